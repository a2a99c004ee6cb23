// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Copyright 2024 Mozilla Foundation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "copy_paths.h"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

using jnav::CopyPathsAction;
using jnav::Json;
using jnav::Navigator;

static_assert(!std::is_copy_constructible<CopyPathsAction>::value &&
                !std::is_copy_assignable<CopyPathsAction>::value &&
                !std::is_move_constructible<CopyPathsAction>::value,
              "CopyPathsAction holds pointers into its own branch");

// {"store":{"book":[{"author":"Nigel Rees","price":8.95,"title":"Sayings"},
//                   {"author":"Evelyn Waugh","price":12.99,"title":"Sword"}],
//           "bicycle":{"color":"red","price":19.95}},
//  "expensive":10}
static Json
store()
{
    Json tree;
    Json& books = tree["store"]["book"];
    books[0]["author"] = "Nigel Rees";
    books[0]["price"] = 8.95;
    books[0]["title"] = "Sayings";
    books[1]["author"] = "Evelyn Waugh";
    books[1]["price"] = 12.99;
    books[1]["title"] = "Sword";
    tree["store"]["bicycle"]["color"] = "red";
    tree["store"]["bicycle"]["price"] = 19.95;
    tree["expensive"] = 10;
    return tree;
}

static void
expect_copy(const Json& tree,
            std::vector<std::string> paths,
            const std::string& want,
            int code)
{
    CopyPathsAction copy;
    Navigator nav(&copy, std::move(paths));
    nav.navigate(tree);
    if (copy.result().toString() != want) {
        printf("error: copy was %s but wanted %s\n",
               copy.result().toString().c_str(),
               want.c_str());
        exit(code);
    }
}

void
branch_test()
{
    Json tree;
    tree["k1"]["k2"] = "v1";
    tree["k3"]["k4"] = "v2";
    expect_copy(tree, { "k1.k2" }, R"({"k1":{"k2":"v1"}})", 1);
    expect_copy(tree, { "k3.k4", "k1.k2" }, R"({"k1":{"k2":"v1"},"k3":{"k4":"v2"}})", 2);
    expect_copy(tree, { "k1" }, R"({"k1":{"k2":"v1"}})", 3);
    expect_copy(tree, { "k1.k2", "k1.k2" }, R"({"k1":{"k2":"v1"}})", 4);
}

void
array_test()
{
    expect_copy(store(),
                { "store.book.author" },
                R"({"store":{"book":[{"author":"Nigel Rees"},{"author":"Evelyn Waugh"}]}})",
                10);
    // two paths through the same array merge element by element
    expect_copy(store(),
                { "store.book.author", "store.book.price" },
                R"({"store":{"book":[{"author":"Nigel Rees","price":8.95},)"
                R"({"author":"Evelyn Waugh","price":12.99}]}})",
                11);
    expect_copy(store(),
                { "store.bicycle.color", "expensive" },
                R"({"expensive":10,"store":{"bicycle":{"color":"red"}}})",
                12);

    Json scalars;
    scalars["a"][0] = 1;
    scalars["a"][1] = "x";
    expect_copy(scalars, { "a" }, R"({"a":[1,"x"]})", 13);

    CopyPathsAction copy;
    Navigator nav(&copy, { "store.bicycle.price" });
    nav.navigate(store());
    const Json* price = copy.result().find("store")->find("bicycle")->find("price");
    if (!price || std::fabs(price->getDouble() - 19.95) > 1e-9)
        exit(14);
}

void
missing_test()
{
    CopyPathsAction copy;
    Navigator nav(&copy, { "store.bicycle.color", "store.car.color", "expensive.value" });
    nav.navigate(store());
    if (copy.result().toString() != R"({"store":{"bicycle":{"color":"red"}}})")
        exit(20);
    if (copy.missing().size() != 2 || copy.missing()[0] != "store.car.color" ||
        copy.missing()[1] != "expensive.value")
        exit(21);

    // a miss in any array element discards that whole path
    Json partial;
    partial["a"][0]["b"] = 1;
    partial["a"][1]["c"] = 2;
    CopyPathsAction copy2;
    Navigator nav2(&copy2, { "a.b", "a.c" });
    nav2.navigate(partial);
    if (copy2.result().toString() != "{}" || copy2.missing().size() != 2)
        exit(22);
}

void
strict_test()
{
    CopyPathsAction copy;
    copy.setStrict(true);
    if (!copy.isStrict())
        exit(30);
    Navigator nav(&copy, { "store.bicycle.color", "store.car.color" });
    bool thrown = false;
    try {
        nav.navigate(store());
    } catch (const std::invalid_argument& e) {
        thrown = std::string(e.what()) ==
                 "path not found in source: 'store.car.color'";
    }
    if (!thrown)
        exit(31);

    Json nested;
    nested["a"][0][0] = 1;
    Navigator nav2(&copy, { "a.b" });
    thrown = false;
    try {
        nav2.navigate(nested);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    if (!thrown)
        exit(32);
}

void
reuse_test()
{
    // each navigation starts from an empty result
    CopyPathsAction copy;
    Navigator nav(&copy, { "expensive", "nope" });
    nav.navigate(store());
    Json other;
    other["expensive"] = false;
    nav.navigate(other);
    if (copy.result().toString() != R"({"expensive":false})")
        exit(40);
    if (copy.missing().size() != 1)
        exit(41);
}

void
empty_test()
{
    CopyPathsAction copy;
    Navigator nav(&copy, std::vector<std::string>());
    nav.navigate(store());
    if (copy.result().toString() != "{}")
        exit(50);

    Navigator nav2(&copy, { "expensive" });
    nav2.navigate(Json());
    if (!copy.result().isNull())
        exit(51);
}

void
merge_test()
{
    Json dest;
    dest["a"][0]["x"] = 1;
    dest["b"] = 1;
    Json src;
    src["a"][0]["y"] = 2;
    src["a"][1]["z"] = 3;
    src["b"]["c"] = true;
    CopyPathsAction::merge(dest, src);
    if (dest.toString() != R"({"a":[{"x":1,"y":2},{"z":3}],"b":{"c":true}})")
        exit(60);
}

int
main()
{
    branch_test();
    array_test();
    missing_test();
    strict_test();
    reuse_test();
    empty_test();
    merge_test();
}
