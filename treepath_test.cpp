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

#include "treepath.h"
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#define ARRAYLEN(A) \
    ((sizeof(A) / sizeof(*(A))) / ((unsigned)!(sizeof(A) % sizeof(*(A)))))

using jnav::TreePath;

static const struct
{
    std::string path;
    size_t length;
    std::string joined;
} kSplit[] = {
    { "", 0, "" },
    { "a", 1, "a" },
    { "k1.k2", 2, "k1|k2" },
    { "store.book.title", 3, "store|book|title" },
    { "a..b", 3, "a||b" },
    { ".a", 2, "|a" },
    { "a.", 1, "a" },
    { "a.b..", 2, "a|b" },
    { ".", 0, "" },
};

void
split_test()
{
    for (size_t i = 0; i < ARRAYLEN(kSplit); ++i) {
        std::vector<std::string> keys = TreePath::split(kSplit[i].path, '.');
        std::string joined;
        for (size_t j = 0; j < keys.size(); ++j) {
            if (j)
                joined += '|';
            joined += keys[j];
        }
        if (keys.size() != kSplit[i].length || joined != kSplit[i].joined) {
            printf("error: split(%s) gave %zu segments %s but wanted %zu %s\n",
                   kSplit[i].path.c_str(),
                   keys.size(),
                   joined.c_str(),
                   kSplit[i].length,
                   kSplit[i].joined.c_str());
            exit(1);
        }
    }
}

void
cursor_test()
{
    TreePath p("k1.k2.k3");
    if (p.origin() != "k1.k2.k3" || p.length() != 3 || p.nextIndex() != 0)
        exit(10);
    if (!p.hasNext() || p.hasPrev())
        exit(11);
    if (p.peek() != "k1" || p.next() != "k1" || p.current() != "k1")
        exit(12);
    if (p.next() != "k2" || p.consumed() != "k1.k2" || p.remainder() != "k3")
        exit(13);
    if (p.next() != "k3" || p.hasNext() || p.nextIndex() != 3)
        exit(14);
    if (p.remainder() != "" || p.consumed() != "k1.k2.k3")
        exit(15);
    if (p.prev() != "k3" || p.current() != "k2" || p.peek() != "k3")
        exit(16);
    if (p.prev() != "k2" || p.prev() != "k1" || p.hasPrev())
        exit(17);
    if (p.origin() != "k1.k2.k3")
        exit(18);
}

void
clone_test()
{
    TreePath p("a.b.c");
    p.next();
    TreePath q = p.clone();
    TreePath r = p.clone();
    if (q.nextIndex() != 1 || q.origin() != p.origin())
        exit(20);
    q.next();
    if (p.nextIndex() != 1 || p.peek() != "b" || r.peek() != "b")
        exit(21);
    if (q.peek() != "c")
        exit(22);
    p.next();
    p.next();
    if (p.hasNext() || !r.hasNext() || q.nextIndex() != 2)
        exit(23);
    r.prev();
    if (r.nextIndex() != 0 || p.nextIndex() != 3 || q.nextIndex() != 2)
        exit(24);
}

void
precondition_test()
{
    TreePath p("a");
    int thrown = 0;
    try {
        p.current();
    } catch (const std::logic_error&) {
        ++thrown;
    }
    try {
        p.prev();
    } catch (const std::logic_error&) {
        ++thrown;
    }
    p.next();
    try {
        p.next();
    } catch (const std::logic_error& e) {
        if (std::string(e.what()).find("'a'") != std::string::npos)
            ++thrown;
    }
    try {
        p.peek();
    } catch (const std::logic_error&) {
        ++thrown;
    }
    if (thrown != 4)
        exit(30);
    if (p.nextIndex() != 1 || p.current() != "a")
        exit(31);

    TreePath empty("");
    if (empty.hasNext() || empty.length() != 0)
        exit(32);
}

void
delimiter_test()
{
    TreePath p("/usr/local", '/');
    if (p.length() != 3 || p.delimiter() != '/')
        exit(40);
    if (p.next() != "" || p.next() != "usr")
        exit(41);
    if (p.consumed() != "/usr" || p.remainder() != "local")
        exit(42);
    TreePath dotted("a.b/c", '/');
    if (dotted.length() != 2 || dotted.peek() != "a.b")
        exit(43);
}

int
main()
{
    split_test();
    cursor_test();
    clone_test();
    precondition_test();
    delimiter_test();
}
