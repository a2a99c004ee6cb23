// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Example usage of the jnav::Navigator library
//
// This example demonstrates:
// - Building a JSON tree
// - Printing the leaves reached by a set of paths
// - Masking selected fields in a copy of the tree
// - Validating that required paths exist
// - Extracting branches with CopyPathsAction

#include "../copy_paths.h"
#include "../navigator.h"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using jnav::CopyPathsAction;
using jnav::Json;
using jnav::NavigateAction;
using jnav::Navigator;
using jnav::TreePath;

static Json
make_config()
{
    Json config;
    config["database"]["host"] = "localhost";
    config["database"]["port"] = 5432;
    config["database"]["credentials"]["username"] = "admin";
    config["database"]["credentials"]["password"] = "secret123";
    config["server"]["host"] = "0.0.0.0";
    config["server"]["port"] = 8080;
    config["server"]["ssl"] = true;
    config["users"][0]["name"] = "jane";
    config["users"][0]["token"] = "tk-1";
    config["users"][1]["name"] = "joe";
    config["users"][1]["token"] = "tk-2";
    config["features"][0] = "logging";
    config["features"][1] = "metrics";
    return config;
}

// Does nothing; subclasses override the events they care about.
class BaseAction : public NavigateAction
{
  public:
    bool onNavigationStart(const Json&, const std::vector<std::string>&) override
    {
        return true;
    }
    bool onNextPath(const std::string&) override
    {
        return true;
    }
    void onPathEnd(const std::string&) override
    {
    }
    void onNavigationEnd() override
    {
    }
    void onPrematureBranchEnd(const TreePath&, const Json&) override
    {
    }
    bool onObjectStartAndRecur(const TreePath&, const Json&) override
    {
        return true;
    }
    bool onArrayStartAndRecur(const TreePath&, const Json&) override
    {
        return true;
    }
    void onObjectLeaf(const TreePath&, const Json&) override
    {
    }
    void onArrayLeaf(size_t, const Json&) override
    {
    }
    void onObjectEnd(const TreePath&) override
    {
    }
    void onArrayEnd(const TreePath&) override
    {
    }
    bool failPathSilently(const std::string&, const std::exception&) override
    {
        return false;
    }
    bool failPathFast(const std::string&, const std::exception&) override
    {
        return false;
    }
};

class PrintLeaves : public BaseAction
{
  public:
    void onObjectLeaf(const TreePath& path, const Json& leaf) override
    {
        std::cout << "  " << path.consumed() << " = " << leaf.toString()
                  << std::endl;
    }
    void onArrayLeaf(size_t index, const Json& leaf) override
    {
        std::cout << "  [" << index << "] = " << leaf.toString() << std::endl;
    }
    void onPrematureBranchEnd(const TreePath& path, const Json&) override
    {
        std::cout << "  " << path.origin() << " stops at '" << path.current()
                  << "'" << std::endl;
    }
};

// Records where the matched leaves are, so a copy of the tree can be
// rewritten afterwards. Arrays are not entered.
class CollectLocations : public BaseAction
{
  public:
    std::vector<std::vector<std::string>> locations;

    bool onNextPath(const std::string&) override
    {
        prefix_.clear();
        return true;
    }
    bool onObjectStartAndRecur(const TreePath& path, const Json&) override
    {
        prefix_.push_back(path.current());
        return true;
    }
    void onObjectEnd(const TreePath&) override
    {
        if (!prefix_.empty())
            prefix_.pop_back();
    }
    bool onArrayStartAndRecur(const TreePath&, const Json&) override
    {
        return false;
    }
    void onObjectLeaf(const TreePath& path, const Json&) override
    {
        std::vector<std::string> location = prefix_;
        location.push_back(path.current());
        locations.push_back(location);
    }

  private:
    std::vector<std::string> prefix_;
};

// Example 1: Print the leaves reached by a set of paths
void example_print()
{
    std::cout << "\n=== Example 1: Printing Leaves ===" << std::endl;

    Json config = make_config();
    PrintLeaves print;
    Navigator nav(&print, { "database.port", "users.name", "features", "server.tls.cert" });
    nav.navigate(config);
}

// Example 2: Validate that required settings exist
void example_validate()
{
    std::cout << "\n=== Example 2: Validation ===" << std::endl;

    class RequirePaths : public BaseAction
    {
      public:
        void onPrematureBranchEnd(const TreePath& path, const Json&) override
        {
            throw std::invalid_argument("missing required setting: " +
                                        path.origin());
        }
        bool failPathFast(const std::string&, const std::exception&) override
        {
            return true;
        }
    };

    Json config = make_config();
    RequirePaths require;
    Navigator nav(&require, { "database.host", "server.port", "server.tls.cert" });
    try {
        nav.navigate(config);
        std::cout << "All required settings present" << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cout << "Validation failed (expected): " << e.what() << std::endl;
    }
}

// Example 3: Extract a subset of the tree
void example_extract()
{
    std::cout << "\n=== Example 3: Extracting Branches ===" << std::endl;

    Json config = make_config();
    CopyPathsAction copy;
    Navigator nav(&copy, { "database.host", "database.port", "users.name" });
    nav.navigate(config);
    std::cout << copy.result().toStringPretty() << std::endl;
}

// Example 4: Mask the password in a copy of the tree
void example_mask()
{
    std::cout << "\n=== Example 4: Masking Fields ===" << std::endl;

    Json config = make_config();
    CollectLocations collect;
    Navigator nav(&collect, { "database.credentials.password" });
    nav.navigate(config);

    Json masked = config;
    for (const std::vector<std::string>& location : collect.locations) {
        Json* node = &masked;
        for (const std::string& key : location)
            node = &(*node)[key];
        *node = "********";
    }
    std::cout << masked["database"].toStringPretty() << std::endl;
}

// Example 5: Arrays nested in arrays are rejected
void example_nested_arrays()
{
    std::cout << "\n=== Example 5: Nested Arrays ===" << std::endl;

    Json matrix;
    matrix["rows"][0][0] = 1;
    matrix["rows"][0][1] = 2;

    class FailFast : public BaseAction
    {
      public:
        bool failPathFast(const std::string&, const std::exception&) override
        {
            return true;
        }
    };

    FailFast action;
    Navigator nav(&action, { "rows" });
    try {
        nav.navigate(matrix);
    } catch (const std::invalid_argument& e) {
        std::cout << "Navigation error (expected): " << e.what() << std::endl;
    }
}

int main()
{
    std::cout << "JSON Navigator Example Program" << std::endl;
    std::cout << "==============================" << std::endl;

    example_print();
    example_validate();
    example_extract();
    example_mask();
    example_nested_arrays();

    std::cout << "\nAll examples completed!" << std::endl;
    return 0;
}
