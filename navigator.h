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

#pragma once
#include <cstddef>
#include <exception>
#include <initializer_list>
#include <string>
#include <vector>

#include "json.h"
#include "treepath.h"

namespace jnav {

// What the navigator does after an exception escapes one path.
enum class PathFailure
{
    AbortRemaining, // stop quietly, skip the rest of the path set
    Propagate,      // rethrow out of navigate()
    Continue        // drop this path, go on with the next one
};

// Callbacks fired by Navigator. Hooks returning bool decide whether
// the navigator goes on: false from a start hook prunes that branch.
class NavigateAction
{
  public:
    virtual ~NavigateAction() = default;

    virtual bool onNavigationStart(const Json& root,
                                   const std::vector<std::string>& paths) = 0;
    virtual bool onNextPath(const std::string& path) = 0;
    virtual void onPathEnd(const std::string& path) = 0;
    virtual void onNavigationEnd() = 0;

    // The tree ended before the path did. node is the object lacking
    // the next key, or the leaf found where a container was expected.
    virtual void onPrematureBranchEnd(const TreePath& path,
                                      const Json& node) = 0;

    virtual bool onObjectStartAndRecur(const TreePath& path,
                                       const Json& object) = 0;
    virtual bool onArrayStartAndRecur(const TreePath& path,
                                      const Json& array) = 0;

    virtual void onObjectLeaf(const TreePath& path, const Json& leaf) = 0;
    virtual void onArrayLeaf(size_t index, const Json& leaf) = 0;

    virtual void onObjectEnd(const TreePath& path) = 0;
    virtual void onArrayEnd(const TreePath& path) = 0;

    virtual bool failPathSilently(const std::string& path,
                                  const std::exception& e) = 0;
    virtual bool failPathFast(const std::string& path,
                              const std::exception& e) = 0;

    // Silent abort takes precedence over fail fast.
    virtual PathFailure onPathFailure(const std::string& path,
                                      const std::exception& e)
    {
        if (failPathSilently(path, e))
            return PathFailure::AbortRemaining;
        if (failPathFast(path, e))
            return PathFailure::Propagate;
        return PathFailure::Continue;
    }
};

// Walks only the branches of a JSON object named by a set of paths.
//
// For {"k1":{"k2":"v1"},"k3":{"k4":"v2"}} and the path "k1.k2" the
// navigator visits k1 and k2 and never looks at k3. When a segment
// resolves to an array, every object in it continues the rest of the
// path on its own copy of the cursor.
//
// The action is not owned and must outlive the navigator.
class Navigator
{
  public:
    Navigator(NavigateAction* action,
              std::vector<std::string> paths,
              char delimiter = '.');

    // Null entries are kept as empty paths, which are skipped.
    Navigator(NavigateAction* action,
              std::initializer_list<const char*> paths,
              char delimiter = '.');

    // paths must be an array of strings (nulls allowed) or null.
    Navigator(NavigateAction* action, const Json& paths, char delimiter = '.');

    // root must be an object; a null root is an absent object.
    void navigate(const Json& root) const;

    const std::vector<std::string>& paths() const
    {
        return paths_;
    }

  private:
    NavigateAction* action_;
    std::vector<std::string> paths_;
    char delimiter_;

    void walkObject(const Json* node, TreePath& path) const;
    void walkArray(const Json* array, TreePath& path) const;
};

} // namespace jnav
