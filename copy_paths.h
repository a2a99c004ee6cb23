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
#include <string>
#include <vector>

#include "json.h"
#include "navigator.h"

namespace jnav {

// Copies the navigated branches of a tree into a new object.
//
// Navigating {"k1":{"k2":"v1"},"k3":{"k4":"v2"}} with "k1.k2" yields
// {"k1":{"k2":"v1"}}. A path ending on an object or array copies the
// whole container. Arrays on the way are rebuilt element by element,
// keeping only what each element's branch reached.
//
// Paths missing from the source are recorded in missing(). They fail
// the whole navigation instead when strict mode is on.
class CopyPathsAction : public NavigateAction
{
  public:
    CopyPathsAction() : strict_(false)
    {
    }

    // stack_ points into branch_
    CopyPathsAction(const CopyPathsAction&) = delete;
    CopyPathsAction& operator=(const CopyPathsAction&) = delete;

    void setStrict(bool strict)
    {
        strict_ = strict;
    }

    bool isStrict() const
    {
        return strict_;
    }

    const Json& result() const
    {
        return result_;
    }

    const std::vector<std::string>& missing() const
    {
        return missing_;
    }

    bool onNavigationStart(const Json& root,
                           const std::vector<std::string>& paths) override;
    bool onNextPath(const std::string& path) override;
    void onPathEnd(const std::string& path) override;
    void onNavigationEnd() override;
    void onPrematureBranchEnd(const TreePath& path, const Json& node) override;
    bool onObjectStartAndRecur(const TreePath& path,
                               const Json& object) override;
    bool onArrayStartAndRecur(const TreePath& path, const Json& array) override;
    void onObjectLeaf(const TreePath& path, const Json& leaf) override;
    void onArrayLeaf(size_t index, const Json& leaf) override;
    void onObjectEnd(const TreePath& path) override;
    void onArrayEnd(const TreePath& path) override;
    bool failPathSilently(const std::string& path,
                          const std::exception& e) override;
    bool failPathFast(const std::string& path,
                      const std::exception& e) override;

    // Overlays src onto dest: objects merge by key, arrays by index,
    // anything else is replaced.
    static void merge(Json& dest, const Json& src);

  private:
    bool strict_;
    Json result_;
    Json branch_;
    // Containers of branch_ under construction, innermost last. The
    // pointers stay valid because only the innermost one is modified.
    std::vector<Json*> stack_;
    std::vector<std::string> missing_;

    Json& attach(const TreePath& path, Json&& node);
};

} // namespace jnav
