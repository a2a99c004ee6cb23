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

#include <stdexcept>
#include <utility>

namespace jnav {

bool
CopyPathsAction::onNavigationStart(const Json& root,
                                   const std::vector<std::string>& paths)
{
    missing_.clear();
    stack_.clear();
    if (root.isNull()) {
        result_ = nullptr;
        return false;
    }
    result_.setObject();
    return !paths.empty();
}

bool
CopyPathsAction::onNextPath(const std::string&)
{
    branch_.setObject();
    stack_.assign(1, &branch_);
    return true;
}

void
CopyPathsAction::onPathEnd(const std::string&)
{
    merge(result_, branch_);
    branch_ = nullptr;
    stack_.clear();
}

void
CopyPathsAction::onNavigationEnd()
{
    branch_ = nullptr;
    stack_.clear();
}

void
CopyPathsAction::onPrematureBranchEnd(const TreePath& path, const Json&)
{
    missing_.push_back(path.origin());
    throw std::invalid_argument("path not found in source: '" +
                                path.origin() + "'");
}

bool
CopyPathsAction::onObjectStartAndRecur(const TreePath& path, const Json&)
{
    // a path ending here gets the object delivered whole as a leaf
    if (!path.hasNext())
        return false;
    stack_.push_back(&attach(path, Json()));
    stack_.back()->setObject();
    return true;
}

bool
CopyPathsAction::onArrayStartAndRecur(const TreePath& path, const Json&)
{
    if (!path.hasNext())
        return false;
    stack_.push_back(&attach(path, Json()));
    stack_.back()->setArray();
    return true;
}

void
CopyPathsAction::onObjectLeaf(const TreePath& path, const Json& leaf)
{
    attach(path, Json(leaf));
}

void
CopyPathsAction::onArrayLeaf(size_t, const Json& leaf)
{
    stack_.back()->getArray().push_back(leaf);
}

void
CopyPathsAction::onObjectEnd(const TreePath&)
{
    if (!stack_.empty())
        stack_.pop_back();
}

void
CopyPathsAction::onArrayEnd(const TreePath&)
{
    if (!stack_.empty())
        stack_.pop_back();
}

bool
CopyPathsAction::failPathSilently(const std::string&, const std::exception&)
{
    return false;
}

bool
CopyPathsAction::failPathFast(const std::string&, const std::exception&)
{
    return strict_;
}

Json&
CopyPathsAction::attach(const TreePath& path, Json&& node)
{
    Json& parent = *stack_.back();
    if (parent.isArray()) {
        parent.getArray().push_back(std::move(node));
        return parent.getArray().back();
    }
    Json& slot = parent[path.current()];
    slot = std::move(node);
    return slot;
}

void
CopyPathsAction::merge(Json& dest, const Json& src)
{
    if (dest.isObject() && src.isObject()) {
        auto& members = dest.getObject();
        for (const auto& member : src.getObject()) {
            auto it = members.find(member.first);
            if (it == members.end()) {
                members.emplace(member.first, member.second);
            } else {
                merge(it->second, member.second);
            }
        }
    } else if (dest.isArray() && src.isArray()) {
        auto& items = dest.getArray();
        const auto& more = src.getArray();
        for (size_t i = 0; i < more.size(); ++i) {
            if (i < items.size()) {
                merge(items[i], more[i]);
            } else {
                items.push_back(more[i]);
            }
        }
    } else {
        dest = src;
    }
}

} // namespace jnav
