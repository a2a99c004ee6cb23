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

#include "navigator.h"

#include <stdexcept>
#include <utility>

namespace jnav {

static NavigateAction*
checkAction(NavigateAction* action)
{
    if (!action)
        throw std::invalid_argument("NavigateAction cannot be null");
    return action;
}

static std::vector<std::string>
pathsFromJson(const Json& paths)
{
    std::vector<std::string> res;
    switch (paths.getType()) {
        case Json::Null:
            break;
        case Json::Array:
            res.reserve(paths.getArray().size());
            for (const Json& path : paths.getArray()) {
                if (path.isString()) {
                    res.push_back(path.getString());
                } else if (path.isNull()) {
                    res.emplace_back();
                } else {
                    throw std::invalid_argument(
                      std::string("path must be a string, found ") +
                      Json::typeName(path.getType()));
                }
            }
            break;
        default:
            throw std::invalid_argument(
              std::string("paths must be an array, found ") +
              Json::typeName(paths.getType()));
    }
    return res;
}

Navigator::Navigator(NavigateAction* action,
                     std::vector<std::string> paths,
                     char delimiter)
  : action_(checkAction(action))
  , paths_(std::move(paths))
  , delimiter_(delimiter)
{
}

Navigator::Navigator(NavigateAction* action,
                     std::initializer_list<const char*> paths,
                     char delimiter)
  : action_(checkAction(action))
  , delimiter_(delimiter)
{
    paths_.reserve(paths.size());
    for (const char* path : paths)
        paths_.emplace_back(path ? path : "");
}

Navigator::Navigator(NavigateAction* action, const Json& paths, char delimiter)
  : action_(checkAction(action))
  , paths_(pathsFromJson(paths))
  , delimiter_(delimiter)
{
}

void
Navigator::navigate(const Json& root) const
{
    if (!root.isObject() && !root.isNull())
        throw std::invalid_argument(
          std::string("navigation root must be an object, found ") +
          Json::typeName(root.getType()));
    const Json* source = root.isObject() ? &root : nullptr;
    if (action_->onNavigationStart(root, paths_)) {
        for (const std::string& path : paths_) {
            if (path.empty() || !action_->onNextPath(path))
                continue;
            try {
                TreePath jp(path, delimiter_);
                walkObject(source, jp);
                action_->onPathEnd(path);
            } catch (const std::exception& e) {
                PathFailure failure = action_->onPathFailure(path, e);
                if (failure == PathFailure::AbortRemaining)
                    break;
                if (failure == PathFailure::Propagate)
                    throw;
            }
        }
    }
    action_->onNavigationEnd();
}

void
Navigator::walkObject(const Json* node, TreePath& path) const
{
    if (!node)
        return;
    if (path.hasNext()) {
        const Json* child = node->find(path.next());
        if (!child) {
            // tree ends before the path does
            action_->onPrematureBranchEnd(path, *node);
        } else {
            bool recurred = false;
            switch (child->getType()) {
                case Json::Object:
                    if (action_->onObjectStartAndRecur(path, *child)) {
                        walkObject(child, path);
                        recurred = true;
                    }
                    break;
                case Json::Array:
                    if (action_->onArrayStartAndRecur(path, *child)) {
                        walkArray(child, path);
                        recurred = true;
                    }
                    break;
                case Json::Null:
                case Json::Bool:
                case Json::Long:
                case Json::Float:
                case Json::Double:
                case Json::String:
                    break;
            }
            // a pruned container counts as a leaf from here on
            if (!recurred) {
                if (path.hasNext()) {
                    action_->onPrematureBranchEnd(path, *child);
                } else {
                    action_->onObjectLeaf(path, *child);
                }
            }
        }
    }
    action_->onObjectEnd(path);
}

void
Navigator::walkArray(const Json* array, TreePath& path) const
{
    if (!array)
        return;
    size_t index = 0;
    for (const Json& item : array->getArray()) {
        switch (item.getType()) {
            case Json::Object:
                if (action_->onObjectStartAndRecur(path, item)) {
                    // each element resumes from the same segment
                    TreePath branch = path.clone();
                    walkObject(&item, branch);
                    break;
                }
                if (!path.hasNext())
                    action_->onArrayLeaf(index, item);
                break;
            case Json::Array:
                throw std::invalid_argument(
                  "illegal json - found array nested inside array at: '" +
                  path.origin() + "'");
            case Json::Null:
            case Json::Bool:
            case Json::Long:
            case Json::Float:
            case Json::Double:
            case Json::String:
                // no event when the path wants to go deeper
                if (!path.hasNext())
                    action_->onArrayLeaf(index, item);
                break;
        }
        ++index;
    }
    action_->onArrayEnd(path);
}

} // namespace jnav
