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
#include <memory>
#include <string>
#include <vector>

namespace jnav {

// A delimited path such as "store.book.title" split into segments,
// plus a cursor into them. Copies share the segment list and keep
// their own position, so a copy taken at an array can walk each
// element from the same point without disturbing its siblings.
class TreePath
{
  public:
    explicit TreePath(const std::string& path, char delimiter = '.');

    bool hasNext() const
    {
        return pos_ < keys_->size();
    }

    bool hasPrev() const
    {
        return pos_ > 0;
    }

    // Returns the next segment and advances past it.
    const std::string& next();

    // Steps back over the last consumed segment and returns it.
    const std::string& prev();

    // Segment that next() would return.
    const std::string& peek() const;

    // Last consumed segment, i.e. the key the cursor is positioned at.
    const std::string& current() const;

    size_t nextIndex() const
    {
        return pos_;
    }

    size_t length() const
    {
        return keys_->size();
    }

    const std::string& origin() const
    {
        return origin_;
    }

    char delimiter() const
    {
        return delimiter_;
    }

    std::string consumed() const;
    std::string remainder() const;

    TreePath clone() const
    {
        return *this;
    }

    static std::vector<std::string> split(const std::string& path,
                                          char delimiter);

  private:
    std::string origin_;
    char delimiter_;
    std::shared_ptr<const std::vector<std::string>> keys_;
    size_t pos_;

    std::string join(size_t begin, size_t end) const;
};

} // namespace jnav
