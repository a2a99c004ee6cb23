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

#include <cstdlib>
#include <stdexcept>

#if defined(__cpp_exceptions) || defined(__EXCEPTIONS) || defined(_CPPUNWIND)
#define ON_LOGIC_ERROR(s) throw std::logic_error(s)
#else
#define ON_LOGIC_ERROR(s) abort()
#endif

namespace jnav {

TreePath::TreePath(const std::string& path, char delimiter)
  : origin_(path)
  , delimiter_(delimiter)
  , keys_(std::make_shared<const std::vector<std::string>>(
      split(path, delimiter)))
  , pos_(0)
{
}

// Inner empty segments survive ("a..b" is three segments) while
// trailing ones are dropped ("a." is one).
std::vector<std::string>
TreePath::split(const std::string& path, char delimiter)
{
    std::vector<std::string> keys;
    size_t start = 0;
    for (;;) {
        size_t end = path.find(delimiter, start);
        if (end == std::string::npos) {
            keys.emplace_back(path, start);
            break;
        }
        keys.emplace_back(path, start, end - start);
        start = end + 1;
    }
    while (!keys.empty() && keys.back().empty())
        keys.pop_back();
    return keys;
}

const std::string&
TreePath::next()
{
    if (!hasNext())
        ON_LOGIC_ERROR("path '" + origin_ + "' has no next segment");
    return (*keys_)[pos_++];
}

const std::string&
TreePath::prev()
{
    if (!hasPrev())
        ON_LOGIC_ERROR("path '" + origin_ + "' has no previous segment");
    return (*keys_)[--pos_];
}

const std::string&
TreePath::peek() const
{
    if (!hasNext())
        ON_LOGIC_ERROR("path '" + origin_ + "' has no next segment");
    return (*keys_)[pos_];
}

const std::string&
TreePath::current() const
{
    if (!hasPrev())
        ON_LOGIC_ERROR("path '" + origin_ + "' has not consumed a segment");
    return (*keys_)[pos_ - 1];
}

std::string
TreePath::consumed() const
{
    return join(0, pos_);
}

std::string
TreePath::remainder() const
{
    return join(pos_, keys_->size());
}

std::string
TreePath::join(size_t begin, size_t end) const
{
    std::string b;
    for (size_t i = begin; i < end; ++i) {
        if (i > begin)
            b += delimiter_;
        b += (*keys_)[i];
    }
    return b;
}

} // namespace jnav
