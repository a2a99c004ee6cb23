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
#include <map>
#include <string>
#include <vector>

namespace jnav {

// In-memory JSON tree. Every node holds exactly one alternative of
// Type, so consumers can switch over getType() and cover every kind.
class Json
{
  public:
    enum Type
    {
        Null,
        Bool,
        Long,
        Float,
        Double,
        String,
        Array,
        Object
    };

  private:
    Type type_;
    union
    {
        bool bool_value;
        float float_value;
        double double_value;
        long long long_value;
        std::string string_value;
        std::vector<Json> array_value;
        std::map<std::string, Json> object_value;
    };

  public:
    static const char* typeName(Type type);

    Json(const Json&);
    Json(Json&&);
    Json(unsigned long);
    Json(unsigned long long);
    Json(const char*);
    Json(const std::string&);
    ~Json();

    Json(const std::nullptr_t = nullptr) : type_(Null)
    {
    }

    Json(bool value) : type_(Bool), bool_value(value)
    {
    }

    Json(int value) : type_(Long), long_value(value)
    {
    }

    Json(float value) : type_(Float), float_value(value)
    {
    }

    Json(unsigned value) : type_(Long), long_value(value)
    {
    }

    Json(long value) : type_(Long), long_value(value)
    {
    }

    Json(long long value) : type_(Long), long_value(value)
    {
    }

    Json(double value) : type_(Double), double_value(value)
    {
    }

    Json(std::string&& value) : type_(String), string_value(std::move(value))
    {
    }

    Type getType() const
    {
        return type_;
    }

    bool isNull() const
    {
        return type_ == Null;
    }

    bool isBool() const
    {
        return type_ == Bool;
    }

    bool isLong() const
    {
        return type_ == Long;
    }

    bool isFloat() const
    {
        return type_ == Float;
    }

    bool isDouble() const
    {
        return type_ == Double;
    }

    bool isString() const
    {
        return type_ == String;
    }

    bool isArray() const
    {
        return type_ == Array;
    }

    bool isObject() const
    {
        return type_ == Object;
    }

    bool getBool() const;
    double getDouble() const;
    long long getLong() const;
    std::string& getString();
    const std::string& getString() const;
    std::vector<Json>& getArray();
    const std::vector<Json>& getArray() const;
    std::map<std::string, Json>& getObject();
    const std::map<std::string, Json>& getObject() const;

    void setArray();
    void setObject();

    std::string toString() const;
    std::string toStringPretty() const;

    bool contains(const std::string& key) const;

    // Returns the member named key, or nullptr when this is not an
    // object or has no such member.
    const Json* find(const std::string& key) const;

    Json& operator[](size_t index);
    Json& operator[](const std::string& key);

    Json& operator=(const Json&);
    Json& operator=(Json&&);

  private:
    void clear();
    void copyFrom(const Json&);
    void moveFrom(Json&&);
    void marshal(std::string&, bool, int) const;
    static void stringify(std::string&, const std::string&);
    static void serialize(std::string&, const std::string&);
};

} // namespace jnav
