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

#include "json.h"

#include <climits>
#include <cstdlib>
#include <cwchar>
#include <new>
#include <stdexcept>
#include <utility>

#include "double-conversion/double-to-string.h"

#define ThomPikeCont(x) (0200 == (0300 & (x)))
#define ThomPikeByte(x) ((x) & (((1 << ThomPikeMsb(x)) - 1) | 3))
#define ThomPikeLen(x) (7 - ThomPikeMsb(x))
#define ThomPikeMsb(x) ((255 & (x)) < 252 ? Bsr(255 & ~(x)) : 1)
#define ThomPikeMerge(x, y) ((x) << 6 | (077 & (y)))

#define EncodeUtf16(wc) \
    ((0x0000 <= (wc) && (wc) <= 0xFFFF) || (0xE000 <= (wc) && (wc) <= 0xFFFF) \
       ? (wc) \
     : 0x10000 <= (wc) && (wc) <= 0x10FFFF \
       ? (((((wc) - 0x10000) >> 10) + 0xD800) | \
          (unsigned)((((wc) - 0x10000) & 1023) + 0xDC00) << 16) \
       : 0xFFFD)

#if defined(__cpp_exceptions) || defined(__EXCEPTIONS) || defined(_CPPUNWIND)
#define ON_LOGIC_ERROR(s) throw std::logic_error(s)
#else
#define ON_LOGIC_ERROR(s) abort()
#endif

namespace jnav {

// 0 literal, 1-7 short escapes, 9 needs \u escaping
static const char kEscapeLiteral[128] = {
    9, 9, 9, 9, 9, 9, 9, 9, 9, 1, 2, 9, 4, 3, 9, 9, // 0x00
    9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, 9, // 0x10
    0, 0, 7, 0, 0, 0, 9, 9, 0, 0, 0, 0, 0, 0, 0, 6, // 0x20
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 9, 9, 9, 0, // 0x30
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 0x40
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 5, 0, 0, 0, // 0x50
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, // 0x60
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 9, // 0x70
};

static const double_conversion::DoubleToStringConverter kDoubleToJson(
  double_conversion::DoubleToStringConverter::UNIQUE_ZERO |
    double_conversion::DoubleToStringConverter::EMIT_POSITIVE_EXPONENT_SIGN,
  "1e5000",
  "null",
  'e',
  -6,
  21,
  6,
  0);

#if defined(__GNUC__) || defined(__clang__)
#define Bsr(x) (__builtin_clz(x) ^ (sizeof(int) * CHAR_BIT - 1))
#else
static int
Bsr(int x)
{
    int r = 0;
    if (x & 0xFFFF0000u) {
        x >>= 16;
        r |= 16;
    }
    if (x & 0xFF00) {
        x >>= 8;
        r |= 8;
    }
    if (x & 0xF0) {
        x >>= 4;
        r |= 4;
    }
    if (x & 0xC) {
        x >>= 2;
        r |= 2;
    }
    if (x & 0x2) {
        r |= 1;
    }
    return r;
}
#endif

static char*
UlongToString(char* p, unsigned long long x)
{
    char t;
    size_t i, a, b;
    i = 0;
    do {
        p[i++] = x % 10 + '0';
        x = x / 10;
    } while (x > 0);
    p[i] = '\0';
    if (i) {
        for (a = 0, b = i - 1; a < b; ++a, --b) {
            t = p[a];
            p[a] = p[b];
            p[b] = t;
        }
    }
    return p + i;
}

static char*
LongToString(char* p, long long x)
{
    if (x < 0)
        *p++ = '-', x = 0 - (unsigned long long)x;
    return UlongToString(p, x);
}

const char*
Json::typeName(Type type)
{
    switch (type) {
        case Null:
            return "null";
        case Bool:
            return "bool";
        case Long:
            return "long";
        case Float:
            return "float";
        case Double:
            return "double";
        case String:
            return "string";
        case Array:
            return "array";
        case Object:
            return "object";
        default:
            ON_LOGIC_ERROR("Unhandled JSON type.");
    }
}

Json::Json(unsigned long value) : Json(static_cast<unsigned long long>(value))
{
}

// Values past LLONG_MAX lose precision rather than wrap.
Json::Json(unsigned long long value)
{
    if (value <= LLONG_MAX) {
        type_ = Long;
        long_value = static_cast<long long>(value);
    } else {
        type_ = Double;
        double_value = static_cast<double>(value);
    }
}

Json::Json(const char* value)
{
    if (value) {
        type_ = String;
        new (&string_value) std::string(value);
    } else {
        type_ = Null;
    }
}

Json::Json(const std::string& value) : type_(String), string_value(value)
{
}

Json::Json(const Json& other) : type_(Null)
{
    copyFrom(other);
}

Json::Json(Json&& other) : type_(Null)
{
    moveFrom(std::move(other));
}

Json::~Json()
{
    if (type_ >= String)
        clear();
}

void
Json::clear()
{
    switch (type_) {
        case String:
            string_value.~basic_string();
            break;
        case Array:
            array_value.~vector();
            break;
        case Object:
            object_value.~map();
            break;
        default:
            break;
    }
    type_ = Null;
}

// Expects this to be Null.
void
Json::copyFrom(const Json& other)
{
    switch (other.type_) {
        case Null:
            break;
        case Bool:
            bool_value = other.bool_value;
            break;
        case Long:
            long_value = other.long_value;
            break;
        case Float:
            float_value = other.float_value;
            break;
        case Double:
            double_value = other.double_value;
            break;
        case String:
            new (&string_value) std::string(other.string_value);
            break;
        case Array:
            new (&array_value) std::vector<Json>(other.array_value);
            break;
        case Object:
            new (&object_value) std::map<std::string, Json>(other.object_value);
            break;
        default:
            ON_LOGIC_ERROR("Unhandled JSON type.");
    }
    type_ = other.type_;
}

// Expects this to be Null. Leaves other Null.
void
Json::moveFrom(Json&& other)
{
    switch (other.type_) {
        case Null:
            break;
        case Bool:
            bool_value = other.bool_value;
            break;
        case Long:
            long_value = other.long_value;
            break;
        case Float:
            float_value = other.float_value;
            break;
        case Double:
            double_value = other.double_value;
            break;
        case String:
            new (&string_value) std::string(std::move(other.string_value));
            break;
        case Array:
            new (&array_value) std::vector<Json>(std::move(other.array_value));
            break;
        case Object:
            new (&object_value)
              std::map<std::string, Json>(std::move(other.object_value));
            break;
        default:
            ON_LOGIC_ERROR("Unhandled JSON type.");
    }
    type_ = other.type_;
    if (other.type_ >= String)
        other.clear();
    other.type_ = Null;
}

Json&
Json::operator=(const Json& other)
{
    if (this != &other) {
        // other may live inside this tree, so copy it out first
        Json tmp(other);
        if (type_ >= String)
            clear();
        moveFrom(std::move(tmp));
    }
    return *this;
}

Json&
Json::operator=(Json&& other)
{
    if (this != &other) {
        Json tmp(std::move(other));
        if (type_ >= String)
            clear();
        moveFrom(std::move(tmp));
    }
    return *this;
}

long long
Json::getLong() const
{
    if (type_ != Long)
        ON_LOGIC_ERROR("JSON value is not a long.");
    return long_value;
}

bool
Json::getBool() const
{
    if (type_ != Bool)
        ON_LOGIC_ERROR("JSON value is not a bool.");
    return bool_value;
}

double
Json::getDouble() const
{
    if (type_ == Float)
        return float_value;
    if (type_ != Double)
        ON_LOGIC_ERROR("JSON value is not a floating-point number.");
    return double_value;
}

std::string&
Json::getString()
{
    if (type_ != String)
        ON_LOGIC_ERROR("JSON value is not a string.");
    return string_value;
}

const std::string&
Json::getString() const
{
    if (type_ != String)
        ON_LOGIC_ERROR("JSON value is not a string.");
    return string_value;
}

std::vector<Json>&
Json::getArray()
{
    if (type_ != Array)
        ON_LOGIC_ERROR("JSON value is not an array.");
    return array_value;
}

const std::vector<Json>&
Json::getArray() const
{
    if (type_ != Array)
        ON_LOGIC_ERROR("JSON value is not an array.");
    return array_value;
}

std::map<std::string, Json>&
Json::getObject()
{
    if (type_ != Object)
        ON_LOGIC_ERROR("JSON value is not an object.");
    return object_value;
}

const std::map<std::string, Json>&
Json::getObject() const
{
    if (type_ != Object)
        ON_LOGIC_ERROR("JSON value is not an object.");
    return object_value;
}

void
Json::setArray()
{
    if (type_ >= String)
        clear();
    new (&array_value) std::vector<Json>();
    type_ = Array;
}

void
Json::setObject()
{
    if (type_ >= String)
        clear();
    new (&object_value) std::map<std::string, Json>();
    type_ = Object;
}

bool
Json::contains(const std::string& key) const
{
    return find(key) != nullptr;
}

const Json*
Json::find(const std::string& key) const
{
    if (!isObject())
        return nullptr;
    auto it = object_value.find(key);
    if (it == object_value.end())
        return nullptr;
    return &it->second;
}

Json&
Json::operator[](size_t index)
{
    if (!isArray())
        setArray();
    if (index >= array_value.size())
        array_value.resize(index + 1);
    return array_value[index];
}

Json&
Json::operator[](const std::string& key)
{
    if (!isObject())
        setObject();
    return object_value[key];
}

std::string
Json::toString() const
{
    std::string b;
    marshal(b, false, 0);
    return b;
}

std::string
Json::toStringPretty() const
{
    std::string b;
    marshal(b, true, 0);
    return b;
}

void
Json::marshal(std::string& b, bool pretty, int indent) const
{
    switch (type_) {
        case Null:
            b += "null";
            break;
        case String:
            stringify(b, string_value);
            break;
        case Bool:
            b += bool_value ? "true" : "false";
            break;
        case Long: {
            char buf[64];
            b.append(buf, LongToString(buf, long_value) - buf);
            break;
        }
        case Float: {
            char buf[128];
            double_conversion::StringBuilder db(buf, 128);
            kDoubleToJson.ToShortestSingle(float_value, &db);
            db.Finalize();
            b += buf;
            break;
        }
        case Double: {
            char buf[128];
            double_conversion::StringBuilder db(buf, 128);
            kDoubleToJson.ToShortest(double_value, &db);
            db.Finalize();
            b += buf;
            break;
        }
        case Array: {
            bool once = false;
            b += '[';
            for (const Json& item : array_value) {
                if (once) {
                    b += ',';
                    if (pretty)
                        b += ' ';
                } else {
                    once = true;
                }
                item.marshal(b, pretty, indent);
            }
            b += ']';
            break;
        }
        case Object: {
            bool once = false;
            bool multiline = pretty && object_value.size() > 1;
            b += '{';
            for (const auto& member : object_value) {
                if (once) {
                    b += ',';
                } else {
                    once = true;
                }
                if (multiline) {
                    b += '\n';
                    for (int j = 0; j <= indent; ++j)
                        b += "  ";
                }
                stringify(b, member.first);
                b += ':';
                if (pretty)
                    b += ' ';
                member.second.marshal(b, pretty, multiline ? indent + 1 : indent);
            }
            if (multiline) {
                b += '\n';
                for (int j = 0; j < indent; ++j)
                    b += "  ";
            }
            b += '}';
            break;
        }
        default:
            ON_LOGIC_ERROR("Unhandled JSON type.");
    }
}

void
Json::stringify(std::string& b, const std::string& s)
{
    b += '"';
    serialize(b, s);
    b += '"';
}

// Decodes UTF-8 as it goes; anything outside printable ASCII is
// written as \u escapes, with astral planes split into surrogates.
void
Json::serialize(std::string& sb, const std::string& s)
{
    size_t i, j, m;
    wint_t x, a, b;
    unsigned long long w;
    for (i = 0; i < s.size();) {
        x = s[i++] & 255;
        if (x >= 0300) {
            a = ThomPikeByte(x);
            m = ThomPikeLen(x) - 1;
            if (i + m <= s.size()) {
                for (j = 0;;) {
                    b = s[i + j] & 0xff;
                    if (!ThomPikeCont(b))
                        break;
                    a = ThomPikeMerge(a, b);
                    if (++j == m) {
                        x = a;
                        i += j;
                        break;
                    }
                }
            }
        }
        switch (x <= 127 ? kEscapeLiteral[x] : 9) {
            case 0:
                sb += x;
                break;
            case 1:
                sb += "\\t";
                break;
            case 2:
                sb += "\\n";
                break;
            case 3:
                sb += "\\r";
                break;
            case 4:
                sb += "\\f";
                break;
            case 5:
                sb += "\\\\";
                break;
            case 6:
                sb += "\\/";
                break;
            case 7:
                sb += "\\\"";
                break;
            case 9:
                w = EncodeUtf16(x);
                do {
                    char esc[6];
                    esc[0] = '\\';
                    esc[1] = 'u';
                    esc[2] = "0123456789abcdef"[(w & 0xF000) >> 014];
                    esc[3] = "0123456789abcdef"[(w & 0x0F00) >> 010];
                    esc[4] = "0123456789abcdef"[(w & 0x00F0) >> 004];
                    esc[5] = "0123456789abcdef"[(w & 0x000F) >> 000];
                    sb.append(esc, 6);
                } while ((w >>= 16));
                break;
            default:
                ON_LOGIC_ERROR("Unhandled character escape code during string serialization.");
        }
    }
}

} // namespace jnav
