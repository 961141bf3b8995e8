// Copyright (C) 2020-2024 Sami Väisänen
// Copyright (C) 2020-2024 Ensisoft http://www.ensisoft.com
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include "config.h"

#include "warnpush.h"
#  include <nlohmann/json_fwd.hpp>
#  include <magic_enum.hpp>
#  include <glm/fwd.hpp>
#include "warnpop.h"

#include <tuple>
#include <string>
#include <type_traits>
#include <optional>
#include <vector>

// json utilities. nlohmann/json.hpp is a huge header and including it is a
// great way to make the build slow. This header (and the source file) provide
// a little firewall around it so that only json.cpp and the translation units
// that really need to walk json objects include the full header.

namespace base {
namespace detail {
    void JsonWriteJson(nlohmann::json& json, const char* name, nlohmann::json&& object);
    bool HasObject(const nlohmann::json& json, const char* name);
    bool HasValue(const nlohmann::json& json, const char* name);
} // detail

// Get a pointer to the named child object or nullptr if there's no such object.
const nlohmann::json* GetJsonObj(const nlohmann::json& json, const char* name);

bool JsonReadSafe(const nlohmann::json& object, const char* name, float* out);
bool JsonReadSafe(const nlohmann::json& object, const char* name, int* out);
bool JsonReadSafe(const nlohmann::json& object, const char* name, unsigned* out);
bool JsonReadSafe(const nlohmann::json& object, const char* name, bool* out);
bool JsonReadSafe(const nlohmann::json& object, const char* name, std::string* out);
bool JsonReadSafe(const nlohmann::json& object, const char* name, glm::vec2* out);
bool JsonReadSafe(const nlohmann::json& object, const char* name, glm::vec3* out);
bool JsonReadSafe(const nlohmann::json& object, const char* name, glm::vec4* out);

void JsonWrite(nlohmann::json& object, const char* name, int value);
void JsonWrite(nlohmann::json& object, const char* name, unsigned value);
void JsonWrite(nlohmann::json& object, const char* name, float value);
void JsonWrite(nlohmann::json& object, const char* name, bool value);
void JsonWrite(nlohmann::json& object, const char* name, const char* str);
void JsonWrite(nlohmann::json& object, const char* name, const std::string& value);
void JsonWrite(nlohmann::json& object, const char* name, const glm::vec2& vec);
void JsonWrite(nlohmann::json& object, const char* name, const glm::vec3& vec);
void JsonWrite(nlohmann::json& object, const char* name, const glm::vec4& vec);
void JsonWrite(nlohmann::json& object, const char* name, nlohmann::json&& child);

template<typename EnumT> inline
bool JsonReadSafeEnum(const nlohmann::json& json, const char* name, EnumT* out)
{
    std::string str;
    if (!JsonReadSafe(json, name, &str))
        return false;
    const auto& enum_val = magic_enum::enum_cast<EnumT>(str);
    if (!enum_val.has_value())
        return false;
    *out = enum_val.value();
    return true;
}

template<typename T> inline
bool JsonReadObject(const nlohmann::json& json, const char* name, T* out)
{
    const auto* object = GetJsonObj(json, name);
    if (object == nullptr)
        return false;
    std::optional<T> ret = T::FromJson(*object);
    if (!ret.has_value())
        return false;
    *out = std::move(ret.value());
    return true;
}

template<typename ValueT> inline
bool JsonReadSafe(const nlohmann::json& object, const char* name, ValueT* out)
{
    if constexpr (std::is_enum<ValueT>::value)
        return JsonReadSafeEnum(object, name, out);
    else return JsonReadObject(object, name, out);
}

// read an optional value. if the value doesn't exist the optional is
// left as is and the read is considered successful. if the value exists
// but cannot be read the read fails.
template<typename T> inline
bool JsonReadOptional(const nlohmann::json& json, const char* name, std::optional<T>* out)
{
    if (!detail::HasValue(json, name))
        return true;
    T value;
    if (!JsonReadSafe(json, name, &value))
        return false;
    *out = value;
    return true;
}

template<typename EnumT> inline
void JsonWriteEnum(nlohmann::json& json, const char* name, EnumT value)
{ JsonWrite(json, name, std::string(magic_enum::enum_name(value))); }

template<typename T> inline
void JsonWriteObject(nlohmann::json& json, const char* name, const T& value)
{ detail::JsonWriteJson(json, name, value.ToJson()); }

template<typename ValueT> inline
void JsonWrite(nlohmann::json& json, const char* name, const ValueT& value)
{
    if constexpr (std::is_enum<ValueT>::value)
        JsonWriteEnum(json, name, value);
    else JsonWriteObject(json, name, value);
}

std::tuple<bool, nlohmann::json, std::string> JsonParse(const char* beg, const char* end);
std::tuple<bool, nlohmann::json, std::string> JsonParse(const std::string& json);

} // base
