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

#include "config.h"

#include "warnpush.h"
#  include <nlohmann/json.hpp>
#  include <glm/vec2.hpp>
#  include <glm/vec3.hpp>
#  include <glm/vec4.hpp>
#include "warnpop.h"


#include "base/json.h"

namespace base {
namespace detail {

void JsonWriteJson(nlohmann::json& json, const char* name, nlohmann::json&& object)
{ json[name] = std::move(object); }

bool HasObject(const nlohmann::json& json, const char* name)
{ return json.contains(name) && json[name].is_object(); }

bool HasValue(const nlohmann::json& json, const char* name)
{ return json.contains(name); }

} // namespace

const nlohmann::json* GetJsonObj(const nlohmann::json& json, const char* name)
{
    if (!detail::HasObject(json, name))
        return nullptr;
    return &json[name];
}

// integer values are accepted where a float is expected since
// hand written config files will have "1" instead of "1.0"
bool JsonReadSafe(const nlohmann::json& object, const char* name, float* out)
{
    if (!object.contains(name) || !object[name].is_number())
        return false;
    *out = object[name];
    return true;
}
bool JsonReadSafe(const nlohmann::json& object, const char* name, int* out)
{
    if (!object.contains(name) || !object[name].is_number_integer())
        return false;
    *out = object[name];
    return true;
}
bool JsonReadSafe(const nlohmann::json& object, const char* name, unsigned* out)
{
    if (!object.contains(name) || !object[name].is_number_unsigned())
        return false;
    *out = object[name];
    return true;
}
bool JsonReadSafe(const nlohmann::json& object, const char* name, bool* out)
{
    if (!object.contains(name) || !object[name].is_boolean())
        return false;
    *out = object[name];
    return true;
}
bool JsonReadSafe(const nlohmann::json& object, const char* name, std::string* out)
{
    if  (!object.contains(name) || !object[name].is_string())
        return false;
    *out = object[name];
    return true;
}

bool JsonReadSafe(const nlohmann::json& object, const char* name, glm::vec2* out)
{
    if (!object.contains(name) || !object[name].is_object())
        return false;
    const auto& vector = object[name];
    glm::vec2 ret;
    if (!JsonReadSafe(vector, "x", &ret.x) ||
        !JsonReadSafe(vector, "y", &ret.y))
        return false;
    // if it contains more than x and y then it's not a vec2
    if (vector.contains("z"))
        return false;
    *out = ret;
    return true;
}
bool JsonReadSafe(const nlohmann::json& object, const char* name, glm::vec3* out)
{
    if (!object.contains(name) || !object[name].is_object())
        return false;
    const auto& vector = object[name];
    glm::vec3 ret;
    if (!JsonReadSafe(vector, "x", &ret.x) ||
        !JsonReadSafe(vector, "y", &ret.y) ||
        !JsonReadSafe(vector, "z", &ret.z))
        return false;
    // if it contains more than x,y,z then it's not a vec3
    if (vector.contains("w"))
        return false;
    *out = ret;
    return true;
}
bool JsonReadSafe(const nlohmann::json& object, const char* name, glm::vec4* out)
{
    if (!object.contains(name) || !object[name].is_object())
        return false;
    const auto& vector = object[name];
    glm::vec4 ret;
    if (!JsonReadSafe(vector, "x", &ret.x) ||
        !JsonReadSafe(vector, "y", &ret.y) ||
        !JsonReadSafe(vector, "z", &ret.z) ||
        !JsonReadSafe(vector, "w", &ret.w))
        return false;
    *out = ret;
    return true;
}

void JsonWrite(nlohmann::json& object, const char* name, int value)
{ object[name] = value; }
void JsonWrite(nlohmann::json& object, const char* name, unsigned value)
{ object[name] = value; }
void JsonWrite(nlohmann::json& object, const char* name, float value)
{ object[name] = value; }
void JsonWrite(nlohmann::json& object, const char* name, bool value)
{ object[name] = value; }
void JsonWrite(nlohmann::json& object, const char* name, const char* str)
{ object[name] = str; }
void JsonWrite(nlohmann::json& object, const char* name, const std::string& value)
{ object[name] = value; }

void JsonWrite(nlohmann::json& object, const char* name, const glm::vec2& vec)
{
    nlohmann::json json;
    json["x"] = vec.x;
    json["y"] = vec.y;
    object[name] = std::move(json);
}
void JsonWrite(nlohmann::json& object, const char* name, const glm::vec3& vec)
{
    nlohmann::json json;
    json["x"] = vec.x;
    json["y"] = vec.y;
    json["z"] = vec.z;
    object[name] = std::move(json);
}
void JsonWrite(nlohmann::json& object, const char* name, const glm::vec4& vec)
{
    nlohmann::json json;
    json["x"] = vec.x;
    json["y"] = vec.y;
    json["z"] = vec.z;
    json["w"] = vec.w;
    object[name] = std::move(json);
}
void JsonWrite(nlohmann::json& object, const char* name, nlohmann::json&& child)
{ object[name] = std::move(child); }

template<typename It>
std::tuple<bool, nlohmann::json, std::string> JsonParse(It beg, It end)
{
    // if exceptions are suppressed there are no diagnostics
    // so use this wrapper.
    std::string msg;
    nlohmann::json json;
    bool ok = true;

    try
    { json = nlohmann::json::parse(beg, end); }
    catch (const nlohmann::detail::parse_error& err)
    {
        msg = err.what();
        ok = false;
    }
    return std::make_tuple(ok, std::move(json), std::move(msg));
}

std::tuple<bool, nlohmann::json, std::string> JsonParse(const char* beg, const char* end)
{ return JsonParse<const char*>(beg, end); }
std::tuple<bool, nlohmann::json, std::string> JsonParse(const std::string& json)
{ return JsonParse(json.begin(), json.end()); }

} // namespace
