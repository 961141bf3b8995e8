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
#  include <magic_enum.hpp>
#include "warnpop.h"

#include <type_traits>

#include "base/assert.h"
#include "swarm/uniform.h"
#include "swarm/program.h"
#include "swarm/texture.h"

namespace swarm
{

std::string UniformTypeToString(UniformType type)
{
    switch (type)
    {
        case UniformType::Sampler2D: return "sampler2D";
        case UniformType::Float:     return "float";
        case UniformType::Vec2:      return "vec2";
        case UniformType::Vec3:      return "vec3";
        case UniformType::Vec4:      return "vec4";
        case UniformType::Mat4:      return "mat4";
    }
    BUG("Unhandled uniform type.");
    return "";
}

bool UniformTypeFromString(const std::string& str, UniformType* type)
{
    for (const auto value : magic_enum::enum_values<UniformType>())
    {
        if (UniformTypeToString(value) != str)
            continue;
        *type = value;
        return true;
    }
    return false;
}

void ApplyUniformValue(ProgramState& state, const std::string& name, const UniformValue& value)
{
    std::visit([&state, &name](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same<T, const Texture*>::value) {
            if (v)
                state.SetTexture(name, *v);
        } else {
            state.SetUniform(name, v);
        }
    }, value);
}

} // namespace
