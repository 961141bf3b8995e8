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
#  include <glm/vec2.hpp>
#  include <glm/vec3.hpp>
#  include <glm/vec4.hpp>
#  include <glm/mat4x4.hpp>
#include "warnpop.h"

#include <string>
#include <variant>

namespace swarm
{
    class Texture;
    class ProgramState;

    // The types of uniforms that can be declared by the users of
    // the composed programs.
    enum class UniformType {
        Sampler2D, Float, Vec2, Vec3, Vec4, Mat4
    };

    // The value alternative index is the UniformType value. A sampler
    // without a texture is a nullptr.
    using UniformValue = std::variant<const Texture*, float,
            glm::vec2, glm::vec3, glm::vec4, glm::mat4>;

    struct UniformDeclaration {
        std::string name;
        UniformType type = UniformType::Float;
        UniformValue value;
    };

    inline bool IsValueOfType(const UniformValue& value, UniformType type) noexcept
    { return value.index() == static_cast<size_t>(type); }

    // GLSL type name of the uniform type, e.g. "vec3".
    std::string UniformTypeToString(UniformType type);
    // Map a GLSL type name back to the uniform type. Returns false
    // if the type is not a supported uniform type.
    bool UniformTypeFromString(const std::string& str, UniformType* type);

    // Set the uniform value on the program state. Textures are set
    // as sampler bindings and nullptr textures are ignored.
    void ApplyUniformValue(ProgramState& state, const std::string& name, const UniformValue& value);

} // namespace
