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
#include "warnpop.h"

#include <array>
#include <cstdint>

namespace swarm
{
    // Two scalars in [0,1] packed into one RGBA8 texel so that each
    // scalar gets the extra precision of a second 8 bit channel.
    // x is stored in R (coarse) and G (fine), y in B and A.
    // The GLSL and the CPU functions are equivalent so that a texel
    // written by one decodes to the same value with the other.
    using PackedTexel = std::array<std::uint8_t, 4>;

    // GLSL ES 3.00 source for
    //   vec4 pack2HalfToRGBA(const vec2 v)
    //   vec2 unpackRGBATo2Half(const vec4 v)
    const char* GetPackingSource() noexcept;

    // Encode the value into normalized (float) channel values the way
    // the shader writes them into the color buffer.
    glm::vec4 Pack2HalfToRGBA(const glm::vec2& value) noexcept;
    // Decode normalized channel values.
    glm::vec2 UnpackRGBATo2Half(const glm::vec4& rgba) noexcept;

    // Quantize to bytes the same way the fixed function output does
    // when writing into an RGBA8 color buffer.
    PackedTexel QuantizeTexel(const glm::vec4& rgba) noexcept;
    glm::vec4 NormalizeTexel(const PackedTexel& texel) noexcept;

    inline PackedTexel PackTexel(const glm::vec2& value) noexcept
    { return QuantizeTexel(Pack2HalfToRGBA(value)); }
    inline glm::vec2 UnpackTexel(const PackedTexel& texel) noexcept
    { return UnpackRGBATo2Half(NormalizeTexel(texel)); }

    // Largest decoding error of a value in [0,1] going through
    // PackTexel and UnpackTexel.
    constexpr float PackingPrecision = 1.0f / (255.0f * 255.0f);

    // Decode a position stored in two texels, xy in the first and z in
    // the x component of the second.
    inline glm::vec3 UnpackPosition(const PackedTexel& xy, const PackedTexel& zw) noexcept
    {
        const auto& a = UnpackTexel(xy);
        const auto& b = UnpackTexel(zw);
        return glm::vec3(a.x, a.y, b.x);
    }

} // namespace
