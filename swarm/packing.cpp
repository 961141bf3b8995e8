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
#  include <glm/common.hpp>
#include "warnpop.h"

#include <cmath>

#include "swarm/packing.h"

namespace swarm
{

const char* GetPackingSource() noexcept
{
    return R"(
vec4 pack2HalfToRGBA(const vec2 v) {
    vec4 r = vec4(v.x, fract(v.x * 255.0), v.y, fract(v.y * 255.0));
    return vec4(r.x - r.y / 255.0, r.y, r.z - r.w / 255.0, r.w);
}
vec2 unpackRGBATo2Half(const vec4 v) {
    return vec2(v.x + (v.y / 255.0), v.z + (v.w / 255.0));
}
)";
}

glm::vec4 Pack2HalfToRGBA(const glm::vec2& value) noexcept
{
    const glm::vec4 r(value.x, glm::fract(value.x * 255.0f),
                      value.y, glm::fract(value.y * 255.0f));
    return glm::vec4(r.x - r.y / 255.0f, r.y, r.z - r.w / 255.0f, r.w);
}

glm::vec2 UnpackRGBATo2Half(const glm::vec4& rgba) noexcept
{
    return glm::vec2(rgba.x + rgba.y / 255.0f, rgba.z + rgba.w / 255.0f);
}

PackedTexel QuantizeTexel(const glm::vec4& rgba) noexcept
{
    PackedTexel ret;
    for (int i=0; i<4; ++i)
    {
        const float c = glm::clamp(rgba[i], 0.0f, 1.0f);
        ret[i] = static_cast<std::uint8_t>(std::lround(c * 255.0f));
    }
    return ret;
}

glm::vec4 NormalizeTexel(const PackedTexel& texel) noexcept
{
    return glm::vec4(texel[0] / 255.0f, texel[1] / 255.0f,
                     texel[2] / 255.0f, texel[3] / 255.0f);
}

} // namespace
