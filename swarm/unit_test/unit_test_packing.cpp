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
#  include <glm/vec2.hpp>
#  include <glm/vec3.hpp>
#  include <glm/common.hpp>
#include "warnpop.h"

#include <cmath>
#include <algorithm>

#include "base/test_minimal.h"
#include "base/random.h"
#include "base/utility.h"
#include "swarm/packing.h"

namespace {
// Allow for the float rounding on top of the quantization error.
constexpr float Tolerance = swarm::PackingPrecision + 1e-6f;

bool Near(float a, float b)
{
    return std::abs(a - b) <= Tolerance;
}
} // namespace

void unit_test_packing_source()
{
    TEST_CASE(test::Type::Feature)

    const std::string source = swarm::GetPackingSource();
    TEST_REQUIRE(base::Contains(source, "vec4 pack2HalfToRGBA(const vec2 v)"));
    TEST_REQUIRE(base::Contains(source, "vec2 unpackRGBATo2Half(const vec4 v)"));
}

void unit_test_packing_exact()
{
    TEST_CASE(test::Type::Feature)

    // without quantization the codec is exact up to float rounding.
    const float values[] = {0.0f, 1.0f, 0.5f, 0.25f, 0.123456f, 0.999f, 1.0f / 255.0f};
    for (float x : values)
    {
        for (float y : values)
        {
            const auto& ret = swarm::UnpackRGBATo2Half(swarm::Pack2HalfToRGBA(glm::vec2(x, y)));
            TEST_REQUIRE(std::abs(ret.x - x) < 1e-5f);
            TEST_REQUIRE(std::abs(ret.y - y) < 1e-5f);
        }
    }

    // every channel of the encoding is a valid color value.
    const auto& rgba = swarm::Pack2HalfToRGBA(glm::vec2(0.7f, 0.3f));
    for (int i=0; i<4; ++i)
    {
        TEST_REQUIRE(rgba[i] >= 0.0f);
        TEST_REQUIRE(rgba[i] <= 1.0f);
    }
}

void unit_test_packing_quantized()
{
    TEST_CASE(test::Type::Feature)

    // end points
    {
        const auto& zero = swarm::UnpackTexel(swarm::PackTexel(glm::vec2(0.0f, 0.0f)));
        TEST_REQUIRE(zero.x == 0.0f && zero.y == 0.0f);
        const auto& one = swarm::UnpackTexel(swarm::PackTexel(glm::vec2(1.0f, 1.0f)));
        TEST_REQUIRE(Near(one.x, 1.0f) && Near(one.y, 1.0f));
    }

    // going through the 8 bit texel keeps much more precision
    // than a single 8 bit channel would.
    base::RandomGenerator<float> random(0x1234, 0.0f, 1.0f);
    for (unsigned i=0; i<10000; ++i)
    {
        const glm::vec2 value(random(), random());
        const auto& texel = swarm::PackTexel(value);
        const auto& ret = swarm::UnpackTexel(texel);
        TEST_REQUIRE(Near(ret.x, value.x));
        TEST_REQUIRE(Near(ret.y, value.y));
    }

    // the texel bytes round trip unchanged.
    swarm::PackedTexel texel = {12, 200, 255, 0};
    TEST_REQUIRE(swarm::QuantizeTexel(swarm::NormalizeTexel(texel)) == texel);

    // out of range values are clamped by the quantization.
    const auto& clamped = swarm::QuantizeTexel(glm::vec4(-1.0f, 2.0f, 0.0f, 1.0f));
    TEST_REQUIRE(clamped[0] == 0);
    TEST_REQUIRE(clamped[1] == 255);
}

void unit_test_packing_position()
{
    TEST_CASE(test::Type::Feature)

    const glm::vec3 position(0.1f, 0.6f, 0.9f);
    const auto& xy = swarm::PackTexel(glm::vec2(position.x, position.y));
    const auto& zw = swarm::PackTexel(glm::vec2(position.z, 0.0f));
    const auto& ret = swarm::UnpackPosition(xy, zw);
    TEST_REQUIRE(Near(ret.x, position.x));
    TEST_REQUIRE(Near(ret.y, position.y));
    TEST_REQUIRE(Near(ret.z, position.z));
}

// Run the position update the way the update pipeline does it on the
// CPU reference of the codec and check that the result matches the
// wrapped new position within the codec precision.
void unit_test_packing_update_step()
{
    TEST_CASE(test::Type::Feature)

    const glm::vec3 gravity(0.0f, -1.0f, 0.0f);
    const glm::vec3 movement(0.25f, 0.0f, -0.5f);
    const glm::vec3 wrap(1.0f, 1.0f, 0.5f);
    const float dt = 0.016f;

    base::RandomGenerator<float> random(42, 0.0f, 0.5f);
    for (unsigned i=0; i<1000; ++i)
    {
        const glm::vec3 old(random(), random(), random());
        auto xy = swarm::PackTexel(glm::vec2(old.x, old.y));
        auto zw = swarm::PackTexel(glm::vec2(old.z, 0.0f));

        const auto& previous = swarm::UnpackPosition(xy, zw);
        const auto& next = glm::mod(previous + (gravity + movement) * dt, wrap);
        xy = swarm::PackTexel(glm::vec2(next.x, next.y));
        zw = swarm::PackTexel(glm::vec2(next.z, 0.0f));

        const auto& expected = glm::mod(old + (gravity + movement) * dt, wrap);
        const auto& decoded  = swarm::UnpackPosition(xy, zw);
        for (int c=0; c<3; ++c)
        {
            // a value right at the wrap bound can land on either side.
            float diff = std::abs(decoded[c] - expected[c]);
            diff = std::min(diff, std::abs(diff - wrap[c]));
            TEST_REQUIRE(diff <= 2.0f * Tolerance);
        }
        // decoded positions stay inside the wrap box.
        TEST_REQUIRE(decoded.x >= 0.0f && decoded.x <= wrap.x + Tolerance);
        TEST_REQUIRE(decoded.y >= 0.0f && decoded.y <= wrap.y + Tolerance);
        TEST_REQUIRE(decoded.z >= 0.0f && decoded.z <= wrap.z + Tolerance);
    }
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    unit_test_packing_source();
    unit_test_packing_exact();
    unit_test_packing_quantized();
    unit_test_packing_position();
    unit_test_packing_update_step();
    return 0;
}
) // EXPORT_TEST_MAIN
