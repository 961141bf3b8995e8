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

#include <cmath>
#include <string>
#include <stdexcept>
#include <functional>
#include <variant>

#include "base/test_minimal.h"
#include "base/test_float.h"
#include "base/utility.h"
#include "swarm/gpu_instanced_billboard.h"
#include "swarm/instanced_billboard.h"
#include "swarm/unit_test/test_device.h"

namespace {
swarm::GpuInstancedBillboard::Params MakeGpuParams(unsigned max_count)
{
    swarm::GpuInstancedBillboard::Params params;
    params.max_instances_count = max_count;
    params.rendering.fragment_code = "return vec4(uColor, 1.0);";
    params.rendering.uniforms.push_back({"uColor", swarm::UniformType::Vec3, glm::vec3(1.0f)});
    params.simulation.seed = 123;
    return params;
}

swarm::InstancedBillboard::Params MakeBatchParams()
{
    swarm::InstancedBillboard::Params params;
    params.attributes.push_back({"color", swarm::BillboardShader::AttributeType::Vec4});
    params.varyings.push_back({"vColor", swarm::BillboardShader::VaryingType::Vec4});
    params.vertex_code   = "vColor = a_color;";
    params.fragment_code = "return vColor;";
    return params;
}

std::string GetExceptionMessage(const std::function<void()>& func)
{
    try
    {
        func();
    }
    catch (const std::exception& e)
    {
        return e.what();
    }
    return "";
}
} // namespace

void unit_test_texture_size()
{
    TEST_CASE(test::Type::Feature)

    using B = swarm::GpuInstancedBillboard;

    TEST_REQUIRE(B::NextPowerOfTwo(1) == 2);
    TEST_REQUIRE(B::NextPowerOfTwo(2) == 2);
    TEST_REQUIRE(B::NextPowerOfTwo(3) == 4);
    TEST_REQUIRE(B::NextPowerOfTwo(141) == 256);
    TEST_REQUIRE(B::NextPowerOfTwo(256) == 256);
    TEST_REQUIRE(B::NextPowerOfTwo(257) == 512);
    TEST_REQUIRE(B::NextPowerOfTwo(1u << 29) == (1u << 29));
    TEST_EXCEPTION(B::NextPowerOfTwo(0));
    TEST_EXCEPTION(B::NextPowerOfTwo((1u << 29) + 1));

    TEST_REQUIRE(B::ComputeTextureSize(1) == 2);
    TEST_REQUIRE(B::ComputeTextureSize(4) == 2);
    TEST_REQUIRE(B::ComputeTextureSize(20000) == 256);
    TEST_REQUIRE(B::ComputeTextureSize(65536) == 256);

    // the size is based on the floor of the square root which
    // leaves some counts without enough texels.
    TEST_REQUIRE(GetExceptionMessage([]() { B::ComputeTextureSize(5); }) == "Too many particles");
    TEST_REQUIRE(GetExceptionMessage([]() { B::ComputeTextureSize(65537); }) == "Too many particles");

    TEST_REQUIRE(B::ComputeTexelId(0, 256) == glm::uvec2(0, 0));
    TEST_REQUIRE(B::ComputeTexelId(255, 256) == glm::uvec2(255, 0));
    TEST_REQUIRE(B::ComputeTexelId(300, 256) == glm::uvec2(44, 1));
    TEST_REQUIRE(B::ComputeTexelId(65535, 256) == glm::uvec2(255, 255));
}

void unit_test_gpu_billboard_create()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;
    swarm::GpuInstancedBillboard billboard(device, MakeGpuParams(20000));
    TEST_REQUIRE(billboard.GetTextureSize() == 256);
    TEST_REQUIRE(billboard.GetMaxInstancesCount() == 20000);
    TEST_REQUIRE(billboard.GetInstancesCount() == 0);
    TEST_REQUIRE(billboard.GetState().GetWidth() == 256);
    TEST_REQUIRE(billboard.GetState().GetHeight() == 256);

    // 2 noise textures and 2 sets of 2 position textures.
    TEST_REQUIRE(device.GetNumTextures() == 6);
    TEST_REQUIRE(device.GetNumFramebuffers() == 2);

    for (unsigned i=0; i<2; ++i)
    {
        const auto* noise = device.GetTexture(billboard.GetNoiseTexture(i)->GetId());
        TEST_REQUIRE(noise);
        TEST_REQUIRE(noise->GetWidth() == 256);
        TEST_REQUIRE(noise->GetHeight() == 256);
        TEST_REQUIRE(noise->GetBytes().size() == 256 * 256 * 4);
        TEST_REQUIRE(noise->GetMinFilter() == swarm::Texture::MinFilter::Nearest);
    }
    TEST_REQUIRE(base::EndsWith(billboard.GetNoiseTexture(0)->GetId(), "/Noise1"));
    TEST_REQUIRE(base::EndsWith(billboard.GetNoiseTexture(1)->GetId(), "/Noise2"));

    // the display program samples the positions in the instance texel.
    const auto& vertex = billboard.GetShader().GetVertexSource();
    TEST_REQUIRE(base::Contains(vertex, "uniform sampler2D uPositionXYTexture;"));
    TEST_REQUIRE(base::Contains(vertex, "uniform sampler2D uPositionZWTexture;"));
    TEST_REQUIRE(base::Contains(vertex, "int(mod(float(gl_InstanceID), 256.0))"));
    TEST_REQUIRE(base::Contains(vertex, "gl_InstanceID / 256"));
    TEST_REQUIRE(base::Contains(vertex, "texelFetch(uPositionXYTexture, texelId, 0)"));

    const auto& state = billboard.GetState();
    TEST_REQUIRE(base::Contains(state.GetFragmentSource("initialize"), "uniform sampler2D uNoiseTexture1;"));
    TEST_REQUIRE(base::Contains(state.GetFragmentSource("initialize"), "mod(position, uWrapBound)"));
    TEST_REQUIRE(base::Contains(state.GetFragmentSource("update"), "(uGravity + uUniformMovement) * uDeltaTime"));

    // the current position textures are bound from the start.
    const auto& program_state = billboard.GetShader().GetProgramState();
    TEST_REQUIRE(program_state.FindTextureBinding("uPositionXYTexture")->texture == state.GetCurrentTexture("positionsTexture1"));
    TEST_REQUIRE(program_state.FindTextureBinding("uPositionZWTexture")->texture == state.GetCurrentTexture("positionsTexture2"));
}

void unit_test_gpu_billboard_invalid()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;
    TEST_EXCEPTION(swarm::GpuInstancedBillboard billboard(device, MakeGpuParams(0)));
    TEST_EXCEPTION(swarm::GpuInstancedBillboard billboard(device, MakeGpuParams(65537)));

    {
        auto params = MakeGpuParams(100);
        params.simulation.wrap_bound = glm::vec3(1.0f, 0.0f, 1.0f);
        TEST_EXCEPTION(swarm::GpuInstancedBillboard billboard(device, params));
    }
    {
        auto params = MakeGpuParams(100);
        params.simulation.wrap_bound = glm::vec3(1.0f, 1.0f, 1.5f);
        TEST_EXCEPTION(swarm::GpuInstancedBillboard billboard(device, params));
    }
    {
        auto params = MakeGpuParams(100);
        params.rendering.uniforms.push_back({"uPositionsRange", swarm::UniformType::Vec3, glm::vec3(1.0f)});
        TEST_EXCEPTION(swarm::GpuInstancedBillboard billboard(device, params));
    }
    TEST_REQUIRE(device.GetNumTextures() == 0);
    TEST_REQUIRE(device.GetNumFramebuffers() == 0);

    // position textures larger than the device supports are rejected
    // before any texture is created. 300M instances needs 32768x32768.
    TEST_REQUIRE(swarm::GpuInstancedBillboard::ComputeTextureSize(300000000) == 32768);
    TEST_REQUIRE(GetExceptionMessage([&device]() {
        swarm::GpuInstancedBillboard billboard(device, MakeGpuParams(300000000));
    }) == "Position texture size 32768 exceeds the device max 4096x4096.");

    swarm::Device::DeviceCaps caps;
    device.GetDeviceCaps(&caps);
    caps.max_fbo_width  = 128;
    caps.max_fbo_height = 128;
    device.SetDeviceCaps(caps);
    TEST_EXCEPTION(swarm::GpuInstancedBillboard billboard(device, MakeGpuParams(20000)));
    TEST_REQUIRE(device.GetNumTextures() == 0);
    TEST_REQUIRE(device.GetNumFramebuffers() == 0);

    swarm::GpuInstancedBillboard billboard(device, MakeGpuParams(16384));
    TEST_REQUIRE(billboard.GetTextureSize() == 128);
}

void unit_test_gpu_billboard_instances()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;
    swarm::GpuInstancedBillboard billboard(device, MakeGpuParams(20000));

    billboard.SetInstancesCount(20000);
    TEST_REQUIRE(billboard.GetInstancesCount() == 20000);
    billboard.SetInstancesCount(0);
    TEST_REQUIRE(billboard.GetInstancesCount() == 0);
    billboard.SetInstancesCount(1000);

    const auto& message = GetExceptionMessage([&billboard]() {
        billboard.SetInstancesCount(65537);
    });
    TEST_REQUIRE(base::Contains(message, "65537"));
    TEST_REQUIRE(base::Contains(message, "20000"));
    TEST_REQUIRE(billboard.GetInstancesCount() == 1000);
}

void unit_test_gpu_billboard_simulation()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;
    swarm::GpuInstancedBillboard billboard(device, MakeGpuParams(1000));
    const auto& state = billboard.GetState();
    const auto& program_state = billboard.GetShader().GetProgramState();

    // updating before initializing is fine, the positions start from
    // whatever the textures contain.
    billboard.UpdatePositions(0.5f, glm::vec3(1.0f, 0.0f, 0.0f));
    TEST_REQUIRE(device.GetNumDraws() == 1);
    {
        const auto& draw = device.GetDraw(0);
        TEST_REQUIRE(draw.program == state.GetProgramId("update"));
        TEST_REQUIRE(draw.state.FindTextureBinding("uPreviousState_positionsTexture1"));
        TEST_REQUIRE(draw.state.FindTextureBinding("uPreviousState_positionsTexture2"));
        float dt = 0.0f;
        glm::vec3 movement;
        glm::vec3 gravity;
        TEST_REQUIRE(draw.state.GetUniform("uDeltaTime", &dt));
        TEST_REQUIRE(draw.state.GetUniform("uUniformMovement", &movement));
        TEST_REQUIRE(draw.state.GetUniform("uGravity", &gravity));
        TEST_REQUIRE(dt == 0.5f);
        TEST_REQUIRE(movement == glm::vec3(1.0f, 0.0f, 0.0f));
        TEST_REQUIRE(gravity == glm::vec3(0.0f, -1.0f, 0.0f));
    }
    TEST_REQUIRE(program_state.FindTextureBinding("uPositionXYTexture")->texture == state.GetCurrentTexture("positionsTexture1"));

    billboard.InitializePositions();
    TEST_REQUIRE(device.GetNumDraws() == 2);
    {
        const auto& draw = device.GetDraw(1);
        TEST_REQUIRE(draw.program == state.GetProgramId("initialize"));
        TEST_REQUIRE(draw.state.FindTextureBinding("uNoiseTexture1")->texture == billboard.GetNoiseTexture(0));
        TEST_REQUIRE(draw.state.FindTextureBinding("uNoiseTexture2")->texture == billboard.GetNoiseTexture(1));
        TEST_REQUIRE(draw.state.FindTextureBinding("uPreviousState_positionsTexture1") == nullptr);
    }
    TEST_REQUIRE(program_state.FindTextureBinding("uPositionXYTexture")->texture == state.GetCurrentTexture("positionsTexture1"));
    TEST_REQUIRE(program_state.FindTextureBinding("uPositionZWTexture")->texture == state.GetCurrentTexture("positionsTexture2"));

    billboard.UpdatePositions(0.016f, glm::vec3(0.0f));
    TEST_REQUIRE(device.GetNumDraws() == 3);
    TEST_REQUIRE(program_state.FindTextureBinding("uPositionXYTexture")->texture == state.GetCurrentTexture("positionsTexture1"));
}

void unit_test_gpu_billboard_draw()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;
    swarm::GpuInstancedBillboard billboard(device, MakeGpuParams(1000));

    // nothing to draw
    billboard.Draw();
    TEST_REQUIRE(device.GetNumDraws() == 0);

    billboard.SetInstancesCount(500);
    billboard.SetPositionsRange(glm::vec3(10.0f, 5.0f, 10.0f));
    billboard.SetUniform("uColor", glm::vec3(1.0f, 0.0f, 0.0f));
    TEST_EXCEPTION(billboard.SetUniform("uColor", 1.0f));
    TEST_EXCEPTION(billboard.SetUniform("uFoo", 1.0f));

    billboard.Draw();
    TEST_REQUIRE(device.GetNumDraws() == 1);
    {
        const auto& draw = device.GetDraw(0);
        TEST_REQUIRE(draw.program == billboard.GetShader().GetProgramId());
        TEST_REQUIRE(draw.geometry == "billboard-quad");
        TEST_REQUIRE(draw.fbo == nullptr);
        TEST_REQUIRE(draw.instance_count.has_value());
        TEST_REQUIRE(draw.instance_count.value() == 500);
        TEST_REQUIRE(draw.instance_buffers.empty());

        glm::vec3 range;
        glm::vec3 color;
        TEST_REQUIRE(draw.state.GetUniform("uPositionsRange", &range));
        TEST_REQUIRE(draw.state.GetUniform("uColor", &color));
        TEST_REQUIRE(range == glm::vec3(10.0f, 5.0f, 10.0f));
        TEST_REQUIRE(color == glm::vec3(1.0f, 0.0f, 0.0f));
    }

    // display program and the initialize and update programs, each with
    // its own fragment shader, plus the shared vertex shaders.
    TEST_REQUIRE(device.GetNumShaders() == 5);

    billboard.Dispose();
    TEST_REQUIRE(billboard.IsDisposed());
    TEST_REQUIRE(device.GetNumTextures() == 0);
    TEST_REQUIRE(device.GetNumFramebuffers() == 0);
    TEST_REQUIRE(device.GetNumPrograms() == 0);
    TEST_REQUIRE(device.GetNumShaders() == 0);

    // draw after dispose is a no-op, everything else is an error.
    billboard.Draw();
    TEST_REQUIRE(device.GetNumDraws() == 1);
    billboard.Dispose();
    TEST_EXCEPTION(billboard.SetInstancesCount(1));
    TEST_EXCEPTION(billboard.InitializePositions());
    TEST_EXCEPTION(billboard.UpdatePositions(0.1f, glm::vec3(0.0f)));
}

void unit_test_gpu_billboard_noise()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;

    auto params = MakeGpuParams(100);
    swarm::GpuInstancedBillboard a(device, params);
    swarm::GpuInstancedBillboard b(device, params);
    params.simulation.seed = 124;
    swarm::GpuInstancedBillboard c(device, params);

    const auto& a1 = device.GetTexture(a.GetNoiseTexture(0)->GetId())->GetBytes();
    const auto& a2 = device.GetTexture(a.GetNoiseTexture(1)->GetId())->GetBytes();
    const auto& b1 = device.GetTexture(b.GetNoiseTexture(0)->GetId())->GetBytes();
    const auto& b2 = device.GetTexture(b.GetNoiseTexture(1)->GetId())->GetBytes();
    const auto& c1 = device.GetTexture(c.GetNoiseTexture(0)->GetId())->GetBytes();

    // same seed gives the same noise.
    TEST_REQUIRE(a1 == b1);
    TEST_REQUIRE(a2 == b2);
    // the two noise textures differ from each other.
    TEST_REQUIRE(a1 != a2);
    // the second texture uses seed + 1
    TEST_REQUIRE(a2 == c1);
}

void unit_test_gpu_billboard_json()
{
    TEST_CASE(test::Type::Feature)

    swarm::GpuInstancedBillboard::Params params;
    params.max_instances_count = 5000;
    params.origin    = glm::vec2(0.0f, -0.5f);
    params.positions_range = glm::vec3(20.0f, 10.0f, 20.0f);
    params.rendering.material    = swarm::BillboardShader::Material::Phong;
    params.rendering.blending    = swarm::BillboardShader::Blending::Additive;
    params.rendering.depth_write = false;
    params.rendering.transparent = true;
    params.rendering.fragment_code = "return vec4(uTint, uAlpha);";
    params.rendering.uniforms.push_back({"uTint", swarm::UniformType::Vec3, glm::vec3(0.5f, 0.25f, 1.0f)});
    params.rendering.uniforms.push_back({"uAlpha", swarm::UniformType::Float, 0.75f});
    params.rendering.uniforms.push_back({"uMask", swarm::UniformType::Sampler2D, static_cast<const swarm::Texture*>(nullptr)});
    params.simulation.gravity    = glm::vec3(0.0f, -0.2f, 0.0f);
    params.simulation.wrap_bound = glm::vec3(1.0f, 0.5f, 1.0f);
    params.simulation.seed       = 77;

    nlohmann::json json;
    params.IntoJson(json);

    const auto& ret = swarm::GpuInstancedBillboard::Params::FromJson(json);
    TEST_REQUIRE(ret.has_value());
    TEST_REQUIRE(ret->max_instances_count == 5000);
    TEST_REQUIRE(ret->origin.has_value());
    TEST_REQUIRE(ret->origin.value() == glm::vec2(0.0f, -0.5f));
    TEST_REQUIRE(ret->lock_axis.has_value() == false);
    TEST_REQUIRE(ret->positions_range == glm::vec3(20.0f, 10.0f, 20.0f));
    TEST_REQUIRE(ret->rendering.material == swarm::BillboardShader::Material::Phong);
    TEST_REQUIRE(ret->rendering.blending == swarm::BillboardShader::Blending::Additive);
    TEST_REQUIRE(ret->rendering.depth_write == false);
    TEST_REQUIRE(ret->rendering.transparent == true);
    TEST_REQUIRE(ret->rendering.fragment_code == "return vec4(uTint, uAlpha);");
    TEST_REQUIRE(ret->rendering.uniforms.size() == 3);
    TEST_REQUIRE(ret->rendering.uniforms[0].name == "uTint");
    TEST_REQUIRE(ret->rendering.uniforms[0].type == swarm::UniformType::Vec3);
    TEST_REQUIRE(std::get<glm::vec3>(ret->rendering.uniforms[0].value) == glm::vec3(0.5f, 0.25f, 1.0f));
    TEST_REQUIRE(ret->rendering.uniforms[1].name == "uAlpha");
    TEST_REQUIRE(real::equals(std::get<float>(ret->rendering.uniforms[1].value), 0.75f));
    TEST_REQUIRE(ret->rendering.uniforms[2].type == swarm::UniformType::Sampler2D);
    TEST_REQUIRE(std::get<const swarm::Texture*>(ret->rendering.uniforms[2].value) == nullptr);
    TEST_REQUIRE(ret->simulation.gravity == glm::vec3(0.0f, -0.2f, 0.0f));
    TEST_REQUIRE(ret->simulation.wrap_bound == glm::vec3(1.0f, 0.5f, 1.0f));
    TEST_REQUIRE(ret->simulation.seed == 77);

    // unsupported material
    {
        auto bad = json;
        bad["rendering"]["material"] = "Lambert";
        TEST_REQUIRE(!swarm::GpuInstancedBillboard::Params::FromJson(bad).has_value());
    }
    // missing rendering
    {
        auto bad = json;
        bad.erase("rendering");
        TEST_REQUIRE(!swarm::GpuInstancedBillboard::Params::FromJson(bad).has_value());
    }
    // wrong uniform value type
    {
        auto bad = json;
        bad["rendering"]["uniforms"][1]["value"] = "foo";
        TEST_REQUIRE(!swarm::GpuInstancedBillboard::Params::FromJson(bad).has_value());
    }
    // the simulation settings are optional.
    {
        auto minimal = json;
        minimal.erase("simulation");
        const auto& ret = swarm::GpuInstancedBillboard::Params::FromJson(minimal);
        TEST_REQUIRE(ret.has_value());
        TEST_REQUIRE(ret->simulation.seed == 0);
        TEST_REQUIRE(ret->simulation.wrap_bound == glm::vec3(1.0f, 1.0f, 1.0f));
    }
}

void unit_test_batch()
{
    TEST_CASE(test::Type::Feature)

    const std::vector<swarm::BillboardShader::Attribute> attributes = {
        {"color", swarm::BillboardShader::AttributeType::Vec4},
        {"size", swarm::BillboardShader::AttributeType::Float}
    };

    TEST_EXCEPTION(swarm::InstancedBillboardBatch batch("batch", 0, attributes));
    {
        std::vector<swarm::BillboardShader::Attribute> bad;
        bad.push_back({"foo", swarm::BillboardShader::AttributeType::Mat2});
        TEST_EXCEPTION(swarm::InstancedBillboardBatch batch("batch", 10, bad));
    }
    {
        std::vector<swarm::BillboardShader::Attribute> bad;
        bad.push_back({"foo", swarm::BillboardShader::AttributeType::Float});
        bad.push_back({"foo", swarm::BillboardShader::AttributeType::Vec2});
        TEST_EXCEPTION(swarm::InstancedBillboardBatch batch("batch", 10, bad));
    }

    swarm::InstancedBillboardBatch batch("batch", 10, attributes);
    TEST_REQUIRE(batch.GetMaxInstancesCount() == 10);
    TEST_REQUIRE(batch.GetInstancesCount() == 0);
    TEST_REQUIRE(batch.GetAttributeData("aInstanceWorldPosition")->size() == 30);
    TEST_REQUIRE(batch.GetAttributeData("aInstanceLocalTransform")->size() == 40);
    TEST_REQUIRE(batch.GetAttributeData("a_color")->size() == 40);
    TEST_REQUIRE(batch.GetAttributeData("a_size")->size() == 10);
    TEST_REQUIRE(batch.GetAttributeData("a_foo") == nullptr);

    batch.SetInstancesCount(10);
    TEST_EXCEPTION(batch.SetInstancesCount(11));
    TEST_REQUIRE(batch.GetInstancesCount() == 10);

    // default transform is a uniform scale.
    {
        const auto& data = *batch.GetAttributeData("aInstanceLocalTransform");
        TEST_REQUIRE(real::equals(data[0], 1.0f / 15.0f));
        TEST_REQUIRE(data[1] == 0.0f);
        TEST_REQUIRE(data[2] == 0.0f);
        TEST_REQUIRE(real::equals(data[3], 1.0f / 15.0f));
    }

    batch.SetInstancePosition(2, glm::vec3(1.0f, 2.0f, 3.0f));
    {
        const auto& data = *batch.GetAttributeData("aInstanceWorldPosition");
        TEST_REQUIRE(data[6] == 1.0f);
        TEST_REQUIRE(data[7] == 2.0f);
        TEST_REQUIRE(data[8] == 3.0f);
    }

    const float half_pi = std::acos(0.0f);
    batch.SetInstanceTransform(1, half_pi, glm::vec2(2.0f, 3.0f));
    {
        const auto& data = *batch.GetAttributeData("aInstanceLocalTransform");
        TEST_REQUIRE(std::abs(data[4] - 0.0f) < 1e-5f);
        TEST_REQUIRE(std::abs(data[5] - 2.0f) < 1e-5f);
        TEST_REQUIRE(std::abs(data[6] + 3.0f) < 1e-5f);
        TEST_REQUIRE(std::abs(data[7] - 0.0f) < 1e-5f);
    }
    batch.SetInstanceTransform(0, 0.0f, glm::vec2(0.5f, 0.25f));
    {
        const auto& data = *batch.GetAttributeData("aInstanceLocalTransform");
        TEST_REQUIRE(real::equals(data[0], 0.5f));
        TEST_REQUIRE(real::equals(data[3], 0.25f));
    }

    batch.SetInstanceCustomAttribute(3, "color", {0.1f, 0.2f, 0.3f, 0.4f});
    batch.SetInstanceCustomAttribute(3, "size", {5.0f});
    {
        const auto& color = *batch.GetAttributeData("a_color");
        TEST_REQUIRE(color[12] == 0.1f);
        TEST_REQUIRE(color[15] == 0.4f);
        TEST_REQUIRE((*batch.GetAttributeData("a_size"))[3] == 5.0f);
    }
    TEST_REQUIRE(GetExceptionMessage([&batch]() {
        batch.SetInstanceCustomAttribute(0, "speed", {1.0f});
    }) == "Unknown attribute \"speed\".");
    TEST_REQUIRE(GetExceptionMessage([&batch]() {
        batch.SetInstanceCustomAttribute(0, "color", {1.0f, 2.0f});
    }) == "Invalid value size for \"color\": \"2\", expected \"4\".");

    TEST_EXCEPTION(batch.SetInstancePosition(10, glm::vec3(0.0f)));
    TEST_EXCEPTION(batch.SetInstanceTransform(10, 0.0f, glm::vec2(1.0f)));

    // upload clears the dirty flags and only the dirty buffers
    // are uploaded again.
    TestDevice device;
    TEST_REQUIRE(batch.IsDirty("aInstanceWorldPosition"));
    batch.Upload(device);
    TEST_REQUIRE(device.GetNumInstanceUploads() == 4);
    TEST_REQUIRE(device.GetNumInstancedDraws() == 4);
    TEST_REQUIRE(!batch.IsDirty("aInstanceWorldPosition"));
    TEST_REQUIRE(!batch.IsDirty("aInstanceLocalTransform"));
    TEST_REQUIRE(!batch.IsDirty("a_color"));
    TEST_REQUIRE(!batch.IsDirty("a_size"));

    {
        const auto* buffer = device.GetInstancedDraw("batch/aInstanceLocalTransform");
        TEST_REQUIRE(buffer);
        TEST_REQUIRE(buffer->GetUsage() == swarm::InstancedDraw::Usage::Dynamic);
        TEST_REQUIRE(buffer->GetInstanceCount() == 10);
        const auto& layout = buffer->GetBuffer().GetInstanceDataLayout();
        TEST_REQUIRE(layout.vertex_struct_size == 4 * sizeof(float));
        TEST_REQUIRE(layout.attributes.size() == 1);
        TEST_REQUIRE(layout.attributes[0].name == "aInstanceLocalTransform");
        TEST_REQUIRE(layout.attributes[0].num_vector_components == 2);
        TEST_REQUIRE(layout.attributes[0].num_columns == 2);
        TEST_REQUIRE(layout.attributes[0].divisor == 1);
    }

    device.ClearCounters();
    batch.Upload(device);
    TEST_REQUIRE(device.GetNumInstanceUploads() == 0);

    batch.SetInstanceCustomAttribute(0, "size", {2.0f});
    TEST_REQUIRE(batch.IsDirty("a_size"));
    TEST_REQUIRE(!batch.IsDirty("a_color"));
    batch.Upload(device);
    TEST_REQUIRE(device.GetNumInstanceUploads() == 1);

    batch.Dispose(device);
    TEST_REQUIRE(device.GetNumInstancedDraws() == 0);
    TEST_REQUIRE(batch.IsDirty("aInstanceWorldPosition"));
}

void unit_test_instanced_billboard()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;

    {
        auto params = MakeBatchParams();
        params.batch_size = 0;
        TEST_EXCEPTION(swarm::InstancedBillboard billboard(device, params));
    }
    {
        auto params = MakeBatchParams();
        params.attributes.push_back({"transform", swarm::BillboardShader::AttributeType::Mat2});
        TEST_EXCEPTION(swarm::InstancedBillboard billboard(device, params));
    }

    using IB = swarm::InstancedBillboard;
    TEST_REQUIRE(IB::ComputeBatchCount(0, 2000) == 0);
    TEST_REQUIRE(IB::ComputeBatchCount(1, 2000) == 1);
    TEST_REQUIRE(IB::ComputeBatchCount(2000, 2000) == 1);
    TEST_REQUIRE(IB::ComputeBatchCount(2001, 2000) == 2);
    TEST_REQUIRE(IB::ComputeBatchCount(4500, 2000) == 3);
    // counts at the top of the range must not wrap around.
    TEST_REQUIRE(IB::ComputeBatchCount(0xffffffffu, 2000) == 2147484);
    TEST_REQUIRE(IB::ComputeBatchCount(0xffffffffu, 0x80000000u) == 2);
    TEST_REQUIRE(IB::ComputeBatchCount(0xffffffffu, 1) == 0xffffffffu);

    swarm::InstancedBillboard billboard(device, MakeBatchParams());
    TEST_REQUIRE(billboard.GetBatchSize() == 2000);
    TEST_REQUIRE(billboard.GetNumBatches() == 0);

    const auto& vertex = billboard.GetShader().GetVertexSource();
    TEST_REQUIRE(base::Contains(vertex, "in vec3 aInstanceWorldPosition;"));
    TEST_REQUIRE(base::Contains(vertex, "in mat2 aInstanceLocalTransform;"));
    TEST_REQUIRE(base::Contains(vertex, "in vec4 a_color;"));
    TEST_REQUIRE(base::Contains(vertex, "modelPosition = aInstanceWorldPosition;"));
    TEST_REQUIRE(base::Contains(vertex, "vColor = a_color;"));

    // no batch for the instance yet.
    TEST_REQUIRE(GetExceptionMessage([&billboard]() {
        billboard.SetInstancePosition(0, glm::vec3(0.0f));
    }) == "No mesh for instance \"0\".");

    billboard.SetInstancesCount(4500);
    TEST_REQUIRE(billboard.GetInstancesCount() == 4500);
    TEST_REQUIRE(billboard.GetNumBatches() == 3);
    TEST_REQUIRE(billboard.GetBatch(0).GetInstancesCount() == 2000);
    TEST_REQUIRE(billboard.GetBatch(1).GetInstancesCount() == 2000);
    TEST_REQUIRE(billboard.GetBatch(2).GetInstancesCount() == 500);

    // instances map to batch and local index.
    billboard.SetInstancePosition(2001, glm::vec3(4.0f, 5.0f, 6.0f));
    {
        const auto& data = *billboard.GetBatch(1).GetAttributeData("aInstanceWorldPosition");
        TEST_REQUIRE(data[3] == 4.0f);
        TEST_REQUIRE(data[4] == 5.0f);
        TEST_REQUIRE(data[5] == 6.0f);
    }
    billboard.SetInstanceCustomAttribute(4499, "color", {1.0f, 0.0f, 0.0f, 1.0f});
    TEST_REQUIRE((*billboard.GetBatch(2).GetAttributeData("a_color"))[499*4] == 1.0f);
    TEST_EXCEPTION(billboard.SetInstanceCustomAttribute(0, "size", {1.0f}));

    billboard.Draw();
    TEST_REQUIRE(device.GetNumDraws() == 3);
    TEST_REQUIRE(device.GetNumInstanceUploads() == 9);
    for (unsigned i=0; i<3; ++i)
    {
        const auto& draw = device.GetDraw(i);
        TEST_REQUIRE(draw.program == billboard.GetShader().GetProgramId());
        TEST_REQUIRE(draw.geometry == "billboard-quad");
        TEST_REQUIRE(draw.instance_buffers.size() == 3);
        TEST_REQUIRE(draw.instance_buffers[0] == billboard.GetBatch(i).GetName() + "/aInstanceWorldPosition");
        TEST_REQUIRE(draw.instance_buffers[1] == billboard.GetBatch(i).GetName() + "/aInstanceLocalTransform");
        TEST_REQUIRE(draw.instance_buffers[2] == billboard.GetBatch(i).GetName() + "/a_color");
    }
    TEST_REQUIRE(device.GetDraw(0).instance_count.value() == 2000);
    TEST_REQUIRE(device.GetDraw(2).instance_count.value() == 500);

    // shrinking keeps the batches but empties them.
    device.ClearDraws();
    device.ClearCounters();
    billboard.SetInstancesCount(100);
    TEST_REQUIRE(billboard.GetNumBatches() == 3);
    TEST_REQUIRE(billboard.GetBatch(0).GetInstancesCount() == 100);
    TEST_REQUIRE(billboard.GetBatch(1).GetInstancesCount() == 0);
    TEST_REQUIRE(billboard.GetBatch(2).GetInstancesCount() == 0);
    billboard.SetInstancePosition(5999, glm::vec3(1.0f));
    TEST_EXCEPTION(billboard.SetInstancePosition(6000, glm::vec3(1.0f)));

    billboard.SetInstanceTransform(10, 0.5f, glm::vec2(1.0f));
    billboard.Draw();
    TEST_REQUIRE(device.GetNumDraws() == 1);
    TEST_REQUIRE(device.GetDraw(0).instance_count.value() == 100);
    TEST_REQUIRE(device.GetNumInstanceUploads() == 1);

    TEST_REQUIRE(device.GetNumShaders() == 2);
    billboard.Dispose();
    TEST_REQUIRE(billboard.GetNumBatches() == 0);
    TEST_REQUIRE(device.GetNumInstancedDraws() == 0);
    TEST_REQUIRE(device.GetNumPrograms() == 0);
    TEST_REQUIRE(device.GetNumShaders() == 0);
    billboard.Draw();
    TEST_REQUIRE(device.GetNumDraws() == 1);
    TEST_EXCEPTION(billboard.SetInstancesCount(10));
    TEST_EXCEPTION(billboard.SetInstancePosition(0, glm::vec3(0.0f)));
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    unit_test_texture_size();
    unit_test_gpu_billboard_create();
    unit_test_gpu_billboard_invalid();
    unit_test_gpu_billboard_instances();
    unit_test_gpu_billboard_simulation();
    unit_test_gpu_billboard_draw();
    unit_test_gpu_billboard_noise();
    unit_test_gpu_billboard_json();
    unit_test_batch();
    unit_test_instanced_billboard();
    return 0;
}
) // EXPORT_TEST_MAIN
