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
#  include <glm/vec3.hpp>
#include "warnpop.h"

#include <string>

#include "base/test_minimal.h"
#include "base/utility.h"
#include "swarm/gpu_textures_state.h"
#include "swarm/unit_test/test_device.h"

namespace {
swarm::GpuTexturesState::Params MakeParams()
{
    swarm::GpuTexturesState::Pipeline seed;
    seed.requires_previous_state = false;
    seed.uniforms.push_back({"uValue", swarm::UniformType::Vec3, glm::vec3(0.5f)});
    seed.code = "out_position = vec4(uValue, 1.0);\nout_velocity = vec4(0.0);";

    swarm::GpuTexturesState::Pipeline step;
    step.requires_previous_state = true;
    step.uniforms.push_back({"uDelta", swarm::UniformType::Float, 0.0f});
    step.code = "out_position = in_position + in_velocity * uDelta;\nout_velocity = in_velocity;";

    swarm::GpuTexturesState::Params params;
    params.name     = "state";
    params.width    = 16;
    params.height   = 8;
    params.channels = {"position", "velocity"};
    params.pipelines["seed"] = std::move(seed);
    params.pipelines["step"] = std::move(step);
    return params;
}
} // namespace

void unit_test_state_create()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;
    {
        swarm::GpuTexturesState state(device, MakeParams());
        TEST_REQUIRE(state.GetName() == "state");
        TEST_REQUIRE(state.GetWidth() == 16);
        TEST_REQUIRE(state.GetHeight() == 8);
        TEST_REQUIRE(state.GetCurrentIndex() == 0);

        // two sets of textures, one texture per channel per set.
        TEST_REQUIRE(device.GetNumTextures() == 4);
        TEST_REQUIRE(device.GetNumFramebuffers() == 2);
        TEST_REQUIRE(device.GetNumPrograms() == 2);

        for (const char* name : {"state/Set0/position", "state/Set0/velocity",
                                 "state/Set1/position", "state/Set1/velocity"})
        {
            const auto* texture = device.GetTexture(name);
            TEST_REQUIRE(texture);
            TEST_REQUIRE(texture->GetWidth() == 16);
            TEST_REQUIRE(texture->GetHeight() == 8);
            TEST_REQUIRE(texture->GetFormat() == swarm::Texture::Format::RGBA);
            TEST_REQUIRE(texture->GetMinFilter() == swarm::Texture::MinFilter::Nearest);
            TEST_REQUIRE(texture->GetMagFilter() == swarm::Texture::MagFilter::Nearest);
            TEST_REQUIRE(texture->GetWrapX() == swarm::Texture::Wrapping::Clamp);
            TEST_REQUIRE(texture->GetWrapY() == swarm::Texture::Wrapping::Clamp);
        }
        const auto* fbo = device.GetFramebuffer("state/Set1");
        TEST_REQUIRE(fbo);
        TEST_REQUIRE(fbo->GetColorTargetCount() == 2);
        TEST_REQUIRE(fbo->GetWidth() == 16);
        TEST_REQUIRE(fbo->GetColorTarget(swarm::Framebuffer::ColorAttachment::Attachment0) == device.GetTexture("state/Set1/position"));
        TEST_REQUIRE(fbo->GetColorTarget(swarm::Framebuffer::ColorAttachment::Attachment1) == device.GetTexture("state/Set1/velocity"));
    }
    // destructor releases everything.
    TEST_REQUIRE(device.GetNumTextures() == 0);
    TEST_REQUIRE(device.GetNumFramebuffers() == 0);
    TEST_REQUIRE(device.GetNumPrograms() == 0);

    // generated name
    {
        auto params = MakeParams();
        params.name.clear();
        swarm::GpuTexturesState state(device, params);
        TEST_REQUIRE(base::StartsWith(state.GetName(), "GpuTexturesState/"));
    }
}

void unit_test_state_invalid()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;

    {
        auto params = MakeParams();
        params.channels.clear();
        TEST_EXCEPTION(swarm::GpuTexturesState state(device, params));
    }
    {
        auto params = MakeParams();
        params.width = 0;
        TEST_EXCEPTION(swarm::GpuTexturesState state(device, params));
    }
    {
        auto params = MakeParams();
        params.channels = {"a", "b", "c", "d", "e"};
        TEST_EXCEPTION(swarm::GpuTexturesState state(device, params));
    }
    {
        auto params = MakeParams();
        params.channels = {"position", "position"};
        TEST_EXCEPTION(swarm::GpuTexturesState state(device, params));
    }
    {
        auto params = MakeParams();
        params.channels = {"not valid"};
        TEST_EXCEPTION(swarm::GpuTexturesState state(device, params));
    }
    {
        auto params = MakeParams();
        params.pipelines["seed"].uniforms.push_back({"uPreviousState_position", swarm::UniformType::Sampler2D,
                                                     static_cast<const swarm::Texture*>(nullptr)});
        TEST_EXCEPTION(swarm::GpuTexturesState state(device, params));
    }
    {
        auto params = MakeParams();
        params.pipelines["seed"].uniforms.push_back({"uValue", swarm::UniformType::Float, 1.0f});
        TEST_EXCEPTION(swarm::GpuTexturesState state(device, params));
    }
    {
        auto params = MakeParams();
        params.pipelines["seed"].uniforms.push_back({"uOther", swarm::UniformType::Float, glm::vec3(1.0f)});
        TEST_EXCEPTION(swarm::GpuTexturesState state(device, params));
    }

    // the device supports fewer attachments.
    {
        auto caps = TestDevice::DeviceCaps();
        caps.num_color_attachments = 1;
        device.SetDeviceCaps(caps);
        TEST_EXCEPTION(swarm::GpuTexturesState state(device, MakeParams()));
    }
    // nothing was left behind by the failed constructions.
    TEST_REQUIRE(device.GetNumTextures() == 0);
    TEST_REQUIRE(device.GetNumFramebuffers() == 0);
}

void unit_test_state_fragment_source()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;
    swarm::GpuTexturesState state(device, MakeParams());

    const auto& seed = state.GetFragmentSource("seed");
    TEST_REQUIRE(base::StartsWith(seed, "#version 300 es"));
    TEST_REQUIRE(base::Contains(seed, "uniform vec3 uValue;"));
    TEST_REQUIRE(base::Contains(seed, "uPreviousState_") == false);
    TEST_REQUIRE(base::Contains(seed, "in_position") == false);
    TEST_REQUIRE(base::Contains(seed, "layout(location=0) out vec4 out_fragColor0;"));
    TEST_REQUIRE(base::Contains(seed, "layout(location=1) out vec4 out_fragColor1;"));
    TEST_REQUIRE(base::Contains(seed, "out vec4 out_position"));
    TEST_REQUIRE(base::Contains(seed, "out vec4 out_velocity"));
    TEST_REQUIRE(base::Contains(seed, "vec4 pack2HalfToRGBA(const vec2 v)"));

    const auto& step = state.GetFragmentSource("step");
    TEST_REQUIRE(base::Contains(step, "uniform sampler2D uPreviousState_position;"));
    TEST_REQUIRE(base::Contains(step, "uniform sampler2D uPreviousState_velocity;"));
    TEST_REQUIRE(base::Contains(step, "const vec4 in_position"));
    TEST_REQUIRE(base::Contains(step, "const vec4 in_velocity"));
    TEST_REQUIRE(base::Contains(step, "texture(uPreviousState_position, vUv)"));
    TEST_REQUIRE(base::Contains(step, "out_position = in_position + in_velocity * uDelta;"));

    TEST_REQUIRE(state.GetProgramId("seed") != state.GetProgramId("step"));
    TEST_EXCEPTION(state.GetFragmentSource("foo"));

    // same pipeline code in a different state object shares the program.
    auto params = MakeParams();
    params.name = "other";
    swarm::GpuTexturesState other(device, params);
    TEST_REQUIRE(other.GetProgramId("seed") == state.GetProgramId("seed"));
    TEST_REQUIRE(other.GetProgramId("step") == state.GetProgramId("step"));
    TEST_REQUIRE(device.GetNumProgramsCreated() == 2);
}

void unit_test_state_run_pipeline()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;
    swarm::GpuTexturesState state(device, MakeParams());

    const auto* set0 = device.GetFramebuffer("state/Set0");
    const auto* set1 = device.GetFramebuffer("state/Set1");

    TEST_REQUIRE(state.GetCurrentTexture("position") == device.GetTexture("state/Set0/position"));
    TEST_REQUIRE(state.GetCurrentTexture("velocity") == device.GetTexture("state/Set0/velocity"));

    state.RunPipeline("seed");
    TEST_REQUIRE(state.GetCurrentIndex() == 1);
    TEST_REQUIRE(device.GetNumDraws() == 1);
    {
        const auto& draw = device.GetDraw(0);
        TEST_REQUIRE(draw.program == state.GetProgramId("seed"));
        TEST_REQUIRE(draw.geometry == "gpu-state-quad");
        TEST_REQUIRE(draw.fbo == set1);
        TEST_REQUIRE(draw.state.GetSamplerCount() == 0);
        TEST_REQUIRE(draw.raster.blending == swarm::Device::BlendOp::None);
        TEST_REQUIRE(draw.raster.depth_test == swarm::Device::DepthTest::Disabled);
        TEST_REQUIRE(draw.raster.bWriteDepth == false);
        TEST_REQUIRE(draw.instance_buffers.empty());

        glm::vec3 value;
        TEST_REQUIRE(draw.state.GetUniform("uValue", &value));
        TEST_REQUIRE(value == glm::vec3(0.5f));
    }
    TEST_REQUIRE(state.GetCurrentTexture("position") == device.GetTexture("state/Set1/position"));
    TEST_REQUIRE(state.GetCurrentTexture("velocity") == device.GetTexture("state/Set1/velocity"));

    // the step pipeline reads the current set and writes the other one.
    state.SetUniform("step", "uDelta", 0.25f);
    state.RunPipeline("step");
    TEST_REQUIRE(state.GetCurrentIndex() == 0);
    TEST_REQUIRE(device.GetNumDraws() == 2);
    {
        const auto& draw = device.GetDraw(1);
        TEST_REQUIRE(draw.program == state.GetProgramId("step"));
        TEST_REQUIRE(draw.fbo == set0);
        TEST_REQUIRE(draw.state.GetSamplerCount() == 2);
        const auto* position = draw.state.FindTextureBinding("uPreviousState_position");
        const auto* velocity = draw.state.FindTextureBinding("uPreviousState_velocity");
        TEST_REQUIRE(position && velocity);
        TEST_REQUIRE(position->texture == device.GetTexture("state/Set1/position"));
        TEST_REQUIRE(velocity->texture == device.GetTexture("state/Set1/velocity"));
        TEST_REQUIRE(position->unit != velocity->unit);

        float delta = 0.0f;
        TEST_REQUIRE(draw.state.GetUniform("uDelta", &delta));
        TEST_REQUIRE(delta == 0.25f);
    }

    state.RunPipeline("step");
    TEST_REQUIRE(state.GetCurrentIndex() == 1);
    {
        const auto& draw = device.GetDraw(2);
        TEST_REQUIRE(draw.fbo == set1);
        const auto* position = draw.state.FindTextureBinding("uPreviousState_position");
        TEST_REQUIRE(position->texture == device.GetTexture("state/Set0/position"));
    }

    // an unknown pipeline changes nothing.
    TEST_EXCEPTION(state.RunPipeline("foo"));
    TEST_REQUIRE(state.GetCurrentIndex() == 1);
    TEST_REQUIRE(device.GetNumDraws() == 3);

    TEST_EXCEPTION(state.GetCurrentTexture("color"));
}

void unit_test_state_set_uniform()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;
    swarm::GpuTexturesState state(device, MakeParams());

    state.SetUniform("seed", "uValue", glm::vec3(1.0f, 2.0f, 3.0f));
    TEST_EXCEPTION(state.SetUniform("foo", "uValue", glm::vec3(1.0f)));
    TEST_EXCEPTION(state.SetUniform("seed", "uDelta", 1.0f));
    TEST_EXCEPTION(state.SetUniform("seed", "uValue", 1.0f));
    TEST_EXCEPTION(state.SetUniform("seed", "uPreviousState_position",
                                    static_cast<const swarm::Texture*>(nullptr)));

    state.RunPipeline("seed");
    glm::vec3 value;
    TEST_REQUIRE(device.GetDraw(0).state.GetUniform("uValue", &value));
    TEST_REQUIRE(value == glm::vec3(1.0f, 2.0f, 3.0f));
}

void unit_test_state_dispose()
{
    TEST_CASE(test::Type::Feature)

    TestDevice device;
    swarm::GpuTexturesState state(device, MakeParams());
    state.RunPipeline("seed");

    TEST_REQUIRE(device.GetNumShaders() > 0);

    state.Dispose();
    TEST_REQUIRE(state.IsDisposed());
    TEST_REQUIRE(device.GetNumTextures() == 0);
    TEST_REQUIRE(device.GetNumFramebuffers() == 0);
    TEST_REQUIRE(device.GetNumPrograms() == 0);
    TEST_REQUIRE(device.GetNumShaders() == 0);

    // idempotent
    state.Dispose();
    TEST_REQUIRE(state.IsDisposed());

    TEST_EXCEPTION(state.RunPipeline("seed"));
    TEST_EXCEPTION(state.GetCurrentTexture("position"));
    TEST_EXCEPTION(state.SetUniform("seed", "uValue", glm::vec3(1.0f)));
    TEST_REQUIRE(device.GetNumDraws() == 1);
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    unit_test_state_create();
    unit_test_state_invalid();
    unit_test_state_fragment_source();
    unit_test_state_run_pipeline();
    unit_test_state_set_uniform();
    unit_test_state_dispose();
    return 0;
}
) // EXPORT_TEST_MAIN
