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

#include <memory>
#include <vector>
#include <cmath>
#include <algorithm>

#include "base/test_minimal.h"
#include "base/random.h"
#include "base/format.h"
#include "device/device.h"
#include "swarm/device.h"
#include "swarm/framebuffer.h"
#include "swarm/packing.h"
#include "swarm/gpu_textures_state.h"
#include "swarm/gpu_instanced_billboard.h"
#include "swarm/instanced_billboard.h"

// We need this to create the rendering context.
#include "wdk/opengl/context.h"
#include "wdk/opengl/config.h"
#include "wdk/opengl/surface.h"

// setup context for headless rendering.
class TestContext : public dev::Context
{
public:
    TestContext(unsigned w, unsigned h)
    {
        wdk::Config::Attributes attrs;
        attrs.red_size  = 8;
        attrs.green_size = 8;
        attrs.blue_size = 8;
        attrs.alpha_size = 8;
        attrs.depth_size = 24;
        attrs.surfaces.pbuffer = true;
        attrs.double_buffer = false;
        attrs.srgb_buffer = false;
        constexpr auto debug_context = false;
        mConfig   = std::make_unique<wdk::Config>(attrs);
        mContext  = std::make_unique<wdk::Context>(*mConfig, 3, 0, debug_context, wdk::Context::Type::OpenGL_ES);
        mSurface  = std::make_unique<wdk::Surface>(*mConfig, w, h);
        mContext->MakeCurrent(mSurface.get());
    }
   ~TestContext()
    {
        mContext->MakeCurrent(nullptr);
        mSurface->Dispose();
        mSurface.reset();
        mConfig.reset();
    }
    void Display() override
    {
        mContext->SwapBuffers();
    }
    void* Resolve(const char* name) override
    {
        return mContext->Resolve(name);
    }
    void MakeCurrent() override
    {
        mContext->MakeCurrent(mSurface.get());
    }
    Version GetVersion() const override
    {
        return Version::OpenGL_ES3;
    }
private:
    std::unique_ptr<wdk::Context> mContext;
    std::unique_ptr<wdk::Surface> mSurface;
    std::unique_ptr<wdk::Config>  mConfig;
};

namespace {
constexpr unsigned SurfaceSize = 64;

// The shaders run the codec in 32bit floats but the driver is free to
// round the final 8bit conversion so allow for one step of the low byte.
constexpr float GpuTolerance = 1.0f / 255.0f;

std::shared_ptr<swarm::Device> CreateDevice()
{
    auto context = std::make_shared<TestContext>(SurfaceSize, SurfaceSize);
    auto device  = dev::CreateDevice(context);
    return swarm::CreateDevice(device->GetSharedGraphicsDevice());
}

// Window pixel covered by the point at clip space position when the
// view and projection are identity.
glm::uvec2 ClipToPixel(const glm::vec2& clip)
{
    const auto x = static_cast<unsigned>((clip.x + 1.0f) * 0.5f * SurfaceSize);
    const auto y = static_cast<unsigned>((clip.y + 1.0f) * 0.5f * SurfaceSize);
    return glm::uvec2(std::min(x, SurfaceSize - 1), std::min(y, SurfaceSize - 1));
}

swarm::PackedTexel GetTexel(const swarm::Device::ColorBuffer& buffer, unsigned x, unsigned y)
{
    const auto offset = (y * buffer.width + x) * 4;
    return {buffer.pixels[offset + 0], buffer.pixels[offset + 1],
            buffer.pixels[offset + 2], buffer.pixels[offset + 3]};
}

// Distance between two positions inside a wrapping box. A value right at
// the bound can land on either side.
float WrapDistance(float a, float b, float wrap)
{
    const float diff = std::abs(a - b);
    return std::min(diff, std::abs(diff - wrap));
}

std::vector<glm::vec3> ReadPositions(swarm::Device& device, const swarm::GpuTexturesState& state)
{
    auto* fbo = device.FindFramebuffer(base::FormatString("%1/Set%2", state.GetName(), state.GetCurrentIndex()));
    TEST_REQUIRE(fbo);

    const auto size = state.GetWidth();
    const auto& xy = device.ReadColorBuffer(size, size, fbo, swarm::Framebuffer::ColorAttachment::Attachment0);
    const auto& zw = device.ReadColorBuffer(size, size, fbo, swarm::Framebuffer::ColorAttachment::Attachment1);
    TEST_REQUIRE(xy.pixels.size() == size * size * 4);
    TEST_REQUIRE(zw.pixels.size() == size * size * 4);

    std::vector<glm::vec3> positions;
    for (unsigned y=0; y<size; ++y)
    {
        for (unsigned x=0; x<size; ++x)
        {
            positions.push_back(swarm::UnpackPosition(GetTexel(xy, x, y), GetTexel(zw, x, y)));
        }
    }
    return positions;
}
} // namespace

void unit_test_gl_state()
{
    TEST_CASE(test::Type::Feature)

    auto device = CreateDevice();

    swarm::GpuTexturesState::Pipeline write;
    write.uniforms.push_back({"uScale", swarm::UniformType::Float, 1.0f});
    write.code = "out_value = pack2HalfToRGBA(uv * uScale);";

    swarm::GpuTexturesState::Pipeline halve;
    halve.requires_previous_state = true;
    halve.code = "out_value = pack2HalfToRGBA(unpackRGBATo2Half(in_value) * 0.5);";

    swarm::GpuTexturesState::Params params;
    params.name     = "gl-state";
    params.width    = 4;
    params.height   = 4;
    params.channels = {"value"};
    params.pipelines["write"] = std::move(write);
    params.pipelines["halve"] = std::move(halve);

    swarm::GpuTexturesState state(*device, params);
    TEST_REQUIRE(device->FindProgram(state.GetProgramId("write"))->IsValid());
    TEST_REQUIRE(device->FindProgram(state.GetProgramId("halve"))->IsValid());

    const auto check = [&](float scale) {
        auto* fbo = device->FindFramebuffer(base::FormatString("gl-state/Set%1", state.GetCurrentIndex()));
        const auto& buffer = device->ReadColorBuffer(4, 4, fbo);
        for (unsigned y=0; y<4; ++y)
        {
            for (unsigned x=0; x<4; ++x)
            {
                // uv is sampled at the texel centers.
                const glm::vec2 expected((x + 0.5f) / 4.0f * scale, (y + 0.5f) / 4.0f * scale);
                const auto& value = swarm::UnpackTexel(GetTexel(buffer, x, y));
                TEST_REQUIRE(std::abs(value.x - expected.x) <= GpuTolerance);
                TEST_REQUIRE(std::abs(value.y - expected.y) <= GpuTolerance);
            }
        }
    };

    state.RunPipeline("write");
    check(1.0f);
    state.RunPipeline("halve");
    check(0.5f);
    state.RunPipeline("halve");
    check(0.25f);

    state.SetUniform("write", "uScale", 0.5f);
    state.RunPipeline("write");
    check(0.5f);
}

void unit_test_gl_billboard_simulation()
{
    TEST_CASE(test::Type::Feature)

    auto device = CreateDevice();

    swarm::GpuInstancedBillboard::Params params;
    params.max_instances_count = 16;
    params.rendering.fragment_code = "return vec4(1.0);";
    params.simulation.seed       = 5;
    params.simulation.gravity    = glm::vec3(0.0f, -1.0f, 0.0f);
    params.simulation.wrap_bound = glm::vec3(1.0f, 1.0f, 0.5f);

    swarm::GpuInstancedBillboard billboard(*device, params);
    TEST_REQUIRE(billboard.GetTextureSize() == 4);
    TEST_REQUIRE(billboard.GetShader().GetProgram(*device)->IsValid());

    // compute the expected initial positions from the same noise.
    std::vector<glm::vec3> expected;
    {
        base::RandomGenerator<unsigned> noise1(5, 0, 255);
        base::RandomGenerator<unsigned> noise2(6, 0, 255);
        std::vector<swarm::PackedTexel> texels1(16);
        std::vector<swarm::PackedTexel> texels2(16);
        for (auto& texel : texels1)
            for (auto& byte : texel) byte = static_cast<std::uint8_t>(noise1());
        for (auto& texel : texels2)
            for (auto& byte : texel) byte = static_cast<std::uint8_t>(noise2());

        for (unsigned i=0; i<16; ++i)
        {
            const glm::vec3 position(swarm::UnpackTexel(texels1[i]), swarm::UnpackTexel(texels2[i]).x);
            expected.push_back(glm::mod(position, params.simulation.wrap_bound));
        }
    }

    billboard.InitializePositions();
    auto positions = ReadPositions(*device, billboard.GetState());
    TEST_REQUIRE(positions.size() == 16);
    for (unsigned i=0; i<16; ++i)
    {
        for (int c=0; c<3; ++c)
        {
            TEST_REQUIRE(WrapDistance(positions[i][c], expected[i][c], params.simulation.wrap_bound[c]) <= GpuTolerance);
        }
    }

    // one step moves every particle by (gravity + movement) * dt.
    const glm::vec3 movement(0.25f, 0.0f, 0.0f);
    billboard.UpdatePositions(0.1f, movement);
    const auto& next = ReadPositions(*device, billboard.GetState());
    for (unsigned i=0; i<16; ++i)
    {
        const auto& step = glm::mod(positions[i] + (params.simulation.gravity + movement) * 0.1f,
                                    params.simulation.wrap_bound);
        for (int c=0; c<3; ++c)
        {
            TEST_REQUIRE(WrapDistance(next[i][c], step[c], params.simulation.wrap_bound[c]) <= GpuTolerance);
        }
    }

    // draw the current positions to the window. with the default identity
    // camera every billboard is centered on its position in clip space.
    billboard.SetInstancesCount(16);
    device->BeginFrame();
    device->ClearColorDepth(glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
    billboard.Draw();

    const auto& window = device->ReadColorBuffer(SurfaceSize, SurfaceSize);
    TEST_REQUIRE(window.pixels.size() == SurfaceSize * SurfaceSize * 4);

    unsigned visible = 0;
    for (unsigned i=0; i<16; ++i)
    {
        // skip the particles that are fading out near the box edge and the ones
        // so close to the camera plane that the quad is seen almost edge on.
        const auto& d = next[i] - glm::vec3(0.5f);
        if (glm::dot(d, d) >= 0.2f || next[i].z >= 0.45f)
            continue;

        const auto& pixel = ClipToPixel(glm::vec2(next[i].x, next[i].y));
        const auto& texel = GetTexel(window, pixel.x, pixel.y);
        TEST_REQUIRE(texel[0] == 0xff);
        TEST_REQUIRE(texel[1] == 0xff);
        TEST_REQUIRE(texel[2] == 0xff);
        ++visible;
    }
    TEST_REQUIRE(visible > 0);

    // every position is inside the unit box so nothing lands in the
    // lower left quadrant of the window.
    const auto& corner = GetTexel(window, 4, 4);
    TEST_REQUIRE(corner[0] == 0 && corner[1] == 0 && corner[2] == 0);

    device->EndFrame(false);
}

void unit_test_gl_draw_after_state_pass()
{
    TEST_CASE(test::Type::Feature)

    auto device = CreateDevice();

    // a small render target pass right before drawing to the window.
    swarm::GpuTexturesState::Pipeline fill;
    fill.code = "out_value = vec4(1.0);";

    swarm::GpuTexturesState::Params params;
    params.name     = "gl-viewport";
    params.width    = 4;
    params.height   = 4;
    params.channels = {"value"};
    params.pipelines["fill"] = std::move(fill);
    swarm::GpuTexturesState state(*device, params);

    swarm::InstancedBillboard::Params billboard_params;
    billboard_params.fragment_code = "return vec4(1.0, 0.0, 0.0, 1.0);";
    swarm::InstancedBillboard billboard(*device, billboard_params);
    billboard.SetInstancesCount(1);
    billboard.SetInstancePosition(0, glm::vec3(0.5f, 0.5f, 0.0f));
    billboard.SetInstanceTransform(0, 0.0f, glm::vec2(0.4f));

    device->BeginFrame();
    device->ClearColorDepth(glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
    state.RunPipeline("fill");
    billboard.Draw();

    const auto& window = device->ReadColorBuffer(SurfaceSize, SurfaceSize);
    TEST_REQUIRE(window.pixels.size() == SurfaceSize * SurfaceSize * 4);

    // the quad is centered at clip (0.5, 0.5) which is the window pixel
    // (48, 48) and it extends over 5 pixels in every direction.
    for (unsigned y=45; y<=51; ++y)
    {
        for (unsigned x=45; x<=51; ++x)
        {
            const auto& texel = GetTexel(window, x, y);
            TEST_REQUIRE(texel[0] == 0xff);
            TEST_REQUIRE(texel[1] == 0x00);
            TEST_REQUIRE(texel[2] == 0x00);
        }
    }
    // nothing outside the quad, the lower left corner of the window
    // included.
    for (const auto& pixel : {glm::uvec2(1, 1), glm::uvec2(2, 3), glm::uvec2(30, 30), glm::uvec2(60, 60)})
    {
        const auto& texel = GetTexel(window, pixel.x, pixel.y);
        TEST_REQUIRE(texel[0] == 0x00);
    }
    device->EndFrame(false);

    // the render target still has the pass result.
    auto* fbo = device->FindFramebuffer(base::FormatString("gl-viewport/Set%1", state.GetCurrentIndex()));
    const auto& target = device->ReadColorBuffer(4, 4, fbo);
    for (unsigned y=0; y<4; ++y)
    {
        for (unsigned x=0; x<4; ++x)
        {
            TEST_REQUIRE(GetTexel(target, x, y)[0] == 0xff);
        }
    }

    billboard.Dispose();
    state.Dispose();
}

void unit_test_gl_instanced_billboard()
{
    TEST_CASE(test::Type::Feature)

    auto device = CreateDevice();

    swarm::InstancedBillboard::Params params;
    params.attributes.push_back({"color", swarm::BillboardShader::AttributeType::Vec4});
    params.varyings.push_back({"vColor", swarm::BillboardShader::VaryingType::Vec4});
    params.vertex_code   = "vColor = a_color;";
    params.fragment_code = "return vColor;";
    params.material      = swarm::BillboardShader::Material::Phong;
    params.batch_size    = 8;

    swarm::InstancedBillboard billboard(*device, params);
    TEST_REQUIRE(billboard.GetShader().GetProgram(*device)->IsValid());

    billboard.SetInstancesCount(20);
    for (unsigned i=0; i<20; ++i)
    {
        billboard.SetInstancePosition(i, glm::vec3(i * 0.1f, 0.0f, 0.0f));
        billboard.SetInstanceTransform(i, i * 0.1f, glm::vec2(0.1f));
        billboard.SetInstanceCustomAttribute(i, "color", {1.0f, 0.0f, 0.0f, 1.0f});
    }
    device->BeginFrame();
    device->ClearColorDepth(glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
    billboard.Draw();
    device->EndFrame(false);

    TEST_REQUIRE(billboard.GetNumBatches() == 3);

    billboard.Dispose();
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    unit_test_gl_state();
    unit_test_gl_billboard_simulation();
    unit_test_gl_draw_after_state_pass();
    unit_test_gl_instanced_billboard();
    return 0;
}
) // EXPORT_TEST_MAIN
