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
#include "warnpop.h"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include "base/assert.h"
#include "base/format.h"
#include "base/hash.h"
#include "base/logging.h"
#include "base/utility.h"
#include "swarm/gpu_textures_state.h"
#include "swarm/shader_source.h"
#include "swarm/packing.h"
#include "swarm/texture.h"
#include "swarm/framebuffer.h"

namespace {
// The fullscreen vertex shader is shared by every pipeline.
const char* VertexShaderId = "gpu-state-vs";

std::string GenerateName()
{
    static unsigned counter = 0;
    return base::FormatString("GpuTexturesState/%1", ++counter);
}

bool IsReservedPipelineName(const std::string& name)
{
    return name == "uv" || name == "vUv" || name == "runPipeline" ||
           base::StartsWith(name, "uPreviousState_") ||
           base::StartsWith(name, "in_") ||
           base::StartsWith(name, "out_") ||
           name == "pack2HalfToRGBA" || name == "unpackRGBATo2Half";
}

swarm::ShaderSource::ShaderDataType MapType(swarm::UniformType type)
{
    using T = swarm::UniformType;
    using D = swarm::ShaderSource::ShaderDataType;
    if (type == T::Sampler2D) return D::Sampler2D;
    else if (type == T::Float) return D::Float;
    else if (type == T::Vec2) return D::Vec2f;
    else if (type == T::Vec3) return D::Vec3f;
    else if (type == T::Vec4) return D::Vec4f;
    else if (type == T::Mat4) return D::Mat4f;
    BUG("Unhandled uniform type.");
    return D::Float;
}

} // namespace

namespace swarm
{

GpuTexturesState::GpuTexturesState(Device& device, Params params)
  : mDevice(device)
  , mName(params.name.empty() ? GenerateName() : params.name)
  , mWidth(params.width)
  , mHeight(params.height)
  , mChannels(params.channels)
{
    ValidateParams(params);

    CreateTextureSet(0);
    CreateTextureSet(1);

    static const std::string quad_id = "gpu-state-quad";
    mQuad = mDevice.FindGeometry(quad_id);
    if (!mQuad)
    {
        const std::vector<glm::vec2> vertices = {
            {0.0f, 0.0f}, {1.0f, 0.0f}, {1.0f, 1.0f},
            {0.0f, 0.0f}, {1.0f, 1.0f}, {0.0f, 1.0f}
        };
        const VertexLayout layout(sizeof(glm::vec2), {
            {"aPosition", 0, 2, 1, 0, 0}
        });
        Geometry::CreateArgs args;
        args.usage = Geometry::Usage::Static;
        args.content_name = "FullscreenQuad";
        args.buffer.SetVertexLayout(layout);
        args.buffer.SetVertexBuffer(vertices);
        args.buffer.AddDrawCmd(Geometry::DrawType::Triangles);
        args.content_hash = args.buffer.GetHash();
        mQuad = mDevice.CreateGeometry(quad_id, std::move(args));
    }

    for (const auto& pair : params.pipelines)
        CreatePipeline(pair.first, pair.second);

    DEBUG("Created GPU textures state. [name='%1', width=%2, height=%3, channels=%4, pipelines=%5]",
          mName, mWidth, mHeight, mChannels.size(), mPipelines.size());
}

GpuTexturesState::~GpuTexturesState()
{
    Dispose();
}

void GpuTexturesState::RunPipeline(const std::string& name)
{
    CheckNotDisposed();

    auto* pipeline = base::SafeFind(mPipelines, name);
    if (pipeline == nullptr)
        throw std::runtime_error(base::FormatString("Unknown pipeline \"%1\".", name));

    const auto& current = mSets[mCurrentIndex];
    const auto& next    = mSets[(mCurrentIndex + 1) % 2];

    if (pipeline->requires_previous_state)
    {
        for (size_t i=0; i<mChannels.size(); ++i)
        {
            pipeline->state.SetTexture("uPreviousState_" + mChannels[i], *current.textures[i]);
        }
    }

    Device::RasterState state;
    state.blending    = Device::BlendOp::None;
    state.depth_test  = Device::DepthTest::Disabled;
    state.bWriteDepth = false;
    state.culling     = Device::Culling::None;

    GeometryDrawCommand draw(*mQuad);
    mDevice.Draw(*pipeline->program, pipeline->state, draw, state, next.framebuffer);

    mCurrentIndex = (mCurrentIndex + 1) % 2;

    VERBOSE("Ran GPU textures state pipeline. [name='%1', pipeline='%2', current=%3]", mName, name, mCurrentIndex);
}

const Texture* GpuTexturesState::GetCurrentTexture(const std::string& channel) const
{
    CheckNotDisposed();

    const auto it = std::find(mChannels.begin(), mChannels.end(), channel);
    if (it == mChannels.end())
        throw std::runtime_error(base::FormatString("Unknown texture \"%1\".", channel));

    const auto index = std::distance(mChannels.begin(), it);
    return mSets[mCurrentIndex].textures[index];
}

void GpuTexturesState::SetUniform(const std::string& pipeline, const std::string& name, UniformValue value)
{
    CheckNotDisposed();

    auto* p = base::SafeFind(mPipelines, pipeline);
    if (p == nullptr)
        throw std::runtime_error(base::FormatString("Unknown pipeline \"%1\".", pipeline));

    const auto* type = base::SafeFind(p->uniform_types, name);
    if (type == nullptr)
        throw std::runtime_error(base::FormatString("Unknown uniform \"%1\" in pipeline \"%2\".", name, pipeline));
    if (!IsValueOfType(value, *type))
        throw std::runtime_error(base::FormatString("Invalid value type for uniform \"%1\", expected %2.",
                                                    name, UniformTypeToString(*type)));
    ApplyUniformValue(p->state, name, value);
}

void GpuTexturesState::Dispose()
{
    if (mDisposed)
        return;

    // the framebuffers must go before the textures they render to.
    for (auto& set : mSets)
    {
        if (set.framebuffer)
            mDevice.DeleteFramebuffer(set.name);
        set.framebuffer = nullptr;
    }
    for (auto& set : mSets)
    {
        for (auto* texture : set.textures)
            mDevice.DeleteTexture(texture->GetId());
        set.textures.clear();
    }
    for (auto& pair : mPipelines)
    {
        auto& pipeline = pair.second;
        pipeline.state.Clear();
        pipeline.program.reset();
        mDevice.DeleteProgram(pipeline.program_id);
        mDevice.DeleteShader(pipeline.program_id + "/fs");
    }
    mDevice.DeleteShader(VertexShaderId);
    mQuad.reset();
    mDisposed = true;

    DEBUG("Disposed GPU textures state. [name='%1']", mName);
}

std::string GpuTexturesState::GetProgramId(const std::string& pipeline) const
{
    return GetPipeline(pipeline).program_id;
}

std::string GpuTexturesState::GetFragmentSource(const std::string& pipeline) const
{
    return GetPipeline(pipeline).fragment_source;
}

void GpuTexturesState::ValidateParams(const Params& params) const
{
    if (params.width == 0 || params.height == 0)
        throw std::runtime_error(base::FormatString("Invalid GPU textures state size %1x%2.", params.width, params.height));
    if (params.channels.empty())
        throw std::runtime_error("GPU textures state has no channels.");

    Device::DeviceCaps caps;
    mDevice.GetDeviceCaps(&caps);
    unsigned max_channels = dev::MaxColorAttachments;
    if (caps.num_color_attachments)
        max_channels = std::min(max_channels, caps.num_color_attachments);
    if (params.channels.size() > max_channels)
        throw std::runtime_error(base::FormatString("Too many GPU textures state channels %1, max is %2.",
                                                    params.channels.size(), max_channels));
    if (caps.max_fbo_width && caps.max_fbo_height &&
        (params.width > caps.max_fbo_width || params.height > caps.max_fbo_height))
        throw std::runtime_error(base::FormatString("GPU textures state size %1x%2 exceeds the device max %3x%4.",
                                                    params.width, params.height, caps.max_fbo_width, caps.max_fbo_height));

    std::unordered_set<std::string> channels;
    for (const auto& channel : params.channels)
    {
        if (!ShaderSource::IsValidIdentifier(channel))
            throw std::runtime_error(base::FormatString("Invalid channel name \"%1\".", channel));
        if (base::Contains(channels, channel))
            throw std::runtime_error(base::FormatString("Duplicate channel \"%1\".", channel));
        channels.insert(channel);
    }

    for (const auto& pair : params.pipelines)
    {
        const auto& name = pair.first;
        if (name.empty())
            throw std::runtime_error("Pipeline name is empty.");

        std::unordered_set<std::string> uniforms;
        for (const auto& uniform : pair.second.uniforms)
        {
            if (!ShaderSource::IsValidIdentifier(uniform.name) || IsReservedPipelineName(uniform.name))
                throw std::runtime_error(base::FormatString("Invalid uniform name \"%1\" in pipeline \"%2\".",
                                                            uniform.name, name));
            if (base::Contains(uniforms, uniform.name))
                throw std::runtime_error(base::FormatString("Duplicate uniform \"%1\" in pipeline \"%2\".",
                                                            uniform.name, name));
            if (!IsValueOfType(uniform.value, uniform.type))
                throw std::runtime_error(base::FormatString("Invalid value type for uniform \"%1\", expected %2.",
                                                            uniform.name, UniformTypeToString(uniform.type)));
            uniforms.insert(uniform.name);
        }
    }
}

std::string GpuTexturesState::BuildFragmentSource(const Pipeline& pipeline) const
{
    ShaderSource source(ShaderSource::Type::Fragment,
                        ShaderSource::Version::GLSL_300,
                        ShaderSource::Precision::High);
    for (const auto& uniform : pipeline.uniforms)
        source.AddUniform(uniform.name, MapType(uniform.type));
    if (pipeline.requires_previous_state)
    {
        for (const auto& channel : mChannels)
            source.AddUniform("uPreviousState_" + channel, ShaderSource::UniformType::Sampler2D);
    }
    source.AddVarying("vUv", ShaderSource::VaryingType::Vec2f);
    for (unsigned i=0; i<mChannels.size(); ++i)
        source.AddOutput(base::FormatString("out_fragColor%1", i), i);

    source.AddSource(GetPackingSource());

    std::vector<std::string> params;
    std::vector<std::string> args;
    params.push_back("const vec2 uv");
    args.push_back("vUv");
    if (pipeline.requires_previous_state)
    {
        for (const auto& channel : mChannels)
        {
            params.push_back("const vec4 in_" + channel);
            args.push_back(base::FormatString("texture(uPreviousState_%1, vUv)", channel));
        }
    }
    for (unsigned i=0; i<mChannels.size(); ++i)
    {
        params.push_back("out vec4 out_" + mChannels[i]);
        args.push_back(base::FormatString("out_fragColor%1", i));
    }

    std::string code;
    code += "void runPipeline(\n    " + base::JoinString(params, ",\n    ") + ") {\n";
    code += pipeline.code;
    code += "\n}\n";
    code += "void main() {\n";
    code += "    runPipeline(\n        " + base::JoinString(args, ",\n        ") + ");\n";
    code += "}\n";
    source.AddSource(std::move(code));
    return source.GetSource();
}

void GpuTexturesState::CreateTextureSet(unsigned index)
{
    auto& set = mSets[index];
    set.name = base::FormatString("%1/Set%2", mName, index);

    for (const auto& channel : mChannels)
    {
        const auto& id = base::FormatString("%1/%2", set.name, channel);
        auto* texture = mDevice.MakeTexture(id);
        texture->SetName(id);
        texture->SetFilter(Texture::MinFilter::Nearest);
        texture->SetFilter(Texture::MagFilter::Nearest);
        texture->SetWrapX(Texture::Wrapping::Clamp);
        texture->SetWrapY(Texture::Wrapping::Clamp);
        texture->Allocate(mWidth, mHeight, Texture::Format::RGBA);
        set.textures.push_back(texture);
    }

    Framebuffer::Config conf;
    conf.format = Framebuffer::Format::ColorRGBA8;
    conf.width  = mWidth;
    conf.height = mHeight;
    conf.color_target_count = static_cast<unsigned>(mChannels.size());

    set.framebuffer = mDevice.MakeFramebuffer(set.name);
    set.framebuffer->SetConfig(conf);
    for (unsigned i=0; i<mChannels.size(); ++i)
    {
        set.framebuffer->SetColorTarget(set.textures[i], static_cast<Framebuffer::ColorAttachment>(i));
    }
}

void GpuTexturesState::CreatePipeline(const std::string& name, const Pipeline& pipeline)
{
    static const char* vertex_source = {
#include "shaders/fullscreen_vertex.glsl"
    };
    PipelineState state;
    state.requires_previous_state = pipeline.requires_previous_state;
    state.fragment_source = BuildFragmentSource(pipeline);
    state.program_id = base::FormatString("gpu-state-program-%1",
                                          base::hash_combine(size_t(0), state.fragment_source));
    for (const auto& uniform : pipeline.uniforms)
    {
        state.uniform_types[uniform.name] = uniform.type;
        ApplyUniformValue(state.state, uniform.name, uniform.value);
    }

    state.program = mDevice.FindProgram(state.program_id);
    if (!state.program)
    {
        ShaderPtr vs = mDevice.FindShader(VertexShaderId);
        if (!vs)
        {
            Shader::CreateArgs args;
            args.name   = "FullscreenVertexShader";
            args.source = vertex_source;
            vs = mDevice.CreateShader(VertexShaderId, args);
        }
        Shader::CreateArgs fs;
        fs.name   = base::FormatString("%1/%2", mName, name);
        fs.source = state.fragment_source;

        Program::CreateArgs args;
        args.name = fs.name;
        args.vertex_shader   = vs;
        args.fragment_shader = mDevice.CreateShader(state.program_id + "/fs", fs);
        state.program = mDevice.CreateProgram(state.program_id, args);
        if (!state.program->IsValid())
            ERROR("Failed to build GPU textures state pipeline program. [name='%1', pipeline='%2']", mName, name);
    }
    mPipelines[name] = std::move(state);
}

const GpuTexturesState::PipelineState& GpuTexturesState::GetPipeline(const std::string& name) const
{
    const auto* pipeline = base::SafeFind(mPipelines, name);
    if (pipeline == nullptr)
        throw std::runtime_error(base::FormatString("Unknown pipeline \"%1\".", name));
    return *pipeline;
}

void GpuTexturesState::CheckNotDisposed() const
{
    if (mDisposed)
        throw std::runtime_error(base::FormatString("GPU textures state '%1' has been disposed.", mName));
}

} // namespace
