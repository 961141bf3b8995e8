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

#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <cstdint>
#include <cstring>
#include <optional>

#include "base/test_minimal.h"
#include "swarm/device.h"
#include "swarm/shader.h"
#include "swarm/program.h"
#include "swarm/geometry.h"
#include "swarm/instance.h"
#include "swarm/texture.h"
#include "swarm/framebuffer.h"

// Device implementation that doesn't touch any GPU but records
// the resources and the draws so that the tests can inspect them.

class TestShader : public swarm::Shader
{
public:
    TestShader(std::string name, std::string source) noexcept
      : mName(std::move(name))
      , mSource(std::move(source))
    {}
    bool IsValid() const override
    { return true; }
    std::string GetName() const override
    { return mName; }
    std::string GetSource() const
    { return mSource; }
private:
    std::string mName;
    std::string mSource;
};

class TestProgram : public swarm::Program
{
public:
    TestProgram(std::string id, const swarm::Program::CreateArgs& args)
      : mId(std::move(id))
      , mName(args.name)
      , mState(args.state)
      , mVertexShader(std::static_pointer_cast<const TestShader>(args.vertex_shader))
      , mFragmentShader(std::static_pointer_cast<const TestShader>(args.fragment_shader))
    {}
    bool IsValid() const override
    { return true; }
    std::string GetName() const override
    { return mName; }
    std::string GetId() const override
    { return mId; }
    std::string GetVertexSource() const
    { return mVertexShader ? mVertexShader->GetSource() : ""; }
    std::string GetFragmentSource() const
    { return mFragmentShader ? mFragmentShader->GetSource() : ""; }
    const swarm::ProgramState& GetInitialState() const
    { return mState; }
private:
    std::string mId;
    std::string mName;
    swarm::ProgramState mState;
    std::shared_ptr<const TestShader> mVertexShader;
    std::shared_ptr<const TestShader> mFragmentShader;
};

class TestGeometry : public swarm::Geometry
{
public:
    TestGeometry(std::string id, swarm::Geometry::CreateArgs args)
      : mId(std::move(id))
      , mArgs(std::move(args))
    {}
    std::string GetName() const override
    { return mArgs.content_name; }
    Usage GetUsage() const override
    { return mArgs.usage; }
    std::size_t GetContentHash() const override
    { return mArgs.content_hash; }
    std::size_t GetNumDrawCmds() const override
    { return mArgs.buffer.GetNumDrawCmds(); }
    DrawCommand GetDrawCmd(size_t index) const override
    { return mArgs.buffer.GetDrawCmd(index); }
    std::string GetId() const
    { return mId; }
    const swarm::GeometryBuffer& GetBuffer() const
    { return mArgs.buffer; }
private:
    std::string mId;
    swarm::Geometry::CreateArgs mArgs;
};

class TestInstancedDraw : public swarm::InstancedDraw
{
public:
    TestInstancedDraw(std::string id, swarm::InstancedDraw::CreateArgs args)
      : mId(std::move(id))
      , mArgs(std::move(args))
    {}
    std::string GetContentName() const override
    { return mArgs.content_name; }
    std::size_t GetInstanceCount() const override
    { return mArgs.buffer.GetInstanceCount(); }
    std::string GetId() const
    { return mId; }
    Usage GetUsage() const
    { return mArgs.usage; }
    const swarm::InstancedDrawBuffer& GetBuffer() const
    { return mArgs.buffer; }
private:
    std::string mId;
    swarm::InstancedDraw::CreateArgs mArgs;
};

class TestTexture : public swarm::Texture
{
public:
    explicit TestTexture(std::string id)
      : mId(std::move(id))
    {}
    void SetFilter(MinFilter filter) override
    { mMinFilter = filter; }
    void SetFilter(MagFilter filter) override
    { mMagFilter = filter; }
    MinFilter GetMinFilter() const override
    { return mMinFilter; }
    MagFilter GetMagFilter() const override
    { return mMagFilter; }
    void SetWrapX(Wrapping w) override
    { mWrapX = w; }
    void SetWrapY(Wrapping w) override
    { mWrapY = w; }
    Wrapping GetWrapX() const override
    { return mWrapX; }
    Wrapping GetWrapY() const override
    { return mWrapY; }
    void Upload(const void* bytes, unsigned width, unsigned height, Format format) override
    {
        mWidth  = width;
        mHeight = height;
        mFormat = format;
        mBytes.clear();
        if (bytes)
        {
            TEST_REQUIRE(format == Format::RGBA);
            mBytes.resize(width * height * 4);
            std::memcpy(&mBytes[0], bytes, mBytes.size());
        }
    }
    void Allocate(unsigned width, unsigned height, Format format) override
    {
        mWidth  = width;
        mHeight = height;
        mFormat = format;
        mBytes.clear();
    }
    unsigned GetWidth() const override
    { return mWidth; }
    unsigned GetHeight() const override
    { return mHeight; }
    Format GetFormat() const override
    { return mFormat; }
    void SetName(const std::string& name) override
    { mName = name; }
    std::string GetName() const override
    { return mName; }
    std::string GetId() const override
    { return mId; }

    const std::vector<std::uint8_t>& GetBytes() const
    { return mBytes; }
private:
    const std::string mId;
    std::string mName;
    unsigned mWidth  = 0;
    unsigned mHeight = 0;
    Format mFormat  = Format::RGBA;
    Wrapping mWrapX = Wrapping::Repeat;
    Wrapping mWrapY = Wrapping::Repeat;
    MinFilter mMinFilter = MinFilter::Default;
    MagFilter mMagFilter = MagFilter::Default;
    std::vector<std::uint8_t> mBytes;
};

class TestFramebuffer : public swarm::Framebuffer
{
public:
    explicit TestFramebuffer(std::string id)
      : mId(std::move(id))
    {}
    void SetConfig(const Config& conf) override
    { mConfig = conf; }
    void SetColorTarget(swarm::Texture* texture, ColorAttachment attachment) override
    {
        const auto index = static_cast<unsigned>(attachment);
        if (index >= mTargets.size())
            mTargets.resize(index + 1);
        mTargets[index] = texture;
    }
    swarm::Texture* GetColorTarget(ColorAttachment attachment) const override
    {
        const auto index = static_cast<unsigned>(attachment);
        if (index >= mTargets.size())
            return nullptr;
        return mTargets[index];
    }
    unsigned GetWidth() const override
    { return mConfig.width; }
    unsigned GetHeight() const override
    { return mConfig.height; }
    Format GetFormat() const override
    { return mConfig.format; }
    unsigned GetColorTargetCount() const override
    { return mConfig.color_target_count; }

    bool HasColorTarget(const swarm::Texture* texture) const
    {
        if (texture == nullptr)
            return false;
        for (const auto* target : mTargets)
        {
            if (target == texture)
                return true;
        }
        return false;
    }
    std::string GetId() const
    { return mId; }
private:
    const std::string mId;
    Config mConfig;
    std::vector<swarm::Texture*> mTargets;
};

class TestDevice : public swarm::Device
{
public:
    struct DrawRecord {
        std::string program;
        std::string geometry;
        swarm::ProgramState state;
        RasterState raster;
        swarm::Framebuffer* fbo = nullptr;
        std::vector<std::string> instance_buffers;
        std::optional<unsigned> instance_count;
    };

    TestDevice()
    {
        mCaps.num_texture_units          = 16;
        mCaps.num_color_attachments      = 4;
        mCaps.max_fbo_width              = 4096;
        mCaps.max_fbo_height             = 4096;
        mCaps.instanced_rendering        = true;
        mCaps.multiple_color_attachments = true;
    }

    void ClearColorDepth(const glm::vec4& color, float depth) const override
    {}

    swarm::ShaderPtr FindShader(const std::string& id) override
    {
        auto it = mShaders.find(id);
        if (it == mShaders.end())
            return nullptr;
        return it->second;
    }
    swarm::ShaderPtr CreateShader(const std::string& id, const swarm::Shader::CreateArgs& args) override
    {
        auto shader = std::make_shared<TestShader>(args.name, args.source);
        mShaders[id] = shader;
        return shader;
    }
    swarm::ProgramPtr FindProgram(const std::string& id) override
    {
        auto it = mPrograms.find(id);
        if (it == mPrograms.end())
            return nullptr;
        return it->second;
    }
    swarm::ProgramPtr CreateProgram(const std::string& id, const swarm::Program::CreateArgs& args) override
    {
        TEST_REQUIRE(args.vertex_shader && args.fragment_shader);
        auto program = std::make_shared<TestProgram>(id, args);
        mPrograms[id] = program;
        ++mProgramsCreated;
        return program;
    }
    swarm::GeometryPtr FindGeometry(const std::string& id) override
    {
        auto it = mGeoms.find(id);
        if (it == mGeoms.end())
            return nullptr;
        return it->second;
    }
    swarm::GeometryPtr CreateGeometry(const std::string& id, swarm::Geometry::CreateArgs args) override
    {
        auto geometry = std::make_shared<TestGeometry>(id, std::move(args));
        mGeoms[id] = geometry;
        return geometry;
    }
    swarm::InstancedDrawPtr FindInstancedDraw(const std::string& id) override
    {
        auto it = mInstances.find(id);
        if (it == mInstances.end())
            return nullptr;
        return it->second;
    }
    swarm::InstancedDrawPtr CreateInstancedDraw(const std::string& id, swarm::InstancedDraw::CreateArgs args) override
    {
        TEST_REQUIRE(args.buffer.IsValid());
        auto instance = std::make_shared<TestInstancedDraw>(id, std::move(args));
        mInstances[id] = instance;
        ++mInstanceUploads;
        return instance;
    }
    swarm::Texture* FindTexture(const std::string& name) override
    {
        auto it = mTextures.find(name);
        if (it == mTextures.end())
            return nullptr;
        return it->second.get();
    }
    swarm::Texture* MakeTexture(const std::string& name) override
    {
        TEST_REQUIRE(mTextures.find(name) == mTextures.end());
        auto texture = std::make_unique<TestTexture>(name);
        auto* ret = texture.get();
        mTextures[name] = std::move(texture);
        return ret;
    }
    swarm::Framebuffer* FindFramebuffer(const std::string& name) override
    {
        auto it = mFBOs.find(name);
        if (it == mFBOs.end())
            return nullptr;
        return it->second.get();
    }
    swarm::Framebuffer* MakeFramebuffer(const std::string& name) override
    {
        TEST_REQUIRE(mFBOs.find(name) == mFBOs.end());
        auto fbo = std::make_unique<TestFramebuffer>(name);
        auto* ret = fbo.get();
        mFBOs[name] = std::move(fbo);
        return ret;
    }

    void DeleteShader(const std::string& id) override
    { mShaders.erase(id); }
    void DeleteProgram(const std::string& id) override
    { mPrograms.erase(id); }
    void DeleteGeometry(const std::string& id) override
    { mGeoms.erase(id); }
    void DeleteInstancedDraw(const std::string& id) override
    { mInstances.erase(id); }
    void DeleteTexture(const std::string& id) override
    {
        auto it = mTextures.find(id);
        if (it == mTextures.end())
            return;
        // same as the real device, a texture that is used as a render
        // target must not be deleted before the framebuffer.
        for (const auto& fbo : mFBOs)
        {
            TEST_REQUIRE(!fbo.second->HasColorTarget(it->second.get()));
        }
        mTextures.erase(it);
    }
    void DeleteFramebuffer(const std::string& id) override
    { mFBOs.erase(id); }

    void Draw(const swarm::Program& program, const swarm::ProgramState& program_state,
              const swarm::GeometryDrawCommand& geometry, const RasterState& state, swarm::Framebuffer* fbo) override
    {
        // a pass must never sample a texture it's rendering to.
        if (fbo)
        {
            const auto* test_fbo = static_cast<const TestFramebuffer*>(fbo);
            for (size_t i=0; i<program_state.GetSamplerCount(); ++i)
            {
                const auto& sampler = program_state.GetSamplerSetting(i);
                TEST_REQUIRE(!test_fbo->HasColorTarget(sampler.texture));
            }
        }

        DrawRecord record;
        record.program  = program.GetId();
        record.geometry = static_cast<const TestGeometry*>(geometry.GetGeometry())->GetId();
        record.state    = program_state;
        record.raster   = state;
        record.fbo      = fbo;
        record.instance_count = geometry.GetInstanceCount();
        for (size_t i=0; i<geometry.GetNumInstanceBuffers(); ++i)
        {
            const auto* instance = static_cast<const TestInstancedDraw*>(geometry.GetInstanceBuffer(i));
            record.instance_buffers.push_back(instance->GetId());
        }
        mDraws.push_back(std::move(record));
    }

    void BeginFrame() override
    {}
    void EndFrame(bool display) override
    {}
    ColorBuffer ReadColorBuffer(unsigned width, unsigned height, swarm::Framebuffer* fbo, ColorAttachment) const override
    {
        ColorBuffer buffer;
        buffer.width  = width;
        buffer.height = height;
        buffer.pixels.resize(width * height * 4, 0);
        return buffer;
    }
    void GetDeviceCaps(DeviceCaps* caps) const override
    { *caps = mCaps; }

    void SetDeviceCaps(const DeviceCaps& caps)
    { mCaps = caps; }

    const TestProgram* GetProgram(const std::string& id) const
    {
        auto it = mPrograms.find(id);
        if (it == mPrograms.end())
            return nullptr;
        return it->second.get();
    }
    const TestTexture* GetTexture(const std::string& id) const
    {
        auto it = mTextures.find(id);
        if (it == mTextures.end())
            return nullptr;
        return it->second.get();
    }
    const TestFramebuffer* GetFramebuffer(const std::string& id) const
    {
        auto it = mFBOs.find(id);
        if (it == mFBOs.end())
            return nullptr;
        return it->second.get();
    }
    const TestGeometry* GetGeometry(const std::string& id) const
    {
        auto it = mGeoms.find(id);
        if (it == mGeoms.end())
            return nullptr;
        return it->second.get();
    }
    const TestInstancedDraw* GetInstancedDraw(const std::string& id) const
    {
        auto it = mInstances.find(id);
        if (it == mInstances.end())
            return nullptr;
        return it->second.get();
    }
    const DrawRecord& GetDraw(size_t index) const
    {
        TEST_REQUIRE(index < mDraws.size());
        return mDraws[index];
    }

    size_t GetNumDraws() const
    { return mDraws.size(); }
    size_t GetNumTextures() const
    { return mTextures.size(); }
    size_t GetNumFramebuffers() const
    { return mFBOs.size(); }
    size_t GetNumPrograms() const
    { return mPrograms.size(); }
    size_t GetNumShaders() const
    { return mShaders.size(); }
    size_t GetNumInstancedDraws() const
    { return mInstances.size(); }
    unsigned GetNumProgramsCreated() const
    { return mProgramsCreated; }
    unsigned GetNumInstanceUploads() const
    { return mInstanceUploads; }

    void ClearDraws()
    { mDraws.clear(); }
    void ClearCounters()
    {
        mProgramsCreated = 0;
        mInstanceUploads = 0;
    }
private:
    DeviceCaps mCaps;
    std::unordered_map<std::string, std::shared_ptr<TestShader>> mShaders;
    std::unordered_map<std::string, std::shared_ptr<TestProgram>> mPrograms;
    std::unordered_map<std::string, std::shared_ptr<TestGeometry>> mGeoms;
    std::unordered_map<std::string, std::shared_ptr<TestInstancedDraw>> mInstances;
    std::unordered_map<std::string, std::unique_ptr<TestTexture>> mTextures;
    std::unordered_map<std::string, std::unique_ptr<TestFramebuffer>> mFBOs;
    std::vector<DrawRecord> mDraws;
    unsigned mProgramsCreated = 0;
    unsigned mInstanceUploads = 0;
};
