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

#include <algorithm>
#include <unordered_map>
#include <limits>

#include "base/assert.h"
#include "base/logging.h"
#include "device/graphics.h"
#include "swarm/device.h"
#include "swarm/texture.h"
#include "swarm/device_texture.h"
#include "swarm/device_geometry.h"
#include "swarm/device_shader.h"
#include "swarm/device_framebuffer.h"
#include "swarm/device_program.h"
#include "swarm/device_instance.h"

namespace {
class GraphicsDevice : public swarm::Device {
public:
    explicit GraphicsDevice(std::shared_ptr<dev::GraphicsDevice> device) noexcept;
    explicit GraphicsDevice(dev::GraphicsDevice* device) noexcept;
   ~GraphicsDevice() override;

    void ClearColorDepth(const glm::vec4& color, float depth) const override;

    swarm::ShaderPtr FindShader(const std::string& id) override;
    swarm::ShaderPtr CreateShader(const std::string& id, const swarm::Shader::CreateArgs& args) override;
    swarm::ProgramPtr FindProgram(const std::string& id) override;
    swarm::ProgramPtr CreateProgram(const std::string& id, const swarm::Program::CreateArgs& args) override;
    swarm::GeometryPtr FindGeometry(const std::string& id) override;
    swarm::GeometryPtr CreateGeometry(const std::string& id, swarm::Geometry::CreateArgs args) override;
    swarm::InstancedDrawPtr FindInstancedDraw(const std::string& id) override;
    swarm::InstancedDrawPtr CreateInstancedDraw(const std::string& id, swarm::InstancedDraw::CreateArgs args) override;
    swarm::Texture* FindTexture(const std::string& name) override;
    swarm::Texture* MakeTexture(const std::string& name) override;
    swarm::Framebuffer* FindFramebuffer(const std::string& name) override;
    swarm::Framebuffer* MakeFramebuffer(const std::string& name) override;

    void DeleteShader(const std::string& id) override;
    void DeleteProgram(const std::string& id) override;
    void DeleteGeometry(const std::string& id) override;
    void DeleteInstancedDraw(const std::string& id) override;
    void DeleteTexture(const std::string& id) override;
    void DeleteFramebuffer(const std::string& id) override;

    void Draw(const swarm::Program& program, const swarm::ProgramState& program_state,
              const swarm::GeometryDrawCommand& geometry, const RasterState& state, swarm::Framebuffer* fbo) override;

    void BeginFrame() override;
    void EndFrame(bool display) override;
    ColorBuffer ReadColorBuffer(unsigned width, unsigned height, swarm::Framebuffer* fbo,
                                ColorAttachment attachment) const override;
    void GetDeviceCaps(DeviceCaps* caps) const override;

private:
    dev::Framebuffer SetupFBO(swarm::Framebuffer* fbo) const;
    bool IsTextureFBOTarget(const swarm::Texture* texture) const;

private:
    std::shared_ptr<dev::GraphicsDevice> mDeviceImpl;
    dev::GraphicsDevice* mDevice = nullptr;

    std::unordered_map<std::string, std::shared_ptr<swarm::InstancedDraw>> mInstances;
    std::unordered_map<std::string, std::shared_ptr<swarm::Geometry>> mGeoms;
    std::unordered_map<std::string, std::shared_ptr<swarm::Shader>> mShaders;
    std::unordered_map<std::string, std::shared_ptr<swarm::Program>> mPrograms;
    std::unordered_map<std::string, std::unique_ptr<swarm::Texture>> mTextures;
    std::unordered_map<std::string, std::unique_ptr<swarm::Framebuffer>> mFBOs;
};

GraphicsDevice::GraphicsDevice(std::shared_ptr<dev::GraphicsDevice> device) noexcept
  : mDeviceImpl(std::move(device))
  , mDevice(mDeviceImpl.get())
{
    DEBUG("Create swarm::Device");
}
GraphicsDevice::GraphicsDevice(dev::GraphicsDevice* device) noexcept
  : mDevice(device)
{
    DEBUG("Create swarm::Device");
}

GraphicsDevice::~GraphicsDevice()
{
    DEBUG("Destroy swarm::Device");
    // make sure our cleanup order is specific so that the
    // resources are deleted before the context is deleted.
    mFBOs.clear();
    mTextures.clear();
    mPrograms.clear();
    mShaders.clear();
    mGeoms.clear();
    mInstances.clear();
}

void GraphicsDevice::ClearColorDepth(const glm::vec4& color, float depth) const
{
    mDevice->ClearColorDepth(color, depth);
}

swarm::ShaderPtr GraphicsDevice::FindShader(const std::string& id)
{
    auto it = mShaders.find(id);
    if (it == std::end(mShaders))
        return nullptr;
    return it->second;
}

swarm::ShaderPtr GraphicsDevice::CreateShader(const std::string& id, const swarm::Shader::CreateArgs& args)
{
    auto shader = std::make_shared<swarm::DeviceShader>(mDevice);
    shader->SetName(args.name);
    shader->CompileSource(args.source, args.debug);
    mShaders[id] = shader;
    return shader;
}

swarm::ProgramPtr GraphicsDevice::FindProgram(const std::string& id)
{
    auto it = mPrograms.find(id);
    if (it == std::end(mPrograms))
        return nullptr;
    return it->second;
}

swarm::ProgramPtr GraphicsDevice::CreateProgram(const std::string& id, const swarm::Program::CreateArgs& args)
{
    auto program = std::make_shared<swarm::DeviceProgram>(mDevice);

    std::vector<swarm::ShaderPtr> shaders;
    shaders.push_back(args.vertex_shader);
    shaders.push_back(args.fragment_shader);

    program->SetId(id);
    program->SetName(args.name);
    program->Build(shaders);

    if (program->IsValid())
    {
        // set the initial uniform state
        program->ApplyUniformState(args.state);
    }

    mPrograms[id] = program;
    return program;
}

swarm::GeometryPtr GraphicsDevice::FindGeometry(const std::string& id)
{
    auto it = mGeoms.find(id);
    if (it == std::end(mGeoms))
        return nullptr;
    return it->second;
}

swarm::GeometryPtr GraphicsDevice::CreateGeometry(const std::string& id, swarm::Geometry::CreateArgs args)
{
    auto geometry = std::make_shared<swarm::DeviceGeometry>(mDevice);
    geometry->SetName(args.content_name);
    geometry->SetDataHash(args.content_hash);
    geometry->SetUsage(args.usage);
    geometry->SetBuffer(std::move(args.buffer));
    geometry->Upload();

    mGeoms[id] = geometry;
    return geometry;
}

swarm::InstancedDrawPtr GraphicsDevice::FindInstancedDraw(const std::string& id)
{
    auto it = mInstances.find(id);
    if (it == std::end(mInstances))
        return nullptr;
    return it->second;
}

swarm::InstancedDrawPtr GraphicsDevice::CreateInstancedDraw(const std::string& id, swarm::InstancedDraw::CreateArgs args)
{
    // re-creating an instance buffer with the same id reuses the
    // existing object so that a same size upload keeps its buffer.
    std::shared_ptr<swarm::DeviceDrawInstanceBuffer> instance;
    auto it = mInstances.find(id);
    if (it != mInstances.end())
        instance = std::static_pointer_cast<swarm::DeviceDrawInstanceBuffer>(it->second);
    else instance = std::make_shared<swarm::DeviceDrawInstanceBuffer>(mDevice);

    instance->SetContentName(args.content_name);
    instance->SetUsage(args.usage);
    instance->SetBuffer(std::move(args.buffer));
    instance->Upload();

    mInstances[id] = instance;
    return instance;
}

swarm::Texture* GraphicsDevice::FindTexture(const std::string& name)
{
    auto it = mTextures.find(name);
    if (it == std::end(mTextures))
        return nullptr;
    return it->second.get();
}

swarm::Texture* GraphicsDevice::MakeTexture(const std::string& name)
{
    auto texture = std::make_unique<swarm::DeviceTexture>(mDevice, name);
    auto* ret = texture.get();
    mTextures[name] = std::move(texture);
    return ret;
}

swarm::Framebuffer* GraphicsDevice::FindFramebuffer(const std::string& name)
{
    auto it = mFBOs.find(name);
    if (it == std::end(mFBOs))
        return nullptr;
    return it->second.get();
}

swarm::Framebuffer* GraphicsDevice::MakeFramebuffer(const std::string& name)
{
    auto fbo = std::make_unique<swarm::DeviceFramebuffer>(mDevice, name);
    auto* ret = fbo.get();
    mFBOs[name] = std::move(fbo);
    return ret;
}

void GraphicsDevice::DeleteShader(const std::string& id)
{
    mShaders.erase(id);
}
void GraphicsDevice::DeleteProgram(const std::string& id)
{
    mPrograms.erase(id);
}
void GraphicsDevice::DeleteGeometry(const std::string& id)
{
    mGeoms.erase(id);
}
void GraphicsDevice::DeleteInstancedDraw(const std::string& id)
{
    mInstances.erase(id);
}
void GraphicsDevice::DeleteFramebuffer(const std::string& id)
{
    mFBOs.erase(id);
}
void GraphicsDevice::DeleteTexture(const std::string& id)
{
    auto it = mTextures.find(id);
    if (it == mTextures.end())
        return;

    auto* texture = static_cast<swarm::DeviceTexture*>(it->second.get());
    ASSERT(IsTextureFBOTarget(texture) == false);

    mTextures.erase(it);
}

void GraphicsDevice::Draw(const swarm::Program& program,
                          const swarm::ProgramState& program_state,
                          const swarm::GeometryDrawCommand& geometry,
                          const Device::RasterState& state,
                          swarm::Framebuffer* fbo)
{
    const auto* myprog = static_cast<const swarm::DeviceProgram*>(&program);
    if (!myprog->IsValid())
    {
        WARN("Skipping draw with invalid program. [name='%1']", myprog->GetName());
        return;
    }

    const auto* mygeom = static_cast<const swarm::DeviceGeometry*>(geometry.GetGeometry());
    // geometry without vertex data is a dummy and has nothing to draw.
    if (mygeom->IsEmpty())
        return;

    size_t instance_count = 0;
    if (geometry.IsInstanced())
    {
        instance_count = std::numeric_limits<size_t>::max();
        for (size_t i=0; i<geometry.GetNumInstanceBuffers(); ++i)
        {
            const auto* myinst = static_cast<const swarm::DeviceDrawInstanceBuffer*>(geometry.GetInstanceBuffer(i));
            if (myinst->IsEmpty())
            {
                WARN("Skipping draw with empty instance buffer. [name='%1']", myinst->GetContentName());
                return;
            }
            instance_count = std::min(instance_count, myinst->GetInstanceCount());
        }
        if (const auto count = geometry.GetInstanceCount())
            instance_count = std::min(instance_count, static_cast<size_t>(count.value()));

        if (instance_count == 0)
            return;
    }

    // this will also call glUseProgram
    myprog->ApplyUniformState(program_state);

    mDevice->SetPipelineState(state);

    // set program texture bindings
    const auto num_textures = program_state.GetSamplerCount();
    for (size_t i=0; i<num_textures; ++i)
    {
        const auto& sampler = program_state.GetSamplerSetting(i);

        const auto* texture = static_cast<const swarm::DeviceTexture*>(sampler.texture);
        // if the program sampler/texture setting is using a discontinuous set of
        // texture units we might end up with "holes" in the program texture state
        // and then the texture object is actually a nullptr.
        if (texture == nullptr)
            continue;

        // sampling a texture that is also being rendered to is undefined.
        if (fbo)
        {
            for (unsigned j=0; j<fbo->GetColorTargetCount(); ++j)
            {
                ASSERT(fbo->GetColorTarget(static_cast<ColorAttachment>(j)) != texture);
            }
        }

        // the simulation textures are sampled per texel so anything
        // that isn't explicitly filtered is sampled with nearest.
        auto texture_min_filter = texture->GetMinFilter();
        auto texture_mag_filter = texture->GetMagFilter();
        if (texture_min_filter == dev::TextureMinFilter::Default)
            texture_min_filter = dev::TextureMinFilter::Nearest;
        if (texture_mag_filter == dev::TextureMagFilter::Default)
            texture_mag_filter = dev::TextureMagFilter::Nearest;

        if (!mDevice->BindTexture2D(texture->GetTexture(), myprog->GetProgram(), sampler.name,
                                    static_cast<unsigned>(i), texture->GetWrapX(), texture->GetWrapY(),
                                    texture_min_filter, texture_mag_filter))
        {
            ERROR("Failed to bind texture. [texture='%1', sampler='%2']", texture->GetName(), sampler.name);
            return;
        }
    }

    // the viewport of the default target belongs to whoever set up the
    // window surface. a pass into a custom target covers the whole target
    // and the previous viewport is restored after it.
    const auto default_viewport = mDevice->GetViewportState();

    dev::Framebuffer framebuffer = SetupFBO(fbo);
    if (!framebuffer.IsValid())
    {
        mDevice->BindFramebuffer(mDevice->GetDefaultFramebuffer());
        return;
    }

    // start drawing geometry.
    constexpr auto DrawMax = std::numeric_limits<uint32_t>::max();

    mDevice->BindFramebuffer(framebuffer);
    if (fbo)
    {
        dev::ViewportState viewport;
        viewport.width  = static_cast<int>(framebuffer.width);
        viewport.height = static_cast<int>(framebuffer.height);
        mDevice->SetViewportState(viewport);
    }

    mDevice->BindVertexBuffer(mygeom->GetVertexBuffer(),
                              myprog->GetProgram(),
                              mygeom->GetVertexLayout());

    const auto draw_command_count = geometry.GetNumDrawCmds();
    const auto vertex_buffer_item_count = mygeom->GetVertexCount();

    if (geometry.IsInstanced())
    {
        for (size_t i=0; i<geometry.GetNumInstanceBuffers(); ++i)
        {
            const auto* myinst = static_cast<const swarm::DeviceDrawInstanceBuffer*>(geometry.GetInstanceBuffer(i));
            mDevice->BindVertexBuffer(myinst->GetVertexBuffer(),
                                      myprog->GetProgram(),
                                      myinst->GetVertexLayout());
        }

        for (size_t i = 0; i < draw_command_count; ++i)
        {
            const auto& draw_cmd = geometry.GetDrawCmd(i);
            const auto draw_cmd_primitive_count =
                    draw_cmd.count == DrawMax ? vertex_buffer_item_count : draw_cmd.count;
            const auto draw_cmd_primitive_type = draw_cmd.type;
            const auto draw_cmd_offset = draw_cmd.offset;

            // draw arrays instanced
            mDevice->Draw(draw_cmd_primitive_type, draw_cmd_offset, draw_cmd_primitive_count, instance_count);
        }
    }
    else
    {
        for (size_t i=0; i<draw_command_count; ++i)
        {
            const auto& draw_cmd = geometry.GetDrawCmd(i);
            const auto draw_cmd_primitive_count =
                    draw_cmd.count == DrawMax ? vertex_buffer_item_count : draw_cmd.count;
            const auto draw_cmd_primitive_type  = draw_cmd.type;
            const auto draw_cmd_offset = draw_cmd.offset;

            // draw arrays
            mDevice->Draw(draw_cmd_primitive_type, draw_cmd_offset, draw_cmd_primitive_count);
        }
    }

    // leave the default framebuffer bound for whoever draws next
    // without an explicit target.
    if (fbo)
    {
        mDevice->BindFramebuffer(mDevice->GetDefaultFramebuffer());
        mDevice->SetViewportState(default_viewport);
    }
}

void GraphicsDevice::BeginFrame()
{
    mDevice->BeginFrame();
}

void GraphicsDevice::EndFrame(bool display)
{
    mDevice->EndFrame(display);
}

swarm::Device::ColorBuffer GraphicsDevice::ReadColorBuffer(unsigned width, unsigned height,
                                                           swarm::Framebuffer* fbo,
                                                           ColorAttachment attachment) const
{
    ColorBuffer buffer;
    dev::Framebuffer framebuffer = SetupFBO(fbo);
    if (!framebuffer.IsValid())
        return buffer;

    buffer.width  = width;
    buffer.height = height;
    buffer.pixels.resize(width * height * 4);
    mDevice->ReadColor(width, height, framebuffer, attachment, buffer.pixels.data());
    if (fbo)
        mDevice->BindFramebuffer(mDevice->GetDefaultFramebuffer());
    return buffer;
}

void GraphicsDevice::GetDeviceCaps(DeviceCaps* caps) const
{
    mDevice->GetDeviceCaps(caps);
}

dev::Framebuffer GraphicsDevice::SetupFBO(swarm::Framebuffer* framebuffer) const
{
    dev::Framebuffer invalid_handle;
    if (framebuffer)
    {
        auto* device_framebuffer = static_cast<swarm::DeviceFramebuffer*>(framebuffer);
        if (device_framebuffer->IsReady())
        {
            if (!device_framebuffer->Complete())
                return invalid_handle;
        }
        else
        {
            if (!device_framebuffer->Create())
                return invalid_handle;
            if (!device_framebuffer->Complete())
                return invalid_handle;
        }
        return device_framebuffer->GetFramebuffer();
    }
    return mDevice->GetDefaultFramebuffer();
}

bool GraphicsDevice::IsTextureFBOTarget(const swarm::Texture* texture) const
{
    for (const auto& pair: mFBOs)
    {
        const auto* fbo = static_cast<const swarm::DeviceFramebuffer*>(pair.second.get());
        for (unsigned i = 0; i < fbo->GetClientTextureCount(); ++i)
        {
            const auto* client_texture = fbo->GetClientTexture(i);
            if (client_texture == nullptr)
                continue;
            if (client_texture == texture)
                return true;
        }
    }
    return false;
}

} // namespace

namespace swarm {
std::shared_ptr<Device> CreateDevice(std::shared_ptr<dev::GraphicsDevice> device)
{
    return std::make_shared<GraphicsDevice>(device);
}
std::shared_ptr<Device> CreateDevice(dev::GraphicsDevice* device)
{
    return std::make_shared<GraphicsDevice>(device);
}

} // namespace
