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

#include "base/assert.h"
#include "base/logging.h"
#include "swarm/device_texture.h"
#include "swarm/device_framebuffer.h"

namespace swarm {

DeviceFramebuffer::~DeviceFramebuffer()
{
    mColorTextures.clear();

    if (mFramebuffer.IsValid())
    {
        mDevice->DeleteFramebuffer(mFramebuffer);
        DEBUG("Deleted frame buffer object. [name='%1']", mName);
    }
}

void DeviceFramebuffer::SetConfig(const Config& conf)
{
    ASSERT(conf.format != Format::Invalid);
    ASSERT(conf.color_target_count >= 1);
    ASSERT(conf.color_target_count <= dev::MaxColorAttachments);

    // we don't allow the config to be changed after it has been created.
    if (mFramebuffer.IsValid())
    {
        ASSERT(mConfig.format == conf.format);
        ASSERT(mConfig.color_target_count == conf.color_target_count);
    }

    mConfig = conf;
    mClientColorTextures.resize(mConfig.color_target_count);
    mColorTextures.resize(mConfig.color_target_count);
}

void DeviceFramebuffer::SetColorTarget(swarm::Texture* texture, ColorAttachment attachment)
{
    const auto index = static_cast<unsigned>(attachment);

    ASSERT(mConfig.format != Format::Invalid);
    ASSERT(index < mConfig.color_target_count);

    if (texture == mClientColorTextures[index])
        return;

    mClientColorTextures[index] = static_cast<swarm::DeviceTexture*>(texture);

    // the client textures drive the FBO size and every
    // client texture must have the same size.
    unsigned width  = 0;
    unsigned height = 0;
    for (const auto* client : mClientColorTextures)
    {
        if (!client)
            continue;

        if (width == 0 && height == 0)
        {
            width  = client->GetWidth();
            height = client->GetHeight();
        }
        else
        {
            ASSERT(client->GetWidth() == width);
            ASSERT(client->GetHeight() == height);
        }
    }
}

swarm::Texture* DeviceFramebuffer::GetColorTarget(ColorAttachment attachment) const
{
    const auto index = static_cast<unsigned>(attachment);
    ASSERT(index < mConfig.color_target_count);
    return GetColorBufferTexture(index);
}

unsigned DeviceFramebuffer::GetWidth() const
{
    for (const auto* client : mClientColorTextures)
    {
        if (client)
            return client->GetWidth();
    }
    return mConfig.width;
}

unsigned DeviceFramebuffer::GetHeight() const
{
    for (const auto* client : mClientColorTextures)
    {
        if (client)
            return client->GetHeight();
    }
    return mConfig.height;
}

swarm::DeviceTexture* DeviceFramebuffer::GetColorBufferTexture(unsigned index) const noexcept
{
    if (mClientColorTextures[index])
        return mClientColorTextures[index];

    return mColorTextures[index].get();
}

bool DeviceFramebuffer::Complete()
{
    CreateColorBufferTextures();

    std::vector<unsigned> color_attachments;
    for (unsigned i=0; i<mConfig.color_target_count; ++i)
    {
        const auto* color_target = GetColorBufferTexture(i);
        if (!color_target->GetTexture().IsValid())
        {
            ERROR("Framebuffer color target has no storage. [name='%1', attachment=%2]", mName, i);
            return false;
        }
        mDevice->BindRenderTargetTexture2D(mFramebuffer, color_target->GetTexture(), i);
        color_attachments.push_back(i);
    }

    if (!mDevice->CompleteFramebuffer(mFramebuffer, color_attachments))
    {
        ERROR("Unsupported framebuffer configuration. [name='%1', attachments=%2]", mName,
              mConfig.color_target_count);
        return false;
    }
    return true;
}

bool DeviceFramebuffer::Create()
{
    ASSERT(!mFramebuffer.IsValid());
    ASSERT(mConfig.format != Format::Invalid);

    // client textures drive the size, if there are none
    // the size must come from the config.
    const auto fbo_width  = GetWidth();
    const auto fbo_height = GetHeight();
    if (!fbo_width || !fbo_height)
    {
        ERROR("Framebuffer has no size. [name='%1']", mName);
        return false;
    }

    // commit the size before creating the color buffers.
    mConfig.width  = fbo_width;
    mConfig.height = fbo_height;
    CreateColorBufferTextures();

    dev::FramebufferConfig config;
    config.width  = fbo_width;
    config.height = fbo_height;
    config.format = mConfig.format;
    mFramebuffer = mDevice->CreateFramebuffer(config);
    if (!mFramebuffer.IsValid())
    {
        ERROR("Failed to create frame buffer object. [name='%1', width=%2, height=%3]", mName,
              fbo_width, fbo_height);
        return false;
    }
    DEBUG("Created new frame buffer object. [name='%1', width=%2, height=%3, format=%4, attachments=%5]",
          mName, fbo_width, fbo_height, mConfig.format, mConfig.color_target_count);
    return true;
}


void DeviceFramebuffer::CreateColorBufferTextures()
{
    mClientColorTextures.resize(mConfig.color_target_count);
    mColorTextures.resize(mConfig.color_target_count);

    for (unsigned i=0; i<mConfig.color_target_count; ++i)
    {
        if (mClientColorTextures[i])
            continue;

        // we must have FBO width and height for creating
        // the color buffer texture.
        ASSERT(mConfig.width && mConfig.height);

        if (!mColorTextures[i])
        {
            const auto texture_name = "FBO/" + mName + "/Color" + std::to_string(i);
            mColorTextures[i] = std::make_unique<swarm::DeviceTexture>(mDevice, texture_name);
            mColorTextures[i]->SetName(texture_name);
            mColorTextures[i]->Allocate(mConfig.width, mConfig.height, swarm::Texture::Format::RGBA);
            mColorTextures[i]->SetFilter(swarm::Texture::MinFilter::Nearest);
            mColorTextures[i]->SetFilter(swarm::Texture::MagFilter::Nearest);
            mColorTextures[i]->SetWrapX(swarm::Texture::Wrapping::Clamp);
            mColorTextures[i]->SetWrapY(swarm::Texture::Wrapping::Clamp);
            DEBUG("Allocated new FBO color buffer (texture) target. [name='%1', width=%2, height=%3]", mName,
                  mConfig.width, mConfig.height);
        }
        else
        {
            const auto width  = mColorTextures[i]->GetWidth();
            const auto height = mColorTextures[i]->GetHeight();
            if (width != mConfig.width || height != mConfig.height)
                mColorTextures[i]->Allocate(mConfig.width, mConfig.height, swarm::Texture::Format::RGBA);
        }
    }
}

} // namespace
