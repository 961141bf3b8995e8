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

#include <memory>
#include <string>
#include <vector>

#include "device/graphics.h"
#include "swarm/framebuffer.h"
#include "swarm/device_texture.h"

namespace swarm
{
    class DeviceFramebuffer : public swarm::Framebuffer
    {
    public:
        DeviceFramebuffer(dev::GraphicsDevice* device, std::string name) noexcept
          : mName(std::move(name))
          , mDevice(device)
        {}
       ~DeviceFramebuffer() override;

        void SetConfig(const Config& conf) override;
        void SetColorTarget(swarm::Texture* texture, ColorAttachment attachment) override;
        swarm::Texture* GetColorTarget(ColorAttachment attachment) const override;

        unsigned GetWidth() const override;
        unsigned GetHeight() const override;

        Format GetFormat() const override
        { return mConfig.format; }
        unsigned GetColorTargetCount() const override
        { return mConfig.color_target_count; }

        bool IsReady() const noexcept
        { return mFramebuffer.IsValid(); }
        dev::Framebuffer GetFramebuffer() const noexcept
        { return mFramebuffer; }

        unsigned GetClientTextureCount() const noexcept
        { return static_cast<unsigned>(mClientColorTextures.size()); }
        const swarm::DeviceTexture* GetClientTexture(unsigned index) const noexcept
        { return mClientColorTextures[index]; }
        DeviceTexture* GetColorBufferTexture(unsigned index) const noexcept;

        bool Complete();
        bool Create();
        void CreateColorBufferTextures();

    private:
        const std::string mName;

        dev::GraphicsDevice* mDevice = nullptr;
        dev::Framebuffer mFramebuffer;

        // Texture targets that we allocate when the user hasn't
        // provided a client texture for an attachment.
        std::vector<std::unique_ptr<swarm::DeviceTexture>> mColorTextures;

        // Client provided texture(s) that will ultimately contain
        // the rendered result.
        std::vector<swarm::DeviceTexture*> mClientColorTextures;

        Config mConfig;
    };

} // namespace
