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

#include "device/enum.h"
#include "device/graphics.h"
#include "swarm/texture.h"

namespace swarm
{
    class DeviceTexture : public swarm::Texture
    {
    public:
        DeviceTexture(dev::GraphicsDevice* device, std::string id) noexcept
           : mDevice(device)
           , mGpuId(std::move(id))
        {}
       ~DeviceTexture() override;

        void Upload(const void* bytes, unsigned width, unsigned height, Format format) override;
        void Allocate(unsigned width, unsigned height, Format format) override;

        // refer actual state setting to the point when
        // the texture is actually used in a program's sampler
        void SetFilter(MinFilter filter) override
        { mMinFilter = filter; }
        void SetFilter(MagFilter filter) override
        { mMagFilter = filter; }
        void SetWrapX(Wrapping w) override
        { mWrapX = w; }
        void SetWrapY(Wrapping w) override
        { mWrapY = w; }
        MinFilter GetMinFilter() const override
        { return mMinFilter; }
        MagFilter GetMagFilter() const override
        { return mMagFilter; }
        Wrapping GetWrapX() const override
        { return mWrapX; }
        Wrapping GetWrapY() const override
        { return mWrapY; }
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
        { return mGpuId; }

        dev::TextureObject GetTexture() const
        { return mTexture; }

    private:
        bool StoreSize(unsigned width, unsigned height, Format format);
    private:
        dev::GraphicsDevice* mDevice = nullptr;
        dev::TextureObject mTexture;
    private:
        MinFilter mMinFilter = MinFilter::Default;
        MagFilter mMagFilter = MagFilter::Default;
        Wrapping mWrapX = Wrapping::Repeat;
        Wrapping mWrapY = Wrapping::Repeat;
        Format mFormat  = Format::RGBA;
    private:
        unsigned mWidth  = 0;
        unsigned mHeight = 0;
        std::string mName;
        std::string mGpuId;
    };
} // namespace
