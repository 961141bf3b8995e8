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

namespace swarm
{
    class Texture
    {
    public:
        virtual ~Texture() = default;

        using Format    = dev::TextureFormat;
        using MinFilter = dev::TextureMinFilter;
        using MagFilter = dev::TextureMagFilter;
        using Wrapping  = dev::TextureWrapping;

        // Set texture minification filter.
        virtual void SetFilter(MinFilter filter) = 0;
        // Set texture magnification filter.
        virtual void SetFilter(MagFilter filter) = 0;
        // Get current texture minification filter.
        virtual MinFilter GetMinFilter() const = 0;
        // Get current texture magnification filter.
        virtual MagFilter GetMagFilter() const = 0;
        // Set texture coordinate wrapping behaviour on X axis.
        virtual void SetWrapX(Wrapping w) = 0;
        // Set texture coordinate wrapping behaviour on Y axis.
        virtual void SetWrapY(Wrapping w) = 0;
        // Get current texture coordinate wrapping behaviour on X axis.
        virtual Wrapping GetWrapX() const = 0;
        // Get current texture coordinate wrapping behaviour on Y axis.
        virtual Wrapping GetWrapY() const = 0;
        // Upload the texture contents from the given CPU side buffer.
        // This will overwrite any previous contents and reshape the
        // texture dimensions. A nullptr buffer only allocates storage.
        virtual void Upload(const void* bytes, unsigned width, unsigned height, Format format) = 0;
        // Allocate texture storage based on the texture format and dimensions.
        // The contents of the texture are unspecified and any previous contents
        // are no longer valid/available. The primary use case for this method is
        // to be able to allocate texture storage for using the texture as a render
        // target when rendering to an FBO.
        virtual void Allocate(unsigned width, unsigned height, Format format) = 0;
        // Get the texture width. Initially 0 until Upload or Allocate is called.
        virtual unsigned GetWidth() const = 0;
        // Get the texture height. Initially 0 until Upload or Allocate is called.
        virtual unsigned GetHeight() const = 0;
        // Get the texture format.
        virtual Format GetFormat() const = 0;
        // Set a (human-readable) name for the texture object.
        // Used for improved debug/log messages.
        virtual void SetName(const std::string& name) = 0;
        // Get the (human-readable) name given for the texture object.
        virtual std::string GetName() const = 0;
        // Get the texture GPU resource ID used to create the texture.
        virtual std::string GetId() const = 0;

        // helpers.
        auto HasSize() const noexcept
        { return GetWidth() && GetHeight(); }
    private:
    };

} // namespace
