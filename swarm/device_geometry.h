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

#include <optional>
#include <string>
#include <vector>
#include <cstddef>

#include "device/enum.h"
#include "device/vertex.h"
#include "device/graphics.h"
#include "swarm/geometry.h"

namespace swarm
{
    class DeviceGeometry : public swarm::Geometry
    {
    public:
        explicit DeviceGeometry(dev::GraphicsDevice* device) noexcept
            : mDevice(device)
        {}
       ~DeviceGeometry() override;

        size_t GetContentHash() const  override
        { return mHash; }
        size_t GetNumDrawCmds() const override
        { return mDrawCommands.size(); }
        DrawCommand GetDrawCmd(size_t index) const override
        { return mDrawCommands[index]; }
        Usage GetUsage() const override
        { return mUsage; }
        std::string GetName() const override
        { return mName; }

        inline void SetBuffer(swarm::GeometryBuffer&& buffer) noexcept
        { mPendingUpload = std::move(buffer); }
        inline void SetUsage(Usage usage) noexcept
        { mUsage = usage; }
        inline void SetDataHash(size_t hash) noexcept
        { mHash = hash; }
        inline void SetName(const std::string& name) noexcept
        { mName = name; }

        inline bool IsEmpty() const noexcept
        { return mVertexBuffer.buffer_bytes == 0; }
        inline const dev::VertexLayout& GetVertexLayout() const noexcept
        { return mVertexLayout; }
        inline const dev::GraphicsBuffer& GetVertexBuffer() const noexcept
        { return mVertexBuffer; }
        inline size_t GetVertexCount() const noexcept
        { return mVertexBuffer.buffer_bytes / mVertexLayout.vertex_struct_size; }

        void Upload() const;
    private:
        dev::GraphicsDevice* mDevice = nullptr;
        dev::BufferUsage mUsage = dev::BufferUsage::Static;
        std::size_t mHash = 0;
        std::string mName;

        mutable std::optional<swarm::GeometryBuffer> mPendingUpload;
        mutable std::vector<DrawCommand> mDrawCommands;
        mutable dev::GraphicsBuffer mVertexBuffer;
        mutable dev::VertexLayout mVertexLayout;
    };
} // namespace
