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
#include <cstddef>

#include "device/enum.h"
#include "device/graphics.h"
#include "swarm/instance.h"

namespace swarm
{
    class DeviceDrawInstanceBuffer : public swarm::InstancedDraw
    {
    public:
        explicit DeviceDrawInstanceBuffer(dev::GraphicsDevice* device) noexcept
          : mDevice(device)
        {}
       ~DeviceDrawInstanceBuffer() override;

        std::string GetContentName() const override
        { return mContentName; }
        std::size_t GetInstanceCount() const override
        { return mLayout.vertex_struct_size ? mBuffer.buffer_bytes / mLayout.vertex_struct_size : 0; }

        inline void SetContentName(std::string name)
        { mContentName = std::move(name); }
        inline void SetBuffer(swarm::InstancedDrawBuffer&& buffer) noexcept
        { mPendingUpload = std::move(buffer); }
        inline void SetUsage(Usage usage) noexcept
        { mUsage = usage; }
        inline const swarm::InstanceDataLayout& GetVertexLayout() const noexcept
        { return mLayout; }
        inline const dev::GraphicsBuffer& GetVertexBuffer() const noexcept
        { return mBuffer; }
        inline bool IsEmpty() const noexcept
        { return mBuffer.buffer_bytes == 0; }

        void Upload() const;

    private:
        dev::GraphicsDevice* mDevice = nullptr;
        std::string mContentName;
        dev::BufferUsage mUsage = dev::BufferUsage::Dynamic;
        mutable std::optional<swarm::InstancedDrawBuffer> mPendingUpload;
        mutable swarm::InstanceDataLayout mLayout;
        mutable dev::GraphicsBuffer mBuffer;
    };

} // namespace
