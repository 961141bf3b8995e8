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

#include <cstring> // for memcpy
#include <cstdint>
#include <vector>
#include <string>
#include <memory>

#include "base/assert.h"
#include "device/enum.h"
#include "device/vertex.h"

namespace swarm
{
    using InstanceDataLayout = dev::VertexLayout;

    // A CPU buffer for per instance vertex data. Every instance
    // has one struct laid out according to the InstanceDataLayout.
    class InstancedDrawBuffer
    {
    public:
        // Define how the contents of the instance buffer are used
        using Usage = dev::BufferUsage;

        void Resize(size_t count)
        {
            ASSERT(mLayout.vertex_struct_size);
            const auto bytes = count * mLayout.vertex_struct_size;
            mVertexData.resize(bytes);
        }

        void SetInstanceBuffer(const void* ptr, size_t bytes)
        {
            ASSERT(ptr && bytes);
            mVertexData.resize(bytes);
            std::memcpy(&mVertexData[0], ptr, bytes);
        }

        template<typename InstanceAttr>
        inline void SetInstanceBuffer(const std::vector<InstanceAttr>& data)
        { SetInstanceBuffer(data.data(), data.size() * sizeof(InstanceAttr)); }

        inline void SetInstanceBuffer(std::vector<uint8_t>&& buffer) noexcept
        { mVertexData = std::move(buffer); }
        inline void SetInstanceDataLayout(const InstanceDataLayout& layout)
        { mLayout = layout; }

        inline bool IsValid() const noexcept
        {
            if (mLayout.vertex_struct_size == 0)
                return false;
            if (mVertexData.empty())
                return false;
            if (mVertexData.size() % mLayout.vertex_struct_size)
                return false;
            return true;
        }
        inline bool IsEmpty() const noexcept
        {  return mVertexData.empty(); }
        inline size_t GetInstanceCount() const noexcept
        {
            ASSERT(mLayout.vertex_struct_size);
            return mVertexData.size() / mLayout.vertex_struct_size;
        }
        inline size_t GetInstanceDataSize() const noexcept
        { return mVertexData.size(); }
        inline const void* GetVertexDataPtr() const noexcept
        { return mVertexData.data(); }
        inline const auto& GetInstanceDataLayout() const noexcept
        { return mLayout; }
    private:
        InstanceDataLayout mLayout;
        std::vector<uint8_t> mVertexData;
    };

    // Per geometry instance vertex data.
    class InstancedDraw
    {
    public:
        using Usage = InstancedDrawBuffer::Usage;
        struct CreateArgs {
            InstancedDrawBuffer buffer;
            // The expected usage of the geometry instance data.
            Usage usage = Usage::Dynamic;
            // Set the (human-readable) name of the instance geometry.
            // This has debug significance only.
            std::string content_name;
        };
        virtual ~InstancedDraw() = default;

        // Get the human-readable name.
        virtual std::string GetContentName() const = 0;
        // Get the number of instances in the buffer.
        virtual std::size_t GetInstanceCount() const = 0;
    private:
    };

    using InstancedDrawPtr = std::shared_ptr<const InstancedDraw>;

} // namespace
