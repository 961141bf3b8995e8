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

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <memory>
#include <vector>
#include <optional>

#include "base/assert.h"
#include "device/enum.h"
#include "device/vertex.h"

namespace swarm
{
    class InstancedDraw;

    using VertexLayout = dev::VertexLayout;

    // Geometry buffer contains the geometry data for producing
    // geometries on the GPU. This includes the vertex data and
    // vertex layout and a list of draw commands that refer to the
    // data and describe how it is supposed to be drawn. I.e. what
    // kind of draw primitives which offset and how many vertices
    // are to be drawn.
    class GeometryBuffer
    {
    public:
        using DrawType = dev::DrawType;
        using Usage    = dev::BufferUsage;

        struct DrawCommand {
            DrawType type = DrawType::Triangles;
            uint32_t count  = 0;
            uint32_t offset = 0;
        };

        void UploadVertices(const void* data, size_t bytes)
        {
            ASSERT((data && bytes) || (!data && !bytes));
            mVertexData.resize(bytes);
            if (data)
                std::memcpy(&mVertexData[0], data, bytes);
        }
        void SetVertexLayout(const VertexLayout& layout)
        { mVertexLayout = layout; }

        template<typename Vertex>
        void SetVertexBuffer(const std::vector<Vertex>& vertices)
        { UploadVertices(vertices.data(), vertices.size() * sizeof(Vertex)); }

        void ClearDraws() noexcept
        { mDrawCmds.clear(); }
        void AddDrawCmd(const DrawCommand& cmd)
        { mDrawCmds.push_back(cmd); }

        // Add a draw command that starts at offset 0 and covers the whole
        // current vertex buffer (i.e. count = num of vertices)
        void AddDrawCmd(DrawType type)
        {
            DrawCommand cmd;
            cmd.type   = type;
            cmd.offset = 0;
            cmd.count  = std::numeric_limits<uint32_t>::max();
            AddDrawCmd(cmd);
        }

        auto GetNumDrawCmds() const noexcept
        { return mDrawCmds.size(); }
        auto GetVertexBytes() const noexcept
        { return mVertexData.size(); }
        const void* GetVertexDataPtr() const noexcept
        { return mVertexData.empty() ? nullptr : &mVertexData[0]; }
        const auto& GetLayout() const noexcept
        { return mVertexLayout; }
        const auto& GetDrawCmd(size_t index) const
        { return mDrawCmds[index]; }
        const auto& GetDrawCommands() const noexcept
        { return mDrawCmds; }
        bool HasVertexData() const noexcept
        { return !mVertexData.empty(); }

        auto GetVertexCount() const noexcept
        {
            ASSERT(mVertexLayout.vertex_struct_size);
            return mVertexData.size() / mVertexLayout.vertex_struct_size;
        }

        size_t GetHash() const noexcept;

    private:
        VertexLayout mVertexLayout;
        std::vector<DrawCommand> mDrawCmds;
        std::vector<uint8_t> mVertexData;
    };

    // Encapsulate information about a particular geometry and how
    // that geometry is to be rendered and rasterized. A geometry
    // object contains a set of vertex data and then multiple draw
    // commands each command addressing some subset of the vertices.
    class Geometry
    {
    public:
        using Usage       = GeometryBuffer::Usage;
        using DrawType    = GeometryBuffer::DrawType;
        using DrawCommand = GeometryBuffer::DrawCommand;

        struct CreateArgs {
            // This is the geometry data buffer with vertex data
            // and the draw commands.
            GeometryBuffer buffer;
            // Set the expected usage of the geometry.
            Usage usage = Usage::Static;
            // Set the (human-readable) name of the geometry.
            // This has debug significance only.
            std::string content_name;
            // Set the hash value based on the buffer contents.
            std::size_t content_hash = 0;
        };

        virtual ~Geometry() = default;

        // Get the human-readable geometry name.
        virtual std::string GetName() const = 0;
        // Get the current usage set on the geometry.
        virtual Usage GetUsage() const = 0;
        // Get the hash value computed from the geometry buffer.
        virtual std::size_t GetContentHash() const  = 0;
        // Get the number of draw commands set on the geometry.
        virtual std::size_t GetNumDrawCmds() const = 0;
        // Get the draw command at the specified index.
        virtual DrawCommand GetDrawCmd(size_t index) const = 0;
    private:
    };

    using GeometryPtr = std::shared_ptr<const Geometry>;

    // Describe a draw of some geometry with optional instancing.
    // Instancing is on when per-instance vertex buffers are attached
    // or when an explicit instance count is set. The latter draws
    // the geometry N times with only gl_InstanceID telling the
    // instances apart.
    class GeometryDrawCommand
    {
    public:
        using DrawCommand = Geometry::DrawCommand;

        explicit GeometryDrawCommand(const Geometry& geometry) noexcept
          : mGeometry(&geometry)
        {}

        inline void AddInstanceBuffer(const InstancedDraw& instance)
        { mInstances.push_back(&instance); }
        inline void SetInstanceCount(unsigned count) noexcept
        { mInstanceCount = count; }

        inline size_t GetNumDrawCmds() const noexcept
        { return mGeometry->GetNumDrawCmds(); }
        inline DrawCommand GetDrawCmd(size_t index) const noexcept
        { return mGeometry->GetDrawCmd(index); }
        inline const Geometry* GetGeometry() const noexcept
        { return mGeometry; }
        inline size_t GetNumInstanceBuffers() const noexcept
        { return mInstances.size(); }
        inline const InstancedDraw* GetInstanceBuffer(size_t index) const noexcept
        { return mInstances[index]; }
        inline bool IsInstanced() const noexcept
        { return !mInstances.empty() || mInstanceCount.has_value(); }
        inline std::optional<unsigned> GetInstanceCount() const noexcept
        { return mInstanceCount; }

    private:
        const Geometry* mGeometry = nullptr;
        std::vector<const InstancedDraw*> mInstances;
        std::optional<unsigned> mInstanceCount;
    };

} // namespace
