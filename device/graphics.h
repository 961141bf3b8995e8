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

#include "warnpush.h"
#  include <glm/vec4.hpp>
#include "warnpop.h"

#include <string>
#include <vector>

#include "device/handle.h"
#include "device/enum.h"
#include "device/types.h"

namespace dev
{
    using GraphicsShader  = detail::ResourceHandle<ResourceType::GraphicsShader>;
    using GraphicsProgram = detail::ResourceHandle<ResourceType::GraphicsProgram>;
    using GraphicsBuffer  = detail::ResourceHandle<ResourceType::GraphicsBuffer>;
    using TextureObject   = detail::ResourceHandle<ResourceType::Texture>;
    using Framebuffer     = detail::ResourceHandle<ResourceType::FrameBuffer>;

    struct VertexLayout;

    // Low level graphics device abstraction over the OpenGL ES3 API.
    // The device deals only in raw resource handles and leaves the
    // ownership and the naming of the resources to the caller.
    class GraphicsDevice
    {
    public:
        virtual Framebuffer GetDefaultFramebuffer() const = 0;
        virtual Framebuffer CreateFramebuffer(const FramebufferConfig& config) = 0;
        virtual void BindRenderTargetTexture2D(const Framebuffer& framebuffer, const TextureObject& texture,
                                               unsigned color_attachment) = 0;
        // Complete the framebuffer with the given color attachments as draw buffers.
        // Returns false if the framebuffer is not complete.
        virtual bool CompleteFramebuffer(const Framebuffer& framebuffer,
                                         const std::vector<unsigned>& color_attachments) = 0;
        virtual void BindFramebuffer(const Framebuffer& framebuffer) const = 0;
        virtual void DeleteFramebuffer(const Framebuffer& fbo) = 0;

        virtual GraphicsShader CompileShader(const std::string& source, ShaderType type, std::string* compile_info) = 0;
        virtual GraphicsProgram BuildProgram(const std::vector<GraphicsShader>& shaders, std::string* build_info) = 0;

        virtual TextureObject AllocateTexture2D(unsigned texture_width,
                                                unsigned texture_height, TextureFormat format) = 0;
        virtual TextureObject UploadTexture2D(const void* bytes,
                                              unsigned texture_width,
                                              unsigned texture_height, TextureFormat format) = 0;

        // Bind the texture to the texture unit and the unit to the program's sampler.
        // Returns false if the unit is not available. A sampler that the program
        // doesn't use (i.e. optimized away) is not an error.
        virtual bool BindTexture2D(const TextureObject& texture, const GraphicsProgram& program, const std::string& sampler_name,
                                   unsigned texture_unit, TextureWrapping texture_x_wrap, TextureWrapping texture_y_wrap,
                                   TextureMinFilter texture_min_filter, TextureMagFilter texture_mag_filter) const = 0;

        virtual void DeleteTexture(const TextureObject& texture) = 0;

        virtual GraphicsBuffer AllocateBuffer(size_t bytes, BufferUsage usage, BufferType type) = 0;
        virtual void FreeBuffer(const GraphicsBuffer& buffer) = 0;
        virtual void UploadBuffer(const GraphicsBuffer& buffer, const void* data, size_t bytes) = 0;

        virtual void BindVertexBuffer(const GraphicsBuffer& buffer, const GraphicsProgram& program, const VertexLayout& layout) const = 0;

        virtual void SetPipelineState(const GraphicsPipelineState& state) const = 0;
        virtual void SetViewportState(const ViewportState& state) const = 0;
        virtual ViewportState GetViewportState() const = 0;
        virtual void SetProgramState(const GraphicsProgram& program, const ProgramState& state) const = 0;

        virtual void DeleteShader(const GraphicsShader& shader) = 0;
        virtual void DeleteProgram(const GraphicsProgram& program) = 0;

        // Draw with the currently bound vertex buffers. The instanced
        // draw sources the attributes with divisor 1 per instance.
        virtual void Draw(DrawType draw_primitive, unsigned vertex_start_index,
                          unsigned vertex_draw_count, unsigned instance_count) const = 0;
        virtual void Draw(DrawType draw_primitive, unsigned vertex_start_index, unsigned vertex_draw_count) const = 0;

        // Clear the color and the depth of the default framebuffer.
        virtual void ClearColorDepth(const glm::vec4& color, float depth) const = 0;

        virtual void ReadColor(unsigned width, unsigned height, const Framebuffer& fbo,
                               ColorAttachment attachment, void* color_data) const = 0;

        virtual void GetDeviceCaps(GraphicsDeviceCaps* caps) const = 0;

        virtual void BeginFrame()  = 0;
        virtual void EndFrame(bool display) = 0;

    protected:
        virtual ~GraphicsDevice() = default;
    };

} // namespace
