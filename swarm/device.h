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

#include <memory>
#include <cstdint>
#include <string>
#include <vector>

#include "device/types.h"
#include "device/graphics.h"
#include "swarm/shader.h"
#include "swarm/program.h"
#include "swarm/geometry.h"
#include "swarm/instance.h"
#include "swarm/framebuffer.h"

namespace swarm
{
    class Shader;
    class Program;
    class Geometry;
    class GeometryDrawCommand;
    class Texture;
    class Framebuffer;

    // High level graphics device that owns the GPU resources by name
    // and submits draws. The device is the only way to create the
    // resource objects and every object it hands out stays valid until
    // deleted through the device or until the device is destroyed.
    class Device
    {
    public:
        using RasterState   = dev::GraphicsPipelineState;
        using DeviceCaps    = dev::GraphicsDeviceCaps;
        using DepthTest     = dev::DepthTest;
        using BlendOp       = dev::BlendOp;
        using Culling       = dev::Culling;
        using MinFilter     = dev::TextureMinFilter;
        using MagFilter     = dev::TextureMagFilter;

        using ColorAttachment = swarm::Framebuffer::ColorAttachment;

        // Pixel data read back from a color buffer. The rows are in
        // the order OpenGL stores them, i.e. row 0 is the row with
        // texel y = 0.
        struct ColorBuffer {
            unsigned width  = 0;
            unsigned height = 0;
            // RGBA8 pixel data, 4 bytes per pixel.
            std::vector<std::uint8_t> pixels;
        };

        virtual ~Device() = default;

        // Clear the default framebuffer's color and depth before
        // drawing depth tested billboards into it.
        virtual void ClearColorDepth(const glm::vec4& color, float depth = 1.0f) const = 0;

        // resource creation APIs
        virtual ShaderPtr FindShader(const std::string& id) = 0;
        virtual ShaderPtr CreateShader(const std::string& id, const Shader::CreateArgs& args) = 0;
        virtual ProgramPtr FindProgram(const std::string& id) = 0;
        virtual ProgramPtr CreateProgram(const std::string& id, const Program::CreateArgs& args) = 0;
        virtual GeometryPtr FindGeometry(const std::string& id) = 0;
        virtual GeometryPtr CreateGeometry(const std::string& id, Geometry::CreateArgs args) = 0;
        virtual InstancedDrawPtr FindInstancedDraw(const std::string& id) = 0;
        virtual InstancedDrawPtr CreateInstancedDraw(const std::string& id, InstancedDraw::CreateArgs args) = 0;
        virtual Texture* FindTexture(const std::string& name) = 0;
        virtual Texture* MakeTexture(const std::string& name) = 0;
        virtual Framebuffer* FindFramebuffer(const std::string& name) = 0;
        virtual Framebuffer* MakeFramebuffer(const std::string& name) = 0;
        // Resource deletion APIs
        virtual void DeleteShader(const std::string& id) = 0;
        virtual void DeleteProgram(const std::string& id) = 0;
        virtual void DeleteGeometry(const std::string& id) = 0;
        virtual void DeleteInstancedDraw(const std::string& id) = 0;
        virtual void DeleteTexture(const std::string& id) = 0;
        virtual void DeleteFramebuffer(const std::string& id) = 0;

        // Draw the given geometry using the given program with the specified
        // state applied. When the framebuffer is nullptr the draw goes into
        // the default framebuffer.
        virtual void Draw(const Program& program, const ProgramState& program_state,
                          const GeometryDrawCommand& geometry, const RasterState& state, Framebuffer* fbo = nullptr) = 0;

        // Prepare the device for the next frame.
        virtual void BeginFrame() = 0;
        // End rendering a frame. If display is true then this will call
        // Context::Display as well as a convenience.
        virtual void EndFrame(bool display = true) = 0;

        // Read the contents of a color buffer of the given framebuffer
        // or the default framebuffer when fbo is nullptr.
        // Width and height specify the dimensions of the data to read.
        virtual ColorBuffer ReadColorBuffer(unsigned width, unsigned height, Framebuffer* fbo = nullptr,
                                            ColorAttachment attachment = ColorAttachment::Attachment0) const = 0;

        virtual void GetDeviceCaps(DeviceCaps* caps) const = 0;
    private:
    };

    std::shared_ptr<Device> CreateDevice(std::shared_ptr<dev::GraphicsDevice> device);
    std::shared_ptr<Device> CreateDevice(dev::GraphicsDevice* device);

} // namespace
