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

#include <cstdint>
#include <cstddef>

namespace dev
{
    enum class ResourceType {
        GraphicsProgram,
        GraphicsShader,
        GraphicsBuffer,
        FrameBuffer,
        Texture,
    };

    enum class ShaderType {
        Invalid, VertexShader, FragmentShader
    };

    enum class BufferType {
        Invalid,
        VertexBuffer
    };

    // Every swarm geometry is a triangle list, each 3
    // vertices make a single triangle.
    enum class DrawType : uint32_t {
        Triangles
    };

    // Specify common usage hint for a GPU buffer.
    enum class BufferUsage {
        // The buffer is updated once and used multiple times.
        Static,
        // The buffer is updated multiple times and used once/few times.
        Stream,
        // The buffer is updated multiple times and used multiple times.
        Dynamic
    };

    // 8bit linear RGBA data is the storage format of every
    // simulation state texture and every noise texture.
    enum class TextureFormat {
        RGBA
    };

    // Texture minifying filter is used whenever the
    // pixel being textured maps to an area greater than
    // one texture element.
    enum class TextureMinFilter {
        // Use the texture element nearest to the
        // center of the pixel (Manhattan distance)
        Nearest,
        // Use the weighted average of the four texture
        // elements that are closest to the pixel.
        Linear,
        // Use the default filtering set for the device.
        Default
    };

    // Texture magnifying filter is used whenever the
    // pixel being textured maps to an area less than
    // one texture element.
    enum class TextureMagFilter {
        Nearest,
        Linear,
        Default
    };

    // Texture wrapping options for how to deal with
    // texture coordinates outside of [0,1] range,
    enum class TextureWrapping {
        // Clamp the texture coordinate to the boundary.
        Clamp,
        // Wrap the coordinate by ignoring the integer part.
        Repeat
    };

    // Which polygon faces to cull. The front faces are
    // always the counter clockwise ones.
    enum class Culling {
        // Both polygon front and back faces are rasterized.
        None,
        Back
    };

    // How to mix the fragment with the existing color buffer value.
    enum class BlendOp {
        // Overwrite the color buffer.
        None,
        // src * alpha + dst * (1 - alpha)
        Transparent,
        // src * alpha + dst
        Additive
    };

    enum class DepthTest {
        // Depth testing is disabled, depth buffer is also not updated.
        Disabled,
        // Depth test passes and color buffer is updated when the fragments
        // depth value is less or equal to previously written depth value.
        LessOrEQual
    };

    enum class FramebufferFormat {
        Invalid,
        // RGBA color texture buffer(s) with 8bits (unsigned) per channel.
        // The simulation state framebuffers have no depth buffer.
        ColorRGBA8
    };

    // OpenGL ES 3 guarantees at least 4 color attachments.
    enum class ColorAttachment : uint8_t {
        Attachment0,
        Attachment1,
        Attachment2,
        Attachment3
    };

    constexpr unsigned MaxColorAttachments = SWARM_MAX_COLOR_ATTACHMENTS;

    // Framebuffer configuration.
    struct FramebufferConfig {
        FramebufferFormat format = FramebufferFormat::ColorRGBA8;
        // The width of the fbo in pixels.
        unsigned width = 0;
        // The height of the fbo in pixels.
        unsigned height = 0;
    };

} // namespace
