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

#include <vector>

#include "device/enum.h"
#include "device/uniform.h"

namespace dev
{
    struct ViewportState {
        // the device viewport into the render target in device coordinates
        // (pixels, texels). the origin is at the bottom left and the Y axis
        // grows upwards.
        int x = 0;
        int y = 0;
        int width  = 0;
        int height = 0;
    };

    struct ProgramState {
        std::vector<const Uniform*> uniforms;
    };

    // Device state including the rasterizer state
    // that is to be applied for any draw operation.
    struct GraphicsPipelineState {
        using DepthTest   = dev::DepthTest;
        using Culling     = dev::Culling;
        using BlendOp     = dev::BlendOp;

        DepthTest depth_test = DepthTest::Disabled;
        // write the depth buffer when the depth test passes.
        bool bWriteDepth = true;

        // polygon face culling setting.
        Culling culling = Culling::Back;

        BlendOp blending = BlendOp::None;
    };

    struct GraphicsDeviceCaps {
        unsigned num_texture_units = 0;
        unsigned num_color_attachments = 0;
        unsigned max_fbo_width = 0;
        unsigned max_fbo_height = 0;
        bool instanced_rendering = false;
        bool multiple_color_attachments = false;
    };

} // dev
