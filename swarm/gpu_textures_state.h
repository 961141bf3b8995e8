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
#include <vector>
#include <map>
#include <unordered_map>

#include "swarm/device.h"
#include "swarm/program.h"
#include "swarm/geometry.h"
#include "swarm/uniform.h"

namespace swarm
{
    class Texture;
    class Framebuffer;

    // Simulation state that lives in textures on the GPU. The state is
    // a set of named channels with one RGBA8 texture per channel. The
    // state is updated by running pipelines which are full screen passes
    // that compute the new value of every texel of every channel.
    //
    // There are two texture sets. The current set holds the latest state
    // and a pipeline run writes into the other set after which the sets
    // swap roles. A pass never samples the textures it renders to.
    //
    // The pipeline code is the body of
    //   void runPipeline(const vec2 uv, const vec4 in_<channel>..., out vec4 out_<channel>...)
    // where the in_ parameters are only present when the pipeline
    // requires the previous state. The packing functions
    // pack2HalfToRGBA and unpackRGBATo2Half are available to the code.
    class GpuTexturesState
    {
    public:
        struct Pipeline {
            // When true the current state textures are sampled and passed
            // in as in_<channel> values.
            bool requires_previous_state = false;
            std::vector<UniformDeclaration> uniforms;
            std::string code;
        };
        struct Params {
            // Name used for naming the device resources. Must be unique
            // per device. When empty a unique name is generated.
            std::string name;
            unsigned width  = 0;
            unsigned height = 0;
            std::vector<std::string> channels;
            std::map<std::string, Pipeline> pipelines;
        };

        // Allocate the texture sets and build the pipeline programs.
        // Throws std::runtime_error if the parameters are not valid.
        GpuTexturesState(Device& device, Params params);
        GpuTexturesState(const GpuTexturesState&) = delete;
        ~GpuTexturesState();

        // Run the named pipeline and make its output the current state.
        // Throws std::runtime_error if there's no such pipeline.
        void RunPipeline(const std::string& name);

        // Get the current state texture of the named channel. Throws
        // std::runtime_error if there's no such channel.
        const Texture* GetCurrentTexture(const std::string& channel) const;

        // Set a value of a uniform declared by the named pipeline. Throws
        // std::runtime_error if there's no such pipeline or uniform or if
        // the value type doesn't match.
        void SetUniform(const std::string& pipeline, const std::string& name, UniformValue value);

        // Delete the device resources. Calling Dispose more than once
        // is fine. The object can no longer be used after this.
        void Dispose();

        inline unsigned GetCurrentIndex() const noexcept
        { return mCurrentIndex; }
        inline unsigned GetWidth() const noexcept
        { return mWidth; }
        inline unsigned GetHeight() const noexcept
        { return mHeight; }
        inline bool IsDisposed() const noexcept
        { return mDisposed; }
        inline std::string GetName() const
        { return mName; }
        // Get the ID of the program of the named pipeline.
        std::string GetProgramId(const std::string& pipeline) const;
        // Get the generated fragment shader source of the named pipeline.
        std::string GetFragmentSource(const std::string& pipeline) const;

        GpuTexturesState& operator=(const GpuTexturesState&) = delete;
    private:
        struct PipelineState {
            bool requires_previous_state = false;
            std::string program_id;
            std::string fragment_source;
            std::unordered_map<std::string, UniformType> uniform_types;
            ProgramState state;
            ProgramPtr program;
        };
        struct TextureSet {
            std::string name;
            std::vector<Texture*> textures;
            Framebuffer* framebuffer = nullptr;
        };
        void ValidateParams(const Params& params) const;
        std::string BuildFragmentSource(const Pipeline& pipeline) const;
        void CreateTextureSet(unsigned index);
        void CreatePipeline(const std::string& name, const Pipeline& pipeline);
        const PipelineState& GetPipeline(const std::string& name) const;
        void CheckNotDisposed() const;
    private:
        Device& mDevice;
        const std::string mName;
        const unsigned mWidth  = 0;
        const unsigned mHeight = 0;
        const std::vector<std::string> mChannels;
        std::unordered_map<std::string, PipelineState> mPipelines;
        TextureSet mSets[2];
        GeometryPtr mQuad;
        unsigned mCurrentIndex = 0;
        bool mDisposed = false;
    };

} // namespace
