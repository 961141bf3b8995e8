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
#  include <nlohmann/json_fwd.hpp>
#  include <glm/vec2.hpp>
#  include <glm/vec3.hpp>
#include "warnpop.h"

#include <string>
#include <vector>
#include <memory>
#include <optional>

#include "swarm/billboard_shader.h"
#include "swarm/gpu_textures_state.h"
#include "swarm/uniform.h"

namespace swarm
{
    class Device;
    class Texture;
    class Framebuffer;

    struct GpuInstancedBillboardParams {
        struct Rendering {
            BillboardShader::Material material = BillboardShader::Material::Basic;
            BillboardShader::Blending blending = BillboardShader::Blending::Normal;
            bool depth_write = true;
            bool transparent = false;
            // Additional uniforms available to the fragment code.
            std::vector<UniformDeclaration> uniforms;
            // getColor function body, see BillboardShader.
            std::string fragment_code;
        };
        struct Simulation {
            // Constant velocity of every particle in position box
            // units per second.
            glm::vec3 gravity = {0.0f, -1.0f, 0.0f};
            // Particle positions wrap around at these bounds. Each component
            // must be in the range (0, 1].
            glm::vec3 wrap_bound = {1.0f, 1.0f, 1.0f};
            // Seed for the initial random positions.
            unsigned seed = 0;
        };
        std::optional<glm::vec2> origin;
        std::optional<glm::vec3> lock_axis;
        unsigned max_instances_count = 0;
        // Scale from the unit position box to model space.
        glm::vec3 positions_range = {1.0f, 1.0f, 1.0f};
        Rendering rendering;
        Simulation simulation;

        void IntoJson(nlohmann::json& json) const;
        static std::optional<GpuInstancedBillboardParams> FromJson(const nlohmann::json& json);
    };

    // A population of billboards whose positions are simulated entirely
    // on the GPU. Every instance owns one texel of the position textures,
    // instance i owns the texel (i mod S, i div S) where S is the texture
    // size. The positions live in a unit box and are packed into two RGBA8
    // textures, xy in the first and z in the second.
    class GpuInstancedBillboard
    {
    public:
        using Params = GpuInstancedBillboardParams;

        // Throws std::runtime_error if the parameters are not valid
        // or if the instance count doesn't fit in the position textures.
        GpuInstancedBillboard(Device& device, Params params);
        GpuInstancedBillboard(const GpuInstancedBillboard&) = delete;
        ~GpuInstancedBillboard();

        // Set the number of instances to draw. Throws std::runtime_error
        // if the count exceeds the max instances count. Instances beyond
        // the count are still simulated.
        void SetInstancesCount(unsigned count);
        // Seed the positions from the noise textures.
        void InitializePositions();
        // Advance the simulation by delta time seconds. The movement is
        // an additional velocity shared by all the particles.
        void UpdatePositions(float delta_time, const glm::vec3& movement);
        // Draw the visible instances into the given framebuffer or to the
        // default framebuffer when fbo is nullptr. Does nothing when the
        // count is zero or after the object has been disposed.
        void Draw(Framebuffer* fbo = nullptr);
        // Delete the device resources. Calling Dispose more than once
        // is fine. The object can no longer be used after this.
        void Dispose();

        void SetPositionsRange(const glm::vec3& range);
        // Set the value of one of the rendering uniforms.
        void SetUniform(const std::string& name, UniformValue value);

        // Access the shader for setting the camera, the model transform
        // and the lighting.
        inline BillboardShader& GetShader() noexcept
        { return *mShader; }
        inline const BillboardShader& GetShader() const noexcept
        { return *mShader; }
        inline const GpuTexturesState& GetState() const noexcept
        { return *mState; }
        inline unsigned GetInstancesCount() const noexcept
        { return mInstancesCount; }
        inline unsigned GetMaxInstancesCount() const noexcept
        { return mMaxInstancesCount; }
        inline unsigned GetTextureSize() const noexcept
        { return mTextureSize; }
        inline bool IsDisposed() const noexcept
        { return mDisposed; }
        inline const Texture* GetNoiseTexture(unsigned index) const noexcept
        { return mNoise[index]; }

        // Smallest power of two that is >= x starting from 2. Throws
        // std::runtime_error if x is 0 or if the result would exceed 2^29.
        static unsigned NextPowerOfTwo(unsigned x);
        // Compute the size of the square position textures for the
        // given number of instances. Throws std::runtime_error with
        // "Too many particles" if the instances don't fit.
        static unsigned ComputeTextureSize(unsigned max_instances_count);
        // Texel owned by the instance with the given index.
        static glm::uvec2 ComputeTexelId(unsigned index, unsigned texture_size) noexcept;

        GpuInstancedBillboard& operator=(const GpuInstancedBillboard&) = delete;
    private:
        void CheckNotDisposed() const;
        void EnforceCurrentPositionTexture();
        Texture* CreateNoiseTexture(const std::string& name, unsigned seed);
    private:
        Device& mDevice;
        const std::string mName;
        const unsigned mMaxInstancesCount = 0;
        const unsigned mTextureSize = 0;
        unsigned mInstancesCount = 0;
        Texture* mNoise[2] = {nullptr, nullptr};
        std::unique_ptr<GpuTexturesState> mState;
        std::unique_ptr<BillboardShader> mShader;
        ProgramPtr mProgram;
        GeometryPtr mGeometry;
        bool mDisposed = false;
    };

} // namespace
