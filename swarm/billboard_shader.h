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
#  include <glm/vec2.hpp>
#  include <glm/vec3.hpp>
#  include <glm/vec4.hpp>
#  include <glm/mat4x4.hpp>
#include "warnpop.h"

#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

#include "swarm/device.h"
#include "swarm/program.h"
#include "swarm/geometry.h"
#include "swarm/uniform.h"

namespace swarm
{
    class Texture;

    // Composes a complete billboard rendering program out of a fixed
    // program skeleton, a set of declarations (uniforms, per instance
    // attributes and varyings) and two caller supplied code blocks.
    //
    // The vertex code block is the body of
    //   void getBillboard(out vec3 modelPosition, out mat2 localTransform, out <varying>...)
    // and computes the billboard anchor position in model space and the
    // local 2D transform (rotation and scale) of the quad. Varyings are
    // written through the parameters named after the varyings.
    //
    // The fragment code block is the body of
    //   vec4 getColor(const vec2 uv, const <varying>...)
    // and returns the color of the billboard surface at uv.
    //
    // The quad is turned towards the camera around the up vector which
    // is either the camera up vector or a fixed lock axis.
    class BillboardShader
    {
    public:
        enum class Material {
            // Unlit, the color is the color computed by getColor.
            Basic,
            // One directional light plus ambient light with specular highlights.
            Phong
        };
        enum class Blending {
            None, Normal, Additive
        };
        using UniformType  = swarm::UniformType;
        using UniformValue = swarm::UniformValue;
        using Uniform      = swarm::UniformDeclaration;

        enum class AttributeType {
            Float, Vec2, Vec3, Vec4, Mat2
        };
        enum class VaryingType {
            Float, Vec2, Vec3, Vec4
        };

        struct Attribute {
            std::string name;
            AttributeType type = AttributeType::Float;
        };
        struct Varying {
            std::string name;
            VaryingType type = VaryingType::Float;
        };

        struct Params {
            // The point on the quad (in quad units, the quad spans
            // [-0.5, 0.5] on both axis) that is placed at the model position.
            std::optional<glm::vec2> origin;
            // Fixed world up axis. When not set the camera up is used.
            std::optional<glm::vec3> lock_axis;
            Material material = Material::Basic;
            Blending blending = Blending::Normal;
            bool depth_write = true;
            bool transparent = false;
            std::vector<Uniform> uniforms;
            std::vector<Attribute> attributes;
            std::vector<Varying> varyings;
            // getBillboard function body.
            std::string billboard_code;
            // getColor function body.
            std::string color_code;
        };

        // Compose the program sources. Throws std::runtime_error if the
        // declarations or the material are not valid.
        explicit BillboardShader(Params params);

        // Get the ID of the program. The ID is computed from the content
        // so that equal configurations map to the same program.
        inline std::string GetProgramId() const
        { return mProgramId; }
        inline std::string GetVertexSource() const
        { return mVertexSource; }
        inline std::string GetFragmentSource() const
        { return mFragmentSource; }
        inline const ProgramState& GetProgramState() const noexcept
        { return mState; }
        inline const Params& GetParams() const noexcept
        { return mParams; }

        // Find or create the program on the device.
        ProgramPtr GetProgram(Device& device) const;
        // Delete the program and its shaders from the device.
        void DeleteProgram(Device& device) const;
        // Find or create the billboard quad geometry on the device.
        GeometryPtr GetGeometry(Device& device) const;
        // Get the device raster state matching the blending and
        // depth options.
        Device::RasterState GetRasterState() const;

        // Set the value of a declared uniform. Throws std::runtime_error
        // if no such uniform is declared or if the value type doesn't
        // match the declared type.
        void SetUniform(const std::string& name, UniformValue value);

        void SetCamera(const glm::mat4& view, const glm::mat4& projection, const glm::vec3& camera_position);
        void SetModelMatrix(const glm::mat4& model);

        // Phong lighting parameters. The light direction is the world
        // space direction towards which the light travels.
        void SetLightDirection(const glm::vec3& direction);
        void SetLightColor(const glm::vec3& color);
        void SetAmbientColor(const glm::vec3& color);
        void SetShininess(float shininess);

        // Map a material name to a material. Throws std::runtime_error
        // on an unsupported material.
        static Material ParseMaterial(const std::string& name);

        static std::string AttributeTypeToString(AttributeType type);
        static std::string VaryingTypeToString(VaryingType type);
        // Number of float components in an attribute of the given type.
        static unsigned GetAttributeSize(AttributeType type) noexcept;

    private:
        void ValidateDeclarations() const;
        void ComposeVertexSource();
        void ComposeFragmentSource();
        void ComputeProgramId();
    private:
        const Params mParams;
        std::string mVertexSource;
        std::string mFragmentSource;
        std::string mProgramId;
        std::unordered_map<std::string, UniformType> mUniformTypes;
        ProgramState mState;
    };

} // namespace
