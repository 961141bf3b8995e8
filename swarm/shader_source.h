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
#include "warnpop.h"

#include <variant>
#include <vector>
#include <string>
#include <optional>
#include <unordered_map>

namespace swarm
{
    // Builder for GLSL ES 3.00 shader source. The source is collected
    // as blocks in declaration groups (constants, attributes, uniforms,
    // varyings, outputs, code) and combined in a fixed group order.
    class ShaderSource
    {
    public:
        enum class ShaderDataType {
            Int,
            Float,
            Vec2f, Vec3f, Vec4f,
            Vec2i,
            Mat2f, Mat3f, Mat4f,
            Sampler2D
        };
        using AttributeType = ShaderDataType;
        using UniformType   = ShaderDataType;
        using VaryingType   = ShaderDataType;

        enum class ShaderBlockType {
            // Attribute, Uniform, Varying, Constant, Output
            ShaderDataDeclaration,
            // #define NAME value
            PreprocessorDefine,
            // this is a comment
            Comment,
            ShaderCode
        };

        using ShaderDataDeclarationValue = std::variant<int, float, glm::vec2, glm::vec3, glm::vec4>;

        enum class Type {
            NotSet, Vertex, Fragment
        };
        enum class Version {
            NotSet, GLSL_300
        };
        enum class Precision {
            NotSet, Low, Medium, High
        };

        enum class ShaderDataDeclarationType {
            Attribute, Uniform, Varying, Constant, Output
        };

        struct ShaderDataDeclaration {
            // attribute, uniform, constant etc.
            ShaderDataDeclarationType decl_type;
            // int, float, vec2, etc.
            ShaderDataType data_type;
            // name of the data variable.
            std::string name;
            // constant value (if any), only used when the decl_type is Constant
            std::optional<ShaderDataDeclarationValue> constant_value;
        };

        struct ShaderBlock {
            ShaderBlockType type;
            std::string data;
            std::optional<ShaderDataDeclaration> data_decl;
        };

        ShaderSource() = default;
        ShaderSource(Type type, Version version, Precision precision = Precision::NotSet) noexcept
          : mType(type)
          , mVersion(version)
          , mPrecision(precision)
        {}

        inline void SetType(Type type) noexcept
        { mType = type; }
        inline void SetPrecision(Precision precision) noexcept
        { mPrecision = precision; }
        inline void SetVersion(Version version) noexcept
        { mVersion = version; }
        inline bool IsEmpty() const noexcept
        { return mShaderBlocks.empty(); }
        inline void Clear() noexcept
        { mShaderBlocks.clear(); }
        inline Type GetType() const noexcept
        { return mType; }
        inline Precision GetPrecision() const noexcept
        { return mPrecision; }
        inline Version GetVersion() const noexcept
        { return mVersion; }

        inline void AddShaderName(std::string name) noexcept
        { mName = std::move(name); }
        inline std::string GetShaderName() const
        { return mName; }

        const ShaderDataDeclaration* FindDataDeclaration(const std::string& name) const;

        void AddSource(std::string source);
        void AddComment(std::string comment);
        void AddPreprocessorDefinition(std::string name, int value);
        void AddAttribute(std::string name, AttributeType type);
        void AddUniform(std::string name, UniformType type);
        void AddConstant(std::string name, ShaderDataDeclarationValue value);
        void AddVarying(std::string name, VaryingType type);
        // Add a fragment shader output bound to a color attachment location.
        void AddOutput(std::string name, unsigned location);

        bool HasDataDeclaration(const std::string& name, ShaderDataDeclarationType type) const;

        inline bool HasUniform(const std::string& name) const
        { return HasDataDeclaration(name, ShaderDataDeclarationType::Uniform); }
        inline bool HasVarying(const std::string& name) const
        { return HasDataDeclaration(name, ShaderDataDeclarationType::Varying); }

        // Get the actual shader source string by combining the
        // version and precision header with the declarations
        // and the source code snippets.
        std::string GetSource() const;

        // Get only the declarations (preprocessor, constants, attributes,
        // uniforms, varyings and outputs) without the header and the code.
        std::string GetDeclarationSource() const;

        static std::string DataTypeToString(ShaderDataType type);
        static ShaderDataType DataTypeFromValue(const ShaderDataDeclarationValue& value) noexcept;
        static std::string ToConst(const ShaderDataDeclarationValue& value);

        // Check whether the name is usable as a GLSL identifier, i.e. starts
        // with a letter or an underscore, continues with letters, digits or
        // underscores, isn't a reserved word and isn't in the reserved
        // gl_ namespace.
        static bool IsValidIdentifier(const std::string& name);

    private:
        std::string GetGroupSource(const char* const* groups, size_t count) const;
    private:
        Type mType = Type::NotSet;
        Version mVersion = Version::NotSet;
        Precision mPrecision = Precision::NotSet;
        std::string mName;

        std::unordered_map<std::string,
           std::vector<ShaderBlock>> mShaderBlocks;
    };
} // namespace
