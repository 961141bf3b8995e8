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

#include "config.h"

#include <sstream>
#include <unordered_set>

#include "base/assert.h"
#include "base/utility.h"
#include "base/format.h"
#include "swarm/shader_source.h"

namespace {
    // GLSL constants carry more precision than the default ToChars.
    constexpr unsigned ConstPrecision = 6;

    std::string ToConstValue(int value)
    {
        return base::ToChars(value);
    }
    std::string ToConstValue(float value)
    {
        return base::ToChars(value, ConstPrecision);
    }
    std::string ToConstValue(const glm::vec2& vec2)
    {
        return base::FormatString("vec2(%1,%2)",
                                  base::ToChars(vec2.x, ConstPrecision),
                                  base::ToChars(vec2.y, ConstPrecision));
    }
    std::string ToConstValue(const glm::vec3& vec3)
    {
        return base::FormatString("vec3(%1,%2,%3)",
                                  base::ToChars(vec3.x, ConstPrecision),
                                  base::ToChars(vec3.y, ConstPrecision),
                                  base::ToChars(vec3.z, ConstPrecision));
    }
    std::string ToConstValue(const glm::vec4& vec4)
    {
        return base::FormatString("vec4(%1,%2,%3,%4)",
                                  base::ToChars(vec4.x, ConstPrecision),
                                  base::ToChars(vec4.y, ConstPrecision),
                                  base::ToChars(vec4.z, ConstPrecision),
                                  base::ToChars(vec4.w, ConstPrecision));
    }

    // Words that cannot be used as identifiers in GLSL ES 3.00.
    // This covers the keywords and the type names a declaration
    // could plausibly collide with.
    const std::unordered_set<std::string>& GetReservedWords()
    {
        static const std::unordered_set<std::string> words = {
            "const", "uniform", "layout", "centroid", "flat", "smooth",
            "break", "continue", "do", "for", "while", "switch", "case", "default",
            "if", "else", "in", "out", "inout", "float", "int", "void", "bool",
            "true", "false", "invariant", "discard", "return",
            "mat2", "mat3", "mat4", "mat2x2", "mat2x3", "mat2x4", "mat3x2", "mat3x3",
            "mat3x4", "mat4x2", "mat4x3", "mat4x4",
            "vec2", "vec3", "vec4", "ivec2", "ivec3", "ivec4", "bvec2", "bvec3", "bvec4",
            "uint", "uvec2", "uvec3", "uvec4", "lowp", "mediump", "highp", "precision",
            "sampler2D", "sampler3D", "samplerCube", "sampler2DShadow", "samplerCubeShadow",
            "sampler2DArray", "sampler2DArrayShadow", "isampler2D", "isampler3D", "isamplerCube",
            "isampler2DArray", "usampler2D", "usampler3D", "usamplerCube", "usampler2DArray",
            "struct", "attribute", "varying", "main"
        };
        return words;
    }
} // namespace

namespace swarm
{

const ShaderSource::ShaderDataDeclaration* ShaderSource::FindDataDeclaration(const std::string& name) const
{
    for (const auto& pair : mShaderBlocks)
    {
        const auto& blocks = pair.second;
        for (const auto& block : blocks)
        {
            if (block.type != ShaderBlockType::ShaderDataDeclaration)
                continue;
            const auto& data = block.data_decl.value();
            if (data.name == name)
                return &data;
        }
    }
    return nullptr;
}

void ShaderSource::AddSource(std::string source)
{
    std::string line;
    std::stringstream ss(source);
    while (std::getline(ss, line))
    {
        ShaderBlock block;
        block.type = ShaderBlockType::ShaderCode;
        block.data = line;
        mShaderBlocks["code"].push_back(std::move(block));
    }
}

void ShaderSource::AddComment(std::string comment)
{
    ShaderBlock block;
    block.type = ShaderBlockType::Comment;
    block.data = "// " + comment;
    mShaderBlocks["code"].push_back(std::move(block));
}

void ShaderSource::AddPreprocessorDefinition(std::string name, int value)
{
    ShaderBlock block;
    block.type = ShaderBlockType::PreprocessorDefine;
    block.data = base::FormatString("#define %1 %2", name, ToConstValue(value));
    mShaderBlocks["preprocessor"].push_back(std::move(block));
}

void ShaderSource::AddAttribute(std::string name, AttributeType type)
{
    ASSERT(mType == Type::Vertex);

    ShaderDataDeclaration decl;
    decl.decl_type = ShaderDataDeclarationType::Attribute;
    decl.data_type = type;
    decl.name      = name;

    ShaderBlock block;
    block.type = ShaderBlockType::ShaderDataDeclaration;
    block.data = base::FormatString("in %1 %2;", DataTypeToString(type), name);
    block.data_decl = decl;
    mShaderBlocks["attributes"].push_back(std::move(block));
}
void ShaderSource::AddUniform(std::string name, UniformType type)
{
    ShaderDataDeclaration decl;
    decl.decl_type = ShaderDataDeclarationType::Uniform;
    decl.data_type = type;
    decl.name      = name;

    ShaderBlock block;
    block.type = ShaderBlockType::ShaderDataDeclaration;
    block.data = base::FormatString("uniform %1 %2;", DataTypeToString(type), name);
    block.data_decl = decl;
    mShaderBlocks["uniforms"].push_back(std::move(block));
}
void ShaderSource::AddConstant(std::string name, ShaderDataDeclarationValue value)
{
    const auto data_type = DataTypeFromValue(value);

    ShaderDataDeclaration decl;
    decl.decl_type = ShaderDataDeclarationType::Constant;
    decl.data_type = data_type;
    decl.name      = name;
    decl.constant_value = value;

    ShaderBlock block;
    block.type = ShaderBlockType::ShaderDataDeclaration;
    block.data = base::FormatString("const %1 %2 = %3;", DataTypeToString(data_type), name, ToConst(value));
    block.data_decl = decl;
    mShaderBlocks["constants"].push_back(std::move(block));
}
void ShaderSource::AddVarying(std::string name, VaryingType type)
{
    std::string code;
    if (mType == Type::Fragment)
        code = base::FormatString("in %1 %2;", DataTypeToString(type), name);
    else if (mType == Type::Vertex)
        code = base::FormatString("out %1 %2;", DataTypeToString(type), name);
    else BUG("Bug on varying formatting.");

    ShaderDataDeclaration decl;
    decl.decl_type = ShaderDataDeclarationType::Varying;
    decl.data_type = type;
    decl.name      = name;

    ShaderBlock block;
    block.type = ShaderBlockType::ShaderDataDeclaration;
    block.data = std::move(code);
    block.data_decl = decl;
    mShaderBlocks["varyings"].push_back(std::move(block));
}

void ShaderSource::AddOutput(std::string name, unsigned location)
{
    ASSERT(mType == Type::Fragment);

    ShaderDataDeclaration decl;
    decl.decl_type = ShaderDataDeclarationType::Output;
    decl.data_type = ShaderDataType::Vec4f;
    decl.name      = name;

    ShaderBlock block;
    block.type = ShaderBlockType::ShaderDataDeclaration;
    block.data = base::FormatString("layout(location=%1) out vec4 %2;", location, name);
    block.data_decl = decl;
    mShaderBlocks["out"].push_back(std::move(block));
}

bool ShaderSource::HasDataDeclaration(const std::string& name, ShaderDataDeclarationType type) const
{
    for (const auto& pair : mShaderBlocks)
    {
        const auto& blocks = pair.second;
        for (const auto& block : blocks)
        {
            if (block.type != ShaderBlockType::ShaderDataDeclaration)
                continue;

            const auto& decl = block.data_decl.value();
            if (decl.name == name && decl.decl_type == type)
                return true;
        }
    }
    return false;
}

std::string ShaderSource::GetSource() const
{
    std::stringstream ss;
    if (mVersion == Version::GLSL_300)
        ss << "#version 300 es";
    else if (mVersion != Version::NotSet)
        BUG("Missing GLSL version handling.");
    ss << "\n\n";

    if (mType == Type::Fragment)
    {
        if (mPrecision == Precision::Low)
            ss << "precision lowp float;";
        else if (mPrecision == Precision::Medium)
            ss << "precision mediump float;";
        else if (mPrecision == Precision::High)
            ss << "precision highp float;";
        else if (mPrecision != Precision::NotSet)
            BUG("Missing GLSL fragment shader floating point precision handling.");
        ss << "\n\n";
    }

    if (!mName.empty())
        ss << "// Name = " << mName << "\n";

    static const char* groups[] = {
        "preprocessor",
        "constants",
        "attributes",
        "uniforms",
        "varyings",
        "out",
        "code"
    };
    ss << GetGroupSource(groups, sizeof(groups) / sizeof(groups[0]));
    return ss.str();
}

std::string ShaderSource::GetDeclarationSource() const
{
    static const char* groups[] = {
        "preprocessor",
        "constants",
        "attributes",
        "uniforms",
        "varyings",
        "out"
    };
    return GetGroupSource(groups, sizeof(groups) / sizeof(groups[0]));
}

std::string ShaderSource::GetGroupSource(const char* const* groups, size_t count) const
{
    std::stringstream ss;
    for (size_t i=0; i<count; ++i)
    {
        const auto* blocks = base::SafeFind(mShaderBlocks, std::string(groups[i]));
        if (blocks == nullptr)
            continue;
        for (const auto& block : *blocks)
        {
            ss << block.data;
            ss << "\n";
        }
        ss << "\n";
    }
    return ss.str();
}

// static
std::string ShaderSource::DataTypeToString(ShaderDataType type)
{
    using T = ShaderDataType;

    if (type == T::Int)
        return "int";
    else if (type == T::Float)
        return "float";
    else if (type == T::Vec2f)
        return "vec2";
    else if (type == T::Vec3f)
        return "vec3";
    else if (type == T::Vec4f)
        return "vec4";
    else if (type == T::Vec2i)
        return "ivec2";
    else if (type == T::Mat2f)
        return "mat2";
    else if (type == T::Mat3f)
        return "mat3";
    else if (type == T::Mat4f)
        return "mat4";
    else if (type == T::Sampler2D)
        return "sampler2D";
    BUG("Bug on shader type string.");
    return "";
}

// static
ShaderSource::ShaderDataType ShaderSource::DataTypeFromValue(const ShaderDataDeclarationValue& value) noexcept
{
    if (std::holds_alternative<int>(value))
        return ShaderDataType::Int;
    else if (std::holds_alternative<float>(value))
        return ShaderDataType::Float;
    else if (std::holds_alternative<glm::vec2>(value))
        return ShaderDataType::Vec2f;
    else if (std::holds_alternative<glm::vec3>(value))
        return ShaderDataType::Vec3f;
    else if (std::holds_alternative<glm::vec4>(value))
        return ShaderDataType::Vec4f;

    BUG("Missing shader source type.");
    return ShaderDataType::Int;
}

// static
std::string ShaderSource::ToConst(const ShaderDataDeclarationValue& value)
{
    std::string ret;
    std::visit([&ret](const auto& the_value) {
        ret = ToConstValue(the_value);
    }, value);
    return ret;
}

// static
bool ShaderSource::IsValidIdentifier(const std::string& name)
{
    if (name.empty())
        return false;

    const auto is_alpha = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    };
    const auto is_digit = [](char c) {
        return c >= '0' && c <= '9';
    };
    if (!is_alpha(name[0]))
        return false;
    for (char c : name)
    {
        if (!is_alpha(c) && !is_digit(c))
            return false;
    }
    // gl_ prefix and double underscores are reserved for the implementation.
    if (base::StartsWith(name, "gl_"))
        return false;
    if (base::Contains(name, "__"))
        return false;
    if (GetReservedWords().count(name))
        return false;
    return true;
}

} // namespace
