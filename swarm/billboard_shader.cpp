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

#include "warnpush.h"
#  include <glm/geometric.hpp>
#  include <magic_enum.hpp>
#include "warnpop.h"

#include <stdexcept>
#include <unordered_set>

#include "base/assert.h"
#include "base/format.h"
#include "base/hash.h"
#include "base/logging.h"
#include "base/utility.h"
#include "swarm/billboard_shader.h"
#include "swarm/shader_anchor.h"
#include "swarm/shader_source.h"
#include "swarm/packing.h"
#include "swarm/texture.h"

namespace {

// Names used by the program skeleton. Caller declarations may not
// use these.
const std::unordered_set<std::string>& GetSkeletonNames()
{
    static const std::unordered_set<std::string> names = {
        "modelMatrix", "viewMatrix", "projectionMatrix", "cameraPosition",
        "lightDirection", "lightColor", "ambientColor", "shininess", "specularColor",
        "position", "normal", "uv", "vUv", "vViewNormal", "vViewPosition",
        "modelPosition", "localTransform", "up", "right", "lookVector", "origin2d",
        "billboardOriginWorld", "localPosition2d", "transformed", "viewPosition",
        "diffuseColor", "fragOutColor", "getBillboard", "getColor",
        "pack2HalfToRGBA", "unpackRGBATo2Half"
    };
    return names;
}

swarm::ShaderSource::ShaderDataType MapType(swarm::BillboardShader::UniformType type)
{
    using T = swarm::BillboardShader::UniformType;
    using D = swarm::ShaderSource::ShaderDataType;
    if (type == T::Sampler2D) return D::Sampler2D;
    else if (type == T::Float) return D::Float;
    else if (type == T::Vec2) return D::Vec2f;
    else if (type == T::Vec3) return D::Vec3f;
    else if (type == T::Vec4) return D::Vec4f;
    else if (type == T::Mat4) return D::Mat4f;
    BUG("Unhandled uniform type.");
    return D::Float;
}
swarm::ShaderSource::ShaderDataType MapType(swarm::BillboardShader::AttributeType type)
{
    using T = swarm::BillboardShader::AttributeType;
    using D = swarm::ShaderSource::ShaderDataType;
    if (type == T::Float) return D::Float;
    else if (type == T::Vec2) return D::Vec2f;
    else if (type == T::Vec3) return D::Vec3f;
    else if (type == T::Vec4) return D::Vec4f;
    else if (type == T::Mat2) return D::Mat2f;
    BUG("Unhandled attribute type.");
    return D::Float;
}
swarm::ShaderSource::ShaderDataType MapType(swarm::BillboardShader::VaryingType type)
{
    using T = swarm::BillboardShader::VaryingType;
    using D = swarm::ShaderSource::ShaderDataType;
    if (type == T::Float) return D::Float;
    else if (type == T::Vec2) return D::Vec2f;
    else if (type == T::Vec3) return D::Vec3f;
    else if (type == T::Vec4) return D::Vec4f;
    BUG("Unhandled varying type.");
    return D::Float;
}

struct QuadVertex {
    glm::vec3 position;
    glm::vec3 normal;
    glm::vec2 uv;
};

} // namespace

namespace swarm
{

BillboardShader::BillboardShader(Params params)
  : mParams(std::move(params))
{
    ValidateDeclarations();
    ComposeVertexSource();
    ComposeFragmentSource();
    ComputeProgramId();

    for (const auto& uniform : mParams.uniforms)
    {
        mUniformTypes[uniform.name] = uniform.type;
        ApplyUniformValue(mState, uniform.name, uniform.value);
    }

    mState.SetUniform("modelMatrix", glm::mat4(1.0f));
    mState.SetUniform("viewMatrix", glm::mat4(1.0f));
    mState.SetUniform("projectionMatrix", glm::mat4(1.0f));
    mState.SetUniform("cameraPosition", glm::vec3(0.0f, 0.0f, 1.0f));
    if (mParams.material == Material::Phong)
    {
        mState.SetUniform("lightDirection", glm::normalize(glm::vec3(-1.0f, -1.0f, -1.0f)));
        mState.SetUniform("lightColor", glm::vec3(1.0f));
        mState.SetUniform("ambientColor", glm::vec3(0.3f));
        mState.SetUniform("shininess", 30.0f);
    }
    DEBUG("Composed billboard program. [id='%1', material=%2, uniforms=%3, attributes=%4, varyings=%5]",
          mProgramId, mParams.material, mParams.uniforms.size(), mParams.attributes.size(),
          mParams.varyings.size());
}

ProgramPtr BillboardShader::GetProgram(Device& device) const
{
    if (auto program = device.FindProgram(mProgramId))
        return program;

    Shader::CreateArgs vs;
    vs.name   = "BillboardVertexShader";
    vs.source = mVertexSource;
    Shader::CreateArgs fs;
    fs.name   = base::FormatString("Billboard%1FragmentShader", mParams.material);
    fs.source = mFragmentSource;

    Program::CreateArgs args;
    args.name = base::FormatString("Billboard%1Program", mParams.material);
    args.vertex_shader   = device.CreateShader(mProgramId + "/vs", vs);
    args.fragment_shader = device.CreateShader(mProgramId + "/fs", fs);
    if (!args.vertex_shader->IsValid() || !args.fragment_shader->IsValid())
        ERROR("Failed to compile billboard shaders. [id='%1']", mProgramId);

    return device.CreateProgram(mProgramId, args);
}

void BillboardShader::DeleteProgram(Device& device) const
{
    device.DeleteProgram(mProgramId);
    device.DeleteShader(mProgramId + "/vs");
    device.DeleteShader(mProgramId + "/fs");
}

GeometryPtr BillboardShader::GetGeometry(Device& device) const
{
    static const std::string id = "billboard-quad";
    if (auto geometry = device.FindGeometry(id))
        return geometry;

    // Two triangles, counter clockwise when seen from the camera
    // after the quad has been turned to face it.
    const std::vector<QuadVertex> vertices = {
        {{ 0.5f,  0.5f, 0.0f}, {0.0f, 0.0f, 1.0f}, {0.0f, 1.0f}},
        {{-0.5f, -0.5f, 0.0f}, {0.0f, 0.0f, 1.0f}, {1.0f, 0.0f}},
        {{-0.5f,  0.5f, 0.0f}, {0.0f, 0.0f, 1.0f}, {1.0f, 1.0f}},
        {{ 0.5f,  0.5f, 0.0f}, {0.0f, 0.0f, 1.0f}, {0.0f, 1.0f}},
        {{ 0.5f, -0.5f, 0.0f}, {0.0f, 0.0f, 1.0f}, {0.0f, 0.0f}},
        {{-0.5f, -0.5f, 0.0f}, {0.0f, 0.0f, 1.0f}, {1.0f, 0.0f}},
    };
    const VertexLayout layout(sizeof(QuadVertex), {
        {"position", 0, 3, 1, 0, offsetof(QuadVertex, position)},
        {"normal",   1, 3, 1, 0, offsetof(QuadVertex, normal)},
        {"uv",       2, 2, 1, 0, offsetof(QuadVertex, uv)}
    });

    Geometry::CreateArgs args;
    args.usage = Geometry::Usage::Static;
    args.content_name = "BillboardQuad";
    args.buffer.SetVertexLayout(layout);
    args.buffer.SetVertexBuffer(vertices);
    args.buffer.AddDrawCmd(Geometry::DrawType::Triangles);
    args.content_hash = args.buffer.GetHash();
    return device.CreateGeometry(id, std::move(args));
}

Device::RasterState BillboardShader::GetRasterState() const
{
    Device::RasterState state;
    state.depth_test    = Device::DepthTest::LessOrEQual;
    state.bWriteDepth   = mParams.depth_write;
    state.culling       = Device::Culling::Back;
    // normal blending only applies to transparent materials.
    if (mParams.blending == Blending::None)
        state.blending = Device::BlendOp::None;
    else if (mParams.blending == Blending::Normal)
        state.blending = mParams.transparent ? Device::BlendOp::Transparent : Device::BlendOp::None;
    else if (mParams.blending == Blending::Additive)
        state.blending = Device::BlendOp::Additive;
    return state;
}

void BillboardShader::SetUniform(const std::string& name, UniformValue value)
{
    const auto* type = base::SafeFind(mUniformTypes, name);
    if (type == nullptr)
        throw std::runtime_error(base::FormatString("Unknown uniform \"%1\".", name));
    if (!IsValueOfType(value, *type))
        throw std::runtime_error(base::FormatString("Invalid value type for uniform \"%1\", expected %2.",
                                                    name, UniformTypeToString(*type)));
    ApplyUniformValue(mState, name, value);
}

void BillboardShader::SetCamera(const glm::mat4& view, const glm::mat4& projection, const glm::vec3& camera_position)
{
    mState.SetUniform("viewMatrix", view);
    mState.SetUniform("projectionMatrix", projection);
    mState.SetUniform("cameraPosition", camera_position);
}

void BillboardShader::SetModelMatrix(const glm::mat4& model)
{
    mState.SetUniform("modelMatrix", model);
}

void BillboardShader::SetLightDirection(const glm::vec3& direction)
{
    if (mParams.material == Material::Phong)
        mState.SetUniform("lightDirection", glm::normalize(direction));
}
void BillboardShader::SetLightColor(const glm::vec3& color)
{
    if (mParams.material == Material::Phong)
        mState.SetUniform("lightColor", color);
}
void BillboardShader::SetAmbientColor(const glm::vec3& color)
{
    if (mParams.material == Material::Phong)
        mState.SetUniform("ambientColor", color);
}
void BillboardShader::SetShininess(float shininess)
{
    if (mParams.material == Material::Phong)
        mState.SetUniform("shininess", shininess);
}

// static
BillboardShader::Material BillboardShader::ParseMaterial(const std::string& name)
{
    const auto material = magic_enum::enum_cast<Material>(name);
    if (!material.has_value())
        throw std::runtime_error(base::FormatString("Unsupported material \"%1\".", name));
    return material.value();
}

// static
std::string BillboardShader::AttributeTypeToString(AttributeType type)
{
    return ShaderSource::DataTypeToString(MapType(type));
}
// static
std::string BillboardShader::VaryingTypeToString(VaryingType type)
{
    return ShaderSource::DataTypeToString(MapType(type));
}

// static
unsigned BillboardShader::GetAttributeSize(AttributeType type) noexcept
{
    if (type == AttributeType::Float) return 1;
    else if (type == AttributeType::Vec2) return 2;
    else if (type == AttributeType::Vec3) return 3;
    else if (type == AttributeType::Vec4) return 4;
    else if (type == AttributeType::Mat2) return 4;
    BUG("Unhandled attribute type.");
    return 0;
}

void BillboardShader::ValidateDeclarations() const
{
    if (!magic_enum::enum_contains(mParams.material))
        throw std::runtime_error(base::FormatString("Unsupported material \"%1\".",
                                                    static_cast<int>(mParams.material)));
    if (!magic_enum::enum_contains(mParams.blending))
        throw std::runtime_error(base::FormatString("Unsupported blending \"%1\".",
                                                    static_cast<int>(mParams.blending)));

    if (mParams.lock_axis.has_value() && glm::length(mParams.lock_axis.value()) == 0.0f)
        throw std::runtime_error("Invalid billboard lock axis, the axis has zero length.");

    std::unordered_set<std::string> names;
    const auto declare = [&names](const std::string& name, const char* what) {
        if (!ShaderSource::IsValidIdentifier(name))
            throw std::runtime_error(base::FormatString("Invalid %1 name \"%2\".", what, name));
        if (base::Contains(GetSkeletonNames(), name))
            throw std::runtime_error(base::FormatString("The %1 name \"%2\" is reserved.", what, name));
        if (base::Contains(names, name))
            throw std::runtime_error(base::FormatString("Duplicate declaration of \"%1\".", name));
        names.insert(name);
    };

    for (const auto& uniform : mParams.uniforms)
    {
        declare(uniform.name, "uniform");
        if (!IsValueOfType(uniform.value, uniform.type))
            throw std::runtime_error(base::FormatString("Invalid value type for uniform \"%1\", expected %2.",
                                                        uniform.name, UniformTypeToString(uniform.type)));
    }
    for (const auto& attribute : mParams.attributes)
        declare(attribute.name, "attribute");
    for (const auto& varying : mParams.varyings)
        declare(varying.name, "varying");
    // the varyings are visible as v_<name> in the program scope.
    for (const auto& varying : mParams.varyings)
        declare("v_" + varying.name, "varying");
}

void BillboardShader::ComposeVertexSource()
{
    static const char* skeleton = {
#include "shaders/billboard_vertex.glsl"
    };

    ShaderSource decls(ShaderSource::Type::Vertex, ShaderSource::Version::GLSL_300);
    for (const auto& uniform : mParams.uniforms)
        decls.AddUniform(uniform.name, MapType(uniform.type));
    for (const auto& attribute : mParams.attributes)
        decls.AddAttribute(attribute.name, MapType(attribute.type));
    for (const auto& varying : mParams.varyings)
        decls.AddVarying("v_" + varying.name, MapType(varying.type));

    std::string signature = "void getBillboard(out vec3 modelPosition, out mat2 localTransform";
    std::string call = "getBillboard(modelPosition, localTransform";
    for (const auto& varying : mParams.varyings)
    {
        signature += base::FormatString(", out %1 %2", VaryingTypeToString(varying.type), varying.name);
        call += ", v_" + varying.name;
    }
    signature += ") {\n" + mParams.billboard_code + "\n}";
    call += ");";

    std::string up;
    if (const auto* axis = base::GetOpt(mParams.lock_axis))
        up = base::FormatString("const vec3 up = %1;", ShaderSource::ToConst(glm::normalize(*axis)));
    else up = "vec3 up = normalize(vec3(viewMatrix[0][1], viewMatrix[1][1], viewMatrix[2][1]));";

    const auto& origin = mParams.origin.value_or(glm::vec2(0.0f, 0.0f));

    mVertexSource = SubstituteAnchors(skeleton, {
        {"DECLARATIONS", decls.GetDeclarationSource()},
        {"PACKING", GetPackingSource()},
        {"GET_BILLBOARD", signature},
        {"CALL_GET_BILLBOARD", call},
        {"UP_VECTOR", up},
        {"ORIGIN", base::FormatString("const vec2 origin2d = vec2(%1, %2);",
                                      base::ToChars(origin.x, 3), base::ToChars(origin.y, 3))}
    }, "billboard vertex shader");
}

void BillboardShader::ComposeFragmentSource()
{
    static const char* basic_skeleton = {
#include "shaders/billboard_fragment_basic.glsl"
    };
    static const char* phong_skeleton = {
#include "shaders/billboard_fragment_phong.glsl"
    };

    ShaderSource decls(ShaderSource::Type::Fragment, ShaderSource::Version::GLSL_300);
    for (const auto& uniform : mParams.uniforms)
        decls.AddUniform(uniform.name, MapType(uniform.type));
    for (const auto& varying : mParams.varyings)
        decls.AddVarying("v_" + varying.name, MapType(varying.type));

    std::string signature = "vec4 getColor(const vec2 uv";
    std::string call = "diffuseColor.rgb = getColor(vUv";
    for (const auto& varying : mParams.varyings)
    {
        signature += base::FormatString(", const %1 %2", VaryingTypeToString(varying.type), varying.name);
        call += ", v_" + varying.name;
    }
    signature += ") {\n" + mParams.color_code + "\n}";
    call += ").rgb;";

    const char* skeleton = mParams.material == Material::Phong ? phong_skeleton : basic_skeleton;

    mFragmentSource = SubstituteAnchors(skeleton, {
        {"DECLARATIONS", decls.GetDeclarationSource()},
        {"PACKING", GetPackingSource()},
        {"GET_COLOR", signature},
        {"CALL_GET_COLOR", call}
    }, base::FormatString("billboard %1 fragment shader", mParams.material));
}

void BillboardShader::ComputeProgramId()
{
    size_t hash = 0;
    hash = base::hash_combine(hash, mParams.material);
    hash = base::hash_combine(hash, mParams.origin);
    hash = base::hash_combine(hash, mParams.lock_axis);
    for (const auto& uniform : mParams.uniforms)
    {
        hash = base::hash_combine(hash, uniform.name);
        hash = base::hash_combine(hash, uniform.type);
    }
    for (const auto& attribute : mParams.attributes)
    {
        hash = base::hash_combine(hash, attribute.name);
        hash = base::hash_combine(hash, attribute.type);
    }
    for (const auto& varying : mParams.varyings)
    {
        hash = base::hash_combine(hash, varying.name);
        hash = base::hash_combine(hash, varying.type);
    }
    hash = base::hash_combine(hash, mParams.billboard_code);
    hash = base::hash_combine(hash, mParams.color_code);
    // the sources are a function of the above but hashing them too
    // makes sure that a change to the skeleton changes the ID.
    hash = base::hash_combine(hash, mVertexSource);
    hash = base::hash_combine(hash, mFragmentSource);
    mProgramId = "billboard-program-" + std::to_string(hash);
}

} // namespace
