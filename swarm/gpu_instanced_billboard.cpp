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
#  include <nlohmann/json.hpp>
#  include <magic_enum.hpp>
#  include <glm/mat4x4.hpp>
#include "warnpop.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include "base/assert.h"
#include "base/format.h"
#include "base/json.h"
#include "base/logging.h"
#include "base/random.h"
#include "base/utility.h"
#include "swarm/gpu_instanced_billboard.h"
#include "swarm/device.h"
#include "swarm/texture.h"

namespace {
std::string GenerateName()
{
    static unsigned counter = 0;
    return base::FormatString("GpuInstancedBillboard/%1", ++counter);
}

const char* InitializeCode = R"(
vec3 position = vec3(
    unpackRGBATo2Half(texture(uNoiseTexture1, uv)),
    unpackRGBATo2Half(texture(uNoiseTexture2, uv)).x
);
position = mod(position, uWrapBound);

out_positionsTexture1 = pack2HalfToRGBA(position.xy);
out_positionsTexture2 = pack2HalfToRGBA(vec2(position.z, 0.0));
)";

const char* UpdateCode = R"(
vec3 previousPosition = vec3(
    unpackRGBATo2Half(in_positionsTexture1),
    unpackRGBATo2Half(in_positionsTexture2).x
);

vec3 newPosition = previousPosition + (uGravity + uUniformMovement) * uDeltaTime;
newPosition = mod(newPosition, uWrapBound);

out_positionsTexture1 = pack2HalfToRGBA(newPosition.xy);
out_positionsTexture2 = pack2HalfToRGBA(vec2(newPosition.z, 0.0));
)";

// Read the value of a uniform declaration from JSON. Samplers have no
// JSON representation and are always read as nullptr.
bool ReadUniformValue(const nlohmann::json& json, swarm::UniformType type, swarm::UniformValue* value)
{
    using T = swarm::UniformType;
    if (type == T::Sampler2D)
    {
        *value = static_cast<const swarm::Texture*>(nullptr);
        return true;
    }
    else if (type == T::Float)
    {
        float val = 0.0f;
        if (!base::JsonReadSafe(json, "value", &val))
            return false;
        *value = val;
        return true;
    }
    else if (type == T::Vec2)
    {
        glm::vec2 val;
        if (!base::JsonReadSafe(json, "value", &val))
            return false;
        *value = val;
        return true;
    }
    else if (type == T::Vec3)
    {
        glm::vec3 val;
        if (!base::JsonReadSafe(json, "value", &val))
            return false;
        *value = val;
        return true;
    }
    else if (type == T::Vec4)
    {
        glm::vec4 val;
        if (!base::JsonReadSafe(json, "value", &val))
            return false;
        *value = val;
        return true;
    }
    else if (type == T::Mat4)
    {
        if (!json.contains("value") || !json["value"].is_array() || json["value"].size() != 16)
            return false;
        glm::mat4 val;
        const auto& array = json["value"];
        for (unsigned i=0; i<16; ++i)
        {
            if (!array[i].is_number())
                return false;
            val[i / 4][i % 4] = array[i].get<float>();
        }
        *value = val;
        return true;
    }
    BUG("Unhandled uniform type.");
    return false;
}

void WriteUniformValue(nlohmann::json& json, const swarm::UniformValue& value)
{
    if (const auto* val = std::get_if<float>(&value))
        base::JsonWrite(json, "value", *val);
    else if (const auto* val = std::get_if<glm::vec2>(&value))
        base::JsonWrite(json, "value", *val);
    else if (const auto* val = std::get_if<glm::vec3>(&value))
        base::JsonWrite(json, "value", *val);
    else if (const auto* val = std::get_if<glm::vec4>(&value))
        base::JsonWrite(json, "value", *val);
    else if (const auto* val = std::get_if<glm::mat4>(&value))
    {
        nlohmann::json array = nlohmann::json::array();
        for (unsigned i=0; i<16; ++i)
            array.push_back((*val)[i / 4][i % 4]);
        json["value"] = std::move(array);
    }
}

} // namespace

namespace swarm
{

void GpuInstancedBillboardParams::IntoJson(nlohmann::json& json) const
{
    base::JsonWrite(json, "max_instances_count", max_instances_count);
    base::JsonWrite(json, "positions_range", positions_range);
    if (origin.has_value())
        base::JsonWrite(json, "origin", origin.value());
    if (lock_axis.has_value())
        base::JsonWrite(json, "lock_axis", lock_axis.value());

    nlohmann::json render;
    base::JsonWrite(render, "material", rendering.material);
    base::JsonWrite(render, "blending", rendering.blending);
    base::JsonWrite(render, "depth_write", rendering.depth_write);
    base::JsonWrite(render, "transparent", rendering.transparent);
    base::JsonWrite(render, "fragment_code", rendering.fragment_code);
    nlohmann::json uniforms = nlohmann::json::array();
    for (const auto& uniform : rendering.uniforms)
    {
        nlohmann::json u;
        base::JsonWrite(u, "name", uniform.name);
        base::JsonWrite(u, "type", UniformTypeToString(uniform.type));
        WriteUniformValue(u, uniform.value);
        uniforms.push_back(std::move(u));
    }
    render["uniforms"] = std::move(uniforms);
    json["rendering"] = std::move(render);

    nlohmann::json sim;
    base::JsonWrite(sim, "gravity", simulation.gravity);
    base::JsonWrite(sim, "wrap_bound", simulation.wrap_bound);
    base::JsonWrite(sim, "seed", simulation.seed);
    json["simulation"] = std::move(sim);
}

// static
std::optional<GpuInstancedBillboardParams> GpuInstancedBillboardParams::FromJson(const nlohmann::json& json)
{
    GpuInstancedBillboardParams ret;
    if (!base::JsonReadSafe(json, "max_instances_count", &ret.max_instances_count))
    {
        ERROR("Missing or invalid billboard 'max_instances_count'.");
        return std::nullopt;
    }
    if (!base::JsonReadOptional(json, "origin", &ret.origin) ||
        !base::JsonReadOptional(json, "lock_axis", &ret.lock_axis))
    {
        ERROR("Invalid billboard origin or lock axis.");
        return std::nullopt;
    }
    if (json.contains("positions_range") && !base::JsonReadSafe(json, "positions_range", &ret.positions_range))
    {
        ERROR("Invalid billboard 'positions_range'.");
        return std::nullopt;
    }

    const auto* render = base::GetJsonObj(json, "rendering");
    if (render == nullptr)
    {
        ERROR("Missing billboard 'rendering' object.");
        return std::nullopt;
    }
    std::string material;
    if (!base::JsonReadSafe(*render, "material", &material))
    {
        ERROR("Missing billboard rendering 'material'.");
        return std::nullopt;
    }
    const auto material_value = magic_enum::enum_cast<BillboardShader::Material>(material);
    if (!material_value.has_value())
    {
        ERROR("Unsupported material \"%1\".", material);
        return std::nullopt;
    }
    ret.rendering.material = material_value.value();

    if (render->contains("blending") && !base::JsonReadSafe(*render, "blending", &ret.rendering.blending))
    {
        ERROR("Invalid billboard rendering 'blending'.");
        return std::nullopt;
    }
    if ((render->contains("depth_write") && !base::JsonReadSafe(*render, "depth_write", &ret.rendering.depth_write)) ||
        (render->contains("transparent") && !base::JsonReadSafe(*render, "transparent", &ret.rendering.transparent)))
    {
        ERROR("Invalid billboard rendering flags.");
        return std::nullopt;
    }
    if (!base::JsonReadSafe(*render, "fragment_code", &ret.rendering.fragment_code))
    {
        ERROR("Missing billboard rendering 'fragment_code'.");
        return std::nullopt;
    }
    if (render->contains("uniforms"))
    {
        const auto& uniforms = (*render)["uniforms"];
        if (!uniforms.is_array())
        {
            ERROR("Invalid billboard rendering 'uniforms'.");
            return std::nullopt;
        }
        for (const auto& u : uniforms)
        {
            UniformDeclaration uniform;
            std::string type;
            if (!base::JsonReadSafe(u, "name", &uniform.name) ||
                !base::JsonReadSafe(u, "type", &type) ||
                !UniformTypeFromString(type, &uniform.type) ||
                !ReadUniformValue(u, uniform.type, &uniform.value))
            {
                ERROR("Invalid billboard rendering uniform. [uniform='%1']", uniform.name);
                return std::nullopt;
            }
            ret.rendering.uniforms.push_back(std::move(uniform));
        }
    }

    if (const auto* sim = base::GetJsonObj(json, "simulation"))
    {
        if ((sim->contains("gravity") && !base::JsonReadSafe(*sim, "gravity", &ret.simulation.gravity)) ||
            (sim->contains("wrap_bound") && !base::JsonReadSafe(*sim, "wrap_bound", &ret.simulation.wrap_bound)) ||
            (sim->contains("seed") && !base::JsonReadSafe(*sim, "seed", &ret.simulation.seed)))
        {
            ERROR("Invalid billboard 'simulation' settings.");
            return std::nullopt;
        }
    }
    return ret;
}

GpuInstancedBillboard::GpuInstancedBillboard(Device& device, Params params)
  : mDevice(device)
  , mName(GenerateName())
  , mMaxInstancesCount(params.max_instances_count)
  , mTextureSize(ComputeTextureSize(params.max_instances_count))
{
    const auto& bound = params.simulation.wrap_bound;
    for (int i=0; i<3; ++i)
    {
        if (!(bound[i] > 0.0f && bound[i] <= 1.0f))
            throw std::runtime_error(base::FormatString("Invalid wrap bound %1, each component must be in (0, 1].", bound));
    }

    // the noise and the position textures are all texture size squared.
    Device::DeviceCaps caps;
    mDevice.GetDeviceCaps(&caps);
    if (caps.max_fbo_width && caps.max_fbo_height &&
        (mTextureSize > caps.max_fbo_width || mTextureSize > caps.max_fbo_height))
        throw std::runtime_error(base::FormatString("Position texture size %1 exceeds the device max %2x%3.",
                                                    mTextureSize, caps.max_fbo_width, caps.max_fbo_height));

    // Compose the display program first since it's the part that
    // validates the caller supplied declarations.
    BillboardShader::Params shader;
    shader.origin      = params.origin;
    shader.lock_axis   = params.lock_axis;
    shader.material    = params.rendering.material;
    shader.blending    = params.rendering.blending;
    shader.depth_write = params.rendering.depth_write;
    shader.transparent = params.rendering.transparent;
    shader.uniforms    = {
        {"uPositionXYTexture", UniformType::Sampler2D, static_cast<const Texture*>(nullptr)},
        {"uPositionZWTexture", UniformType::Sampler2D, static_cast<const Texture*>(nullptr)},
        {"uPositionsRange", UniformType::Vec3, params.positions_range}
    };
    for (const auto& uniform : params.rendering.uniforms)
        shader.uniforms.push_back(uniform);

    const auto& size_float = base::ToChars(static_cast<float>(mTextureSize), 1);
    const auto& size_int   = base::ToChars(mTextureSize);
    shader.billboard_code = base::FormatString(R"(
ivec2 texelId = ivec2(
    int(mod(float(gl_InstanceID), %1)),
    gl_InstanceID / %2
);

vec4 positionXYTexel = texelFetch(uPositionXYTexture, texelId, 0);
vec4 positionZWTexel = texelFetch(uPositionZWTexture, texelId, 0);

vec3 positionInBox = vec3(
    unpackRGBATo2Half(positionXYTexel),
    unpackRGBATo2Half(positionZWTexel).x
);
modelPosition = uPositionsRange * positionInBox;
vec3 positionFromBoxCenter = positionInBox - 0.5;
float distanceSqFromBoxCenter = dot(positionFromBoxCenter, positionFromBoxCenter);

float size = 0.2 * (1.0 - smoothstep(0.23, 0.25, distanceSqFromBoxCenter));
localTransform = mat2(size, 0.0, 0.0, size);)", size_float, size_int);
    shader.color_code = params.rendering.fragment_code;
    mShader = std::make_unique<BillboardShader>(std::move(shader));

    mNoise[0] = CreateNoiseTexture(mName + "/Noise1", params.simulation.seed);
    mNoise[1] = CreateNoiseTexture(mName + "/Noise2", params.simulation.seed + 1);

    GpuTexturesState::Pipeline initialize;
    initialize.requires_previous_state = false;
    initialize.uniforms = {
        {"uNoiseTexture1", UniformType::Sampler2D, static_cast<const Texture*>(mNoise[0])},
        {"uNoiseTexture2", UniformType::Sampler2D, static_cast<const Texture*>(mNoise[1])},
        {"uWrapBound", UniformType::Vec3, params.simulation.wrap_bound}
    };
    initialize.code = InitializeCode;

    GpuTexturesState::Pipeline update;
    update.requires_previous_state = true;
    update.uniforms = {
        {"uUniformMovement", UniformType::Vec3, glm::vec3(0.0f)},
        {"uDeltaTime", UniformType::Float, 0.0f},
        {"uGravity", UniformType::Vec3, params.simulation.gravity},
        {"uWrapBound", UniformType::Vec3, params.simulation.wrap_bound}
    };
    update.code = UpdateCode;

    GpuTexturesState::Params state;
    state.name     = mName + "/Positions";
    state.width    = mTextureSize;
    state.height   = mTextureSize;
    state.channels = {"positionsTexture1", "positionsTexture2"};
    state.pipelines["initialize"] = std::move(initialize);
    state.pipelines["update"]     = std::move(update);
    try
    {
        mState = std::make_unique<GpuTexturesState>(mDevice, std::move(state));
    }
    catch (const std::exception&)
    {
        mDevice.DeleteTexture(mNoise[0]->GetId());
        mDevice.DeleteTexture(mNoise[1]->GetId());
        throw;
    }

    mProgram  = mShader->GetProgram(mDevice);
    mGeometry = mShader->GetGeometry(mDevice);

    EnforceCurrentPositionTexture();

    DEBUG("Created GPU instanced billboard. [name='%1', max=%2, texture_size=%3, material=%4]",
          mName, mMaxInstancesCount, mTextureSize, params.rendering.material);
}

GpuInstancedBillboard::~GpuInstancedBillboard()
{
    Dispose();
}

void GpuInstancedBillboard::SetInstancesCount(unsigned count)
{
    CheckNotDisposed();

    if (count > mMaxInstancesCount)
        throw std::runtime_error(base::FormatString("Cannot set instancescount=\"%1\" because max is \"%2\".",
                                                    count, mMaxInstancesCount));
    mInstancesCount = count;
}

void GpuInstancedBillboard::InitializePositions()
{
    CheckNotDisposed();

    mState->RunPipeline("initialize");
    EnforceCurrentPositionTexture();
}

void GpuInstancedBillboard::UpdatePositions(float delta_time, const glm::vec3& movement)
{
    CheckNotDisposed();

    mState->SetUniform("update", "uDeltaTime", delta_time);
    mState->SetUniform("update", "uUniformMovement", movement);
    mState->RunPipeline("update");
    EnforceCurrentPositionTexture();
}

void GpuInstancedBillboard::Draw(Framebuffer* fbo)
{
    if (mDisposed || mInstancesCount == 0)
        return;

    GeometryDrawCommand draw(*mGeometry);
    draw.SetInstanceCount(mInstancesCount);
    mDevice.Draw(*mProgram, mShader->GetProgramState(), draw, mShader->GetRasterState(), fbo);
}

void GpuInstancedBillboard::Dispose()
{
    if (mDisposed)
        return;

    mState->Dispose();
    for (auto*& noise : mNoise)
    {
        mDevice.DeleteTexture(noise->GetId());
        noise = nullptr;
    }
    mShader->DeleteProgram(mDevice);
    mProgram.reset();
    mGeometry.reset();
    mInstancesCount = 0;
    mDisposed = true;

    DEBUG("Disposed GPU instanced billboard. [name='%1']", mName);
}

void GpuInstancedBillboard::SetPositionsRange(const glm::vec3& range)
{
    CheckNotDisposed();

    mShader->SetUniform("uPositionsRange", range);
}

void GpuInstancedBillboard::SetUniform(const std::string& name, UniformValue value)
{
    CheckNotDisposed();

    mShader->SetUniform(name, std::move(value));
}

// static
unsigned GpuInstancedBillboard::NextPowerOfTwo(unsigned x)
{
    if (x == 0)
        throw std::runtime_error("Cannot compute the next power of two of 0.");
    if (x > (1u << 29))
        throw std::runtime_error(base::FormatString("Value %1 is too large for the next power of two.", x));

    return std::max(2u, base::NextPOT(x));
}

// static
unsigned GpuInstancedBillboard::ComputeTextureSize(unsigned max_instances_count)
{
    const auto root = static_cast<unsigned>(std::floor(std::sqrt(static_cast<double>(max_instances_count))));
    const auto size = NextPowerOfTwo(root);
    if (static_cast<std::uint64_t>(max_instances_count) > static_cast<std::uint64_t>(size) * size)
        throw std::runtime_error("Too many particles");
    return size;
}

// static
glm::uvec2 GpuInstancedBillboard::ComputeTexelId(unsigned index, unsigned texture_size) noexcept
{
    ASSERT(texture_size);
    return glm::uvec2(index % texture_size, index / texture_size);
}

void GpuInstancedBillboard::CheckNotDisposed() const
{
    if (mDisposed)
        throw std::runtime_error(base::FormatString("GPU instanced billboard '%1' has been disposed.", mName));
}

void GpuInstancedBillboard::EnforceCurrentPositionTexture()
{
    mShader->SetUniform("uPositionXYTexture", mState->GetCurrentTexture("positionsTexture1"));
    mShader->SetUniform("uPositionZWTexture", mState->GetCurrentTexture("positionsTexture2"));
}

Texture* GpuInstancedBillboard::CreateNoiseTexture(const std::string& name, unsigned seed)
{
    base::RandomGenerator<unsigned> random(seed, 0, 255);

    std::vector<std::uint8_t> bytes(size_t(4) * mTextureSize * mTextureSize);
    for (auto& byte : bytes)
        byte = static_cast<std::uint8_t>(random());

    auto* texture = mDevice.MakeTexture(name);
    texture->SetName(name);
    texture->SetFilter(Texture::MinFilter::Nearest);
    texture->SetFilter(Texture::MagFilter::Nearest);
    texture->SetWrapX(Texture::Wrapping::Clamp);
    texture->SetWrapY(Texture::Wrapping::Clamp);
    texture->Upload(bytes.data(), mTextureSize, mTextureSize, Texture::Format::RGBA);
    return texture;
}

} // namespace
