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
#  include <glm/vec2.hpp>
#  include <glm/vec3.hpp>
#include "warnpop.h"

#include <cmath>
#include <stdexcept>
#include <algorithm>

#include "base/assert.h"
#include "base/format.h"
#include "base/logging.h"
#include "base/utility.h"
#include "swarm/instanced_billboard.h"
#include "swarm/device.h"

namespace {
std::string GenerateName()
{
    static unsigned counter = 0;
    return base::FormatString("InstancedBillboard/%1", ++counter);
}

// Initial size of every instance, 1/15 of the quad size on both axis.
constexpr float DefaultInstanceScale = 1.0f / 15.0f;

const char* InstanceBillboardCode = R"(
modelPosition = aInstanceWorldPosition;
localTransform = aInstanceLocalTransform;
)";

} // namespace

namespace swarm
{

InstancedBillboardBatch::InstancedBillboardBatch(std::string name, unsigned max_instances_count,
                                                 const std::vector<Attribute>& custom_attributes)
  : mName(std::move(name))
  , mMaxInstancesCount(max_instances_count)
{
    if (mMaxInstancesCount == 0)
        throw std::runtime_error(base::FormatString("Invalid batch '%1' capacity, capacity is 0.", mName));

    AttributeBuffer position;
    position.name       = "aInstanceWorldPosition";
    position.components = 3;
    position.data.resize(3 * mMaxInstancesCount, 0.0f);
    mBuffers.push_back(std::move(position));

    AttributeBuffer transform;
    transform.name       = "aInstanceLocalTransform";
    transform.components = 2;
    transform.columns    = 2;
    transform.data.resize(4 * mMaxInstancesCount, 0.0f);
    for (unsigned i=0; i<mMaxInstancesCount; ++i)
    {
        transform.data[i*4 + 0] = DefaultInstanceScale;
        transform.data[i*4 + 3] = DefaultInstanceScale;
    }
    mBuffers.push_back(std::move(transform));

    for (const auto& attribute : custom_attributes)
    {
        if (attribute.type == BillboardShader::AttributeType::Mat2)
            throw std::runtime_error(base::FormatString("Unsupported type for instance attribute \"%1\".", attribute.name));

        const auto& name = "a_" + attribute.name;
        if (FindBuffer(name))
            throw std::runtime_error(base::FormatString("Duplicate instance attribute \"%1\".", attribute.name));

        AttributeBuffer buffer;
        buffer.name       = name;
        buffer.components = BillboardShader::GetAttributeSize(attribute.type);
        buffer.data.resize(buffer.components * mMaxInstancesCount, 0.0f);
        mBuffers.push_back(std::move(buffer));
    }
}

void InstancedBillboardBatch::SetInstancesCount(unsigned count)
{
    if (count > mMaxInstancesCount)
        throw std::runtime_error(base::FormatString("Invalid instances count \"%1\".", count));

    mInstancesCount = count;
}

void InstancedBillboardBatch::SetInstancePosition(unsigned instance, const glm::vec3& position)
{
    CheckInstance(instance);

    auto* buffer = FindBuffer("aInstanceWorldPosition");
    buffer->data[instance*3 + 0] = position.x;
    buffer->data[instance*3 + 1] = position.y;
    buffer->data[instance*3 + 2] = position.z;
    buffer->dirty = true;
}

void InstancedBillboardBatch::SetInstanceTransform(unsigned instance, float rotation, const glm::vec2& size)
{
    CheckInstance(instance);

    const auto cos = std::cos(rotation);
    const auto sin = std::sin(rotation);

    // column major mat2, first column is the rotated and scaled x axis.
    auto* buffer = FindBuffer("aInstanceLocalTransform");
    buffer->data[instance*4 + 0] =  size.x * cos;
    buffer->data[instance*4 + 1] =  size.x * sin;
    buffer->data[instance*4 + 2] = -size.y * sin;
    buffer->data[instance*4 + 3] =  size.y * cos;
    buffer->dirty = true;
}

void InstancedBillboardBatch::SetInstanceCustomAttribute(unsigned instance, const std::string& name, const std::vector<float>& values)
{
    CheckInstance(instance);

    auto* buffer = FindBuffer("a_" + name);
    if (buffer == nullptr)
        throw std::runtime_error(base::FormatString("Unknown attribute \"%1\".", name));

    const auto size = buffer->GetSize();
    if (values.size() != size)
        throw std::runtime_error(base::FormatString("Invalid value size for \"%1\": \"%2\", expected \"%3\".",
                                                    name, values.size(), size));

    std::copy(values.begin(), values.end(), buffer->data.begin() + instance * size);
    buffer->dirty = true;
}

void InstancedBillboardBatch::Upload(Device& device)
{
    for (auto& buffer : mBuffers)
    {
        if (!buffer.dirty && buffer.gpu_buffer)
            continue;

        InstanceDataLayout::Attribute attribute;
        attribute.name                  = buffer.name;
        attribute.num_vector_components = buffer.components;
        attribute.num_columns           = buffer.columns;
        attribute.divisor               = 1;
        attribute.offset                = 0;

        InstanceDataLayout layout;
        layout.vertex_struct_size = buffer.GetSize() * sizeof(float);
        layout.attributes.push_back(attribute);

        InstancedDraw::CreateArgs args;
        args.usage = InstancedDraw::Usage::Dynamic;
        args.content_name = buffer.name;
        args.buffer.SetInstanceDataLayout(layout);
        args.buffer.SetInstanceBuffer(buffer.data);
        buffer.gpu_buffer = device.CreateInstancedDraw(GetBufferId(buffer), std::move(args));
        buffer.dirty = false;

        VERBOSE("Uploaded instance buffer. [batch='%1', attribute='%2']", mName, buffer.name);
    }
}

void InstancedBillboardBatch::Draw(Device& device, const Program& program, const ProgramState& state,
                                   const Geometry& geometry, const Device::RasterState& raster, Framebuffer* fbo)
{
    if (mInstancesCount == 0)
        return;

    Upload(device);

    GeometryDrawCommand draw(geometry);
    for (const auto& buffer : mBuffers)
        draw.AddInstanceBuffer(*buffer.gpu_buffer);
    draw.SetInstanceCount(mInstancesCount);
    device.Draw(program, state, draw, raster, fbo);
}

void InstancedBillboardBatch::Dispose(Device& device)
{
    for (auto& buffer : mBuffers)
    {
        if (!buffer.gpu_buffer)
            continue;
        buffer.gpu_buffer.reset();
        device.DeleteInstancedDraw(GetBufferId(buffer));
        buffer.dirty = true;
    }
}

bool InstancedBillboardBatch::IsDirty(const std::string& attribute) const
{
    const auto* buffer = FindBuffer(attribute);
    return buffer && buffer->dirty;
}

const std::vector<float>* InstancedBillboardBatch::GetAttributeData(const std::string& attribute) const
{
    if (const auto* buffer = FindBuffer(attribute))
        return &buffer->data;
    return nullptr;
}

InstancedBillboardBatch::AttributeBuffer* InstancedBillboardBatch::FindBuffer(const std::string& name)
{
    return base::SafeFind(mBuffers, [&name](const AttributeBuffer& buffer) {
        return buffer.name == name;
    });
}
const InstancedBillboardBatch::AttributeBuffer* InstancedBillboardBatch::FindBuffer(const std::string& name) const
{
    return base::SafeFind(mBuffers, [&name](const AttributeBuffer& buffer) {
        return buffer.name == name;
    });
}

void InstancedBillboardBatch::CheckInstance(unsigned instance) const
{
    if (instance >= mMaxInstancesCount)
        throw std::runtime_error(base::FormatString("Invalid instance \"%1\" in batch '%2'.", instance, mName));
}

std::string InstancedBillboardBatch::GetBufferId(const AttributeBuffer& buffer) const
{
    return mName + "/" + buffer.name;
}

InstancedBillboard::InstancedBillboard(Device& device, Params params)
  : mDevice(device)
  , mName(GenerateName())
  , mBatchSize(params.batch_size)
  , mAttributes(params.attributes)
{
    if (mBatchSize == 0)
        throw std::runtime_error("Invalid instanced billboard batch size 0.");

    BillboardShader::Params shader;
    shader.origin      = params.origin;
    shader.lock_axis   = params.lock_axis;
    shader.material    = params.material;
    shader.blending    = params.blending;
    shader.depth_write = params.depth_write;
    shader.transparent = params.transparent;
    shader.uniforms    = std::move(params.uniforms);
    shader.varyings    = std::move(params.varyings);
    shader.attributes.push_back({"aInstanceWorldPosition", BillboardShader::AttributeType::Vec3});
    shader.attributes.push_back({"aInstanceLocalTransform", BillboardShader::AttributeType::Mat2});
    for (const auto& attribute : mAttributes)
    {
        if (attribute.type == BillboardShader::AttributeType::Mat2)
            throw std::runtime_error(base::FormatString("Unsupported type for instance attribute \"%1\".", attribute.name));
        shader.attributes.push_back({"a_" + attribute.name, attribute.type});
    }
    shader.billboard_code = InstanceBillboardCode + params.vertex_code;
    shader.color_code     = std::move(params.fragment_code);
    mShader = std::make_unique<BillboardShader>(std::move(shader));

    DEBUG("Created instanced billboard. [name='%1', batch_size=%2, attributes=%3]",
          mName, mBatchSize, mAttributes.size());
}

InstancedBillboard::~InstancedBillboard()
{
    Dispose();
}

// static
unsigned InstancedBillboard::ComputeBatchCount(unsigned count, unsigned batch_size) noexcept
{
    ASSERT(batch_size);
    return count / batch_size + (count % batch_size != 0 ? 1 : 0);
}

void InstancedBillboard::SetInstancesCount(unsigned count)
{
    CheckNotDisposed();

    const auto batches = ComputeBatchCount(count, mBatchSize);
    while (mBatches.size() < batches)
    {
        const auto& name = base::FormatString("%1/Batch%2", mName, mBatches.size());
        mBatches.push_back(std::make_unique<InstancedBillboardBatch>(name, mBatchSize, mAttributes));
        DEBUG("Allocated instanced billboard batch. [name='%1']", name);
    }

    for (size_t i=0; i<mBatches.size(); ++i)
    {
        const auto first = static_cast<unsigned>(i) * mBatchSize;
        unsigned batch_count = 0;
        if (count <= first)
            batch_count = 0;
        else if (count >= first + mBatchSize)
            batch_count = mBatchSize;
        else batch_count = count - first;
        mBatches[i]->SetInstancesCount(batch_count);
    }
    mInstancesCount = count;
}

void InstancedBillboard::SetInstancePosition(unsigned instance, const glm::vec3& position)
{
    unsigned local = 0;
    GetBatchInstance(instance, &local).SetInstancePosition(local, position);
}

void InstancedBillboard::SetInstanceTransform(unsigned instance, float rotation, const glm::vec2& size)
{
    unsigned local = 0;
    GetBatchInstance(instance, &local).SetInstanceTransform(local, rotation, size);
}

void InstancedBillboard::SetInstanceCustomAttribute(unsigned instance, const std::string& name, const std::vector<float>& values)
{
    unsigned local = 0;
    GetBatchInstance(instance, &local).SetInstanceCustomAttribute(local, name, values);
}

void InstancedBillboard::Draw(Framebuffer* fbo)
{
    if (mDisposed)
        return;

    auto program  = mShader->GetProgram(mDevice);
    auto geometry = mShader->GetGeometry(mDevice);
    const auto& raster = mShader->GetRasterState();
    for (auto& batch : mBatches)
    {
        batch->Draw(mDevice, *program, mShader->GetProgramState(), *geometry, raster, fbo);
    }
}

void InstancedBillboard::Dispose()
{
    if (mDisposed)
        return;

    for (auto& batch : mBatches)
        batch->Dispose(mDevice);
    mBatches.clear();
    mShader->DeleteProgram(mDevice);
    mInstancesCount = 0;
    mDisposed = true;

    DEBUG("Disposed instanced billboard. [name='%1']", mName);
}

InstancedBillboardBatch& InstancedBillboard::GetBatchInstance(unsigned instance, unsigned* local_instance)
{
    CheckNotDisposed();

    const auto index = instance / mBatchSize;
    if (index >= mBatches.size())
        throw std::runtime_error(base::FormatString("No mesh for instance \"%1\".", instance));

    *local_instance = instance % mBatchSize;
    return *mBatches[index];
}

void InstancedBillboard::CheckNotDisposed() const
{
    if (mDisposed)
        throw std::runtime_error(base::FormatString("Instanced billboard '%1' has been disposed.", mName));
}

} // namespace
