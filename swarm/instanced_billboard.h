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
#include "warnpop.h"

#include <string>
#include <vector>
#include <memory>
#include <optional>

#include "swarm/billboard_shader.h"
#include "swarm/instance.h"
#include "swarm/uniform.h"

namespace swarm
{
    class Device;
    class Framebuffer;

    // A fixed capacity batch of billboard instances whose per instance
    // data is written on the CPU and uploaded into per instance vertex
    // buffers. Every attribute has its own buffer and only the buffers
    // that have changed since the previous upload are uploaded again.
    //
    // The built-in attributes are
    //   aInstanceWorldPosition, vec3, the billboard anchor position
    //   aInstanceLocalTransform, mat2, rotation and scale of the quad
    // and every custom attribute <name> is bound as a_<name>.
    class InstancedBillboardBatch
    {
    public:
        using Attribute = BillboardShader::Attribute;

        // Custom attributes must be float, vec2, vec3 or vec4.
        // Throws std::runtime_error on an invalid attribute.
        InstancedBillboardBatch(std::string name, unsigned max_instances_count,
                                const std::vector<Attribute>& custom_attributes);

        // Set the number of instances to draw. Throws std::runtime_error
        // if the count exceeds the batch capacity.
        void SetInstancesCount(unsigned count);
        void SetInstancePosition(unsigned instance, const glm::vec3& position);
        // Set the rotation (in radians) and the size of the instance.
        void SetInstanceTransform(unsigned instance, float rotation, const glm::vec2& size);
        // Set the value of a custom attribute. The number of values must
        // match the attribute size.
        void SetInstanceCustomAttribute(unsigned instance, const std::string& name, const std::vector<float>& values);

        // Upload the changed attribute buffers to the device.
        void Upload(Device& device);
        // Upload and draw the instances. Does nothing when the instance
        // count is zero.
        void Draw(Device& device, const Program& program, const ProgramState& state,
                  const Geometry& geometry, const Device::RasterState& raster, Framebuffer* fbo);
        // Delete the device instance buffers.
        void Dispose(Device& device);

        // Check whether the attribute buffer (by shader attribute name)
        // has changes that have not been uploaded yet.
        bool IsDirty(const std::string& attribute) const;
        // Get the CPU side data of the attribute buffer (by shader
        // attribute name). Returns nullptr if there's no such buffer.
        const std::vector<float>* GetAttributeData(const std::string& attribute) const;

        inline unsigned GetInstancesCount() const noexcept
        { return mInstancesCount; }
        inline unsigned GetMaxInstancesCount() const noexcept
        { return mMaxInstancesCount; }
        inline std::string GetName() const
        { return mName; }
    private:
        struct AttributeBuffer {
            // name of the attribute in the shader.
            std::string name;
            // number of floats per column.
            unsigned components = 0;
            unsigned columns = 1;
            std::vector<float> data;
            bool dirty = true;
            InstancedDrawPtr gpu_buffer;
            inline unsigned GetSize() const noexcept
            { return components * columns; }
        };
        AttributeBuffer* FindBuffer(const std::string& name);
        const AttributeBuffer* FindBuffer(const std::string& name) const;
        void CheckInstance(unsigned instance) const;
        std::string GetBufferId(const AttributeBuffer& buffer) const;
    private:
        const std::string mName;
        const unsigned mMaxInstancesCount = 0;
        unsigned mInstancesCount = 0;
        std::vector<AttributeBuffer> mBuffers;
    };

    struct InstancedBillboardParams {
        std::optional<glm::vec2> origin;
        std::optional<glm::vec3> lock_axis;
        BillboardShader::Material material = BillboardShader::Material::Basic;
        BillboardShader::Blending blending = BillboardShader::Blending::Normal;
        bool depth_write = true;
        bool transparent = false;
        std::vector<UniformDeclaration> uniforms;
        // Custom per instance attributes, visible in the vertex code as a_<name>.
        std::vector<BillboardShader::Attribute> attributes;
        std::vector<BillboardShader::Varying> varyings;
        // Code appended to the getBillboard body after modelPosition and
        // localTransform have been set from the instance attributes.
        // Typically computes the varyings from the custom attributes.
        std::string vertex_code;
        // getColor function body.
        std::string fragment_code;
        // The number of instances per batch.
        unsigned batch_size = 2000;
    };

    // Any number of billboards split into batches of fixed capacity.
    // Batches are allocated lazily when the instance count grows.
    class InstancedBillboard
    {
    public:
        using Params = InstancedBillboardParams;

        // Throws std::runtime_error if the shader cannot be composed.
        InstancedBillboard(Device& device, Params params);
        InstancedBillboard(const InstancedBillboard&) = delete;
        ~InstancedBillboard();

        // Set the total number of instances. Allocates new batches as needed.
        void SetInstancesCount(unsigned count);
        // Per instance setters. Throw std::runtime_error if the batch of
        // the instance hasn't been allocated.
        void SetInstancePosition(unsigned instance, const glm::vec3& position);
        void SetInstanceTransform(unsigned instance, float rotation, const glm::vec2& size);
        void SetInstanceCustomAttribute(unsigned instance, const std::string& name, const std::vector<float>& values);

        // Draw every batch that has instances to draw.
        void Draw(Framebuffer* fbo = nullptr);
        // Delete the device resources. Calling Dispose more than once is fine.
        void Dispose();

        inline BillboardShader& GetShader() noexcept
        { return *mShader; }
        inline const BillboardShader& GetShader() const noexcept
        { return *mShader; }
        inline size_t GetNumBatches() const noexcept
        { return mBatches.size(); }
        inline const InstancedBillboardBatch& GetBatch(size_t index) const noexcept
        { return *mBatches[index]; }
        inline unsigned GetInstancesCount() const noexcept
        { return mInstancesCount; }
        inline unsigned GetBatchSize() const noexcept
        { return mBatchSize; }

        // Number of batches needed for count instances.
        static unsigned ComputeBatchCount(unsigned count, unsigned batch_size) noexcept;

        InstancedBillboard& operator=(const InstancedBillboard&) = delete;
    private:
        InstancedBillboardBatch& GetBatchInstance(unsigned instance, unsigned* local_instance);
        void CheckNotDisposed() const;
    private:
        Device& mDevice;
        const std::string mName;
        const unsigned mBatchSize = 0;
        const std::vector<BillboardShader::Attribute> mAttributes;
        std::unique_ptr<BillboardShader> mShader;
        std::vector<std::unique_ptr<InstancedBillboardBatch>> mBatches;
        unsigned mInstancesCount = 0;
        bool mDisposed = false;
    };

} // namespace
