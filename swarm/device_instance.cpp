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

#include "base/logging.h"
#include "swarm/device_instance.h"

namespace swarm {

DeviceDrawInstanceBuffer::~DeviceDrawInstanceBuffer()
{
    if (mBuffer.IsValid())
    {
        mDevice->FreeBuffer(mBuffer);
    }
    if (mUsage != Usage::Stream)
        DEBUG("Deleted instanced draw object. [name='%1']", mContentName);
}

void DeviceDrawInstanceBuffer::Upload() const
{
    if (!mPendingUpload.has_value())
        return;

    auto upload = std::move(mPendingUpload.value());

    mPendingUpload.reset();

    const auto vertex_bytes = upload.GetInstanceDataSize();
    const auto vertex_ptr   = upload.GetVertexDataPtr();
    if (vertex_bytes == 0)
        return;

    // same size data goes into the buffer we already have.
    if (mBuffer.IsValid() && mBuffer.buffer_bytes != vertex_bytes)
    {
        mDevice->FreeBuffer(mBuffer);
        mBuffer = dev::GraphicsBuffer{};
    }
    if (!mBuffer.IsValid())
    {
        mBuffer = mDevice->AllocateBuffer(vertex_bytes, mUsage, dev::BufferType::VertexBuffer);
        DEBUG("Allocated geometry instance buffer. [name='%1', bytes='%2', usage='%3']", mContentName, vertex_bytes, mUsage);
    }
    mDevice->UploadBuffer(mBuffer, vertex_ptr, vertex_bytes);
    mLayout = upload.GetInstanceDataLayout();
}

} // namespace
