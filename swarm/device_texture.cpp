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
#include "device/graphics.h"
#include "swarm/device_texture.h"

namespace swarm {

DeviceTexture::~DeviceTexture()
{
    if (mTexture.IsValid())
    {
        mDevice->DeleteTexture(mTexture);
        DEBUG("Deleted texture object. [name='%1']", mName);
    }
}

void DeviceTexture::Upload(const void* bytes, unsigned width, unsigned height, Format format)
{
    if (bytes == nullptr)
    {
        Allocate(width, height, format);
        return;
    }

    if (mTexture.IsValid())
        mDevice->DeleteTexture(mTexture);

    mTexture = mDevice->UploadTexture2D(bytes, width, height, format);
    if (!StoreSize(width, height, format))
        return;
    DEBUG("Uploaded new texture object. [name='%1', size=%2x%3, format=%4]", mName, width, height, format);
}

void DeviceTexture::Allocate(unsigned width, unsigned height, Format format)
{
    if (mTexture.IsValid())
        mDevice->DeleteTexture(mTexture);

    mTexture = mDevice->AllocateTexture2D(width, height, format);
    if (!StoreSize(width, height, format))
        return;
    DEBUG("Allocated new texture object. [name='%1', size=%2x%3, format=%4]", mName, width, height, format);
}

bool DeviceTexture::StoreSize(unsigned width, unsigned height, Format format)
{
    // a texture without storage has no size so that any framebuffer
    // or sampler use of it fails instead of sampling garbage.
    if (!mTexture.IsValid())
    {
        ERROR("Failed to create texture storage. [name='%1', size=%2x%3]", mName, width, height);
        mWidth  = 0;
        mHeight = 0;
        return false;
    }
    mWidth  = width;
    mHeight = height;
    mFormat = format;
    return true;
}

} // namespace
