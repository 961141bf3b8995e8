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

#include <string>
#include <vector>
#include <cstddef>

#include "device/graphics.h"
#include "swarm/program.h"
#include "swarm/shader.h"

namespace swarm
{
    class DeviceProgram : public Program
    {
    public:
        explicit DeviceProgram(dev::GraphicsDevice* device) noexcept
          : mDevice(device)
        {}
       ~DeviceProgram() override;

        bool IsValid() const override
        { return mProgram.IsValid(); }
        std::string GetName() const override
        { return mName; }
        std::string GetId() const override
        { return mGpuId; }

        dev::GraphicsProgram GetProgram() const noexcept
        { return mProgram; }

        void SetName(std::string name) noexcept
        { mName = std::move(name); }
        void SetId(std::string id) noexcept
        { mGpuId = std::move(id); }

        bool Build(const std::vector<ShaderPtr>& shaders);

        void ApplyUniformState(const ProgramState& state) const;

    private:
        dev::GraphicsDevice* mDevice = nullptr;
        dev::GraphicsProgram mProgram;
        std::string mName;
        std::string mGpuId;
    };

} // namespace
