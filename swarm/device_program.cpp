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

#include "base/assert.h"
#include "base/logging.h"
#include "base/utility.h"
#include "device/graphics.h"
#include "swarm/program.h"
#include "swarm/device_program.h"
#include "swarm/device_shader.h"

namespace swarm
{

DeviceProgram::~DeviceProgram()
{
    if (mProgram.IsValid())
    {
        mDevice->DeleteProgram(mProgram);
        DEBUG("Deleted program object. [name='%1']", mName);
    }
}

bool DeviceProgram::Build(const std::vector<swarm::ShaderPtr>& shaders)
{
    std::vector<dev::GraphicsShader> shader_handles;
    for (const auto& shader : shaders)
    {
        if (!shader || !shader->IsValid())
        {
            ERROR("Program has an invalid shader. [name='%1', shader='%2']", mName,
                  shader ? shader->GetName() : std::string("null"));
            return false;
        }
        const auto* ptr = static_cast<const swarm::DeviceShader*>(shader.get());
        shader_handles.push_back(ptr->GetShader());
    }

    std::string build_info;
    auto program = mDevice->BuildProgram(shader_handles, &build_info);
    if (!program.IsValid())
    {
        ERROR("Program build error. [name='%1']",  mName);
        const auto& error_lines = base::SplitString(build_info, '\n');
        for (const auto& error_line : error_lines)
        {
            if (error_line.empty())
                continue;
            ERROR("Program error: %1", error_line);
        }

        for (const auto& shader : shaders)
        {
            const auto* ptr = static_cast<const swarm::DeviceShader*>(shader.get());
            ptr->DumpSource();
        }
        return false;
    }

    DEBUG("Program was built successfully. [name='%1']", mName);

    const auto& info_lines = base::SplitString(build_info, '\n');
    for (const auto& info_line : info_lines)
    {
        if (info_line.empty())
            continue;
        INFO("Program info: %1", info_line);
    }

    for (auto& shader : shaders)
    {
        const auto* ptr = static_cast<const swarm::DeviceShader*>(shader.get());
        ptr->ClearSource();
    }
    mProgram = program;
    return true;
}

void DeviceProgram::ApplyUniformState(const ProgramState& state) const
{
    ASSERT(mProgram.IsValid());

    dev::ProgramState ps;
    for (size_t i=0; i<state.GetUniformCount(); ++i)
    {
        const auto& uniform = state.GetUniformSetting(i);
        ps.uniforms.push_back(&uniform);
    }
    mDevice->SetProgramState(mProgram, ps);
}

} // namespace
