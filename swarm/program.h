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
#  include <glm/mat4x4.hpp>
#include "warnpop.h"

#include <string>
#include <vector>
#include <variant>
#include <memory>

#include "base/assert.h"
#include "device/uniform.h"

namespace swarm
{
    class Shader;
    class Texture;

    // The uniform values and the texture sampler bindings that
    // are applied on a program when it's used to draw.
    class ProgramState
    {
    public:
        struct Sampler {
            std::string name;
            unsigned unit = 0;
            const Texture* texture = nullptr;
        };
        using Uniform = dev::Uniform;
        using UniformValue = dev::UniformValType;

        // Set a uniform value. Setting a uniform that has been set
        // before replaces the previous value.
        void SetUniform(const std::string& name, UniformValue value)
        {
            for (auto& u : mUniforms)
            {
                if (u.name != name)
                    continue;
                u.value = std::move(value);
                return;
            }
            mUniforms.push_back({name, std::move(value)});
        }

        // Set scalar uniform.
        inline void SetUniform(const std::string& name, int x)
        { SetUniform(name, UniformValue{x}); }
        // Set scalar uniform.
        inline void SetUniform(const std::string& name, float x)
        { SetUniform(name, UniformValue{x}); }
        // Set vec2 uniform.
        inline void SetUniform(const std::string& name, float x, float y)
        { SetUniform(name, UniformValue{glm::vec2{x, y}}); }
        // Set vec3 uniform.
        inline void SetUniform(const std::string& name, float x, float y, float z)
        { SetUniform(name, UniformValue{glm::vec3{x, y, z}}); }
        inline void SetUniform(const std::string& name, const glm::vec2& vector)
        { SetUniform(name, UniformValue{vector}); }
        inline void SetUniform(const std::string& name, const glm::vec3& vector)
        { SetUniform(name, UniformValue{vector}); }
        inline void SetUniform(const std::string& name, const glm::vec4& vector)
        { SetUniform(name, UniformValue{vector}); }

        // Set 4x4 matrix uniform. The matrix memory layout is column
        // major, i.e. the first 4 floats are the X vector etc.
        inline void SetUniform(const std::string& name, const glm::mat4& matrix)
        { SetUniform(name, UniformValue{matrix}); }

        // Set a texture sampler.
        // Sampler is the name of the texture sampler in the shader.
        // It's possible to sample multiple textures in the program by setting each
        // texture to a different texture unit.
        void SetTexture(const std::string& sampler, unsigned unit, const Texture& texture)
        {
            if (unit >= mSamplers.size())
                mSamplers.resize(unit + 1);

            mSamplers[unit].texture = &texture;
            mSamplers[unit].name    = sampler;
            mSamplers[unit].unit    = unit;
        }
        // Set a texture on the sampler with the given name. If the
        // sampler has no unit yet the next free unit is used.
        void SetTexture(const std::string& sampler, const Texture& texture)
        {
            for (auto& s : mSamplers)
            {
                if (s.name != sampler)
                    continue;
                s.texture = &texture;
                return;
            }
            SetTexture(sampler, static_cast<unsigned>(mSamplers.size()), texture);
        }
        // Set the number of textures used by the next draw.
        inline void SetTextureCount(unsigned count)
        { mSamplers.resize(count); }

        inline size_t GetUniformCount() const noexcept
        { return mUniforms.size(); }
        inline size_t GetSamplerCount() const noexcept
        { return mSamplers.size(); }
        inline const Sampler& GetSamplerSetting(size_t index) const noexcept
        { return mSamplers[index]; }
        inline const Uniform& GetUniformSetting(size_t index) const noexcept
        { return mUniforms[index]; }

        template<typename T>
        bool GetUniform(const std::string& name, T* value) const noexcept
        {
            for (const auto& u : mUniforms)
            {
                if (u.name != name)
                    continue;
                ASSERT(std::holds_alternative<T>(u.value));
                *value = std::get<T>(u.value);
                return true;
            }
            return false;
        }
        inline bool HasUniform(const std::string& name) const noexcept
        {
            for (const auto& u : mUniforms)
            {
                if (u.name == name)
                    return true;
            }
            return false;
        }

        inline void Clear() noexcept
        {
            mUniforms.clear();
            mSamplers.clear();
        }

        const Sampler* FindTextureBinding(const std::string& name) const
        {
            for (const auto& s : mSamplers)
            {
                if (s.name == name)
                    return &s;
            }
            return nullptr;
        }
    private:
        std::vector<Sampler> mSamplers;
        std::vector<Uniform> mUniforms;
    };

    // Program object interface. Program objects are device
    // specific graphics programs that are built from shaders
    // and then uploaded and executed on the device.
    class Program
    {
    public:
        struct CreateArgs {
            // The program state that is applied initially on the program
            // once when created. Note that this only applies to uniforms!
            ProgramState state;
            // The program human-readable debug name
            std::string name;
            // mandatory fragment shader. Must be valid
            std::shared_ptr<const Shader> fragment_shader;
            // mandatory vertex shader. Must be valid.
            std::shared_ptr<const Shader> vertex_shader;
        };
        virtual ~Program() = default;

        // Returns true if the program is valid or not I.e. it has been
        // successfully build and can be used for drawing.
        virtual bool IsValid() const = 0;
        // Get the human-readable name of the program.
        virtual std::string GetName() const = 0;
        // Get the ID the program was created with.
        virtual std::string GetId() const = 0;
    private:
    };

    using ProgramPtr = std::shared_ptr<const Program>;

} // namespace
