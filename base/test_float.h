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

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <cmath>

namespace real
{
    // IEEE 754 single precision float with access to the bit
    // representation for ulps (units in the last place) comparison.
    class float32
    {
    public:
        explicit
        float32(double d) : m_f(static_cast<float>(d))
        { std::memcpy(&m_i, &m_f, sizeof(m_i)); }

        explicit
        float32(float f) :  m_f(f)
        { std::memcpy(&m_i, &m_f, sizeof(m_i)); }

        int sign() const
        {
            // 1 for negative numbers, 0 for positive
            return (m_i >> 31);
        }
        int exponent() const
        {
            return ((m_i >> 23) & 0xff);
        }
        int mantissa() const
        {
            return m_i & ((1 << 23) - 1);
        }
        float as_float() const
        {
            return m_f;
        }
        int ulps(const float32& other) const
        {
            return static_cast<int>(std::llabs((long long)m_i - (long long)other.m_i));
        }
        bool is_zero() const
        {
            return !(m_i & 0x7FFFFFFF);
        }
        bool is_NaN() const
        {
            return exponent() == 255 && mantissa() != 0;
        }
        bool is_inf() const
        {
            return exponent() == 255 && mantissa() == 0;
        }
    private:
        float    m_f = 0.0f;
        uint32_t m_i = 0;
    };

    inline bool equals(float a, float b)
    {
        const float32 a32(a);
        const float32 b32(b);
        if (a32.is_NaN() || b32.is_NaN())
            return false;

        if (a32.sign() != b32.sign())
        {
            if (a32.is_zero() && b32.is_zero())
                return true;
            return false;
        }

        const int ulps = a32.ulps(b32);
        return (ulps <= 1);
    }

    // absolute tolerance comparison for values that went through
    // a lossy conversion such as 8 bit quantization.
    inline bool near(float a, float b, float epsilon)
    {
        return std::fabs(a - b) <= epsilon;
    }

    inline bool operator==(const float32& f32, float f)
    { return equals(f32.as_float(), f); }
    inline bool operator!=(const float32& f32, float f)
    { return !equals(f32.as_float(), f); }

    inline bool operator==(float f, const float32& f32)
    { return equals(f, f32.as_float()); }
    inline bool operator!=(float f, const float32& f32)
    { return !equals(f, f32.as_float()); }

#define F32(x) \
    real::float32(x)

} // namespace
