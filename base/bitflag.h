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

#include <cstdint>
#include <initializer_list>

#include "base/assert.h"

namespace base
{
    // type safe set of enum flags. each enum value maps to one bit
    // so the enum values must be sequential from 0 and fit in Bits.
    template<typename Enum,
        typename Bits = std::uint32_t>
    class bitflag
    {
    public:
        enum {
            BitCount = sizeof(Bits) * 8
        };
        bitflag() = default;
        bitflag(Enum initial)
        {
            set(initial);
        }
        explicit bitflag(Bits value) : bits_(value)
        {}
        bitflag(const std::initializer_list<Enum>& values)
        {
            for (auto e : values)
            {
                set(e, true);
            }
        }

        bitflag& set(Enum value, bool on = true)
        {
            const auto b = bittify(value);

            if (on)
                bits_ |= b;
            else bits_ &= ~b;
            return *this;
        }

        bitflag& operator |= (bitflag other)
        {
            bits_ |= other.bits_;
            return *this;
        }

        // test a particular value.
        bool test(Enum value) const
        {
            const auto b = bittify(value);
            return (bits_ & b) == b;
        }

        // test for any value.
        bool test(bitflag values) const
        { return bits_ & values.bits_; }

        void clear()
        { bits_ = 0x0; }

        bool any_bit() const
        { return bits_ != 0; }

        Bits value() const
        { return bits_; }

    private:
        static Bits bittify(Enum value)
        {
            ASSERT(static_cast<unsigned>(value) < BitCount);
            return Bits(1) << Bits(value);
        }

    private:
        Bits bits_ = 0;
    };

    template<typename Enum, typename Bits>
    auto operator | (bitflag<Enum, Bits> lhs, bitflag<Enum, Bits> rhs) -> decltype(lhs)
    {
        return bitflag<Enum, Bits>(lhs.value() | rhs.value());
    }

    template<typename Enum, typename Bits>
    bool operator == (bitflag<Enum, Bits> lhs, bitflag<Enum, Bits> rhs)
    {
        return lhs.value() == rhs.value();
    }

} // base
