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

#include <type_traits>

#include "warnpush.h"
#  include <boost/random/mersenne_twister.hpp>
#  include <boost/random/uniform_int_distribution.hpp>
#  include <boost/random/uniform_real_distribution.hpp>
#include "warnpop.h"

namespace base
{
    // Pseudo random number generator with an explicit seed so that
    // the same seed always produces the same sequence. Each instance
    // has its own engine state.
    template<typename T>
    class RandomGenerator
    {
    public:
        explicit RandomGenerator(unsigned seed) noexcept
          : mEngine(seed)
        {}
        RandomGenerator(unsigned seed, T min, T max) noexcept
          : mEngine(seed)
          , mMin(min)
          , mMax(max)
        {}
        T operator()() noexcept
        { return Generate(mMin, mMax); }

        // generate a random number in the range of min max (inclusive)
        T operator()(T min, T max) noexcept
        { return Generate(min, max); }
    private:
        T Generate(T min, T max) noexcept
        {
            // boost uniform distribution has an assert for the condition
            // that min < max. simply return min.
            if (min >= max)
                return min;

            if constexpr (std::is_floating_point<T>::value) {
                boost::random::uniform_real_distribution<T> dist(min, max);
                return dist(mEngine);
            } else {
                boost::random::uniform_int_distribution<T> dist(min, max);
                return dist(mEngine);
            }
        }
    private:
        boost::random::mt19937 mEngine;
        T mMin = T();
        T mMax = T();
    };

} // namespace
