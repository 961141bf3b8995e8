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

namespace debug
{
    // check if running in debugger
    bool has_debugger();

    // print the failed expression and the callstack and abort.
    [[noreturn]]
    void do_assert(const char* expression, const char* file, const char* func, int line);

    // Force a breakpoint when having a debugger attached or otherwise abort
    [[noreturn]]
    void do_break();

} // debug

// ASSERT is *always* compiled in, unlike the standard assert which is
// elided in release builds. It's used for conditions whose violation
// means the program is in an undefined state (programmer error), not
// for validating input. Invalid input is reported by throwing
// std::runtime_error from the API that received it.
// On failure the process dumps core instead of throwing so that the
// state at the point of failure is preserved for post-mortem analysis.
#define ASSERT(expr) \
    (expr) \
    ? ((void)0) \
    : (debug::has_debugger() ? \
        debug::do_break() : \
        debug::do_assert(#expr, __FILE__, __PRETTY_FUNCTION__, __LINE__))
#define BUG(message)                                                    \
  do {                                                                  \
    debug::has_debugger()                                               \
  ? debug::do_break()                                                   \
  : debug::do_assert(message, __FILE__, __PRETTY_FUNCTION__, __LINE__); \
} while(0)
