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

#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <atomic>
#include <iostream>

#if defined(WINDOWS_OS)
#  include "warnpush.h"
#  include <windows.h>
#  include "warnpop.h"
#elif defined(LINUX_OS)
#  include <execinfo.h>
#  include <unistd.h>
#  include <fcntl.h>
#endif

#if defined(POSIX_OS)
#  include <signal.h>
#endif

#include "base/assert.h"

// So where is my core file?
// ulimit -c unlimited
// cat /proc/sys/kernel/core_pattern

namespace {
std::atomic_flag mutex = ATOMIC_FLAG_INIT;
} // namespace

namespace debug
{

void do_break()
{
    if (has_debugger())
    {
#if defined(WINDOWS_OS)
        DebugBreak();
#elif defined(POSIX_OS)
        ::raise(SIGTRAP);
#endif
    }
    std::abort();
}

void do_assert(const char* expression, const char* file, const char* func, int line)
{
    // if one thread is already asserting then spin lock other threads here.
    if (mutex.test_and_set())
        while (1);

    // flush previous output before dumping core.
    std::cerr.flush();
    std::cout.flush();
    std::fflush(stdout);
    std::fflush(stderr);

    std::fprintf(stderr, "%s:%i: %s: Assertion `%s' failed.\n", file, line, func, expression);

#if defined(LINUX_OS)
    constexpr int MAX_CALLSTACK = 62;
    void* callstack[MAX_CALLSTACK] = {0};

    const int frames = backtrace(callstack, MAX_CALLSTACK);
    if (frames == 0)
        std::abort();

    // for backtrace symbols to work you need -rdynamic ld (linker) flag
    char** strings = backtrace_symbols(callstack, frames);
    if (strings == nullptr)
        std::abort();

    for (int i=0; i<frames; ++i)
    {
        std::fprintf(stderr, "Frame (%d): @ %p, '%s'\n",
            i, callstack[i], strings[i]);
    }
    free(strings);
#endif
    std::abort();
}

bool has_debugger()
{
#if defined(WINDOWS_OS)
    return (IsDebuggerPresent() == TRUE);
#elif defined(LINUX_OS)
    // a traced process has a non-zero TracerPid in /proc/self/status
    char buf[4096];

    const int status_fd = ::open("/proc/self/status", O_RDONLY);
    if (status_fd == -1)
        return false;

    const ssize_t num_read = ::read(status_fd, buf, sizeof(buf) - 1);
    ::close(status_fd);

    if (num_read <= 0)
        return false;

    buf[num_read] = '\0';
    constexpr char tracerPidString[] = "TracerPid:";
    const auto* tracer_pid_ptr = ::strstr(buf, tracerPidString);
    if (!tracer_pid_ptr)
        return false;

    for (const char* ptr = tracer_pid_ptr + sizeof(tracerPidString) - 1; ptr <= buf + num_read; ++ptr)
    {
        if (::isspace(*ptr))
            continue;
        return ::isdigit(*ptr) != 0 && *ptr != '0';
    }
    return false;
#else
    return false;
#endif
}

} // debug
