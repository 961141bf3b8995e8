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

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "base/platform.h"
#include "base/bitflag.h"
#include "base/assert.h"
#include "base/test_minimal.h"

#if defined(POSIX_OS)
#  include <signal.h> // for raise/signal
#endif

namespace test {

base::bitflag<Type>      EnabledTestTypes;
std::vector<std::string> EnabledTestNames;

unsigned ErrorCount = 0;

static bool EnableFatality = true;

void Print(Color color, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);

#if defined(POSIX_OS)
    if (color == Color::Error)
        std::printf("\033[%dm", 31);
    else if (color == Color::Warning)
        std::printf("\033[%dm", 93);
    else if (color == Color::Success)
        std::printf("\033[%dm", 32);
    else if (color == Color::Info)
        std::printf("\033[%dm", 97);
    std::vprintf(fmt, args);
    std::printf("\033[m");
#else
    std::vprintf(fmt, args);
#endif

    va_end(args);
    std::fflush(stdout);
}

const char* GetFileName(const char* file)
{
    // strip the path from the filename
    const char* p = file;
    while (*file) {
        if (*file == '/' || *file == '\\')
            p = file + 1;
        ++file;
    }
    return p;
}

const char* GetTestName(const char* function_name)
{
    return function_name;
}

void BlurpFailure(const char* expression, const char* file, const char* function, int line, bool fatality)
{
    ++ErrorCount;

    file = GetFileName(file);

    if (fatality && EnableFatality)
    {
#if defined(POSIX_OS)
        if (debug::has_debugger())
            ::raise(SIGTRAP);
#endif
        // instead of exiting/aborting the process here throw an exception
        // for unwinding the stack back to main which can then report
        // the total test case tally. This won't work if there's a
        // catch block in the test that would catch this exception.
        throw Fatality(expression, file, function, line);
    }
    test::Print(Color::Warning, "\n%s(%d): %s failed in function: '%s'\n\n", file, line, expression, function);
}

bool IsEnabledByName(const std::string& name)
{
    if (EnabledTestNames.empty())
        return true;

    for (const auto& str : EnabledTestNames)
    {
        if (name.find(str) != std::string::npos)
            return true;
    }
    return false;
}

bool IsEnabledByType(Type type)
{
    return EnabledTestTypes.test(type);
}

} // namespace

int main(int argc, char* argv[])
{
    test::EnabledTestTypes.set(test::Type::Feature,     true);
    test::EnabledTestTypes.set(test::Type::Performance, true);
    test::EnabledTestTypes.set(test::Type::Other,       true);
    for (int i=1; i<argc; ++i)
    {
        if (!std::strcmp(argv[i], "--disable-fatality") ||
            !std::strcmp(argv[i], "-df"))
            test::EnableFatality = false;
        else if (!std::strcmp(argv[i], "--disable-perf-test") ||
                 !std::strcmp(argv[i], "-dpt"))
            test::EnabledTestTypes.set(test::Type::Performance, false);
        else if (!std::strcmp(argv[i], "--disable-feature-test") ||
                 !std::strcmp(argv[i], "-dft"))
            test::EnabledTestTypes.set(test::Type::Feature, false);
        else if (!std::strcmp(argv[i], "--disable-other-test") ||
                 !std::strcmp(argv[i], "-dot"))
            test::EnabledTestTypes.set(test::Type::Other, false);
        else if ((!std::strcmp(argv[i], "--case") ||
                  !std::strcmp(argv[i], "-c")) && i + 1 < argc)
            test::EnabledTestNames.emplace_back(argv[++i]);
    }
    try
    {
        extern int test_main(int argc, char* argv[]);
        test_main(argc, argv);

        if (test::ErrorCount)
            test::Print(test::Color::Warning, "Tests completed with errors.\n");
        else test::Print(test::Color::Success, "Success!\n");
    }
    catch (const test::Fatality& fatality)
    {
        test::Print(test::Color::Error, "\n%s(%d): %s failed in function: '%s'\n",
                    fatality.mFile, fatality.mLine, fatality.mExpression, fatality.mFunc);
        test::Print(test::Color::Warning, "\nTesting finished early on fatality.\n");
        return 1;
    }
    catch (const std::exception & e)
    {
        test::Print(test::Color::Error, "\nTests didn't run to completion because an exception occurred!\n\n");
        test::Print(test::Color::Error, "%s\n", e.what());
        return 1;
    }
    return test::ErrorCount ? 1 : 0;
}
