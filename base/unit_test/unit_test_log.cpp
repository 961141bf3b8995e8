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

#include <thread>
#include <iostream>

#include "base/test_minimal.h"
#include "base/logging.h"

void thread_entry(base::Logger* logger)
{
    base::SetThreadLog(logger);
    for (int i=0; i<100; ++i)
    {
        INFO("thread");
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    base::SetThreadLog(nullptr);
}

void unit_test_global_log()
{
    TEST_CASE(test::Type::Feature)

    base::NullLogger null;
    base::SetGlobalLog(&null);
    TEST_REQUIRE(base::GetGlobalLog() == &null);
    base::SetGlobalLog(nullptr);
    TEST_REQUIRE(base::GetGlobalLog() == nullptr);
    base::EnableDebugLog(true);
    TEST_REQUIRE(base::IsDebugLogEnabled());
    base::EnableDebugLog(false);
    TEST_REQUIRE(base::IsDebugLogEnabled() == false);

    base::EnableLogEvent(base::LogEvent::Verbose, true);
    TEST_REQUIRE(base::IsLogEventEnabled(base::LogEvent::Verbose));
    base::EnableLogEvent(base::LogEvent::Verbose, false);
    TEST_REQUIRE(!base::IsLogEventEnabled(base::LogEvent::Verbose));
}

void unit_test_buffer_log()
{
    TEST_CASE(test::Type::Feature)

    base::BufferLogger<base::NullLogger> logger;
    base::SetGlobalLog(&logger);
    base::EnableDebugLog(true);

    DEBUG("debug");
    INFO("information %1", 123);
    WARN("warning %1 %2", "foo", 1.5f);
    ERROR("error");
    VERBOSE("not enabled");

    TEST_REQUIRE(logger.GetBufferMsgCount() == 4);
    TEST_REQUIRE(logger.GetMessage(0).msg == "debug");
    TEST_REQUIRE(logger.GetMessage(0).line != 0);
    TEST_REQUIRE(logger.GetMessage(0).file == "unit_test_log.cpp");
    TEST_REQUIRE(logger.GetMessage(0).type == base::LogEvent::Debug);

    TEST_REQUIRE(logger.GetMessage(1).msg == "information 123");
    TEST_REQUIRE(logger.GetMessage(1).type == base::LogEvent::Info);

    TEST_REQUIRE(logger.GetMessage(2).msg == "warning foo 1.500000");
    TEST_REQUIRE(logger.GetMessage(2).type == base::LogEvent::Warning);

    TEST_REQUIRE(logger.GetMessage(3).msg == "error");
    TEST_REQUIRE(logger.GetMessage(3).type == base::LogEvent::Error);

    logger.Dispatch();
    TEST_REQUIRE(logger.GetBufferMsgCount() == 0);

    // debug messages are filtered at runtime.
    base::EnableDebugLog(false);
    DEBUG("debug");
    TEST_REQUIRE(logger.GetBufferMsgCount() == 0);

    base::SetGlobalLog(nullptr);
}

void unit_test_thread_log()
{
    TEST_CASE(test::Type::Feature)

    // thread specific logs take precedence over the global log.
    {
        base::BufferLogger<base::NullLogger> global;
        base::BufferLogger<base::NullLogger> one;
        base::BufferLogger<base::NullLogger> two;
        base::SetGlobalLog(&global);

        std::thread t0(thread_entry, &one);
        std::thread t1(thread_entry, &two);

        t0.join();
        t1.join();
        TEST_REQUIRE(one.GetBufferMsgCount() == 100);
        TEST_REQUIRE(two.GetBufferMsgCount() == 100);
        TEST_REQUIRE(global.GetBufferMsgCount() == 0);
        base::SetGlobalLog(nullptr);
    }

    // thread safe log.
    {
        base::LockedLogger<base::BufferLogger<base::NullLogger>> log;
        base::SetGlobalLog(&log);

        std::thread t0(thread_entry, &log);
        std::thread t1(thread_entry, &log);
        thread_entry(&log);

        t0.join();
        t1.join();
        TEST_REQUIRE(log.GetLoggerUnsafe().GetBufferMsgCount() == 300);
        base::SetGlobalLog(nullptr);
    }
}

void unit_test_terminal_log()
{
    TEST_CASE(test::Type::Other)

    base::OStreamLogger logger(std::cout);
    logger.EnableTerminalColors(true);
    base::SetGlobalLog(&logger);
    base::EnableDebugLog(true);
    DEBUG("Hello");
    INFO("Hello");
    WARN("Hello");
    ERROR("Hello");
    base::EnableDebugLog(false);
    base::SetGlobalLog(nullptr);
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    unit_test_global_log();
    unit_test_buffer_log();
    unit_test_thread_log();
    unit_test_terminal_log();
    return 0;
}
) // TEST_MAIN
