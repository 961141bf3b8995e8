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

#include <iostream>
#include <chrono>
#include <cstdio>
#include <mutex>

#include "base/assert.h"
#include "base/logging.h"

namespace {
// a thread specific logger object.
thread_local base::Logger* threadLogger;

// global logger
base::Logger* globalLogger;
std::mutex globalLoggerMutex;

// flags to globally specify which log events
// are enabled or not.
bool isGlobalVerboseLogEnabled = false;
bool isGlobalDebugLogEnabled   = false;
bool isGlobalWarnLogEnabled    = true;
bool isGlobalInfoLogEnabled    = true;
bool isGlobalErrorLogEnabled   = true;

} // namespace

namespace base
{

const char* ToString(base::LogEvent e)
{
    switch (e)
    {
        case LogEvent::Verbose:
            return "Verbose";
        case LogEvent::Debug:
           return "Debug";
        case LogEvent::Info:
           return "Info";
        case LogEvent::Warning:
           return "Warning";
        case LogEvent::Error:
            return "Error";
    }
    BUG("Unknown log event.");
    return "";
}

OStreamLogger::OStreamLogger(std::ostream& out) : mOut(&out)
{}

void OStreamLogger::Write(LogEvent type, const char* msg)
{
    if (!mTerminalColors)
    {
        (*mOut) << msg;
        return;
    }
    // Using raw terminal escape sequences here. ncurses requires
    // the use of its own output functions, which garbles any raw
    // stdout output from code that simply printf's something.
    // https://en.wikipedia.org/wiki/ANSI_escape_code#Colors
#if defined(POSIX_OS)
    if (type == LogEvent::Error)
        *mOut << "\033[" << 31 << "m";
    else if (type == LogEvent::Warning)
        *mOut << "\033[" << 33 << "m";
    else if (type == LogEvent::Info)
        *mOut << "\033[" << 36 << "m";

    *mOut << msg;

    // reset terminal color.
    *mOut << "\033[m";
#else
    *mOut << msg;
#endif
}

void OStreamLogger::Flush()
{
    (*mOut).flush();
}

Logger* SetGlobalLog(Logger* log)
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex);

    auto* ret = globalLogger;
    globalLogger = log;
    return ret;
}

Logger* GetGlobalLog()
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex);
    return globalLogger;
}

Logger* GetThreadLog()
{
    return threadLogger;
}

Logger* SetThreadLog(Logger* log)
{
    auto* ret = threadLogger;
    threadLogger = log;
    return ret;
}

void FlushThreadLog()
{
    if (auto* log = threadLogger)
        log->Flush();
}

void FlushGlobalLog()
{
    if (auto* log = GetGlobalLog())
        log->Flush();
}

bool IsDebugLogEnabled()
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex);

    return isGlobalDebugLogEnabled;
}

bool IsLogEventEnabled(LogEvent type)
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex);

    if (type == LogEvent::Verbose)
        return isGlobalVerboseLogEnabled;
    else if (type == LogEvent::Debug)
        return isGlobalDebugLogEnabled;
    else if (type == LogEvent::Warning)
        return isGlobalWarnLogEnabled;
    else if (type == LogEvent::Error)
        return isGlobalErrorLogEnabled;
    else if (type == LogEvent::Info)
        return isGlobalInfoLogEnabled;
    else BUG("No such log event.");
    return false;
}

void EnableLogEvent(LogEvent type, bool on_off)
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex);

    if (type == LogEvent::Verbose)
        isGlobalVerboseLogEnabled = on_off;
    else if (type == LogEvent::Debug)
        isGlobalDebugLogEnabled = on_off;
    else if (type == LogEvent::Warning)
        isGlobalWarnLogEnabled = on_off;
    else if (type == LogEvent::Error)
        isGlobalErrorLogEnabled = on_off;
    else if (type == LogEvent::Info)
        isGlobalInfoLogEnabled = on_off;
    else BUG("No such log event.");
}

void EnableDebugLog(bool on_off)
{
    std::lock_guard<std::mutex> lock(globalLoggerMutex);

    isGlobalDebugLogEnabled = on_off;
}

void WriteLogMessage(LogEvent type, const char* file, int line, const std::string& message)
{
    // strip the path from the file name.
    const char* p = file;
    while (*file) {
        if (*file == '/' || *file == '\\')
            p = file + 1;
        ++file;
    }
    file = p;

    using steady_clock = std::chrono::steady_clock;
    // magic static is thread safe.
    static const auto first_event_time = steady_clock::now();
    const auto current_event_time = steady_clock::now();
    const auto elapsed = current_event_time - first_event_time;
    const double seconds = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() / 1000.0;

    auto* logger = GetThreadLog();
    if (logger == nullptr)
        logger = GetGlobalLog();
    if (logger == nullptr)
        return;

    if (logger->TestWriteMask(Logger::WriteType::WriteRaw))
        logger->Write(type, file, line, message.c_str(), seconds);

    if (logger->TestWriteMask(Logger::WriteType::WriteFormatted))
    {
        // long messages (shader info logs) are truncated
        char formatted_log_message[1024] = {0};
        std::snprintf(formatted_log_message, sizeof(formatted_log_message) - 1,
                      "[%f] %s: %s:%d \"%s\"\n",
                      seconds, ToString(type), file, line, message.c_str());
        logger->Write(type, formatted_log_message);
    }
}

} // base
