#pragma once

#include <libimlabel/Platform/LogLevel.h>
#include <libimlabel/Platform/LogMessage.h>
#include <libimlabel/Platform/Logger.h>

#include <cstddef>
#include <memory>
#include <vector>

// log: process-wide logging
//
// the default logger writes `[imlabel] [level] message` lines to stderr and
// also keeps a bounded traceback of recent messages in memory

namespace iml
{
    inline constexpr size_t c_max_log_traceback_messages = 256;

    std::shared_ptr<Logger> global_default_logger();
    Logger* global_default_logger_raw();

    template<typename... Args>
    void log_message(LogLevel level, const char* fmt, const Args&... args)
    {
        global_default_logger_raw()->log_message(level, fmt, args...);
    }

    template<typename... Args>
    void log_trace(const char* fmt, const Args&... args)
    {
        global_default_logger_raw()->trace(fmt, args...);
    }

    template<typename... Args>
    void log_debug(const char* fmt, const Args&... args)
    {
        global_default_logger_raw()->debug(fmt, args...);
    }

    template<typename... Args>
    void log_info(const char* fmt, const Args&... args)
    {
        global_default_logger_raw()->info(fmt, args...);
    }

    template<typename... Args>
    void log_warn(const char* fmt, const Args&... args)
    {
        global_default_logger_raw()->warn(fmt, args...);
    }

    template<typename... Args>
    void log_error(const char* fmt, const Args&... args)
    {
        global_default_logger_raw()->error(fmt, args...);
    }

    template<typename... Args>
    void log_critical(const char* fmt, const Args&... args)
    {
        global_default_logger_raw()->critical(fmt, args...);
    }

    LogLevel log_level();
    void set_log_level(LogLevel);  // sets the level of the stderr sink

    LogLevel global_get_traceback_level();
    void global_set_traceback_level(LogLevel);
    std::vector<LogMessage> global_copy_traceback_log();
}
