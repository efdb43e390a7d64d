#pragma once

#include <libimlabel/Platform/ILogSink.h>
#include <libimlabel/Platform/LogLevel.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace iml
{
    // a named logger that formats printf-style messages and forwards them to its sinks
    class Logger final {
    public:
        explicit Logger(std::string name) :
            name_{std::move(name)}
        {}

        Logger(std::string name, std::shared_ptr<ILogSink> sink) :
            name_{std::move(name)},
            sinks_{std::move(sink)}
        {}

        // formats `fmt` with the (printf-compatible) variadic arguments and
        // forwards the result to each sink that accepts `level`
        void log_message(LogLevel level, const char* fmt, ...);

        template<typename... Args>
        void trace(const char* fmt, const Args&... args) { log_message(LogLevel::trace, fmt, args...); }

        template<typename... Args>
        void debug(const char* fmt, const Args&... args) { log_message(LogLevel::debug, fmt, args...); }

        template<typename... Args>
        void info(const char* fmt, const Args&... args) { log_message(LogLevel::info, fmt, args...); }

        template<typename... Args>
        void warn(const char* fmt, const Args&... args) { log_message(LogLevel::warn, fmt, args...); }

        template<typename... Args>
        void error(const char* fmt, const Args&... args) { log_message(LogLevel::err, fmt, args...); }

        template<typename... Args>
        void critical(const char* fmt, const Args&... args) { log_message(LogLevel::critical, fmt, args...); }

        const std::vector<std::shared_ptr<ILogSink>>& sinks() const { return sinks_; }
        std::vector<std::shared_ptr<ILogSink>>& sinks() { return sinks_; }

        LogLevel level() const { return level_; }
        void set_level(LogLevel level) { level_ = level; }

    private:
        std::string name_;
        std::vector<std::shared_ptr<ILogSink>> sinks_;
        LogLevel level_ = LogLevel::trace;
    };
}
