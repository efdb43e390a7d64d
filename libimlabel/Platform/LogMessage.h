#pragma once

#include <libimlabel/Platform/LogLevel.h>

#include <chrono>
#include <string>
#include <string_view>

namespace iml
{
    // a non-owning view of a log message
    //
    // to prevent needless runtime allocations, this does not own its data (see
    // `LogMessage` if you need an owning version)
    class LogMessageView final {
    public:
        LogMessageView(std::string_view logger_name, std::string_view payload, LogLevel level) :
            logger_name_{logger_name},
            time_{std::chrono::system_clock::now()},
            payload_{payload},
            level_{level}
        {}

        std::string_view logger_name() const { return logger_name_; }
        std::chrono::system_clock::time_point time() const { return time_; }
        std::string_view payload() const { return payload_; }
        LogLevel level() const { return level_; }

    private:
        std::string_view logger_name_;
        std::chrono::system_clock::time_point time_;
        std::string_view payload_;
        LogLevel level_;
    };

    // a log message that owns all of its data
    class LogMessage final {
    public:
        explicit LogMessage(const LogMessageView& view) :
            logger_name_{view.logger_name()},
            time_{view.time()},
            payload_{view.payload()},
            level_{view.level()}
        {}

        const std::string& logger_name() const { return logger_name_; }
        std::chrono::system_clock::time_point time() const { return time_; }
        const std::string& payload() const { return payload_; }
        LogLevel level() const { return level_; }

    private:
        std::string logger_name_;
        std::chrono::system_clock::time_point time_;
        std::string payload_;
        LogLevel level_;
    };
}
