#include "Log.h"

#include <libimlabel/Platform/LogSink.h>

#include <algorithm>
#include <array>
#include <cstdarg>
#include <cstdio>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace iml;

void iml::Logger::log_message(LogLevel level, const char* fmt, ...)
{
    if (level < level_) {
        return;
    }

    bool should_log = false;
    for (const auto& sink : sinks_) {
        should_log = should_log or sink->should_log(level);
    }
    if (not should_log) {
        return;
    }

    // format the message into a fixed-size buffer (longer messages are truncated)
    std::array<char, 2048> buffer{};
    va_list args;
    va_start(args, fmt);
    const int n = std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    va_end(args);
    if (n < 0) {
        return;
    }
    const size_t length = std::min(static_cast<size_t>(n), buffer.size() - 1);

    const LogMessageView view{name_, std::string_view{buffer.data(), length}, level};
    for (const auto& sink : sinks_) {
        if (sink->should_log(level)) {
            sink->sink_message(view);
        }
    }
}

namespace
{
    constexpr std::string_view c_default_logger_name = "imlabel";

    class StderrSink final : public LogSink {
    private:
        void impl_sink_message(const LogMessageView& view) final
        {
            const std::lock_guard lock{mutex_};
            std::cerr << '[' << view.logger_name() << "] [" << to_string_view(view.level()) << "] " << view.payload() << '\n';
        }

        std::mutex mutex_;
    };

    class TracebackSink final : public LogSink {
    public:
        std::vector<LogMessage> copy_messages() const
        {
            const std::lock_guard lock{mutex_};
            return {messages_.begin(), messages_.end()};
        }

    private:
        void impl_sink_message(const LogMessageView& view) final
        {
            const std::lock_guard lock{mutex_};
            if (messages_.size() >= c_max_log_traceback_messages) {
                messages_.pop_front();
            }
            messages_.emplace_back(view);
        }

        mutable std::mutex mutex_;
        std::deque<LogMessage> messages_;
    };

    struct GlobalSinks final {
        std::shared_ptr<StderrSink> stderr_sink = std::make_shared<StderrSink>();
        std::shared_ptr<TracebackSink> traceback_sink = std::make_shared<TracebackSink>();
        std::shared_ptr<Logger> default_logger = [this]()
        {
            auto logger = std::make_shared<Logger>(std::string{c_default_logger_name}, stderr_sink);
            logger->sinks().push_back(traceback_sink);
            return logger;
        }();
    };

    GlobalSinks& global_sinks()
    {
        static GlobalSinks s_sinks;
        return s_sinks;
    }
}

std::shared_ptr<Logger> iml::global_default_logger()
{
    return global_sinks().default_logger;
}

Logger* iml::global_default_logger_raw()
{
    return global_sinks().default_logger.get();
}

LogLevel iml::log_level()
{
    return global_sinks().stderr_sink->level();
}

void iml::set_log_level(LogLevel level)
{
    global_sinks().stderr_sink->set_level(level);
}

LogLevel iml::global_get_traceback_level()
{
    return global_sinks().traceback_sink->level();
}

void iml::global_set_traceback_level(LogLevel level)
{
    global_sinks().traceback_sink->set_level(level);
}

std::vector<LogMessage> iml::global_copy_traceback_log()
{
    return global_sinks().traceback_sink->copy_messages();
}
