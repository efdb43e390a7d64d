#pragma once

#include <libimlabel/Platform/ILogSink.h>
#include <libimlabel/Platform/LogLevel.h>

#include <atomic>

namespace iml
{
    // an `ILogSink` that stores its level filter, so that concrete sinks only
    // need to handle messages
    class LogSink : public ILogSink {
    private:
        LogLevel impl_level() const final { return level_.load(); }
        void impl_set_level(LogLevel level) final { level_.store(level); }

        std::atomic<LogLevel> level_{LogLevel::DEFAULT};
    };
}
