#pragma once

#include <libimlabel/Platform/LogLevel.h>
#include <libimlabel/Platform/LogMessage.h>

namespace iml
{
    // an interface to something that can consume log messages (console, buffer, file, etc.)
    class ILogSink {
    protected:
        ILogSink() = default;
        ILogSink(const ILogSink&) = default;
        ILogSink(ILogSink&&) noexcept = default;
        ILogSink& operator=(const ILogSink&) = default;
        ILogSink& operator=(ILogSink&&) noexcept = default;
    public:
        virtual ~ILogSink() noexcept = default;

        void sink_message(const LogMessageView& view) { impl_sink_message(view); }

        LogLevel level() const { return impl_level(); }
        void set_level(LogLevel level) { impl_set_level(level); }
        bool should_log(LogLevel level) const { return level >= this->level(); }

    private:
        virtual void impl_sink_message(const LogMessageView&) = 0;
        virtual LogLevel impl_level() const = 0;
        virtual void impl_set_level(LogLevel) = 0;
    };
}
