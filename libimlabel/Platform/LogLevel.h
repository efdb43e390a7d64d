#pragma once

#include <optional>
#include <string_view>

namespace iml
{
    enum class LogLevel {
        trace = 0,
        debug,
        info,
        warn,
        err,
        critical,
        off,
        NUM_OPTIONS,
        DEFAULT = info,
    };

    std::string_view to_string_view(LogLevel);
    const char* to_cstring(LogLevel);

    // parses a case-sensitive level name (e.g. "info", "warning"), returns `std::nullopt` if unrecognized
    std::optional<LogLevel> try_parse_as_log_level(std::string_view);
}
