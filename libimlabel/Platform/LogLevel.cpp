#include "LogLevel.h"

#include <array>
#include <cstddef>

using namespace iml;

namespace
{
    constexpr auto c_log_level_strings = std::to_array<const char*>({
        "trace",
        "debug",
        "info",
        "warning",
        "error",
        "critical",
        "off",
    });
    static_assert(c_log_level_strings.size() == static_cast<size_t>(LogLevel::NUM_OPTIONS));
}

std::string_view iml::to_string_view(LogLevel level)
{
    return to_cstring(level);
}

const char* iml::to_cstring(LogLevel level)
{
    return c_log_level_strings.at(static_cast<size_t>(level));
}

std::optional<LogLevel> iml::try_parse_as_log_level(std::string_view str)
{
    for (size_t i = 0; i < c_log_level_strings.size(); ++i) {
        if (str == c_log_level_strings[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return std::nullopt;
}
