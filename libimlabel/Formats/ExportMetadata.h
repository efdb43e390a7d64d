#pragma once

#include <ctime>
#include <string>
#include <string_view>

namespace iml
{
    // information about who/what wrote an exported file, and when
    struct ExportMetadata final {

        explicit ExportMetadata();

        explicit ExportMetadata(std::string_view authoring_tool_);

        ExportMetadata(std::string_view authoring_tool_, const std::tm& creation_time_);

        std::string authoring_tool;
        std::tm creation_time;
    };

    // returns the name of this library, as written into exported files by default
    std::string_view library_name();

    // returns the calendar time as an ISO 8601 string (e.g. "2024-03-01T14:05:09")
    std::string to_iso8601_string(const std::tm&);
}
