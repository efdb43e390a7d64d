#include "ExportMetadata.h"

#include <libimlabel/Platform/os.h>

#include <iomanip>
#include <sstream>
#include <utility>

using namespace iml;

iml::ExportMetadata::ExportMetadata() :
    ExportMetadata{library_name()}
{}

iml::ExportMetadata::ExportMetadata(std::string_view authoring_tool_) :
    authoring_tool{authoring_tool_},
    creation_time{system_calendar_time()}
{}

iml::ExportMetadata::ExportMetadata(std::string_view authoring_tool_, const std::tm& creation_time_) :
    authoring_tool{authoring_tool_},
    creation_time{creation_time_}
{}

std::string_view iml::library_name()
{
    return "imlabel";
}

std::string iml::to_iso8601_string(const std::tm& t)
{
    std::stringstream ss;
    ss << std::put_time(&t, "%Y-%m-%dT%H:%M:%S");
    return std::move(ss).str();
}
