#include "ExportMetadata.h"

#include <gtest/gtest.h>

#include <ctime>

using namespace iml;

TEST(ExportMetadata, default_constructed_names_this_library_as_authoring_tool)
{
    const ExportMetadata metadata;
    ASSERT_EQ(metadata.authoring_tool, library_name());
    ASSERT_GE(metadata.creation_time.tm_year, 100);  // i.e. after the year 2000
}

TEST(to_iso8601_string, formats_calendar_time)
{
    std::tm t{};
    t.tm_year = 2024 - 1900;
    t.tm_mon = 0;
    t.tm_mday = 9;
    t.tm_hour = 7;
    t.tm_min = 30;
    t.tm_sec = 5;
    ASSERT_EQ(to_iso8601_string(t), "2024-01-09T07:30:05");
}
