#pragma once

#include <ctime>
#include <filesystem>

// os: where OS-specific queries are hidden
namespace iml
{
    // returns current system time as a calendar time (local time)
    std::tm system_calendar_time();

    // returns the full path to the directory containing the currently-executing
    // application
    //
    // care: can be slow: downstream callers should cache it
    std::filesystem::path current_executable_directory();
}
