#include "os.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <stdexcept>
#include <system_error>

#include <time.h>

std::tm iml::system_calendar_time()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm rv{};
    if (localtime_r(&now, &rv) == nullptr) {
        throw std::runtime_error{"localtime_r: failed to convert the system time into a calendar time"};
    }
    return rv;
}

std::filesystem::path iml::current_executable_directory()
{
    std::error_code ec;
    const std::filesystem::path exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        // fallback: use the working directory
        return std::filesystem::current_path();
    }
    return exe.parent_path();
}
