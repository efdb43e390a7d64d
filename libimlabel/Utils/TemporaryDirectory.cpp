#include "TemporaryDirectory.h"

#include <libimlabel/Platform/Log.h>

#include <filesystem>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

using namespace iml;

namespace
{
    std::filesystem::path make_unique_temporary_directory(const TemporaryDirectoryParameters& parameters)
    {
        const std::filesystem::path root = std::filesystem::temp_directory_path();
        std::random_device rd;
        std::uniform_int_distribution<unsigned long long> dist;

        for (int attempt = 0; attempt < 100; ++attempt) {
            std::stringstream name;
            name << parameters.prefix << std::hex << dist(rd) << parameters.suffix;
            std::filesystem::path candidate = root / name.str();

            std::error_code ec;
            if (std::filesystem::create_directory(candidate, ec)) {
                return candidate;
            }
        }
        throw std::runtime_error{"failed to create a unique temporary directory in " + root.string()};
    }
}

iml::TemporaryDirectory::TemporaryDirectory(const TemporaryDirectoryParameters& parameters) :
    absolute_path_{make_unique_temporary_directory(parameters)}
{}
iml::TemporaryDirectory::TemporaryDirectory(TemporaryDirectory&& tmp) noexcept :
    absolute_path_{std::move(tmp.absolute_path_)},
    should_delete_{std::exchange(tmp.should_delete_, false)}
{}
iml::TemporaryDirectory& iml::TemporaryDirectory::operator=(TemporaryDirectory&& tmp) noexcept
{
    if (&tmp != this) {
        std::swap(absolute_path_, tmp.absolute_path_);
        std::swap(should_delete_, tmp.should_delete_);
    }
    return *this;
}
iml::TemporaryDirectory::~TemporaryDirectory() noexcept
{
    if (not should_delete_) {
        return;
    }

    std::error_code ec;
    std::filesystem::remove_all(absolute_path_, ec);
    if (ec) {
        log_error("Error deleting a temporary directory (%s): %s", absolute_path_.string().c_str(), ec.message().c_str());
    }
}
