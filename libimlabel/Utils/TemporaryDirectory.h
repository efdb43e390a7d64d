#pragma once

#include <libimlabel/Utils/TemporaryDirectoryParameters.h>

#include <filesystem>

namespace iml
{
    // an RAII handle to a uniquely-named directory in the system's temporary
    // directory, which is recursively deleted when the handle is destroyed
    class TemporaryDirectory final {
    public:
        explicit TemporaryDirectory(const TemporaryDirectoryParameters& = {});
        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory(TemporaryDirectory&&) noexcept;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) noexcept;
        ~TemporaryDirectory() noexcept;

        const std::filesystem::path& absolute_path() const { return absolute_path_; }

    private:
        std::filesystem::path absolute_path_;
        bool should_delete_ = true;
    };
}
