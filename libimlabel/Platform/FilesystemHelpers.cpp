#include "FilesystemHelpers.h"

#include <libimlabel/Platform/Log.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

using namespace iml;

namespace
{
    std::filesystem::path temporary_sibling_of(const std::filesystem::path& destination)
    {
        std::random_device rd;
        std::uniform_int_distribution<unsigned> dist{0, 0xffffff};
        std::stringstream name;
        name << '.' << destination.filename().string() << ".tmp-" << std::hex << dist(rd);
        return destination.parent_path() / name.str();
    }

    std::string to_lowercase(std::string_view str)
    {
        std::string rv{str};
        std::transform(rv.begin(), rv.end(), rv.begin(), [](unsigned char c)
        {
            return static_cast<char>(std::tolower(c));
        });
        return rv;
    }

    void try_remove(const std::filesystem::path& p)
    {
        std::error_code ec;
        std::filesystem::remove(p, ec);
        if (ec) {
            log_error("%s: could not remove temporary file: %s", p.string().c_str(), ec.message().c_str());
        }
    }
}

void iml::write_file_atomically(const std::filesystem::path& destination, std::string_view content)
{
    const std::filesystem::path tmp = temporary_sibling_of(destination);
    {
        std::ofstream out{tmp, std::ios::binary | std::ios::trunc};
        if (not out) {
            throw std::runtime_error{tmp.string() + ": cannot open file for writing"};
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (not out) {
            out.close();
            try_remove(tmp);
            throw std::runtime_error{tmp.string() + ": error writing file content"};
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, destination, ec);
    if (ec) {
        try_remove(tmp);
        throw std::runtime_error{destination.string() + ": cannot replace file: " + ec.message()};
    }
}

void iml::write_file_atomically(
    const std::filesystem::path& destination,
    const std::function<void(std::ostream&)>& writer)
{
    std::stringstream ss;
    writer(ss);
    write_file_atomically(destination, std::move(ss).str());
}

std::vector<std::filesystem::path> iml::find_files_with_extensions(
    const std::filesystem::path& directory,
    std::span<const std::string_view> extensions)
{
    std::vector<std::filesystem::path> rv;

    std::error_code ec;
    if (not std::filesystem::is_directory(directory, ec)) {
        return rv;
    }

    for (const std::filesystem::directory_entry& e : std::filesystem::directory_iterator{directory}) {
        if (not e.is_regular_file()) {
            continue;
        }
        const std::string extension = to_lowercase(e.path().extension().string());
        const bool matches = std::any_of(extensions.begin(), extensions.end(), [&extension](std::string_view wanted)
        {
            return extension == to_lowercase(wanted);
        });
        if (matches) {
            rv.push_back(e.path());
        }
    }

    std::sort(rv.begin(), rv.end(), [](const std::filesystem::path& a, const std::filesystem::path& b)
    {
        return a.filename() < b.filename();
    });
    return rv;
}

iml::UniqueFilenameAllocator::UniqueFilenameAllocator(std::filesystem::path directory) :
    directory_{std::move(directory)}
{}

std::filesystem::path iml::UniqueFilenameAllocator::claim(std::string_view stem, std::string_view suffix)
{
    std::string filename = std::string{stem} + std::string{suffix};
    for (size_t n = 2; not claimed_.insert(to_lowercase(filename)).second; ++n) {
        filename = std::string{stem} + '_' + std::to_string(n) + std::string{suffix};
    }
    return directory_ / filename;
}

std::string iml::slurp(const std::filesystem::path& path)
{
    std::ifstream in{path, std::ios::binary};
    if (not in) {
        throw std::runtime_error{path.string() + ": cannot open file for reading"};
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return std::move(ss).str();
}
