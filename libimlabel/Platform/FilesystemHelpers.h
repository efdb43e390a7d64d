#pragma once

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace iml
{
    // writes `content` to `destination` so that readers either see the previous
    // content of `destination` or all of `content`, never a partial write
    //
    // the content is written to a temporary sibling file that is then renamed
    // over `destination`. On failure, the temporary file is removed and an
    // exception is thrown.
    void write_file_atomically(const std::filesystem::path& destination, std::string_view content);

    // as above, but the content is produced by `writer`, which is called with an
    // in-memory stream before anything touches the filesystem
    void write_file_atomically(
        const std::filesystem::path& destination,
        const std::function<void(std::ostream&)>& writer
    );

    // returns the regular files directly inside `directory` whose extension matches any
    // of `extensions` (case-insensitively, e.g. ".png" matches "a.PNG"), sorted by filename
    //
    // returns an empty vector if `directory` does not exist or is not a directory
    std::vector<std::filesystem::path> find_files_with_extensions(
        const std::filesystem::path& directory,
        std::span<const std::string_view> extensions
    );

    // hands out unique file names within one output directory
    //
    // the first claim of a name gets it as-is. Later claims of the same name (compared
    // case-insensitively, so the result is also unique on case-insensitive filesystems)
    // get `<stem>_2<suffix>`, `<stem>_3<suffix>`, etc.
    class UniqueFilenameAllocator final {
    public:
        explicit UniqueFilenameAllocator(std::filesystem::path directory);

        // returns `directory / (stem + suffix)`, or a numbered variant of it if that
        // name has already been claimed
        std::filesystem::path claim(std::string_view stem, std::string_view suffix);

    private:
        std::filesystem::path directory_;
        std::unordered_set<std::string> claimed_;
    };

    // returns the entire content of the file at `path`, or throws if it cannot be read
    std::string slurp(const std::filesystem::path& path);
}
