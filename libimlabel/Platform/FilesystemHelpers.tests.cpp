#include "FilesystemHelpers.h"

#include <libimlabel/Utils/TemporaryDirectory.h>

#include <gtest/gtest.h>

#include <filesystem>
#include <ostream>
#include <stdexcept>
#include <string_view>
#include <vector>

using namespace iml;

TEST(write_file_atomically, writes_content_to_new_file)
{
    TemporaryDirectory dir;
    const auto p = dir.absolute_path() / "out.txt";
    write_file_atomically(p, "hello");
    ASSERT_EQ(slurp(p), "hello");
}

TEST(write_file_atomically, replaces_existing_file_content)
{
    TemporaryDirectory dir;
    const auto p = dir.absolute_path() / "out.txt";
    write_file_atomically(p, "first version of the content");
    write_file_atomically(p, "second");
    ASSERT_EQ(slurp(p), "second");
}

TEST(write_file_atomically, leaves_no_temporary_files_behind)
{
    TemporaryDirectory dir;
    write_file_atomically(dir.absolute_path() / "a.json", "{}");

    size_t n = 0;
    for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator{dir.absolute_path()}) {
        ++n;
    }
    ASSERT_EQ(n, 1);
}

TEST(write_file_atomically, writer_exception_leaves_destination_untouched)
{
    TemporaryDirectory dir;
    const auto p = dir.absolute_path() / "out.txt";
    write_file_atomically(p, "original");

    ASSERT_THROW(write_file_atomically(p, [](std::ostream& out)
    {
        out << "partial";
        throw std::runtime_error{"writer failed"};
    }), std::runtime_error);

    ASSERT_EQ(slurp(p), "original");
}

TEST(write_file_atomically, throws_if_directory_does_not_exist)
{
    TemporaryDirectory dir;
    ASSERT_ANY_THROW(write_file_atomically(dir.absolute_path() / "missing" / "out.txt", "x"));
}

TEST(TemporaryDirectory, is_deleted_when_handle_is_destroyed)
{
    std::filesystem::path p;
    {
        TemporaryDirectory dir{{.prefix = "imlabel_test_"}};
        p = dir.absolute_path();
        ASSERT_TRUE(std::filesystem::is_directory(p));
        ASSERT_TRUE(p.filename().string().starts_with("imlabel_test_"));
    }
    ASSERT_FALSE(std::filesystem::exists(p));
}

TEST(UniqueFilenameAllocator, numbers_repeated_claims_of_the_same_name)
{
    UniqueFilenameAllocator allocator{"out"};

    ASSERT_EQ(allocator.claim("cat", ".xml"), std::filesystem::path{"out"} / "cat.xml");
    ASSERT_EQ(allocator.claim("dog", ".xml"), std::filesystem::path{"out"} / "dog.xml");
    ASSERT_EQ(allocator.claim("cat", ".xml"), std::filesystem::path{"out"} / "cat_2.xml");
    ASSERT_EQ(allocator.claim("cat", ".xml"), std::filesystem::path{"out"} / "cat_3.xml");
}

TEST(UniqueFilenameAllocator, treats_names_that_differ_only_in_case_as_the_same)
{
    UniqueFilenameAllocator allocator{"out"};

    ASSERT_EQ(allocator.claim("Cat", ".xml"), std::filesystem::path{"out"} / "Cat.xml");
    ASSERT_EQ(allocator.claim("cat", ".XML"), std::filesystem::path{"out"} / "cat_2.XML");
}

TEST(UniqueFilenameAllocator, skips_numbered_names_that_were_claimed_directly)
{
    UniqueFilenameAllocator allocator{"out"};

    allocator.claim("cat_2", ".xml");
    allocator.claim("cat", ".xml");
    ASSERT_EQ(allocator.claim("cat", ".xml"), std::filesystem::path{"out"} / "cat_3.xml");
}

TEST(find_files_with_extensions, returns_matching_files_sorted_by_name)
{
    TemporaryDirectory dir;
    const auto root = dir.absolute_path();
    write_file_atomically(root / "b.png", "");
    write_file_atomically(root / "a.JPG", "");
    write_file_atomically(root / "notes.txt", "");
    std::filesystem::create_directory(root / "c.png");  // directories never match

    const std::string_view extensions[] = {".png", ".jpg"};
    const std::vector<std::filesystem::path> expected = {root / "a.JPG", root / "b.png"};
    ASSERT_EQ(find_files_with_extensions(root, extensions), expected);
}

TEST(find_files_with_extensions, returns_empty_for_missing_directory)
{
    TemporaryDirectory dir;
    const std::string_view extensions[] = {".png"};
    ASSERT_TRUE(find_files_with_extensions(dir.absolute_path() / "missing", extensions).empty());
}
