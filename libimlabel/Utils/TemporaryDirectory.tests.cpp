#include "TemporaryDirectory.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

using namespace iml;

TEST(TemporaryDirectory, creates_a_directory_that_exists)
{
    const TemporaryDirectory dir;
    ASSERT_TRUE(std::filesystem::is_directory(dir.absolute_path()));
    ASSERT_TRUE(dir.absolute_path().is_absolute());
}

TEST(TemporaryDirectory, uses_prefix_and_suffix)
{
    const TemporaryDirectory dir({.prefix = "voc_export_", .suffix = "_tmp"});
    const std::string name = dir.absolute_path().filename().string();
    ASSERT_TRUE(name.starts_with("voc_export_"));
    ASSERT_TRUE(name.ends_with("_tmp"));
}

TEST(TemporaryDirectory, destructor_removes_directory_and_its_content)
{
    std::filesystem::path p;
    {
        const TemporaryDirectory dir;
        p = dir.absolute_path();
        std::ofstream{p / "file.txt"} << "content";
    }
    ASSERT_FALSE(std::filesystem::exists(p));
}

TEST(TemporaryDirectory, moved_from_directory_does_not_delete_it)
{
    TemporaryDirectory a;
    const std::filesystem::path p = a.absolute_path();
    {
        TemporaryDirectory b{std::move(a)};
        ASSERT_EQ(b.absolute_path(), p);
    }
    ASSERT_FALSE(std::filesystem::exists(p));
}
