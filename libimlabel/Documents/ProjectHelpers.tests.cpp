#include "ProjectHelpers.h"

#include <libimlabel/Platform/FilesystemHelpers.h>
#include <libimlabel/Utils/TemporaryDirectory.h>

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

using namespace iml;

namespace
{
    Project make_project()
    {
        Project project;
        project.add_image("a.png");
        project.add_image("b.png");
        project.add_label("car", Color::red());
        project.add_label("dog", Color::blue());
        project.create_annotation(0, Rect::from_corners({0.0, 0.0}, {5.0, 5.0}), "car");
        project.create_annotation(0, Vec2{1.0, 1.0}, "dog");
        project.create_annotation(1, Rect::from_corners({1.0, 1.0}, {2.0, 2.0}), "car");
        project.create_annotation(1, Circle{.origin = {}, .radius = 2.0});
        return project;
    }
}

TEST(calc_statistics, counts_by_kind_and_label)
{
    const AnnotationStatistics stats = calc_statistics(make_project());

    ASSERT_EQ(stats.total, 4);
    ASSERT_EQ(stats.num_unlabeled, 1);
    ASSERT_EQ(stats.num_of_kind(AnnotationKind::Rectangle), 2);
    ASSERT_EQ(stats.num_of_kind(AnnotationKind::Point), 1);
    ASSERT_EQ(stats.num_of_kind(AnnotationKind::Circle), 1);
    ASSERT_EQ(stats.num_of_kind(AnnotationKind::Polygon), 0);
    ASSERT_EQ(stats.num_by_label.at("car"), 2);
    ASSERT_EQ(stats.num_by_label.at("dog"), 1);
}

TEST(calc_statistics, can_be_calculated_for_one_image)
{
    const Project project = make_project();
    ASSERT_EQ(calc_statistics(project.annotations(1)).total, 2);
}

TEST(find_annotations_by_label, returns_ids_across_images)
{
    const auto ids = find_annotations_by_label(make_project(), "car");
    ASSERT_EQ(ids, (std::vector<AnnotationID>{AnnotationID{1}, AnnotationID{3}}));
}

TEST(find_annotations_by_kind, returns_matching_ids)
{
    const auto ids = find_annotations_by_kind(make_project(), AnnotationKind::Circle);
    ASSERT_EQ(ids, (std::vector<AnnotationID>{AnnotationID{4}}));
}

TEST(present_kind_names, lists_kinds_in_declaration_order)
{
    const Project project = make_project();
    ASSERT_EQ(present_kind_names(project.annotations(0)), (std::vector<std::string>{"Point", "Rectangle"}));
}

TEST(to_summary_string, includes_id_geometry_and_label)
{
    const Project project = make_project();
    ASSERT_EQ(to_summary_string(project.get_annotation(AnnotationID{1})), "#1 Rectangle (0, 0) - (5, 5) [car]");
}

TEST(is_supported_image_file, matches_known_extensions_case_insensitively)
{
    ASSERT_TRUE(is_supported_image_file("a/cat.png"));
    ASSERT_TRUE(is_supported_image_file("cat.JPEG"));
    ASSERT_TRUE(is_supported_image_file("cat.tiff"));
    ASSERT_FALSE(is_supported_image_file("cat.tif"));
    ASSERT_FALSE(is_supported_image_file("cat_annotations.json"));
    ASSERT_FALSE(is_supported_image_file("png"));
}

TEST(load_image_folder, adds_supported_images_sorted_by_filename)
{
    TemporaryDirectory dir;
    const auto root = dir.absolute_path();
    write_file_atomically(root / "zebra.png", "");
    write_file_atomically(root / "apple.GIF", "");
    write_file_atomically(root / "middle.bmp", "");
    write_file_atomically(root / "middle_annotations.json", "{}");
    write_file_atomically(root / "readme.txt", "");

    const Project project = load_image_folder(root);

    ASSERT_EQ(project.num_images(), 3);
    ASSERT_EQ(project.image_at(0).path, root / "apple.GIF");
    ASSERT_EQ(project.image_at(1).path, root / "middle.bmp");
    ASSERT_EQ(project.image_at(2).path, root / "zebra.png");
    ASSERT_FALSE(project.image_at(0).dimensions.has_value());
    ASSERT_TRUE(project.labels().empty());
    ASSERT_EQ(project.num_annotations(), 0);
}

TEST(load_image_folder, returns_empty_project_for_missing_directory)
{
    TemporaryDirectory dir;
    ASSERT_EQ(load_image_folder(dir.absolute_path() / "missing").num_images(), 0);
}
