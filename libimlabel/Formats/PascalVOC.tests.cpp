#include "PascalVOC.h"

#include <libimlabel/Platform/FilesystemHelpers.h>
#include <libimlabel/Utils/Exceptions.h>
#include <libimlabel/Utils/TemporaryDirectory.h>

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>
#include <utility>

using namespace iml;

namespace
{
    Project make_project()
    {
        Project project;
        project.add_image("data/cars/street.png", ImageDimensions{640, 480});
        project.add_image("data/cars/empty.png");
        project.add_label("car", Color::red());
        project.add_label("a<b & \"c\"", Color::blue());
        return project;
    }

    std::string write_to_string(const Project& project, size_t image_index, const PascalVOCParameters& parameters = {})
    {
        std::stringstream ss;
        PascalVOC::write(ss, project, image_index, parameters);
        return std::move(ss).str();
    }

    bool contains(const std::string& haystack, std::string_view needle)
    {
        return haystack.find(needle) != std::string::npos;
    }
}

TEST(PascalVOC, write_produces_expected_document_for_rectangle)
{
    Project project = make_project();
    project.create_annotation(0, Rect::from_corners({10.7, 20.2}, {100.9, 90.5}), "car");

    const std::string expected = R"(<?xml version="1.0" encoding="utf-8"?>
<annotation>
  <folder>cars</folder>
  <filename>street.png</filename>
  <path>data/cars/street.png</path>
  <source>
    <database>Unknown</database>
  </source>
  <size>
    <width>640</width>
    <height>480</height>
    <depth>3</depth>
  </size>
  <segmented>0</segmented>
  <object>
    <name>car</name>
    <pose>Unspecified</pose>
    <truncated>0</truncated>
    <difficult>0</difficult>
    <bndbox>
      <xmin>10</xmin>
      <ymin>20</ymin>
      <xmax>100</xmax>
      <ymax>90</ymax>
    </bndbox>
  </object>
</annotation>
)";
    ASSERT_EQ(write_to_string(project, 0), expected);
}

TEST(PascalVOC, write_adds_polygon_points_for_polygons)
{
    Project project = make_project();
    project.create_annotation(0, Polygon{{{0.0, 0.0}, {10.5, 0.0}, {5.0, 8.9}}}, "car");

    const std::string document = write_to_string(project, 0);
    ASSERT_TRUE(contains(document, "<xmax>10</xmax>"));
    ASSERT_TRUE(contains(document, "<ymax>8</ymax>"));
    ASSERT_TRUE(contains(document, "    <polygon>\n      <pt>\n        <x>0</x>\n        <y>0</y>\n      </pt>\n"));
    ASSERT_TRUE(contains(document, "        <x>5</x>\n        <y>8</y>\n"));
}

TEST(PascalVOC, write_approximates_points_and_circles)
{
    Project project = make_project();
    project.create_annotation(0, Vec2{50.0, 60.0}, "car");
    project.create_annotation(0, Circle{{100.0, 100.0}, 10.0}, "car");

    const std::string document = write_to_string(project, 0);
    ASSERT_TRUE(contains(document, "<xmin>49</xmin>\n      <ymin>59</ymin>\n      <xmax>51</xmax>\n      <ymax>61</ymax>"));
    ASSERT_TRUE(contains(document, "<xmin>90</xmin>\n      <ymin>90</ymin>\n      <xmax>110</xmax>\n      <ymax>110</ymax>"));
    ASSERT_TRUE(contains(document, "<x>110</x>\n        <y>100</y>"));  // first vertex of the circle's polygon
}

TEST(PascalVOC, write_throws_unsupported_kind_when_approximation_is_disabled)
{
    Project project = make_project();
    project.create_annotation(0, Rect::from_corners({0.0, 0.0}, {1.0, 1.0}), "car");
    project.create_annotation(0, Circle{{100.0, 100.0}, 10.0}, "car");

    PascalVOCParameters parameters;
    parameters.approximation_policy.allow_approximation = false;

    try {
        write_to_string(project, 0, parameters);
        FAIL() << "expected an exception";
    }
    catch (const UnsupportedKind& ex) {
        ASSERT_EQ(ex.location().image_index, 0);
        ASSERT_EQ(ex.location().annotation_index, 1);
    }
}

TEST(PascalVOC, write_skips_unlabeled_annotations_and_escapes_names)
{
    Project project = make_project();
    project.create_annotation(0, Rect::from_corners({0.0, 0.0}, {1.0, 1.0}));
    project.create_annotation(0, Rect::from_corners({0.0, 0.0}, {1.0, 1.0}), "a<b & \"c\"");

    const std::string document = write_to_string(project, 0);
    ASSERT_TRUE(contains(document, "<name>a&lt;b &amp; &quot;c&quot;</name>"));
    ASSERT_EQ(document.find("<object>"), document.rfind("<object>"));
}

TEST(PascalVOC, write_uses_configured_depth_and_zero_for_unknown_size)
{
    PascalVOCParameters parameters;
    parameters.image_depth = 1;

    const std::string document = write_to_string(make_project(), 1, parameters);
    ASSERT_TRUE(contains(document, "<width>0</width>"));
    ASSERT_TRUE(contains(document, "<depth>1</depth>"));
}

TEST(PascalVOC, write_throws_not_found_for_bad_image_index)
{
    std::stringstream ss;
    ASSERT_THROW({ PascalVOC::write(ss, make_project(), 5); }, NotFound);
}

TEST(export_pascal_voc_files, writes_one_document_per_annotated_image)
{
    Project project = make_project();
    project.create_annotation(0, Rect::from_corners({0.0, 0.0}, {1.0, 1.0}), "car");

    TemporaryDirectory dir;
    const auto written = export_pascal_voc_files(dir.absolute_path(), project);

    ASSERT_EQ(written.size(), 1);
    ASSERT_EQ(written[0], dir.absolute_path() / "Annotations" / "street.xml");
    ASSERT_TRUE(contains(slurp(written[0]), "<name>car</name>"));
    ASSERT_FALSE(std::filesystem::exists(dir.absolute_path() / "Annotations" / "empty.xml"));
}

TEST(export_pascal_voc_files, writes_nothing_if_any_document_fails)
{
    Project project = make_project();
    project.add_image("data/z.png");
    project.create_annotation(0, Rect::from_corners({0.0, 0.0}, {1.0, 1.0}), "car");
    project.create_annotation(2, Vec2{1.0, 1.0}, "car");

    PascalVOCParameters parameters;
    parameters.approximation_policy.allow_approximation = false;

    TemporaryDirectory dir;
    ASSERT_THROW({ export_pascal_voc_files(dir.absolute_path(), project, parameters); }, UnsupportedKind);
    ASSERT_FALSE(std::filesystem::exists(dir.absolute_path() / "Annotations" / "street.xml"));
}

TEST(export_pascal_voc_files, gives_images_with_the_same_stem_distinct_files)
{
    Project project;
    project.add_label("car", Color::red());
    project.add_label("dog", Color::blue());
    project.add_image("photos/cat.png");
    project.add_image("photos/cat.jpg");
    project.add_image("other/cat.png");
    project.create_annotation(0, Rect::from_corners({0.0, 0.0}, {1.0, 1.0}), "car");
    project.create_annotation(1, Rect::from_corners({0.0, 0.0}, {1.0, 1.0}), "dog");
    project.create_annotation(2, Rect::from_corners({0.0, 0.0}, {1.0, 1.0}), "car");

    TemporaryDirectory dir;
    const auto written = export_pascal_voc_files(dir.absolute_path(), project);

    const std::filesystem::path annotations = dir.absolute_path() / "Annotations";
    ASSERT_EQ(written.size(), 3);
    ASSERT_EQ(written[0], annotations / "cat.xml");
    ASSERT_EQ(written[1], annotations / "cat_2.xml");
    ASSERT_EQ(written[2], annotations / "cat_3.xml");

    ASSERT_TRUE(contains(slurp(written[0]), "<filename>cat.png</filename>"));
    ASSERT_TRUE(contains(slurp(written[0]), "<name>car</name>"));
    ASSERT_TRUE(contains(slurp(written[1]), "<filename>cat.jpg</filename>"));
    ASSERT_TRUE(contains(slurp(written[1]), "<name>dog</name>"));
    ASSERT_TRUE(contains(slurp(written[2]), "<path>other/cat.png</path>"));
}
