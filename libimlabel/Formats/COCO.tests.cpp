#include "COCO.h"

#include <libimlabel/Platform/FilesystemHelpers.h>
#include <libimlabel/Utils/Exceptions.h>
#include <libimlabel/Utils/TemporaryDirectory.h>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <sstream>
#include <string>

using namespace iml;
using json = nlohmann::ordered_json;

namespace
{
    Project make_project()
    {
        Project project;
        project.add_image("photos/street.png", ImageDimensions{640, 480});
        project.add_image("photos/park.jpg");
        project.add_label("tree", Color::green());
        project.add_label("car", Color::red());

        project.create_annotation(0, Rect::from_corners({10.0, 20.0}, {110.0, 70.0}), "car");
        project.create_annotation(0, Vec2{5.0, 5.0});  // unlabeled: skipped
        project.create_annotation(1, Polygon{{{0.0, 0.0}, {10.0, 0.0}, {10.0, 10.0}, {5.0, 15.0}}}, "tree");
        project.create_annotation(1, Vec2{50.0, 60.0}, "car");
        return project;
    }

    json write_to_json(const Project& project, const ApproximationPolicy& policy = ApproximationPolicy{})
    {
        std::stringstream ss;
        COCO::write(ss, project, policy);
        return json::parse(ss.str());
    }

    Project read_from_string(const std::string& str)
    {
        std::stringstream ss{str};
        return COCO::read(ss, "coco.json", Color::blue());
    }
}

TEST(COCO, write_assigns_category_ids_in_name_order)
{
    const json categories = write_to_json(make_project()).at("categories");

    ASSERT_EQ(categories.size(), 2);
    ASSERT_EQ(categories.at(0).at("name"), "car");
    ASSERT_EQ(categories.at(0).at("id"), 1);
    ASSERT_EQ(categories.at(0).at("supercategory"), "none");
    ASSERT_EQ(categories.at(1).at("name"), "tree");
    ASSERT_EQ(categories.at(1).at("id"), 2);
}

TEST(COCO, write_is_deterministic_apart_from_metadata)
{
    std::tm t{};
    t.tm_year = 2024 - 1900;
    const ExportMetadata metadata{"tests", t};

    std::stringstream a;
    std::stringstream b;
    COCO::write(a, make_project(), ApproximationPolicy{}, metadata);
    COCO::write(b, make_project(), ApproximationPolicy{}, metadata);
    ASSERT_EQ(a.str(), b.str());
}

TEST(COCO, write_describes_images_with_one_based_ids)
{
    const json images = write_to_json(make_project()).at("images");

    ASSERT_EQ(images.size(), 2);
    ASSERT_EQ(images.at(0).at("id"), 1);
    ASSERT_EQ(images.at(0).at("file_name"), "street.png");
    ASSERT_EQ(images.at(0).at("width"), 640);
    ASSERT_EQ(images.at(0).at("height"), 480);
    ASSERT_EQ(images.at(1).at("id"), 2);
    ASSERT_EQ(images.at(1).at("width"), 0);
}

TEST(COCO, write_maps_rectangle_to_bbox_and_four_corner_segmentation)
{
    const json annotations = write_to_json(make_project()).at("annotations");
    const json& rect = annotations.at(0);

    ASSERT_EQ(rect.at("id"), 1);
    ASSERT_EQ(rect.at("image_id"), 1);
    ASSERT_EQ(rect.at("category_id"), 1);
    ASSERT_EQ(rect.at("bbox"), json::parse("[10, 20, 100, 50]"));
    ASSERT_EQ(rect.at("segmentation"), json::parse("[[10, 20, 110, 20, 110, 70, 10, 70]]"));
    ASSERT_EQ(rect.at("area"), 5000);
    ASSERT_EQ(rect.at("iscrowd"), 0);
}

TEST(COCO, write_skips_unlabeled_annotations)
{
    const json annotations = write_to_json(make_project()).at("annotations");

    ASSERT_EQ(annotations.size(), 3);
    ASSERT_EQ(annotations.at(1).at("id"), 2);
    ASSERT_EQ(annotations.at(1).at("image_id"), 2);
}

TEST(COCO, write_maps_polygon_and_approximated_point)
{
    const json annotations = write_to_json(make_project()).at("annotations");

    const json& polygon = annotations.at(1);
    ASSERT_EQ(polygon.at("category_id"), 2);
    ASSERT_EQ(polygon.at("segmentation"), json::parse("[[0, 0, 10, 0, 10, 10, 5, 15]]"));
    ASSERT_EQ(polygon.at("bbox"), json::parse("[0, 0, 10, 15]"));
    ASSERT_EQ(polygon.at("area"), 100);

    const json& point = annotations.at(2);
    ASSERT_EQ(point.at("bbox"), json::parse("[49, 59, 2, 2]"));
    ASSERT_EQ(point.at("area"), 4);
}

TEST(COCO, write_throws_unsupported_kind_when_approximation_is_disabled)
{
    ApproximationPolicy policy;
    policy.allow_approximation = false;

    try {
        write_to_json(make_project(), policy);
        FAIL() << "expected an exception";
    }
    catch (const UnsupportedKind& ex) {
        ASSERT_EQ(ex.location().image_index, 1);
        ASSERT_EQ(ex.location().annotation_index, 1);
    }
}

TEST(COCO, read_imports_exported_document)
{
    std::stringstream ss;
    COCO::write(ss, make_project());
    const Project project = read_from_string(ss.str());

    ASSERT_EQ(project.num_images(), 2);
    ASSERT_EQ(project.image_at(0).path, "street.png");
    ASSERT_EQ(project.image_at(0).dimensions, (ImageDimensions{640, 480}));
    ASSERT_EQ(project.image_at(1).dimensions, std::nullopt);

    ASSERT_EQ(project.labels().size(), 2);
    ASSERT_EQ(project.labels().at(0).name, "car");
    ASSERT_EQ(project.labels().at(0).color, Color::blue());

    ASSERT_EQ(project.annotations(0).size(), 1);
    ASSERT_EQ(project.annotations(0).at(0).geometry, AnnotationGeometry{Rect::from_corners({10.0, 20.0}, {110.0, 70.0})});
    ASSERT_EQ(project.annotations(0).at(0).label, "car");

    ASSERT_EQ(project.annotations(1).size(), 2);
    ASSERT_EQ(kind_of(project.annotations(1).at(0)), AnnotationKind::Polygon);
    ASSERT_EQ(project.annotations(1).at(0).label, "tree");
    ASSERT_EQ(project.annotations(1).at(1).geometry, AnnotationGeometry{Rect::from_corners({49.0, 59.0}, {51.0, 61.0})});
}

TEST(COCO, read_uses_bbox_when_there_is_no_segmentation)
{
    const Project project = read_from_string(R"({
        "images": [{"id": 3, "file_name": "a.png"}],
        "categories": [{"id": 9, "name": "dog"}],
        "annotations": [{"id": 1, "image_id": 3, "category_id": 9, "bbox": [1, 2, 3, 4]}]
    })");

    ASSERT_EQ(project.annotations(0).at(0).geometry, AnnotationGeometry{Rect::from_corners({1.0, 2.0}, {4.0, 6.0})});
}

TEST(COCO, read_treats_rectangular_segmentation_that_disagrees_with_bbox_as_polygon)
{
    const Project project = read_from_string(R"({
        "images": [{"id": 1, "file_name": "a.png"}],
        "categories": [{"id": 1, "name": "dog"}],
        "annotations": [{
            "image_id": 1,
            "category_id": 1,
            "segmentation": [[0, 0, 10, 0, 10, 10, 0, 10]],
            "bbox": [0, 0, 5, 5]
        }]
    })");

    ASSERT_EQ(kind_of(project.annotations(0).at(0)), AnnotationKind::Polygon);
}

TEST(COCO, read_skips_annotations_with_unknown_image_or_category)
{
    const Project project = read_from_string(R"({
        "images": [{"id": 1, "file_name": "a.png"}],
        "categories": [{"id": 1, "name": "dog"}],
        "annotations": [
            {"image_id": 2, "category_id": 1, "bbox": [0, 0, 1, 1]},
            {"image_id": 1, "category_id": 2, "bbox": [0, 0, 1, 1]},
            {"image_id": 1, "category_id": 1, "bbox": [0, 0, 1, 1]}
        ]
    })");

    ASSERT_EQ(project.num_annotations(), 1);
}

TEST(COCO, read_reports_index_of_malformed_annotation)
{
    try {
        read_from_string(R"({
            "images": [{"id": 1, "file_name": "a.png"}],
            "categories": [{"id": 1, "name": "dog"}],
            "annotations": [
                {"image_id": 1, "category_id": 1, "bbox": [0, 0, 1, 1]},
                {"image_id": 1, "category_id": 1, "bbox": [0, 0, 1]}
            ]
        })");
        FAIL() << "expected an exception";
    }
    catch (const MalformedInput& ex) {
        ASSERT_EQ(ex.location().source, "coco.json");
        ASSERT_EQ(ex.location().image_index, 0);
        ASSERT_EQ(ex.location().annotation_index, 1);
    }
}

TEST(COCO, read_throws_malformed_input_for_missing_sections)
{
    ASSERT_THROW({ read_from_string(R"({"images": [], "annotations": []})"); }, MalformedInput);
    ASSERT_THROW({ read_from_string("[1, 2, 3]"); }, MalformedInput);
    ASSERT_THROW({ read_from_string("{"); }, MalformedInput);
}

TEST(export_coco_file, writes_document_and_import_reads_it_back)
{
    TemporaryDirectory dir;
    const auto path = dir.absolute_path() / "annotations_coco.json";

    export_coco_file(path, make_project());
    ASSERT_EQ(json::parse(slurp(path)).at("licenses").at(0).at("name"), "Unknown");
    ASSERT_EQ(import_coco_file(path).num_annotations(), 3);
}

TEST(export_coco_file, leaves_existing_file_untouched_on_failure)
{
    TemporaryDirectory dir;
    const auto path = dir.absolute_path() / "annotations_coco.json";
    write_file_atomically(path, "previous");

    ApproximationPolicy policy;
    policy.allow_approximation = false;
    ASSERT_THROW({ export_coco_file(path, make_project(), policy); }, UnsupportedKind);
    ASSERT_EQ(slurp(path), "previous");
}
