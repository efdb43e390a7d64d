#include "NativeJSON.h"

#include <libimlabel/Documents/ProjectHelpers.h>
#include <libimlabel/Platform/FilesystemHelpers.h>
#include <libimlabel/Utils/Exceptions.h>
#include <libimlabel/Utils/TemporaryDirectory.h>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <ctime>
#include <filesystem>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace iml;
using json = nlohmann::ordered_json;

namespace
{
    ExportMetadata fixed_metadata()
    {
        std::tm t{};
        t.tm_year = 2024 - 1900;
        t.tm_mon = 2;
        t.tm_mday = 1;
        t.tm_hour = 14;
        t.tm_min = 5;
        t.tm_sec = 9;
        return ExportMetadata{"imlabel-tests", t};
    }

    Project make_street_project()
    {
        Project project;
        project.add_image("images/street.png", ImageDimensions{640, 480});
        project.add_image("images/park.jpg");
        project.add_label("car", Color::red());
        project.add_label("tree", Color::green());

        project.create_annotation(0, Rect::from_corners({10.0, 10.0}, {100.0, 100.0}), "car");
        project.create_annotation(0, Vec2{3.5, 4.25});
        const AnnotationID circle = project.create_annotation(0, Circle{{50.0, 60.0}, 12.5}, "tree");
        project.set_color_override(circle, Color{0x12, 0x34, 0x56});
        project.create_annotation(1, Polygon{{{0.0, 0.0}, {10.0, 0.0}, {5.0, 7.5}}}, "tree");
        return project;
    }

    std::string write_image_to_string(const Project& project, size_t image_index)
    {
        std::stringstream ss;
        NativeJSON::write_image(ss, project, image_index, fixed_metadata());
        return std::move(ss).str();
    }

    std::string write_project_to_string(const Project& project)
    {
        std::stringstream ss;
        NativeJSON::write_project(ss, project, "images", fixed_metadata());
        return std::move(ss).str();
    }

    Project read_project_from_string(const std::string& str)
    {
        std::stringstream ss{str};
        return NativeJSON::read_project(ss, "project.json");
    }

    ImageAnnotationSet read_image_from_string(const std::string& str)
    {
        std::stringstream ss{str};
        return NativeJSON::read_image(ss, "street_annotations.json");
    }
}

TEST(NativeJSON, write_image_contains_labeled_rectangle_in_expected_form)
{
    Project project;
    project.add_image("street.png");
    project.add_label("car", *try_parse_html_color_string("#FF0000"));
    project.create_annotation(0, Rect::from_corners({10.0, 10.0}, {100.0, 100.0}), "car");

    const json document = json::parse(write_image_to_string(project, 0));
    const json expected = json::parse(R"({"type":"Rectangle","coordinates":[10,10,100,100],"label":"car","color":"#FF0000"})");

    ASSERT_EQ(document.at("annotations").size(), 1);
    ASSERT_EQ(document.at("annotations").at(0), expected);
    ASSERT_EQ(document.at("annotations").at(0).dump(), expected.dump());
}

TEST(NativeJSON, write_image_writes_per_image_members_in_order)
{
    const json document = json::parse(write_image_to_string(make_street_project(), 0));

    std::vector<std::string> keys;
    for (const auto& item : document.items()) {
        keys.push_back(item.key());
    }
    const std::vector<std::string> expected = {
        "image_path",
        "image_name",
        "annotations",
        "labels",
        "label_colors",
        "total_annotations",
        "annotation_types",
        "creation_date",
        "annotation_ids",
        "color_overrides",
    };
    ASSERT_EQ(keys, expected);
    ASSERT_EQ(document.at("image_name"), "street.png");
    ASSERT_EQ(document.at("total_annotations"), 3);
    ASSERT_EQ(document.at("creation_date"), "2024-03-01T14:05:09");
    ASSERT_EQ(document.at("label_colors").at("tree"), "#00FF00");
    ASSERT_EQ(document.at("annotation_types"), json::parse(R"(["Point","Rectangle","Circle"])"));
}

TEST(NativeJSON, write_image_writes_kind_specific_coordinates)
{
    const json annotations = json::parse(write_image_to_string(make_street_project(), 0)).at("annotations");

    ASSERT_EQ(annotations.at(1).at("coordinates"), json::parse("[3.5, 4.25]"));
    ASSERT_TRUE(annotations.at(1).at("label").is_null());
    ASSERT_EQ(annotations.at(2).at("coordinates"), json::parse("[50, 60, 12.5]"));
    ASSERT_EQ(annotations.at(2).at("color"), "#123456");

    const json polygon = json::parse(write_image_to_string(make_street_project(), 1)).at("annotations").at(0);
    ASSERT_EQ(polygon.at("coordinates"), json::parse("[0, 0, 10, 0, 5, 7.5]"));
}

TEST(NativeJSON, write_image_throws_not_found_for_bad_image_index)
{
    std::stringstream ss;
    ASSERT_THROW({ NativeJSON::write_image(ss, make_street_project(), 7); }, NotFound);
}

TEST(NativeJSON, project_round_trip_reproduces_identical_project)
{
    const Project original = make_street_project();
    const Project loaded = read_project_from_string(write_project_to_string(original));

    ASSERT_EQ(loaded, original);
    ASSERT_EQ(loaded.next_annotation_id(), original.next_annotation_id());
    ASSERT_EQ(loaded.get_annotation(AnnotationID{3}).color_override, (Color{0x12, 0x34, 0x56}));
    ASSERT_EQ(loaded.get_annotation(AnnotationID{1}).color_override, std::nullopt);
}

TEST(NativeJSON, project_round_trip_preserves_counter_after_deletions)
{
    Project original = make_street_project();
    original.delete_annotation(AnnotationID{4});

    const Project loaded = read_project_from_string(write_project_to_string(original));

    ASSERT_EQ(loaded, original);
    ASSERT_EQ(loaded.next_annotation_id(), 5);
}

TEST(NativeJSON, write_project_writes_relative_paths_and_dimensions)
{
    const json document = json::parse(write_project_to_string(make_street_project()));

    const json& street = document.at("images").at(0);
    ASSERT_EQ(street.at("relative_path"), "street.png");
    ASSERT_EQ(street.at("width"), 640);
    ASSERT_EQ(street.at("height"), 480);
    ASSERT_EQ(document.at("images").at(1).at("width"), 0);
    ASSERT_EQ(document.at("dataset_info").at("total_annotations"), 4);
    ASSERT_EQ(document.at("dataset_info").at("next_annotation_id"), 5);
}

TEST(NativeJSON, read_image_round_trips_through_import)
{
    const Project original = make_street_project();
    const ImageAnnotationSet set = read_image_from_string(write_image_to_string(original, 0));

    ASSERT_EQ(set.image_path, "images/street.png");
    ASSERT_EQ(set.labels.size(), 2);
    ASSERT_EQ(set.annotations, original.annotations(0));

    Project target;
    target.add_image("images/street.png", ImageDimensions{640, 480});
    target.add_image("images/park.jpg");
    import_image_annotations(target, 0, set);
    ASSERT_EQ(target.annotations(0), original.annotations(0));
    ASSERT_EQ(target.labels(), original.labels());
}

TEST(NativeJSON, read_image_infers_overrides_when_document_lacks_ids)
{
    const ImageAnnotationSet set = read_image_from_string(R"({
        "image_path": "a.png",
        "annotations": [
            {"type": "Point", "coordinates": [1, 2], "label": "car", "color": "#FF0000"},
            {"type": "Point", "coordinates": [3, 4], "label": "car", "color": "#00ff00"}
        ],
        "labels": ["car"],
        "label_colors": {"car": "#FF0000"}
    })");

    ASSERT_EQ(set.annotations.size(), 2);
    ASSERT_FALSE(set.annotations[0].id.is_valid());
    ASSERT_EQ(set.annotations[0].color_override, std::nullopt);
    ASSERT_EQ(set.annotations[1].color_override, Color::green());
}

TEST(NativeJSON, read_image_accepts_legacy_bounding_box_circle)
{
    const ImageAnnotationSet set = read_image_from_string(R"({
        "image_path": "a.png",
        "annotations": [{"type": "Circle", "coordinates": [10, 20, 30, 40], "label": null, "color": "#FF0000"}]
    })");

    ASSERT_EQ(set.annotations.at(0).geometry, AnnotationGeometry{(Circle{{20.0, 30.0}, 10.0})});
}

TEST(NativeJSON, read_image_adds_labels_that_are_only_referenced_by_annotations)
{
    const ImageAnnotationSet set = read_image_from_string(R"({
        "image_path": "a.png",
        "annotations": [{"type": "Point", "coordinates": [1, 2], "label": "dog", "color": "#0000FF"}]
    })");

    ASSERT_EQ(set.labels.size(), 1);
    ASSERT_EQ(set.labels[0].name, "dog");
    ASSERT_EQ(set.labels[0].color, Color::blue());
    ASSERT_EQ(set.annotations[0].color_override, std::nullopt);
}

TEST(NativeJSON, read_image_reports_byte_offset_of_syntax_errors)
{
    try {
        read_image_from_string(R"({"image_path": "a.png", )");
        FAIL() << "expected an exception";
    }
    catch (const MalformedInput& ex) {
        ASSERT_EQ(ex.location().source, "street_annotations.json");
        ASSERT_TRUE(ex.location().byte_offset.has_value());
    }
}

TEST(NativeJSON, read_image_reports_index_of_bad_annotation)
{
    try {
        read_image_from_string(R"({
            "image_path": "a.png",
            "annotations": [
                {"type": "Point", "coordinates": [1, 2], "label": null, "color": "#FF0000"},
                {"type": "Polygon", "coordinates": [0, 0, 1, 1], "label": null, "color": "#FF0000"}
            ]
        })");
        FAIL() << "expected an exception";
    }
    catch (const MalformedInput& ex) {
        ASSERT_EQ(ex.location().annotation_index, 1);
        ASSERT_EQ(ex.kind(), ErrorKind::MalformedInput);
    }
}

TEST(NativeJSON, read_image_rejects_unknown_type_and_bad_color)
{
    ASSERT_THROW({
        read_image_from_string(R"({"image_path": "a.png", "annotations": [{"type": "Ellipse", "coordinates": [1, 2]}]})");
    }, MalformedInput);
    ASSERT_THROW({
        read_image_from_string(R"({"image_path": "a.png", "annotations": [{"type": "Point", "coordinates": [1, 2], "color": "red"}]})");
    }, MalformedInput);
    ASSERT_THROW({
        read_image_from_string(R"({"annotations": []})");
    }, MalformedInput);
}

TEST(NativeJSON, read_project_reports_image_index_of_duplicate_ids)
{
    try {
        read_project_from_string(R"({
            "images": [
                {"image_path": "a.png", "annotations": [{"type": "Point", "coordinates": [1, 2]}], "annotation_ids": [4]},
                {"image_path": "b.png", "annotations": [{"type": "Point", "coordinates": [1, 2]}], "annotation_ids": [4]}
            ]
        })");
        FAIL() << "expected an exception";
    }
    catch (const MalformedInput& ex) {
        ASSERT_EQ(ex.location().image_index, 1);
        ASSERT_EQ(ex.location().annotation_index, 0);
    }
}

TEST(NativeJSON, read_project_assigns_fresh_ids_when_none_are_recorded)
{
    const Project project = read_project_from_string(R"({
        "images": [
            {"image_path": "a.png", "annotations": [{"type": "Point", "coordinates": [1, 2]}]},
            {"image_path": "b.png", "annotations": [{"type": "Point", "coordinates": [3, 4]}], "annotation_ids": [7]}
        ]
    })");

    ASSERT_EQ(project.annotations(0).at(0).id, AnnotationID{8});
    ASSERT_EQ(project.annotations(1).at(0).id, AnnotationID{7});
    ASSERT_EQ(project.next_annotation_id(), 9);
}

TEST(NativeJSON, read_project_rejects_ids_that_leave_no_room_for_the_counter)
{
    try {
        read_project_from_string(R"({
            "images": [
                {"image_path": "a.png", "annotations": [{"type": "Point", "coordinates": [1, 2]}], "annotation_ids": [9223372036854775807]}
            ]
        })");
        FAIL() << "expected an exception";
    }
    catch (const MalformedInput& ex) {
        ASSERT_EQ(ex.location().image_index, 0);
    }
}

TEST(NativeJSON, read_project_accepts_largest_id_without_wrapping_the_counter)
{
    const Project project = read_project_from_string(R"({
        "images": [
            {"image_path": "a.png", "annotations": [{"type": "Point", "coordinates": [1, 2]}], "annotation_ids": [9223372036854775806]}
        ]
    })");

    ASSERT_EQ(project.annotations(0).at(0).id, AnnotationID{c_max_annotation_id});
    ASSERT_EQ(project.next_annotation_id(), std::numeric_limits<AnnotationID::element_type>::max());
}

TEST(NativeJSON, default_color_applies_to_unlabeled_annotations_on_write_and_read)
{
    Project project;
    project.add_image("a.png");
    project.create_annotation(0, Vec2{1.0, 2.0});

    std::stringstream out;
    NativeJSON::write_image(out, project, 0, fixed_metadata(), Color::blue());
    const std::string document = std::move(out).str();
    ASSERT_EQ(json::parse(document).at("annotations").at(0).at("color"), "#0000FF");

    std::stringstream in{R"({"image_path": "a.png", "annotations": [{"type": "Point", "coordinates": [1, 2], "color": "#0000FF"}]})"};
    const ImageAnnotationSet set = NativeJSON::read_image(in, "a_annotations.json", Color::blue());
    ASSERT_FALSE(set.annotations.at(0).color_override.has_value());
}

TEST(NativeJSON, import_image_annotations_leaves_project_unchanged_on_failure)
{
    Project project = make_street_project();
    const Project before = project;

    ImageAnnotationSet set;
    set.annotations.push_back(Annotation{
        .id = AnnotationID{},
        .geometry = Polygon{{{0.0, 0.0}, {1.0, 1.0}}},
        .label = std::nullopt,
        .color_override = std::nullopt,
    });

    ASSERT_THROW({ import_image_annotations(project, 0, set); }, InvalidGeometry);
    ASSERT_EQ(project, before);
    ASSERT_THROW({ import_image_annotations(project, 9, ImageAnnotationSet{}); }, NotFound);
}

TEST(native_annotation_path_for, places_document_beside_image)
{
    ASSERT_EQ(native_annotation_path_for("dir/cat.png"), std::filesystem::path{"dir/cat_annotations.json"});
    ASSERT_EQ(native_annotation_path_for("cat.tar.gz"), std::filesystem::path{"cat.tar_annotations.json"});
}

TEST(save_project_file, load_project_file_reads_back_saved_project)
{
    TemporaryDirectory dir;
    const auto path = dir.absolute_path() / "master_dataset.json";
    const Project original = make_street_project();

    save_project_file(path, original, fixed_metadata());
    ASSERT_EQ(load_project_file(path), original);
}

TEST(load_project_file, throws_for_missing_file)
{
    TemporaryDirectory dir;
    ASSERT_ANY_THROW({ load_project_file(dir.absolute_path() / "missing.json"); });
}

TEST(export_native_annotation_files, writes_one_document_per_image)
{
    TemporaryDirectory dir;
    const auto written = export_native_annotation_files(dir.absolute_path() / "out", make_street_project(), fixed_metadata());

    ASSERT_EQ(written.size(), 2);
    ASSERT_EQ(written[0], dir.absolute_path() / "out" / "street_annotations.json");
    ASSERT_EQ(written[1], dir.absolute_path() / "out" / "park_annotations.json");
    ASSERT_EQ(json::parse(slurp(written[1])).at("total_annotations"), 1);
}

TEST(export_native_annotation_files, gives_images_with_the_same_stem_distinct_files)
{
    Project project;
    project.add_label("car", Color::red());
    project.add_label("dog", Color::blue());
    project.add_image("photos/cat.png");
    project.add_image("photos/cat.jpg");
    project.create_annotation(0, Vec2{1.0, 1.0}, "car");
    project.create_annotation(1, Vec2{2.0, 2.0}, "dog");

    TemporaryDirectory dir;
    const auto written = export_native_annotation_files(dir.absolute_path(), project, fixed_metadata());

    ASSERT_EQ(written.size(), 2);
    ASSERT_EQ(written[0], dir.absolute_path() / "cat_annotations.json");
    ASSERT_EQ(written[1], dir.absolute_path() / "cat_2_annotations.json");
    ASSERT_EQ(json::parse(slurp(written[0])).at("image_name"), "cat.png");
    ASSERT_EQ(json::parse(slurp(written[1])).at("image_name"), "cat.jpg");
}

TEST(load_image_annotation_files, imports_documents_found_beside_images)
{
    TemporaryDirectory dir;
    const auto root = dir.absolute_path();
    for (const char* name : {"a.png", "b.png", "c.png"}) {
        write_file_atomically(root / name, "");
    }

    Project original = load_image_folder(root);
    original.add_label("car", Color::green());
    original.create_annotation(0, Rect::from_corners({1.0, 2.0}, {30.0, 40.0}), "car");
    original.create_annotation(1, Vec2{5.0, 6.0});
    export_native_annotation_files(root, original, fixed_metadata());
    write_file_atomically(root / "c_annotations.json", "{ not json");

    Project project = load_image_folder(root);
    const AnnotationFilesLoadResult result = load_image_annotation_files(project);

    ASSERT_EQ(result.num_loaded, 2);
    ASSERT_EQ(result.failed, std::vector<std::filesystem::path>{root / "c_annotations.json"});
    ASSERT_EQ(project.annotations(0), original.annotations(0));
    ASSERT_EQ(project.annotations(1), original.annotations(1));
    ASSERT_TRUE(project.annotations(2).empty());
    ASSERT_EQ(project.get_label("car").color, Color::green());
}

TEST(load_image_annotation_files, leaves_images_without_documents_untouched)
{
    TemporaryDirectory dir;
    write_file_atomically(dir.absolute_path() / "a.png", "");

    Project project = load_image_folder(dir.absolute_path());
    const Project before = project;

    const AnnotationFilesLoadResult result = load_image_annotation_files(project);
    ASSERT_EQ(result.num_loaded, 0);
    ASSERT_TRUE(result.failed.empty());
    ASSERT_EQ(project, before);
}
