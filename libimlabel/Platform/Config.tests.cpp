#include "Config.h"

#include <libimlabel/Documents/HitTesting.h>
#include <libimlabel/Documents/UndoableProject.h>
#include <libimlabel/Formats/NativeJSON.h>
#include <libimlabel/Platform/FilesystemHelpers.h>
#include <libimlabel/Utils/TemporaryDirectory.h>

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using namespace iml;

TEST(Config, default_constructed_has_documented_defaults)
{
    const Config config;

    ASSERT_EQ(config.source_path(), std::nullopt);
    ASSERT_EQ(config.viewport_parameters().min_zoom, 0.1);
    ASSERT_EQ(config.viewport_parameters().max_zoom, 5.0);
    ASSERT_EQ(config.viewport_parameters().zoom_step, 1.2);
    ASSERT_EQ(config.vertex_tolerance(), 10.0);
    ASSERT_EQ(config.edge_tolerance(), 5.0);
    ASSERT_EQ(config.min_drag_distance(), 5.0);
    ASSERT_EQ(config.max_history_depth(), 50);
    ASSERT_EQ(config.default_label_color(), Color::red());
    ASSERT_EQ(config.approximation_policy(), ApproximationPolicy{});
    ASSERT_EQ(config.voc_image_depth(), 3);
}

TEST(Config, from_toml_string_reads_all_sections)
{
    const Config config = Config::from_toml_string(R"(
[viewport]
min_zoom = 0.5
max_zoom = 8
zoom_step = 1.5
wheel_zoom_step = 1.05
fit_margin = 0.8

[editing]
vertex_tolerance = 12.0
edge_tolerance = 4
min_drag_distance = 2.5

[history]
max_depth = 10

[labels]
default_color = "#00ff00"

[export]
allow_approximation = false
circle_polygon_sides = 32
point_box_size = 4.0
voc_image_depth = 1
)");

    ASSERT_EQ(config.viewport_parameters().min_zoom, 0.5);
    ASSERT_EQ(config.viewport_parameters().max_zoom, 8.0);
    ASSERT_EQ(config.viewport_parameters().zoom_step, 1.5);
    ASSERT_EQ(config.viewport_parameters().wheel_zoom_step, 1.05);
    ASSERT_EQ(config.viewport_parameters().fit_margin, 0.8);
    ASSERT_EQ(config.vertex_tolerance(), 12.0);
    ASSERT_EQ(config.edge_tolerance(), 4.0);
    ASSERT_EQ(config.min_drag_distance(), 2.5);
    ASSERT_EQ(config.max_history_depth(), 10);
    ASSERT_EQ(config.default_label_color(), Color::green());
    ASSERT_FALSE(config.approximation_policy().allow_approximation);
    ASSERT_EQ(config.approximation_policy().circle_polygon_sides, 32);
    ASSERT_EQ(config.approximation_policy().point_box_size, 4.0);
    ASSERT_EQ(config.pascal_voc_parameters().image_depth, 1);
    ASSERT_FALSE(config.pascal_voc_parameters().approximation_policy.allow_approximation);
}

TEST(Config, from_toml_string_keeps_defaults_for_invalid_values)
{
    const Config config = Config::from_toml_string(R"(
[viewport]
min_zoom = -1.0

[history]
max_depth = 0

[labels]
default_color = "reddish"

[export]
circle_polygon_sides = 2
point_box_size = "big"
)");

    ASSERT_EQ(config.viewport_parameters().min_zoom, 0.1);
    ASSERT_EQ(config.max_history_depth(), 50);
    ASSERT_EQ(config.default_label_color(), Color::red());
    ASSERT_EQ(config.approximation_policy().circle_polygon_sides, 16);
    ASSERT_EQ(config.approximation_policy().point_box_size, 2.0);
}

TEST(Config, from_toml_string_rejects_integers_that_do_not_fit_their_setting)
{
    const Config config = Config::from_toml_string(R"(
[export]
voc_image_depth = 5000000000
circle_polygon_sides = -3
)");

    ASSERT_EQ(config.voc_image_depth(), 3);
    ASSERT_EQ(config.approximation_policy().circle_polygon_sides, 16);
}

TEST(Config, from_toml_string_rejects_inverted_zoom_bounds)
{
    const Config config = Config::from_toml_string("[viewport]\nmin_zoom = 4.0\nmax_zoom = 2.0\n");

    ASSERT_EQ(config.viewport_parameters().min_zoom, 0.1);
    ASSERT_EQ(config.viewport_parameters().max_zoom, 5.0);
}

TEST(Config, from_toml_string_uses_defaults_when_source_cannot_be_parsed)
{
    const Config config = Config::from_toml_string("[history\nmax_depth = = 3");
    ASSERT_EQ(config.max_history_depth(), 50);
}

TEST(Config, load_reads_file_and_remembers_its_path)
{
    TemporaryDirectory dir;
    const auto path = dir.absolute_path() / "imlabel.toml";
    write_file_atomically(path, "[editing]\nvertex_tolerance = 3.0\n");

    const Config config = Config::load(path);
    ASSERT_EQ(config.source_path(), path);
    ASSERT_EQ(config.vertex_tolerance(), 3.0);
}

TEST(Config, load_uses_defaults_for_missing_file)
{
    TemporaryDirectory dir;
    const Config config = Config::load(dir.absolute_path() / "missing.toml");
    ASSERT_EQ(config.max_history_depth(), 50);
}

TEST(Config, configured_values_drive_editing_and_export)
{
    const Config config = Config::from_toml_string(R"(
[viewport]
max_zoom = 2.0

[editing]
vertex_tolerance = 20.0
min_drag_distance = 12.0

[history]
max_depth = 2

[labels]
default_color = "#00FF00"
)");

    Project project;
    project.add_image("a.png");
    const AnnotationID id = project.create_annotation(0, Vec2{100.0, 100.0});

    // a press 15 pixels away only hits the point with the configured tolerance
    const std::vector<Annotation> annotations = project.annotations(0);
    ASSERT_FALSE(hit_test({115.0, 100.0}, ViewportState{}, annotations, Config{}.vertex_tolerance()).has_value());
    ASSERT_TRUE(hit_test({115.0, 100.0}, ViewportState{}, annotations, config.vertex_tolerance()).has_value());

    ASSERT_TRUE(exceeds_drag_threshold({0.0, 0.0}, {8.0, 0.0}, Config{}.min_drag_distance()));
    ASSERT_FALSE(exceeds_drag_threshold({0.0, 0.0}, {8.0, 0.0}, config.min_drag_distance()));

    ASSERT_EQ(zoom_in(ViewportState{.zoom = 1.9}, {}, config.viewport_parameters()).zoom, 2.0);

    UndoableProject doc{project, config.max_history_depth()};
    ASSERT_EQ(doc.history().max_depth(), 2);

    std::stringstream ss;
    NativeJSON::write_image(ss, project, 0, ExportMetadata{}, config.default_label_color());
    ASSERT_NE(ss.str().find(R"("color": "#00FF00")"), std::string::npos);
    ASSERT_TRUE(project.contains_annotation(id));
}
