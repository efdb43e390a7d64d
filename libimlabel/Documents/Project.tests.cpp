#include "Project.h"

#include <libimlabel/Utils/Exceptions.h>

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace iml;

namespace
{
    const Rect c_car_box = Rect::from_corners({10.0, 10.0}, {100.0, 100.0});
    const Polygon c_triangle{{{0.0, 0.0}, {10.0, 0.0}, {0.0, 10.0}}};

    Project make_project_with_car_label()
    {
        Project project;
        project.add_image("images/street.png", ImageDimensions{640, 480});
        project.add_label("car", Color::red());
        return project;
    }
}

TEST(Project, default_constructed_is_empty)
{
    const Project project;
    ASSERT_EQ(project.num_images(), 0);
    ASSERT_TRUE(project.labels().empty());
    ASSERT_EQ(project.num_annotations(), 0);
    ASSERT_EQ(project.next_annotation_id(), 1);
}

TEST(Project, add_image_returns_index_and_find_image_finds_it)
{
    Project project;
    ASSERT_EQ(project.add_image("a.png"), 0);
    ASSERT_EQ(project.add_image("b.png", ImageDimensions{10, 20}), 1);
    ASSERT_EQ(project.find_image("b.png"), 1);
    ASSERT_EQ(project.find_image("c.png"), std::nullopt);
    ASSERT_EQ(project.image_at(1).dimensions, (ImageDimensions{10, 20}));
}

TEST(Project, image_at_throws_not_found_for_bad_index)
{
    const Project project;
    ASSERT_THROW({ [[maybe_unused]] const auto& image = project.image_at(0); }, NotFound);
}

TEST(Project, create_annotation_assigns_increasing_ids)
{
    Project project = make_project_with_car_label();
    const AnnotationID a = project.create_annotation(0, c_car_box, "car");
    const AnnotationID b = project.create_annotation(0, Vec2{5.0, 5.0});

    ASSERT_EQ(a, AnnotationID{1});
    ASSERT_EQ(b, AnnotationID{2});
    ASSERT_EQ(project.get_annotation(a).label, "car");
    ASSERT_EQ(project.get_annotation(b).label, std::nullopt);
    ASSERT_EQ(project.annotations(0).size(), 2);
}

TEST(Project, ids_are_never_reused_after_delete)
{
    Project project = make_project_with_car_label();
    const AnnotationID a = project.create_annotation(0, c_car_box);
    project.delete_annotation(a);
    const AnnotationID b = project.create_annotation(0, c_car_box);
    ASSERT_NE(a, b);
}

TEST(Project, create_annotation_rejects_invalid_geometry_without_side_effects)
{
    Project project = make_project_with_car_label();
    const Project before = project;
    const auto next_id = project.next_annotation_id();

    ASSERT_THROW(project.create_annotation(0, Polygon{{{0.0, 0.0}, {1.0, 1.0}}}), InvalidGeometry);
    ASSERT_EQ(project, before);
    ASSERT_EQ(project.next_annotation_id(), next_id);
}

TEST(Project, create_annotation_rejects_unknown_label)
{
    Project project = make_project_with_car_label();
    ASSERT_THROW(project.create_annotation(0, c_car_box, "bus"), NotFound);
    ASSERT_EQ(project.num_annotations(), 0);
}

TEST(Project, get_annotation_throws_not_found_for_unknown_id)
{
    const Project project = make_project_with_car_label();
    ASSERT_THROW({ [[maybe_unused]] const auto& a = project.get_annotation(AnnotationID{7}); }, NotFound);
    ASSERT_EQ(project.try_get_annotation(AnnotationID{7}), nullptr);
}

TEST(Project, delete_annotation_returns_removed_annotation)
{
    Project project = make_project_with_car_label();
    const AnnotationID id = project.create_annotation(0, c_car_box, "car");

    const Annotation removed = project.delete_annotation(id);

    ASSERT_EQ(removed.id, id);
    ASSERT_EQ(removed.geometry, AnnotationGeometry{c_car_box});
    ASSERT_FALSE(project.contains_annotation(id));
    ASSERT_THROW(project.delete_annotation(id), NotFound);
}

TEST(Project, insert_annotation_restores_original_z_order_position)
{
    Project project = make_project_with_car_label();
    project.create_annotation(0, c_car_box);
    const AnnotationID middle = project.create_annotation(0, c_triangle);
    project.create_annotation(0, Vec2{1.0, 1.0});
    const Project before = project;

    const AnnotationLocation location = project.locate_annotation(middle);
    Annotation removed = project.delete_annotation(middle);
    project.insert_annotation(location, std::move(removed));

    ASSERT_EQ(project, before);
}

TEST(Project, insert_annotation_rejects_duplicate_ids)
{
    Project project = make_project_with_car_label();
    const AnnotationID id = project.create_annotation(0, c_car_box);
    const Annotation copy = project.get_annotation(id);
    ASSERT_THROW(project.insert_annotation({.image_index = 0, .position = 0}, copy), std::invalid_argument);
}

TEST(Project, set_geometry_validates_and_preserves_prior_geometry_on_failure)
{
    Project project = make_project_with_car_label();
    const AnnotationID id = project.create_annotation(0, c_triangle);

    ASSERT_THROW(project.set_geometry(id, Polygon{{{0.0, 0.0}, {1.0, 1.0}}}), InvalidGeometry);
    ASSERT_EQ(project.get_annotation(id).geometry, AnnotationGeometry{c_triangle});
}

TEST(Project, set_geometry_cannot_change_kind)
{
    Project project = make_project_with_car_label();
    const AnnotationID id = project.create_annotation(0, c_triangle);
    ASSERT_THROW(project.set_geometry(id, c_car_box), InvalidGeometry);
}

TEST(Project, set_label_assigns_and_clears_label)
{
    Project project = make_project_with_car_label();
    const AnnotationID id = project.create_annotation(0, c_car_box);

    project.set_label(id, "car");
    ASSERT_EQ(project.get_annotation(id).label, "car");

    project.set_label(id, std::nullopt);
    ASSERT_EQ(project.get_annotation(id).label, std::nullopt);

    ASSERT_THROW(project.set_label(id, "bus"), NotFound);
}

TEST(Project, add_label_throws_duplicate_label_for_existing_name)
{
    Project project = make_project_with_car_label();
    ASSERT_THROW(project.add_label("car", Color::blue()), DuplicateLabel);
    ASSERT_EQ(project.get_label("car").color, Color::red());
}

TEST(Project, label_names_are_case_sensitive)
{
    Project project = make_project_with_car_label();
    ASSERT_NO_THROW(project.add_label("Car", Color::blue()));
    ASSERT_EQ(project.labels().size(), 2);
}

TEST(Project, add_label_rejects_empty_name)
{
    Project project;
    ASSERT_THROW(project.add_label("", Color::blue()), std::invalid_argument);
}

TEST(Project, remove_label_without_cascade_throws_label_in_use)
{
    Project project = make_project_with_car_label();
    const AnnotationID id = project.create_annotation(0, c_car_box, "car");
    const Project before = project;

    ASSERT_THROW(project.remove_label("car", false), LabelInUse);
    ASSERT_EQ(project, before);
    ASSERT_EQ(project.get_annotation(id).label, "car");
}

TEST(Project, remove_label_with_cascade_clears_references)
{
    Project project = make_project_with_car_label();
    const AnnotationID a = project.create_annotation(0, c_car_box, "car");
    const AnnotationID b = project.create_annotation(0, c_triangle, "car");
    const AnnotationID c = project.create_annotation(0, Vec2{});

    const std::vector<AnnotationID> cleared = project.remove_label("car", true);

    ASSERT_EQ(cleared, (std::vector<AnnotationID>{a, b}));
    ASSERT_FALSE(project.has_label("car"));
    ASSERT_EQ(project.get_annotation(a).label, std::nullopt);
    ASSERT_EQ(project.get_annotation(b).label, std::nullopt);
    ASSERT_EQ(project.get_annotation(c).label, std::nullopt);
}

TEST(Project, remove_unused_label_succeeds_without_cascade)
{
    Project project = make_project_with_car_label();
    ASSERT_TRUE(project.remove_label("car", false).empty());
    ASSERT_TRUE(project.labels().empty());
}

TEST(Project, remove_label_throws_not_found_for_unknown_label)
{
    Project project;
    ASSERT_THROW(project.remove_label("car", true), NotFound);
}

TEST(Project, effective_color_prefers_override_then_label_then_fallback)
{
    Project project = make_project_with_car_label();
    const AnnotationID labeled = project.create_annotation(0, c_car_box, "car");
    const AnnotationID unlabeled = project.create_annotation(0, c_car_box);

    ASSERT_EQ(project.effective_color_of(project.get_annotation(labeled)), Color::red());
    ASSERT_EQ(project.effective_color_of(project.get_annotation(unlabeled), Color::green()), Color::green());

    project.set_label_color("car", Color::blue());
    ASSERT_EQ(project.effective_color_of(project.get_annotation(labeled)), Color::blue());

    project.set_color_override(labeled, Color::white());
    ASSERT_EQ(project.effective_color_of(project.get_annotation(labeled)), Color::white());

    project.set_color_override(labeled, std::nullopt);
    ASSERT_EQ(project.effective_color_of(project.get_annotation(labeled)), Color::blue());
}

TEST(Project, insert_annotation_rejects_ids_that_would_overflow_the_counter)
{
    Project project = make_project_with_car_label();
    const Annotation annotation{
        .id = AnnotationID{std::numeric_limits<AnnotationID::element_type>::max()},
        .geometry = c_car_box,
        .label = std::nullopt,
        .color_override = std::nullopt,
    };
    const Project before = project;

    ASSERT_THROW(project.insert_annotation({.image_index = 0, .position = 0}, annotation), std::invalid_argument);
    ASSERT_EQ(project, before);
    ASSERT_EQ(project.next_annotation_id(), 1);
}

TEST(Project, largest_accepted_id_exhausts_the_counter_without_wrapping)
{
    Project project = make_project_with_car_label();
    project.insert_annotation({.image_index = 0, .position = 0}, Annotation{
        .id = AnnotationID{c_max_annotation_id},
        .geometry = c_car_box,
        .label = std::nullopt,
        .color_override = std::nullopt,
    });

    ASSERT_EQ(project.next_annotation_id(), std::numeric_limits<AnnotationID::element_type>::max());
    ASSERT_THROW({ [[maybe_unused]] auto id = project.allocate_annotation_id(); }, std::overflow_error);
    ASSERT_THROW({ [[maybe_unused]] auto id = project.create_annotation(0, c_car_box); }, std::overflow_error);
    ASSERT_EQ(project.num_annotations(), 1);
}

TEST(Project, equality_ignores_id_counter)
{
    Project a = make_project_with_car_label();
    Project b = make_project_with_car_label();
    [[maybe_unused]] const auto id = b.allocate_annotation_id();

    ASSERT_NE(a.next_annotation_id(), b.next_annotation_id());
    ASSERT_EQ(a, b);
}

TEST(Project, set_next_annotation_id_never_goes_below_existing_ids)
{
    Project project = make_project_with_car_label();
    project.create_annotation(0, c_car_box);
    project.create_annotation(0, c_car_box);

    project.set_next_annotation_id(1);
    ASSERT_EQ(project.next_annotation_id(), 3);

    project.set_next_annotation_id(100);
    ASSERT_EQ(project.next_annotation_id(), 100);
}

TEST(Project, annotations_are_owned_per_image)
{
    Project project = make_project_with_car_label();
    project.add_image("images/other.png");
    const AnnotationID id = project.create_annotation(1, c_car_box);

    ASSERT_TRUE(project.annotations(0).empty());
    ASSERT_EQ(project.annotations(1).size(), 1);
    ASSERT_EQ(project.locate_annotation(id), (AnnotationLocation{.image_index = 1, .position = 0}));
}

TEST(Project, remove_image_removes_its_annotations)
{
    Project project = make_project_with_car_label();
    const AnnotationID id = project.create_annotation(0, c_car_box);
    project.remove_image(0);
    ASSERT_EQ(project.num_images(), 0);
    ASSERT_FALSE(project.contains_annotation(id));
}
