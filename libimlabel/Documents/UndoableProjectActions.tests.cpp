#include "UndoableProjectActions.h"

#include <libimlabel/Documents/UndoableProject.h>
#include <libimlabel/Utils/Exceptions.h>

#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

using namespace iml;

namespace
{
    const Rect c_car_box = Rect::from_corners({10.0, 10.0}, {100.0, 100.0});
    const Polygon c_triangle{{{0.0, 0.0}, {10.0, 0.0}, {0.0, 10.0}}};
    const Polygon c_square{{{0.0, 0.0}, {10.0, 0.0}, {10.0, 10.0}, {0.0, 10.0}}};

    UndoableProject make_document()
    {
        Project project;
        project.add_image("street.png");
        project.add_label("car", Color::red());
        return UndoableProject{std::move(project)};
    }
}

TEST(action_create_annotation, creates_one_undoable_command)
{
    UndoableProject doc = make_document();
    const Project before = doc.project();

    const AnnotationID id = action_create_annotation(doc, 0, c_car_box, "car");

    ASSERT_EQ(doc.project().get_annotation(id).label, "car");
    ASSERT_EQ(doc.history().num_undo_entries(), 1);
    ASSERT_EQ(doc.history().undo_entry_at(0).description(), "created Rectangle");

    doc.undo();
    ASSERT_EQ(doc.project(), before);

    doc.redo();
    ASSERT_EQ(doc.project().get_annotation(id).geometry, AnnotationGeometry{c_car_box});
}

TEST(action_create_annotation, never_reuses_ids_after_undo)
{
    UndoableProject doc = make_document();
    const AnnotationID a = action_create_annotation(doc, 0, c_car_box);
    doc.undo();
    const AnnotationID b = action_create_annotation(doc, 0, c_car_box);
    ASSERT_NE(a, b);
}

TEST(action_create_annotation, invalid_geometry_records_nothing)
{
    UndoableProject doc = make_document();
    ASSERT_THROW(action_create_annotation(doc, 0, Polygon{{{0.0, 0.0}, {1.0, 1.0}}}), InvalidGeometry);
    ASSERT_FALSE(doc.can_undo());
    ASSERT_EQ(doc.project().num_annotations(), 0);
}

TEST(action_delete_annotation, undo_restores_original_z_order)
{
    UndoableProject doc = make_document();
    action_create_annotation(doc, 0, c_car_box);
    const AnnotationID middle = action_create_annotation(doc, 0, c_triangle);
    action_create_annotation(doc, 0, Vec2{5.0, 5.0});
    const Project before = doc.project();

    action_delete_annotation(doc, middle);
    ASSERT_FALSE(doc.project().contains_annotation(middle));

    doc.undo();
    ASSERT_EQ(doc.project(), before);
}

TEST(action_delete_vertex, polygon_with_three_vertices_is_unchanged)
{
    UndoableProject doc = make_document();
    const AnnotationID id = action_create_annotation(doc, 0, c_triangle);
    const size_t num_entries = doc.history().num_undo_entries();

    ASSERT_THROW(action_delete_vertex(doc, id, 0), InvalidGeometry);
    ASSERT_EQ(doc.project().get_annotation(id).geometry, AnnotationGeometry{c_triangle});
    ASSERT_EQ(doc.history().num_undo_entries(), num_entries);
}

TEST(action_insert_vertex, then_undo_restores_polygon)
{
    UndoableProject doc = make_document();
    const AnnotationID id = action_create_annotation(doc, 0, c_square);

    action_insert_vertex(doc, id, 0, {5.0, -1.0});
    ASSERT_EQ(std::get<Polygon>(doc.project().get_annotation(id).geometry).vertices.size(), 5);

    doc.undo();
    ASSERT_EQ(doc.project().get_annotation(id).geometry, AnnotationGeometry{c_square});
}

TEST(action_move_vertex, records_one_command)
{
    UndoableProject doc = make_document();
    const AnnotationID id = action_create_annotation(doc, 0, c_car_box);

    action_move_vertex(doc, id, 2, {200.0, 200.0});

    ASSERT_EQ(doc.project().get_annotation(id).geometry, AnnotationGeometry{Rect::from_corners({10.0, 10.0}, {200.0, 200.0})});
    ASSERT_EQ(doc.history().num_undo_entries(), 2);
}

TEST(action_translate_annotation, can_be_undone)
{
    UndoableProject doc = make_document();
    const AnnotationID id = action_create_annotation(doc, 0, Circle{.origin = {50.0, 50.0}, .radius = 5.0});

    action_translate_annotation(doc, id, {10.0, 0.0});
    ASSERT_EQ(std::get<Circle>(doc.project().get_annotation(id).geometry).origin, Vec2(60.0, 50.0));

    doc.undo();
    ASSERT_EQ(std::get<Circle>(doc.project().get_annotation(id).geometry).origin, Vec2(50.0, 50.0));
}

TEST(action_set_label, and_set_color_override_are_undoable)
{
    UndoableProject doc = make_document();
    const AnnotationID id = action_create_annotation(doc, 0, c_car_box);

    action_set_label(doc, id, "car");
    action_set_color_override(doc, id, Color::green());
    ASSERT_EQ(doc.project().effective_color_of(doc.project().get_annotation(id)), Color::green());

    doc.undo();
    ASSERT_EQ(doc.project().effective_color_of(doc.project().get_annotation(id)), Color::red());

    doc.undo();
    ASSERT_EQ(doc.project().get_annotation(id).label, std::nullopt);
}

TEST(action_add_label, duplicate_throws_and_records_nothing)
{
    UndoableProject doc = make_document();
    ASSERT_THROW(action_add_label(doc, "car", Color::blue()), DuplicateLabel);
    ASSERT_FALSE(doc.can_undo());
}

TEST(action_remove_label, without_cascade_throws_label_in_use)
{
    UndoableProject doc = make_document();
    action_create_annotation(doc, 0, c_car_box, "car");
    const Project before = doc.project();

    ASSERT_THROW(action_remove_label(doc, "car", false), LabelInUse);
    ASSERT_EQ(doc.project(), before);
}

TEST(action_remove_label, with_cascade_clears_references_and_undo_restores_them)
{
    UndoableProject doc = make_document();
    const AnnotationID id = action_create_annotation(doc, 0, c_car_box, "car");
    const Project before = doc.project();

    action_remove_label(doc, "car", true);
    ASSERT_FALSE(doc.project().has_label("car"));
    ASSERT_EQ(doc.project().get_annotation(id).label, std::nullopt);

    doc.undo();
    ASSERT_EQ(doc.project(), before);
}

TEST(action_set_label_color, is_followed_by_labeled_annotations)
{
    UndoableProject doc = make_document();
    const AnnotationID id = action_create_annotation(doc, 0, c_car_box, "car");

    action_set_label_color(doc, "car", Color::blue());
    ASSERT_EQ(doc.project().effective_color_of(doc.project().get_annotation(id)), Color::blue());

    doc.undo();
    ASSERT_EQ(doc.project().get_label("car").color, Color::red());
}

TEST(action_drag_vertex_without_committing, whole_drag_collapses_into_one_command)
{
    UndoableProject doc = make_document();
    const AnnotationID id = action_create_annotation(doc, 0, c_square);
    const Project before_drag = doc.project();

    for (int i = 1; i <= 10; ++i) {
        action_drag_vertex_without_committing(doc, id, 2, {10.0 + i, 10.0 + i});
    }
    action_commit_drag(doc);

    ASSERT_EQ(std::get<Polygon>(doc.project().get_annotation(id).geometry).vertices[2], Vec2(20.0, 20.0));
    ASSERT_EQ(doc.history().num_undo_entries(), 2);

    doc.undo();
    ASSERT_EQ(doc.project(), before_drag);
}

TEST(action_drag_vertex_without_committing, rectangle_drag_is_relative_to_start_geometry)
{
    UndoableProject doc = make_document();
    const AnnotationID id = action_create_annotation(doc, 0, c_car_box);

    // drag the top-left corner past the bottom-right one and back again
    action_drag_vertex_without_committing(doc, id, 0, {150.0, 150.0});
    action_drag_vertex_without_committing(doc, id, 0, {20.0, 30.0});
    action_commit_drag(doc);

    ASSERT_EQ(doc.project().get_annotation(id).geometry, AnnotationGeometry{Rect::from_corners({20.0, 30.0}, {100.0, 100.0})});
}

TEST(action_drag_annotation_without_committing, uses_total_delta_from_start)
{
    UndoableProject doc = make_document();
    const AnnotationID id = action_create_annotation(doc, 0, Vec2{10.0, 10.0});

    action_drag_annotation_without_committing(doc, id, {1.0, 1.0});
    action_drag_annotation_without_committing(doc, id, {5.0, 2.0});
    action_commit_drag(doc);

    ASSERT_EQ(doc.project().get_annotation(id).geometry, (AnnotationGeometry{Vec2{15.0, 12.0}}));
    ASSERT_EQ(doc.history().undo_entry_at(0).description(), "moved Point");
}

TEST(action_cancel_drag, restores_start_state_and_records_nothing)
{
    UndoableProject doc = make_document();
    const AnnotationID id = action_create_annotation(doc, 0, c_square);
    const Project before_drag = doc.project();

    action_drag_vertex_without_committing(doc, id, 0, {-50.0, -50.0});
    action_cancel_drag(doc);

    ASSERT_EQ(doc.project(), before_drag);
    ASSERT_EQ(doc.history().num_undo_entries(), 1);
    ASSERT_FALSE(doc.has_pending_gesture());
}

TEST(action_commit_drag, without_movement_records_nothing)
{
    UndoableProject doc = make_document();
    const AnnotationID id = action_create_annotation(doc, 0, c_square);

    doc.begin_gesture(id, "no-op");
    action_commit_drag(doc);

    ASSERT_EQ(doc.history().num_undo_entries(), 1);
}

TEST(UndoableProject, undo_commits_pending_gesture_first)
{
    UndoableProject doc = make_document();
    const AnnotationID id = action_create_annotation(doc, 0, Vec2{0.0, 0.0});

    action_drag_annotation_without_committing(doc, id, {3.0, 3.0});
    doc.undo();  // commits the drag, then undoes it

    ASSERT_EQ(doc.project().get_annotation(id).geometry, (AnnotationGeometry{Vec2{0.0, 0.0}}));
    ASSERT_TRUE(doc.can_redo());
}

TEST(UndoableProject, update_gesture_without_pending_gesture_throws)
{
    UndoableProject doc = make_document();
    ASSERT_THROW(doc.update_gesture(Vec2{}), std::logic_error);
}

TEST(UndoableProject, reset_replaces_project_and_clears_history)
{
    UndoableProject doc = make_document();
    action_create_annotation(doc, 0, c_car_box);

    doc.reset(Project{});

    ASSERT_EQ(doc.project().num_images(), 0);
    ASSERT_FALSE(doc.can_undo());
}

TEST(UndoableProject, undo_and_redo_throw_when_unavailable)
{
    UndoableProject doc = make_document();
    ASSERT_THROW(action_undo(doc), NothingToUndo);
    ASSERT_THROW(action_redo(doc), NothingToRedo);
}
