#pragma once

#include <libimlabel/Documents/AnnotationGeometry.h>
#include <libimlabel/Documents/AnnotationID.h>
#include <libimlabel/Graphics/Color.h>
#include <libimlabel/Maths/Vec2.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace iml { class UndoableProject; }

// undoable actions: each one performs exactly one recorded mutation of an
// `UndoableProject`, or throws and leaves it unchanged
namespace iml
{
    AnnotationID action_create_annotation(
        UndoableProject&,
        size_t image_index,
        AnnotationGeometry,
        std::optional<std::string> label = std::nullopt
    );

    void action_delete_annotation(UndoableProject&, AnnotationID);

    void action_set_label(UndoableProject&, AnnotationID, std::optional<std::string> label_name);

    void action_set_geometry(UndoableProject&, AnnotationID, AnnotationGeometry);

    void action_set_color_override(UndoableProject&, AnnotationID, std::optional<Color>);

    void action_translate_annotation(UndoableProject&, AnnotationID, const Vec2& image_delta);

    void action_move_vertex(UndoableProject&, AnnotationID, size_t vertex_index, const Vec2& new_image_point);

    void action_insert_vertex(UndoableProject&, AnnotationID, size_t edge_index, const Vec2& image_point);

    void action_delete_vertex(UndoableProject&, AnnotationID, size_t vertex_index);

    void action_add_label(UndoableProject&, std::string name, const Color&);

    void action_remove_label(UndoableProject&, std::string_view name, bool cascade);

    void action_set_label_color(UndoableProject&, std::string_view name, const Color&);

    // drag gestures
    //
    // the `*_without_committing` actions update the annotation live (e.g. on each
    // pointer-move event) without recording anything. `action_commit_drag` then
    // records one command spanning the whole drag, and `action_cancel_drag`
    // restores the state from before the drag.

    // moves the vertex handle to `image_point`, relative to the geometry the
    // annotation had when the drag started
    void action_drag_vertex_without_committing(UndoableProject&, AnnotationID, size_t vertex_index, const Vec2& image_point);

    // translates the annotation by `total_image_delta` relative to where it was
    // when the drag started
    void action_drag_annotation_without_committing(UndoableProject&, AnnotationID, const Vec2& total_image_delta);

    void action_commit_drag(UndoableProject&);
    void action_cancel_drag(UndoableProject&);

    void action_undo(UndoableProject&);
    void action_redo(UndoableProject&);
}
