#include "UndoableProjectActions.h"

#include <libimlabel/Documents/Command.h>
#include <libimlabel/Documents/Project.h>
#include <libimlabel/Documents/UndoableProject.h>
#include <libimlabel/Documents/VertexEditing.h>
#include <libimlabel/Utils/Exceptions.h>

#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace iml;

namespace
{
    std::string describe(std::string_view verb, const Project& project, AnnotationID id)
    {
        std::stringstream ss;
        ss << verb << ' ' << kind_of(project.get_annotation(id));
        return std::move(ss).str();
    }

    void execute_geometry_change(UndoableProject& doc, AnnotationID id, AnnotationGeometry after, std::string description)
    {
        const Annotation& annotation = doc.project().get_annotation(id);
        doc.execute(Command{
            std::move(description),
            GeometryDelta{.id = id, .before = annotation.geometry, .after = std::move(after)},
        });
    }

    // ensures that a drag gesture is pending on `id`
    void ensure_gesture_on(UndoableProject& doc, AnnotationID id, std::string_view verb)
    {
        if (doc.pending_gesture_annotation() != id) {
            doc.begin_gesture(id, describe(verb, doc.project(), id));
        }
    }
}

AnnotationID iml::action_create_annotation(
    UndoableProject& doc,
    size_t image_index,
    AnnotationGeometry geometry,
    std::optional<std::string> label)
{
    const Project& project = doc.project();
    const AnnotationID id{project.next_annotation_id()};
    const AnnotationKind kind = kind_of(geometry);

    std::stringstream description;
    description << "created " << kind;

    doc.execute(Command{
        std::move(description).str(),
        CreateAnnotationDelta{
            .location = {.image_index = image_index, .position = project.annotations(image_index).size()},
            .annotation = Annotation{
                .id = id,
                .geometry = std::move(geometry),
                .label = std::move(label),
                .color_override = std::nullopt,
            },
        },
    });
    return id;
}

void iml::action_delete_annotation(UndoableProject& doc, AnnotationID id)
{
    const Project& project = doc.project();
    const AnnotationLocation location = project.locate_annotation(id);
    std::string description = describe("deleted", project, id);

    doc.execute(Command{
        std::move(description),
        DeleteAnnotationDelta{.location = location, .annotation = project.get_annotation(id)},
    });
}

void iml::action_set_label(UndoableProject& doc, AnnotationID id, std::optional<std::string> label_name)
{
    const Annotation& annotation = doc.project().get_annotation(id);
    std::string description = label_name ? "labeled " + std::string{to_string_view(kind_of(annotation))} + " as '" + *label_name + "'" : "cleared label";

    doc.execute(Command{
        std::move(description),
        LabelAssignmentDelta{.id = id, .before = annotation.label, .after = std::move(label_name)},
    });
}

void iml::action_set_geometry(UndoableProject& doc, AnnotationID id, AnnotationGeometry geometry)
{
    execute_geometry_change(doc, id, std::move(geometry), describe("reshaped", doc.project(), id));
}

void iml::action_set_color_override(UndoableProject& doc, AnnotationID id, std::optional<Color> color)
{
    const Annotation& annotation = doc.project().get_annotation(id);
    std::string description = color ? "set color to " + to_html_string_rgb(*color) : "reset color";

    doc.execute(Command{
        std::move(description),
        ColorOverrideDelta{.id = id, .before = annotation.color_override, .after = color},
    });
}

void iml::action_translate_annotation(UndoableProject& doc, AnnotationID id, const Vec2& image_delta)
{
    const Project& project = doc.project();
    execute_geometry_change(doc, id, with_translation(project.get_annotation(id).geometry, image_delta), describe("moved", project, id));
}

void iml::action_move_vertex(UndoableProject& doc, AnnotationID id, size_t vertex_index, const Vec2& new_image_point)
{
    const Project& project = doc.project();
    execute_geometry_change(doc, id, with_vertex_moved(project.get_annotation(id).geometry, vertex_index, new_image_point), describe("moved vertex of", project, id));
}

void iml::action_insert_vertex(UndoableProject& doc, AnnotationID id, size_t edge_index, const Vec2& image_point)
{
    const Project& project = doc.project();
    execute_geometry_change(doc, id, with_vertex_inserted(project.get_annotation(id).geometry, edge_index, image_point), describe("added vertex to", project, id));
}

void iml::action_delete_vertex(UndoableProject& doc, AnnotationID id, size_t vertex_index)
{
    const Project& project = doc.project();
    execute_geometry_change(doc, id, with_vertex_deleted(project.get_annotation(id).geometry, vertex_index), describe("deleted vertex from", project, id));
}

void iml::action_add_label(UndoableProject& doc, std::string name, const Color& color)
{
    std::string description = "added label '" + name + "'";
    const size_t position = doc.project().labels().size();

    doc.execute(Command{
        std::move(description),
        AddLabelDelta{.position = position, .label = Label{.name = std::move(name), .color = color}},
    });
}

void iml::action_remove_label(UndoableProject& doc, std::string_view name, bool cascade)
{
    const Project& project = doc.project();
    const std::optional<size_t> position = project.find_label_index(name);
    if (not position) {
        throw NotFound{"'" + std::string{name} + "': no such label exists in the project"};
    }

    doc.execute(Command{
        "removed label '" + std::string{name} + "'",
        RemoveLabelDelta{
            .position = *position,
            .label = project.labels()[*position],
            .cascade = cascade,
            .cleared_annotations = cascade ? project.annotations_with_label(name) : std::vector<AnnotationID>{},
        },
    });
}

void iml::action_set_label_color(UndoableProject& doc, std::string_view name, const Color& color)
{
    const Label& label = doc.project().get_label(name);

    doc.execute(Command{
        "changed color of label '" + label.name + "'",
        LabelColorDelta{.label_name = label.name, .before = label.color, .after = color},
    });
}

void iml::action_drag_vertex_without_committing(UndoableProject& doc, AnnotationID id, size_t vertex_index, const Vec2& image_point)
{
    ensure_gesture_on(doc, id, "moved vertex of");
    doc.update_gesture(with_vertex_moved(doc.pending_gesture_start_geometry(), vertex_index, image_point));
}

void iml::action_drag_annotation_without_committing(UndoableProject& doc, AnnotationID id, const Vec2& total_image_delta)
{
    ensure_gesture_on(doc, id, "moved");
    doc.update_gesture(with_translation(doc.pending_gesture_start_geometry(), total_image_delta));
}

void iml::action_commit_drag(UndoableProject& doc)
{
    doc.commit_gesture();
}

void iml::action_cancel_drag(UndoableProject& doc)
{
    doc.cancel_gesture();
}

void iml::action_undo(UndoableProject& doc)
{
    doc.undo();
}

void iml::action_redo(UndoableProject& doc)
{
    doc.redo();
}
