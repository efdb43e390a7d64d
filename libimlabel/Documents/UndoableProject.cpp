#include "UndoableProject.h"

#include <libimlabel/Platform/Log.h>

#include <stdexcept>
#include <utility>

using namespace iml;

iml::UndoableProject::UndoableProject(Project project, size_t max_history_depth) :
    project_{std::move(project)},
    history_{max_history_depth}
{}

void iml::UndoableProject::reset(Project project)
{
    project_ = std::move(project);
    history_.clear();
    gesture_.reset();
}

void iml::UndoableProject::execute(Command command)
{
    commit_gesture();
    history_.push(project_, std::move(command));
}

void iml::UndoableProject::undo()
{
    commit_gesture();
    history_.undo(project_);
}

void iml::UndoableProject::redo()
{
    commit_gesture();
    history_.redo(project_);
}

void iml::UndoableProject::set_max_history_depth(size_t max_depth)
{
    history_.set_max_depth(max_depth);
}

void iml::UndoableProject::begin_gesture(AnnotationID id, std::string description)
{
    commit_gesture();
    gesture_ = PendingGesture{
        .id = id,
        .description = std::move(description),
        .start_geometry = project_.get_annotation(id).geometry,
    };
}

std::optional<AnnotationID> iml::UndoableProject::pending_gesture_annotation() const
{
    if (not gesture_) {
        return std::nullopt;
    }
    return gesture_->id;
}

const AnnotationGeometry& iml::UndoableProject::pending_gesture_start_geometry() const
{
    if (not gesture_) {
        throw std::logic_error{"there is no pending gesture"};
    }
    return gesture_->start_geometry;
}

void iml::UndoableProject::update_gesture(AnnotationGeometry geometry)
{
    if (not gesture_) {
        throw std::logic_error{"cannot update a gesture: there is no pending gesture"};
    }
    project_.set_geometry(gesture_->id, std::move(geometry));
}

void iml::UndoableProject::commit_gesture()
{
    if (not gesture_) {
        return;
    }

    PendingGesture gesture = std::move(*gesture_);
    gesture_.reset();

    const Annotation* annotation = project_.try_get_annotation(gesture.id);
    if (not annotation or annotation->geometry == gesture.start_geometry) {
        return;  // nothing changed
    }

    history_.record(Command{
        std::move(gesture.description),
        GeometryDelta{
            .id = gesture.id,
            .before = std::move(gesture.start_geometry),
            .after = annotation->geometry,
        },
    });
}

void iml::UndoableProject::cancel_gesture()
{
    if (not gesture_) {
        return;
    }
    project_.set_geometry(gesture_->id, gesture_->start_geometry);
    gesture_.reset();
    log_debug("cancelled a gesture: the annotation was restored to its start state");
}
