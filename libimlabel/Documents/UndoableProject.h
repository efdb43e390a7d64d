#pragma once

#include <libimlabel/Documents/AnnotationGeometry.h>
#include <libimlabel/Documents/AnnotationID.h>
#include <libimlabel/Documents/Command.h>
#include <libimlabel/Documents/CommandHistory.h>
#include <libimlabel/Documents/Project.h>

#include <cstddef>
#include <optional>
#include <string>

namespace iml
{
    // a `Project` paired with the `CommandHistory` of the mutations made to it
    //
    // every mutation goes through `execute` (see `UndoableProjectActions.h`) so
    // that it can be undone. Continuous gestures (e.g. dragging a vertex) use the
    // gesture API so that the whole gesture becomes one command.
    class UndoableProject final {
    public:
        explicit UndoableProject(
            Project project = {},
            size_t max_history_depth = CommandHistory::c_default_max_depth
        );

        const Project& project() const { return project_; }
        const CommandHistory& history() const { return history_; }

        // replaces the project (e.g. after loading one) and clears the history
        void reset(Project);

        // applies and records `command`. Any pending gesture is committed first.
        void execute(Command);

        bool can_undo() const { return history_.can_undo(); }
        bool can_redo() const { return history_.can_redo(); }

        // any pending gesture is committed before undoing/redoing
        void undo();
        void redo();

        void set_max_history_depth(size_t);

        // gestures

        // starts a geometry-editing gesture on the annotation, remembering its
        // current geometry as the gesture's start state
        //
        // throws `NotFound` if the annotation does not exist. Any other pending
        // gesture is committed first.
        void begin_gesture(AnnotationID, std::string description);

        bool has_pending_gesture() const { return gesture_.has_value(); }
        std::optional<AnnotationID> pending_gesture_annotation() const;

        // returns the geometry the annotation had when the pending gesture began
        const AnnotationGeometry& pending_gesture_start_geometry() const;

        // sets the annotation's geometry without recording a command
        //
        // throws if no gesture is pending or the geometry is invalid (in which
        // case the intermediate state is left unchanged)
        void update_gesture(AnnotationGeometry);

        // records a single command that covers the gesture's start state to its
        // current state (nothing is recorded if the geometry did not change)
        void commit_gesture();

        // restores the start state of the pending gesture without recording anything
        void cancel_gesture();

    private:
        struct PendingGesture final {
            AnnotationID id;
            std::string description;
            AnnotationGeometry start_geometry;
        };

        Project project_;
        CommandHistory history_;
        std::optional<PendingGesture> gesture_;
    };
}
