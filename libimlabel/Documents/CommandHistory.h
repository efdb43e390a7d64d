#pragma once

#include <libimlabel/Documents/Command.h>

#include <cstddef>
#include <optional>
#include <vector>

namespace iml { class Project; }

namespace iml
{
    // a linear undo/redo history of `Command`s
    //
    // commands live in an arena and the undo/redo stacks hold indices into it.
    // Both stacks are bounded by `max_depth()`: when a bound is exceeded the
    // oldest entry is evicted.
    class CommandHistory final {
    public:
        static constexpr size_t c_default_max_depth = 50;

        explicit CommandHistory(size_t max_depth = c_default_max_depth);

        // applies `command` to `project` and records it, discarding any redo path
        //
        // if applying throws, nothing is recorded and `project` is unchanged
        void push(Project& project, Command command);

        // records a command that the caller has already applied (e.g. at the end
        // of a drag gesture), discarding any redo path
        void record(Command command);

        // inverts the most recent command and moves it onto the redo stack
        //
        // throws `NothingToUndo` if there is nothing to undo
        void undo(Project& project);

        // re-applies the most recently undone command
        //
        // throws `NothingToRedo` if there is nothing to redo
        void redo(Project& project);

        bool can_undo() const { return not undo_stack_.empty(); }
        bool can_redo() const { return not redo_stack_.empty(); }
        size_t num_undo_entries() const { return undo_stack_.size(); }
        size_t num_redo_entries() const { return redo_stack_.size(); }

        // returns the `i`th undo entry, where 0 is the most recent one
        const Command& undo_entry_at(size_t i) const;

        // returns the `i`th redo entry, where 0 is the next one that `redo` would apply
        const Command& redo_entry_at(size_t i) const;

        size_t max_depth() const { return max_depth_; }

        // sets the maximum depth (at least 1), evicting the oldest entries if necessary
        void set_max_depth(size_t);

        void clear();

    private:
        size_t store(Command);
        void release(size_t slot);
        void clear_redo_stack();
        void trim_to_max_depth(std::vector<size_t>& stack);
        const Command& command_at(size_t slot) const;

        std::vector<std::optional<Command>> arena_;
        std::vector<size_t> free_slots_;
        std::vector<size_t> undo_stack_;  // back() is the most recent entry
        std::vector<size_t> redo_stack_;  // back() is the next entry to redo
        size_t max_depth_;
    };
}
