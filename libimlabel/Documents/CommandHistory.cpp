#include "CommandHistory.h"

#include <libimlabel/Documents/Project.h>
#include <libimlabel/Platform/Log.h>
#include <libimlabel/Utils/Exceptions.h>

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>

using namespace iml;

iml::CommandHistory::CommandHistory(size_t max_depth) :
    max_depth_{std::max<size_t>(max_depth, 1)}
{}

void iml::CommandHistory::push(Project& project, Command command)
{
    command.apply(project);
    record(std::move(command));
}

void iml::CommandHistory::record(Command command)
{
    const size_t slot = store(std::move(command));
    undo_stack_.push_back(slot);
    clear_redo_stack();
    trim_to_max_depth(undo_stack_);
}

void iml::CommandHistory::undo(Project& project)
{
    if (undo_stack_.empty()) {
        throw NothingToUndo{};
    }

    const size_t slot = undo_stack_.back();
    command_at(slot).invert(project);  // if this throws, the stacks are untouched
    undo_stack_.pop_back();
    redo_stack_.push_back(slot);
    trim_to_max_depth(redo_stack_);
}

void iml::CommandHistory::redo(Project& project)
{
    if (redo_stack_.empty()) {
        throw NothingToRedo{};
    }

    const size_t slot = redo_stack_.back();
    command_at(slot).apply(project);
    redo_stack_.pop_back();
    undo_stack_.push_back(slot);
    trim_to_max_depth(undo_stack_);
}

const Command& iml::CommandHistory::undo_entry_at(size_t i) const
{
    if (i >= undo_stack_.size()) {
        throw std::out_of_range{"undo entry index out of range"};
    }
    return command_at(undo_stack_[undo_stack_.size() - 1 - i]);
}

const Command& iml::CommandHistory::redo_entry_at(size_t i) const
{
    if (i >= redo_stack_.size()) {
        throw std::out_of_range{"redo entry index out of range"};
    }
    return command_at(redo_stack_[redo_stack_.size() - 1 - i]);
}

void iml::CommandHistory::set_max_depth(size_t max_depth)
{
    max_depth_ = std::max<size_t>(max_depth, 1);
    trim_to_max_depth(undo_stack_);
    trim_to_max_depth(redo_stack_);
}

void iml::CommandHistory::clear()
{
    arena_.clear();
    free_slots_.clear();
    undo_stack_.clear();
    redo_stack_.clear();
}

size_t iml::CommandHistory::store(Command command)
{
    if (not free_slots_.empty()) {
        const size_t slot = free_slots_.back();
        arena_[slot].emplace(std::move(command));
        free_slots_.pop_back();
        return slot;
    }
    arena_.emplace_back(std::move(command));
    return arena_.size() - 1;
}

void iml::CommandHistory::release(size_t slot)
{
    arena_[slot].reset();
    free_slots_.push_back(slot);
}

void iml::CommandHistory::clear_redo_stack()
{
    for (const size_t slot : redo_stack_) {
        release(slot);
    }
    redo_stack_.clear();
}

void iml::CommandHistory::trim_to_max_depth(std::vector<size_t>& stack)
{
    if (stack.size() <= max_depth_) {
        return;
    }

    const size_t num_evicted = stack.size() - max_depth_;
    for (size_t i = 0; i < num_evicted; ++i) {
        log_debug("history: evicting '%s' (maximum depth of %zu reached)", command_at(stack[i]).description().c_str(), max_depth_);
        release(stack[i]);
    }
    stack.erase(stack.begin(), stack.begin() + static_cast<std::ptrdiff_t>(num_evicted));
}

const Command& iml::CommandHistory::command_at(size_t slot) const
{
    return *arena_.at(slot);
}
