#include "CommandHistory.h"

#include <libimlabel/Documents/Project.h>
#include <libimlabel/Utils/Exceptions.h>

#include <gtest/gtest.h>

#include <string>

using namespace iml;

namespace
{
    Project make_project()
    {
        Project project;
        project.add_image("a.png");
        project.add_label("car", Color::red());
        return project;
    }

    Command make_create_command(const Project& project, double x)
    {
        return Command{
            "created Point",
            CreateAnnotationDelta{
                .location = {.image_index = 0, .position = project.annotations(0).size()},
                .annotation = Annotation{.id = AnnotationID{project.next_annotation_id()}, .geometry = Vec2{x, x}, .label = std::nullopt, .color_override = std::nullopt},
            },
        };
    }
}

TEST(CommandHistory, push_applies_command)
{
    Project project = make_project();
    CommandHistory history;

    history.push(project, make_create_command(project, 1.0));

    ASSERT_EQ(project.num_annotations(), 1);
    ASSERT_TRUE(history.can_undo());
    ASSERT_FALSE(history.can_redo());
}

TEST(CommandHistory, undo_on_empty_history_throws_nothing_to_undo)
{
    Project project = make_project();
    CommandHistory history;
    ASSERT_THROW(history.undo(project), NothingToUndo);
}

TEST(CommandHistory, redo_after_fresh_push_throws_nothing_to_redo)
{
    Project project = make_project();
    CommandHistory history;
    history.push(project, make_create_command(project, 1.0));
    ASSERT_THROW(history.redo(project), NothingToRedo);
}

TEST(CommandHistory, undoing_every_push_restores_original_project)
{
    Project project = make_project();
    const Project original = project;
    CommandHistory history;

    for (int i = 0; i < 5; ++i) {
        history.push(project, make_create_command(project, static_cast<double>(i)));
    }
    const AnnotationID first{1};
    history.push(project, Command{"labeled", LabelAssignmentDelta{.id = first, .before = std::nullopt, .after = "car"}});
    history.push(project, Command{"recolored", LabelColorDelta{.label_name = "car", .before = Color::red(), .after = Color::blue()}});
    history.push(project, Command{"removed label", RemoveLabelDelta{.position = 0, .label = {.name = "car", .color = Color::blue()}, .cascade = true, .cleared_annotations = {first}}});

    for (int i = 0; i < 8; ++i) {
        history.undo(project);
    }

    ASSERT_EQ(project, original);
    ASSERT_FALSE(history.can_undo());
    ASSERT_EQ(history.num_redo_entries(), 8);
}

TEST(CommandHistory, redo_reapplies_undone_commands)
{
    Project project = make_project();
    CommandHistory history;
    history.push(project, make_create_command(project, 1.0));
    history.push(project, make_create_command(project, 2.0));
    const Project after = project;

    history.undo(project);
    history.undo(project);
    history.redo(project);
    history.redo(project);

    ASSERT_EQ(project, after);
}

TEST(CommandHistory, push_after_undo_discards_redo_path)
{
    Project project = make_project();
    CommandHistory history;
    history.push(project, make_create_command(project, 1.0));
    history.undo(project);
    ASSERT_TRUE(history.can_redo());

    history.push(project, make_create_command(project, 2.0));

    ASSERT_FALSE(history.can_redo());
    ASSERT_THROW(history.redo(project), NothingToRedo);
}

TEST(CommandHistory, failed_push_records_nothing)
{
    Project project = make_project();
    CommandHistory history;
    const Project before = project;

    ASSERT_THROW(history.push(project, Command{"bad", LabelAssignmentDelta{.id = AnnotationID{99}, .before = std::nullopt, .after = "car"}}), NotFound);

    ASSERT_EQ(project, before);
    ASSERT_FALSE(history.can_undo());
}

TEST(CommandHistory, evicts_oldest_entries_beyond_max_depth)
{
    Project project = make_project();
    CommandHistory history{3};

    for (int i = 0; i < 5; ++i) {
        history.push(project, make_create_command(project, static_cast<double>(i)));
    }

    ASSERT_EQ(history.num_undo_entries(), 3);
    history.undo(project);
    history.undo(project);
    history.undo(project);
    ASSERT_THROW(history.undo(project), NothingToUndo);
    ASSERT_EQ(project.num_annotations(), 2);  // the two evicted creations stay
}

TEST(CommandHistory, set_max_depth_trims_existing_entries)
{
    Project project = make_project();
    CommandHistory history;
    for (int i = 0; i < 10; ++i) {
        history.push(project, make_create_command(project, static_cast<double>(i)));
    }
    history.set_max_depth(4);
    ASSERT_EQ(history.num_undo_entries(), 4);
    ASSERT_EQ(history.max_depth(), 4);
}

TEST(CommandHistory, entries_are_indexed_from_most_recent)
{
    Project project = make_project();
    CommandHistory history;
    history.push(project, Command{"first", AddLabelDelta{.position = 1, .label = {.name = "dog", .color = Color::blue()}}});
    history.push(project, Command{"second", AddLabelDelta{.position = 2, .label = {.name = "cat", .color = Color::green()}}});

    ASSERT_EQ(history.undo_entry_at(0).description(), "second");
    ASSERT_EQ(history.undo_entry_at(1).description(), "first");

    history.undo(project);
    ASSERT_EQ(history.redo_entry_at(0).description(), "second");
}

TEST(CommandHistory, clear_removes_all_entries)
{
    Project project = make_project();
    CommandHistory history;
    history.push(project, make_create_command(project, 1.0));
    history.undo(project);
    history.push(project, make_create_command(project, 2.0));
    history.clear();

    ASSERT_FALSE(history.can_undo());
    ASSERT_FALSE(history.can_redo());
}
