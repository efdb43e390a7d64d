#pragma once

#include <libimlabel/Documents/Annotation.h>
#include <libimlabel/Documents/AnnotationGeometry.h>
#include <libimlabel/Documents/AnnotationID.h>
#include <libimlabel/Documents/Label.h>
#include <libimlabel/Documents/Project.h>
#include <libimlabel/Graphics/Color.h>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace iml
{
    // the forward/inverse deltas that a `Command` can carry
    //
    // each delta only holds what the mutation changed (e.g. a geometry change
    // holds the before/after geometry of one annotation), never a project snapshot

    struct CreateAnnotationDelta final {
        AnnotationLocation location;
        Annotation annotation;
    };

    struct DeleteAnnotationDelta final {
        AnnotationLocation location;
        Annotation annotation;
    };

    struct GeometryDelta final {
        AnnotationID id;
        AnnotationGeometry before;
        AnnotationGeometry after;
    };

    struct LabelAssignmentDelta final {
        AnnotationID id;
        std::optional<std::string> before;
        std::optional<std::string> after;
    };

    struct ColorOverrideDelta final {
        AnnotationID id;
        std::optional<Color> before;
        std::optional<Color> after;
    };

    struct AddLabelDelta final {
        size_t position = 0;
        Label label;
    };

    struct RemoveLabelDelta final {
        size_t position = 0;
        Label label;
        bool cascade = false;
        std::vector<AnnotationID> cleared_annotations;  // annotations whose label was cleared by a cascade
    };

    struct LabelColorDelta final {
        std::string label_name;
        Color before;
        Color after;
    };

    using CommandDelta = std::variant<
        CreateAnnotationDelta,
        DeleteAnnotationDelta,
        GeometryDelta,
        LabelAssignmentDelta,
        ColorOverrideDelta,
        AddLabelDelta,
        RemoveLabelDelta,
        LabelColorDelta
    >;

    // a reversible unit of project mutation that is tracked by a `CommandHistory`
    class Command final {
    public:
        Command(std::string description, CommandDelta delta) :
            description_{std::move(description)},
            delta_{std::move(delta)}
        {}

        // a human-readable description of the command (e.g. for an "Undo ..." menu item)
        const std::string& description() const { return description_; }
        const CommandDelta& delta() const { return delta_; }

        // applies the forward delta to `project`
        //
        // throws if the delta cannot be applied, in which case `project` is unchanged
        void apply(Project& project) const;

        // applies the inverse delta to `project`, reverting a previous `apply`
        void invert(Project& project) const;

    private:
        std::string description_;
        CommandDelta delta_;
    };
}
