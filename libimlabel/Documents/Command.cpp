#include "Command.h"

#include <libimlabel/Utils/Overload.h>

#include <exception>
#include <variant>

using namespace iml;

void iml::Command::apply(Project& project) const
{
    std::visit(Overload{
        [&project](const CreateAnnotationDelta& d)
        {
            project.insert_annotation(d.location, d.annotation);
        },
        [&project](const DeleteAnnotationDelta& d)
        {
            project.delete_annotation(d.annotation.id);
        },
        [&project](const GeometryDelta& d)
        {
            project.set_geometry(d.id, d.after);
        },
        [&project](const LabelAssignmentDelta& d)
        {
            project.set_label(d.id, d.after);
        },
        [&project](const ColorOverrideDelta& d)
        {
            project.set_color_override(d.id, d.after);
        },
        [&project](const AddLabelDelta& d)
        {
            project.insert_label(d.position, d.label);
        },
        [&project](const RemoveLabelDelta& d)
        {
            project.remove_label(d.label.name, d.cascade);
        },
        [&project](const LabelColorDelta& d)
        {
            project.set_label_color(d.label_name, d.after);
        },
    }, delta_);
}

void iml::Command::invert(Project& project) const
{
    std::visit(Overload{
        [&project](const CreateAnnotationDelta& d)
        {
            project.delete_annotation(d.annotation.id);
        },
        [&project](const DeleteAnnotationDelta& d)
        {
            project.insert_annotation(d.location, d.annotation);
        },
        [&project](const GeometryDelta& d)
        {
            project.set_geometry(d.id, d.before);
        },
        [&project](const LabelAssignmentDelta& d)
        {
            project.set_label(d.id, d.before);
        },
        [&project](const ColorOverrideDelta& d)
        {
            project.set_color_override(d.id, d.before);
        },
        [&project](const AddLabelDelta& d)
        {
            project.remove_label(d.label.name, false);
        },
        [&project](const RemoveLabelDelta& d)
        {
            project.insert_label(d.position, d.label);
            try {
                for (const AnnotationID& id : d.cleared_annotations) {
                    project.set_label(id, d.label.name);
                }
            }
            catch (const std::exception&) {
                // keep the project unchanged: take the partially-restored label back out
                project.remove_label(d.label.name, true);
                throw;
            }
        },
        [&project](const LabelColorDelta& d)
        {
            project.set_label_color(d.label_name, d.before);
        },
    }, delta_);
}
