#pragma once

#include <libimlabel/Documents/AnnotationGeometry.h>
#include <libimlabel/Documents/AnnotationID.h>
#include <libimlabel/Documents/AnnotationKind.h>
#include <libimlabel/Graphics/Color.h>

#include <optional>
#include <string>

namespace iml
{
    // the color of annotations that have neither a label nor a color override
    inline constexpr Color c_unlabeled_annotation_color = Color::red();

    // a single, optionally labeled, geometric region on one image
    struct Annotation final {
        friend bool operator==(const Annotation&, const Annotation&) = default;

        AnnotationID id;
        AnnotationGeometry geometry;
        std::optional<std::string> label;  // name of a `Label` in the owning project
        std::optional<Color> color_override;
    };

    inline AnnotationKind kind_of(const Annotation& annotation)
    {
        return kind_of(annotation.geometry);
    }
}
