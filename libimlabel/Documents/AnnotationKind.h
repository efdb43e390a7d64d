#pragma once

#include <iosfwd>
#include <optional>
#include <string_view>

namespace iml
{
    // the kind of geometric primitive an annotation is made of
    //
    // an annotation's kind is fixed for its lifetime
    enum class AnnotationKind {
        Point,
        Rectangle,
        Circle,
        Polygon,
        NUM_OPTIONS,
    };

    // returns the kind's name as it appears in serialized documents (e.g. "Rectangle")
    std::string_view to_string_view(AnnotationKind);

    std::optional<AnnotationKind> try_parse_as_annotation_kind(std::string_view);

    std::ostream& operator<<(std::ostream&, AnnotationKind);
}
