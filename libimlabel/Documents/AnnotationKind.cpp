#include "AnnotationKind.h"

#include <array>
#include <cstddef>
#include <ostream>

using namespace iml;

namespace
{
    constexpr auto c_annotation_kind_strings = std::to_array<std::string_view>({
        "Point",
        "Rectangle",
        "Circle",
        "Polygon",
    });
    static_assert(c_annotation_kind_strings.size() == static_cast<size_t>(AnnotationKind::NUM_OPTIONS));
}

std::string_view iml::to_string_view(AnnotationKind kind)
{
    return c_annotation_kind_strings.at(static_cast<size_t>(kind));
}

std::optional<AnnotationKind> iml::try_parse_as_annotation_kind(std::string_view str)
{
    for (size_t i = 0; i < c_annotation_kind_strings.size(); ++i) {
        if (str == c_annotation_kind_strings[i]) {
            return static_cast<AnnotationKind>(i);
        }
    }
    return std::nullopt;
}

std::ostream& iml::operator<<(std::ostream& out, AnnotationKind kind)
{
    return out << to_string_view(kind);
}
