#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <limits>

namespace iml
{
    // a stable identifier for an annotation within a `Project`
    //
    // ids are allocated by the project from a monotonically increasing counter,
    // starting at 1, and are never reused. A default-constructed id is invalid.
    class AnnotationID final {
    public:
        using element_type = int64_t;

        constexpr AnnotationID() = default;
        explicit constexpr AnnotationID(element_type value) : value_{value} {}

        constexpr element_type get() const { return value_; }
        constexpr bool is_valid() const { return value_ > 0; }
        explicit constexpr operator bool() const { return is_valid(); }

        friend constexpr auto operator<=>(const AnnotationID&, const AnnotationID&) = default;

    private:
        element_type value_ = 0;
    };

    std::ostream& operator<<(std::ostream&, const AnnotationID&);

    // the largest id that a project accepts, so that the project's counter can always
    // point one past its largest id
    inline constexpr AnnotationID::element_type c_max_annotation_id = std::numeric_limits<AnnotationID::element_type>::max() - 1;
}

template<>
struct std::hash<iml::AnnotationID> final {
    size_t operator()(const iml::AnnotationID& id) const noexcept
    {
        return std::hash<int64_t>{}(id.get());
    }
};
