#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace iml
{
    // an 8-bit-per-channel RGB display color
    struct Color final {
        static constexpr Color red() { return {0xff, 0x00, 0x00}; }
        static constexpr Color green() { return {0x00, 0xff, 0x00}; }
        static constexpr Color blue() { return {0x00, 0x00, 0xff}; }
        static constexpr Color black() { return {0x00, 0x00, 0x00}; }
        static constexpr Color white() { return {0xff, 0xff, 0xff}; }

        friend constexpr bool operator==(const Color&, const Color&) = default;

        uint8_t r = 0;
        uint8_t g = 0;
        uint8_t b = 0;
    };

    // returns an uppercase HTML color string for the color (e.g. "#FF0000")
    std::string to_html_string_rgb(const Color&);

    // tries to parse an HTML-style color string (case-insensitive)
    //
    // accepts "#RRGGBB" and the shorthand "#RGB"; returns `std::nullopt` for
    // anything else
    std::optional<Color> try_parse_html_color_string(std::string_view);

    std::ostream& operator<<(std::ostream&, const Color&);
}

template<>
struct std::hash<iml::Color> final {
    size_t operator()(const iml::Color& color) const noexcept
    {
        return std::hash<uint32_t>{}((uint32_t{color.r} << 16) | (uint32_t{color.g} << 8) | uint32_t{color.b});
    }
};
