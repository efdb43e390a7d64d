#include "Color.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

using namespace iml;

namespace
{
    std::optional<uint8_t> try_parse_hex_nibble(char c)
    {
        if ('0' <= c and c <= '9') {
            return static_cast<uint8_t>(c - '0');
        }
        if ('a' <= c and c <= 'f') {
            return static_cast<uint8_t>(10 + (c - 'a'));
        }
        if ('A' <= c and c <= 'F') {
            return static_cast<uint8_t>(10 + (c - 'A'));
        }
        return std::nullopt;
    }

    std::optional<uint8_t> try_parse_hex_byte(char hi, char lo)
    {
        const auto h = try_parse_hex_nibble(hi);
        const auto l = try_parse_hex_nibble(lo);
        if (not h or not l) {
            return std::nullopt;
        }
        return static_cast<uint8_t>((*h << 4) | *l);
    }

    void append_hex_byte(std::string& out, uint8_t v)
    {
        constexpr std::string_view c_hex_chars = "0123456789ABCDEF";
        out.push_back(c_hex_chars[(v >> 4) & 0xf]);
        out.push_back(c_hex_chars[v & 0xf]);
    }
}

std::string iml::to_html_string_rgb(const Color& color)
{
    std::string rv;
    rv.reserve(7);
    rv.push_back('#');
    append_hex_byte(rv, color.r);
    append_hex_byte(rv, color.g);
    append_hex_byte(rv, color.b);
    return rv;
}

std::optional<Color> iml::try_parse_html_color_string(std::string_view str)
{
    if (str.empty() or str.front() != '#') {
        return std::nullopt;
    }
    str.remove_prefix(1);

    if (str.size() == 6) {
        const auto r = try_parse_hex_byte(str[0], str[1]);
        const auto g = try_parse_hex_byte(str[2], str[3]);
        const auto b = try_parse_hex_byte(str[4], str[5]);
        if (r and g and b) {
            return Color{*r, *g, *b};
        }
    }
    else if (str.size() == 3) {
        const auto r = try_parse_hex_byte(str[0], str[0]);
        const auto g = try_parse_hex_byte(str[1], str[1]);
        const auto b = try_parse_hex_byte(str[2], str[2]);
        if (r and g and b) {
            return Color{*r, *g, *b};
        }
    }
    return std::nullopt;
}

std::ostream& iml::operator<<(std::ostream& out, const Color& color)
{
    return out << to_html_string_rgb(color);
}
