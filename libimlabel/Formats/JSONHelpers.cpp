#include "JSONHelpers.h"

#include <cmath>
#include <cstdint>
#include <utility>

using namespace iml;
using json = nlohmann::ordered_json;

namespace
{
    // largest magnitude at which every integer is exactly representable as a double
    constexpr double c_max_exact_integer = 9007199254740992.0;  // 2^53
}

json iml::to_json_number(double v)
{
    if (std::isfinite(v) and std::trunc(v) == v and std::abs(v) <= c_max_exact_integer) {
        return json(static_cast<int64_t>(v));
    }
    return json(v);
}

json iml::parse_json_document(std::istream& in, std::string_view source_name)
{
    try {
        return json::parse(in);
    }
    catch (const json::parse_error& ex) {
        throw MalformedInput{
            CodecErrorLocation{.source = std::string{source_name}, .byte_offset = ex.byte},
            std::string{"invalid JSON: "} + ex.what(),
        };
    }
}

const json& iml::require_member(const json& object, std::string_view key, const CodecErrorLocation& location)
{
    if (not object.is_object()) {
        throw MalformedInput{location, "expected a JSON object"};
    }
    const auto it = object.find(std::string{key});
    if (it == object.end()) {
        throw MalformedInput{location, "missing required member '" + std::string{key} + "'"};
    }
    return *it;
}

std::vector<double> iml::to_number_vector(const json& value, std::string_view what, const CodecErrorLocation& location)
{
    if (not value.is_array()) {
        throw MalformedInput{location, std::string{what} + ": expected an array of numbers"};
    }

    std::vector<double> rv;
    rv.reserve(value.size());
    for (const json& element : value) {
        if (not element.is_number()) {
            throw MalformedInput{location, std::string{what} + ": expected an array of numbers, but it contains a non-number"};
        }
        rv.push_back(element.get<double>());
    }
    return rv;
}

std::string iml::to_string_or_throw(const json& value, std::string_view what, const CodecErrorLocation& location)
{
    if (not value.is_string()) {
        throw MalformedInput{location, std::string{what} + ": expected a string"};
    }
    return value.get<std::string>();
}

std::optional<std::string> iml::to_optional_string_or_throw(const json& value, std::string_view what, const CodecErrorLocation& location)
{
    if (value.is_null()) {
        return std::nullopt;
    }
    return to_string_or_throw(value, what, location);
}

std::string iml::dump_json_document(const json& document)
{
    return document.dump(2, ' ', false, json::error_handler_t::replace);
}
