#pragma once

#include <libimlabel/Utils/Exceptions.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// helpers shared by the JSON-based codecs
namespace iml
{
    // returns `v` as a JSON number, written as an integer when it has no
    // fractional part (so that e.g. `10.0` is written as `10`)
    nlohmann::ordered_json to_json_number(double v);

    // parses a JSON document from `in`, converting parse errors into `MalformedInput`
    nlohmann::ordered_json parse_json_document(std::istream& in, std::string_view source_name);

    // returns the value of `key` in `object`, or throws `MalformedInput` if it is missing
    const nlohmann::ordered_json& require_member(
        const nlohmann::ordered_json& object,
        std::string_view key,
        const CodecErrorLocation&
    );

    // returns the elements of a JSON array of numbers, or throws `MalformedInput`
    std::vector<double> to_number_vector(
        const nlohmann::ordered_json&,
        std::string_view what,
        const CodecErrorLocation&
    );

    // returns the string, or throws `MalformedInput` if the value is not a string
    std::string to_string_or_throw(
        const nlohmann::ordered_json&,
        std::string_view what,
        const CodecErrorLocation&
    );

    // returns the value, or `std::nullopt` if it is JSON `null`; throws `MalformedInput`
    // for anything else that is not a string
    std::optional<std::string> to_optional_string_or_throw(
        const nlohmann::ordered_json&,
        std::string_view what,
        const CodecErrorLocation&
    );

    // returns the JSON document as an indented string
    std::string dump_json_document(const nlohmann::ordered_json&);
}
