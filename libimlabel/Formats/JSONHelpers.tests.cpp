#include "JSONHelpers.h"

#include <libimlabel/Utils/Exceptions.h>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace iml;
using json = nlohmann::ordered_json;

TEST(to_json_number, writes_integral_values_as_integers)
{
    ASSERT_EQ(to_json_number(10.0).dump(), "10");
    ASSERT_EQ(to_json_number(-3.0).dump(), "-3");
    ASSERT_TRUE(to_json_number(10.0).is_number_integer());
}

TEST(to_json_number, writes_fractional_values_as_floats)
{
    ASSERT_TRUE(to_json_number(10.5).is_number_float());
    ASSERT_EQ(to_json_number(10.5).get<double>(), 10.5);
}

TEST(parse_json_document, converts_syntax_errors_into_malformed_input)
{
    std::stringstream ss{R"({"a": [1, 2,]})"};
    try {
        parse_json_document(ss, "bad.json");
        FAIL() << "expected an exception";
    }
    catch (const MalformedInput& ex) {
        ASSERT_EQ(ex.location().source, "bad.json");
        ASSERT_TRUE(ex.location().byte_offset.has_value());
    }
}

TEST(require_member, throws_malformed_input_naming_missing_member)
{
    const json object = json::parse(R"({"a": 1})");
    ASSERT_EQ(require_member(object, "a", {}), 1);
    try {
        require_member(object, "images", {});
        FAIL() << "expected an exception";
    }
    catch (const MalformedInput& ex) {
        ASSERT_NE(ex.reason().find("images"), std::string::npos);
    }
}

TEST(to_number_vector, rejects_non_numbers)
{
    ASSERT_EQ(to_number_vector(json::parse("[1, 2.5]"), "coordinates", {}), (std::vector<double>{1.0, 2.5}));
    ASSERT_THROW({ to_number_vector(json::parse(R"([1, "2"])"), "coordinates", {}); }, MalformedInput);
    ASSERT_THROW({ to_number_vector(json::parse("3"), "coordinates", {}); }, MalformedInput);
}

TEST(to_optional_string_or_throw, maps_null_to_nullopt)
{
    ASSERT_EQ(to_optional_string_or_throw(json(nullptr), "label", {}), std::nullopt);
    ASSERT_EQ(to_optional_string_or_throw(json("car"), "label", {}), "car");
    ASSERT_THROW({ to_optional_string_or_throw(json(5), "label", {}); }, MalformedInput);
}
