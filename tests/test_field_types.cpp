// tests/test_field_types.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/types/field_type.h"
#include <cstdint>
#include <limits>
#include <stdexcept>

using namespace agentflow;

TEST_CASE("Type strings parse to canonical spellings", "[types]") {
    CHECK(FieldType::parse("string").to_string() == "str");
    CHECK(FieldType::parse("integer").to_string() == "int");
    CHECK(FieldType::parse("number").to_string() == "float");
    CHECK(FieldType::parse("boolean").to_string() == "bool");
    CHECK(FieldType::parse("list[ str ]").to_string() == "list[str]");
    CHECK(FieldType::parse("dict[str,list[int]]").to_string() == "dict[str, list[int]]");
    CHECK(FieldType::parse("list") == FieldType(FieldKind::LIST));
}

TEST_CASE("Unknown type strings are rejected", "[types]") {
    REQUIRE_THROWS_AS(FieldType::parse("strng"), std::invalid_argument);
    REQUIRE_THROWS_AS(FieldType::parse(""), std::invalid_argument);
    REQUIRE_THROWS_AS(FieldType::parse("dict[str]"), std::invalid_argument);
    CHECK_FALSE(FieldType::is_valid("list[foo]"));
    CHECK(FieldType::is_valid("list[list[float]]"));
}

TEST_CASE("Values are matched against their declared type", "[types]") {
    auto list_of_int = FieldType::parse("list[int]");
    CHECK(list_of_int.matches(Value::array({1, 2, 3})));
    CHECK_FALSE(list_of_int.matches(Value::array({1, "two"})));
    CHECK_FALSE(list_of_int.matches(Value(1)));

    CHECK(FieldType::parse("float").matches(Value(3)));
    CHECK_FALSE(FieldType::parse("int").matches(Value(3.5)));
    CHECK_FALSE(FieldType::parse("str").matches(Value(nullptr)));
    CHECK(FieldType::parse("dict[str, bool]").matches(Value{{"a", true}}));
}

TEST_CASE("Coercion converts numbers only when lossless", "[types]") {
    auto as_int = FieldType::parse("int").coerce(Value(4.0));
    REQUIRE(as_int.has_value());
    CHECK(as_int->is_number_integer());
    CHECK(*as_int == 4);

    CHECK_FALSE(FieldType::parse("int").coerce(Value(4.5)).has_value());

    auto floats = FieldType::parse("list[float]").coerce(Value::array({1, 2.5}));
    REQUIRE(floats.has_value());
    CHECK((*floats)[0].is_number_float());

    CHECK_FALSE(FieldType::parse("bool").coerce(Value("true")).has_value());
}

TEST_CASE("Integer coercion keeps exact values and rejects out-of-range ones", "[types]") {
    auto int_type = FieldType::parse("int");

    // above 2^53: must not round-trip through double
    const int64_t big = 9007199254740993LL;
    auto exact = int_type.coerce(Value(big));
    REQUIRE(exact.has_value());
    CHECK(exact->get<int64_t>() == big);

    auto lowest = int_type.coerce(Value(std::numeric_limits<int64_t>::min()));
    REQUIRE(lowest.has_value());
    CHECK(lowest->get<int64_t>() == std::numeric_limits<int64_t>::min());

    CHECK_FALSE(int_type.coerce(Value(1e20)).has_value());
    CHECK_FALSE(int_type.coerce(Value(-1e20)).has_value());
    CHECK_FALSE(int_type.coerce(Value(9223372036854775808.0)).has_value());
    CHECK_FALSE(int_type.coerce(Value(std::numeric_limits<uint64_t>::max())).has_value());
    CHECK_FALSE(int_type.coerce(Value(std::numeric_limits<double>::infinity())).has_value());

    auto list = FieldType::parse("list[int]").coerce(Value::array({1, 1e20}));
    CHECK_FALSE(list.has_value());
}

TEST_CASE("JSON schema rendering follows the type", "[types]") {
    Value schema = FieldType::parse("list[str]").to_json_schema();
    CHECK(schema["type"] == "array");
    CHECK(schema["items"]["type"] == "string");
    CHECK(FieldType::parse("dict[str, int]").to_json_schema()["additionalProperties"]["type"] == "integer");
}
