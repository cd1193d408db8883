// flow_core Value helper tests

#include <catch2/catch_test_macros.hpp>
#include <flow_engine/core/value.hpp>

using namespace flow_core;

TEST_CASE("is_truthy", "[core][value]") {
    REQUIRE_FALSE(is_truthy(Value(nullptr)));
    REQUIRE_FALSE(is_truthy(Value(false)));
    REQUIRE_FALSE(is_truthy(Value(0)));
    REQUIRE_FALSE(is_truthy(Value(0.0)));
    REQUIRE_FALSE(is_truthy(Value("")));

    REQUIRE(is_truthy(Value(true)));
    REQUIRE(is_truthy(Value(-1)));
    REQUIRE(is_truthy(Value("0")));
    REQUIRE(is_truthy(Value::array()));
    REQUIRE(is_truthy(Value::object()));
}

TEST_CASE("to_display_string", "[core][value]") {
    REQUIRE(to_display_string(Value("abc")) == "abc");
    REQUIRE(to_display_string(Value(5)) == "5");
    REQUIRE(to_display_string(Value(5.0)) == "5");
    REQUIRE(to_display_string(Value(2.5)) == "2.5");
    REQUIRE(to_display_string(Value(true)) == "true");
    REQUIRE(to_display_string(Value(nullptr)) == "null");
    REQUIRE(to_display_string(Value::parse(R"({"a":1})")) == R"({"a":1})");
}

TEST_CASE("coerce_number", "[core][value]") {
    SECTION("numbers") {
        REQUIRE(coerce_number(Value(3)) == 3.0);
        REQUIRE(coerce_number(Value(-1.5)) == -1.5);
    }

    SECTION("numeric strings") {
        REQUIRE(coerce_number(Value("42")) == 42.0);
        REQUIRE(coerce_number(Value("  7.25 ")) == 7.25);
    }

    SECTION("non-numeric values give nothing") {
        REQUIRE_FALSE(coerce_number(Value("abc")).has_value());
        REQUIRE_FALSE(coerce_number(Value("12abc")).has_value());
        REQUIRE_FALSE(coerce_number(Value("")).has_value());
        REQUIRE_FALSE(coerce_number(Value(true)).has_value());
        REQUIRE_FALSE(coerce_number(Value(nullptr)).has_value());
        REQUIRE_FALSE(coerce_number(Value::array()).has_value());
    }
}

TEST_CASE("values_equal", "[core][value]") {
    SECTION("primitives compare as strings") {
        REQUIRE(values_equal(Value(5), Value("5")));
        REQUIRE(values_equal(Value(true), Value("true")));
        REQUIRE(values_equal(Value(1.0), Value(1)));
        REQUIRE_FALSE(values_equal(Value("a"), Value("b")));
    }

    SECTION("structured values compare deeply") {
        REQUIRE(values_equal(Value::parse(R"({"a":[1,2]})"), Value::parse(R"({"a":[1,2]})")));
        REQUIRE_FALSE(values_equal(Value::parse(R"({"a":[1,2]})"), Value::parse(R"({"a":[2,1]})")));
        REQUIRE_FALSE(values_equal(Value::array(), Value("[]")));
    }
}

TEST_CASE("parse_path", "[core][value]") {
    SECTION("dotted keys with indices") {
        auto segments = parse_path("data.items[1].name");
        REQUIRE(segments);
        REQUIRE(segments->size() == 4);
        REQUIRE((*segments)[0].key == "data");
        REQUIRE((*segments)[1].key == "items");
        REQUIRE((*segments)[2].is_index());
        REQUIRE(*(*segments)[2].index == 1);
        REQUIRE((*segments)[3].key == "name");
    }

    SECTION("empty path") {
        auto segments = parse_path("");
        REQUIRE(segments);
        REQUIRE(segments->empty());
    }

    SECTION("malformed paths") {
        REQUIRE_FALSE(parse_path("a..b"));
        REQUIRE_FALSE(parse_path("a[0"));
        REQUIRE_FALSE(parse_path("a[x]"));
        REQUIRE_FALSE(parse_path("a[0]b"));
        REQUIRE(parse_path("a[").error().code() == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("lookup_path", "[core][value]") {
    Value doc = Value::parse(R"({"user":{"name":"Ada","tags":["x","y"]},"list":[{"v":1}]})");

    REQUIRE(*lookup_path(doc, "user.name") == "Ada");
    REQUIRE(*lookup_path(doc, "user.tags[1]") == "y");
    REQUIRE(*lookup_path(doc, "list.0.v") == 1);

    REQUIRE(lookup_path(doc, "user.missing") == nullptr);
    REQUIRE(lookup_path(doc, "user.name.first") == nullptr);
    REQUIRE(lookup_path(doc, "user.tags[5]") == nullptr);
    REQUIRE(lookup_path(doc, "user[") == nullptr);
}
