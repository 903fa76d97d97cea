/// @file test_serializer.cpp
/// @brief Unit tests for pulljson::serialize() / JsonValue::dump() and round trips.

#include <pulljson/pulljson.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <sstream>
#include <string>

using namespace pulljson;

// ═══════════════════════════════════════════════════════════════════════════════
// Scalars
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Serializer, Keywords) {
    EXPECT_EQ(JsonValue(nullptr).dump(), "null");
    EXPECT_EQ(JsonValue(true).dump(), "true");
    EXPECT_EQ(JsonValue(false).dump(), "false");
}

TEST(Serializer, Integers) {
    EXPECT_EQ(JsonValue(0).dump(), "0");
    EXPECT_EQ(JsonValue(-100).dump(), "-100");
    EXPECT_EQ(JsonValue(std::numeric_limits<int64_t>::min()).dump(), "-9223372036854775808");
}

TEST(Serializer, FloatKeepsDecimalPoint) {
    EXPECT_EQ(JsonValue(1.0).dump(), "1.0");
    EXPECT_EQ(JsonValue(-0.0).dump(), "-0.0");
    EXPECT_NE(JsonValue(3.14).dump().find("3.14"), std::string::npos);
}

TEST(Serializer, NonFiniteFloatIsNull) {
    EXPECT_EQ(JsonValue(std::nan("")).dump(), "null");
    EXPECT_EQ(JsonValue(std::numeric_limits<double>::infinity()).dump(), "null");
}

TEST(Serializer, BigNumberIsExactText) {
    EXPECT_EQ(JsonValue::big_number("123456789012345678901234567890").dump(),
              "123456789012345678901234567890");
    EXPECT_EQ(JsonValue::big_number("1e400").dump(), "1e400");
}

TEST(Serializer, StringEscapes) {
    EXPECT_EQ(JsonValue("line1\nline2\ttab").dump(), "\"line1\\nline2\\ttab\"");
    EXPECT_EQ(JsonValue("say \"hi\" \\ bye").dump(), "\"say \\\"hi\\\" \\\\ bye\"");
    EXPECT_EQ(JsonValue(std::string("\x01\x1f", 2)).dump(), "\"\\u0001\\u001f\"");
}

TEST(Serializer, NonAsciiPassesThrough) {
    EXPECT_EQ(JsonValue("caf\xC3\xA9").dump(), "\"caf\xC3\xA9\"");
}

TEST(Serializer, AllShortEscapes) {
    EXPECT_EQ(JsonValue("\b\f\r/").dump(), "\"\\b\\f\\r/\"");
    EXPECT_EQ(JsonValue(std::string("a\0b", 3)).dump(), "\"a\\u0000b\"");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Containers
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Serializer, CompactContainers) {
    EXPECT_EQ(JsonValue::array().dump(), "[]");
    EXPECT_EQ(JsonValue::object().dump(), "{}");
    JsonValue v = Object{{"a", JsonValue(1)}, {"b", Array{JsonValue(true), JsonValue()}}};
    EXPECT_EQ(v.dump(), R"({"a":1,"b":[true,null]})");
}

TEST(Serializer, PrettyEmptyContainersStayOnOneLine) {
    JsonValue v = Object{{"a", JsonValue::array()}, {"b", JsonValue::object()}};
    EXPECT_EQ(v.dump(2), "{\n  \"a\": [],\n  \"b\": {}\n}");
}

TEST(Serializer, Pretty) {
    JsonValue v = Object{{"a", JsonValue(1)}, {"b", Array{JsonValue(2), JsonValue(3)}}};
    EXPECT_EQ(v.dump(2),
              "{\n"
              "  \"a\": 1,\n"
              "  \"b\": [\n"
              "    2,\n"
              "    3\n"
              "  ]\n"
              "}");
}

TEST(Serializer, StreamOutput) {
    JsonValue v = Array{JsonValue(1), JsonValue("x")};
    std::ostringstream os;
    os << v;
    EXPECT_EQ(os.str(), R"([1,"x"])");

    std::ostringstream pretty;
    serialize(pretty, v, 1);
    EXPECT_EQ(pretty.str(), "[\n 1,\n \"x\"\n]");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Round trip
// ═══════════════════════════════════════════════════════════════════════════════

TEST(RoundTrip, StrictDocumentSurvives) {
    const char* text = R"({
        "name": "pulljson",
        "tags": ["a", "b\n", "é"],
        "nested": {"deep": [[], {}, [1, 2, 3]]},
        "flag": true,
        "nothing": null
    })";
    auto original = parse(text);
    auto reparsed = parse(original.dump());
    EXPECT_EQ(original, reparsed);
    EXPECT_EQ(parse(original.dump(4)), original);
}

TEST(RoundTrip, NumbersKeepTheirKind) {
    auto original = parse("[0, -7, 1.5, -0.0, 1e300, 3.14159265358979323846, 99999999999999999999]");
    auto reparsed = parse(original.dump());
    ASSERT_EQ(reparsed.size(), 7u);
    EXPECT_TRUE(reparsed[0].is_integer());
    EXPECT_TRUE(reparsed[2].is_float());
    EXPECT_TRUE(reparsed[3].is_float());
    EXPECT_TRUE(std::signbit(reparsed[3].as_float()));
    EXPECT_TRUE(reparsed[4].is_float());
    EXPECT_EQ(reparsed[5].as_number_string(), "3.14159265358979323846");
    EXPECT_EQ(reparsed[6].as_number_string(), "99999999999999999999");
    EXPECT_EQ(original, reparsed);
}

TEST(RoundTrip, LenientElisionsBecomeExplicitNull) {
    auto v = parse("[1,,2,]");
    EXPECT_EQ(v.dump(), "[1,null,2]");
    EXPECT_EQ(parse(v.dump()), v);
}

TEST(RoundTrip, LenientInputReparsesStrictly) {
    auto lenient_value = parse("{a: [1,'two'], b: bare; c: 0x10,}");
    EXPECT_EQ(lenient_value.dump(), R"({"a":[1,"two"],"b":"bare","c":16})");
    auto strict_value = parse(lenient_value.dump(), ParseOptions::strict_mode());
    EXPECT_EQ(lenient_value, strict_value);
    EXPECT_EQ(strict_value["c"].as_integer(), 16);
}
