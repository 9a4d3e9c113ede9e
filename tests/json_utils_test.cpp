#include <gtest/gtest.h>

#include <string>

#include "../src/utils/json_utils.hpp"

TEST(json_utils, validity) {
    ASSERT_TRUE(json_utils::is_valid_json(R"({"x":1})"));
    ASSERT_TRUE(json_utils::is_valid_json(" [1, 2.5, \"s\"] "));
    ASSERT_TRUE(json_utils::is_valid_json("42"));
    ASSERT_FALSE(json_utils::is_valid_json("{bad}"));
    ASSERT_FALSE(json_utils::is_valid_json(R"({"x":1} trailing)"));
    ASSERT_FALSE(json_utils::is_valid_json(""));
}

TEST(json_utils, sorts_keys_and_pretty_prints) {
    auto pretty = json_utils::to_sorted_pretty_json(R"({"b":1,"a":2})");
    ASSERT_TRUE(pretty.has_value());
    ASSERT_EQ("{\n  \"a\": 2,\n  \"b\": 1\n}", *pretty);
}

TEST(json_utils, sorts_nested_objects) {
    auto pretty = json_utils::to_sorted_pretty_json(R"({"z":{"y":[1,{"d":null,"c":true}],"x":"s"},"B":false})");
    ASSERT_TRUE(pretty.has_value());
    const std::string expected =
        "{\n"
        "  \"B\": false,\n"
        "  \"z\": {\n"
        "    \"x\": \"s\",\n"
        "    \"y\": [\n"
        "      1,\n"
        "      {\n"
        "        \"c\": true,\n"
        "        \"d\": null\n"
        "      }\n"
        "    ]\n"
        "  }\n"
        "}";
    ASSERT_EQ(expected, *pretty);
}

TEST(json_utils, empty_containers_and_scalars) {
    ASSERT_EQ("{}", *json_utils::to_sorted_pretty_json("{}"));
    ASSERT_EQ("[]", *json_utils::to_sorted_pretty_json(" [ ] "));
    ASSERT_EQ("\"hi\"", *json_utils::to_sorted_pretty_json("\"hi\""));
    ASSERT_EQ("-7", *json_utils::to_sorted_pretty_json("-7"));
    ASSERT_EQ("18446744073709551615", *json_utils::to_sorted_pretty_json("18446744073709551615"));
}

TEST(json_utils, duplicate_keys_keep_last) { ASSERT_EQ("{\n  \"a\": 2\n}", *json_utils::to_sorted_pretty_json(R"({"a":1,"a":2})")); }

TEST(json_utils, doubles) {
    ASSERT_EQ("0.5", json_utils::format_double(0.5));
    ASSERT_EQ("1.0", json_utils::format_double(1.0));
    ASSERT_EQ("[\n  1.0,\n  2.25\n]", *json_utils::to_sorted_pretty_json("[1.0, 2.25]"));
}

TEST(json_utils, escapes_strings) {
    ASSERT_EQ(R"("line\nbreak \"q\" \\ \u0001")", *json_utils::to_sorted_pretty_json(R"("line\nbreak \"q\" \\ \u0001")"));
    ASSERT_EQ("\"caf\xC3\xA9\"", *json_utils::to_sorted_pretty_json("\"caf\\u00e9\""));
}

TEST(json_utils, non_json_yields_nothing) {
    ASSERT_FALSE(json_utils::to_sorted_pretty_json("<html>hello</html>").has_value());
    ASSERT_FALSE(json_utils::to_sorted_pretty_json("").has_value());
}

TEST(json_utils, integers_beyond_64_bits_still_pretty_print) {
    const std::string body = R"({"z":1,"n":123456789012345678901234567890,"a":[-5,18446744073709551615]})";
    ASSERT_TRUE(json_utils::is_valid_json(body));

    auto pretty = json_utils::to_sorted_pretty_json(body);
    ASSERT_TRUE(pretty.has_value());
    ASSERT_EQ(0U, pretty->find("{\n  \"a\": [\n    -5,\n    18446744073709551615\n  ],\n  \"n\": 1.23456789012345"));
    ASSERT_NE(std::string::npos, pretty->find("e+29,\n  \"z\": 1\n}"));
}

TEST(json_utils, big_integer_alone) {
    auto pretty = json_utils::to_sorted_pretty_json(R"({"n":123456789012345678901234567890})");
    ASSERT_TRUE(pretty.has_value());
    ASSERT_EQ(0U, pretty->find("{\n  \"n\": 1.23456789012345"));
    ASSERT_FALSE(json_utils::to_sorted_pretty_json(R"({"n":123456789012345678901234567890,})").has_value());
    ASSERT_FALSE(json_utils::is_valid_json(R"({"n":123456789012345678901234567890} x)"));
}
