#include <catch2/catch.hpp>
#include "utils/errors.hpp"
#include "utils/json_parser.hpp"

using namespace wordbase;

TEST_CASE("flat members are returned as text", "[json]") {
    auto m = JsonParser::parse(R"({"name":"Ann","age":31,"active":true,"note":null})");
    CHECK(m.size() == 4);
    CHECK(m["name"] == "Ann");
    CHECK(m["age"] == "31");
    CHECK(m["active"] == "true");
    CHECK(m["note"] == "null");
}

TEST_CASE("nested containers come back as raw JSON", "[json]") {
    auto m = JsonParser::parse(R"({"topics": ["music", "it"], "tr": {"cat": "noun", "x": "}"}})");
    CHECK(m["topics"] == R"(["music", "it"])");
    CHECK(m["tr"] == R"({"cat": "noun", "x": "}"})");

    auto inner = JsonParser::parse(m["tr"]);
    CHECK(inner["cat"] == "noun");
    CHECK(inner["x"] == "}");
}

TEST_CASE("string escapes are decoded", "[json]") {
    auto m = JsonParser::parse(R"({"s":"a\"b\\c\nd","u":"\u043f\u0440\u0438","pair":"\ud83d\ude00"})");
    CHECK(m["s"] == "a\"b\\c\nd");
    CHECK(m["u"] == "\xD0\xBF\xD1\x80\xD0\xB8");
    CHECK(m["pair"] == "\xF0\x9F\x98\x80");
}

TEST_CASE("a JSON-encoded payload survives a round trip as a string value", "[json]") {
    const std::string payload = R"({"user_id": 1, "first_name": "A \"quoted\" name"})";
    const std::string wrapped = JsonParser::stringify({{"purpose", "ADD_USER"}, {"user", payload}});

    auto outer = JsonParser::parse(wrapped);
    CHECK(outer["purpose"] == "ADD_USER");
    CHECK(outer["user"] == payload);
    CHECK(JsonParser::parse(outer["user"])["first_name"] == "A \"quoted\" name");
}

TEST_CASE("string arrays", "[json]") {
    CHECK(JsonParser::parseStringArray("[]").empty());
    auto values = JsonParser::parseStringArray(R"([ "a", "b,c" , "d\"e" ])");
    REQUIRE(values.size() == 3);
    CHECK(values[1] == "b,c");
    CHECK(values[2] == "d\"e");
    CHECK(JsonParser::stringifyStringArray({"x", "y\"z"}) == R"(["x","y\"z"])");
}

TEST_CASE("control characters are escaped", "[json]") {
    CHECK(JsonParser::escapeJson(std::string("a\x01" "b")) == "a\\u0001b");
    CHECK(JsonParser::quote("tab\there") == "\"tab\\there\"");
}

TEST_CASE("malformed input is rejected", "[json]") {
    CHECK_THROWS_AS(JsonParser::parse(""), ValidationError);
    CHECK_THROWS_AS(JsonParser::parse("[1,2]"), ValidationError);
    CHECK_THROWS_AS(JsonParser::parse(R"({"a":1)"), ValidationError);
    CHECK_THROWS_AS(JsonParser::parse(R"({"a" 1})"), ValidationError);
    CHECK_THROWS_AS(JsonParser::parse(R"({"a":"open})"), ValidationError);
    CHECK_THROWS_AS(JsonParser::parse(R"({"a":1} trailing)"), ValidationError);
    CHECK_THROWS_AS(JsonParser::parseStringArray(R"({"a":1})"), ValidationError);
}

TEST_CASE("object detection skips leading whitespace", "[json]") {
    CHECK(JsonParser::looksLikeObject("  {\"a\":1}"));
    CHECK_FALSE(JsonParser::looksLikeObject("\"{}\""));
    CHECK_FALSE(JsonParser::looksLikeObject(""));
}
