#include <catch2/catch_test_macros.hpp>
#include "restjson/json_text.hpp"
#include <limits>

using namespace restjson::json;
using json = nlohmann::json;

TEST_CASE("is_valid accepts every kind of JSON value", "[json_text]")
{
    REQUIRE(JsonText::is_valid(R"({"name": "cale"})"));
    REQUIRE(JsonText::is_valid("[1,2,3]"));
    REQUIRE(JsonText::is_valid(R"("quoted")"));
    REQUIRE(JsonText::is_valid("42"));
    REQUIRE(JsonText::is_valid("-1.5e3"));
    REQUIRE(JsonText::is_valid("true"));
    REQUIRE(JsonText::is_valid("null"));
    REQUIRE(JsonText::is_valid("  {}\n"));
}

TEST_CASE("is_valid rejects plain text and broken documents", "[json_text]")
{
    REQUIRE_FALSE(JsonText::is_valid(""));
    REQUIRE_FALSE(JsonText::is_valid("   "));
    REQUIRE_FALSE(JsonText::is_valid("not found"));
    REQUIRE_FALSE(JsonText::is_valid("\"not found'"));
    REQUIRE_FALSE(JsonText::is_valid("{\"a\":1"));
    REQUIRE_FALSE(JsonText::is_valid("{} {}"));
    REQUIRE_FALSE(JsonText::is_valid("'single'"));
    REQUIRE_FALSE(JsonText::is_valid("\"\xff\""));
}

TEST_CASE("is_valid rejects a leading byte order mark", "[json_text]")
{
    REQUIRE_FALSE(JsonText::is_valid("\xEF\xBB\xBF{\"code\":\"001\"}"));
    REQUIRE_FALSE(JsonText::is_valid("\xEF\xBB\xBF[1,2,3]"));
    REQUIRE_FALSE(JsonText::is_valid("\xEF\xBB\xBF"));
    REQUIRE(JsonText::is_valid("\"\xEF\xBB\xBF inside a string\""));
}

TEST_CASE("quote wraps plain text", "[json_text]")
{
    REQUIRE(JsonText::quote("not found") == R"("not found")");
    REQUIRE(JsonText::quote("") == R"("")");
}

TEST_CASE("quote escapes quotes, backslashes and control characters", "[json_text]")
{
    REQUIRE(JsonText::quote("\"not found'") == R"("\"not found'")");
    REQUIRE(JsonText::quote("a\\b") == R"("a\\b")");
    REQUIRE(JsonText::quote("line1\nline2\ttab\r") == R"("line1\nline2\ttab\r")");
    REQUIRE(JsonText::quote(std::string("nul\0x", 5)) == R"("nul\u0000x")");
    REQUIRE(JsonText::quote("\x01\x1f") == R"("\u0001\u001f")");
}

TEST_CASE("quote escapes HTML characters unless disabled", "[json_text]")
{
    REQUIRE(JsonText::quote("<a&b>") == R"("\u003ca\u0026b\u003e")");
    REQUIRE(JsonText::quote("<a&b>", QuoteOptions{false}) == R"("<a&b>")");
}

TEST_CASE("quote keeps UTF-8 and escapes line separators", "[json_text]")
{
    REQUIRE(JsonText::quote("caf\xc3\xa9") == "\"caf\xc3\xa9\"");
    REQUIRE(JsonText::quote("\xf0\x9f\x98\x80") == "\"\xf0\x9f\x98\x80\"");
    REQUIRE(JsonText::quote("a\xe2\x80\xa8" "b\xe2\x80\xa9") == R"("a\u2028b\u2029")");
}

TEST_CASE("quote replaces ill-formed UTF-8", "[json_text]")
{
    REQUIRE(JsonText::quote("bad\xff") == R"("bad\ufffd")");
    REQUIRE(JsonText::quote("\xc3") == R"("\ufffd")");
    REQUIRE(JsonText::quote("\xc0\xaf") == R"("\ufffd\ufffd")");
    REQUIRE(JsonText::quote("\xed\xa0\x80") == R"("\ufffd\ufffd\ufffd")");
}

TEST_CASE("quote output is always valid JSON", "[json_text]")
{
    const char *inputs[] = {
        "not found",
        "\"not found'",
        "{\"half\": ",
        "tab\there",
        "\xff\xfe",
        "mixed \xc3\xa9 and \xe2\x80\xa8"};

    for (const auto *input : inputs)
    {
        auto quoted = JsonText::quote(input);
        REQUIRE(JsonText::is_valid(quoted));
    }
}

TEST_CASE("quote round-trips through a JSON parser", "[json_text]")
{
    std::string text = "He said \"hello\" <b>\\ 'bye'";
    auto parsed = json::parse(JsonText::quote(text));
    REQUIRE(parsed.get<std::string>() == text);
}

TEST_CASE("encode produces compact JSON", "[json_text]")
{
    json obj = {{"name", "Eder"}, {"ids", {1, 2, 3}}};
    auto encoded = JsonText::encode(obj);
    REQUIRE(encoded.has_value());
    REQUIRE(*encoded == R"({"ids":[1,2,3],"name":"Eder"})");
    REQUIRE(JsonText::encode(json(nullptr)).value() == "null");
    REQUIRE(JsonText::encode(json(0)).value() == "0");
}

TEST_CASE("encode rejects values JSON cannot represent", "[json_text]")
{
    auto nan = JsonText::encode(json{{"x", std::numeric_limits<double>::quiet_NaN()}});
    REQUIRE_FALSE(nan.has_value());
    REQUIRE(nan.error().code == restjson::ErrorCode::SerializationError);

    auto inf = JsonText::encode(json::array({1.0, std::numeric_limits<double>::infinity()}));
    REQUIRE_FALSE(inf.has_value());

    auto utf8 = JsonText::encode(json("bad\xff"));
    REQUIRE_FALSE(utf8.has_value());
    REQUIRE(utf8.error().code == restjson::ErrorCode::SerializationError);
}
