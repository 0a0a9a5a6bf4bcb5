#include <catch2/catch_test_macros.hpp>
#include "restjson/response.hpp"
#include <limits>
#include <map>
#include <stdexcept>
#include <vector>

using namespace restjson;
using restjson::json::JsonText;

namespace
{
    struct Person
    {
        std::string name;
    };

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Person, name)

    struct Reading
    {
        double value;
    };

    void to_json(nlohmann::json &j, const Reading &r)
    {
        j = nlohmann::json{{"value", r.value}};
    }

    struct Unencodable
    {
    };

    void to_json(nlohmann::json &, const Unencodable &)
    {
        throw std::invalid_argument("unsupported type");
    }

    bool contains(const std::string &haystack, const std::string &needle)
    {
        return haystack.find(needle) != std::string::npos;
    }
}

TEST_CASE("marshalled encodes a record", "[marshalled]")
{
    ResponseRecorder rec;

    auto n = marshalled(rec, Person{"Eder"}, 500);

    REQUIRE(n.has_value());
    REQUIRE(rec.status() == 500);
    REQUIRE(rec.header("Content-Type") == "application/json");
    REQUIRE(JsonText::is_valid(rec.body()));
    REQUIRE(contains(rec.body(), "Eder"));
    REQUIRE(rec.body() == R"({"name":"Eder"})");
}

TEST_CASE("marshalled encodes zero as a bare numeral", "[marshalled]")
{
    ResponseRecorder rec;
    REQUIRE(marshalled(rec, 0, 500).has_value());
    REQUIRE(JsonText::is_valid(rec.body()));
    REQUIRE(rec.body() == "0");
}

TEST_CASE("marshalled encodes absent values as null", "[marshalled]")
{
    ResponseRecorder from_null;
    REQUIRE(marshalled(from_null, nullptr, 500).has_value());
    REQUIRE(from_null.body() == "null");

    ResponseRecorder from_optional;
    REQUIRE(marshalled(from_optional, std::optional<int>{}, 200).has_value());
    REQUIRE(from_optional.body() == "null");

    ResponseRecorder from_value;
    REQUIRE(marshalled(from_value, std::optional<int>{7}, 200).has_value());
    REQUIRE(from_value.body() == "7");
}

TEST_CASE("marshalled encodes maps and sequences", "[marshalled]")
{
    ResponseRecorder seq;
    REQUIRE(marshalled(seq, std::vector<int>{1, 2, 3}, 200).has_value());
    REQUIRE(seq.body() == "[1,2,3]");

    ResponseRecorder map;
    std::map<std::string, bool> flags{{"a", true}, {"b", false}};
    REQUIRE(marshalled(map, flags, 200).has_value());
    REQUIRE(map.body() == R"({"a":true,"b":false})");
}

TEST_CASE("marshalled accepts a prepared JSON document", "[marshalled]")
{
    ResponseRecorder rec;
    nlohmann::json doc = {{"status", "ok"}, {"items", nlohmann::json::array()}};
    auto n = marshalled(rec, doc, 200);
    REQUIRE(n.has_value());
    REQUIRE(*n == rec.body().size());
    REQUIRE(rec.body() == R"({"items":[],"status":"ok"})");
}

TEST_CASE("marshalled leaves the sink untouched on non-finite numbers", "[marshalled]")
{
    ResponseRecorder rec;

    auto n = marshalled(rec, Reading{std::numeric_limits<double>::quiet_NaN()}, 200);

    REQUIRE_FALSE(n.has_value());
    REQUIRE(n.error().code == ErrorCode::SerializationError);
    REQUIRE_FALSE(rec.wrote_header());
    REQUIRE_FALSE(rec.header("Content-Type").has_value());
    REQUIRE(rec.body().empty());
}

TEST_CASE("marshalled leaves the sink untouched on ill-formed UTF-8", "[marshalled]")
{
    ResponseRecorder rec;

    auto n = marshalled(rec, std::string("bad\xff"), 200);

    REQUIRE_FALSE(n.has_value());
    REQUIRE(n.error().code == ErrorCode::SerializationError);
    REQUIRE_FALSE(rec.wrote_header());
}

TEST_CASE("marshalled reports conversion failures as serialization errors", "[marshalled]")
{
    ResponseRecorder rec;

    auto n = marshalled(rec, Unencodable{}, 200);

    REQUIRE_FALSE(n.has_value());
    REQUIRE(n.error().code == ErrorCode::SerializationError);
    REQUIRE(contains(n.error().what(), "unsupported type"));
    REQUIRE_FALSE(rec.wrote_header());
}

TEST_CASE("marshalled propagates sink write failures", "[marshalled]")
{
    ResponseRecorder rec;
    rec.fail_writes("connection reset");

    auto n = marshalled(rec, Person{"Eder"}, 200);

    REQUIRE_FALSE(n.has_value());
    REQUIRE(n.error().code == ErrorCode::IOError);
}
