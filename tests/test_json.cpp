#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_exception.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

#include "json.hpp"

using Catch::Matchers::ContainsSubstring;

// ============================================================================
// Building request envelopes
// ============================================================================

TEST_CASE("envelope built from initializer lists") {
    json req = {
        {"method", "getblock"},
        {"params", json::array_t{json("00ab"), json(2)}},
        {"id", int64_t{7}},
    };
    req["version"] = "1.1";

    CHECK(req.is_object());
    CHECK(req.size() == 4);
    CHECK(req.dump() == R"({"id":7,"method":"getblock","params":["00ab",2],"version":"1.1"})");
}

TEST_CASE("a two-element list whose first item is a string becomes an object") {
    json pair_like = {"key", 1};
    CHECK(pair_like.is_array());

    json nested = {{"key", 1}};
    CHECK(nested.is_object());
    CHECK(nested["key"].get<int>() == 1);

    json empty = {};
    CHECK(empty.is_null());
}

TEST_CASE("const lookups never insert") {
    const json resp = json::parse(R"({"error":null,"id":3})");
    CHECK(resp["result"].is_null());
    CHECK(!resp.contains("result"));
    CHECK(resp.size() == 2);

    const json scalar(5);
    CHECK(scalar["error"].is_null());
    CHECK(!scalar.contains("error"));
}

TEST_CASE("operator[] on the wrong kind throws") {
    json j(42);
    CHECK_THROWS_AS(j["key"], json::exception);
    const json s("str");
    CHECK_THROWS_AS((void)s[0], json::exception);
}

// ============================================================================
// value() defaults, as used for peer error objects
// ============================================================================

TEST_CASE("value() on an error object") {
    const json err = json::parse(R"({"code":-8,"message":"Block height out of range"})");
    CHECK(err.value("code", 0) == -8);
    CHECK(err.value("message", "") == "Block height out of range");
    CHECK(err.value("data", "none") == "none");
}

TEST_CASE("value() falls back on null, wrong type and non-objects") {
    const json err = json::parse(R"({"code":"x","message":null})");
    CHECK(err.value("code", 0) == 0);
    CHECK(err.value("message", "fallback") == "fallback");
    CHECK(json::array().value("code", 3) == 3);
}

// ============================================================================
// Numbers
// ============================================================================

TEST_CASE("integer literals stay integers") {
    auto j = json::parse("884231");
    CHECK(j.is_number_integer());
    CHECK(!j.is_decimal());
    CHECK(j.get<int64_t>() == 884231);
    CHECK(json::parse("-7").get<int>() == -7);
    CHECK(json::parse("9223372036854775807").get<int64_t>() ==
          std::numeric_limits<int64_t>::max());
}

TEST_CASE("fraction and exponent literals parse to Decimal") {
    auto j = json::parse("0.1");
    CHECK(j.is_decimal());
    CHECK(j.is_number());
    CHECK(j.is_number_float());
    CHECK(!j.is_number_integer());
    CHECK(j.get<Decimal>() == Decimal::parse("0.10"));
    CHECK(j.get<double>() == Catch::Approx(0.1));

    CHECK(json::parse("1e3").is_decimal());
    CHECK(json::parse("2E-1").get<double>() == Catch::Approx(0.2));
}

TEST_CASE("integers wider than int64 keep every digit") {
    auto j = json::parse("123456789012345678901234567890");
    CHECK(j.is_decimal());
    CHECK(j.get<Decimal>().to_string() == "123456789012345678901234567890");
}

TEST_CASE("malformed numbers throw json::exception") {
    CHECK_THROWS_AS(json::parse("-"),   json::exception);
    CHECK_THROWS_AS(json::parse("1."),  json::exception);
    CHECK_THROWS_AS(json::parse("1e"),  json::exception);
    CHECK_THROWS_AS(json::parse("-.5"), json::exception);
}

TEST_CASE("get<integer> from a fractional number is range checked") {
    CHECK(json::parse("2.0").get<int>() == 2);
    CHECK(json(-3.9).get<int>() == -3);

    CHECK_THROWS_AS(json::parse("1e20").get<int>(),     json::exception);
    CHECK_THROWS_AS(json::parse("1e20").get<int64_t>(), json::exception);
    CHECK_THROWS_AS(json(std::nan("")).get<int>(),      json::exception);
    CHECK_THROWS_AS(json(-1.0).get<uint32_t>(),         json::exception);
    CHECK_THROWS_AS(json(9.3e18).get<int64_t>(),        json::exception);
    CHECK(json(9.2e18).get<int64_t>() == int64_t{9200000000000000000});

    // value() turns the failure into its default
    const json err = json::parse(R"({"code":1e20})");
    CHECK(err.value("code", 0) == 0);
}

TEST_CASE("get<Decimal>") {
    CHECK(json(5).get<Decimal>() == Decimal(5));
    CHECK(json(Decimal::parse("0.5")).get<Decimal>() == Decimal::parse("0.5"));
    CHECK_THROWS_AS(json("0.5").get<Decimal>(), json::exception);
    CHECK_THROWS_AS(json(0.5).get<Decimal>(),   json::exception);
}

TEST_CASE("get type mismatches throw") {
    CHECK_THROWS_AS(json(42).get<bool>(),        json::exception);
    CHECK_THROWS_AS(json(42).get<std::string>(), json::exception);
    CHECK_THROWS_AS(json(true).get<int>(),       json::exception);
    CHECK_THROWS_AS(json("hi").get<double>(),    json::exception);
}

// ============================================================================
// Encoding numbers
// ============================================================================

TEST_CASE("dump decimal rounds to 8 fractional digits") {
    CHECK(json(Decimal::parse("12.345678901")).dump() == "12.34567890");
    CHECK(json(Decimal::parse("0.00000001")).dump()   == "0.00000001");
    CHECK(json(Decimal::parse("1.5")).dump()          == "1.50000000");
    CHECK(json(Decimal::parse("-2e-9")).dump()        == "0.00000000");
    CHECK(json::parse(R"({"amount":21000000.00000000})").dump() ==
          R"({"amount":21000000.00000000})");
}

TEST_CASE("dump double uses the shortest round-trip form") {
    CHECK(json(0.1).dump()   == "0.1");
    CHECK(json(3.14).dump()  == "3.14");
    CHECK(json(-0.5).dump()  == "-0.5");
    CHECK(json(100.0).dump() == "100");
    CHECK(json::parse(json(0.30000001).dump()).get<Decimal>() == Decimal::parse("0.30000001"));
}

TEST_CASE("dump non-finite double throws") {
    CHECK_THROWS_AS(json(std::nan("")).dump(), json::exception);
    CHECK_THROWS_AS(json(-std::numeric_limits<double>::infinity()).dump(), json::exception);
    json a = {1, std::numeric_limits<double>::infinity()};
    CHECK_THROWS_AS(a.dump(), json::exception);
}

// ============================================================================
// Structure limits
// ============================================================================

TEST_CASE("nesting up to the limit parses") {
    const std::string deep = std::string(512, '[') + std::string(512, ']');
    auto j = json::parse(deep);
    CHECK(j.is_array());
    CHECK(j.size() == 1);

    std::string objects;
    for (int i = 0; i < 512; ++i)
        objects += R"({"a":)";
    objects += "1" + std::string(512, '}');
    CHECK(json::parse(objects).is_object());
}

TEST_CASE("nesting past the limit throws") {
    const std::string too_deep = std::string(513, '[') + std::string(513, ']');
    CHECK_THROWS_MATCHES(json::parse(too_deep), json::exception,
                         Catch::Matchers::MessageMatches(ContainsSubstring("Nesting too deep")));

    const std::string huge = std::string(200000, '[') + std::string(200000, ']');
    CHECK_THROWS_AS(json::parse(huge), json::exception);
}

TEST_CASE("sibling containers do not accumulate depth") {
    std::string wide = "[";
    for (int i = 0; i < 1000; ++i)
        wide += (i ? ",[[]]" : "[[]]");
    wide += "]";
    CHECK(json::parse(wide).size() == 1000);
}

TEST_CASE("parse errors throw json::exception") {
    CHECK_THROWS_AS(json::parse(""),                 json::exception);
    CHECK_THROWS_AS(json::parse("{"),                json::exception);
    CHECK_THROWS_AS(json::parse("["),                json::exception);
    CHECK_THROWS_AS(json::parse("tru"),              json::exception);
    CHECK_THROWS_AS(json::parse(R"("unterminated)"), json::exception);
    CHECK_THROWS_AS(json::parse("42 extra"),         json::exception);
    CHECK_THROWS_AS(json::parse("{\"k\":}"),         json::exception);
    CHECK_THROWS_AS(json::parse("<html>401</html>"), json::exception);
}

TEST_CASE("strings survive a dump/parse cycle") {
    const std::string raw = "label \"hot\"\twallet\\\né";
    CHECK(json::parse(json(raw).dump()).get<std::string>() == raw);
    CHECK(json::parse(R"("A")").get<std::string>() == "A");
}

// ============================================================================
// Bitcoin Core RPC response shape (integration-style)
// ============================================================================

TEST_CASE("getblockchaininfo response shape") {
    const std::string raw = R"({
        "result": {
            "chain": "main",
            "blocks": 884231,
            "difficulty": 113762235938718.02,
            "verificationprogress": 0.9999978,
            "pruned": false
        },
        "error": null,
        "id": 1
    })";

    auto j = json::parse(raw);
    CHECK(j["error"].is_null());

    auto r = j["result"];
    CHECK(r.value("chain",  "") == "main");
    CHECK(r.value("blocks", 0LL) == 884231LL);
    CHECK(r.value("pruned", true) == false);
    CHECK(r.value("verificationprogress", 0.0) == Catch::Approx(0.9999978).epsilon(1e-6));
    CHECK(r["difficulty"].is_decimal());
    CHECK(r["difficulty"].dump() == "113762235938718.02000000");
}

TEST_CASE("batch response shape") {
    const std::string raw = R"([
        {"result": 884231, "error": null, "id": 4},
        {"result": null, "error": {"code": -8, "message": "Block height out of range"}, "id": 5}
    ])";

    auto j = json::parse(raw);
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 2);

    CHECK(j[0]["error"].is_null());
    CHECK(j[0].value("result", 0LL) == 884231LL);
    CHECK(j[0]["id"].get<int>() == 4);

    const auto& err = j[1]["error"];
    CHECK(err.is_object());
    CHECK(err.value("code", 0) == -8);
    CHECK(err.value("message", "") == "Block height out of range");
    CHECK(j[1]["result"].is_null());
}

TEST_CASE("getbalances response keeps satoshi precision") {
    const std::string raw = R"({
        "result": {"mine": {"trusted": 0.30000001, "untrusted_pending": 0.00000000}},
        "error": null,
        "id": 3
    })";

    auto j       = json::parse(raw);
    auto trusted = j["result"]["mine"]["trusted"];
    CHECK(trusted.is_decimal());
    CHECK(trusted.get<Decimal>() == Decimal::parse("0.30000001"));
    CHECK(trusted.dump() == "0.30000001");
    CHECK(j["result"]["mine"]["untrusted_pending"].get<Decimal>().is_zero());
}

TEST_CASE("pretty dump for console output") {
    const json o = json::parse(R"({"x":1,"y":[true]})");
    const std::string pretty = o.dump(2);
    CHECK(pretty.find('\n') != std::string::npos);
    CHECK(pretty.find("  \"x\": 1") != std::string::npos);
}
