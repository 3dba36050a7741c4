#include <catch2/catch_test_macros.hpp>
#include "chainlog/canonical_json.hpp"
#include "chainlog/audit.hpp"
#include "chainlog/chain_verifier.hpp"
#include "chainlog/crypto.hpp"
#include <chrono>
#include <cmath>
#include <limits>
#include <utility>
#include <vector>

using namespace chainlog;
using namespace chainlog::json;
using json = nlohmann::json;

namespace
{
    std::string encode(const json &value)
    {
        auto res = CanonicalEncoder::encode(value);
        REQUIRE(res.has_value());
        return *res;
    }
}

TEST_CASE("Canonical - Simple object canonicalization", "[json]")
{
    json obj = {
        {"z", 3},
        {"a", 1},
        {"m", 2}};

    REQUIRE(encode(obj) == R"({"a":1,"m":2,"z":3})");
}

TEST_CASE("Canonical - Nested object canonicalization", "[json]")
{
    json obj = {
        {"outer", {{"z", "last"}, {"a", "first"}}}};

    REQUIRE(encode(obj) == R"({"outer":{"a":"first","z":"last"}})");
}

TEST_CASE("Canonical - Array order is preserved", "[json]")
{
    REQUIRE(encode(json{3, 1, 2}) == "[3,1,2]");
    REQUIRE(encode(json::array({json{{"b", 1}, {"a", 2}}, nullptr})) == R"([{"a":2,"b":1},null])");
}

TEST_CASE("Canonical - Insertion order does not matter", "[json]")
{
    json forward = json::object();
    forward["alpha"] = 1;
    forward["beta"] = json{{"x", true}, {"y", false}};
    forward["gamma"] = "g";

    json backward = json::object();
    backward["gamma"] = "g";
    backward["beta"] = json{{"y", false}, {"x", true}};
    backward["alpha"] = 1;

    REQUIRE(encode(forward) == encode(backward));
}

TEST_CASE("Canonical - String escaping", "[json]")
{
    json s = "tab\there \"q\" \\ \x01";
    REQUIRE(encode(s) == R"("tab\there \"q\" \\ \u0001")");

    json ctrl = "\b\f\n\r\x1f";
    REQUIRE(encode(ctrl) == R"("\b\f\n\r\u001f")");
}

TEST_CASE("Canonical - Non-ASCII characters are escaped", "[json]")
{
    // e-acute, U+1F600 (surrogate pair), DEL
    json s = "\xc3\xa9\xf0\x9f\x98\x80\x7f";
    REQUIRE(encode(s) == R"("\u00e9\ud83d\ude00\u007f")");
}

TEST_CASE("Canonical - Keys sort by code point", "[json]")
{
    json obj = {{"\xc3\xa9", 2}, {"z", 1}, {"Z", 0}};
    REQUIRE(encode(obj) == R"({"Z":0,"z":1,"\u00e9":2})");
}

TEST_CASE("Canonical - Integer formatting", "[json]")
{
    json obj = {
        {"int", 42},
        {"negative", -17},
        {"zero", 0},
        {"max", std::numeric_limits<uint64_t>::max()},
        {"min", std::numeric_limits<int64_t>::min()}};

    REQUIRE(encode(obj) ==
            R"({"int":42,"max":18446744073709551615,"min":-9223372036854775808,"negative":-17,"zero":0})");
}

TEST_CASE("Canonical - Float formatting", "[json]")
{
    const std::vector<std::pair<double, std::string>> cases = {
        {1.0, "1.0"},
        {0.0, "0.0"},
        {-0.0, "-0.0"},
        {0.1, "0.1"},
        {2.5, "2.5"},
        {3.14, "3.14"},
        {-3.14, "-3.14"},
        {0.0001, "0.0001"},
        {1e-5, "1e-05"},
        {2.5e-7, "2.5e-07"},
        {1e15, "1000000000000000.0"},
        {1e16, "1e+16"},
        {1e21, "1e+21"},
        {1.5e300, "1.5e+300"},
        {5e-324, "5e-324"},
        {123456789.125, "123456789.125"},
        {123456789012345678.0, "1.2345678901234568e+17"}};

    for (const auto &[value, expected] : cases)
    {
        INFO("expected " << expected);
        REQUIRE(encode(json(value)) == expected);
    }
}

TEST_CASE("Canonical - Boolean and null", "[json]")
{
    json obj = {
        {"bool_true", true},
        {"bool_false", false},
        {"null_val", nullptr}};

    REQUIRE(encode(obj) == R"({"bool_false":false,"bool_true":true,"null_val":null})");
}

TEST_CASE("Canonical - Empty structures", "[json]")
{
    REQUIRE(encode(json::object()) == "{}");
    REQUIRE(encode(json::array()) == "[]");
    REQUIRE(encode(json("")) == R"("")");
}

TEST_CASE("Canonical - Mixed document matches existing chains byte for byte", "[json][compat]")
{
    json obj = {
        {"b", {1, 2.5, nullptr, true}},
        {"a", {{"z", "\xc3\xa9\xf0\x9f\x98\x80\x7f"},
               {"y", 1e16},
               {"x", 0.0001},
               {"w", 1e-5},
               {"v", 1e15},
               {"u", -0.0},
               {"t", 1.0},
               {"s", 123456789.125}}}};

    REQUIRE(encode(obj) ==
            R"({"a":{"s":123456789.125,"t":1.0,"u":-0.0,"v":1000000000000000.0,"w":1e-05,"x":0.0001,"y":1e+16,"z":"\u00e9\ud83d\ude00\u007f"},"b":[1,2.5,null,true]})");
}

TEST_CASE("Canonical - Non-finite numbers are rejected", "[json][errors]")
{
    auto nan = CanonicalEncoder::encode(json{{"v", std::numeric_limits<double>::quiet_NaN()}});
    REQUIRE_FALSE(nan.has_value());
    REQUIRE(nan.error().code == ErrorCode::EncodingError);

    auto inf = CanonicalEncoder::encode(json::array({std::numeric_limits<double>::infinity()}));
    REQUIRE_FALSE(inf.has_value());
    REQUIRE(inf.error().code == ErrorCode::EncodingError);
}

TEST_CASE("Canonical - Binary values are rejected", "[json][errors]")
{
    auto res = CanonicalEncoder::encode(json{{"blob", json::binary({0x01, 0x02})}});
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::EncodingError);
}

TEST_CASE("Canonical - Invalid UTF-8 is rejected", "[json][errors]")
{
    for (const std::string bad : {std::string("\xff"), std::string("ab\xc3"), std::string("\xc0\xaf"),
                                  std::string("\xed\xa0\x80")})
    {
        auto res = CanonicalEncoder::encode(json(bad));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::EncodingError);
    }

    json bad_key = json::object();
    bad_key[std::string("k\xff")] = 1;
    REQUIRE_FALSE(CanonicalEncoder::encode(bad_key).has_value());
}

TEST_CASE("Canonical - Excessive nesting is rejected", "[json][errors]")
{
    json deep = json::array();
    for (std::size_t i = 1; i < CanonicalEncoder::kMaxDepth; ++i)
    {
        deep = json::array({deep});
    }
    REQUIRE(CanonicalEncoder::encode(deep).has_value());

    json too_deep = json::array({deep});
    auto res = CanonicalEncoder::encode(too_deep);
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::EncodingError);
}

TEST_CASE("Canonical - encode_text parses then encodes", "[json]")
{
    auto res = CanonicalEncoder::encode_text(R"({ "b" : 1, "a" : [1, 2.0, "x"] })");
    REQUIRE(res.has_value());
    REQUIRE(*res == R"({"a":[1,2.0,"x"],"b":1})");

    auto bad = CanonicalEncoder::encode_text("{\"a\":");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == ErrorCode::ParsingError);
}

TEST_CASE("Canonical - Logged records verify after a JSON round trip", "[json][chain]")
{
    AuditLogger logger("eng-001", "op-alice");
    auto record = logger.log_event("scan", json{{"hosts", 5}, {"open_ports", {22, 443}}}, "task-7", "task-7");
    REQUIRE(record.has_value());

    // chain_hash is the digest of the canonical record minus chain_hash
    json unchained = record->to_json();
    unchained.erase("chain_hash");
    auto canonical = CanonicalEncoder::encode(unchained);
    REQUIRE(canonical.has_value());
    REQUIRE(record->chain_hash == crypto::SHA256::hex_digest(*canonical));

    // Transport through text with members re-inserted in reverse order
    json parsed = json::parse(record->to_json().dump(4));
    json reordered = json::object();
    std::vector<std::string> keys;
    for (auto it = parsed.begin(); it != parsed.end(); ++it)
        keys.push_back(it.key());
    for (auto it = keys.rbegin(); it != keys.rend(); ++it)
        reordered[*it] = parsed[*it];

    auto valid = ChainVerifier::verify(std::vector<json>{reordered});
    REQUIRE(valid.has_value());
    REQUIRE(*valid);
}
