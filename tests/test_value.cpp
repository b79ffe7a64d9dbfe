#include <catch2/catch.hpp>
#include <ftl/value.hpp>
#include <cmath>
#include <limits>
#include <set>

using namespace ftl;

// ===== Construction =====

TEST_CASE("default value is none", "[value]") {
    FluentValue v;
    CHECK(v.is_none());
    CHECK_FALSE(v.is_number());
    CHECK(v.to_string().empty());
}

TEST_CASE("integer types collapse to int64", "[value]") {
    CHECK(FluentValue(42).get_if<int64_t>() != nullptr);
    CHECK(FluentValue(42L).get_if<int64_t>() != nullptr);
    CHECK(FluentValue(42LL).get_if<int64_t>() != nullptr);
    CHECK(FluentValue(42u).get_if<int64_t>() != nullptr);
    CHECK(FluentValue(size_t(42)).get_if<int64_t>() != nullptr);
    CHECK(FluentValue(42) == FluentValue(42LL));
}

TEST_CASE("string literals become strings, not bools", "[value]") {
    FluentValue v("hello");
    CHECK(v.is_string());
    CHECK(v.to_string() == "hello");
    CHECK(FluentValue(std::string("x")).is_string());
}

TEST_CASE("bools are not numbers", "[value]") {
    FluentValue v(true);
    CHECK_FALSE(v.is_number());
    CHECK_FALSE(v.as_number().has_value());
    CHECK(v.to_string() == "true");
    CHECK(FluentValue(false).to_string() == "false");
}

// ===== Numbers =====

TEST_CASE("as_number covers all numeric kinds", "[value]") {
    CHECK(FluentValue(3).as_number() == 3.0);
    CHECK(FluentValue(2.5).as_number() == 2.5);
    CHECK(FluentValue(FluentNumber{7.0, "7.00"}).as_number() == 7.0);
    CHECK_FALSE(FluentValue("3").as_number().has_value());
}

TEST_CASE("doubles print in shortest form", "[value]") {
    CHECK(FluentValue(2.5).to_string() == "2.5");
    CHECK(FluentValue(0.1).to_string() == "0.1");
    CHECK(FluentValue(-3.0).to_string() == "-3");
    CHECK(FluentValue(std::nan("")).to_string() == "NaN");
    CHECK(FluentValue(std::numeric_limits<double>::infinity()).to_string() == "Infinity");
    CHECK(FluentValue(-std::numeric_limits<double>::infinity()).to_string() == "-Infinity");
}

TEST_CASE("integers print exactly", "[value]") {
    CHECK(FluentValue(-17).to_string() == "-17");
    CHECK(FluentValue(int64_t(9007199254740993LL)).to_string() == "9007199254740993");
}

TEST_CASE("formatted numbers print their formatted text", "[value]") {
    FluentValue v(FluentNumber{1234.5, "1,234.5"});
    CHECK(v.is_number());
    CHECK(v.to_string() == "1,234.5");
}

// ===== Dates =====

TEST_CASE("dates print as ISO-8601 UTC", "[value]") {
    CHECK(FluentValue(make_date(2025, 10, 27)).to_string() == "2025-10-27T00:00:00Z");
    CHECK(FluentValue(make_date(2000, 2, 29, 23, 59, 58)).to_string() == "2000-02-29T23:59:58Z");
    CHECK(FluentValue(make_date(1970, 1, 1)).to_string() == "1970-01-01T00:00:00Z");
    CHECK(FluentValue(make_date(1969, 12, 31, 12)).to_string() == "1969-12-31T12:00:00Z");
}

TEST_CASE("make_date is relative to the unix epoch", "[value]") {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        make_date(1970, 1, 2).time_since_epoch()).count();
    CHECK(secs == 86400);
    CHECK(FluentValue(make_date(2025, 1, 1)).is_date());
}

// ===== Cache keys =====

TEST_CASE("cache keys carry the type", "[value]") {
    CHECK(FluentValue().cache_key() == "n:");
    CHECK(FluentValue(true).cache_key() == "b:1");
    CHECK(FluentValue(false).cache_key() == "b:0");
    CHECK(FluentValue(42).cache_key() == "i:42");
    CHECK(FluentValue(2.5).cache_key() == "d:2.5");
    CHECK(FluentValue("ab").cache_key() == "s:2:ab");
    CHECK(FluentValue(FluentNumber{1.0, "1.0"}).cache_key() == "f:1:1.0");
}

TEST_CASE("distinct values have distinct cache keys", "[value]") {
    std::vector<FluentValue> values = {
        FluentValue(), FluentValue(true), FluentValue(1), FluentValue(1.5),
        FluentValue("1"), FluentValue(""), FluentValue("i:1"),
        FluentValue(FluentNumber{1.0, "1"}), FluentValue(make_date(2020, 1, 1)),
    };
    std::set<std::string> keys;
    for (const auto& v : values) keys.insert(v.cache_key());
    CHECK(keys.size() == values.size());
}

TEST_CASE("value equality compares type and content", "[value]") {
    CHECK(FluentValue(1) == FluentValue(1));
    CHECK(FluentValue(1) != FluentValue(1.0));
    CHECK(FluentValue("a") != FluentValue("b"));
    CHECK(FluentValue(make_date(2020, 1, 1)) == FluentValue(make_date(2020, 1, 1)));
}
