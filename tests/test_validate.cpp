#include <catch2/catch.hpp>
#include <ftl/validate.hpp>

using namespace ftl;

static size_t count_code(const ValidationResult& r, const std::string& code) {
    size_t n = 0;
    for (const auto& w : r.warnings) {
        if (w.code == code) ++n;
    }
    return n;
}

// ===== Clean input =====

TEST_CASE("well-formed resource validates cleanly", "[validate]") {
    auto r = validate_source(
        "-brand = Acme\n"
        "hello = Hello from { -brand }\n"
        "about = { hello }\n");
    CHECK(r.is_valid());
    CHECK(r.error_count() == 0);
    CHECK(r.warning_count() == 0);
}

TEST_CASE("empty resource is valid", "[validate]") {
    auto r = validate_source("");
    CHECK(r.is_valid());
    CHECK(r.warnings.empty());
}

// ===== Syntax errors =====

TEST_CASE("junk becomes parse errors", "[validate]") {
    auto r = validate_source("ok = fine\nbroken = { $x\n");
    CHECK_FALSE(r.is_valid());
    REQUIRE(r.error_count() == 1);
    CHECK(r.errors[0].code == "parse-error");
    CHECK(r.errors[0].content == "broken = { $x\n");
    CHECK_FALSE(r.errors[0].message.empty());
}

// ===== Duplicates =====

TEST_CASE("duplicate message ids warn", "[validate]") {
    auto r = validate_source("a = 1\na = 2\n");
    CHECK(r.is_valid());
    REQUIRE(r.warning_count() == 1);
    CHECK(r.warnings[0].code == "duplicate-id");
    CHECK(r.warnings[0].message == "Duplicate message id 'a'; the later definition wins");
    CHECK(r.warnings[0].context == "a");
}

TEST_CASE("duplicate term ids warn", "[validate]") {
    auto r = validate_source("-t = 1\n-t = 2\n");
    REQUIRE(r.warning_count() == 1);
    CHECK(r.warnings[0].message == "Duplicate term id '-t'; the later definition wins");
    CHECK(r.warnings[0].context == "-t");
}

TEST_CASE("a message and a term may share a name", "[validate]") {
    auto r = validate_source("brand = x\n-brand = y\n");
    CHECK(r.warnings.empty());
}

// ===== Undefined references =====

TEST_CASE("undefined message reference warns", "[validate]") {
    auto r = validate_source("a = { missing }\n");
    REQUIRE(r.warning_count() == 1);
    CHECK(r.warnings[0].code == "undefined-reference");
    CHECK(r.warnings[0].message == "'a' references undefined message 'missing'");
    CHECK(r.warnings[0].context == "a");
}

TEST_CASE("undefined term reference from an attribute warns", "[validate]") {
    auto r = validate_source("a = x\n    .title = { -nope }\n");
    REQUIRE(r.warning_count() == 1);
    CHECK(r.warnings[0].message == "'a.title' references undefined term '-nope'");
    CHECK(r.warnings[0].context == "a");
}

TEST_CASE("known ids satisfy references", "[validate]") {
    KnownIds known;
    known.messages.insert("elsewhere");
    known.terms.insert("brand");
    auto r = validate_source("a = { elsewhere } { -brand }\n", known);
    CHECK(r.warnings.empty());
}

TEST_CASE("only the winning duplicate is checked", "[validate]") {
    auto r = validate_source("a = { missing }\na = fixed\n");
    CHECK(count_code(r, "duplicate-id") == 1);
    CHECK(count_code(r, "undefined-reference") == 0);
}

// ===== Cycles =====

TEST_CASE("self reference is a cycle", "[validate]") {
    auto r = validate_source("a = { a }\n");
    REQUIRE(count_code(r, "circular-reference") == 1);
    CHECK(r.warnings[0].message == "Circular reference: a -> a");
    CHECK(r.warnings[0].context == "a");
}

TEST_CASE("cycle through messages and terms", "[validate]") {
    auto r = validate_source(
        "a = { -t }\n"
        "-t = { b }\n"
        "b = { a }\n");
    REQUIRE(count_code(r, "circular-reference") == 1);
    CHECK(r.warnings[0].message == "Circular reference: a -> -t -> b -> a");
}

TEST_CASE("attribute references are tracked separately", "[validate]") {
    // a.x -> a (value) is not a cycle; a -> a.x -> a is
    auto ok = validate_source("a = fine\n    .x = { a }\n");
    CHECK(count_code(ok, "circular-reference") == 0);

    auto bad = validate_source("a = { a.x }\n    .x = { a }\n");
    REQUIRE(count_code(bad, "circular-reference") == 1);
    CHECK(bad.warnings[0].message == "Circular reference: a -> a.x -> a");
}

TEST_CASE("reference to a missing attribute is not a cycle edge", "[validate]") {
    auto r = validate_source("a = { a.nope }\n");
    CHECK(count_code(r, "circular-reference") == 0);
}
