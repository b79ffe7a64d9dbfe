#include <catch2/catch.hpp>
#include <ftl/lang/parser.hpp>
#include <ftl/resolver.hpp>
#include <cctype>
#include <stdexcept>

using namespace ftl;

// Message and term tables built from FTL source, plus a registry with the
// built-in functions.
struct Tables {
    MessageTable messages;
    TermTable terms;
    FunctionRegistry functions = FunctionRegistry::with_builtins();

    explicit Tables(const std::string& src) {
        Resource r = parse(src);
        for (const auto& entry : r.entries) {
            if (const auto* m = std::get_if<Message>(&entry)) messages[m->id] = *m;
            if (const auto* t = std::get_if<Term>(&entry)) terms[t->id] = *t;
        }
    }

    static ResolverOptions plain(const std::string& locale = "en-US") {
        ResolverOptions opts;
        opts.locale = locale;
        opts.use_isolating = false;
        return opts;
    }

    ResolveResult format(const std::string& id, const FluentArgs& args = {},
                         const std::optional<std::string>& attr = std::nullopt,
                         ResolverOptions opts = plain()) const {
        Resolver resolver(messages, terms, functions, std::move(opts));
        return resolver.resolve(messages.at(id), args, attr);
    }
};

static const std::string FSI = "\xE2\x81\xA8";
static const std::string PDI = "\xE2\x81\xA9";

// ===== Patterns and variables =====

TEST_CASE("resolve plain text", "[resolver]") {
    Tables t("hello = Hello, world!");
    auto r = t.format("hello");
    CHECK(r.value == "Hello, world!");
    CHECK(r.ok());
}

TEST_CASE("resolve variable", "[resolver]") {
    Tables t("welcome = Welcome, { $name }!");
    auto r = t.format("welcome", {{"name", "Anna"}});
    CHECK(r.value == "Welcome, Anna!");
    CHECK(r.errors.empty());
}

TEST_CASE("placeables are wrapped in isolation marks", "[resolver]") {
    Tables t("welcome = Welcome, { $name }!");
    ResolverOptions opts;
    auto r = t.format("welcome", {{"name", "Anna"}}, std::nullopt, opts);
    CHECK(r.value == "Welcome, " + FSI + "Anna" + PDI + "!");
}

TEST_CASE("missing variable falls back without isolation marks", "[resolver]") {
    Tables t("welcome = Welcome, { $name }!");
    ResolverOptions opts;
    auto r = t.format("welcome", {}, std::nullopt, opts);
    CHECK(r.value == "Welcome, {$name}!");
    REQUIRE(r.errors.size() == 1);
    CHECK(r.errors[0].code == DiagnosticCode::VariableNotProvided);
    CHECK(r.errors[0].message == "Variable '$name' not provided");
    REQUIRE(r.errors[0].span.has_value());
    CHECK(r.errors[0].span->start == 21);
}

TEST_CASE("number and string argument display", "[resolver]") {
    Tables t("x = { $i } { $d } { $b }");
    auto r = t.format("x", {{"i", 42}, {"d", 2.5}, {"b", true}});
    CHECK(r.value == "42 2.5 true");
}

TEST_CASE("literals resolve to themselves", "[resolver]") {
    Tables t(R"(x = { "{" }literal{ "}" } { 5 } { -1.50 })");
    CHECK(t.format("x").value == "{literal} 5 -1.5");
}

TEST_CASE("decimal literals keep a fraction", "[resolver]") {
    Tables t("a = { 1.0 } / { 0.50 } / { -01.50 } / { 007 }");
    CHECK(t.format("a").value == "1.0 / 0.5 / -1.5 / 7");
}

TEST_CASE("large integer literals print their exact digits", "[resolver]") {
    Tables t("a = { 12345678901234567890 } / { 9007199254740993 } / { -00098765432109876543210 }");
    CHECK(t.format("a").value ==
          "12345678901234567890 / 9007199254740993 / -98765432109876543210");
}

TEST_CASE("decimal literal still selects numerically", "[resolver]") {
    Tables t("x = { 1.0 ->\n    [1] exact\n   *[other] other\n}\n"
             "y = { 1.0 ->\n    [one] single\n   *[other] other\n}");
    CHECK(t.format("x").value == "exact");
    CHECK(t.format("y").value == "single");
}

// ===== Message references =====

TEST_CASE("resolve message reference", "[resolver]") {
    Tables t("a = A\nb = { a } and B");
    CHECK(t.format("b").value == "A and B");
}

TEST_CASE("resolve message attribute reference", "[resolver]") {
    Tables t("a = A\n    .title = Title\nb = { a.title }");
    CHECK(t.format("b").value == "Title");
}

TEST_CASE("missing message reference", "[resolver]") {
    Tables t("b = See { nope }");
    auto r = t.format("b");
    CHECK(r.value == "See {nope}");
    REQUIRE(r.errors.size() == 1);
    CHECK(r.errors[0].code == DiagnosticCode::MessageNotFound);
    CHECK(r.errors[0].is_reference_error());
}

TEST_CASE("missing attribute in referenced message", "[resolver]") {
    Tables t("a = A\nb = { a.nope }");
    auto r = t.format("b");
    CHECK(r.value == "{a.nope}");
    REQUIRE(r.errors.size() == 1);
    CHECK(r.errors[0].code == DiagnosticCode::AttributeNotFound);
    CHECK(r.errors[0].message == "Attribute 'nope' not found in message 'a'");
}

TEST_CASE("referenced message without value", "[resolver]") {
    Tables t("a =\n    .title = T\nb = { a }");
    auto r = t.format("b");
    CHECK(r.value == "{a}");
    REQUIRE(r.errors.size() == 1);
    CHECK(r.errors[0].code == DiagnosticCode::MessageNoValue);
}

TEST_CASE("resolve top-level attribute", "[resolver]") {
    Tables t("button = Save\n    .tooltip = Click to save");
    auto r = t.format("button", {}, std::string("tooltip"));
    CHECK(r.value == "Click to save");
    CHECK(r.ok());
}

TEST_CASE("missing top-level attribute", "[resolver]") {
    Tables t("button = Save");
    auto r = t.format("button", {}, std::string("tooltip"));
    CHECK(r.value == "{button.tooltip}");
    REQUIRE(r.errors.size() == 1);
    CHECK(r.errors[0].code == DiagnosticCode::AttributeNotFound);
}

TEST_CASE("top-level message without value", "[resolver]") {
    Tables t("login =\n    .title = T");
    auto r = t.format("login");
    CHECK(r.value == "{login}");
    REQUIRE(r.errors.size() == 1);
    CHECK(r.errors[0].code == DiagnosticCode::MessageNoValue);
    CHECK(r.errors[0].message == "Message 'login' has no value");
}

TEST_CASE("nested diagnostics are merged in order", "[resolver]") {
    Tables t("a = { $x }\nb = { a } { $y }");
    auto r = t.format("b");
    CHECK(r.value == "{$x} {$y}");
    REQUIRE(r.errors.size() == 2);
    CHECK(r.errors[0].message == "Variable '$x' not provided");
    CHECK(r.errors[1].message == "Variable '$y' not provided");
}

// ===== Terms =====

TEST_CASE("resolve term reference", "[resolver]") {
    Tables t("-brand = Acme\nabout = About { -brand }");
    CHECK(t.format("about").value == "About Acme");
}

TEST_CASE("missing term", "[resolver]") {
    Tables t("about = About { -nope }");
    auto r = t.format("about");
    CHECK(r.value == "About {-nope}");
    REQUIRE(r.errors.size() == 1);
    CHECK(r.errors[0].code == DiagnosticCode::TermNotFound);
    CHECK(r.errors[0].message == "Term '-nope' not found");
}

TEST_CASE("missing term attribute", "[resolver]") {
    Tables t("-brand = Acme\nx = { -brand.nope }");
    auto r = t.format("x");
    CHECK(r.value == "{-brand.nope}");
    REQUIRE(r.errors.size() == 1);
    CHECK(r.errors[0].code == DiagnosticCode::TermAttributeNotFound);
}

TEST_CASE("select on term attribute", "[resolver]") {
    Tables t("-brand = Acme\n    .gender = neuter\n"
             "x = { -brand.gender ->\n    [neuter] It works\n   *[other] They work\n}\n");
    CHECK(t.format("x").value == "It works");
}

TEST_CASE("parameterized term", "[resolver]") {
    Tables t("-thing = { $case ->\n    [gen] of the thing\n   *[nom] the thing\n}\n"
             "x = Owner { -thing(case: \"gen\") }\n"
             "y = { -thing }\n");
    CHECK(t.format("x").value == "Owner of the thing");

    // Without arguments the selector fails and the default variant is used
    auto r = t.format("y");
    CHECK(r.value == "the thing");
    REQUIRE(r.errors.size() == 1);
    CHECK(r.errors[0].code == DiagnosticCode::VariableNotProvided);
}

TEST_CASE("terms see the caller's arguments", "[resolver]") {
    Tables t("-t = Hi { $name }\nx = { -t }");
    auto r = t.format("x", {{"name", "Anna"}});
    CHECK(r.value == "Hi Anna");
    CHECK(r.errors.empty());

    auto missing = t.format("x");
    CHECK(missing.value == "Hi {$name}");
    REQUIRE(missing.errors.size() == 1);
    CHECK(missing.errors[0].code == DiagnosticCode::VariableNotProvided);
}

TEST_CASE("term call arguments override the caller's", "[resolver]") {
    Tables t("-t = { $case } { $name }\n"
             "x = { -t(case: \"gen\") }\n"
             "y = { -t }");
    FluentArgs args{{"case", "nom"}, {"name", "Anna"}};
    CHECK(t.format("x", args).value == "gen Anna");
    CHECK(t.format("y", args).value == "nom Anna");
}

// ===== Cycles =====

TEST_CASE("self reference terminates", "[resolver]") {
    Tables t("hello = { hello }");
    auto r = t.format("hello");
    CHECK(r.value == "{hello}");
    REQUIRE(r.errors.size() == 1);
    CHECK(r.errors[0].code == DiagnosticCode::CyclicReference);
    CHECK(r.errors[0].message == "Circular reference detected: hello -> hello");
}

TEST_CASE("indirect cycle reports the full path", "[resolver]") {
    Tables t("a = A { b }\nb = B { a }");
    auto r = t.format("a");
    CHECK(r.value == "A B {a}");
    REQUIRE(r.errors.size() == 1);
    CHECK(r.errors[0].message == "Circular reference detected: a -> b -> a");
}

TEST_CASE("term cycle", "[resolver]") {
    Tables t("-t = { -t }\nx = { -t }");
    auto r = t.format("x");
    CHECK(r.value == "{-t}");
    REQUIRE(r.errors.size() == 1);
    CHECK(r.errors[0].message == "Circular reference detected: x -> -t -> -t");
}

TEST_CASE("value and attribute of one message are distinct keys", "[resolver]") {
    Tables t("a = Value\n    .title = { a } title");
    auto r = t.format("a", {}, std::string("title"));
    CHECK(r.value == "Value title");
    CHECK(r.ok());
}

TEST_CASE("same message referenced twice is not a cycle", "[resolver]") {
    Tables t("a = A\nb = { a }{ a }");
    auto r = t.format("b");
    CHECK(r.value == "AA");
    CHECK(r.ok());
}

// ===== Select expressions =====

TEST_CASE("plural select from a variable", "[resolver]") {
    Tables t("count = { $n -> [one] One *[other] { $n } items }");
    auto one = t.format("count", {{"n", 1}});
    CHECK(one.value == "One");
    CHECK(one.ok());

    auto five = t.format("count", {{"n", 5}});
    CHECK(five.value == "5 items");
    CHECK(five.ok());
}

TEST_CASE("exact numeric key wins over plural category", "[resolver]") {
    Tables t("x = { $n ->\n    [0] none\n    [one] one\n   *[other] many\n}");
    CHECK(t.format("x", {{"n", 0}}).value == "none");
    CHECK(t.format("x", {{"n", 0.0}}).value == "none");
    CHECK(t.format("x", {{"n", 1}}).value == "one");
    CHECK(t.format("x", {{"n", 7}}).value == "many");
}

TEST_CASE("string selector matches identifier keys", "[resolver]") {
    Tables t("x = { $g ->\n    [male] he\n    [female] she\n   *[other] they\n}");
    CHECK(t.format("x", {{"g", "female"}}).value == "she");
    CHECK(t.format("x", {{"g", "unknown"}}).value == "they");
}

TEST_CASE("plural categories follow the locale", "[resolver]") {
    Tables t("x = { $n ->\n    [one] one\n    [few] few\n    [many] many\n   *[other] other\n}");
    CHECK(t.format("x", {{"n", 2}}, std::nullopt, Tables::plain("ru")).value == "few");
    CHECK(t.format("x", {{"n", 5}}, std::nullopt, Tables::plain("ru")).value == "many");
    CHECK(t.format("x", {{"n", 21}}, std::nullopt, Tables::plain("ru")).value == "one");
    CHECK(t.format("x", {{"n", 2}}, std::nullopt, Tables::plain("en")).value == "other");
}

TEST_CASE("plural function can be replaced", "[resolver]") {
    Tables t("x = { $n ->\n    [few] few\n   *[other] other\n}");
    ResolverOptions opts = Tables::plain();
    std::string seen_locale;
    opts.plural = [&seen_locale](double, const std::string& locale) {
        seen_locale = locale;
        return std::string("few");
    };
    CHECK(t.format("x", {{"n", 3}}, std::nullopt, opts).value == "few");
    CHECK(seen_locale == "en-US");
}

TEST_CASE("number literal selector", "[resolver]") {
    Tables t("x = { 1 ->\n    [one] single\n   *[other] multiple\n}");
    CHECK(t.format("x").value == "single");
}

TEST_CASE("failed selector uses the default variant", "[resolver]") {
    Tables t("x = { $missing ->\n    [a] A\n   *[b] B\n}");
    auto r = t.format("x");
    CHECK(r.value == "B");
    REQUIRE(r.errors.size() == 1);
    CHECK(r.errors[0].code == DiagnosticCode::VariableNotProvided);
}

TEST_CASE("select without default uses the first variant", "[resolver]") {
    MessageTable messages;
    TermTable terms;
    FunctionRegistry functions;

    SelectExpression select;
    select.selector = make_expr(StringLiteral{"zzz"});
    select.variants.push_back(Variant{std::string("a"), Pattern{{TextElement{"first"}}}, false, {}});
    select.variants.push_back(Variant{std::string("b"), Pattern{{TextElement{"second"}}}, false, {}});

    Pattern pattern{{Placeable{make_expr(std::move(select))}}};
    Resolver resolver(messages, terms, functions, Tables::plain());
    auto r = resolver.resolve_pattern(pattern);
    CHECK(r.value == "first");
    CHECK(r.ok());
}

TEST_CASE("select with no variants reports a diagnostic", "[resolver]") {
    MessageTable messages;
    TermTable terms;
    FunctionRegistry functions;

    SelectExpression select;
    select.selector = make_expr(VariableReference{"n"});
    Pattern pattern{{TextElement{"x "}, Placeable{make_expr(std::move(select))}}};

    Resolver resolver(messages, terms, functions, Tables::plain());
    auto r = resolver.resolve_pattern(pattern, {{"n", 1}});
    CHECK(r.value == "x {???}");
    REQUIRE(r.errors.size() == 1);
    CHECK(r.errors[0].code == DiagnosticCode::NoVariants);
    CHECK_FALSE(r.errors[0].is_reference_error());
}

// ===== Functions =====

TEST_CASE("builtin NUMBER receives the locale", "[resolver][functions]") {
    Tables t("x = { NUMBER($n, minimumFractionDigits: 2) }");
    CHECK(t.format("x", {{"n", 42}}).value == "42.00");
    CHECK(t.format("x", {{"n", 1234.5}}, std::nullopt, Tables::plain("de")).value == "1.234,50");
}

TEST_CASE("NUMBER result still selects plural variants", "[resolver][functions]") {
    Tables t("x = { NUMBER($n) ->\n    [one] one\n   *[other] other\n}");
    CHECK(t.format("x", {{"n", 1}}).value == "one");
    CHECK(t.format("x", {{"n", 3}}).value == "other");
}

TEST_CASE("custom function gets only its own arguments", "[resolver][functions]") {
    Tables t("x = { SHOUT($name, suffix: \"!\") }");
    size_t seen_positional = 0;
    REQUIRE(t.functions.add("SHOUT", [&seen_positional](const std::vector<FluentValue>& pos,
                                                        const NamedArgs& named) {
        seen_positional = pos.size();
        std::string s = pos.at(0).to_string();
        for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return Result<FluentValue>::ok(s + named.at("suffix").to_string());
    }).is_ok());

    auto r = t.format("x", {{"name", "anna"}});
    CHECK(r.value == "ANNA!");
    CHECK(seen_positional == 1);
}

TEST_CASE("replacing a builtin stops locale injection", "[resolver][functions]") {
    Tables t("x = { NUMBER($n) }");
    size_t seen_positional = 0;
    REQUIRE(t.functions.add("NUMBER", [&seen_positional](const std::vector<FluentValue>& pos,
                                                         const NamedArgs&) {
        seen_positional = pos.size();
        return Result<FluentValue>::ok(FluentValue("custom"));
    }).is_ok());

    CHECK(t.format("x", {{"n", 3}}).value == "custom");
    CHECK(seen_positional == 1);
}

TEST_CASE("unknown function", "[resolver][functions]") {
    Tables t("x = { NOPE($n) }");
    auto r = t.format("x", {{"n", 1}});
    CHECK(r.value == "{NOPE(...)}");
    REQUIRE(r.errors.size() == 1);
    CHECK(r.errors[0].code == DiagnosticCode::FunctionNotFound);
}

TEST_CASE("failing function", "[resolver][functions]") {
    Tables t("x = { FAIL() } { THROW() }");
    REQUIRE(t.functions.add("FAIL", [](const std::vector<FluentValue>&, const NamedArgs&) {
        return Result<FluentValue>(FtlError(FtlError::InvalidArg, "bad input"));
    }).is_ok());
    REQUIRE(t.functions.add("THROW", [](const std::vector<FluentValue>&,
                                        const NamedArgs&) -> Result<FluentValue> {
        throw std::runtime_error("boom");
    }).is_ok());

    auto r = t.format("x");
    CHECK(r.value == "{FAIL(...)} {THROW(...)}");
    REQUIRE(r.errors.size() == 2);
    CHECK(r.errors[0].code == DiagnosticCode::FunctionFailed);
    CHECK(r.errors[0].message == "Function 'FAIL' failed: bad input");
    CHECK(r.errors[1].message == "Function 'THROW' failed: boom");
}

TEST_CASE("failed function argument is reported once", "[resolver][functions]") {
    Tables t("x = { NUMBER($missing) }");
    auto r = t.format("x");
    CHECK(r.value == "{NUMBER(...)}");
    REQUIRE(r.errors.size() == 1);
    CHECK(r.errors[0].code == DiagnosticCode::VariableNotProvided);
}

TEST_CASE("builtin error becomes a diagnostic", "[resolver][functions]") {
    Tables t("x = { NUMBER($n) }");
    auto r = t.format("x", {{"n", "abc"}});
    CHECK(r.value == "{NUMBER(...)}");
    REQUIRE(r.errors.size() == 1);
    CHECK(r.errors[0].code == DiagnosticCode::FunctionFailed);
}

// ===== Determinism and reentrancy =====

TEST_CASE("resolving twice gives identical results", "[resolver]") {
    Tables t("a = { b } { $x }\nb = { a }");
    auto first = t.format("a");
    auto second = t.format("a");
    CHECK(first.value == second.value);
    CHECK(first.errors == second.errors);
}

TEST_CASE("one resolver serves several calls without leaking state", "[resolver]") {
    Tables t("x = { $n }");
    Resolver resolver(t.messages, t.terms, t.functions, Tables::plain());
    auto bad = resolver.resolve(t.messages.at("x"));
    CHECK(bad.errors.size() == 1);
    auto good = resolver.resolve(t.messages.at("x"), {{"n", 1}});
    CHECK(good.value == "1");
    CHECK(good.ok());
}

// ===== Fallbacks =====

TEST_CASE("fallback text follows the expression shape", "[resolver]") {
    CHECK(fallback_for(*make_expr(VariableReference{"name"})) == "{$name}");
    CHECK(fallback_for(*make_expr(MessageReference{"msg", std::nullopt})) == "{msg}");
    CHECK(fallback_for(*make_expr(MessageReference{"msg", std::string("attr")})) == "{msg.attr}");
    CHECK(fallback_for(*make_expr(TermReference{"brand", std::nullopt, std::nullopt})) == "{-brand}");
    CHECK(fallback_for(*make_expr(FunctionReference{"NUMBER", {}})) == "{NUMBER(...)}");
    CHECK(fallback_for(*make_expr(StringLiteral{"x"})) == "{???}");
}
