#include <catch2/catch.hpp>
#include <ftl/localization.hpp>
#include <cstdlib>
#include <map>

using namespace ftl;

static std::string fixture_dir() {
    const char* src = std::getenv("FTL_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

static BundleOptions plain() {
    BundleOptions opts;
    opts.use_isolating = false;
    return opts;
}

// In-memory loader keyed on "locale/resource"
class MapLoader : public ResourceLoader {
public:
    std::map<std::string, std::string> files;

    Result<std::string> load(const std::string& locale,
                             const std::string& resource_id) const override {
        auto it = files.find(locale + "/" + resource_id);
        if (it == files.end()) {
            return FtlError{FtlError::NotFound, locale + "/" + resource_id};
        }
        return Result<std::string>::ok(it->second);
    }
};

class BrokenLoader : public ResourceLoader {
public:
    Result<std::string> load(const std::string&, const std::string&) const override {
        return FtlError{FtlError::IO, "disk on fire"};
    }
};

// ===== PathResourceLoader =====

TEST_CASE("path loader substitutes the locale", "[localization]") {
    PathResourceLoader loader("locales/{locale}");
    CHECK(loader.path_for("en-US", "main.ftl") == "locales/en-US/main.ftl");

    PathResourceLoader twice("{locale}/x/{locale}");
    CHECK(twice.path_for("de", "a.ftl") == "de/x/de/a.ftl");
}

TEST_CASE("path loader reads fixture files", "[localization][fixture]") {
    PathResourceLoader loader(fixture_dir() + "/locales/{locale}");
    auto src = loader.load("en-US", "main.ftl");
    REQUIRE(src.is_ok());
    CHECK(src.value().find("hello = Hello, { $name }!") != std::string::npos);
}

TEST_CASE("path loader reports missing files as not found", "[localization][fixture]") {
    PathResourceLoader loader(fixture_dir() + "/locales/{locale}");
    auto src = loader.load("fr", "main.ftl");
    REQUIRE(src.is_err());
    CHECK(src.error().code == FtlError::NotFound);
}

// ===== create =====

TEST_CASE("create needs at least one locale", "[localization]") {
    auto r = Localization::create({});
    REQUIRE(r.is_err());
    CHECK(r.error().code == FtlError::InvalidArg);
}

TEST_CASE("create needs a loader for resource ids", "[localization]") {
    auto r = Localization::create({"en-US"}, {"main.ftl"});
    REQUIRE(r.is_err());
    CHECK(r.error().code == FtlError::InvalidArg);
}

TEST_CASE("create rejects repeated locales", "[localization]") {
    auto r = Localization::create({"en-US", "de", "en-US"});
    REQUIRE(r.is_err());
    CHECK(r.error().code == FtlError::Duplicate);
}

TEST_CASE("create skips resources a locale does not have", "[localization]") {
    MapLoader loader;
    loader.files["en-US/main.ftl"] = "hello = Hello\n";
    loader.files["en-US/extra.ftl"] = "extra = Extra\n";
    loader.files["de/main.ftl"] = "hello = Hallo\n";

    auto r = Localization::create({"de", "en-US"}, {"main.ftl", "extra.ftl"}, &loader, plain());
    REQUIRE(r.is_ok());
    const auto& l10n = r.value();
    CHECK(l10n.locales() == std::vector<std::string>{"de", "en-US"});
    CHECK(l10n.format_value("hello").value == "Hallo");
    CHECK(l10n.format_value("extra").value == "Extra");
}

TEST_CASE("create stops on loader failures other than not found", "[localization]") {
    BrokenLoader loader;
    auto r = Localization::create({"en-US"}, {"main.ftl"}, &loader);
    REQUIRE(r.is_err());
    CHECK(r.error().code == FtlError::IO);
}

// ===== Fallback =====

TEST_CASE("messages fall back along the chain", "[localization][fixture]") {
    PathResourceLoader loader(fixture_dir() + "/locales/{locale}");
    auto r = Localization::create({"de", "en-US"}, {"main.ftl"}, &loader, plain());
    REQUIRE(r.is_ok());
    const auto& l10n = r.value();

    CHECK(l10n.format_value("hello", {{"name", "Anna"}}).value == "Hallo, Anna!");
    CHECK(l10n.format_value("goodbye").value == "Goodbye");
    CHECK(l10n.format_value("items", {{"count", 1}}).value == "Ein Artikel");
    CHECK(l10n.format_value("items", {{"count", 4}}).value == "4 Artikel");
    CHECK(l10n.has_message("goodbye"));
    CHECK_FALSE(l10n.bundle("de")->has_message("goodbye"));
}

TEST_CASE("message missing everywhere", "[localization]") {
    auto r = Localization::create({"de", "en-US"}, {}, nullptr, plain());
    REQUIRE(r.is_ok());
    auto out = r.value().format_value("nope");
    CHECK(out.value == "{nope}");
    REQUIRE(out.errors.size() == 1);
    CHECK(out.errors[0].code == DiagnosticCode::MessageNotFound);
    CHECK(out.errors[0].message == "Message 'nope' not found in any locale");
    CHECK_FALSE(r.value().has_message("nope"));
}

TEST_CASE("format_pattern falls back for attributes", "[localization]") {
    auto r = Localization::create({"de", "en-US"}, {}, nullptr, plain());
    REQUIRE(r.is_ok());
    auto& l10n = r.value();
    REQUIRE(l10n.add_resource("en-US", "login = Log in\n    .title = Sign in\n").is_ok());
    auto out = l10n.format_pattern("login", {}, std::string("title"));
    CHECK(out.value == "Sign in");
    CHECK(out.errors.empty());
}

// ===== Mutation =====

TEST_CASE("add_resource targets one locale", "[localization]") {
    auto r = Localization::create({"de", "en-US"}, {}, nullptr, plain());
    REQUIRE(r.is_ok());
    auto& l10n = r.value();

    auto junk = l10n.add_resource("de", "a = A\nbroken = {\n");
    REQUIRE(junk.is_ok());
    CHECK(junk.value().size() == 1);
    CHECK(l10n.bundle("de")->has_message("a"));
    CHECK_FALSE(l10n.bundle("en-US")->has_message("a"));

    auto bad = l10n.add_resource("fr", "a = A\n");
    REQUIRE(bad.is_err());
    CHECK(bad.error().code == FtlError::InvalidArg);
    CHECK(bad.error().message == "locale 'fr' is not in the fallback chain");
}

TEST_CASE("add_function reaches every bundle", "[localization]") {
    auto r = Localization::create({"de", "en-US"}, {}, nullptr, plain());
    REQUIRE(r.is_ok());
    auto& l10n = r.value();
    REQUIRE(l10n.add_resource("en-US", "x = { TWICE($v) }\n").is_ok());

    auto twice = [](const std::vector<FluentValue>& pos, const NamedArgs&) {
        std::string s = pos.empty() ? "" : pos[0].to_string();
        return Result<FluentValue>::ok(s + s);
    };
    REQUIRE(l10n.add_function("TWICE", twice).is_ok());
    CHECK(l10n.format_value("x", {{"v", "ab"}}).value == "abab");
    CHECK(l10n.add_function("bad name", twice).is_err());
}

TEST_CASE("bundle lookup", "[localization]") {
    auto r = Localization::create({"de"}, {}, nullptr, plain());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().bundle("de") != nullptr);
    CHECK(r.value().bundle("de")->locale() == "de");
    CHECK(r.value().bundle("en-US") == nullptr);
}

// ===== from_config =====

TEST_CASE("from_config loads the configured chain", "[localization][fixture]") {
    auto cfg = Config::load(fixture_dir() + "/ftl.toml");
    REQUIRE(cfg.is_ok());
    Config config = cfg.value();
    config.resource_path = fixture_dir() + "/locales/{locale}";

    auto r = Localization::from_config(config);
    REQUIRE(r.is_ok());
    const auto& l10n = r.value();
    CHECK(l10n.locales() == std::vector<std::string>{"de", "en-US"});
    CHECK(l10n.format_value("hello", {{"name", "Jo"}}).value == "Hallo, Jo!");
    CHECK(l10n.format_value("goodbye").value == "Goodbye");
    CHECK(l10n.bundle("de")->cache_stats().capacity == 16);
}

TEST_CASE("from_config without resources", "[localization]") {
    Config config;
    config.locale = "fr";
    config.fallback_locales = {"en"};
    auto r = Localization::from_config(config);
    REQUIRE(r.is_ok());
    CHECK(r.value().locales() == std::vector<std::string>{"fr", "en"});
}

TEST_CASE("from_config needs a path for resource files", "[localization]") {
    Config config;
    config.resource_files = {"main.ftl"};
    auto r = Localization::from_config(config);
    REQUIRE(r.is_err());
    CHECK(r.error().code == FtlError::Config);
}
