#include <catch2/catch.hpp>
#include <ftl/fs.hpp>
#include <cstdlib>

using namespace ftl;

static std::string fixture_dir() {
    const char* src = std::getenv("FTL_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

TEST_CASE("read_text_file returns the whole file", "[fs][fixture]") {
    auto r = read_text_file(fixture_dir() + "/locales/de/main.ftl", "resource file");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().find("hello = Hallo, { $name }!") != std::string::npos);
    REQUIRE(r.value().back() == '\n');
}

TEST_CASE("read_text_file reports missing files", "[fs]") {
    std::string path = fixture_dir() + "/nope.ftl";
    auto r = read_text_file(path, "resource file");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FtlError::NotFound);
    REQUIRE(r.error().message == "resource file not found: " + path);
    REQUIRE(r.error().file == path);
}

TEST_CASE("read_text_file rejects directories", "[fs][fixture]") {
    auto r = read_text_file(fixture_dir() + "/locales", "config file");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == FtlError::IO);
    REQUIRE(r.error().message.find("config file is a directory") == 0);
}
