#include <catch2/catch.hpp>

#include "include/Utils.hpp"
#include "TestSupport.hpp"

#include <cstdlib>
#include <filesystem>

using namespace curvefan;
using curvefan::test::TempDir;

TEST_CASE("strict integer parsing", "[utils]") {
    CHECK(util::parse_ll("42") == 42);
    CHECK(util::parse_ll(" -7\n") == -7);
    CHECK_FALSE(util::parse_ll("").has_value());
    CHECK_FALSE(util::parse_ll("12abc").has_value());
    CHECK_FALSE(util::parse_ll("4.5").has_value());
    CHECK_FALSE(util::parse_ll("99999999999999999999999").has_value());
}

TEST_CASE("string helpers", "[utils]") {
    CHECK(util::trim("  a b \t\n") == "a b");
    CHECK(util::trim("   ").empty());
    CHECK(util::to_lower("TrUe") == "true");
}

TEST_CASE("first line of a sysfs-style file", "[utils]") {
    TempDir dir;
    CHECK(util::read_first_line_ll(dir.write("a", "2\n")) == 2);
    CHECK(util::read_first_line_ll(dir.write("b", "17\nignored\n")) == 17);
    CHECK_FALSE(util::read_first_line_ll(dir.write("c", "manual\n")).has_value());
    CHECK_FALSE(util::read_first_line_ll(dir.file("missing")).has_value());
}

TEST_CASE("atomic text write replaces the whole file", "[utils]") {
    TempDir dir;
    const std::string path = dir.write("status.json", "old contents that are longer");
    std::string err;
    REQUIRE(util::write_text_file_atomic(path, "new", &err));
    CHECK(err.empty());
    CHECK(dir.read("status.json") == "new");
    CHECK_FALSE(std::filesystem::exists(path + ".tmp"));

    CHECK_FALSE(util::write_text_file_atomic(dir.file("no/such/dir/x"), "data", &err));
    CHECK_FALSE(err.empty());
}

TEST_CASE("user path expansion", "[utils]") {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        CHECK(util::expandUserPath("~/fan") == std::string(home) + "/fan");
    }
    ::setenv("CURVEFAN_TEST_DIR", "/opt/x", 1);
    CHECK(util::expandUserPath("$CURVEFAN_TEST_DIR/a") == "/opt/x/a");
    CHECK(util::expandUserPath("${CURVEFAN_TEST_DIR}/b") == "/opt/x/b");
    CHECK(util::expandUserPath("/plain") == "/plain");
    ::unsetenv("CURVEFAN_TEST_DIR");
}

TEST_CASE("integer environment values outside int fall back to the default", "[utils]") {
    ::setenv("CURVEFAN_TEST_INT", "4294968296", 1);  // 2^32 + 1000
    CHECK(util::getenv_int("CURVEFAN_TEST_INT", 1000) == 1000);
    ::setenv("CURVEFAN_TEST_INT", "-4294967296", 1);
    CHECK(util::getenv_int("CURVEFAN_TEST_INT", 7) == 7);
    ::setenv("CURVEFAN_TEST_INT", "250", 1);
    CHECK(util::getenv_int("CURVEFAN_TEST_INT", 1000) == 250);
    ::unsetenv("CURVEFAN_TEST_INT");
}
