#include <catch2/catch_test_macros.hpp>
#include "IniConfig.hpp"
#include "TestHelpers.hpp"

TEST_CASE("ini values are read by section") {
    TempDir temp_dir;
    const auto path = temp_dir.path() / "config.ini";
    write_file(path,
               "; comment\n"
               "top = level\n"
               "[Sanitize]\n"
               "MaxLength = 120\n"
               "  CaseStyle=title  \r\n"
               "# another comment\n"
               "[Extraction]\n"
               "RegexPattern = Invoice (\\d+) = total\n"
               "not a key value line\n"
               "= orphan value\n");

    IniConfig config;
    REQUIRE(config.load(path));
    CHECK(config.get_string("", "top") == "level");
    CHECK(config.get_string("Sanitize", "CaseStyle") == "title");
    CHECK(config.get_string("Extraction", "RegexPattern") == "Invoice (\\d+) = total");
    CHECK(config.get_string("Extraction", "Missing", "fallback") == "fallback");
    CHECK(config.get_integer("Sanitize", "MaxLength") == std::optional<long long>(120));
    CHECK(config.contains("Sanitize", "MaxLength"));
    CHECK_FALSE(config.contains("Rename", "DryRun"));
    CHECK_FALSE(config.find("Extraction", "not a key value line").has_value());
}

TEST_CASE("typed ini getters reject malformed values") {
    TempDir temp_dir;
    const auto path = temp_dir.path() / "config.ini";
    write_file(path,
               "[Rename]\n"
               "DryRun = Yes\n"
               "Verbose = off\n"
               "Broken = maybe\n"
               "Pages = 12abc\n"
               "Negative = -4\n");

    IniConfig config;
    REQUIRE(config.load(path));
    CHECK(config.get_bool("Rename", "DryRun") == std::optional<bool>(true));
    CHECK(config.get_bool("Rename", "Verbose") == std::optional<bool>(false));
    CHECK_FALSE(config.get_bool("Rename", "Broken").has_value());
    CHECK_FALSE(config.get_bool("Rename", "Missing").has_value());
    CHECK_FALSE(config.get_integer("Rename", "Pages").has_value());
    CHECK(config.get_integer("Rename", "Negative") == std::optional<long long>(-4));
}

TEST_CASE("ini values survive a save and reload") {
    TempDir temp_dir;
    const auto path = temp_dir.path() / "config.ini";

    IniConfig config;
    config.set_bool("Sanitize", "ReplaceSpaces", true);
    config.set_integer("Sanitize", "MaxLength", 80);
    config.set("Sanitize", "ConflictSuffixFormat", " copy {n}");
    config.set("Extraction", "RegexPattern", "\"quoted\"");
    config.set("Rename", "Temporary", "x");
    config.erase("Rename", "Temporary");
    REQUIRE(config.save(path));

    const std::string text = read_file(path);
    CHECK(text.find("ConflictSuffixFormat = \" copy {n}\"") != std::string::npos);
    CHECK(text.find("[Rename]") == std::string::npos);

    IniConfig reloaded;
    REQUIRE(reloaded.load(path));
    CHECK(reloaded.get_bool("Sanitize", "ReplaceSpaces") == std::optional<bool>(true));
    CHECK(reloaded.get_integer("Sanitize", "MaxLength") == std::optional<long long>(80));
    CHECK(reloaded.get_string("Sanitize", "ConflictSuffixFormat") == " copy {n}");
    CHECK(reloaded.get_string("Extraction", "RegexPattern") == "\"quoted\"");
    CHECK_FALSE(reloaded.contains("Rename", "Temporary"));
}

TEST_CASE("loading a missing ini file fails") {
    TempDir temp_dir;
    IniConfig config;
    CHECK_FALSE(config.load(temp_dir.path() / "absent.ini"));
}
