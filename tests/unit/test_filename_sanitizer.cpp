#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "FilenameSanitizer.hpp"
#include "TestHelpers.hpp"
#include "Utils.hpp"

#include <set>

TEST_CASE("sanitize without a target directory only cleans the name") {
    const FilenameSanitizer sanitizer;
    CHECK(sanitizer.sanitize("Invoice #4521?.pdf") == "Invoice #4521_.pdf");
}

TEST_CASE("an already valid and unique name is returned unchanged") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "other.txt");

    const FilenameSanitizer sanitizer;
    CHECK(sanitizer.sanitize("notes.txt", temp_dir.path()) == "notes.txt");
}

TEST_CASE("sanitize resolves conflicts against the target directory") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "a.txt");

    const FilenameSanitizer sanitizer;
    CHECK(sanitizer.sanitize("a.txt", temp_dir.path()) == "a(1).txt");

    write_file(temp_dir.path() / "a(1).txt");
    CHECK(sanitizer.sanitize("a.txt", temp_dir.path()) == "a(2).txt");
}

TEST_CASE("conflict resolution can be turned off") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "a.txt");

    SanitizeConfig config;
    config.conflict_resolution = false;
    const FilenameSanitizer sanitizer(config);
    CHECK(sanitizer.sanitize("a.txt", temp_dir.path()) == "a.txt");
}

TEST_CASE("a missing target directory means no conflicts") {
    const FilenameSanitizer sanitizer;
    const auto missing = std::filesystem::temp_directory_path() / make_unique_token("missing-");
    CHECK(sanitizer.sanitize("a.txt", missing) == "a.txt");
}

TEST_CASE("prefix and suffix are injected and re-truncated") {
    SanitizeConfig config;
    config.max_length = 12;
    const FilenameSanitizer sanitizer(config);

    CHECK(sanitizer.sanitize("photo.jpg", std::nullopt, "x_", "_y") == "x_photo_.jpg");
    CHECK(Utils::utf8_length(sanitizer.sanitize("photo.jpg", std::nullopt, "2023-05-17_", "")) <= 12);
}

TEST_CASE("injected text is sanitized too") {
    const FilenameSanitizer sanitizer;
    CHECK(sanitizer.sanitize("photo.jpg", std::nullopt, "a/b:", "") == "a_b_photo.jpg");
}

TEST_CASE("case normalization runs after injection") {
    SanitizeConfig config;
    config.case_style = CaseStyle::Lower;
    const FilenameSanitizer sanitizer(config);
    CHECK(sanitizer.sanitize("My Photo.JPG", std::nullopt, "Trip ", "") == "trip my photo.jpg");
}

TEST_CASE("space replacement and unicode options reach the sanitizer") {
    SanitizeConfig config;
    config.replace_spaces = true;
    config.normalize_unicode = false;
    const FilenameSanitizer sanitizer(config);
    CHECK(sanitizer.sanitize("Café menu.txt") == "Café_menu.txt");
}

TEST_CASE("empty input still goes through conflict resolution") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "unnamed");

    const FilenameSanitizer sanitizer;
    CHECK(sanitizer.sanitize("", temp_dir.path()) == "unnamed(1)");
}

TEST_CASE("invalid configurations are rejected") {
    SanitizeConfig zero_length;
    zero_length.max_length = 0;
    REQUIRE_THROWS_AS(FilenameSanitizer(zero_length), ErrorCodes::AppException);

    SanitizeConfig bad_format;
    bad_format.conflict_suffix_format = "-copy";
    REQUIRE_THROWS_AS(FilenameSanitizer(bad_format), ErrorCodes::AppException);
}

TEST_CASE("batch_sanitize gives duplicate inputs distinct names") {
    const FilenameSanitizer sanitizer;
    const auto results = sanitizer.batch_sanitize({"report", "report"});

    REQUIRE(results.size() == 2);
    CHECK(results[0] == std::make_pair(std::string("report"), std::string("report")));
    CHECK(results[1] == std::make_pair(std::string("report"), std::string("report(1)")));
}

TEST_CASE("batch_sanitize catches names that only collide after sanitization") {
    const FilenameSanitizer sanitizer;
    const auto results = sanitizer.batch_sanitize({"a?.txt", "a*.txt", "a_.txt"});

    REQUIRE(results.size() == 3);
    std::set<std::string> finals;
    for (const auto& entry : results) {
        finals.insert(entry.second);
    }
    CHECK(finals.size() == 3);
    CHECK(results[0].second == "a_.txt");
    CHECK(results[1].second == "a_(1).txt");
    CHECK(results[2].second == "a_(2).txt");
}

TEST_CASE("batch renumbering avoids names that exist in the directory") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "report(1).pdf");

    const FilenameSanitizer sanitizer;
    const auto results = sanitizer.batch_sanitize({"report.pdf", "report.pdf"}, temp_dir.path());

    REQUIRE(results.size() == 2);
    CHECK(results[0].second == "report.pdf");
    CHECK(results[1].second == "report(2).pdf");
}

TEST_CASE("batch_sanitize keeps input order and originals") {
    const FilenameSanitizer sanitizer;
    const auto results = sanitizer.batch_sanitize({"b.txt", "a.txt", "c:d.txt"});

    REQUIRE(results.size() == 3);
    CHECK(results[0].first == "b.txt");
    CHECK(results[1].first == "a.txt");
    CHECK(results[2].first == "c:d.txt");
    CHECK(results[2].second == "c_d.txt");
}

TEST_CASE("sanitize never returns a bare device name") {
    const FilenameSanitizer sanitizer;
    CHECK(sanitizer.sanitize("CON.") == "_CON");
    CHECK(sanitizer.sanitize("nul..") == "_nul");
    CHECK(sanitizer.sanitize("  CON.txt") == "_CON.txt");
}
