#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "ConflictResolver.hpp"
#include "NameSet.hpp"
#include "TestHelpers.hpp"
#include "Utils.hpp"

#include <chrono>
#include <ctime>

TEST_CASE("free names are returned unchanged") {
    const InMemoryNameSet existing{"b.txt"};
    CHECK(resolve_filename_conflicts("a.txt", existing) == "a.txt");
}

TEST_CASE("conflicting names get the first free number") {
    InMemoryNameSet existing{"a.txt"};
    CHECK(resolve_filename_conflicts("a.txt", existing) == "a(1).txt");

    existing.insert("a(1).txt");
    CHECK(resolve_filename_conflicts("a.txt", existing) == "a(2).txt");
}

TEST_CASE("numbering skips taken numbers") {
    const InMemoryNameSet existing{"a.txt", "a(1).txt", "a(3).txt"};
    CHECK(resolve_filename_conflicts("a.txt", existing) == "a(2).txt");
}

TEST_CASE("custom suffix formats are honoured") {
    const InMemoryNameSet existing{"report.pdf"};
    CHECK(resolve_filename_conflicts("report.pdf", existing, "_{n}") == "report_1.pdf");
    CHECK(resolve_filename_conflicts("report.pdf", existing, " copy {}") == "report copy 1.pdf");
}

TEST_CASE("names without extension are numbered at the end") {
    const InMemoryNameSet existing{"Makefile", ".bashrc"};
    CHECK(resolve_filename_conflicts("Makefile", existing) == "Makefile(1)");
    CHECK(resolve_filename_conflicts(".bashrc", existing) == ".bashrc(1)");
}

TEST_CASE("a suffix format without a slot is rejected") {
    REQUIRE_THROWS_AS(ConflictResolver("copy"), ErrorCodes::AppException);
    CHECK_FALSE(ConflictResolver::is_valid_suffix_format("(n)"));
    CHECK(ConflictResolver::is_valid_suffix_format("-{n}"));
}

TEST_CASE("max_attempts must be positive") {
    REQUIRE_THROWS_AS(ConflictResolver("({n})", 0), ErrorCodes::AppException);
}

TEST_CASE("exhausted attempts fall back to a timestamp") {
    std::tm fixed{};
    fixed.tm_year = 2024 - 1900;
    fixed.tm_mon = 0;
    fixed.tm_mday = 2;
    fixed.tm_hour = 3;
    fixed.tm_min = 4;
    fixed.tm_sec = 5;
    fixed.tm_isdst = -1;
    const auto when = std::chrono::system_clock::from_time_t(std::mktime(&fixed));

    const InMemoryNameSet existing{"a.txt", "a(1).txt", "a(2).txt"};
    const ConflictResolver resolver("({n})", 2, 0, [when] { return when; });
    CHECK(resolver.resolve("a.txt", existing) == "a_20240102_030405.txt");
}

TEST_CASE("numbered names respect the maximum length") {
    const InMemoryNameSet existing{"abcdefgh.txt"};
    const ConflictResolver resolver("({n})", 10, 12);
    const std::string resolved = resolver.resolve("abcdefgh.txt", existing);
    CHECK(resolved == "abcde(1).txt");
    CHECK(Utils::utf8_length(resolved) == 12);
}

TEST_CASE("directory name sets see files created after construction") {
    TempDir temp_dir;
    const DirectoryNameSet names(temp_dir.path());
    CHECK_FALSE(names.contains("late.txt"));

    write_file(temp_dir.path() / "late.txt");
    CHECK(names.contains("late.txt"));
    CHECK(resolve_filename_conflicts("late.txt", names) == "late(1).txt");
}

TEST_CASE("a missing directory contains nothing") {
    const DirectoryNameSet names(std::filesystem::path("/nonexistent") / make_unique_token("dir-"));
    CHECK_FALSE(names.directory_exists());
    CHECK_FALSE(names.contains("a.txt"));
}
