#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "NameSanitizer.hpp"
#include "Utils.hpp"

#include <array>
#include <string>

using namespace NameSanitizer;

TEST_CASE("sanitize_filename replaces forbidden characters") {
    CHECK(sanitize_filename("my<file>:name?.txt") == "my_file__name_.txt");
    CHECK(sanitize_filename("a|b*c\"d\\e.txt") == "a_b_c_d_e.txt");
    CHECK(sanitize_filename("dir/name.txt") == "dir_name.txt");
    CHECK(sanitize_filename(std::string("tab\there\x01.txt")) == "tab_here_.txt");
}

TEST_CASE("sanitize_filename prefixes reserved device names") {
    CHECK(sanitize_filename("CON") == "_CON");
    CHECK(sanitize_filename("con.txt") == "_con.txt");
    CHECK(sanitize_filename("LPT9.log") == "_LPT9.log");
    CHECK(sanitize_filename("CONSOLE.txt") == "CONSOLE.txt");
    CHECK(sanitize_filename("COM10") == "COM10");
}

TEST_CASE("sanitize_filename prefixes every reserved device name") {
    const std::array<std::string, 22> reserved = {
        "CON", "PRN", "AUX", "NUL",
        "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
        "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"};
    for (const auto& name : reserved) {
        INFO(name);
        const std::string result = sanitize_filename(name + ".txt");
        CHECK(result == "_" + name + ".txt");
        CHECK_FALSE(is_reserved_name(result));
        CHECK(sanitize_filename(Utils::to_lower_copy(name) + ".txt").starts_with("_"));
    }
}

TEST_CASE("sanitize_filename catches device names exposed by stripping") {
    CHECK(sanitize_filename("CON.") == "_CON");
    CHECK(sanitize_filename("CON ") == "_CON");
    CHECK(sanitize_filename("nul..") == "_nul");
    CHECK(sanitize_filename("  CON.txt") == "_CON.txt");
    for (const std::string input : {"CON.", "CON ", "nul..", "  CON.txt"}) {
        CHECK_FALSE(is_reserved_name(sanitize_filename(input)));
    }
}

TEST_CASE("sanitize_filename replaces every control byte") {
    for (int byte = 0x00; byte < 0x20; ++byte) {
        INFO(byte);
        std::string input = "a";
        input += static_cast<char>(byte);
        input += "b.txt";
        CHECK(sanitize_filename(input) == "a_b.txt");
        CHECK(sanitize_filename(input, false) == "a_b.txt");
    }
    CHECK(sanitize_filename(std::string("a\x7F" "b.txt")) == "a_b.txt");
    CHECK(sanitize_filename(std::string("a\0b.txt", 7)) == "a_b.txt");
}

TEST_CASE("sanitize_filename trims dots and spaces and falls back to unnamed") {
    CHECK(sanitize_filename("  report.pdf. ") == "report.pdf");
    CHECK(sanitize_filename("...") == "unnamed");
    CHECK(sanitize_filename("") == "unnamed");
    CHECK(sanitize_filename("   ") == "unnamed");
}

TEST_CASE("sanitize_filename folds accents only when normalization is on") {
    CHECK(sanitize_filename("Café résumé.txt") == "Cafe resume.txt");
    CHECK(sanitize_filename("ﬁle.txt") == "file.txt");
    CHECK(sanitize_filename("Café.txt", false) == "Café.txt");
}

TEST_CASE("sanitize_filename replaces spaces on request") {
    CHECK(sanitize_filename("my holiday photo.jpg", true, true) == "my_holiday_photo.jpg");
    CHECK(sanitize_filename("my holiday photo.jpg", true, false) == "my holiday photo.jpg");
}

TEST_CASE("sanitize_filename keeps the extension when truncating") {
    const std::string long_name = std::string(300, 'a') + ".txt";
    const std::string result = sanitize_filename(long_name);
    CHECK(Utils::utf8_length(result) == 255);
    CHECK(result.ends_with(".txt"));

    CHECK(sanitize_filename("abcdefghij.txt", true, false, 8) == "abcd.txt");
}

TEST_CASE("sanitize_filename does not leave a trailing space after a cut") {
    const std::string result = sanitize_filename("abc defgh", true, false, 4);
    CHECK(result == "abc");
}

TEST_CASE("sanitize_filename counts code points, not bytes") {
    const std::string name = "日本語のファイル名.txt";
    CHECK(sanitize_filename(name, false, false, 100) == name);
    const std::string cut = sanitize_filename(name, false, false, 7);
    CHECK(cut == "日本語.txt");
    CHECK(Utils::utf8_length(cut) == 7);
}

TEST_CASE("sanitize_filename rejects a zero maximum length") {
    REQUIRE_THROWS_AS(sanitize_filename("a.txt", true, false, 0), ErrorCodes::AppException);
}

TEST_CASE("sanitize_filename is idempotent") {
    for (const std::string input : {"my<file>.txt", "CON.txt", "  CON.txt", "nul..",
                                    "Café résumé.PDF", "...", "a b c"}) {
        const std::string once = sanitize_filename(input);
        CHECK(sanitize_filename(once) == once);
    }
}

TEST_CASE("truncate_filename shortens the stem and keeps the extension") {
    CHECK(truncate_filename("document.pdf", 100) == "document.pdf");
    CHECK(truncate_filename("document.pdf", 7) == "doc.pdf");
    CHECK(truncate_filename("document.pdf", 7, false) == "documen");
}

TEST_CASE("truncate_filename cuts everything when the extension does not fit") {
    CHECK(truncate_filename("a.verylongextension", 5) == "a.ver");
}

TEST_CASE("truncate_filename is idempotent") {
    const std::string once = truncate_filename("some-very-long-name.tar.gz", 10);
    CHECK(once == "some-ve.gz");
    CHECK(truncate_filename(once, 10) == once);
}

TEST_CASE("add_prefix_suffix wraps the stem") {
    CHECK(add_prefix_suffix("photo.jpg", "2023_", "_final") == "2023_photo_final.jpg");
    CHECK(add_prefix_suffix("README", "old_", "") == "old_README");
    CHECK(add_prefix_suffix("archive.tar.gz", "", "_v2") == "archive.tar_v2.gz");
    CHECK(add_prefix_suffix("", "x", "y").empty());
}

TEST_CASE("normalize_filename_case applies the style to the stem only") {
    CHECK(normalize_filename_case("My Report.PDF", CaseStyle::Lower) == "my report.pdf");
    CHECK(normalize_filename_case("My Report.PDF", CaseStyle::Upper) == "MY REPORT.pdf");
    CHECK(normalize_filename_case("my annual report.TXT", CaseStyle::Title) == "My Annual Report.txt");
    CHECK(normalize_filename_case("mY aNNUAL rEPORT.txt", CaseStyle::Sentence) == "My annual report.txt");
}

TEST_CASE("title case starts a new word after non-letters") {
    CHECK(normalize_filename_case("hello_world-again 2nd.md", CaseStyle::Title) == "Hello_World-Again 2Nd.md");
}

TEST_CASE("reserved names are matched case-insensitively on the stem") {
    CHECK(is_reserved_name("nul"));
    CHECK(is_reserved_name("Aux.txt"));
    CHECK_FALSE(is_reserved_name("auxiliary.txt"));
}
