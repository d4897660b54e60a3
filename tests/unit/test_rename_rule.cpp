#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "ContentExtractorRegistry.hpp"
#include "RenameRule.hpp"
#include "TestHelpers.hpp"
#include "TextContentExtractor.hpp"

TEST_CASE("sequential rule numbers files from one with three digits") {
    const auto rule = RenameRule::sequential();
    CHECK(rule.candidate_for("/photos", "IMG_4411.JPG", 0, nullptr, {}) == std::optional<std::string>("file_001.JPG"));
    CHECK(rule.candidate_for("/photos", "IMG_4412.JPG", 9, nullptr, {}) == std::optional<std::string>("file_010.JPG"));
    CHECK(rule.candidate_for("/photos", "notes", 1, nullptr, {}) == std::optional<std::string>("file_002"));

    const auto custom = RenameRule::sequential("holiday_");
    CHECK(custom.candidate_for("/photos", "a.png", 999, nullptr, {}) == std::optional<std::string>("holiday_1000.png"));
}

TEST_CASE("add-text rule wraps the stem") {
    const auto rule = RenameRule::add_text("old_", "_v2");
    CHECK(rule.candidate_for("/docs", "plan.docx", 0, nullptr, {}) == std::optional<std::string>("old_plan_v2.docx"));
}

TEST_CASE("replace rule rewrites every occurrence in the stem") {
    const auto rule = RenameRule::replace("draft", "final");
    CHECK(rule.candidate_for("/docs", "draft-a-draft.draft", 0, nullptr, {}) ==
          std::optional<std::string>("final-a-final.draft"));

    const auto empty_find = RenameRule::replace("", "x");
    CHECK(empty_find.candidate_for("/docs", "keep.txt", 0, nullptr, {}) == std::optional<std::string>("keep.txt"));
}

TEST_CASE("folder-sequential rule uses the directory name") {
    const auto rule = RenameRule::folder_sequential();
    CHECK(rule.candidate_for("/home/me/Holidays", "a.jpg", 2, nullptr, {}) ==
          std::optional<std::string>("Holidays_003.jpg"));
    CHECK(rule.candidate_for("/home/me/Holidays/", "a.jpg", 0, nullptr, {}) ==
          std::optional<std::string>("Holidays_001.jpg"));
}

TEST_CASE("content rule appends the original extension to the extracted text") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "scan.txt", "Invoice #4521\n");
    write_file(temp_dir.path() / "empty.txt", "\n");

    std::vector<std::unique_ptr<IContentExtractor>> extractors;
    extractors.push_back(std::make_unique<TextContentExtractor>());
    const ContentExtractorRegistry registry(std::move(extractors));

    const auto rule = RenameRule::content();
    CHECK(rule.candidate_for(temp_dir.path(), "scan.txt", 0, &registry, {}) ==
          std::optional<std::string>("Invoice #4521.txt"));
    CHECK_FALSE(rule.candidate_for(temp_dir.path(), "empty.txt", 0, &registry, {}).has_value());
    CHECK_FALSE(rule.candidate_for(temp_dir.path(), "movie.mkv", 0, &registry, {}).has_value());
}

TEST_CASE("content rule requires extractors") {
    const auto rule = RenameRule::content();
    CHECK(rule.needs_extractors());
    REQUIRE_THROWS_AS(rule.candidate_for("/docs", "a.txt", 0, nullptr, {}), ErrorCodes::AppException);
}

TEST_CASE("rule kinds round-trip through their names") {
    for (auto kind : {RenameRuleKind::Sequential, RenameRuleKind::AddText, RenameRuleKind::Replace,
                      RenameRuleKind::FolderSequential, RenameRuleKind::Content}) {
        CHECK(rename_rule_kind_from_string(to_string(kind)) == kind);
    }
    CHECK_FALSE(rename_rule_kind_from_string("shuffle").has_value());
}
