#include <catch2/catch_test_macros.hpp>
#include "ContentExtractorRegistry.hpp"
#include "RenamePlanner.hpp"
#include "TestHelpers.hpp"
#include "TextContentExtractor.hpp"


TEST_CASE("planner numbers selected files and sanitizes the result") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "b.jpg");
    write_file(temp_dir.path() / "a.jpg");

    const RenamePlanner planner;
    const auto plan = planner.plan(temp_dir.path(), {"a.jpg", "b.jpg"},
                                   RenameRule::sequential("trip?"), SanitizeConfig{}, ExtractionOptions{});

    REQUIRE(plan.size() == 2);
    CHECK(plan[0].source == "a.jpg");
    CHECK(plan[0].proposed == "trip_001.jpg");
    CHECK(plan[0].status == PlanStatus::Ready);
    CHECK(plan[1].proposed == "trip_002.jpg");
}

TEST_CASE("a file keeping its own name is unchanged, not renumbered") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "file_001.txt");

    const RenamePlanner planner;
    const auto plan = planner.plan(temp_dir.path(), {"file_001.txt"},
                                   RenameRule::sequential(), SanitizeConfig{}, ExtractionOptions{});

    REQUIRE(plan.size() == 1);
    CHECK(plan[0].proposed == "file_001.txt");
    CHECK(plan[0].status == PlanStatus::Unchanged);
}

TEST_CASE("planner avoids names held by other files in the directory") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "draft.txt");
    write_file(temp_dir.path() / "final.txt");

    const RenamePlanner planner;
    const auto plan = planner.plan(temp_dir.path(), {"draft.txt"},
                                   RenameRule::replace("draft", "final"), SanitizeConfig{}, ExtractionOptions{});

    REQUIRE(plan.size() == 1);
    CHECK(plan[0].proposed == "final(1).txt");
    CHECK(plan[0].status == PlanStatus::Ready);
}

TEST_CASE("planner keeps proposals unique within the selection") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "a:1.txt");
    write_file(temp_dir.path() / "a?1.txt");

    const RenamePlanner planner;
    const auto plan = planner.plan(temp_dir.path(), {"a:1.txt", "a?1.txt"},
                                   RenameRule::add_text("", ""), SanitizeConfig{}, ExtractionOptions{});

    REQUIRE(plan.size() == 2);
    CHECK(plan[0].proposed == "a_1.txt");
    CHECK(plan[1].proposed == "a_1(1).txt");
}

TEST_CASE("files without content get no candidate") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "scan.txt", "Invoice #4521\n");
    write_file(temp_dir.path() / "blank.txt", "   \n");

    std::vector<std::unique_ptr<IContentExtractor>> extractors;
    extractors.push_back(std::make_unique<TextContentExtractor>());
    const ContentExtractorRegistry registry(std::move(extractors));

    const RenamePlanner planner(&registry);
    const auto plan = planner.plan(temp_dir.path(), {"blank.txt", "scan.txt"},
                                   RenameRule::content(), SanitizeConfig{}, ExtractionOptions{});

    REQUIRE(plan.size() == 2);
    CHECK(plan[0].status == PlanStatus::NoCandidate);
    CHECK(plan[0].proposed == "blank.txt");
    CHECK(plan[1].status == PlanStatus::Ready);
    CHECK(plan[1].proposed == "Invoice #4521.txt");
}

TEST_CASE("planner applies prefix, suffix and case options") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "IMG 1.JPG");

    SanitizeConfig config;
    config.case_style = CaseStyle::Lower;
    config.replace_spaces = true;

    const RenamePlanner planner;
    const auto plan = planner.plan(temp_dir.path(), {"IMG 1.JPG"},
                                   RenameRule::replace("IMG", "Photo"), config, ExtractionOptions{},
                                   "Rome ", "");

    REQUIRE(plan.size() == 1);
    CHECK(plan[0].proposed == "rome_photo_1.jpg");
}

TEST_CASE("planner without conflict resolution still separates the batch") {
    TempDir temp_dir;
    write_file(temp_dir.path() / "a:1.txt");
    write_file(temp_dir.path() / "a?1.txt");
    write_file(temp_dir.path() / "a_1.txt");

    SanitizeConfig config;
    config.conflict_resolution = false;

    const RenamePlanner planner;
    const auto plan = planner.plan(temp_dir.path(), {"a:1.txt", "a?1.txt"},
                                   RenameRule::add_text("", ""), config, ExtractionOptions{});

    REQUIRE(plan.size() == 2);
    CHECK(plan[0].proposed == "a_1.txt");
    CHECK(plan[1].proposed == "a_1(1).txt");
}
