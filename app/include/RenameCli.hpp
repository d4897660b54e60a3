#ifndef RENAME_CLI_HPP
#define RENAME_CLI_HPP

#include "RenameExecutor.hpp"
#include "RenamePlanner.hpp"
#include "RenameRule.hpp"
#include "Types.hpp"

#include <QStringList>

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

class ContentExtractorRegistry;

struct CliOptions {
    std::filesystem::path directory;
    std::vector<std::string> files; ///< Explicit selection; empty selects every file.
    RenameRuleKind rule_kind{RenameRuleKind::Sequential};
    std::string base_name{RenameRule::kDefaultBaseName};
    std::string prefix;
    std::string suffix;
    std::string find;
    std::string replacement;
    SanitizeConfig sanitize;
    ExtractionOptions extraction;
    bool dry_run{false};
    bool list_formats{false};
    bool save_defaults{false};
    bool show_help{false};
    std::string help_text;

    RenameRule rule() const;
};

/**
 * @brief Command-line front-end: parses options, prints the plan and applies it.
 */
class RenameCli {
public:
    static constexpr int kExitSuccess = 0;
    static constexpr int kExitFailures = 1;
    static constexpr int kExitUsage = 2;

    RenameCli(std::ostream& out, std::ostream& err);

    /**
     * @brief Parses @p arguments (program name first) on top of the given defaults.
     *
     * Without a directory argument a rename run falls back to @p last_folder.
     * @throws ErrorCodes::AppException (validation codes) on invalid usage.
     */
    static CliOptions parse(const QStringList& arguments,
                            const SanitizeConfig& sanitize_defaults = {},
                            const ExtractionOptions& extraction_defaults = {},
                            bool dry_run_default = false,
                            const std::string& last_folder = {});

    int run(const CliOptions& options, const ContentExtractorRegistry& registry) const;
    int list_formats(const ContentExtractorRegistry& registry) const;

    static std::string format_plan_line(const RenamePlanEntry& entry);
    static std::string format_summary(const RenameReport& report);

private:
    std::vector<std::string> select_files(const CliOptions& options) const;

    std::ostream& out_;
    std::ostream& err_;
};

#endif
