#ifndef RENAME_EXECUTOR_HPP
#define RENAME_EXECUTOR_HPP

#include "RenamePlanner.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

enum class RenameOutcome {
    Renamed,
    Skipped,
    NoCandidate,
    SourceMissing,
    DestinationExists,
    Failed
};

std::string to_string(RenameOutcome outcome);

struct RenameResult {
    std::string source;
    std::string destination;
    RenameOutcome outcome{RenameOutcome::Skipped};
    std::string message;
};

struct RenameReport {
    bool dry_run{false};
    std::size_t renamed{0};
    std::vector<RenameResult> results;

    std::vector<std::string> errors() const;
    bool has_errors() const;
};

/**
 * @brief Applies a rename plan inside one directory.
 *
 * Entries are applied in order and independently: a failure is recorded and
 * the remaining entries are still processed. An existing destination is never
 * overwritten.
 */
class RenameExecutor {
public:
    RenameReport apply(const std::filesystem::path& directory,
                       const std::vector<RenamePlanEntry>& plan,
                       bool dry_run = false) const;

private:
    RenameResult apply_entry(const std::filesystem::path& directory,
                             const RenamePlanEntry& entry,
                             bool dry_run) const;
};

#endif
