#ifndef RENAME_PLANNER_HPP
#define RENAME_PLANNER_HPP

#include "RenameRule.hpp"
#include "Types.hpp"

#include <filesystem>
#include <string>
#include <vector>

class ContentExtractorRegistry;

enum class PlanStatus {
    Ready,       ///< Proposed name differs from the current one.
    Unchanged,   ///< Rule and sanitization kept the current name.
    NoCandidate  ///< The rule produced nothing (e.g. no extractable content).
};

std::string to_string(PlanStatus status);

struct RenamePlanEntry {
    std::string source;
    std::string proposed;
    PlanStatus status{PlanStatus::NoCandidate};
};

/**
 * @brief Turns a selection of files into sanitized, collision-free target names.
 */
class RenamePlanner {
public:
    /**
     * @param registry Extractors for the content rule; must outlive the planner.
     */
    explicit RenamePlanner(const ContentExtractorRegistry* registry = nullptr);

    /**
     * @brief Plans @p selected (names inside @p directory) in the given order.
     *
     * Proposed names never collide with each other nor with other files of the
     * directory; a file's own current name does not count as taken.
     * @p prefix and @p suffix are injected by the sanitizer around each stem.
     *
     * @throws ErrorCodes::AppException for an invalid @p config, or when the
     * content rule is used without a registry.
     */
    std::vector<RenamePlanEntry> plan(const std::filesystem::path& directory,
                                      const std::vector<std::string>& selected,
                                      const RenameRule& rule,
                                      const SanitizeConfig& config,
                                      const ExtractionOptions& options,
                                      const std::string& prefix = "",
                                      const std::string& suffix = "") const;

private:
    const ContentExtractorRegistry* registry_;
};

#endif
