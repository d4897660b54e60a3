#ifndef FILENAME_SANITIZER_HPP
#define FILENAME_SANITIZER_HPP

#include "ConflictResolver.hpp"
#include "NameSet.hpp"
#include "Types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Configurable pipeline producing final, collision-free filenames.
 *
 * sanitize() runs character and length sanitization, prefix/suffix injection,
 * case normalization and, when enabled, conflict resolution against the
 * target directory as it is at the moment of the call.
 */
class FilenameSanitizer {
public:
    /**
     * @throws ErrorCodes::AppException when @p config is invalid
     * (max_length of zero, suffix format without a slot).
     */
    explicit FilenameSanitizer(SanitizeConfig config = {},
                               ConflictResolver::Clock clock = {});

    std::string sanitize(const std::string& name,
                         const std::optional<std::filesystem::path>& target_dir = std::nullopt,
                         const std::string& prefix = "",
                         const std::string& suffix = "") const;

    /**
     * @brief Same pipeline with an explicit set of taken names (nullptr: none).
     */
    std::string sanitize_against(const std::string& name,
                                 const INameSet* existing,
                                 const std::string& prefix = "",
                                 const std::string& suffix = "") const;

    /**
     * @brief Sanitizes @p names in order so that no two results are equal.
     *
     * Each name goes through sanitize(); a result already produced earlier in
     * the batch is renumbered with the conflict suffix format. The directory is
     * consulted again during renumbering so that a renumbered name does not
     * land on an existing file.
     *
     * @return (original, final) pairs in input order.
     */
    std::vector<std::pair<std::string, std::string>>
    batch_sanitize(const std::vector<std::string>& names,
                   const std::optional<std::filesystem::path>& target_dir = std::nullopt,
                   const std::string& prefix = "",
                   const std::string& suffix = "") const;

    /**
     * @brief Records @p name as used in a batch, renumbering it first when
     * @p used or @p existing already hold it.
     */
    std::string claim_in_batch(const std::string& name,
                               InMemoryNameSet& used,
                               const INameSet* existing = nullptr) const;

    const SanitizeConfig& config() const { return config_; }

    static void validate(const SanitizeConfig& config);

private:
    SanitizeConfig config_;
    ConflictResolver resolver_;
};

#endif
