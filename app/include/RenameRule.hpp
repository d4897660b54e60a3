#ifndef RENAME_RULE_HPP
#define RENAME_RULE_HPP

#include "Types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

class ContentExtractorRegistry;

enum class RenameRuleKind {
    Sequential,
    AddText,
    Replace,
    FolderSequential,
    Content
};

std::string to_string(RenameRuleKind kind);
std::optional<RenameRuleKind> rename_rule_kind_from_string(const std::string& value);

/**
 * @brief Produces the unsanitized candidate name of one selected file.
 */
class RenameRule {
public:
    static constexpr int kSequenceWidth = 3;
    static constexpr const char* kDefaultBaseName = "file_";

    static RenameRule sequential(std::string base_name = kDefaultBaseName);
    static RenameRule add_text(std::string prefix, std::string suffix);
    static RenameRule replace(std::string find, std::string replacement);
    static RenameRule folder_sequential();
    static RenameRule content();

    RenameRuleKind kind() const { return kind_; }
    bool needs_extractors() const { return kind_ == RenameRuleKind::Content; }

    /**
     * @brief Candidate for @p file_name, the @p index-th (0-based) selected file
     * of @p directory.
     *
     * @param registry Required by the content rule; ignored otherwise.
     * @return std::nullopt when the rule yields nothing for this file.
     * @throws ErrorCodes::AppException for a content rule without a registry.
     */
    std::optional<std::string> candidate_for(const std::filesystem::path& directory,
                                             const std::string& file_name,
                                             std::size_t index,
                                             const ContentExtractorRegistry* registry,
                                             const ExtractionOptions& options) const;

    static std::string sequence_number(std::size_t index);

private:
    explicit RenameRule(RenameRuleKind kind) : kind_(kind) {}

    RenameRuleKind kind_;
    std::string base_name_;
    std::string prefix_;
    std::string suffix_;
    std::string find_;
    std::string replacement_;
};

#endif
