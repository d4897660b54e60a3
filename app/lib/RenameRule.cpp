#include "RenameRule.hpp"

#include "AppException.hpp"
#include "ContentExtractorRegistry.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <utility>

namespace {
std::string replace_all(std::string value, const std::string& find, const std::string& replacement)
{
    std::size_t pos = 0;
    while ((pos = value.find(find, pos)) != std::string::npos) {
        value.replace(pos, find.size(), replacement);
        pos += replacement.size();
    }
    return value;
}

std::string folder_name_of(const std::filesystem::path& directory)
{
    std::filesystem::path normalized = directory.lexically_normal();
    if (!normalized.has_filename()) {
        normalized = normalized.parent_path();
    }
    if (normalized.filename() == "." || normalized.empty()) {
        std::error_code ec;
        const auto absolute = std::filesystem::absolute(directory, ec);
        if (!ec) {
            normalized = absolute.lexically_normal();
            if (!normalized.has_filename()) {
                normalized = normalized.parent_path();
            }
        }
    }
    return Utils::path_to_utf8(normalized.filename());
}
}

std::string to_string(RenameRuleKind kind)
{
    switch (kind) {
        case RenameRuleKind::Sequential: return "sequential";
        case RenameRuleKind::AddText: return "add-text";
        case RenameRuleKind::Replace: return "replace";
        case RenameRuleKind::FolderSequential: return "folder-sequential";
        case RenameRuleKind::Content: return "content";
        default: return "sequential";
    }
}


std::optional<RenameRuleKind> rename_rule_kind_from_string(const std::string& value)
{
    if (value == "sequential") return RenameRuleKind::Sequential;
    if (value == "add-text") return RenameRuleKind::AddText;
    if (value == "replace") return RenameRuleKind::Replace;
    if (value == "folder-sequential") return RenameRuleKind::FolderSequential;
    if (value == "content") return RenameRuleKind::Content;
    return std::nullopt;
}


RenameRule RenameRule::sequential(std::string base_name)
{
    RenameRule rule(RenameRuleKind::Sequential);
    rule.base_name_ = std::move(base_name);
    return rule;
}


RenameRule RenameRule::add_text(std::string prefix, std::string suffix)
{
    RenameRule rule(RenameRuleKind::AddText);
    rule.prefix_ = std::move(prefix);
    rule.suffix_ = std::move(suffix);
    return rule;
}


RenameRule RenameRule::replace(std::string find, std::string replacement)
{
    RenameRule rule(RenameRuleKind::Replace);
    rule.find_ = std::move(find);
    rule.replacement_ = std::move(replacement);
    return rule;
}


RenameRule RenameRule::folder_sequential()
{
    return RenameRule(RenameRuleKind::FolderSequential);
}


RenameRule RenameRule::content()
{
    return RenameRule(RenameRuleKind::Content);
}


std::string RenameRule::sequence_number(std::size_t index)
{
    return fmt::format("{:0{}d}", index + 1, kSequenceWidth);
}


std::optional<std::string> RenameRule::candidate_for(const std::filesystem::path& directory,
                                                     const std::string& file_name,
                                                     std::size_t index,
                                                     const ContentExtractorRegistry* registry,
                                                     const ExtractionOptions& options) const
{
    const Utils::NameParts parts = Utils::split_name(file_name);

    switch (kind_) {
        case RenameRuleKind::Sequential:
            return base_name_ + sequence_number(index) + parts.extension;
        case RenameRuleKind::AddText:
            return prefix_ + parts.stem + suffix_ + parts.extension;
        case RenameRuleKind::Replace:
            if (find_.empty()) {
                return file_name;
            }
            return replace_all(parts.stem, find_, replacement_) + parts.extension;
        case RenameRuleKind::FolderSequential:
            return folder_name_of(directory) + "_" + sequence_number(index) + parts.extension;
        case RenameRuleKind::Content: {
            if (!registry) {
                THROW_APP_ERROR_MSG(ErrorCodes::Code::RENAME_INVALID_RULE,
                                    "Content rule needs content extractors",
                                    file_name);
            }
            auto content = registry->extract_content(directory / Utils::utf8_to_path(file_name), options);
            if (!content) {
                return std::nullopt;
            }
            return *content + parts.extension;
        }
    }
    return std::nullopt;
}
