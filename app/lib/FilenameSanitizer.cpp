#include "FilenameSanitizer.hpp"

#include "AppException.hpp"
#include "Logger.hpp"
#include "NameSanitizer.hpp"

namespace {
SanitizeConfig validated(SanitizeConfig config)
{
    FilenameSanitizer::validate(config);
    return config;
}
}

FilenameSanitizer::FilenameSanitizer(SanitizeConfig config, ConflictResolver::Clock clock)
    : config_(validated(std::move(config))),
      resolver_(config_.conflict_suffix_format,
                ConflictResolver::kDefaultMaxAttempts,
                config_.max_length,
                std::move(clock))
{}


void FilenameSanitizer::validate(const SanitizeConfig& config)
{
    if (config.max_length == 0) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            "Maximum filename length must be at least 1",
                            "max_length=0");
    }
    if (!ConflictResolver::is_valid_suffix_format(config.conflict_suffix_format)) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            "Conflict suffix format needs a {n} slot",
                            "conflict_suffix_format=" + config.conflict_suffix_format);
    }
}


std::string FilenameSanitizer::sanitize(const std::string& name,
                                        const std::optional<std::filesystem::path>& target_dir,
                                        const std::string& prefix,
                                        const std::string& suffix) const
{
    if (!target_dir) {
        return sanitize_against(name, nullptr, prefix, suffix);
    }
    const DirectoryNameSet existing(*target_dir);
    return sanitize_against(name, &existing, prefix, suffix);
}


std::string FilenameSanitizer::sanitize_against(const std::string& name,
                                                const INameSet* existing,
                                                const std::string& prefix,
                                                const std::string& suffix) const
{
    std::string result = NameSanitizer::sanitize_filename(
        name, config_.normalize_unicode, config_.replace_spaces, config_.max_length);

    if (!prefix.empty() || !suffix.empty()) {
        // Injected text is user input too; sanitizing again also re-truncates
        result = NameSanitizer::add_prefix_suffix(result, prefix, suffix);
        result = NameSanitizer::sanitize_filename(
            result, config_.normalize_unicode, config_.replace_spaces, config_.max_length);
    }

    if (config_.case_style) {
        result = NameSanitizer::normalize_filename_case(result, *config_.case_style);
        // Full case mappings can lengthen a name ("ß" -> "SS")
        result = NameSanitizer::sanitize_filename(result, false, false, config_.max_length);
    }

    if (config_.conflict_resolution && existing) {
        result = resolver_.resolve(result, *existing);
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->trace("Sanitized '{}' to '{}'", name, result);
    }
    return result;
}


std::string FilenameSanitizer::claim_in_batch(const std::string& name,
                                              InMemoryNameSet& used,
                                              const INameSet* existing) const
{
    std::string claimed = name;
    if (used.contains(claimed)) {
        if (existing) {
            const CombinedNameSet taken(used, *existing);
            claimed = resolver_.resolve(claimed, taken);
        } else {
            claimed = resolver_.resolve(claimed, used);
        }
    }
    used.insert(claimed);
    return claimed;
}


std::vector<std::pair<std::string, std::string>>
FilenameSanitizer::batch_sanitize(const std::vector<std::string>& names,
                                  const std::optional<std::filesystem::path>& target_dir,
                                  const std::string& prefix,
                                  const std::string& suffix) const
{
    std::optional<DirectoryNameSet> directory;
    if (target_dir && config_.conflict_resolution) {
        directory.emplace(*target_dir);
    }
    const INameSet* existing = directory ? &*directory : nullptr;

    std::vector<std::pair<std::string, std::string>> results;
    results.reserve(names.size());
    InMemoryNameSet used;

    for (const auto& original : names) {
        std::string sanitized = sanitize(original, target_dir, prefix, suffix);
        results.emplace_back(original, claim_in_batch(sanitized, used, existing));
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Batch sanitized {} name(s)", results.size());
    }
    return results;
}
