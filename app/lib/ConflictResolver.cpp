#include "ConflictResolver.hpp"

#include "AppException.hpp"
#include "Logger.hpp"
#include "NameSanitizer.hpp"
#include "Utils.hpp"

#include <spdlog/fmt/chrono.h>
#include <spdlog/fmt/fmt.h>

#include <ctime>
#include <string_view>
#include <utility>

namespace {
constexpr std::string_view kNamedSlot = "{n}";
constexpr std::string_view kPositionalSlot = "{}";

std::size_t find_slot(const std::string& format, std::size_t& slot_length)
{
    auto pos = format.find(kNamedSlot);
    if (pos != std::string::npos) {
        slot_length = kNamedSlot.size();
        return pos;
    }
    pos = format.find(kPositionalSlot);
    slot_length = kPositionalSlot.size();
    return pos;
}
}

ConflictResolver::ConflictResolver(std::string suffix_format,
                                   int max_attempts,
                                   std::size_t max_length,
                                   Clock clock)
    : suffix_format_(std::move(suffix_format)),
      max_attempts_(max_attempts),
      max_length_(max_length),
      clock_(std::move(clock))
{
    if (!is_valid_suffix_format(suffix_format_)) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            "Conflict suffix format needs a {n} slot",
                            "suffix_format=" + suffix_format_);
    }
    if (max_attempts_ < 1) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_VALUE_OUT_OF_RANGE,
                            "Conflict resolution needs at least one attempt",
                            "max_attempts=" + std::to_string(max_attempts_));
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}


bool ConflictResolver::is_valid_suffix_format(const std::string& suffix_format)
{
    std::size_t slot_length = 0;
    return find_slot(suffix_format, slot_length) != std::string::npos;
}


std::string ConflictResolver::format_suffix(int number) const
{
    std::size_t slot_length = 0;
    const auto pos = find_slot(suffix_format_, slot_length);
    std::string suffix = suffix_format_;
    suffix.replace(pos, slot_length, std::to_string(number));
    return suffix;
}


std::string ConflictResolver::resolve(const std::string& candidate, const INameSet& existing) const
{
    if (!existing.contains(candidate)) {
        return candidate;
    }

    const auto parts = Utils::split_name(candidate);
    for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
        std::string numbered = compose(parts.stem, format_suffix(attempt), parts.extension);
        if (!existing.contains(numbered)) {
            return numbered;
        }
    }

    std::string fallback = timestamp_fallback(parts.stem, parts.extension);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->warn("No free numbered name for '{}' after {} attempts; using '{}'",
                     candidate, max_attempts_, fallback);
    }
    return fallback;
}


std::string ConflictResolver::compose(const std::string& stem,
                                      const std::string& insert,
                                      const std::string& extension) const
{
    std::string composed = stem + insert + extension;
    if (max_length_ == 0 || Utils::utf8_length(composed) <= max_length_) {
        return composed;
    }

    const std::size_t reserved = Utils::utf8_length(insert) + Utils::utf8_length(extension);
    if (reserved < max_length_) {
        return Utils::utf8_prefix(stem, max_length_ - reserved) + insert + extension;
    }
    return NameSanitizer::truncate_filename(composed, max_length_, false);
}


std::string ConflictResolver::timestamp_fallback(const std::string& stem,
                                                 const std::string& extension) const
{
    const std::time_t now = std::chrono::system_clock::to_time_t(clock_());
    const std::string timestamp = fmt::format("{:%Y%m%d_%H%M%S}", fmt::localtime(now));
    return compose(stem, "_" + timestamp, extension);
}


std::string resolve_filename_conflicts(const std::string& candidate,
                                       const INameSet& existing,
                                       const std::string& suffix_format,
                                       int max_attempts)
{
    return ConflictResolver(suffix_format, max_attempts).resolve(candidate, existing);
}
