#ifndef CONTENT_EXTRACTOR_HPP
#define CONTENT_EXTRACTOR_HPP

#include "Types.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>

/**
 * @brief Derives a candidate name fragment from one family of file formats.
 *
 * Implementations are stateless. extract() never throws: unreadable files,
 * decode errors and files without usable content all yield std::nullopt,
 * which callers treat as a routine outcome.
 */
class IContentExtractor {
public:
    virtual ~IContentExtractor() = default;

    /**
     * @brief Short identifier used in logs ("text", "pdf", "image-metadata").
     */
    virtual std::string name() const = 0;

    /**
     * @brief Lower-case extensions including the dot, e.g. ".txt".
     */
    virtual const std::set<std::string>& extensions() const = 0;

    /**
     * @brief True when the decoding capability this extractor needs is present.
     */
    virtual bool is_available() const { return true; }

    /**
     * @brief Extension match (case-insensitive) on an available extractor.
     */
    virtual bool can_handle(const std::filesystem::path& path) const;

    virtual std::optional<std::string> extract(const std::filesystem::path& path,
                                               const ExtractionOptions& options) const = 0;
};

namespace ContentSelection {

/**
 * @brief Picks the candidate out of decoded text.
 *
 * With a pattern, returns the first capture group of the first match (the whole
 * match when the pattern has no group); ^ and $ match at line breaks. An
 * invalid pattern, no match or an empty capture yields std::nullopt. Without a
 * pattern, returns the first line that is not blank, trimmed.
 */
std::optional<std::string> select(const std::string& text,
                                  const std::optional<std::string>& regex_pattern);

std::optional<std::string> first_non_empty_line(const std::string& text);

/**
 * @brief True when the pattern compiles; otherwise the reason goes to error.
 */
bool is_valid_pattern(const std::string& regex_pattern, std::string* error = nullptr);

} // namespace ContentSelection

#endif
