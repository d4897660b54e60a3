#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstddef>
#include <optional>
#include <string>

/**
 * @brief Case transformation applied to a filename stem.
 */
enum class CaseStyle {
    Lower,
    Upper,
    Title,    ///< First letter of each word.
    Sentence  ///< First letter only.
};

inline std::string to_string(CaseStyle style) {
    switch (style) {
        case CaseStyle::Lower: return "lower";
        case CaseStyle::Upper: return "upper";
        case CaseStyle::Title: return "title";
        case CaseStyle::Sentence: return "sentence";
        default: return "lower";
    }
}

inline std::optional<CaseStyle> case_style_from_string(const std::string& value) {
    if (value == "lower") return CaseStyle::Lower;
    if (value == "upper") return CaseStyle::Upper;
    if (value == "title") return CaseStyle::Title;
    if (value == "sentence") return CaseStyle::Sentence;
    return std::nullopt;
}

/**
 * @brief Options forwarded to a content extractor.
 */
struct ExtractionOptions {
    /**
     * @brief Pattern searched in the extracted text. The first capture group is
     * returned when the pattern has one, the whole match otherwise.
     */
    std::optional<std::string> regex_pattern;
    /**
     * @brief Maximum number of pages read from paged documents.
     */
    int max_pages = 3;
    /**
     * @brief Output template for metadata timestamps (tokens or strftime syntax).
     */
    std::string date_format = "YYYYMMDD_HHMMSS";
};

/**
 * @brief User-selected options for one sanitization session.
 */
struct SanitizeConfig {
    bool normalize_unicode{true};
    bool replace_spaces{false};
    std::size_t max_length{255};
    std::optional<CaseStyle> case_style;
    bool conflict_resolution{true};
    std::string conflict_suffix_format{"({n})"};
};

#endif
