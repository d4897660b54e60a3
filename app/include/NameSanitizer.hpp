#ifndef NAME_SANITIZER_HPP
#define NAME_SANITIZER_HPP

#include "Types.hpp"

#include <cstddef>
#include <string>

/**
 * @brief Pure functions that turn arbitrary strings into filesystem-legal names.
 *
 * All lengths are counted in Unicode code points of the UTF-8 input and cuts
 * never split a multi-byte sequence.
 */
namespace NameSanitizer {

/**
 * @brief Fallback used when nothing usable is left of a name.
 */
inline constexpr const char* kFallbackName = "unnamed";

/**
 * @brief Makes @p name safe for use as a filename.
 *
 * Steps, in order: optional NFKD decomposition with combining marks removed;
 * replacement of < > : " | ? * \ / and control characters with '_';
 * '_' prefix for reserved device names (CON, PRN, AUX, NUL, COM1-9, LPT1-9);
 * optional space replacement; trimming of leading/trailing dots and spaces;
 * "unnamed" for empty results; stem-preserving truncation to @p max_length.
 *
 * @throws ErrorCodes::AppException when @p max_length is zero.
 */
std::string sanitize_filename(const std::string& name,
                              bool normalize_unicode = true,
                              bool replace_spaces = false,
                              std::size_t max_length = 255);

/**
 * @brief Cuts @p name to @p max_length code points.
 *
 * With @p preserve_extension the stem is shortened and the extension kept,
 * unless the extension alone does not fit, in which case the whole string is
 * cut. Idempotent.
 */
std::string truncate_filename(const std::string& name,
                              std::size_t max_length,
                              bool preserve_extension = true);

/**
 * @brief Inserts @p prefix before and @p suffix after the stem.
 */
std::string add_prefix_suffix(const std::string& name,
                              const std::string& prefix,
                              const std::string& suffix);

/**
 * @brief Applies @p style to the stem and lower-cases the extension.
 */
std::string normalize_filename_case(const std::string& name, CaseStyle style);

/**
 * @brief True when the stem of @p name is a reserved device name.
 */
bool is_reserved_name(const std::string& name);

/**
 * @brief True for characters that sanitize_filename() replaces.
 */
bool is_forbidden_char(char ch);

} // namespace NameSanitizer

#endif
