#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path);
std::filesystem::path utf8_to_path(const std::string& value);

std::string to_lower_copy(std::string value);
std::string trim_copy(const std::string& value);

/**
 * @brief Lower-cased extension of a path including the dot (".pdf"), or "".
 */
std::string lower_extension(const std::filesystem::path& path);

/**
 * @brief A bare filename split at its final extension.
 *
 * The extension starts at the last dot, provided that dot is neither the
 * first nor the last character: ".bashrc" and "notes." have no extension.
 */
struct NameParts {
    std::string stem;
    std::string extension;
};
NameParts split_name(const std::string& name);

/**
 * @brief Number of code points in a UTF-8 string.
 */
std::size_t utf8_length(std::string_view value);

/**
 * @brief Leading @p count code points of a UTF-8 string.
 */
std::string utf8_prefix(std::string_view value, std::size_t count);

} // namespace Utils

#endif
