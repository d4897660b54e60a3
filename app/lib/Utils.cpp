#include "Utils.hpp"

#include <algorithm>
#include <cctype>

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path)
{
    const auto utf8 = path.u8string();
    return std::string(utf8.begin(), utf8.end());
}


std::filesystem::path utf8_to_path(const std::string& value)
{
    return std::filesystem::path(std::u8string(value.begin(), value.end()));
}


std::string to_lower_copy(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}


std::string trim_copy(const std::string& value)
{
    auto result = value;
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    result.erase(result.begin(), std::find_if(result.begin(), result.end(), not_space));
    result.erase(std::find_if(result.rbegin(), result.rend(), not_space).base(), result.end());
    return result;
}


std::string lower_extension(const std::filesystem::path& path)
{
    if (!path.has_extension()) {
        return {};
    }
    return to_lower_copy(path_to_utf8(path.extension()));
}


NameParts split_name(const std::string& name)
{
    const auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= name.size()) {
        return NameParts{name, {}};
    }
    return NameParts{name.substr(0, dot), name.substr(dot)};
}


std::size_t utf8_length(std::string_view value)
{
    return static_cast<std::size_t>(std::count_if(value.begin(), value.end(), [](char ch) {
        return (static_cast<unsigned char>(ch) & 0xC0) != 0x80;
    }));
}


std::string utf8_prefix(std::string_view value, std::size_t count)
{
    std::size_t seen = 0;
    for (std::size_t i = 0; i < value.size(); ++i) {
        const auto byte = static_cast<unsigned char>(value[i]);
        if ((byte & 0xC0) != 0x80) {
            if (seen == count) {
                return std::string(value.substr(0, i));
            }
            ++seen;
        }
    }
    return std::string(value);
}

} // namespace Utils
