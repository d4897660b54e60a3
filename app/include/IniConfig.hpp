#ifndef INICONFIG_HPP
#define INICONFIG_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>

/**
 * @brief Sectioned key/value store persisted in INI syntax.
 *
 * Lines starting with ';' or '#' are comments. Keys before the first header
 * belong to the "" section. A value wrapped in double quotes keeps its
 * surrounding whitespace; save() adds the quotes where they are needed.
 */
class IniConfig {
public:
    bool load(const std::filesystem::path& path);
    bool save(const std::filesystem::path& path) const;

    std::optional<std::string> find(const std::string& section, const std::string& key) const;
    std::string get_string(const std::string& section, const std::string& key,
                           const std::string& fallback = "") const;

    /**
     * @brief true/false, yes/no, on/off or 1/0 (case-insensitive); nullopt otherwise.
     */
    std::optional<bool> get_bool(const std::string& section, const std::string& key) const;
    std::optional<long long> get_integer(const std::string& section, const std::string& key) const;

    bool contains(const std::string& section, const std::string& key) const;

    void set(const std::string& section, const std::string& key, const std::string& value);
    void set_bool(const std::string& section, const std::string& key, bool value);
    void set_integer(const std::string& section, const std::string& key, long long value);
    void erase(const std::string& section, const std::string& key);

private:
    using Section = std::map<std::string, std::string>;
    std::map<std::string, Section> sections_;
};

#endif
