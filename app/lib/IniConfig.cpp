#include "IniConfig.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <cctype>
#include <charconv>
#include <fstream>
#include <utility>

namespace {

bool is_comment(const std::string& line)
{
    return line.front() == ';' || line.front() == '#';
}

std::string unquote(std::string value)
{
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

bool needs_quotes(const std::string& value)
{
    if (value.empty()) {
        return false;
    }
    const auto front = static_cast<unsigned char>(value.front());
    const auto back = static_cast<unsigned char>(value.back());
    if (std::isspace(front) || std::isspace(back)) {
        return true;
    }
    return value.size() >= 2 && value.front() == '"' && value.back() == '"';
}

} // namespace


bool IniConfig::load(const std::filesystem::path& path)
{
    auto logger = Logger::get_logger("core_logger");
    std::ifstream file(path);
    if (!file.is_open()) {
        if (logger) {
            logger->debug("No configuration at '{}'", Utils::path_to_utf8(path));
        }
        return false;
    }

    sections_.clear();
    std::string current;
    std::string raw_line;
    for (std::size_t line_number = 1; std::getline(file, raw_line); ++line_number) {
        const std::string line = Utils::trim_copy(raw_line);
        if (line.empty() || is_comment(line)) {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            current = Utils::trim_copy(line.substr(1, line.size() - 2));
            continue;
        }

        const auto equals = line.find('=');
        const std::string key = equals == std::string::npos ? std::string()
                                                            : Utils::trim_copy(line.substr(0, equals));
        if (key.empty()) {
            if (logger) {
                logger->warn("Ignoring malformed line {} in '{}'", line_number, Utils::path_to_utf8(path));
            }
            continue;
        }
        sections_[current][key] = unquote(Utils::trim_copy(line.substr(equals + 1)));
    }
    return true;
}


bool IniConfig::save(const std::filesystem::path& path) const
{
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Cannot open '{}' for writing", Utils::path_to_utf8(path));
        }
        return false;
    }

    bool first = true;
    for (const auto& [name, entries] : sections_) {
        if (!first) {
            file << '\n';
        }
        first = false;
        if (!name.empty()) {
            file << '[' << name << "]\n";
        }
        for (const auto& [key, value] : entries) {
            file << key << " = ";
            if (needs_quotes(value)) {
                file << '"' << value << '"';
            } else {
                file << value;
            }
            file << '\n';
        }
    }

    file.flush();
    if (!file) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Failed to write '{}'", Utils::path_to_utf8(path));
        }
        return false;
    }
    return true;
}


std::optional<std::string> IniConfig::find(const std::string& section, const std::string& key) const
{
    const auto section_it = sections_.find(section);
    if (section_it == sections_.end()) {
        return std::nullopt;
    }
    const auto value_it = section_it->second.find(key);
    if (value_it == section_it->second.end()) {
        return std::nullopt;
    }
    return value_it->second;
}


std::string IniConfig::get_string(const std::string& section, const std::string& key,
                                  const std::string& fallback) const
{
    return find(section, key).value_or(fallback);
}


std::optional<bool> IniConfig::get_bool(const std::string& section, const std::string& key) const
{
    const auto raw = find(section, key);
    if (!raw) {
        return std::nullopt;
    }
    const std::string value = Utils::to_lower_copy(Utils::trim_copy(*raw));
    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    return std::nullopt;
}


std::optional<long long> IniConfig::get_integer(const std::string& section, const std::string& key) const
{
    const auto raw = find(section, key);
    if (!raw) {
        return std::nullopt;
    }
    const std::string value = Utils::trim_copy(*raw);
    long long parsed = 0;
    const char* end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
    if (value.empty() || ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return parsed;
}


bool IniConfig::contains(const std::string& section, const std::string& key) const
{
    return find(section, key).has_value();
}


void IniConfig::set(const std::string& section, const std::string& key, const std::string& value)
{
    sections_[section][key] = value;
}


void IniConfig::set_bool(const std::string& section, const std::string& key, bool value)
{
    set(section, key, value ? "true" : "false");
}


void IniConfig::set_integer(const std::string& section, const std::string& key, long long value)
{
    set(section, key, std::to_string(value));
}


void IniConfig::erase(const std::string& section, const std::string& key)
{
    const auto section_it = sections_.find(section);
    if (section_it == sections_.end()) {
        return;
    }
    section_it->second.erase(key);
    if (section_it->second.empty()) {
        sections_.erase(section_it);
    }
}
