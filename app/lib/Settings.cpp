#include "Settings.hpp"
#include "ConflictResolver.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <filesystem>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <utility>


namespace {
constexpr const char* kSanitizeSection = "Sanitize";
constexpr const char* kExtractionSection = "Extraction";
constexpr const char* kRenameSection = "Rename";
constexpr long long kMaxPages = 10000;

template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}
}


Settings::Settings()
{
    config_path = define_config_path();
    config_dir = std::filesystem::path(config_path).parent_path();

    try {
        if (!std::filesystem::exists(config_dir)) {
            std::filesystem::create_directories(config_dir);
        }
    } catch (const std::filesystem::filesystem_error &e) {
        settings_log(spdlog::level::err, "Error creating configuration directory: {}", e.what());
    }
}


std::string Settings::define_config_path()
{
    std::string AppName = "FileRenamer";
    if (const char* override_root = std::getenv("FILE_RENAMER_CONFIG_DIR")) {
        std::filesystem::path base = override_root;
        return (base / AppName / "config.ini").string();
    }
#ifdef _WIN32
    if (const char* appdata = std::getenv("APPDATA")) {
        return (std::filesystem::path(appdata) / AppName / "config.ini").string();
    }
#elif defined(__APPLE__)
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/Library/Application Support/" + AppName + "/config.ini";
    }
#else
    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME")) {
        return (std::filesystem::path(xdg_config) / AppName / "config.ini").string();
    }
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/.config/" + AppName + "/config.ini";
    }
#endif
    return "config.ini";
}


bool Settings::load()
{
    sanitize = SanitizeConfig{};
    extraction = ExtractionOptions{};
    last_folder.clear();
    dry_run = false;

    if (!config.load(config_path)) {
        return false;
    }

    auto read_bool = [this](const char* section, const char* key, bool fallback) {
        if (!config.contains(section, key)) {
            return fallback;
        }
        if (const auto value = config.get_bool(section, key)) {
            return *value;
        }
        settings_log(spdlog::level::warn, "Ignoring invalid {}/{} value '{}'", section, key,
                     config.get_string(section, key));
        return fallback;
    };

    auto read_integer = [this](const char* section, const char* key,
                               long long minimum, long long maximum) -> std::optional<long long> {
        if (!config.contains(section, key)) {
            return std::nullopt;
        }
        const auto value = config.get_integer(section, key);
        if (value && *value >= minimum && *value <= maximum) {
            return value;
        }
        settings_log(spdlog::level::warn, "Ignoring invalid {}/{} value '{}'", section, key,
                     config.get_string(section, key));
        return std::nullopt;
    };

    sanitize.normalize_unicode = read_bool(kSanitizeSection, "NormalizeUnicode", sanitize.normalize_unicode);
    sanitize.replace_spaces = read_bool(kSanitizeSection, "ReplaceSpaces", sanitize.replace_spaces);
    sanitize.conflict_resolution = read_bool(kSanitizeSection, "ConflictResolution", sanitize.conflict_resolution);

    if (const auto max_length = read_integer(kSanitizeSection, "MaxLength", 1,
                                                 std::numeric_limits<long long>::max())) {
        sanitize.max_length = static_cast<std::size_t>(*max_length);
    }

    const std::string case_value = Utils::trim_copy(config.get_string(kSanitizeSection, "CaseStyle"));
    if (!case_value.empty() && case_value != "none") {
        sanitize.case_style = case_style_from_string(Utils::to_lower_copy(case_value));
        if (!sanitize.case_style) {
            settings_log(spdlog::level::warn, "Ignoring invalid Sanitize/CaseStyle value '{}'", case_value);
        }
    }

    if (const auto format = config.find(kSanitizeSection, "ConflictSuffixFormat")) {
        if (ConflictResolver::is_valid_suffix_format(*format)) {
            sanitize.conflict_suffix_format = *format;
        } else {
            settings_log(spdlog::level::warn, "Ignoring conflict suffix format without a slot: '{}'", *format);
        }
    }

    const std::string pattern = config.get_string(kExtractionSection, "RegexPattern");
    if (!pattern.empty()) {
        extraction.regex_pattern = pattern;
    }

    if (const auto max_pages = read_integer(kExtractionSection, "MaxPages", 1, kMaxPages)) {
        extraction.max_pages = static_cast<int>(*max_pages);
    }

    const std::string date_format = config.get_string(kExtractionSection, "DateFormat");
    if (!date_format.empty()) {
        extraction.date_format = date_format;
    }

    last_folder = config.get_string(kRenameSection, "LastFolder");
    dry_run = read_bool(kRenameSection, "DryRun", false);

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("Loaded settings from '{}' (max length: {}, case: {}, conflict resolution: {}, max pages: {})",
                     config_path,
                     sanitize.max_length,
                     sanitize.case_style ? to_string(*sanitize.case_style) : std::string("none"),
                     sanitize.conflict_resolution,
                     extraction.max_pages);
    }

    return true;
}


bool Settings::save()
{
    config.set_bool(kSanitizeSection, "NormalizeUnicode", sanitize.normalize_unicode);
    config.set_bool(kSanitizeSection, "ReplaceSpaces", sanitize.replace_spaces);
    config.set_integer(kSanitizeSection, "MaxLength", static_cast<long long>(sanitize.max_length));
    config.set(kSanitizeSection, "CaseStyle",
               sanitize.case_style ? to_string(*sanitize.case_style) : std::string("none"));
    config.set_bool(kSanitizeSection, "ConflictResolution", sanitize.conflict_resolution);
    config.set(kSanitizeSection, "ConflictSuffixFormat", sanitize.conflict_suffix_format);

    if (extraction.regex_pattern && !extraction.regex_pattern->empty()) {
        config.set(kExtractionSection, "RegexPattern", *extraction.regex_pattern);
    } else {
        config.erase(kExtractionSection, "RegexPattern");
    }
    config.set_integer(kExtractionSection, "MaxPages", extraction.max_pages);
    config.set(kExtractionSection, "DateFormat", extraction.date_format);

    if (!last_folder.empty()) {
        config.set(kRenameSection, "LastFolder", last_folder);
    }
    config.set_bool(kRenameSection, "DryRun", dry_run);

    return config.save(config_path);
}


SanitizeConfig Settings::sanitize_config() const
{
    return sanitize;
}


void Settings::set_sanitize_config(const SanitizeConfig& value)
{
    sanitize = value;
}


ExtractionOptions Settings::extraction_options() const
{
    return extraction;
}


void Settings::set_extraction_options(const ExtractionOptions& value)
{
    extraction = value;
}


std::string Settings::get_last_folder() const
{
    return last_folder;
}


void Settings::set_last_folder(const std::string& path)
{
    last_folder = path;
}


bool Settings::get_dry_run() const
{
    return dry_run;
}


void Settings::set_dry_run(bool value)
{
    dry_run = value;
}
