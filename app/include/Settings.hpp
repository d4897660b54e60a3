#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <Types.hpp>
#include <filesystem>
#include <optional>
#include <string>


/**
 * @brief Persisted user defaults for sanitization, extraction and renaming.
 *
 * Stored in config.ini under the per-user configuration directory; the root
 * can be redirected with FILE_RENAMER_CONFIG_DIR.
 */
class Settings
{
public:
    Settings();

    bool load();
    bool save();

    std::string define_config_path();
    std::string get_config_path() const { return config_path; }

    SanitizeConfig sanitize_config() const;
    void set_sanitize_config(const SanitizeConfig& value);

    ExtractionOptions extraction_options() const;
    void set_extraction_options(const ExtractionOptions& value);

    std::string get_last_folder() const;
    void set_last_folder(const std::string& path);

    bool get_dry_run() const;
    void set_dry_run(bool value);

private:
    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;

    SanitizeConfig sanitize;
    ExtractionOptions extraction;
    std::string last_folder;
    bool dry_run{false};
};

#endif
