#ifndef EXIFTOOL_METADATA_READER_HPP
#define EXIFTOOL_METADATA_READER_HPP

#include "Capabilities.hpp"

/**
 * @brief EXIF tags read through the exiftool command-line tool (JSON output).
 */
class ExiftoolMetadataReader : public IImageMetadataReader {
public:
    explicit ExiftoolMetadataReader(std::string executable = "exiftool", int timeout_ms = 10000);

    bool is_available() const override;

    std::optional<std::map<std::string, std::string>>
    read_tags(const std::filesystem::path& path, const std::vector<std::string>& tags) const override;

    /**
     * @brief Extracts @p tags from exiftool's "-j" output.
     * @return std::nullopt when @p json is not an exiftool result array.
     */
    static std::optional<std::map<std::string, std::string>>
    parse_json(const std::string& json, const std::vector<std::string>& tags);

private:
    std::string executable_;
    int timeout_ms_;
};

#endif
