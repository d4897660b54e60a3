#ifndef IMAGE_METADATA_EXTRACTOR_HPP
#define IMAGE_METADATA_EXTRACTOR_HPP

#include "Capabilities.hpp"
#include "ContentExtractor.hpp"

#include <ctime>
#include <memory>
#include <vector>

/**
 * @brief Capture timestamp of a photo, formatted with the session's date template.
 *
 * The first tag present in the file is used (DateTimeOriginal, then
 * ModifyDate). A malformed value yields no content; later tags are not tried.
 */
class ImageMetadataExtractor : public IContentExtractor {
public:
    explicit ImageMetadataExtractor(std::shared_ptr<const IImageMetadataReader> reader);

    std::string name() const override { return "image-metadata"; }
    const std::set<std::string>& extensions() const override;
    bool is_available() const override;

    std::optional<std::string> extract(const std::filesystem::path& path,
                                       const ExtractionOptions& options) const override;

    static const std::vector<std::string>& timestamp_tags();

    /**
     * @brief Parses an EXIF "YYYY:MM:DD HH:MM:SS" value into a calendar time.
     *
     * Every field must be zero-padded and form a real date ("2023:02:30 ..."
     * is rejected).
     */
    static std::optional<std::tm> parse_exif_datetime(const std::string& value);

    /**
     * @brief Rewrites a token template (YYYY, YY, MM, DD, HH, SS) as a
     * strftime format. MM after HH stands for minutes. A template that already
     * contains '%' is returned unchanged.
     */
    static std::string to_strftime_format(const std::string& date_format);

    /**
     * @return The formatted time, or std::nullopt when the result is empty.
     */
    static std::optional<std::string> format_timestamp(const std::tm& time,
                                                       const std::string& date_format);

private:
    std::shared_ptr<const IImageMetadataReader> reader_;
};

#endif
