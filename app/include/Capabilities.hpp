#ifndef CAPABILITIES_HPP
#define CAPABILITIES_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Guesses the text encoding of a raw byte prefix.
 */
class IEncodingDetector {
public:
    virtual ~IEncodingDetector() = default;

    /**
     * @return An encoding name understood by QStringDecoder ("UTF-8",
     * "ISO-8859-1", ...), or std::nullopt when no guess can be made.
     */
    virtual std::optional<std::string> detect(std::string_view prefix) const = 0;
};

/**
 * @brief Reads the text of paged documents, one string per page.
 */
class IPagedTextSource {
public:
    virtual ~IPagedTextSource() = default;

    virtual bool is_available() const = 0;

    /**
     * @brief Text of the first min(@p max_pages, page count) pages in order.
     * @return std::nullopt when the document cannot be decoded.
     */
    virtual std::optional<std::vector<std::string>>
    read_pages(const std::filesystem::path& path, int max_pages) const = 0;
};

/**
 * @brief Reads metadata tags (EXIF) from image files.
 */
class IImageMetadataReader {
public:
    virtual ~IImageMetadataReader() = default;

    virtual bool is_available() const = 0;

    /**
     * @brief Values of the requested tags that are present in the file.
     * @return std::nullopt when the file cannot be read at all.
     */
    virtual std::optional<std::map<std::string, std::string>>
    read_tags(const std::filesystem::path& path, const std::vector<std::string>& tags) const = 0;
};

#endif
