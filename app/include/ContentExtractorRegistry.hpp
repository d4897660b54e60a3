#ifndef CONTENT_EXTRACTOR_REGISTRY_HPP
#define CONTENT_EXTRACTOR_REGISTRY_HPP

#include "ContentExtractor.hpp"

#include <memory>
#include <vector>

/**
 * @brief Ordered set of content extractors; the first one able to handle a
 * path wins.
 */
class ContentExtractorRegistry {
public:
    /**
     * @brief Text (Qt encoding detection), PDF (pdftotext) and image
     * metadata (exiftool), in that order.
     */
    ContentExtractorRegistry();
    explicit ContentExtractorRegistry(std::vector<std::unique_ptr<IContentExtractor>> extractors);

    /**
     * @return The first extractor whose can_handle() accepts @p path, or nullptr.
     */
    const IContentExtractor* get_extractor(const std::filesystem::path& path) const;

    /**
     * @brief Runs the matching extractor. No extractor, or no content, is std::nullopt.
     */
    std::optional<std::string> extract_content(const std::filesystem::path& path,
                                               const ExtractionOptions& options = {}) const;

    /**
     * @brief Extensions of the extractors whose capability is currently present.
     */
    std::set<std::string> supported_extensions() const;

    const std::vector<std::unique_ptr<IContentExtractor>>& all() const { return extractors_; }

private:
    std::vector<std::unique_ptr<IContentExtractor>> extractors_;
};

#endif
