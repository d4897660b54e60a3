#include "ContentExtractorRegistry.hpp"

#include "ExiftoolMetadataReader.hpp"
#include "ImageMetadataExtractor.hpp"
#include "Logger.hpp"
#include "PdfContentExtractor.hpp"
#include "PdftotextSource.hpp"
#include "QtEncodingDetector.hpp"
#include "TextContentExtractor.hpp"
#include "Utils.hpp"

#include <utility>

ContentExtractorRegistry::ContentExtractorRegistry()
{
    extractors_.push_back(std::make_unique<TextContentExtractor>(std::make_shared<QtEncodingDetector>()));
    extractors_.push_back(std::make_unique<PdfContentExtractor>(std::make_shared<PdftotextSource>()));
    extractors_.push_back(std::make_unique<ImageMetadataExtractor>(std::make_shared<ExiftoolMetadataReader>()));
}


ContentExtractorRegistry::ContentExtractorRegistry(std::vector<std::unique_ptr<IContentExtractor>> extractors)
    : extractors_(std::move(extractors))
{}


const IContentExtractor* ContentExtractorRegistry::get_extractor(const std::filesystem::path& path) const
{
    for (const auto& extractor : extractors_) {
        if (extractor && extractor->can_handle(path)) {
            return extractor.get();
        }
    }
    return nullptr;
}


std::optional<std::string> ContentExtractorRegistry::extract_content(const std::filesystem::path& path,
                                                                     const ExtractionOptions& options) const
{
    const IContentExtractor* extractor = get_extractor(path);
    if (!extractor) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("No extractor for '{}'", Utils::path_to_utf8(path));
        }
        return std::nullopt;
    }

    auto content = extractor->extract(path, options);
    if (auto logger = Logger::get_logger("core_logger")) {
        if (content) {
            logger->debug("{} extractor produced '{}' for '{}'", extractor->name(), *content,
                          Utils::path_to_utf8(path));
        } else {
            logger->debug("{} extractor found no content in '{}'", extractor->name(),
                          Utils::path_to_utf8(path));
        }
    }
    return content;
}


std::set<std::string> ContentExtractorRegistry::supported_extensions() const
{
    std::set<std::string> result;
    for (const auto& extractor : extractors_) {
        if (extractor && extractor->is_available()) {
            result.insert(extractor->extensions().begin(), extractor->extensions().end());
        }
    }
    return result;
}
