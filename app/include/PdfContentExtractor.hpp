#ifndef PDF_CONTENT_EXTRACTOR_HPP
#define PDF_CONTENT_EXTRACTOR_HPP

#include "Capabilities.hpp"
#include "ContentExtractor.hpp"

#include <memory>

/**
 * @brief First line (or pattern match) of the leading pages of a PDF.
 *
 * Without a paged-text source the extractor handles nothing.
 */
class PdfContentExtractor : public IContentExtractor {
public:
    explicit PdfContentExtractor(std::shared_ptr<const IPagedTextSource> source);

    std::string name() const override { return "pdf"; }
    const std::set<std::string>& extensions() const override;
    bool is_available() const override;

    std::optional<std::string> extract(const std::filesystem::path& path,
                                       const ExtractionOptions& options) const override;

private:
    std::shared_ptr<const IPagedTextSource> source_;
};

#endif
