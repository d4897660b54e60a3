#ifndef TEXT_CONTENT_EXTRACTOR_HPP
#define TEXT_CONTENT_EXTRACTOR_HPP

#include "Capabilities.hpp"
#include "ContentExtractor.hpp"

#include <memory>

/**
 * @brief First line (or pattern match) of plain text files.
 */
class TextContentExtractor : public IContentExtractor {
public:
    /**
     * @brief Number of leading bytes handed to the encoding detector.
     */
    static constexpr std::size_t kDetectionPrefixSize = 8 * 1024;

    /**
     * @param detector Encoding detector; nullptr decodes everything as UTF-8.
     */
    explicit TextContentExtractor(std::shared_ptr<const IEncodingDetector> detector = nullptr);

    std::string name() const override { return "text"; }
    const std::set<std::string>& extensions() const override;

    std::optional<std::string> extract(const std::filesystem::path& path,
                                       const ExtractionOptions& options) const override;

    /**
     * @brief Decodes @p bytes from @p encoding to UTF-8, dropping invalid
     * sequences. Unknown encodings are decoded as UTF-8.
     */
    static std::string decode(const std::string& bytes, const std::string& encoding);

private:
    std::shared_ptr<const IEncodingDetector> detector_;
};

#endif
