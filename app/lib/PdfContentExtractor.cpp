#include "PdfContentExtractor.hpp"

#include "Logger.hpp"
#include "Utils.hpp"

#include <utility>

namespace {
const std::set<std::string> kPdfExtensions = {".pdf"};
}

PdfContentExtractor::PdfContentExtractor(std::shared_ptr<const IPagedTextSource> source)
    : source_(std::move(source))
{}


const std::set<std::string>& PdfContentExtractor::extensions() const
{
    return kPdfExtensions;
}


bool PdfContentExtractor::is_available() const
{
    return source_ && source_->is_available();
}


std::optional<std::string> PdfContentExtractor::extract(const std::filesystem::path& path,
                                                        const ExtractionOptions& options) const
{
    if (!is_available()) {
        return std::nullopt;
    }

    const auto pages = source_->read_pages(path, options.max_pages);
    if (!pages) {
        return std::nullopt;
    }

    std::string content;
    const std::size_t page_limit = options.max_pages > 0 ? static_cast<std::size_t>(options.max_pages) : 0;
    for (std::size_t i = 0; i < pages->size() && i < page_limit; ++i) {
        content += (*pages)[i];
        content += '\n';
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->trace("Read {} page(s) from '{}'", std::min(pages->size(), page_limit),
                      Utils::path_to_utf8(path));
    }
    return ContentSelection::select(content, options.regex_pattern);
}
