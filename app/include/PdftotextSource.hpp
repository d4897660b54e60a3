#ifndef PDFTOTEXT_SOURCE_HPP
#define PDFTOTEXT_SOURCE_HPP

#include "Capabilities.hpp"

/**
 * @brief Paged PDF text through poppler's pdftotext command-line tool.
 *
 * Availability is checked on PATH at each query, so installing or removing
 * the tool is picked up without restarting.
 */
class PdftotextSource : public IPagedTextSource {
public:
    explicit PdftotextSource(std::string executable = "pdftotext", int timeout_ms = 15000);

    bool is_available() const override;

    std::optional<std::vector<std::string>>
    read_pages(const std::filesystem::path& path, int max_pages) const override;

private:
    std::string executable_;
    int timeout_ms_;
};

#endif
