#include "PdftotextSource.hpp"

#include "ExternalTool.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <string>
#include <utility>

namespace {
// pdftotext terminates every page with a form feed
std::vector<std::string> split_pages(const std::string& output)
{
    std::vector<std::string> pages;
    std::size_t start = 0;
    while (start < output.size()) {
        const auto end = output.find('\f', start);
        if (end == std::string::npos) {
            pages.push_back(output.substr(start));
            break;
        }
        pages.push_back(output.substr(start, end - start));
        start = end + 1;
    }
    return pages;
}
}

PdftotextSource::PdftotextSource(std::string executable, int timeout_ms)
    : executable_(std::move(executable)),
      timeout_ms_(timeout_ms)
{}


bool PdftotextSource::is_available() const
{
    return ExternalTool::find_executable(executable_).has_value();
}


std::optional<std::vector<std::string>>
PdftotextSource::read_pages(const std::filesystem::path& path, int max_pages) const
{
    if (max_pages < 1) {
        return std::vector<std::string>{};
    }
    const auto program = ExternalTool::find_executable(executable_);
    if (!program) {
        return std::nullopt;
    }

    auto output = ExternalTool::run_process(*program,
                                            {"-q", "-enc", "UTF-8",
                                             "-f", "1", "-l", std::to_string(max_pages),
                                             Utils::path_to_utf8(path), "-"},
                                            timeout_ms_);
    if (!output) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("pdftotext could not read '{}'", Utils::path_to_utf8(path));
        }
        return std::nullopt;
    }

    auto pages = split_pages(*output);
    if (pages.size() > static_cast<std::size_t>(max_pages)) {
        pages.resize(static_cast<std::size_t>(max_pages));
    }
    return pages;
}
