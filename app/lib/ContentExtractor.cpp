#include "ContentExtractor.hpp"

#include "Logger.hpp"
#include "Utils.hpp"

#include <QRegularExpression>
#include <QRegularExpressionMatch>
#include <QString>

#include <sstream>

bool IContentExtractor::can_handle(const std::filesystem::path& path) const
{
    const std::string ext = Utils::lower_extension(path);
    if (ext.empty() || !extensions().contains(ext)) {
        return false;
    }
    return is_available();
}

namespace ContentSelection {

std::optional<std::string> first_non_empty_line(const std::string& text)
{
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        std::string trimmed = Utils::trim_copy(line);
        if (!trimmed.empty()) {
            return trimmed;
        }
    }
    return std::nullopt;
}


bool is_valid_pattern(const std::string& regex_pattern, std::string* error)
{
    const QRegularExpression pattern(QString::fromStdString(regex_pattern));
    if (!pattern.isValid() && error) {
        *error = pattern.errorString().toStdString();
    }
    return pattern.isValid();
}


std::optional<std::string> select(const std::string& text,
                                  const std::optional<std::string>& regex_pattern)
{
    if (!regex_pattern || regex_pattern->empty()) {
        return first_non_empty_line(text);
    }

    const QRegularExpression pattern(QString::fromStdString(*regex_pattern),
                                     QRegularExpression::MultilineOption);
    if (!pattern.isValid()) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("Invalid content pattern '{}': {}", *regex_pattern,
                          pattern.errorString().toStdString());
        }
        return std::nullopt;
    }

    const QRegularExpressionMatch match = pattern.match(QString::fromStdString(text));
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    const int group = pattern.captureCount() > 0 ? 1 : 0;
    const QString captured = match.captured(group);
    if (captured.isEmpty()) {
        return std::nullopt;
    }
    return captured.toStdString();
}

} // namespace ContentSelection
