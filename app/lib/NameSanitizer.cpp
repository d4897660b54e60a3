#include "NameSanitizer.hpp"

#include "AppException.hpp"
#include "Utils.hpp"

#include <QChar>
#include <QString>

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace {

constexpr std::array<std::string_view, 22> kReservedNames = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"
};

constexpr std::string_view kForbiddenChars = "<>:\"|?*\\/";

std::string to_upper_ascii(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return value;
}

std::string fold_accents(const std::string& value)
{
    const QString decomposed =
        QString::fromStdString(value).normalized(QString::NormalizationForm_KD);
    std::u32string kept;
    kept.reserve(static_cast<std::size_t>(decomposed.size()));
    for (const auto code_point : decomposed.toUcs4()) {
        const auto ucs4 = static_cast<char32_t>(code_point);
        if (QChar::combiningClass(ucs4) == 0) {
            kept.push_back(ucs4);
        }
    }
    return QString::fromUcs4(kept.data(), static_cast<qsizetype>(kept.size())).toStdString();
}

std::string strip_dots_and_spaces(const std::string& value)
{
    const auto begin = value.find_first_not_of(". ");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(". ");
    return value.substr(begin, end - begin + 1);
}

bool is_cased(char32_t ucs4)
{
    return QChar::isLower(ucs4) || QChar::isUpper(ucs4) || QChar::isTitleCase(ucs4);
}

QString title_case(const QString& value)
{
    std::u32string result;
    bool previous_is_cased = false;
    for (const auto code_point : value.toUcs4()) {
        const auto ucs4 = static_cast<char32_t>(code_point);
        result.push_back(previous_is_cased ? QChar::toLower(ucs4) : QChar::toTitleCase(ucs4));
        previous_is_cased = is_cased(ucs4);
    }
    return QString::fromUcs4(result.data(), static_cast<qsizetype>(result.size()));
}

QString sentence_case(const QString& value)
{
    std::u32string result;
    bool first = true;
    for (const auto code_point : value.toUcs4()) {
        const auto ucs4 = static_cast<char32_t>(code_point);
        result.push_back(first ? QChar::toTitleCase(ucs4) : QChar::toLower(ucs4));
        first = false;
    }
    return QString::fromUcs4(result.data(), static_cast<qsizetype>(result.size()));
}

} // namespace

namespace NameSanitizer {

bool is_forbidden_char(char ch)
{
    const auto byte = static_cast<unsigned char>(ch);
    if (byte < 0x20 || byte == 0x7F) {
        return true;
    }
    return kForbiddenChars.find(ch) != std::string_view::npos;
}


bool is_reserved_name(const std::string& name)
{
    const std::string stem = to_upper_ascii(Utils::split_name(name).stem);
    return std::find(kReservedNames.begin(), kReservedNames.end(), stem) != kReservedNames.end();
}


std::string sanitize_filename(const std::string& name,
                              bool normalize_unicode,
                              bool replace_spaces,
                              std::size_t max_length)
{
    if (max_length == 0) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::VALIDATION_VALUE_OUT_OF_RANGE,
                            "Maximum filename length must be at least 1",
                            "max_length=0");
    }
    if (name.empty()) {
        return truncate_filename(kFallbackName, max_length);
    }

    std::string result = normalize_unicode ? fold_accents(name) : name;

    std::replace_if(result.begin(), result.end(), is_forbidden_char, '_');

    if (is_reserved_name(result)) {
        result.insert(result.begin(), '_');
    }

    if (replace_spaces) {
        std::replace(result.begin(), result.end(), ' ', '_');
    }

    result = strip_dots_and_spaces(result);
    if (result.empty()) {
        result = kFallbackName;
    }
    // Stripping can leave a bare device name such as "CON." -> "CON"
    if (is_reserved_name(result)) {
        result.insert(result.begin(), '_');
    }

    if (Utils::utf8_length(result) > max_length) {
        result = truncate_filename(result, max_length);
        // A cut can expose a trailing dot or space, or shorten the stem to a device name
        result = strip_dots_and_spaces(result);
        if (result.empty()) {
            result = truncate_filename(kFallbackName, max_length);
        }
        if (is_reserved_name(result)) {
            result = truncate_filename("_" + result, max_length);
        }
    }

    return result;
}


std::string truncate_filename(const std::string& name,
                              std::size_t max_length,
                              bool preserve_extension)
{
    if (Utils::utf8_length(name) <= max_length) {
        return name;
    }
    if (!preserve_extension) {
        return Utils::utf8_prefix(name, max_length);
    }

    const auto parts = Utils::split_name(name);
    const std::size_t extension_length = Utils::utf8_length(parts.extension);
    if (extension_length >= max_length) {
        return Utils::utf8_prefix(name, max_length);
    }
    return Utils::utf8_prefix(parts.stem, max_length - extension_length) + parts.extension;
}


std::string add_prefix_suffix(const std::string& name,
                              const std::string& prefix,
                              const std::string& suffix)
{
    if (name.empty()) {
        return name;
    }
    const auto parts = Utils::split_name(name);
    return prefix + parts.stem + suffix + parts.extension;
}


std::string normalize_filename_case(const std::string& name, CaseStyle style)
{
    if (name.empty()) {
        return name;
    }
    const auto parts = Utils::split_name(name);
    const QString stem = QString::fromStdString(parts.stem);

    QString normalized;
    switch (style) {
        case CaseStyle::Lower:
            normalized = stem.toLower();
            break;
        case CaseStyle::Upper:
            normalized = stem.toUpper();
            break;
        case CaseStyle::Title:
            normalized = title_case(stem);
            break;
        case CaseStyle::Sentence:
            normalized = sentence_case(stem);
            break;
    }

    return normalized.toStdString() + QString::fromStdString(parts.extension).toLower().toStdString();
}

} // namespace NameSanitizer
