#include "QtEncodingDetector.hpp"

#include <QByteArrayView>
#include <QString>
#include <QStringConverter>
#include <QStringDecoder>

#include <cstddef>

namespace {
// Share of NUL bytes at even or odd offsets above which a BOM-less prefix is treated as UTF-16
constexpr double kUtf16NulRatio = 0.3;

std::optional<std::string> guess_utf16(std::string_view prefix)
{
    if (prefix.size() < 4) {
        return std::nullopt;
    }
    std::size_t even_nuls = 0;
    std::size_t odd_nuls = 0;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (prefix[i] == '\0') {
            (i % 2 == 0 ? even_nuls : odd_nuls)++;
        }
    }
    const double pairs = static_cast<double>(prefix.size() / 2);
    if (odd_nuls / pairs > kUtf16NulRatio && even_nuls == 0) {
        return std::string("UTF-16LE");
    }
    if (even_nuls / pairs > kUtf16NulRatio && odd_nuls == 0) {
        return std::string("UTF-16BE");
    }
    return std::nullopt;
}

// Length of the prefix without a multi-byte sequence cut off by the buffer end
std::size_t complete_utf8_length(std::string_view prefix)
{
    const std::size_t size = prefix.size();
    for (std::size_t back = 1; back <= 3 && back <= size; ++back) {
        const auto byte = static_cast<unsigned char>(prefix[size - back]);
        if ((byte & 0xC0) == 0x80) {
            continue;
        }
        const std::size_t expected = byte >= 0xF0 ? 4 : byte >= 0xE0 ? 3 : byte >= 0xC0 ? 2 : 1;
        return expected > back ? size - back : size;
    }
    return size;
}

bool is_utf8(std::string_view prefix)
{
    QStringDecoder decoder(QStringConverter::Utf8);
    const QString decoded = decoder.decode(
        QByteArrayView(prefix.data(), static_cast<qsizetype>(complete_utf8_length(prefix))));
    return !decoder.hasError();
}
}

std::optional<std::string> QtEncodingDetector::detect(std::string_view prefix) const
{
    if (prefix.empty()) {
        return std::nullopt;
    }

    const QByteArrayView data(prefix.data(), static_cast<qsizetype>(prefix.size()));
    if (const auto encoding = QStringConverter::encodingForData(data)) {
        if (const char* name = QStringConverter::nameForEncoding(*encoding)) {
            return std::string(name);
        }
    }

    if (auto utf16 = guess_utf16(prefix)) {
        return utf16;
    }

    if (is_utf8(prefix)) {
        return std::string("UTF-8");
    }
    return std::string("ISO-8859-1");
}
