#include "TextContentExtractor.hpp"

#include "Logger.hpp"
#include "Utils.hpp"

#include <QByteArrayView>
#include <QString>
#include <QStringDecoder>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <utility>

namespace {
const std::set<std::string> kTextExtensions = {".txt", ".md", ".log", ".rst", ".csv"};

std::optional<std::string> read_all_bytes(const std::filesystem::path& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::string buffer((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return buffer;
}
}

TextContentExtractor::TextContentExtractor(std::shared_ptr<const IEncodingDetector> detector)
    : detector_(std::move(detector))
{}


const std::set<std::string>& TextContentExtractor::extensions() const
{
    return kTextExtensions;
}


std::string TextContentExtractor::decode(const std::string& bytes, const std::string& encoding)
{
    QStringDecoder decoder(encoding.c_str());
    if (!decoder.isValid()) {
        decoder = QStringDecoder(QStringConverter::Utf8);
    }
    QString text = decoder(QByteArrayView(bytes.data(), static_cast<qsizetype>(bytes.size())));
    text.remove(QChar::ReplacementCharacter);
    return text.toStdString();
}


std::optional<std::string> TextContentExtractor::extract(const std::filesystem::path& path,
                                                         const ExtractionOptions& options) const
{
    const auto raw = read_all_bytes(path);
    if (!raw) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("Cannot read text file '{}'", Utils::path_to_utf8(path));
        }
        return std::nullopt;
    }

    std::string encoding = "UTF-8";
    if (detector_) {
        const std::string_view prefix(raw->data(), std::min(raw->size(), kDetectionPrefixSize));
        if (auto detected = detector_->detect(prefix)) {
            encoding = std::move(*detected);
        }
    }

    const std::string text = decode(*raw, encoding);
    return ContentSelection::select(text, options.regex_pattern);
}
