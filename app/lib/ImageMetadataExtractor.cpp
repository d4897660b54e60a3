#include "ImageMetadataExtractor.hpp"

#include "Logger.hpp"
#include "Utils.hpp"

#include <array>
#include <cctype>
#include <string_view>
#include <utility>

namespace {
const std::set<std::string> kImageExtensions = {".jpg", ".jpeg", ".tiff", ".tif"};

constexpr std::size_t kExifDateTimeLength = 19;
constexpr std::size_t kMaxFormattedLength = 256;

bool read_number(const std::string& value, std::size_t offset, std::size_t width, int& out)
{
    int result = 0;
    for (std::size_t i = offset; i < offset + width; ++i) {
        const unsigned char ch = static_cast<unsigned char>(value[i]);
        if (!std::isdigit(ch)) {
            return false;
        }
        result = result * 10 + (ch - '0');
    }
    out = result;
    return true;
}

bool is_leap_year(int year)
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month)
{
    static constexpr std::array<int, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[static_cast<std::size_t>(month - 1)];
}
}

ImageMetadataExtractor::ImageMetadataExtractor(std::shared_ptr<const IImageMetadataReader> reader)
    : reader_(std::move(reader))
{}


const std::set<std::string>& ImageMetadataExtractor::extensions() const
{
    return kImageExtensions;
}


bool ImageMetadataExtractor::is_available() const
{
    return reader_ && reader_->is_available();
}


const std::vector<std::string>& ImageMetadataExtractor::timestamp_tags()
{
    static const std::vector<std::string> tags = {"DateTimeOriginal", "ModifyDate"};
    return tags;
}


std::optional<std::tm> ImageMetadataExtractor::parse_exif_datetime(const std::string& value)
{
    const std::string trimmed = Utils::trim_copy(value);
    if (trimmed.size() != kExifDateTimeLength) {
        return std::nullopt;
    }
    if (trimmed[4] != ':' || trimmed[7] != ':' || trimmed[10] != ' ' ||
        trimmed[13] != ':' || trimmed[16] != ':') {
        return std::nullopt;
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!read_number(trimmed, 0, 4, year) || !read_number(trimmed, 5, 2, month) ||
        !read_number(trimmed, 8, 2, day) || !read_number(trimmed, 11, 2, hour) ||
        !read_number(trimmed, 14, 2, minute) || !read_number(trimmed, 17, 2, second)) {
        return std::nullopt;
    }

    if (year < 1 || month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
        hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    std::tm time{};
    time.tm_year = year - 1900;
    time.tm_mon = month - 1;
    time.tm_mday = day;
    time.tm_hour = hour;
    time.tm_min = minute;
    time.tm_sec = second;
    time.tm_isdst = -1;
    return time;
}


std::string ImageMetadataExtractor::to_strftime_format(const std::string& date_format)
{
    if (date_format.find('%') != std::string::npos) {
        return date_format;
    }

    std::string result;
    bool seen_hour = false;
    std::size_t pos = 0;
    while (pos < date_format.size()) {
        const std::string_view rest = std::string_view(date_format).substr(pos);
        if (rest.starts_with("YYYY")) {
            result += "%Y";
            pos += 4;
        } else if (rest.starts_with("YY")) {
            result += "%y";
            pos += 2;
        } else if (rest.starts_with("MM")) {
            result += seen_hour ? "%M" : "%m";
            pos += 2;
        } else if (rest.starts_with("DD")) {
            result += "%d";
            pos += 2;
        } else if (rest.starts_with("HH")) {
            result += "%H";
            seen_hour = true;
            pos += 2;
        } else if (rest.starts_with("SS")) {
            result += "%S";
            pos += 2;
        } else {
            result += date_format[pos];
            ++pos;
        }
    }
    return result;
}


std::optional<std::string> ImageMetadataExtractor::format_timestamp(const std::tm& time,
                                                                    const std::string& date_format)
{
    const std::string pattern = to_strftime_format(date_format);
    if (pattern.empty()) {
        return std::nullopt;
    }

    std::array<char, kMaxFormattedLength> buffer{};
    const std::size_t written = std::strftime(buffer.data(), buffer.size(), pattern.c_str(), &time);
    if (written == 0) {
        return std::nullopt;
    }
    return std::string(buffer.data(), written);
}


std::optional<std::string> ImageMetadataExtractor::extract(const std::filesystem::path& path,
                                                           const ExtractionOptions& options) const
{
    if (!is_available()) {
        return std::nullopt;
    }

    const auto values = reader_->read_tags(path, timestamp_tags());
    if (!values) {
        return std::nullopt;
    }

    for (const auto& tag : timestamp_tags()) {
        const auto it = values->find(tag);
        if (it == values->end() || it->second.empty()) {
            continue;
        }

        const auto parsed = parse_exif_datetime(it->second);
        if (!parsed) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->debug("Malformed {} '{}' in '{}'", tag, it->second, Utils::path_to_utf8(path));
            }
            return std::nullopt;
        }
        return format_timestamp(*parsed, options.date_format);
    }
    return std::nullopt;
}
