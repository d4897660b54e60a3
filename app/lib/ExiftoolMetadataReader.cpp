#include "ExiftoolMetadataReader.hpp"

#include "ExternalTool.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#if __has_include(<jsoncpp/json/json.h>)
#include <jsoncpp/json/json.h>
#elif __has_include(<json/json.h>)
#include <json/json.h>
#else
#error "jsoncpp headers not found. Install jsoncpp development files."
#endif

#include <sstream>
#include <utility>

ExiftoolMetadataReader::ExiftoolMetadataReader(std::string executable, int timeout_ms)
    : executable_(std::move(executable)),
      timeout_ms_(timeout_ms)
{}


bool ExiftoolMetadataReader::is_available() const
{
    return ExternalTool::find_executable(executable_).has_value();
}


std::optional<std::map<std::string, std::string>>
ExiftoolMetadataReader::read_tags(const std::filesystem::path& path,
                                  const std::vector<std::string>& tags) const
{
    const auto program = ExternalTool::find_executable(executable_);
    if (!program) {
        return std::nullopt;
    }

    std::vector<std::string> args{"-j", "-charset", "filename=UTF8"};
    for (const auto& tag : tags) {
        args.push_back("-EXIF:" + tag);
    }
    args.push_back(Utils::path_to_utf8(path));

    const auto output = ExternalTool::run_process(*program, args, timeout_ms_);
    if (!output) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("exiftool could not read '{}'", Utils::path_to_utf8(path));
        }
        return std::nullopt;
    }
    return parse_json(*output, tags);
}


std::optional<std::map<std::string, std::string>>
ExiftoolMetadataReader::parse_json(const std::string& json, const std::vector<std::string>& tags)
{
    Json::CharReaderBuilder reader;
    Json::Value root;
    std::string errors;
    std::istringstream stream(json);
    if (!Json::parseFromStream(reader, stream, &root, &errors)) {
        return std::nullopt;
    }
    if (!root.isArray() || root.empty() || !root[0].isObject()) {
        return std::nullopt;
    }

    const Json::Value& entry = root[0];
    std::map<std::string, std::string> values;
    for (const auto& tag : tags) {
        if (!entry.isMember(tag)) {
            continue;
        }
        const Json::Value& value = entry[tag];
        if (value.isString() || value.isNumeric() || value.isBool()) {
            values[tag] = value.asString();
        }
    }
    return values;
}
