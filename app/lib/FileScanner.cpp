#include "FileScanner.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <array>
#include <string_view>
#include <system_error>

namespace {
constexpr std::array<std::string_view, 3> kJunkNames = {".DS_Store", "Thumbs.db", "desktop.ini"};

[[noreturn]] void throw_unreadable(const std::string& directory, const std::error_code& ec)
{
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->warn("Error while listing '{}': {}", directory, ec.message());
    }
    THROW_APP_ERROR_MSG(ErrorCodes::Code::DIRECTORY_ACCESS_DENIED,
                        "Cannot read directory " + directory, ec.message());
}
}

FileScanner::FileScanner(bool include_hidden)
    : include_hidden_(include_hidden)
{}


std::vector<std::string> FileScanner::list_file_names(const std::filesystem::path& directory) const
{
    const std::string display = Utils::path_to_utf8(directory);

    std::error_code ec;
    if (!std::filesystem::exists(directory, ec)) {
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_NOT_FOUND, display);
    }
    if (!std::filesystem::is_directory(directory, ec)) {
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_INVALID, display);
    }

    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        throw_unreadable(display, ec);
    }

    std::vector<std::string> names;
    for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        std::string name = Utils::path_to_utf8(it->path().filename());
        if (accepts(name)) {
            names.push_back(std::move(name));
        }
    }
    // increment() reports a failed read by setting ec and ending the loop
    if (ec) {
        throw_unreadable(display, ec);
    }

    std::sort(names.begin(), names.end());

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Found {} file(s) in '{}'", names.size(), display);
    }
    return names;
}


bool FileScanner::is_junk_file(const std::string& name)
{
    return std::find(kJunkNames.begin(), kJunkNames.end(), name) != kJunkNames.end();
}


bool FileScanner::is_hidden(const std::string& name)
{
    return name.starts_with('.');
}


bool FileScanner::accepts(const std::string& name) const
{
    if (is_junk_file(name)) {
        return false;
    }
    return include_hidden_ || !is_hidden(name);
}
