#include "NameSet.hpp"
#include "Utils.hpp"

#include <system_error>

DirectoryNameSet::DirectoryNameSet(std::filesystem::path directory)
    : directory_(std::move(directory))
{}


bool DirectoryNameSet::contains(const std::string& name) const
{
    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        return false;
    }
    const auto candidate = directory_ / Utils::utf8_to_path(name);
    // symlink_status so that dangling links still count as taken
    const auto status = std::filesystem::symlink_status(candidate, ec);
    return !ec && std::filesystem::exists(status);
}


bool DirectoryNameSet::directory_exists() const
{
    std::error_code ec;
    return std::filesystem::is_directory(directory_, ec);
}


InMemoryNameSet::InMemoryNameSet(std::initializer_list<std::string> names)
    : names_(names)
{}


InMemoryNameSet::InMemoryNameSet(const std::vector<std::string>& names)
    : names_(names.begin(), names.end())
{}


bool InMemoryNameSet::contains(const std::string& name) const
{
    return names_.contains(name);
}


void InMemoryNameSet::insert(const std::string& name)
{
    names_.insert(name);
}
