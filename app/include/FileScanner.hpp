#ifndef FILE_SCANNER_HPP
#define FILE_SCANNER_HPP

#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Collects the names of the regular files directly inside a directory.
 *
 * Subdirectories are never entered. Names starting with a dot are left out
 * unless hidden files are requested; OS metadata files are always left out.
 */
class FileScanner {
public:
    explicit FileScanner(bool include_hidden = false);

    /**
     * @brief File names (not paths) in byte order.
     * @throws ErrorCodes::AppException DIRECTORY_NOT_FOUND, DIRECTORY_INVALID or
     * DIRECTORY_ACCESS_DENIED.
     */
    std::vector<std::string> list_file_names(const std::filesystem::path& directory) const;

    static bool is_junk_file(const std::string& name);
    static bool is_hidden(const std::string& name);

private:
    bool accepts(const std::string& name) const;

    bool include_hidden_;
};

#endif
