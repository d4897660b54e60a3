#ifndef NAME_SET_HPP
#define NAME_SET_HPP

#include <filesystem>
#include <initializer_list>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * @brief Read-only view of names that are already taken.
 */
class INameSet {
public:
    virtual ~INameSet() = default;
    virtual bool contains(const std::string& name) const = 0;
};

/**
 * @brief Names present in a directory, queried live at each lookup.
 *
 * A directory that does not exist contains nothing.
 */
class DirectoryNameSet : public INameSet {
public:
    explicit DirectoryNameSet(std::filesystem::path directory);

    bool contains(const std::string& name) const override;
    bool directory_exists() const;
    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path directory_;
};

/**
 * @brief Names claimed in memory, e.g. by earlier entries of a batch.
 */
class InMemoryNameSet : public INameSet {
public:
    InMemoryNameSet() = default;
    InMemoryNameSet(std::initializer_list<std::string> names);
    explicit InMemoryNameSet(const std::vector<std::string>& names);

    bool contains(const std::string& name) const override;
    void insert(const std::string& name);
    std::size_t size() const { return names_.size(); }

private:
    std::unordered_set<std::string> names_;
};

/**
 * @brief Union of two name sets. Both must outlive the view.
 */
class CombinedNameSet : public INameSet {
public:
    CombinedNameSet(const INameSet& first, const INameSet& second)
        : first_(first), second_(second) {}

    bool contains(const std::string& name) const override {
        return first_.contains(name) || second_.contains(name);
    }

private:
    const INameSet& first_;
    const INameSet& second_;
};

#endif
