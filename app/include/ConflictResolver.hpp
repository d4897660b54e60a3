#ifndef CONFLICT_RESOLVER_HPP
#define CONFLICT_RESOLVER_HPP

#include "NameSet.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

/**
 * @brief Turns a candidate name into one that is absent from a name set.
 *
 * Taken names get a numbered suffix inserted before the extension, using a
 * template with one integer slot written "{n}" or "{}" (e.g. "({n})" gives
 * "report(2).pdf"). When every attempt collides, a seconds-resolution
 * timestamp is appended to the stem instead; that fallback is not checked
 * against the set again.
 */
class ConflictResolver {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr int kDefaultMaxAttempts = 1000;

    /**
     * @param suffix_format Template with exactly one "{n}" or "{}" slot.
     * @param max_attempts Numbered names tried before the timestamp fallback.
     * @param max_length Upper bound in code points for produced names; the stem
     * is shortened to make room for the suffix. Zero disables the bound.
     * @throws ErrorCodes::AppException for a template without a slot or a
     * non-positive attempt count.
     */
    explicit ConflictResolver(std::string suffix_format = "({n})",
                              int max_attempts = kDefaultMaxAttempts,
                              std::size_t max_length = 0,
                              Clock clock = {});

    std::string resolve(const std::string& candidate, const INameSet& existing) const;

    /**
     * @brief Renders the suffix template for attempt @p number.
     */
    std::string format_suffix(int number) const;

    /**
     * @brief True when @p suffix_format contains a "{n}" or "{}" slot.
     */
    static bool is_valid_suffix_format(const std::string& suffix_format);

private:
    std::string compose(const std::string& stem,
                        const std::string& insert,
                        const std::string& extension) const;
    std::string timestamp_fallback(const std::string& stem, const std::string& extension) const;

    std::string suffix_format_;
    int max_attempts_;
    std::size_t max_length_;
    Clock clock_;
};

/**
 * @brief Convenience wrapper around ConflictResolver::resolve.
 */
std::string resolve_filename_conflicts(const std::string& candidate,
                                       const INameSet& existing,
                                       const std::string& suffix_format = "({n})",
                                       int max_attempts = ConflictResolver::kDefaultMaxAttempts);

#endif
