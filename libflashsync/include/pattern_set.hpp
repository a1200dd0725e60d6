/**
 * @file pattern_set.hpp
 * @brief Compiled set of file-name patterns.
 */

#ifndef FLASHSYNC_PATTERN_SET_HPP
#define FLASHSYNC_PATTERN_SET_HPP

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace flashsync {

/**
 * @brief Ordered list of case-insensitive regular expressions.
 *
 * @details Built from a semicolon-separated string: every segment is trimmed,
 * empty segments are dropped, and the rest are compiled with
 * std::regex::icase. A name matches the set if any pattern is found
 * anywhere in it (std::regex_search, no implicit anchoring).
 */
class PatternSet {
public:
    /**
     * @brief Compile a pattern string such as ".*\\.txt;^report_".
     * @throws InvalidPatternError if no non-empty segment remains or a
     *         segment is rejected by the regex engine.
     */
    static PatternSet compile(std::string_view pattern_string);

    /**
     * @brief True if any pattern matches somewhere in @p file_name.
     */
    [[nodiscard]] bool matches(std::string_view file_name) const;

    [[nodiscard]] std::size_t size() const { return regexes_.size(); }

    /// Trimmed source text of each pattern, in input order.
    [[nodiscard]] const std::vector<std::string>& sources() const { return sources_; }

private:
    PatternSet() = default;

    std::vector<std::regex> regexes_;
    std::vector<std::string> sources_;
};

/**
 * @brief Strip leading and trailing whitespace.
 */
std::string_view trim(std::string_view s);

} // namespace flashsync

#endif // FLASHSYNC_PATTERN_SET_HPP
