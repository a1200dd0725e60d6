#include "../../include/pattern_set.hpp"
#include "../../include/sync_errors.hpp"
#include "../../include/logger.hpp"
#include <cctype>

namespace flashsync {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

PatternSet PatternSet::compile(const std::string_view pattern_string) {
    PatternSet set;

    std::size_t start = 0;
    while (start <= pattern_string.size()) {
        auto end = pattern_string.find(';', start);
        if (end == std::string_view::npos) {
            end = pattern_string.size();
        }
        const auto segment = trim(pattern_string.substr(start, end - start));
        start = end + 1;
        if (segment.empty()) {
            continue;
        }

        std::string source(segment);
        try {
            set.regexes_.emplace_back(source, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            throw InvalidPatternError("Invalid pattern '" + source + "': " + e.what());
        }
        set.sources_.push_back(std::move(source));
    }

    if (set.regexes_.empty()) {
        throw InvalidPatternError("Pattern string contains no pattern");
    }

    Logger::log(LogLevel::Debug,
                "Compiled " + std::to_string(set.regexes_.size()) + " pattern(s)",
                "patterns");
    return set;
}

bool PatternSet::matches(const std::string_view file_name) const {
    for (const auto& re : regexes_) {
        if (std::regex_search(file_name.begin(), file_name.end(), re)) {
            return true;
        }
    }
    return false;
}

} // namespace flashsync
