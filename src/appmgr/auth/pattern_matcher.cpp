/**
 * @file pattern_matcher.cpp
 * @brief Glob (fnmatch) and regex matcher implementations.
 */
#include "appmgr/auth/pattern_matcher.hpp"

#include <fnmatch.h>
#include <regex>
#include <string>

namespace appmgr::auth {

bool GlobMatcher::match(std::string_view pattern, std::string_view candidate) const {
    // fnmatch needs NUL-terminated input
    const std::string p(pattern);
    const std::string c(candidate);
    return ::fnmatch(p.c_str(), c.c_str(), 0) == 0;
}

bool RegexMatcher::match(std::string_view pattern, std::string_view candidate) const {
    try {
        const std::regex re(pattern.begin(), pattern.end(), std::regex::ECMAScript);
        return std::regex_match(candidate.begin(), candidate.end(), re);
    } catch (const std::regex_error&) {
        return false;
    }
}

std::shared_ptr<const PatternMatcher> make_matcher(std::string_view kind) {
    if (kind == "glob")  return std::make_shared<GlobMatcher>();
    if (kind == "regex") return std::make_shared<RegexMatcher>();
    return nullptr;
}

} // namespace appmgr::auth
