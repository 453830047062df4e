#pragma once
/**
 * @file pattern_matcher.hpp
 * @brief Pluggable hub-identity matcher used by the authorization gate.
 * @details The gate owns evaluation order; a matcher only answers match(pattern, candidate).
 */

#include <memory>
#include <string>
#include <string_view>

namespace appmgr::auth {

    class PatternMatcher {
    public:
        virtual ~PatternMatcher() = default;

        /**
         * @brief Test a requesting hub identity against one whitelist pattern.
         * @param pattern   Whitelist entry as configured.
         * @param candidate Requesting hub identity.
         */
        virtual bool match(std::string_view pattern, std::string_view candidate) const = 0;

        /// Dialect label for logs ("glob", "regex").
        virtual const char* name() const noexcept = 0;
    };

    /// Shell-style wildcards: '*', '?', '[...]' (fnmatch semantics, whole string).
    class GlobMatcher final : public PatternMatcher {
    public:
        bool match(std::string_view pattern, std::string_view candidate) const override;
        const char* name() const noexcept override { return "glob"; }
    };

    /// ECMAScript regular expressions, anchored to the whole identity.
    /// An invalid expression never matches.
    class RegexMatcher final : public PatternMatcher {
    public:
        bool match(std::string_view pattern, std::string_view candidate) const override;
        const char* name() const noexcept override { return "regex"; }
    };

    /// Build a matcher by dialect name; nullptr for an unknown name.
    std::shared_ptr<const PatternMatcher> make_matcher(std::string_view kind);

} // namespace appmgr::auth
