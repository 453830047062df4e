/**
 * @file whitelist_policy.hpp
 * @brief Remote-control whitelist: ordered patterns, a blacklist for the open
 *        case, plus the local-only switch.
 */
#pragma once

#include <string>
#include <vector>

namespace appmgr::auth {

/**
 * @brief Whitelist policy, replaced wholesale at runtime.
 *
 * @note Semantics:
 *  - local_only:          every remote request is denied.
 *  - patterns empty:      every remote hub not matched by the blacklist is allowed.
 *  - patterns non-empty:  first matching pattern allows; no match denies. The
 *                         blacklist is not consulted.
 *  The blacklist only gates requests; advertisement under an open policy
 *  still targets every hub.
 */
struct WhitelistPolicy final {
  std::vector<std::string> patterns;
  bool local_only{false};
  std::vector<std::string> blacklist;

  bool open() const noexcept { return !local_only && patterns.empty(); }

  bool operator==(const WhitelistPolicy&) const = default;
};

} // namespace appmgr::auth
