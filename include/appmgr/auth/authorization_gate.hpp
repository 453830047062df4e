#pragma once
// App Manager: AuthorizationGate
// Concurrency Model: RCU via atomic shared_ptr snapshot swap (same as the registry
// snapshots elsewhere in the tree).
//   • evaluate() takes one snapshot (ACQUIRE) and decides against it only, so a
//     concurrent set_policy() is never observed half-applied.
//   • set_policy() publishes a complete new policy (RELEASE); in-flight
//     evaluations finish against the policy they started with.
//   • Writers serialize on a mutex, so update_policy() read-modify-writes
//     never lose a concurrent edit. Readers never take it.

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>

#include "appmgr/auth/pattern_matcher.hpp"
#include "appmgr/auth/whitelist_policy.hpp"
#include "appmgr/obs/observability.hpp"

namespace appmgr::auth {

/// Outcome of a gate evaluation.
enum class Verdict : std::uint8_t { Allow, Deny };

const char* to_string(Verdict v) noexcept;

class AuthorizationGate final {
public:
    /**
     * @param matcher  Pattern dialect; defaults to glob when null.
     * @param initial  Policy in effect until the first set_policy().
     */
    explicit AuthorizationGate(std::shared_ptr<const PatternMatcher> matcher = nullptr,
                               WhitelistPolicy initial = {},
                               obs::Observer& observer = *obs::make_simple_observer());

    AuthorizationGate(const AuthorizationGate&)            = delete;
    AuthorizationGate& operator=(const AuthorizationGate&) = delete;

    /// Atomically replace the active policy.
    void set_policy(WhitelistPolicy policy);

    /**
     * @brief Copy the active policy, let @p edit change it, publish the result.
     * Concurrent updates apply one after another.
     * @return Version after the update.
     */
    uint64_t update_policy(const std::function<void(WhitelistPolicy&)>& edit);

    /// Consistent snapshot of the active policy.
    std::shared_ptr<const WhitelistPolicy> policy() const noexcept;

    /**
     * @brief Decide a control request.
     * @param requesting_hub Hub identity the request is tagged with (ignored when local).
     * @param is_local       True for requests issued on this robot.
     */
    Verdict evaluate(std::string_view requesting_hub, bool is_local) const;

    /// Same rules, against an explicit policy (no snapshot, no logging).
    Verdict evaluate_with(const WhitelistPolicy& policy,
                          std::string_view requesting_hub, bool is_local) const;

    /// Monotonic counter, incremented on every set_policy().
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    const PatternMatcher& matcher() const noexcept { return *matcher_; }

private:
    uint64_t publish_locked(WhitelistPolicy policy);

    std::shared_ptr<const PatternMatcher>  matcher_;
    std::shared_ptr<const WhitelistPolicy> policy_;
    std::mutex                             write_mu_; ///< Serializes writers
    std::atomic<uint64_t>                  version_{0};
    obs::Observer&                         obs_;
};

} // namespace appmgr::auth
