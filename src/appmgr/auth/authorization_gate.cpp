#include "appmgr/auth/authorization_gate.hpp"

#include <string>

namespace appmgr::auth {

const char* to_string(Verdict v) noexcept {
    return v == Verdict::Allow ? "allow" : "deny";
}

AuthorizationGate::AuthorizationGate(std::shared_ptr<const PatternMatcher> matcher,
                                     WhitelistPolicy initial,
                                     obs::Observer& observer)
    : matcher_(matcher ? std::move(matcher) : std::make_shared<GlobMatcher>()),
      policy_(std::make_shared<const WhitelistPolicy>(std::move(initial))),
      obs_(observer) {}

std::shared_ptr<const WhitelistPolicy> AuthorizationGate::policy() const noexcept {
    return std::atomic_load_explicit(&policy_, std::memory_order_acquire);
}

namespace {

std::string summarize(const WhitelistPolicy& p) {
    if (p.local_only) return "local-only";
    if (!p.patterns.empty()) return std::to_string(p.patterns.size()) + " pattern(s)";
    if (!p.blacklist.empty()) return "open, " + std::to_string(p.blacklist.size()) + " blacklisted";
    return "open";
}

} // namespace

uint64_t AuthorizationGate::publish_locked(WhitelistPolicy policy) {
    const std::string summary = summarize(policy);
    std::shared_ptr<const WhitelistPolicy> next = std::make_shared<const WhitelistPolicy>(std::move(policy));
    std::atomic_store_explicit(&policy_, std::move(next), std::memory_order_release);
    const uint64_t v = version_.fetch_add(1, std::memory_order_relaxed) + 1;
    obs_.record({obs::Severity::Info, obs::Kind::Note, "auth", "whitelist policy replaced: " + summary});
    return v;
}

void AuthorizationGate::set_policy(WhitelistPolicy policy) {
    std::lock_guard<std::mutex> lk(write_mu_);
    publish_locked(std::move(policy));
}

uint64_t AuthorizationGate::update_policy(const std::function<void(WhitelistPolicy&)>& edit) {
    std::lock_guard<std::mutex> lk(write_mu_);
    WhitelistPolicy next = *policy();
    edit(next);
    return publish_locked(std::move(next));
}

Verdict AuthorizationGate::evaluate_with(const WhitelistPolicy& policy,
                                         std::string_view requesting_hub, bool is_local) const {
    if (is_local) return Verdict::Allow;
    if (policy.local_only) return Verdict::Deny;
    if (policy.patterns.empty()) {
        for (const auto& pattern : policy.blacklist) {
            if (matcher_->match(pattern, requesting_hub)) return Verdict::Deny;
        }
        return Verdict::Allow;
    }
    for (const auto& pattern : policy.patterns) {
        if (matcher_->match(pattern, requesting_hub)) return Verdict::Allow;
    }
    return Verdict::Deny;
}

Verdict AuthorizationGate::evaluate(std::string_view requesting_hub, bool is_local) const {
    const auto snap = policy();
    const auto verdict = evaluate_with(*snap, requesting_hub, is_local);
    if (verdict == Verdict::Deny) {
        obs_.record({obs::Severity::Warn, obs::Kind::AuthDenied, "auth",
                     "denied remote request from '" + std::string(requesting_hub) + "'" +
                     (snap->local_only ? " (local-only)" : (snap->patterns.empty() ? " (blacklisted)" : ""))});
    }
    return verdict;
}

} // namespace appmgr::auth
