/**
 * @file presence_controller.cpp
 * @brief Advertised-set derivation and hub delta application.
 */
#include "appmgr/gateway/presence_controller.hpp"

#include <algorithm>
#include <iterator>

namespace appmgr::gateway {

using appmgr_detail::unexpected;

namespace {

std::size_t symmetric_difference_size(const EndpointSet& a, const EndpointSet& b) {
    std::size_t n = 0;
    for (const auto& r : a) if (!b.contains(r)) ++n;
    for (const auto& r : b) if (!a.contains(r)) ++n;
    return n;
}

std::string describe(const std::optional<std::string>& target) {
    return target ? "'" + *target + "'" : std::string("none");
}

} // namespace

PresenceController::PresenceController(HubClient& hub,
                                       const registry::RappRegistry& registry,
                                       const auth::AuthorizationGate& gate,
                                       std::chrono::milliseconds connect_deadline,
                                       obs::Observer& observer)
    : hub_(hub), registry_(registry), gate_(gate), deadline_(connect_deadline), obs_(observer) {
    hub_.on_connection_lost([this] {
        lost_.store(true, std::memory_order_release);
        obs_.record({obs::Severity::Warn, obs::Kind::ConnectionLost, "presence", "hub connection lost"});
    });
}

PresenceController::~PresenceController() {
    hub_.on_connection_lost(nullptr);
}

EndpointSet PresenceController::compute_endpoints(const RobotIdentity& identity,
                                                  const registry::RappDescriptor* rapp,
                                                  const auth::WhitelistPolicy& policy) {
    EndpointSet out;
    if (!rapp || policy.local_only) return out;

    const std::string ns = "/" + identity.application_namespace() + "/";
    std::vector<std::string> names;
    if (rapp->interfaces.empty()) {
        names.push_back(ns + rapp->id);
    } else {
        for (const auto& iface : rapp->interfaces) {
            names.push_back(!iface.empty() && iface.front() == '/' ? iface : ns + iface);
        }
    }

    const std::vector<std::string> any{config::constants::ANY_HUB};
    const auto& remotes = policy.patterns.empty() ? any : policy.patterns;
    for (const auto& n : names) {
        for (const auto& r : remotes) out.insert(FlipRule{n, r});
    }
    return out;
}

EndpointSet PresenceController::desired_locked() const {
    if (!identity_ || !target_) return {};
    const auto policy = gate_.policy();
    return compute_endpoints(*identity_, registry_.find(*target_), *policy);
}

void PresenceController::push_event_locked(PresenceEvent ev) {
    ev.seq = ++seq_;
    events_.push_back(std::move(ev));
    while (events_.size() > config::constants::PRESENCE_EVENT_QUEUE_MAX) events_.pop_front();
}

appmgr_detail::expected<void, ConnectionError> PresenceController::connect(const RobotIdentity& identity) {
    std::lock_guard<std::mutex> lk(mu_);
    identity_ = identity;
    auto res = hub_.connect(identity.effective_name(), deadline_);
    if (!res) {
        obs_.record({obs::Severity::Warn, obs::Kind::Note, "presence",
                     std::string("hub connect failed (") + to_string(res.error().code) + "): " + res.error().detail});
        return unexpected(res.error());
    }
    // Fresh session: the hub holds nothing of ours.
    lost_.store(false, std::memory_order_release);
    applied_.clear();
    obs_.record({obs::Severity::Info, obs::Kind::Reconnect, "presence",
                 "connected to hub as '" + identity.effective_name() + "'"});
    PresenceEvent ev;
    ev.target = target_;
    ev.connected = true;
    ev.reconnect = true;
    ev.report.pending = desired_locked().size();
    push_event_locked(std::move(ev));
    return {};
}

appmgr_detail::expected<void, ConnectionError> PresenceController::reconnect() {
    std::optional<RobotIdentity> id;
    {
        std::lock_guard<std::mutex> lk(mu_);
        id = identity_;
    }
    if (!id) return unexpected(ConnectionError{HubErrc::NotConnected, "no identity bound yet"});
    return connect(*id);
}

ReconcileReport PresenceController::set_advertised(std::optional<std::string> rapp_id) {
    std::lock_guard<std::mutex> lk(mu_);
    if (lost_.exchange(false, std::memory_order_acq_rel)) applied_.clear();

    target_ = std::move(rapp_id);
    const EndpointSet want = desired_locked();
    ReconcileReport rep;

    if (want != applied_) {
        const bool live = hub_.connected();
        std::vector<FlipRule> to_remove, to_add;
        std::set_difference(applied_.begin(), applied_.end(), want.begin(), want.end(), std::back_inserter(to_remove));
        std::set_difference(want.begin(), want.end(), applied_.begin(), applied_.end(), std::back_inserter(to_add));

        if (!live) {
            rep.failed = to_remove.size() + to_add.size();
        } else {
            for (const auto& r : to_remove) {
                if (auto res = hub_.withdraw(r); res) {
                    applied_.erase(r);
                    rep.removed++;
                    obs_.record({obs::Severity::Info, obs::Kind::Flip, "presence", "withdrew " + r.endpoint + " -> " + r.remote});
                } else {
                    rep.failed++;
                    obs_.record({obs::Severity::Warn, obs::Kind::FlipFailure, "presence",
                                 "withdraw " + r.endpoint + " failed (" + to_string(res.error().code) + "), pending"});
                }
            }
            for (const auto& r : to_add) {
                if (auto res = hub_.advertise(r); res) {
                    applied_.insert(r);
                    rep.added++;
                    obs_.record({obs::Severity::Info, obs::Kind::Flip, "presence", "advertised " + r.endpoint + " -> " + r.remote});
                } else {
                    rep.failed++;
                    obs_.record({obs::Severity::Warn, obs::Kind::FlipFailure, "presence",
                                 "advertise " + r.endpoint + " failed (" + to_string(res.error().code) + "), pending"});
                }
            }
        }
        rep.pending = symmetric_difference_size(want, applied_);
        if (!live) {
            obs_.record({obs::Severity::Warn, obs::Kind::FlipFailure, "presence",
                         "hub not connected; " + std::to_string(rep.pending) + " flip(s) pending for target " + describe(target_)});
        }
    }

    rep.seq = seq_ + 1; // assigned by push_event_locked()
    PresenceEvent ev;
    ev.target = target_;
    ev.report = rep;
    ev.connected = hub_.connected();
    push_event_locked(std::move(ev));
    return rep;
}

bool PresenceController::connected() const {
    return hub_.connected() && !lost_.load(std::memory_order_acquire);
}

bool PresenceController::has_identity() const {
    std::lock_guard<std::mutex> lk(mu_);
    return identity_.has_value();
}

EndpointSet PresenceController::advertised() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (lost_.load(std::memory_order_acquire)) return {};
    return applied_;
}

EndpointSet PresenceController::desired() const {
    std::lock_guard<std::mutex> lk(mu_);
    return desired_locked();
}

std::size_t PresenceController::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    const EndpointSet none;
    return symmetric_difference_size(desired_locked(), lost_.load(std::memory_order_acquire) ? none : applied_);
}

std::optional<std::string> PresenceController::target() const {
    std::lock_guard<std::mutex> lk(mu_);
    return target_;
}

std::vector<PresenceEvent> PresenceController::drain_events() {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<PresenceEvent> out(std::make_move_iterator(events_.begin()), std::make_move_iterator(events_.end()));
    events_.clear();
    return out;
}

} // namespace appmgr::gateway
