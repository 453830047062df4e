/**
* @file loopback_hub.cpp
 * @brief Implementation of the in-process hub.
 */
#include "appmgr/gateway/loopback_hub.hpp"

namespace appmgr::gateway {

    using appmgr_detail::unexpected;

    const char* to_string(HubErrc c) noexcept {
        switch (c) {
            case HubErrc::Unreachable:  return "unreachable";
            case HubErrc::Timeout:      return "timeout";
            case HubErrc::Rejected:     return "rejected";
            case HubErrc::NotConnected: return "not_connected";
        }
        return "unknown";
    }

    appmgr_detail::expected<void, ConnectionError>
    LoopbackHub::connect(const std::string& name, std::chrono::milliseconds deadline) {
        std::lock_guard<std::mutex> lk(mu_);
        stats_.connects++;
        if (!reachable_) {
            stats_.failures++;
            return unexpected(ConnectionError{HubErrc::Unreachable, "loopback hub offline"});
        }
        if (latency_ > deadline) {
            stats_.failures++;
            return unexpected(ConnectionError{HubErrc::Timeout,
                "connect latency " + std::to_string(latency_.count()) + "ms exceeds deadline " +
                std::to_string(deadline.count()) + "ms"});
        }
        if (name.empty()) {
            stats_.failures++;
            return unexpected(ConnectionError{HubErrc::Rejected, "empty robot name"});
        }
        // A new session starts with nothing advertised.
        if (!connected_ || name_ != name) advertised_.clear();
        name_ = name;
        connected_ = true;
        return {};
    }

    bool LoopbackHub::connected() const {
        std::lock_guard<std::mutex> lk(mu_);
        return connected_;
    }

    appmgr_detail::expected<void, ConnectionError> LoopbackHub::advertise(const FlipRule& rule) {
        std::lock_guard<std::mutex> lk(mu_);
        if (!connected_) { stats_.failures++; return unexpected(ConnectionError{HubErrc::NotConnected, rule.endpoint}); }
        if (!reachable_) { stats_.failures++; return unexpected(ConnectionError{HubErrc::Unreachable, rule.endpoint}); }
        advertised_.insert(rule);
        stats_.advertises++;
        return {};
    }

    appmgr_detail::expected<void, ConnectionError> LoopbackHub::withdraw(const FlipRule& rule) {
        std::lock_guard<std::mutex> lk(mu_);
        if (!connected_) { stats_.failures++; return unexpected(ConnectionError{HubErrc::NotConnected, rule.endpoint}); }
        if (!reachable_) { stats_.failures++; return unexpected(ConnectionError{HubErrc::Unreachable, rule.endpoint}); }
        advertised_.erase(rule);
        stats_.withdraws++;
        return {};
    }

    void LoopbackHub::on_connection_lost(std::function<void()> cb) {
        std::lock_guard<std::mutex> lk(mu_);
        lost_cb_ = std::move(cb);
    }

    void LoopbackHub::set_reachable(bool reachable) {
        std::lock_guard<std::mutex> lk(mu_);
        reachable_ = reachable;
    }

    void LoopbackHub::set_connect_latency(std::chrono::milliseconds latency) {
        std::lock_guard<std::mutex> lk(mu_);
        latency_ = latency;
    }

    void LoopbackHub::drop_connection() {
        std::function<void()> cb;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (!connected_) return;
            connected_ = false;
            advertised_.clear();
            cb = lost_cb_;
        }
        if (cb) cb(); // outside the lock: the callback may call back into the hub
    }

    std::set<FlipRule> LoopbackHub::advertised() const {
        std::lock_guard<std::mutex> lk(mu_);
        return advertised_;
    }

    std::string LoopbackHub::registered_name() const {
        std::lock_guard<std::mutex> lk(mu_);
        return name_;
    }

    LoopbackHub::Stats LoopbackHub::stats() const {
        std::lock_guard<std::mutex> lk(mu_);
        return stats_;
    }

} // namespace appmgr::gateway
