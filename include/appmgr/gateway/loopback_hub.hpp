#pragma once
/**
 * @file loopback_hub.hpp
 * @brief In-process hub with controllable reachability and latency.
 * @details Serves standalone robots (no gateway deployed) and tests. Mirrors
 *          gateway semantics: a dropped connection forgets every flip.
 */

#include "appmgr/gateway/hub_client.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <string>

namespace appmgr::gateway {

    class LoopbackHub final : public HubClient {
    public:
        appmgr_detail::expected<void, ConnectionError>
        connect(const std::string& name, std::chrono::milliseconds deadline) override;
        bool connected() const override;
        appmgr_detail::expected<void, ConnectionError> advertise(const FlipRule& rule) override;
        appmgr_detail::expected<void, ConnectionError> withdraw(const FlipRule& rule) override;
        void on_connection_lost(std::function<void()> cb) override;

        // --------------------------- Simulation knobs ----------------------------
        /// Unreachable hubs fail connect() and every flip.
        void set_reachable(bool reachable);
        /// Simulated connect latency; compared against the caller's deadline.
        void set_connect_latency(std::chrono::milliseconds latency);
        /// Drop the session: forget flips, then fire the loss callback.
        void drop_connection();

        // --------------------------- Inspection ----------------------------------
        std::set<FlipRule> advertised() const;
        std::string registered_name() const;

        struct Stats {
            uint64_t connects{0}, advertises{0}, withdraws{0}, failures{0};
        };
        Stats stats() const;

    private:
        mutable std::mutex         mu_;
        bool                       reachable_{true};
        bool                       connected_{false};
        std::chrono::milliseconds  latency_{0};
        std::string                name_;
        std::set<FlipRule>         advertised_;
        std::function<void()>      lost_cb_;
        Stats                      stats_;
    };

} // namespace appmgr::gateway
