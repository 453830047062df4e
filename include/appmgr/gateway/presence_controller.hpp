#pragma once
/**
 * @file presence_controller.hpp
 * @brief Keeps the hub-visible endpoint set equal to the one derived from the
 *        running rapp and the whitelist policy.
 *
 * Advertised set:
 *  - empty when no rapp is targeted, the rapp is unknown, or the policy is local-only;
 *  - otherwise {endpoint × remote} where endpoints are the rapp's interfaces
 *    (or its id) under the robot's application namespace and remotes are the
 *    whitelist patterns ("*" for an open policy).
 *
 * Flips the hub refuses stay pending and are retried by the next call
 * (normally the watch loop). Never retries inline.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "appmgr/auth/authorization_gate.hpp"
#include "appmgr/config/constants.hpp"
#include "appmgr/gateway/hub_client.hpp"
#include "appmgr/gateway/robot_identity.hpp"
#include "appmgr/obs/observability.hpp"
#include "appmgr/registry/rapp_registry.hpp"

namespace appmgr::gateway {

using EndpointSet = std::set<FlipRule>;

/** @struct ReconcileReport
 *  @brief What one set_advertised() call did on the hub.
 */
struct ReconcileReport {
    std::size_t added{0};    ///< Rules newly advertised
    std::size_t removed{0};  ///< Rules withdrawn
    std::size_t failed{0};   ///< Hub calls that failed this round
    std::size_t pending{0};  ///< Rules still differing from the target afterwards
    uint64_t    seq{0};      ///< Sequence number of the PresenceEvent this call queued

    bool changed() const noexcept { return added + removed > 0; }
    bool converged() const noexcept { return pending == 0; }
};

/** @struct PresenceEvent
 *  @brief Emitted on every set_advertised() / connect(); drained by the watch loop.
 */
struct PresenceEvent {
    uint64_t                   seq{0};
    std::optional<std::string> target;     ///< Rapp targeted by the call
    ReconcileReport            report;
    bool                       connected{false};
    bool                       reconnect{false}; ///< Emitted by connect()
};

class PresenceController final {
public:
    PresenceController(HubClient& hub,
                       const registry::RappRegistry& registry,
                       const auth::AuthorizationGate& gate,
                       std::chrono::milliseconds connect_deadline =
                           std::chrono::milliseconds(config::constants::HUB_CONNECT_TIMEOUT_MS),
                       obs::Observer& observer = *obs::make_simple_observer());
    ~PresenceController();

    PresenceController(const PresenceController&)            = delete;
    PresenceController& operator=(const PresenceController&) = delete;

    /**
     * @brief Establish the outward identity with the hub (one attempt, bounded by the deadline).
     * @return ConnectionError on failure; the caller decides when to retry.
     */
    appmgr_detail::expected<void, ConnectionError> connect(const RobotIdentity& identity);

    /// Reconnect with the identity of the last connect() call.
    appmgr_detail::expected<void, ConnectionError> reconnect();

    /**
     * @brief Retarget advertisement and apply the delta to the hub.
     * @param rapp_id Running rapp, or nullopt when nothing runs.
     * @note Idempotent: an already-applied target makes no hub calls.
     */
    ReconcileReport set_advertised(std::optional<std::string> rapp_id);

    /// Live hub connection state.
    bool connected() const;

    /// True once connect() succeeded at least once (identity bound).
    bool has_identity() const;

    /// Rules currently applied on the hub.
    EndpointSet advertised() const;

    /// Rules the current target and policy call for.
    EndpointSet desired() const;

    /// Rules that differ between desired() and advertised().
    std::size_t pending() const;

    /// Last target passed to set_advertised().
    std::optional<std::string> target() const;

    /// Remove and return queued presence events (oldest first).
    std::vector<PresenceEvent> drain_events();

    /// Pure derivation of the advertised set.
    static EndpointSet compute_endpoints(const RobotIdentity& identity,
                                         const registry::RappDescriptor* rapp,
                                         const auth::WhitelistPolicy& policy);

private:
    EndpointSet desired_locked() const;
    void push_event_locked(PresenceEvent ev);

    HubClient&                     hub_;
    const registry::RappRegistry&  registry_;
    const auth::AuthorizationGate& gate_;
    std::chrono::milliseconds      deadline_;
    obs::Observer&                 obs_;

    mutable std::mutex             mu_;          ///< Serializes hub flips
    std::optional<RobotIdentity>   identity_;
    std::optional<std::string>     target_;
    EndpointSet                    applied_;
    std::deque<PresenceEvent>      events_;
    uint64_t                       seq_{0};
    std::atomic<bool>              lost_{false}; ///< Set by the hub's loss callback
};

} // namespace appmgr::gateway
