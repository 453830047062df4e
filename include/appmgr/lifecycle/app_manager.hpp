#pragma once
/**
 * @file app_manager.hpp
 * @brief Single-tenant rapp lifecycle: start/stop/status with authorization,
 *        child supervision and advertisement updates.
 *
 * Concurrency:
 *  - One mutex guards LifecycleState and everything tied to it; every state
 *    change goes through transition_locked().
 *  - Process launch, termination waits and hub flips run outside that mutex.
 *  - Child exits arrive on a supervisor thread via notify_child_exit(), tagged
 *    with the launch generation so stale notifications are dropped.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "appmgr/auth/authorization_gate.hpp"
#include "appmgr/compat/expected.hpp"
#include "appmgr/config/constants.hpp"
#include "appmgr/gateway/presence_controller.hpp"
#include "appmgr/gateway/robot_identity.hpp"
#include "appmgr/lifecycle/lifecycle_state.hpp"
#include "appmgr/obs/observability.hpp"
#include "appmgr/os/process.hpp"
#include "appmgr/registry/rapp_registry.hpp"

namespace appmgr::lifecycle {

/** @struct CallerContext
 *  @brief Origin of a control request.
 */
struct CallerContext {
    bool        is_local{true}; ///< Issued on this robot
    std::string hub;            ///< Requesting hub identity (remote only)

    static CallerContext local() { return {}; }
    static CallerContext remote(std::string hub_identity) { return {false, std::move(hub_identity)}; }
};

enum class StartError : std::uint8_t {
    AlreadyRunning, ///< Another rapp occupies the slot
    NotFound,       ///< Identifier not in the registry
    NotRunnable,    ///< Installed, but required capabilities are unavailable
    Unauthorized,   ///< Remote caller denied by the whitelist
    LaunchError     ///< Entry point could not be started
};

enum class StopError : std::uint8_t {
    NotRunning,     ///< Nothing to stop (or a stop is already underway)
    Unauthorized    ///< Remote caller denied by the whitelist
};

enum class InviteError : std::uint8_t {
    LocalCaller,    ///< Invitations come from remote hubs only
    Unauthorized,   ///< Hub denied by the whitelist or blacklist
    Busy,           ///< Another hub holds the invitation
    NotInvited      ///< Cancel from a hub that does not hold the invitation
};

const char* to_string(StartError e) noexcept;
const char* to_string(StopError e) noexcept;
const char* to_string(InviteError e) noexcept;

/// Topic/service remapping handed to the rapp as a `from:=to` argument.
struct Remapping {
    std::string from;
    std::string to;
};

struct StartAccepted {
    std::string rapp_id;
    int         pid{0};
};

struct StopAccepted {
    std::string rapp_id;
    bool        forced{false}; ///< Graceful bound exceeded; child was killed
};

struct InviteAccepted {
    std::string                hub;
    bool                       repeated{false}; ///< Hub already held the invitation
    std::optional<std::string> stopped;         ///< Rapp stopped when the invitation was cancelled
};

struct StatusReport {
    LifecycleState             state{LifecycleState::Idle};
    std::optional<std::string> rapp_id;           ///< Set whenever state != Idle
    std::string                remote_controller; ///< Hub that started the current rapp ("" = local)
    std::string                invited;           ///< Hub holding the invitation ("" = none)
    uint64_t                   transitions{0};
};

struct RappListing {
    registry::RappDescriptor descriptor;
    bool runnable{false};
    bool running{false};
};

struct PlatformInfo {
    std::string name;                  ///< Effective robot name
    std::string robot_type;
    std::string application_namespace;
};

/** @struct ManagerOptions
 *  @brief Tunables; defaults come from constants.hpp.
 */
struct ManagerOptions {
    std::vector<std::string>  capabilities;      ///< Capabilities available on this robot
    std::string               robot_type{config::constants::ROBOT_TYPE_DEFAULT};
    std::chrono::milliseconds stop_grace{config::constants::STOP_GRACE_MS_DEFAULT};
    std::chrono::milliseconds kill_grace{config::constants::KILL_GRACE_MS_DEFAULT};
    bool                      rapp_output_to_screen{false};
};

class AppManager final {
public:
    AppManager(const registry::RappRegistry& registry,
               const auth::AuthorizationGate& gate,
               gateway::PresenceController& presence,
               os::ProcessLauncher& launcher,
               gateway::RobotIdentity identity,
               ManagerOptions options = {},
               obs::Observer& observer = *obs::make_simple_observer());

    /// Stops a running rapp and waits for every supervisor thread.
    ~AppManager();

    AppManager(const AppManager&)            = delete;
    AppManager& operator=(const AppManager&) = delete;

    /**
     * @brief Start @p rapp_id if the slot is free.
     * Order of checks: authorization, single-tenancy, lookup, capabilities, launch.
     * @param remappings Appended to the rapp's parameters as `from:=to`.
     */
    appmgr_detail::expected<StartAccepted, StartError>
    start(std::string_view rapp_id, const CallerContext& caller,
          const std::vector<Remapping>& remappings = {});

    /**
     * @brief Stop the running rapp: SIGTERM, bounded wait, then SIGKILL.
     * A stop issued while Starting waits for the launch to resolve first.
     */
    appmgr_detail::expected<StopAccepted, StopError>
    stop(const CallerContext& caller);

    /**
     * @brief Bind the requesting hub as this robot's controller.
     * While bound, remote start/stop from any other hub is refused.
     * A repeat invite from the bound hub is accepted and changes nothing.
     */
    appmgr_detail::expected<InviteAccepted, InviteError> invite(const CallerContext& caller);

    /// Release the binding held by the requesting hub and stop whatever runs.
    appmgr_detail::expected<InviteAccepted, InviteError> cancel_invite(const CallerContext& caller);

    /// Read-only snapshot; always succeeds.
    StatusReport status() const;

    /// Rapp to advertise right now: the running id, or nullopt.
    std::optional<std::string> advertised_target() const;

    /// Installed rapps with runnable/running flags, in registry order.
    std::vector<RappListing> list_rapps() const;

    PlatformInfo platform_info() const;

    /// Recent transitions, oldest first.
    std::vector<Transition> history() const;

    /// True when every required capability of @p rapp is available.
    bool runnable(const registry::RappDescriptor& rapp) const;

    /**
     * @brief Child-exit event entry point (called from the supervisor thread).
     * @param generation Launch generation the child belongs to.
     */
    void notify_child_exit(uint64_t generation, const os::ExitStatus& status);

    /// Stop whatever runs (local authority). nullopt when idle.
    std::optional<StopAccepted> shutdown();

private:
    bool admitted_locked(const CallerContext& caller) const;
    void transition_locked(LifecycleState to);
    void clear_slot_locked();
    void note(obs::Severity sev, obs::Kind kind, std::string msg) const;

    const registry::RappRegistry&  registry_;
    const auth::AuthorizationGate& gate_;
    gateway::PresenceController&   presence_;
    os::ProcessLauncher&           launcher_;
    const gateway::RobotIdentity   identity_;
    const ManagerOptions           opts_;
    obs::Observer&                 obs_;

    mutable std::mutex             mu_;
    std::condition_variable        cv_;                ///< Signalled when Starting resolves
    LifecycleState                 state_{LifecycleState::Idle};
    std::optional<std::string>     current_;
    std::string                    controller_;
    std::string                    invited_;           ///< Bound controller hub, survives rapp runs
    uint64_t                       generation_{0};
    std::optional<os::ExitStatus>  early_exit_;        ///< Exit seen while still Starting
    std::unique_ptr<os::ProcessHandle> child_;
    std::vector<std::unique_ptr<os::ProcessHandle>> retired_; ///< Exited children awaiting release
    std::deque<Transition>         history_;
    uint64_t                       transitions_{0};
};

} // namespace appmgr::lifecycle
