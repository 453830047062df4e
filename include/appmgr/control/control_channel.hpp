#pragma once
/**
 * @file control_channel.hpp
 * @brief Text control surface over the manager: request parsing and dispatch.
 *
 * Line grammar (whitespace separated):
 *   start <rapp_id> [from:=to ...] | stop | status | list | platform | health
 *   whitelist <p1,p2,...|->      ("-" clears the list: open policy)
 *   blacklist <p1,p2,...|->      (consulted only while the whitelist is empty)
 *   local-only on|off
 *   invite | cancel              (bind/release the requesting hub as controller)
 *   as <hub> <command...>       (tag the request with a remote hub identity)
 *
 * Policy changes are accepted from local callers only. The `as <hub>` tag is
 * asserted by whoever writes the line; it is not authenticated.
 */

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "appmgr/auth/authorization_gate.hpp"
#include "appmgr/compat/expected.hpp"
#include "appmgr/gateway/presence_controller.hpp"
#include "appmgr/lifecycle/app_manager.hpp"
#include "appmgr/watch/watch_loop.hpp"

namespace appmgr::control {

enum class Command : std::uint8_t {
    Start,
    Stop,
    Status,
    List,
    Platform,
    Health,
    Whitelist,
    Blacklist,
    LocalOnly,
    Invite,
    Cancel
};

const char* to_string(Command c) noexcept;

struct ControlRequest {
    Command                  command{Command::Status};
    lifecycle::CallerContext caller;
    std::string              rapp_id;   ///< Start
    std::vector<lifecycle::Remapping> remappings; ///< Start
    std::vector<std::string> patterns;  ///< Whitelist, Blacklist
    bool                     flag{false}; ///< LocalOnly
};

struct ControlResponse {
    bool        ok{false};
    std::string outcome; ///< "accepted", "not_found", "unauthorized", ...
    std::string message; ///< Human-readable detail
};

/// Parse one command line. Error text names what was wrong.
appmgr_detail::expected<ControlRequest, std::string> parse_command(std::string_view line);

/// One reply line: "ok <outcome>[: message]" or "error <outcome>[: message]".
std::string format_response(const ControlResponse& resp);

class ControlChannel final {
public:
    ControlChannel(lifecycle::AppManager& manager,
                   auth::AuthorizationGate& gate,
                   gateway::PresenceController& presence,
                   const watch::WatchLoop* watch = nullptr,
                   obs::Observer& observer = *obs::make_simple_observer());

    ControlResponse handle(const ControlRequest& req);

    /// parse_command() + handle(); parse errors become outcome "bad_request".
    ControlResponse handle_line(std::string_view line);

private:
    ControlResponse replace_policy(const ControlRequest& req,
                                   const std::function<void(auth::WhitelistPolicy&)>& edit);

    lifecycle::AppManager&       manager_;
    auth::AuthorizationGate&     gate_;
    gateway::PresenceController& presence_;
    const watch::WatchLoop*      watch_;
    obs::Observer&               obs_;
};

} // namespace appmgr::control
