/**
 * @file control_channel.cpp
 * @brief Command parsing and request dispatch.
 */
#include "appmgr/control/control_channel.hpp"

#include <sstream>

namespace appmgr::control {

namespace {

using appmgr_detail::unexpected;

std::vector<std::string> tokenize(std::string_view line) {
    std::vector<std::string> out;
    std::istringstream in{std::string(line)};
    for (std::string tok; in >> tok;) out.push_back(std::move(tok));
    return out;
}

std::vector<std::string> split_patterns(const std::string& csv) {
    std::vector<std::string> out;
    if (csv == "-") return out;
    std::size_t start = 0;
    while (start <= csv.size()) {
        auto end = csv.find(',', start);
        if (end == std::string::npos) end = csv.size();
        if (end > start) out.push_back(csv.substr(start, end - start));
        start = end + 1;
    }
    return out;
}

std::string join(const std::vector<std::string>& v, const char* sep) {
    std::string out;
    for (const auto& s : v) {
        if (!out.empty()) out += sep;
        out += s;
    }
    return out;
}

ControlResponse accepted(std::string message) { return {true, "accepted", std::move(message)}; }

/// "from:=to" with both sides non-empty.
bool parse_remapping(const std::string& tok, lifecycle::Remapping& out) {
    const auto sep = tok.find(":=");
    if (sep == std::string::npos || sep == 0 || sep + 2 >= tok.size()) return false;
    out.from = tok.substr(0, sep);
    out.to = tok.substr(sep + 2);
    return true;
}

} // namespace

const char* to_string(Command c) noexcept {
    switch (c) {
        case Command::Start:     return "start";
        case Command::Stop:      return "stop";
        case Command::Status:    return "status";
        case Command::List:      return "list";
        case Command::Platform:  return "platform";
        case Command::Health:    return "health";
        case Command::Whitelist: return "whitelist";
        case Command::Blacklist: return "blacklist";
        case Command::LocalOnly: return "local-only";
        case Command::Invite:    return "invite";
        case Command::Cancel:    return "cancel";
    }
    return "unknown";
}

appmgr_detail::expected<ControlRequest, std::string> parse_command(std::string_view line) {
    auto toks = tokenize(line);
    ControlRequest req;
    std::size_t i = 0;

    if (!toks.empty() && toks[0] == "as") {
        if (toks.size() < 3) return unexpected(std::string("usage: as <hub> <command>"));
        req.caller = lifecycle::CallerContext::remote(toks[1]);
        i = 2;
    }
    if (i >= toks.size()) return unexpected(std::string("empty command"));

    const std::string& verb = toks[i];
    const std::size_t nargs = toks.size() - i - 1;
    auto no_args = [&](Command c) -> appmgr_detail::expected<ControlRequest, std::string> {
        if (nargs != 0) return unexpected(verb + " takes no arguments");
        req.command = c;
        return req;
    };

    if (verb == "start") {
        if (nargs < 1) return unexpected(std::string("usage: start <rapp_id> [from:=to ...]"));
        req.command = Command::Start;
        req.rapp_id = toks[i + 1];
        for (std::size_t k = i + 2; k < toks.size(); ++k) {
            lifecycle::Remapping r;
            if (!parse_remapping(toks[k], r)) return unexpected("bad remapping '" + toks[k] + "', expected from:=to");
            req.remappings.push_back(std::move(r));
        }
        return req;
    }
    if (verb == "stop")     return no_args(Command::Stop);
    if (verb == "status")   return no_args(Command::Status);
    if (verb == "list")     return no_args(Command::List);
    if (verb == "platform") return no_args(Command::Platform);
    if (verb == "health")   return no_args(Command::Health);
    if (verb == "invite")   return no_args(Command::Invite);
    if (verb == "cancel")   return no_args(Command::Cancel);
    if (verb == "whitelist" || verb == "blacklist") {
        if (nargs != 1) return unexpected("usage: " + verb + " <p1,p2,...|->");
        req.command = verb == "whitelist" ? Command::Whitelist : Command::Blacklist;
        req.patterns = split_patterns(toks[i + 1]);
        return req;
    }
    if (verb == "local-only") {
        if (nargs != 1 || (toks[i + 1] != "on" && toks[i + 1] != "off")) {
            return unexpected(std::string("usage: local-only on|off"));
        }
        req.command = Command::LocalOnly;
        req.flag = toks[i + 1] == "on";
        return req;
    }
    return unexpected("unknown command '" + verb + "'");
}

std::string format_response(const ControlResponse& resp) {
    std::string out = resp.ok ? "ok " : "error ";
    out += resp.outcome;
    if (!resp.message.empty()) out += ": " + resp.message;
    return out;
}

ControlChannel::ControlChannel(lifecycle::AppManager& manager,
                               auth::AuthorizationGate& gate,
                               gateway::PresenceController& presence,
                               const watch::WatchLoop* watch,
                               obs::Observer& observer)
    : manager_(manager), gate_(gate), presence_(presence), watch_(watch), obs_(observer) {}

ControlResponse ControlChannel::handle_line(std::string_view line) {
    auto req = parse_command(line);
    if (!req) return {false, "bad_request", req.error()};
    return handle(*req);
}

ControlResponse ControlChannel::replace_policy(const ControlRequest& req,
                                               const std::function<void(auth::WhitelistPolicy&)>& edit) {
    if (!req.caller.is_local) {
        obs_.record({obs::Severity::Warn, obs::Kind::AuthDenied, "control",
                     "policy change from remote hub '" + req.caller.hub + "' refused"});
        return {false, "unauthorized", "policy changes are local only"};
    }
    const uint64_t version = gate_.update_policy(edit);
    const auto rep = presence_.set_advertised(manager_.advertised_target());
    return accepted("policy v" + std::to_string(version) + ", flips +" + std::to_string(rep.added) +
                    " -" + std::to_string(rep.removed) + ", pending " + std::to_string(rep.pending));
}

ControlResponse ControlChannel::handle(const ControlRequest& req) {
    switch (req.command) {
        case Command::Start: {
            auto r = manager_.start(req.rapp_id, req.caller, req.remappings);
            if (!r) return {false, lifecycle::to_string(r.error()), "start '" + req.rapp_id + "' refused"};
            return accepted("started '" + r->rapp_id + "' pid " + std::to_string(r->pid));
        }
        case Command::Stop: {
            auto r = manager_.stop(req.caller);
            if (!r) return {false, lifecycle::to_string(r.error()), "nothing stopped"};
            return accepted("stopped '" + r->rapp_id + "'" + (r->forced ? " (killed)" : ""));
        }
        case Command::Status: {
            const auto s = manager_.status();
            std::string msg = std::string("state=") + lifecycle::to_string(s.state);
            if (s.rapp_id) msg += " rapp=" + *s.rapp_id;
            if (!s.remote_controller.empty()) msg += " controller=" + s.remote_controller;
            if (!s.invited.empty()) msg += " invited=" + s.invited;
            msg += " transitions=" + std::to_string(s.transitions);
            return accepted(std::move(msg));
        }
        case Command::List: {
            std::string msg;
            for (const auto& l : manager_.list_rapps()) {
                if (!msg.empty()) msg += '\n';
                msg += l.descriptor.id + " \"" + l.descriptor.display_name + "\"";
                if (!l.runnable) msg += " [not runnable]";
                if (l.running) msg += " [running]";
            }
            return accepted(std::move(msg));
        }
        case Command::Platform: {
            const auto p = manager_.platform_info();
            return accepted("name=" + p.name + " type=" + p.robot_type + " namespace=" + p.application_namespace);
        }
        case Command::Health: {
            const auto s = manager_.status();
            std::string msg = "alive=true hub=";
            msg += presence_.connected() ? "connected" : "disconnected";
            msg += " pending=" + std::to_string(presence_.pending());
            msg += " watch=";
            msg += watch_ && watch_->running() ? "running" : "stopped";
            msg += " ticks=" + std::to_string(watch_ ? watch_->ticks() : 0);
            msg += std::string(" state=") + lifecycle::to_string(s.state);
            return accepted(std::move(msg));
        }
        case Command::Whitelist: {
            auto resp = replace_policy(req, [&](auth::WhitelistPolicy& p) { p.patterns = req.patterns; });
            if (resp.ok) resp.message = "whitelist [" + join(req.patterns, ",") + "], " + resp.message;
            return resp;
        }
        case Command::Blacklist: {
            auto resp = replace_policy(req, [&](auth::WhitelistPolicy& p) { p.blacklist = req.patterns; });
            if (resp.ok) resp.message = "blacklist [" + join(req.patterns, ",") + "], " + resp.message;
            return resp;
        }
        case Command::LocalOnly:
            return replace_policy(req, [&](auth::WhitelistPolicy& p) { p.local_only = req.flag; });
        case Command::Invite: {
            auto r = manager_.invite(req.caller);
            if (!r) return {false, lifecycle::to_string(r.error()), "invitation refused"};
            return accepted(std::string(r->repeated ? "already relaying" : "relaying") + " controls to '" + r->hub + "'");
        }
        case Command::Cancel: {
            auto r = manager_.cancel_invite(req.caller);
            if (!r) return {false, lifecycle::to_string(r.error()), "nothing cancelled"};
            std::string msg = "released '" + r->hub + "'";
            if (r->stopped) msg += ", stopped '" + *r->stopped + "'";
            return accepted(std::move(msg));
        }
    }
    return {false, "bad_request", "unhandled command"};
}

} // namespace appmgr::control
