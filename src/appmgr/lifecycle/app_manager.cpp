/**
 * @file app_manager.cpp
 * @brief Lifecycle state machine and child supervision.
 */
#include "appmgr/lifecycle/app_manager.hpp"

#include <algorithm>

namespace appmgr::lifecycle {

using appmgr_detail::unexpected;

const char* to_string(LifecycleState s) noexcept {
    switch (s) {
        case LifecycleState::Idle:     return "idle";
        case LifecycleState::Starting: return "starting";
        case LifecycleState::Running:  return "running";
        case LifecycleState::Stopping: return "stopping";
        case LifecycleState::Failed:   return "failed";
    }
    return "unknown";
}

const char* to_string(StartError e) noexcept {
    switch (e) {
        case StartError::AlreadyRunning: return "already_running";
        case StartError::NotFound:       return "not_found";
        case StartError::NotRunnable:    return "not_runnable";
        case StartError::Unauthorized:   return "unauthorized";
        case StartError::LaunchError:    return "launch_error";
    }
    return "unknown";
}

const char* to_string(StopError e) noexcept {
    switch (e) {
        case StopError::NotRunning:   return "not_running";
        case StopError::Unauthorized: return "unauthorized";
    }
    return "unknown";
}

const char* to_string(InviteError e) noexcept {
    switch (e) {
        case InviteError::LocalCaller:  return "local_caller";
        case InviteError::Unauthorized: return "unauthorized";
        case InviteError::Busy:         return "busy";
        case InviteError::NotInvited:   return "not_invited";
    }
    return "unknown";
}

AppManager::AppManager(const registry::RappRegistry& registry,
                       const auth::AuthorizationGate& gate,
                       gateway::PresenceController& presence,
                       os::ProcessLauncher& launcher,
                       gateway::RobotIdentity identity,
                       ManagerOptions options,
                       obs::Observer& observer)
    : registry_(registry), gate_(gate), presence_(presence), launcher_(launcher),
      identity_(std::move(identity)), opts_(std::move(options)), obs_(observer) {}

AppManager::~AppManager() {
    shutdown();
    std::vector<std::unique_ptr<os::ProcessHandle>> graveyard;
    {
        std::lock_guard<std::mutex> lk(mu_);
        graveyard.swap(retired_);
    }
    // graveyard joins supervisor threads here, outside mu_
}

void AppManager::note(obs::Severity sev, obs::Kind kind, std::string msg) const {
    obs_.record({sev, kind, "lifecycle", std::move(msg)});
}

//------------------------------- State core -----------------------------------

void AppManager::transition_locked(LifecycleState to) {
    const auto from = state_;
    if (!is_valid_transition(from, to)) {
        note(obs::Severity::Error, obs::Kind::Note,
             std::string("rejected illegal transition ") + to_string(from) + " -> " + to_string(to));
        return;
    }
    state_ = to;
    transitions_++;
    history_.push_back(Transition{from, to, current_.value_or(""), std::chrono::system_clock::now()});
    while (history_.size() > config::constants::TRANSITION_HISTORY_MAX) history_.pop_front();
    note(obs::Severity::Info, obs::Kind::Transition,
         std::string(to_string(from)) + " -> " + to_string(to) + (current_ ? " [" + *current_ + "]" : ""));
}

void AppManager::clear_slot_locked() {
    current_.reset();
    controller_.clear();
    early_exit_.reset();
}

bool AppManager::admitted_locked(const CallerContext& caller) const {
    if (caller.is_local || invited_.empty() || caller.hub == invited_) return true;
    note(obs::Severity::Warn, obs::Kind::AuthDenied,
         "request from '" + caller.hub + "' refused: controls are relayed to '" + invited_ + "'");
    return false;
}

bool AppManager::runnable(const registry::RappDescriptor& rapp) const {
    return std::all_of(rapp.required_capabilities.begin(), rapp.required_capabilities.end(),
                       [&](const std::string& cap) {
                           return std::find(opts_.capabilities.begin(), opts_.capabilities.end(), cap)
                                  != opts_.capabilities.end();
                       });
}

//------------------------------- Requests -------------------------------------

appmgr_detail::expected<StartAccepted, StartError>
AppManager::start(std::string_view rapp_id, const CallerContext& caller,
                  const std::vector<Remapping>& remappings) {
    if (!caller.is_local && gate_.evaluate(caller.hub, false) == auth::Verdict::Deny) {
        return unexpected(StartError::Unauthorized);
    }

    registry::RappDescriptor rapp;
    uint64_t generation = 0;
    std::vector<std::unique_ptr<os::ProcessHandle>> graveyard; // released after the lock
    {
        std::lock_guard<std::mutex> lk(mu_);
        graveyard.swap(retired_);
        if (!admitted_locked(caller)) return unexpected(StartError::Unauthorized);
        if (state_ != LifecycleState::Idle) {
            note(obs::Severity::Warn, obs::Kind::Note,
                 "start '" + std::string(rapp_id) + "' refused: '" + current_.value_or("") + "' is " + to_string(state_));
            return unexpected(StartError::AlreadyRunning);
        }
        const auto* d = registry_.find(rapp_id);
        if (!d) {
            note(obs::Severity::Warn, obs::Kind::Note, "start refused: rapp '" + std::string(rapp_id) + "' is not installed");
            return unexpected(StartError::NotFound);
        }
        if (!runnable(*d)) {
            note(obs::Severity::Warn, obs::Kind::Note,
                 "start refused: rapp '" + d->id + "' is installed but its required capabilities are unavailable");
            return unexpected(StartError::NotRunnable);
        }
        rapp = *d;
        generation = ++generation_;
        early_exit_.reset();
        current_ = rapp.id;
        controller_ = caller.is_local ? std::string{} : caller.hub;
        transition_locked(LifecycleState::Starting);
    }

    os::LaunchSpec spec;
    spec.entry = rapp.entry;
    spec.args = rapp.parameters;
    for (const auto& r : remappings) spec.args.push_back(r.from + ":=" + r.to);
    spec.inherit_output = opts_.rapp_output_to_screen;
    spec.on_exit = [this, generation](const os::ExitStatus& st) { notify_child_exit(generation, st); };
    auto launched = launcher_.launch(spec);

    int pid = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!launched) {
            note(obs::Severity::Error, obs::Kind::LaunchFailure,
                 "launch of '" + rapp.id + "' failed (" + os::to_string(launched.error().code) + "): " +
                 launched.error().detail);
            transition_locked(LifecycleState::Failed);
            clear_slot_locked();
            transition_locked(LifecycleState::Idle);
            cv_.notify_all();
            return unexpected(StartError::LaunchError);
        }
        child_ = std::move(*launched);
        pid = child_->pid();
        transition_locked(LifecycleState::Running);
        if (early_exit_) {
            note(obs::Severity::Warn, obs::Kind::Note,
                 "rapp '" + rapp.id + "' exited during start (" + os::describe(*early_exit_) + ")");
            transition_locked(LifecycleState::Failed);
            retired_.push_back(std::move(child_));
            clear_slot_locked();
            transition_locked(LifecycleState::Idle);
        }
        cv_.notify_all();
    }

    presence_.set_advertised(advertised_target());
    return StartAccepted{rapp.id, pid};
}

appmgr_detail::expected<StopAccepted, StopError>
AppManager::stop(const CallerContext& caller) {
    if (!caller.is_local && gate_.evaluate(caller.hub, false) == auth::Verdict::Deny) {
        return unexpected(StopError::Unauthorized);
    }

    std::unique_ptr<os::ProcessHandle> child;
    std::string rapp_id;
    {
        std::unique_lock<std::mutex> lk(mu_);
        if (!admitted_locked(caller)) return unexpected(StopError::Unauthorized);
        cv_.wait(lk, [&] { return state_ != LifecycleState::Starting; });
        if (state_ != LifecycleState::Running) {
            note(obs::Severity::Warn, obs::Kind::Note,
                 std::string("stop refused: no rapp running (state ") + to_string(state_) + ")");
            return unexpected(StopError::NotRunning);
        }
        rapp_id = current_.value_or("");
        transition_locked(LifecycleState::Stopping);
        child = std::move(child_);
    }

    bool forced = false;
    if (child) {
        if (!child->terminate()) {
            note(obs::Severity::Debug, obs::Kind::Note, "rapp '" + rapp_id + "' already exited before SIGTERM");
        }
        if (!child->wait_for(opts_.stop_grace)) {
            forced = true;
            note(obs::Severity::Warn, obs::Kind::ForcedStop,
                 "rapp '" + rapp_id + "' ignored SIGTERM for " + std::to_string(opts_.stop_grace.count()) + "ms; killing");
            child->kill();
            if (!child->wait_for(opts_.kill_grace)) {
                note(obs::Severity::Error, obs::Kind::Note, "rapp '" + rapp_id + "' still not reaped after SIGKILL");
            }
        }
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        ++generation_; // anything still in flight for this child is stale
        clear_slot_locked();
        transition_locked(LifecycleState::Idle);
        cv_.notify_all();
    }
    child.reset(); // joins the supervisor outside mu_

    presence_.set_advertised(advertised_target());
    return StopAccepted{rapp_id, forced};
}

appmgr_detail::expected<InviteAccepted, InviteError>
AppManager::invite(const CallerContext& caller) {
    if (caller.is_local) return unexpected(InviteError::LocalCaller);
    if (gate_.evaluate(caller.hub, false) == auth::Verdict::Deny) return unexpected(InviteError::Unauthorized);

    std::lock_guard<std::mutex> lk(mu_);
    if (invited_ == caller.hub) {
        note(obs::Severity::Debug, obs::Kind::Note, "repeat invitation from '" + caller.hub + "' ignored");
        return InviteAccepted{caller.hub, true, std::nullopt};
    }
    if (!invited_.empty()) {
        note(obs::Severity::Warn, obs::Kind::Note,
             "invitation from '" + caller.hub + "' refused: controls are relayed to '" + invited_ + "'");
        return unexpected(InviteError::Busy);
    }
    invited_ = caller.hub;
    note(obs::Severity::Info, obs::Kind::Note, "relaying controls to '" + invited_ + "'");
    return InviteAccepted{caller.hub, false, std::nullopt};
}

appmgr_detail::expected<InviteAccepted, InviteError>
AppManager::cancel_invite(const CallerContext& caller) {
    if (caller.is_local) return unexpected(InviteError::LocalCaller);
    if (gate_.evaluate(caller.hub, false) == auth::Verdict::Deny) return unexpected(InviteError::Unauthorized);
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (invited_.empty() || invited_ != caller.hub) {
            note(obs::Severity::Warn, obs::Kind::Note,
                 "cancel from '" + caller.hub + "' ignored: controls are relayed to '" +
                 (invited_.empty() ? std::string("nobody") : invited_) + "'");
            return unexpected(InviteError::NotInvited);
        }
        invited_.clear();
        note(obs::Severity::Info, obs::Kind::Note, "cancelled relayed controls to '" + caller.hub + "'");
    }

    InviteAccepted out{caller.hub, false, std::nullopt};
    if (auto stopped = stop(CallerContext::local())) out.stopped = stopped->rapp_id;
    return out;
}

std::optional<StopAccepted> AppManager::shutdown() {
    auto res = stop(CallerContext::local());
    if (!res) return std::nullopt;
    return *res;
}

//------------------------------- Events ---------------------------------------

void AppManager::notify_child_exit(uint64_t generation, const os::ExitStatus& status) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (generation != generation_) return; // stale: a later launch or a completed stop
        switch (state_) {
            case LifecycleState::Starting:
                early_exit_ = status; // start() resolves it
                return;
            case LifecycleState::Running:
                note(status.success() ? obs::Severity::Info : obs::Severity::Warn, obs::Kind::Note,
                     "rapp '" + current_.value_or("") + "' exited on its own (" + os::describe(status) + ")");
                transition_locked(LifecycleState::Failed);
                retired_.push_back(std::move(child_));
                clear_slot_locked();
                transition_locked(LifecycleState::Idle);
                cv_.notify_all();
                break;
            case LifecycleState::Stopping: // stop() owns the child
            case LifecycleState::Idle:
            case LifecycleState::Failed:
                return;
        }
    }
    presence_.set_advertised(advertised_target());
}

//------------------------------- Queries --------------------------------------

StatusReport AppManager::status() const {
    std::lock_guard<std::mutex> lk(mu_);
    StatusReport r;
    r.state = state_;
    if (state_ != LifecycleState::Idle) r.rapp_id = current_;
    r.remote_controller = controller_;
    r.invited = invited_;
    r.transitions = transitions_;
    return r;
}

std::optional<std::string> AppManager::advertised_target() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ != LifecycleState::Running) return std::nullopt;
    return current_;
}

std::vector<RappListing> AppManager::list_rapps() const {
    std::optional<std::string> running = advertised_target();
    std::vector<RappListing> out;
    out.reserve(registry_.size());
    for (const auto& d : registry_.entries()) {
        out.push_back(RappListing{d, runnable(d), running && *running == d.id});
    }
    return out;
}

PlatformInfo AppManager::platform_info() const {
    return PlatformInfo{identity_.effective_name(), opts_.robot_type, identity_.application_namespace()};
}

std::vector<Transition> AppManager::history() const {
    std::lock_guard<std::mutex> lk(mu_);
    return std::vector<Transition>(history_.begin(), history_.end());
}

} // namespace appmgr::lifecycle
