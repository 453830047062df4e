// apps/appmgr_daemon/src/main.cpp
// App Manager daemon
// Purpose: host the rapp registry, authorization gate, hub presence, watch loop and
// lifecycle manager for one robot, and serve control commands on stdin.
//
// Usage:
//   ./appmgr_daemon [--config <file.yaml>] [--name <robot>] [--rapp-lists "a.yaml;b.yaml"]
//                   [--auto-start <rapp_id>] [--local-only] [--exit-on-eof]
//
// Notes:
// - Command-line flags override the config file.
// - Local deployment only: the hub is the in-process loopback hub, so nothing is
//   advertised on a network. A real gateway implements gateway::HubClient.
// - "Remote" requests are stdin lines tagged "as <hub> ...". The tag is taken on
//   trust; whoever can write to stdin can claim any hub identity.
// - SIGINT/SIGTERM stop the running rapp and exit.

#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <pthread.h>
#include <signal.h>
#include <string>
#include <thread>
#include <unistd.h>

#include "appmgr/auth/authorization_gate.hpp"
#include "appmgr/config/config_loader.hpp"
#include "appmgr/control/control_channel.hpp"
#include "appmgr/control/line_server.hpp"
#include "appmgr/gateway/loopback_hub.hpp"
#include "appmgr/gateway/presence_controller.hpp"
#include "appmgr/gateway/robot_identity.hpp"
#include "appmgr/lifecycle/app_manager.hpp"
#include "appmgr/obs/observability.hpp"
#include "appmgr/os/process.hpp"
#include "appmgr/registry/catalog.hpp"
#include "appmgr/registry/rapp_registry.hpp"
#include "appmgr/version.hpp"
#include "appmgr/watch/watch_loop.hpp"

using namespace appmgr;

namespace {

struct CliOptions {
    std::string config_path;
    std::string name;
    std::string rapp_lists;
    std::string auto_start;
    bool        local_only{false};
    bool        exit_on_eof{false};
};

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " [--config <file>] [--name <robot>] [--rapp-lists <a;b>] [--auto-start <id>]"
                 " [--local-only] [--exit-on-eof]\n"
                 "\n"
                 "Runs against an in-process loopback hub; nothing is advertised on a network.\n"
                 "Commands are read from stdin, one per line. A line prefixed with 'as <hub>'\n"
                 "is treated as a remote request from that hub; the tag is not authenticated.\n";
}

bool parse_cli(int argc, char** argv, CliOptions& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto value = [&](std::string& dst) {
            if (i + 1 >= argc) return false;
            dst = argv[++i];
            return true;
        };
        if (a == "--config") {
            if (!value(out.config_path)) return false;
        } else if (a == "--name") {
            if (!value(out.name)) return false;
        } else if (a == "--rapp-lists") {
            if (!value(out.rapp_lists)) return false;
        } else if (a == "--auto-start") {
            if (!value(out.auto_start)) return false;
        } else if (a == "--local-only") {
            out.local_only = true;
        } else if (a == "--exit-on-eof") {
            out.exit_on_eof = true;
        } else {
            return false;
        }
    }
    return true;
}

void fatal(const std::string& msg) {
    obs::make_simple_observer()->record({obs::Severity::Error, obs::Kind::Note, "daemon", msg});
}

} // namespace

int main(int argc, char** argv) {
    CliOptions cli;
    if (!parse_cli(argc, argv, cli)) {
        usage(argv[0]);
        return 2;
    }

    // ---------------------------------------------------------------- config
    config::ManagerConfig cfg;
    if (!cli.config_path.empty()) {
        auto loaded = config::Loader::load_from_file(cli.config_path);
        if (!loaded) {
            const auto& e = loaded.error();
            fatal(std::string("config ") + config::to_string(e.code) +
                  (e.key.empty() ? "" : " [" + e.key + "]") + ": " + e.detail);
            return 1;
        }
        cfg = std::move(*loaded);
    }
    if (!cli.name.empty()) cfg.robot_name = cli.name;
    if (!cli.rapp_lists.empty()) cfg.rapp_lists = registry::split_source_list(cli.rapp_lists);
    if (!cli.auto_start.empty()) cfg.auto_start_rapp = cli.auto_start;
    if (cli.local_only) cfg.local_only = true;
    obs::set_min_severity(obs::severity_from_string(cfg.log_level));

    auto* observer = obs::make_simple_observer();
    observer->record({obs::Severity::Info, obs::Kind::Note, "daemon",
                      std::string("appmgr ") + version_string + " starting as '" + cfg.robot_name + "'"});

    // Block termination signals before any thread starts; a dedicated thread waits for them.
    sigset_t term_set;
    sigemptyset(&term_set);
    sigaddset(&term_set, SIGINT);
    sigaddset(&term_set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &term_set, nullptr);

    // -------------------------------------------------------------- registry
    registry::YamlCatalogSource catalogs{cfg.catalog_search_paths};
    auto reg = registry::RappRegistry::load(cfg.rapp_lists, catalogs);
    if (!reg) {
        const auto& e = reg.error();
        fatal(std::string("registry ") + registry::to_string(e.code) + " '" + e.source + "': " + e.detail);
        return 1;
    }
    const registry::RappRegistry& rapps = *reg;

    // ------------------------------------------------------------- authority
    auto matcher = auth::make_matcher(cfg.matcher);
    if (!matcher) {
        fatal("unknown matcher '" + cfg.matcher + "'");
        return 1;
    }
    auth::AuthorizationGate gate{matcher, auth::WhitelistPolicy{cfg.remote_controller_whitelist, cfg.local_only,
                                                                cfg.remote_controller_blacklist}};

    // -------------------------------------------------------------- presence
    const auto identity = gateway::RobotIdentity::create(cfg.robot_name, cfg.unique_suffix);
    gateway::LoopbackHub hub;
    gateway::PresenceController presence{hub, rapps, gate, std::chrono::milliseconds(cfg.hub_connect_timeout_ms)};
    if (auto c = presence.connect(identity); !c) {
        observer->record({obs::Severity::Warn, obs::Kind::Note, "daemon",
                          "initial hub connect failed; the watch loop keeps retrying"});
    }

    // ------------------------------------------------------------- lifecycle
    os::PosixProcessLauncher launcher;
    lifecycle::ManagerOptions mopts;
    mopts.capabilities = cfg.capabilities;
    mopts.robot_type = cfg.robot_type;
    mopts.stop_grace = std::chrono::milliseconds(cfg.stop_grace_ms);
    mopts.kill_grace = std::chrono::milliseconds(cfg.kill_grace_ms);
    mopts.rapp_output_to_screen = cfg.rapp_output_to_screen;
    lifecycle::AppManager manager{rapps, gate, presence, launcher, identity, mopts};

    watch::WatchLoop watcher{presence, [&manager] { return manager.advertised_target(); },
                             std::chrono::milliseconds(cfg.watch_period_ms)};
    watcher.start();

    control::ControlChannel channel{manager, gate, presence, &watcher};

    if (!cfg.auto_start_rapp.empty()) {
        const auto r = channel.handle(control::ControlRequest{.command = control::Command::Start,
                                                              .caller  = lifecycle::CallerContext::local(),
                                                              .rapp_id = cfg.auto_start_rapp});
        observer->record({r.ok ? obs::Severity::Info : obs::Severity::Error, obs::Kind::Note, "daemon",
                          "auto-start '" + cfg.auto_start_rapp + "': " + r.outcome});
    }

    // --------------------------------------------------------------- serving
    std::atomic<bool> stop_requested{false};
    std::thread sig_thread([&term_set, &stop_requested] {
        int sig = 0;
        if (sigwait(&term_set, &sig) == 0) stop_requested.store(true, std::memory_order_release);
    });

    control::ServeOptions sopts;
    sopts.exit_on_eof = cli.exit_on_eof;
    const auto why = control::serve(STDIN_FILENO, channel,
                                    [](const std::string& line) { std::cout << line << std::endl; },
                                    stop_requested, sopts);
    if (why == control::ServeExit::ReadError) fatal("stdin read failed; shutting down");
    observer->record({obs::Severity::Info, obs::Kind::Note, "daemon",
                      std::string("control loop ended: ") + control::to_string(why)});

    // -------------------------------------------------------------- shutdown
    if (!stop_requested.load(std::memory_order_acquire)) {
        // wake the signal thread so it can be joined
        ::kill(::getpid(), SIGTERM);
    }
    sig_thread.join();

    watcher.stop();
    if (auto stopped = manager.shutdown()) {
        observer->record({obs::Severity::Info, obs::Kind::Note, "daemon",
                          "stopped '" + stopped->rapp_id + "' on shutdown"});
    }
    presence.set_advertised(std::nullopt);

    const auto c = observer->snapshot();
    observer->record({obs::Severity::Info, obs::Kind::Note, "daemon",
                      "exiting: transitions=" + std::to_string(c.transitions) + " flips=" + std::to_string(c.flips) +
                      " reconnects=" + std::to_string(c.reconnects)});
    return 0;
}
