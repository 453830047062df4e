/**
 * @file watch_loop.cpp
 * @brief Background reconcile thread.
 */
#include "appmgr/watch/watch_loop.hpp"

#include <algorithm>

namespace appmgr::watch {

WatchLoop::WatchLoop(gateway::PresenceController& presence,
                     TargetFn target,
                     std::chrono::milliseconds period,
                     obs::Observer& observer)
    : presence_(presence), target_(std::move(target)),
      period_(std::max(period, std::chrono::milliseconds(config::constants::WATCH_PERIOD_MS_MIN))),
      obs_(observer) {}

WatchLoop::~WatchLoop() { stop(); }

void WatchLoop::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) return;
    {
        std::lock_guard<std::mutex> lk(wake_mu_);
        stop_requested_ = false;
    }
    thread_ = std::thread([this] { run(); });
    obs_.record({obs::Severity::Info, obs::Kind::Note, "watch",
                 "watch loop started, period " + std::to_string(period_.count()) + "ms"});
}

void WatchLoop::stop() {
    {
        std::lock_guard<std::mutex> lk(wake_mu_);
        stop_requested_ = true;
    }
    wake_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
        obs_.record({obs::Severity::Info, obs::Kind::Note, "watch", "watch loop stopped"});
    }
    running_.store(false, std::memory_order_release);
}

void WatchLoop::run() {
    std::unique_lock<std::mutex> lk(wake_mu_);
    while (!stop_requested_) {
        if (wake_cv_.wait_for(lk, period_, [this] { return stop_requested_; })) break;
        lk.unlock();
        tick();
        lk.lock();
    }
}

TickReport WatchLoop::tick() {
    std::lock_guard<std::mutex> guard(tick_mu_);
    TickReport out;

    if (!presence_.connected()) {
        if (!presence_.has_identity()) {
            // connect() was never called; nothing to reconnect as
            out.connect_failed = true;
            ticks_.fetch_add(1, std::memory_order_relaxed);
            return out;
        }
        auto r = presence_.reconnect();
        if (!r) {
            out.connect_failed = true;
            obs_.record({obs::Severity::Warn, obs::Kind::Note, "watch",
                         std::string("reconnect failed (") + gateway::to_string(r.error().code) + "): " +
                         r.error().detail});
            ticks_.fetch_add(1, std::memory_order_relaxed);
            return out;
        }
        out.reconnected = true;
    }

    out.reconcile = presence_.set_advertised(target_());

    for (const auto& ev : presence_.drain_events()) {
        if (ev.seq == out.reconcile.seq) continue;
        out.events++;
        if (ev.report.failed == 0) continue;
        out.failed_events++;
        obs_.record({obs::Severity::Warn, obs::Kind::Note, "watch",
                     "presence event #" + std::to_string(ev.seq) + " had " +
                     std::to_string(ev.report.failed) + " failed flip(s)" +
                     (ev.target ? " for '" + *ev.target + "'" : std::string())});
    }

    if (out.reconcile.changed() || out.reconnected) {
        obs_.record({obs::Severity::Info, obs::Kind::Drift, "watch",
                     "repaired advertisement: +" + std::to_string(out.reconcile.added) +
                     " -" + std::to_string(out.reconcile.removed) +
                     (out.reconnected ? " after reconnect" : "")});
    }
    if (!out.reconcile.converged()) {
        obs_.record({obs::Severity::Warn, obs::Kind::Note, "watch",
                     std::to_string(out.reconcile.pending) + " rule(s) still pending"});
    }
    ticks_.fetch_add(1, std::memory_order_relaxed);
    return out;
}

} // namespace appmgr::watch
