#pragma once
/**
 * @file watch_loop.hpp
 * @brief Periodic reconciliation of hub presence with the running rapp.
 *
 * Each tick:
 *  1) reconnect when the hub session is gone (one bounded attempt);
 *  2) re-apply the advertised set for the current target;
 *  3) drain presence events and log those with failed flips. Only the event
 *     queued by this tick's own re-apply is skipped; events queued by other
 *     callers in the meantime are all observed.
 *
 * A failed reconnect skips the rest of the tick; the next tick retries.
 * stop() wakes the loop immediately instead of waiting out the period.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "appmgr/config/constants.hpp"
#include "appmgr/gateway/presence_controller.hpp"
#include "appmgr/obs/observability.hpp"

namespace appmgr::watch {

/// What one tick did.
struct TickReport {
    bool                       reconnected{false};
    bool                       connect_failed{false};
    gateway::ReconcileReport   reconcile;
    std::size_t                events{0};        ///< Presence events observed (own event excluded)
    std::size_t                failed_events{0}; ///< Of those, events that carried failed flips
};

class WatchLoop final {
public:
    /// Supplies the rapp that should be advertised right now.
    using TargetFn = std::function<std::optional<std::string>()>;

    WatchLoop(gateway::PresenceController& presence,
              TargetFn target,
              std::chrono::milliseconds period =
                  std::chrono::milliseconds(config::constants::WATCH_PERIOD_MS_DEFAULT),
              obs::Observer& observer = *obs::make_simple_observer());
    ~WatchLoop();

    WatchLoop(const WatchLoop&)            = delete;
    WatchLoop& operator=(const WatchLoop&) = delete;

    /// Spawn the background thread. No-op when already running.
    void start();

    /// Signal and join. Safe to call repeatedly.
    void stop();

    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

    /// Run one reconciliation pass on the calling thread.
    TickReport tick();

    /// Ticks completed so far (background and manual).
    [[nodiscard]] uint64_t ticks() const noexcept { return ticks_.load(std::memory_order_relaxed); }

    [[nodiscard]] std::chrono::milliseconds period() const noexcept { return period_; }

private:
    void run();

    gateway::PresenceController& presence_;
    TargetFn                     target_;
    std::chrono::milliseconds    period_;
    obs::Observer&               obs_;

    std::mutex                   tick_mu_;  ///< One tick at a time
    std::mutex                   wake_mu_;
    std::condition_variable      wake_cv_;
    bool                         stop_requested_{false};
    std::atomic<bool>            running_{false};
    std::atomic<uint64_t>        ticks_{0};
    std::thread                  thread_;
};

} // namespace appmgr::watch
