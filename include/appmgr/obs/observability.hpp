#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: structured component events + counters.
 * @details Every component reports through an Observer reference so tests can
 *          substitute a recording sink for the stdout one.
 */

#include <cstdint>
#include <string>

namespace appmgr::obs {

    /** @enum Severity
     *  @brief Log level of an event; events below the sink threshold are counted but not printed.
     */
    enum class Severity : std::uint8_t { Debug, Info, Warn, Error };

    /** @enum Kind
     *  @brief Event category; drives the counters.
     */
    enum class Kind : std::uint8_t {
        Note,             ///< Free-form informational line
        Transition,       ///< LifecycleState changed
        Flip,             ///< Endpoint advertised/withdrawn on the hub
        FlipFailure,      ///< Hub refused or was unreachable during a flip
        AuthDenied,       ///< Remote request rejected by the whitelist
        Reconnect,        ///< Hub connection (re)established by the watch loop
        ConnectionLost,   ///< Hub dropped the connection
        Drift,            ///< Watch loop had to repair advertisement
        RegistryConflict, ///< Duplicate rapp id skipped during load
        LaunchFailure,    ///< Child process could not be started
        ForcedStop        ///< Graceful stop exceeded its bound
    };

    /** @struct Counters
     *  @brief Process-level counters for manager activity.
     */
    struct Counters {
        uint64_t events{0};            ///< Total events recorded
        uint64_t transitions{0};       ///< Lifecycle transitions
        uint64_t flips{0};             ///< Successful advertise/withdraw calls
        uint64_t flip_failures{0};     ///< Failed advertise/withdraw calls
        uint64_t auth_denials{0};      ///< Denied remote requests
        uint64_t reconnects{0};        ///< Successful hub (re)connects
        uint64_t connection_losses{0}; ///< Hub disconnect notifications
        uint64_t drift_repairs{0};     ///< Watch-loop ticks that changed the hub
        uint64_t registry_conflicts{0};///< Duplicate ids skipped
        uint64_t launch_failures{0};   ///< Failed child launches
        uint64_t forced_stops{0};      ///< Stops escalated to SIGKILL
    };

    /** @struct Event
     *  @brief Payload describing a single component event.
     */
    struct Event {
        Severity    severity{Severity::Info}; ///< Log level
        Kind        kind{Kind::Note};         ///< Category
        std::string component;                ///< Emitting component, e.g. "lifecycle"
        std::string message;                  ///< Human-readable text
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single event.
        virtual void record(const Event& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide stdout sink (JSON-ish lines).
    Observer* make_simple_observer();

    /// Set the print threshold of the process-wide sink.
    void set_min_severity(Severity s) noexcept;

    /// Parse "debug" | "info" | "warn" | "error"; unknown text maps to Info.
    Severity severity_from_string(const std::string& s) noexcept;

    const char* to_string(Severity s) noexcept;
    const char* to_string(Kind k) noexcept;

    /// Apply an event to a counter block (shared by every sink).
    void count(Counters& c, Kind k) noexcept;

} // namespace appmgr::obs
