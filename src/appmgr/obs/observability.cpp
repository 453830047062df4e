/**
* @file observability.cpp
 * @brief printf-backed implementation of Observer.
 */
#include "appmgr/obs/observability.hpp"
#include <atomic>
#include <mutex>
#include <cstdio>

namespace appmgr::obs {

    namespace {
        std::atomic<Severity> g_min_severity{Severity::Info};

        // Escape the two characters that would break a quoted field.
        std::string escape(const std::string& in) {
            std::string out;
            out.reserve(in.size());
            for (char c : in) {
                if (c == '"' || c == '\\') out.push_back('\\');
                out.push_back(c == '\n' ? ' ' : c);
            }
            return out;
        }
    }

    const char* to_string(Severity s) noexcept {
        switch (s) {
            case Severity::Debug: return "debug";
            case Severity::Info:  return "info";
            case Severity::Warn:  return "warn";
            case Severity::Error: return "error";
        }
        return "info";
    }

    const char* to_string(Kind k) noexcept {
        switch (k) {
            case Kind::Note:             return "note";
            case Kind::Transition:       return "transition";
            case Kind::Flip:             return "flip";
            case Kind::FlipFailure:      return "flip_failure";
            case Kind::AuthDenied:       return "auth_denied";
            case Kind::Reconnect:        return "reconnect";
            case Kind::ConnectionLost:   return "connection_lost";
            case Kind::Drift:            return "drift";
            case Kind::RegistryConflict: return "registry_conflict";
            case Kind::LaunchFailure:    return "launch_failure";
            case Kind::ForcedStop:       return "forced_stop";
        }
        return "note";
    }

    Severity severity_from_string(const std::string& s) noexcept {
        if (s == "debug") return Severity::Debug;
        if (s == "warn" || s == "warning") return Severity::Warn;
        if (s == "error") return Severity::Error;
        return Severity::Info;
    }

    void set_min_severity(Severity s) noexcept {
        g_min_severity.store(s, std::memory_order_relaxed);
    }

    void count(Counters& c, Kind k) noexcept {
        c.events++;
        switch (k) {
            case Kind::Transition:       c.transitions++; break;
            case Kind::Flip:             c.flips++; break;
            case Kind::FlipFailure:      c.flip_failures++; break;
            case Kind::AuthDenied:       c.auth_denials++; break;
            case Kind::Reconnect:        c.reconnects++; break;
            case Kind::ConnectionLost:   c.connection_losses++; break;
            case Kind::Drift:            c.drift_repairs++; break;
            case Kind::RegistryConflict: c.registry_conflicts++; break;
            case Kind::LaunchFailure:    c.launch_failures++; break;
            case Kind::ForcedStop:       c.forced_stops++; break;
            case Kind::Note:             break;
        }
    }

    class SimpleObserver : public Observer {
    public:
        void record(const Event& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            count(ctr_, e.kind);
            if (e.severity < g_min_severity.load(std::memory_order_relaxed)) return;
            // JSON-ish line (one event per line)
            std::printf(
              R"({"level":"%s","kind":"%s","component":"%s","msg":"%s"})" "\n",
              to_string(e.severity), to_string(e.kind),
              escape(e.component).c_str(), escape(e.message).c_str());
            std::fflush(stdout);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace appmgr::obs
