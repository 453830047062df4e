/**
 * @file lifecycle_state.hpp
 * @brief Rapp lifecycle states and the legal transitions between them.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace appmgr::lifecycle {

/**
 * @brief Lifecycle of the single rapp slot.
 *
 * @note Legal transitions:
 *  - Idle → Starting → Running → Stopping → Idle
 *  - Starting → Failed, Running → Failed (launch failure / abnormal exit)
 *  - Failed → Idle (after cleanup)
 */
enum class LifecycleState : std::uint8_t {
  Idle = 0,
  Starting,
  Running,
  Stopping,
  Failed
};

const char* to_string(LifecycleState s) noexcept;

constexpr bool is_valid_transition(LifecycleState from, LifecycleState to) noexcept {
  using S = LifecycleState;
  switch (from) {
    case S::Idle:     return to == S::Starting;
    case S::Starting: return to == S::Running || to == S::Failed;
    case S::Running:  return to == S::Stopping || to == S::Failed;
    case S::Stopping: return to == S::Idle;
    case S::Failed:   return to == S::Idle;
  }
  return false;
}

/// One recorded state change.
struct Transition final {
  LifecycleState from{LifecycleState::Idle};
  LifecycleState to{LifecycleState::Idle};
  std::string    rapp_id;
  std::chrono::system_clock::time_point at{};
};

} // namespace appmgr::lifecycle
