#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the app manager components.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (YAML) in deployments.
 */

#include <cstddef>
#include <cstdint>

namespace appmgr::config::constants {

// =====================
// Robot identity
// =====================
inline constexpr const char* ROBOT_NAME_DEFAULT        = "app_manager"; ///< Base name when none configured
inline constexpr const char* ROBOT_TYPE_DEFAULT        = "robot";       ///< Platform robot type label
inline constexpr bool        UNIQUE_SUFFIX_DEFAULT     = false;         ///< Append a generated token to the name
inline constexpr std::size_t UNIQUE_SUFFIX_HEX_DIGITS  = 16;            ///< Length of the generated token
inline constexpr const char* APPLICATION_NAMESPACE     = "application"; ///< Endpoints live under <name>/application

// =====================
// Registry limits
// =====================
inline constexpr std::size_t REGISTRY_MAX_RAPPS        = 512; ///< Hard cap on merged catalog size
inline constexpr std::size_t REGISTRY_MAX_ID_LEN       = 128; ///< Max length of a rapp identifier
inline constexpr char        CATALOG_LIST_SEPARATOR    = ';'; ///< Separator for catalog reference lists

// =====================
// Watch loop
// =====================
inline constexpr uint32_t WATCH_PERIOD_MS_DEFAULT      = 1000; ///< Reconciliation tick period
inline constexpr uint32_t WATCH_PERIOD_MS_MIN          = 10;   ///< Lower bound accepted from config

// =====================
// Hub connection
// =====================
inline constexpr uint32_t HUB_CONNECT_TIMEOUT_MS       = 3000; ///< Deadline for one connect attempt
inline constexpr std::size_t PRESENCE_EVENT_QUEUE_MAX  = 64;   ///< Undrained presence events kept

// =====================
// Process supervision
// =====================
inline constexpr uint32_t STOP_GRACE_MS_DEFAULT        = 5000; ///< SIGTERM → exit bound before escalation
inline constexpr uint32_t KILL_GRACE_MS_DEFAULT        = 2000; ///< SIGKILL → reap bound
inline constexpr std::size_t TRANSITION_HISTORY_MAX    = 128;  ///< Transitions kept for status/health

// =====================
// Authorization
// =====================
inline constexpr bool        LOCAL_ONLY_DEFAULT        = false;  ///< Remote requests allowed by default
inline constexpr const char* MATCHER_DEFAULT           = "glob"; ///< Whitelist pattern dialect
inline constexpr const char* ANY_HUB                   = "*";    ///< Flip target meaning "every hub"

} // namespace appmgr::config::constants
