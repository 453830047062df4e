/**
 * @file rapp_descriptor.hpp
 * @brief Runnable description of one robot application ("rapp").
 *
 * Shared by the registry, the lifecycle manager (launch + capability checks)
 * and the presence controller (endpoint naming). Immutable once loaded.
 */
#pragma once

#include <string>
#include <vector>

namespace appmgr::registry {

/**
 * @brief Minimal rapp descriptor.
 *
 * Equality is defaulted so registries can be compared element-wise in tests.
 *
 * @note Identifier uniqueness is enforced by the registry, not here.
 */
struct RappDescriptor final {
  /// Namespaced identifier, e.g. "rocon_apps/talker".
  std::string id;

  /// Display name (defaults to id when the catalog omits it).
  std::string display_name;

  /// Opaque icon reference; never resolved by the core.
  std::string icon;

  /// Executable entry point (absolute path or PATH-resolvable name).
  std::string entry;

  /// Runtime arguments appended to the entry point.
  std::vector<std::string> parameters;

  /// Capabilities that must be available for the rapp to be runnable.
  std::vector<std::string> required_capabilities;

  /// Public endpoints flipped to the hub while running; empty means "the rapp itself".
  std::vector<std::string> interfaces;

  bool operator==(const RappDescriptor&) const = default;
};

using RappList = std::vector<RappDescriptor>;

} // namespace appmgr::registry
