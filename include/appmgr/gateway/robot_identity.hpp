#pragma once
/**
 * @file robot_identity.hpp
 * @brief Outward network identity of the robot: base name plus optional unique token.
 */

#include <optional>
#include <string>

namespace appmgr::gateway {

/**
 * @class RobotIdentity
 * @brief Immutable for the process lifetime; created once at startup.
 */
class RobotIdentity {
public:
    RobotIdentity(std::string base_name, std::optional<std::string> suffix = std::nullopt);

    /// Build an identity, generating a suffix when @p unique is set.
    static RobotIdentity create(std::string base_name, bool unique);

    const std::string& base_name() const noexcept { return base_; }
    const std::optional<std::string>& suffix() const noexcept { return suffix_; }

    /// base, or base + "-" + suffix.
    const std::string& effective_name() const noexcept { return effective_; }

    /// Namespace endpoints are published under: "<effective>/application".
    std::string application_namespace() const;

    bool operator==(const RobotIdentity& o) const noexcept { return effective_ == o.effective_; }

private:
    std::string                base_;
    std::optional<std::string> suffix_;
    std::string                effective_;
};

/// Random lowercase hex token of the configured length.
std::string generate_unique_suffix();

} // namespace appmgr::gateway
