#pragma once
/**
 * @file hub_client.hpp
 * @brief Pluggable client side of the hub/gateway connection.
 * @details The presence controller drives it; the loopback hub stands in until a
 *          real gateway transport is wired.
 */

#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>
#include <string>

#include "appmgr/compat/expected.hpp"

namespace appmgr::gateway {

    /// Hub failure classes.
    enum class HubErrc : std::uint8_t {
        Unreachable,  ///< No route to the hub
        Timeout,      ///< Attempt exceeded its deadline
        Rejected,     ///< Hub refused the request
        NotConnected  ///< Flip attempted without a live connection
    };

    const char* to_string(HubErrc c) noexcept;

    struct ConnectionError {
        HubErrc     code{HubErrc::Unreachable};
        std::string detail;
    };

    /**
     * @struct FlipRule
     * @brief One hub-visible endpoint and the remote hub pattern it is flipped to.
     */
    struct FlipRule {
        std::string endpoint; ///< Fully qualified endpoint name
        std::string remote;   ///< Remote hub pattern ("*" = every hub)

        auto operator<=>(const FlipRule&) const = default;
    };

    class HubClient {
    public:
        virtual ~HubClient() = default;

        /**
         * @brief Register the robot under @p name.
         * @param deadline Upper bound for this attempt; exceeded → HubErrc::Timeout.
         */
        virtual appmgr_detail::expected<void, ConnectionError>
        connect(const std::string& name, std::chrono::milliseconds deadline) = 0;

        /// Live connection state.
        virtual bool connected() const = 0;

        /// Make @p rule visible on the hub.
        virtual appmgr_detail::expected<void, ConnectionError> advertise(const FlipRule& rule) = 0;

        /// Remove @p rule from the hub.
        virtual appmgr_detail::expected<void, ConnectionError> withdraw(const FlipRule& rule) = 0;

        /**
         * @brief Install the connection-loss callback (replaces any previous one).
         * @note May be invoked from any thread, including from inside advertise/withdraw.
         */
        virtual void on_connection_lost(std::function<void()> cb) = 0;
    };

} // namespace appmgr::gateway
