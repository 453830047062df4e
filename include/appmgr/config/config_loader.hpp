#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: manager settings from a YAML document.
 * @details Missing keys keep the named defaults from constants.hpp; unknown keys
 *          are ignored; a key of the wrong shape is an InvalidValue error.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "appmgr/compat/expected.hpp"
#include "appmgr/config/constants.hpp"

namespace appmgr::config {

    /** @struct ManagerConfig
     *  @brief Everything the daemon needs to wire the manager together.
     */
    struct ManagerConfig {
        std::string              robot_name{constants::ROBOT_NAME_DEFAULT};
        std::string              robot_type{constants::ROBOT_TYPE_DEFAULT};
        bool                     unique_suffix{constants::UNIQUE_SUFFIX_DEFAULT};
        std::vector<std::string> rapp_lists;          ///< Catalog references, in precedence order
        std::vector<std::string> catalog_search_paths;///< Directories tried for relative references
        std::vector<std::string> capabilities;        ///< Capabilities this robot provides
        std::vector<std::string> remote_controller_whitelist;
        std::vector<std::string> remote_controller_blacklist; ///< Consulted only while the whitelist is empty
        bool                     local_only{constants::LOCAL_ONLY_DEFAULT};
        std::string              matcher{constants::MATCHER_DEFAULT}; ///< "glob" | "regex"
        std::string              auto_start_rapp;     ///< Started at boot when non-empty
        uint32_t                 watch_period_ms{constants::WATCH_PERIOD_MS_DEFAULT};
        uint32_t                 hub_connect_timeout_ms{constants::HUB_CONNECT_TIMEOUT_MS};
        uint32_t                 stop_grace_ms{constants::STOP_GRACE_MS_DEFAULT};
        uint32_t                 kill_grace_ms{constants::KILL_GRACE_MS_DEFAULT};
        bool                     rapp_output_to_screen{false};
        std::string              log_level{"info"};
    };

    enum class ConfigErrc : std::uint8_t {
        FileUnreadable, ///< Path missing or not readable
        ParseError,     ///< Not valid YAML
        InvalidValue    ///< Known key with a value of the wrong shape
    };

    const char* to_string(ConfigErrc c) noexcept;

    struct ConfigError {
        ConfigErrc  code{ConfigErrc::ParseError};
        std::string key;    ///< Offending key, empty for document-level errors
        std::string detail;
    };

    /** @class Loader
     *  @brief Source of manager configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /**
         * @brief Load configuration from a YAML file.
         * @param path File path; relative paths resolve against the working directory.
         */
        static appmgr_detail::expected<ManagerConfig, ConfigError> load_from_file(const std::string& path);

        /// Same rules, for an in-memory document. An empty document yields defaults.
        static appmgr_detail::expected<ManagerConfig, ConfigError> load_from_string(std::string_view text);
    };

} // namespace appmgr::config
