/**
 * @file config_loader.cpp
 * @brief yaml-cpp backed loader; every default comes from constants.hpp.
 */
#include "appmgr/config/config_loader.hpp"

#include <limits>
#include <yaml-cpp/yaml.h>

#include "appmgr/registry/catalog.hpp"

namespace appmgr::config {

    namespace {

        using appmgr_detail::unexpected;

        ConfigError invalid(const std::string& key, std::string detail) {
            return ConfigError{ConfigErrc::InvalidValue, key, std::move(detail)};
        }

        bool read_string(const YAML::Node& root, const char* key, std::string& out, ConfigError& err) {
            const auto n = root[key];
            if (!n) return true;
            if (!n.IsScalar()) { err = invalid(key, "expected a string"); return false; }
            out = n.as<std::string>();
            return true;
        }

        bool read_bool(const YAML::Node& root, const char* key, bool& out, ConfigError& err) {
            const auto n = root[key];
            if (!n) return true;
            bool v = false;
            if (!n.IsScalar() || !YAML::convert<bool>::decode(n, v)) {
                err = invalid(key, "expected true/false");
                return false;
            }
            out = v;
            return true;
        }

        bool read_ms(const YAML::Node& root, const char* key, uint32_t min, uint32_t& out, ConfigError& err) {
            const auto n = root[key];
            if (!n) return true;
            long long v = 0;
            if (!n.IsScalar() || !YAML::convert<long long>::decode(n, v)) {
                err = invalid(key, "expected an integer (milliseconds)");
                return false;
            }
            if (v < static_cast<long long>(min) || v > std::numeric_limits<uint32_t>::max()) {
                err = invalid(key, "out of range, minimum " + std::to_string(min));
                return false;
            }
            out = static_cast<uint32_t>(v);
            return true;
        }

        bool read_list(const YAML::Node& root, const char* key, std::vector<std::string>& out, ConfigError& err) {
            const auto n = root[key];
            if (!n) return true;
            if (!n.IsSequence()) { err = invalid(key, "expected a list of strings"); return false; }
            out.clear();
            for (const auto& item : n) {
                if (!item.IsScalar()) { err = invalid(key, "expected a list of strings"); return false; }
                out.push_back(item.as<std::string>());
            }
            return true;
        }

        // rapp_lists: "a.yaml;b.yaml" or a sequence
        bool read_sources(const YAML::Node& root, const char* key, std::vector<std::string>& out, ConfigError& err) {
            const auto n = root[key];
            if (!n) return true;
            if (n.IsScalar()) {
                out = registry::split_source_list(n.as<std::string>());
                return true;
            }
            return read_list(root, key, out, err);
        }

        appmgr_detail::expected<ManagerConfig, ConfigError> from_node(const YAML::Node& root) {
            ManagerConfig cfg;
            if (!root || root.IsNull()) return cfg;
            if (!root.IsMap()) return unexpected(ConfigError{ConfigErrc::ParseError, {}, "document root is not a mapping"});

            ConfigError err;
            const bool ok =
                read_string(root, "robot_name", cfg.robot_name, err) &&
                read_string(root, "robot_type", cfg.robot_type, err) &&
                read_bool(root, "unique_suffix", cfg.unique_suffix, err) &&
                read_sources(root, "rapp_lists", cfg.rapp_lists, err) &&
                read_list(root, "catalog_search_paths", cfg.catalog_search_paths, err) &&
                read_list(root, "capabilities", cfg.capabilities, err) &&
                read_list(root, "remote_controller_whitelist", cfg.remote_controller_whitelist, err) &&
                read_list(root, "remote_controller_blacklist", cfg.remote_controller_blacklist, err) &&
                read_bool(root, "local_only", cfg.local_only, err) &&
                read_string(root, "matcher", cfg.matcher, err) &&
                read_string(root, "auto_start_rapp", cfg.auto_start_rapp, err) &&
                read_ms(root, "watch_period_ms", constants::WATCH_PERIOD_MS_MIN, cfg.watch_period_ms, err) &&
                read_ms(root, "hub_connect_timeout_ms", 1, cfg.hub_connect_timeout_ms, err) &&
                read_ms(root, "stop_grace_ms", 0, cfg.stop_grace_ms, err) &&
                read_ms(root, "kill_grace_ms", 0, cfg.kill_grace_ms, err) &&
                read_bool(root, "rapp_output_to_screen", cfg.rapp_output_to_screen, err) &&
                read_string(root, "log_level", cfg.log_level, err);
            if (!ok) return unexpected(err);

            if (cfg.matcher != "glob" && cfg.matcher != "regex") {
                return unexpected(invalid("matcher", "unknown matcher '" + cfg.matcher + "'"));
            }
            if (cfg.robot_name.empty()) cfg.robot_name = constants::ROBOT_NAME_DEFAULT;
            return cfg;
        }

    } // namespace

    const char* to_string(ConfigErrc c) noexcept {
        switch (c) {
            case ConfigErrc::FileUnreadable: return "file_unreadable";
            case ConfigErrc::ParseError:     return "parse_error";
            case ConfigErrc::InvalidValue:   return "invalid_value";
        }
        return "unknown";
    }

    appmgr_detail::expected<ManagerConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        YAML::Node root;
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::BadFile& e) {
            return unexpected(ConfigError{ConfigErrc::FileUnreadable, {}, path + ": " + e.what()});
        } catch (const YAML::Exception& e) {
            return unexpected(ConfigError{ConfigErrc::ParseError, {}, path + ": " + e.what()});
        }
        return from_node(root);
    }

    appmgr_detail::expected<ManagerConfig, ConfigError> Loader::load_from_string(std::string_view text) {
        YAML::Node root;
        try {
            root = YAML::Load(std::string(text));
        } catch (const YAML::Exception& e) {
            return unexpected(ConfigError{ConfigErrc::ParseError, {}, e.what()});
        }
        return from_node(root);
    }

} // namespace appmgr::config
