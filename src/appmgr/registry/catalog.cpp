/**
 * @file catalog.cpp
 * @brief YAML catalog parsing and reference resolution.
 */
#include "appmgr/registry/catalog.hpp"

#include <cctype>
#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

#include "appmgr/config/constants.hpp"

namespace appmgr::registry {

namespace {

using appmgr_detail::unexpected;

RegistryError malformed(const std::string& ref, std::string detail) {
    return RegistryError{RegistryErrc::MalformedEntry, ref, std::move(detail)};
}

bool scalar_list(const YAML::Node& node, std::vector<std::string>& out) {
    if (!node) return true; // optional
    if (!node.IsSequence()) return false;
    for (const auto& item : node) {
        if (!item.IsScalar()) return false;
        out.push_back(item.as<std::string>());
    }
    return true;
}

// Capabilities appear either as plain names or as {name: ...} maps.
bool capability_list(const YAML::Node& node, std::vector<std::string>& out) {
    if (!node) return true;
    if (!node.IsSequence()) return false;
    for (const auto& item : node) {
        if (item.IsScalar()) {
            out.push_back(item.as<std::string>());
        } else if (item.IsMap() && item["name"] && item["name"].IsScalar()) {
            out.push_back(item["name"].as<std::string>());
        } else {
            return false;
        }
    }
    return true;
}

appmgr_detail::expected<RappDescriptor, RegistryError>
parse_entry(const YAML::Node& node, std::size_t index, const std::string& ref) {
    const std::string where = "entry #" + std::to_string(index);
    if (!node.IsMap()) return unexpected(malformed(ref, where + ": not a mapping"));

    const auto id = node["id"];
    if (!id || !id.IsScalar() || id.as<std::string>().empty()) {
        return unexpected(malformed(ref, where + ": missing 'id'"));
    }
    const auto entry = node["entry"];
    if (!entry || !entry.IsScalar() || entry.as<std::string>().empty()) {
        return unexpected(malformed(ref, where + ": missing 'entry'"));
    }

    RappDescriptor d;
    d.id    = id.as<std::string>();
    d.entry = entry.as<std::string>();
    d.display_name = (node["name"] && node["name"].IsScalar()) ? node["name"].as<std::string>() : d.id;
    if (node["icon"]) {
        if (!node["icon"].IsScalar()) return unexpected(malformed(ref, where + ": 'icon' must be a string"));
        d.icon = node["icon"].as<std::string>();
    }
    if (!scalar_list(node["parameters"], d.parameters)) {
        return unexpected(malformed(ref, where + ": 'parameters' must be a list of strings"));
    }
    if (!capability_list(node["required_capabilities"], d.required_capabilities)) {
        return unexpected(malformed(ref, where + ": 'required_capabilities' must be a list"));
    }
    if (!scalar_list(node["interfaces"], d.interfaces)) {
        return unexpected(malformed(ref, where + ": 'interfaces' must be a list of strings"));
    }
    return d;
}

appmgr_detail::expected<RappList, RegistryError>
parse_root(const YAML::Node& root, const std::string& ref) {
    if (!root.IsMap()) return unexpected(malformed(ref, "document root is not a mapping"));
    const auto rapps = root["rapps"];
    if (!rapps || !rapps.IsSequence()) return unexpected(malformed(ref, "missing 'rapps' sequence"));

    RappList out;
    out.reserve(rapps.size());
    std::size_t index = 0;
    for (const auto& node : rapps) {
        auto d = parse_entry(node, index++, ref);
        if (!d) return unexpected(d.error());
        out.push_back(std::move(*d));
    }
    return out;
}

} // namespace

const char* to_string(RegistryErrc c) noexcept {
    switch (c) {
        case RegistryErrc::SourceUnreadable: return "source_unreadable";
        case RegistryErrc::MalformedEntry:   return "malformed_entry";
        case RegistryErrc::NotFound:         return "not_found";
    }
    return "unknown";
}

std::vector<std::string> split_source_list(std::string_view list) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= list.size()) {
        auto end = list.find(config::constants::CATALOG_LIST_SEPARATOR, start);
        if (end == std::string_view::npos) end = list.size();
        auto item = list.substr(start, end - start);
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.front()))) item.remove_prefix(1);
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.back())))  item.remove_suffix(1);
        if (!item.empty()) out.emplace_back(item);
        start = end + 1;
    }
    return out;
}

std::string YamlCatalogSource::resolve(const std::string& reference) const {
    namespace fs = std::filesystem;
    std::error_code ec;
    const fs::path ref{reference};
    if (ref.is_absolute()) {
        return fs::is_regular_file(ref, ec) ? reference : std::string{};
    }
    for (const auto& dir : search_paths_) {
        const auto candidate = fs::path{dir} / ref;
        if (fs::is_regular_file(candidate, ec)) return candidate.string();
    }
    return fs::is_regular_file(ref, ec) ? reference : std::string{};
}

appmgr_detail::expected<RappList, RegistryError>
YamlCatalogSource::read(const std::string& reference) const {
    const auto path = resolve(reference);
    if (path.empty()) {
        return unexpected(RegistryError{RegistryErrc::SourceUnreadable, reference, "no such catalog file"});
    }
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile& e) {
        return unexpected(RegistryError{RegistryErrc::SourceUnreadable, reference, e.what()});
    } catch (const YAML::Exception& e) {
        return unexpected(malformed(reference, e.what()));
    }
    try {
        return parse_root(root, reference);
    } catch (const YAML::Exception& e) {
        return unexpected(malformed(reference, e.what()));
    }
}

appmgr_detail::expected<RappList, RegistryError>
parse_catalog(std::string_view text, const std::string& reference) {
    try {
        return parse_root(YAML::Load(std::string(text)), reference);
    } catch (const YAML::Exception& e) {
        return unexpected(malformed(reference, e.what()));
    }
}

} // namespace appmgr::registry
