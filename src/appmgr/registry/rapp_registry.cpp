// RappRegistry: merge notes
// Sources are merged strictly in configured order. A duplicate id never
// replaces an earlier one; it is reported and skipped. Any source failure
// discards the partially merged result.

#include "appmgr/registry/rapp_registry.hpp"

#include "appmgr/config/constants.hpp"

namespace appmgr::registry {

using appmgr_detail::unexpected;
using namespace appmgr::config::constants;

//------------------------------- Validation -----------------------------------

bool RappRegistry::validateId(std::string_view id) noexcept {
    if (id.empty() || id.size() > REGISTRY_MAX_ID_LEN) return false;
    if (id.front() == '/' || id.back() == '/') return false;
    for (char c : id) {
        const bool ok = (c == '_' || c == '-' || c == '/' || c == '.' ||
                         (c >= '0' && c <= '9') ||
                         (c >= 'A' && c <= 'Z') ||
                         (c >= 'a' && c <= 'z'));
        if (!ok) return false;
    }
    return true;
}

//------------------------------- Construction ---------------------------------

bool RappRegistry::insert(RappDescriptor d) {
    if (index_.find(std::string_view{d.id}) != index_.end()) return false;
    index_.emplace(d.id, entries_.size());
    entries_.push_back(std::move(d));
    return true;
}

appmgr_detail::expected<void, RegistryError>
RappRegistry::merge(const RappList& entries, const std::string& source, obs::Observer& observer) {
    for (const auto& d : entries) {
        if (!validateId(d.id)) {
            return unexpected(RegistryError{RegistryErrc::MalformedEntry, source,
                                            "invalid rapp id '" + d.id + "'"});
        }
        if (d.entry.empty()) {
            return unexpected(RegistryError{RegistryErrc::MalformedEntry, source,
                                            "rapp '" + d.id + "' has no entry point"});
        }
        RappDescriptor entry = d;
        if (entry.display_name.empty()) entry.display_name = entry.id;
        if (!insert(std::move(entry))) {
            observer.record({obs::Severity::Warn, obs::Kind::RegistryConflict, "registry",
                        "duplicate rapp '" + d.id + "' in " + source + " ignored (first wins)"});
            continue;
        }
        if (entries_.size() > REGISTRY_MAX_RAPPS) {
            return unexpected(RegistryError{RegistryErrc::MalformedEntry, source,
                                            "catalog exceeds " + std::to_string(REGISTRY_MAX_RAPPS) + " rapps"});
        }
    }
    return {};
}

appmgr_detail::expected<RappRegistry, RegistryError>
RappRegistry::load(const std::vector<std::string>& sources,
                   const CatalogSource& reader,
                   obs::Observer& observer) {
    RappRegistry reg;
    for (const auto& ref : sources) {
        auto list = reader.read(ref);
        if (!list) return unexpected(list.error());
        auto merged = reg.merge(*list, ref, observer);
        if (!merged) return unexpected(merged.error());
        observer.record({obs::Severity::Info, obs::Kind::Note, "registry",
                    "loaded " + std::to_string(list->size()) + " rapps from " + ref});
    }
    return reg;
}

appmgr_detail::expected<RappRegistry, RegistryError>
RappRegistry::from_entries(const RappList& entries, const std::string& source, obs::Observer& observer) {
    RappRegistry reg;
    auto merged = reg.merge(entries, source, observer);
    if (!merged) return unexpected(merged.error());
    return reg;
}

//------------------------------- Lookup ---------------------------------------

const RappDescriptor* RappRegistry::find(std::string_view id) const noexcept {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second];
}

appmgr_detail::expected<RappDescriptor, RegistryError>
RappRegistry::lookup(std::string_view id) const {
    if (const auto* d = find(id)) return *d;
    return unexpected(RegistryError{RegistryErrc::NotFound, std::string(id), "no such rapp"});
}

} // namespace appmgr::registry
