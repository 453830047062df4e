#pragma once
// App Manager: RappRegistry
// Ordered identifier → descriptor mapping built once from the configured catalogs.
//   • Merge order follows the configured source order; duplicates are first-wins.
//   • Fail-fast: one unreadable or malformed source aborts the whole load.
//   • Immutable after load; safe for concurrent readers without locking.


#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "appmgr/compat/expected.hpp"
#include "appmgr/obs/observability.hpp"
#include "appmgr/registry/catalog.hpp"
#include "appmgr/registry/rapp_descriptor.hpp"

namespace appmgr::registry {

///
/// Maintains an insertion-ordered catalog: RappId → RappDescriptor.
/// - Built by the load() factory only; no mutation API.
/// - Heterogeneous lookup with string_view (no temporaries per query).
///
class RappRegistry final {
public:
    // Transparent hash/equal functors enable heterogeneous lookup with string_view.
    struct SKeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct SKeyEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept {
            return a == b;
        }
    };

    using Index = std::unordered_map<std::string, std::size_t, SKeyHash, SKeyEq>;

    /// Empty registry (no catalogs configured).
    RappRegistry() = default;

    /**
     * @brief Load and merge all catalogs in order.
     * @param sources Catalog references, in priority order.
     * @param reader  Resolves and parses one reference.
     * @param observer Receives one RegistryConflict event per skipped duplicate.
     * @return The merged registry or the first source failure.
     */
    static appmgr_detail::expected<RappRegistry, RegistryError>
    load(const std::vector<std::string>& sources,
         const CatalogSource& reader,
         obs::Observer& observer = *obs::make_simple_observer());

    /// Build directly from parsed entries (same first-wins/validation rules).
    static appmgr_detail::expected<RappRegistry, RegistryError>
    from_entries(const RappList& entries,
                 const std::string& source,
                 obs::Observer& observer = *obs::make_simple_observer());

    /// Descriptor copy for @p id, or NotFound.
    [[nodiscard]] appmgr_detail::expected<RappDescriptor, RegistryError>
    lookup(std::string_view id) const;

    /// Non-owning pointer into the registry; nullptr when absent.
    [[nodiscard]] const RappDescriptor* find(std::string_view id) const noexcept;

    [[nodiscard]] bool contains(std::string_view id) const noexcept { return find(id) != nullptr; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// Entries in merge order.
    [[nodiscard]] const RappList& entries() const noexcept { return entries_; }

    /// Validate a rapp identifier: [A-Za-z0-9_./-], no leading/trailing '/'.
    static bool validateId(std::string_view id) noexcept;

private:
    // Insert unless present. Returns false for a duplicate (caller reports it).
    bool insert(RappDescriptor d);

    appmgr_detail::expected<void, RegistryError>
    merge(const RappList& entries, const std::string& source, obs::Observer& observer);

    RappList entries_;
    Index    index_;
};

} // namespace appmgr::registry
