#pragma once
/**
 * @file catalog.hpp
 * @brief Catalog sources: resolve a reference and parse it into rapp entries.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "appmgr/compat/expected.hpp"
#include "appmgr/registry/rapp_descriptor.hpp"

namespace appmgr::registry {

/// Failure classes of catalog loading and lookup.
enum class RegistryErrc : std::uint8_t {
    SourceUnreadable, ///< Reference did not resolve or the file could not be read.
    MalformedEntry,   ///< Document or an entry violates the catalog schema.
    NotFound          ///< Lookup of an unknown identifier.
};

const char* to_string(RegistryErrc c) noexcept;

/// Error with enough context to name the offending source.
struct RegistryError {
    RegistryErrc code{RegistryErrc::SourceUnreadable};
    std::string  source; ///< Catalog reference (or identifier for NotFound)
    std::string  detail; ///< Parser/IO message
};

/**
 * @class CatalogSource
 * @brief Pluggable reader: catalog reference → ordered rapp entries.
 */
class CatalogSource {
public:
    virtual ~CatalogSource() = default;

    /**
     * @brief Read every entry of one catalog.
     * @param reference Catalog reference as configured.
     * @return Entries in document order, or the first error encountered.
     */
    virtual appmgr_detail::expected<RappList, RegistryError>
    read(const std::string& reference) const = 0;
};

/**
 * @class YamlCatalogSource
 * @brief File-backed catalogs in YAML; relative references are searched in order.
 */
class YamlCatalogSource final : public CatalogSource {
public:
    YamlCatalogSource() = default;
    explicit YamlCatalogSource(std::vector<std::string> search_paths)
        : search_paths_(std::move(search_paths)) {}

    appmgr_detail::expected<RappList, RegistryError>
    read(const std::string& reference) const override;

    /// Resolve a reference to an existing file path; empty when nothing matches.
    std::string resolve(const std::string& reference) const;

private:
    std::vector<std::string> search_paths_;
};

/// Parse catalog text (already loaded) attributed to @p reference.
appmgr_detail::expected<RappList, RegistryError>
parse_catalog(std::string_view text, const std::string& reference);

/// Split "a;b;;c" into {"a","b","c"} (empty items dropped, whitespace trimmed).
std::vector<std::string> split_source_list(std::string_view list);

} // namespace appmgr::registry
