/**
 * @file test_registry.cpp
 * @brief Tests for catalog parsing and RappRegistry merge semantics.
 *
 * Validates:
 *  - YAML catalog schema (required keys, optional lists, capability forms)
 *  - First-wins merge across sources, with one conflict event per duplicate
 *  - Fail-fast load: one bad source aborts everything
 *  - Heterogeneous lookup and NotFound
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <string_view>

#include "appmgr/registry/catalog.hpp"
#include "appmgr/registry/rapp_registry.hpp"
#include "test_support.hpp"

using appmgr::registry::CatalogSource;
using appmgr::registry::RappList;
using appmgr::registry::RappRegistry;
using appmgr::registry::RegistryErrc;
using appmgr::registry::RegistryError;
using appmgr::registry::parse_catalog;
using appmgr::registry::split_source_list;
using appmgr::test::RecordingObserver;

namespace {

using Docs = std::map<std::string, std::string>;

/// Catalog references resolved from an in-memory table of YAML documents.
class MapCatalogSource final : public CatalogSource {
public:
    explicit MapCatalogSource(Docs docs) : docs_(std::move(docs)) {}

    appmgr_detail::expected<RappList, RegistryError> read(const std::string& ref) const override {
        auto it = docs_.find(ref);
        if (it == docs_.end()) {
            return appmgr_detail::unexpected(RegistryError{RegistryErrc::SourceUnreadable, ref, "missing"});
        }
        return parse_catalog(it->second, ref);
    }

private:
    Docs docs_;
};

constexpr const char* kTurtles = R"(
rapps:
  - id: turtle/talker
    name: Talker
    icon: talker.png
    entry: /usr/bin/talker
    parameters: ["--rate", "10"]
    interfaces: [chatter]
  - id: turtle/chirp
    entry: chirp
    required_capabilities:
      - speaker
      - name: microphone
)";

constexpr const char* kOverlay = R"(
rapps:
  - id: turtle/talker
    name: Shadowed Talker
    entry: /opt/other/talker
  - id: turtle/listener
    entry: listener
)";

} // namespace

// --------------------------- Catalog parsing --------------------------------

/**
 * @test Catalog_Parse_AllFields
 * @brief Every documented key lands in the descriptor; name defaults to id.
 */
TEST(Catalog, Catalog_Parse_AllFields) {
    auto list = parse_catalog(kTurtles, "turtles");
    ASSERT_TRUE(list);
    ASSERT_EQ(list->size(), 2u);

    const auto& talker = (*list)[0];
    EXPECT_EQ(talker.id, "turtle/talker");
    EXPECT_EQ(talker.display_name, "Talker");
    EXPECT_EQ(talker.icon, "talker.png");
    EXPECT_EQ(talker.entry, "/usr/bin/talker");
    EXPECT_EQ(talker.parameters, (std::vector<std::string>{"--rate", "10"}));
    EXPECT_EQ(talker.interfaces, (std::vector<std::string>{"chatter"}));

    const auto& chirp = (*list)[1];
    EXPECT_EQ(chirp.display_name, "turtle/chirp");
    EXPECT_EQ(chirp.required_capabilities, (std::vector<std::string>{"speaker", "microphone"}));
}

/**
 * @test Catalog_Reject_MissingEntry
 * @brief An entry without an entry point is a schema violation.
 */
TEST(Catalog, Catalog_Reject_MissingEntry) {
    auto list = parse_catalog("rapps:\n  - id: lonely\n", "bad");
    ASSERT_FALSE(list);
    EXPECT_EQ(list.error().code, RegistryErrc::MalformedEntry);
    EXPECT_EQ(list.error().source, "bad");
}

/**
 * @test Catalog_Reject_WrongShapes
 * @brief Root must be a mapping with a 'rapps' sequence; lists must be lists.
 */
TEST(Catalog, Catalog_Reject_WrongShapes) {
    EXPECT_FALSE(parse_catalog("- just a list", "a"));
    EXPECT_FALSE(parse_catalog("rapps: 3", "b"));
    EXPECT_FALSE(parse_catalog("rapps:\n  - id: x\n    entry: y\n    parameters: oops\n", "c"));
    EXPECT_FALSE(parse_catalog("rapps: [ {id: x, entry: y", "d")); // not YAML
}

/**
 * @test Catalog_Split_SourceList
 * @brief Semicolon lists are trimmed and empty items dropped.
 */
TEST(Catalog, Catalog_Split_SourceList) {
    EXPECT_EQ(split_source_list(" a.yaml ; b.yaml;;c.yaml ;"),
              (std::vector<std::string>{"a.yaml", "b.yaml", "c.yaml"}));
    EXPECT_TRUE(split_source_list("").empty());
    EXPECT_TRUE(split_source_list(" ; ").empty());
}

/**
 * @test Catalog_File_SearchPaths
 * @brief Relative references resolve through search paths; absent files are unreadable.
 */
TEST(Catalog, Catalog_File_SearchPaths) {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "appmgr_catalog_test";
    fs::create_directories(dir);
    {
        std::ofstream(dir / "turtles.yaml") << kTurtles;
    }

    appmgr::registry::YamlCatalogSource src(std::vector<std::string>{"/nonexistent/dir", dir.string()});
    EXPECT_EQ(src.resolve("turtles.yaml"), (dir / "turtles.yaml").string());

    auto ok = src.read("turtles.yaml");
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok->size(), 2u);

    auto missing = src.read("nope.yaml");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, RegistryErrc::SourceUnreadable);

    fs::remove_all(dir);
}

// --------------------------- Registry load ----------------------------------

/**
 * @test Registry_Load_FirstWins
 * @brief Earlier sources keep their entries; the duplicate is reported once.
 */
TEST(RappRegistry, Registry_Load_FirstWins) {
    MapCatalogSource src(Docs{{"turtles", kTurtles}, {"overlay", kOverlay}});
    RecordingObserver obs;

    auto reg = RappRegistry::load({"turtles", "overlay"}, src, obs);
    ASSERT_TRUE(reg);
    ASSERT_EQ(reg->size(), 3u);

    auto talker = reg->lookup("turtle/talker");
    ASSERT_TRUE(talker);
    EXPECT_EQ(talker->entry, "/usr/bin/talker");
    EXPECT_EQ(talker->display_name, "Talker");

    // merge order preserved
    EXPECT_EQ(reg->entries()[0].id, "turtle/talker");
    EXPECT_EQ(reg->entries()[1].id, "turtle/chirp");
    EXPECT_EQ(reg->entries()[2].id, "turtle/listener");

    EXPECT_EQ(obs.count_kind(appmgr::obs::Kind::RegistryConflict), 1u);
    EXPECT_EQ(obs.snapshot().registry_conflicts, 1u);
}

/**
 * @test Registry_Load_FailFast
 * @brief An unreadable source discards sources already merged.
 */
TEST(RappRegistry, Registry_Load_FailFast) {
    MapCatalogSource src(Docs{{"turtles", kTurtles}});
    RecordingObserver obs;

    auto reg = RappRegistry::load({"turtles", "missing"}, src, obs);
    ASSERT_FALSE(reg);
    EXPECT_EQ(reg.error().code, RegistryErrc::SourceUnreadable);
    EXPECT_EQ(reg.error().source, "missing");
}

/**
 * @test Registry_Load_MalformedAborts
 * @brief Schema violations in any source fail the whole load.
 */
TEST(RappRegistry, Registry_Load_MalformedAborts) {
    MapCatalogSource src(Docs{{"turtles", kTurtles}, {"broken", "rapps:\n  - name: no id\n    entry: x\n"}});
    RecordingObserver obs;

    auto reg = RappRegistry::load({"turtles", "broken"}, src, obs);
    ASSERT_FALSE(reg);
    EXPECT_EQ(reg.error().code, RegistryErrc::MalformedEntry);
}

/**
 * @test Registry_Lookup_NotFound
 * @brief Misses report NotFound; find() returns nullptr.
 */
TEST(RappRegistry, Registry_Lookup_NotFound) {
    MapCatalogSource src(Docs{{"turtles", kTurtles}});
    RecordingObserver obs;
    auto reg = RappRegistry::load({"turtles"}, src, obs);
    ASSERT_TRUE(reg);

    auto miss = reg->lookup(std::string_view{"turtle/ghost"});
    ASSERT_FALSE(miss);
    EXPECT_EQ(miss.error().code, RegistryErrc::NotFound);
    EXPECT_EQ(reg->find("turtle/ghost"), nullptr);
    EXPECT_TRUE(reg->contains("turtle/chirp"));
}

/**
 * @test Registry_ValidateId
 * @brief Namespaced ids pass; whitespace and edge slashes do not.
 */
TEST(RappRegistry, Registry_ValidateId) {
    EXPECT_TRUE(RappRegistry::validateId("turtle_concert/turtle_stroll"));
    EXPECT_TRUE(RappRegistry::validateId("a.b-c"));
    EXPECT_FALSE(RappRegistry::validateId(""));
    EXPECT_FALSE(RappRegistry::validateId("/leading"));
    EXPECT_FALSE(RappRegistry::validateId("trailing/"));
    EXPECT_FALSE(RappRegistry::validateId("has space"));
    EXPECT_FALSE(RappRegistry::validateId(std::string(200, 'x')));
}

/**
 * @test Registry_Empty_NoSources
 * @brief No configured catalogs yields an empty, usable registry.
 */
TEST(RappRegistry, Registry_Empty_NoSources) {
    MapCatalogSource src(Docs{});
    RecordingObserver obs;
    auto reg = RappRegistry::load({}, src, obs);
    ASSERT_TRUE(reg);
    EXPECT_TRUE(reg->empty());
}
