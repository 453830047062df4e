/**
 * @file test_presence.cpp
 * @brief Tests for RobotIdentity and PresenceController against the loopback hub.
 *
 * Validates:
 *  - Identity naming (base, suffix, application namespace)
 *  - Endpoint derivation from rapp interfaces and whitelist patterns
 *  - set_advertised() idempotence (one observable flip)
 *  - Pending flips while disconnected; convergence after reconnect
 *  - Connect failures are surfaced once, never retried inline
 */

#include <gtest/gtest.h>
#include <cctype>
#include <chrono>
#include <optional>
#include <string>

#include "appmgr/auth/authorization_gate.hpp"
#include "appmgr/gateway/loopback_hub.hpp"
#include "appmgr/gateway/presence_controller.hpp"
#include "appmgr/gateway/robot_identity.hpp"
#include "appmgr/registry/rapp_registry.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using appmgr::auth::AuthorizationGate;
using appmgr::auth::WhitelistPolicy;
using appmgr::gateway::EndpointSet;
using appmgr::gateway::FlipRule;
using appmgr::gateway::HubErrc;
using appmgr::gateway::LoopbackHub;
using appmgr::gateway::PresenceController;
using appmgr::gateway::RobotIdentity;
using appmgr::registry::RappDescriptor;
using appmgr::registry::RappRegistry;
using appmgr::test::RecordingObserver;

namespace {

RappRegistry make_registry(appmgr::obs::Observer& obs) {
    auto reg = RappRegistry::from_entries({
        RappDescriptor{.id = "talker", .entry = "talker", .interfaces = {"chatter"}},
        RappDescriptor{.id = "chirp", .entry = "chirp"},
        RappDescriptor{.id = "teleop", .entry = "teleop", .interfaces = {"cmd_vel", "/global/status"}},
    }, "test", obs);
    EXPECT_TRUE(reg);
    return std::move(*reg);
}

/// Common wiring: registry + gate + loopback hub + controller, connected as "robot".
struct PresenceFixture : ::testing::Test {
    RecordingObserver  obs;
    RappRegistry       reg{make_registry(obs)};
    AuthorizationGate  gate{nullptr, WhitelistPolicy{}, obs};
    LoopbackHub        hub;
    PresenceController presence{hub, reg, gate, 100ms, obs};
    RobotIdentity      id{"robot"};

    void SetUp() override { ASSERT_TRUE(presence.connect(id)); }
};

} // namespace

// --------------------------- Identity ---------------------------------------

/**
 * @test Identity_Names
 * @brief Effective name carries the suffix; namespace hangs off the effective name.
 */
TEST(RobotIdentity, Identity_Names) {
    RobotIdentity plain{"turtle"};
    EXPECT_EQ(plain.effective_name(), "turtle");
    EXPECT_EQ(plain.application_namespace(), "turtle/application");

    RobotIdentity tagged{"turtle", std::string("abc")};
    EXPECT_EQ(tagged.effective_name(), "turtle-abc");
    EXPECT_EQ(tagged.application_namespace(), "turtle-abc/application");

    RobotIdentity unnamed{""};
    EXPECT_EQ(unnamed.effective_name(), "app_manager");
}

/**
 * @test Identity_UniqueSuffix
 * @brief create(unique) appends a 16-digit lowercase hex token.
 */
TEST(RobotIdentity, Identity_UniqueSuffix) {
    auto a = RobotIdentity::create("turtle", true);
    ASSERT_TRUE(a.suffix());
    EXPECT_EQ(a.suffix()->size(), 16u);
    for (char c : *a.suffix()) EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)) && !std::isupper(static_cast<unsigned char>(c)));
    EXPECT_EQ(a.effective_name(), "turtle-" + *a.suffix());

    auto b = RobotIdentity::create("turtle", false);
    EXPECT_FALSE(b.suffix());
}

// --------------------------- Endpoint derivation ----------------------------

/**
 * @test Endpoints_FromInterfaces_AndPatterns
 * @brief Interfaces × patterns; absolute interfaces are kept verbatim.
 */
TEST(PresenceController, Endpoints_FromInterfaces_AndPatterns) {
    RobotIdentity id{"robot"};
    RappDescriptor teleop{.id = "teleop", .entry = "teleop", .interfaces = {"cmd_vel", "/global/status"}};

    auto set = PresenceController::compute_endpoints(id, &teleop, WhitelistPolicy{{"hub-a*"}, false});
    EXPECT_EQ(set, (EndpointSet{
        FlipRule{"/global/status", "hub-a*"},
        FlipRule{"/robot/application/cmd_vel", "hub-a*"},
    }));
}

/**
 * @test Endpoints_OpenPolicy_AnyHub
 * @brief No patterns: flipped to every hub; no interfaces: the rapp id itself.
 */
TEST(PresenceController, Endpoints_OpenPolicy_AnyHub) {
    RobotIdentity id{"robot"};
    RappDescriptor chirp{.id = "chirp", .entry = "chirp"};

    auto set = PresenceController::compute_endpoints(id, &chirp, WhitelistPolicy{});
    EXPECT_EQ(set, (EndpointSet{FlipRule{"/robot/application/chirp", "*"}}));
}

/**
 * @test Endpoints_Empty_WhenIdleOrLocalOnly
 * @brief Nothing is advertised without a rapp or under local-only.
 */
TEST(PresenceController, Endpoints_Empty_WhenIdleOrLocalOnly) {
    RobotIdentity id{"robot"};
    RappDescriptor chirp{.id = "chirp", .entry = "chirp"};

    EXPECT_TRUE(PresenceController::compute_endpoints(id, nullptr, WhitelistPolicy{}).empty());
    EXPECT_TRUE(PresenceController::compute_endpoints(id, &chirp, WhitelistPolicy{{"*"}, true}).empty());
}

// --------------------------- Reconciliation ---------------------------------

/**
 * @test Presence_SetAdvertised_Idempotent
 * @brief Same target twice: one flip on the hub, second call changes nothing.
 */
TEST_F(PresenceFixture, Presence_SetAdvertised_Idempotent) {
    auto first = presence.set_advertised("talker");
    EXPECT_EQ(first.added, 1u);
    EXPECT_TRUE(first.converged());

    auto second = presence.set_advertised("talker");
    EXPECT_FALSE(second.changed());
    EXPECT_EQ(hub.stats().advertises, 1u);
    EXPECT_EQ(hub.advertised(), (std::set<FlipRule>{FlipRule{"/robot/application/chatter", "*"}}));
    EXPECT_EQ(presence.advertised(), hub.advertised());
}

/**
 * @test Presence_Retarget_And_Clear
 * @brief Switching rapps withdraws the old rules; none clears the hub.
 */
TEST_F(PresenceFixture, Presence_Retarget_And_Clear) {
    presence.set_advertised("talker");
    auto swap = presence.set_advertised("chirp");
    EXPECT_EQ(swap.removed, 1u);
    EXPECT_EQ(swap.added, 1u);
    EXPECT_EQ(hub.advertised(), (std::set<FlipRule>{FlipRule{"/robot/application/chirp", "*"}}));

    auto clear = presence.set_advertised(std::nullopt);
    EXPECT_EQ(clear.removed, 1u);
    EXPECT_TRUE(hub.advertised().empty());
    EXPECT_TRUE(presence.advertised().empty());
    EXPECT_FALSE(presence.target());
}

/**
 * @test Presence_PolicyChange_Reflips
 * @brief A new whitelist re-targets the same rapp's flips to the new hubs.
 */
TEST_F(PresenceFixture, Presence_PolicyChange_Reflips) {
    presence.set_advertised("talker");
    gate.set_policy(WhitelistPolicy{{"hub-a*", "hub-b*"}, false});

    auto rep = presence.set_advertised("talker");
    EXPECT_EQ(rep.removed, 1u);
    EXPECT_EQ(rep.added, 2u);
    EXPECT_EQ(hub.advertised().size(), 2u);

    gate.set_policy(WhitelistPolicy{{"hub-a*"}, true});
    presence.set_advertised("talker");
    EXPECT_TRUE(hub.advertised().empty());
}

/**
 * @test Presence_Unreachable_MarksPending
 * @brief Flips refused by the hub stay pending and converge on a later call.
 */
TEST_F(PresenceFixture, Presence_Unreachable_MarksPending) {
    hub.set_reachable(false);
    auto rep = presence.set_advertised("talker");
    EXPECT_EQ(rep.failed, 1u);
    EXPECT_EQ(rep.pending, 1u);
    EXPECT_EQ(presence.pending(), 1u);
    EXPECT_EQ(obs.snapshot().flip_failures, 1u);

    hub.set_reachable(true);
    auto retry = presence.set_advertised("talker");
    EXPECT_EQ(retry.added, 1u);
    EXPECT_TRUE(retry.converged());
    EXPECT_EQ(presence.pending(), 0u);
}

/**
 * @test Presence_ConnectionLost_ForgetsFlips
 * @brief A dropped session empties the advertised set until reconnect.
 */
TEST_F(PresenceFixture, Presence_ConnectionLost_ForgetsFlips) {
    presence.set_advertised("talker");
    hub.drop_connection();

    EXPECT_FALSE(presence.connected());
    EXPECT_TRUE(presence.advertised().empty());
    EXPECT_EQ(presence.pending(), 1u);
    EXPECT_EQ(obs.snapshot().connection_losses, 1u);

    ASSERT_TRUE(presence.reconnect());
    auto rep = presence.set_advertised("talker");
    EXPECT_EQ(rep.added, 1u);
    EXPECT_EQ(hub.advertised().size(), 1u);
}

/**
 * @test Presence_Events_EveryCall
 * @brief Each set_advertised() queues one event, drained oldest first.
 */
TEST_F(PresenceFixture, Presence_Events_EveryCall) {
    (void)presence.drain_events(); // connect event
    presence.set_advertised("talker");
    presence.set_advertised("talker");

    auto evs = presence.drain_events();
    ASSERT_EQ(evs.size(), 2u);
    EXPECT_LT(evs[0].seq, evs[1].seq);
    EXPECT_EQ(evs[0].report.added, 1u);
    EXPECT_FALSE(evs[1].report.changed());
    EXPECT_TRUE(presence.drain_events().empty());
}

// --------------------------- Connect ----------------------------------------

/**
 * @test Connect_Failures_Surface
 * @brief Unreachable and slow hubs fail the single attempt with typed errors.
 */
TEST(PresenceController, Connect_Failures_Surface) {
    RecordingObserver obs;
    RappRegistry reg{make_registry(obs)};
    AuthorizationGate gate{nullptr, WhitelistPolicy{}, obs};
    LoopbackHub hub;
    PresenceController presence{hub, reg, gate, 50ms, obs};

    hub.set_reachable(false);
    auto down = presence.connect(RobotIdentity{"robot"});
    ASSERT_FALSE(down);
    EXPECT_EQ(down.error().code, HubErrc::Unreachable);
    EXPECT_EQ(hub.stats().connects, 1u); // no inline retry

    hub.set_reachable(true);
    hub.set_connect_latency(200ms);
    auto slow = presence.connect(RobotIdentity{"robot"});
    ASSERT_FALSE(slow);
    EXPECT_EQ(slow.error().code, HubErrc::Timeout);

    hub.set_connect_latency(0ms);
    ASSERT_TRUE(presence.reconnect());
    EXPECT_TRUE(presence.connected());
    EXPECT_EQ(hub.registered_name(), "robot");
}
