/**
 * @file test_auth.cpp
 * @brief Tests for AuthorizationGate evaluation order and policy publication.
 *
 * Validates:
 *  - Local requests always pass
 *  - local-only denies every remote request
 *  - Ordered patterns, first match wins; empty list is open
 *  - Glob and regex dialects are swappable behind the matcher interface
 *  - set_policy() is atomic under concurrent evaluate()
 *  - The blacklist applies to the open policy only
 *  - update_policy() never loses a concurrent edit
 */

#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "appmgr/auth/authorization_gate.hpp"
#include "test_support.hpp"

using appmgr::auth::AuthorizationGate;
using appmgr::auth::GlobMatcher;
using appmgr::auth::RegexMatcher;
using appmgr::auth::Verdict;
using appmgr::auth::WhitelistPolicy;
using appmgr::auth::make_matcher;
using appmgr::test::RecordingObserver;

// --------------------------- Matchers ---------------------------------------

/**
 * @test Matcher_Glob_WholeString
 * @brief Glob patterns match the whole identity, not a substring.
 */
TEST(PatternMatcher, Matcher_Glob_WholeString) {
    GlobMatcher g;
    EXPECT_TRUE(g.match("hub-a*", "hub-a-1"));
    EXPECT_TRUE(g.match("hub-?", "hub-x"));
    EXPECT_FALSE(g.match("hub-a*", "my-hub-a-1"));
    EXPECT_FALSE(g.match("hub-a", "hub-a-1"));
}

/**
 * @test Matcher_Regex_Anchored
 * @brief Regex patterns are anchored; invalid expressions never match.
 */
TEST(PatternMatcher, Matcher_Regex_Anchored) {
    RegexMatcher r;
    EXPECT_TRUE(r.match("hub-a.*", "hub-a-1"));
    EXPECT_FALSE(r.match("hub-a", "hub-a-1"));
    EXPECT_FALSE(r.match("([unclosed", "anything"));
}

/**
 * @test Matcher_Factory
 * @brief Dialects are selected by name; unknown names yield nullptr.
 */
TEST(PatternMatcher, Matcher_Factory) {
    ASSERT_TRUE(make_matcher("glob"));
    ASSERT_TRUE(make_matcher("regex"));
    EXPECT_STREQ(make_matcher("regex")->name(), "regex");
    EXPECT_EQ(make_matcher("perl"), nullptr);
}

// --------------------------- Evaluation -------------------------------------

/**
 * @test Gate_Whitelist_FirstMatch
 * @brief ["hub-a*"]: hub-a-1 allowed, hub-b-1 denied and logged.
 */
TEST(AuthorizationGate, Gate_Whitelist_FirstMatch) {
    RecordingObserver obs;
    AuthorizationGate gate{nullptr, WhitelistPolicy{{"hub-a*"}, false}, obs};

    EXPECT_EQ(gate.evaluate("hub-a-1", false), Verdict::Allow);
    EXPECT_EQ(gate.evaluate("hub-b-1", false), Verdict::Deny);
    EXPECT_EQ(obs.snapshot().auth_denials, 1u);
}

/**
 * @test Gate_LocalOnly_DeniesAllRemote
 * @brief local-only overrides any pattern for remote callers.
 */
TEST(AuthorizationGate, Gate_LocalOnly_DeniesAllRemote) {
    RecordingObserver obs;
    AuthorizationGate gate{nullptr, WhitelistPolicy{{"hub-a*", "*"}, true}, obs};

    EXPECT_EQ(gate.evaluate("hub-a-1", false), Verdict::Deny);
    EXPECT_EQ(gate.evaluate("hub-b-1", false), Verdict::Deny);
    EXPECT_EQ(gate.evaluate("", false), Verdict::Deny);
}

/**
 * @test Gate_Local_AlwaysAllowed
 * @brief Local requests pass whatever the policy says.
 */
TEST(AuthorizationGate, Gate_Local_AlwaysAllowed) {
    RecordingObserver obs;
    AuthorizationGate gate{nullptr, WhitelistPolicy{{"nobody"}, true}, obs};

    EXPECT_EQ(gate.evaluate("", true), Verdict::Allow);
    EXPECT_EQ(gate.evaluate("hub-z", true), Verdict::Allow);
    EXPECT_EQ(obs.snapshot().auth_denials, 0u);
}

/**
 * @test Gate_EmptyList_Open
 * @brief No patterns and local-only off: every remote hub is allowed.
 */
TEST(AuthorizationGate, Gate_EmptyList_Open) {
    RecordingObserver obs;
    AuthorizationGate gate{nullptr, WhitelistPolicy{}, obs};

    EXPECT_TRUE(gate.policy()->open());
    EXPECT_EQ(gate.evaluate("anyone", false), Verdict::Allow);
}

/**
 * @test Gate_Regex_Dialect
 * @brief The same evaluation order runs over a regex matcher.
 */
TEST(AuthorizationGate, Gate_Regex_Dialect) {
    RecordingObserver obs;
    AuthorizationGate gate{make_matcher("regex"), WhitelistPolicy{{"hub-[ab]-[0-9]+"}, false}, obs};

    EXPECT_STREQ(gate.matcher().name(), "regex");
    EXPECT_EQ(gate.evaluate("hub-b-42", false), Verdict::Allow);
    EXPECT_EQ(gate.evaluate("hub-c-1", false), Verdict::Deny);
}

// --------------------------- Policy replacement -----------------------------

/**
 * @test Gate_SetPolicy_TakesEffect
 * @brief Replacement applies to later evaluations and bumps the version.
 */
TEST(AuthorizationGate, Gate_SetPolicy_TakesEffect) {
    RecordingObserver obs;
    AuthorizationGate gate{nullptr, WhitelistPolicy{{"hub-a*"}, false}, obs};
    const auto v0 = gate.version();
    const auto old_snapshot = gate.policy();

    gate.set_policy(WhitelistPolicy{{"hub-b*"}, false});

    EXPECT_EQ(gate.version(), v0 + 1);
    EXPECT_EQ(gate.evaluate("hub-a-1", false), Verdict::Deny);
    EXPECT_EQ(gate.evaluate("hub-b-1", false), Verdict::Allow);
    // a snapshot taken before the swap is unaffected
    EXPECT_EQ(gate.evaluate_with(*old_snapshot, "hub-a-1", false), Verdict::Allow);
}

/**
 * @test Gate_Concurrent_NoTornPolicy
 * @brief Readers only ever see one of the two complete policies.
 */
TEST(AuthorizationGate, Gate_Concurrent_NoTornPolicy) {
    RecordingObserver obs;
    const WhitelistPolicy a{{"hub-a*"}, false};
    const WhitelistPolicy b{{"hub-b*", "hub-c*"}, true};
    AuthorizationGate gate{nullptr, a, obs};

    std::atomic<bool> stop{false};
    std::atomic<int>  torn{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!stop.load(std::memory_order_relaxed)) {
                const auto snap = gate.policy();
                if (!(*snap == a) && !(*snap == b)) torn.fetch_add(1);
            }
        });
    }
    for (int i = 0; i < 2000; ++i) gate.set_policy(i % 2 ? a : b);
    stop.store(true);
    for (auto& t : readers) t.join();

    EXPECT_EQ(torn.load(), 0);
    EXPECT_EQ(gate.version(), 2000u);
}

// --------------------------- Blacklist --------------------------------------

/**
 * @test Gate_Blacklist_OnlyWhenWhitelistEmpty
 * @brief An open policy refuses blacklisted hubs; a whitelist ignores the blacklist.
 */
TEST(AuthorizationGate, Gate_Blacklist_OnlyWhenWhitelistEmpty) {
    RecordingObserver obs;
    AuthorizationGate gate{nullptr, WhitelistPolicy{{}, false, {"hub-rogue*"}}, obs};

    EXPECT_EQ(gate.evaluate("hub-rogue-1", false), Verdict::Deny);
    EXPECT_EQ(gate.evaluate("hub-a-1", false), Verdict::Allow);
    EXPECT_EQ(gate.evaluate("hub-rogue-1", true), Verdict::Allow);
    EXPECT_EQ(obs.snapshot().auth_denials, 1u);

    gate.set_policy(WhitelistPolicy{{"hub-r*"}, false, {"hub-rogue*"}});
    EXPECT_EQ(gate.evaluate("hub-rogue-1", false), Verdict::Allow);
    EXPECT_EQ(gate.evaluate("hub-a-1", false), Verdict::Deny);
}

// --------------------------- Read-modify-write ------------------------------

/**
 * @test Gate_UpdatePolicy_NoLostEdits
 * @brief Concurrent field edits all land; each one bumps the version once.
 */
TEST(AuthorizationGate, Gate_UpdatePolicy_NoLostEdits) {
    RecordingObserver obs;
    AuthorizationGate gate{nullptr, WhitelistPolicy{}, obs};

    constexpr int kThreads = 8;
    constexpr int kEdits   = 50;
    std::vector<std::thread> writers;
    for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([&gate, t] {
            for (int i = 0; i < kEdits; ++i) {
                const std::string pattern = "hub-" + std::to_string(t) + "-" + std::to_string(i);
                gate.update_policy([&](WhitelistPolicy& p) { p.patterns.push_back(pattern); });
            }
        });
    }
    for (auto& w : writers) w.join();

    EXPECT_EQ(gate.policy()->patterns.size(), static_cast<std::size_t>(kThreads * kEdits));
    EXPECT_EQ(gate.version(), static_cast<uint64_t>(kThreads * kEdits));
}

/**
 * @test Gate_UpdatePolicy_KeepsOtherFields
 * @brief Editing one field leaves the rest of the policy as it was.
 */
TEST(AuthorizationGate, Gate_UpdatePolicy_KeepsOtherFields) {
    RecordingObserver obs;
    AuthorizationGate gate{nullptr, WhitelistPolicy{{"hub-a*"}, false, {"hub-x"}}, obs};

    const auto v = gate.update_policy([](WhitelistPolicy& p) { p.local_only = true; });
    EXPECT_EQ(v, gate.version());
    EXPECT_TRUE(gate.policy()->local_only);
    EXPECT_EQ(gate.policy()->patterns, (std::vector<std::string>{"hub-a*"}));
    EXPECT_EQ(gate.policy()->blacklist, (std::vector<std::string>{"hub-x"}));
}
