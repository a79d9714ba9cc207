#include <gtest/gtest.h>
#include "rule_engine.hpp"
#include "list_store.hpp"
#include "guard_errors.hpp"
#include "fake_packet_filter.hpp"
#include "temp_dir.hpp"

class RuleEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        filter = std::make_unique<FakePacketFilter>();
        engine = std::make_unique<RuleEngine>(*filter, kPort);
    }

    static constexpr std::uint16_t kPort = 9901;

    std::unique_ptr<FakePacketFilter> filter;
    std::unique_ptr<RuleEngine> engine;

    const std::string test_ip1 = "203.0.113.7";
    const std::string test_ip2 = "10.0.0.5";
};

TEST_F(RuleEngineTest, ApplyIsIdempotent) {
    EXPECT_TRUE(engine->apply(test_ip1, FilterAction::DROP));
    EXPECT_FALSE(engine->apply(test_ip1, FilterAction::DROP));
    EXPECT_FALSE(engine->apply(test_ip1, FilterAction::DROP));

    EXPECT_EQ(filter->insert_calls, 1u);
    EXPECT_EQ(filter->count(test_ip1, kPort, FilterAction::DROP), 1u);
    EXPECT_TRUE(engine->has_rule(test_ip1, FilterAction::DROP));
}

TEST_F(RuleEngineTest, RevokeRemovesEveryCopy) {
    filter->rules = {
        {test_ip1, kPort, FilterAction::DROP},
        {test_ip1, kPort, FilterAction::DROP},
        {test_ip1, kPort, FilterAction::DROP},
    };

    EXPECT_TRUE(engine->revoke(test_ip1, FilterAction::DROP));
    EXPECT_EQ(filter->count(test_ip1, kPort, FilterAction::DROP), 0u);
    EXPECT_FALSE(engine->revoke(test_ip1, FilterAction::DROP));
}

TEST_F(RuleEngineTest, OtherPortsAreInvisibleAndUntouched) {
    filter->rules = {{test_ip1, 22, FilterAction::DROP}};

    EXPECT_TRUE(engine->list().empty());
    EXPECT_FALSE(engine->revoke(test_ip1, FilterAction::DROP));
    EXPECT_TRUE(engine->apply(test_ip1, FilterAction::DROP));

    EXPECT_EQ(filter->count(test_ip1, 22, FilterAction::DROP), 1u);
    EXPECT_EQ(filter->count(test_ip1, kPort, FilterAction::DROP), 1u);
}

TEST_F(RuleEngineTest, CommandFailuresPropagate) {
    filter->fail_insert = true;
    EXPECT_THROW(engine->apply(test_ip1, FilterAction::DROP), FilterCommandError);

    filter->fail_insert = false;
    filter->fail_list = true;
    EXPECT_THROW(engine->list(), FilterCommandError);
}

TEST_F(RuleEngineTest, RejectsInvalidAddress) {
    EXPECT_THROW(engine->apply("1.2.3.4 -j ACCEPT", FilterAction::DROP), ValidationError);
    EXPECT_EQ(filter->insert_calls, 0u);
}

class RuleEngineReconcileTest : public RuleEngineTest {
protected:
    void SetUp() override {
        RuleEngineTest::SetUp();
        dir = std::make_unique<TempDir>();
        store = std::make_unique<ListStore>(dir->file("whitelist"), dir->file("blacklist"));
        store->load();
    }

    std::unique_ptr<TempDir> dir;
    std::unique_ptr<ListStore> store;
};

TEST_F(RuleEngineReconcileTest, AppliesMissingRules) {
    store->add(ListStore::ListKind::ALLOWED, test_ip2);
    store->add(ListStore::ListKind::DENIED, test_ip1);

    auto report = engine->reconcile(*store);

    EXPECT_TRUE(report.clean());
    EXPECT_EQ(report.rules_applied, 2u);
    EXPECT_EQ(filter->count(test_ip2, kPort, FilterAction::ACCEPT), 1u);
    EXPECT_EQ(filter->count(test_ip1, kPort, FilterAction::DROP), 1u);
}

TEST_F(RuleEngineReconcileTest, ConvergesOnSecondRun) {
    store->add(ListStore::ListKind::DENIED, test_ip1);
    engine->reconcile(*store);
    filter->insert_calls = 0;

    auto second = engine->reconcile(*store);

    EXPECT_EQ(second.rules_applied, 0u);
    EXPECT_EQ(second.duplicates_removed, 0u);
    EXPECT_EQ(second.conflicts_revoked, 0u);
    EXPECT_EQ(filter->insert_calls, 0u);
}

TEST_F(RuleEngineReconcileTest, RemovesDuplicatesAndConflicts) {
    store->add(ListStore::ListKind::DENIED, test_ip1);
    filter->rules = {
        {test_ip1, kPort, FilterAction::DROP},
        {test_ip1, kPort, FilterAction::ACCEPT},
        {test_ip1, kPort, FilterAction::DROP},
    };

    auto report = engine->reconcile(*store);

    EXPECT_EQ(report.duplicates_removed, 1u);
    EXPECT_EQ(report.conflicts_revoked, 1u);
    EXPECT_EQ(report.rules_applied, 0u);
    EXPECT_EQ(filter->rules.size(), 1u);
    EXPECT_EQ(filter->count(test_ip1, kPort, FilterAction::DROP), 1u);
}

TEST_F(RuleEngineReconcileTest, LeavesUnlistedRulesAlone) {
    filter->rules = {
        {"192.0.2.50", kPort, FilterAction::DROP},
        {"192.0.2.51", kPort, FilterAction::ACCEPT},
    };

    auto report = engine->reconcile(*store);

    EXPECT_TRUE(report.clean());
    EXPECT_EQ(filter->rules.size(), 2u);
}

TEST_F(RuleEngineReconcileTest, ContinuesPastFailures) {
    store->add(ListStore::ListKind::DENIED, test_ip1);
    store->add(ListStore::ListKind::DENIED, "192.0.2.1");
    filter->fail_insert = true;

    auto report = engine->reconcile(*store);

    EXPECT_FALSE(report.clean());
    EXPECT_EQ(report.failures, 2u);
    EXPECT_EQ(report.errors.size(), 2u);
}

TEST_F(RuleEngineReconcileTest, UnreadableTableFailsWholeRun) {
    store->add(ListStore::ListKind::DENIED, test_ip1);
    filter->fail_list = true;

    auto report = engine->reconcile(*store);

    EXPECT_EQ(report.failures, 1u);
    EXPECT_EQ(filter->insert_calls, 0u);
}
