#include <gtest/gtest.h>
#include "node_registry.hpp"
#include <atomic>

class NodeRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_.setMembershipListener([this]() { notifications_++; });
    }

    StaticNodeRegistry registry_;
    std::atomic<int> notifications_{0};
    Node a_{"host-a", 7000};
    Node b_{"host-b", 7000};
};

TEST_F(NodeRegistryTest, RegisteredNodesAreActiveInOrder) {
    registry_.registerNode(b_);
    registry_.registerNode(a_);

    auto active = registry_.getActiveNodes();
    ASSERT_EQ(active.size(), 2);
    EXPECT_EQ(active[0], b_);
    EXPECT_EQ(active[1], a_);
    EXPECT_EQ(registry_.getNodeCount(), 2);
    EXPECT_EQ(notifications_.load(), 2);
}

TEST_F(NodeRegistryTest, UnhealthyNodesLeaveActiveSet) {
    registry_.registerNode(a_);
    registry_.registerNode(b_);

    registry_.updateHealth(a_, false);

    auto active = registry_.getActiveNodes();
    ASSERT_EQ(active.size(), 1);
    EXPECT_EQ(active[0], b_);
    EXPECT_FALSE(registry_.isHealthy(a_.getId()));
    EXPECT_EQ(registry_.getNodeCount(), 2);

    registry_.updateHealth(a_, true);
    EXPECT_EQ(registry_.getActiveNodes().size(), 2);
}

TEST_F(NodeRegistryTest, RedundantHealthUpdateDoesNotNotify) {
    registry_.registerNode(a_);
    int before = notifications_.load();

    registry_.updateHealth(a_, true);
    registry_.updateHealth(Node("unknown", 1), false);

    EXPECT_EQ(notifications_.load(), before);
}

TEST_F(NodeRegistryTest, ReRegistrationRevivesNode) {
    registry_.registerNode(a_);
    registry_.updateHealth(a_, false);

    registry_.registerNode(a_);

    EXPECT_TRUE(registry_.isHealthy(a_.getId()));
    EXPECT_EQ(registry_.getNodeCount(), 1);
}

TEST_F(NodeRegistryTest, RemoveNode) {
    registry_.registerNode(a_);
    registry_.registerNode(b_);

    registry_.removeNode(a_);
    int after_remove = notifications_.load();
    registry_.removeNode(a_);

    auto active = registry_.getActiveNodes();
    ASSERT_EQ(active.size(), 1);
    EXPECT_EQ(active[0], b_);
    EXPECT_EQ(notifications_.load(), after_remove);
}

TEST_F(NodeRegistryTest, InitialNodesAreRegistered) {
    StaticNodeRegistry seeded({a_, b_});
    EXPECT_EQ(seeded.getActiveNodes().size(), 2);
}
