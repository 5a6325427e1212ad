#include <gtest/gtest.h>
#include "coordinator.hpp"
#include "unit_test_utils.hpp"
#include <functional>

using unit_test_utils::LoopbackTransport;

// Three in-process nodes wired together through a loopback transport
class CoordinatorTest : public ::testing::Test {
protected:
    struct Member {
        Node node;
        std::shared_ptr<InMemoryDurableStore> durable;
        std::unique_ptr<LocalCacheEngine> engine;
        std::shared_ptr<StaticNodeRegistry> registry;
        std::unique_ptr<DistributedCoordinator> coordinator;
    };

    void SetUp() override {
        transport_ = std::make_shared<LoopbackTransport>();
        pool_ = std::make_shared<WorkerPool>(4, "fanout-test");
        nodes_ = {Node("node-1", 7001), Node("node-2", 7002), Node("node-3", 7003)};
    }

    void TearDown() override {
        // In-flight replica calls point at the coordinators
        pool_->shutdown();
        members_.clear();
    }

    void startCluster(ReplicationMode mode, size_t replicas, size_t write_quorum) {
        CoordinatorOptions options;
        options.replication_factor = replicas;
        options.rpc_timeout = std::chrono::milliseconds(200);
        options.virtual_nodes = 50;

        for (const auto& node : nodes_) {
            auto member = std::make_unique<Member>();
            member->node = node;
            member->durable = std::make_shared<InMemoryDurableStore>();
            member->engine = std::make_unique<LocalCacheEngine>(100, EvictionKind::LRU, member->durable, 2);
            member->registry = std::make_shared<StaticNodeRegistry>(nodes_);
            member->coordinator = std::make_unique<DistributedCoordinator>(
                node, *member->engine, member->registry,
                makeReplicationStrategy(mode, write_quorum, transport_, pool_, options.rpc_timeout),
                transport_, options);
            transport_->attach(node, member->coordinator.get());
            members_.push_back(std::move(member));
        }
    }

    Member& memberFor(const Node& node) {
        for (auto& member : members_) {
            if (member->node == node) {
                return *member;
            }
        }
        throw std::runtime_error("unknown node " + node.getId());
    }

    // First key whose replica set (seen from node-1) satisfies the predicate
    std::string findKey(std::function<bool(const std::vector<Node>&)> predicate) {
        for (int i = 0; i < 10000; ++i) {
            std::string key = "key_" + std::to_string(i);
            if (predicate(members_[0]->coordinator->replicasFor(key))) {
                return key;
            }
        }
        ADD_FAILURE() << "no key matches";
        return "key_0";
    }

    std::shared_ptr<LoopbackTransport> transport_;
    std::shared_ptr<WorkerPool> pool_;
    std::vector<Node> nodes_;
    std::vector<std::unique_ptr<Member>> members_;
};

TEST_F(CoordinatorTest, EveryNodeSeesTheSameRing) {
    startCluster(ReplicationMode::QUORUM, 2, 2);

    for (int i = 0; i < 100; ++i) {
        std::string key = "key_" + std::to_string(i);
        auto expected = members_[0]->coordinator->replicasFor(key);
        for (auto& member : members_) {
            EXPECT_EQ(member->coordinator->replicasFor(key), expected);
        }
    }
}

TEST_F(CoordinatorTest, PutThroughAnyNodeReadableEverywhere) {
    startCluster(ReplicationMode::QUORUM, 2, 2);

    for (int i = 0; i < 30; ++i) {
        std::string key = "key_" + std::to_string(i);
        auto& writer = *members_[i % members_.size()];
        ASSERT_TRUE(writer.coordinator->put(key, "value_" + std::to_string(i)));
    }

    for (int i = 0; i < 30; ++i) {
        std::string key = "key_" + std::to_string(i);
        for (auto& member : members_) {
            EXPECT_EQ(member->coordinator->get(key), "value_" + std::to_string(i));
        }
    }
}

TEST_F(CoordinatorTest, WriteLandsOnExactlyTheReplicaSet) {
    startCluster(ReplicationMode::SYNCHRONOUS, 2, 1);

    std::string key = "placement";
    auto replicas = members_[0]->coordinator->replicasFor(key);
    ASSERT_EQ(replicas.size(), 2);

    ASSERT_TRUE(members_[0]->coordinator->put(key, "v"));

    for (auto& member : members_) {
        bool is_replica = member->node == replicas[0] || member->node == replicas[1];
        EXPECT_EQ(member->engine->contains(key), is_replica) << member->node.getId();
        EXPECT_EQ(member->durable->read(key).has_value(), is_replica) << member->node.getId();
    }
}

TEST_F(CoordinatorTest, ReplicatedWritesDoNotFireWriteHook) {
    startCluster(ReplicationMode::SYNCHRONOUS, 3, 1);

    std::atomic<int> hook_calls{0};
    for (auto& member : members_) {
        member->engine->setWriteHook([&](const std::string&, const std::string&) { hook_calls++; });
    }

    ASSERT_TRUE(members_[0]->coordinator->put("k", "v"));
    EXPECT_EQ(hook_calls.load(), 0);
}

TEST_F(CoordinatorTest, QuorumFailureKeepsLocalWrite) {
    startCluster(ReplicationMode::QUORUM, 2, 2);

    std::string key = findKey([&](const std::vector<Node>& replicas) {
        return replicas.size() == 2 && replicas[0] == nodes_[0];
    });
    auto replicas = members_[0]->coordinator->replicasFor(key);
    transport_->detach(replicas[1]);

    EXPECT_FALSE(members_[0]->coordinator->put(key, "partial"));

    // Locally durable, not fully replicated
    EXPECT_EQ(members_[0]->engine->peek(key), "partial");
    EXPECT_EQ(members_[0]->durable->read(key), "partial");
    EXPECT_FALSE(memberFor(replicas[1]).engine->contains(key));
}

TEST_F(CoordinatorTest, SynchronousFailsWhenAnyReplicaIsDown) {
    startCluster(ReplicationMode::SYNCHRONOUS, 3, 1);

    transport_->detach(nodes_[2]);
    EXPECT_FALSE(members_[0]->coordinator->put("k", "v"));
}

TEST_F(CoordinatorTest, QuorumToleratesMinorityFailure) {
    startCluster(ReplicationMode::QUORUM, 3, 2);

    transport_->detach(nodes_[2]);
    EXPECT_TRUE(members_[0]->coordinator->put("k", "v"));
}

TEST_F(CoordinatorTest, AsyncSucceedsWithReplicaDown) {
    startCluster(ReplicationMode::ASYNC, 3, 1);

    transport_->detach(nodes_[1]);
    transport_->detach(nodes_[2]);
    EXPECT_TRUE(members_[0]->coordinator->put("k", "v"));

    pool_->shutdown();
    auto& async = dynamic_cast<const AsyncReplication&>(members_[0]->coordinator->replicationStrategy());
    EXPECT_EQ(async.failedDeliveries(), 2);
}

TEST_F(CoordinatorTest, RemoteReadFallsBackToLocalWhenOwnerDown) {
    startCluster(ReplicationMode::QUORUM, 1, 1);

    // Owned by node-2, read through node-1
    std::string key = findKey([&](const std::vector<Node>& replicas) {
        return replicas.size() == 1 && replicas[0] == nodes_[1];
    });

    members_[0]->engine->internalPut(key, "stale-local").get();
    ASSERT_TRUE(members_[1]->coordinator->put(key, "fresh"));

    EXPECT_EQ(members_[0]->coordinator->get(key), "fresh");

    transport_->detach(nodes_[1]);
    EXPECT_EQ(members_[0]->coordinator->get(key), "stale-local");
}

TEST_F(CoordinatorTest, RemoteNotFoundIsNotFallback) {
    startCluster(ReplicationMode::QUORUM, 1, 1);

    std::string key = findKey([&](const std::vector<Node>& replicas) {
        return replicas.size() == 1 && replicas[0] == nodes_[1];
    });
    members_[0]->engine->internalPut(key, "local-only").get();

    EXPECT_FALSE(members_[0]->coordinator->get(key).has_value());
}

TEST_F(CoordinatorTest, MembershipChangeRebuildsRing) {
    startCluster(ReplicationMode::QUORUM, 1, 1);

    std::string key = findKey([&](const std::vector<Node>& replicas) {
        return replicas.size() == 1 && replicas[0] == nodes_[1];
    });

    members_[0]->registry->updateHealth(nodes_[1], false);

    EXPECT_EQ(members_[0]->coordinator->ring().nodeCount(), 2);
    auto owner = members_[0]->coordinator->ring().getOwner(key);
    ASSERT_TRUE(owner.has_value());
    EXPECT_NE(*owner, nodes_[1]);
}

TEST_F(CoordinatorTest, RemoveDeletesOnEveryReplica) {
    startCluster(ReplicationMode::SYNCHRONOUS, 3, 1);

    ASSERT_TRUE(members_[0]->coordinator->put("k", "v"));
    EXPECT_TRUE(members_[1]->coordinator->remove("k"));

    for (auto& member : members_) {
        EXPECT_FALSE(member->engine->contains("k"));
        EXPECT_FALSE(member->coordinator->get("k").has_value());
    }
}

TEST_F(CoordinatorTest, RemoveReportsUnreachableReplica) {
    startCluster(ReplicationMode::SYNCHRONOUS, 3, 1);

    ASSERT_TRUE(members_[0]->coordinator->put("k", "v"));
    transport_->detach(nodes_[2]);

    EXPECT_FALSE(members_[0]->coordinator->remove("k"));
    EXPECT_FALSE(members_[0]->engine->contains("k"));
}

TEST_F(CoordinatorTest, LocalStoreErrorPropagatesFromPut) {
    auto failing = std::make_shared<unit_test_utils::FailingDurableStore>();
    LocalCacheEngine engine(10, EvictionKind::LRU, failing);
    auto registry = std::make_shared<StaticNodeRegistry>();

    DistributedCoordinator coordinator(nodes_[0], engine, registry,
                                       makeReplicationStrategy(ReplicationMode::SYNCHRONOUS, 1, transport_, pool_,
                                                               std::chrono::milliseconds(100)),
                                       transport_);

    failing->fail_writes = true;
    EXPECT_THROW(coordinator.put("k", "v"), StoreError);
}
