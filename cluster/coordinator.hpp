#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "hash_ring.hpp"
#include "node.hpp"
#include "node_registry.hpp"
#include "peer_transport.hpp"
#include "put_request.hpp"
#include "replication.hpp"
#include "../cachenode/cache_engine.hpp"

struct CoordinatorOptions {
    size_t replication_factor = 2;
    std::chrono::milliseconds rpc_timeout{1000};
    int virtual_nodes = 100;
};

// Entry point of a cache node. Routes keys over the hash ring to the local
// engine or a peer and propagates writes through the replication strategy.
class DistributedCoordinator {
private:
    Node local_node;
    LocalCacheEngine& engine;
    std::shared_ptr<NodeRegistry> registry;
    std::unique_ptr<ReplicationStrategy> replication;
    std::shared_ptr<PeerTransport> transport;
    CoordinatorOptions options;
    HashRing hash_ring;

    void splitReplicas(const std::vector<Node>& replicas, bool& local_is_replica,
                       std::vector<Node>& remote) const;

public:
    DistributedCoordinator(const Node& local_node,
                           LocalCacheEngine& engine,
                           std::shared_ptr<NodeRegistry> registry,
                           std::unique_ptr<ReplicationStrategy> replication,
                           std::shared_ptr<PeerTransport> transport,
                           const CoordinatorOptions& options = CoordinatorOptions());
    ~DistributedCoordinator();

    DistributedCoordinator(const DistributedCoordinator&) = delete;
    DistributedCoordinator& operator=(const DistributedCoordinator&) = delete;

    // Reads from the owner; falls back to the local engine when the owner
    // cannot be reached. StoreError from the local path propagates.
    std::optional<std::string> get(const std::string& key);

    // false when the replication strategy reports too few acknowledgements.
    // The local replica may already hold the value in that case.
    bool put(const std::string& key, const std::string& value);

    // Delete on every replica; true when each one removed the key or reported it
    // absent, false if any replica could not be reached
    bool remove(const std::string& key);

    // Inbound handlers for peer RPCs
    void handlePutRequest(const PutRequest& request);
    std::optional<std::string> handleGetRequest(const std::string& key);
    bool handleDeleteRequest(const std::string& key);

    // Rebuild the ring from the registry's active nodes
    void refreshMembership();

    std::vector<Node> replicasFor(const std::string& key) const;
    const HashRing& ring() const { return hash_ring; }
    const ReplicationStrategy& replicationStrategy() const { return *replication; }
};
