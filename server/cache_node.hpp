#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include "config.hpp"
#include "cache_service.hpp"
#include "../cachenode/cache_engine.hpp"
#include "../cachenode/durable_store.hpp"
#include "../cachenode/worker_pool.hpp"
#include "../cluster/coordinator.hpp"
#include "../cluster/node_registry.hpp"
#include "../cluster/peer_transport.hpp"

// One cache node: durable store, engine, ring coordinator and both gRPC services
class CacheNode {
private:
    NodeConfig config;
    Node local_node;

    std::shared_ptr<DurableStore> durable;
    std::unique_ptr<LocalCacheEngine> engine;
    std::shared_ptr<StaticNodeRegistry> registry;
    std::shared_ptr<PeerTransport> transport;
    std::shared_ptr<WorkerPool> fanout_pool;
    std::unique_ptr<DistributedCoordinator> coordinator;

    std::unique_ptr<ReplicaServiceImpl> replica_service;
    std::unique_ptr<CacheServiceImpl> cache_service;
    std::unique_ptr<grpc::Server> server;

    std::atomic<bool> stopped{false};

    static std::shared_ptr<DurableStore> makeDurableStore(const NodeConfig& config);

public:
    // Throws std::invalid_argument for an inconsistent config
    explicit CacheNode(const NodeConfig& config);
    ~CacheNode();

    CacheNode(const CacheNode&) = delete;
    CacheNode& operator=(const CacheNode&) = delete;

    // false if the listening port could not be bound
    bool start();

    // Blocks until the server shuts down
    void wait();

    void stop();

    DistributedCoordinator& getCoordinator() { return *coordinator; }
    LocalCacheEngine& getEngine() { return *engine; }
    const Node& getLocalNode() const { return local_node; }
};
