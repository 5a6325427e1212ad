#include "cache_node.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <grpcpp/resource_quota.h>
#include <grpcpp/server_builder.h>

std::shared_ptr<DurableStore> CacheNode::makeDurableStore(const NodeConfig& config) {
    if (config.storage_path.empty()) {
        std::cout << "[INFO] Using in-memory durable store\n";
        return std::make_shared<InMemoryDurableStore>();
    }

    auto store = std::make_shared<FileDurableStore>(config.storage_path, config.storage_capacity);
    if (!store->performHealthCheck()) {
        std::cerr << "[WARNING] Health check found issues, continuing anyway\n";
    }
    return store;
}

CacheNode::CacheNode(const NodeConfig& config) : config(config) {
    validateNodeConfig(config);

    local_node = *Node::fromAddress(config.node_addr);

    std::vector<Node> peers;
    for (const auto& address : config.peers) {
        auto peer = *Node::fromAddress(address);
        if (peer != local_node) {
            peers.push_back(peer);
        }
    }

    durable = makeDurableStore(config);
    engine = std::make_unique<LocalCacheEngine>(config.capacity, config.eviction, durable, config.workers);
    registry = std::make_shared<StaticNodeRegistry>(peers);
    transport = std::make_shared<GrpcPeerTransport>();
    fanout_pool = std::make_shared<WorkerPool>(config.rpc_threads, "fanout");

    auto replication = makeReplicationStrategy(config.replication,
                                               config.effectiveWriteQuorum(),
                                               transport,
                                               fanout_pool,
                                               config.rpc_timeout);

    CoordinatorOptions options;
    options.replication_factor = config.replicas;
    options.rpc_timeout = config.rpc_timeout;
    options.virtual_nodes = config.virtual_nodes;

    coordinator = std::make_unique<DistributedCoordinator>(local_node, *engine, registry,
                                                           std::move(replication), transport, options);

    replica_service = std::make_unique<ReplicaServiceImpl>(coordinator.get());
    cache_service = std::make_unique<CacheServiceImpl>(coordinator.get());
}

CacheNode::~CacheNode() {
    stop();
}

bool CacheNode::start() {
    grpc::ResourceQuota quota("minicache-" + local_node.getId());
    quota.SetMaxThreads(static_cast<int>(config.rpc_threads));

    grpc::ServerBuilder builder;
    builder.SetResourceQuota(quota);
    builder.AddListeningPort(config.listen_addr, grpc::InsecureServerCredentials());
    builder.RegisterService(replica_service.get());
    builder.RegisterService(cache_service.get());

    server = builder.BuildAndStart();
    if (!server) {
        std::cerr << "[ERROR] Failed to start cache node on " << config.listen_addr << "\n";
        return false;
    }

    std::cout << "[INFO] Cache node " << local_node.getId() << " listening on " << config.listen_addr << "\n";
    std::cout << "[INFO] Peers: " << config.peers.size()
              << ", replication: " << coordinator->replicationStrategy().name()
              << ", eviction: " << engine->evictionPolicy().name() << "\n";
    return true;
}

void CacheNode::wait() {
    if (server) {
        server->Wait();
    }
}

void CacheNode::stop() {
    if (stopped.exchange(true)) {
        return;
    }

    if (server) {
        auto deadline = std::chrono::system_clock::now() + std::chrono::seconds(2);
        server->Shutdown(deadline);
    }
    fanout_pool->shutdown();
    engine->shutdown();

    std::cout << "[INFO] Cache node " << local_node.getId() << " stopped\n";
}
