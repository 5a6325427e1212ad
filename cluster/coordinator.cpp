#include "coordinator.hpp"
#include <iostream>
#include <stdexcept>

DistributedCoordinator::DistributedCoordinator(const Node& local_node,
                                               LocalCacheEngine& engine,
                                               std::shared_ptr<NodeRegistry> registry,
                                               std::unique_ptr<ReplicationStrategy> replication,
                                               std::shared_ptr<PeerTransport> transport,
                                               const CoordinatorOptions& options)
    : local_node(local_node),
      engine(engine),
      registry(std::move(registry)),
      replication(std::move(replication)),
      transport(std::move(transport)),
      options(options),
      hash_ring(options.virtual_nodes) {

    if (!this->registry || !this->replication || !this->transport) {
        throw std::invalid_argument("DistributedCoordinator requires a registry, replication strategy and transport");
    }
    if (options.replication_factor < 1) {
        throw std::invalid_argument("Replication factor must be at least 1");
    }

    this->registry->registerNode(local_node);
    this->registry->setMembershipListener([this]() { refreshMembership(); });
    refreshMembership();

    std::cout << "[INFO] Coordinator for " << local_node.getId() << " ready: replicas="
              << options.replication_factor << ", replication=" << this->replication->name()
              << ", virtual_nodes=" << options.virtual_nodes << "\n";
}

DistributedCoordinator::~DistributedCoordinator() {
    registry->setMembershipListener(nullptr);
}

void DistributedCoordinator::refreshMembership() {
    auto nodes = registry->getActiveNodes();
    hash_ring.rebuild(nodes);
    std::cout << "[INFO] Hash ring rebuilt with " << nodes.size() << " nodes\n";
}

std::vector<Node> DistributedCoordinator::replicasFor(const std::string& key) const {
    return hash_ring.getReplicaSet(key, options.replication_factor);
}

void DistributedCoordinator::splitReplicas(const std::vector<Node>& replicas,
                                           bool& local_is_replica,
                                           std::vector<Node>& remote) const {
    local_is_replica = false;
    for (const auto& replica : replicas) {
        if (replica == local_node) {
            local_is_replica = true;
        } else {
            remote.push_back(replica);
        }
    }
}

std::optional<std::string> DistributedCoordinator::get(const std::string& key) {
    auto owner = hash_ring.getOwner(key);
    if (!owner.has_value() || *owner == local_node) {
        return engine.get(key).get();
    }

    RpcResult result = transport->get(*owner, key, options.rpc_timeout);
    switch (result.status) {
        case RpcStatus::OK:
            return result.value;
        case RpcStatus::NOT_FOUND:
            return std::nullopt;
        default:
            break;
    }

    // Best effort: the local copy may be stale or missing
    std::cerr << "[WARNING] Read of " << key << " from owner " << owner->getId() << " failed ("
              << rpcStatusName(result.status) << "), falling back to local cache\n";
    return engine.get(key).get();
}

bool DistributedCoordinator::put(const std::string& key, const std::string& value) {
    auto replicas = replicasFor(key);
    if (replicas.empty()) {
        std::cerr << "[ERROR] No active nodes for key " << key << "\n";
        return false;
    }

    bool local_is_replica = false;
    std::vector<Node> remote;
    splitReplicas(replicas, local_is_replica, remote);

    if (local_is_replica) {
        engine.internalPut(key, value).get();
    }

    PutRequest request = PutRequest::create(key, value);
    bool replicated = replication->replicate(request, remote, local_is_replica ? 1 : 0);
    if (!replicated) {
        std::cerr << "[ERROR] Replication failed for key " << key << " (" << request.operation_id
                  << ", " << replication->name() << ")\n";
    }
    return replicated;
}

bool DistributedCoordinator::remove(const std::string& key) {
    auto replicas = replicasFor(key);

    bool local_is_replica = false;
    std::vector<Node> remote;
    splitReplicas(replicas, local_is_replica, remote);

    if (local_is_replica) {
        engine.remove(key).get();
    }

    bool confirmed = true;
    for (const auto& replica : remote) {
        RpcResult result = transport->remove(replica, key, options.rpc_timeout);
        if (!result.ok() && result.status != RpcStatus::NOT_FOUND) {
            confirmed = false;
            std::cerr << "[WARNING] Delete of " << key << " on " << replica.getId() << " failed: "
                      << rpcStatusName(result.status) << " " << result.message << "\n";
        }
    }

    return confirmed;
}

void DistributedCoordinator::handlePutRequest(const PutRequest& request) {
    engine.internalPut(request.key, request.value).get();
}

std::optional<std::string> DistributedCoordinator::handleGetRequest(const std::string& key) {
    return engine.get(key).get();
}

bool DistributedCoordinator::handleDeleteRequest(const std::string& key) {
    return engine.remove(key).get();
}
