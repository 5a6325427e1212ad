#include "replication.hpp"
#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace {

struct AckTracker {
    std::mutex mutex;
    std::condition_variable cv;
    size_t acks = 0;
    size_t failures = 0;
};

}  // namespace

FanOutReplication::FanOutReplication(std::shared_ptr<PeerTransport> transport,
                                     std::shared_ptr<WorkerPool> pool,
                                     std::chrono::milliseconds timeout)
    : transport(std::move(transport)), pool(std::move(pool)), timeout(timeout) {
    if (!this->transport || !this->pool) {
        throw std::invalid_argument("Replication requires a transport and a worker pool");
    }
}

bool FanOutReplication::awaitAcks(const PutRequest& request,
                                  const std::vector<Node>& replicas,
                                  size_t required) {
    if (required == 0) {
        return true;
    }
    if (required > replicas.size()) {
        std::cerr << "[WARNING] Replication of " << request.key << " needs " << required
                  << " acks but only " << replicas.size() << " replicas are available\n";
        return false;
    }

    auto tracker = std::make_shared<AckTracker>();
    auto rpc = transport;
    auto rpc_timeout = timeout;

    for (const auto& replica : replicas) {
        try {
            pool->submit([tracker, rpc, rpc_timeout, request, replica]() {
                RpcResult result;
                try {
                    result = rpc->put(replica, request, rpc_timeout);
                } catch (const std::exception& e) {
                    result = {RpcStatus::INTERNAL, "", e.what()};
                }
                if (!result.ok()) {
                    std::cerr << "[WARNING] Replica " << replica.getId() << " did not acknowledge "
                              << request.operation_id << ": " << rpcStatusName(result.status)
                              << " " << result.message << "\n";
                }

                {
                    std::lock_guard<std::mutex> lock(tracker->mutex);
                    if (result.ok()) {
                        tracker->acks++;
                    } else {
                        tracker->failures++;
                    }
                }
                tracker->cv.notify_all();
            });
        } catch (const std::runtime_error& e) {
            std::cerr << "[WARNING] Replication to " << replica.getId() << " not scheduled: " << e.what() << "\n";
            std::lock_guard<std::mutex> lock(tracker->mutex);
            tracker->failures++;
        }
    }

    // Each RPC is bounded by its deadline, so the wait always ends
    std::unique_lock<std::mutex> lock(tracker->mutex);
    tracker->cv.wait(lock, [&]() {
        return tracker->acks >= required ||
               replicas.size() - tracker->failures < required;
    });

    return tracker->acks >= required;
}

// SynchronousReplication

bool SynchronousReplication::replicate(const PutRequest& request,
                                       const std::vector<Node>& replicas,
                                       size_t /*local_acks*/) {
    return awaitAcks(request, replicas, replicas.size());
}

// QuorumReplication

QuorumReplication::QuorumReplication(size_t write_quorum,
                                     std::shared_ptr<PeerTransport> transport,
                                     std::shared_ptr<WorkerPool> pool,
                                     std::chrono::milliseconds timeout)
    : FanOutReplication(std::move(transport), std::move(pool), timeout),
      write_quorum(write_quorum) {
    if (write_quorum < 1) {
        throw std::invalid_argument("Write quorum must be at least 1");
    }
}

bool QuorumReplication::replicate(const PutRequest& request,
                                  const std::vector<Node>& replicas,
                                  size_t local_acks) {
    size_t required = local_acks >= write_quorum ? 0 : write_quorum - local_acks;
    return awaitAcks(request, replicas, required);
}

std::string QuorumReplication::name() const {
    return "quorum(W=" + std::to_string(write_quorum) + ")";
}

// AsyncReplication

AsyncReplication::AsyncReplication(std::shared_ptr<PeerTransport> transport,
                                   std::shared_ptr<WorkerPool> pool,
                                   std::chrono::milliseconds timeout)
    : transport(std::move(transport)),
      pool(std::move(pool)),
      timeout(timeout),
      failed_deliveries(std::make_shared<std::atomic<uint64_t>>(0)) {
    if (!this->transport || !this->pool) {
        throw std::invalid_argument("Replication requires a transport and a worker pool");
    }
}

bool AsyncReplication::replicate(const PutRequest& request,
                                 const std::vector<Node>& replicas,
                                 size_t /*local_acks*/) {
    auto rpc = transport;
    auto rpc_timeout = timeout;
    auto failures = failed_deliveries;

    for (const auto& replica : replicas) {
        try {
            pool->submit([rpc, rpc_timeout, failures, request, replica]() {
                RpcResult result;
                try {
                    result = rpc->put(replica, request, rpc_timeout);
                } catch (const std::exception& e) {
                    result = {RpcStatus::INTERNAL, "", e.what()};
                }
                if (!result.ok()) {
                    failures->fetch_add(1);
                    std::cerr << "[WARNING] Async replication to " << replica.getId()
                              << " failed for " << request.operation_id << ": "
                              << rpcStatusName(result.status) << " " << result.message << "\n";
                }
            });
        } catch (const std::runtime_error& e) {
            failures->fetch_add(1);
            std::cerr << "[WARNING] Async replication to " << replica.getId()
                      << " not scheduled: " << e.what() << "\n";
        }
    }

    return true;
}

// Factories

std::optional<ReplicationMode> parseReplicationMode(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "sync" || lowered == "synchronous") {
        return ReplicationMode::SYNCHRONOUS;
    }
    if (lowered == "quorum") {
        return ReplicationMode::QUORUM;
    }
    if (lowered == "async" || lowered == "asynchronous") {
        return ReplicationMode::ASYNC;
    }
    return std::nullopt;
}

const char* replicationModeName(ReplicationMode mode) {
    switch (mode) {
        case ReplicationMode::SYNCHRONOUS: return "sync";
        case ReplicationMode::QUORUM: return "quorum";
        case ReplicationMode::ASYNC: return "async";
    }
    return "unknown";
}

std::unique_ptr<ReplicationStrategy> makeReplicationStrategy(ReplicationMode mode,
                                                             size_t write_quorum,
                                                             std::shared_ptr<PeerTransport> transport,
                                                             std::shared_ptr<WorkerPool> pool,
                                                             std::chrono::milliseconds timeout) {
    switch (mode) {
        case ReplicationMode::SYNCHRONOUS:
            return std::make_unique<SynchronousReplication>(std::move(transport), std::move(pool), timeout);
        case ReplicationMode::QUORUM:
            return std::make_unique<QuorumReplication>(write_quorum, std::move(transport), std::move(pool), timeout);
        case ReplicationMode::ASYNC:
            return std::make_unique<AsyncReplication>(std::move(transport), std::move(pool), timeout);
    }
    throw std::invalid_argument("Unknown replication mode");
}

size_t majorityQuorum(size_t replication_factor) {
    return (replication_factor + 2) / 2;
}
