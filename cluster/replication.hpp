#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "node.hpp"
#include "peer_transport.hpp"
#include "put_request.hpp"
#include "../cachenode/worker_pool.hpp"

enum class ReplicationMode {
    SYNCHRONOUS,
    QUORUM,
    ASYNC
};

// Propagates a write that the coordinator has already applied locally.
// `replicas` holds only the remote targets; `local_acks` is 1 when the local
// node was itself a replica and already holds the value.
class ReplicationStrategy {
public:
    virtual ~ReplicationStrategy() = default;

    virtual bool replicate(const PutRequest& request,
                           const std::vector<Node>& replicas,
                           size_t local_acks = 0) = 0;

    virtual std::string name() const = 0;
};

// Shared fan-out machinery: one RPC per replica on the pool, the caller
// blocks until `required` remote acks arrive or they become impossible.
class FanOutReplication : public ReplicationStrategy {
protected:
    std::shared_ptr<PeerTransport> transport;
    std::shared_ptr<WorkerPool> pool;
    std::chrono::milliseconds timeout;

    bool awaitAcks(const PutRequest& request, const std::vector<Node>& replicas, size_t required);

public:
    FanOutReplication(std::shared_ptr<PeerTransport> transport,
                      std::shared_ptr<WorkerPool> pool,
                      std::chrono::milliseconds timeout);
};

// Every remote replica must acknowledge
class SynchronousReplication : public FanOutReplication {
public:
    using FanOutReplication::FanOutReplication;

    bool replicate(const PutRequest& request,
                   const std::vector<Node>& replicas,
                   size_t local_acks = 0) override;
    std::string name() const override { return "synchronous"; }
};

// At least W acknowledgements, the local apply included
class QuorumReplication : public FanOutReplication {
private:
    size_t write_quorum;

public:
    QuorumReplication(size_t write_quorum,
                      std::shared_ptr<PeerTransport> transport,
                      std::shared_ptr<WorkerPool> pool,
                      std::chrono::milliseconds timeout);

    bool replicate(const PutRequest& request,
                   const std::vector<Node>& replicas,
                   size_t local_acks = 0) override;
    std::string name() const override;
};

// Fire-and-forget: always succeeds, failures are only logged and counted
class AsyncReplication : public ReplicationStrategy {
private:
    std::shared_ptr<PeerTransport> transport;
    std::shared_ptr<WorkerPool> pool;
    std::chrono::milliseconds timeout;
    std::shared_ptr<std::atomic<uint64_t>> failed_deliveries;

public:
    AsyncReplication(std::shared_ptr<PeerTransport> transport,
                     std::shared_ptr<WorkerPool> pool,
                     std::chrono::milliseconds timeout);

    bool replicate(const PutRequest& request,
                   const std::vector<Node>& replicas,
                   size_t local_acks = 0) override;
    std::string name() const override { return "async"; }

    uint64_t failedDeliveries() const { return failed_deliveries->load(); }
};

// Accepts "sync", "quorum" or "async" (case-insensitive)
std::optional<ReplicationMode> parseReplicationMode(const std::string& name);
const char* replicationModeName(ReplicationMode mode);

std::unique_ptr<ReplicationStrategy> makeReplicationStrategy(ReplicationMode mode,
                                                             size_t write_quorum,
                                                             std::shared_ptr<PeerTransport> transport,
                                                             std::shared_ptr<WorkerPool> pool,
                                                             std::chrono::milliseconds timeout);

// ceil((R + 1) / 2)
size_t majorityQuorum(size_t replication_factor);
