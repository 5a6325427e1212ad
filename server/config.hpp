#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>
#include "../cachenode/eviction_policy.hpp"
#include "../cluster/replication.hpp"

struct NodeConfig {
    std::string listen_addr = "0.0.0.0:50061";
    std::string node_addr = "localhost:50061";
    std::vector<std::string> peers;

    size_t capacity = 1000;
    EvictionKind eviction = EvictionKind::LRU;

    ReplicationMode replication = ReplicationMode::QUORUM;
    size_t replicas = 2;
    size_t write_quorum = 0;  // 0 = majority of replicas

    int virtual_nodes = 100;
    size_t workers = 4;
    size_t rpc_threads = 8;
    std::chrono::milliseconds rpc_timeout{1000};

    std::string storage_path;  // empty = in-memory durable store
    int64_t storage_capacity = 1024LL * 1024 * 1024;

    size_t effectiveWriteQuorum() const;
};

enum class ParseResult {
    OK,
    HELP,
    ERROR
};

// Hand-rolled long-option parser. Errors are written to `err`.
ParseResult parseNodeConfig(int argc, char* argv[], NodeConfig& config, std::ostream& err);

// Throws std::invalid_argument on inconsistent settings
void validateNodeConfig(const NodeConfig& config);

void printUsage(const char* program, std::ostream& out);

std::vector<std::string> splitPeers(const std::string& list);
