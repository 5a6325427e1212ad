#include "config.hpp"
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include "../cluster/node.hpp"

size_t NodeConfig::effectiveWriteQuorum() const {
    return write_quorum == 0 ? majorityQuorum(replicas) : write_quorum;
}

std::vector<std::string> splitPeers(const std::string& list) {
    std::vector<std::string> peers;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            peers.push_back(item);
        }
    }
    return peers;
}

void printUsage(const char* program, std::ostream& out) {
    out << "Usage: " << program << " [options]\n"
        << "Options:\n"
        << "  --listen-addr <addr>         gRPC listen address (default: 0.0.0.0:50061)\n"
        << "  --node-addr <host:port>      This node's identity on the ring (default: localhost:50061)\n"
        << "  --peers <host:port,...>      Other cluster nodes (default: none)\n"
        << "  --capacity <n>               Cache capacity in entries (default: 1000)\n"
        << "  --eviction <lru|lfu>         Eviction policy (default: lru)\n"
        << "  --replication <mode>         sync, quorum or async (default: quorum)\n"
        << "  --replicas <n>               Replication factor (default: 2)\n"
        << "  --write-quorum <n>           Acks required in quorum mode (default: majority)\n"
        << "  --virtual-nodes <n>          Ring points per node (default: 100)\n"
        << "  --workers <n>                Per-key executor workers (default: 4)\n"
        << "  --rpc-threads <n>            RPC handler and fan-out threads (default: 8)\n"
        << "  --rpc-timeout-ms <ms>        Deadline for peer calls (default: 1000)\n"
        << "  --storage-path <path>        Durable store directory (default: in-memory)\n"
        << "  --storage-capacity-mb <MB>   Durable store capacity (default: 1024)\n"
        << "  --help                       Show this help message\n";
}

void validateNodeConfig(const NodeConfig& config) {
    if (config.capacity < 1) {
        throw std::invalid_argument("capacity must be at least 1");
    }
    if (config.replicas < 1) {
        throw std::invalid_argument("replicas must be at least 1");
    }
    if (config.virtual_nodes < 1) {
        throw std::invalid_argument("virtual-nodes must be at least 1");
    }
    if (config.workers < 1) {
        throw std::invalid_argument("workers must be at least 1");
    }
    if (config.rpc_threads < 1) {
        throw std::invalid_argument("rpc-threads must be at least 1");
    }
    if (config.rpc_timeout.count() <= 0) {
        throw std::invalid_argument("rpc-timeout-ms must be positive");
    }
    if (config.storage_capacity <= 0) {
        throw std::invalid_argument("storage-capacity-mb must be positive");
    }

    size_t quorum = config.effectiveWriteQuorum();
    if (quorum < 1 || quorum > config.replicas) {
        throw std::invalid_argument("write-quorum must satisfy 1 <= W <= replicas");
    }

    if (!Node::fromAddress(config.node_addr).has_value()) {
        throw std::invalid_argument("invalid node address: " + config.node_addr);
    }
    for (const auto& peer : config.peers) {
        if (!Node::fromAddress(peer).has_value()) {
            throw std::invalid_argument("invalid peer address: " + peer);
        }
    }
}

namespace {

size_t parseCount(const std::string& option, const std::string& value) {
    if (value.empty() || value[0] == '-') {
        throw std::invalid_argument(option + " expects a non-negative number");
    }
    size_t consumed = 0;
    unsigned long long parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument(option + " expects a number, got " + value);
    }
    return static_cast<size_t>(parsed);
}

// parseCount with an upper bound, for options stored in narrower types
size_t parseBounded(const std::string& option, const std::string& value, unsigned long long max) {
    size_t parsed = parseCount(option, value);
    if (parsed > max) {
        throw std::invalid_argument(option + " must be at most " + std::to_string(max));
    }
    return parsed;
}

constexpr unsigned long long kMaxStorageMegabytes =
    static_cast<unsigned long long>(std::numeric_limits<int64_t>::max()) / (1024 * 1024);

}  // namespace

ParseResult parseNodeConfig(int argc, char* argv[], NodeConfig& config, std::ostream& err) {
    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help") {
                return ParseResult::HELP;
            }
            if (i + 1 >= argc) {
                err << "[ERROR] Unknown option or missing value: " << arg << "\n";
                return ParseResult::ERROR;
            }

            std::string value = argv[++i];
            if (arg == "--listen-addr") {
                config.listen_addr = value;
            } else if (arg == "--node-addr") {
                config.node_addr = value;
            } else if (arg == "--peers") {
                config.peers = splitPeers(value);
            } else if (arg == "--capacity") {
                config.capacity = parseCount(arg, value);
            } else if (arg == "--eviction") {
                auto kind = parseEvictionKind(value);
                if (!kind.has_value()) {
                    throw std::invalid_argument("unknown eviction policy " + value);
                }
                config.eviction = *kind;
            } else if (arg == "--replication") {
                auto mode = parseReplicationMode(value);
                if (!mode.has_value()) {
                    throw std::invalid_argument("unknown replication mode " + value);
                }
                config.replication = *mode;
            } else if (arg == "--replicas") {
                config.replicas = parseCount(arg, value);
            } else if (arg == "--write-quorum") {
                config.write_quorum = parseCount(arg, value);
                if (config.write_quorum == 0) {
                    throw std::invalid_argument("write-quorum must be at least 1");
                }
            } else if (arg == "--virtual-nodes") {
                config.virtual_nodes = static_cast<int>(parseBounded(arg, value, std::numeric_limits<int>::max()));
            } else if (arg == "--workers") {
                config.workers = parseCount(arg, value);
            } else if (arg == "--rpc-threads") {
                config.rpc_threads = parseBounded(arg, value, std::numeric_limits<int>::max());
            } else if (arg == "--rpc-timeout-ms") {
                config.rpc_timeout = std::chrono::milliseconds(
                    parseBounded(arg, value, std::numeric_limits<int32_t>::max()));
            } else if (arg == "--storage-path") {
                config.storage_path = value;
            } else if (arg == "--storage-capacity-mb") {
                config.storage_capacity = static_cast<int64_t>(parseBounded(arg, value, kMaxStorageMegabytes)) * 1024 * 1024;
            } else {
                err << "[ERROR] Unknown option: " << arg << "\n";
                return ParseResult::ERROR;
            }
        }

        validateNodeConfig(config);
    } catch (const std::invalid_argument& e) {
        err << "[ERROR] Invalid configuration: " << e.what() << "\n";
        return ParseResult::ERROR;
    } catch (const std::out_of_range&) {
        err << "[ERROR] Invalid configuration: value out of range\n";
        return ParseResult::ERROR;
    }

    return ParseResult::OK;
}
