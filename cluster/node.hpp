#pragma once

#include <optional>
#include <string>

// A cache node. Identity is the "host:port" id; only the health flag changes.
class Node {
private:
    std::string id;
    std::string host;
    int port = 0;
    bool healthy = true;

public:
    Node() = default;
    Node(const std::string& host, int port);

    // Parse "host:port"; nullopt when malformed
    static std::optional<Node> fromAddress(const std::string& address);

    const std::string& getId() const { return id; }
    const std::string& getHost() const { return host; }
    int getPort() const { return port; }
    bool isHealthy() const { return healthy; }
    void setHealthy(bool value) { healthy = value; }

    // Address usable for a gRPC channel
    std::string address() const { return id; }

    bool operator==(const Node& other) const { return id == other.id; }
    bool operator!=(const Node& other) const { return id != other.id; }
};
