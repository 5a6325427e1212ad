#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "node.hpp"

// Consistent-hashing ring. Each node owns V virtual points at
// hash(node.id + "#" + i); a key belongs to the first point clockwise from
// hash(key), wrapping past the top of the 32-bit space.
class HashRing {
public:
    using HashFunction = std::function<uint32_t(const std::string&)>;

    explicit HashRing(int virtual_nodes = 100, HashFunction hash = md5Hash);

    void addNode(const Node& node);
    void removeNode(const Node& node);

    // Replace the whole membership
    void rebuild(const std::vector<Node>& nodes);

    // nullopt only when the ring is empty
    std::optional<Node> getOwner(const std::string& key) const;

    // Up to `count` distinct nodes, starting with the owner, walking clockwise
    std::vector<Node> getReplicaSet(const std::string& key, size_t count) const;

    bool hasNode(const std::string& node_id) const;
    size_t nodeCount() const;
    size_t pointCount() const;
    int virtualNodeCount() const { return virtual_nodes; }

    // First four bytes of the MD5 digest, big-endian
    static uint32_t md5Hash(const std::string& key);

private:
    int virtual_nodes;
    HashFunction hash;

    mutable std::mutex ring_mutex;
    std::map<uint32_t, Node> ring;                    // point -> owning node
    std::unordered_map<std::string, Node> members;    // node id -> node

    std::string pointLabel(const Node& node, int index) const;
    void addNodeLocked(const Node& node);
};
