#include "hash_ring.hpp"
#include <stdexcept>
#include <unordered_set>
#include <openssl/evp.h>

HashRing::HashRing(int virtual_nodes, HashFunction hash)
    : virtual_nodes(virtual_nodes), hash(std::move(hash)) {
    if (virtual_nodes <= 0) {
        throw std::invalid_argument("HashRing requires at least one virtual node per node");
    }
    if (!this->hash) {
        throw std::invalid_argument("HashRing requires a hash function");
    }
}

uint32_t HashRing::md5Hash(const std::string& key) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(key.data(), key.size(), digest, &digest_len, EVP_md5(), nullptr) != 1 || digest_len < 4) {
        throw std::runtime_error("MD5 digest failed");
    }

    return (static_cast<uint32_t>(digest[0]) << 24) |
           (static_cast<uint32_t>(digest[1]) << 16) |
           (static_cast<uint32_t>(digest[2]) << 8) |
           static_cast<uint32_t>(digest[3]);
}

std::string HashRing::pointLabel(const Node& node, int index) const {
    return node.getId() + "#" + std::to_string(index);
}

void HashRing::addNodeLocked(const Node& node) {
    for (int i = 0; i < virtual_nodes; ++i) {
        ring[hash(pointLabel(node, i))] = node;
    }
    members[node.getId()] = node;
}

void HashRing::addNode(const Node& node) {
    std::lock_guard<std::mutex> lock(ring_mutex);
    addNodeLocked(node);
}

void HashRing::removeNode(const Node& node) {
    std::lock_guard<std::mutex> lock(ring_mutex);

    for (int i = 0; i < virtual_nodes; ++i) {
        auto it = ring.find(hash(pointLabel(node, i)));
        // A colliding point may have been claimed by another node
        if (it != ring.end() && it->second == node) {
            ring.erase(it);
        }
    }
    members.erase(node.getId());
}

void HashRing::rebuild(const std::vector<Node>& nodes) {
    std::lock_guard<std::mutex> lock(ring_mutex);
    ring.clear();
    members.clear();
    for (const auto& node : nodes) {
        addNodeLocked(node);
    }
}

std::optional<Node> HashRing::getOwner(const std::string& key) const {
    std::lock_guard<std::mutex> lock(ring_mutex);

    if (ring.empty()) {
        return std::nullopt;
    }

    auto it = ring.lower_bound(hash(key));
    if (it == ring.end()) {
        it = ring.begin();
    }
    return it->second;
}

std::vector<Node> HashRing::getReplicaSet(const std::string& key, size_t count) const {
    std::lock_guard<std::mutex> lock(ring_mutex);

    std::vector<Node> replicas;
    if (ring.empty() || count == 0) {
        return replicas;
    }

    std::unordered_set<std::string> seen;
    auto it = ring.lower_bound(hash(key));

    // One full lap over the points, wrapping at the end
    for (size_t visited = 0; visited < ring.size() && replicas.size() < count; ++visited) {
        if (it == ring.end()) {
            it = ring.begin();
        }
        if (seen.insert(it->second.getId()).second) {
            replicas.push_back(it->second);
        }
        ++it;
    }

    return replicas;
}

bool HashRing::hasNode(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(ring_mutex);
    return members.find(node_id) != members.end();
}

size_t HashRing::nodeCount() const {
    std::lock_guard<std::mutex> lock(ring_mutex);
    return members.size();
}

size_t HashRing::pointCount() const {
    std::lock_guard<std::mutex> lock(ring_mutex);
    return ring.size();
}
