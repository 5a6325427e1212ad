#include "node_registry.hpp"
#include <algorithm>
#include <iostream>

StaticNodeRegistry::StaticNodeRegistry(const std::vector<Node>& initial_nodes) {
    for (const auto& node : initial_nodes) {
        registerNode(node);
    }
}

void StaticNodeRegistry::notifyMembershipChanged() {
    MembershipListener callback;
    {
        std::lock_guard<std::mutex> lock(listener_mutex);
        callback = listener;
    }
    if (callback) {
        callback();
    }
}

std::vector<Node> StaticNodeRegistry::getActiveNodes() const {
    std::lock_guard<std::mutex> lock(nodes_mutex);
    std::vector<Node> active_nodes;

    for (const auto& id : registration_order) {
        const auto& state = nodes.at(id);
        if (state.node.isHealthy()) {
            active_nodes.push_back(state.node);
        }
    }

    return active_nodes;
}

void StaticNodeRegistry::registerNode(const Node& node) {
    {
        std::lock_guard<std::mutex> lock(nodes_mutex);

        auto now = std::chrono::steady_clock::now();
        auto it = nodes.find(node.getId());
        if (it != nodes.end()) {
            // Re-registration revives the node
            it->second.node.setHealthy(true);
            it->second.last_health_change = now;
        } else {
            NodeState state;
            state.node = node;
            state.node.setHealthy(true);
            state.registered_at = now;
            state.last_health_change = now;
            nodes[node.getId()] = state;
            registration_order.push_back(node.getId());
        }
    }

    std::cout << "[INFO] Registered node: " << node.getId() << "\n";
    notifyMembershipChanged();
}

void StaticNodeRegistry::removeNode(const Node& node) {
    {
        std::lock_guard<std::mutex> lock(nodes_mutex);
        if (nodes.erase(node.getId()) == 0) {
            return;
        }
        registration_order.erase(
            std::remove(registration_order.begin(), registration_order.end(), node.getId()),
            registration_order.end());
    }

    std::cout << "[INFO] Removed node: " << node.getId() << "\n";
    notifyMembershipChanged();
}

void StaticNodeRegistry::updateHealth(const Node& node, bool healthy) {
    {
        std::lock_guard<std::mutex> lock(nodes_mutex);
        auto it = nodes.find(node.getId());
        if (it == nodes.end() || it->second.node.isHealthy() == healthy) {
            return;
        }
        it->second.node.setHealthy(healthy);
        it->second.last_health_change = std::chrono::steady_clock::now();
    }

    std::cout << "[INFO] Node " << node.getId() << " marked "
              << (healthy ? "healthy" : "unhealthy") << "\n";
    notifyMembershipChanged();
}

void StaticNodeRegistry::setMembershipListener(MembershipListener new_listener) {
    std::lock_guard<std::mutex> lock(listener_mutex);
    listener = std::move(new_listener);
}

size_t StaticNodeRegistry::getNodeCount() const {
    std::lock_guard<std::mutex> lock(nodes_mutex);
    return nodes.size();
}

bool StaticNodeRegistry::isHealthy(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(nodes_mutex);
    auto it = nodes.find(node_id);
    return it != nodes.end() && it->second.node.isHealthy();
}
