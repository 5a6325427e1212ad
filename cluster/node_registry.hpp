#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "node.hpp"

using MembershipListener = std::function<void()>;

// Membership and health source for the hash ring
class NodeRegistry {
public:
    virtual ~NodeRegistry() = default;

    // Registered nodes currently marked healthy, in registration order
    virtual std::vector<Node> getActiveNodes() const = 0;

    virtual void registerNode(const Node& node) = 0;
    virtual void removeNode(const Node& node) = 0;
    virtual void updateHealth(const Node& node, bool healthy) = 0;

    // Called after every change that alters the active set
    virtual void setMembershipListener(MembershipListener listener) = 0;
};

struct NodeState {
    Node node;
    std::chrono::steady_clock::time_point registered_at;
    std::chrono::steady_clock::time_point last_health_change;
};

// In-process registry fed by configuration or by tests
class StaticNodeRegistry : public NodeRegistry {
private:
    mutable std::mutex nodes_mutex;
    std::vector<std::string> registration_order;
    std::unordered_map<std::string, NodeState> nodes;  // node id -> state

    std::mutex listener_mutex;
    MembershipListener listener;

    void notifyMembershipChanged();

public:
    StaticNodeRegistry() = default;
    explicit StaticNodeRegistry(const std::vector<Node>& initial_nodes);

    std::vector<Node> getActiveNodes() const override;
    void registerNode(const Node& node) override;
    void removeNode(const Node& node) override;
    void updateHealth(const Node& node, bool healthy) override;
    void setMembershipListener(MembershipListener listener) override;

    size_t getNodeCount() const;
    bool isHealthy(const std::string& node_id) const;
};
