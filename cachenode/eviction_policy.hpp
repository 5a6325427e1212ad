#pragma once

#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

enum class EvictionKind {
    LRU,
    LFU
};

// Tracks access recency/frequency for every cached key and picks the victim
// when the cache is full. Implementations are shared by all executor workers,
// so each one guards its own structures.
class EvictionPolicy {
public:
    virtual ~EvictionPolicy() = default;

    // Record an access. Untracked keys start being tracked.
    virtual void touch(const std::string& key) = 0;

    // Remove and return the victim, or nullopt when nothing is tracked
    virtual std::optional<std::string> evict() = 0;

    // Stop tracking a key (explicit delete)
    virtual void remove(const std::string& key) = 0;

    virtual bool contains(const std::string& key) const = 0;
    virtual size_t size() const = 0;
    virtual std::string name() const = 0;
};

class LruEvictionPolicy : public EvictionPolicy {
private:
    mutable std::mutex lru_mutex;

    // Front = most recently used, back = least recently used
    std::list<std::string> order;

    // Map for O(1) lookup: key -> iterator to list node
    std::unordered_map<std::string, std::list<std::string>::iterator> positions;

public:
    void touch(const std::string& key) override;
    std::optional<std::string> evict() override;
    void remove(const std::string& key) override;
    bool contains(const std::string& key) const override;
    size_t size() const override;
    std::string name() const override { return "LRU"; }
};

class LfuEvictionPolicy : public EvictionPolicy {
private:
    using Bucket = std::list<std::string>;

    struct KeyState {
        size_t frequency;
        Bucket::iterator position;
    };

    mutable std::mutex lfu_mutex;

    // key -> current frequency and its slot inside the frequency bucket
    std::unordered_map<std::string, KeyState> key_states;

    // frequency -> keys in insertion order (front = oldest within the bucket)
    std::unordered_map<size_t, Bucket> buckets;

    // Active frequencies, smallest first
    std::set<size_t> frequencies;

    void detach(KeyState& state);

public:
    void touch(const std::string& key) override;
    std::optional<std::string> evict() override;
    void remove(const std::string& key) override;
    bool contains(const std::string& key) const override;
    size_t size() const override;
    std::string name() const override { return "LFU"; }

    // 0 when the key is not tracked
    size_t frequencyOf(const std::string& key) const;
};

std::unique_ptr<EvictionPolicy> makeEvictionPolicy(EvictionKind kind);

// Accepts "lru" / "lfu" (case-insensitive)
std::optional<EvictionKind> parseEvictionKind(const std::string& name);
