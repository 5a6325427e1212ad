#include "eviction_policy.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

void LruEvictionPolicy::touch(const std::string& key) {
    std::lock_guard<std::mutex> lock(lru_mutex);

    auto it = positions.find(key);
    if (it != positions.end()) {
        // Move the accessed key to the front of the list
        order.splice(order.begin(), order, it->second);
        return;
    }

    order.push_front(key);
    positions[key] = order.begin();
}

std::optional<std::string> LruEvictionPolicy::evict() {
    std::lock_guard<std::mutex> lock(lru_mutex);

    if (order.empty()) {
        return std::nullopt;
    }

    std::string victim = order.back();
    positions.erase(victim);
    order.pop_back();
    return victim;
}

void LruEvictionPolicy::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(lru_mutex);

    auto it = positions.find(key);
    if (it != positions.end()) {
        order.erase(it->second);
        positions.erase(it);
    }
}

bool LruEvictionPolicy::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(lru_mutex);
    return positions.find(key) != positions.end();
}

size_t LruEvictionPolicy::size() const {
    std::lock_guard<std::mutex> lock(lru_mutex);
    return order.size();
}

void LfuEvictionPolicy::detach(KeyState& state) {
    // Should be called with lfu_mutex locked
    auto bucket_it = buckets.find(state.frequency);
    bucket_it->second.erase(state.position);
    if (bucket_it->second.empty()) {
        buckets.erase(bucket_it);
        frequencies.erase(state.frequency);
    }
}

void LfuEvictionPolicy::touch(const std::string& key) {
    std::lock_guard<std::mutex> lock(lfu_mutex);

    auto it = key_states.find(key);
    if (it == key_states.end()) {
        Bucket& bucket = buckets[1];
        bucket.push_back(key);
        frequencies.insert(1);
        key_states.emplace(key, KeyState{1, std::prev(bucket.end())});
        return;
    }

    KeyState& state = it->second;
    detach(state);

    // Freshest within the new bucket
    state.frequency += 1;
    Bucket& bucket = buckets[state.frequency];
    bucket.push_back(key);
    state.position = std::prev(bucket.end());
    frequencies.insert(state.frequency);
}

std::optional<std::string> LfuEvictionPolicy::evict() {
    std::lock_guard<std::mutex> lock(lfu_mutex);

    if (frequencies.empty()) {
        return std::nullopt;
    }

    size_t min_frequency = *frequencies.begin();
    auto bucket_it = buckets.find(min_frequency);
    std::string victim = bucket_it->second.front();

    bucket_it->second.pop_front();
    if (bucket_it->second.empty()) {
        buckets.erase(bucket_it);
        frequencies.erase(min_frequency);
    }
    key_states.erase(victim);

    return victim;
}

void LfuEvictionPolicy::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(lfu_mutex);

    auto it = key_states.find(key);
    if (it != key_states.end()) {
        detach(it->second);
        key_states.erase(it);
    }
}

bool LfuEvictionPolicy::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(lfu_mutex);
    return key_states.find(key) != key_states.end();
}

size_t LfuEvictionPolicy::size() const {
    std::lock_guard<std::mutex> lock(lfu_mutex);
    return key_states.size();
}

size_t LfuEvictionPolicy::frequencyOf(const std::string& key) const {
    std::lock_guard<std::mutex> lock(lfu_mutex);
    auto it = key_states.find(key);
    return it == key_states.end() ? 0 : it->second.frequency;
}

std::unique_ptr<EvictionPolicy> makeEvictionPolicy(EvictionKind kind) {
    switch (kind) {
        case EvictionKind::LFU:
            return std::make_unique<LfuEvictionPolicy>();
        case EvictionKind::LRU:
        default:
            return std::make_unique<LruEvictionPolicy>();
    }
}

std::optional<EvictionKind> parseEvictionKind(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "lru") return EvictionKind::LRU;
    if (lowered == "lfu") return EvictionKind::LFU;
    return std::nullopt;
}
