#include "local_store.hpp"
#include <iostream>

LocalCacheStore::LocalCacheStore(size_t capacity) : capacity(capacity) {
    if (capacity == 0) {
        this->capacity = 1; // Minimum capacity of 1
    }
}

void LocalCacheStore::setVictimSelector(VictimSelector selector) {
    std::lock_guard<std::mutex> lock(store_mutex);
    select_victim = std::move(selector);
}

void LocalCacheStore::setAccessRecorder(AccessRecorder recorder) {
    std::lock_guard<std::mutex> lock(store_mutex);
    record_access = std::move(recorder);
}

std::optional<std::string> LocalCacheStore::evictOneLocked() {
    if (!select_victim) {
        return std::nullopt;
    }

    // The tracker may still name a key that was already removed from the map;
    // skip those until a live entry is dropped or the tracker runs dry.
    while (auto victim = select_victim()) {
        if (entries.erase(*victim) > 0) {
            return victim;
        }
    }
    return std::nullopt;
}

std::optional<std::string> LocalCacheStore::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(store_mutex);

    auto it = entries.find(key);
    if (it != entries.end()) {
        it->second = value;
        if (record_access) {
            record_access(key);
        }
        return std::nullopt;
    }

    std::optional<std::string> evicted;
    if (entries.size() >= capacity) {
        evicted = evictOneLocked();
        if (!evicted) {
            std::cerr << "[WARNING] Cache full (" << entries.size() << "/" << capacity
                      << ") but no eviction victim available, admitting " << key << "\n";
        }
    }

    entries.emplace(key, value);
    if (record_access) {
        record_access(key);
    }
    return evicted;
}

std::vector<std::string> LocalCacheStore::admit(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(store_mutex);

    entries[key] = value;
    if (record_access) {
        record_access(key);
    }
    return evictOverflowLocked();
}

std::optional<std::string> LocalCacheStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(store_mutex);

    auto it = entries.find(key);
    if (it == entries.end()) {
        return std::nullopt;
    }
    if (record_access) {
        record_access(key);
    }
    return it->second;
}

std::optional<std::string> LocalCacheStore::peek(const std::string& key) const {
    std::lock_guard<std::mutex> lock(store_mutex);

    auto it = entries.find(key);
    if (it != entries.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool LocalCacheStore::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(store_mutex);
    return entries.find(key) != entries.end();
}

bool LocalCacheStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(store_mutex);
    return entries.erase(key) > 0;
}

std::vector<std::string> LocalCacheStore::evictOverflow() {
    std::lock_guard<std::mutex> lock(store_mutex);
    return evictOverflowLocked();
}

std::vector<std::string> LocalCacheStore::evictOverflowLocked() {
    std::vector<std::string> evicted;
    while (entries.size() > capacity) {
        auto victim = evictOneLocked();
        if (!victim) {
            break;
        }
        evicted.push_back(*victim);
    }
    return evicted;
}

void LocalCacheStore::clear() {
    std::lock_guard<std::mutex> lock(store_mutex);
    entries.clear();
}

size_t LocalCacheStore::size() const {
    std::lock_guard<std::mutex> lock(store_mutex);
    return entries.size();
}

size_t LocalCacheStore::getCapacity() const {
    return capacity;
}

std::vector<std::string> LocalCacheStore::keys() const {
    std::lock_guard<std::mutex> lock(store_mutex);
    std::vector<std::string> result;
    result.reserve(entries.size());

    for (const auto& [key, _] : entries) {
        result.push_back(key);
    }

    return result;
}
