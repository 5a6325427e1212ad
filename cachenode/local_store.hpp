#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Picks (and stops tracking) the entry to drop when the store is full
using VictimSelector = std::function<std::optional<std::string>()>;

// Records an access for a key that was just inserted or updated
using AccessRecorder = std::function<void(const std::string&)>;

// Bounded key -> value map. Values are replaced on update, never mutated in place.
class LocalCacheStore {
private:
    size_t capacity;
    mutable std::mutex store_mutex;
    std::unordered_map<std::string, std::string> entries;
    VictimSelector select_victim;
    AccessRecorder record_access;

    // Drop one entry chosen by the selector. Should be called with store_mutex locked.
    std::optional<std::string> evictOneLocked();
    std::vector<std::string> evictOverflowLocked();

public:
    explicit LocalCacheStore(size_t capacity = 1000);

    void setVictimSelector(VictimSelector selector);
    void setAccessRecorder(AccessRecorder recorder);

    // Insert or update an entry. Inserting a new key into a full store first
    // evicts one victim, so size() <= capacity holds when put returns.
    // The access is recorded before the lock is released, so every stored
    // key is already a candidate for the next eviction.
    // Returns the evicted key, if any.
    std::optional<std::string> put(const std::string& key, const std::string& value);

    // Admit a value loaded on a cache miss: insert, record the access, then
    // evict while over capacity. The loaded key itself may be the victim.
    // Returns the evicted keys.
    std::vector<std::string> admit(const std::string& key, const std::string& value);

    // Get entry value (returns nullopt if not found). A hit is recorded as an access.
    std::optional<std::string> get(const std::string& key);

    // Same as get, without recording an access
    std::optional<std::string> peek(const std::string& key) const;

    bool contains(const std::string& key) const;

    // Returns true if the key was present
    bool remove(const std::string& key);

    // Evict until size() <= capacity; returns the evicted keys
    std::vector<std::string> evictOverflow();

    void clear();

    size_t size() const;
    size_t getCapacity() const;
    std::vector<std::string> keys() const;
};
