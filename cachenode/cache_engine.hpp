#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "cache_policy.hpp"
#include "durable_store.hpp"
#include "eviction_policy.hpp"
#include "local_store.hpp"
#include "per_key_executor.hpp"

struct CacheStats {
    uint64_t hits;
    uint64_t misses;
    uint64_t evictions;
};

// Fired after a successful public put (never by internalPut)
using WriteHook = std::function<void(const std::string& key, const std::string& value)>;

// Single-node cache: bounded store + eviction tracker + read/write policies.
// Every single-key operation runs on the key's PerKeyExecutor bucket, so a
// read never observes a half-applied write for the same key.
class LocalCacheEngine {
private:
    LocalCacheStore store;
    std::unique_ptr<EvictionPolicy> eviction;
    std::shared_ptr<DurableStore> durable;
    std::unique_ptr<ReadPolicy> read_policy;
    std::unique_ptr<WritePolicy> write_policy;

    std::mutex hook_mutex;
    WriteHook write_hook;

    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};
    std::atomic<uint64_t> evictions{0};

    // Declared last: workers are joined before the structures they use go away
    PerKeyExecutor executor;

    std::optional<std::string> selectVictim();
    std::optional<std::string> doGet(const std::string& key);
    void doPut(const std::string& key, const std::string& value);
    bool doRemove(const std::string& key);

public:
    LocalCacheEngine(size_t capacity,
                     std::unique_ptr<EvictionPolicy> eviction,
                     std::shared_ptr<DurableStore> durable,
                     std::unique_ptr<ReadPolicy> read_policy,
                     std::unique_ptr<WritePolicy> write_policy,
                     size_t num_workers = 4);

    // Read-through / write-through with the given eviction policy
    LocalCacheEngine(size_t capacity,
                     EvictionKind kind,
                     std::shared_ptr<DurableStore> durable,
                     size_t num_workers = 4);

    ~LocalCacheEngine();

    // Value, or nullopt when absent from both cache and durable store.
    // StoreError is delivered through the future.
    std::future<std::optional<std::string>> get(const std::string& key);

    // Evicts first when full, then writes cache and durable store
    std::future<void> put(const std::string& key, const std::string& value);

    // Same as put but used on replication targets: never fires the write hook
    std::future<void> internalPut(const std::string& key, const std::string& value);

    // Drop the key from cache, eviction tracker and durable store
    std::future<bool> remove(const std::string& key);

    void setWriteHook(WriteHook hook);

    // Cache-only view, no access recorded
    std::optional<std::string> peek(const std::string& key) const;
    bool contains(const std::string& key) const;

    size_t size() const;
    size_t capacity() const;
    CacheStats stats() const;
    const EvictionPolicy& evictionPolicy() const { return *eviction; }
    size_t bucketFor(const std::string& key) const { return executor.bucketFor(key); }

    void shutdown();
};
