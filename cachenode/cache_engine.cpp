#include "cache_engine.hpp"
#include <iostream>

LocalCacheEngine::LocalCacheEngine(size_t capacity,
                                   std::unique_ptr<EvictionPolicy> eviction,
                                   std::shared_ptr<DurableStore> durable,
                                   std::unique_ptr<ReadPolicy> read_policy,
                                   std::unique_ptr<WritePolicy> write_policy,
                                   size_t num_workers)
    : store(capacity),
      eviction(std::move(eviction)),
      durable(std::move(durable)),
      read_policy(std::move(read_policy)),
      write_policy(std::move(write_policy)),
      executor(num_workers) {

    if (!this->eviction || !this->durable || !this->read_policy || !this->write_policy) {
        throw std::invalid_argument("LocalCacheEngine requires eviction, durable store and read/write policies");
    }

    store.setVictimSelector([this]() { return selectVictim(); });
    store.setAccessRecorder([this](const std::string& key) { this->eviction->touch(key); });

    std::cout << "[INFO] Cache engine initialized: capacity=" << store.getCapacity()
              << ", eviction=" << this->eviction->name()
              << ", workers=" << executor.workerCount() << "\n";
}

LocalCacheEngine::LocalCacheEngine(size_t capacity,
                                   EvictionKind kind,
                                   std::shared_ptr<DurableStore> durable,
                                   size_t num_workers)
    : LocalCacheEngine(capacity,
                       makeEvictionPolicy(kind),
                       std::move(durable),
                       std::make_unique<ReadThroughPolicy>(),
                       std::make_unique<WriteThroughPolicy>(),
                       num_workers) {
}

LocalCacheEngine::~LocalCacheEngine() {
    shutdown();
}

std::optional<std::string> LocalCacheEngine::selectVictim() {
    auto victim = eviction->evict();
    if (victim.has_value()) {
        evictions++;
    }
    return victim;
}

std::optional<std::string> LocalCacheEngine::doGet(const std::string& key) {
    // The store records the hit under its own lock
    auto cached = store.get(key);
    if (cached.has_value()) {
        hits++;
        return cached;
    }

    misses++;

    // Durable-store misses leave the cache untouched. A loaded value is
    // inserted and touched before the overflow check, so under LFU a
    // low-frequency load can be evicted right away.
    return read_policy->read(key, store, *durable);
}

void LocalCacheEngine::doPut(const std::string& key, const std::string& value) {
    // The store makes room and records the access before admitting the key,
    // so the key being written is never the victim.
    try {
        write_policy->write(key, value, store, *durable);
    } catch (const StoreError& e) {
        std::cerr << "[ERROR] Durable write failed for key " << key << ": " << e.what() << "\n";
        throw;
    }
}

bool LocalCacheEngine::doRemove(const std::string& key) {
    bool cached = store.remove(key);
    eviction->remove(key);
    bool persisted = durable->remove(key);
    return cached || persisted;
}

std::future<std::optional<std::string>> LocalCacheEngine::get(const std::string& key) {
    return executor.submit(key, [this, key]() { return doGet(key); });
}

std::future<void> LocalCacheEngine::put(const std::string& key, const std::string& value) {
    return executor.submit(key, [this, key, value]() {
        doPut(key, value);

        WriteHook hook;
        {
            std::lock_guard<std::mutex> lock(hook_mutex);
            hook = write_hook;
        }
        if (hook) {
            hook(key, value);
        }
    });
}

std::future<void> LocalCacheEngine::internalPut(const std::string& key, const std::string& value) {
    return executor.submit(key, [this, key, value]() { doPut(key, value); });
}

std::future<bool> LocalCacheEngine::remove(const std::string& key) {
    return executor.submit(key, [this, key]() { return doRemove(key); });
}

void LocalCacheEngine::setWriteHook(WriteHook hook) {
    std::lock_guard<std::mutex> lock(hook_mutex);
    write_hook = std::move(hook);
}

std::optional<std::string> LocalCacheEngine::peek(const std::string& key) const {
    return store.peek(key);
}

bool LocalCacheEngine::contains(const std::string& key) const {
    return store.contains(key);
}

size_t LocalCacheEngine::size() const {
    return store.size();
}

size_t LocalCacheEngine::capacity() const {
    return store.getCapacity();
}

CacheStats LocalCacheEngine::stats() const {
    return {hits.load(), misses.load(), evictions.load()};
}

void LocalCacheEngine::shutdown() {
    executor.shutdown();
}
