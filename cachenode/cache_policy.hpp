#pragma once

#include <optional>
#include <string>
#include "durable_store.hpp"
#include "local_store.hpp"

// How a cache miss is served
class ReadPolicy {
public:
    virtual ~ReadPolicy() = default;
    virtual std::optional<std::string> read(const std::string& key,
                                            LocalCacheStore& cache,
                                            DurableStore& durable) = 0;
};

// How a write reaches the cache and the durable store
class WritePolicy {
public:
    virtual ~WritePolicy() = default;
    virtual void write(const std::string& key, const std::string& value,
                       LocalCacheStore& cache,
                       DurableStore& durable) = 0;
};

// Query the durable store and admit the loaded value into the cache on a hit
class ReadThroughPolicy : public ReadPolicy {
public:
    std::optional<std::string> read(const std::string& key,
                                    LocalCacheStore& cache,
                                    DurableStore& durable) override;
};

// Cache first, then the durable store. A durable failure leaves the new
// value in the cache; the StoreError still reaches the caller.
class WriteThroughPolicy : public WritePolicy {
public:
    void write(const std::string& key, const std::string& value,
               LocalCacheStore& cache,
               DurableStore& durable) override;
};
