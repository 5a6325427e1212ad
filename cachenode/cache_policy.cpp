#include "cache_policy.hpp"

std::optional<std::string> ReadThroughPolicy::read(const std::string& key,
                                                   LocalCacheStore& cache,
                                                   DurableStore& durable) {
    auto value = durable.read(key);
    if (value.has_value()) {
        cache.admit(key, *value);
    }
    return value;
}

void WriteThroughPolicy::write(const std::string& key, const std::string& value,
                               LocalCacheStore& cache,
                               DurableStore& durable) {
    cache.put(key, value);
    durable.write(key, value);
}
