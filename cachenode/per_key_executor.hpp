#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "worker_pool.hpp"

// Routes every task for a key to one of N serial workers (bucket = hash(key) mod N).
// Tasks in the same bucket run in submission order; buckets run concurrently.
// Distinct keys that share a bucket are serialized against each other too.
class PerKeyExecutor {
private:
    std::vector<std::unique_ptr<WorkerPool>> workers;

public:
    explicit PerKeyExecutor(size_t num_workers = 4);

    template<typename F>
    auto submit(const std::string& key, F&& task) {
        return workers[bucketFor(key)]->submit(std::forward<F>(task));
    }

    size_t bucketFor(const std::string& key) const;
    size_t workerCount() const;
    void shutdown();
};
