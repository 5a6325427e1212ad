#include "per_key_executor.hpp"

PerKeyExecutor::PerKeyExecutor(size_t num_workers) {
    if (num_workers == 0) {
        num_workers = 1;
    }
    workers.reserve(num_workers);
    for (size_t i = 0; i < num_workers; ++i) {
        workers.push_back(std::make_unique<WorkerPool>(1, "key-worker-" + std::to_string(i)));
    }
}

size_t PerKeyExecutor::bucketFor(const std::string& key) const {
    return std::hash<std::string>{}(key) % workers.size();
}

size_t PerKeyExecutor::workerCount() const {
    return workers.size();
}

void PerKeyExecutor::shutdown() {
    for (auto& worker : workers) {
        worker->shutdown();
    }
}
