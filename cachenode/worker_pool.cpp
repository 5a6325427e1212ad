#include "worker_pool.hpp"

WorkerPool::WorkerPool(size_t num_threads, const std::string& name) : name(name) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    for (size_t i = 0; i < num_threads; ++i) {
        workers.emplace_back(&WorkerPool::workerLoop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (stopping) {
            throw std::runtime_error("WorkerPool " + name + " is shut down");
        }
        tasks.push(std::move(task));
    }
    queue_cv.notify_one();
}

void WorkerPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            queue_cv.wait(lock, [this] { return stopping || !tasks.empty(); });
            if (stopping && tasks.empty()) return;
            task = std::move(tasks.front());
            tasks.pop();
        }
        task();
    }
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (stopping && workers.empty()) return;
        stopping = true;
    }
    queue_cv.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers.clear();
}

size_t WorkerPool::threadCount() const {
    return workers.size();
}
