#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed set of threads draining one FIFO queue. With a single thread every
// submitted task runs strictly in submission order.
class WorkerPool {
private:
    std::string name;
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex queue_mutex;
    std::condition_variable queue_cv;
    bool stopping = false;

    void workerLoop();
    void enqueue(std::function<void()> task);

public:
    explicit WorkerPool(size_t num_threads, const std::string& name = "worker");
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Exceptions thrown by the task are delivered through the future
    template<typename F>
    auto submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
        std::future<Result> result = packaged->get_future();
        enqueue([packaged]() { (*packaged)(); });
        return result;
    }

    // Finish queued tasks, then join the threads
    void shutdown();

    size_t threadCount() const;
};
