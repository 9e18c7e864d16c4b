#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed set of worker threads draining a FIFO task queue.
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t n_threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once shutdown has begun.
    bool submit(Task task);

    size_t queue_depth() const;
    size_t active() const;
    size_t size() const { return workers_.size(); }

    // Stops accepting tasks, runs everything already queued, joins the workers.
    void shutdown();

private:
    void worker_main();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    size_t active_ = 0;
    bool stopping_ = false;
    std::vector<std::jthread> workers_;
};
