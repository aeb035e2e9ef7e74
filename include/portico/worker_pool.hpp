#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace portico {

/**
 * Fixed worker threads over a bounded FIFO queue.
 *
 * The thread count caps how many units run at once; the queue capacity caps
 * how many wait. submit() blocks while the queue is full, which pushes back on
 * whoever is delivering events.
 *
 * Example:
 *   WorkerPool pool(8, 256);
 *   pool.submit([&] { process(event); });
 *   pool.shutdown(std::chrono::seconds(10));
 */
class WorkerPool {
public:
    using Task = std::function<void()>;

    WorkerPool(std::size_t threads, std::size_t queue_capacity);

    /**
     * Discards queued tasks and waits for running ones.
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * Enqueue a task, blocking while the queue is full.
     *
     * @return false if shutdown has begun; the task is not run
     */
    bool submit(Task task);

    /**
     * Stop accepting work and wait up to grace for queued and running tasks.
     * Tasks still queued when grace runs out are discarded. Running tasks are
     * always joined.
     *
     * @return true if every accepted task ran
     */
    bool shutdown(std::chrono::milliseconds grace);

    std::size_t thread_count() const { return workers_.size(); }
    std::size_t pending() const;
    std::size_t active() const;

private:
    void run_loop();

    std::size_t capacity_;
    std::vector<std::thread> workers_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::condition_variable idle_;
    std::deque<Task> queue_;
    std::size_t active_ = 0;
    bool accepting_ = true;
    bool stopping_ = false;
};

} // namespace portico
