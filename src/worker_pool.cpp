#include "portico/worker_pool.hpp"

#include <algorithm>
#include <exception>
#include "portico/logging.hpp"

namespace portico {

namespace {
constexpr const char* COMPONENT = "worker_pool";
}

WorkerPool::WorkerPool(std::size_t threads, std::size_t queue_capacity)
    : capacity_(std::max<std::size_t>(queue_capacity, 1)) {
    threads = std::max<std::size_t>(threads, 1);
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { run_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown(std::chrono::milliseconds(0));
}

bool WorkerPool::submit(Task task) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return !accepting_ || queue_.size() < capacity_; });
        if (!accepting_) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    not_empty_.notify_one();
    return true;
}

bool WorkerPool::shutdown(std::chrono::milliseconds grace) {
    bool drained = true;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stopping_) {
            return queue_.empty();
        }
        accepting_ = false;
        not_full_.notify_all();

        drained = idle_.wait_for(lock, grace, [this] { return queue_.empty() && active_ == 0; });
        if (!queue_.empty()) {
            log_warn(COMPONENT, "tasks_discarded",
                     {{"count", queue_.size()}, {"grace_ms", grace.count()}});
            queue_.clear();
        }
        stopping_ = true;
    }
    not_empty_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    return drained;
}

std::size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::size_t WorkerPool::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

void WorkerPool::run_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait(lock, [this] { return !queue_.empty() || stopping_; });
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }
        not_full_.notify_one();

        try {
            task();
        } catch (const std::exception& e) {
            log_error(COMPONENT, "task_failed", {{"error", e.what()}});
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
            if (queue_.empty() && active_ == 0) {
                idle_.notify_all();
            }
        }
    }
}

} // namespace portico
