#pragma once
// Job queue and fixed worker pool
//
// The daemon's poll loop pushes requests; workers pop and execute them.
// stop() lets workers drain what is already queued, then pop() returns false.

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace kosha {

template <typename T>
class JobQueue {
public:
    void push(T job) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push(std::move(job));
        }
        cv_.notify_one();
    }

    // Blocks until a job is available; false once stopped and drained
    bool pop(T& job) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || stop_; });

        if (stop_ && queue_.empty()) return false;

        job = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;  // Guarded by mutex_
};

template <typename T>
class WorkerPool {
public:
    using Handler = std::function<void(T&)>;

    WorkerPool(size_t workers, Handler handler) : handler_(std::move(handler)) {
        threads_.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            threads_.emplace_back([this] { run(); });
        }
    }

    ~WorkerPool() { shutdown(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(T job) {
        in_flight_.fetch_add(1, std::memory_order_relaxed);
        queue_.push(std::move(job));
    }

    // Finish queued jobs, then join
    void shutdown() {
        queue_.stop();
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
        threads_.clear();
    }

    size_t pending() const { return in_flight_.load(std::memory_order_relaxed); }
    size_t workers() const { return threads_.size(); }

private:
    void run() {
        T job;
        while (queue_.pop(job)) {
            handler_(job);
            in_flight_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    Handler handler_;
    JobQueue<T> queue_;
    std::vector<std::thread> threads_;
    std::atomic<size_t> in_flight_{0};
};

} // namespace kosha
