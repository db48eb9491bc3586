#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace tracevia {

/// Interface for task execution strategies
/// Lets batch routing run on jthreads, a host thread pool, or inline
class ITaskExecutor {
public:
    virtual ~ITaskExecutor() = default;

    /// Submit a task for execution
    /// @return true if the task will run, false if it was rejected
    ///         (executor stopped); a rejected task is dropped unrun
    virtual bool submit(std::function<void()> task) = 0;

    /// Stop accepting tasks and wait for running ones
    virtual void shutdown() = 0;

    virtual bool isRunning() const = 0;
};

/// Fixed pool of std::jthread workers draining one FIFO queue
///
/// shutdown() stops intake, lets the workers finish everything already
/// queued and joins them.
class JThreadExecutor : public ITaskExecutor {
public:
    /// @param workerCount Number of worker threads, at least one is started
    explicit JThreadExecutor(size_t workerCount = defaultWorkerCount()) {
        workerCount = std::max<size_t>(1, workerCount);
        workers_.reserve(workerCount);
        for (size_t i = 0; i < workerCount; ++i) {
            workers_.emplace_back([this]() { workerLoop(); });
        }
    }

    ~JThreadExecutor() override {
        shutdown();
    }

    JThreadExecutor(const JThreadExecutor&) = delete;
    JThreadExecutor& operator=(const JThreadExecutor&) = delete;

    bool submit(std::function<void()> task) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.load()) {
                return false;
            }
            queue_.push_back(std::move(task));
        }
        wakeup_.notify_one();
        return true;
    }

    void shutdown() override {
        std::vector<std::jthread> workers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_.store(false);
            workers.swap(workers_);
        }
        wakeup_.notify_all();
        workers.clear();  // jthread joins in its destructor
    }

    bool isRunning() const override {
        return running_.load();
    }

    size_t workerCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return workers_.size();
    }

    static size_t defaultWorkerCount() {
        return std::max<size_t>(1, std::thread::hardware_concurrency());
    }

private:
    void workerLoop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                wakeup_.wait(lock, [this]() { return !running_.load() || !queue_.empty(); });
                if (queue_.empty()) {
                    return;  // stopped and drained
                }
                task = std::move(queue_.front());
                queue_.pop_front();
            }
            task();
        }
    }

    std::vector<std::jthread> workers_;
    std::deque<std::function<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    std::atomic<bool> running_{true};
};

/// Runs every task immediately on the calling thread
class InlineExecutor : public ITaskExecutor {
public:
    bool submit(std::function<void()> task) override {
        if (!running_) {
            return false;
        }
        task();
        return true;
    }

    void shutdown() override { running_ = false; }

    bool isRunning() const override { return running_; }

private:
    bool running_ = true;
};

}  // namespace tracevia
