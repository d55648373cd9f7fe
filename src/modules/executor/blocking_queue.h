// modules/executor/blocking_queue.h
#ifndef LOOM_MODULES_EXECUTOR_BLOCKING_QUEUE_H
#define LOOM_MODULES_EXECUTOR_BLOCKING_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace loom {

// Thread-safe blocking FIFO
template <typename T>
class BlockingQueue {
public:
    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push(std::move(item));
        }
        cv_.notify_one();
    }

    // Blocks until an item arrives or the queue is shut down and drained
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
        return take_locked();
    }

    // nullopt on timeout
    std::optional<T> pop_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return shutdown_ || !queue_.empty(); });
        return take_locked();
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

private:
    std::optional<T> take_locked() {
        if (queue_.empty()) return std::nullopt;
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<T> queue_;
    bool shutdown_ = false;
};

} // namespace loom

#endif // LOOM_MODULES_EXECUTOR_BLOCKING_QUEUE_H
