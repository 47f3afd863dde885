/**
 * @file event_queue.hpp
 * @brief Closable multi-producer / multi-consumer hand-off queue
 *
 * The phase worker pool uses it to hand queue items to workers and to hand
 * their outcomes back:
 *
 * ThreadSafeQueue<QueueItem> work;
 * for (auto& item : batch) work.push(item);
 * work.close();                         // workers drain, then pop() yields nullopt
 * while (auto item = work.pop()) { ... }
 */

#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace fieldsync::events {

/**
 * @brief Thread-safe FIFO with close semantics
 *
 * THREAD SAFETY:
 * - Any number of producers and consumers
 * - After close(), push() is refused and pop() returns the remaining items,
 *   then std::nullopt once the queue is empty
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @return false when the queue was already closed; the item is dropped
     */
    bool push(T item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Block until an item arrives or the queue is closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !items_.empty() || closed_; });
        return take_locked();
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    std::optional<T> take_locked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::deque<T> items_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace fieldsync::events
