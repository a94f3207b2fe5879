#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace mbk::core {

/**
 * @brief Bounded hand-off queue between submitters and worker threads
 *
 * THREAD SAFETY:
 * - try_push() and pop() may be called from any number of threads
 * - After shutdown() no new items are accepted, but items already queued
 *   are still handed out; pop() returns nullopt once the queue is drained
 *
 * A capacity of 0 means unbounded.
 */
template<typename T>
class WorkQueue {
public:
    explicit WorkQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    /// False when full or shut down; @p item is dropped in that case.
    bool try_push(T item) {
        std::unique_lock lock(mutex_);
        if (closed_ || full_locked()) {
            return false;
        }
        items_.push_back(std::move(item));
        lock.unlock();
        ready_.notify_one();
        return true;
    }

    /// Blocks until an item is available or the queue is shut down and empty.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this]() { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        return item;
    }

    void shutdown() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    [[nodiscard]] std::size_t pending() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] bool is_shutdown() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    bool full_locked() const { return capacity_ != 0 && items_.size() >= capacity_; }

    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    const std::size_t capacity_;
    bool closed_ = false;
};

} // namespace mbk::core
