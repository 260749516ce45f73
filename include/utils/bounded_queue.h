#pragma once

#include "pipeline_config.h"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace zwatch {

/**
 * @brief Fixed-capacity FIFO between one producer and one consumer thread
 *
 * When full, the backpressure policy decides what happens to a push. Only
 * items accepted by the droppable predicate are ever discarded; if no queued
 * item may be dropped and the new one may not be dropped either, the producer
 * blocks until the consumer makes room.
 */
template<typename T>
class BoundedQueue {
public:
    using DropPredicate = std::function<bool(const T&)>;

    enum class PushResult {
        PUSHED,
        DROPPED_OLDEST,   ///< Pushed after evicting the oldest droppable item
        DROPPED_NEW,      ///< The pushed item itself was discarded
        CLOSED
    };

    /**
     * @param capacity Maximum number of queued items, at least 1
     * @param policy Backpressure policy applied when full
     * @param droppable Which items may be discarded, all of them when empty
     */
    BoundedQueue(size_t capacity, BackpressurePolicy policy, DropPredicate droppable = DropPredicate())
        : capacity_(capacity == 0 ? 1 : capacity),
          policy_(policy),
          droppable_(std::move(droppable)),
          closed_(false),
          dropped_(0) {}

    PushResult push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        PushResult result = PushResult::PUSHED;

        while (!closed_ && queue_.size() >= capacity_) {
            if (policy_ == BackpressurePolicy::DROP_NEWEST && canDrop(item)) {
                ++dropped_;
                return PushResult::DROPPED_NEW;
            }
            if (policy_ != BackpressurePolicy::BLOCK) {
                if (evictOldestDroppable()) {
                    result = PushResult::DROPPED_OLDEST;
                    break;
                }
                if (canDrop(item)) {
                    ++dropped_;
                    return PushResult::DROPPED_NEW;
                }
            }
            notFull_.wait(lock);
        }

        if (closed_) {
            return PushResult::CLOSED;
        }

        queue_.push_back(std::move(item));
        lock.unlock();
        notEmpty_.notify_one();
        return result;
    }

    /**
     * @brief Wait for the next item
     *
     * @return std::optional<T> The item, nullopt once the queue is closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        notFull_.notify_one();
        return item;
    }

    std::optional<T> tryPop() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        notFull_.notify_one();
        return item;
    }

    /**
     * @brief Refuse further pushes and wake every waiter; queued items can still be popped
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    /**
     * @brief Accept pushes again after close(); items still queued are kept
     */
    void reopen() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return capacity_; }

    uint64_t droppedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    bool canDrop(const T& item) const {
        return !droppable_ || droppable_(item);
    }

    bool evictOldestDroppable() {
        for (auto it = queue_.begin(); it != queue_.end(); ++it) {
            if (canDrop(*it)) {
                queue_.erase(it);
                ++dropped_;
                return true;
            }
        }
        return false;
    }

    const size_t capacity_;
    const BackpressurePolicy policy_;
    DropPredicate droppable_;
    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    bool closed_;
    uint64_t dropped_;
};

} // namespace zwatch
