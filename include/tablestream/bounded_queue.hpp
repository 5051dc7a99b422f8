#pragma once
/**
 * @file bounded_queue.hpp
 * @brief Fixed-capacity blocking FIFO and one-shot signal connecting pipeline stages.
 *
 * BoundedQueue stores its items in an etl::deque, so the capacity is part of
 * the type and the queue never grows: a producer that runs ahead blocks in
 * push() until a consumer catches up. That is what keeps memory flat while
 * the device, the producers and the checkers run at different speeds.
 *
 * Normal shutdown goes through sentinel items pushed by the upstream stage.
 * close() is the abort path: it wakes every waiter, and push()/pop() return
 * false from then on even if items are still queued.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <utility>

#include "etl/deque.h"

namespace tablestream {

/** Capacity of the queues between pipeline stages. */
static constexpr size_t PIPELINE_QUEUE_CAP = 16;

template <typename T, size_t CAP = PIPELINE_QUEUE_CAP>
class BoundedQueue {
public:
    /** Block while full. @return false if the queue was closed. */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mtx_);
        not_full_.wait(lock, [this] { return closed_ || !items_.full(); });
        if (closed_) return false;
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    /** Block while empty. @return false if the queue was closed. */
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mtx_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (closed_) return false;
        out = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return true;
    }

    bool try_pop(T& out) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (closed_ || items_.empty()) return false;
        out = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = true;
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return items_.size();
    }

    static constexpr size_t capacity() { return CAP; }

private:
    mutable std::mutex mtx_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    etl::deque<T, CAP> items_;
    bool closed_ = false;
};


/**
 * @brief Event that fires once and stays set. Used to gate the device enable
 *        until the first block is uploaded and the capture stream is armed.
 */
class OneShotSignal {
public:
    void set() {
        std::lock_guard<std::mutex> lock(mtx_);
        set_ = true;
        cv_.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this] { return set_; });
    }

    /** @return true if the signal is set within @p timeout. */
    bool wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        return cv_.wait_for(lock, timeout, [this] { return set_; });
    }

    bool is_set() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return set_;
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool set_ = false;
};

} // namespace tablestream
