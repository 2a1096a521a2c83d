#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stop_token>

namespace chunkrelay::transfer {

// Fixed-capacity single-producer/single-consumer queue. Every wait is
// interruptible through the caller's stop token.
//
// The consumer inspects the oldest item with peek() and removes it with
// release() once it is done with it, so an item stays accounted against the
// capacity until it has been fully consumed. References returned by peek()
// stay valid across concurrent push() calls.
template<typename T>
class BoundedBuffer {
public:
    explicit BoundedBuffer(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity)
    {
    }

    BoundedBuffer(const BoundedBuffer&) = delete;
    BoundedBuffer& operator=(const BoundedBuffer&) = delete;

    // Blocks while full. Returns false if stopped or closed before the item
    // could be queued.
    bool push(T item, std::stop_token stop) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = not_full_.wait(lock, stop, [this] {
            return closed_ || items_.size() < capacity_;
        });

        if (!ready || closed_) {
            return false;
        }

        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // Blocks while empty. Returns nullptr if stopped, or if closed and drained.
    T* peek(std::stop_token stop) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = not_empty_.wait(lock, stop, [this] {
            return closed_ || !items_.empty();
        });

        if (!ready || items_.empty()) {
            return nullptr;
        }

        return &items_.front();
    }

    // Drops the item last returned by peek().
    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!items_.empty()) {
            items_.pop_front();
        }
        not_full_.notify_one();
    }

    // Wakes both sides; pending items stay readable, new pushes are refused.
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    const size_t capacity_;
    std::deque<T> items_;
    bool closed_ = false;

    mutable std::mutex mutex_;
    std::condition_variable_any not_full_;
    std::condition_variable_any not_empty_;
};

} // namespace chunkrelay::transfer
