#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

// Thread-safe bounded queue carrying raw query-log lines from the producer to the workers.
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity)
        : capacity_(capacity ? capacity : 1), high_water_(0), closed_(false) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Blocks while full. False once the queue is closed.
    bool push(T item) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_full_.wait(lk, [&]{ return q_.size() < capacity_ || closed_; });
        if (closed_) return false;
        q_.push(std::move(item));
        if (q_.size() > high_water_) high_water_ = q_.size();
        cv_empty_.notify_one();
        return true;
    }

    // Blocks while empty. False when closed and drained.
    bool pop(T &out) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_empty_.wait(lk, [&]{ return !q_.empty() || closed_; });
        if (q_.empty()) return false;
        out = std::move(q_.front());
        q_.pop();
        cv_full_.notify_one();
        if (closed_ && q_.empty()) cv_drained_.notify_all();
        return true;
    }

    // No more pushes; queued items can still be popped.
    void close() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        cv_empty_.notify_all();
        cv_full_.notify_all();
        if (q_.empty()) cv_drained_.notify_all();
    }

    // Waits until the queue is closed and empty. False on timeout.
    bool wait_drained(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mu_);
        return cv_drained_.wait_for(lk, timeout, [&]{ return closed_ && q_.empty(); });
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

    // Deepest backlog seen so far; equal to capacity means the producer blocked.
    size_t high_water() const {
        std::lock_guard<std::mutex> lk(mu_);
        return high_water_;
    }

private:
    size_t capacity_;
    std::queue<T> q_;
    mutable std::mutex mu_;
    std::condition_variable cv_empty_;
    std::condition_variable cv_full_;
    std::condition_variable cv_drained_;
    size_t high_water_;
    bool closed_;
};
