#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace cordon {

// BoundedQueue
// - Thread-safe FIFO hand-off between submitters and a worker pool
// - try_push never blocks: it fails once every idle consumer is spoken for
//   and `capacity` items are already waiting
// - Blocking pop with shutdown(); queued items still drain after shutdown
template <typename T>
class BoundedQueue {
public:
    enum class Push { OK, FULL, CLOSED };

    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {}

    Push try_push(T value) {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return Push::CLOSED;
        if (q_.size() >= capacity_ + waiting_) return Push::FULL;
        q_.push_back(std::move(value));
        cv_.notify_one();
        return Push::OK;
    }

    // Returns false when shut down and drained.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(mu_);
        waiting_++;
        cv_.wait(lk, [&]{ return closed_ || !q_.empty(); });
        waiting_--;
        if (q_.empty()) return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    void shutdown() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

    // Consumers blocked in pop().
    size_t idle() const {
        std::lock_guard<std::mutex> lk(mu_);
        return waiting_;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

    size_t capacity() const { return capacity_; }

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> q_;
    const size_t capacity_;
    size_t waiting_{0};
    bool closed_{false};
};

} // namespace cordon
