#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace patchbench {

// ConcurrentQueue
// - Thread-safe FIFO push/pop
// - Blocking pop; close() lets consumers drain what is left, then pop fails
template <typename T>
class ConcurrentQueue {
public:
    ConcurrentQueue() = default;

    // Returns false once closed.
    bool push(T value) {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return false;
        q_.push_back(std::move(value));
        cv_.notify_one();
        return true;
    }

    // Returns false when closed and empty.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&] { return closed_ || !q_.empty(); });
        if (q_.empty()) return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> q_;
    bool closed_{false};
};

} // namespace patchbench
