#ifndef BOUNDED_CHANNEL_HPP
#define BOUNDED_CHANNEL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

// Bounded FIFO between the audio producer and the dispatcher.
// The producer side never waits: trySend() fails when the channel is full or
// closed and the caller decides what to drop. The consumer blocks in receive()
// until an item arrives or the channel is closed and drained.
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(size_t capacity) : capacity_(capacity) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    bool trySend(T&& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_ || queue_.size() >= capacity_) return false;
        queue_.push_back(std::move(item));
        cv_.notify_one();
        return true;
    }

    // Returns false once the channel is closed and empty
    bool receive(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) return false;
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    // No more sends; pending items are still delivered
    void close() {
        std::unique_lock<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

    bool isClosed() const {
        std::unique_lock<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::unique_lock<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    const size_t capacity_;
    bool closed_ = false;
};

#endif
