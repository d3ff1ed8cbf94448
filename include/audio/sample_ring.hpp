#ifndef SAMPLE_RING_HPP
#define SAMPLE_RING_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

// Single-producer single-consumer lock-free ring of int16 samples.
// The producer only calls push(), the consumer only calls pop()/popExact()/discard().
class SampleRing {
public:
    explicit SampleRing(size_t capacity)
        : buffer_(capacity), capacity_(capacity), head_(0), tail_(0) {}

    SampleRing(const SampleRing&) = delete;
    SampleRing& operator=(const SampleRing&) = delete;

    size_t capacity() const { return capacity_; }

    // Push up to n samples, returns samples actually written.
    size_t push(const int16_t* data, size_t n) {
        return write(n, [data](size_t i) { return data[i]; });
    }

    // Push n zero samples, returns samples actually written.
    size_t pushSilence(size_t n) {
        return write(n, [](size_t) { return (int16_t)0; });
    }

    // Pop up to n samples, returns samples actually read.
    size_t pop(int16_t* out, size_t n) {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t head = head_.load(std::memory_order_acquire);
        const size_t available = head - tail;
        const size_t to_read = n < available ? n : available;
        for (size_t i = 0; i < to_read; ++i) {
            out[i] = buffer_[(tail + i) % capacity_];
        }
        tail_.store(tail + to_read, std::memory_order_release);
        return to_read;
    }

    // Pops exactly n samples or nothing at all.
    bool popExact(int16_t* out, size_t n) {
        if (size() < n) return false;
        return pop(out, n) == n;
    }

    // Drops up to n samples from the consumer side, returns samples dropped.
    size_t discard(size_t n) {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t head = head_.load(std::memory_order_acquire);
        const size_t available = head - tail;
        const size_t to_drop = n < available ? n : available;
        tail_.store(tail + to_drop, std::memory_order_release);
        return to_drop;
    }

    size_t size() const {
        const size_t head = head_.load(std::memory_order_acquire);
        const size_t tail = tail_.load(std::memory_order_acquire);
        return head - tail;
    }

private:
    template <typename Source>
    size_t write(size_t n, Source sample) {
        const size_t head = head_.load(std::memory_order_relaxed);
        const size_t tail = tail_.load(std::memory_order_acquire);
        const size_t free_space = capacity_ - (head - tail);
        const size_t to_write = n < free_space ? n : free_space;
        for (size_t i = 0; i < to_write; ++i) {
            buffer_[(head + i) % capacity_] = sample(i);
        }
        head_.store(head + to_write, std::memory_order_release);
        return to_write;
    }

    std::vector<int16_t> buffer_;
    const size_t capacity_;
    std::atomic<size_t> head_;
    std::atomic<size_t> tail_;
};

#endif
