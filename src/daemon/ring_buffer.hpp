#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

// Lock-free single-producer single-consumer ring buffer of float samples.
// Producer (PipeWire realtime thread) calls write(). Consumer (daemon thread)
// calls read() / drain_all() once the producer has been stopped or paused.
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    // Producer: append samples. Returns the number actually written; a short
    // write means the buffer is full.
    size_t write(std::span<const float> samples) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t avail = capacity_ - (w - r);
        size_t to_write = std::min(samples.size(), avail);
        if (to_write == 0) return 0;

        size_t offset = w % capacity_;
        size_t first = std::min(to_write, capacity_ - offset);
        std::memcpy(buf_.data() + offset, samples.data(), first * sizeof(float));
        if (first < to_write) {
            std::memcpy(buf_.data(), samples.data() + first, (to_write - first) * sizeof(float));
        }

        write_pos_.store(w + to_write, std::memory_order_release);
        return to_write;
    }

    // Consumer: read up to dest.size() samples. Returns samples actually read.
    size_t read(std::span<float> dest) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        size_t to_read = std::min(dest.size(), w - r);
        if (to_read == 0) return 0;

        size_t offset = r % capacity_;
        size_t first = std::min(to_read, capacity_ - offset);
        std::memcpy(dest.data(), buf_.data() + offset, first * sizeof(float));
        if (first < to_read) {
            std::memcpy(dest.data() + first, buf_.data(), (to_read - first) * sizeof(float));
        }

        read_pos_.store(r + to_read, std::memory_order_release);
        return to_read;
    }

    // Consumer: drain everything buffered so far.
    std::vector<float> drain_all() {
        std::vector<float> samples(available());
        if (samples.empty()) return samples;
        samples.resize(read(samples));
        return samples;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    bool full() const { return available() >= capacity_; }
    size_t capacity() const { return capacity_; }

    // Only call while the producer is stopped.
    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<float> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
};
