#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

// Lock-free single-producer single-consumer ring of interleaved int16 samples.
// Producer (device real-time thread) calls write(). Consumer (capture loop) calls read().
class SampleRing {
public:
    explicit SampleRing(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    // Producer: returns samples actually written. Samples that do not fit are
    // counted as overruns and discarded; the producer never waits.
    size_t write(std::span<const int16_t> data) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t avail = capacity_ - (w - r);
        size_t to_write = std::min(data.size(), avail);
        if (to_write < data.size()) {
            overruns_.fetch_add(data.size() - to_write, std::memory_order_relaxed);
        }
        if (to_write == 0) return 0;

        size_t offset = w % capacity_;
        size_t first = std::min(to_write, capacity_ - offset);
        std::memcpy(buf_.data() + offset, data.data(), first * sizeof(int16_t));
        if (first < to_write) {
            std::memcpy(buf_.data(), data.data() + first, (to_write - first) * sizeof(int16_t));
        }

        write_pos_.store(w + to_write, std::memory_order_release);
        return to_write;
    }

    // Consumer: read up to out.size() samples. Returns samples actually read.
    size_t read(std::span<int16_t> out) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        size_t to_read = std::min(out.size(), w - r);
        if (to_read == 0) return 0;

        size_t offset = r % capacity_;
        size_t first = std::min(to_read, capacity_ - offset);
        std::memcpy(out.data(), buf_.data() + offset, first * sizeof(int16_t));
        if (first < to_read) {
            std::memcpy(out.data() + first, buf_.data(), (to_read - first) * sizeof(int16_t));
        }

        read_pos_.store(r + to_read, std::memory_order_release);
        return to_read;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t capacity() const { return capacity_; }
    uint64_t overruns() const { return overruns_.load(std::memory_order_relaxed); }

    // Only safe while the producer is not running.
    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
        overruns_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<int16_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<uint64_t> overruns_{0};
};
