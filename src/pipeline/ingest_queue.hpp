#pragma once

#include "audio_chunk.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <mutex>
#include <optional>

// Fixed-capacity hand-off between the capture threads and the transcription
// consumer. push() never blocks: when full, the oldest chunk is evicted.
class BoundedIngestQueue {
public:
    BoundedIngestQueue(size_t capacity, ChunkShape shape);

    BoundedIngestQueue(const BoundedIngestQueue&) = delete;
    BoundedIngestQueue& operator=(const BoundedIngestQueue&) = delete;

    // Rejects malformed chunks; a rejected chunk is never observed by pop().
    std::expected<void, ValidationError> push(AudioChunk chunk);

    // Consumer only. Waits at most `timeout`; empty on timeout or after close().
    std::optional<AudioChunk> pop(std::chrono::milliseconds timeout);
    // Non-blocking variant used to drain on shutdown.
    std::optional<AudioChunk> try_pop();

    // Wakes the consumer; later pushes are discarded and counted as dropped.
    void close();
    void reopen();
    bool closed() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    const ChunkShape& shape() const { return shape_; }

    uint64_t dropped_chunks() const { return dropped_.load(std::memory_order_relaxed); }
    uint64_t pushed_chunks() const { return pushed_.load(std::memory_order_relaxed); }
    uint64_t rejected_chunks() const { return rejected_.load(std::memory_order_relaxed); }

private:
    const size_t capacity_;
    const ChunkShape shape_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<AudioChunk> queue_;
    bool closed_ = false;

    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> pushed_{0};
    std::atomic<uint64_t> rejected_{0};
};
