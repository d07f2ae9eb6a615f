#include "ingest_queue.hpp"

#include <algorithm>

BoundedIngestQueue::BoundedIngestQueue(size_t capacity, ChunkShape shape)
    : capacity_(std::max<size_t>(capacity, 1)), shape_(shape) {}

std::expected<void, ValidationError> BoundedIngestQueue::push(AudioChunk chunk) {
    if (auto err = validate_chunk(chunk, shape_)) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return std::unexpected(*err);
    }

    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return {};
        }
        while (queue_.size() >= capacity_) {
            queue_.pop_front();
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
        queue_.push_back(std::move(chunk));
        pushed_.fetch_add(1, std::memory_order_relaxed);
    }
    cv_.notify_one();
    return {};
}

std::optional<AudioChunk> BoundedIngestQueue::pop(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) return std::nullopt;

    auto chunk = std::move(queue_.front());
    queue_.pop_front();
    return chunk;
}

std::optional<AudioChunk> BoundedIngestQueue::try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) return std::nullopt;

    auto chunk = std::move(queue_.front());
    queue_.pop_front();
    return chunk;
}

void BoundedIngestQueue::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void BoundedIngestQueue::reopen() {
    std::lock_guard lock(mutex_);
    closed_ = false;
}

bool BoundedIngestQueue::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

size_t BoundedIngestQueue::size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}
