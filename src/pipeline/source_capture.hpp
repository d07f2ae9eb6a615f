#pragma once

#include "audio_chunk.hpp"
#include "clock_anchor.hpp"
#include "platform/audio_device.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

enum class CaptureState { Idle, Opening, Streaming, Stopping, Closed, Error, Fallback };

std::string_view to_string(CaptureState s);

// Acquisition loop for one endpoint. Runs on its own thread, never waits on
// anything but its own device, and replaces a failed device with silent
// chunks at the same cadence.
class SourceCapture {
public:
    using ChunkSink = std::function<void(AudioChunk chunk)>;

    struct Options {
        uint32_t sample_rate = 16000;
        uint32_t block_ms = 20;
        std::chrono::milliseconds read_timeout{500};
    };

    // `device` may be null, in which case the source streams in fallback.
    SourceCapture(AudioSource source, std::unique_ptr<AudioDevice> device,
                  const ClockAnchor& clock, Options options);
    ~SourceCapture();

    SourceCapture(const SourceCapture&) = delete;
    SourceCapture& operator=(const SourceCapture&) = delete;

    bool start(std::string call_id, ChunkSink sink);
    void stop();

    // Asks the loop to abandon the device; applied before the next block.
    void demote(std::string reason);

    AudioSource source() const { return source_; }
    CaptureState state() const { return state_.load(std::memory_order_acquire); }
    // Stays true after stop() once the source has been demoted.
    bool in_fallback() const { return fallback_entered_.load(std::memory_order_acquire); }
    std::optional<DeviceFormat> device_format() const;
    std::string fallback_reason() const;

    uint64_t chunks_emitted() const { return chunks_emitted_.load(std::memory_order_relaxed); }
    // Timeline position in output samples, including skipped spans.
    uint64_t samples_consumed() const { return samples_consumed_.load(std::memory_order_relaxed); }
    // Output samples never emitted because the device stalled before fallback.
    uint64_t samples_skipped() const { return samples_skipped_.load(std::memory_order_relaxed); }
    // -1 until the first chunk has been emitted.
    int64_t t0_ms() const { return t0_ms_.load(std::memory_order_acquire); }
    int64_t last_timestamp_ms() const { return last_ts_ms_.load(std::memory_order_acquire); }
    size_t buffered_samples() const { return device_ ? device_->buffered() : 0; }
    size_t block_samples() const { return block_samples_; }

private:
    void run(std::stop_token st);
    bool open_device();
    std::expected<void, std::string> stream_block(std::stop_token& st);
    void fallback_block(std::stop_token& st);
    void enter_fallback(const std::string& reason);
    void skip_missed_blocks();
    void close_device();
    void emit(std::vector<int16_t> samples);

    AudioSource source_;
    std::unique_ptr<AudioDevice> device_;
    const ClockAnchor& clock_;
    Options options_;
    size_t block_samples_;

    std::string call_id_;
    ChunkSink sink_;

    std::atomic<CaptureState> state_{CaptureState::Idle};
    std::atomic<bool> fallback_entered_{false};
    std::atomic<bool> demote_requested_{false};
    bool device_open_ = false;

    // Native block layout, known once the device is open. Block sizes follow
    // the running block index so fractional frame counts do not drift.
    DeviceFormat native_{};
    uint64_t native_blocks_ = 0;
    std::vector<int16_t> pending_;

    std::atomic<uint64_t> chunks_emitted_{0};
    std::atomic<uint64_t> samples_consumed_{0};
    std::atomic<uint64_t> samples_skipped_{0};
    std::atomic<int64_t> t0_ms_{-1};
    std::atomic<int64_t> last_ts_ms_{-1};

    mutable std::mutex mutex_;
    std::optional<DeviceFormat> device_format_;
    std::string fallback_reason_;
    std::string demote_reason_;

    std::mutex sleep_mutex_;
    std::condition_variable_any sleep_cv_;

    std::jthread thread_;
};
