#pragma once

#include "audio_chunk.hpp"
#include "clock_anchor.hpp"
#include "config.hpp"
#include "decoder/decoder.hpp"
#include "decoder/model_resolver.hpp"
#include "ingest_queue.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

struct ServiceMetrics {
    std::string call_id;
    bool running = false;
    std::string decoder;
    bool decoder_is_real = false;
    uint64_t windows_emitted = 0;
    uint64_t short_windows = 0;
    uint64_t decode_failures = 0;
    uint64_t rejected_chunks = 0;
    uint64_t gap_samples_filled = 0;
    double avg_decode_ms = 0.0;
    double last_decode_ms = 0.0;
    double avg_emit_latency_ms = 0.0;
    std::array<size_t, 2> buffer_sizes{};
    std::array<uint64_t, 2> samples_consumed{};
    uint64_t dropped_chunks = 0;
    size_t queue_depth = 0;
};

// Single consumer of the ingest queue. Accumulates a sliding window per
// source and emits one TranscriptChunk per completed window.
class TranscriptionService {
public:
    using Listener = std::function<void(const TranscriptChunk&)>;

    TranscriptionService(const Config& config, BoundedIngestQueue& queue,
                         ModelResolver& resolver, const ClockAnchor& clock);
    ~TranscriptionService();

    TranscriptionService(const TranscriptionService&) = delete;
    TranscriptionService& operator=(const TranscriptionService&) = delete;

    // Resolves the decoder (configured model, then the fallback models),
    // falling back to the simulated one.
    void init();
    // Re-queries the resolver; keeps the current decoder when still unavailable
    // and a real one is already loaded.
    bool refresh_decoder();
    // Installs a decoder directly (tests, embedding applications).
    void set_decoder(std::unique_ptr<Decoder> decoder);

    void add_listener(Listener listener);

    bool start(const std::string& call_id);
    bool stop(const std::string& call_id);
    bool is_running() const { return running_.load(std::memory_order_acquire); }

    // Synchronous entry point used by the consumer loop.
    std::expected<void, ValidationError> process_chunk(const AudioChunk& chunk);

    bool decoder_is_real() const;
    std::string decoder_name() const;

    ServiceMetrics get_metrics() const;

private:
    struct SourceWindow {
        std::string call_id;
        std::vector<int16_t> buffer;
        uint64_t samples_consumed = 0;
        std::optional<int64_t> t0_ms;
        // Leading samples of `buffer` already covered by an emitted window.
        size_t decoded_prefix = 0;
    };

    // Tries the configured model, then each fallback model, in order.
    std::expected<std::unique_ptr<Decoder>, std::string> resolve_decoder();
    std::shared_ptr<Decoder> current_decoder() const;
    void consume_loop(std::stop_token st);
    void drain_windows(AudioSource source, SourceWindow& sw);
    void flush_partial(AudioSource source, SourceWindow& sw);
    void emit_window(AudioSource source, SourceWindow& sw, std::span<const int16_t> window);
    void pad_gap(AudioSource source, SourceWindow& sw, const AudioChunk& chunk);
    int64_t sample_to_ms(const SourceWindow& sw, uint64_t sample) const;
    void reset_windows();
    void publish_window_state();

    const Config& config_;
    BoundedIngestQueue& queue_;
    ModelResolver& resolver_;
    const ClockAnchor& clock_;

    size_t window_samples_;
    size_t step_samples_;
    size_t min_window_samples_;
    uint32_t sample_rate_;

    // Held only to swap or copy the pointer; decoding runs on a copy so a slow
    // decode never blocks metrics or a refresh.
    mutable std::mutex decoder_mutex_;
    std::shared_ptr<Decoder> decoder_;

    std::mutex listeners_mutex_;
    std::vector<Listener> listeners_;

    // Serializes chunk processing between the consumer thread and stop().
    std::mutex state_mutex_;
    std::array<SourceWindow, 2> windows_;

    std::atomic<bool> running_{false};
    std::jthread consumer_;

    mutable std::mutex metrics_mutex_;
    std::string call_id_;
    std::array<size_t, 2> buffer_sizes_{};
    std::array<uint64_t, 2> samples_consumed_{};
    uint64_t windows_emitted_ = 0;
    uint64_t short_windows_ = 0;
    uint64_t decode_failures_ = 0;
    uint64_t rejected_chunks_ = 0;
    uint64_t gap_samples_filled_ = 0;
    uint64_t decoded_windows_ = 0;
    double total_decode_ms_ = 0.0;
    double last_decode_ms_ = 0.0;
    double total_emit_latency_ms_ = 0.0;
};
