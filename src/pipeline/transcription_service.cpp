#include "transcription_service.hpp"

#include "decoder/simulated_decoder.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <print>

TranscriptionService::TranscriptionService(const Config& config, BoundedIngestQueue& queue,
                                           ModelResolver& resolver, const ClockAnchor& clock)
    : config_(config), queue_(queue), resolver_(resolver), clock_(clock),
      window_samples_(std::max<size_t>(config.window_samples(), 1)),
      step_samples_(std::min(config.step_samples(), window_samples_)),
      min_window_samples_(config.min_window_samples()),
      sample_rate_(config.audio.sample_rate) {}

TranscriptionService::~TranscriptionService() {
    std::string id;
    {
        std::lock_guard lock(metrics_mutex_);
        id = call_id_;
    }
    if (is_running()) stop(id);
}

std::expected<std::unique_ptr<Decoder>, std::string> TranscriptionService::resolve_decoder() {
    std::vector<std::string> candidates{config_.transcription.model};
    for (auto& m : config_.transcription.fallback_models) {
        if (std::find(candidates.begin(), candidates.end(), m) == candidates.end()) {
            candidates.push_back(m);
        }
    }

    std::string reasons;
    for (auto& model : candidates) {
        auto resolved = resolver_.resolve(model);
        if (resolved) {
            if (model != config_.transcription.model) {
                std::println(stderr, "transcription: {} unavailable, using {}",
                             config_.transcription.model, model);
            }
            return resolved;
        }
        if (!reasons.empty()) reasons += "; ";
        reasons += resolved.error();
    }
    return std::unexpected(reasons);
}

void TranscriptionService::init() {
    auto resolved = resolve_decoder();
    if (resolved) {
        set_decoder(std::move(*resolved));
        std::println(stderr, "transcription: using decoder {}", decoder_name());
        return;
    }

    std::println(stderr, "transcription: {}, using simulated decoder", resolved.error());
    set_decoder(std::make_unique<SimulatedDecoder>());
}

bool TranscriptionService::refresh_decoder() {
    auto resolved = resolve_decoder();
    if (resolved) {
        set_decoder(std::move(*resolved));
        std::println(stderr, "transcription: decoder refreshed, now {}", decoder_name());
        return true;
    }

    {
        std::lock_guard lock(decoder_mutex_);
        if (!decoder_) decoder_ = std::make_shared<SimulatedDecoder>();
    }
    std::println(stderr, "transcription: refresh failed: {}", resolved.error());
    return false;
}

void TranscriptionService::set_decoder(std::unique_ptr<Decoder> decoder) {
    std::lock_guard lock(decoder_mutex_);
    decoder_ = std::move(decoder);
}

std::shared_ptr<Decoder> TranscriptionService::current_decoder() const {
    std::lock_guard lock(decoder_mutex_);
    return decoder_;
}

bool TranscriptionService::decoder_is_real() const {
    auto decoder = current_decoder();
    return decoder && decoder->is_real();
}

std::string TranscriptionService::decoder_name() const {
    auto decoder = current_decoder();
    return decoder ? decoder->name() : "none";
}

void TranscriptionService::add_listener(Listener listener) {
    std::lock_guard lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
}

bool TranscriptionService::start(const std::string& call_id) {
    if (is_running()) {
        std::println(stderr, "transcription: already running");
        return false;
    }

    {
        std::lock_guard lock(decoder_mutex_);
        if (!decoder_) decoder_ = std::make_shared<SimulatedDecoder>();
    }

    {
        std::lock_guard lock(state_mutex_);
        reset_windows();
    }
    {
        std::lock_guard lock(metrics_mutex_);
        call_id_ = call_id;
        windows_emitted_ = 0;
        short_windows_ = 0;
        decode_failures_ = 0;
        rejected_chunks_ = 0;
        gap_samples_filled_ = 0;
        decoded_windows_ = 0;
        total_decode_ms_ = 0.0;
        last_decode_ms_ = 0.0;
        total_emit_latency_ms_ = 0.0;
    }
    publish_window_state();

    queue_.reopen();
    running_.store(true, std::memory_order_release);
    consumer_ = std::jthread([this](std::stop_token st) { consume_loop(st); });
    return true;
}

bool TranscriptionService::stop(const std::string& call_id) {
    if (!is_running()) return false;
    {
        std::lock_guard lock(metrics_mutex_);
        if (call_id != call_id_) {
            std::println(stderr, "transcription: stop for {} ignored, bound to {}", call_id, call_id_);
            return false;
        }
    }

    running_.store(false, std::memory_order_release);
    consumer_.request_stop();
    queue_.close();
    if (consumer_.joinable()) consumer_.join();

    // Chunks still queued belong to the session; process them before flushing.
    while (auto chunk = queue_.try_pop()) {
        if (auto res = process_chunk(*chunk); !res) {
            std::println(stderr, "transcription: rejected chunk: {}", to_string(res.error()));
        }
    }

    {
        std::lock_guard lock(state_mutex_);
        for (auto source : kAllSources) {
            flush_partial(source, windows_[source_index(source)]);
        }
    }
    publish_window_state();

    auto m = get_metrics();
    std::println(stderr, "transcription: stopped {} ({} windows, avg decode {:.1f} ms, avg latency {:.1f} ms)",
                 call_id, m.windows_emitted, m.avg_decode_ms, m.avg_emit_latency_ms);
    return true;
}

void TranscriptionService::consume_loop(std::stop_token st) {
    auto poll = std::chrono::milliseconds(config_.queue.poll_interval_ms);
    while (!st.stop_requested()) {
        auto chunk = queue_.pop(poll);
        if (!chunk) continue;

        if (auto res = process_chunk(*chunk); !res) {
            std::println(stderr, "transcription: rejected chunk: {}", to_string(res.error()));
        }
    }
}

std::expected<void, ValidationError> TranscriptionService::process_chunk(const AudioChunk& chunk) {
    if (auto err = validate_chunk(chunk, queue_.shape())) {
        std::lock_guard lock(metrics_mutex_);
        ++rejected_chunks_;
        return std::unexpected(*err);
    }

    {
        std::lock_guard lock(state_mutex_);
        auto& sw = windows_[source_index(chunk.source)];

        if (!sw.t0_ms) {
            sw.t0_ms = chunk.timestamp_ms;
        } else {
            pad_gap(chunk.source, sw, chunk);
        }
        sw.call_id = chunk.call_id;

        sw.buffer.insert(sw.buffer.end(), chunk.samples.begin(), chunk.samples.end());
        drain_windows(chunk.source, sw);
    }
    publish_window_state();
    return {};
}

void TranscriptionService::pad_gap(AudioSource source, SourceWindow& sw, const AudioChunk& chunk) {
    size_t block = queue_.shape().block_samples;
    if (block == 0 || chunk.timestamp_ms <= *sw.t0_ms) return;

    uint64_t expected = sw.samples_consumed + sw.buffer.size();
    auto actual = static_cast<uint64_t>(chunk.timestamp_ms - *sw.t0_ms) * sample_rate_ / 1000;
    if (actual <= expected) return;

    // Upstream drops remove whole blocks; round to block multiples to absorb
    // the millisecond truncation of timestamps.
    uint64_t missing_blocks = (actual - expected + block / 2) / block;
    if (missing_blocks == 0) return;
    uint64_t gap = missing_blocks * block;

    if (gap <= window_samples_) {
        sw.buffer.insert(sw.buffer.end(), gap, int16_t{0});
    } else {
        flush_partial(source, sw);
        sw.samples_consumed = expected + gap;
    }

    std::lock_guard lock(metrics_mutex_);
    gap_samples_filled_ += gap;
}

void TranscriptionService::drain_windows(AudioSource source, SourceWindow& sw) {
    while (sw.buffer.size() >= window_samples_) {
        emit_window(source, sw, std::span<const int16_t>(sw.buffer.data(), window_samples_));

        sw.buffer.erase(sw.buffer.begin(), sw.buffer.begin() + static_cast<ptrdiff_t>(step_samples_));
        sw.samples_consumed += step_samples_;
        sw.decoded_prefix = std::min(window_samples_ - step_samples_, sw.buffer.size());
    }
}

void TranscriptionService::flush_partial(AudioSource source, SourceWindow& sw) {
    if (sw.buffer.size() > sw.decoded_prefix) {
        emit_window(source, sw, sw.buffer);
    }
    sw.samples_consumed += sw.buffer.size();
    sw.buffer.clear();
    sw.decoded_prefix = 0;
}

void TranscriptionService::emit_window(AudioSource source, SourceWindow& sw,
                                       std::span<const int16_t> window) {
    TranscriptChunk tc{
        .call_id = sw.call_id,
        .source = source,
        .ts_start_ms = sample_to_ms(sw, sw.samples_consumed),
        .ts_end_ms = sample_to_ms(sw, sw.samples_consumed + window.size()),
    };

    bool short_window = window.empty() || window.size() < min_window_samples_;
    double decode_ms = 0.0;
    bool failed = false;

    if (!short_window) {
        auto begin = std::chrono::steady_clock::now();
        DecodeResult result;
        auto decoder = current_decoder();
        try {
            result = decoder ? decoder->decode(window, sample_rate_) : DecodeResult{};
        } catch (const std::exception& e) {
            std::println(stderr, "transcription: decoder threw: {}", e.what());
            result = DecodeResult{.failed = true};
        }
        decode_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - begin).count();

        failed = result.failed;
        tc.text = std::move(result.text);
        tc.confidence = std::isfinite(result.confidence)
            ? std::clamp(result.confidence, 0.0f, 1.0f) : 0.0f;
    }

    {
        std::lock_guard lock(metrics_mutex_);
        ++windows_emitted_;
        if (short_window) {
            ++short_windows_;
        } else {
            ++decoded_windows_;
            total_decode_ms_ += decode_ms;
            last_decode_ms_ = decode_ms;
        }
        if (failed) ++decode_failures_;
        total_emit_latency_ms_ += static_cast<double>(clock_.now_ms() - tc.ts_end_ms);
    }

    std::vector<Listener> listeners;
    {
        std::lock_guard lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (auto& listener : listeners) {
        try {
            listener(tc);
        } catch (const std::exception& e) {
            std::println(stderr, "transcription: listener failed: {}", e.what());
        }
    }
}

int64_t TranscriptionService::sample_to_ms(const SourceWindow& sw, uint64_t sample) const {
    return sw.t0_ms.value_or(0) + static_cast<int64_t>(sample * 1000 / sample_rate_);
}

void TranscriptionService::reset_windows() {
    for (auto& sw : windows_) {
        sw = SourceWindow{};
    }
}

void TranscriptionService::publish_window_state() {
    std::array<size_t, 2> sizes{};
    std::array<uint64_t, 2> consumed{};
    {
        std::lock_guard lock(state_mutex_);
        for (size_t i = 0; i < windows_.size(); ++i) {
            sizes[i] = windows_[i].buffer.size();
            consumed[i] = windows_[i].samples_consumed;
        }
    }
    std::lock_guard lock(metrics_mutex_);
    buffer_sizes_ = sizes;
    samples_consumed_ = consumed;
}

ServiceMetrics TranscriptionService::get_metrics() const {
    ServiceMetrics m;
    m.running = is_running();
    if (auto decoder = current_decoder()) {
        m.decoder = decoder->name();
        m.decoder_is_real = decoder->is_real();
    } else {
        m.decoder = "none";
    }
    {
        std::lock_guard lock(metrics_mutex_);
        m.call_id = call_id_;
        m.windows_emitted = windows_emitted_;
        m.short_windows = short_windows_;
        m.decode_failures = decode_failures_;
        m.rejected_chunks = rejected_chunks_;
        m.gap_samples_filled = gap_samples_filled_;
        m.avg_decode_ms = decoded_windows_ > 0 ? total_decode_ms_ / static_cast<double>(decoded_windows_) : 0.0;
        m.last_decode_ms = last_decode_ms_;
        m.avg_emit_latency_ms = windows_emitted_ > 0
            ? total_emit_latency_ms_ / static_cast<double>(windows_emitted_) : 0.0;
        m.buffer_sizes = buffer_sizes_;
        m.samples_consumed = samples_consumed_;
    }
    m.dropped_chunks = queue_.dropped_chunks();
    m.queue_depth = queue_.size();
    return m;
}
