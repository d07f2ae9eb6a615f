#include "source_capture.hpp"

#include "resample.hpp"

#include <algorithm>
#include <format>
#include <print>

namespace {

constexpr uint32_t kMinDeviceRate = 8000;
constexpr uint32_t kMaxDeviceRate = 192000;
constexpr uint32_t kMaxDeviceChannels = 8;

// Upper bound on a single device wait so stop requests are seen promptly.
constexpr std::chrono::milliseconds kReadSlice{50};

} // namespace

std::string_view to_string(CaptureState s) {
    switch (s) {
        case CaptureState::Idle: return "idle";
        case CaptureState::Opening: return "opening";
        case CaptureState::Streaming: return "streaming";
        case CaptureState::Stopping: return "stopping";
        case CaptureState::Closed: return "closed";
        case CaptureState::Error: return "error";
        case CaptureState::Fallback: return "fallback";
    }
    return "unknown";
}

SourceCapture::SourceCapture(AudioSource source, std::unique_ptr<AudioDevice> device,
                             const ClockAnchor& clock, Options options)
    : source_(source), device_(std::move(device)), clock_(clock), options_(options),
      block_samples_(static_cast<size_t>(options.sample_rate) * options.block_ms / 1000) {}

SourceCapture::~SourceCapture() {
    stop();
}

bool SourceCapture::start(std::string call_id, ChunkSink sink) {
    auto s = state();
    if (s != CaptureState::Idle && s != CaptureState::Closed) return false;
    if (thread_.joinable()) thread_.join();

    call_id_ = std::move(call_id);
    sink_ = std::move(sink);

    chunks_emitted_.store(0, std::memory_order_relaxed);
    samples_consumed_.store(0, std::memory_order_relaxed);
    samples_skipped_.store(0, std::memory_order_relaxed);
    t0_ms_.store(-1, std::memory_order_release);
    last_ts_ms_.store(-1, std::memory_order_release);
    fallback_entered_.store(false, std::memory_order_release);
    demote_requested_.store(false, std::memory_order_release);
    {
        std::lock_guard lock(mutex_);
        device_format_.reset();
        fallback_reason_.clear();
        demote_reason_.clear();
    }

    state_.store(CaptureState::Opening, std::memory_order_release);
    thread_ = std::jthread([this](std::stop_token st) { run(st); });
    return true;
}

void SourceCapture::stop() {
    if (!thread_.joinable()) return;

    thread_.request_stop();
    sleep_cv_.notify_all();
    thread_.join();
}

void SourceCapture::demote(std::string reason) {
    {
        std::lock_guard lock(mutex_);
        demote_reason_ = std::move(reason);
    }
    demote_requested_.store(true, std::memory_order_release);
}

std::optional<DeviceFormat> SourceCapture::device_format() const {
    std::lock_guard lock(mutex_);
    return device_format_;
}

std::string SourceCapture::fallback_reason() const {
    std::lock_guard lock(mutex_);
    return fallback_reason_;
}

void SourceCapture::run(std::stop_token st) {
    if (open_device()) {
        state_.store(CaptureState::Streaming, std::memory_order_release);
    }

    while (!st.stop_requested()) {
        if (demote_requested_.exchange(false, std::memory_order_acq_rel)) {
            std::string reason;
            {
                std::lock_guard lock(mutex_);
                reason = demote_reason_;
            }
            if (state() == CaptureState::Streaming) {
                state_.store(CaptureState::Error, std::memory_order_release);
                close_device();
                enter_fallback(reason.empty() ? "demoted" : reason);
                skip_missed_blocks();
            }
        }

        if (state() == CaptureState::Streaming) {
            auto res = stream_block(st);
            if (!res) {
                state_.store(CaptureState::Error, std::memory_order_release);
                close_device();
                enter_fallback(res.error());
                skip_missed_blocks();
            }
        } else {
            fallback_block(st);
        }
    }

    state_.store(CaptureState::Stopping, std::memory_order_release);
    close_device();
    state_.store(CaptureState::Closed, std::memory_order_release);
}

bool SourceCapture::open_device() {
    if (!device_) {
        state_.store(CaptureState::Error, std::memory_order_release);
        enter_fallback("no device");
        return false;
    }

    auto fmt = device_->open();
    if (!fmt) {
        state_.store(CaptureState::Error, std::memory_order_release);
        enter_fallback("open failed: " + fmt.error());
        return false;
    }
    device_open_ = true;

    {
        std::lock_guard lock(mutex_);
        device_format_ = *fmt;
    }

    if (fmt->channels == 0 || fmt->channels > kMaxDeviceChannels ||
        fmt->sample_rate < kMinDeviceRate || fmt->sample_rate > kMaxDeviceRate) {
        state_.store(CaptureState::Error, std::memory_order_release);
        close_device();
        enter_fallback(std::format("unsupported format: {} Hz, {} channels",
                                   fmt->sample_rate, fmt->channels));
        return false;
    }

    native_ = *fmt;
    native_blocks_ = 0;
    pending_.clear();
    return true;
}

std::expected<void, std::string> SourceCapture::stream_block(std::stop_token& st) {
    auto deadline = std::chrono::steady_clock::now() + options_.read_timeout;
    size_t filled = 0;
    pending_.resize(resample::frames_for(native_.sample_rate, options_.block_ms, native_blocks_) *
                    native_.channels);

    while (filled < pending_.size()) {
        if (st.stop_requested()) return {};

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::unexpected(std::format("read timed out after {} ms",
                                               options_.read_timeout.count()));
        }
        auto wait = std::min(kReadSlice,
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));

        auto n = device_->read(std::span(pending_).subspan(filled), wait);
        if (!n) return std::unexpected("read failed: " + n.error());
        filled += *n;
    }

    auto mono = resample::downmix(pending_, native_.channels);
    ++native_blocks_;
    emit(resample::linear(mono, block_samples_));
    return {};
}

void SourceCapture::fallback_block(std::stop_token& st) {
    int64_t t0 = t0_ms();
    if (t0 >= 0) {
        // Emit each silent block when the wall clock reaches its timestamp.
        int64_t next_ts = t0 + static_cast<int64_t>(samples_consumed() * 1000 / options_.sample_rate);
        std::unique_lock lock(sleep_mutex_);
        sleep_cv_.wait_until(lock, st, clock_.at(next_ts), [] { return false; });
        if (st.stop_requested()) return;
    }

    emit(std::vector<int16_t>(block_samples_, 0));
}

void SourceCapture::skip_missed_blocks() {
    int64_t t0 = t0_ms();
    if (t0 < 0) return;

    // A timed-out read leaves the timeline behind the wall clock. Resume at
    // the current block instead of replaying the missed span as a burst; the
    // consumer sees the jump as a timestamp gap.
    uint64_t consumed = samples_consumed();
    int64_t next_ts = t0 + static_cast<int64_t>(consumed * 1000 / options_.sample_rate);
    int64_t lag_ms = clock_.now_ms() - next_ts;
    if (lag_ms < static_cast<int64_t>(options_.block_ms)) return;

    uint64_t skipped = static_cast<uint64_t>(lag_ms / options_.block_ms) * block_samples_;
    samples_consumed_.store(consumed + skipped, std::memory_order_relaxed);
    samples_skipped_.fetch_add(skipped, std::memory_order_relaxed);
    std::println(stderr, "capture[{}]: skipped {} ms of missed audio", to_string(source_),
                 skipped * 1000 / options_.sample_rate);
}

void SourceCapture::enter_fallback(const std::string& reason) {
    {
        std::lock_guard lock(mutex_);
        fallback_reason_ = reason;
    }
    std::println(stderr, "capture[{}]: {}, streaming silence", to_string(source_), reason);
    fallback_entered_.store(true, std::memory_order_release);
    state_.store(CaptureState::Fallback, std::memory_order_release);
}

void SourceCapture::close_device() {
    if (device_ && device_open_) {
        device_->close();
        device_open_ = false;
    }
}

void SourceCapture::emit(std::vector<int16_t> samples) {
    int64_t t0 = t0_ms();
    if (t0 < 0) {
        t0 = clock_.now_ms();
        t0_ms_.store(t0, std::memory_order_release);
    }

    uint64_t consumed = samples_consumed_.load(std::memory_order_relaxed);
    int64_t ts = t0 + static_cast<int64_t>(consumed * 1000 / options_.sample_rate);
    samples_consumed_.store(consumed + samples.size(), std::memory_order_relaxed);
    last_ts_ms_.store(ts, std::memory_order_release);
    chunks_emitted_.fetch_add(1, std::memory_order_relaxed);

    if (sink_) {
        sink_(AudioChunk{
            .call_id = call_id_,
            .source = source_,
            .timestamp_ms = ts,
            .samples = std::move(samples),
            .sample_rate = options_.sample_rate,
            .channel_count = 1,
        });
    }
}
