#include "capture_session.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <print>
#include <random>

std::string_view to_string(SessionHealth h) {
    switch (h) {
        case SessionHealth::Healthy: return "healthy";
        case SessionHealth::Degraded: return "degraded";
        case SessionHealth::Failed: return "failed";
    }
    return "unknown";
}

CaptureSession::CaptureSession(const Config& config, const ClockAnchor& clock, DeviceFactory factory)
    : config_(config), clock_(clock), factory_(std::move(factory)) {}

CaptureSession::~CaptureSession() {
    stop();
}

std::string CaptureSession::make_call_id() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<uint32_t> dist(0, 0xffffff);
    return std::format("call-{:x}-{:06x}", ms, dist(gen));
}

std::string CaptureSession::start() {
    std::lock_guard control(control_mutex_);
    if (is_active()) return call_id();

    std::string id = make_call_id();
    {
        std::lock_guard lock(mutex_);
        call_id_ = id;
        started_at_ = std::chrono::steady_clock::now();
        stopped_at_ = started_at_;
        t0_ms_ = {-1, -1};
        offset_ms_ = {};
        seen_ = {};
        initial_checked_ = false;
        initial_drift_ms_ = 0;
        sync_drift_ms_ = 0;
        max_drift_ms_ = 0;
        drift_violations_ = 0;
        last_health_ = SessionHealth::Healthy;
    }
    callback_errors_.store(0, std::memory_order_relaxed);

    SourceCapture::Options opts{
        .sample_rate = config_.audio.sample_rate,
        .block_ms = config_.audio.block_ms,
        .read_timeout = std::chrono::milliseconds(config_.audio.read_timeout_ms),
    };

    // Fresh devices per call; a source whose device cannot be created streams silence.
    std::array<std::unique_ptr<SourceCapture>, 2> fresh;
    for (auto source : kAllSources) {
        std::unique_ptr<AudioDevice> device;
        if (factory_) device = factory_(source);
        fresh[source_index(source)] =
            std::make_unique<SourceCapture>(source, std::move(device), clock_, opts);
    }

    // Held until both threads run so a demote() cannot land between the two starts.
    std::lock_guard lifecycle(lifecycle_mutex_);
    captures_.swap(fresh);
    active_.store(true, std::memory_order_release);
    for (auto source : kAllSources) {
        captures_[source_index(source)]->start(
            id, [this, source](AudioChunk chunk) { on_chunk(source, chunk); });
    }

    std::println(stderr, "session: started {}", id);
    return id;
}

void CaptureSession::add_callback(Callback cb) {
    std::unique_lock lock(callbacks_mutex_);
    callbacks_.push_back(std::move(cb));
}

void CaptureSession::stop() {
    std::lock_guard control(control_mutex_);
    if (!active_.exchange(false, std::memory_order_acq_rel)) return;

    // Joined without lifecycle_mutex_: chunk callbacks on these threads may
    // still read metrics or demote. Only start() replaces captures_, and it
    // needs control_mutex_.
    for (auto& capture : captures_) {
        if (capture) capture->stop();
    }

    std::string id;
    {
        std::lock_guard lock(mutex_);
        stopped_at_ = std::chrono::steady_clock::now();
        id = call_id_;
    }

    SessionHealth health;
    {
        std::lock_guard lifecycle(lifecycle_mutex_);
        health = current_health();
    }
    std::println(stderr, "session: stopped {} ({})", id, to_string(health));
}

void CaptureSession::cleanup() {
    stop();
    std::unique_lock lock(callbacks_mutex_);
    callbacks_.clear();
}

std::string CaptureSession::call_id() const {
    std::lock_guard lock(mutex_);
    return call_id_;
}

void CaptureSession::demote(AudioSource source, std::string reason) {
    if (!is_valid_source(source)) return;
    std::lock_guard lifecycle(lifecycle_mutex_);
    if (!is_active()) return;
    if (auto& capture = captures_[source_index(source)]) capture->demote(std::move(reason));
}

const SourceCapture* CaptureSession::capture(AudioSource source) const {
    if (!is_valid_source(source)) return nullptr;
    std::lock_guard lifecycle(lifecycle_mutex_);
    return captures_[source_index(source)].get();
}

SessionHealth CaptureSession::current_health() const {
    int in_fallback = 0;
    for (auto& capture : captures_) {
        if (capture && capture->in_fallback()) ++in_fallback;
    }
    if (in_fallback == 0) return SessionHealth::Healthy;
    if (in_fallback == 1) return SessionHealth::Degraded;
    return SessionHealth::Failed;
}

void CaptureSession::on_chunk(AudioSource source, const AudioChunk& chunk) {
    size_t idx = source_index(source);
    int64_t now = clock_.now_ms();
    auto health = current_health();

    {
        std::lock_guard lock(mutex_);
        if (t0_ms_[idx] < 0) t0_ms_[idx] = chunk.timestamp_ms;
        offset_ms_[idx] = now - chunk.timestamp_ms;
        seen_[idx] = true;

        if (seen_[0] && seen_[1]) {
            if (!initial_checked_) {
                initial_checked_ = true;
                initial_drift_ms_ = std::abs(t0_ms_[0] - t0_ms_[1]);
                if (initial_drift_ms_ > config_.sync.max_drift_ms) {
                    ++drift_violations_;
                    std::println(stderr, "session: start offset {} ms exceeds {} ms",
                                 initial_drift_ms_, config_.sync.max_drift_ms);
                }
            }

            sync_drift_ms_ = std::abs(offset_ms_[0] - offset_ms_[1]);
            max_drift_ms_ = std::max(max_drift_ms_, sync_drift_ms_);
            if (sync_drift_ms_ > config_.sync.max_drift_ms) ++drift_violations_;
        }

        if (health != last_health_) {
            std::println(stderr, "session: health {} -> {}", to_string(last_health_), to_string(health));
            last_health_ = health;
        }
    }

    std::shared_lock lock(callbacks_mutex_);
    for (auto& cb : callbacks_) {
        try {
            cb(chunk);
        } catch (const std::exception& e) {
            callback_errors_.fetch_add(1, std::memory_order_relaxed);
            std::println(stderr, "session: callback failed on {}: {}", to_string(source), e.what());
        }
    }
}

SessionMetrics CaptureSession::get_metrics() const {
    SessionMetrics m;
    m.active = is_active();
    {
        std::lock_guard lifecycle(lifecycle_mutex_);
        for (auto source : kAllSources) {
            size_t idx = source_index(source);
            auto& capture = captures_[idx];
            if (!capture) continue;
            if (auto fmt = capture->device_format()) m.sample_rates[idx] = fmt->sample_rate;
            m.buffer_sizes[idx] = capture->buffered_samples();
            m.chunk_counts[idx] = capture->chunks_emitted();
            m.fallback[idx] = capture->in_fallback();
        }
        m.health = current_health();
    }

    std::lock_guard lock(mutex_);
    m.call_id = call_id_;
    m.initial_drift_ms = initial_drift_ms_;
    m.sync_drift_ms = sync_drift_ms_;
    m.max_drift_ms = max_drift_ms_;
    m.drift_violations = drift_violations_;
    m.callback_errors = callback_errors_.load(std::memory_order_relaxed);
    auto end = m.active ? std::chrono::steady_clock::now() : stopped_at_;
    m.duration_s = std::chrono::duration<double>(end - started_at_).count();
    return m;
}
