#pragma once

#include "audio_chunk.hpp"
#include "clock_anchor.hpp"
#include "config.hpp"
#include "platform/audio_device.hpp"
#include "source_capture.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

enum class SessionHealth { Healthy, Degraded, Failed };

std::string_view to_string(SessionHealth h);

struct SessionMetrics {
    std::string call_id;
    bool active = false;
    SessionHealth health = SessionHealth::Healthy;
    // Per source, indexed by source_index(). Native rate is 0 when no device opened.
    std::array<uint32_t, 2> sample_rates{};
    std::array<size_t, 2> buffer_sizes{};
    std::array<uint64_t, 2> chunk_counts{};
    std::array<bool, 2> fallback{};
    int64_t initial_drift_ms = 0;
    int64_t sync_drift_ms = 0;
    int64_t max_drift_ms = 0;
    uint64_t drift_violations = 0;
    uint64_t callback_errors = 0;
    double duration_s = 0.0;
};

// Owns the microphone and loopback captures of one call and fans their chunks
// out to listeners.
class CaptureSession {
public:
    using Callback = std::function<void(const AudioChunk&)>;
    // Returns null when the endpoint is unavailable; that source then runs in fallback.
    using DeviceFactory = std::function<std::unique_ptr<AudioDevice>(AudioSource)>;

    CaptureSession(const Config& config, const ClockAnchor& clock, DeviceFactory factory);
    ~CaptureSession();

    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;

    // Returns the new call id, or the active one if already started.
    std::string start();
    void add_callback(Callback cb);
    void stop();
    // stop() and drop every listener.
    void cleanup();

    bool is_active() const { return active_.load(std::memory_order_acquire); }
    std::string call_id() const;

    // Forces one source into fallback; no-op when the session is not active.
    void demote(AudioSource source, std::string reason);
    const SourceCapture* capture(AudioSource source) const;

    SessionMetrics get_metrics() const;

    static std::string make_call_id();

private:
    void on_chunk(AudioSource source, const AudioChunk& chunk);
    SessionHealth current_health() const;

    const Config& config_;
    const ClockAnchor& clock_;
    DeviceFactory factory_;

    // Serializes start() and stop().
    std::mutex control_mutex_;
    // Guards captures_ against replacement while readers use it. Never held
    // while a capture thread is joined.
    mutable std::mutex lifecycle_mutex_;
    std::array<std::unique_ptr<SourceCapture>, 2> captures_;
    std::atomic<bool> active_{false};

    mutable std::shared_mutex callbacks_mutex_;
    std::vector<Callback> callbacks_;
    std::atomic<uint64_t> callback_errors_{0};

    mutable std::mutex mutex_;
    std::string call_id_;
    std::chrono::steady_clock::time_point started_at_;
    std::chrono::steady_clock::time_point stopped_at_;

    // Drift bookkeeping, guarded by mutex_. An offset is wall clock minus chunk
    // timestamp at emission; the drift is the difference between the two sources.
    std::array<int64_t, 2> t0_ms_{-1, -1};
    std::array<int64_t, 2> offset_ms_{};
    std::array<bool, 2> seen_{};
    bool initial_checked_ = false;
    int64_t initial_drift_ms_ = 0;
    int64_t sync_drift_ms_ = 0;
    int64_t max_drift_ms_ = 0;
    uint64_t drift_violations_ = 0;
    SessionHealth last_health_ = SessionHealth::Healthy;
};
