#include "platform/linux/pipewire_device.hpp"

#include <format>
#include <print>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>
#include <thread>

namespace {

// Roughly 5 s of 48 kHz stereo.
constexpr size_t kRingSamples = 1u << 19;
constexpr std::chrono::milliseconds kNegotiateTimeout{2000};
constexpr std::chrono::milliseconds kPollInterval{2};

} // namespace

PipeWireDevice::PipeWireDevice(AudioSource source, std::string target)
    : source_(source), target_(std::move(target)), ring_(kRingSamples) {
    pw_init(nullptr, nullptr);
}

PipeWireDevice::~PipeWireDevice() {
    close();
    pw_deinit();
}

std::string PipeWireDevice::name() const {
    auto base = source_ == AudioSource::Loopback ? "loopback" : "microphone";
    if (target_.empty()) return std::format("pipewire:{}", base);
    return std::format("pipewire:{}:{}", base, target_);
}

std::expected<DeviceFormat, std::string> PipeWireDevice::open() {
    if (capturing_.load(std::memory_order_relaxed)) {
        std::lock_guard lock(format_mutex_);
        if (format_) return *format_;
    }

    {
        std::lock_guard lock(format_mutex_);
        format_.reset();
        stream_error_.clear();
    }
    format_changed_.store(false, std::memory_order_relaxed);
    ring_.reset();

    loop_ = pw_thread_loop_new("callscribe", nullptr);
    if (!loop_) {
        return std::unexpected("failed to create thread loop");
    }

    bool loopback = source_ == AudioSource::Loopback;
    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, loopback ? "callscribe-loopback" : "callscribe-microphone",
        PW_KEY_APP_NAME, "callscribe",
        nullptr
    );
    if (loopback) {
        pw_properties_set(props, PW_KEY_STREAM_CAPTURE_SINK, "true");
    }
    if (!target_.empty()) {
        pw_properties_set(props, PW_KEY_TARGET_OBJECT, target_.c_str());
    }

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        loopback ? "callscribe-loopback" : "callscribe-microphone",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        teardown();
        return std::unexpected("failed to create stream");
    }

    // Only the sample format is fixed; rate and channel count follow the graph
    // and are reported through param_changed.
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    if (ret < 0) {
        teardown();
        return std::unexpected(std::format("stream connect failed: {}", spa_strerror(ret)));
    }

    capturing_.store(true, std::memory_order_release);
    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        teardown();
        return std::unexpected(std::format("thread loop start failed: {}", spa_strerror(ret)));
    }

    std::unique_lock lock(format_mutex_);
    bool negotiated = format_cv_.wait_for(lock, kNegotiateTimeout, [this] {
        return format_.has_value() || !stream_error_.empty();
    });
    if (!negotiated || !format_) {
        std::string reason = stream_error_.empty() ? "no format negotiated" : stream_error_;
        lock.unlock();
        teardown();
        return std::unexpected(reason);
    }
    return *format_;
}

std::expected<size_t, std::string> PipeWireDevice::read(std::span<int16_t> out,
                                                        std::chrono::milliseconds timeout) {
    if (!capturing_.load(std::memory_order_acquire)) {
        return std::unexpected("device not open");
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (format_changed_.load(std::memory_order_acquire)) {
            return std::unexpected("format renegotiated");
        }
        {
            std::lock_guard lock(format_mutex_);
            if (!stream_error_.empty()) return std::unexpected(stream_error_);
        }

        size_t n = ring_.read(out);
        if (n > 0) return n;
        if (std::chrono::steady_clock::now() >= deadline) return 0;
        std::this_thread::sleep_for(kPollInterval);
    }
}

void PipeWireDevice::close() {
    if (!capturing_.load(std::memory_order_relaxed) && !loop_) return;
    teardown();
}

void PipeWireDevice::teardown() {
    capturing_.store(false, std::memory_order_release);

    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireDevice::on_process(void* userdata) {
    auto* self = static_cast<PipeWireDevice*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = reinterpret_cast<const int16_t*>(static_cast<const uint8_t*>(d->data) + d->chunk->offset);
    size_t samples = d->chunk->size / sizeof(int16_t);

    if (self->capturing_.load(std::memory_order_relaxed)) {
        self->ring_.write(std::span<const int16_t>(data, samples));
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireDevice::on_param_changed(void* userdata, uint32_t id, const spa_pod* param) {
    auto* self = static_cast<PipeWireDevice*>(userdata);
    if (!param || id != SPA_PARAM_Format) return;

    uint32_t media_type = 0;
    uint32_t media_subtype = 0;
    if (spa_format_parse(param, &media_type, &media_subtype) < 0) return;
    if (media_type != SPA_MEDIA_TYPE_audio || media_subtype != SPA_MEDIA_SUBTYPE_raw) return;

    spa_audio_info_raw info{};
    if (spa_format_audio_raw_parse(param, &info) < 0) return;

    {
        std::lock_guard lock(self->format_mutex_);
        DeviceFormat fmt{.sample_rate = info.rate, .channels = info.channels};
        if (self->format_ && (self->format_->sample_rate != fmt.sample_rate ||
                              self->format_->channels != fmt.channels)) {
            self->format_changed_.store(true, std::memory_order_release);
        }
        self->format_ = fmt;
    }
    self->format_cv_.notify_all();
}

void PipeWireDevice::on_state_changed(void* userdata, enum pw_stream_state old,
                                      enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireDevice*>(userdata);
    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
    if (state == PW_STREAM_STATE_ERROR || state == PW_STREAM_STATE_UNCONNECTED) {
        {
            std::lock_guard lock(self->format_mutex_);
            self->stream_error_ = error ? error : "stream disconnected";
        }
        self->format_cv_.notify_all();
    }
}
