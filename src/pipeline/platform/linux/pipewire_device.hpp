#pragma once

#include "audio_chunk.hpp"
#include "platform/audio_device.hpp"
#include "sample_ring.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <string>

// PipeWire capture stream for one source. The loopback instance records the
// monitor of a sink instead of a source node.
class PipeWireDevice : public AudioDevice {
public:
    // `target` is a node name or serial; empty means the default source or sink.
    PipeWireDevice(AudioSource source, std::string target);
    ~PipeWireDevice() override;

    PipeWireDevice(const PipeWireDevice&) = delete;
    PipeWireDevice& operator=(const PipeWireDevice&) = delete;

    std::expected<DeviceFormat, std::string> open() override;
    std::expected<size_t, std::string> read(std::span<int16_t> out,
                                            std::chrono::milliseconds timeout) override;
    void close() override;

    size_t buffered() const override { return ring_.available(); }
    std::string name() const override;

private:
    static void on_process(void* userdata);
    static void on_param_changed(void* userdata, uint32_t id, const spa_pod* param);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void teardown();

    AudioSource source_;
    std::string target_;
    SampleRing ring_;

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;
    std::atomic<bool> capturing_{false};

    // Negotiation result, written from the PipeWire loop thread.
    std::mutex format_mutex_;
    std::condition_variable format_cv_;
    std::optional<DeviceFormat> format_;
    std::string stream_error_;
    std::atomic<bool> format_changed_{false};

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .param_changed = on_param_changed,
        .process = on_process,
    };
};
