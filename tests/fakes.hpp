#pragma once

#include "audio_chunk.hpp"
#include "decoder/decoder.hpp"
#include "decoder/model_resolver.hpp"
#include "platform/audio_device.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <numbers>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Observable from the test after the device has been handed to a capture.
struct FakeDeviceProbe {
    std::atomic<int> opens{0};
    std::atomic<int> closes{0};
    std::atomic<uint64_t> delivered{0};
};

// Produces a tone at wall-clock pace (or as fast as asked when unpaced) and can
// be scripted to fail opening or to stall after a number of samples.
class FakeDevice : public AudioDevice {
public:
    struct Script {
        DeviceFormat format{.sample_rate = 16000, .channels = 1};
        bool fail_open = false;
        bool paced = true;
        int16_t amplitude = 8000;
        // Interleaved samples delivered before reads stop returning data.
        std::optional<uint64_t> stall_after;
        bool error_on_stall = false;
        std::chrono::milliseconds open_delay{0};
    };

    explicit FakeDevice(Script script, std::shared_ptr<FakeDeviceProbe> probe = nullptr)
        : script_(script), probe_(probe ? std::move(probe) : std::make_shared<FakeDeviceProbe>()) {}

    std::expected<DeviceFormat, std::string> open() override {
        probe_->opens.fetch_add(1);
        if (script_.open_delay.count() > 0) std::this_thread::sleep_for(script_.open_delay);
        if (script_.fail_open) return std::unexpected("no such node");
        opened_at_ = std::chrono::steady_clock::now();
        return script_.format;
    }

    std::expected<size_t, std::string> read(std::span<int16_t> out,
                                            std::chrono::milliseconds timeout) override {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            uint64_t ready = ready_samples();
            if (script_.stall_after) {
                if (delivered_ >= *script_.stall_after && script_.error_on_stall) {
                    return std::unexpected("device vanished");
                }
                ready = std::min(ready, *script_.stall_after);
            }

            if (ready > delivered_) {
                size_t n = static_cast<size_t>(std::min<uint64_t>(out.size(), ready - delivered_));
                for (size_t i = 0; i < n; ++i) out[i] = sample_at(delivered_ + i);
                delivered_ += n;
                probe_->delivered.store(delivered_);
                return n;
            }
            if (std::chrono::steady_clock::now() >= deadline) return 0;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    void close() override { probe_->closes.fetch_add(1); }
    size_t buffered() const override { return 0; }
    std::string name() const override { return "fake"; }

private:
    uint64_t ready_samples() const {
        if (!script_.paced) return delivered_ + (1u << 16);
        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - opened_at_).count();
        return static_cast<uint64_t>(elapsed * script_.format.sample_rate) * script_.format.channels;
    }

    int16_t sample_at(uint64_t index) const {
        uint64_t frame = index / std::max<uint32_t>(script_.format.channels, 1);
        double t = static_cast<double>(frame) / script_.format.sample_rate;
        return static_cast<int16_t>(script_.amplitude * std::sin(2.0 * std::numbers::pi * 440.0 * t));
    }

    Script script_;
    std::shared_ptr<FakeDeviceProbe> probe_;
    std::chrono::steady_clock::time_point opened_at_{};
    uint64_t delivered_ = 0;
};

// Records every window it sees; text is "window N".
class CountingDecoder : public Decoder {
public:
    struct Log {
        std::mutex mutex;
        std::vector<size_t> window_sizes;
    };

    explicit CountingDecoder(std::shared_ptr<Log> log, float confidence = 0.8f, bool real = true)
        : log_(std::move(log)), confidence_(confidence), real_(real) {}

    DecodeResult decode(std::span<const int16_t> window, uint32_t /*sample_rate*/) override {
        std::lock_guard lock(log_->mutex);
        log_->window_sizes.push_back(window.size());
        return DecodeResult{
            .text = "window " + std::to_string(log_->window_sizes.size()),
            .confidence = confidence_,
        };
    }

    bool is_real() const override { return real_; }
    std::string name() const override { return "counting"; }

private:
    std::shared_ptr<Log> log_;
    float confidence_;
    bool real_;
};

class ThrowingDecoder : public Decoder {
public:
    DecodeResult decode(std::span<const int16_t>, uint32_t) override {
        throw std::runtime_error("model crashed");
    }
    bool is_real() const override { return true; }
    std::string name() const override { return "throwing"; }
};

// Resolves through a callback; null callback means unavailable. When
// `installed` is non-empty only those model names resolve.
class FakeResolver : public ModelResolver {
public:
    using Make = std::function<std::unique_ptr<Decoder>()>;

    explicit FakeResolver(Make make = nullptr) : make_(std::move(make)) {}

    std::expected<std::unique_ptr<Decoder>, std::string>
    resolve(const std::string& model_name) override {
        std::lock_guard lock(mutex_);
        ++calls;
        last_model = model_name;
        tried.push_back(model_name);
        bool listed = installed.empty() ||
            std::find(installed.begin(), installed.end(), model_name) != installed.end();
        if (!make_ || !listed) return std::unexpected("model " + model_name + " not installed");
        return make_();
    }

    void set(Make make) {
        std::lock_guard lock(mutex_);
        make_ = std::move(make);
    }

    int calls = 0;
    std::string last_model;
    std::vector<std::string> tried;
    std::vector<std::string> installed;

private:
    std::mutex mutex_;
    Make make_;
};

inline AudioChunk make_chunk(AudioSource source, int64_t ts_ms, int16_t value = 0,
                             const std::string& call_id = "call-test", size_t samples = 320) {
    return AudioChunk{
        .call_id = call_id,
        .source = source,
        .timestamp_ms = ts_ms,
        .samples = std::vector<int16_t>(samples, value),
        .sample_rate = 16000,
        .channel_count = 1,
    };
}

// Polls `pred` until it holds or `timeout` passes.
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}
