#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

struct DeviceFormat {
    uint32_t sample_rate = 0;
    uint32_t channels = 0;
};

// One hardware capture endpoint delivering interleaved S16 samples.
class AudioDevice {
public:
    virtual ~AudioDevice() = default;

    virtual std::expected<DeviceFormat, std::string> open() = 0;

    // Reads up to out.size() interleaved samples, waiting at most `timeout` for
    // the first one. Returns 0 when nothing arrived in time.
    virtual std::expected<size_t, std::string> read(std::span<int16_t> out,
                                                    std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;

    // Samples captured but not yet read.
    virtual size_t buffered() const = 0;
    virtual std::string name() const = 0;
};
