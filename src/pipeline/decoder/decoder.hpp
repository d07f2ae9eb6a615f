#pragma once

#include <cstdint>
#include <span>
#include <string>

struct DecodeResult {
    std::string text;
    float confidence = 0.0f;
    // Set when the decoder swallowed an internal failure.
    bool failed = false;
};

// Speech-to-text transform applied to one window of 16-bit mono audio.
// Implementations never throw; failures come back as an empty, failed result.
class Decoder {
public:
    virtual ~Decoder() = default;
    virtual DecodeResult decode(std::span<const int16_t> window, uint32_t sample_rate) = 0;
    virtual bool is_real() const = 0;
    virtual std::string name() const = 0;
};
