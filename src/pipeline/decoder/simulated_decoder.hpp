#pragma once

#include "decoder.hpp"

#include <cstdint>
#include <span>
#include <string>

// Stand-in used when no model can be resolved. Deterministic: the same window
// always yields the same text and confidence.
class SimulatedDecoder : public Decoder {
public:
    // Windows whose RMS is below the threshold decode to silence.
    explicit SimulatedDecoder(double rms_threshold = 1000.0);

    DecodeResult decode(std::span<const int16_t> window, uint32_t sample_rate) override;
    bool is_real() const override { return false; }
    std::string name() const override { return "simulated"; }

    static double rms(std::span<const int16_t> window);

private:
    double rms_threshold_;
};
