#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace resample {

// Averages interleaved frames down to one channel.
std::vector<int16_t> downmix(std::span<const int16_t> interleaved, uint32_t channels);

// Linear interpolation of `in` onto exactly `out_len` samples spanning the same
// duration. Returns `in` unchanged when the lengths already match.
std::vector<int16_t> linear(std::span<const int16_t> in, size_t out_len);

// Native frames that make up block `index` of `block_ms` at `rate`. Rates that
// do not divide into whole blocks (11025 Hz at 20 ms is 220.5 frames) alternate
// so that blocks 0..n-1 always span floor(n * rate * block_ms / 1000) frames.
size_t frames_for(uint32_t rate, uint32_t block_ms, uint64_t index);

} // namespace resample
