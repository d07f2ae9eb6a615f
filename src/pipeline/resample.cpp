#include "resample.hpp"

#include <algorithm>
#include <cmath>

namespace resample {

std::vector<int16_t> downmix(std::span<const int16_t> interleaved, uint32_t channels) {
    if (channels <= 1) return {interleaved.begin(), interleaved.end()};

    size_t frames = interleaved.size() / channels;
    std::vector<int16_t> mono(frames);
    for (size_t i = 0; i < frames; ++i) {
        int32_t sum = 0;
        for (uint32_t c = 0; c < channels; ++c) {
            sum += interleaved[i * channels + c];
        }
        mono[i] = static_cast<int16_t>(sum / static_cast<int32_t>(channels));
    }
    return mono;
}

std::vector<int16_t> linear(std::span<const int16_t> in, size_t out_len) {
    if (in.size() == out_len) return {in.begin(), in.end()};
    std::vector<int16_t> out(out_len, 0);
    if (in.empty() || out_len == 0) return out;
    if (in.size() == 1) {
        std::fill(out.begin(), out.end(), in[0]);
        return out;
    }

    double ratio = static_cast<double>(in.size()) / static_cast<double>(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        double pos = static_cast<double>(i) * ratio;
        auto idx = static_cast<size_t>(pos);
        if (idx >= in.size() - 1) {
            out[i] = in.back();
            continue;
        }
        double frac = pos - static_cast<double>(idx);
        double v = in[idx] + (in[idx + 1] - in[idx]) * frac;
        out[i] = static_cast<int16_t>(std::lround(v));
    }
    return out;
}

size_t frames_for(uint32_t rate, uint32_t block_ms, uint64_t index) {
    uint64_t per_block = static_cast<uint64_t>(rate) * block_ms;
    return static_cast<size_t>((index + 1) * per_block / 1000 - index * per_block / 1000);
}

} // namespace resample
