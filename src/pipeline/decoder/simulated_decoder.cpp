#include "simulated_decoder.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <string_view>

namespace {

constexpr std::array<std::string_view, 12> kPhrases = {
    "Good morning, how are you today?",
    "I'd like to know more about the product.",
    "What does the solution cost?",
    "Understood, thanks for the information.",
    "Can we schedule a demonstration?",
    "I need to check with our technical lead.",
    "The budget is approved for this quarter.",
    "When could we start the project?",
    "That fits within our budget.",
    "What is the implementation timeline?",
    "Do you offer technical support?",
    "What are the main benefits?",
};

} // namespace

SimulatedDecoder::SimulatedDecoder(double rms_threshold)
    : rms_threshold_(rms_threshold) {}

double SimulatedDecoder::rms(std::span<const int16_t> window) {
    if (window.empty()) return 0.0;
    double sum = 0.0;
    for (int16_t s : window) {
        sum += static_cast<double>(s) * s;
    }
    return std::sqrt(sum / static_cast<double>(window.size()));
}

DecodeResult SimulatedDecoder::decode(std::span<const int16_t> window, uint32_t /*sample_rate*/) {
    double level = rms(window);
    if (level < rms_threshold_) return {};

    // FNV-1a over the samples picks the phrase.
    uint64_t h = 1469598103934665603ull;
    for (int16_t s : window) {
        h ^= static_cast<uint16_t>(s);
        h *= 1099511628211ull;
    }

    // Louder windows read as clearer speech: 0.70 at the threshold, 0.95 at full scale.
    double t = std::clamp((level - rms_threshold_) / (32767.0 - rms_threshold_), 0.0, 1.0);
    return DecodeResult{
        .text = std::string(kPhrases[h % kPhrases.size()]),
        .confidence = static_cast<float>(0.70 + 0.25 * t),
    };
}
