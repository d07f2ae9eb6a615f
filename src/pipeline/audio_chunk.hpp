#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class AudioSource : uint8_t { Microphone = 0, Loopback = 1 };

inline constexpr std::array<AudioSource, 2> kAllSources = {
    AudioSource::Microphone, AudioSource::Loopback,
};

// Index into per-source arrays. Only valid for a validated source.
inline constexpr size_t source_index(AudioSource s) { return static_cast<size_t>(s); }

bool is_valid_source(AudioSource s);
std::string_view to_string(AudioSource s);
// Accepts "microphone", "mic" and "loopback".
std::optional<AudioSource> parse_source(std::string_view name);

// One fixed-duration block of mono audio from one source.
struct AudioChunk {
    std::string call_id;
    AudioSource source = AudioSource::Microphone;
    int64_t timestamp_ms = 0;
    std::vector<int16_t> samples;
    uint32_t sample_rate = 16000;
    uint32_t channel_count = 1;
};

// One decoded window.
struct TranscriptChunk {
    std::string call_id;
    AudioSource source = AudioSource::Microphone;
    std::string text;
    float confidence = 0.0f;
    int64_t ts_start_ms = 0;
    int64_t ts_end_ms = 0;
};

enum class ValidationError {
    InvalidSource,
    WrongChannelCount,
    WrongSampleRate,
    WrongBlockSize,
};

std::string_view to_string(ValidationError e);

// Shape expected of every chunk crossing the queue/service boundary.
struct ChunkShape {
    uint32_t sample_rate = 16000;
    size_t block_samples = 320;
};

std::optional<ValidationError> validate_chunk(const AudioChunk& chunk, const ChunkShape& shape);
