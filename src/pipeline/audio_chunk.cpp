#include "audio_chunk.hpp"

bool is_valid_source(AudioSource s) {
    return s == AudioSource::Microphone || s == AudioSource::Loopback;
}

std::string_view to_string(AudioSource s) {
    switch (s) {
        case AudioSource::Microphone: return "microphone";
        case AudioSource::Loopback: return "loopback";
    }
    return "invalid";
}

std::optional<AudioSource> parse_source(std::string_view name) {
    if (name == "microphone" || name == "mic") return AudioSource::Microphone;
    if (name == "loopback") return AudioSource::Loopback;
    return std::nullopt;
}

std::string_view to_string(ValidationError e) {
    switch (e) {
        case ValidationError::InvalidSource: return "invalid_source";
        case ValidationError::WrongChannelCount: return "wrong_channel_count";
        case ValidationError::WrongSampleRate: return "wrong_sample_rate";
        case ValidationError::WrongBlockSize: return "wrong_block_size";
    }
    return "unknown";
}

std::optional<ValidationError> validate_chunk(const AudioChunk& chunk, const ChunkShape& shape) {
    if (!is_valid_source(chunk.source)) return ValidationError::InvalidSource;
    if (chunk.channel_count != 1) return ValidationError::WrongChannelCount;
    if (chunk.sample_rate != shape.sample_rate) return ValidationError::WrongSampleRate;
    if (chunk.samples.size() != shape.block_samples) return ValidationError::WrongBlockSize;
    return std::nullopt;
}
