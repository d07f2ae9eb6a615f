#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t block_ms = 20;
        uint32_t read_timeout_ms = 500;
        // PipeWire target node names; empty means the default source/sink.
        std::string microphone_target;
        std::string loopback_target;

        size_t block_samples() const {
            return static_cast<size_t>(sample_rate) * block_ms / 1000;
        }
    } audio;

    struct Sync {
        int64_t max_drift_ms = 20;
    } sync;

    struct Queue {
        size_t capacity = 8;
        uint32_t poll_interval_ms = 50;
    } queue;

    struct Transcription {
        double window_seconds = 3.0;
        double overlap_fraction = 0.1;
        double min_window_seconds = 0.5;
        std::string model = "whisper-base";
        // Tried in order when `model` cannot be resolved.
        std::vector<std::string> fallback_models{"whisper-tiny"};
    } transcription;

    struct Decoder {
        std::string type = "lan"; // "lan" or "simulated"
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string language = "en";
        uint32_t timeout_s = 30;
        uint32_t probe_timeout_ms = 1500;
        // One silent decode after resolving, so the first real window does not pay for model load.
        bool warmup = true;
    } decoder;

    struct Storage {
        bool enabled = true;
        std::string db_path; // empty: <data dir>/transcripts.db
    } storage;

    // Computed from transcription and audio settings (no independent config keys).
    // load() validates the durations; negatives set in code clamp to zero.
    size_t window_samples() const {
        return static_cast<size_t>(std::max(transcription.window_seconds, 0.0) * audio.sample_rate);
    }
    size_t step_samples() const;
    size_t min_window_samples() const {
        return static_cast<size_t>(std::max(transcription.min_window_seconds, 0.0) * audio.sample_rate);
    }

    static Config load(const std::string& path);
    static Config load_default();
};
