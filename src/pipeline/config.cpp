#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

size_t Config::step_samples() const {
    double overlap = std::clamp(transcription.overlap_fraction, 0.0, 0.9);
    auto step = static_cast<size_t>(std::lround(static_cast<double>(window_samples()) * (1.0 - overlap)));
    return std::max<size_t>(step, 1);
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("block_ms")) cfg.audio.block_ms = a["block_ms"].get<uint32_t>();
            if (a.contains("read_timeout_ms")) cfg.audio.read_timeout_ms = a["read_timeout_ms"].get<uint32_t>();
            if (a.contains("microphone_target")) cfg.audio.microphone_target = a["microphone_target"].get<std::string>();
            if (a.contains("loopback_target")) cfg.audio.loopback_target = a["loopback_target"].get<std::string>();
        }

        if (j.contains("sync")) {
            auto& s = j["sync"];
            if (s.contains("max_drift_ms")) cfg.sync.max_drift_ms = s["max_drift_ms"].get<int64_t>();
        }

        if (j.contains("queue")) {
            auto& q = j["queue"];
            if (q.contains("capacity")) cfg.queue.capacity = q["capacity"].get<size_t>();
            if (q.contains("poll_interval_ms")) cfg.queue.poll_interval_ms = q["poll_interval_ms"].get<uint32_t>();
        }

        if (j.contains("transcription")) {
            auto& t = j["transcription"];
            if (t.contains("window_seconds")) cfg.transcription.window_seconds = t["window_seconds"].get<double>();
            if (t.contains("overlap_fraction")) cfg.transcription.overlap_fraction = t["overlap_fraction"].get<double>();
            if (t.contains("min_window_seconds")) cfg.transcription.min_window_seconds = t["min_window_seconds"].get<double>();
            if (t.contains("model")) cfg.transcription.model = t["model"].get<std::string>();
            if (t.contains("fallback_models")) {
                cfg.transcription.fallback_models = t["fallback_models"].get<std::vector<std::string>>();
            }
        }

        if (j.contains("decoder")) {
            auto& d = j["decoder"];
            if (d.contains("type")) cfg.decoder.type = d["type"].get<std::string>();
            if (d.contains("url")) cfg.decoder.url = d["url"].get<std::string>();
            if (d.contains("api_format")) cfg.decoder.api_format = d["api_format"].get<std::string>();
            if (d.contains("language")) cfg.decoder.language = d["language"].get<std::string>();
            if (d.contains("timeout_s")) cfg.decoder.timeout_s = d["timeout_s"].get<uint32_t>();
            if (d.contains("probe_timeout_ms")) cfg.decoder.probe_timeout_ms = d["probe_timeout_ms"].get<uint32_t>();
            if (d.contains("warmup")) cfg.decoder.warmup = d["warmup"].get<bool>();
        }

        if (j.contains("storage")) {
            auto& s = j["storage"];
            if (s.contains("enabled")) cfg.storage.enabled = s["enabled"].get<bool>();
            if (s.contains("db_path")) cfg.storage.db_path = s["db_path"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    if (cfg.queue.capacity == 0) {
        std::println(stderr, "config: queue.capacity must be positive, using 8");
        cfg.queue.capacity = 8;
    }
    if (cfg.audio.block_ms == 0 || cfg.audio.sample_rate == 0) {
        std::println(stderr, "config: invalid audio block, using defaults");
        cfg.audio = Config::Audio{};
    }

    auto& t = cfg.transcription;
    const Config::Transcription defaults;
    // Shorter than one block never fills; NaN fails every comparison.
    double block_s = static_cast<double>(cfg.audio.block_ms) / 1000.0;
    if (!(t.window_seconds >= block_s && t.window_seconds <= 60.0)) {
        std::println(stderr, "config: transcription.window_seconds {} out of range, using {}",
                     t.window_seconds, defaults.window_seconds);
        t.window_seconds = defaults.window_seconds;
    }
    if (!(t.overlap_fraction >= 0.0 && t.overlap_fraction <= 0.9)) {
        std::println(stderr, "config: transcription.overlap_fraction {} out of range, using {}",
                     t.overlap_fraction, defaults.overlap_fraction);
        t.overlap_fraction = defaults.overlap_fraction;
    }
    if (!(t.min_window_seconds >= 0.0 && t.min_window_seconds <= t.window_seconds)) {
        double fallback = std::min(defaults.min_window_seconds, t.window_seconds);
        std::println(stderr, "config: transcription.min_window_seconds {} out of range, using {}",
                     t.min_window_seconds, fallback);
        t.min_window_seconds = fallback;
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
