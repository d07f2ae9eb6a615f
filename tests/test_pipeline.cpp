#include <catch2/catch_test_macros.hpp>

#include "call_core.hpp"
#include "clock_anchor.hpp"
#include "fakes.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct TmpDir {
    fs::path path;

    TmpDir() {
        path = fs::temp_directory_path() / ("cs_test_pipeline_" + std::to_string(getpid()));
        fs::create_directories(path);
    }

    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

std::vector<std::string> read_lines(std::FILE* f) {
    std::vector<std::string> lines;
    std::rewind(f);
    std::string line;
    int c;
    while ((c = std::fgetc(f)) != EOF) {
        if (c == '\n') {
            lines.push_back(line);
            line.clear();
        } else {
            line.push_back(static_cast<char>(c));
        }
    }
    return lines;
}

Config pipeline_config(const TmpDir& tmp) {
    Config config;
    config.queue.capacity = 64;
    config.transcription.window_seconds = 1.0;
    config.transcription.min_window_seconds = 0.2;
    config.decoder.type = "simulated";
    config.storage.db_path = (tmp.path / "transcripts.db").string();
    return config;
}

} // namespace

TEST_CASE("CallCore end to end", "[pipeline]") {
    TmpDir tmp;
    ClockAnchor clock;
    FakeResolver resolver;

    std::FILE* out = std::tmpfile();
    REQUIRE(out != nullptr);

    auto factory = [](AudioSource source) -> std::unique_ptr<AudioDevice> {
        FakeDevice::Script script;
        if (source == AudioSource::Loopback) {
            script.format = DeviceFormat{.sample_rate = 48000, .channels = 2};
        }
        return std::make_unique<FakeDevice>(script);
    };

    CallCore::Options options{
        .json_output = true,
        .print_transcripts = true,
        .record_dir = (tmp.path / "rec").string(),
    };

    std::string call_id;
    SessionMetrics sm;
    {
        CallCore core(pipeline_config(tmp), false, clock, resolver, factory, options, out);
        REQUIRE(core.init());
        REQUIRE(core.db().is_open());
        REQUIRE(core.service().decoder_name() == "simulated");

        call_id = core.start_call();
        REQUIRE_FALSE(call_id.empty());
        REQUIRE(core.in_call());
        REQUIRE(core.start_call() == call_id);

        std::this_thread::sleep_for(std::chrono::milliseconds(2500));
        core.stop_call();
        REQUIRE_FALSE(core.in_call());

        sm = core.session().get_metrics();
        REQUIRE(sm.call_id == call_id);
        REQUIRE(sm.health == SessionHealth::Healthy);
        REQUIRE(sm.sample_rates[source_index(AudioSource::Loopback)] == 48000);

        auto tm = core.service().get_metrics();
        REQUIRE(tm.rejected_chunks == 0);
        REQUIRE(tm.windows_emitted >= 4);

        // Stored rows only carry decoded text.
        {
            auto stored = core.db().for_call(call_id);
            REQUIRE_FALSE(stored.empty());
            for (auto& t : stored) {
                REQUIRE(t.call_id == call_id);
                REQUIRE_FALSE(t.text.empty());
            }

            auto sessions = core.db().sessions(1);
            REQUIRE(sessions.size() == 1);
            REQUIRE(sessions[0].call_id == call_id);
            REQUIRE(sessions[0].health == "healthy");
            REQUIRE(sessions[0].decoder == "simulated");
            REQUIRE(sessions[0].windows == static_cast<int64_t>(tm.windows_emitted));
        }
    }

    // Every window, including empty ones, reaches the JSON stream.
    {
        std::map<AudioSource, std::vector<TranscriptChunk>> by_source;
        for (auto& line : read_lines(out)) {
            auto j = nlohmann::json::parse(line);
            REQUIRE(j["type"] == "transcript");
            REQUIRE(j["call_id"] == call_id);
            auto source = parse_source(j["source"].get<std::string>());
            REQUIRE(source.has_value());
            by_source[*source].push_back(TranscriptChunk{
                .call_id = call_id,
                .source = *source,
                .text = j["text"].get<std::string>(),
                .confidence = j["confidence"].get<float>(),
                .ts_start_ms = j["ts_start_ms"].get<int64_t>(),
                .ts_end_ms = j["ts_end_ms"].get<int64_t>(),
            });
        }

        for (auto source : kAllSources) {
            auto& windows = by_source[source];
            REQUIRE_FALSE(windows.empty());

            // Windows arrive in order and each starts before the previous ends.
            for (size_t i = 1; i < windows.size(); ++i) {
                REQUIRE(windows[i].ts_start_ms > windows[i - 1].ts_start_ms);
                REQUIRE(windows[i].ts_start_ms <= windows[i - 1].ts_end_ms);
            }

            int64_t span = windows.back().ts_end_ms - windows.front().ts_start_ms;
            auto expected = static_cast<int64_t>(sm.chunk_counts[source_index(source)]) * 20;
            REQUIRE(std::abs(span - expected) <= 20);
        }

        // Both sources share one anchor, so their timelines start together.
        REQUIRE(std::abs(by_source[AudioSource::Microphone].front().ts_start_ms -
                         by_source[AudioSource::Loopback].front().ts_start_ms) <= 20);
    }

    {
        for (auto source : kAllSources) {
            auto path = fs::path(options.record_dir) /
                        (call_id + "-" + std::string(to_string(source)) + ".wav");
            REQUIRE(fs::exists(path));
            auto size = fs::file_size(path);
            REQUIRE(size > 44);
            REQUIRE((size - 44) % 640 == 0);
        }
    }

    std::fclose(out);
}

TEST_CASE("CallCore without storage", "[pipeline]") {
    TmpDir tmp;
    ClockAnchor clock;
    FakeResolver resolver;
    std::FILE* out = std::tmpfile();
    REQUIRE(out != nullptr);

    auto config = pipeline_config(tmp);
    config.storage.enabled = false;

    // No endpoints at all: the call still runs on silence and is reported failed.
    CallCore core(config, false, clock, resolver, [](AudioSource) { return std::unique_ptr<AudioDevice>{}; },
                  CallCore::Options{.json_output = false}, out);
    REQUIRE(core.init());
    REQUIRE_FALSE(core.db().is_open());

    auto call_id = core.start_call();
    REQUIRE_FALSE(call_id.empty());
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    core.stop_call();

    auto sm = core.session().get_metrics();
    REQUIRE(sm.health == SessionHealth::Failed);
    REQUIRE(sm.chunk_counts[0] > 0);
    REQUIRE(sm.chunk_counts[1] > 0);

    // Silence decodes to nothing, and plain-text output skips empty windows.
    REQUIRE(read_lines(out).empty());
    std::fclose(out);
}

TEST_CASE("CallCore decoder refresh", "[pipeline]") {
    TmpDir tmp;
    ClockAnchor clock;
    FakeResolver resolver;
    std::FILE* out = std::tmpfile();
    REQUIRE(out != nullptr);

    auto config = pipeline_config(tmp);
    config.storage.enabled = false;
    config.decoder.type = "lan";

    CallCore core(config, false, clock, resolver, [](AudioSource) { return std::unique_ptr<AudioDevice>{}; },
                  CallCore::Options{}, out);
    REQUIRE(core.init());
    REQUIRE(core.service().decoder_name() == "simulated");

    SECTION("StaysSimulatedWhileUnavailable") {
        REQUIRE_FALSE(core.refresh_decoder());
        REQUIRE_FALSE(core.service().decoder_is_real());
    }

    SECTION("PicksUpModelOnceServed") {
        auto decoded = std::make_shared<CountingDecoder::Log>();
        resolver.set([decoded] { return std::make_unique<CountingDecoder>(decoded); });
        REQUIRE(core.refresh_decoder());
        REQUIRE(core.service().decoder_name() == "counting");

        // A real decoder is never re-resolved.
        auto calls = resolver.calls;
        REQUIRE_FALSE(core.refresh_decoder());
        REQUIRE(resolver.calls == calls);
    }

    std::fclose(out);
}

TEST_CASE("CallCore refresh with simulated decoder configured", "[pipeline]") {
    TmpDir tmp;
    ClockAnchor clock;
    FakeResolver resolver;
    auto config = pipeline_config(tmp);
    config.storage.enabled = false;

    CallCore core(config, false, clock, resolver, [](AudioSource) { return std::unique_ptr<AudioDevice>{}; },
                  CallCore::Options{}, stdout);
    REQUIRE(core.init());
    auto calls = resolver.calls;
    REQUIRE_FALSE(core.refresh_decoder());
    REQUIRE(resolver.calls == calls);
}
