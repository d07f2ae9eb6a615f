#include <catch2/catch_test_macros.hpp>

#include "clock_anchor.hpp"
#include "fakes.hpp"
#include "source_capture.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

using namespace std::chrono_literals;

namespace {

// Thread-safe chunk collector used as the capture sink. With a clock it also
// records when each chunk arrived.
struct Collected {
    std::mutex mutex;
    std::vector<AudioChunk> chunks;
    std::vector<int64_t> arrivals;
    const ClockAnchor* clock = nullptr;

    SourceCapture::ChunkSink sink() {
        return [this](AudioChunk c) {
            std::lock_guard lock(mutex);
            if (clock) arrivals.push_back(clock->now_ms());
            chunks.push_back(std::move(c));
        };
    }

    size_t size() {
        std::lock_guard lock(mutex);
        return chunks.size();
    }

    std::vector<AudioChunk> snapshot() {
        std::lock_guard lock(mutex);
        return chunks;
    }
};

void require_contiguous(const std::vector<AudioChunk>& chunks) {
    REQUIRE_FALSE(chunks.empty());
    for (size_t i = 1; i < chunks.size(); ++i) {
        REQUIRE(chunks[i].timestamp_ms - chunks[i - 1].timestamp_ms == 20);
    }
}

SourceCapture::Options fast_timeout() {
    return SourceCapture::Options{.sample_rate = 16000, .block_ms = 20, .read_timeout = 100ms};
}

} // namespace

TEST_CASE("SourceCapture", "[capture]") {
    ClockAnchor clock;
    Collected out;

    SECTION("NoDeviceStreamsSilence") {
        SourceCapture cap(AudioSource::Loopback, nullptr, clock, {});
        REQUIRE(cap.state() == CaptureState::Idle);
        REQUIRE(cap.t0_ms() == -1);
        REQUIRE(cap.start("call-1", out.sink()));

        REQUIRE(wait_until([&] { return out.size() >= 5; }));
        REQUIRE(cap.state() == CaptureState::Fallback);
        REQUIRE(cap.in_fallback());
        REQUIRE(cap.fallback_reason() == "no device");
        REQUIRE_FALSE(cap.device_format().has_value());
        cap.stop();

        auto chunks = out.snapshot();
        for (auto& c : chunks) {
            REQUIRE(c.call_id == "call-1");
            REQUIRE(c.source == AudioSource::Loopback);
            REQUIRE(c.samples.size() == 320);
            REQUIRE(c.sample_rate == 16000);
            REQUIRE(c.channel_count == 1);
            for (auto s : c.samples) REQUIRE(s == 0);
        }
        REQUIRE(chunks.front().timestamp_ms == cap.t0_ms());
        require_contiguous(chunks);
    }

    SECTION("FallbackKeepsWallClockCadence") {
        SourceCapture cap(AudioSource::Microphone, nullptr, clock, {});
        REQUIRE(cap.start("call-1", out.sink()));
        std::this_thread::sleep_for(300ms);
        cap.stop();

        // About 15 blocks in 300 ms; never a burst ahead of the clock.
        auto n = out.size();
        REQUIRE(n >= 8);
        REQUIRE(n <= 17);
        REQUIRE(cap.last_timestamp_ms() <= clock.now_ms());
    }

    SECTION("StreamsResampledBlocks") {
        auto probe = std::make_shared<FakeDeviceProbe>();
        auto dev = std::make_unique<FakeDevice>(
            FakeDevice::Script{.format = {.sample_rate = 48000, .channels = 2}}, probe);
        SourceCapture cap(AudioSource::Microphone, std::move(dev), clock, {});
        REQUIRE(cap.start("call-2", out.sink()));

        REQUIRE(wait_until([&] { return out.size() >= 10; }));
        REQUIRE(cap.state() == CaptureState::Streaming);
        REQUIRE_FALSE(cap.in_fallback());
        auto fmt = cap.device_format();
        REQUIRE(fmt.has_value());
        REQUIRE(fmt->sample_rate == 48000);
        REQUIRE(fmt->channels == 2);
        cap.stop();

        REQUIRE(cap.state() == CaptureState::Closed);
        REQUIRE(probe->opens == 1);
        REQUIRE(probe->closes == 1);

        auto chunks = out.snapshot();
        bool any_signal = false;
        for (auto& c : chunks) {
            REQUIRE(c.samples.size() == 320);
            REQUIRE(c.sample_rate == 16000);
            for (auto s : c.samples) any_signal |= (s != 0);
        }
        REQUIRE(any_signal);
        require_contiguous(chunks);
        REQUIRE(cap.samples_consumed() == cap.chunks_emitted() * 320);
    }

    SECTION("FractionalRateKeepsNativePhase") {
        // 220.5 native frames per block; rounding each block would read 221.
        auto probe = std::make_shared<FakeDeviceProbe>();
        auto dev = std::make_unique<FakeDevice>(
            FakeDevice::Script{.format = {.sample_rate = 11025, .channels = 1}, .paced = false}, probe);
        SourceCapture cap(AudioSource::Microphone, std::move(dev), clock, {});
        REQUIRE(cap.start("call-13", out.sink()));
        REQUIRE(wait_until([&] { return out.size() >= 600; }));
        cap.stop();

        uint64_t n = cap.chunks_emitted();
        uint64_t delivered = probe->delivered.load();
        REQUIRE(delivered >= n * 11025 * 20 / 1000);
        REQUIRE(delivered <= (n + 1) * 11025 * 20 / 1000);
        for (auto& c : out.snapshot()) REQUIRE(c.samples.size() == 320);
    }

    SECTION("OpenFailureFallsBack") {
        auto dev = std::make_unique<FakeDevice>(FakeDevice::Script{.fail_open = true});
        SourceCapture cap(AudioSource::Microphone, std::move(dev), clock, {});
        REQUIRE(cap.start("call-3", out.sink()));

        REQUIRE(wait_until([&] { return out.size() >= 3; }));
        REQUIRE(cap.in_fallback());
        REQUIRE(cap.fallback_reason().find("open failed") != std::string::npos);
        cap.stop();
    }

    SECTION("UnsupportedFormatFallsBack") {
        auto probe = std::make_shared<FakeDeviceProbe>();
        auto dev = std::make_unique<FakeDevice>(
            FakeDevice::Script{.format = {.sample_rate = 4000, .channels = 1}}, probe);
        SourceCapture cap(AudioSource::Loopback, std::move(dev), clock, {});
        REQUIRE(cap.start("call-4", out.sink()));

        REQUIRE(wait_until([&] { return out.size() >= 3; }));
        REQUIRE(cap.in_fallback());
        REQUIRE(cap.fallback_reason().find("unsupported format") != std::string::npos);
        REQUIRE(probe->closes == 1);
        cap.stop();
    }

    SECTION("StallDemotesAndSkipsMissedSpan") {
        auto dev = std::make_unique<FakeDevice>(FakeDevice::Script{.stall_after = 5 * 320});
        SourceCapture cap(AudioSource::Microphone, std::move(dev), clock, fast_timeout());
        REQUIRE(cap.start("call-5", out.sink()));

        REQUIRE(wait_until([&] { return out.size() >= 12; }));
        REQUIRE(cap.in_fallback());
        REQUIRE(cap.fallback_reason().find("timed out") != std::string::npos);
        cap.stop();

        auto chunks = out.snapshot();
        for (size_t i = 0; i < 5; ++i) {
            bool any = false;
            for (auto s : chunks[i].samples) any |= (s != 0);
            REQUIRE(any);
        }
        for (auto s : chunks.back().samples) REQUIRE(s == 0);

        // One forward jump where the read timed out, block aligned and covering
        // the skipped samples; contiguous on both sides.
        int jumps = 0;
        for (size_t i = 1; i < chunks.size(); ++i) {
            auto step = chunks[i].timestamp_ms - chunks[i - 1].timestamp_ms;
            if (step == 20) continue;
            ++jumps;
            REQUIRE(i == 5);
            REQUIRE(step % 20 == 0);
            REQUIRE(static_cast<uint64_t>(step - 20) * 16 == cap.samples_skipped());
        }
        REQUIRE(jumps == 1);
        REQUIRE(cap.samples_skipped() >= 3 * 320);
        REQUIRE(cap.samples_consumed() == cap.chunks_emitted() * 320 + cap.samples_skipped());
    }

    SECTION("FallbackResumesAtWallClock") {
        // Default 500 ms read timeout: replaying the missed span would emit
        // about 25 blocks at once.
        out.clock = &clock;
        auto dev = std::make_unique<FakeDevice>(FakeDevice::Script{.stall_after = 10 * 320});
        SourceCapture cap(AudioSource::Loopback, std::move(dev), clock, {});
        REQUIRE(cap.start("call-11", out.sink()));

        REQUIRE(wait_until([&] { return cap.in_fallback() && out.size() >= 20; }));
        cap.stop();

        std::lock_guard lock(out.mutex);
        REQUIRE(out.arrivals.size() == out.chunks.size());
        for (size_t i = 0; i < out.chunks.size(); ++i) {
            REQUIRE(out.arrivals[i] - out.chunks[i].timestamp_ms <= 60);
        }
        REQUIRE(cap.samples_skipped() >= 20 * 320);
    }

    SECTION("ReadErrorDemotes") {
        auto dev = std::make_unique<FakeDevice>(
            FakeDevice::Script{.stall_after = 3 * 320, .error_on_stall = true});
        SourceCapture cap(AudioSource::Loopback, std::move(dev), clock, fast_timeout());
        REQUIRE(cap.start("call-6", out.sink()));

        REQUIRE(wait_until([&] { return out.size() >= 6; }));
        REQUIRE(cap.in_fallback());
        REQUIRE(cap.fallback_reason().find("device vanished") != std::string::npos);
        cap.stop();
        require_contiguous(out.snapshot());
    }

    SECTION("DemoteOnRequest") {
        auto dev = std::make_unique<FakeDevice>(FakeDevice::Script{});
        SourceCapture cap(AudioSource::Microphone, std::move(dev), clock, {});
        REQUIRE(cap.start("call-7", out.sink()));
        REQUIRE(wait_until([&] { return out.size() >= 3; }));
        REQUIRE_FALSE(cap.in_fallback());

        cap.demote("operator request");
        REQUIRE(wait_until([&] { return cap.state() == CaptureState::Fallback; }));
        size_t at_demote = out.size();
        REQUIRE(wait_until([&] { return out.size() >= at_demote + 3; }));
        REQUIRE(cap.fallback_reason() == "operator request");
        cap.stop();

        // Fallback state survives stop for metrics.
        REQUIRE(cap.in_fallback());
        require_contiguous(out.snapshot());
    }

    SECTION("DemoteWhileOpeningIsApplied") {
        auto probe = std::make_shared<FakeDeviceProbe>();
        auto dev = std::make_unique<FakeDevice>(FakeDevice::Script{.open_delay = 150ms}, probe);
        SourceCapture cap(AudioSource::Loopback, std::move(dev), clock, {});
        REQUIRE(cap.start("call-12", out.sink()));

        REQUIRE(wait_until([&] { return probe->opens.load() == 1; }));
        REQUIRE(cap.state() == CaptureState::Opening);
        cap.demote("muted before open");

        REQUIRE(wait_until([&] { return cap.state() == CaptureState::Fallback; }));
        REQUIRE(cap.fallback_reason() == "muted before open");
        REQUIRE(wait_until([&] { return out.size() >= 3; }));
        cap.stop();

        REQUIRE(probe->closes == 1);
        for (auto& c : out.snapshot()) {
            for (auto s : c.samples) REQUIRE(s == 0);
        }
    }

    SECTION("StopIsIdempotent") {
        SourceCapture cap(AudioSource::Microphone, nullptr, clock, {});
        cap.stop();
        REQUIRE(cap.state() == CaptureState::Idle);

        REQUIRE(cap.start("call-8", out.sink()));
        REQUIRE_FALSE(cap.start("call-8", out.sink()));
        cap.stop();
        cap.stop();
        REQUIRE(cap.state() == CaptureState::Closed);
    }

    SECTION("RestartResetsCounters") {
        SourceCapture cap(AudioSource::Microphone, nullptr, clock, {});
        REQUIRE(cap.start("call-9", out.sink()));
        REQUIRE(wait_until([&] { return out.size() >= 3; }));
        cap.stop();

        Collected second;
        REQUIRE(cap.start("call-10", second.sink()));
        REQUIRE(wait_until([&] { return second.size() >= 2; }));
        cap.stop();

        auto chunks = second.snapshot();
        REQUIRE(chunks.front().call_id == "call-10");
        REQUIRE(chunks.front().timestamp_ms == cap.t0_ms());
        REQUIRE(cap.chunks_emitted() == chunks.size());
    }

    SECTION("StateNames") {
        REQUIRE(to_string(CaptureState::Streaming) == "streaming");
        REQUIRE(to_string(CaptureState::Fallback) == "fallback");
        REQUIRE(to_string(CaptureState::Closed) == "closed");
    }
}
