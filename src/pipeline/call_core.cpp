#include "call_core.hpp"

#include "event_json.hpp"
#include "platform/platform_paths.hpp"

#include <filesystem>
#include <format>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;

CallCore::CallCore(Config config, bool verbose, const ClockAnchor& clock,
                   ModelResolver& resolver, CaptureSession::DeviceFactory factory,
                   Options options, std::FILE* out)
    : config_(std::move(config)), verbose_(verbose), options_(std::move(options)), out_(out),
      queue_(config_.queue.capacity,
             ChunkShape{.sample_rate = config_.audio.sample_rate,
                        .block_samples = config_.audio.block_samples()}),
      service_(config_, queue_, resolver, clock),
      session_(config_, clock, std::move(factory)) {}

CallCore::~CallCore() {
    if (in_call()) stop_call();
}

bool CallCore::init() {
    service_.init();
    log("decoder: " + service_.decoder_name());

    session_.add_callback([this](const AudioChunk& chunk) { on_audio(chunk); });
    service_.add_listener([this](const TranscriptChunk& chunk) { on_transcript(chunk); });

    if (!config_.storage.enabled) {
        log("transcript store disabled");
        return true;
    }

    std::string db_path = config_.storage.db_path;
    if (db_path.empty()) {
        auto data = platform::data_dir();
        db_path = data.empty() ? "/tmp/callscribe/transcripts.db" : data + "/transcripts.db";
    }
    if (!db_.open(db_path)) {
        std::println(stderr, "Warning: transcript DB failed to open, storage disabled");
    } else {
        log("transcripts stored in " + db_path);
    }
    return true;
}

std::string CallCore::start_call() {
    if (in_call()) return session_.call_id();

    // A previous stop closed the queue; accept chunks before the service binds.
    queue_.reopen();
    auto call_id = session_.start();

    if (!service_.start(call_id)) {
        std::println(stderr, "Failed to start transcription for {}", call_id);
        session_.stop();
        return {};
    }

    if (!options_.record_dir.empty() && !open_recorders(call_id)) {
        std::println(stderr, "Warning: recording to {} disabled", options_.record_dir);
    }

    log(std::format("call {} started", call_id));
    return call_id;
}

void CallCore::stop_call() {
    if (!in_call()) return;

    auto call_id = session_.call_id();
    session_.stop();
    service_.stop(call_id);
    close_recorders();

    auto sm = session_.get_metrics();
    auto tm = service_.get_metrics();

    if (db_.is_open()) {
        db_.record_session(SessionRecord{
            .call_id = call_id,
            .duration_s = sm.duration_s,
            .health = std::string(to_string(sm.health)),
            .decoder = tm.decoder,
            .windows = static_cast<int64_t>(tm.windows_emitted),
            .max_drift_ms = sm.max_drift_ms,
        });
    }

    log(std::format("call {} stopped after {:.1f}s ({})", call_id, sm.duration_s,
                    to_string(sm.health)));
}

bool CallCore::refresh_decoder() {
    if (config_.decoder.type == "simulated" || service_.decoder_is_real()) return false;
    if (!service_.refresh_decoder() || !service_.decoder_is_real()) return false;
    log("decoder: " + service_.decoder_name());
    return true;
}

void CallCore::on_audio(const AudioChunk& chunk) {
    if (auto res = queue_.push(chunk); !res) {
        std::println(stderr, "capture: chunk rejected: {}", to_string(res.error()));
        return;
    }

    std::lock_guard lock(recorders_mutex_);
    auto& rec = recorders_[source_index(chunk.source)];
    if (rec.is_open() && !rec.write(chunk.samples)) {
        std::println(stderr, "recorder: write failed for {}, closing", to_string(chunk.source));
        rec.close();
    }
}

void CallCore::on_transcript(const TranscriptChunk& chunk) {
    if (db_.is_open() && !chunk.text.empty()) db_.insert(chunk);

    if (!options_.print_transcripts) return;
    if (!options_.json_output && chunk.text.empty()) return;

    std::lock_guard lock(out_mutex_);
    if (options_.json_output) {
        nlohmann::json j = chunk;
        std::println(out_, "{}", j.dump());
    } else {
        std::println(out_, "[{:>10} {:8.2f}-{:8.2f}] ({:.2f}) {}", to_string(chunk.source),
                     chunk.ts_start_ms / 1000.0, chunk.ts_end_ms / 1000.0,
                     chunk.confidence, chunk.text);
    }
    std::fflush(out_);
}

bool CallCore::open_recorders(const std::string& call_id) {
    std::error_code ec;
    fs::create_directories(options_.record_dir, ec);
    if (ec) {
        std::println(stderr, "recorder: cannot create {}: {}", options_.record_dir, ec.message());
        return false;
    }

    std::lock_guard lock(recorders_mutex_);
    bool ok = true;
    for (auto source : kAllSources) {
        auto path = fs::path(options_.record_dir) / std::format("{}-{}.wav", call_id, to_string(source));
        if (!recorders_[source_index(source)].open(path.string(), config_.audio.sample_rate)) {
            std::println(stderr, "recorder: cannot open {}", path.string());
            ok = false;
            continue;
        }
        log("recording " + path.string());
    }
    return ok;
}

void CallCore::close_recorders() {
    std::lock_guard lock(recorders_mutex_);
    for (auto& rec : recorders_) rec.close();
}

void CallCore::print_metrics() {
    auto sm = session_.get_metrics();
    auto tm = service_.get_metrics();

    std::lock_guard lock(out_mutex_);
    if (options_.json_output) {
        nlohmann::json s = sm;
        nlohmann::json t = tm;
        std::println(out_, "{}", s.dump());
        std::println(out_, "{}", t.dump());
    } else {
        std::println(out_, "call {}: {} for {:.1f}s, health {}", sm.call_id,
                     sm.active ? "active" : "finished", sm.duration_s, to_string(sm.health));
        for (auto source : kAllSources) {
            size_t i = source_index(source);
            std::println(out_, "  {:>10}: {} chunks, native {} Hz{}", to_string(source),
                         sm.chunk_counts[i], sm.sample_rates[i],
                         sm.fallback[i] ? ", fallback" : "");
        }
        std::println(out_, "  drift: initial {} ms, max {} ms, {} violations",
                     sm.initial_drift_ms, sm.max_drift_ms, sm.drift_violations);
        std::println(out_, "  decoder {}: {} windows ({} short, {} failed), avg {:.1f} ms",
                     tm.decoder, tm.windows_emitted, tm.short_windows, tm.decode_failures,
                     tm.avg_decode_ms);
        std::println(out_, "  queue: {} dropped, emit latency {:.1f} ms",
                     tm.dropped_chunks, tm.avg_emit_latency_ms);
    }
    std::fflush(out_);
}

void CallCore::print_history(int limit) {
    auto records = db_.sessions(limit);

    std::lock_guard lock(out_mutex_);
    if (options_.json_output) {
        nlohmann::json arr = nlohmann::json::array();
        for (auto& r : records) {
            arr.push_back({
                {"call_id", r.call_id},
                {"started_at", r.started_at},
                {"duration_s", r.duration_s},
                {"health", r.health},
                {"decoder", r.decoder},
                {"windows", r.windows},
                {"max_drift_ms", r.max_drift_ms},
            });
        }
        std::println(out_, "{}", arr.dump());
        return;
    }

    if (records.empty()) {
        std::println(out_, "No calls recorded.");
        return;
    }
    for (auto& r : records) {
        std::println(out_, "{}  {}  {:.1f}s  {}  {} windows", r.started_at, r.call_id,
                     r.duration_s, r.health, r.windows);
        for (auto& t : db_.for_call(r.call_id)) {
            std::println(out_, "    [{:>10} {:8.2f}] {}", to_string(t.source),
                         t.ts_start_ms / 1000.0, t.text);
        }
    }
}

void CallCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[callscribe] {}", msg);
    }
}
