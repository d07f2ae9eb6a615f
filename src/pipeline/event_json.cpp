#include "event_json.hpp"

using json = nlohmann::json;

namespace {

template <typename T>
json per_source(const std::array<T, 2>& values) {
    json j = json::object();
    for (auto source : kAllSources) {
        j[std::string(to_string(source))] = values[source_index(source)];
    }
    return j;
}

} // namespace

void to_json(json& j, const TranscriptChunk& chunk) {
    j = {
        {"type", "transcript"},
        {"call_id", chunk.call_id},
        {"source", std::string(to_string(chunk.source))},
        {"text", chunk.text},
        {"confidence", chunk.confidence},
        {"ts_start_ms", chunk.ts_start_ms},
        {"ts_end_ms", chunk.ts_end_ms},
    };
}

void to_json(json& j, const SessionMetrics& m) {
    j = {
        {"type", "session_metrics"},
        {"call_id", m.call_id},
        {"active", m.active},
        {"health", std::string(to_string(m.health))},
        {"sample_rates", per_source(m.sample_rates)},
        {"buffer_sizes", per_source(m.buffer_sizes)},
        {"chunk_counts", per_source(m.chunk_counts)},
        {"fallback", per_source(m.fallback)},
        {"initial_drift_ms", m.initial_drift_ms},
        {"sync_drift_ms", m.sync_drift_ms},
        {"max_drift_ms", m.max_drift_ms},
        {"drift_violations", m.drift_violations},
        {"callback_errors", m.callback_errors},
        {"duration_s", m.duration_s},
    };
}

void to_json(json& j, const ServiceMetrics& m) {
    j = {
        {"type", "service_metrics"},
        {"call_id", m.call_id},
        {"running", m.running},
        {"decoder", m.decoder},
        {"decoder_is_real", m.decoder_is_real},
        {"windows_emitted", m.windows_emitted},
        {"short_windows", m.short_windows},
        {"decode_failures", m.decode_failures},
        {"rejected_chunks", m.rejected_chunks},
        {"gap_samples_filled", m.gap_samples_filled},
        {"avg_decode_ms", m.avg_decode_ms},
        {"last_decode_ms", m.last_decode_ms},
        {"avg_emit_latency_ms", m.avg_emit_latency_ms},
        {"buffer_sizes", per_source(m.buffer_sizes)},
        {"samples_consumed", per_source(m.samples_consumed)},
        {"dropped_chunks", m.dropped_chunks},
        {"queue_depth", m.queue_depth},
    };
}
