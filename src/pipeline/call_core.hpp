#pragma once

#include "capture_session.hpp"
#include "clock_anchor.hpp"
#include "config.hpp"
#include "decoder/model_resolver.hpp"
#include "ingest_queue.hpp"
#include "storage/transcript_db.hpp"
#include "transcription_service.hpp"
#include "wav_encoder.hpp"

#include <array>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>

// Portable wiring of one call: capture session -> ingest queue ->
// transcription service -> transcript output, store and recordings.
class CallCore {
public:
    struct Options {
        bool json_output = false;
        bool print_transcripts = true;
        // Per-source WAV recordings of the captured audio; empty disables.
        std::string record_dir;
    };

    CallCore(Config config, bool verbose, const ClockAnchor& clock,
             ModelResolver& resolver, CaptureSession::DeviceFactory factory,
             Options options, std::FILE* out = stdout);
    ~CallCore();

    CallCore(const CallCore&) = delete;
    CallCore& operator=(const CallCore&) = delete;

    bool init();

    // Returns the call id, empty when the call could not be started.
    std::string start_call();
    void stop_call();
    bool in_call() const { return session_.is_active(); }

    // Retries model resolution while the simulated decoder stands in.
    // True when a real decoder was picked up.
    bool refresh_decoder();

    void print_metrics();
    void print_history(int limit);

    const Config& config() const { return config_; }
    CaptureSession& session() { return session_; }
    TranscriptionService& service() { return service_; }
    BoundedIngestQueue& queue() { return queue_; }
    TranscriptDb& db() { return db_; }

private:
    void on_audio(const AudioChunk& chunk);
    void on_transcript(const TranscriptChunk& chunk);
    bool open_recorders(const std::string& call_id);
    void close_recorders();
    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    Options options_;
    std::FILE* out_;

    BoundedIngestQueue queue_;
    TranscriptionService service_;
    CaptureSession session_;
    TranscriptDb db_;

    // Opened after the session has started, so the capture threads may already be writing.
    std::mutex recorders_mutex_;
    std::array<wav::FileWriter, 2> recorders_;
    std::mutex out_mutex_;
};
