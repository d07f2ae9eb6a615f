#pragma once

#include "../audio_chunk.hpp"

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct SessionRecord {
    std::string call_id;
    std::string started_at;
    double duration_s = 0.0;
    std::string health;
    std::string decoder;
    int64_t windows = 0;
    int64_t max_drift_ms = 0;
};

// Persists transcript events and per-call summaries, keyed by call_id.
class TranscriptDb {
public:
    TranscriptDb();
    ~TranscriptDb();

    TranscriptDb(const TranscriptDb&) = delete;
    TranscriptDb& operator=(const TranscriptDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const TranscriptChunk& chunk);
    // Window order: by source, then start timestamp.
    std::vector<TranscriptChunk> for_call(const std::string& call_id);

    // Inserts or replaces the summary row for record.call_id.
    bool record_session(const SessionRecord& record);
    // Most recent first.
    std::vector<SessionRecord> sessions(int limit = 10);

private:
    bool create_tables();
    bool prepare(const char* sql, sqlite3_stmt** stmt, const char* what);

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* for_call_stmt_ = nullptr;
    sqlite3_stmt* session_stmt_ = nullptr;
    sqlite3_stmt* sessions_stmt_ = nullptr;
};
