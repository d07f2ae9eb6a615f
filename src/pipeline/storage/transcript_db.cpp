#include "transcript_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

namespace {

std::string get_text(sqlite3_stmt* stmt, int col) {
    auto* p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

} // namespace

TranscriptDb::TranscriptDb() = default;

TranscriptDb::~TranscriptDb() {
    close();
}

bool TranscriptDb::open(const std::string& path) {
    close();

    fs::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
    }

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        close();
        return false;
    }

    const char* insert_sql =
        "INSERT INTO transcripts (call_id, source, text, confidence, ts_start_ms, ts_end_ms) "
        "VALUES (?, ?, ?, ?, ?, ?)";

    const char* for_call_sql =
        "SELECT call_id, source, text, confidence, ts_start_ms, ts_end_ms "
        "FROM transcripts WHERE call_id = ? ORDER BY source, ts_start_ms, id";

    const char* session_sql =
        "INSERT INTO sessions (call_id, duration_s, health, decoder, windows, max_drift_ms) "
        "VALUES (?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(call_id) DO UPDATE SET duration_s = excluded.duration_s, "
        "health = excluded.health, decoder = excluded.decoder, "
        "windows = excluded.windows, max_drift_ms = excluded.max_drift_ms";

    const char* sessions_sql =
        "SELECT call_id, started_at, duration_s, health, decoder, windows, max_drift_ms "
        "FROM sessions ORDER BY started_at DESC, rowid DESC LIMIT ?";

    if (!prepare(insert_sql, &insert_stmt_, "insert") ||
        !prepare(for_call_sql, &for_call_stmt_, "for_call") ||
        !prepare(session_sql, &session_stmt_, "session") ||
        !prepare(sessions_sql, &sessions_stmt_, "sessions")) {
        close();
        return false;
    }

    return true;
}

bool TranscriptDb::prepare(const char* sql, sqlite3_stmt** stmt, const char* what) {
    if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare {} failed: {}", what, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

void TranscriptDb::close() {
    for (auto** stmt : {&insert_stmt_, &for_call_stmt_, &session_stmt_, &sessions_stmt_}) {
        if (*stmt) { sqlite3_finalize(*stmt); *stmt = nullptr; }
    }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool TranscriptDb::insert(const TranscriptChunk& chunk) {
    if (!insert_stmt_) return false;

    auto source = std::string(to_string(chunk.source));

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, chunk.call_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, source.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 3, chunk.text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(insert_stmt_, 4, chunk.confidence);
    sqlite3_bind_int64(insert_stmt_, 5, chunk.ts_start_ms);
    sqlite3_bind_int64(insert_stmt_, 6, chunk.ts_end_ms);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<TranscriptChunk> TranscriptDb::for_call(const std::string& call_id) {
    std::vector<TranscriptChunk> chunks;
    if (!for_call_stmt_) return chunks;

    sqlite3_reset(for_call_stmt_);
    sqlite3_bind_text(for_call_stmt_, 1, call_id.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(for_call_stmt_) == SQLITE_ROW) {
        auto source = parse_source(get_text(for_call_stmt_, 1));
        if (!source) continue;

        TranscriptChunk c;
        c.call_id = get_text(for_call_stmt_, 0);
        c.source = *source;
        c.text = get_text(for_call_stmt_, 2);
        c.confidence = static_cast<float>(sqlite3_column_double(for_call_stmt_, 3));
        c.ts_start_ms = sqlite3_column_int64(for_call_stmt_, 4);
        c.ts_end_ms = sqlite3_column_int64(for_call_stmt_, 5);
        chunks.push_back(std::move(c));
    }

    return chunks;
}

bool TranscriptDb::record_session(const SessionRecord& record) {
    if (!session_stmt_) return false;

    sqlite3_reset(session_stmt_);
    sqlite3_bind_text(session_stmt_, 1, record.call_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(session_stmt_, 2, record.duration_s);
    sqlite3_bind_text(session_stmt_, 3, record.health.c_str(), -1, SQLITE_TRANSIENT);
    if (record.decoder.empty()) sqlite3_bind_null(session_stmt_, 4);
    else sqlite3_bind_text(session_stmt_, 4, record.decoder.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(session_stmt_, 5, record.windows);
    sqlite3_bind_int64(session_stmt_, 6, record.max_drift_ms);

    int rc = sqlite3_step(session_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: record session failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<SessionRecord> TranscriptDb::sessions(int limit) {
    std::vector<SessionRecord> records;
    if (!sessions_stmt_) return records;

    sqlite3_reset(sessions_stmt_);
    sqlite3_bind_int(sessions_stmt_, 1, limit);

    while (sqlite3_step(sessions_stmt_) == SQLITE_ROW) {
        SessionRecord r;
        r.call_id = get_text(sessions_stmt_, 0);
        r.started_at = get_text(sessions_stmt_, 1);
        r.duration_s = sqlite3_column_double(sessions_stmt_, 2);
        r.health = get_text(sessions_stmt_, 3);
        r.decoder = get_text(sessions_stmt_, 4);
        r.windows = sqlite3_column_int64(sessions_stmt_, 5);
        r.max_drift_ms = sqlite3_column_int64(sessions_stmt_, 6);
        records.push_back(std::move(r));
    }

    return records;
}

bool TranscriptDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS transcripts (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            call_id TEXT NOT NULL,
            source TEXT NOT NULL,
            text TEXT NOT NULL,
            confidence REAL NOT NULL,
            ts_start_ms INTEGER NOT NULL,
            ts_end_ms INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS transcripts_call ON transcripts (call_id);
        CREATE TABLE IF NOT EXISTS sessions (
            call_id TEXT PRIMARY KEY,
            started_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            duration_s REAL,
            health TEXT,
            decoder TEXT,
            windows INTEGER,
            max_drift_ms INTEGER
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create tables failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
