#include "history_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

namespace {

constexpr const char* columns =
    "id, timestamp, path, duration_ms, stop_reason, transcript, backend, audio_kept";

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

} // namespace

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    std::string find_sql = std::string("SELECT ") + columns +
                           " FROM recordings WHERE path = ? ORDER BY id DESC LIMIT 1";
    std::string recent_sql = std::string("SELECT ") + columns +
                             " FROM recordings ORDER BY id DESC LIMIT ?";

    return prepare("INSERT INTO recordings (path, duration_ms, stop_reason) VALUES (?, ?, ?)",
                   &insert_stmt_, "insert") &&
           prepare("UPDATE recordings SET transcript = ?, backend = ? WHERE path = ?",
                   &transcript_stmt_, "transcript") &&
           prepare("UPDATE recordings SET audio_kept = 0 WHERE path = ?",
                   &removed_stmt_, "removed") &&
           prepare(find_sql.c_str(), &find_stmt_, "find") &&
           prepare(recent_sql.c_str(), &recent_stmt_, "recent");
}

void HistoryDb::close() {
    for (auto** stmt : {&insert_stmt_, &transcript_stmt_, &removed_stmt_, &find_stmt_, &recent_stmt_}) {
        if (*stmt) { sqlite3_finalize(*stmt); *stmt = nullptr; }
    }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::insert_recording(const std::string& path, int64_t duration_ms,
                                 const std::string& stop_reason) {
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(insert_stmt_, 2, duration_ms);
    sqlite3_bind_text(insert_stmt_, 3, stop_reason.c_str(), -1, SQLITE_TRANSIENT);
    return step_done(insert_stmt_, "insert");
}

bool HistoryDb::set_transcript(const std::string& path, const std::string& transcript,
                               const std::string& backend) {
    if (!transcript_stmt_) return false;

    sqlite3_reset(transcript_stmt_);
    sqlite3_bind_text(transcript_stmt_, 1, transcript.c_str(), -1, SQLITE_TRANSIENT);
    if (backend.empty()) sqlite3_bind_null(transcript_stmt_, 2);
    else sqlite3_bind_text(transcript_stmt_, 2, backend.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(transcript_stmt_, 3, path.c_str(), -1, SQLITE_TRANSIENT);
    if (!step_done(transcript_stmt_, "transcript")) return false;
    return sqlite3_changes(db_) > 0;
}

bool HistoryDb::mark_audio_removed(const std::string& path) {
    if (!removed_stmt_) return false;

    sqlite3_reset(removed_stmt_);
    sqlite3_bind_text(removed_stmt_, 1, path.c_str(), -1, SQLITE_TRANSIENT);
    return step_done(removed_stmt_, "removed");
}

std::optional<HistoryEntry> HistoryDb::find(const std::string& path) {
    if (!find_stmt_) return std::nullopt;

    sqlite3_reset(find_stmt_);
    sqlite3_bind_text(find_stmt_, 1, path.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(find_stmt_) != SQLITE_ROW) return std::nullopt;
    return read_row(find_stmt_);
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
    std::vector<HistoryEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        entries.push_back(read_row(recent_stmt_));
    }
    return entries;
}

HistoryEntry HistoryDb::read_row(sqlite3_stmt* stmt) {
    HistoryEntry e;
    e.id = sqlite3_column_int64(stmt, 0);
    e.timestamp = column_text(stmt, 1);
    e.path = column_text(stmt, 2);
    e.duration_ms = sqlite3_column_int64(stmt, 3);
    e.stop_reason = column_text(stmt, 4);
    e.transcript = column_text(stmt, 5);
    e.backend = column_text(stmt, 6);
    e.audio_kept = sqlite3_column_int(stmt, 7) != 0;
    return e;
}

bool HistoryDb::prepare(const char* sql, sqlite3_stmt** stmt, const char* what) {
    if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare {} failed: {}", what, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool HistoryDb::step_done(sqlite3_stmt* stmt, const char* what) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: {} failed: {}", what, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS recordings (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            path TEXT NOT NULL,
            duration_ms INTEGER NOT NULL DEFAULT 0,
            stop_reason TEXT NOT NULL DEFAULT 'manual',
            transcript TEXT,
            backend TEXT,
            audio_kept INTEGER NOT NULL DEFAULT 1
        );
        CREATE INDEX IF NOT EXISTS recordings_path ON recordings(path);
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
