#pragma once

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    std::string path;
    int64_t duration_ms;
    std::string stop_reason;
    std::string transcript;
    std::string backend;
    bool audio_kept;
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert_recording(const std::string& path, int64_t duration_ms,
                          const std::string& stop_reason);
    bool set_transcript(const std::string& path, const std::string& transcript,
                        const std::string& backend);
    bool mark_audio_removed(const std::string& path);

    std::optional<HistoryEntry> find(const std::string& path);
    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();
    bool prepare(const char* sql, sqlite3_stmt** stmt, const char* what);
    bool step_done(sqlite3_stmt* stmt, const char* what);
    static HistoryEntry read_row(sqlite3_stmt* stmt);

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* transcript_stmt_ = nullptr;
    sqlite3_stmt* removed_stmt_ = nullptr;
    sqlite3_stmt* find_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
