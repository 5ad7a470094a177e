#pragma once

#include "storage/history_db.hpp"
#include "storage/recording_store.hpp"

// Writes recordings as files under their output path and indexes them in the
// history database. A closed database only disables the index.
class FileRecordingStore : public RecordingStore {
public:
    explicit FileRecordingStore(HistoryDb& history);

    std::expected<void, std::string> ensure_directory(const std::string& path) override;
    std::expected<void, std::string> persist(const RecordingResult& result) override;
    std::expected<void, std::string> attach_transcript(const std::string& output_path,
                                                       const std::string& text,
                                                       const std::string& backend) override;
    std::expected<void, std::string> discard_audio(const std::string& output_path) override;

private:
    HistoryDb& history_;
};
