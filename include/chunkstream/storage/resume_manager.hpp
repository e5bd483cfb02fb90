#pragma once

#include "manifest.hpp"
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

struct sqlite3;

namespace chunkstream::storage {

struct ResumeInfo {
    std::string file_id;
    std::string session_id;
    std::string peer;
    Manifest manifest;
    std::set<uint32_t> completed_chunks;
    std::chrono::system_clock::time_point last_activity;
};

// SQLite journal of downloads that ended before completion, keyed by file id.
class ResumeManager {
public:
    explicit ResumeManager(const std::filesystem::path& database_path);
    ~ResumeManager();

    ResumeManager(const ResumeManager&) = delete;
    ResumeManager& operator=(const ResumeManager&) = delete;

    bool initialize();

    // Replaces any existing entry for the same file id
    bool save_resume_state(const ResumeInfo& info);
    std::optional<ResumeInfo> load_resume_state(const std::string& file_id);
    bool remove_resume_state(const std::string& file_id);

    bool update_chunk_completed(const std::string& file_id, uint32_t chunk_index);
    std::set<uint32_t> get_completed_chunks(const std::string& file_id);
    std::vector<uint32_t> get_missing_chunks(const std::string& file_id);

    // Returns the number of entries removed
    size_t cleanup_old_resume_states(std::chrono::hours max_age = std::chrono::hours(72));
    std::vector<ResumeInfo> list_resumable_transfers();

    size_t get_resume_state_count() const;
    bool is_resumable(const std::string& file_id) const;

private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    mutable std::mutex mutex_;

    bool create_tables();

    static std::vector<uint8_t> serialize_completed_chunks(const std::set<uint32_t>& chunks);
    static std::set<uint32_t> deserialize_completed_chunks(std::span<const uint8_t> data);
};

} // namespace chunkstream::storage
