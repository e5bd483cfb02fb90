#include "chunkstream/storage/resume_manager.hpp"
#include "chunkstream/network/protocol.hpp"
#include "chunkstream/core/logger.hpp"
#include <sqlite3.h>

namespace chunkstream::storage {

namespace {
    constexpr const char* SELECT_COLUMNS =
        "SELECT file_id, session_id, peer, manifest, completed_chunks, last_activity FROM resume_state";

    std::span<const uint8_t> column_blob(sqlite3_stmt* stmt, int column) {
        auto data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, column));
        auto size = sqlite3_column_bytes(stmt, column);
        if (!data || size <= 0) {
            return {};
        }
        return {data, static_cast<size_t>(size)};
    }

    std::string column_text(sqlite3_stmt* stmt, int column) {
        auto text = sqlite3_column_text(stmt, column);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

    int64_t to_unix_seconds(std::chrono::system_clock::time_point time) {
        return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
    }
}

ResumeManager::ResumeManager(const std::filesystem::path& database_path)
    : db_path_(database_path), db_(nullptr) {
}

ResumeManager::~ResumeManager() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool ResumeManager::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open resume journal {}: {}", db_path_.string(), sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    return create_tables();
}

bool ResumeManager::create_tables() {
    const char* create_resume_table = R"(
        CREATE TABLE IF NOT EXISTS resume_state (
            file_id TEXT PRIMARY KEY,
            session_id TEXT NOT NULL,
            peer TEXT NOT NULL,
            manifest BLOB NOT NULL,
            completed_chunks BLOB NOT NULL,
            last_activity INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_resume_last_activity ON resume_state(last_activity);
    )";

    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, create_resume_table, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to create resume tables: {}", error_msg ? error_msg : "unknown error");
        sqlite3_free(error_msg);
        return false;
    }

    return true;
}

bool ResumeManager::save_resume_state(const ResumeInfo& info) {
    const char* insert_sql = R"(
        INSERT OR REPLACE INTO resume_state
        (file_id, session_id, peer, manifest, completed_chunks, last_activity)
        VALUES (?, ?, ?, ?, ?, ?);
    )";

    auto manifest_blob = network::encode_manifest(info.manifest);
    auto chunks_blob = serialize_completed_chunks(info.completed_chunks);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to prepare resume insert: {}", sqlite3_errmsg(db_));
        return false;
    }

    sqlite3_bind_text(stmt, 1, info.file_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, info.session_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, info.peer.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_blob(stmt, 4, manifest_blob.data(), static_cast<int>(manifest_blob.size()), SQLITE_STATIC);
    sqlite3_bind_blob(stmt, 5, chunks_blob.data(), static_cast<int>(chunks_blob.size()), SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 6, to_unix_seconds(info.last_activity));

    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (result != SQLITE_DONE) {
        LOG_ERROR("Failed to save resume state for {}: {}", info.file_id, sqlite3_errmsg(db_));
        return false;
    }

    LOG_DEBUG("Saved resume state for {} ({} of {} chunks)",
              info.file_id, info.completed_chunks.size(), info.manifest.chunk_count());
    return true;
}

std::optional<ResumeInfo> ResumeManager::load_resume_state(const std::string& file_id) {
    std::string select_sql = std::string(SELECT_COLUMNS) + " WHERE file_id = ?;";

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, select_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, file_id.c_str(), -1, SQLITE_STATIC);

    std::optional<ResumeInfo> info;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        try {
            ResumeInfo row;
            row.file_id = column_text(stmt, 0);
            row.session_id = column_text(stmt, 1);
            row.peer = column_text(stmt, 2);
            row.manifest = network::decode_manifest(column_blob(stmt, 3));
            row.completed_chunks = deserialize_completed_chunks(column_blob(stmt, 4));
            row.last_activity = std::chrono::system_clock::time_point(
                std::chrono::seconds(sqlite3_column_int64(stmt, 5)));
            info = std::move(row);
        } catch (const network::ProtocolError& e) {
            LOG_WARN("Discarding unreadable resume state for {}: {}", file_id, e.what());
        }
    }

    sqlite3_finalize(stmt);
    return info;
}

bool ResumeManager::remove_resume_state(const std::string& file_id) {
    const char* delete_sql = "DELETE FROM resume_state WHERE file_id = ?;";

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, delete_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, file_id.c_str(), -1, SQLITE_STATIC);
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return result == SQLITE_DONE && sqlite3_changes(db_) > 0;
}

bool ResumeManager::update_chunk_completed(const std::string& file_id, uint32_t chunk_index) {
    auto info = load_resume_state(file_id);
    if (!info || chunk_index >= info->manifest.chunk_count()) {
        return false;
    }

    info->completed_chunks.insert(chunk_index);
    info->last_activity = std::chrono::system_clock::now();
    return save_resume_state(*info);
}

std::set<uint32_t> ResumeManager::get_completed_chunks(const std::string& file_id) {
    auto info = load_resume_state(file_id);
    return info ? info->completed_chunks : std::set<uint32_t>{};
}

std::vector<uint32_t> ResumeManager::get_missing_chunks(const std::string& file_id) {
    std::vector<uint32_t> missing;
    auto info = load_resume_state(file_id);
    if (!info) {
        return missing;
    }

    for (uint32_t i = 0; i < info->manifest.chunk_count(); ++i) {
        if (!info->completed_chunks.count(i)) {
            missing.push_back(i);
        }
    }
    return missing;
}

size_t ResumeManager::cleanup_old_resume_states(std::chrono::hours max_age) {
    const char* delete_sql = "DELETE FROM resume_state WHERE last_activity < ?;";

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, delete_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    auto cutoff = std::chrono::system_clock::now() - max_age;
    sqlite3_bind_int64(stmt, 1, to_unix_seconds(cutoff));
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (result != SQLITE_DONE) {
        LOG_ERROR("Failed to clean up resume states: {}", sqlite3_errmsg(db_));
        return 0;
    }

    auto removed = static_cast<size_t>(sqlite3_changes(db_));
    if (removed > 0) {
        LOG_INFO("Removed {} stale resume entries", removed);
    }
    return removed;
}

std::vector<ResumeInfo> ResumeManager::list_resumable_transfers() {
    std::vector<std::string> file_ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_) {
            return {};
        }

        sqlite3_stmt* stmt;
        const char* select_sql = "SELECT file_id FROM resume_state ORDER BY last_activity DESC;";
        if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return {};
        }
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            file_ids.push_back(column_text(stmt, 0));
        }
        sqlite3_finalize(stmt);
    }

    std::vector<ResumeInfo> transfers;
    for (const auto& file_id : file_ids) {
        if (auto info = load_resume_state(file_id)) {
            transfers.push_back(std::move(*info));
        }
    }
    return transfers;
}

size_t ResumeManager::get_resume_state_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM resume_state;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

bool ResumeManager::is_resumable(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT 1 FROM resume_state WHERE file_id = ?;", -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, file_id.c_str(), -1, SQLITE_STATIC);
    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

std::vector<uint8_t> ResumeManager::serialize_completed_chunks(const std::set<uint32_t>& chunks) {
    std::vector<uint8_t> data;
    data.reserve(chunks.size() * 4);
    for (auto index : chunks) {
        data.push_back((index >> 24) & 0xFF);
        data.push_back((index >> 16) & 0xFF);
        data.push_back((index >> 8) & 0xFF);
        data.push_back(index & 0xFF);
    }
    return data;
}

std::set<uint32_t> ResumeManager::deserialize_completed_chunks(std::span<const uint8_t> data) {
    if (data.size() % 4 != 0) {
        throw network::ProtocolError("Completed chunk list has a partial entry");
    }

    std::set<uint32_t> chunks;
    for (size_t i = 0; i < data.size(); i += 4) {
        chunks.insert((static_cast<uint32_t>(data[i]) << 24) |
                      (static_cast<uint32_t>(data[i + 1]) << 16) |
                      (static_cast<uint32_t>(data[i + 2]) << 8) |
                      static_cast<uint32_t>(data[i + 3]));
    }
    return chunks;
}

} // namespace chunkstream::storage
