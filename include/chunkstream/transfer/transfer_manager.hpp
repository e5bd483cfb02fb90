#pragma once

#include "transfer_session.hpp"
#include "../storage/resume_manager.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkstream::core {
class Config;
}

namespace chunkstream::transfer {

struct TransferSessionStats {
    std::string session_id;
    std::string file_id;
    PeerId peer;
    TransferRole role;
    TransferProgress progress;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::milliseconds estimated_time_remaining{0};
};

class TransferManager {
public:
    static constexpr uint32_t DEFAULT_MAX_UPLOADS = 3;
    static constexpr uint32_t DEFAULT_MAX_DOWNLOADS = 3;

    explicit TransferManager(std::shared_ptr<storage::ChunkStore> store, TransferOptions options = {});
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    // Reads transfer limits and session options
    void configure(const core::Config& config);

    // Interrupted receiver sessions are journaled here when set
    void set_resume_manager(std::shared_ptr<storage::ResumeManager> resume_manager);

    Result start_upload(std::shared_ptr<const storage::Manifest> manifest,
                        const PeerId& peer,
                        std::shared_ptr<network::Transport> transport,
                        std::string& session_id);

    Result accept_download(const network::TransferRequest& request,
                           const PeerId& peer,
                           std::shared_ptr<network::Transport> transport,
                           std::string& session_id);

    // Reads the first frame of a fresh connection. Rejects it when the download
    // limit is reached or the request is unusable, otherwise accepts it.
    Result handle_incoming(const PeerId& peer,
                           std::shared_ptr<network::Transport> transport,
                           std::string& session_id);

    bool has_session(const std::string& session_id) const;
    std::optional<TransferSessionStats> get_session_stats(const std::string& session_id) const;
    std::vector<TransferSessionStats> get_all_sessions() const;
    std::shared_ptr<const storage::Manifest> get_manifest(const std::string& session_id) const;

    std::optional<TransferOutcome> wait_for(const std::string& session_id, std::chrono::milliseconds timeout);

    Result pause_transfer(const std::string& session_id);
    Result resume_transfer(const std::string& session_id);
    Result cancel_transfer(const std::string& session_id);

    // Drops sessions in a terminal state; returns how many were removed
    size_t cleanup_completed_sessions();

    void set_max_uploads(uint32_t max_uploads);
    void set_max_downloads(uint32_t max_downloads);
    uint32_t get_active_upload_count() const;
    uint32_t get_active_download_count() const;
    uint64_t get_total_bytes_transferred() const;

private:
    struct SessionEntry {
        std::shared_ptr<TransferSession> session;
        bool journaled = false;
    };

    std::shared_ptr<storage::ChunkStore> store_;
    TransferOptions options_;
    std::shared_ptr<storage::ResumeManager> resume_manager_;

    std::unordered_map<std::string, SessionEntry> sessions_;
    mutable std::mutex sessions_mutex_;

    uint32_t max_uploads_;
    uint32_t max_downloads_;
    uint64_t finished_bytes_transferred_;

    std::shared_ptr<TransferSession> find_session(const std::string& session_id) const;
    uint32_t count_active(TransferRole role) const;
    void journal_outcome(SessionEntry& entry);
    TransferSessionStats create_session_stats(const TransferSession& session) const;
    void reject(network::Transport& transport, const std::string& file_id, const std::string& reason);
};

} // namespace chunkstream::transfer
