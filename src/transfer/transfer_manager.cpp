#include "chunkstream/transfer/transfer_manager.hpp"
#include "chunkstream/network/codec.hpp"
#include "chunkstream/core/config.hpp"
#include "chunkstream/core/logger.hpp"

namespace chunkstream::transfer {

TransferManager::TransferManager(std::shared_ptr<storage::ChunkStore> store, TransferOptions options)
    : store_(std::move(store))
    , options_(options)
    , max_uploads_(DEFAULT_MAX_UPLOADS)
    , max_downloads_(DEFAULT_MAX_DOWNLOADS)
    , finished_bytes_transferred_(0)
{
}

TransferManager::~TransferManager() {
    std::unordered_map<std::string, SessionEntry> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.swap(sessions_);
    }

    for (auto& [session_id, entry] : sessions) {
        entry.session->cancel();
        entry.session->await_terminal();
        journal_outcome(entry);
    }
}

void TransferManager::configure(const core::Config& config) {
    options_ = TransferOptions::from_config(config);

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    max_uploads_ = static_cast<uint32_t>(config.get_int("transfer.max_uploads", DEFAULT_MAX_UPLOADS));
    max_downloads_ = static_cast<uint32_t>(config.get_int("transfer.max_downloads", DEFAULT_MAX_DOWNLOADS));
}

void TransferManager::set_resume_manager(std::shared_ptr<storage::ResumeManager> resume_manager) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    resume_manager_ = std::move(resume_manager);
}

Result TransferManager::start_upload(std::shared_ptr<const storage::Manifest> manifest,
                                     const PeerId& peer,
                                     std::shared_ptr<network::Transport> transport,
                                     std::string& session_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);

    if (count_active(TransferRole::SENDER) >= max_uploads_) {
        return Result(ErrorCode::LIMIT_REACHED, "Upload limit reached");
    }

    std::shared_ptr<TransferSession> session =
        TransferSession::start_send(std::move(manifest), peer, store_, std::move(transport), options_);
    session_id = session->id();
    sessions_[session_id] = SessionEntry{session, false};

    LOG_INFO("Upload {} of {} to {} registered", session_id, session->manifest().file_id(), peer);
    return Result();
}

Result TransferManager::accept_download(const network::TransferRequest& request,
                                        const PeerId& peer,
                                        std::shared_ptr<network::Transport> transport,
                                        std::string& session_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);

    if (count_active(TransferRole::RECEIVER) >= max_downloads_) {
        return Result(ErrorCode::LIMIT_REACHED, "Download limit reached");
    }

    if (resume_manager_) {
        auto previous = resume_manager_->load_resume_state(request.file_id);
        if (previous && !(previous->manifest == request.manifest)) {
            LOG_INFO("Manifest for {} changed since the interrupted download, discarding journal entry",
                     request.file_id);
            if (!resume_manager_->remove_resume_state(request.file_id)) {
                LOG_WARN("Failed to discard the journal entry for {}", request.file_id);
            }
        } else if (previous) {
            // The store decides what is already held; drop journaled chunks it lost
            auto journaled = previous->completed_chunks.size();
            std::erase_if(previous->completed_chunks, [&](std::uint32_t index) {
                return index >= request.manifest.chunk_count() ||
                       !store_->has(request.manifest.chunk(index).chunk_id);
            });
            if (previous->completed_chunks.size() != journaled) {
                LOG_WARN("{} of {} journaled chunks of {} are missing from the store and will be fetched again",
                         journaled - previous->completed_chunks.size(), journaled, request.file_id);
                if (!resume_manager_->save_resume_state(*previous)) {
                    LOG_WARN("Failed to update the journal entry for {}", request.file_id);
                }
            }
            LOG_INFO("Resuming download of {} with {} of {} chunks from an earlier session",
                     request.file_id, previous->completed_chunks.size(), request.manifest.chunk_count());
        }
    }

    std::shared_ptr<TransferSession> session =
        TransferSession::accept(request, peer, store_, std::move(transport), options_);
    session_id = session->id();
    sessions_[session_id] = SessionEntry{session, false};

    LOG_INFO("Download {} of {} from {} registered", session_id, request.file_id, peer);
    return Result();
}

Result TransferManager::handle_incoming(const PeerId& peer,
                                        std::shared_ptr<network::Transport> transport,
                                        std::string& session_id) {
    std::vector<uint8_t> frame;
    auto status = transport->recv_frame(frame);
    if (status != network::TransportStatus::OK) {
        transport->close();
        return Result(ErrorCode::TRANSPORT_CLOSED,
                      std::string("No transfer request received: ") + network::transport_status_name(status));
    }

    network::Message message;
    try {
        message = network::codec::decode(frame);
    } catch (const network::ManifestError& e) {
        LOG_WARN("Rejecting request from {}: {}", peer, e.what());
        reject(*transport, e.file_id(), e.result().message);
        return Result(ErrorCode::MANIFEST_INVALID, e.result().message);
    } catch (const network::ProtocolError& e) {
        LOG_WARN("Malformed first frame from {}: {}", peer, e.what());
        reject(*transport, "", "malformed request");
        return Result(ErrorCode::PROTOCOL_VIOLATION, e.what());
    }

    auto* request = std::get_if<network::TransferRequest>(&message);
    if (!request) {
        LOG_WARN("Expected a transfer request from {}, got {}", peer,
                 network::message_type_name(network::codec::type_of(message)));
        reject(*transport, network::codec::file_id_of(message), "expected transfer request");
        return Result(ErrorCode::PROTOCOL_VIOLATION, "First frame was not a transfer request");
    }

    auto result = accept_download(*request, peer, transport, session_id);
    if (!result) {
        LOG_WARN("Rejecting {} from {}: {}", request->file_id, peer, result.message);
        reject(*transport, request->file_id, result.message);
    }
    return result;
}

bool TransferManager::has_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.find(session_id) != sessions_.end();
}

std::optional<TransferSessionStats> TransferManager::get_session_stats(const std::string& session_id) const {
    auto session = find_session(session_id);
    if (!session) {
        return std::nullopt;
    }
    return create_session_stats(*session);
}

std::vector<TransferSessionStats> TransferManager::get_all_sessions() const {
    std::vector<std::shared_ptr<TransferSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& [session_id, entry] : sessions_) {
            sessions.push_back(entry.session);
        }
    }

    std::vector<TransferSessionStats> all_stats;
    for (const auto& session : sessions) {
        all_stats.push_back(create_session_stats(*session));
    }
    return all_stats;
}

std::shared_ptr<const storage::Manifest> TransferManager::get_manifest(const std::string& session_id) const {
    auto session = find_session(session_id);
    return session ? session->shared_manifest() : nullptr;
}

std::optional<TransferOutcome> TransferManager::wait_for(const std::string& session_id,
                                                         std::chrono::milliseconds timeout) {
    auto session = find_session(session_id);
    if (!session) {
        return std::nullopt;
    }

    auto outcome = session->await_terminal_for(timeout);
    if (outcome) {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            journal_outcome(it->second);
        }
    }
    return outcome;
}

Result TransferManager::pause_transfer(const std::string& session_id) {
    auto session = find_session(session_id);
    if (!session) {
        return Result(ErrorCode::NOT_FOUND, "Session not found");
    }
    return session->pause();
}

Result TransferManager::resume_transfer(const std::string& session_id) {
    auto session = find_session(session_id);
    if (!session) {
        return Result(ErrorCode::NOT_FOUND, "Session not found");
    }
    return session->resume();
}

Result TransferManager::cancel_transfer(const std::string& session_id) {
    auto session = find_session(session_id);
    if (!session) {
        return Result(ErrorCode::NOT_FOUND, "Session not found");
    }
    session->cancel();
    return Result();
}

size_t TransferManager::cleanup_completed_sessions() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);

    size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (is_terminal(it->second.session->state())) {
            journal_outcome(it->second);
            finished_bytes_transferred_ += it->second.session->progress().bytes_transferred;
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        LOG_DEBUG("Removed {} finished sessions", removed);
    }
    return removed;
}

void TransferManager::set_max_uploads(uint32_t max_uploads) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    max_uploads_ = max_uploads;
}

void TransferManager::set_max_downloads(uint32_t max_downloads) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    max_downloads_ = max_downloads;
}

uint32_t TransferManager::get_active_upload_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return count_active(TransferRole::SENDER);
}

uint32_t TransferManager::get_active_download_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return count_active(TransferRole::RECEIVER);
}

uint64_t TransferManager::get_total_bytes_transferred() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    uint64_t total = finished_bytes_transferred_;
    for (const auto& [session_id, entry] : sessions_) {
        total += entry.session->progress().bytes_transferred;
    }
    return total;
}

std::shared_ptr<TransferSession> TransferManager::find_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    return it != sessions_.end() ? it->second.session : nullptr;
}

uint32_t TransferManager::count_active(TransferRole role) const {
    uint32_t count = 0;
    for (const auto& [session_id, entry] : sessions_) {
        if (entry.session->role() == role && !is_terminal(entry.session->state())) {
            ++count;
        }
    }
    return count;
}

void TransferManager::journal_outcome(SessionEntry& entry) {
    if (entry.journaled || !resume_manager_ || entry.session->role() != TransferRole::RECEIVER) {
        return;
    }

    auto state = entry.session->state();
    if (!is_terminal(state)) {
        return;
    }
    entry.journaled = true;

    const auto& manifest = entry.session->manifest();
    if (state == TransferState::COMPLETED) {
        if (resume_manager_->remove_resume_state(manifest.file_id())) {
            LOG_DEBUG("Cleared journal entry for {}", manifest.file_id());
        }
        return;
    }

    storage::ResumeInfo info;
    info.file_id = manifest.file_id();
    info.session_id = entry.session->id();
    info.peer = entry.session->peer();
    info.manifest = manifest;
    info.last_activity = std::chrono::system_clock::now();

    auto completed = entry.session->completed_chunks();
    for (auto i = completed.find_first(); i != network::ChunkBitset::npos; i = completed.find_next(i)) {
        info.completed_chunks.insert(static_cast<uint32_t>(i));
    }

    if (!resume_manager_->save_resume_state(info)) {
        LOG_WARN("Could not journal interrupted download of {}", info.file_id);
    }
}

TransferSessionStats TransferManager::create_session_stats(const TransferSession& session) const {
    TransferSessionStats stats;
    stats.session_id = session.id();
    stats.file_id = session.manifest().file_id();
    stats.peer = session.peer();
    stats.role = session.role();
    stats.progress = session.progress();
    stats.start_time = session.started_at();

    if (stats.progress.speed_bps > 0 && stats.progress.total_chunks > 0) {
        double remaining_fraction = 1.0 - stats.progress.percentage() / 100.0;
        double remaining_bytes = remaining_fraction * static_cast<double>(stats.progress.total_bytes);
        stats.estimated_time_remaining = std::chrono::milliseconds(
            static_cast<int64_t>(remaining_bytes * 1000.0 / static_cast<double>(stats.progress.speed_bps)));
    }

    return stats;
}

void TransferManager::reject(network::Transport& transport, const std::string& file_id, const std::string& reason) {
    network::TransferReject message{file_id, reason};
    try {
        auto status = transport.send_frame(network::codec::encode(message));
        if (status != network::TransportStatus::OK) {
            LOG_DEBUG("Reject for {} not delivered: {}", file_id, network::transport_status_name(status));
        }
    } catch (const network::ProtocolError& e) {
        LOG_WARN("Could not encode reject for {}: {}", file_id, e.what());
    }
    transport.close();
}

} // namespace chunkstream::transfer
