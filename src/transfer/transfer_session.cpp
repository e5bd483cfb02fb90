#include "chunkstream/transfer/transfer_session.hpp"
#include "chunkstream/network/codec.hpp"
#include "chunkstream/crypto/random.hpp"
#include "chunkstream/core/logger.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <future>
#include <stdexcept>
#include <type_traits>

namespace chunkstream::transfer {

using network::AbortReason;
using network::NackReason;

namespace {
    constexpr size_t MAX_ABORT_DETAIL = 1024;

    ErrorCode error_for_nack(NackReason reason) {
        return reason == NackReason::MANIFEST_MISMATCH ? ErrorCode::PROTOCOL_VIOLATION : ErrorCode::STORAGE_ERROR;
    }

    AbortReason abort_for_nack(NackReason reason) {
        return reason == NackReason::MANIFEST_MISMATCH ? AbortReason::PROTOCOL_VIOLATION : AbortReason::STORAGE_ERROR;
    }
}

std::unique_ptr<TransferSession> TransferSession::start_send(std::shared_ptr<const storage::Manifest> manifest,
                                                             PeerId peer,
                                                             std::shared_ptr<storage::ChunkStore> store,
                                                             std::shared_ptr<network::Transport> transport,
                                                             TransferOptions options) {
    if (!manifest || !store || !transport) {
        throw std::invalid_argument("start_send requires a manifest, a chunk store and a transport");
    }

    std::unique_ptr<TransferSession> session(new TransferSession(
        TransferRole::SENDER, std::move(manifest), std::move(peer), std::move(store),
        std::move(transport), options));
    session->start();
    return session;
}

std::unique_ptr<TransferSession> TransferSession::accept(const network::TransferRequest& request,
                                                         PeerId peer,
                                                         std::shared_ptr<storage::ChunkStore> store,
                                                         std::shared_ptr<network::Transport> transport,
                                                         TransferOptions options) {
    if (!store || !transport) {
        throw std::invalid_argument("accept requires a chunk store and a transport");
    }

    std::unique_ptr<TransferSession> session(new TransferSession(
        TransferRole::RECEIVER, std::make_shared<const storage::Manifest>(request.manifest),
        std::move(peer), std::move(store), std::move(transport), options));
    session->start();
    return session;
}

TransferSession::TransferSession(TransferRole role,
                                 std::shared_ptr<const storage::Manifest> manifest,
                                 PeerId peer,
                                 std::shared_ptr<storage::ChunkStore> store,
                                 std::shared_ptr<network::Transport> transport,
                                 TransferOptions options)
    : id_(crypto::SecureRandom::generate_hex(8))
    , role_(role)
    , manifest_(std::move(manifest))
    , peer_(std::move(peer))
    , store_(std::move(store))
    , transport_(std::move(transport))
    , options_(options)
    , started_at_(Clock::now())
    , work_guard_(boost::asio::make_work_guard(io_context_))
    , tick_timer_(io_context_)
    , window_(options.min_chunk_timeout)
    , completed_(manifest_->chunk_count())
    , timeouts_per_chunk_(manifest_->chunk_count(), 0)
    , last_chunk_at_(started_at_)
{
    if (role_ == TransferRole::RECEIVER) {
        window_size_ = 0;
    }
}

TransferSession::~TransferSession() {
    if (!is_terminal(state_)) {
        cancel();
        if (!await_terminal_for(std::chrono::seconds(5))) {
            LOG_ERROR("Session {} did not stop after cancellation", id_);
        }
    }

    transport_->close();
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }

    work_guard_.reset();
    io_context_.stop();
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
}

void TransferSession::start() {
    loop_thread_ = std::thread([this] {
        while (true) {
            try {
                io_context_.run();
                return;
            } catch (const std::exception& e) {
                LOG_ERROR("Session {}: unhandled error on event loop: {}", id_, e.what());
                finish(TransferState::FAILED, Result(ErrorCode::INVALID_STATE, std::string("Internal error: ") + e.what()));
            }
        }
    });

    boost::asio::post(io_context_, [this] {
        if (role_ == TransferRole::SENDER) {
            begin_send();
        } else {
            begin_receive();
        }
        if (!is_terminal(state_)) {
            schedule_tick();
        }
    });

    reader_thread_ = std::thread([this] { reader_loop(); });
}

void TransferSession::reader_loop() {
    std::vector<std::uint8_t> frame;

    while (true) {
        auto status = transport_->recv_frame(frame);
        if (status != network::TransportStatus::OK) {
            boost::asio::post(io_context_, [this, status] { handle_transport_status(status); });
            return;
        }

        // Hand the frame to the loop and wait, so only one inbound buffer exists at a time
        std::promise<void> consumed;
        auto done = consumed.get_future();
        boost::asio::post(io_context_, [this, &frame, &consumed] {
            try {
                handle_frame(frame);
            } catch (const std::exception& e) {
                LOG_ERROR("Session {}: error handling frame: {}", id_, e.what());
                finish(TransferState::FAILED, Result(ErrorCode::INVALID_STATE, std::string("Internal error: ") + e.what()));
            }
            consumed.set_value();
        });
        done.wait();

        if (is_terminal(state_)) {
            return;
        }
    }
}

void TransferSession::schedule_tick() {
    tick_timer_.expires_after(options_.tick_interval);
    tick_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (!ec) {
            on_tick();
        }
    });
}

void TransferSession::on_tick() {
    if (is_terminal(state_)) {
        return;
    }

    if (cancel_requested_) {
        do_cancel();
        return;
    }

    auto now = Clock::now();

    if (options_.overall_timeout.count() > 0 && now - started_at_ > options_.overall_timeout) {
        abort(ErrorCode::STALLED, AbortReason::STALLED, "Overall transfer timeout exceeded");
        return;
    }

    flush_outbox();
    if (is_terminal(state_)) {
        return;
    }

    switch (state_.load()) {
        case TransferState::NEGOTIATING:
            if (now > phase_deadline_) {
                abort(ErrorCode::STALLED, AbortReason::STALLED, "No answer to transfer request");
                return;
            }
            break;

        case TransferState::COMPLETING:
            if (role_ == TransferRole::RECEIVER && now > phase_deadline_) {
                abort(ErrorCode::STALLED, AbortReason::STALLED, "TransferComplete never arrived");
                return;
            }
            break;

        case TransferState::TRANSFERRING:
            if (role_ == TransferRole::SENDER) {
                check_timeouts(now);
                if (is_terminal(state_)) {
                    return;
                }
                fill_window();
            } else if (now - last_chunk_at_ > options_.negotiation_timeout) {
                abort(ErrorCode::STALLED, AbortReason::STALLED, "No chunk received within the idle limit");
                return;
            }
            break;

        default:
            break;
    }

    if (!is_terminal(state_)) {
        schedule_tick();
    }
}

void TransferSession::begin_send() {
    set_state(TransferState::NEGOTIATING);
    phase_deadline_ = Clock::now() + options_.negotiation_timeout;

    std::vector<std::uint8_t> frame;
    try {
        frame = network::codec::encode(network::TransferRequest{manifest_->file_id(), *manifest_});
    } catch (const network::ProtocolError& e) {
        LOG_ERROR("Session {}: cannot encode manifest for {}: {}", id_, manifest_->file_id(), e.what());
        finish(TransferState::FAILED, Result(ErrorCode::MANIFEST_INVALID, e.what()));
        return;
    }

    auto status = transport_->send_frame(frame);
    if (status == network::TransportStatus::BACKPRESSURED) {
        outbox_.push_back(Outgoing{std::move(frame), std::nullopt});
    } else if (status != network::TransportStatus::OK) {
        finish(TransferState::FAILED, Result(ErrorCode::TRANSPORT_CLOSED, "Transport closed before the request was sent"));
        return;
    }

    LOG_INFO("Session {}: offered {} ({} bytes, {} chunks) to {}",
             id_, manifest_->file_id(), manifest_->total_size(), manifest_->chunk_count(), peer_);
}

void TransferSession::begin_receive() {
    set_state(TransferState::NEGOTIATING);

    network::ChunkBitset already_have(manifest_->chunk_count());
    for (const auto& chunk : manifest_->chunks()) {
        if (store_->has(chunk.chunk_id)) {
            already_have.set(chunk.index);
        }
    }

    {
        std::lock_guard<std::mutex> lock(completed_mutex_);
        completed_ = already_have;
    }
    completed_count_ = static_cast<std::uint32_t>(already_have.count());

    if (!send_message(network::TransferAccept{manifest_->file_id(), already_have})) {
        return;
    }

    LOG_INFO("Session {}: accepted {} from {}, {} of {} chunks already present",
             id_, manifest_->file_id(), peer_, already_have.count(), manifest_->chunk_count());

    set_state(TransferState::TRANSFERRING);
    last_chunk_at_ = Clock::now();

    if (already_have.all()) {
        enter_completing();
    }
}

void TransferSession::handle_frame(const std::vector<std::uint8_t>& frame) {
    if (is_terminal(state_)) {
        return;
    }

    network::Message message;
    try {
        message = network::codec::decode(frame);
    } catch (const network::ProtocolError& e) {
        LOG_WARN("Session {}: undecodable frame from {}: {}", id_, peer_, e.what());
        abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION, e.what());
        return;
    }

    const auto& file_id = network::codec::file_id_of(message);
    if (file_id != manifest_->file_id()) {
        // A request that could not be decoded is rejected without a file id
        bool anonymous_reject = std::holds_alternative<network::TransferReject>(message) && file_id.empty();
        if (!anonymous_reject) {
            abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION,
                  "Message for unknown file id '" + file_id + "'");
            return;
        }
    }

    LOG_TRACE("Session {}: received {}", id_, network::message_type_name(network::codec::type_of(message)));
    handle_message(message);
}

void TransferSession::handle_message(network::Message& message) {
    std::visit([this](auto& msg) {
        using T = std::decay_t<decltype(msg)>;

        if constexpr (std::is_same_v<T, network::TransferAccept>) {
            on_accept(msg);
        } else if constexpr (std::is_same_v<T, network::TransferReject>) {
            on_reject(msg);
        } else if constexpr (std::is_same_v<T, network::ChunkData>) {
            on_chunk(msg);
        } else if constexpr (std::is_same_v<T, network::ChunkAck>) {
            on_ack(msg);
        } else if constexpr (std::is_same_v<T, network::ChunkNack>) {
            on_nack(msg);
        } else if constexpr (std::is_same_v<T, network::TransferComplete>) {
            on_complete(msg);
        } else if constexpr (std::is_same_v<T, network::TransferAbort>) {
            on_abort(msg);
        } else if constexpr (std::is_same_v<T, network::TransferPause>) {
            on_pause(msg);
        } else if constexpr (std::is_same_v<T, network::TransferResume>) {
            on_resume(msg);
        } else {
            abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION,
                  "Unexpected TransferRequest on an established session");
        }
    }, message);
}

void TransferSession::handle_transport_status(network::TransportStatus status) {
    if (is_terminal(state_)) {
        return;
    }

    if (status == network::TransportStatus::FRAME_REJECTED) {
        abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION, "Frame header rejected");
        return;
    }

    if (cancel_requested_) {
        finish(TransferState::CANCELLED, Result(ErrorCode::CANCELLED, "Transfer cancelled"));
        return;
    }

    LOG_WARN("Session {}: transport to {} closed in state {}", id_, peer_, transfer_state_name(state_));
    finish(TransferState::FAILED, Result(ErrorCode::TRANSPORT_CLOSED, "Transport closed"));
}

void TransferSession::on_accept(const network::TransferAccept& accept) {
    if (role_ != TransferRole::SENDER || state_ != TransferState::NEGOTIATING) {
        abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION,
              std::string("Unexpected TransferAccept in state ") + transfer_state_name(state_));
        return;
    }

    if (accept.already_have.size() != manifest_->chunk_count()) {
        abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION,
              "already_have covers " + std::to_string(accept.already_have.size()) + " chunks, manifest has " +
              std::to_string(manifest_->chunk_count()));
        return;
    }

    merge_peer_bitset(accept.already_have);

    LOG_INFO("Session {}: {} accepted {}, peer already has {} of {} chunks",
             id_, peer_, manifest_->file_id(), accept.already_have.count(), manifest_->chunk_count());

    set_state(TransferState::TRANSFERRING);
    fill_window();
    check_sender_done();
}

void TransferSession::on_reject(const network::TransferReject& reject) {
    if (role_ != TransferRole::SENDER || state_ != TransferState::NEGOTIATING) {
        abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION,
              std::string("Unexpected TransferReject in state ") + transfer_state_name(state_));
        return;
    }

    LOG_WARN("Session {}: {} rejected {}: {}", id_, peer_, manifest_->file_id(), reject.reason);
    finish(TransferState::FAILED, Result(ErrorCode::REJECTED, reject.reason));
}

void TransferSession::on_ack(const network::ChunkAck& ack) {
    auto state = state_.load();
    // Late answers to resent chunks may still arrive while TransferComplete is queued
    if (role_ != TransferRole::SENDER ||
        (state != TransferState::TRANSFERRING && state != TransferState::PAUSED &&
         state != TransferState::COMPLETING)) {
        abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION,
              std::string("Unexpected ChunkAck in state ") + transfer_state_name(state));
        return;
    }

    if (ack.index >= manifest_->chunk_count()) {
        abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION,
              "ChunkAck for index " + std::to_string(ack.index) + " out of range");
        return;
    }

    auto it = in_flight_.find(ack.index);
    if (it == in_flight_.end() || !it->second.sent) {
        LOG_TRACE("Session {}: ignoring duplicate ack for chunk {}", id_, ack.index);
        return;
    }

    auto now = Clock::now();
    auto rtt = now - it->second.sent_at;
    in_flight_.erase(it);
    in_flight_count_ = static_cast<std::uint32_t>(in_flight_.size());

    consecutive_integrity_failures_ = 0;
    mark_completed(ack.index);

    auto size = manifest_->chunk(ack.index).size;
    bytes_transferred_ += size;
    speed_.record(size, std::chrono::duration_cast<std::chrono::milliseconds>(rtt));
    speed_bps_ = speed_.speed_bps();

    window_.on_success(std::chrono::duration_cast<std::chrono::microseconds>(rtt));
    window_size_ = window_.window();

    LOG_TRACE("Session {}: chunk {} acked, window {}", id_, ack.index, window_.window());

    fill_window();
    check_sender_done();
}

void TransferSession::on_nack(const network::ChunkNack& nack) {
    auto state = state_.load();
    if (role_ != TransferRole::SENDER ||
        (state != TransferState::TRANSFERRING && state != TransferState::PAUSED &&
         state != TransferState::COMPLETING)) {
        abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION,
              std::string("Unexpected ChunkNack in state ") + transfer_state_name(state));
        return;
    }

    if (nack.index >= manifest_->chunk_count()) {
        abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION,
              "ChunkNack for index " + std::to_string(nack.index) + " out of range");
        return;
    }

    if (!network::is_transient(nack.reason)) {
        abort(error_for_nack(nack.reason), abort_for_nack(nack.reason),
              std::string("Peer reported ") + network::nack_reason_name(nack.reason) +
              " for chunk " + std::to_string(nack.index));
        return;
    }

    auto it = in_flight_.find(nack.index);
    if (it == in_flight_.end()) {
        LOG_TRACE("Session {}: ignoring stale nack for chunk {}", id_, nack.index);
        return;
    }
    in_flight_.erase(it);
    in_flight_count_ = static_cast<std::uint32_t>(in_flight_.size());

    LOG_DEBUG("Session {}: chunk {} nacked ({})", id_, nack.index, network::nack_reason_name(nack.reason));

    if (nack.reason == NackReason::INTEGRITY_FAILED) {
        if (++consecutive_integrity_failures_ >= options_.max_consecutive_integrity_failures) {
            abort(ErrorCode::INTEGRITY_FAILED, AbortReason::INTEGRITY_FAILED,
                  std::to_string(consecutive_integrity_failures_) + " consecutive integrity failures");
            return;
        }
    } else if (++malformed_count_ >= options_.max_malformed_frames) {
        abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION,
              std::to_string(malformed_count_) + " chunks reported malformed");
        return;
    }

    retry_queue_.insert(nack.index);
    record_loss();
    fill_window();
}

void TransferSession::fill_window() {
    if (state_ != TransferState::TRANSFERRING) {
        return;
    }

    while (in_flight_.size() < window_.window() && outbox_.empty()) {
        auto index = next_chunk_to_send();
        if (!index) {
            break;
        }

        const auto& descriptor = manifest_->chunk(*index);
        std::vector<std::uint8_t> bytes;
        auto result = store_->get(descriptor.chunk_id, bytes);
        if (!result) {
            abort(ErrorCode::STORAGE_ERROR, AbortReason::STORAGE_ERROR,
                  "Chunk " + std::to_string(*index) + " unavailable: " + result.message);
            return;
        }
        if (bytes.size() != descriptor.size) {
            abort(ErrorCode::STORAGE_ERROR, AbortReason::STORAGE_ERROR,
                  "Stored chunk " + std::to_string(*index) + " has the wrong size");
            return;
        }

        in_flight_[*index] = InFlight{Clock::now(), false};
        in_flight_count_ = static_cast<std::uint32_t>(in_flight_.size());

        if (!send_message(network::ChunkData{manifest_->file_id(), *index, std::move(bytes)}, *index)) {
            return;
        }
        LOG_TRACE("Session {}: sent chunk {} ({} in flight)", id_, *index, in_flight_.size());
    }
}

std::optional<std::uint32_t> TransferSession::next_chunk_to_send() {
    while (!retry_queue_.empty()) {
        auto index = *retry_queue_.begin();
        retry_queue_.erase(retry_queue_.begin());
        if (!completed_[index] && !in_flight_.count(index)) {
            return index;
        }
    }

    while (next_index_ < manifest_->chunk_count()) {
        auto index = next_index_++;
        if (!completed_[index] && !in_flight_.count(index)) {
            return index;
        }
    }

    return std::nullopt;
}

void TransferSession::requeue(std::uint32_t index) {
    in_flight_.erase(index);
    drop_outgoing_chunk(index);
    retry_queue_.insert(index);
}

void TransferSession::record_loss() {
    window_.on_loss();
    window_size_ = window_.window();

    // Shrink in-flight to the new window, giving back the highest indices
    while (in_flight_.size() > window_.window()) {
        auto highest = std::prev(in_flight_.end())->first;
        requeue(highest);
        LOG_TRACE("Session {}: chunk {} evicted by window shrink", id_, highest);
    }
    in_flight_count_ = static_cast<std::uint32_t>(in_flight_.size());
}

void TransferSession::check_timeouts(Clock::time_point now) {
    auto timeout = window_.timeout();

    std::vector<std::uint32_t> expired;
    for (const auto& [index, entry] : in_flight_) {
        if (entry.sent && now - entry.sent_at > timeout) {
            expired.push_back(index);
        }
    }

    for (auto index : expired) {
        // An earlier loss in this pass may already have evicted it
        if (!in_flight_.count(index)) {
            continue;
        }

        if (++timeouts_per_chunk_[index] > options_.max_chunk_retries) {
            abort(ErrorCode::STALLED, AbortReason::STALLED,
                  "Chunk " + std::to_string(index) + " timed out " +
                  std::to_string(timeouts_per_chunk_[index]) + " times");
            return;
        }

        LOG_DEBUG("Session {}: chunk {} timed out after {} ms (attempt {})",
                  id_, index, timeout.count(), timeouts_per_chunk_[index]);
        requeue(index);
        record_loss();
    }
    in_flight_count_ = static_cast<std::uint32_t>(in_flight_.size());
}

void TransferSession::check_sender_done() {
    auto state = state_.load();
    if (state != TransferState::TRANSFERRING && state != TransferState::PAUSED) {
        return;
    }
    if (!completed_.all() || !in_flight_.empty()) {
        return;
    }

    set_state(TransferState::COMPLETING);
    complete_sent_ = true;
    if (!send_message(network::TransferComplete{manifest_->file_id()})) {
        return;
    }
    if (outbox_.empty()) {
        finish(TransferState::COMPLETED, Result());
    }
}

void TransferSession::merge_peer_bitset(const network::ChunkBitset& bits) {
    for (auto i = bits.find_first(); i != network::ChunkBitset::npos; i = bits.find_next(i)) {
        auto index = static_cast<std::uint32_t>(i);
        if (completed_[index]) {
            continue;
        }
        in_flight_.erase(index);
        retry_queue_.erase(index);
        drop_outgoing_chunk(index);
        mark_completed(index);
    }
    in_flight_count_ = static_cast<std::uint32_t>(in_flight_.size());
}

void TransferSession::on_chunk(network::ChunkData& chunk) {
    auto state = state_.load();
    if (role_ != TransferRole::RECEIVER ||
        (state != TransferState::TRANSFERRING && state != TransferState::PAUSED &&
         state != TransferState::COMPLETING)) {
        abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION,
              std::string("Unexpected ChunkData in state ") + transfer_state_name(state));
        return;
    }

    const auto& file_id = manifest_->file_id();

    if (chunk.index >= manifest_->chunk_count() ||
        chunk.bytes.size() != manifest_->chunk(chunk.index).size) {
        LOG_WARN("Session {}: malformed chunk {} ({} bytes) from {}", id_, chunk.index, chunk.bytes.size(), peer_);
        if (!send_message(network::ChunkNack{file_id, chunk.index, NackReason::MALFORMED})) {
            return;
        }
        if (++malformed_count_ >= options_.max_malformed_frames) {
            abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION,
                  std::to_string(malformed_count_) + " malformed chunks received");
        }
        return;
    }

    const auto& descriptor = manifest_->chunk(chunk.index);

    if (completed_[chunk.index]) {
        LOG_TRACE("Session {}: chunk {} already held, acking again", id_, chunk.index);
        send_message(network::ChunkAck{file_id, chunk.index});
        return;
    }

    if (!storage::Manifest::verify_chunk(descriptor, chunk.bytes)) {
        LOG_WARN("Session {}: chunk {} from {} failed verification", id_, chunk.index, peer_);
        if (!send_message(network::ChunkNack{file_id, chunk.index, NackReason::INTEGRITY_FAILED})) {
            return;
        }
        if (++consecutive_integrity_failures_ >= options_.max_consecutive_integrity_failures) {
            abort(ErrorCode::INTEGRITY_FAILED, AbortReason::INTEGRITY_FAILED,
                  std::to_string(consecutive_integrity_failures_) + " consecutive chunks failed verification");
        }
        return;
    }

    auto result = store_->put(descriptor.chunk_id, chunk.bytes);
    if (!result) {
        LOG_ERROR("Session {}: failed to store chunk {}: {}", id_, chunk.index, result.message);
        auto reason = result.error == ErrorCode::STORAGE_FULL ? NackReason::STORAGE_FULL : NackReason::IO_ERROR;
        if (!send_message(network::ChunkNack{file_id, chunk.index, reason})) {
            return;
        }
        abort(ErrorCode::STORAGE_ERROR, AbortReason::STORAGE_ERROR, result.message);
        return;
    }

    consecutive_integrity_failures_ = 0;
    mark_completed(chunk.index);

    auto now = Clock::now();
    bytes_transferred_ += descriptor.size;
    speed_.record(descriptor.size, std::chrono::duration_cast<std::chrono::milliseconds>(now - last_chunk_at_));
    speed_bps_ = speed_.speed_bps();
    last_chunk_at_ = now;

    if (!send_message(network::ChunkAck{file_id, chunk.index})) {
        return;
    }

    LOG_TRACE("Session {}: stored chunk {} ({}/{})", id_, chunk.index, completed_count_.load(), manifest_->chunk_count());

    if (completed_.all() && state_ != TransferState::COMPLETING) {
        enter_completing();
    }
}

void TransferSession::on_complete(const network::TransferComplete&) {
    if (role_ != TransferRole::RECEIVER || state_ != TransferState::COMPLETING) {
        abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION,
              std::string("Unexpected TransferComplete in state ") + transfer_state_name(state_));
        return;
    }

    finish(TransferState::COMPLETED, Result());
}

void TransferSession::enter_completing() {
    if (!manifest_->verify_file(manifest_->chunk_ids())) {
        abort(ErrorCode::CORRUPTED, AbortReason::CORRUPTED, "File hash does not match the received chunks");
        return;
    }

    set_state(TransferState::COMPLETING);
    phase_deadline_ = Clock::now() + options_.negotiation_timeout;
}

void TransferSession::on_abort(const network::TransferAbort& message) {
    LOG_WARN("Session {}: {} aborted {} ({}): {}", id_, peer_, manifest_->file_id(),
             network::abort_reason_name(message.reason), message.detail);

    if (message.reason == AbortReason::CANCELLED) {
        finish(TransferState::CANCELLED, Result(ErrorCode::CANCELLED, "Cancelled by peer"));
    } else {
        finish(TransferState::FAILED, Result(ErrorCode::PEER_ABORTED,
               std::string(network::abort_reason_name(message.reason)) + ": " + message.detail));
    }
}

void TransferSession::on_pause(const network::TransferPause&) {
    auto state = state_.load();
    if (state == TransferState::TRANSFERRING) {
        LOG_INFO("Session {}: paused by {}", id_, peer_);
        set_state(TransferState::PAUSED);
    } else if (state != TransferState::PAUSED && state != TransferState::COMPLETING) {
        abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION,
              std::string("Unexpected TransferPause in state ") + transfer_state_name(state));
    }
}

void TransferSession::on_resume(const network::TransferResume& resume) {
    auto state = state_.load();
    if (state == TransferState::TRANSFERRING || state == TransferState::COMPLETING) {
        return;
    }
    if (state != TransferState::PAUSED) {
        abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION,
              std::string("Unexpected TransferResume in state ") + transfer_state_name(state));
        return;
    }

    if (role_ == TransferRole::SENDER && !resume.already_have.empty()) {
        if (resume.already_have.size() != manifest_->chunk_count()) {
            abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION,
                  "TransferResume bitset does not match the manifest");
            return;
        }
        merge_peer_bitset(resume.already_have);
    }

    LOG_INFO("Session {}: resumed by {}", id_, peer_);
    do_resume_local();
}

void TransferSession::do_resume_local() {
    set_state(TransferState::TRANSFERRING);

    // Paused time does not count against in-flight chunks
    auto now = Clock::now();
    for (auto& [index, entry] : in_flight_) {
        if (entry.sent) {
            entry.sent_at = now;
        }
    }
    last_chunk_at_ = now;

    if (role_ == TransferRole::SENDER) {
        fill_window();
        check_sender_done();
    }
}

Result TransferSession::do_pause() {
    if (state_ != TransferState::TRANSFERRING) {
        return Result(ErrorCode::INVALID_STATE,
                      std::string("Cannot pause in state ") + transfer_state_name(state_));
    }

    if (!send_message(network::TransferPause{manifest_->file_id()})) {
        return Result(ErrorCode::TRANSPORT_CLOSED, "Transport closed");
    }

    LOG_INFO("Session {}: paused", id_);
    set_state(TransferState::PAUSED);
    return Result();
}

Result TransferSession::do_resume() {
    if (state_ != TransferState::PAUSED) {
        return Result(ErrorCode::INVALID_STATE,
                      std::string("Cannot resume in state ") + transfer_state_name(state_));
    }

    network::TransferResume resume{manifest_->file_id(), {}};
    if (role_ == TransferRole::RECEIVER) {
        resume.already_have = completed_;
    }
    if (!send_message(resume)) {
        return Result(ErrorCode::TRANSPORT_CLOSED, "Transport closed");
    }

    LOG_INFO("Session {}: resumed", id_);
    do_resume_local();
    return Result();
}

void TransferSession::do_cancel() {
    if (is_terminal(state_)) {
        return;
    }
    abort(ErrorCode::CANCELLED, AbortReason::CANCELLED, "Transfer cancelled");
}

bool TransferSession::send_message(const network::Message& message, std::optional<std::uint32_t> chunk_index) {
    std::vector<std::uint8_t> frame;
    try {
        frame = network::codec::encode(message);
    } catch (const network::ProtocolError& e) {
        abort(ErrorCode::PROTOCOL_VIOLATION, AbortReason::PROTOCOL_VIOLATION, e.what());
        return false;
    }

    if (!outbox_.empty()) {
        outbox_.push_back(Outgoing{std::move(frame), chunk_index});
        return true;
    }

    auto status = transport_->send_frame(frame);
    switch (status) {
        case network::TransportStatus::OK:
            if (chunk_index) {
                auto it = in_flight_.find(*chunk_index);
                if (it != in_flight_.end()) {
                    it->second.sent_at = Clock::now();
                    it->second.sent = true;
                }
            }
            return true;

        case network::TransportStatus::BACKPRESSURED:
            LOG_DEBUG("Session {}: transport backpressured, queueing", id_);
            outbox_.push_back(Outgoing{std::move(frame), chunk_index});
            return true;

        default:
            if (cancel_requested_) {
                finish(TransferState::CANCELLED, Result(ErrorCode::CANCELLED, "Transfer cancelled"));
            } else {
                finish(TransferState::FAILED, Result(ErrorCode::TRANSPORT_CLOSED,
                       std::string("Send failed: ") + network::transport_status_name(status)));
            }
            return false;
    }
}

void TransferSession::flush_outbox() {
    while (!outbox_.empty()) {
        auto& next = outbox_.front();
        auto status = transport_->send_frame(next.frame);
        if (status == network::TransportStatus::BACKPRESSURED) {
            return;
        }
        if (status != network::TransportStatus::OK) {
            finish(TransferState::FAILED, Result(ErrorCode::TRANSPORT_CLOSED,
                   std::string("Send failed: ") + network::transport_status_name(status)));
            return;
        }

        if (next.chunk_index) {
            auto it = in_flight_.find(*next.chunk_index);
            if (it != in_flight_.end()) {
                it->second.sent_at = Clock::now();
                it->second.sent = true;
            }
        }
        outbox_.pop_front();
    }

    if (role_ == TransferRole::SENDER && complete_sent_ && state_ == TransferState::COMPLETING) {
        finish(TransferState::COMPLETED, Result());
    }
}

void TransferSession::drop_outgoing_chunk(std::uint32_t index) {
    std::erase_if(outbox_, [index](const Outgoing& out) {
        return out.chunk_index && *out.chunk_index == index;
    });
}

void TransferSession::mark_completed(std::uint32_t index) {
    std::lock_guard<std::mutex> lock(completed_mutex_);
    if (!completed_[index]) {
        completed_.set(index);
        completed_count_++;
    }
}

void TransferSession::set_state(TransferState state) {
    auto previous = state_.exchange(state);
    if (previous != state) {
        LOG_INFO("Session {} ({} {}): {} -> {}", id_, transfer_role_name(role_), manifest_->file_id(),
                 transfer_state_name(previous), transfer_state_name(state));
    }
}

void TransferSession::abort(ErrorCode error, network::AbortReason reason, const std::string& detail) {
    if (is_terminal(state_)) {
        return;
    }

    auto truncated = detail.substr(0, MAX_ABORT_DETAIL);
    if (error == ErrorCode::CANCELLED) {
        LOG_INFO("Session {}: cancelling", id_);
    } else {
        LOG_ERROR("Session {}: aborting with {}: {}", id_, error_code_name(error), truncated);
    }

    // Best effort, the transport may already be gone
    auto frame = network::codec::encode(network::TransferAbort{manifest_->file_id(), reason, truncated});
    auto status = transport_->send_frame(frame);
    if (status != network::TransportStatus::OK) {
        LOG_DEBUG("Session {}: abort not delivered ({})", id_, network::transport_status_name(status));
    }

    finish(error == ErrorCode::CANCELLED ? TransferState::CANCELLED : TransferState::FAILED,
           Result(error, truncated));
}

void TransferSession::finish(TransferState state, Result result) {
    if (is_terminal(state_)) {
        return;
    }

    set_state(state);
    tick_timer_.cancel();
    outbox_.clear();
    transport_->close();

    if (state == TransferState::COMPLETED) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_at_);
        LOG_INFO("Session {}: {} complete, {} bytes moved in {} ms",
                 id_, manifest_->file_id(), bytes_transferred_.load(), elapsed.count());
    }

    {
        std::lock_guard<std::mutex> lock(outcome_mutex_);
        outcome_ = TransferOutcome{state, std::move(result)};
    }
    outcome_cv_.notify_all();
}

template<typename T>
Result TransferSession::run_on_loop(T&& fn) {
    if (std::this_thread::get_id() == loop_thread_.get_id()) {
        return fn();
    }

    std::promise<Result> promise;
    auto future = promise.get_future();
    boost::asio::post(io_context_, [&promise, &fn] { promise.set_value(fn()); });
    return future.get();
}

void TransferSession::cancel() {
    if (is_terminal(state_) || cancel_requested_.exchange(true)) {
        return;
    }
    boost::asio::post(io_context_, [this] { do_cancel(); });
}

Result TransferSession::pause() {
    return run_on_loop([this] { return do_pause(); });
}

Result TransferSession::resume() {
    return run_on_loop([this] { return do_resume(); });
}

TransferOutcome TransferSession::await_terminal() {
    std::unique_lock<std::mutex> lock(outcome_mutex_);
    outcome_cv_.wait(lock, [this] { return outcome_.has_value(); });
    return *outcome_;
}

std::optional<TransferOutcome> TransferSession::await_terminal_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(outcome_mutex_);
    if (!outcome_cv_.wait_for(lock, timeout, [this] { return outcome_.has_value(); })) {
        return std::nullopt;
    }
    return *outcome_;
}

TransferProgress TransferSession::progress() const {
    TransferProgress progress;
    progress.state = state_;
    progress.completed_chunks = completed_count_;
    progress.total_chunks = manifest_->chunk_count();
    progress.bytes_transferred = bytes_transferred_;
    progress.total_bytes = manifest_->total_size();
    progress.in_flight = in_flight_count_;
    progress.window = window_size_;
    progress.speed_bps = speed_bps_;
    return progress;
}

network::ChunkBitset TransferSession::completed_chunks() const {
    std::lock_guard<std::mutex> lock(completed_mutex_);
    return completed_;
}

} // namespace chunkstream::transfer
