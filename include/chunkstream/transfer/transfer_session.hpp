#pragma once

#include "transfer_types.hpp"
#include "window_controller.hpp"
#include "speed_tracker.hpp"
#include "../network/protocol.hpp"
#include "../network/transport.hpp"
#include "../storage/chunk_store.hpp"
#include "../storage/manifest.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <thread>

namespace chunkstream::transfer {

// One file moving between two peers over one transport. All protocol state lives on the
// session's event loop; a reader thread feeds it one inbound frame at a time.
//
// Destroying a session that has not reached a terminal state cancels it first.
class TransferSession {
public:
    using Clock = std::chrono::steady_clock;

    static std::unique_ptr<TransferSession> start_send(std::shared_ptr<const storage::Manifest> manifest,
                                                       PeerId peer,
                                                       std::shared_ptr<storage::ChunkStore> store,
                                                       std::shared_ptr<network::Transport> transport,
                                                       TransferOptions options = {});

    // `request` is the TransferRequest already read from `transport`.
    static std::unique_ptr<TransferSession> accept(const network::TransferRequest& request,
                                                   PeerId peer,
                                                   std::shared_ptr<storage::ChunkStore> store,
                                                   std::shared_ptr<network::Transport> transport,
                                                   TransferOptions options = {});

    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    TransferProgress progress() const;
    TransferState state() const { return state_; }

    // Idempotent; the session reaches Cancelled within one tick.
    void cancel();

    // INVALID_STATE unless Transferring (pause) or Paused (resume).
    Result pause();
    Result resume();

    TransferOutcome await_terminal();
    std::optional<TransferOutcome> await_terminal_for(std::chrono::milliseconds timeout);

    // Indices held by the receiver (or acknowledged, for the sender).
    network::ChunkBitset completed_chunks() const;

    const std::string& id() const { return id_; }
    TransferRole role() const { return role_; }
    const PeerId& peer() const { return peer_; }
    const storage::Manifest& manifest() const { return *manifest_; }
    std::shared_ptr<const storage::Manifest> shared_manifest() const { return manifest_; }
    Clock::time_point started_at() const { return started_at_; }

private:
    struct InFlight {
        Clock::time_point sent_at;
        bool sent;
    };

    struct Outgoing {
        std::vector<std::uint8_t> frame;
        std::optional<std::uint32_t> chunk_index;
    };

    TransferSession(TransferRole role,
                    std::shared_ptr<const storage::Manifest> manifest,
                    PeerId peer,
                    std::shared_ptr<storage::ChunkStore> store,
                    std::shared_ptr<network::Transport> transport,
                    TransferOptions options);

    void start();
    void reader_loop();
    void schedule_tick();
    void on_tick();

    void begin_send();
    void begin_receive();

    void handle_frame(const std::vector<std::uint8_t>& frame);
    void handle_message(network::Message& message);
    void handle_transport_status(network::TransportStatus status);

    // sender
    void on_accept(const network::TransferAccept& accept);
    void on_reject(const network::TransferReject& reject);
    void on_ack(const network::ChunkAck& ack);
    void on_nack(const network::ChunkNack& nack);
    void fill_window();
    std::optional<std::uint32_t> next_chunk_to_send();
    void requeue(std::uint32_t index);
    void record_loss();
    void check_timeouts(Clock::time_point now);
    void check_sender_done();
    void merge_peer_bitset(const network::ChunkBitset& bits);

    // receiver
    void on_chunk(network::ChunkData& chunk);
    void on_complete(const network::TransferComplete& complete);
    void enter_completing();

    // both
    void on_abort(const network::TransferAbort& abort);
    void on_pause(const network::TransferPause& pause);
    void on_resume(const network::TransferResume& resume);
    Result do_pause();
    Result do_resume();
    void do_resume_local();
    void do_cancel();

    bool send_message(const network::Message& message, std::optional<std::uint32_t> chunk_index = std::nullopt);
    void flush_outbox();
    void drop_outgoing_chunk(std::uint32_t index);
    void mark_completed(std::uint32_t index);

    void set_state(TransferState state);
    void abort(ErrorCode error, network::AbortReason reason, const std::string& detail);
    void finish(TransferState state, Result result);

    template<typename T>
    Result run_on_loop(T&& fn);

    std::string id_;
    TransferRole role_;
    std::shared_ptr<const storage::Manifest> manifest_;
    PeerId peer_;
    std::shared_ptr<storage::ChunkStore> store_;
    std::shared_ptr<network::Transport> transport_;
    TransferOptions options_;
    Clock::time_point started_at_;

    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    boost::asio::steady_timer tick_timer_;
    std::thread loop_thread_;
    std::thread reader_thread_;

    // Loop-thread state
    WindowController window_;
    SpeedTracker speed_;
    network::ChunkBitset completed_;
    mutable std::mutex completed_mutex_;
    std::map<std::uint32_t, InFlight> in_flight_;
    std::set<std::uint32_t> retry_queue_;
    std::uint32_t next_index_ = 0;
    std::vector<std::uint32_t> timeouts_per_chunk_;
    std::deque<Outgoing> outbox_;
    std::uint32_t consecutive_integrity_failures_ = 0;
    std::uint32_t malformed_count_ = 0;
    Clock::time_point phase_deadline_;
    Clock::time_point last_chunk_at_;
    bool complete_sent_ = false;

    // Readable from any thread
    std::atomic<TransferState> state_{TransferState::IDLE};
    std::atomic<bool> cancel_requested_{false};
    std::atomic<std::uint32_t> completed_count_{0};
    std::atomic<std::uint64_t> bytes_transferred_{0};
    std::atomic<std::uint32_t> in_flight_count_{0};
    std::atomic<std::uint32_t> window_size_{WindowController::W_INIT};
    std::atomic<std::uint64_t> speed_bps_{0};

    mutable std::mutex outcome_mutex_;
    std::condition_variable outcome_cv_;
    std::optional<TransferOutcome> outcome_;
};

} // namespace chunkstream::transfer
