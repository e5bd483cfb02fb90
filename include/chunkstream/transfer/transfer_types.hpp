#pragma once

#include "../core/result.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace chunkstream::core {
class Config;
}

namespace chunkstream::transfer {

using PeerId = std::string;

enum class TransferRole {
    SENDER,
    RECEIVER
};

enum class TransferState {
    IDLE,
    NEGOTIATING,
    TRANSFERRING,
    PAUSED,
    COMPLETING,
    COMPLETED,
    FAILED,
    CANCELLED
};

const char* transfer_role_name(TransferRole role);
const char* transfer_state_name(TransferState state);

inline bool is_terminal(TransferState state) {
    return state == TransferState::COMPLETED ||
           state == TransferState::FAILED ||
           state == TransferState::CANCELLED;
}

struct TransferProgress {
    TransferState state = TransferState::IDLE;
    uint32_t completed_chunks = 0;   // includes chunks the receiver already had
    uint32_t total_chunks = 0;
    uint64_t bytes_transferred = 0;  // moved by this session only
    uint64_t total_bytes = 0;
    uint32_t in_flight = 0;
    uint32_t window = 0;
    uint64_t speed_bps = 0;

    double percentage() const {
        return total_chunks == 0 ? 0.0 : 100.0 * completed_chunks / total_chunks;
    }
};

struct TransferOutcome {
    TransferState state = TransferState::IDLE;
    Result result;

    bool completed() const { return state == TransferState::COMPLETED; }
    bool cancelled() const { return state == TransferState::CANCELLED; }
    bool failed() const { return state == TransferState::FAILED; }
};

struct TransferOptions {
    std::chrono::milliseconds negotiation_timeout{30000};
    std::chrono::milliseconds tick_interval{25};
    std::chrono::milliseconds min_chunk_timeout{2000};
    uint32_t max_chunk_retries = 3;
    std::chrono::milliseconds overall_timeout{0}; // 0 disables
    uint32_t max_consecutive_integrity_failures = 8;
    uint32_t max_malformed_frames = 8;

    static TransferOptions from_config(const core::Config& config);
};

} // namespace chunkstream::transfer
