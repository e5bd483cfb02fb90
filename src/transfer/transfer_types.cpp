#include "chunkstream/transfer/transfer_types.hpp"
#include "chunkstream/core/config.hpp"

namespace chunkstream::transfer {

const char* transfer_role_name(TransferRole role) {
    return role == TransferRole::SENDER ? "sender" : "receiver";
}

const char* transfer_state_name(TransferState state) {
    switch (state) {
        case TransferState::IDLE: return "Idle";
        case TransferState::NEGOTIATING: return "Negotiating";
        case TransferState::TRANSFERRING: return "Transferring";
        case TransferState::PAUSED: return "Paused";
        case TransferState::COMPLETING: return "Completing";
        case TransferState::COMPLETED: return "Completed";
        case TransferState::FAILED: return "Failed";
        case TransferState::CANCELLED: return "Cancelled";
    }
    return "Unknown";
}

TransferOptions TransferOptions::from_config(const core::Config& config) {
    TransferOptions options;

    options.negotiation_timeout = std::chrono::milliseconds(
        config.get_uint64("transfer.negotiation_timeout_ms", options.negotiation_timeout.count()));
    options.tick_interval = std::chrono::milliseconds(
        config.get_uint64("transfer.tick_interval_ms", options.tick_interval.count()));
    options.min_chunk_timeout = std::chrono::milliseconds(
        config.get_uint64("transfer.min_chunk_timeout_ms", options.min_chunk_timeout.count()));
    options.max_chunk_retries = static_cast<uint32_t>(
        config.get_uint64("transfer.max_chunk_retries", options.max_chunk_retries));
    options.overall_timeout = std::chrono::milliseconds(
        config.get_uint64("transfer.overall_timeout_ms", options.overall_timeout.count()));

    if (options.tick_interval.count() <= 0) {
        options.tick_interval = std::chrono::milliseconds(25);
    }

    return options;
}

} // namespace chunkstream::transfer
