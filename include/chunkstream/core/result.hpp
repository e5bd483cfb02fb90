#pragma once

#include <string>
#include <utility>

namespace chunkstream {

enum class ErrorCode {
    SUCCESS = 0,

    // Manifest construction
    MANIFEST_INVALID,
    CHUNK_OVERSIZE,
    EMPTY_MANIFEST,

    // Session failures
    PROTOCOL_VIOLATION,
    INTEGRITY_FAILED,
    STALLED,
    STORAGE_ERROR,
    PEER_ABORTED,
    CANCELLED,
    REJECTED,
    TRANSPORT_CLOSED,
    CORRUPTED,

    // Chunk store
    STORAGE_FULL,
    NOT_FOUND,
    IO_ERROR,

    INVALID_STATE,
    LIMIT_REACHED
};

const char* error_code_name(ErrorCode code);

struct Result {
    ErrorCode error;
    std::string message;

    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }
};

} // namespace chunkstream
