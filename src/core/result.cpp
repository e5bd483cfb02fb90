#include "chunkstream/core/result.hpp"

namespace chunkstream {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:            return "Success";
        case ErrorCode::MANIFEST_INVALID:   return "ManifestInvalid";
        case ErrorCode::CHUNK_OVERSIZE:     return "ChunkOversize";
        case ErrorCode::EMPTY_MANIFEST:     return "EmptyManifest";
        case ErrorCode::PROTOCOL_VIOLATION: return "ProtocolViolation";
        case ErrorCode::INTEGRITY_FAILED:   return "IntegrityFailed";
        case ErrorCode::STALLED:            return "Stalled";
        case ErrorCode::STORAGE_ERROR:      return "StorageError";
        case ErrorCode::PEER_ABORTED:       return "PeerAborted";
        case ErrorCode::CANCELLED:          return "Cancelled";
        case ErrorCode::REJECTED:           return "Rejected";
        case ErrorCode::TRANSPORT_CLOSED:   return "TransportClosed";
        case ErrorCode::CORRUPTED:          return "Corrupted";
        case ErrorCode::STORAGE_FULL:       return "StorageFull";
        case ErrorCode::NOT_FOUND:          return "NotFound";
        case ErrorCode::IO_ERROR:           return "IoError";
        case ErrorCode::INVALID_STATE:      return "InvalidState";
        case ErrorCode::LIMIT_REACHED:      return "LimitReached";
    }
    return "Unknown";
}

} // namespace chunkstream
