#pragma once

#include "../core/result.hpp"
#include "../storage/manifest.hpp"
#include <boost/dynamic_bitset.hpp>
#include <cstdint>
#include <concepts>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace chunkstream::network {

// Frame: u32 big-endian length (tag + body), u8 tag, body.
constexpr std::size_t FRAME_HEADER_SIZE = 5;
constexpr std::uint32_t MAX_MESSAGE_SIZE = 64 * 1024;
constexpr std::uint32_t HEADER_OVERHEAD = 512;
constexpr std::uint32_t MAX_CHUNK_FRAME = storage::CHUNK_MAX + HEADER_OVERHEAD;

enum class MessageType : std::uint8_t {
    TRANSFER_REQUEST  = 1,
    TRANSFER_ACCEPT   = 2,
    TRANSFER_REJECT   = 3,
    CHUNK_DATA        = 4,
    CHUNK_ACK         = 5,
    CHUNK_NACK        = 6,
    TRANSFER_COMPLETE = 7,
    TRANSFER_ABORT    = 8,
    TRANSFER_PAUSE    = 9,
    TRANSFER_RESUME   = 10
};

enum class NackReason : std::uint8_t {
    INTEGRITY_FAILED  = 1,
    MALFORMED         = 2,
    STORAGE_FULL      = 3,
    MANIFEST_MISMATCH = 4,
    IO_ERROR          = 5
};

enum class AbortReason : std::uint8_t {
    CANCELLED          = 1,
    PROTOCOL_VIOLATION = 2,
    INTEGRITY_FAILED   = 3,
    STALLED            = 4,
    STORAGE_ERROR      = 5,
    CORRUPTED          = 6
};

const char* message_type_name(MessageType type);
const char* nack_reason_name(NackReason reason);
const char* abort_reason_name(AbortReason reason);

// Transient NACKs are retried by the sender, the others end the transfer.
inline bool is_transient(NackReason reason) {
    return reason == NackReason::INTEGRITY_FAILED || reason == NackReason::MALFORMED;
}

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

// A TransferRequest that decoded cleanly but whose manifest failed validation.
class ManifestError : public ProtocolError {
public:
    ManifestError(std::string file_id, Result result)
        : ProtocolError("Invalid manifest for " + file_id + ": " + result.message)
        , file_id_(std::move(file_id)), result_(std::move(result)) {}

    const std::string& file_id() const { return file_id_; }
    const Result& result() const { return result_; }

private:
    std::string file_id_;
    Result result_;
};

template<typename T>
concept MessagePayload = requires(T t) {
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
};

using ChunkBitset = boost::dynamic_bitset<>;

struct TransferRequest {
    static constexpr MessageType TYPE = MessageType::TRANSFER_REQUEST;

    std::string file_id;
    storage::Manifest manifest;

    std::vector<std::uint8_t> serialize() const;
    static TransferRequest deserialize(std::span<const std::uint8_t> data);
    bool operator==(const TransferRequest& other) const = default;
};

struct TransferAccept {
    static constexpr MessageType TYPE = MessageType::TRANSFER_ACCEPT;

    std::string file_id;
    ChunkBitset already_have;

    std::vector<std::uint8_t> serialize() const;
    static TransferAccept deserialize(std::span<const std::uint8_t> data);
    bool operator==(const TransferAccept& other) const = default;
};

struct TransferReject {
    static constexpr MessageType TYPE = MessageType::TRANSFER_REJECT;

    std::string file_id;
    std::string reason;

    std::vector<std::uint8_t> serialize() const;
    static TransferReject deserialize(std::span<const std::uint8_t> data);
    bool operator==(const TransferReject& other) const = default;
};

struct ChunkData {
    static constexpr MessageType TYPE = MessageType::CHUNK_DATA;

    std::string file_id;
    std::uint32_t index = 0;
    std::vector<std::uint8_t> bytes;

    std::vector<std::uint8_t> serialize() const;
    static ChunkData deserialize(std::span<const std::uint8_t> data);
    bool operator==(const ChunkData& other) const = default;
};

struct ChunkAck {
    static constexpr MessageType TYPE = MessageType::CHUNK_ACK;

    std::string file_id;
    std::uint32_t index = 0;

    std::vector<std::uint8_t> serialize() const;
    static ChunkAck deserialize(std::span<const std::uint8_t> data);
    bool operator==(const ChunkAck& other) const = default;
};

struct ChunkNack {
    static constexpr MessageType TYPE = MessageType::CHUNK_NACK;

    std::string file_id;
    std::uint32_t index = 0;
    NackReason reason = NackReason::INTEGRITY_FAILED;

    std::vector<std::uint8_t> serialize() const;
    static ChunkNack deserialize(std::span<const std::uint8_t> data);
    bool operator==(const ChunkNack& other) const = default;
};

struct TransferComplete {
    static constexpr MessageType TYPE = MessageType::TRANSFER_COMPLETE;

    std::string file_id;

    std::vector<std::uint8_t> serialize() const;
    static TransferComplete deserialize(std::span<const std::uint8_t> data);
    bool operator==(const TransferComplete& other) const = default;
};

struct TransferAbort {
    static constexpr MessageType TYPE = MessageType::TRANSFER_ABORT;

    std::string file_id;
    AbortReason reason = AbortReason::CANCELLED;
    std::string detail;

    std::vector<std::uint8_t> serialize() const;
    static TransferAbort deserialize(std::span<const std::uint8_t> data);
    bool operator==(const TransferAbort& other) const = default;
};

struct TransferPause {
    static constexpr MessageType TYPE = MessageType::TRANSFER_PAUSE;

    std::string file_id;

    std::vector<std::uint8_t> serialize() const;
    static TransferPause deserialize(std::span<const std::uint8_t> data);
    bool operator==(const TransferPause& other) const = default;
};

// The receiver fills already_have with its completion bitset; the sender leaves it empty.
struct TransferResume {
    static constexpr MessageType TYPE = MessageType::TRANSFER_RESUME;

    std::string file_id;
    ChunkBitset already_have;

    std::vector<std::uint8_t> serialize() const;
    static TransferResume deserialize(std::span<const std::uint8_t> data);
    bool operator==(const TransferResume& other) const = default;
};

using Message = std::variant<TransferRequest, TransferAccept, TransferReject, ChunkData, ChunkAck,
                             ChunkNack, TransferComplete, TransferAbort, TransferPause, TransferResume>;

// Manifest body as carried by TransferRequest; also used by the resume journal.
std::vector<std::uint8_t> encode_manifest(const storage::Manifest& manifest);
storage::Manifest decode_manifest(std::span<const std::uint8_t> data);

}

static_assert(chunkstream::network::MessagePayload<chunkstream::network::TransferRequest>);
static_assert(chunkstream::network::MessagePayload<chunkstream::network::ChunkData>);
static_assert(chunkstream::network::MessagePayload<chunkstream::network::TransferAbort>);
