#include "chunkstream/network/protocol.hpp"
#include <algorithm>

namespace chunkstream::network {

namespace {
    constexpr std::uint8_t HAS_FILENAME = 0x01;
    constexpr std::uint8_t HAS_MIME = 0x02;
    constexpr std::uint8_t HAS_PLAINTEXT_HASH = 0x04;

    constexpr std::size_t WIRE_CHUNK_SIZE = crypto::SHA256_HASH_SIZE + 4;

    void write_uint8(std::vector<std::uint8_t>& buffer, std::uint8_t value) {
        buffer.push_back(value);
    }

    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }

    void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
        write_uint32(buffer, static_cast<std::uint32_t>(value >> 32));
        write_uint32(buffer, static_cast<std::uint32_t>(value & 0xFFFFFFFF));
    }

    void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
        write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
        buffer.insert(buffer.end(), str.begin(), str.end());
    }

    void write_hash(std::vector<std::uint8_t>& buffer, const crypto::Sha256Hash& hash) {
        buffer.insert(buffer.end(), hash.begin(), hash.end());
    }

    // u32 bit count followed by ceil(bits / 8) bytes, bit i in byte i / 8 at position i % 8.
    void write_bitset(std::vector<std::uint8_t>& buffer, const ChunkBitset& bits) {
        write_uint32(buffer, static_cast<std::uint32_t>(bits.size()));
        std::vector<std::uint8_t> packed((bits.size() + 7) / 8, 0);
        for (auto i = bits.find_first(); i != ChunkBitset::npos; i = bits.find_next(i)) {
            packed[i / 8] |= static_cast<std::uint8_t>(1u << (i % 8));
        }
        buffer.insert(buffer.end(), packed.begin(), packed.end());
    }

    std::uint8_t read_uint8(std::span<const std::uint8_t>& data) {
        if (data.empty()) throw ProtocolError("Insufficient data for uint8");
        std::uint8_t value = data[0];
        data = data.subspan(1);
        return value;
    }

    std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
        if (data.size() < 4) throw ProtocolError("Insufficient data for uint32");
        std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                             (static_cast<std::uint32_t>(data[1]) << 16) |
                             (static_cast<std::uint32_t>(data[2]) << 8) |
                             static_cast<std::uint32_t>(data[3]);
        data = data.subspan(4);
        return value;
    }

    std::uint64_t read_uint64(std::span<const std::uint8_t>& data) {
        std::uint64_t high = read_uint32(data);
        std::uint64_t low = read_uint32(data);
        return (high << 32) | low;
    }

    std::string read_string(std::span<const std::uint8_t>& data, std::size_t max_length) {
        auto length = read_uint32(data);
        if (length > max_length) throw ProtocolError("String length " + std::to_string(length) + " over limit");
        if (data.size() < length) throw ProtocolError("Insufficient data for string");
        std::string str(reinterpret_cast<const char*>(data.data()), length);
        data = data.subspan(length);
        return str;
    }

    std::string read_file_id(std::span<const std::uint8_t>& data) {
        auto file_id = read_string(data, storage::MAX_FILE_ID_LENGTH);
        if (file_id.empty()) throw ProtocolError("Empty file id");
        return file_id;
    }

    crypto::Sha256Hash read_hash(std::span<const std::uint8_t>& data) {
        if (data.size() < crypto::SHA256_HASH_SIZE) throw ProtocolError("Insufficient data for hash");
        crypto::Sha256Hash hash;
        std::copy_n(data.begin(), crypto::SHA256_HASH_SIZE, hash.begin());
        data = data.subspan(crypto::SHA256_HASH_SIZE);
        return hash;
    }

    ChunkBitset read_bitset(std::span<const std::uint8_t>& data) {
        auto bit_count = read_uint32(data);
        std::size_t byte_count = (static_cast<std::size_t>(bit_count) + 7) / 8;
        if (data.size() < byte_count) throw ProtocolError("Insufficient data for bitset");

        ChunkBitset bits(bit_count);
        for (std::size_t byte = 0; byte < byte_count; ++byte) {
            auto value = data[byte];
            for (std::size_t bit = 0; bit < 8 && value != 0; ++bit) {
                if (!(value & (1u << bit))) {
                    continue;
                }
                std::size_t index = byte * 8 + bit;
                if (index >= bit_count) throw ProtocolError("Bitset padding bits set");
                bits.set(index);
            }
        }
        data = data.subspan(byte_count);
        return bits;
    }

    void expect_end(std::span<const std::uint8_t> data, const char* what) {
        if (!data.empty()) {
            throw ProtocolError(std::to_string(data.size()) + " trailing bytes after " + what);
        }
    }

    NackReason to_nack_reason(std::uint8_t value) {
        if (value < static_cast<std::uint8_t>(NackReason::INTEGRITY_FAILED) ||
            value > static_cast<std::uint8_t>(NackReason::IO_ERROR)) {
            throw ProtocolError("Unknown NACK reason " + std::to_string(value));
        }
        return static_cast<NackReason>(value);
    }

    AbortReason to_abort_reason(std::uint8_t value) {
        if (value < static_cast<std::uint8_t>(AbortReason::CANCELLED) ||
            value > static_cast<std::uint8_t>(AbortReason::CORRUPTED)) {
            throw ProtocolError("Unknown abort reason " + std::to_string(value));
        }
        return static_cast<AbortReason>(value);
    }

    void write_manifest(std::vector<std::uint8_t>& buffer, const storage::Manifest& manifest) {
        write_string(buffer, manifest.file_id());
        write_uint64(buffer, manifest.total_size());
        write_hash(buffer, manifest.file_hash());

        write_uint32(buffer, manifest.chunk_count());
        for (const auto& chunk : manifest.chunks()) {
            write_hash(buffer, chunk.chunk_id);
            write_uint32(buffer, chunk.size);
        }

        const auto& metadata = manifest.metadata();
        std::uint8_t flags = 0;
        if (metadata.filename) flags |= HAS_FILENAME;
        if (metadata.mime) flags |= HAS_MIME;
        if (metadata.plaintext_hash) flags |= HAS_PLAINTEXT_HASH;
        write_uint8(buffer, flags);

        if (metadata.filename) write_string(buffer, *metadata.filename);
        if (metadata.mime) write_string(buffer, *metadata.mime);
        if (metadata.plaintext_hash) write_hash(buffer, *metadata.plaintext_hash);
    }

    storage::Manifest read_manifest(std::span<const std::uint8_t>& data) {
        auto file_id = read_file_id(data);
        auto total_size = read_uint64(data);
        auto file_hash = read_hash(data);

        auto chunk_count = read_uint32(data);
        if (static_cast<std::uint64_t>(chunk_count) * WIRE_CHUNK_SIZE > data.size()) {
            throw ProtocolError("Chunk count " + std::to_string(chunk_count) + " exceeds frame");
        }

        std::vector<storage::ChunkDescriptor> chunks;
        chunks.reserve(chunk_count);
        for (std::uint32_t i = 0; i < chunk_count; ++i) {
            storage::ChunkDescriptor descriptor;
            descriptor.chunk_id = read_hash(data);
            descriptor.index = i;
            descriptor.size = read_uint32(data);
            chunks.push_back(descriptor);
        }

        auto flags = read_uint8(data);
        if (flags & ~(HAS_FILENAME | HAS_MIME | HAS_PLAINTEXT_HASH)) {
            throw ProtocolError("Unknown manifest flags");
        }

        storage::ManifestMetadata metadata;
        if (flags & HAS_FILENAME) metadata.filename = read_string(data, storage::MAX_FILENAME_LENGTH);
        if (flags & HAS_MIME) metadata.mime = read_string(data, storage::MAX_MIME_LENGTH);
        if (flags & HAS_PLAINTEXT_HASH) metadata.plaintext_hash = read_hash(data);

        storage::Manifest manifest;
        auto result = storage::Manifest::from_wire(file_id, std::move(chunks), std::move(metadata),
                                                   total_size, file_hash, manifest);
        if (!result) {
            throw ManifestError(file_id, result);
        }
        return manifest;
    }
}

const char* message_type_name(MessageType type) {
    switch (type) {
        case MessageType::TRANSFER_REQUEST: return "TransferRequest";
        case MessageType::TRANSFER_ACCEPT: return "TransferAccept";
        case MessageType::TRANSFER_REJECT: return "TransferReject";
        case MessageType::CHUNK_DATA: return "ChunkData";
        case MessageType::CHUNK_ACK: return "ChunkAck";
        case MessageType::CHUNK_NACK: return "ChunkNack";
        case MessageType::TRANSFER_COMPLETE: return "TransferComplete";
        case MessageType::TRANSFER_ABORT: return "TransferAbort";
        case MessageType::TRANSFER_PAUSE: return "TransferPause";
        case MessageType::TRANSFER_RESUME: return "TransferResume";
    }
    return "Unknown";
}

const char* nack_reason_name(NackReason reason) {
    switch (reason) {
        case NackReason::INTEGRITY_FAILED: return "IntegrityFailed";
        case NackReason::MALFORMED: return "Malformed";
        case NackReason::STORAGE_FULL: return "StorageFull";
        case NackReason::MANIFEST_MISMATCH: return "ManifestMismatch";
        case NackReason::IO_ERROR: return "IoError";
    }
    return "Unknown";
}

const char* abort_reason_name(AbortReason reason) {
    switch (reason) {
        case AbortReason::CANCELLED: return "Cancelled";
        case AbortReason::PROTOCOL_VIOLATION: return "ProtocolViolation";
        case AbortReason::INTEGRITY_FAILED: return "IntegrityFailed";
        case AbortReason::STALLED: return "Stalled";
        case AbortReason::STORAGE_ERROR: return "StorageError";
        case AbortReason::CORRUPTED: return "Corrupted";
    }
    return "Unknown";
}

std::vector<std::uint8_t> encode_manifest(const storage::Manifest& manifest) {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(64 + manifest.chunk_count() * WIRE_CHUNK_SIZE);
    write_manifest(buffer, manifest);
    return buffer;
}

storage::Manifest decode_manifest(std::span<const std::uint8_t> data) {
    auto span = data;
    auto manifest = read_manifest(span);
    expect_end(span, "manifest");
    return manifest;
}

std::vector<std::uint8_t> TransferRequest::serialize() const {
    if (file_id != manifest.file_id()) {
        throw std::invalid_argument("TransferRequest file id differs from manifest file id");
    }
    return encode_manifest(manifest);
}

TransferRequest TransferRequest::deserialize(std::span<const std::uint8_t> data) {
    TransferRequest msg;
    msg.manifest = decode_manifest(data);
    msg.file_id = msg.manifest.file_id();
    return msg;
}

std::vector<std::uint8_t> TransferAccept::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_bitset(buffer, already_have);
    return buffer;
}

TransferAccept TransferAccept::deserialize(std::span<const std::uint8_t> data) {
    TransferAccept msg;
    auto span = data;
    msg.file_id = read_file_id(span);
    msg.already_have = read_bitset(span);
    expect_end(span, "TransferAccept");
    return msg;
}

std::vector<std::uint8_t> TransferReject::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_string(buffer, reason);
    return buffer;
}

TransferReject TransferReject::deserialize(std::span<const std::uint8_t> data) {
    TransferReject msg;
    auto span = data;
    // A request that failed to decode is rejected before its file id is known
    msg.file_id = read_string(span, storage::MAX_FILE_ID_LENGTH);
    msg.reason = read_string(span, MAX_MESSAGE_SIZE);
    expect_end(span, "TransferReject");
    return msg;
}

std::vector<std::uint8_t> ChunkData::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(4 + file_id.size() + 8 + bytes.size());
    write_string(buffer, file_id);
    write_uint32(buffer, index);
    write_uint32(buffer, static_cast<std::uint32_t>(bytes.size()));
    buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    return buffer;
}

ChunkData ChunkData::deserialize(std::span<const std::uint8_t> data) {
    ChunkData msg;
    auto span = data;
    msg.file_id = read_file_id(span);
    msg.index = read_uint32(span);

    auto length = read_uint32(span);
    if (length == 0 || length > storage::CHUNK_MAX) {
        throw ProtocolError("Chunk length " + std::to_string(length) + " out of range");
    }
    if (span.size() < length) throw ProtocolError("Insufficient data for chunk bytes");

    msg.bytes.assign(span.begin(), span.begin() + length);
    span = span.subspan(length);
    expect_end(span, "ChunkData");
    return msg;
}

std::vector<std::uint8_t> ChunkAck::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_uint32(buffer, index);
    return buffer;
}

ChunkAck ChunkAck::deserialize(std::span<const std::uint8_t> data) {
    ChunkAck msg;
    auto span = data;
    msg.file_id = read_file_id(span);
    msg.index = read_uint32(span);
    expect_end(span, "ChunkAck");
    return msg;
}

std::vector<std::uint8_t> ChunkNack::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_uint32(buffer, index);
    write_uint8(buffer, static_cast<std::uint8_t>(reason));
    return buffer;
}

ChunkNack ChunkNack::deserialize(std::span<const std::uint8_t> data) {
    ChunkNack msg;
    auto span = data;
    msg.file_id = read_file_id(span);
    msg.index = read_uint32(span);
    msg.reason = to_nack_reason(read_uint8(span));
    expect_end(span, "ChunkNack");
    return msg;
}

std::vector<std::uint8_t> TransferComplete::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    return buffer;
}

TransferComplete TransferComplete::deserialize(std::span<const std::uint8_t> data) {
    TransferComplete msg;
    auto span = data;
    msg.file_id = read_file_id(span);
    expect_end(span, "TransferComplete");
    return msg;
}

std::vector<std::uint8_t> TransferAbort::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_uint8(buffer, static_cast<std::uint8_t>(reason));
    write_string(buffer, detail);
    return buffer;
}

TransferAbort TransferAbort::deserialize(std::span<const std::uint8_t> data) {
    TransferAbort msg;
    auto span = data;
    msg.file_id = read_file_id(span);
    msg.reason = to_abort_reason(read_uint8(span));
    msg.detail = read_string(span, MAX_MESSAGE_SIZE);
    expect_end(span, "TransferAbort");
    return msg;
}

std::vector<std::uint8_t> TransferPause::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    return buffer;
}

TransferPause TransferPause::deserialize(std::span<const std::uint8_t> data) {
    TransferPause msg;
    auto span = data;
    msg.file_id = read_file_id(span);
    expect_end(span, "TransferPause");
    return msg;
}

std::vector<std::uint8_t> TransferResume::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_bitset(buffer, already_have);
    return buffer;
}

TransferResume TransferResume::deserialize(std::span<const std::uint8_t> data) {
    TransferResume msg;
    auto span = data;
    msg.file_id = read_file_id(span);
    msg.already_have = read_bitset(span);
    expect_end(span, "TransferResume");
    return msg;
}

}
