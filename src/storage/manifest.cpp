#include "chunkstream/storage/manifest.hpp"
#include "chunkstream/crypto/hash.hpp"
#include <sodium.h>

namespace chunkstream::storage {

Result Manifest::build(std::string file_id,
                       std::vector<ChunkDescriptor> chunks,
                       ManifestMetadata metadata,
                       Manifest& out) {
    if (file_id.empty() || file_id.size() > MAX_FILE_ID_LENGTH) {
        return Result(ErrorCode::MANIFEST_INVALID,
                      "File id must be 1.." + std::to_string(MAX_FILE_ID_LENGTH) + " bytes");
    }

    if (chunks.empty()) {
        return Result(ErrorCode::EMPTY_MANIFEST, "Manifest has no chunks");
    }

    if (metadata.filename && metadata.filename->size() > MAX_FILENAME_LENGTH) {
        return Result(ErrorCode::MANIFEST_INVALID, "Filename too long");
    }
    if (metadata.mime && metadata.mime->size() > MAX_MIME_LENGTH) {
        return Result(ErrorCode::MANIFEST_INVALID, "Mime type too long");
    }

    std::uint64_t total_size = 0;
    for (size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];

        if (chunk.index != i) {
            return Result(ErrorCode::MANIFEST_INVALID,
                          "Chunk indices are not contiguous at position " + std::to_string(i));
        }
        if (chunk.size == 0) {
            return Result(ErrorCode::MANIFEST_INVALID,
                          "Chunk " + std::to_string(i) + " is empty");
        }
        if (chunk.size > CHUNK_MAX) {
            return Result(ErrorCode::CHUNK_OVERSIZE,
                          "Chunk " + std::to_string(i) + " is " + std::to_string(chunk.size) +
                          " bytes, limit is " + std::to_string(CHUNK_MAX));
        }

        total_size += chunk.size;
    }

    Manifest manifest;
    manifest.file_id_ = std::move(file_id);
    manifest.total_size_ = total_size;
    manifest.file_hash_ = compute_file_hash(chunks);
    manifest.chunks_ = std::move(chunks);
    manifest.metadata_ = std::move(metadata);

    out = std::move(manifest);
    return Result();
}

Result Manifest::from_wire(std::string file_id,
                           std::vector<ChunkDescriptor> chunks,
                           ManifestMetadata metadata,
                           std::uint64_t advertised_total_size,
                           const crypto::Sha256Hash& advertised_file_hash,
                           Manifest& out) {
    Manifest manifest;
    auto result = build(std::move(file_id), std::move(chunks), std::move(metadata), manifest);
    if (!result) {
        return result;
    }

    if (manifest.total_size_ != advertised_total_size) {
        return Result(ErrorCode::MANIFEST_INVALID,
                      "Advertised total size " + std::to_string(advertised_total_size) +
                      " does not match chunk sizes (" + std::to_string(manifest.total_size_) + ")");
    }

    if (manifest.file_hash_ != advertised_file_hash) {
        return Result(ErrorCode::MANIFEST_INVALID, "Advertised file hash does not match chunk ids");
    }

    out = std::move(manifest);
    return Result();
}

crypto::Sha256Hash Manifest::compute_file_hash(const std::vector<ChunkDescriptor>& chunks) {
    crypto::Sha256Hasher hasher;
    for (const auto& chunk : chunks) {
        // update() only fails after finalize()
        hasher.update(std::span<const std::uint8_t>(chunk.chunk_id));
    }
    return hasher.finalize();
}

bool Manifest::verify_chunk(const ChunkDescriptor& descriptor, std::span<const std::uint8_t> bytes) {
    if (bytes.size() != descriptor.size) {
        return false;
    }
    return crypto::hash_utils::verify_hash(bytes, descriptor.chunk_id);
}

bool Manifest::verify_file(const std::vector<crypto::ChunkId>& chunk_ids_in_order) const {
    crypto::Sha256Hasher hasher;
    for (const auto& chunk_id : chunk_ids_in_order) {
        hasher.update(std::span<const std::uint8_t>(chunk_id));
    }
    auto computed = hasher.finalize();
    return sodium_memcmp(computed.data(), file_hash_.data(), computed.size()) == 0;
}

std::vector<crypto::ChunkId> Manifest::chunk_ids() const {
    std::vector<crypto::ChunkId> ids;
    ids.reserve(chunks_.size());
    for (const auto& chunk : chunks_) {
        ids.push_back(chunk.chunk_id);
    }
    return ids;
}

} // namespace chunkstream::storage
