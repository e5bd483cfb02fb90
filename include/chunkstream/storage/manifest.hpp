#pragma once

#include "../core/result.hpp"
#include "../crypto/crypto_types.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace chunkstream::storage {

constexpr std::uint32_t CHUNK_MAX = 256 * 1024;
constexpr size_t MAX_FILE_ID_LENGTH = 255;
constexpr size_t MAX_FILENAME_LENGTH = 1024;
constexpr size_t MAX_MIME_LENGTH = 255;

struct ChunkDescriptor {
    crypto::ChunkId chunk_id;
    std::uint32_t index;
    std::uint32_t size;

    bool operator==(const ChunkDescriptor& other) const = default;
};

// Advisory metadata. Never consulted by the transfer protocol.
struct ManifestMetadata {
    std::optional<std::string> filename;
    std::optional<std::string> mime;
    std::optional<crypto::Sha256Hash> plaintext_hash;

    bool operator==(const ManifestMetadata& other) const = default;
};

// Immutable description of a file as an ordered list of content-addressed chunks.
// file_hash is SHA-256 over chunk_id[0] || ... || chunk_id[N-1], not over the plaintext.
class Manifest {
public:
    Manifest() = default;

    static Result build(std::string file_id,
                        std::vector<ChunkDescriptor> chunks,
                        ManifestMetadata metadata,
                        Manifest& out);

    // Rebuilds a manifest received from a peer and checks the advertised aggregate
    // values against the recomputed ones.
    static Result from_wire(std::string file_id,
                            std::vector<ChunkDescriptor> chunks,
                            ManifestMetadata metadata,
                            std::uint64_t advertised_total_size,
                            const crypto::Sha256Hash& advertised_file_hash,
                            Manifest& out);

    static crypto::Sha256Hash compute_file_hash(const std::vector<ChunkDescriptor>& chunks);
    static bool verify_chunk(const ChunkDescriptor& descriptor, std::span<const std::uint8_t> bytes);

    bool verify_file(const std::vector<crypto::ChunkId>& chunk_ids_in_order) const;

    const std::string& file_id() const { return file_id_; }
    std::uint64_t total_size() const { return total_size_; }
    const crypto::Sha256Hash& file_hash() const { return file_hash_; }
    const std::vector<ChunkDescriptor>& chunks() const { return chunks_; }
    const ChunkDescriptor& chunk(std::uint32_t index) const { return chunks_.at(index); }
    std::uint32_t chunk_count() const { return static_cast<std::uint32_t>(chunks_.size()); }
    const ManifestMetadata& metadata() const { return metadata_; }

    std::vector<crypto::ChunkId> chunk_ids() const;

    bool operator==(const Manifest& other) const = default;

private:
    std::string file_id_;
    std::uint64_t total_size_ = 0;
    crypto::Sha256Hash file_hash_{};
    std::vector<ChunkDescriptor> chunks_;
    ManifestMetadata metadata_;
};

} // namespace chunkstream::storage
