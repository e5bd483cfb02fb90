#pragma once

#include "../core/result.hpp"
#include "../crypto/crypto_types.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace chunkstream::storage {

// Content-addressed chunk storage. Implementations must be safe to call from
// several sessions at once.
class ChunkStore {
public:
    virtual ~ChunkStore() = default;

    // Idempotent for an id already present. STORAGE_FULL or IO_ERROR on failure.
    virtual Result put(const crypto::ChunkId& id, std::span<const std::uint8_t> bytes) = 0;

    // NOT_FOUND or IO_ERROR on failure.
    virtual Result get(const crypto::ChunkId& id, std::vector<std::uint8_t>& out) = 0;

    virtual bool has(const crypto::ChunkId& id) = 0;
    virtual std::optional<std::uint32_t> size(const crypto::ChunkId& id) = 0;
};

class MemoryChunkStore : public ChunkStore {
public:
    // capacity_bytes == 0 means unbounded
    explicit MemoryChunkStore(std::uint64_t capacity_bytes = 0);

    Result put(const crypto::ChunkId& id, std::span<const std::uint8_t> bytes) override;
    Result get(const crypto::ChunkId& id, std::vector<std::uint8_t>& out) override;
    bool has(const crypto::ChunkId& id) override;
    std::optional<std::uint32_t> size(const crypto::ChunkId& id) override;

    bool remove(const crypto::ChunkId& id);
    size_t chunk_count() const;
    std::uint64_t used_bytes() const;

private:
    mutable std::mutex mutex_;
    std::map<crypto::ChunkId, std::vector<std::uint8_t>> chunks_;
    std::uint64_t capacity_bytes_;
    std::uint64_t used_bytes_ = 0;
};

} // namespace chunkstream::storage
