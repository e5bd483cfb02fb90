#pragma once

#include "chunk_store.hpp"
#include "storage_config.hpp"
#include <filesystem>
#include <mutex>

namespace chunkstream::storage {

// Chunk store laid out on disk by chunk id. Writes go to a temporary file that is
// renamed into place, so a reader never sees a partial chunk.
class FileChunkStore : public ChunkStore {
public:
    explicit FileChunkStore(const StorageConfig& config);

    // Creates the directory tree and accounts for chunks already on disk.
    Result initialize();

    Result put(const crypto::ChunkId& id, std::span<const std::uint8_t> bytes) override;
    Result get(const crypto::ChunkId& id, std::vector<std::uint8_t>& out) override;
    bool has(const crypto::ChunkId& id) override;
    std::optional<std::uint32_t> size(const crypto::ChunkId& id) override;

    Result remove(const crypto::ChunkId& id);

    std::uint64_t used_bytes() const;
    const StorageConfig& config() const { return config_; }

private:
    StorageConfig config_;
    mutable std::mutex mutex_;
    std::uint64_t used_bytes_ = 0;
};

} // namespace chunkstream::storage
