#include "chunkstream/storage/chunk_store.hpp"

namespace chunkstream::storage {

MemoryChunkStore::MemoryChunkStore(std::uint64_t capacity_bytes)
    : capacity_bytes_(capacity_bytes) {
}

Result MemoryChunkStore::put(const crypto::ChunkId& id, std::span<const std::uint8_t> bytes) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (chunks_.count(id)) {
        return Result();
    }

    if (capacity_bytes_ > 0 && used_bytes_ + bytes.size() > capacity_bytes_) {
        return Result(ErrorCode::STORAGE_FULL,
                      "Memory store capacity of " + std::to_string(capacity_bytes_) + " bytes reached");
    }

    chunks_.emplace(id, std::vector<std::uint8_t>(bytes.begin(), bytes.end()));
    used_bytes_ += bytes.size();
    return Result();
}

Result MemoryChunkStore::get(const crypto::ChunkId& id, std::vector<std::uint8_t>& out) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = chunks_.find(id);
    if (it == chunks_.end()) {
        return Result(ErrorCode::NOT_FOUND, "Chunk not in store");
    }

    out = it->second;
    return Result();
}

bool MemoryChunkStore::has(const crypto::ChunkId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.count(id) > 0;
}

std::optional<std::uint32_t> MemoryChunkStore::size(const crypto::ChunkId& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = chunks_.find(id);
    if (it == chunks_.end()) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(it->second.size());
}

bool MemoryChunkStore::remove(const crypto::ChunkId& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = chunks_.find(id);
    if (it == chunks_.end()) {
        return false;
    }
    used_bytes_ -= it->second.size();
    chunks_.erase(it);
    return true;
}

size_t MemoryChunkStore::chunk_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

std::uint64_t MemoryChunkStore::used_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_bytes_;
}

} // namespace chunkstream::storage
