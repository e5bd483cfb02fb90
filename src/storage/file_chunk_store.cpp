#include "chunkstream/storage/file_chunk_store.hpp"
#include "chunkstream/storage/manifest.hpp"
#include "chunkstream/crypto/random.hpp"
#include "chunkstream/core/logger.hpp"
#include <algorithm>
#include <fstream>

namespace chunkstream::storage {

FileChunkStore::FileChunkStore(const StorageConfig& config) : config_(config) {
}

Result FileChunkStore::initialize() {
    if (!config_.validate()) {
        return Result(ErrorCode::IO_ERROR, "Invalid storage configuration");
    }

    if (!config_.create_directories()) {
        return Result(ErrorCode::IO_ERROR,
                      "Failed to create storage directories under " + config_.chunk_directory.string());
    }

    std::error_code ec;
    std::uint64_t total = 0;
    for (auto it = std::filesystem::recursive_directory_iterator(config_.chunk_directory, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file() && it->path().extension() == ".chunk") {
            total += it->file_size();
        }
    }
    if (ec) {
        return Result(ErrorCode::IO_ERROR, "Failed to scan chunk directory: " + ec.message());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    used_bytes_ = total;

    LOG_INFO("Chunk store at {} holds {} bytes (limit {})",
             config_.chunk_directory.string(), used_bytes_, config_.max_storage_size);
    return Result();
}

Result FileChunkStore::put(const crypto::ChunkId& id, std::span<const std::uint8_t> bytes) {
    auto chunk_path = config_.get_chunk_path(id);

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (std::filesystem::exists(chunk_path, ec)) {
        return Result();
    }

    if (used_bytes_ + bytes.size() > config_.max_storage_size) {
        return Result(ErrorCode::STORAGE_FULL,
                      "Storage limit of " + std::to_string(config_.max_storage_size) + " bytes reached");
    }

    std::filesystem::create_directories(chunk_path.parent_path(), ec);
    if (ec) {
        return Result(ErrorCode::IO_ERROR, "Failed to create " + chunk_path.parent_path().string() +
                      ": " + ec.message());
    }

    auto temp_path = chunk_path;
    temp_path += ".tmp." + crypto::SecureRandom::generate_hex(8);

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return Result(ErrorCode::IO_ERROR, "Failed to open " + temp_path.string());
        }

        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file.good()) {
            file.close();
            std::filesystem::remove(temp_path, ec);
            return Result(ErrorCode::IO_ERROR, "Failed to write " + temp_path.string());
        }
    }

    std::filesystem::rename(temp_path, chunk_path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return Result(ErrorCode::IO_ERROR, "Failed to move chunk into place: " + ec.message());
    }

    used_bytes_ += bytes.size();
    return Result();
}

Result FileChunkStore::get(const crypto::ChunkId& id, std::vector<std::uint8_t>& out) {
    auto chunk_path = config_.get_chunk_path(id);

    std::ifstream file(chunk_path, std::ios::binary);
    if (!file.is_open()) {
        std::error_code ec;
        if (!std::filesystem::exists(chunk_path, ec)) {
            return Result(ErrorCode::NOT_FOUND, "Chunk not in store");
        }
        return Result(ErrorCode::IO_ERROR, "Failed to open " + chunk_path.string());
    }

    file.seekg(0, std::ios::end);
    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    if (size < 0 || static_cast<std::uint64_t>(size) > CHUNK_MAX) {
        return Result(ErrorCode::IO_ERROR, "Chunk file has invalid size: " + chunk_path.string());
    }

    out.resize(static_cast<size_t>(size));
    file.read(reinterpret_cast<char*>(out.data()), size);
    if (file.gcount() != size) {
        return Result(ErrorCode::IO_ERROR, "Short read from " + chunk_path.string());
    }

    return Result();
}

bool FileChunkStore::has(const crypto::ChunkId& id) {
    std::error_code ec;
    return std::filesystem::is_regular_file(config_.get_chunk_path(id), ec);
}

std::optional<std::uint32_t> FileChunkStore::size(const crypto::ChunkId& id) {
    std::error_code ec;
    auto size = std::filesystem::file_size(config_.get_chunk_path(id), ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(size);
}

Result FileChunkStore::remove(const crypto::ChunkId& id) {
    auto chunk_path = config_.get_chunk_path(id);

    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    auto size = std::filesystem::file_size(chunk_path, ec);
    if (ec) {
        return Result(ErrorCode::NOT_FOUND, "Chunk not in store");
    }

    if (!std::filesystem::remove(chunk_path, ec) || ec) {
        return Result(ErrorCode::IO_ERROR, "Failed to remove " + chunk_path.string());
    }

    used_bytes_ -= std::min<std::uint64_t>(used_bytes_, size);
    return Result();
}

std::uint64_t FileChunkStore::used_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_bytes_;
}

} // namespace chunkstream::storage
