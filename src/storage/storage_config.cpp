#include "chunkstream/storage/storage_config.hpp"
#include "chunkstream/storage/manifest.hpp"
#include "chunkstream/core/config.hpp"
#include "chunkstream/crypto/hash.hpp"

namespace chunkstream::storage {

StorageConfig::StorageConfig(const std::filesystem::path& base_dir) {
    set_base_directory(base_dir);
}

StorageConfig StorageConfig::from_config(const core::Config& config) {
    StorageConfig storage(config.get_string("storage.directory", "./chunkstream_data"));
    storage.max_storage_size = config.get_uint64("storage.max_size", storage.max_storage_size);
    storage.chunk_size = static_cast<uint32_t>(config.get_uint64("chunk.size", storage.chunk_size));
    return storage;
}

bool StorageConfig::validate() const {
    if (chunk_directory.empty() || download_directory.empty() || database_path.empty()) {
        return false;
    }

    if (max_storage_size == 0) {
        return false;
    }

    if (chunk_size == 0 || chunk_size > CHUNK_MAX) {
        return false;
    }

    return true;
}

bool StorageConfig::create_directories() const {
    try {
        std::filesystem::create_directories(chunk_directory);
        std::filesystem::create_directories(download_directory);

        auto db_dir = database_path.parent_path();
        if (!db_dir.empty()) {
            std::filesystem::create_directories(db_dir);
        }

        return true;
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}

uint64_t StorageConfig::get_available_space() const {
    std::error_code ec;
    auto space_info = std::filesystem::space(chunk_directory, ec);
    if (ec) {
        return 0;
    }
    return space_info.available;
}

bool StorageConfig::has_sufficient_space(uint64_t required_bytes) const {
    uint64_t available = get_available_space();

    // Keep at least 100MB free
    uint64_t safety_margin = 100ULL * 1024 * 1024;

    return available > (required_bytes + safety_margin);
}

std::filesystem::path StorageConfig::get_chunk_path(const crypto::ChunkId& chunk_id) const {
    auto hex = crypto::hash_utils::hash_to_hex(chunk_id);
    return chunk_directory / hex.substr(0, 2) / (hex + ".chunk");
}

std::filesystem::path StorageConfig::get_download_path(const std::string& filename) const {
    // Strip any directory components a peer may have put in the advisory name
    auto name = std::filesystem::path(filename).filename();
    if (name.empty() || name == "." || name == "..") {
        name = "download.bin";
    }
    return download_directory / name;
}

void StorageConfig::set_base_directory(const std::filesystem::path& base_dir) {
    chunk_directory = base_dir / "chunks";
    download_directory = base_dir / "downloads";
    database_path = base_dir / "chunkstream.db";
}

} // namespace chunkstream::storage
