#pragma once

#include "../crypto/crypto_types.hpp"
#include <filesystem>
#include <string>
#include <cstdint>

namespace chunkstream::core {
class Config;
}

namespace chunkstream::storage {

struct StorageConfig {
    std::filesystem::path chunk_directory;
    std::filesystem::path download_directory;
    std::filesystem::path database_path;

    uint64_t max_storage_size = 10ULL * 1024 * 1024 * 1024; // 10GB default
    uint32_t chunk_size = 256 * 1024;

    StorageConfig() = default;

    explicit StorageConfig(const std::filesystem::path& base_dir);

    static StorageConfig from_config(const core::Config& config);

    bool validate() const;

    bool create_directories() const;

    uint64_t get_available_space() const;

    bool has_sufficient_space(uint64_t required_bytes) const;

    // <chunk_directory>/<first two hex chars>/<hex id>.chunk
    std::filesystem::path get_chunk_path(const crypto::ChunkId& chunk_id) const;

    std::filesystem::path get_download_path(const std::string& filename) const;

    void set_base_directory(const std::filesystem::path& base_dir);
};

} // namespace chunkstream::storage
