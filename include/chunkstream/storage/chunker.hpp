#pragma once

#include "manifest.hpp"
#include "chunk_store.hpp"
#include "../core/result.hpp"
#include <filesystem>
#include <span>
#include <string>

namespace chunkstream::storage {

// Fixed-size chunking of files into a chunk store, and the reverse.
class Chunker {
public:
    static constexpr std::uint32_t DEFAULT_CHUNK_SIZE = 256 * 1024;

    // Throws std::invalid_argument for 0 or sizes above CHUNK_MAX.
    explicit Chunker(std::uint32_t chunk_size = DEFAULT_CHUNK_SIZE);

    Result chunk_file(const std::filesystem::path& file_path,
                      const std::string& file_id,
                      ChunkStore& store,
                      Manifest& out) const;

    Result chunk_bytes(std::span<const std::uint8_t> data,
                       const std::string& file_id,
                       ChunkStore& store,
                       Manifest& out,
                       ManifestMetadata metadata = {}) const;

    // Writes the chunks of `manifest` to output_path in order. The file is written to a
    // temporary path and only moved into place once every chunk and the root verified.
    static Result reassemble(const Manifest& manifest,
                             ChunkStore& store,
                             const std::filesystem::path& output_path);

    std::uint32_t chunk_size() const { return chunk_size_; }

private:
    std::uint32_t chunk_size_;
};

} // namespace chunkstream::storage
