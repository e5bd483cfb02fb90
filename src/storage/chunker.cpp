#include "chunkstream/storage/chunker.hpp"
#include "chunkstream/crypto/hash.hpp"
#include "chunkstream/core/logger.hpp"
#include <fstream>
#include <algorithm>
#include <stdexcept>

namespace chunkstream::storage {

namespace {

Result store_chunk(ChunkStore& store,
                   std::span<const std::uint8_t> bytes,
                   std::uint32_t index,
                   std::vector<ChunkDescriptor>& chunks) {
    auto chunk_id = crypto::Sha256Hasher::hash(bytes);

    auto result = store.put(chunk_id, bytes);
    if (!result) {
        return Result(result.error, "Failed to store chunk " + std::to_string(index) + ": " + result.message);
    }

    chunks.push_back(ChunkDescriptor{chunk_id, index, static_cast<std::uint32_t>(bytes.size())});
    return Result();
}

}

Chunker::Chunker(std::uint32_t chunk_size) : chunk_size_(chunk_size) {
    if (chunk_size_ == 0 || chunk_size_ > CHUNK_MAX) {
        throw std::invalid_argument("Chunk size must be in 1.." + std::to_string(CHUNK_MAX));
    }
}

Result Chunker::chunk_file(const std::filesystem::path& file_path,
                           const std::string& file_id,
                           ChunkStore& store,
                           Manifest& out) const {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return Result(ErrorCode::NOT_FOUND, "File not found: " + file_path.string());
    }

    std::vector<ChunkDescriptor> chunks;
    std::vector<std::uint8_t> buffer(chunk_size_);
    crypto::Sha256Hasher plaintext_hasher;

    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), chunk_size_);
        std::streamsize bytes_read = file.gcount();
        if (bytes_read <= 0) {
            break;
        }

        std::span<const std::uint8_t> chunk(buffer.data(), static_cast<size_t>(bytes_read));
        auto hashed = plaintext_hasher.update(chunk);
        if (!hashed) {
            return hashed;
        }

        auto result = store_chunk(store, chunk, static_cast<std::uint32_t>(chunks.size()), chunks);
        if (!result) {
            return result;
        }
    }

    if (file.bad()) {
        return Result(ErrorCode::IO_ERROR, "Error reading " + file_path.string());
    }

    if (chunks.empty()) {
        return Result(ErrorCode::EMPTY_MANIFEST, "File is empty: " + file_path.string());
    }

    ManifestMetadata metadata;
    metadata.filename = file_path.filename().string();
    metadata.plaintext_hash = plaintext_hasher.finalize();

    auto result = Manifest::build(file_id, std::move(chunks), std::move(metadata), out);
    if (result) {
        LOG_DEBUG("Chunked {} into {} chunks ({} bytes)", file_path.string(), out.chunk_count(), out.total_size());
    }
    return result;
}

Result Chunker::chunk_bytes(std::span<const std::uint8_t> data,
                            const std::string& file_id,
                            ChunkStore& store,
                            Manifest& out,
                            ManifestMetadata metadata) const {
    if (data.empty()) {
        return Result(ErrorCode::EMPTY_MANIFEST, "No data to chunk");
    }

    std::vector<ChunkDescriptor> chunks;
    chunks.reserve((data.size() + chunk_size_ - 1) / chunk_size_);

    for (size_t offset = 0; offset < data.size(); offset += chunk_size_) {
        auto length = std::min<size_t>(chunk_size_, data.size() - offset);
        auto result = store_chunk(store, data.subspan(offset, length),
                                  static_cast<std::uint32_t>(chunks.size()), chunks);
        if (!result) {
            return result;
        }
    }

    metadata.plaintext_hash = crypto::Sha256Hasher::hash(data);
    return Manifest::build(file_id, std::move(chunks), std::move(metadata), out);
}

Result Chunker::reassemble(const Manifest& manifest,
                           ChunkStore& store,
                           const std::filesystem::path& output_path) {
    auto temp_path = output_path;
    temp_path += ".partial";

    std::vector<crypto::ChunkId> received_ids;
    received_ids.reserve(manifest.chunk_count());

    auto fail = [&temp_path](Result result) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        return result;
    };

    {
        std::ofstream output_file(temp_path, std::ios::binary | std::ios::trunc);
        if (!output_file.is_open()) {
            return Result(ErrorCode::IO_ERROR, "Failed to open " + temp_path.string());
        }

        std::vector<std::uint8_t> chunk_data;
        for (const auto& descriptor : manifest.chunks()) {
            auto result = store.get(descriptor.chunk_id, chunk_data);
            if (!result) {
                return fail(Result(result.error, "Chunk " + std::to_string(descriptor.index) +
                                   " unavailable: " + result.message));
            }

            if (!Manifest::verify_chunk(descriptor, chunk_data)) {
                return fail(Result(ErrorCode::INTEGRITY_FAILED,
                                   "Chunk " + std::to_string(descriptor.index) + " does not match its id"));
            }
            received_ids.push_back(crypto::Sha256Hasher::hash(chunk_data));

            output_file.write(reinterpret_cast<const char*>(chunk_data.data()),
                              static_cast<std::streamsize>(chunk_data.size()));
            if (!output_file.good()) {
                return fail(Result(ErrorCode::IO_ERROR, "Failed to write " + temp_path.string()));
            }
        }
    }

    if (!manifest.verify_file(received_ids)) {
        return fail(Result(ErrorCode::CORRUPTED, "Reassembled chunks do not match the manifest root"));
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, output_path, ec);
    if (ec) {
        return fail(Result(ErrorCode::IO_ERROR, "Failed to move file into place: " + ec.message()));
    }

    LOG_INFO("Reassembled {} ({} bytes) at {}", manifest.file_id(), manifest.total_size(), output_path.string());
    return Result();
}

} // namespace chunkstream::storage
