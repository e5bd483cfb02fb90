#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace chunkstream::crypto {

constexpr size_t SHA256_HASH_SIZE = 32;

using Sha256Hash = std::array<std::uint8_t, SHA256_HASH_SIZE>;

// Content address of a chunk: SHA-256 of its bytes.
using ChunkId = Sha256Hash;

}
