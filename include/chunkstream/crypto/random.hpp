#pragma once

#include "../core/result.hpp"
#include <cstdint>
#include <span>
#include <string>

namespace chunkstream::crypto {

class SecureRandom {
public:
    static Result generate_bytes(std::span<std::uint8_t> output);
    static std::uint64_t generate_uint64();

    // Lowercase hex string built from `byte_count` random bytes.
    static std::string generate_hex(size_t byte_count);
};

}
