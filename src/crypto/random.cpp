#include "chunkstream/crypto/random.hpp"
#include "chunkstream/crypto/hash.hpp"
#include <sodium.h>
#include <vector>

namespace chunkstream::crypto {

Result SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (output.empty()) {
        return Result(ErrorCode::INVALID_STATE, "Output buffer is empty");
    }

    if (!initialize()) {
        return Result(ErrorCode::INVALID_STATE, "libsodium is not available");
    }

    randombytes_buf(output.data(), output.size());
    return Result();
}

std::uint64_t SecureRandom::generate_uint64() {
    std::uint64_t value = 0;
    if (initialize()) {
        randombytes_buf(&value, sizeof(value));
    }
    return value;
}

std::string SecureRandom::generate_hex(size_t byte_count) {
    std::vector<std::uint8_t> bytes(byte_count);
    if (!generate_bytes(bytes).success()) {
        return {};
    }

    std::string hex(byte_count * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.resize(byte_count * 2);
    return hex;
}

}
