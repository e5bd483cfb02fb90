#include "chunkstream/crypto/hash.hpp"
#include "chunkstream/core/logger.hpp"
#include <sodium.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace chunkstream::crypto {

bool initialize() {
    // sodium_init() returns 1 when the library was already initialized.
    if (sodium_init() < 0) {
        LOG_CRITICAL("Failed to initialize libsodium");
        return false;
    }
    return true;
}

struct Sha256Hasher::Impl {
    crypto_hash_sha256_state state;
};

Sha256Hasher::Sha256Hasher()
    : impl_(std::make_unique<Impl>())
    , finalized_(false) {
    crypto_hash_sha256_init(&impl_->state);
}

Sha256Hasher::~Sha256Hasher() {
    sodium_memzero(&impl_->state, sizeof(impl_->state));
}

Result Sha256Hasher::update(std::span<const std::uint8_t> data) {
    if (finalized_) {
        return Result(ErrorCode::INVALID_STATE, "Hasher already finalized");
    }

    if (crypto_hash_sha256_update(&impl_->state, data.data(), data.size()) != 0) {
        return Result(ErrorCode::IO_ERROR, "Failed to update hash");
    }

    return Result();
}

Sha256Hash Sha256Hasher::finalize() {
    if (finalized_) {
        throw std::logic_error("Sha256Hasher::finalize called twice without reset");
    }

    Sha256Hash result;
    crypto_hash_sha256_final(&impl_->state, result.data());
    finalized_ = true;
    return result;
}

void Sha256Hasher::reset() {
    crypto_hash_sha256_init(&impl_->state);
    finalized_ = false;
}

Sha256Hash Sha256Hasher::hash(std::span<const std::uint8_t> data) {
    Sha256Hash result;
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

Result Sha256Hasher::hash_file(const std::filesystem::path& file_path, Sha256Hash& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return Result(ErrorCode::IO_ERROR, "Cannot open file for hashing: " + file_path.string());
    }

    Sha256Hasher hasher;
    constexpr size_t buffer_size = 65536;
    std::vector<std::uint8_t> buffer(buffer_size);

    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        size_t bytes_read = static_cast<size_t>(file.gcount());

        if (bytes_read > 0) {
            auto result = hasher.update(std::span(buffer.data(), bytes_read));
            if (!result.success()) {
                return result;
            }
        }
    }

    if (file.bad()) {
        return Result(ErrorCode::IO_ERROR, "Read error while hashing: " + file_path.string());
    }

    output = hasher.finalize();
    return Result();
}

namespace hash_utils {

bool verify_hash(std::span<const std::uint8_t> data, const Sha256Hash& expected_hash) {
    auto computed_hash = Sha256Hasher::hash(data);
    return sodium_memcmp(computed_hash.data(), expected_hash.data(), SHA256_HASH_SIZE) == 0;
}

std::string hash_to_hex(const Sha256Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : hash) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::optional<Sha256Hash> hash_from_hex(const std::string& hex_string) {
    if (hex_string.length() != SHA256_HASH_SIZE * 2) {
        return std::nullopt;
    }

    Sha256Hash hash;
    size_t bin_len = 0;
    if (sodium_hex2bin(hash.data(), hash.size(), hex_string.data(), hex_string.size(),
                       nullptr, &bin_len, nullptr) != 0 || bin_len != SHA256_HASH_SIZE) {
        return std::nullopt;
    }

    return hash;
}

}

}
