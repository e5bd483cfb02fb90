#pragma once

#include "crypto_types.hpp"
#include "../core/result.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace chunkstream::crypto {

// Initializes libsodium. Safe to call repeatedly and from several threads.
bool initialize();

class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    Result update(std::span<const std::uint8_t> data);
    Sha256Hash finalize();
    void reset();

    static Sha256Hash hash(std::span<const std::uint8_t> data);
    static Result hash_file(const std::filesystem::path& file_path, Sha256Hash& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool finalized_;
};

namespace hash_utils {

bool verify_hash(std::span<const std::uint8_t> data, const Sha256Hash& expected_hash);
std::string hash_to_hex(const Sha256Hash& hash);
std::optional<Sha256Hash> hash_from_hex(const std::string& hex_string);

}

}
