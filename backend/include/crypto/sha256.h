#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include <sodium.h>

namespace nodeward {

/**
 * Incremental SHA-256 over libsodium's crypto_hash_sha256.
 */
class Sha256 {
public:
    Sha256();

    /// Must succeed once before any digest is taken. Safe to call repeatedly.
    static bool init();

    void update(const void* data, std::size_t size);

    /// Lowercase hex digest. The hasher cannot be updated afterwards.
    std::string hex_digest();

    /// Digest of a whole file, or nullopt if it cannot be read.
    static std::optional<std::string> of_file(const std::filesystem::path& path);

private:
    crypto_hash_sha256_state state_;
    bool                     finalized_ = false;
};

}  // namespace nodeward
