/**
 * Sha256 — digests of installed node binaries, computed with libsodium.
 */

#include "crypto/sha256.h"

#include <fstream>
#include <mutex>

#include <spdlog/spdlog.h>

namespace nodeward {

Sha256::Sha256() {
    init();
    crypto_hash_sha256_init(&state_);
}

bool Sha256::init() {
    static std::once_flag once;
    static bool ok = false;
    std::call_once(once, [] {
        ok = sodium_init() >= 0;
        if (!ok) spdlog::error("[Sha256] sodium_init() failed");
    });
    return ok;
}

void Sha256::update(const void* data, std::size_t size) {
    if (finalized_) return;
    crypto_hash_sha256_update(&state_, static_cast<const unsigned char*>(data), size);
}

std::string Sha256::hex_digest() {
    unsigned char out[crypto_hash_sha256_BYTES];
    crypto_hash_sha256_final(&state_, out);
    finalized_ = true;

    char hex[crypto_hash_sha256_BYTES * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), out, sizeof(out));
    return hex;
}

std::optional<std::string> Sha256::of_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return std::nullopt;

    Sha256 hasher;
    char buf[8192];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        hasher.update(buf, static_cast<std::size_t>(in.gcount()));
    }
    if (in.bad()) return std::nullopt;
    return hasher.hex_digest();
}

}  // namespace nodeward
