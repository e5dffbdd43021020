#include "KeyDerivation.hpp"
#include "../core/Errors.hpp"
#include <spdlog/spdlog.h>

KdfParams KdfParams::interactive() {
    return KdfParams{};
}

KdfParams KdfParams::minimal() {
    KdfParams p;
    p.ops_limit = crypto_pwhash_argon2id_OPSLIMIT_MIN;
    p.mem_limit = crypto_pwhash_argon2id_MEMLIMIT_MIN;
    return p;
}

bool KdfParams::valid() const {
    if (algorithm != crypto_pwhash_ALG_ARGON2ID13) return false;
    if (ops_limit < crypto_pwhash_argon2id_OPSLIMIT_MIN) return false;
    if (mem_limit < crypto_pwhash_argon2id_MEMLIMIT_MIN) return false;
    // a stored file may not ask unlock for more than the sensitive profile, in passes or memory
    if (ops_limit > crypto_pwhash_OPSLIMIT_SENSITIVE) return false;
    if (mem_limit > crypto_pwhash_MEMLIMIT_SENSITIVE) return false;
    return true;
}

void ensureSodiumReady() {
    if (sodium_init() < 0) {
        spdlog::critical("Failed to initialize libsodium");
        throw CryptoError("libsodium initialization failed");
    }
}

std::vector<unsigned char> generateSalt() {
    std::vector<unsigned char> salt(SALT_BYTES);
    randombytes_buf(salt.data(), salt.size());
    return salt;
}

SessionKey deriveKey(const std::string& password,
    const std::vector<unsigned char>& salt,
    const KdfParams& params)
{
    spdlog::debug("Deriving key (ops_limit={}, mem_limit={})", params.ops_limit, params.mem_limit);

    if (salt.size() != SALT_BYTES) {
        spdlog::error("Cannot derive key: salt has {} bytes, expected {}", salt.size(), SALT_BYTES);
        throw CorruptData("salt has an unexpected length");
    }
    if (!params.valid()) {
        spdlog::error("Cannot derive key: KDF parameters out of range");
        throw CorruptData("key derivation parameters out of range");
    }

    SessionKey key(ENC_KEY_BYTES);

    if (crypto_pwhash(key.data(),
        key.size(),
        password.c_str(),
        static_cast<unsigned long long>(password.size()),
        salt.data(),
        params.ops_limit,
        params.mem_limit,
        params.algorithm) != 0)
    {
        spdlog::error("crypto_pwhash failed during key derivation (likely out of memory)");
        throw CryptoError("crypto_pwhash failed (out of memory)");
    }

    spdlog::debug("Key derived successfully");
    return key;
}
