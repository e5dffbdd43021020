#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <sodium.h>
#include "SessionKey.hpp"

// constants for key derivation / pwhash
static constexpr std::size_t ENC_KEY_BYTES = crypto_aead_xchacha20poly1305_ietf_KEYBYTES; // 32
static constexpr std::size_t SALT_BYTES = crypto_pwhash_SALTBYTES;                        // 16

// Argon2id cost parameters. ops_limit is the iteration (pass) count over
// mem_limit bytes of memory. They are persisted with each storage so a later
// unlock reproduces the same key even if the defaults change.
struct KdfParams {
    int algorithm = crypto_pwhash_ALG_ARGON2ID13;
    unsigned long long ops_limit = crypto_pwhash_OPSLIMIT_INTERACTIVE;
    std::size_t mem_limit = crypto_pwhash_MEMLIMIT_INTERACTIVE;

    // libsodium's interactive profile: 2 passes, 64 MiB.
    static KdfParams interactive();
    // Smallest cost libsodium accepts. For tests and scripted use only.
    static KdfParams minimal();

    bool valid() const;

    bool operator==(const KdfParams& o) const {
        return algorithm == o.algorithm && ops_limit == o.ops_limit && mem_limit == o.mem_limit;
    }
    bool operator!=(const KdfParams& o) const { return !(*this == o); }
};

// Initialise libsodium. Safe to call repeatedly and from several threads.
void ensureSodiumReady();

std::vector<unsigned char> generateSalt();

// Deterministic for a given (password, salt, params). Never fails because of a
// wrong password; that is detected later when decryption fails.
SessionKey deriveKey(const std::string& password,
    const std::vector<unsigned char>& salt,
    const KdfParams& params);
