#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <sodium.h>
#include "SessionKey.hpp"

// Cipher seals single values with XChaCha20-Poly1305 (IETF AEAD).
//
// Output layout per value:
//   Nonce: NONCE_BYTES random bytes, fresh for every encrypt() call
//   Ciphertext: plaintext length + TAG_BYTES (Poly1305 tag appended)
//
// The associated data is authenticated but not encrypted; callers bind the
// entry's key name there so ciphertexts cannot be swapped between keys.

static constexpr std::size_t NONCE_BYTES = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES; // 24
static constexpr std::size_t TAG_BYTES = crypto_aead_xchacha20poly1305_ietf_ABYTES;     // 16

struct Sealed {
    std::vector<unsigned char> nonce;
    std::vector<unsigned char> ciphertext; // includes tag
};

class Cipher {
public:
    static Sealed encrypt(const SessionKey& key,
        const std::string& plaintext,
        const std::string& associated);

    // Throws AuthenticationFailure if the tag does not verify, whatever the
    // cause. Never returns partial plaintext.
    static std::string decrypt(const SessionKey& key,
        const std::vector<unsigned char>& nonce,
        const std::vector<unsigned char>& ciphertext,
        const std::string& associated);
};
