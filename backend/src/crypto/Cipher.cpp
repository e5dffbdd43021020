#include "Cipher.hpp"
#include "KeyDerivation.hpp"
#include "../core/Errors.hpp"
#include <spdlog/spdlog.h>

static const unsigned char* adData(const std::string& associated) {
    return associated.empty() ? nullptr : reinterpret_cast<const unsigned char*>(associated.data());
}

Sealed Cipher::encrypt(const SessionKey& key,
    const std::string& plaintext,
    const std::string& associated)
{
    if (key.size() != ENC_KEY_BYTES) {
        spdlog::error("Invalid key size");
        throw CryptoError("invalid key size");
    }

    Sealed out;
    out.nonce.resize(NONCE_BYTES);
    randombytes_buf(out.nonce.data(), out.nonce.size());

    out.ciphertext.resize(plaintext.size() + TAG_BYTES);
    unsigned long long clen = 0;

    if (crypto_aead_xchacha20poly1305_ietf_encrypt(
        out.ciphertext.data(),
        &clen,
        reinterpret_cast<const unsigned char*>(plaintext.data()),
        static_cast<unsigned long long>(plaintext.size()),
        adData(associated),
        static_cast<unsigned long long>(associated.size()),
        nullptr,          // nsec - not used
        out.nonce.data(),
        key.data()) != 0)
    {
        spdlog::error("crypto_aead_xchacha20poly1305_ietf_encrypt failed");
        throw CryptoError("encryption failed");
    }

    out.ciphertext.resize(static_cast<std::size_t>(clen));
    return out;
}

std::string Cipher::decrypt(const SessionKey& key,
    const std::vector<unsigned char>& nonce,
    const std::vector<unsigned char>& ciphertext,
    const std::string& associated)
{
    if (key.size() != ENC_KEY_BYTES) {
        spdlog::error("Invalid key size");
        throw CryptoError("invalid key size");
    }
    if (nonce.size() != NONCE_BYTES || ciphertext.size() < TAG_BYTES) {
        spdlog::debug("Ciphertext or nonce too short");
        throw AuthenticationFailure();
    }

    std::vector<unsigned char> plain(ciphertext.size() - TAG_BYTES);
    unsigned long long plen = 0;

    if (crypto_aead_xchacha20poly1305_ietf_decrypt(
        plain.data(),
        &plen,
        nullptr,          // nsec - not used
        ciphertext.data(),
        static_cast<unsigned long long>(ciphertext.size()),
        adData(associated),
        static_cast<unsigned long long>(associated.size()),
        nonce.data(),
        key.data()) != 0)
    {
        // wrong key, corrupted or tampered ciphertext
        sodium_memzero(plain.data(), plain.size());
        throw AuthenticationFailure();
    }

    std::string out(plain.begin(), plain.begin() + static_cast<std::ptrdiff_t>(plen));
    sodium_memzero(plain.data(), plain.size());
    return out;
}
