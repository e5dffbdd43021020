#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>
#include "../core/Entry.hpp"
#include "../crypto/Cipher.hpp"
#include "../crypto/KeyDerivation.hpp"

// Codec turns the whole persisted state of a storage into bytes and back, and
// moves those bytes to and from disk.
//
// Binary layout, integers little endian:
//   Header: 8 bytes ASCII "FASTMEM\n" (magic), u32 format version
//   Salt: u32 length + bytes (SALT_BYTES)
//   KDF: u32 algorithm, u64 ops_limit (iterations), u64 mem_limit
//   Canary: u8 present; if 1, u32 length + nonce, u32 length + ciphertext
//   Entries: u32 count, then per entry u32 length + key name,
//            u32 length + nonce, u32 length + ciphertext (tag included)
//
// Nothing follows the last entry. Values only ever appear as ciphertext.

static constexpr std::uint32_t FORMAT_VERSION = 1;

struct PersistedState {
    std::uint32_t version = FORMAT_VERSION;
    std::vector<unsigned char> salt;
    KdfParams kdf;
    std::optional<Sealed> canary;
    std::vector<Entry> entries;
};

class Codec {
public:
    static std::vector<unsigned char> serialize(const PersistedState& state);

    // Throws CorruptData on anything structurally wrong.
    static PersistedState deserialize(const std::vector<unsigned char>& bytes);

    // Write a unique temporary sibling (mode 0600), fsync it, rename it over
    // the target, then fsync the directory. Throws IOError.
    static void writeFile(const std::filesystem::path& path, const std::vector<unsigned char>& bytes);

    // Throws IOError if the file cannot be read.
    static std::vector<unsigned char> readFile(const std::filesystem::path& path);
};
