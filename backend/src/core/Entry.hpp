#pragma once
#include <string>
#include <vector>
#include "../crypto/Cipher.hpp"
#include "../crypto/SessionKey.hpp"

// A named stored value. Only the sealed form is ever held: the nonce and the
// ciphertext with its tag. The key name is bound into the tag.
class Entry {
public:
    Entry() = default;
    Entry(const std::string& key, Sealed sealed);

    std::string key;
    std::vector<unsigned char> nonce;
    std::vector<unsigned char> ciphertext; // includes tag

    // Encrypt value under a fresh nonce.
    static Entry seal(const SessionKey& sessionKey, const std::string& key, const std::string& value);

    // Decrypt. Throws AuthenticationFailure if the tag does not verify.
    std::string open(const SessionKey& sessionKey) const;

    // Associated data bound into every entry's tag.
    static std::string associatedData(const std::string& key);
};
