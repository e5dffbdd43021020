#include "Entry.hpp"
#include <utility>
#include <spdlog/spdlog.h>

Entry::Entry(const std::string& k, Sealed sealed)
    : key(k), nonce(std::move(sealed.nonce)), ciphertext(std::move(sealed.ciphertext))
{
}

Entry Entry::seal(const SessionKey& sessionKey, const std::string& key, const std::string& value) {
    Entry e(key, Cipher::encrypt(sessionKey, value, associatedData(key)));
    spdlog::debug("Sealed entry '{}' ({} ciphertext bytes)", key, e.ciphertext.size());
    return e;
}

std::string Entry::open(const SessionKey& sessionKey) const {
    return Cipher::decrypt(sessionKey, nonce, ciphertext, associatedData(key));
}

std::string Entry::associatedData(const std::string& key) {
    return "entry:" + key;
}
