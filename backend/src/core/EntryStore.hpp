#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "Entry.hpp"

// In-memory map from key name to sealed Entry. Holds ciphertext only; lock
// checks are the caller's job (see Storage).
class EntryStore {
public:
    EntryStore() = default;
    explicit EntryStore(std::vector<Entry> list);

    // Insert or overwrite.
    void put(Entry entry);
    const Entry* find(const std::string& key) const;
    bool erase(const std::string& key); // returns true if removed
    void clear();

    bool contains(const std::string& key) const;
    bool empty() const { return entries.empty(); }
    std::size_t size() const { return entries.size(); }

    std::vector<std::string> keys() const; // sorted
    std::vector<Entry> list() const;       // sorted by key

    // Re-encrypt every entry under newKey with fresh nonces. The result is
    // returned and *this is untouched, so a failure leaves the store as it was.
    // Throws AuthenticationFailure if an entry does not open under oldKey.
    EntryStore reencrypt(const SessionKey& oldKey, const SessionKey& newKey) const;

private:
    std::map<std::string, Entry> entries;
};
