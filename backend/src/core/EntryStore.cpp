#include "EntryStore.hpp"
#include <sodium.h>
#include <spdlog/spdlog.h>

EntryStore::EntryStore(std::vector<Entry> list) {
    for (auto& e : list) {
        std::string k = e.key;
        entries[k] = std::move(e);
    }
}

void EntryStore::put(Entry entry) {
    std::string k = entry.key;
    bool overwrite = entries.count(k) != 0;
    entries[k] = std::move(entry);
    spdlog::debug("Entry '{}' {}", k, overwrite ? "overwritten" : "added");
}

const Entry* EntryStore::find(const std::string& key) const {
    auto it = entries.find(key);
    if (it == entries.end()) return nullptr;
    return &it->second;
}

bool EntryStore::erase(const std::string& key) {
    if (entries.erase(key) == 0) return false;
    spdlog::debug("Entry '{}' removed", key);
    return true;
}

void EntryStore::clear() {
    spdlog::debug("Clearing {} entries", entries.size());
    entries.clear();
}

bool EntryStore::contains(const std::string& key) const {
    return entries.find(key) != entries.end();
}

std::vector<std::string> EntryStore::keys() const {
    std::vector<std::string> out;
    out.reserve(entries.size());
    for (const auto& p : entries) out.push_back(p.first);
    return out;
}

std::vector<Entry> EntryStore::list() const {
    std::vector<Entry> out;
    out.reserve(entries.size());
    for (const auto& p : entries) out.push_back(p.second);
    return out;
}

EntryStore EntryStore::reencrypt(const SessionKey& oldKey, const SessionKey& newKey) const {
    EntryStore out;
    for (const auto& p : entries) {
        std::string value = p.second.open(oldKey);
        out.entries[p.first] = Entry::seal(newKey, p.first, value);
        if (!value.empty()) sodium_memzero(&value[0], value.size());
    }
    spdlog::debug("Re-encrypted {} entries", out.entries.size());
    return out;
}
