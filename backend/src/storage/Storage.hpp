#pragma once
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../auth/LockManager.hpp"
#include "../core/EntryStore.hpp"
#include "../crypto/KeyDerivation.hpp"

struct StorageOptions {
    KdfParams kdf = KdfParams::interactive(); // cost for newly created storages
};

// Storage is the public face of the engine: a named, password-protected
// key-value store living in <path>/<name>/.
//
//   <path>/<name>/store.fmem               default persisted state
//   <path>/<name>/snapshots/<snap>.fmem    named backups
//
// Nothing is written unless save() (or init() of a new storage) is called.
//
// One mutex guards the lock state, the entries and the key. Every public call
// holds it for its whole duration, so lock() can never race a get()/set().
// Single writer per directory: two processes saving the same storage must
// coordinate themselves.
class Storage {
public:
    Storage(const std::string& name, const std::string& path, StorageOptions options = {});
    ~Storage();

    Storage(const Storage&) = delete;
    Storage& operator=(const Storage&) = delete;

    // Create the directory and either load the existing default file or
    // persist a fresh one (salt + KDF parameters).
    void init();

    // First call establishes the password. Later calls re-key every entry
    // under the new password (requires unlocked).
    void setPassword(const std::string& password);

    void set(const std::string& key, const std::string& value);
    std::string get(const std::string& key) const;

    // Structured values: stored as compact JSON text, so numbers, arrays and
    // objects come back with their type. getJson throws std::invalid_argument
    // if the stored value is not JSON.
    void setJson(const std::string& key, const nlohmann::json& value);
    nlohmann::json getJson(const std::string& key) const;

    void remove(const std::string& key);
    void clear();

    bool contains(const std::string& key) const;
    std::vector<std::string> keys() const;
    std::size_t size() const;

    void save();
    void save(const std::string& snapshot);
    void load();
    void load(const std::string& snapshot);
    std::vector<std::string> snapshots() const;

    void lock();
    void unlock(const std::string& password);
    void unlock();

    bool isLocked() const;
    bool hasPassword() const;

    const std::string& name() const { return storage_name; }
    const std::filesystem::path& directory() const { return storage_dir; }
    std::filesystem::path defaultFile() const;
    std::filesystem::path snapshotFile(const std::string& snapshot) const;

    static bool validName(const std::string& name);

private:
    void put(const std::string& key, const std::string& value);
    std::string fetch(const std::string& key) const;

    void saveTo(const std::filesystem::path& file) const;
    void loadFrom(const std::filesystem::path& file);

    std::string storage_name;
    std::filesystem::path storage_dir;

    std::vector<unsigned char> salt; // immutable once generated
    KdfParams kdf;
    EntryStore entries;
    LockManager lock_manager;

    mutable std::mutex mtx;
};
