#include "Storage.hpp"
#include "Codec.hpp"
#include "../core/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>
#include <sodium.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

static constexpr const char* STATE_FILENAME = "store.fmem";
static constexpr const char* SNAPSHOT_DIR = "snapshots";
static constexpr const char* SNAPSHOT_EXT = ".fmem";
static constexpr std::size_t MAX_NAME_LEN = 64;

bool Storage::validName(const std::string& s) {
    if (s.empty() || s.size() > MAX_NAME_LEN) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-'; // allow alnum, '_', '-'
    });
}

static void requireEntryKey(const std::string& key) {
    if (key.empty()) {
        throw std::invalid_argument("key must not be empty");
    }
}

static void ensureDir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        spdlog::error("Failed to create directory '{}': {}", dir.string(), ec.message());
        throw IOError("cannot create '" + dir.string() + "': " + ec.message());
    }
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        spdlog::warn("Could not restrict permissions on '{}': {}", dir.string(), ec.message());
    }
}

Storage::Storage(const std::string& name, const std::string& path, StorageOptions options)
    : storage_name(name), kdf(options.kdf)
{
    if (!validName(name)) {
        throw std::invalid_argument("invalid storage name '" + name + "'");
    }
    if (!kdf.valid()) {
        throw std::invalid_argument("key derivation parameters out of range");
    }

    ensureSodiumReady();

    storage_dir = fs::absolute(fs::path(path) / name);
    salt = generateSalt();
    spdlog::info("Storage '{}' configured at '{}'", storage_name, storage_dir.string());
}

Storage::~Storage() {
    std::lock_guard<std::mutex> guard(mtx);
    lock_manager.lock();
}

fs::path Storage::defaultFile() const {
    return storage_dir / STATE_FILENAME;
}

fs::path Storage::snapshotFile(const std::string& snapshot) const {
    if (!validName(snapshot)) {
        throw std::invalid_argument("invalid snapshot name '" + snapshot + "'");
    }
    return storage_dir / SNAPSHOT_DIR / (snapshot + SNAPSHOT_EXT);
}

void Storage::init() {
    std::lock_guard<std::mutex> guard(mtx);
    spdlog::info("Initializing storage '{}'", storage_name);

    lock_manager.requireUnlocked();
    ensureDir(storage_dir);

    std::error_code ec;
    if (fs::exists(defaultFile(), ec)) {
        loadFrom(defaultFile());
        return;
    }
    if (ec) {
        throw IOError("cannot access '" + defaultFile().string() + "': " + ec.message());
    }

    saveTo(defaultFile());
    spdlog::info("Created new storage '{}'", storage_name);
}

void Storage::setPassword(const std::string& password) {
    std::lock_guard<std::mutex> guard(mtx);

    if (password.empty()) {
        throw std::invalid_argument("password must not be empty");
    }

    if (!lock_manager.hasCanary() && !lock_manager.hasKey() && entries.empty()) {
        lock_manager.requireUnlocked();
        spdlog::info("Setting initial password for '{}'", storage_name);
        lock_manager.installKey(deriveKey(password, salt, kdf));
        return;
    }

    spdlog::info("Changing password for '{}'", storage_name);
    const SessionKey& old_key = lock_manager.requireKey();
    SessionKey new_key = deriveKey(password, salt, kdf);

    EntryStore rekeyed;
    try {
        rekeyed = entries.reencrypt(old_key, new_key);
    }
    catch (const AuthenticationFailure&) {
        spdlog::error("Re-key aborted: an entry failed authentication");
        throw CorruptData("an entry failed authentication during re-key");
    }

    lock_manager.installKey(std::move(new_key));
    entries = std::move(rekeyed);
    spdlog::info("Password changed; {} entries re-encrypted", entries.size());
}

void Storage::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> guard(mtx);
    put(key, value);
}

std::string Storage::get(const std::string& key) const {
    std::lock_guard<std::mutex> guard(mtx);
    return fetch(key);
}

void Storage::setJson(const std::string& key, const nlohmann::json& value) {
    std::string text;
    try {
        text = value.dump();
    }
    catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument("value for '" + key + "' cannot be encoded as JSON: " + e.what());
    }

    std::lock_guard<std::mutex> guard(mtx);
    put(key, text);
    sodium_memzero(&text[0], text.size());
}

nlohmann::json Storage::getJson(const std::string& key) const {
    std::string text;
    {
        std::lock_guard<std::mutex> guard(mtx);
        text = fetch(key);
    }

    nlohmann::json value = nlohmann::json::parse(text, nullptr, false);
    if (!text.empty()) sodium_memzero(&text[0], text.size());
    if (value.is_discarded()) {
        spdlog::warn("Value of '{}' is not JSON", key);
        throw std::invalid_argument("value of '" + key + "' is not JSON");
    }
    return value;
}

void Storage::put(const std::string& key, const std::string& value) {
    requireEntryKey(key);

    const SessionKey& k = lock_manager.requireKey();
    entries.put(Entry::seal(k, key, value));
    spdlog::info("Set key '{}' in '{}'", key, storage_name);
}

std::string Storage::fetch(const std::string& key) const {
    requireEntryKey(key);

    const SessionKey& k = lock_manager.requireKey();
    const Entry* e = entries.find(key);
    if (!e) {
        spdlog::warn("Key '{}' not found in '{}'", key, storage_name);
        throw KeyNotFound(key);
    }

    try {
        return e->open(k);
    }
    catch (const AuthenticationFailure&) {
        // the key was verified at unlock, so this is damage, not a wrong password
        spdlog::error("Entry '{}' failed authentication", key);
        throw CorruptData("entry '" + key + "' failed authentication");
    }
}

void Storage::remove(const std::string& key) {
    std::lock_guard<std::mutex> guard(mtx);
    requireEntryKey(key);

    lock_manager.requireUnlocked();
    if (!entries.erase(key)) {
        spdlog::warn("Delete failed: key '{}' not found", key);
        throw KeyNotFound(key);
    }
    spdlog::info("Deleted key '{}' from '{}'", key, storage_name);
}

void Storage::clear() {
    std::lock_guard<std::mutex> guard(mtx);
    lock_manager.requireUnlocked();
    entries.clear();
    spdlog::info("Cleared all entries in '{}'", storage_name);
}

bool Storage::contains(const std::string& key) const {
    std::lock_guard<std::mutex> guard(mtx);
    lock_manager.requireUnlocked();
    return entries.contains(key);
}

std::vector<std::string> Storage::keys() const {
    std::lock_guard<std::mutex> guard(mtx);
    lock_manager.requireUnlocked();
    return entries.keys();
}

std::size_t Storage::size() const {
    std::lock_guard<std::mutex> guard(mtx);
    lock_manager.requireUnlocked();
    return entries.size();
}

void Storage::save() {
    std::lock_guard<std::mutex> guard(mtx);
    ensureDir(storage_dir);
    saveTo(defaultFile());
}

void Storage::save(const std::string& snapshot) {
    std::lock_guard<std::mutex> guard(mtx);
    fs::path file = snapshotFile(snapshot);
    ensureDir(file.parent_path());
    saveTo(file);
    spdlog::info("Saved snapshot '{}' of '{}'", snapshot, storage_name);
}

void Storage::load() {
    std::lock_guard<std::mutex> guard(mtx);
    lock_manager.requireUnlocked();
    loadFrom(defaultFile());
}

void Storage::load(const std::string& snapshot) {
    std::lock_guard<std::mutex> guard(mtx);
    lock_manager.requireUnlocked();
    loadFrom(snapshotFile(snapshot));
    spdlog::info("Loaded snapshot '{}' into '{}'", snapshot, storage_name);
}

std::vector<std::string> Storage::snapshots() const {
    std::lock_guard<std::mutex> guard(mtx);
    std::vector<std::string> out;

    fs::path dir = storage_dir / SNAPSHOT_DIR;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return out;

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path& p = it->path();
        if (p.extension().string() == SNAPSHOT_EXT && validName(p.stem().string())) {
            out.push_back(p.stem().string());
        }
    }
    if (ec) {
        spdlog::error("Failed to list snapshots in '{}': {}", dir.string(), ec.message());
        throw IOError("cannot list '" + dir.string() + "': " + ec.message());
    }

    std::sort(out.begin(), out.end());
    return out;
}

void Storage::lock() {
    std::lock_guard<std::mutex> guard(mtx);
    lock_manager.lock();
}

void Storage::unlock(const std::string& password) {
    std::lock_guard<std::mutex> guard(mtx);
    lock_manager.unlock(password, salt, kdf, entries);
}

void Storage::unlock() {
    std::lock_guard<std::mutex> guard(mtx);
    lock_manager.unlock(entries);
}

bool Storage::isLocked() const {
    std::lock_guard<std::mutex> guard(mtx);
    return lock_manager.isLocked();
}

bool Storage::hasPassword() const {
    std::lock_guard<std::mutex> guard(mtx);
    return lock_manager.hasCanary() || lock_manager.hasKey() || !entries.empty();
}

void Storage::saveTo(const fs::path& file) const {
    PersistedState state;
    state.salt = salt;
    state.kdf = kdf;
    state.canary = lock_manager.getCanary();
    state.entries = entries.list();

    Codec::writeFile(file, Codec::serialize(state));
    spdlog::info("Saved {} entries of '{}' to '{}'", state.entries.size(), storage_name, file.string());
}

void Storage::loadFrom(const fs::path& file) {
    PersistedState state = Codec::deserialize(Codec::readFile(file));

    bool protected_store = state.canary.has_value() || !state.entries.empty();

    salt = std::move(state.salt);
    kdf = state.kdf;
    entries = EntryStore(std::move(state.entries));
    lock_manager.reset(std::move(state.canary), protected_store);

    spdlog::info("Loaded {} entries into '{}' from '{}' ({})",
        entries.size(), storage_name, file.string(), protected_store ? "locked" : "unlocked");
}
