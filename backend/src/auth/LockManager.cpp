#include "LockManager.hpp"
#include "../core/Errors.hpp"
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char CANARY_TEXT[] = "fastmem.canary.v1";
// entry associated data always starts with "entry:", so this never collides
static const char CANARY_AD[] = "canary";

void LockManager::requireUnlocked() const {
    if (lock_state == LockState::Locked) {
        spdlog::warn("Operation refused: storage is locked");
        throw LockedError();
    }
}

const SessionKey& LockManager::requireKey() const {
    requireUnlocked();
    if (!session_key) {
        spdlog::warn("Operation refused: no password has been set");
        throw NoKeyError();
    }
    return *session_key;
}

void LockManager::lock() {
    if (session_key) {
        spdlog::debug("Clearing session key from memory");
        session_key->wipe();
        session_key.reset();
    }
    if (lock_state != LockState::Locked) {
        lock_state = LockState::Locked;
        spdlog::info("Storage locked");
    }
}

Sealed LockManager::makeCanary(const SessionKey& key) {
    return Cipher::encrypt(key, std::string(CANARY_TEXT, sizeof(CANARY_TEXT) - 1), CANARY_AD);
}

bool LockManager::verify(const SessionKey& key, const EntryStore& entries) const {
    try {
        if (canary) {
            std::string text = Cipher::decrypt(key, canary->nonce, canary->ciphertext, CANARY_AD);
            return text.size() == sizeof(CANARY_TEXT) - 1 &&
                sodium_memcmp(text.data(), CANARY_TEXT, text.size()) == 0;
        }

        const auto all = entries.keys();
        if (all.empty()) {
            spdlog::debug("No canary and no entries; accepting key without verification");
            return true;
        }

        std::string value = entries.find(all.front())->open(key);
        if (!value.empty()) sodium_memzero(&value[0], value.size());
        return true;
    }
    catch (const AuthenticationFailure&) {
        return false;
    }
}

void LockManager::unlock(const std::string& password,
    const std::vector<unsigned char>& salt,
    const KdfParams& params,
    const EntryStore& entries)
{
    spdlog::info("Unlock attempt (not logging password)");

    auto candidate = std::make_unique<SessionKey>(deriveKey(password, salt, params));

    if (!verify(*candidate, entries)) {
        spdlog::warn("Unlock failed: password verification failed");
        throw InvalidPassword();
    }

    if (!canary) {
        // pin the accepted password so the next unlock is checked against it
        canary = makeCanary(*candidate);
        spdlog::info("Sealed a canary for the accepted password");
    }

    session_key = std::move(candidate);
    lock_state = LockState::Unlocked;
    spdlog::info("Storage unlocked");
}

void LockManager::unlock(const EntryStore& entries) {
    if (canary || !entries.empty()) {
        spdlog::warn("Unlock failed: storage requires a password");
        throw InvalidPassword("storage requires a password");
    }
    lock_state = LockState::Unlocked;
    spdlog::info("Storage unlocked (no password set)");
}

void LockManager::installKey(SessionKey key) {
    Sealed fresh = makeCanary(key);
    auto installed = std::make_unique<SessionKey>(std::move(key));

    if (session_key) session_key->wipe();
    session_key = std::move(installed);
    canary = std::move(fresh);
    lock_state = LockState::Unlocked;
    spdlog::debug("New session key installed");
}

void LockManager::reset(std::optional<Sealed> loadedCanary, bool passwordProtected) {
    if (session_key) {
        session_key->wipe();
        session_key.reset();
    }
    canary = std::move(loadedCanary);
    lock_state = passwordProtected ? LockState::Locked : LockState::Unlocked;
    spdlog::debug("Lock state reset ({})", passwordProtected ? "locked" : "unlocked");
}
