#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../core/EntryStore.hpp"
#include "../crypto/Cipher.hpp"
#include "../crypto/KeyDerivation.hpp"
#include "../crypto/SessionKey.hpp"

enum class LockState {
    Unlocked,
    Locked
};

// LockManager owns the derived key and decides whether entry operations may
// run. Unlocked holds an optional key (none until a password is set); Locked
// holds no key at all.
//
// A password-protected store carries a canary: a fixed plaintext sealed under
// the key. unlock() checks the candidate key against it, so a wrong password
// is told apart from damaged entries.
//
// Not thread-safe on its own; Storage serialises access.
class LockManager {
public:
    LockManager() = default;

    LockState state() const { return lock_state; }
    bool isLocked() const { return lock_state == LockState::Locked; }
    bool hasKey() const { return static_cast<bool>(session_key); }
    bool hasCanary() const { return canary.has_value(); }
    const std::optional<Sealed>& getCanary() const { return canary; }

    // Throws LockedError while locked.
    void requireUnlocked() const;
    // Throws LockedError while locked, NoKeyError if no password was set.
    const SessionKey& requireKey() const;

    // Always succeeds. Zeroes and drops the key.
    void lock();

    // Re-derive the key from password and verify it against the canary, or
    // against any entry when there is no canary. With neither, the key is
    // accepted as is. A key accepted without a canary gets one sealed under it.
    // Throws InvalidPassword and leaves the state unchanged on mismatch.
    void unlock(const std::string& password,
        const std::vector<unsigned char>& salt,
        const KdfParams& params,
        const EntryStore& entries);

    // Unlock a store that has never had a password. Throws InvalidPassword if
    // one is required.
    void unlock(const EntryStore& entries);

    // Seal a fresh canary under key and make it current. Used when a password
    // is set for the first time and when it is changed.
    void installKey(SessionKey key);

    // Replace everything after a load: drop the key, adopt the loaded canary,
    // and lock if the loaded store is password-protected.
    void reset(std::optional<Sealed> loadedCanary, bool passwordProtected);

private:
    static Sealed makeCanary(const SessionKey& key);
    bool verify(const SessionKey& key, const EntryStore& entries) const;

    LockState lock_state = LockState::Unlocked;
    std::unique_ptr<SessionKey> session_key; // present only while unlocked with a password
    std::optional<Sealed> canary;
};
