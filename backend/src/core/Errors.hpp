#pragma once
#include <stdexcept>
#include <string>

// Every failure the storage engine reports derives from StorageError and
// carries an ErrorKind so callers (the CLI) can switch on it.

enum class ErrorKind {
    InvalidPassword,
    CorruptData,
    Locked,
    KeyNotFound,
    NoKey,
    IO,
    Crypto
};

const char* errorKindName(ErrorKind kind);

class StorageError : public std::runtime_error {
public:
    StorageError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidPassword : public StorageError {
public:
    explicit InvalidPassword(const std::string& what = "invalid password")
        : StorageError(ErrorKind::InvalidPassword, what) {}
};

class CorruptData : public StorageError {
public:
    explicit CorruptData(const std::string& what)
        : StorageError(ErrorKind::CorruptData, what) {}
};

class LockedError : public StorageError {
public:
    explicit LockedError(const std::string& what = "storage is locked")
        : StorageError(ErrorKind::Locked, what) {}
};

class KeyNotFound : public StorageError {
public:
    explicit KeyNotFound(const std::string& key)
        : StorageError(ErrorKind::KeyNotFound, "key '" + key + "' not found") {}
};

class NoKeyError : public StorageError {
public:
    explicit NoKeyError(const std::string& what = "no password has been set for this storage")
        : StorageError(ErrorKind::NoKey, what) {}
};

class IOError : public StorageError {
public:
    explicit IOError(const std::string& what)
        : StorageError(ErrorKind::IO, what) {}
};

class CryptoError : public StorageError {
public:
    explicit CryptoError(const std::string& what)
        : StorageError(ErrorKind::Crypto, what) {}
};

// Raised by Cipher::decrypt on tag mismatch. It never says why: a wrong key and
// a tampered ciphertext look the same. Layers above translate it to
// InvalidPassword or CorruptData.
class AuthenticationFailure : public std::runtime_error {
public:
    AuthenticationFailure() : std::runtime_error("authentication failed") {}
};
