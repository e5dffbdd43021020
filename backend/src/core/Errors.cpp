#include "Errors.hpp"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidPassword: return "InvalidPassword";
    case ErrorKind::CorruptData:     return "CorruptData";
    case ErrorKind::Locked:          return "LockedError";
    case ErrorKind::KeyNotFound:     return "KeyNotFound";
    case ErrorKind::NoKey:           return "NoKeyError";
    case ErrorKind::IO:              return "IOError";
    case ErrorKind::Crypto:          return "CryptoError";
    }
    return "Unknown";
}
