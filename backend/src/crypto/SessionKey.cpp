#include "SessionKey.hpp"
#include "../core/Errors.hpp"
#include <sodium.h>
#include <spdlog/spdlog.h>

SessionKey::SessionKey(std::size_t size)
    : size_(size)
{
    ptr_ = static_cast<unsigned char*>(sodium_malloc(size_));
    if (!ptr_) {
        spdlog::error("sodium_malloc failed for {} byte key", size_);
        size_ = 0;
        throw CryptoError("SessionKey: sodium_malloc failed");
    }
    sodium_memzero(ptr_, size_);
}

SessionKey::~SessionKey() {
    wipe();
}

SessionKey::SessionKey(SessionKey&& other) noexcept
    : ptr_(other.ptr_), size_(other.size_)
{
    other.ptr_ = nullptr;
    other.size_ = 0;
}

SessionKey& SessionKey::operator=(SessionKey&& other) noexcept {
    if (this != &other) {
        wipe();
        ptr_ = other.ptr_;
        size_ = other.size_;
        other.ptr_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

void SessionKey::wipe() noexcept {
    if (ptr_) {
        sodium_memzero(ptr_, size_);
        sodium_free(ptr_);
        ptr_ = nullptr;
        size_ = 0;
    }
}
