#pragma once
#include <cstddef>

// SessionKey holds derived key material in sodium_malloc'd memory (guard pages,
// mlock'd). It is move-only and zeroes its bytes in wipe() and on destruction.
class SessionKey {
public:
    explicit SessionKey(std::size_t size);
    ~SessionKey();

    SessionKey(const SessionKey&) = delete;
    SessionKey& operator=(const SessionKey&) = delete;

    SessionKey(SessionKey&& other) noexcept;
    SessionKey& operator=(SessionKey&& other) noexcept;

    unsigned char* data() { return ptr_; }
    const unsigned char* data() const { return ptr_; }
    std::size_t size() const { return size_; }
    bool empty() const { return ptr_ == nullptr; }

    // Overwrite and release the key now rather than at destruction.
    void wipe() noexcept;

private:
    unsigned char* ptr_ = nullptr;
    std::size_t size_ = 0;
};
