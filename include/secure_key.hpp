#pragma once
#include "vaultconfig_common.hpp"
#include "logging.hpp"
#include <stdexcept>
#include <cstddef>

// Guarded, mlock'ed storage for a derived envelope key.
// Zeroed and released on destruction.
class SecureKey {
public:
    explicit SecureKey(size_t size = KEY_LEN)
        : size_(size)
    {
        ptr_ = static_cast<byte*>(sodium_malloc(size_));
        if (!ptr_) {
            throw std::runtime_error("SecureKey: sodium_malloc failed");
        }

        if (sodium_mlock(ptr_, size_) != 0) {
            // RLIMIT_MEMLOCK; the guarded allocation is still usable
            audit_log_level(LogLevel::WARN,
                "SecureKey: sodium_mlock failed",
                "secure_key",
                "failure");
        }

        sodium_memzero(ptr_, size_);
    }

    // non-copyable
    SecureKey(const SecureKey&) = delete;
    SecureKey& operator=(const SecureKey&) = delete;

    SecureKey(SecureKey&& other) noexcept
        : ptr_(other.ptr_), size_(other.size_)
    {
        other.ptr_ = nullptr;
        other.size_ = 0;
    }
    SecureKey& operator=(SecureKey&& other) noexcept {
        if (this != &other) {
            release();
            ptr_ = other.ptr_;
            size_ = other.size_;
            other.ptr_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }

    ~SecureKey() {
        release();
    }

    byte* data() { return ptr_; }
    const byte* data() const { return ptr_; }
    size_t size() const { return size_; }

private:
    byte* ptr_ = nullptr;
    size_t size_ = 0;

    void release() {
        if (ptr_) {
            sodium_memzero(ptr_, size_);
            sodium_munlock(ptr_, size_);
            sodium_free(ptr_);
            ptr_ = nullptr;
        }
    }
};
