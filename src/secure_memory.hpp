// File: secure_memory.hpp
// Brief: Locked, zero-on-free storage for private key scalars
//
// - Prevents memory from being swapped to disk
// - Zeroes memory on destruction
// - Provides controlled access to the underlying data

#pragma once

#include <cstdint>
#include <cstring>
#include <span>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/mman.h>
#endif

namespace assetlock {

class SecureMemory {
private:
    uint8_t* data_;
    size_t size_;

    void release() {
        if (data_) {
            std::memset(data_, 0, size_);
            #ifdef _WIN32
            VirtualUnlock(data_, size_);
            #else
            munlock(data_, size_);
            #endif
            delete[] data_;
            data_ = nullptr;
            size_ = 0;
        }
    }

public:
    explicit SecureMemory(std::span<const uint8_t> input)
        : data_(new uint8_t[input.size()]), size_(input.size()) {
        std::memcpy(data_, input.data(), size_);

        // mlock may fail without the right privileges; the data is still
        // zeroed on release in that case
        #ifdef _WIN32
        VirtualLock(data_, size_);
        #else
        (void)mlock(data_, size_);
        #endif
    }

    ~SecureMemory() { release(); }

    SecureMemory(const SecureMemory&) = delete;
    SecureMemory& operator=(const SecureMemory&) = delete;

    SecureMemory(SecureMemory&& other) noexcept : data_(other.data_), size_(other.size_) {
        other.data_ = nullptr;
        other.size_ = 0;
    }

    SecureMemory& operator=(SecureMemory&& other) noexcept {
        if (this != &other) {
            release();
            data_ = other.data_;
            size_ = other.size_;
            other.data_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }

    std::span<const uint8_t> bytes() const { return {data_, size_}; }
    const uint8_t* data() const { return data_; }
    size_t size() const { return size_; }

    bool isEmpty() const { return size_ == 0 || data_ == nullptr; }
};

} // namespace assetlock
