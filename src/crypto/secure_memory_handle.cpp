#include "crabcity/crypto/secure_memory_handle.hpp"
#include "crabcity/crypto/sodium_interop.hpp"
#include "crabcity/core/format.hpp"

#include <cstring>

namespace crabcity::auth::crypto {

Result<SecureMemoryHandle, CryptoFailure> SecureMemoryHandle::Allocate(size_t size) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::InitializationFailed("libsodium is not initialized"));
    }

    if (size == 0) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::AllocationFailed("Cannot allocate zero-sized secure memory"));
    }

    void* ptr = SodiumInterop::AllocateSecure(size);
    if (ptr == nullptr) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::AllocationFailed(
                compat::format("sodium_malloc failed for {} bytes", size)));
    }

    return Result<SecureMemoryHandle, CryptoFailure>::Ok(SecureMemoryHandle(ptr, size));
}

SecureMemoryHandle::~SecureMemoryHandle() {
    if (ptr_ != nullptr) {
        SodiumInterop::FreeSecure(ptr_);
        ptr_ = nullptr;
        size_ = 0;
    }
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : ptr_(other.ptr_)
    , size_(other.size_) {
    other.ptr_ = nullptr;
    other.size_ = 0;
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        if (ptr_ != nullptr) {
            SodiumInterop::FreeSecure(ptr_);
        }
        ptr_ = other.ptr_;
        size_ = other.size_;
        other.ptr_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

Result<Unit, CryptoFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::InvalidOperation("Handle has been disposed"));
    }

    if (data.size() > size_) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::BufferTooSmall(compat::format(
                "Data exceeds secure buffer (data: {}, buffer: {})", data.size(), size_)));
    }

    if (!data.empty()) {
        std::memcpy(ptr_, data.data(), data.size());
    }
    if (data.size() < size_) {
        std::memset(static_cast<uint8_t*>(ptr_) + data.size(), 0, size_ - data.size());
    }
    return Result<Unit, CryptoFailure>::Ok(unit);
}

} // namespace crabcity::auth::crypto
