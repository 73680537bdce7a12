#pragma once

#include "crabcity/core/result.hpp"
#include "crabcity/core/failures.hpp"

#include <span>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace crabcity::auth::crypto {

/**
 * @brief RAII owner of a libsodium guarded allocation
 *
 * Backed by sodium_malloc: guard pages on both sides, locked in RAM and
 * zeroed on free. Holds the Ed25519 secret of a SigningKey.
 *
 * Move-only. The destructor always frees.
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, CryptoFailure> Allocate(size_t size);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /**
     * @brief Copy data into the allocation
     *
     * Bytes past data.size() are zeroed.
     */
    Result<Unit, CryptoFailure> Write(std::span<const uint8_t> data);

    /**
     * @brief Run func over the guarded bytes without copying them out
     */
    template<typename F>
    auto WithReadAccess(F&& func) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, CryptoFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;

        if (IsInvalid()) {
            return Result<T, CryptoFailure>::Err(
                CryptoFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<const uint8_t> secure_span(static_cast<const uint8_t*>(ptr_), size_);
        return Result<T, CryptoFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void* ptr_;
    size_t size_;
};

} // namespace crabcity::auth::crypto
