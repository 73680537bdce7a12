#pragma once

#include "crabcity/core/result.hpp"
#include "crabcity/core/failures.hpp"
#include "crabcity/core/constants.hpp"

#include <sodium.h>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace crabcity::auth::crypto {

/**
 * @brief Interop layer for libsodium
 *
 * Every primitive the trust kernel needs (Ed25519, SHA-256, randomness,
 * guarded memory, URL-safe base64) goes through this class so that
 * initialization is checked in one place.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Key generation and signing call it
     * implicitly; tests call it up front.
     */
    static Result<Unit, CryptoFailure> Initialize();

    static bool IsInitialized() noexcept;

    static Result<Unit, CryptoFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without touching contents.
     */
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    static void FillRandom(std::span<uint8_t> buffer) noexcept;

    static std::array<uint8_t, kHashBytes> Sha256(std::span<const uint8_t> data) noexcept;

    /// URL-safe base64 without padding.
    static std::string ToBase64Url(std::span<const uint8_t> data);

    static Result<std::vector<uint8_t>, CryptoFailure> FromBase64Url(std::string_view encoded);

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

/**
 * @brief Incremental SHA-256 over several fields
 *
 * Used wherever a hash covers a sequence of fixed-layout fields (invite
 * links, events) without first concatenating them.
 */
class Sha256Hasher {
public:
    Sha256Hasher() noexcept;

    Sha256Hasher& Update(std::span<const uint8_t> data) noexcept;
    Sha256Hasher& Update(std::string_view data) noexcept;
    Sha256Hasher& UpdateByte(uint8_t byte) noexcept;
    Sha256Hasher& UpdateU32(uint32_t value) noexcept;
    Sha256Hasher& UpdateU64(uint64_t value) noexcept;

    [[nodiscard]] std::array<uint8_t, kHashBytes> Finalize() noexcept;

private:
    crypto_hash_sha256_state state_{};
};

} // namespace crabcity::auth::crypto
