#pragma once

#include "crabcity/core/result.hpp"
#include "crabcity/core/failures.hpp"
#include "crabcity/core/constants.hpp"
#include "crabcity/crypto/secure_memory_handle.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace crabcity::auth::identity {

/**
 * @brief Ed25519 public key; the canonical identity of an actor
 *
 * Compared by byte equality. The all-zero key is the loopback sentinel used
 * for the local operator and is never a valid remote identity.
 */
class PublicKey {
public:
    PublicKey() noexcept = default;
    explicit PublicKey(const std::array<uint8_t, kPublicKeyBytes>& bytes) noexcept
        : bytes_(bytes) {}

    static Result<PublicKey, VerifyError> FromBytes(std::span<const uint8_t> bytes);

    /// Parses the ToString() form.
    static Result<PublicKey, VerifyError> FromString(std::string_view encoded);

    static PublicKey Loopback() noexcept { return PublicKey(); }

    [[nodiscard]] bool IsLoopback() const noexcept;

    [[nodiscard]] const std::array<uint8_t, kPublicKeyBytes>& Bytes() const noexcept {
        return bytes_;
    }

    [[nodiscard]] std::span<const uint8_t> AsSpan() const noexcept {
        return std::span<const uint8_t>(bytes_);
    }

    /**
     * @brief Display-only short identifier, e.g. "crab_58N2MAHA"
     *
     * 40 bits of the key. Collisions are possible; never look anything up
     * or authorize by fingerprint.
     */
    [[nodiscard]] std::string Fingerprint() const;

    /// URL-safe base64 without padding.
    [[nodiscard]] std::string ToString() const;

    bool operator==(const PublicKey&) const = default;
    auto operator<=>(const PublicKey&) const = default;

private:
    std::array<uint8_t, kPublicKeyBytes> bytes_{};
};

class Signature {
public:
    Signature() noexcept = default;
    explicit Signature(const std::array<uint8_t, kSignatureBytes>& bytes) noexcept
        : bytes_(bytes) {}

    static Result<Signature, VerifyError> FromBytes(std::span<const uint8_t> bytes);

    [[nodiscard]] const std::array<uint8_t, kSignatureBytes>& Bytes() const noexcept {
        return bytes_;
    }

    [[nodiscard]] std::span<const uint8_t> AsSpan() const noexcept {
        return std::span<const uint8_t>(bytes_);
    }

    bool operator==(const Signature&) const = default;

private:
    std::array<uint8_t, kSignatureBytes> bytes_{};
};

/**
 * @brief Ed25519 signing key
 *
 * The 64-byte libsodium secret lives in guarded memory. Move-only.
 */
class SigningKey {
public:
    static Result<SigningKey, CryptoFailure> Generate();

    static Result<SigningKey, CryptoFailure> FromSeed(std::span<const uint8_t> seed);

    SigningKey(SigningKey&&) noexcept = default;
    SigningKey& operator=(SigningKey&&) noexcept = default;
    SigningKey(const SigningKey&) = delete;
    SigningKey& operator=(const SigningKey&) = delete;

    /// 32-byte seed for persisting the key; FromSeed restores it.
    [[nodiscard]] Result<std::array<uint8_t, kSeedBytes>, CryptoFailure> ToSeed() const;

    [[nodiscard]] const PublicKey& GetPublicKey() const noexcept {
        return public_key_;
    }

    [[nodiscard]] Result<Signature, CryptoFailure> Sign(std::span<const uint8_t> message) const;

private:
    SigningKey(crypto::SecureMemoryHandle secret_key_handle, PublicKey public_key) noexcept
        : secret_key_handle_(std::move(secret_key_handle))
        , public_key_(public_key) {}

    static Result<SigningKey, CryptoFailure> FromSecretKey(
        std::span<uint8_t> secret_key, const PublicKey& public_key);

    crypto::SecureMemoryHandle secret_key_handle_;
    PublicKey public_key_;
};

/**
 * @brief Verify an Ed25519 signature
 *
 * Initializes libsodium on first use, so a process that only verifies
 * needs no setup. A key that is not a valid curve point (the loopback key
 * included) yields InvalidPublicKey; any other failure is SignatureMismatch.
 */
Result<Unit, VerifyError> Verify(
    const PublicKey& public_key,
    std::span<const uint8_t> message,
    const Signature& signature);

} // namespace crabcity::auth::identity
