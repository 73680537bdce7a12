#include "crabcity/identity/keys.hpp"
#include "crabcity/crypto/sodium_interop.hpp"
#include "crabcity/encoding/base32.hpp"
#include "crabcity/core/format.hpp"

#include <sodium.h>
#include <algorithm>
#include <vector>

namespace crabcity::auth::identity {

using crypto::SodiumInterop;
using crypto::SecureMemoryHandle;

// ============================================================================
// PublicKey
// ============================================================================

Result<PublicKey, VerifyError> PublicKey::FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != kPublicKeyBytes) {
        return Result<PublicKey, VerifyError>::Err(
            VerifyError::InvalidPublicKey(compat::format(
                "Public key must be {} bytes, got {}", kPublicKeyBytes, bytes.size())));
    }
    std::array<uint8_t, kPublicKeyBytes> raw{};
    std::copy(bytes.begin(), bytes.end(), raw.begin());
    return Result<PublicKey, VerifyError>::Ok(PublicKey(raw));
}

Result<PublicKey, VerifyError> PublicKey::FromString(std::string_view encoded) {
    auto decoded = SodiumInterop::FromBase64Url(encoded);
    if (decoded.IsErr()) {
        return Result<PublicKey, VerifyError>::Err(
            VerifyError::InvalidPublicKey(decoded.UnwrapErr().message));
    }
    return FromBytes(decoded.Unwrap());
}

bool PublicKey::IsLoopback() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(), [](const uint8_t b) { return b == 0; });
}

std::string PublicKey::Fingerprint() const {
    const std::string encoded = encoding::EncodeBase32(bytes_);
    return std::string(kFingerprintPrefix) + encoded.substr(0, kFingerprintChars);
}

std::string PublicKey::ToString() const {
    return SodiumInterop::ToBase64Url(bytes_);
}

// ============================================================================
// Signature
// ============================================================================

Result<Signature, VerifyError> Signature::FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != kSignatureBytes) {
        return Result<Signature, VerifyError>::Err(
            VerifyError::SignatureMismatch(compat::format(
                "Signature must be {} bytes, got {}", kSignatureBytes, bytes.size())));
    }
    std::array<uint8_t, kSignatureBytes> raw{};
    std::copy(bytes.begin(), bytes.end(), raw.begin());
    return Result<Signature, VerifyError>::Ok(Signature(raw));
}

// ============================================================================
// SigningKey
// ============================================================================

Result<SigningKey, CryptoFailure> SigningKey::FromSecretKey(
    std::span<uint8_t> secret_key, const PublicKey& public_key) {

    auto handle_result = SecureMemoryHandle::Allocate(kSecretKeyBytes);
    if (handle_result.IsErr()) {
        (void)SodiumInterop::SecureWipe(secret_key);
        return Result<SigningKey, CryptoFailure>::Err(std::move(handle_result).UnwrapErr());
    }
    auto handle = std::move(handle_result).Unwrap();
    auto write_result = handle.Write(secret_key);
    (void)SodiumInterop::SecureWipe(secret_key);
    if (write_result.IsErr()) {
        return Result<SigningKey, CryptoFailure>::Err(std::move(write_result).UnwrapErr());
    }
    return Result<SigningKey, CryptoFailure>::Ok(SigningKey(std::move(handle), public_key));
}

Result<SigningKey, CryptoFailure> SigningKey::Generate() {
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<SigningKey, CryptoFailure>::Err(std::move(init).UnwrapErr());
    }

    std::array<uint8_t, kPublicKeyBytes> public_key{};
    std::vector<uint8_t> secret_key(crypto_sign_SECRETKEYBYTES);
    if (crypto_sign_keypair(public_key.data(), secret_key.data()) != 0) {
        (void)SodiumInterop::SecureWipe(secret_key);
        return Result<SigningKey, CryptoFailure>::Err(
            CryptoFailure::KeyGeneration("Failed to generate Ed25519 keypair"));
    }
    return FromSecretKey(secret_key, PublicKey(public_key));
}

Result<SigningKey, CryptoFailure> SigningKey::FromSeed(std::span<const uint8_t> seed) {
    if (seed.size() != kSeedBytes) {
        return Result<SigningKey, CryptoFailure>::Err(
            CryptoFailure::InvalidOperation(compat::format(
                "Ed25519 seed must be {} bytes, got {}", kSeedBytes, seed.size())));
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<SigningKey, CryptoFailure>::Err(std::move(init).UnwrapErr());
    }

    std::array<uint8_t, kPublicKeyBytes> public_key{};
    std::vector<uint8_t> secret_key(crypto_sign_SECRETKEYBYTES);
    if (crypto_sign_seed_keypair(public_key.data(), secret_key.data(), seed.data()) != 0) {
        (void)SodiumInterop::SecureWipe(secret_key);
        return Result<SigningKey, CryptoFailure>::Err(
            CryptoFailure::KeyGeneration("Failed to derive Ed25519 keypair from seed"));
    }
    return FromSecretKey(secret_key, PublicKey(public_key));
}

Result<std::array<uint8_t, kSeedBytes>, CryptoFailure> SigningKey::ToSeed() const {
    return secret_key_handle_.WithReadAccess([](std::span<const uint8_t> secret) {
        std::array<uint8_t, kSeedBytes> seed{};
        crypto_sign_ed25519_sk_to_seed(seed.data(), secret.data());
        return seed;
    });
}

Result<Signature, CryptoFailure> SigningKey::Sign(std::span<const uint8_t> message) const {
    auto signed_result = secret_key_handle_.WithReadAccess(
        [message](std::span<const uint8_t> secret) {
            std::array<uint8_t, kSignatureBytes> raw{};
            unsigned long long sig_len = 0;
            const int rc = crypto_sign_detached(
                raw.data(), &sig_len, message.data(), message.size(), secret.data());
            return std::make_pair(rc == 0 && sig_len == kSignatureBytes, raw);
        });
    if (signed_result.IsErr()) {
        return Result<Signature, CryptoFailure>::Err(std::move(signed_result).UnwrapErr());
    }
    const auto [ok, raw] = signed_result.Unwrap();
    if (!ok) {
        return Result<Signature, CryptoFailure>::Err(
            CryptoFailure::SigningFailed("crypto_sign_detached failed"));
    }
    return Result<Signature, CryptoFailure>::Ok(Signature(raw));
}

// ============================================================================
// Verification
// ============================================================================

Result<Unit, VerifyError> Verify(
    const PublicKey& public_key,
    std::span<const uint8_t> message,
    const Signature& signature) {

    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<Unit, VerifyError>::Err(
            VerifyError::CryptoUnavailable(std::move(init).UnwrapErr().message));
    }
    if (crypto_core_ed25519_is_valid_point(public_key.Bytes().data()) != 1) {
        return Result<Unit, VerifyError>::Err(
            VerifyError::InvalidPublicKey("Public key is not a valid Ed25519 point"));
    }
    const int rc = crypto_sign_verify_detached(
        signature.Bytes().data(),
        message.data(),
        message.size(),
        public_key.Bytes().data());
    if (rc != 0) {
        return Result<Unit, VerifyError>::Err(
            VerifyError::SignatureMismatch("Ed25519 signature verification failed"));
    }
    return Result<Unit, VerifyError>::Ok(unit);
}

} // namespace crabcity::auth::identity
