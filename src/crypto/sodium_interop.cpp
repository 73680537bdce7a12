#include "crabcity/crypto/sodium_interop.hpp"
#include "crabcity/core/format.hpp"
#include "crabcity/encoding/byte_order.hpp"

#include <cstring>

namespace crabcity::auth::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, CryptoFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        if (sodium_init() < 0) {
            initialized_.store(false, std::memory_order_release);
        } else {
            initialized_.store(true, std::memory_order_release);
        }
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::InitializationFailed("Failed to initialize libsodium"));
    }

    return Result<Unit, CryptoFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Memory
// ============================================================================

Result<Unit, CryptoFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (buffer.empty()) {
        return Result<Unit, CryptoFailure>::Ok(unit);
    }
    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::BufferTooLarge(compat::format(
                "Buffer size {} exceeds maximum {}", buffer.size(), MAX_BUFFER_SIZE)));
    }
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, CryptoFailure>::Ok(unit);
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {

    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

// ============================================================================
// Randomness and hashing
// ============================================================================

void SodiumInterop::FillRandom(std::span<uint8_t> buffer) noexcept {
    if (!buffer.empty()) {
        randombytes_buf(buffer.data(), buffer.size());
    }
}

std::array<uint8_t, kHashBytes> SodiumInterop::Sha256(std::span<const uint8_t> data) noexcept {
    std::array<uint8_t, kHashBytes> digest{};
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

// ============================================================================
// Base64
// ============================================================================

std::string SodiumInterop::ToBase64Url(std::span<const uint8_t> data) {
    constexpr int variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
    std::string encoded(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), variant);
    // ENCODED_LEN counts the trailing NUL
    encoded.resize(std::strlen(encoded.c_str()));
    return encoded;
}

Result<std::vector<uint8_t>, CryptoFailure> SodiumInterop::FromBase64Url(std::string_view encoded) {
    std::vector<uint8_t> decoded(encoded.size() * 3 / 4 + 1);
    size_t decoded_len = 0;
    const char* end = nullptr;
    const int rc = sodium_base642bin(
        decoded.data(), decoded.size(),
        encoded.data(), encoded.size(),
        nullptr, &decoded_len, &end,
        sodium_base64_VARIANT_URLSAFE_NO_PADDING);
    if (rc != 0 || end != encoded.data() + encoded.size()) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::EncodingFailed("Invalid URL-safe base64 input"));
    }
    decoded.resize(decoded_len);
    return Result<std::vector<uint8_t>, CryptoFailure>::Ok(std::move(decoded));
}

// ============================================================================
// Sha256Hasher
// ============================================================================

Sha256Hasher::Sha256Hasher() noexcept {
    crypto_hash_sha256_init(&state_);
}

Sha256Hasher& Sha256Hasher::Update(std::span<const uint8_t> data) noexcept {
    crypto_hash_sha256_update(&state_, data.data(), data.size());
    return *this;
}

Sha256Hasher& Sha256Hasher::Update(std::string_view data) noexcept {
    crypto_hash_sha256_update(
        &state_, reinterpret_cast<const unsigned char*>(data.data()), data.size());
    return *this;
}

Sha256Hasher& Sha256Hasher::UpdateByte(const uint8_t byte) noexcept {
    crypto_hash_sha256_update(&state_, &byte, 1);
    return *this;
}

Sha256Hasher& Sha256Hasher::UpdateU32(const uint32_t value) noexcept {
    const auto bytes = encoding::ToBigEndian32(value);
    return Update(bytes);
}

Sha256Hasher& Sha256Hasher::UpdateU64(const uint64_t value) noexcept {
    const auto bytes = encoding::ToBigEndian64(value);
    return Update(bytes);
}

std::array<uint8_t, kHashBytes> Sha256Hasher::Finalize() noexcept {
    std::array<uint8_t, kHashBytes> digest{};
    crypto_hash_sha256_final(&state_, digest.data());
    return digest;
}

} // namespace crabcity::auth::crypto
