#pragma once

#include "crabcity/core/result.hpp"
#include "crabcity/core/failures.hpp"
#include "crabcity/core/constants.hpp"
#include "crabcity/identity/keys.hpp"
#include "crabcity/configuration/trust_config.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace crabcity::auth::identity {

enum class IdentityProofErrorType {
    TooShort,
    KeyCountExceedsMax,
    TruncatedKeys,
    InvalidHandleFlag,
    TruncatedHandleLen,
    TruncatedHandle,
    InvalidUtf8Handle,
    TruncatedTrailer,
    TrailingBytes,
    HandleTooLong,
    UnsupportedVersion,
    BadSignature,
    SigningFailed
};

class IdentityProofError {
public:
    IdentityProofErrorType type;
    std::string message;

    IdentityProofError(const IdentityProofErrorType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static IdentityProofError TooShort(size_t length);
    static IdentityProofError KeyCountExceedsMax(uint64_t count, size_t limit);
    static IdentityProofError TruncatedKeys(size_t count);
    static IdentityProofError InvalidHandleFlag(uint8_t flag);
    static IdentityProofError TruncatedHandleLen();
    static IdentityProofError TruncatedHandle(size_t declared);
    static IdentityProofError InvalidUtf8Handle();
    static IdentityProofError TruncatedTrailer();
    static IdentityProofError TrailingBytes(size_t extra);
    static IdentityProofError HandleTooLong(size_t length);
    static IdentityProofError UnsupportedVersion(uint8_t version);
    static IdentityProofError BadSignature(std::string_view detail);
    static IdentityProofError SigningFailed(std::string_view detail);

    [[nodiscard]] AuthError ToAuthError() const;
};

struct IdentityProofClaims {
    PublicKey subject;
    PublicKey instance;
    std::vector<PublicKey> related_keys;
    std::optional<std::string> registry_handle;
    uint64_t timestamp = 0;

    bool operator==(const IdentityProofClaims&) const = default;
};

/**
 * @brief Self-issued statement linking a subject key to its other keys
 *
 * Wire layout: version(1) subject(32) instance(32) count(4 BE)
 * count x key(32) handle-flag(1) [len(2 BE) utf8 handle] timestamp(8 BE)
 * signature(64). The signature covers everything before it.
 */
struct IdentityProof {
    uint8_t version = kIdentityProofVersion;
    PublicKey subject;
    PublicKey instance;
    std::vector<PublicKey> related_keys;
    std::optional<std::string> registry_handle;
    uint64_t timestamp = 0;
    Signature signature;

    static Result<IdentityProof, IdentityProofError> Sign(
        const SigningKey& signing_key,
        const PublicKey& instance,
        std::vector<PublicKey> related_keys,
        std::optional<std::string> registry_handle,
        uint64_t timestamp,
        const configuration::TrustConfig& config = configuration::TrustConfig::Default());

    [[nodiscard]] Result<IdentityProofClaims, IdentityProofError> Verify(
        const configuration::TrustConfig& config = configuration::TrustConfig::Default()) const;

    [[nodiscard]] std::vector<uint8_t> ToBytes() const;

    /// Never reads past the input; distinct error per malformation.
    static Result<IdentityProof, IdentityProofError> FromBytes(std::span<const uint8_t> bytes);

    static std::vector<uint8_t> SigningMessage(
        const PublicKey& subject,
        const PublicKey& instance,
        std::span<const PublicKey> related_keys,
        const std::optional<std::string>& registry_handle,
        uint64_t timestamp);

    bool operator==(const IdentityProof&) const = default;
};

/// Strict UTF-8 check: no overlongs, no surrogates, nothing above U+10FFFF.
[[nodiscard]] bool IsValidUtf8(std::span<const uint8_t> bytes) noexcept;

} // namespace crabcity::auth::identity
