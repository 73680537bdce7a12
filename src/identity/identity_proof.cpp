#include "crabcity/identity/identity_proof.hpp"
#include "crabcity/encoding/byte_order.hpp"
#include "crabcity/core/format.hpp"
#include "crabcity/debug/trace_logger.hpp"

#include <algorithm>
#include <limits>

namespace crabcity::auth::identity {

namespace {

constexpr size_t kCountOffset = 1 + kPublicKeyBytes + kPublicKeyBytes;
constexpr size_t kTrailerBytes = 8 + kSignatureBytes;

PublicKey ReadKey(std::span<const uint8_t> bytes, const size_t offset) {
    std::array<uint8_t, kPublicKeyBytes> raw{};
    std::copy_n(bytes.begin() + offset, kPublicKeyBytes, raw.begin());
    return PublicKey(raw);
}

void AppendBody(
    std::vector<uint8_t>& out,
    const uint8_t version,
    const PublicKey& subject,
    const PublicKey& instance,
    std::span<const PublicKey> related_keys,
    const std::optional<std::string>& registry_handle,
    const uint64_t timestamp) {

    out.push_back(version);
    encoding::Append(out, subject.AsSpan());
    encoding::Append(out, instance.AsSpan());
    encoding::Append(out, encoding::ToBigEndian32(static_cast<uint32_t>(related_keys.size())));
    for (const auto& key : related_keys) {
        encoding::Append(out, key.AsSpan());
    }
    if (registry_handle.has_value()) {
        out.push_back(1);
        encoding::Append(out, encoding::ToBigEndian16(static_cast<uint16_t>(registry_handle->size())));
        out.insert(out.end(), registry_handle->begin(), registry_handle->end());
    } else {
        out.push_back(0);
    }
    encoding::Append(out, encoding::ToBigEndian64(timestamp));
}

}  // namespace

// ============================================================================
// IdentityProofError
// ============================================================================

IdentityProofError IdentityProofError::TooShort(const size_t length) {
    return {IdentityProofErrorType::TooShort,
            compat::format("too short: {} bytes, need at least {}", length, kIdentityProofMinBytes)};
}

IdentityProofError IdentityProofError::KeyCountExceedsMax(const uint64_t count, const size_t limit) {
    return {IdentityProofErrorType::KeyCountExceedsMax,
            compat::format("key count {} exceeds maximum {}", count, limit)};
}

IdentityProofError IdentityProofError::TruncatedKeys(const size_t count) {
    return {IdentityProofErrorType::TruncatedKeys,
            compat::format("truncated keys: {} declared", count)};
}

IdentityProofError IdentityProofError::InvalidHandleFlag(const uint8_t flag) {
    return {IdentityProofErrorType::InvalidHandleFlag,
            compat::format("handle flag must be 0 or 1, got {}", flag)};
}

IdentityProofError IdentityProofError::TruncatedHandleLen() {
    return {IdentityProofErrorType::TruncatedHandleLen, "truncated handle length"};
}

IdentityProofError IdentityProofError::TruncatedHandle(const size_t declared) {
    return {IdentityProofErrorType::TruncatedHandle,
            compat::format("truncated handle: {} bytes declared", declared)};
}

IdentityProofError IdentityProofError::InvalidUtf8Handle() {
    return {IdentityProofErrorType::InvalidUtf8Handle, "invalid utf8 in handle"};
}

IdentityProofError IdentityProofError::TruncatedTrailer() {
    return {IdentityProofErrorType::TruncatedTrailer, "truncated timestamp/signature"};
}

IdentityProofError IdentityProofError::TrailingBytes(const size_t extra) {
    return {IdentityProofErrorType::TrailingBytes,
            compat::format("{} unexpected bytes after the signature", extra)};
}

IdentityProofError IdentityProofError::HandleTooLong(const size_t length) {
    return {IdentityProofErrorType::HandleTooLong,
            compat::format("handle of {} bytes does not fit a u16 length", length)};
}

IdentityProofError IdentityProofError::UnsupportedVersion(const uint8_t version) {
    return {IdentityProofErrorType::UnsupportedVersion,
            compat::format("unsupported identity proof version 0x{:02x}", version)};
}

IdentityProofError IdentityProofError::BadSignature(std::string_view detail) {
    return {IdentityProofErrorType::BadSignature, compat::format("bad signature: {}", detail)};
}

IdentityProofError IdentityProofError::SigningFailed(std::string_view detail) {
    return {IdentityProofErrorType::SigningFailed, compat::format("signing failed: {}", detail)};
}

AuthError IdentityProofError::ToAuthError() const {
    if (type == IdentityProofErrorType::BadSignature ||
        type == IdentityProofErrorType::UnsupportedVersion) {
        return AuthError::InvalidSignature();
    }
    return AuthError::InvalidIdentityProof(message);
}

// ============================================================================
// IdentityProof
// ============================================================================

std::vector<uint8_t> IdentityProof::SigningMessage(
    const PublicKey& subject,
    const PublicKey& instance,
    std::span<const PublicKey> related_keys,
    const std::optional<std::string>& registry_handle,
    const uint64_t timestamp) {

    std::vector<uint8_t> message;
    message.reserve(kCountOffset + 4 + related_keys.size() * kPublicKeyBytes + 3 + 8 +
                    (registry_handle.has_value() ? registry_handle->size() : 0));
    AppendBody(message, kIdentityProofVersion, subject, instance, related_keys,
               registry_handle, timestamp);
    return message;
}

Result<IdentityProof, IdentityProofError> IdentityProof::Sign(
    const SigningKey& signing_key,
    const PublicKey& instance,
    std::vector<PublicKey> related_keys,
    std::optional<std::string> registry_handle,
    const uint64_t timestamp,
    const configuration::TrustConfig& config) {
    using ResultType = Result<IdentityProof, IdentityProofError>;

    if (related_keys.size() > config.MaxRelatedKeys()) {
        return ResultType::Err(
            IdentityProofError::KeyCountExceedsMax(related_keys.size(), config.MaxRelatedKeys()));
    }
    if (registry_handle.has_value()) {
        if (registry_handle->size() > std::numeric_limits<uint16_t>::max()) {
            return ResultType::Err(IdentityProofError::HandleTooLong(registry_handle->size()));
        }
        const auto* data = reinterpret_cast<const uint8_t*>(registry_handle->data());
        if (!IsValidUtf8(std::span<const uint8_t>(data, registry_handle->size()))) {
            return ResultType::Err(IdentityProofError::InvalidUtf8Handle());
        }
    }

    IdentityProof proof;
    proof.subject = signing_key.GetPublicKey();
    proof.instance = instance;
    proof.related_keys = std::move(related_keys);
    proof.registry_handle = std::move(registry_handle);
    proof.timestamp = timestamp;

    auto signature = signing_key.Sign(SigningMessage(
        proof.subject, proof.instance, proof.related_keys, proof.registry_handle, timestamp));
    if (signature.IsErr()) {
        return ResultType::Err(IdentityProofError::SigningFailed(signature.UnwrapErr().message));
    }
    proof.signature = signature.Unwrap();
    return ResultType::Ok(std::move(proof));
}

Result<IdentityProofClaims, IdentityProofError> IdentityProof::Verify(
    const configuration::TrustConfig& config) const {
    using ResultType = Result<IdentityProofClaims, IdentityProofError>;

    if (version != kIdentityProofVersion) {
        return ResultType::Err(IdentityProofError::UnsupportedVersion(version));
    }
    if (related_keys.size() > config.MaxRelatedKeys()) {
        return ResultType::Err(
            IdentityProofError::KeyCountExceedsMax(related_keys.size(), config.MaxRelatedKeys()));
    }

    const auto message = SigningMessage(subject, instance, related_keys, registry_handle, timestamp);
    if (auto verified = identity::Verify(subject, message, signature); verified.IsErr()) {
        debug::LogRejection(debug::Subsystem::IdentityProof, verified.UnwrapErr().message);
        return ResultType::Err(IdentityProofError::BadSignature(verified.UnwrapErr().message));
    }

    return ResultType::Ok(IdentityProofClaims{
        subject, instance, related_keys, registry_handle, timestamp});
}

std::vector<uint8_t> IdentityProof::ToBytes() const {
    std::vector<uint8_t> out;
    AppendBody(out, version, subject, instance, related_keys, registry_handle, timestamp);
    encoding::Append(out, signature.AsSpan());
    return out;
}

Result<IdentityProof, IdentityProofError> IdentityProof::FromBytes(std::span<const uint8_t> bytes) {
    using ResultType = Result<IdentityProof, IdentityProofError>;

    if (bytes.size() < kIdentityProofMinBytes) {
        return ResultType::Err(IdentityProofError::TooShort(bytes.size()));
    }

    IdentityProof proof;
    proof.version = bytes[0];
    proof.subject = ReadKey(bytes, 1);
    proof.instance = ReadKey(bytes, 1 + kPublicKeyBytes);

    const uint32_t key_count = encoding::ReadBigEndian32(bytes.data() + kCountOffset);
    if (key_count > kMaxRelatedKeys) {
        return ResultType::Err(IdentityProofError::KeyCountExceedsMax(key_count, kMaxRelatedKeys));
    }
    size_t pos = kCountOffset + 4;

    // Keys plus the handle flag byte
    if (bytes.size() < pos + static_cast<size_t>(key_count) * kPublicKeyBytes + 1) {
        return ResultType::Err(IdentityProofError::TruncatedKeys(key_count));
    }
    proof.related_keys.reserve(key_count);
    for (uint32_t i = 0; i < key_count; ++i) {
        proof.related_keys.push_back(ReadKey(bytes, pos));
        pos += kPublicKeyBytes;
    }

    const uint8_t has_handle = bytes[pos++];
    if (has_handle > 1) {
        return ResultType::Err(IdentityProofError::InvalidHandleFlag(has_handle));
    }
    if (has_handle == 1) {
        if (bytes.size() < pos + 2) {
            return ResultType::Err(IdentityProofError::TruncatedHandleLen());
        }
        const size_t handle_len = encoding::ReadBigEndian16(bytes.data() + pos);
        pos += 2;
        if (bytes.size() < pos + handle_len) {
            return ResultType::Err(IdentityProofError::TruncatedHandle(handle_len));
        }
        const auto handle_bytes = bytes.subspan(pos, handle_len);
        if (!IsValidUtf8(handle_bytes)) {
            return ResultType::Err(IdentityProofError::InvalidUtf8Handle());
        }
        proof.registry_handle.emplace(handle_bytes.begin(), handle_bytes.end());
        pos += handle_len;
    }

    if (bytes.size() < pos + kTrailerBytes) {
        return ResultType::Err(IdentityProofError::TruncatedTrailer());
    }
    proof.timestamp = encoding::ReadBigEndian64(bytes.data() + pos);
    pos += 8;
    std::array<uint8_t, kSignatureBytes> signature{};
    std::copy_n(bytes.begin() + pos, kSignatureBytes, signature.begin());
    proof.signature = Signature(signature);
    pos += kSignatureBytes;

    if (pos != bytes.size()) {
        return ResultType::Err(IdentityProofError::TrailingBytes(bytes.size() - pos));
    }
    return ResultType::Ok(std::move(proof));
}

bool IsValidUtf8(std::span<const uint8_t> bytes) noexcept {
    size_t i = 0;
    while (i < bytes.size()) {
        const uint8_t lead = bytes[i];
        size_t extra = 0;
        uint32_t code_point = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }
        if (bytes.size() - i <= extra) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            const uint8_t continuation = bytes[i + k];
            if ((continuation & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (continuation & 0x3F);
        }
        constexpr uint32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
        if (code_point < kMinForLength[extra] || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace crabcity::auth::identity
