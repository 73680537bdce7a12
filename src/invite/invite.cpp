#include "crabcity/invite/invite.hpp"
#include "crabcity/crypto/sodium_interop.hpp"
#include "crabcity/encoding/base32.hpp"
#include "crabcity/encoding/byte_order.hpp"
#include "crabcity/core/format.hpp"
#include "crabcity/debug/trace_logger.hpp"

#include <algorithm>
#include <chrono>

namespace crabcity::auth::invite {

using crypto::SodiumInterop;
using crypto::Sha256Hasher;
using identity::PublicKey;
using identity::Signature;
using identity::SigningKey;
using access::Capability;

namespace {

// Offsets within a 126-byte link
constexpr size_t kIssuerOffset = 0;
constexpr size_t kCapabilityOffset = kIssuerOffset + kPublicKeyBytes;
constexpr size_t kDepthOffset = kCapabilityOffset + 1;
constexpr size_t kMaxUsesOffset = kDepthOffset + 1;
constexpr size_t kExpiresOffset = kMaxUsesOffset + 4;
constexpr size_t kNonceOffset = kExpiresOffset + 8;
constexpr size_t kSignatureOffset = kNonceOffset + kInviteNonceBytes;
static_assert(kSignatureOffset + kSignatureBytes == kInviteLinkBytes);

uint64_t WireExpiry(const std::optional<uint64_t>& expires_at) {
    return expires_at.value_or(0);
}

std::optional<uint64_t> NormalizeExpiry(const std::optional<uint64_t>& expires_at) {
    if (expires_at.has_value() && *expires_at == 0) {
        return std::nullopt;
    }
    return expires_at;
}

uint64_t NowUnixSeconds() {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
}

Result<InviteLink, InviteError> ParseLink(std::span<const uint8_t> bytes, const size_t index) {
    const auto capability = access::CapabilityFromByte(bytes[kCapabilityOffset]);
    if (!capability.has_value()) {
        return Result<InviteLink, InviteError>::Err(
            InviteError::UnknownCapability(index, bytes[kCapabilityOffset]));
    }

    InviteLink link;
    std::array<uint8_t, kPublicKeyBytes> issuer{};
    std::copy_n(bytes.begin() + kIssuerOffset, kPublicKeyBytes, issuer.begin());
    link.issuer = PublicKey(issuer);
    link.capability = *capability;
    link.max_depth = bytes[kDepthOffset];
    link.max_uses = encoding::ReadBigEndian32(bytes.data() + kMaxUsesOffset);
    link.expires_at = NormalizeExpiry(encoding::ReadBigEndian64(bytes.data() + kExpiresOffset));
    std::copy_n(bytes.begin() + kNonceOffset, kInviteNonceBytes, link.nonce.begin());
    std::array<uint8_t, kSignatureBytes> signature{};
    std::copy_n(bytes.begin() + kSignatureOffset, kSignatureBytes, signature.begin());
    link.signature = Signature(signature);
    return Result<InviteLink, InviteError>::Ok(std::move(link));
}

}  // namespace

// ============================================================================
// InviteError
// ============================================================================

InviteError InviteError::UnsupportedVersion(const uint8_t version) {
    return {InviteErrorType::UnsupportedVersion,
            compat::format("unsupported invite version 0x{:02x}", version)};
}

InviteError InviteError::TooShort(const size_t length) {
    return {InviteErrorType::TooShort,
            compat::format("invite is {} bytes, header alone needs {}", length, kInviteHeaderBytes)};
}

InviteError InviteError::EmptyChain() {
    return {InviteErrorType::EmptyChain, "invite chain has no links"};
}

InviteError InviteError::ChainTooDeep(const size_t length, const size_t limit) {
    return {InviteErrorType::ChainTooDeep,
            compat::format("invite chain of {} links exceeds the limit of {}", length, limit)};
}

InviteError InviteError::WrongSize(const size_t expected, const size_t actual) {
    return {InviteErrorType::WrongSize,
            compat::format("invite should be {} bytes, got {}", expected, actual)};
}

InviteError InviteError::UnknownCapability(const size_t link, const uint8_t value) {
    return {InviteErrorType::UnknownCapability,
            compat::format("unknown capability byte 0x{:02x} at link {}", value, link), link};
}

InviteError InviteError::InvalidBase32() {
    return {InviteErrorType::InvalidBase32, "invite text is not valid base32"};
}

InviteError InviteError::DepthExhausted(const size_t link) {
    return {InviteErrorType::DepthExhausted,
            compat::format("delegation depth exhausted at link {}", link), link};
}

InviteError InviteError::DepthNotDecreasing(
    const size_t link, const uint8_t depth, const uint8_t previous) {
    return {InviteErrorType::DepthNotDecreasing,
            compat::format("max_depth must decrease at link {}: {} >= {}", link, depth, previous),
            link};
}

InviteError InviteError::CapabilityEscalation(
    const size_t link, const Capability requested, const Capability allowed) {
    return {InviteErrorType::CapabilityEscalation,
            compat::format("capability escalation at link {}: {} > {}",
                           link, access::ToString(requested), access::ToString(allowed)),
            link};
}

InviteError InviteError::Expired(const size_t link, const uint64_t expires_at, const uint64_t now) {
    return {InviteErrorType::Expired,
            compat::format("link {} expired at {} (now {})", link, expires_at, now), link};
}

InviteError InviteError::BrokenSignature(const size_t link, std::string_view detail) {
    return {InviteErrorType::BrokenSignature,
            compat::format("bad signature at link {}: {}", link, detail), link};
}

InviteError InviteError::SigningFailed(std::string_view detail) {
    return {InviteErrorType::SigningFailed, compat::format("failed to sign link: {}", detail)};
}

AuthError InviteError::ToAuthError() const {
    return AuthError::InvalidInvite(message);
}

// ============================================================================
// InviteLink
// ============================================================================

Hash256 InviteLink::Hash() const {
    return Sha256Hasher()
        .Update(issuer.AsSpan())
        .UpdateByte(static_cast<uint8_t>(capability))
        .UpdateByte(max_depth)
        .UpdateU32(max_uses)
        .UpdateU64(WireExpiry(expires_at))
        .Update(nonce)
        .Finalize();
}

std::vector<uint8_t> InviteLink::SigningMessage(
    const Hash256& prev_hash,
    const PublicKey& instance,
    const Capability capability,
    const uint8_t max_depth,
    const uint32_t max_uses,
    const std::optional<uint64_t> expires_at,
    const InviteNonce& nonce) {

    std::vector<uint8_t> message;
    message.reserve(kHashBytes + kPublicKeyBytes + 1 + 1 + 4 + 8 + kInviteNonceBytes);
    encoding::Append(message, prev_hash);
    encoding::Append(message, instance.AsSpan());
    message.push_back(static_cast<uint8_t>(capability));
    message.push_back(max_depth);
    encoding::Append(message, encoding::ToBigEndian32(max_uses));
    encoding::Append(message, encoding::ToBigEndian64(WireExpiry(expires_at)));
    encoding::Append(message, nonce);
    return message;
}

Result<InviteLink, InviteError> InviteLink::Sign(
    const SigningKey& signing_key,
    const Hash256& prev_hash,
    const PublicKey& instance,
    const Capability capability,
    const uint8_t max_depth,
    const uint32_t max_uses,
    const std::optional<uint64_t> expires_at) {

    InviteLink link;
    link.issuer = signing_key.GetPublicKey();
    link.capability = capability;
    link.max_depth = max_depth;
    link.max_uses = max_uses;
    link.expires_at = NormalizeExpiry(expires_at);
    SodiumInterop::FillRandom(link.nonce);

    const auto message = SigningMessage(
        prev_hash, instance, capability, max_depth, max_uses, link.expires_at, link.nonce);
    auto signature = signing_key.Sign(message);
    if (signature.IsErr()) {
        return Result<InviteLink, InviteError>::Err(
            InviteError::SigningFailed(signature.UnwrapErr().message));
    }
    link.signature = signature.Unwrap();
    return Result<InviteLink, InviteError>::Ok(std::move(link));
}

Result<Unit, VerifyError> InviteLink::VerifySignature(
    const Hash256& prev_hash, const PublicKey& instance) const {
    const auto message = SigningMessage(
        prev_hash, instance, capability, max_depth, max_uses, expires_at, nonce);
    return identity::Verify(issuer, message, signature);
}

void InviteLink::AppendTo(std::vector<uint8_t>& out) const {
    encoding::Append(out, issuer.AsSpan());
    out.push_back(static_cast<uint8_t>(capability));
    out.push_back(max_depth);
    encoding::Append(out, encoding::ToBigEndian32(max_uses));
    encoding::Append(out, encoding::ToBigEndian64(WireExpiry(expires_at)));
    encoding::Append(out, nonce);
    encoding::Append(out, signature.AsSpan());
}

// ============================================================================
// Construction
// ============================================================================

Result<Invite, InviteError> Invite::CreateFlat(
    const SigningKey& signing_key,
    const PublicKey& instance,
    const Capability capability,
    const uint32_t max_uses,
    const std::optional<uint64_t> expires_at) {

    auto link = InviteLink::Sign(
        signing_key, kGenesisPrevHash, instance, capability, 0, max_uses, expires_at);
    if (link.IsErr()) {
        return Result<Invite, InviteError>::Err(std::move(link).UnwrapErr());
    }
    std::vector<InviteLink> links;
    links.push_back(std::move(link).Unwrap());
    return Result<Invite, InviteError>::Ok(Invite(kInviteVersion, instance, std::move(links)));
}

Result<Invite, InviteError> Invite::CreateRoot(
    const SigningKey& signing_key,
    const PublicKey& instance,
    const Capability capability,
    const uint8_t max_depth,
    const uint32_t max_uses,
    const std::optional<uint64_t> expires_at,
    const configuration::TrustConfig& config) {

    if (max_depth > config.MaxRootDelegationDepth()) {
        return Result<Invite, InviteError>::Err(InviteError::ChainTooDeep(
            static_cast<size_t>(max_depth) + 1, config.MaxChainDepth()));
    }

    auto link = InviteLink::Sign(
        signing_key, kGenesisPrevHash, instance, capability, max_depth, max_uses, expires_at);
    if (link.IsErr()) {
        return Result<Invite, InviteError>::Err(std::move(link).UnwrapErr());
    }
    std::vector<InviteLink> links;
    links.push_back(std::move(link).Unwrap());
    return Result<Invite, InviteError>::Ok(Invite(kInviteVersion, instance, std::move(links)));
}

Result<Invite, InviteError> Invite::Delegate(
    const Invite& parent,
    const SigningKey& signing_key,
    const Capability capability,
    const uint32_t max_uses,
    const std::optional<uint64_t> expires_at) {

    if (parent.links_.empty()) {
        return Result<Invite, InviteError>::Err(InviteError::EmptyChain());
    }
    const size_t next_index = parent.links_.size();
    if (next_index >= kMaxChainDepth) {
        return Result<Invite, InviteError>::Err(
            InviteError::ChainTooDeep(next_index + 1, kMaxChainDepth));
    }

    const InviteLink& leaf = parent.Leaf();
    if (leaf.max_depth == 0) {
        return Result<Invite, InviteError>::Err(InviteError::DepthExhausted(next_index));
    }
    if (capability > leaf.capability) {
        return Result<Invite, InviteError>::Err(
            InviteError::CapabilityEscalation(next_index, capability, leaf.capability));
    }

    auto link = InviteLink::Sign(
        signing_key, leaf.Hash(), parent.instance_, capability,
        static_cast<uint8_t>(leaf.max_depth - 1), max_uses, expires_at);
    if (link.IsErr()) {
        return Result<Invite, InviteError>::Err(std::move(link).UnwrapErr());
    }

    std::vector<InviteLink> links = parent.links_;
    links.push_back(std::move(link).Unwrap());
    return Result<Invite, InviteError>::Ok(
        Invite(parent.version_, parent.instance_, std::move(links)));
}

// ============================================================================
// Verification
// ============================================================================

Result<InviteClaims, InviteError> Invite::Verify(const configuration::TrustConfig& config) const {
    return VerifyAt(NowUnixSeconds(), config);
}

Result<InviteClaims, InviteError> Invite::VerifyAt(
    const uint64_t now_unix_secs, const configuration::TrustConfig& config) const {
    using ResultType = Result<InviteClaims, InviteError>;

    CRABCITY_TRACE_SECTION(debug::Subsystem::Invite, "VERIFY");

    if (version_ != kInviteVersion) {
        return ResultType::Err(InviteError::UnsupportedVersion(version_));
    }
    if (links_.empty()) {
        return ResultType::Err(InviteError::EmptyChain());
    }
    if (links_.size() > config.MaxChainDepth()) {
        return ResultType::Err(InviteError::ChainTooDeep(links_.size(), config.MaxChainDepth()));
    }

    Hash256 prev_hash = kGenesisPrevHash;
    for (size_t i = 0; i < links_.size(); ++i) {
        const InviteLink& link = links_[i];
        debug::LogInviteLink(i, link.issuer.AsSpan(), access::ToString(link.capability),
                             link.max_depth, prev_hash);

        if (auto verified = link.VerifySignature(prev_hash, instance_); verified.IsErr()) {
            debug::LogRejection(debug::Subsystem::Invite, verified.UnwrapErr().message);
            return ResultType::Err(InviteError::BrokenSignature(i, verified.UnwrapErr().message));
        }

        if (i > 0) {
            const InviteLink& previous = links_[i - 1];
            if (link.capability > previous.capability) {
                return ResultType::Err(
                    InviteError::CapabilityEscalation(i, link.capability, previous.capability));
            }
            if (previous.max_depth == 0) {
                return ResultType::Err(InviteError::DepthExhausted(i));
            }
            if (link.max_depth >= previous.max_depth) {
                return ResultType::Err(
                    InviteError::DepthNotDecreasing(i, link.max_depth, previous.max_depth));
            }
        }

        if (link.expires_at.has_value() && now_unix_secs > *link.expires_at) {
            return ResultType::Err(InviteError::Expired(i, *link.expires_at, now_unix_secs));
        }

        prev_hash = link.Hash();
    }

    const InviteLink& root = links_.front();
    const InviteLink& leaf = links_.back();
    return ResultType::Ok(InviteClaims{
        instance_,
        leaf.capability,
        root.issuer,
        leaf.issuer,
        links_.size(),
        leaf.nonce,
    });
}

// ============================================================================
// Encoding
// ============================================================================

std::vector<uint8_t> Invite::ToBytes() const {
    std::vector<uint8_t> out;
    out.reserve(kInviteHeaderBytes + links_.size() * kInviteLinkBytes);
    out.push_back(version_);
    encoding::Append(out, instance_.AsSpan());
    // An oversized chain keeps a count FromBytes rejects instead of wrapping
    out.push_back(static_cast<uint8_t>(std::min<size_t>(links_.size(), 0xFF)));
    for (const auto& link : links_) {
        link.AppendTo(out);
    }
    return out;
}

Result<Invite, InviteError> Invite::FromBytes(std::span<const uint8_t> bytes) {
    using ResultType = Result<Invite, InviteError>;

    if (bytes.size() < kInviteHeaderBytes) {
        return ResultType::Err(InviteError::TooShort(bytes.size()));
    }

    const uint8_t version = bytes[0];
    const size_t count = bytes[1 + kPublicKeyBytes];
    if (count == 0) {
        return ResultType::Err(InviteError::EmptyChain());
    }
    if (count > kMaxChainDepth) {
        return ResultType::Err(InviteError::ChainTooDeep(count, kMaxChainDepth));
    }
    const size_t expected = kInviteHeaderBytes + count * kInviteLinkBytes;
    if (bytes.size() != expected) {
        return ResultType::Err(InviteError::WrongSize(expected, bytes.size()));
    }

    std::array<uint8_t, kPublicKeyBytes> instance{};
    std::copy_n(bytes.begin() + 1, kPublicKeyBytes, instance.begin());

    std::vector<InviteLink> links;
    links.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto link = ParseLink(
            bytes.subspan(kInviteHeaderBytes + i * kInviteLinkBytes, kInviteLinkBytes), i);
        if (link.IsErr()) {
            return ResultType::Err(std::move(link).UnwrapErr());
        }
        links.push_back(std::move(link).Unwrap());
    }
    return ResultType::Ok(Invite(version, PublicKey(instance), std::move(links)));
}

std::string Invite::ToBase32() const {
    return encoding::EncodeBase32(ToBytes());
}

Result<Invite, InviteError> Invite::FromBase32(std::string_view text) {
    auto decoded = encoding::DecodeBase32(text);
    if (!decoded.has_value()) {
        return Result<Invite, InviteError>::Err(InviteError::InvalidBase32());
    }
    return FromBytes(*decoded);
}

} // namespace crabcity::auth::invite
