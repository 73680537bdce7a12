#pragma once

#include "crabcity/core/result.hpp"
#include "crabcity/core/failures.hpp"
#include "crabcity/core/constants.hpp"
#include "crabcity/identity/keys.hpp"
#include "crabcity/access/capability.hpp"
#include "crabcity/configuration/trust_config.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace crabcity::auth::invite {

using InviteNonce = std::array<uint8_t, kInviteNonceBytes>;

/// Previous-link hash signed by a root link.
inline constexpr Hash256 kGenesisPrevHash{};

enum class InviteErrorType {
    // Decoding
    UnsupportedVersion,
    TooShort,
    EmptyChain,
    ChainTooDeep,
    WrongSize,
    UnknownCapability,
    InvalidBase32,
    // Chain rules
    DepthExhausted,
    DepthNotDecreasing,
    CapabilityEscalation,
    Expired,
    BrokenSignature,
    // Construction
    SigningFailed
};

class InviteError {
public:
    InviteErrorType type;
    std::string message;
    /// Zero-based position of the offending link, root = 0.
    std::optional<size_t> link_index;

    InviteError(const InviteErrorType t, std::string msg,
                std::optional<size_t> index = std::nullopt)
        : type(t), message(std::move(msg)), link_index(index) {}

    static InviteError UnsupportedVersion(uint8_t version);
    static InviteError TooShort(size_t length);
    static InviteError EmptyChain();
    static InviteError ChainTooDeep(size_t length, size_t limit);
    static InviteError WrongSize(size_t expected, size_t actual);
    static InviteError UnknownCapability(size_t link, uint8_t value);
    static InviteError InvalidBase32();
    static InviteError DepthExhausted(size_t link);
    static InviteError DepthNotDecreasing(size_t link, uint8_t depth, uint8_t previous);
    static InviteError CapabilityEscalation(
        size_t link, access::Capability requested, access::Capability allowed);
    static InviteError Expired(size_t link, uint64_t expires_at, uint64_t now);
    static InviteError BrokenSignature(size_t link, std::string_view detail);
    static InviteError SigningFailed(std::string_view detail);

    /// Collapse into the caller-facing classification.
    [[nodiscard]] AuthError ToAuthError() const;
};

/**
 * @brief One signed hop of a delegation chain
 *
 * Wire layout, 126 bytes:
 * issuer(32) capability(1) max_depth(1) max_uses(4 BE) expires_at(8 BE,
 * 0 = never) nonce(16) signature(64).
 */
struct InviteLink {
    identity::PublicKey issuer;
    access::Capability capability = access::Capability::View;
    uint8_t max_depth = 0;
    uint32_t max_uses = 0;
    std::optional<uint64_t> expires_at;
    InviteNonce nonce{};
    identity::Signature signature;

    /// SHA-256 over every field except the signature; the next link signs it.
    [[nodiscard]] Hash256 Hash() const;

    /// prev_hash ++ instance ++ capability ++ max_depth ++ max_uses ++ expires_at ++ nonce
    [[nodiscard]] static std::vector<uint8_t> SigningMessage(
        const Hash256& prev_hash,
        const identity::PublicKey& instance,
        access::Capability capability,
        uint8_t max_depth,
        uint32_t max_uses,
        std::optional<uint64_t> expires_at,
        const InviteNonce& nonce);

    /// Signs a new link with a fresh random nonce.
    [[nodiscard]] static Result<InviteLink, InviteError> Sign(
        const identity::SigningKey& signing_key,
        const Hash256& prev_hash,
        const identity::PublicKey& instance,
        access::Capability capability,
        uint8_t max_depth,
        uint32_t max_uses,
        std::optional<uint64_t> expires_at);

    [[nodiscard]] Result<Unit, VerifyError> VerifySignature(
        const Hash256& prev_hash, const identity::PublicKey& instance) const;

    void AppendTo(std::vector<uint8_t>& out) const;

    bool operator==(const InviteLink&) const = default;
};

/// What a verified chain grants. Use counts and issuer standing are the
/// caller's to check at redemption.
struct InviteClaims {
    identity::PublicKey instance;
    access::Capability capability = access::Capability::View;
    identity::PublicKey root_issuer;
    identity::PublicKey leaf_issuer;
    size_t chain_depth = 0;
    InviteNonce nonce{};

    bool operator==(const InviteClaims&) const = default;
};

/**
 * @brief Self-contained, offline-verifiable capability grant
 *
 * Wire layout: version(1) instance(32) count(1) then count links. A flat
 * invite is one link with max_depth 0.
 */
class Invite {
public:
    Invite(uint8_t version, const identity::PublicKey& instance, std::vector<InviteLink> links)
        : version_(version)
        , instance_(instance)
        , links_(std::move(links)) {}

    static Result<Invite, InviteError> CreateFlat(
        const identity::SigningKey& signing_key,
        const identity::PublicKey& instance,
        access::Capability capability,
        uint32_t max_uses,
        std::optional<uint64_t> expires_at);

    /**
     * @brief Root link that may be delegated max_depth more times
     *
     * Fails with ChainTooDeep if max_depth would let the chain outgrow the
     * configured cap.
     */
    static Result<Invite, InviteError> CreateRoot(
        const identity::SigningKey& signing_key,
        const identity::PublicKey& instance,
        access::Capability capability,
        uint8_t max_depth,
        uint32_t max_uses,
        std::optional<uint64_t> expires_at,
        const configuration::TrustConfig& config = configuration::TrustConfig::Default());

    /**
     * @brief Append a narrower link signed by signing_key
     *
     * Refused up front for a capability above the leaf's or a leaf with no
     * depth left; verification would reject both anyway.
     */
    static Result<Invite, InviteError> Delegate(
        const Invite& parent,
        const identity::SigningKey& signing_key,
        access::Capability capability,
        uint32_t max_uses,
        std::optional<uint64_t> expires_at);

    /// VerifyAt with the current wall-clock time.
    [[nodiscard]] Result<InviteClaims, InviteError> Verify(
        const configuration::TrustConfig& config = configuration::TrustConfig::Default()) const;

    /**
     * @brief Walk the chain root to leaf
     *
     * Per link: signature over the previous link's hash, capability no
     * higher than the previous link's, max_depth strictly below a non-zero
     * previous max_depth, not expired (now == expires_at still passes).
     */
    [[nodiscard]] Result<InviteClaims, InviteError> VerifyAt(
        uint64_t now_unix_secs,
        const configuration::TrustConfig& config = configuration::TrustConfig::Default()) const;

    [[nodiscard]] std::vector<uint8_t> ToBytes() const;

    /**
     * @brief Decode untrusted bytes
     *
     * Never reads out of bounds and never allocates for more than
     * kMaxChainDepth links. Signatures are not checked here.
     */
    static Result<Invite, InviteError> FromBytes(std::span<const uint8_t> bytes);

    [[nodiscard]] std::string ToBase32() const;

    static Result<Invite, InviteError> FromBase32(std::string_view text);

    [[nodiscard]] uint8_t Version() const noexcept { return version_; }
    [[nodiscard]] const identity::PublicKey& Instance() const noexcept { return instance_; }
    [[nodiscard]] const std::vector<InviteLink>& Links() const noexcept { return links_; }

    /// Last link. The chain is non-empty for anything built or parsed here.
    [[nodiscard]] const InviteLink& Leaf() const { return links_.back(); }

    bool operator==(const Invite&) const = default;

private:
    uint8_t version_;
    identity::PublicKey instance_;
    std::vector<InviteLink> links_;
};

} // namespace crabcity::auth::invite
