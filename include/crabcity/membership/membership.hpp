#pragma once

#include "crabcity/core/result.hpp"
#include "crabcity/core/failures.hpp"
#include "crabcity/core/constants.hpp"
#include "crabcity/identity/keys.hpp"
#include "crabcity/access/capability.hpp"
#include "crabcity/invite/invite.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace crabcity::auth::membership {

enum class MembershipState : uint8_t {
    Invited,
    Active,
    Suspended,
    Removed
};

[[nodiscard]] std::string_view ToString(MembershipState state) noexcept;
[[nodiscard]] std::optional<MembershipState> ParseMembershipState(std::string_view name) noexcept;

enum class SuspensionSourceType : uint8_t {
    Admin,
    Blocklist
};

struct SuspensionSource {
    SuspensionSourceType type = SuspensionSourceType::Admin;
    std::string scope;

    static SuspensionSource Admin() { return {SuspensionSourceType::Admin, {}}; }
    static SuspensionSource Blocklist(std::string scope) {
        return {SuspensionSourceType::Blocklist, std::move(scope)};
    }

    bool operator==(const SuspensionSource&) const = default;
};

enum class TransitionKind : uint8_t {
    Activate,
    Suspend,
    Reinstate,
    Remove,
    Expire,
    BlocklistHit,
    BlocklistLift,
    Replace
};

[[nodiscard]] std::string_view ToString(TransitionKind kind) noexcept;

/**
 * @brief One input symbol of the membership state machine
 *
 * Only the fields of the selected kind are meaningful; build values through
 * the factories.
 */
struct MembershipTransition {
    TransitionKind kind = TransitionKind::Activate;
    std::string reason;
    SuspensionSource source;
    std::string scope;
    identity::PublicKey new_key;

    static MembershipTransition Activate();
    static MembershipTransition Suspend(std::string reason, SuspensionSource source);
    static MembershipTransition Reinstate();
    static MembershipTransition Remove();
    static MembershipTransition Expire();
    static MembershipTransition BlocklistHit(std::string scope);
    static MembershipTransition BlocklistLift(std::string scope);
    static MembershipTransition Replace(const identity::PublicKey& new_key);
};

enum class TransitionErrorType {
    TerminalState,
    InvalidTransition,
    SuspensionSourceMismatch,
    LoopbackImmutable
};

class TransitionError {
public:
    TransitionErrorType type;
    std::string message;
    TransitionKind attempted;
    MembershipState from;

    TransitionError(const TransitionErrorType t, std::string msg,
                    const TransitionKind kind, const MembershipState state)
        : type(t), message(std::move(msg)), attempted(kind), from(state) {}

    static TransitionError TerminalState(TransitionKind kind);
    static TransitionError InvalidTransition(TransitionKind kind, MembershipState from);
    static TransitionError SuspensionSourceMismatch(
        const SuspensionSource& stored, std::string_view requested_scope);
    static TransitionError LoopbackImmutable(TransitionKind kind, MembershipState from);
};

/**
 * @brief Membership state plus the suspension context needed to decide a
 * later BlocklistLift
 */
struct StateWithContext {
    MembershipState state = MembershipState::Invited;
    std::optional<SuspensionSource> suspension_source;
    std::string suspension_reason;

    static StateWithContext Of(MembershipState state) {
        return {state, std::nullopt, {}};
    }
    static StateWithContext Suspended(SuspensionSource source, std::string reason = {}) {
        return {MembershipState::Suspended, std::move(source), std::move(reason)};
    }

    /**
     * @brief The transition function
     *
     * Removed is terminal. Activate and Expire only from Invited; Suspend and
     * BlocklistHit only from Active; Reinstate only from Suspended;
     * BlocklistLift only from a Blocklist suspension with the same scope;
     * Remove and Replace from anything but Removed.
     */
    [[nodiscard]] Result<StateWithContext, TransitionError> Apply(
        const MembershipTransition& transition) const;

    bool operator==(const StateWithContext&) const = default;
};

/**
 * @brief One actor's standing on an instance
 *
 * capability is the last preset the rights matched; access is what gets
 * checked.
 */
struct MemberGrant {
    identity::PublicKey public_key;
    access::Capability capability = access::Capability::View;
    access::AccessRights access;
    StateWithContext status;
    std::optional<identity::PublicKey> invited_by;
    std::optional<invite::InviteNonce> invited_via;
    std::optional<identity::PublicKey> replaces;

    /// New grant in Invited for the redeemer of a verified invite.
    static MemberGrant FromInvite(
        const identity::PublicKey& redeemer, const invite::InviteClaims& claims);

    /// The local operator: loopback key, Owner, Active.
    static MemberGrant Loopback();

    [[nodiscard]] bool IsLoopback() const noexcept {
        return public_key.IsLoopback();
    }

    [[nodiscard]] bool IsActive() const noexcept {
        return status.state == MembershipState::Active;
    }

    /**
     * @brief Advance the grant through the state machine
     *
     * The loopback grant refuses anything that would take it out of Active.
     */
    [[nodiscard]] Result<MemberGrant, TransitionError> Apply(
        const MembershipTransition& transition) const;

    /// Successor grant for key-loss recovery; the old grant takes Replace.
    [[nodiscard]] MemberGrant Replacement(const identity::PublicKey& new_key) const;

    /**
     * @brief Replace the rights after an admin tweak
     *
     * capability is relabeled only when rights equal a preset. Otherwise it
     * keeps the previous preset and is stale: display code must check
     * CapabilityFromAccess(access) and show the raw rights when it is empty.
     */
    [[nodiscard]] MemberGrant WithAccess(access::AccessRights rights) const;

    [[nodiscard]] Result<Unit, AuthError> Authorize(
        std::string_view type, std::string_view action) const;
};

/**
 * @brief Admission check for a freshly authenticated connection
 *
 * remote_key comes from the transport handshake. Anything but an Active
 * grant is a hard rejection, whatever the caller cached earlier.
 */
Result<Unit, AuthError> AuthorizeConnection(
    const identity::PublicKey& remote_key,
    bool is_local_connection,
    const MemberGrant* grant);

} // namespace crabcity::auth::membership
