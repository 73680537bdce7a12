#include "crabcity/membership/membership.hpp"
#include "crabcity/core/format.hpp"
#include "crabcity/debug/trace_logger.hpp"

namespace crabcity::auth::membership {

std::string_view ToString(const MembershipState state) noexcept {
    switch (state) {
        case MembershipState::Invited: return "invited";
        case MembershipState::Active: return "active";
        case MembershipState::Suspended: return "suspended";
        case MembershipState::Removed: return "removed";
    }
    return "removed";
}

std::optional<MembershipState> ParseMembershipState(std::string_view name) noexcept {
    if (name == "invited") return MembershipState::Invited;
    if (name == "active") return MembershipState::Active;
    if (name == "suspended") return MembershipState::Suspended;
    if (name == "removed") return MembershipState::Removed;
    return std::nullopt;
}

std::string_view ToString(const TransitionKind kind) noexcept {
    switch (kind) {
        case TransitionKind::Activate: return "activate";
        case TransitionKind::Suspend: return "suspend";
        case TransitionKind::Reinstate: return "reinstate";
        case TransitionKind::Remove: return "remove";
        case TransitionKind::Expire: return "expire";
        case TransitionKind::BlocklistHit: return "blocklist_hit";
        case TransitionKind::BlocklistLift: return "blocklist_lift";
        case TransitionKind::Replace: return "replace";
    }
    return "unknown";
}

// ============================================================================
// Transitions
// ============================================================================

MembershipTransition MembershipTransition::Activate() {
    return MembershipTransition{TransitionKind::Activate, {}, {}, {}, {}};
}

MembershipTransition MembershipTransition::Suspend(std::string reason, SuspensionSource source) {
    return MembershipTransition{
        TransitionKind::Suspend, std::move(reason), std::move(source), {}, {}};
}

MembershipTransition MembershipTransition::Reinstate() {
    return MembershipTransition{TransitionKind::Reinstate, {}, {}, {}, {}};
}

MembershipTransition MembershipTransition::Remove() {
    return MembershipTransition{TransitionKind::Remove, {}, {}, {}, {}};
}

MembershipTransition MembershipTransition::Expire() {
    return MembershipTransition{TransitionKind::Expire, {}, {}, {}, {}};
}

MembershipTransition MembershipTransition::BlocklistHit(std::string scope) {
    return MembershipTransition{TransitionKind::BlocklistHit, {}, {}, std::move(scope), {}};
}

MembershipTransition MembershipTransition::BlocklistLift(std::string scope) {
    return MembershipTransition{TransitionKind::BlocklistLift, {}, {}, std::move(scope), {}};
}

MembershipTransition MembershipTransition::Replace(const identity::PublicKey& new_key) {
    return MembershipTransition{TransitionKind::Replace, {}, {}, {}, new_key};
}

TransitionError TransitionError::TerminalState(const TransitionKind kind) {
    return {TransitionErrorType::TerminalState,
            compat::format("cannot {}: removed is a terminal state", ToString(kind)),
            kind, MembershipState::Removed};
}

TransitionError TransitionError::InvalidTransition(
    const TransitionKind kind, const MembershipState from) {
    return {TransitionErrorType::InvalidTransition,
            compat::format("{} is not valid from {}", ToString(kind), ToString(from)),
            kind, from};
}

TransitionError TransitionError::SuspensionSourceMismatch(
    const SuspensionSource& stored, std::string_view requested_scope) {
    std::string message;
    if (stored.type == SuspensionSourceType::Admin) {
        message = "blocklist lift does not apply to an admin suspension";
    } else {
        message = compat::format(
            "blocklist lift for scope '{}' does not match suspension scope '{}'",
            requested_scope, stored.scope);
    }
    return {TransitionErrorType::SuspensionSourceMismatch, std::move(message),
            TransitionKind::BlocklistLift, MembershipState::Suspended};
}

TransitionError TransitionError::LoopbackImmutable(
    const TransitionKind kind, const MembershipState from) {
    return {TransitionErrorType::LoopbackImmutable,
            compat::format("the loopback grant cannot {}", ToString(kind)),
            kind, from};
}

Result<StateWithContext, TransitionError> StateWithContext::Apply(
    const MembershipTransition& transition) const {
    using ResultType = Result<StateWithContext, TransitionError>;
    const TransitionKind kind = transition.kind;

    if (state == MembershipState::Removed) {
        return ResultType::Err(TransitionError::TerminalState(kind));
    }

    // Valid from every remaining state
    if (kind == TransitionKind::Remove || kind == TransitionKind::Replace) {
        return ResultType::Ok(Of(MembershipState::Removed));
    }

    switch (state) {
        case MembershipState::Invited:
            if (kind == TransitionKind::Activate) {
                return ResultType::Ok(Of(MembershipState::Active));
            }
            if (kind == TransitionKind::Expire) {
                return ResultType::Ok(Of(MembershipState::Removed));
            }
            break;

        case MembershipState::Active:
            if (kind == TransitionKind::Suspend) {
                return ResultType::Ok(Suspended(transition.source, transition.reason));
            }
            if (kind == TransitionKind::BlocklistHit) {
                return ResultType::Ok(Suspended(
                    SuspensionSource::Blocklist(transition.scope), "blocklisted"));
            }
            break;

        case MembershipState::Suspended:
            if (kind == TransitionKind::Reinstate) {
                return ResultType::Ok(Of(MembershipState::Active));
            }
            if (kind == TransitionKind::BlocklistLift) {
                const SuspensionSource stored =
                    suspension_source.value_or(SuspensionSource::Admin());
                if (stored.type != SuspensionSourceType::Blocklist ||
                    stored.scope != transition.scope) {
                    return ResultType::Err(
                        TransitionError::SuspensionSourceMismatch(stored, transition.scope));
                }
                return ResultType::Ok(Of(MembershipState::Active));
            }
            break;

        case MembershipState::Removed:
            break;
    }

    return ResultType::Err(TransitionError::InvalidTransition(kind, state));
}

// ============================================================================
// MemberGrant
// ============================================================================

MemberGrant MemberGrant::FromInvite(
    const identity::PublicKey& redeemer, const invite::InviteClaims& claims) {
    MemberGrant grant;
    grant.public_key = redeemer;
    grant.capability = claims.capability;
    grant.access = access::AccessRightsFor(claims.capability);
    grant.status = StateWithContext::Of(MembershipState::Invited);
    grant.invited_by = claims.leaf_issuer;
    grant.invited_via = claims.nonce;
    return grant;
}

MemberGrant MemberGrant::Loopback() {
    MemberGrant grant;
    grant.public_key = identity::PublicKey::Loopback();
    grant.capability = access::Capability::Owner;
    grant.access = access::AccessRightsFor(access::Capability::Owner);
    grant.status = StateWithContext::Of(MembershipState::Active);
    return grant;
}

Result<MemberGrant, TransitionError> MemberGrant::Apply(
    const MembershipTransition& transition) const {

    if (IsLoopback()) {
        switch (transition.kind) {
            case TransitionKind::Suspend:
            case TransitionKind::BlocklistHit:
            case TransitionKind::Remove:
            case TransitionKind::Expire:
            case TransitionKind::Replace:
                debug::LogRejection(debug::Subsystem::Membership, "loopback grant is immutable");
                return Result<MemberGrant, TransitionError>::Err(
                    TransitionError::LoopbackImmutable(transition.kind, status.state));
            default:
                break;
        }
    }

    auto next = status.Apply(transition);
    if (next.IsErr()) {
        return Result<MemberGrant, TransitionError>::Err(std::move(next).UnwrapErr());
    }

    MemberGrant updated = *this;
    updated.status = std::move(next).Unwrap();
    debug::LogTransition(ToString(status.state), ToString(transition.kind),
                         ToString(updated.status.state));
    return Result<MemberGrant, TransitionError>::Ok(std::move(updated));
}

MemberGrant MemberGrant::Replacement(const identity::PublicKey& new_key) const {
    MemberGrant successor;
    successor.public_key = new_key;
    successor.capability = capability;
    successor.access = access;
    successor.status = StateWithContext::Of(MembershipState::Active);
    successor.invited_by = invited_by;
    successor.invited_via = invited_via;
    successor.replaces = public_key;
    return successor;
}

MemberGrant MemberGrant::WithAccess(access::AccessRights rights) const {
    MemberGrant updated = *this;
    updated.capability = access::CapabilityFromAccess(rights).value_or(capability);
    updated.access = std::move(rights);
    return updated;
}

Result<Unit, AuthError> MemberGrant::Authorize(
    std::string_view type, std::string_view action) const {
    if (!IsActive()) {
        return Result<Unit, AuthError>::Err(
            AuthError::GrantNotActive(std::string(ToString(status.state))));
    }
    if (!access.Contains(type, action)) {
        return Result<Unit, AuthError>::Err(
            AuthError::InsufficientAccess(std::string(type), std::string(action)));
    }
    return Result<Unit, AuthError>::Ok(unit);
}

Result<Unit, AuthError> AuthorizeConnection(
    const identity::PublicKey& remote_key,
    const bool is_local_connection,
    const MemberGrant* grant) {

    if (remote_key.IsLoopback() && !is_local_connection) {
        debug::LogRejection(debug::Subsystem::Membership, "loopback key on a remote connection");
        return Result<Unit, AuthError>::Err(AuthError::InvalidSignature());
    }
    if (grant == nullptr || grant->public_key != remote_key) {
        return Result<Unit, AuthError>::Err(AuthError::NotAMember());
    }

    const StateWithContext& status = grant->status;
    switch (status.state) {
        case MembershipState::Active:
            return Result<Unit, AuthError>::Ok(unit);
        case MembershipState::Suspended:
            if (status.suspension_source.has_value() &&
                status.suspension_source->type == SuspensionSourceType::Blocklist) {
                return Result<Unit, AuthError>::Err(
                    AuthError::Blocklisted(status.suspension_source->scope));
            }
            return Result<Unit, AuthError>::Err(AuthError::GrantNotActive(
                status.suspension_reason.empty() ? std::string("suspended")
                                                 : status.suspension_reason));
        case MembershipState::Invited:
        case MembershipState::Removed:
            break;
    }
    return Result<Unit, AuthError>::Err(
        AuthError::GrantNotActive(std::string(ToString(status.state))));
}

} // namespace crabcity::auth::membership
