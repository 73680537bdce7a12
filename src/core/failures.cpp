#include "crabcity/core/failures.hpp"
#include "crabcity/core/format.hpp"

#include <nlohmann/json.hpp>

namespace crabcity::auth {

std::string_view RecoveryAction::ActionName() const noexcept {
    switch (type) {
        case RecoveryActionType::Reconnect: return "reconnect";
        case RecoveryActionType::Retry: return "retry";
        case RecoveryActionType::ContactAdmin: return "contact_admin";
        case RecoveryActionType::RedeemInvite: return "redeem_invite";
        case RecoveryActionType::None: return "none";
    }
    return "none";
}

AuthError AuthError::InvalidInvite(std::string detail) {
    return {AuthErrorType::InvalidInvite, compat::format("invalid invite: {}", detail)};
}

AuthError AuthError::InvalidIdentityProof(std::string detail) {
    return {AuthErrorType::InvalidIdentityProof,
            compat::format("invalid identity proof: {}", detail)};
}

AuthError AuthError::InvalidSignature() {
    return {AuthErrorType::InvalidSignature, "invalid signature"};
}

AuthError AuthError::NotAMember() {
    return {AuthErrorType::NotAMember, "not a member"};
}

AuthError AuthError::GrantNotActive(std::string reason) {
    AuthError error(AuthErrorType::GrantNotActive,
                    compat::format("grant not active: {}", reason));
    error.reason = std::move(reason);
    return error;
}

AuthError AuthError::InsufficientAccess(std::string type, std::string action) {
    AuthError error(AuthErrorType::InsufficientAccess,
                    compat::format("insufficient access: requires {}:{}", type, action));
    error.required_type = std::move(type);
    error.required_action = std::move(action);
    return error;
}

AuthError AuthError::Blocklisted(std::string reason) {
    AuthError error(AuthErrorType::Blocklisted, compat::format("blocklisted: {}", reason));
    error.reason = std::move(reason);
    return error;
}

AuthError AuthError::HandleTaken() {
    return {AuthErrorType::HandleTaken, "handle taken"};
}

AuthError AuthError::AlreadyAMember() {
    return {AuthErrorType::AlreadyAMember, "already a member"};
}

AuthError AuthError::RateLimited(const uint64_t retry_after_secs) {
    AuthError error(AuthErrorType::RateLimited, "rate limited");
    error.retry_after_secs = retry_after_secs;
    return error;
}

std::string_view AuthError::ErrorCode() const noexcept {
    switch (type) {
        case AuthErrorType::InvalidInvite: return "invalid_invite";
        case AuthErrorType::InvalidIdentityProof: return "invalid_identity_proof";
        case AuthErrorType::InvalidSignature: return "invalid_signature";
        case AuthErrorType::NotAMember: return "not_a_member";
        case AuthErrorType::GrantNotActive: return "grant_not_active";
        case AuthErrorType::InsufficientAccess: return "insufficient_access";
        case AuthErrorType::Blocklisted: return "blocklisted";
        case AuthErrorType::HandleTaken: return "handle_taken";
        case AuthErrorType::AlreadyAMember: return "already_a_member";
        case AuthErrorType::RateLimited: return "rate_limited";
    }
    return "unknown";
}

RecoveryAction AuthError::Recovery() const {
    RecoveryAction action;
    switch (type) {
        case AuthErrorType::NotAMember:
            action.type = RecoveryActionType::RedeemInvite;
            break;
        case AuthErrorType::GrantNotActive:
        case AuthErrorType::Blocklisted:
            action.type = RecoveryActionType::ContactAdmin;
            action.reason = reason;
            break;
        case AuthErrorType::AlreadyAMember:
            action.type = RecoveryActionType::Reconnect;
            break;
        case AuthErrorType::RateLimited:
            action.type = RecoveryActionType::Retry;
            action.retry_after_secs = retry_after_secs;
            break;
        case AuthErrorType::InvalidInvite:
        case AuthErrorType::InvalidIdentityProof:
        case AuthErrorType::InvalidSignature:
        case AuthErrorType::InsufficientAccess:
        case AuthErrorType::HandleTaken:
            action.type = RecoveryActionType::None;
            break;
    }
    return action;
}

std::string AuthError::ToErrorResponseJson() const {
    const RecoveryAction action = Recovery();
    nlohmann::json recovery = {{"action", std::string(action.ActionName())}};
    switch (action.type) {
        case RecoveryActionType::Retry:
            recovery["retry_after_secs"] = action.retry_after_secs;
            break;
        case RecoveryActionType::ContactAdmin:
            recovery["admin_fingerprints"] = action.admin_fingerprints;
            recovery["reason"] = action.reason;
            break;
        default:
            break;
    }
    const nlohmann::json response = {
        {"error", std::string(ErrorCode())},
        {"message", message},
        {"recovery", std::move(recovery)},
    };
    return response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace crabcity::auth
