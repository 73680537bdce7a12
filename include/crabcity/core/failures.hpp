#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace crabcity::auth {
enum class CryptoFailureType {
    InitializationFailed,
    AllocationFailed,
    BufferTooSmall,
    BufferTooLarge,
    InvalidOperation,
    KeyGeneration,
    SigningFailed,
    EncodingFailed
};
enum class VerifyErrorType {
    InvalidPublicKey,
    SignatureMismatch,
    CryptoUnavailable
};
class CryptoFailure {
public:
    CryptoFailureType type;
    std::string message;
    CryptoFailure(const CryptoFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static CryptoFailure InitializationFailed(std::string msg) {
        return {CryptoFailureType::InitializationFailed, std::move(msg)};
    }
    static CryptoFailure AllocationFailed(std::string msg) {
        return {CryptoFailureType::AllocationFailed, std::move(msg)};
    }
    static CryptoFailure BufferTooSmall(std::string msg) {
        return {CryptoFailureType::BufferTooSmall, std::move(msg)};
    }
    static CryptoFailure BufferTooLarge(std::string msg) {
        return {CryptoFailureType::BufferTooLarge, std::move(msg)};
    }
    static CryptoFailure InvalidOperation(std::string msg) {
        return {CryptoFailureType::InvalidOperation, std::move(msg)};
    }
    static CryptoFailure KeyGeneration(std::string msg) {
        return {CryptoFailureType::KeyGeneration, std::move(msg)};
    }
    static CryptoFailure SigningFailed(std::string msg) {
        return {CryptoFailureType::SigningFailed, std::move(msg)};
    }
    static CryptoFailure EncodingFailed(std::string msg) {
        return {CryptoFailureType::EncodingFailed, std::move(msg)};
    }
};
class VerifyError {
public:
    VerifyErrorType type;
    std::string message;
    VerifyError(const VerifyErrorType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static VerifyError InvalidPublicKey(std::string msg) {
        return {VerifyErrorType::InvalidPublicKey, std::move(msg)};
    }
    static VerifyError SignatureMismatch(std::string msg) {
        return {VerifyErrorType::SignatureMismatch, std::move(msg)};
    }
    static VerifyError CryptoUnavailable(std::string msg) {
        return {VerifyErrorType::CryptoUnavailable, std::move(msg)};
    }
};

/// What a client should do after receiving an AuthError.
enum class RecoveryActionType {
    Reconnect,
    Retry,
    ContactAdmin,
    RedeemInvite,
    None
};
struct RecoveryAction {
    RecoveryActionType type = RecoveryActionType::None;
    uint64_t retry_after_secs = 0;
    std::vector<std::string> admin_fingerprints;
    std::string reason;

    [[nodiscard]] std::string_view ActionName() const noexcept;
};

enum class AuthErrorType {
    InvalidInvite,
    InvalidIdentityProof,
    InvalidSignature,
    NotAMember,
    GrantNotActive,
    InsufficientAccess,
    Blocklisted,
    HandleTaken,
    AlreadyAMember,
    RateLimited
};

/// Caller-facing classification of a failed authentication or authorization
/// decision. The storage and transport layers map the core's typed errors
/// onto this before surfacing them.
class AuthError {
public:
    AuthErrorType type;
    std::string message;
    std::string reason;
    std::string required_type;
    std::string required_action;
    uint64_t retry_after_secs = 0;

    AuthError(const AuthErrorType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static AuthError InvalidInvite(std::string detail);
    static AuthError InvalidIdentityProof(std::string detail);
    static AuthError InvalidSignature();
    static AuthError NotAMember();
    static AuthError GrantNotActive(std::string reason);
    static AuthError InsufficientAccess(std::string type, std::string action);
    static AuthError Blocklisted(std::string reason);
    static AuthError HandleTaken();
    static AuthError AlreadyAMember();
    static AuthError RateLimited(uint64_t retry_after_secs);

    [[nodiscard]] std::string_view ErrorCode() const noexcept;
    [[nodiscard]] RecoveryAction Recovery() const;

    /// {"error": code, "message": text, "recovery": {"action": ..., ...}}
    [[nodiscard]] std::string ToErrorResponseJson() const;
};
}
