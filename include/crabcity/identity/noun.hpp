#pragma once

#include "crabcity/core/result.hpp"
#include "crabcity/identity/keys.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crabcity::auth::identity {

enum class NounProvider : uint8_t {
    Handle,
    GitHub,
    Google,
    Email
};

enum class NounErrorType {
    UnknownFormat,
    InvalidHandle,
    InvalidGitHub,
    InvalidEmail
};

class NounError {
public:
    NounErrorType type;
    std::string message;

    NounError(const NounErrorType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static NounError UnknownFormat(std::string_view text);
    static NounError InvalidHandle(std::string_view reason);
    static NounError InvalidGitHub(std::string_view reason);
    static NounError InvalidEmail(std::string_view provider, std::string_view reason);
};

/**
 * @brief Human-meaningful name an invite can be addressed to
 *
 * Text forms: "@handle", "github:user", "google:addr", "email:addr".
 * Resolution to keys happens outside this library.
 */
class IdentityNoun {
public:
    static Result<IdentityNoun, NounError> Parse(std::string_view text);

    /// Validated construction from provider and subject.
    static Result<IdentityNoun, NounError> Create(NounProvider provider, std::string subject);

    /// {"provider": "github", "subject": "octocat"}
    static Result<IdentityNoun, NounError> FromJson(const nlohmann::json& value);

    [[nodiscard]] nlohmann::json ToJson() const;

    [[nodiscard]] std::string ToString() const;

    [[nodiscard]] NounProvider Provider() const noexcept { return provider_; }
    [[nodiscard]] std::string_view ProviderName() const noexcept;
    [[nodiscard]] const std::string& Subject() const noexcept { return subject_; }

    [[nodiscard]] Result<Unit, NounError> Validate() const;

    bool operator==(const IdentityNoun&) const = default;

private:
    IdentityNoun(NounProvider provider, std::string subject)
        : provider_(provider), subject_(std::move(subject)) {}

    NounProvider provider_;
    std::string subject_;
};

/**
 * @brief What an external registry answered for a noun
 *
 * The attestation is carried as-is and never parsed here.
 */
struct NounResolution {
    std::string account_id;
    std::optional<std::string> handle;
    std::vector<PublicKey> pubkeys;
    std::vector<uint8_t> attestation;

    [[nodiscard]] bool ContainsKey(const PublicKey& key) const;

    bool operator==(const NounResolution&) const = default;
};

} // namespace crabcity::auth::identity
