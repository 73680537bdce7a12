#include "crabcity/identity/noun.hpp"
#include "crabcity/core/constants.hpp"
#include "crabcity/core/format.hpp"

#include <algorithm>

namespace crabcity::auth::identity {

namespace {

bool IsLowerAlnum(const char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

bool IsAlnum(const char c) {
    return IsLowerAlnum(c) || (c >= 'A' && c <= 'Z');
}

Result<Unit, NounError> ValidateHandle(std::string_view handle) {
    if (handle.size() < kHandleMinChars || handle.size() > kHandleMaxChars) {
        return Result<Unit, NounError>::Err(NounError::InvalidHandle(
            compat::format("must be {}-{} characters", kHandleMinChars, kHandleMaxChars)));
    }
    if (handle.front() == '-' || handle.back() == '-') {
        return Result<Unit, NounError>::Err(
            NounError::InvalidHandle("cannot start or end with hyphen"));
    }
    if (!std::all_of(handle.begin(), handle.end(),
                     [](const char c) { return IsLowerAlnum(c) || c == '-'; })) {
        return Result<Unit, NounError>::Err(
            NounError::InvalidHandle("must be lowercase alphanumeric + hyphens"));
    }
    return Result<Unit, NounError>::Ok(unit);
}

Result<Unit, NounError> ValidateGitHub(std::string_view user) {
    if (user.empty() || user.size() > kGitHubMaxChars) {
        return Result<Unit, NounError>::Err(NounError::InvalidGitHub(
            compat::format("must be 1-{} characters", kGitHubMaxChars)));
    }
    if (user.front() == '-') {
        return Result<Unit, NounError>::Err(NounError::InvalidGitHub("cannot start with hyphen"));
    }
    if (!std::all_of(user.begin(), user.end(),
                     [](const char c) { return IsAlnum(c) || c == '-'; })) {
        return Result<Unit, NounError>::Err(
            NounError::InvalidGitHub("must be alphanumeric + hyphens"));
    }
    return Result<Unit, NounError>::Ok(unit);
}

Result<Unit, NounError> ValidateEmail(std::string_view email, std::string_view provider) {
    if (email.empty()) {
        return Result<Unit, NounError>::Err(NounError::InvalidEmail(provider, "empty"));
    }
    const size_t at = email.find('@');
    if (at == std::string_view::npos) {
        return Result<Unit, NounError>::Err(NounError::InvalidEmail(provider, "missing @"));
    }
    const std::string_view local = email.substr(0, at);
    const std::string_view domain = email.substr(at + 1);
    if (local.empty()) {
        return Result<Unit, NounError>::Err(NounError::InvalidEmail(provider, "empty local part"));
    }
    if (domain.empty()) {
        return Result<Unit, NounError>::Err(NounError::InvalidEmail(provider, "empty domain"));
    }
    if (domain.find('.') == std::string_view::npos) {
        return Result<Unit, NounError>::Err(
            NounError::InvalidEmail(provider, "domain must contain a dot"));
    }
    return Result<Unit, NounError>::Ok(unit);
}

std::optional<NounProvider> ProviderFromName(std::string_view name) {
    if (name == "handle") return NounProvider::Handle;
    if (name == "github") return NounProvider::GitHub;
    if (name == "google") return NounProvider::Google;
    if (name == "email") return NounProvider::Email;
    return std::nullopt;
}

}  // namespace

NounError NounError::UnknownFormat(std::string_view text) {
    return {NounErrorType::UnknownFormat, compat::format("unknown noun format: {}", text)};
}

NounError NounError::InvalidHandle(std::string_view reason) {
    return {NounErrorType::InvalidHandle, compat::format("invalid handle: {}", reason)};
}

NounError NounError::InvalidGitHub(std::string_view reason) {
    return {NounErrorType::InvalidGitHub, compat::format("invalid github username: {}", reason)};
}

NounError NounError::InvalidEmail(std::string_view provider, std::string_view reason) {
    return {NounErrorType::InvalidEmail,
            compat::format("invalid email for {}: {}", provider, reason)};
}

// ============================================================================
// IdentityNoun
// ============================================================================

Result<IdentityNoun, NounError> IdentityNoun::Create(NounProvider provider, std::string subject) {
    IdentityNoun noun(provider, std::move(subject));
    if (auto valid = noun.Validate(); valid.IsErr()) {
        return Result<IdentityNoun, NounError>::Err(std::move(valid).UnwrapErr());
    }
    return Result<IdentityNoun, NounError>::Ok(std::move(noun));
}

Result<IdentityNoun, NounError> IdentityNoun::Parse(std::string_view text) {
    struct Prefix {
        std::string_view text;
        NounProvider provider;
    };
    constexpr Prefix kPrefixes[] = {
        {"@", NounProvider::Handle},
        {"github:", NounProvider::GitHub},
        {"google:", NounProvider::Google},
        {"email:", NounProvider::Email},
    };
    for (const auto& prefix : kPrefixes) {
        if (text.starts_with(prefix.text)) {
            return Create(prefix.provider, std::string(text.substr(prefix.text.size())));
        }
    }
    return Result<IdentityNoun, NounError>::Err(NounError::UnknownFormat(text));
}

Result<IdentityNoun, NounError> IdentityNoun::FromJson(const nlohmann::json& value) {
    if (!value.is_object()) {
        return Result<IdentityNoun, NounError>::Err(NounError::UnknownFormat(
            value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)));
    }
    const auto provider_it = value.find("provider");
    const auto subject_it = value.find("subject");
    if (provider_it == value.end() || !provider_it->is_string() ||
        subject_it == value.end() || !subject_it->is_string()) {
        return Result<IdentityNoun, NounError>::Err(NounError::UnknownFormat(
            value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)));
    }
    const auto provider = ProviderFromName(provider_it->get_ref<const std::string&>());
    if (!provider.has_value()) {
        return Result<IdentityNoun, NounError>::Err(
            NounError::UnknownFormat(provider_it->get_ref<const std::string&>()));
    }
    return Create(*provider, subject_it->get<std::string>());
}

nlohmann::json IdentityNoun::ToJson() const {
    return {{"provider", std::string(ProviderName())}, {"subject", subject_}};
}

std::string IdentityNoun::ToString() const {
    switch (provider_) {
        case NounProvider::Handle: return "@" + subject_;
        case NounProvider::GitHub: return "github:" + subject_;
        case NounProvider::Google: return "google:" + subject_;
        case NounProvider::Email: return "email:" + subject_;
    }
    return subject_;
}

std::string_view IdentityNoun::ProviderName() const noexcept {
    switch (provider_) {
        case NounProvider::Handle: return "handle";
        case NounProvider::GitHub: return "github";
        case NounProvider::Google: return "google";
        case NounProvider::Email: return "email";
    }
    return "handle";
}

Result<Unit, NounError> IdentityNoun::Validate() const {
    switch (provider_) {
        case NounProvider::Handle: return ValidateHandle(subject_);
        case NounProvider::GitHub: return ValidateGitHub(subject_);
        case NounProvider::Google: return ValidateEmail(subject_, "google");
        case NounProvider::Email: return ValidateEmail(subject_, "email");
    }
    return Result<Unit, NounError>::Err(NounError::UnknownFormat(subject_));
}

bool NounResolution::ContainsKey(const PublicKey& key) const {
    return std::find(pubkeys.begin(), pubkeys.end(), key) != pubkeys.end();
}

} // namespace crabcity::auth::identity
