/**
 * @file basic_example.cpp
 * @brief Issue an invite, redeem it and record the result in the audit log
 */

#include "crabcity/crypto/sodium_interop.hpp"
#include "crabcity/identity/keys.hpp"
#include "crabcity/invite/invite.hpp"
#include "crabcity/membership/membership.hpp"
#include "crabcity/events/event.hpp"
#include "crabcity/configuration/trust_config.hpp"

#include <chrono>
#include <iostream>

using namespace crabcity::auth;
using namespace crabcity::auth::crypto;
using namespace crabcity::auth::identity;

namespace {
    uint64_t NowUnixSecs() {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    }
}

int main() {
    std::cout << "=== Crab City Auth - Basic Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: " << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Initialized successfully" << std::endl;
    std::cout << std::endl;

    std::cout << "2. Generating instance and member identities..." << std::endl;
    auto instance_result = SigningKey::Generate();
    auto owner_result = SigningKey::Generate();
    auto guest_result = SigningKey::Generate();
    if (instance_result.IsErr() || owner_result.IsErr() || guest_result.IsErr()) {
        std::cerr << "Failed to generate Ed25519 keys" << std::endl;
        return 1;
    }
    const auto instance = std::move(instance_result).Unwrap();
    const auto owner = std::move(owner_result).Unwrap();
    const auto guest = std::move(guest_result).Unwrap();
    std::cout << "   Instance: " << instance.GetPublicKey().Fingerprint() << std::endl;
    std::cout << "   Owner:    " << owner.GetPublicKey().Fingerprint() << std::endl;
    std::cout << "   Guest:    " << guest.GetPublicKey().Fingerprint() << std::endl;
    std::cout << std::endl;

    std::cout << "3. Issuing a one-use collaborate invite..." << std::endl;
    const uint64_t now = NowUnixSecs();
    auto invite_result = invite::Invite::CreateFlat(
        owner, instance.GetPublicKey(), access::Capability::Collaborate, 1, now + 24 * 3600);
    if (invite_result.IsErr()) {
        std::cerr << "Failed to create invite: " << invite_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const std::string token = invite_result.Unwrap().ToBase32();
    std::cout << "   ✓ Invite token (" << token.size() << " chars): " << token.substr(0, 24) << "..." << std::endl;
    std::cout << std::endl;

    std::cout << "4. Redeeming the invite..." << std::endl;
    auto parsed = invite::Invite::FromBase32(token);
    if (parsed.IsErr()) {
        std::cerr << "Failed to parse invite: " << parsed.UnwrapErr().message << std::endl;
        return 1;
    }
    auto claims = parsed.Unwrap().VerifyAt(now);
    if (claims.IsErr()) {
        std::cerr << "Invite rejected: " << claims.UnwrapErr().ToAuthError().ToErrorResponseJson() << std::endl;
        return 1;
    }
    auto grant = membership::MemberGrant::FromInvite(guest.GetPublicKey(), claims.Unwrap())
        .Apply(membership::MembershipTransition::Activate());
    if (grant.IsErr()) {
        std::cerr << "Failed to activate grant: " << grant.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Guest is " << membership::ToString(grant.Unwrap().status.state)
              << " with capability " << access::ToString(grant.Unwrap().capability) << std::endl;
    std::cout << "   Access: " << grant.Unwrap().access.ToJsonString() << std::endl;

    auto connection = membership::AuthorizeConnection(guest.GetPublicKey(), false, &grant.Unwrap());
    std::cout << "   Connection admitted: " << (connection.IsOk() ? "true" : "false") << std::endl;
    auto manage = grant.Unwrap().Authorize("members", "remove");
    if (manage.IsErr()) {
        std::cout << "   members/remove denied: " << manage.UnwrapErr().ToErrorResponseJson() << std::endl;
    }
    std::cout << std::endl;

    std::cout << "5. Recording the redemption in the audit log..." << std::endl;
    constexpr auto config = configuration::TrustConfig::Default().WithCheckpointInterval(2);
    events::EventLogBuilder builder(instance.GetPublicKey());
    std::vector<events::Event> log;
    log.push_back(builder.Append(events::EventType::InviteRedeemed, guest.GetPublicKey(), std::nullopt,
                                 {{"capability", "collaborate"}}, "2026-01-01T00:00:00Z"));
    log.push_back(builder.Append(events::EventType::MemberJoined, guest.GetPublicKey(), std::nullopt,
                                 nlohmann::json::object(), "2026-01-01T00:00:00Z"));
    std::vector<events::EventCheckpoint> checkpoints;
    if (config.ShouldCheckpoint(log.back().id)) {
        auto checkpoint = builder.Checkpoint(instance, "2026-01-01T00:00:01Z");
        if (checkpoint.IsErr()) {
            std::cerr << "Failed to sign checkpoint: " << checkpoint.UnwrapErr().message << std::endl;
            return 1;
        }
        checkpoints.push_back(std::move(checkpoint).Unwrap());
    }
    auto verified = events::VerifyChainWithCheckpoints(
        log, events::Event::GenesisPrevHash(instance.GetPublicKey()), checkpoints, instance.GetPublicKey());
    if (verified.IsErr()) {
        std::cerr << "Audit log failed verification: " << verified.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ " << log.size() << " events and " << checkpoints.size()
              << " checkpoint verified" << std::endl;
    std::cout << std::endl;

    std::cout << "=== Example completed successfully ===" << std::endl;
    return 0;
}
