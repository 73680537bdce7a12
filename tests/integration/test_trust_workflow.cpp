#include <catch2/catch_test_macros.hpp>
#include "crabcity/invite/invite.hpp"
#include "crabcity/membership/membership.hpp"
#include "crabcity/events/event.hpp"
#include "crabcity/identity/identity_proof.hpp"
#include "crabcity/storage/record_codec.hpp"
#include "crabcity/configuration/trust_config.hpp"
#include "crabcity/crypto/sodium_interop.hpp"

#include <map>
#include <vector>

using namespace crabcity::auth;
using namespace crabcity::auth::identity;
using namespace crabcity::auth::invite;
using namespace crabcity::auth::membership;
using namespace crabcity::auth::events;
using access::Capability;
using configuration::TrustConfig;
using crypto::SodiumInterop;

namespace {
    constexpr uint64_t kNow = 1'700'000'000;

    SigningKey MakeKey() {
        auto key = SigningKey::Generate();
        REQUIRE(key.IsOk());
        return std::move(key).Unwrap();
    }

    /// An instance as the server would hold it: grants by key and its log.
    struct InstanceContext {
        SigningKey instance_key = MakeKey();
        EventLogBuilder builder{instance_key.GetPublicKey()};
        std::map<PublicKey, MemberGrant> grants;
        std::vector<Event> log;
        std::vector<EventCheckpoint> checkpoints;
        TrustConfig config = TrustConfig::Default();

        void Record(EventType type, std::optional<PublicKey> actor, std::optional<PublicKey> target,
                    nlohmann::json payload) {
            log.push_back(builder.Append(type, actor, target, std::move(payload), "2026-01-01T00:00:00Z"));
            if (config.ShouldCheckpoint(log.back().id)) {
                auto checkpoint = builder.Checkpoint(instance_key, "2026-01-01T00:00:00Z");
                REQUIRE(checkpoint.IsOk());
                checkpoints.push_back(std::move(checkpoint).Unwrap());
            }
        }

        Result<Unit, AuthError> Redeem(const Invite& invite, const PublicKey& redeemer) {
            auto claims = invite.VerifyAt(kNow, config);
            if (claims.IsErr()) {
                return Result<Unit, AuthError>::Err(claims.UnwrapErr().ToAuthError());
            }
            if (claims.Unwrap().instance != instance_key.GetPublicKey()) {
                return Result<Unit, AuthError>::Err(AuthError::InvalidInvite("issued for another instance"));
            }
            if (grants.contains(redeemer)) {
                return Result<Unit, AuthError>::Err(AuthError::AlreadyAMember());
            }
            auto activated = MemberGrant::FromInvite(redeemer, claims.Unwrap())
                .Apply(MembershipTransition::Activate());
            REQUIRE(activated.IsOk());
            grants.emplace(redeemer, activated.Unwrap());
            Record(EventType::InviteRedeemed, redeemer, std::nullopt,
                   {{"capability", std::string(access::ToString(claims.Unwrap().capability))}});
            Record(EventType::MemberJoined, redeemer, std::nullopt, nlohmann::json::object());
            return Result<Unit, AuthError>::Ok(unit);
        }

        const MemberGrant* Find(const PublicKey& key) const {
            auto it = grants.find(key);
            return it == grants.end() ? nullptr : &it->second;
        }
    };
}

TEST_CASE("Workflow - Flat invite redemption", "[integration][invite][membership]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    InstanceContext ctx;
    const auto owner = MakeKey();
    const auto guest = MakeKey();

    auto invite = Invite::CreateFlat(
        owner, ctx.instance_key.GetPublicKey(), Capability::Collaborate, 1, kNow + 3600);
    REQUIRE(invite.IsOk());
    ctx.Record(EventType::InviteCreated, owner.GetPublicKey(), std::nullopt,
               {{"nonce", invite.Unwrap().Leaf().nonce.size()}});

    const auto text = invite.Unwrap().ToBase32();
    auto received = Invite::FromBase32(text);
    REQUIRE(received.IsOk());

    SECTION("Redeemed member can connect and chat") {
        REQUIRE(AuthorizeConnection(guest.GetPublicKey(), false, ctx.Find(guest.GetPublicKey()))
                    .UnwrapErr().type == AuthErrorType::NotAMember);

        REQUIRE(ctx.Redeem(received.Unwrap(), guest.GetPublicKey()).IsOk());
        const MemberGrant* grant = ctx.Find(guest.GetPublicKey());
        REQUIRE(grant != nullptr);
        REQUIRE(grant->invited_by == owner.GetPublicKey());
        REQUIRE(AuthorizeConnection(guest.GetPublicKey(), false, grant).IsOk());
        REQUIRE(grant->Authorize("chat", "send").IsOk());
        REQUIRE(grant->Authorize("members", "invite").UnwrapErr().type ==
                AuthErrorType::InsufficientAccess);

        REQUIRE(ctx.Redeem(received.Unwrap(), guest.GetPublicKey()).UnwrapErr().type ==
                AuthErrorType::AlreadyAMember);
        REQUIRE(VerifyChain(ctx.log, Event::GenesisPrevHash(ctx.instance_key.GetPublicKey())).IsOk());
    }

    SECTION("Suspension cuts the connection off") {
        REQUIRE(ctx.Redeem(received.Unwrap(), guest.GetPublicKey()).IsOk());
        auto& grant = ctx.grants.at(guest.GetPublicKey());
        auto suspended = grant.Apply(MembershipTransition::BlocklistHit("203.0.113.0/24"));
        REQUIRE(suspended.IsOk());
        grant = suspended.Unwrap();
        ctx.Record(EventType::MemberSuspended, std::nullopt, guest.GetPublicKey(),
                   {{"source", "blocklist"}});

        auto denied = AuthorizeConnection(guest.GetPublicKey(), false, &grant);
        REQUIRE(denied.UnwrapErr().type == AuthErrorType::Blocklisted);

        auto lifted = grant.Apply(MembershipTransition::BlocklistLift("203.0.113.0/24"));
        REQUIRE(lifted.IsOk());
        REQUIRE(AuthorizeConnection(guest.GetPublicKey(), false, &lifted.Unwrap()).IsOk());
    }

    SECTION("Invite for another instance is refused") {
        InstanceContext other;
        auto result = other.Redeem(received.Unwrap(), guest.GetPublicKey());
        REQUIRE(result.UnwrapErr().type == AuthErrorType::InvalidInvite);
        REQUIRE(other.Find(guest.GetPublicKey()) == nullptr);
    }

    SECTION("Expired invite surfaces as an invalid invite") {
        auto late = received.Unwrap().VerifyAt(kNow + 3601);
        REQUIRE(late.UnwrapErr().type == InviteErrorType::Expired);
        REQUIRE(late.UnwrapErr().ToAuthError().type == AuthErrorType::InvalidInvite);
    }
}

TEST_CASE("Workflow - Delegated invites", "[integration][invite]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    InstanceContext ctx;
    const auto owner = MakeKey();
    const auto admin = MakeKey();
    const auto friend_key = MakeKey();
    const auto instance = ctx.instance_key.GetPublicKey();

    auto root = Invite::CreateRoot(owner, instance, Capability::Admin, 2, 0, std::nullopt);
    REQUIRE(root.IsOk());

    SECTION("Narrowed delegation grants the leaf capability") {
        auto delegated = Invite::Delegate(root.Unwrap(), admin, Capability::View, 1, kNow + 60);
        REQUIRE(delegated.IsOk());
        REQUIRE(ctx.Redeem(delegated.Unwrap(), friend_key.GetPublicKey()).IsOk());

        const MemberGrant* grant = ctx.Find(friend_key.GetPublicKey());
        REQUIRE(grant->capability == Capability::View);
        REQUIRE(grant->invited_by == admin.GetPublicKey());
        REQUIRE(grant->Authorize("content", "read").IsOk());
        REQUIRE(grant->Authorize("chat", "send").IsErr());
    }

    SECTION("Escalating second hop is caught at link 1") {
        auto narrow = Invite::CreateRoot(owner, instance, Capability::Collaborate, 1, 0, std::nullopt);
        REQUIRE(narrow.IsOk());
        const auto& root_link = narrow.Unwrap().Leaf();
        auto escalated = InviteLink::Sign(
            admin, root_link.Hash(), instance, Capability::Admin, 0, 0, std::nullopt);
        REQUIRE(escalated.IsOk());
        const Invite forged(kInviteVersion, instance, {root_link, escalated.Unwrap()});

        auto result = forged.VerifyAt(kNow);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == InviteErrorType::CapabilityEscalation);
        REQUIRE(result.UnwrapErr().link_index == 1);
        REQUIRE(ctx.Redeem(forged, friend_key.GetPublicKey()).UnwrapErr().type ==
                AuthErrorType::InvalidInvite);
        REQUIRE(ctx.Find(friend_key.GetPublicKey()) == nullptr);
    }
}

TEST_CASE("Workflow - Audit log with checkpoints", "[integration][events]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    InstanceContext ctx;
    const auto actor = MakeKey();
    const auto instance = ctx.instance_key.GetPublicKey();
    const auto genesis = Event::GenesisPrevHash(instance);

    for (int i = 0; i < 847; ++i) {
        ctx.Record(EventType::GrantAccessChanged, actor.GetPublicKey(), std::nullopt, {{"seq", i}});
    }
    REQUIRE(ctx.log.size() == 847);
    REQUIRE(ctx.checkpoints.size() == 8);
    REQUIRE(ctx.checkpoints.back().event_id == 800);

    SECTION("Intact log verifies with every checkpoint") {
        REQUIRE(VerifyChainWithCheckpoints(ctx.log, genesis, ctx.checkpoints, instance).IsOk());
    }

    SECTION("Edited payload is located by event id") {
        ctx.log[399].payload = {{"seq", -1}};
        auto result = VerifyChain(ctx.log, genesis);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ChainErrorType::HashMismatch);
        REQUIRE(result.UnwrapErr().event_id == 400);
        REQUIRE(VerifyChainWithCheckpoints(ctx.log, genesis, ctx.checkpoints, instance)
                    .UnwrapErr().event_id == 400);
    }

    SECTION("Rewritten tail is caught by the checkpoint") {
        // Rebuild everything after event 500 with a consistent forged chain.
        auto forger = EventLogBuilder::Resume(ctx.log[499]);
        std::vector<Event> forged(ctx.log.begin(), ctx.log.begin() + 500);
        for (int i = 500; i < 847; ++i) {
            forged.push_back(forger.Append(
                EventType::MemberRemoved, std::nullopt, actor.GetPublicKey(), {{"seq", i}}, "t"));
        }
        REQUIRE(VerifyChain(forged, genesis).IsOk());

        auto result = VerifyChainWithCheckpoints(forged, genesis, ctx.checkpoints, instance);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ChainErrorType::CheckpointMismatch);
        REQUIRE(result.UnwrapErr().event_id == 600);
    }

    SECTION("Log survives storage and resumes") {
        std::vector<Event> reloaded;
        for (const auto& event : ctx.log) {
            auto restored = storage::RecordCodec::FromRecord(storage::RecordCodec::ToRecord(event));
            REQUIRE(restored.IsOk());
            reloaded.push_back(std::move(restored).Unwrap());
        }
        REQUIRE(VerifyChain(reloaded, genesis).IsOk());

        auto resumed = EventLogBuilder::Resume(reloaded.back());
        REQUIRE(resumed.NextId() == 848);
        reloaded.push_back(resumed.Append(
            EventType::IdentityUpdated, actor.GetPublicKey(), std::nullopt, nlohmann::json::object(), "t"));
        REQUIRE(VerifyChain(reloaded, genesis).IsOk());
    }
}

TEST_CASE("Workflow - Identity proof against membership", "[integration][identity]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    InstanceContext ctx;
    const auto owner = MakeKey();
    const auto laptop = MakeKey();
    const auto phone = MakeKey();

    auto invite = Invite::CreateFlat(owner, ctx.instance_key.GetPublicKey(), Capability::View, 0, std::nullopt);
    REQUIRE(invite.IsOk());
    REQUIRE(ctx.Redeem(invite.Unwrap(), laptop.GetPublicKey()).IsOk());

    auto proof = IdentityProof::Sign(
        laptop, ctx.instance_key.GetPublicKey(), {phone.GetPublicKey()}, std::string("laptop-crab"), kNow);
    REQUIRE(proof.IsOk());

    auto parsed = IdentityProof::FromBytes(proof.Unwrap().ToBytes());
    REQUIRE(parsed.IsOk());
    auto claims = parsed.Unwrap().Verify();
    REQUIRE(claims.IsOk());
    REQUIRE(claims.Unwrap().instance == ctx.instance_key.GetPublicKey());
    REQUIRE(ctx.Find(claims.Unwrap().subject) != nullptr);
    REQUIRE(ctx.Find(claims.Unwrap().related_keys.front()) == nullptr);

    SECTION("Lost key is replaced by a linked key") {
        const MemberGrant& old_grant = ctx.grants.at(laptop.GetPublicKey());
        auto retired = old_grant.Apply(MembershipTransition::Replace(phone.GetPublicKey()));
        REQUIRE(retired.IsOk());
        const MemberGrant successor = old_grant.Replacement(phone.GetPublicKey());
        ctx.grants.insert_or_assign(laptop.GetPublicKey(), retired.Unwrap());
        ctx.grants.emplace(phone.GetPublicKey(), successor);

        REQUIRE(AuthorizeConnection(laptop.GetPublicKey(), false, ctx.Find(laptop.GetPublicKey()))
                    .UnwrapErr().type == AuthErrorType::GrantNotActive);
        REQUIRE(AuthorizeConnection(phone.GetPublicKey(), false, ctx.Find(phone.GetPublicKey())).IsOk());

        auto stored = storage::RecordCodec::FromRecord(storage::RecordCodec::ToRecord(successor));
        REQUIRE(stored.IsOk());
        REQUIRE(stored.Unwrap().replaces == laptop.GetPublicKey());
    }

    SECTION("Local operator always gets in over loopback") {
        const auto loopback = MemberGrant::Loopback();
        REQUIRE(AuthorizeConnection(PublicKey::Loopback(), true, &loopback).IsOk());
        REQUIRE(AuthorizeConnection(PublicKey::Loopback(), false, &loopback).UnwrapErr().type ==
                AuthErrorType::InvalidSignature);
    }
}
