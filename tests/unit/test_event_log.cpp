#include <catch2/catch_test_macros.hpp>
#include "crabcity/events/event.hpp"
#include "crabcity/crypto/sodium_interop.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace crabcity::auth;
using namespace crabcity::auth::events;
using namespace crabcity::auth::identity;
using crypto::SodiumInterop;

namespace {
    SigningKey MakeKey() {
        auto key = SigningKey::Generate();
        REQUIRE(key.IsOk());
        return std::move(key).Unwrap();
    }

    std::string Timestamp(const uint64_t n) {
        return "2026-01-01T00:00:" + std::to_string(n % 60) + "Z";
    }

    std::vector<Event> BuildLog(EventLogBuilder& builder, const PublicKey& actor, const size_t count) {
        std::vector<Event> events;
        events.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            events.push_back(builder.Append(
                EventType::MemberJoined, actor, std::nullopt,
                nlohmann::json{{"n", i}, {"note", "joined"}}, Timestamp(i)));
        }
        return events;
    }
}

TEST_CASE("Events - Type names", "[events]") {
    SECTION("Dotted names parse back") {
        REQUIRE(ToString(EventType::MemberJoined) == "member.joined");
        REQUIRE(ToString(EventType::GrantAccessChanged) == "grant.access_changed");
        REQUIRE(ToString(EventType::InviteNounResolved) == "invite.noun_resolved");
        REQUIRE(ParseEventType("identity.updated") == EventType::IdentityUpdated);
        REQUIRE_FALSE(ParseEventType("member.exploded").has_value());
    }

    SECTION("Canonical JSON sorts keys at every level") {
        const auto value = nlohmann::json::parse(R"({"b":1,"a":{"z":true,"y":[3,{"d":0,"c":1}]}})");
        REQUIRE(CanonicalJson(value) == R"({"a":{"y":[3,{"c":1,"d":0}],"z":true},"b":1})");
    }
}

TEST_CASE("Events - Hashing", "[events][hash]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto instance = MakeKey();
    const auto actor = MakeKey();
    const Hash256 genesis = Event::GenesisPrevHash(instance.GetPublicKey());

    SECTION("Genesis is the hash of the instance key") {
        REQUIRE(genesis == SodiumInterop::Sha256(instance.GetPublicKey().AsSpan()));
    }

    SECTION("Hash is deterministic and independent of key order in the payload") {
        const auto a = Event::Create(1, genesis, EventType::InviteCreated, actor.GetPublicKey(),
                                     std::nullopt, nlohmann::json{{"x", 1}, {"y", 2}}, "t");
        const auto payload = nlohmann::json::parse(R"({"y":2,"x":1})");
        const auto b = Event::Create(1, genesis, EventType::InviteCreated, actor.GetPublicKey(),
                                     std::nullopt, payload, "t");
        REQUIRE(a.hash == b.hash);
        REQUIRE(a.VerifyHash());
    }

    SECTION("Every field is covered") {
        const auto base = Event::Create(1, genesis, EventType::InviteCreated, actor.GetPublicKey(),
                                        std::nullopt, nlohmann::json::object(), "t");

        auto changed = base;
        changed.id = 2;
        REQUIRE_FALSE(changed.VerifyHash());

        changed = base;
        changed.type = EventType::InviteRevoked;
        REQUIRE_FALSE(changed.VerifyHash());

        changed = base;
        changed.actor = std::nullopt;
        REQUIRE_FALSE(changed.VerifyHash());

        changed = base;
        changed.target = actor.GetPublicKey();
        REQUIRE_FALSE(changed.VerifyHash());

        changed = base;
        changed.payload["extra"] = 1;
        REQUIRE_FALSE(changed.VerifyHash());

        changed = base;
        changed.created_at = "u";
        REQUIRE_FALSE(changed.VerifyHash());

        changed = base;
        changed.prev_hash[0] ^= 0x01;
        REQUIRE_FALSE(changed.VerifyHash());
    }

    SECTION("Absent actor differs from a zero actor") {
        const auto absent = Event::Create(1, genesis, EventType::MemberRemoved, std::nullopt,
                                          std::nullopt, nlohmann::json::object(), "t");
        const auto zero = Event::Create(1, genesis, EventType::MemberRemoved, PublicKey::Loopback(),
                                        std::nullopt, nlohmann::json::object(), "t");
        REQUIRE(absent.hash != zero.hash);
    }
}

TEST_CASE("Events - Chain verification", "[events][chain]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto instance = MakeKey();
    const auto actor = MakeKey();
    const Hash256 genesis = Event::GenesisPrevHash(instance.GetPublicKey());

    EventLogBuilder builder(instance.GetPublicKey());
    REQUIRE(builder.IsEmpty());
    const auto events = BuildLog(builder, actor.GetPublicKey(), 20);

    SECTION("Builder assigns consecutive ids from one") {
        REQUIRE(events.front().id == 1);
        REQUIRE(events.back().id == 20);
        REQUIRE(events.front().prev_hash == genesis);
        REQUIRE(builder.NextId() == 21);
        REQUIRE(builder.HeadHash() == events.back().hash);
    }

    SECTION("Untouched chain verifies") {
        REQUIRE(VerifyChain(events, genesis).IsOk());
    }

    SECTION("Empty chain verifies") {
        REQUIRE(VerifyChain(std::span<const Event>(), genesis).IsOk());
    }

    SECTION("Wrong genesis is a broken link at the first event") {
        const Hash256 other = Event::GenesisPrevHash(actor.GetPublicKey());
        auto result = VerifyChain(events, other);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ChainErrorType::BrokenLink);
        REQUIRE(result.UnwrapErr().index == 0);
    }

    SECTION("Edited payload is a hash mismatch at that event") {
        auto tampered = events;
        tampered[7].payload["note"] = "edited";
        auto result = VerifyChain(tampered, genesis);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ChainErrorType::HashMismatch);
        REQUIRE(result.UnwrapErr().event_id == 8);
    }

    SECTION("Edited payload with a recomputed hash breaks the next link") {
        auto tampered = events;
        tampered[7].payload["note"] = "edited";
        tampered[7].hash = tampered[7].RecomputeHash();
        auto result = VerifyChain(tampered, genesis);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ChainErrorType::BrokenLink);
        REQUIRE(result.UnwrapErr().event_id == 9);
    }

    SECTION("Deleted event breaks the link") {
        auto shortened = events;
        shortened.erase(shortened.begin() + 5);
        auto result = VerifyChain(shortened, genesis);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ChainErrorType::BrokenLink);
        REQUIRE(result.UnwrapErr().index == 5);
    }

    SECTION("A suffix verifies from its predecessor's hash") {
        const std::span<const Event> suffix(events.data() + 10, events.size() - 10);
        REQUIRE(VerifyChain(suffix, events[9].hash).IsOk());
    }

    SECTION("Resume continues the same chain") {
        auto resumed = EventLogBuilder::Resume(events.back());
        REQUIRE(resumed.NextId() == 21);
        auto extended = events;
        extended.push_back(resumed.Append(EventType::MemberRemoved, actor.GetPublicKey(),
                                          actor.GetPublicKey(), nlohmann::json::object(), "t"));
        REQUIRE(VerifyChain(extended, genesis).IsOk());
    }
}

TEST_CASE("Events - Checkpoints", "[events][checkpoint]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto instance = MakeKey();
    const auto actor = MakeKey();
    const Hash256 genesis = Event::GenesisPrevHash(instance.GetPublicKey());

    EventLogBuilder builder(instance.GetPublicKey());

    SECTION("Empty log cannot be checkpointed") {
        REQUIRE(builder.Checkpoint(instance, "t").IsErr());
    }

    const auto events = BuildLog(builder, actor.GetPublicKey(), 10);
    auto checkpoint_result = builder.Checkpoint(instance, "2026-01-01T00:01:00Z");
    REQUIRE(checkpoint_result.IsOk());
    const auto checkpoint = checkpoint_result.Unwrap();

    SECTION("Checkpoint attests the head") {
        REQUIRE(checkpoint.event_id == 10);
        REQUIRE(checkpoint.chain_head_hash == events.back().hash);
        REQUIRE(checkpoint.Verify(instance.GetPublicKey()).IsOk());
        REQUIRE(VerifyCheckpoint(checkpoint, events, instance.GetPublicKey()).IsOk());
        const std::vector<EventCheckpoint> checkpoints = {checkpoint};
        REQUIRE(VerifyChainWithCheckpoints(events, genesis, checkpoints,
                                           instance.GetPublicKey()).IsOk());
    }

    SECTION("Signing message layout") {
        const auto message = EventCheckpoint::SigningMessage(
            checkpoint.event_id, checkpoint.chain_head_hash, checkpoint.created_at);
        REQUIRE(message.size() == kCheckpointDomain.size() + 8 + kHashBytes +
                                  checkpoint.created_at.size());
        REQUIRE(std::string(message.begin(), message.begin() + kCheckpointDomain.size()) ==
                "crab_city_checkpoint_v1:");
        REQUIRE(message[kCheckpointDomain.size() + 7] == 10);
    }

    SECTION("Checkpoint signed by another key") {
        auto forged = EventCheckpoint::Sign(actor, 10, events.back().hash, "t");
        REQUIRE(forged.IsOk());
        auto result = VerifyCheckpoint(forged.Unwrap(), events, instance.GetPublicKey());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ChainErrorType::CheckpointSignature);
    }

    SECTION("Checkpoint with a tampered field") {
        auto tampered = checkpoint;
        tampered.created_at = "2030-01-01T00:00:00Z";
        REQUIRE(tampered.Verify(instance.GetPublicKey()).IsErr());
    }

    SECTION("Checkpoint over a different history") {
        auto other = EventCheckpoint::Sign(instance, 5, events.back().hash, "t");
        REQUIRE(other.IsOk());
        auto result = VerifyCheckpoint(other.Unwrap(), events, instance.GetPublicKey());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ChainErrorType::CheckpointMismatch);
        REQUIRE(result.UnwrapErr().index == 4);
    }

    SECTION("Checkpoint outside the slice") {
        auto later = EventCheckpoint::Sign(instance, 50, events.back().hash, "t");
        REQUIRE(later.IsOk());
        auto result = VerifyCheckpoint(later.Unwrap(), events, instance.GetPublicKey());
        REQUIRE(result.UnwrapErr().type == ChainErrorType::CheckpointOutOfRange);
    }

    SECTION("Chain errors take precedence over checkpoint errors") {
        auto tampered = events;
        tampered[2].created_at = "edited";
        const std::vector<EventCheckpoint> checkpoints = {checkpoint};
        auto result = VerifyChainWithCheckpoints(tampered, genesis, checkpoints,
                                                 instance.GetPublicKey());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ChainErrorType::HashMismatch);
        REQUIRE(result.UnwrapErr().event_id == 3);
    }
}
