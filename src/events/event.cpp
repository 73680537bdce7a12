#include "crabcity/events/event.hpp"
#include "crabcity/crypto/sodium_interop.hpp"
#include "crabcity/encoding/byte_order.hpp"
#include "crabcity/core/format.hpp"
#include "crabcity/debug/trace_logger.hpp"

#include <algorithm>

namespace crabcity::auth::events {

using crypto::Sha256Hasher;
using crypto::SodiumInterop;
using identity::PublicKey;

namespace {

void UpdateOptionalKey(Sha256Hasher& hasher, const std::optional<PublicKey>& key) {
    if (key.has_value()) {
        hasher.UpdateByte(1).Update(key->AsSpan());
    } else {
        hasher.UpdateByte(0);
    }
}

}  // namespace

std::string_view ToString(const EventType type) noexcept {
    switch (type) {
        case EventType::MemberJoined: return "member.joined";
        case EventType::MemberSuspended: return "member.suspended";
        case EventType::MemberReinstated: return "member.reinstated";
        case EventType::MemberRemoved: return "member.removed";
        case EventType::MemberReplaced: return "member.replaced";
        case EventType::GrantCapabilityChanged: return "grant.capability_changed";
        case EventType::GrantAccessChanged: return "grant.access_changed";
        case EventType::InviteCreated: return "invite.created";
        case EventType::InviteRedeemed: return "invite.redeemed";
        case EventType::InviteRevoked: return "invite.revoked";
        case EventType::InviteNounCreated: return "invite.noun_created";
        case EventType::InviteNounResolved: return "invite.noun_resolved";
        case EventType::IdentityUpdated: return "identity.updated";
    }
    return "unknown";
}

std::optional<EventType> ParseEventType(std::string_view name) noexcept {
    constexpr EventType kAll[] = {
        EventType::MemberJoined, EventType::MemberSuspended, EventType::MemberReinstated,
        EventType::MemberRemoved, EventType::MemberReplaced, EventType::GrantCapabilityChanged,
        EventType::GrantAccessChanged, EventType::InviteCreated, EventType::InviteRedeemed,
        EventType::InviteRevoked, EventType::InviteNounCreated, EventType::InviteNounResolved,
        EventType::IdentityUpdated,
    };
    for (const EventType type : kAll) {
        if (ToString(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

std::string CanonicalJson(const nlohmann::json& value) {
    // nlohmann::json objects are std::map backed, so keys come out sorted.
    // Invalid UTF-8 is replaced rather than thrown on.
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ============================================================================
// Event
// ============================================================================

Event Event::Create(
    const uint64_t id,
    const Hash256& prev_hash,
    const EventType type,
    std::optional<PublicKey> actor,
    std::optional<PublicKey> target,
    nlohmann::json payload,
    std::string created_at) {

    Event event;
    event.id = id;
    event.prev_hash = prev_hash;
    event.type = type;
    event.actor = std::move(actor);
    event.target = std::move(target);
    event.payload = std::move(payload);
    event.created_at = std::move(created_at);
    event.hash = event.RecomputeHash();
    return event;
}

Hash256 Event::GenesisPrevHash(const PublicKey& instance) {
    return SodiumInterop::Sha256(instance.AsSpan());
}

Hash256 Event::ComputeHash(
    const uint64_t id,
    const Hash256& prev_hash,
    const EventType type,
    const std::optional<PublicKey>& actor,
    const std::optional<PublicKey>& target,
    const nlohmann::json& payload,
    std::string_view created_at) {

    Sha256Hasher hasher;
    hasher.UpdateU64(id).Update(prev_hash).Update(ToString(type));
    UpdateOptionalKey(hasher, actor);
    UpdateOptionalKey(hasher, target);
    hasher.Update(std::string_view(CanonicalJson(payload)));
    hasher.Update(created_at);
    return hasher.Finalize();
}

Hash256 Event::RecomputeHash() const {
    return ComputeHash(id, prev_hash, type, actor, target, payload, created_at);
}

bool Event::VerifyHash() const {
    const Hash256 expected = RecomputeHash();
    return SodiumInterop::ConstantTimeEquals(expected, hash);
}

// ============================================================================
// Chain verification
// ============================================================================

ChainError ChainError::BrokenLink(const size_t index, const uint64_t event_id) {
    return {ChainErrorType::BrokenLink,
            compat::format("event {}: prev_hash does not match the previous event's hash", event_id),
            index, event_id};
}

ChainError ChainError::HashMismatch(const size_t index, const uint64_t event_id) {
    return {ChainErrorType::HashMismatch,
            compat::format("event {}: stored hash does not match its contents", event_id),
            index, event_id};
}

ChainError ChainError::CheckpointSignature(const uint64_t event_id, std::string_view detail) {
    return {ChainErrorType::CheckpointSignature,
            compat::format("checkpoint at event {}: {}", event_id, detail),
            0, event_id};
}

ChainError ChainError::CheckpointMismatch(const size_t index, const uint64_t event_id) {
    return {ChainErrorType::CheckpointMismatch,
            compat::format("checkpoint at event {} attests a different hash", event_id),
            index, event_id};
}

ChainError ChainError::CheckpointOutOfRange(const uint64_t event_id) {
    return {ChainErrorType::CheckpointOutOfRange,
            compat::format("checkpoint at event {} is outside the verified range", event_id),
            0, event_id};
}

Result<Unit, ChainError> VerifyChain(
    std::span<const Event> events, const Hash256& genesis_prev_hash) {

    Hash256 expected_prev = genesis_prev_hash;
    for (size_t i = 0; i < events.size(); ++i) {
        const Event& event = events[i];
        if (!SodiumInterop::ConstantTimeEquals(event.prev_hash, expected_prev)) {
            debug::LogRejection(debug::Subsystem::Events, "broken link");
            return Result<Unit, ChainError>::Err(ChainError::BrokenLink(i, event.id));
        }
        if (!event.VerifyHash()) {
            debug::LogRejection(debug::Subsystem::Events, "hash mismatch");
            return Result<Unit, ChainError>::Err(ChainError::HashMismatch(i, event.id));
        }
        expected_prev = event.hash;
    }
    if (!events.empty()) {
        debug::LogChainHead(events.back().id, events.back().hash);
    }
    return Result<Unit, ChainError>::Ok(unit);
}

// ============================================================================
// Checkpoints
// ============================================================================

std::vector<uint8_t> EventCheckpoint::SigningMessage(
    const uint64_t event_id, const Hash256& chain_head_hash, std::string_view created_at) {
    std::vector<uint8_t> message;
    message.reserve(kCheckpointDomain.size() + 8 + kHashBytes + created_at.size());
    message.insert(message.end(), kCheckpointDomain.begin(), kCheckpointDomain.end());
    encoding::Append(message, encoding::ToBigEndian64(event_id));
    encoding::Append(message, chain_head_hash);
    message.insert(message.end(), created_at.begin(), created_at.end());
    return message;
}

Result<EventCheckpoint, CryptoFailure> EventCheckpoint::Sign(
    const identity::SigningKey& instance_key,
    const uint64_t event_id,
    const Hash256& chain_head_hash,
    std::string created_at) {

    auto signature = instance_key.Sign(SigningMessage(event_id, chain_head_hash, created_at));
    if (signature.IsErr()) {
        return Result<EventCheckpoint, CryptoFailure>::Err(std::move(signature).UnwrapErr());
    }
    EventCheckpoint checkpoint;
    checkpoint.event_id = event_id;
    checkpoint.chain_head_hash = chain_head_hash;
    checkpoint.signature = signature.Unwrap();
    checkpoint.created_at = std::move(created_at);
    return Result<EventCheckpoint, CryptoFailure>::Ok(std::move(checkpoint));
}

Result<Unit, VerifyError> EventCheckpoint::Verify(const PublicKey& instance_key) const {
    return identity::Verify(
        instance_key, SigningMessage(event_id, chain_head_hash, created_at), signature);
}

Result<Unit, ChainError> VerifyCheckpoint(
    const EventCheckpoint& checkpoint,
    std::span<const Event> events,
    const PublicKey& instance_key) {

    if (auto verified = checkpoint.Verify(instance_key); verified.IsErr()) {
        return Result<Unit, ChainError>::Err(ChainError::CheckpointSignature(
            checkpoint.event_id, verified.UnwrapErr().message));
    }

    const auto it = std::find_if(events.begin(), events.end(),
        [&checkpoint](const Event& event) { return event.id == checkpoint.event_id; });
    if (it == events.end()) {
        return Result<Unit, ChainError>::Err(
            ChainError::CheckpointOutOfRange(checkpoint.event_id));
    }
    if (!SodiumInterop::ConstantTimeEquals(it->hash, checkpoint.chain_head_hash)) {
        return Result<Unit, ChainError>::Err(ChainError::CheckpointMismatch(
            static_cast<size_t>(it - events.begin()), checkpoint.event_id));
    }
    return Result<Unit, ChainError>::Ok(unit);
}

Result<Unit, ChainError> VerifyChainWithCheckpoints(
    std::span<const Event> events,
    const Hash256& genesis_prev_hash,
    std::span<const EventCheckpoint> checkpoints,
    const PublicKey& instance_key) {

    if (auto chain = VerifyChain(events, genesis_prev_hash); chain.IsErr()) {
        return chain;
    }
    for (const auto& checkpoint : checkpoints) {
        if (auto verified = VerifyCheckpoint(checkpoint, events, instance_key); verified.IsErr()) {
            return verified;
        }
    }
    return Result<Unit, ChainError>::Ok(unit);
}

// ============================================================================
// EventLogBuilder
// ============================================================================

EventLogBuilder::EventLogBuilder(const PublicKey& instance)
    : next_id_(1)
    , head_hash_(Event::GenesisPrevHash(instance)) {}

EventLogBuilder EventLogBuilder::Resume(const Event& head) {
    return EventLogBuilder(head.id + 1, head.hash);
}

Event EventLogBuilder::Append(
    const EventType type,
    std::optional<PublicKey> actor,
    std::optional<PublicKey> target,
    nlohmann::json payload,
    std::string created_at) {

    Event event = Event::Create(
        next_id_, head_hash_, type, std::move(actor), std::move(target),
        std::move(payload), std::move(created_at));
    head_hash_ = event.hash;
    ++next_id_;
    return event;
}

Result<EventCheckpoint, CryptoFailure> EventLogBuilder::Checkpoint(
    const identity::SigningKey& instance_key, std::string created_at) const {
    if (IsEmpty()) {
        return Result<EventCheckpoint, CryptoFailure>::Err(
            CryptoFailure::InvalidOperation("cannot checkpoint an empty log"));
    }
    return EventCheckpoint::Sign(instance_key, next_id_ - 1, head_hash_, std::move(created_at));
}

} // namespace crabcity::auth::events
