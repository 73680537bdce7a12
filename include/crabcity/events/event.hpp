#pragma once

#include "crabcity/core/result.hpp"
#include "crabcity/core/failures.hpp"
#include "crabcity/core/constants.hpp"
#include "crabcity/identity/keys.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace crabcity::auth::events {

enum class EventType : uint8_t {
    MemberJoined,
    MemberSuspended,
    MemberReinstated,
    MemberRemoved,
    MemberReplaced,
    GrantCapabilityChanged,
    GrantAccessChanged,
    InviteCreated,
    InviteRedeemed,
    InviteRevoked,
    InviteNounCreated,
    InviteNounResolved,
    IdentityUpdated
};

/// Dotted tag, e.g. "member.joined". Part of the hashed content.
[[nodiscard]] std::string_view ToString(EventType type) noexcept;
[[nodiscard]] std::optional<EventType> ParseEventType(std::string_view name) noexcept;

/// Compact JSON with object keys sorted at every level.
[[nodiscard]] std::string CanonicalJson(const nlohmann::json& value);

/**
 * @brief One append-only entry of an instance's audit log
 *
 * hash = SHA-256(id BE ++ prev_hash ++ type ++ (1 ++ actor | 0) ++
 * (1 ++ target | 0) ++ canonical payload ++ created_at).
 */
struct Event {
    uint64_t id = 0;
    Hash256 prev_hash{};
    EventType type = EventType::MemberJoined;
    std::optional<identity::PublicKey> actor;
    std::optional<identity::PublicKey> target;
    nlohmann::json payload;
    std::string created_at;
    Hash256 hash{};

    static Event Create(
        uint64_t id,
        const Hash256& prev_hash,
        EventType type,
        std::optional<identity::PublicKey> actor,
        std::optional<identity::PublicKey> target,
        nlohmann::json payload,
        std::string created_at);

    /// prev_hash of the first event: SHA-256 of the instance key.
    static Hash256 GenesisPrevHash(const identity::PublicKey& instance);

    static Hash256 ComputeHash(
        uint64_t id,
        const Hash256& prev_hash,
        EventType type,
        const std::optional<identity::PublicKey>& actor,
        const std::optional<identity::PublicKey>& target,
        const nlohmann::json& payload,
        std::string_view created_at);

    [[nodiscard]] Hash256 RecomputeHash() const;

    [[nodiscard]] bool VerifyHash() const;

    bool operator==(const Event&) const = default;
};

enum class ChainErrorType {
    BrokenLink,
    HashMismatch,
    CheckpointSignature,
    CheckpointMismatch,
    CheckpointOutOfRange
};

class ChainError {
public:
    ChainErrorType type;
    std::string message;
    /// Position in the verified slice.
    size_t index;
    uint64_t event_id;

    ChainError(const ChainErrorType t, std::string msg, const size_t idx, const uint64_t id)
        : type(t), message(std::move(msg)), index(idx), event_id(id) {}

    static ChainError BrokenLink(size_t index, uint64_t event_id);
    static ChainError HashMismatch(size_t index, uint64_t event_id);
    static ChainError CheckpointSignature(uint64_t event_id, std::string_view detail);
    static ChainError CheckpointMismatch(size_t index, uint64_t event_id);
    static ChainError CheckpointOutOfRange(uint64_t event_id);
};

/**
 * @brief Sequential scan from genesis_prev_hash
 *
 * Reports the first event whose prev_hash misses its predecessor
 * (BrokenLink) or whose stored hash is not its recomputed hash
 * (HashMismatch). An empty slice is a valid chain.
 */
Result<Unit, ChainError> VerifyChain(
    std::span<const Event> events, const Hash256& genesis_prev_hash);

/// Instance-signed attestation of the chain head at event_id.
struct EventCheckpoint {
    uint64_t event_id = 0;
    Hash256 chain_head_hash{};
    identity::Signature signature;
    std::string created_at;

    static Result<EventCheckpoint, CryptoFailure> Sign(
        const identity::SigningKey& instance_key,
        uint64_t event_id,
        const Hash256& chain_head_hash,
        std::string created_at);

    /// "crab_city_checkpoint_v1:" ++ event_id BE ++ chain_head_hash ++ created_at
    static std::vector<uint8_t> SigningMessage(
        uint64_t event_id, const Hash256& chain_head_hash, std::string_view created_at);

    [[nodiscard]] Result<Unit, VerifyError> Verify(const identity::PublicKey& instance_key) const;

    bool operator==(const EventCheckpoint&) const = default;
};

/// Signature is the instance's and the checkpointed event is in events with
/// the attested hash.
Result<Unit, ChainError> VerifyCheckpoint(
    const EventCheckpoint& checkpoint,
    std::span<const Event> events,
    const identity::PublicKey& instance_key);

/// VerifyChain first, then every checkpoint against the verified range.
Result<Unit, ChainError> VerifyChainWithCheckpoints(
    std::span<const Event> events,
    const Hash256& genesis_prev_hash,
    std::span<const EventCheckpoint> checkpoints,
    const identity::PublicKey& instance_key);

/**
 * @brief Produces consecutive events on top of a known head
 *
 * Holds no lock. The storage layer must serialize read-head, append and
 * write per instance; two builders on the same head fork the chain.
 */
class EventLogBuilder {
public:
    /// Empty log: first id is 1, prev_hash is the genesis hash.
    explicit EventLogBuilder(const identity::PublicKey& instance);

    /// Continue after a stored head event.
    static EventLogBuilder Resume(const Event& head);

    Event Append(
        EventType type,
        std::optional<identity::PublicKey> actor,
        std::optional<identity::PublicKey> target,
        nlohmann::json payload,
        std::string created_at);

    /// Signs the current head. Fails on an empty log.
    [[nodiscard]] Result<EventCheckpoint, CryptoFailure> Checkpoint(
        const identity::SigningKey& instance_key, std::string created_at) const;

    [[nodiscard]] uint64_t NextId() const noexcept { return next_id_; }
    [[nodiscard]] const Hash256& HeadHash() const noexcept { return head_hash_; }
    [[nodiscard]] bool IsEmpty() const noexcept { return next_id_ == 1; }

private:
    EventLogBuilder(uint64_t next_id, const Hash256& head_hash)
        : next_id_(next_id), head_hash_(head_hash) {}

    uint64_t next_id_;
    Hash256 head_hash_;
};

} // namespace crabcity::auth::events
