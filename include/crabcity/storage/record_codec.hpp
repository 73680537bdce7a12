#pragma once

#include "crabcity/core/result.hpp"
#include "crabcity/events/event.hpp"
#include "crabcity/invite/invite.hpp"
#include "crabcity/membership/membership.hpp"

#include "crabcity/records.pb.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace crabcity::auth::storage {

enum class RecordErrorType {
    WrongSize,
    UnknownValue,
    MalformedJson,
    InconsistentState,
    InvalidInvite
};

class RecordError {
public:
    RecordErrorType type;
    std::string message;
    /// Proto field the error was found in.
    std::string field;

    RecordError(const RecordErrorType t, std::string msg, std::string field_name)
        : type(t), message(std::move(msg)), field(std::move(field_name)) {}

    static RecordError WrongSize(std::string_view field, size_t expected, size_t actual);
    static RecordError UnknownValue(std::string_view field, std::string_view value);
    static RecordError MalformedJson(std::string_view field, std::string_view detail);
    static RecordError InconsistentState(std::string_view field, std::string_view detail);
    static RecordError InvalidInvite(std::string_view detail);
};

/**
 * @brief Issued invite as the storage layer tracks it
 *
 * The chain itself is immutable; use_count and revocation are local
 * bookkeeping next to it.
 */
struct StoredInvite {
    invite::Invite invite;
    uint32_t use_count = 0;
    std::string created_at;
    std::optional<std::string> revoked_at;

    [[nodiscard]] const invite::InviteNonce& Nonce() const { return invite.Leaf().nonce; }

    /// Not revoked, uses left (max_uses 0 is unlimited), leaf not expired.
    [[nodiscard]] bool IsRedeemable(uint64_t now_unix_secs) const;

    bool operator==(const StoredInvite&) const = default;
};

/**
 * @brief Conversion between core values and protobuf storage rows
 *
 * FromRecord checks shape only: sizes, enum names, JSON, and that the
 * suspension fields agree with the state. Event hashes and signatures are
 * left to VerifyChain and the checkpoint verifiers.
 */
class RecordCodec {
public:
    static proto::storage::MemberGrantRecord ToRecord(const membership::MemberGrant& grant);
    static Result<membership::MemberGrant, RecordError> FromRecord(
        const proto::storage::MemberGrantRecord& record);

    static proto::storage::EventRecord ToRecord(const events::Event& event);
    static Result<events::Event, RecordError> FromRecord(
        const proto::storage::EventRecord& record);

    static proto::storage::EventCheckpointRecord ToRecord(const events::EventCheckpoint& checkpoint);
    static Result<events::EventCheckpoint, RecordError> FromRecord(
        const proto::storage::EventCheckpointRecord& record);

    static proto::storage::InviteRecord ToRecord(const StoredInvite& stored);
    static Result<StoredInvite, RecordError> FromRecord(
        const proto::storage::InviteRecord& record);

private:
    RecordCodec() = delete;
};

} // namespace crabcity::auth::storage
