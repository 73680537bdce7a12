#include "crabcity/storage/record_codec.hpp"
#include "crabcity/core/constants.hpp"
#include "crabcity/core/format.hpp"
#include "crabcity/debug/trace_logger.hpp"

#include <algorithm>

namespace crabcity::auth::storage {

using membership::MemberGrant;
using membership::MembershipState;
using membership::StateWithContext;
using membership::SuspensionSource;
using membership::SuspensionSourceType;

namespace {
    using GrantRecord = proto::storage::MemberGrantRecord;

    std::span<const uint8_t> AsBytes(const std::string& bytes) {
        return {reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()};
    }

    template <size_t N>
    Result<std::array<uint8_t, N>, RecordError> ReadFixed(
        const std::string& bytes, std::string_view field) {
        if (bytes.size() != N) {
            return Result<std::array<uint8_t, N>, RecordError>::Err(
                RecordError::WrongSize(field, N, bytes.size()));
        }
        std::array<uint8_t, N> out{};
        std::copy_n(reinterpret_cast<const uint8_t*>(bytes.data()), N, out.begin());
        return Result<std::array<uint8_t, N>, RecordError>::Ok(out);
    }

    Result<identity::PublicKey, RecordError> ReadKey(
        const std::string& bytes, std::string_view field) {
        auto raw = ReadFixed<kPublicKeyBytes>(bytes, field);
        if (raw.IsErr()) {
            return Result<identity::PublicKey, RecordError>::Err(std::move(raw).UnwrapErr());
        }
        return Result<identity::PublicKey, RecordError>::Ok(identity::PublicKey(raw.Unwrap()));
    }

    /// Empty bytes mean the key is absent.
    Result<std::optional<identity::PublicKey>, RecordError> ReadOptionalKey(
        const std::string& bytes, std::string_view field) {
        using ResultType = Result<std::optional<identity::PublicKey>, RecordError>;
        if (bytes.empty()) {
            return ResultType::Ok(std::nullopt);
        }
        auto key = ReadKey(bytes, field);
        if (key.IsErr()) {
            return ResultType::Err(std::move(key).UnwrapErr());
        }
        return ResultType::Ok(std::optional(key.Unwrap()));
    }

    void SetBytes(std::string* target, std::span<const uint8_t> bytes) {
        target->assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

    GrantRecord::SuspensionSource EnumToProtoSource(const std::optional<SuspensionSource>& source) {
        if (!source.has_value()) {
            return GrantRecord::SUSPENSION_SOURCE_NONE;
        }
        return source->type == SuspensionSourceType::Blocklist
            ? GrantRecord::SUSPENSION_SOURCE_BLOCKLIST
            : GrantRecord::SUSPENSION_SOURCE_ADMIN;
    }

    Result<StateWithContext, RecordError> ReadStatus(const GrantRecord& record) {
        using ResultType = Result<StateWithContext, RecordError>;

        const auto state = membership::ParseMembershipState(record.state());
        if (!state.has_value()) {
            return ResultType::Err(RecordError::UnknownValue("state", record.state()));
        }

        const bool suspended = *state == MembershipState::Suspended;
        switch (record.suspension_source()) {
            case GrantRecord::SUSPENSION_SOURCE_NONE:
                if (suspended) {
                    return ResultType::Err(RecordError::InconsistentState(
                        "suspension_source", "suspended grant without a source"));
                }
                if (!record.blocklist_scope().empty() || !record.suspension_reason().empty()) {
                    return ResultType::Err(RecordError::InconsistentState(
                        "suspension_reason", "suspension context on a grant that is not suspended"));
                }
                return ResultType::Ok(StateWithContext::Of(*state));
            case GrantRecord::SUSPENSION_SOURCE_ADMIN:
                if (!suspended) {
                    return ResultType::Err(RecordError::InconsistentState(
                        "suspension_source", "source set on a grant that is not suspended"));
                }
                if (!record.blocklist_scope().empty()) {
                    return ResultType::Err(RecordError::InconsistentState(
                        "blocklist_scope", "scope set on an admin suspension"));
                }
                return ResultType::Ok(StateWithContext::Suspended(
                    SuspensionSource::Admin(), record.suspension_reason()));
            case GrantRecord::SUSPENSION_SOURCE_BLOCKLIST:
                if (!suspended) {
                    return ResultType::Err(RecordError::InconsistentState(
                        "suspension_source", "source set on a grant that is not suspended"));
                }
                return ResultType::Ok(StateWithContext::Suspended(
                    SuspensionSource::Blocklist(record.blocklist_scope()),
                    record.suspension_reason()));
            default:
                return ResultType::Err(RecordError::UnknownValue(
                    "suspension_source", compat::format("{}", static_cast<int>(record.suspension_source()))));
        }
    }
}

// ============================================================================
// RecordError
// ============================================================================

RecordError RecordError::WrongSize(std::string_view field, const size_t expected, const size_t actual) {
    return {RecordErrorType::WrongSize,
            compat::format("{} must be {} bytes, got {}", field, expected, actual),
            std::string(field)};
}

RecordError RecordError::UnknownValue(std::string_view field, std::string_view value) {
    return {RecordErrorType::UnknownValue,
            compat::format("unknown {} '{}'", field, value),
            std::string(field)};
}

RecordError RecordError::MalformedJson(std::string_view field, std::string_view detail) {
    return {RecordErrorType::MalformedJson,
            compat::format("{} is not valid: {}", field, detail),
            std::string(field)};
}

RecordError RecordError::InconsistentState(std::string_view field, std::string_view detail) {
    return {RecordErrorType::InconsistentState, std::string(detail), std::string(field)};
}

RecordError RecordError::InvalidInvite(std::string_view detail) {
    return {RecordErrorType::InvalidInvite,
            compat::format("stored invite rejected: {}", detail),
            "chain_blob"};
}

// ============================================================================
// StoredInvite
// ============================================================================

bool StoredInvite::IsRedeemable(const uint64_t now_unix_secs) const {
    if (revoked_at.has_value()) {
        return false;
    }
    const auto& leaf = invite.Leaf();
    if (leaf.max_uses > 0 && use_count >= leaf.max_uses) {
        return false;
    }
    if (leaf.expires_at.has_value() && now_unix_secs > *leaf.expires_at) {
        return false;
    }
    return true;
}

// ============================================================================
// Member grants
// ============================================================================

proto::storage::MemberGrantRecord RecordCodec::ToRecord(const MemberGrant& grant) {
    GrantRecord record;

    SetBytes(record.mutable_public_key(), grant.public_key.AsSpan());
    record.set_capability(std::string(access::ToString(grant.capability)));
    record.set_access_json(grant.access.ToJsonString());
    record.set_state(std::string(membership::ToString(grant.status.state)));
    record.set_suspension_source(EnumToProtoSource(grant.status.suspension_source));
    if (grant.status.suspension_source.has_value()) {
        record.set_blocklist_scope(grant.status.suspension_source->scope);
    }
    record.set_suspension_reason(grant.status.suspension_reason);

    if (grant.invited_by.has_value()) {
        SetBytes(record.mutable_invited_by(), grant.invited_by->AsSpan());
    }
    if (grant.invited_via.has_value()) {
        SetBytes(record.mutable_invited_via(), *grant.invited_via);
    }
    if (grant.replaces.has_value()) {
        SetBytes(record.mutable_replaces(), grant.replaces->AsSpan());
    }

    return record;
}

Result<MemberGrant, RecordError> RecordCodec::FromRecord(const GrantRecord& record) {
    using ResultType = Result<MemberGrant, RecordError>;

    auto public_key = ReadKey(record.public_key(), "public_key");
    if (public_key.IsErr()) {
        return ResultType::Err(std::move(public_key).UnwrapErr());
    }

    const auto capability = access::ParseCapability(record.capability());
    if (!capability.has_value()) {
        return ResultType::Err(RecordError::UnknownValue("capability", record.capability()));
    }

    auto rights = access::AccessRights::FromJsonString(record.access_json());
    if (rights.IsErr()) {
        return ResultType::Err(RecordError::MalformedJson("access_json", rights.UnwrapErr().message));
    }

    auto status = ReadStatus(record);
    if (status.IsErr()) {
        return ResultType::Err(std::move(status).UnwrapErr());
    }

    auto invited_by = ReadOptionalKey(record.invited_by(), "invited_by");
    if (invited_by.IsErr()) {
        return ResultType::Err(std::move(invited_by).UnwrapErr());
    }
    auto replaces = ReadOptionalKey(record.replaces(), "replaces");
    if (replaces.IsErr()) {
        return ResultType::Err(std::move(replaces).UnwrapErr());
    }

    std::optional<invite::InviteNonce> invited_via;
    if (!record.invited_via().empty()) {
        auto nonce = ReadFixed<kInviteNonceBytes>(record.invited_via(), "invited_via");
        if (nonce.IsErr()) {
            return ResultType::Err(std::move(nonce).UnwrapErr());
        }
        invited_via = nonce.Unwrap();
    }

    MemberGrant grant;
    grant.public_key = public_key.Unwrap();
    grant.capability = *capability;
    grant.access = std::move(rights).Unwrap();
    grant.status = std::move(status).Unwrap();
    grant.invited_by = invited_by.Unwrap();
    grant.invited_via = invited_via;
    grant.replaces = replaces.Unwrap();

    if (grant.IsLoopback() && !grant.IsActive()) {
        debug::LogRejection(debug::Subsystem::Storage, "loopback grant stored outside Active");
        return ResultType::Err(RecordError::InconsistentState(
            "state", "loopback grant must be active"));
    }

    return ResultType::Ok(std::move(grant));
}

// ============================================================================
// Events
// ============================================================================

proto::storage::EventRecord RecordCodec::ToRecord(const events::Event& event) {
    proto::storage::EventRecord record;

    record.set_id(event.id);
    SetBytes(record.mutable_prev_hash(), event.prev_hash);
    record.set_event_type(std::string(events::ToString(event.type)));
    if (event.actor.has_value()) {
        SetBytes(record.mutable_actor(), event.actor->AsSpan());
    }
    if (event.target.has_value()) {
        SetBytes(record.mutable_target(), event.target->AsSpan());
    }
    record.set_payload_json(events::CanonicalJson(event.payload));
    record.set_created_at(event.created_at);
    SetBytes(record.mutable_hash(), event.hash);

    return record;
}

Result<events::Event, RecordError> RecordCodec::FromRecord(const proto::storage::EventRecord& record) {
    using ResultType = Result<events::Event, RecordError>;

    auto prev_hash = ReadFixed<kHashBytes>(record.prev_hash(), "prev_hash");
    if (prev_hash.IsErr()) {
        return ResultType::Err(std::move(prev_hash).UnwrapErr());
    }
    auto hash = ReadFixed<kHashBytes>(record.hash(), "hash");
    if (hash.IsErr()) {
        return ResultType::Err(std::move(hash).UnwrapErr());
    }

    const auto type = events::ParseEventType(record.event_type());
    if (!type.has_value()) {
        return ResultType::Err(RecordError::UnknownValue("event_type", record.event_type()));
    }

    auto actor = ReadOptionalKey(record.actor(), "actor");
    if (actor.IsErr()) {
        return ResultType::Err(std::move(actor).UnwrapErr());
    }
    auto target = ReadOptionalKey(record.target(), "target");
    if (target.IsErr()) {
        return ResultType::Err(std::move(target).UnwrapErr());
    }

    auto payload = nlohmann::json::parse(record.payload_json(), nullptr, false);
    if (payload.is_discarded()) {
        return ResultType::Err(RecordError::MalformedJson("payload_json", "parse error"));
    }

    events::Event event;
    event.id = record.id();
    event.prev_hash = prev_hash.Unwrap();
    event.type = *type;
    event.actor = actor.Unwrap();
    event.target = target.Unwrap();
    event.payload = std::move(payload);
    event.created_at = record.created_at();
    event.hash = hash.Unwrap();

    return ResultType::Ok(std::move(event));
}

proto::storage::EventCheckpointRecord RecordCodec::ToRecord(const events::EventCheckpoint& checkpoint) {
    proto::storage::EventCheckpointRecord record;
    record.set_event_id(checkpoint.event_id);
    SetBytes(record.mutable_chain_head_hash(), checkpoint.chain_head_hash);
    SetBytes(record.mutable_signature(), checkpoint.signature.AsSpan());
    record.set_created_at(checkpoint.created_at);
    return record;
}

Result<events::EventCheckpoint, RecordError> RecordCodec::FromRecord(
    const proto::storage::EventCheckpointRecord& record) {
    using ResultType = Result<events::EventCheckpoint, RecordError>;

    auto head = ReadFixed<kHashBytes>(record.chain_head_hash(), "chain_head_hash");
    if (head.IsErr()) {
        return ResultType::Err(std::move(head).UnwrapErr());
    }
    auto signature = identity::Signature::FromBytes(AsBytes(record.signature()));
    if (signature.IsErr()) {
        return ResultType::Err(
            RecordError::WrongSize("signature", kSignatureBytes, record.signature().size()));
    }

    events::EventCheckpoint checkpoint;
    checkpoint.event_id = record.event_id();
    checkpoint.chain_head_hash = head.Unwrap();
    checkpoint.signature = signature.Unwrap();
    checkpoint.created_at = record.created_at();
    return ResultType::Ok(std::move(checkpoint));
}

// ============================================================================
// Invites
// ============================================================================

proto::storage::InviteRecord RecordCodec::ToRecord(const StoredInvite& stored) {
    proto::storage::InviteRecord record;
    SetBytes(record.mutable_nonce(), stored.Nonce());
    const auto blob = stored.invite.ToBytes();
    SetBytes(record.mutable_chain_blob(), blob);
    record.set_use_count(stored.use_count);
    record.set_created_at(stored.created_at);
    record.set_revoked(stored.revoked_at.has_value());
    if (stored.revoked_at.has_value()) {
        record.set_revoked_at(*stored.revoked_at);
    }
    return record;
}

Result<StoredInvite, RecordError> RecordCodec::FromRecord(const proto::storage::InviteRecord& record) {
    using ResultType = Result<StoredInvite, RecordError>;

    auto nonce = ReadFixed<kInviteNonceBytes>(record.nonce(), "nonce");
    if (nonce.IsErr()) {
        return ResultType::Err(std::move(nonce).UnwrapErr());
    }

    auto parsed = invite::Invite::FromBytes(AsBytes(record.chain_blob()));
    if (parsed.IsErr()) {
        debug::LogRejection(debug::Subsystem::Storage, parsed.UnwrapErr().message);
        return ResultType::Err(RecordError::InvalidInvite(parsed.UnwrapErr().message));
    }

    StoredInvite stored{std::move(parsed).Unwrap(), record.use_count(), record.created_at(), std::nullopt};
    if (stored.Nonce() != nonce.Unwrap()) {
        return ResultType::Err(RecordError::InconsistentState(
            "nonce", "nonce does not match the leaf link of chain_blob"));
    }

    if (record.revoked()) {
        stored.revoked_at = record.revoked_at();
    } else if (!record.revoked_at().empty()) {
        return ResultType::Err(RecordError::InconsistentState(
            "revoked_at", compat::format("revocation time '{}' on a live invite", record.revoked_at())));
    }

    return ResultType::Ok(std::move(stored));
}

} // namespace crabcity::auth::storage
