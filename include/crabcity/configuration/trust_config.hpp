#pragma once

#include "crabcity/core/constants.hpp"

#include <cstddef>
#include <cstdint>

namespace crabcity::auth::configuration {

/// Instance-wide limits applied on top of what invites and proofs carry
///
/// Per-invite max_depth is chosen by the issuer and fits in a byte. The
/// chain-length cap here bounds verification cost no matter what an
/// issuer (or an attacker crafting bytes) puts there.
///
/// @example
/// ```cpp
/// constexpr auto config = TrustConfig::Default().WithCheckpointInterval(50);
/// if (config.ShouldCheckpoint(event.id)) {
///     // sign a checkpoint over the new head
/// }
/// ```
class TrustConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Chains up to 16 links, 256 related keys per proof, a checkpoint
    /// every 100 events.
    [[nodiscard]] static constexpr TrustConfig Default() noexcept {
        return TrustConfig(
            static_cast<uint8_t>(kMaxChainDepth), kMaxRelatedKeys, kDefaultCheckpointInterval);
    }

    /// Short chains and frequent checkpoints for instances that hand out
    /// admin invites.
    [[nodiscard]] static constexpr TrustConfig Strict() noexcept {
        return TrustConfig(4, 16, 25);
    }

    // =========================================================================
    // Builders
    // =========================================================================

    /// Clamped to [1, kMaxChainDepth].
    [[nodiscard]] constexpr TrustConfig WithMaxChainDepth(const uint8_t depth) const noexcept {
        uint8_t clamped = depth;
        if (clamped < 1) {
            clamped = 1;
        }
        if (clamped > kMaxChainDepth) {
            clamped = static_cast<uint8_t>(kMaxChainDepth);
        }
        return TrustConfig(clamped, max_related_keys_, checkpoint_interval_);
    }

    /// Clamped to [0, kMaxRelatedKeys].
    [[nodiscard]] constexpr TrustConfig WithMaxRelatedKeys(const size_t count) const noexcept {
        return TrustConfig(
            max_chain_depth_, count > kMaxRelatedKeys ? kMaxRelatedKeys : count,
            checkpoint_interval_);
    }

    /// Zero is treated as 1.
    [[nodiscard]] constexpr TrustConfig WithCheckpointInterval(const uint64_t interval) const noexcept {
        return TrustConfig(max_chain_depth_, max_related_keys_, interval == 0 ? 1 : interval);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// Longest invite chain, in links, accepted anywhere.
    [[nodiscard]] constexpr uint8_t MaxChainDepth() const noexcept {
        return max_chain_depth_;
    }

    /// Highest max_depth a root link may carry so the chain still fits.
    [[nodiscard]] constexpr uint8_t MaxRootDelegationDepth() const noexcept {
        return static_cast<uint8_t>(max_chain_depth_ - 1);
    }

    [[nodiscard]] constexpr size_t MaxRelatedKeys() const noexcept {
        return max_related_keys_;
    }

    [[nodiscard]] constexpr uint64_t CheckpointInterval() const noexcept {
        return checkpoint_interval_;
    }

    [[nodiscard]] constexpr bool ShouldCheckpoint(const uint64_t event_id) const noexcept {
        return event_id > 0 && event_id % checkpoint_interval_ == 0;
    }

    constexpr bool operator==(const TrustConfig&) const noexcept = default;

private:
    constexpr TrustConfig(
        const uint8_t max_chain_depth,
        const size_t max_related_keys,
        const uint64_t checkpoint_interval) noexcept
        : max_chain_depth_(max_chain_depth)
        , max_related_keys_(max_related_keys)
        , checkpoint_interval_(checkpoint_interval) {}

    uint8_t max_chain_depth_;
    size_t max_related_keys_;
    uint64_t checkpoint_interval_;
};

} // namespace crabcity::auth::configuration
