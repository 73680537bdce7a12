#pragma once

#include "crabcity/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crabcity::auth::access {

/// Ordered preset; the numeric value is the invite wire byte.
enum class Capability : uint8_t {
    View = 0,
    Collaborate = 1,
    Admin = 2,
    Owner = 3
};

[[nodiscard]] std::string_view ToString(Capability capability) noexcept;
[[nodiscard]] std::optional<Capability> ParseCapability(std::string_view name) noexcept;
[[nodiscard]] std::optional<Capability> CapabilityFromByte(uint8_t value) noexcept;

struct AccessRight {
    std::string type;
    std::vector<std::string> actions;

    bool operator==(const AccessRight&) const = default;
};

enum class AccessRightsErrorType {
    MalformedJson,
    NotAnArray,
    NotAnObject,
    InvalidType,
    InvalidActions
};

class AccessRightsError {
public:
    AccessRightsErrorType type;
    std::string message;
    size_t entry_index = 0;

    AccessRightsError(const AccessRightsErrorType t, std::string msg, const size_t index = 0)
        : type(t), message(std::move(msg)), entry_index(index) {}
};

struct AccessRightsDiff;

/**
 * @brief Set of (resource type, action) pairs; the only thing checked at
 * authorization time
 *
 * Always normalized: entries sorted by type, one entry per type, actions
 * sorted and deduplicated, no entry without actions. Equality is therefore
 * set equality.
 */
class AccessRights {
public:
    AccessRights() = default;

    static AccessRights FromEntries(std::vector<AccessRight> entries);

    static AccessRights Single(std::string type, std::string action);

    /**
     * @brief Validate the JSON boundary shape
     *
     * Expects [{"type": "<non-empty>", "actions": ["<non-empty>", ...]}, ...].
     * Nothing from the input is trusted until it passes here.
     */
    static Result<AccessRights, AccessRightsError> FromJson(const nlohmann::json& value);

    static Result<AccessRights, AccessRightsError> FromJsonString(std::string_view text);

    [[nodiscard]] nlohmann::json ToJson() const;

    [[nodiscard]] std::string ToJsonString() const;

    [[nodiscard]] const std::vector<AccessRight>& Entries() const noexcept {
        return entries_;
    }

    [[nodiscard]] bool IsEmpty() const noexcept {
        return entries_.empty();
    }

    [[nodiscard]] bool Contains(std::string_view type, std::string_view action) const;

    [[nodiscard]] bool IsSupersetOf(const AccessRights& other) const;

    /// Per-type action intersection; types missing on either side drop out.
    [[nodiscard]] AccessRights Intersect(const AccessRights& other) const;

    /// added = in other but not here, removed = here but not in other.
    [[nodiscard]] AccessRightsDiff Diff(const AccessRights& other) const;

    bool operator==(const AccessRights&) const = default;

private:
    std::vector<AccessRight> entries_;
};

struct AccessRightsDiff {
    AccessRights added;
    AccessRights removed;
};

/// Preset expansion. Monotone: each step up is a strict superset.
[[nodiscard]] AccessRights AccessRightsFor(Capability capability);

/**
 * @brief Exact-match reverse lookup against the four presets
 *
 * Rights tweaked by an admin usually match no preset; callers then show the
 * raw rights instead of a label.
 */
[[nodiscard]] std::optional<Capability> CapabilityFromAccess(const AccessRights& rights);

} // namespace crabcity::auth::access
