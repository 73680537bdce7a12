#include "crabcity/access/capability.hpp"
#include "crabcity/core/format.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <map>

namespace crabcity::auth::access {

namespace {

AccessRight Right(std::string type, std::initializer_list<const char*> actions) {
    AccessRight right{std::move(type), {}};
    for (const char* action : actions) {
        right.actions.emplace_back(action);
    }
    return right;
}

const AccessRight* FindType(const std::vector<AccessRight>& entries, std::string_view type) {
    const auto it = std::lower_bound(
        entries.begin(), entries.end(), type,
        [](const AccessRight& entry, std::string_view key) { return entry.type < key; });
    if (it == entries.end() || it->type != type) {
        return nullptr;
    }
    return &*it;
}

bool HasAction(const AccessRight& entry, std::string_view action) {
    return std::binary_search(entry.actions.begin(), entry.actions.end(), action,
        [](std::string_view a, std::string_view b) { return a < b; });
}

}  // namespace

// ============================================================================
// Capability
// ============================================================================

std::string_view ToString(const Capability capability) noexcept {
    switch (capability) {
        case Capability::View: return "view";
        case Capability::Collaborate: return "collaborate";
        case Capability::Admin: return "admin";
        case Capability::Owner: return "owner";
    }
    return "view";
}

std::optional<Capability> ParseCapability(std::string_view name) noexcept {
    if (name == "view") return Capability::View;
    if (name == "collaborate") return Capability::Collaborate;
    if (name == "admin") return Capability::Admin;
    if (name == "owner") return Capability::Owner;
    return std::nullopt;
}

std::optional<Capability> CapabilityFromByte(const uint8_t value) noexcept {
    if (value > static_cast<uint8_t>(Capability::Owner)) {
        return std::nullopt;
    }
    return static_cast<Capability>(value);
}

AccessRights AccessRightsFor(const Capability capability) {
    std::vector<AccessRight> rights;
    rights.push_back(Right("content", {"read"}));
    rights.push_back(Right("terminals", {"read"}));

    if (capability >= Capability::Collaborate) {
        rights.push_back(Right("terminals", {"input"}));
        rights.push_back(Right("chat", {"send"}));
        rights.push_back(Right("tasks", {"read", "create", "edit"}));
        rights.push_back(Right("instances", {"create"}));
    }
    if (capability >= Capability::Admin) {
        rights.push_back(Right("members",
            {"read", "invite", "suspend", "reinstate", "remove", "update"}));
    }
    if (capability >= Capability::Owner) {
        rights.push_back(Right("instance", {"manage", "transfer"}));
    }
    return AccessRights::FromEntries(std::move(rights));
}

std::optional<Capability> CapabilityFromAccess(const AccessRights& rights) {
    constexpr std::array<Capability, 4> kPresets = {
        Capability::Owner, Capability::Admin, Capability::Collaborate, Capability::View};
    for (const Capability preset : kPresets) {
        if (AccessRightsFor(preset) == rights) {
            return preset;
        }
    }
    return std::nullopt;
}

// ============================================================================
// AccessRights
// ============================================================================

AccessRights AccessRights::FromEntries(std::vector<AccessRight> entries) {
    std::map<std::string, std::vector<std::string>> merged;
    for (auto& entry : entries) {
        auto& actions = merged[std::move(entry.type)];
        for (auto& action : entry.actions) {
            actions.push_back(std::move(action));
        }
    }

    AccessRights rights;
    for (auto& [type, actions] : merged) {
        std::sort(actions.begin(), actions.end());
        actions.erase(std::unique(actions.begin(), actions.end()), actions.end());
        if (!actions.empty()) {
            rights.entries_.push_back(AccessRight{type, std::move(actions)});
        }
    }
    return rights;
}

AccessRights AccessRights::Single(std::string type, std::string action) {
    return FromEntries({AccessRight{std::move(type), {std::move(action)}}});
}

bool AccessRights::Contains(std::string_view type, std::string_view action) const {
    const AccessRight* entry = FindType(entries_, type);
    return entry != nullptr && HasAction(*entry, action);
}

bool AccessRights::IsSupersetOf(const AccessRights& other) const {
    for (const auto& entry : other.entries_) {
        const AccessRight* mine = FindType(entries_, entry.type);
        if (mine == nullptr) {
            return false;
        }
        if (!std::includes(mine->actions.begin(), mine->actions.end(),
                           entry.actions.begin(), entry.actions.end())) {
            return false;
        }
    }
    return true;
}

AccessRights AccessRights::Intersect(const AccessRights& other) const {
    AccessRights result;
    for (const auto& entry : entries_) {
        const AccessRight* theirs = FindType(other.entries_, entry.type);
        if (theirs == nullptr) {
            continue;
        }
        AccessRight common{entry.type, {}};
        std::set_intersection(entry.actions.begin(), entry.actions.end(),
                              theirs->actions.begin(), theirs->actions.end(),
                              std::back_inserter(common.actions));
        if (!common.actions.empty()) {
            result.entries_.push_back(std::move(common));
        }
    }
    return result;
}

AccessRightsDiff AccessRights::Diff(const AccessRights& other) const {
    const auto subtract = [](const AccessRights& from, const AccessRights& what) {
        AccessRights result;
        for (const auto& entry : from.entries_) {
            const AccessRight* drop = FindType(what.entries_, entry.type);
            if (drop == nullptr) {
                result.entries_.push_back(entry);
                continue;
            }
            AccessRight rest{entry.type, {}};
            std::set_difference(entry.actions.begin(), entry.actions.end(),
                                drop->actions.begin(), drop->actions.end(),
                                std::back_inserter(rest.actions));
            if (!rest.actions.empty()) {
                result.entries_.push_back(std::move(rest));
            }
        }
        return result;
    };
    return AccessRightsDiff{subtract(other, *this), subtract(*this, other)};
}

// ============================================================================
// JSON boundary
// ============================================================================

Result<AccessRights, AccessRightsError> AccessRights::FromJson(const nlohmann::json& value) {
    using ResultType = Result<AccessRights, AccessRightsError>;

    if (!value.is_array()) {
        return ResultType::Err(AccessRightsError(
            AccessRightsErrorType::NotAnArray, "access rights must be a JSON array"));
    }

    std::vector<AccessRight> entries;
    entries.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        const auto& item = value[i];
        if (!item.is_object()) {
            return ResultType::Err(AccessRightsError(
                AccessRightsErrorType::NotAnObject,
                compat::format("entry {} is not an object", i), i));
        }
        const auto type_it = item.find("type");
        if (type_it == item.end() || !type_it->is_string() ||
            type_it->get_ref<const std::string&>().empty()) {
            return ResultType::Err(AccessRightsError(
                AccessRightsErrorType::InvalidType,
                compat::format("entry {} needs a non-empty string \"type\"", i), i));
        }
        const auto actions_it = item.find("actions");
        if (actions_it == item.end() || !actions_it->is_array()) {
            return ResultType::Err(AccessRightsError(
                AccessRightsErrorType::InvalidActions,
                compat::format("entry {} needs an \"actions\" array", i), i));
        }

        AccessRight right{type_it->get<std::string>(), {}};
        for (const auto& action : *actions_it) {
            if (!action.is_string() || action.get_ref<const std::string&>().empty()) {
                return ResultType::Err(AccessRightsError(
                    AccessRightsErrorType::InvalidActions,
                    compat::format("entry {} has a non-string or empty action", i), i));
            }
            right.actions.push_back(action.get<std::string>());
        }
        entries.push_back(std::move(right));
    }
    return ResultType::Ok(FromEntries(std::move(entries)));
}

Result<AccessRights, AccessRightsError> AccessRights::FromJsonString(std::string_view text) {
    nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return Result<AccessRights, AccessRightsError>::Err(AccessRightsError(
            AccessRightsErrorType::MalformedJson, "access rights are not valid JSON"));
    }
    return FromJson(parsed);
}

nlohmann::json AccessRights::ToJson() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& entry : entries_) {
        out.push_back({{"type", entry.type}, {"actions", entry.actions}});
    }
    return out;
}

std::string AccessRights::ToJsonString() const {
    return ToJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace crabcity::auth::access
