#pragma once

/**
 * @file trace_logger.hpp
 * @brief Debug tracing for invite verification, event chains and grant
 * transitions.
 *
 * Output goes to stdout and includes public keys, hashes and nonces.
 * Secret key material is never passed to these helpers.
 *
 * Enable via CMake: -DCRABCITY_DEBUG_TRACE=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace crabcity::debug {

enum class Subsystem {
    Invite,
    Events,
    Membership,
    IdentityProof,
    Storage
};

#ifdef CRABCITY_DEBUG_TRACE

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = 32) {
    if (data.size() <= max_bytes) {
        return ToHex(data);
    }
    auto truncated = ToHex(data.subspan(0, max_bytes));
    truncated += "...(" + std::to_string(data.size()) + " bytes)";
    return truncated;
}

inline const char* SubsystemToString(Subsystem subsystem) {
    switch (subsystem) {
        case Subsystem::Invite: return "INVITE";
        case Subsystem::Events: return "EVENTS";
        case Subsystem::Membership: return "MEMBERSHIP";
        case Subsystem::IdentityProof: return "IDENTITY_PROOF";
        case Subsystem::Storage: return "STORAGE";
    }
    return "UNKNOWN";
}

#define CRABCITY_TRACE_BYTES(subsystem, name, data) \
    do { \
        fprintf(stdout, "[CRABCITY-TRACE] %s %s: %s\n", \
            ::crabcity::debug::SubsystemToString(subsystem), \
            name, \
            ::crabcity::debug::ToHexTruncated(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define CRABCITY_TRACE_VALUE(subsystem, name, value) \
    do { \
        fprintf(stdout, "[CRABCITY-TRACE] %s %s: %s\n", \
            ::crabcity::debug::SubsystemToString(subsystem), \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define CRABCITY_TRACE_MSG(subsystem, message) \
    do { \
        fprintf(stdout, "[CRABCITY-TRACE] %s %s\n", \
            ::crabcity::debug::SubsystemToString(subsystem), \
            std::string(message).c_str()); \
        fflush(stdout); \
    } while(0)

#define CRABCITY_TRACE_SECTION(subsystem, section_name) \
    do { \
        fprintf(stdout, "[CRABCITY-TRACE] %s ========== %s ==========\n", \
            ::crabcity::debug::SubsystemToString(subsystem), \
            section_name); \
        fflush(stdout); \
    } while(0)

inline void LogInviteLink(
    size_t index,
    std::span<const uint8_t> issuer,
    std::string_view capability,
    uint8_t max_depth,
    std::span<const uint8_t> prev_hash) {

    char name[48];
    snprintf(name, sizeof(name), "link[%zu] issuer", index);
    CRABCITY_TRACE_BYTES(Subsystem::Invite, name, issuer);
    snprintf(name, sizeof(name), "link[%zu] prev_hash", index);
    CRABCITY_TRACE_BYTES(Subsystem::Invite, name, prev_hash);
    snprintf(name, sizeof(name), "link[%zu] max_depth", index);
    CRABCITY_TRACE_VALUE(Subsystem::Invite, name, static_cast<uint32_t>(max_depth));
    CRABCITY_TRACE_MSG(Subsystem::Invite, std::string("capability ") + std::string(capability));
}

inline void LogRejection(Subsystem subsystem, std::string_view reason) {
    CRABCITY_TRACE_MSG(subsystem, std::string("rejected: ") + std::string(reason));
}

inline void LogChainHead(uint64_t event_id, std::span<const uint8_t> hash) {
    CRABCITY_TRACE_VALUE(Subsystem::Events, "head_id", event_id);
    CRABCITY_TRACE_BYTES(Subsystem::Events, "head_hash", hash);
}

inline void LogTransition(std::string_view from, std::string_view kind, std::string_view to) {
    CRABCITY_TRACE_MSG(Subsystem::Membership,
        std::string(from) + " --" + std::string(kind) + "--> " + std::string(to));
}

#else // !CRABCITY_DEBUG_TRACE

#define CRABCITY_TRACE_BYTES(subsystem, name, data) ((void)0)
#define CRABCITY_TRACE_VALUE(subsystem, name, value) ((void)0)
#define CRABCITY_TRACE_MSG(subsystem, message) ((void)0)
#define CRABCITY_TRACE_SECTION(subsystem, section_name) ((void)0)

inline void LogInviteLink(size_t, std::span<const uint8_t>, std::string_view, uint8_t,
    std::span<const uint8_t>) {}
inline void LogRejection(Subsystem, std::string_view) {}
inline void LogChainHead(uint64_t, std::span<const uint8_t>) {}
inline void LogTransition(std::string_view, std::string_view, std::string_view) {}

#endif // CRABCITY_DEBUG_TRACE

} // namespace crabcity::debug
