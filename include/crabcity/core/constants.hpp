#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace crabcity::auth {

inline constexpr size_t kPublicKeyBytes = 32;
inline constexpr size_t kSecretKeyBytes = 64;
inline constexpr size_t kSeedBytes = 32;
inline constexpr size_t kSignatureBytes = 64;
inline constexpr size_t kHashBytes = 32;

using Hash256 = std::array<uint8_t, kHashBytes>;

// Invite wire format
inline constexpr uint8_t kInviteVersion = 0x01;
inline constexpr size_t kInviteNonceBytes = 16;
inline constexpr size_t kInviteHeaderBytes = 1 + kPublicKeyBytes + 1;
inline constexpr size_t kInviteLinkBytes =
    kPublicKeyBytes + 1 + 1 + 4 + 8 + kInviteNonceBytes + kSignatureBytes;
static_assert(kInviteLinkBytes == 126, "Invite link layout is fixed at 126 bytes");

// Upper bound on delegation hops accepted from any source. Checked before
// allocating link storage when parsing untrusted bytes.
inline constexpr size_t kMaxChainDepth = 16;

// Identity proof wire format
inline constexpr uint8_t kIdentityProofVersion = 0x01;
inline constexpr size_t kMaxRelatedKeys = 256;
inline constexpr size_t kIdentityProofMinBytes = 1 + kPublicKeyBytes + kPublicKeyBytes + 4;

// Fingerprints
inline constexpr std::string_view kFingerprintPrefix = "crab_";
inline constexpr size_t kFingerprintChars = 8;

// Event log
inline constexpr std::string_view kCheckpointDomain = "crab_city_checkpoint_v1:";
inline constexpr uint64_t kDefaultCheckpointInterval = 100;

// Identity nouns
inline constexpr size_t kHandleMinChars = 3;
inline constexpr size_t kHandleMaxChars = 30;
inline constexpr size_t kGitHubMaxChars = 39;

}  // namespace crabcity::auth
