#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace crabcity::auth::encoding {

/**
 * @brief Crockford base32 alphabet (no I, L, O, U)
 *
 * Bits are grouped five at a time, most significant first, with the final
 * group zero-padded on the right. No '=' padding is emitted.
 */
inline constexpr std::string_view kCrockfordAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

std::string EncodeBase32(std::span<const uint8_t> data);

/**
 * @brief Decode Crockford base32, ignoring case
 *
 * Returns nullopt for a character outside the alphabet or a length that no
 * encoder output can have.
 */
std::optional<std::vector<uint8_t>> DecodeBase32(std::string_view text);

} // namespace crabcity::auth::encoding
