#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace crabcity::auth::encoding {

inline std::array<uint8_t, 2> ToBigEndian16(const uint16_t value) noexcept {
    return {static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value)};
}

inline std::array<uint8_t, 4> ToBigEndian32(const uint32_t value) noexcept {
    return {
        static_cast<uint8_t>(value >> 24),
        static_cast<uint8_t>(value >> 16),
        static_cast<uint8_t>(value >> 8),
        static_cast<uint8_t>(value),
    };
}

inline std::array<uint8_t, 8> ToBigEndian64(const uint64_t value) noexcept {
    std::array<uint8_t, 8> out{};
    for (size_t i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>(value >> (56 - 8 * i));
    }
    return out;
}

// Callers check bounds before reading.
inline uint16_t ReadBigEndian16(const uint8_t* data) noexcept {
    return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) | data[1]);
}

inline uint32_t ReadBigEndian32(const uint8_t* data) noexcept {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

inline uint64_t ReadBigEndian64(const uint8_t* data) noexcept {
    uint64_t value = 0;
    for (size_t i = 0; i < 8; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

inline void Append(std::vector<uint8_t>& out, std::span<const uint8_t> bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

} // namespace crabcity::auth::encoding
