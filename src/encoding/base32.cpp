#include "crabcity/encoding/base32.hpp"

#include <array>

namespace crabcity::auth::encoding {

namespace {

constexpr int8_t kInvalid = -1;

constexpr std::array<int8_t, 256> BuildDecodeTable() {
    std::array<int8_t, 256> table{};
    for (auto& entry : table) {
        entry = kInvalid;
    }
    for (size_t i = 0; i < kCrockfordAlphabet.size(); ++i) {
        const auto upper = static_cast<unsigned char>(kCrockfordAlphabet[i]);
        table[upper] = static_cast<int8_t>(i);
        if (upper >= 'A' && upper <= 'Z') {
            table[upper - 'A' + 'a'] = static_cast<int8_t>(i);
        }
    }
    return table;
}

constexpr auto kDecodeTable = BuildDecodeTable();

}  // namespace

std::string EncodeBase32(std::span<const uint8_t> data) {
    std::string out;
    out.reserve((data.size() * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;
    for (const uint8_t byte : data) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(kCrockfordAlphabet[(buffer >> bits) & 0x1F]);
        }
    }
    if (bits > 0) {
        out.push_back(kCrockfordAlphabet[(buffer << (5 - bits)) & 0x1F]);
    }
    return out;
}

std::optional<std::vector<uint8_t>> DecodeBase32(std::string_view text) {
    // 1, 3 and 6 trailing characters never come out of the encoder
    const size_t remainder = text.size() % 8;
    if (remainder == 1 || remainder == 3 || remainder == 6) {
        return std::nullopt;
    }

    std::vector<uint8_t> out;
    out.reserve(text.size() * 5 / 8);

    uint32_t buffer = 0;
    int bits = 0;
    for (const char c : text) {
        const int8_t value = kDecodeTable[static_cast<unsigned char>(c)];
        if (value == kInvalid) {
            return std::nullopt;
        }
        buffer = (buffer << 5) | static_cast<uint32_t>(value);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>(buffer >> bits));
        }
    }
    // Leftover bits of the last symbol are padding and must be zero
    if (bits > 0 && (buffer & ((1u << bits) - 1)) != 0) {
        return std::nullopt;
    }
    return out;
}

} // namespace crabcity::auth::encoding
