#include <catch2/catch_test_macros.hpp>
#include "crabcity/encoding/base32.hpp"
#include "crabcity/encoding/byte_order.hpp"

#include <string>
#include <vector>

using namespace crabcity::auth::encoding;

TEST_CASE("Base32 - Encoding", "[base32][encoding]") {
    SECTION("Empty input encodes to empty string") {
        REQUIRE(EncodeBase32(std::vector<uint8_t>{}).empty());
    }

    SECTION("Single 0xFF byte") {
        REQUIRE(EncodeBase32(std::vector<uint8_t>{0xFF}) == "ZW");
    }

    SECTION("Five zero bytes are eight zeros") {
        REQUIRE(EncodeBase32(std::vector<uint8_t>(5, 0)) == "00000000");
    }

    SECTION("Output never contains excluded letters") {
        std::vector<uint8_t> all(256);
        for (size_t i = 0; i < all.size(); ++i) {
            all[i] = static_cast<uint8_t>(i);
        }
        const std::string encoded = EncodeBase32(all);
        REQUIRE(encoded.find_first_of("ILOU") == std::string::npos);
        REQUIRE(encoded.size() == (all.size() * 8 + 4) / 5);
    }
}

TEST_CASE("Base32 - Decoding", "[base32][encoding]") {
    SECTION("Decodes what the encoder produced") {
        for (size_t length = 0; length < 24; ++length) {
            std::vector<uint8_t> data(length);
            for (size_t i = 0; i < length; ++i) {
                data[i] = static_cast<uint8_t>(i * 37 + 11);
            }
            auto decoded = DecodeBase32(EncodeBase32(data));
            REQUIRE(decoded.has_value());
            REQUIRE(*decoded == data);
        }
    }

    SECTION("Lowercase is accepted") {
        auto upper = DecodeBase32("ZW");
        auto lower = DecodeBase32("zw");
        REQUIRE(upper.has_value());
        REQUIRE(lower.has_value());
        REQUIRE(*upper == *lower);
        REQUIRE(*lower == std::vector<uint8_t>{0xFF});
    }

    SECTION("Characters outside the alphabet are rejected") {
        REQUIRE_FALSE(DecodeBase32("0U").has_value());
        REQUIRE_FALSE(DecodeBase32("0I").has_value());
        REQUIRE_FALSE(DecodeBase32("0=").has_value());
        REQUIRE_FALSE(DecodeBase32("0 ").has_value());
    }

    SECTION("Non-zero padding bits are rejected") {
        REQUIRE(DecodeBase32("ZW").has_value());
        REQUIRE_FALSE(DecodeBase32("ZX").has_value());
        REQUIRE_FALSE(DecodeBase32("ZZ").has_value());

        for (size_t length = 1; length < 10; ++length) {
            const std::vector<uint8_t> data(length, 0xAB);
            const std::string encoded = EncodeBase32(data);
            const int pad_bits = static_cast<int>(encoded.size() * 5 - length * 8);
            const auto last = static_cast<size_t>(kCrockfordAlphabet.find(encoded.back()));
            for (size_t pad = 1; pad < (size_t{1} << pad_bits); ++pad) {
                std::string mutated = encoded;
                mutated.back() = kCrockfordAlphabet[last ^ pad];
                INFO("length " << length << " text " << mutated);
                REQUIRE_FALSE(DecodeBase32(mutated).has_value());
            }
        }
    }

    SECTION("Impossible lengths are rejected") {
        REQUIRE_FALSE(DecodeBase32("0").has_value());
        REQUIRE_FALSE(DecodeBase32("000").has_value());
        REQUIRE_FALSE(DecodeBase32("000000").has_value());
        REQUIRE_FALSE(DecodeBase32("000000000").has_value());
    }
}

TEST_CASE("Byte order - Big endian helpers", "[encoding]") {
    SECTION("Round trip through the readers") {
        const auto b16 = ToBigEndian16(0xABCD);
        const auto b32 = ToBigEndian32(0x01020304);
        const auto b64 = ToBigEndian64(0x0102030405060708ULL);
        REQUIRE(b16[0] == 0xAB);
        REQUIRE(b32[0] == 0x01);
        REQUIRE(b32[3] == 0x04);
        REQUIRE(b64[7] == 0x08);
        REQUIRE(ReadBigEndian16(b16.data()) == 0xABCD);
        REQUIRE(ReadBigEndian32(b32.data()) == 0x01020304);
        REQUIRE(ReadBigEndian64(b64.data()) == 0x0102030405060708ULL);
    }
}
