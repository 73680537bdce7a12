#include <catch2/catch_test_macros.hpp>
#include "crabcity/crypto/sodium_interop.hpp"
#include "crabcity/crypto/secure_memory_handle.hpp"
#include "crabcity/core/constants.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <vector>

using namespace crabcity::auth;
using namespace crabcity::auth::crypto;

TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        auto result = SodiumInterop::Initialize();
        REQUIRE(result.IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::Initialize().IsOk());
    }
}

TEST_CASE("SodiumInterop - Constant Time Comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Equal buffers") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 5};
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b));
    }
    SECTION("Different buffers") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 6};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b));
    }
    SECTION("Different sizes") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b));
    }
    SECTION("Empty buffers are equal") {
        std::vector<uint8_t> a;
        std::vector<uint8_t> b;
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b));
    }
}

TEST_CASE("SodiumInterop - Hashing and randomness", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("SHA-256 of empty input") {
        const auto digest = SodiumInterop::Sha256(std::vector<uint8_t>{});
        // e3b0c442...
        REQUIRE(digest[0] == 0xE3);
        REQUIRE(digest[1] == 0xB0);
        REQUIRE(digest[2] == 0xC4);
        REQUIRE(digest[3] == 0x42);
    }

    SECTION("Incremental hasher matches one-shot") {
        const std::string text = "crab_city_checkpoint_v1:";
        const std::vector<uint8_t> bytes(text.begin(), text.end());
        const auto one_shot = SodiumInterop::Sha256(bytes);
        const auto incremental = Sha256Hasher()
            .Update(std::string_view(text).substr(0, 10))
            .Update(std::string_view(text).substr(10))
            .Finalize();
        REQUIRE(one_shot == incremental);
    }

    SECTION("Random fill varies between calls") {
        std::array<uint8_t, 32> a{};
        std::array<uint8_t, 32> b{};
        SodiumInterop::FillRandom(a);
        SodiumInterop::FillRandom(b);
        REQUIRE(a != b);
    }

    SECTION("Secure wipe zeroes the buffer") {
        std::vector<uint8_t> buffer(64, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(buffer).IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
}

TEST_CASE("SodiumInterop - URL-safe base64", "[sodium][encoding]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Round trip without padding") {
        const std::vector<uint8_t> data = {0xFB, 0xFF, 0x00, 0x10};
        const std::string encoded = SodiumInterop::ToBase64Url(data);
        REQUIRE(encoded == "-_8AEA");
        auto decoded = SodiumInterop::FromBase64Url(encoded);
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == data);
    }

    SECTION("Standard alphabet characters are rejected") {
        REQUIRE(SodiumInterop::FromBase64Url("+/8AEA").IsErr());
    }
}

TEST_CASE("SecureMemoryHandle - Lifecycle", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Allocate valid size") {
        auto result = SecureMemoryHandle::Allocate(kSecretKeyBytes);
        REQUIRE(result.IsOk());
        auto handle = std::move(result).Unwrap();
        REQUIRE_FALSE(handle.IsInvalid());
        REQUIRE(handle.Size() == kSecretKeyBytes);
    }

    SECTION("Cannot allocate zero bytes") {
        REQUIRE(SecureMemoryHandle::Allocate(0).IsErr());
    }

    SECTION("Move transfers ownership") {
        auto handle1 = SecureMemoryHandle::Allocate(32).Unwrap();
        SecureMemoryHandle handle2(std::move(handle1));
        REQUIRE(handle1.IsInvalid());
        REQUIRE_FALSE(handle2.IsInvalid());
        REQUIRE(handle2.Size() == 32);
    }

    SECTION("Short write zero-fills the rest") {
        auto handle = SecureMemoryHandle::Allocate(8).Unwrap();
        REQUIRE(handle.Write(std::vector<uint8_t>(8, 0xAA)).IsOk());
        REQUIRE(handle.Write(std::vector<uint8_t>{1, 2}).IsOk());
        auto bytes = handle.WithReadAccess([](std::span<const uint8_t> span) {
            return std::vector<uint8_t>(span.begin(), span.end());
        });
        REQUIRE(bytes.IsOk());
        REQUIRE(bytes.Unwrap() == std::vector<uint8_t>{1, 2, 0, 0, 0, 0, 0, 0});
    }

    SECTION("Oversized write fails") {
        auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
        auto result = handle.Write(std::vector<uint8_t>(32, 0x42));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::BufferTooSmall);
    }

    SECTION("Access after move fails") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        auto moved = std::move(handle);
        REQUIRE(handle.Write(std::vector<uint8_t>(4, 1)).IsErr());
        auto read = handle.WithReadAccess([](std::span<const uint8_t> span) { return span.size(); });
        REQUIRE(read.IsErr());
        REQUIRE(moved.Size() == 32);
    }
}
