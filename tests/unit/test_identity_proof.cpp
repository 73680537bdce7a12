#include <catch2/catch_test_macros.hpp>
#include "crabcity/identity/identity_proof.hpp"
#include "crabcity/crypto/sodium_interop.hpp"
#include "crabcity/encoding/byte_order.hpp"

#include <string>
#include <vector>

using namespace crabcity::auth;
using namespace crabcity::auth::identity;
using configuration::TrustConfig;
using crypto::SodiumInterop;

namespace {
    SigningKey MakeKey() {
        auto key = SigningKey::Generate();
        REQUIRE(key.IsOk());
        return std::move(key).Unwrap();
    }

    std::vector<PublicKey> RelatedKeys(const size_t count) {
        std::vector<PublicKey> keys;
        for (size_t i = 0; i < count; ++i) {
            std::array<uint8_t, kPublicKeyBytes> bytes{};
            bytes.fill(static_cast<uint8_t>(i + 1));
            keys.emplace_back(bytes);
        }
        return keys;
    }

    IdentityProof MakeProof(const SigningKey& subject, const PublicKey& instance,
                            std::optional<std::string> handle = std::string("alex")) {
        auto proof = IdentityProof::Sign(subject, instance, RelatedKeys(2), std::move(handle),
                                         1'700'000'000);
        REQUIRE(proof.IsOk());
        return std::move(proof).Unwrap();
    }
}

TEST_CASE("IdentityProof - Sign and verify", "[identity][proof]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto subject = MakeKey();
    const auto instance = MakeKey();

    SECTION("Claims carry every field") {
        const auto proof = MakeProof(subject, instance.GetPublicKey());
        auto claims = proof.Verify();
        REQUIRE(claims.IsOk());
        REQUIRE(claims.Unwrap().subject == subject.GetPublicKey());
        REQUIRE(claims.Unwrap().instance == instance.GetPublicKey());
        REQUIRE(claims.Unwrap().related_keys == RelatedKeys(2));
        REQUIRE(claims.Unwrap().registry_handle == std::string("alex"));
        REQUIRE(claims.Unwrap().timestamp == 1'700'000'000);
    }

    SECTION("Bytes parse back and still verify") {
        for (const auto& handle : {std::optional<std::string>("alex"),
                                   std::optional<std::string>(std::nullopt),
                                   std::optional<std::string>("")}) {
            const auto proof = MakeProof(subject, instance.GetPublicKey(), handle);
            auto parsed = IdentityProof::FromBytes(proof.ToBytes());
            REQUIRE(parsed.IsOk());
            REQUIRE(parsed.Unwrap() == proof);
            REQUIRE(parsed.Unwrap().Verify().IsOk());
        }
    }

    SECTION("Wire size") {
        const auto with_handle = MakeProof(subject, instance.GetPublicKey());
        REQUIRE(with_handle.ToBytes().size() == 1 + 32 + 32 + 4 + 2 * 32 + 1 + 2 + 4 + 8 + 64);
        const auto without = MakeProof(subject, instance.GetPublicKey(), std::nullopt);
        REQUIRE(without.ToBytes().size() == 1 + 32 + 32 + 4 + 2 * 32 + 1 + 8 + 64);
    }

    SECTION("Any field change breaks the signature") {
        const auto proof = MakeProof(subject, instance.GetPublicKey());

        auto changed = proof;
        changed.timestamp += 1;
        REQUIRE(changed.Verify().UnwrapErr().type == IdentityProofErrorType::BadSignature);

        changed = proof;
        changed.registry_handle = "mallory";
        REQUIRE(changed.Verify().IsErr());

        changed = proof;
        changed.related_keys.pop_back();
        REQUIRE(changed.Verify().IsErr());

        changed = proof;
        changed.instance = subject.GetPublicKey();
        REQUIRE(changed.Verify().IsErr());
    }

    SECTION("Version is checked before the signature") {
        auto proof = MakeProof(subject, instance.GetPublicKey());
        proof.version = 0x02;
        auto result = proof.Verify();
        REQUIRE(result.UnwrapErr().type == IdentityProofErrorType::UnsupportedVersion);
        REQUIRE(result.UnwrapErr().ToAuthError().type == AuthErrorType::InvalidSignature);
    }

    SECTION("Key count limits come from the config") {
        const auto config = TrustConfig::Default().WithMaxRelatedKeys(1);
        auto refused = IdentityProof::Sign(subject, instance.GetPublicKey(), RelatedKeys(2),
                                           std::nullopt, 1, config);
        REQUIRE(refused.UnwrapErr().type == IdentityProofErrorType::KeyCountExceedsMax);

        const auto proof = MakeProof(subject, instance.GetPublicKey());
        REQUIRE(proof.Verify(config).UnwrapErr().type == IdentityProofErrorType::KeyCountExceedsMax);
    }

    SECTION("Handles must be valid UTF-8") {
        auto bad = IdentityProof::Sign(subject, instance.GetPublicKey(), {},
                                       std::string("\xC3\x28"), 1);
        REQUIRE(bad.UnwrapErr().type == IdentityProofErrorType::InvalidUtf8Handle);

        auto good = IdentityProof::Sign(subject, instance.GetPublicKey(), {},
                                        std::string("cr\xC3\xA9pe"), 1);
        REQUIRE(good.IsOk());
    }
}

TEST_CASE("IdentityProof - Decoding errors", "[identity][proof][encoding]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto subject = MakeKey();
    const auto instance = MakeKey();
    const auto bytes = MakeProof(subject, instance.GetPublicKey()).ToBytes();
    constexpr size_t kCountOffset = 1 + 32 + 32;
    const size_t flag_offset = kCountOffset + 4 + 2 * 32;

    SECTION("Too short") {
        auto result = IdentityProof::FromBytes(std::span<const uint8_t>(bytes.data(), 68));
        REQUIRE(result.UnwrapErr().type == IdentityProofErrorType::TooShort);
    }

    SECTION("Key count above the wire limit") {
        auto tampered = bytes;
        const auto count = encoding::ToBigEndian32(257);
        std::copy(count.begin(), count.end(), tampered.begin() + kCountOffset);
        auto result = IdentityProof::FromBytes(tampered);
        REQUIRE(result.UnwrapErr().type == IdentityProofErrorType::KeyCountExceedsMax);
    }

    SECTION("Key count beyond the input") {
        auto tampered = bytes;
        const auto count = encoding::ToBigEndian32(200);
        std::copy(count.begin(), count.end(), tampered.begin() + kCountOffset);
        auto result = IdentityProof::FromBytes(tampered);
        REQUIRE(result.UnwrapErr().type == IdentityProofErrorType::TruncatedKeys);
    }

    SECTION("Handle flag must be 0 or 1") {
        auto tampered = bytes;
        tampered[flag_offset] = 2;
        auto result = IdentityProof::FromBytes(tampered);
        REQUIRE(result.UnwrapErr().type == IdentityProofErrorType::InvalidHandleFlag);
    }

    SECTION("Truncated handle length") {
        std::vector<uint8_t> truncated(bytes.begin(), bytes.begin() + flag_offset + 2);
        auto result = IdentityProof::FromBytes(truncated);
        REQUIRE(result.UnwrapErr().type == IdentityProofErrorType::TruncatedHandleLen);
    }

    SECTION("Handle longer than the input") {
        auto tampered = bytes;
        tampered[flag_offset + 1] = 0xFF;
        auto result = IdentityProof::FromBytes(tampered);
        REQUIRE(result.UnwrapErr().type == IdentityProofErrorType::TruncatedHandle);
    }

    SECTION("Invalid UTF-8 in the handle") {
        auto tampered = bytes;
        tampered[flag_offset + 3] = 0xFF;
        auto result = IdentityProof::FromBytes(tampered);
        REQUIRE(result.UnwrapErr().type == IdentityProofErrorType::InvalidUtf8Handle);
        REQUIRE(result.UnwrapErr().ToAuthError().type == AuthErrorType::InvalidIdentityProof);
    }

    SECTION("Truncated trailer") {
        std::vector<uint8_t> truncated(bytes.begin(), bytes.end() - 1);
        auto result = IdentityProof::FromBytes(truncated);
        REQUIRE(result.UnwrapErr().type == IdentityProofErrorType::TruncatedTrailer);
    }

    SECTION("Trailing bytes") {
        auto longer = bytes;
        longer.push_back(0);
        auto result = IdentityProof::FromBytes(longer);
        REQUIRE(result.UnwrapErr().type == IdentityProofErrorType::TrailingBytes);
    }
}

TEST_CASE("IdentityProof - UTF-8 validation", "[identity][utf8]") {
    const auto check = [](std::initializer_list<uint8_t> bytes) {
        const std::vector<uint8_t> data(bytes);
        return IsValidUtf8(data);
    };

    REQUIRE(check({}));
    REQUIRE(check({'a', 'b'}));
    REQUIRE(check({0xC3, 0xA9}));
    REQUIRE(check({0xF0, 0x9F, 0xA6, 0x80}));
    REQUIRE_FALSE(check({0xC0, 0xAF}));
    REQUIRE_FALSE(check({0xED, 0xA0, 0x80}));
    REQUIRE_FALSE(check({0xF4, 0x90, 0x80, 0x80}));
    REQUIRE_FALSE(check({0xE2, 0x82}));
    REQUIRE_FALSE(check({0x80}));
}
