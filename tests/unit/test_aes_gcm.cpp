#include <catch2/catch_test_macros.hpp>
#include "retrochat/crypto/aes_gcm.hpp"
#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/hex.hpp"
#include <set>
using namespace retrochat::vault;
using namespace retrochat::vault::crypto;
namespace {
std::vector<uint8_t> Bytes(const std::string_view text) {
    return {text.begin(), text.end()};
}
}
TEST_CASE("AES-GCM - Basic encryption and decryption", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(kAesKeyBytes, 0xAA);
    const std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0xBB);
    SECTION("Round trip appends a 16-byte tag") {
        const auto plaintext = Bytes("hello");
        const auto aad = Bytes(kMessagesAad);
        auto encrypted = AesGcm::Encrypt(key, nonce, plaintext, aad);
        REQUIRE(encrypted.IsOk());
        REQUIRE(encrypted.Unwrap().size() == plaintext.size() + kAesGcmTagBytes);
        auto decrypted = AesGcm::Decrypt(key, nonce, encrypted.Unwrap(), aad);
        REQUIRE(decrypted.IsOk());
        REQUIRE(decrypted.Unwrap() == plaintext);
    }
    SECTION("Empty plaintext yields only the tag") {
        auto encrypted = AesGcm::Encrypt(key, nonce, {});
        REQUIRE(encrypted.IsOk());
        REQUIRE(encrypted.Unwrap().size() == kAesGcmTagBytes);
        auto decrypted = AesGcm::Decrypt(key, nonce, encrypted.Unwrap());
        REQUIRE(decrypted.IsOk());
        REQUIRE(decrypted.Unwrap().empty());
    }
    SECTION("NIST GCM test case 13: zero key, zero IV, empty input") {
        const std::vector<uint8_t> zero_key(kAesKeyBytes, 0x00);
        const std::vector<uint8_t> zero_iv(kAesGcmNonceBytes, 0x00);
        auto encrypted = AesGcm::Encrypt(zero_key, zero_iv, {});
        REQUIRE(encrypted.IsOk());
        REQUIRE(hex::Encode(encrypted.Unwrap()) == "530f8afbc74536b9a963b4f1c4cb738b");
    }
}
TEST_CASE("AES-GCM - Authentication failures", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(kAesKeyBytes, 0x66);
    const std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x77);
    const auto plaintext = Bytes("secret");
    const auto aad = Bytes(kContactsAad);
    const auto ciphertext = AesGcm::Encrypt(key, nonce, plaintext, aad).Unwrap();
    SECTION("Wrong key") {
        const std::vector<uint8_t> wrong_key(kAesKeyBytes, 0x99);
        auto result = AesGcm::Decrypt(wrong_key, nonce, ciphertext, aad);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().IsIntegrity(IntegrityKind::AeadAuthentication));
    }
    SECTION("AAD from another store") {
        auto result = AesGcm::Decrypt(key, nonce, ciphertext, Bytes(kSettingsAad));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().IsIntegrity(IntegrityKind::AeadAuthentication));
    }
    SECTION("Tampered ciphertext and tag") {
        auto body = ciphertext;
        body[0] ^= 0x01;
        REQUIRE(AesGcm::Decrypt(key, nonce, body, aad).IsErr());
        auto tag = ciphertext;
        tag.back() ^= 0x01;
        REQUIRE(AesGcm::Decrypt(key, nonce, tag, aad).IsErr());
    }
}
TEST_CASE("AES-GCM - Input validation", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(kAesKeyBytes, 0xAA);
    const std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0xBB);
    const auto plaintext = Bytes("test");
    SECTION("Invalid key size") {
        const std::vector<uint8_t> short_key(16, 0xCC);
        REQUIRE(AesGcm::Encrypt(short_key, nonce, plaintext).IsErr());
    }
    SECTION("Invalid nonce size") {
        const std::vector<uint8_t> short_nonce(8, 0xDD);
        REQUIRE(AesGcm::Encrypt(key, short_nonce, plaintext).IsErr());
    }
    SECTION("Ciphertext shorter than a tag") {
        const std::vector<uint8_t> too_short(10, 0xEE);
        REQUIRE(AesGcm::Decrypt(key, nonce, too_short).IsErr());
    }
}
TEST_CASE("AES-GCM - Seal and Open", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(kAesKeyBytes, 0x10);
    const auto plaintext = Bytes("{\"label\":\"Bob\"}");
    const auto aad = Bytes(kContactsAad);
    SECTION("Every seal draws a fresh 12-byte IV") {
        std::set<std::vector<uint8_t>> ivs;
        for (int i = 0; i < 64; ++i) {
            auto sealed = AesGcm::Seal(key, plaintext, aad);
            REQUIRE(sealed.IsOk());
            REQUIRE(sealed.Unwrap().iv.size() == kAesGcmNonceBytes);
            ivs.insert(sealed.Unwrap().iv);
        }
        REQUIRE(ivs.size() == 64);
    }
    SECTION("Open recovers the plaintext") {
        auto sealed = AesGcm::Seal(key, plaintext, aad).Unwrap();
        auto opened = AesGcm::Open(key, sealed, aad);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == plaintext);
    }
    SECTION("Every Open failure looks the same") {
        auto sealed = AesGcm::Seal(key, plaintext, aad).Unwrap();
        EncryptedBlob bad_iv = sealed;
        bad_iv.iv.resize(8);
        EncryptedBlob truncated = sealed;
        truncated.ciphertext.resize(4);
        for (const auto& blob : {bad_iv, truncated}) {
            auto opened = AesGcm::Open(key, blob, aad);
            REQUIRE(opened.IsErr());
            REQUIRE(opened.UnwrapErr().IsIntegrity(IntegrityKind::AeadAuthentication));
            REQUIRE(opened.UnwrapErr().message == "AEAD authentication failed");
        }
    }
}
