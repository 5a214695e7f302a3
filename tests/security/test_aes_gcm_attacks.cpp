#include <catch2/catch_test_macros.hpp>
#include "retrochat/crypto/aes_gcm.hpp"
#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/hex.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <string_view>
#include <thread>
#include <vector>

using namespace retrochat::vault;
using namespace retrochat::vault::crypto;

namespace {
std::vector<uint8_t> RandomKey() {
    return SodiumInterop::GetRandomBytes(kAesKeyBytes);
}
}

TEST_CASE("AES-GCM Security - Nonce reuse", "[security][aes-gcm][critical]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = RandomKey();
    const auto nonce = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);
    const auto aad = hex::AsBytes(kMessagesAad);

    SECTION("Keystream leaks under a reused nonce but forgeries still fail") {
        const std::vector<uint8_t> zeros(64, 0x00);
        const std::vector<uint8_t> ones(64, 0xFF);
        auto first = AesGcm::Encrypt(key, nonce, zeros, aad);
        auto second = AesGcm::Encrypt(key, nonce, ones, aad);
        REQUIRE(first.IsOk());
        REQUIRE(second.IsOk());
        const auto& ct1 = first.Unwrap();
        const auto& ct2 = second.Unwrap();
        REQUIRE(ct1.size() == zeros.size() + kAesGcmTagBytes);

        bool xor_is_plaintext_xor = true;
        for (size_t i = 0; i < zeros.size(); ++i) {
            xor_is_plaintext_xor &= static_cast<uint8_t>(ct1[i] ^ ct2[i]) == 0xFF;
        }
        REQUIRE(xor_is_plaintext_xor);

        auto forged = ct1;
        forged[0] ^= 0x01;
        REQUIRE(AesGcm::Decrypt(key, nonce, forged, aad).IsErr());
    }
    SECTION("Seal never repeats an IV") {
        std::set<std::vector<uint8_t>> ivs;
        const std::vector<uint8_t> plaintext(32, 0x42);
        for (int i = 0; i < 500; ++i) {
            auto sealed = AesGcm::Seal(key, plaintext, aad);
            REQUIRE(sealed.IsOk());
            REQUIRE(sealed.Unwrap().iv.size() == kAesGcmNonceBytes);
            ivs.insert(sealed.Unwrap().iv);
        }
        REQUIRE(ivs.size() == 500);
    }
}

TEST_CASE("AES-GCM Security - Tag forgery", "[security][aes-gcm][critical]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = RandomKey();
    const auto plaintext = SodiumInterop::GetRandomBytes(256);
    auto sealed = AesGcm::Seal(key, plaintext, hex::AsBytes(kContactsAad));
    REQUIRE(sealed.IsOk());
    const EncryptedBlob blob = sealed.Unwrap();
    const size_t body_size = blob.ciphertext.size() - kAesGcmTagBytes;

    SECTION("Zero tag") {
        EncryptedBlob forged = blob;
        std::fill(forged.ciphertext.begin() + static_cast<std::ptrdiff_t>(body_size), forged.ciphertext.end(), 0);
        auto opened = AesGcm::Open(key, forged, hex::AsBytes(kContactsAad));
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().IsIntegrity(IntegrityKind::AeadAuthentication));
    }
    SECTION("Random tags") {
        for (int attempt = 0; attempt < 200; ++attempt) {
            EncryptedBlob forged = blob;
            const auto tag = SodiumInterop::GetRandomBytes(kAesGcmTagBytes);
            std::copy(tag.begin(), tag.end(), forged.ciphertext.begin() + static_cast<std::ptrdiff_t>(body_size));
            REQUIRE(AesGcm::Open(key, forged, hex::AsBytes(kContactsAad)).IsErr());
        }
    }
    SECTION("Every single-bit flip in body and tag") {
        for (size_t byte = 0; byte < blob.ciphertext.size(); byte += 7) {
            for (int bit = 0; bit < 8; bit += 3) {
                EncryptedBlob forged = blob;
                forged.ciphertext[byte] ^= static_cast<uint8_t>(1U << bit);
                REQUIRE(AesGcm::Open(key, forged, hex::AsBytes(kContactsAad)).IsErr());
            }
        }
    }
    SECTION("Flipped IV") {
        EncryptedBlob forged = blob;
        forged.iv[kAesGcmNonceBytes - 1] ^= 0x80;
        REQUIRE(AesGcm::Open(key, forged, hex::AsBytes(kContactsAad)).IsErr());
    }
    SECTION("Tag stripped") {
        EncryptedBlob forged = blob;
        forged.ciphertext.resize(body_size);
        REQUIRE(AesGcm::Open(key, forged, hex::AsBytes(kContactsAad)).IsErr());
    }
}

TEST_CASE("AES-GCM Security - Store labels separate domains", "[security][aes-gcm][critical]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = RandomKey();
    const std::vector<uint8_t> plaintext = {'{', '}'};
    const std::vector<std::string_view> labels = {
        kDskAad, kIdentityAad, kMessagesAad, kContactsAad, kConversationsAad, kSettingsAad, kBackupAad
    };
    for (const auto sealed_under : labels) {
        auto sealed = AesGcm::Seal(key, plaintext, hex::AsBytes(sealed_under));
        REQUIRE(sealed.IsOk());
        for (const auto opened_under : labels) {
            INFO("sealed under " << sealed_under << ", opened under " << opened_under);
            auto opened = AesGcm::Open(key, sealed.Unwrap(), hex::AsBytes(opened_under));
            REQUIRE(opened.IsOk() == (sealed_under == opened_under));
        }
        REQUIRE(AesGcm::Open(key, sealed.Unwrap()).IsErr());
    }
}

TEST_CASE("AES-GCM Security - Concurrent sealing", "[security][aes-gcm][concurrency]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = RandomKey();
    constexpr int kThreads = 8;
    constexpr int kPerThread = 100;
    std::mutex mutex;
    std::set<std::vector<uint8_t>> ivs;
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            const std::vector<uint8_t> plaintext(48, static_cast<uint8_t>(t));
            for (int i = 0; i < kPerThread; ++i) {
                auto sealed = AesGcm::Seal(key, plaintext, hex::AsBytes(kMessagesAad));
                if (sealed.IsErr()) {
                    ++failures;
                    continue;
                }
                auto opened = AesGcm::Open(key, sealed.Unwrap(), hex::AsBytes(kMessagesAad));
                if (opened.IsErr() || opened.Unwrap() != plaintext) {
                    ++failures;
                }
                std::lock_guard lock(mutex);
                ivs.insert(sealed.Unwrap().iv);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    REQUIRE(failures.load() == 0);
    REQUIRE(ivs.size() == static_cast<size_t>(kThreads * kPerThread));
}

TEST_CASE("AES-GCM Security - Large payload", "[security][aes-gcm][boundary]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = RandomKey();
    const auto plaintext = SodiumInterop::GetRandomBytes(4 * 1024 * 1024);
    auto sealed = AesGcm::Seal(key, plaintext, hex::AsBytes(kBackupAad));
    REQUIRE(sealed.IsOk());
    REQUIRE(sealed.Unwrap().ciphertext.size() == plaintext.size() + kAesGcmTagBytes);

    auto opened = AesGcm::Open(key, sealed.Unwrap(), hex::AsBytes(kBackupAad));
    REQUIRE(opened.IsOk());
    REQUIRE(opened.Unwrap() == plaintext);

    EncryptedBlob tampered = sealed.Unwrap();
    tampered.ciphertext[plaintext.size() / 2] ^= 0x01;
    REQUIRE(AesGcm::Open(key, tampered, hex::AsBytes(kBackupAad)).IsErr());
}
