#include "retrochat/crypto/keccak.hpp"
#include "retrochat/core/constants.hpp"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <memory>

namespace retrochat::vault::crypto {
    namespace {
        constexpr size_t kRateBytes = 136;
        constexpr int kRounds = 24;

        constexpr uint64_t kRoundConstants[kRounds] = {
            0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL, 0x8000000080008000ULL,
            0x000000000000808bULL, 0x0000000080000001ULL, 0x8000000080008081ULL, 0x8000000000008009ULL,
            0x000000000000008aULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
            0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL, 0x8000000000008003ULL,
            0x8000000000008002ULL, 0x8000000000000080ULL, 0x000000000000800aULL, 0x800000008000000aULL,
            0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
        };
        constexpr int kRotations[24] = {
            1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14, 27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44
        };
        constexpr int kPiLanes[24] = {
            10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4, 15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1
        };

        constexpr uint64_t Rotl(const uint64_t value, const int shift) noexcept {
            return (value << shift) | (value >> (64 - shift));
        }

        void KeccakF1600(uint64_t (&state)[25]) noexcept {
            uint64_t bc[5];
            for (int round = 0; round < kRounds; ++round) {
                for (int i = 0; i < 5; ++i) {
                    bc[i] = state[i] ^ state[i + 5] ^ state[i + 10] ^ state[i + 15] ^ state[i + 20];
                }
                for (int i = 0; i < 5; ++i) {
                    const uint64_t t = bc[(i + 4) % 5] ^ Rotl(bc[(i + 1) % 5], 1);
                    for (int j = 0; j < 25; j += 5) {
                        state[j + i] ^= t;
                    }
                }
                uint64_t carry = state[1];
                for (int i = 0; i < 24; ++i) {
                    const int lane = kPiLanes[i];
                    const uint64_t next = state[lane];
                    state[lane] = Rotl(carry, kRotations[i]);
                    carry = next;
                }
                for (int j = 0; j < 25; j += 5) {
                    for (int i = 0; i < 5; ++i) {
                        bc[i] = state[j + i];
                    }
                    for (int i = 0; i < 5; ++i) {
                        state[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
                    }
                }
                state[0] ^= kRoundConstants[round];
            }
        }

        void XorByte(uint64_t (&state)[25], const size_t offset, const uint8_t value) noexcept {
            state[offset / 8] ^= static_cast<uint64_t>(value) << (8 * (offset % 8));
        }

        struct MdDeleter {
            void operator()(EVP_MD* md) const noexcept { EVP_MD_free(md); }
        };

        const EVP_MD* ProviderKeccak() noexcept {
            static const std::unique_ptr<EVP_MD, MdDeleter> md([] {
                EVP_MD* fetched = EVP_MD_fetch(nullptr, "KECCAK-256", nullptr);
                if (fetched == nullptr) {
                    ERR_clear_error();
                }
                return fetched;
            }());
            return md.get();
        }
    }

    std::array<uint8_t, 32> Keccak256(const std::span<const uint8_t> data) noexcept {
        if (const EVP_MD* md = ProviderKeccak()) {
            std::array<uint8_t, 32> digest{};
            unsigned int digest_len = 0;
            if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, md, nullptr)
                    == OpenSSLConstants::SUCCESS && digest_len == digest.size()) {
                return digest;
            }
            ERR_clear_error();
        }
        return Keccak256Sponge(data);
    }

    std::array<uint8_t, 32> Keccak256Sponge(const std::span<const uint8_t> data) noexcept {
        uint64_t state[25] = {};
        size_t offset = 0;
        for (const uint8_t byte : data) {
            XorByte(state, offset, byte);
            if (++offset == kRateBytes) {
                KeccakF1600(state);
                offset = 0;
            }
        }
        XorByte(state, offset, 0x01);
        XorByte(state, kRateBytes - 1, 0x80);
        KeccakF1600(state);

        std::array<uint8_t, 32> digest{};
        for (size_t i = 0; i < digest.size(); ++i) {
            digest[i] = static_cast<uint8_t>(state[i / 8] >> (8 * (i % 8)));
        }
        return digest;
    }
}
