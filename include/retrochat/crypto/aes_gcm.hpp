#pragma once
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace retrochat::vault::crypto {

/** AEAD output as persisted: 12-byte IV plus ciphertext with the 16-byte tag appended. */
struct EncryptedBlob {
    std::vector<uint8_t> iv;
    std::vector<uint8_t> ciphertext;
};

/**
 * AES-256-GCM authenticated encryption.
 *
 * Encrypt/Decrypt are the raw primitive and require a caller-supplied nonce.
 * Seal draws a fresh random 96-bit IV per call; with random IVs a single key
 * must stay well below 2^32 encryptions, which holds for per-vault and
 * per-conversation keys.
 *
 * Open reports every failure (bad IV length, truncated input, tag mismatch)
 * as the same "AEAD authentication failed" integrity error so callers cannot
 * distinguish causes.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<EncryptedBlob, VaultFailure>
    Seal(
        std::span<const uint8_t> key,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure>
    Open(
        std::span<const uint8_t> key,
        const EncryptedBlob& blob,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
