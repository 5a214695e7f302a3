#include "retrochat/crypto/digest.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/hex.hpp"
#include <openssl/evp.h>

namespace retrochat::vault::crypto {
    Result<std::vector<uint8_t>, VaultFailure> Digest::Sha256(const std::span<const uint8_t> data) {
        std::vector<uint8_t> digest(kSha256Bytes);
        unsigned int digest_len = 0;
        if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len,
                       EVP_sha256(), nullptr) != OpenSSLConstants::SUCCESS ||
            digest_len != kSha256Bytes) {
            return Result<std::vector<uint8_t>, VaultFailure>::Err(
                VaultFailure::Generic("SHA-256 digest failed"));
        }
        return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(digest));
    }

    Result<std::string, VaultFailure> Digest::Sha256Hex(const std::string_view text) {
        return Sha256(hex::AsBytes(text)).Map([](std::vector<uint8_t> digest) {
            return hex::Encode(digest);
        });
    }

    Result<std::vector<uint8_t>, VaultFailure> Digest::Pbkdf2HmacSha256(
        const std::string_view passphrase,
        const std::span<const uint8_t> salt,
        const uint32_t iterations,
        const size_t output_size) {
        if (iterations == 0 || output_size == 0) {
            return Result<std::vector<uint8_t>, VaultFailure>::Err(
                VaultFailure::KeyDerivation("iterations", "PBKDF2 requires non-zero iterations and output size"));
        }
        std::vector<uint8_t> output(output_size);
        if (PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()),
                              salt.data(), static_cast<int>(salt.size()),
                              static_cast<int>(iterations), EVP_sha256(),
                              static_cast<int>(output.size()), output.data()) != OpenSSLConstants::SUCCESS) {
            return Result<std::vector<uint8_t>, VaultFailure>::Err(
                VaultFailure::KeyDerivation("passphrase", "PBKDF2 key derivation failed"));
        }
        return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(output));
    }
}
