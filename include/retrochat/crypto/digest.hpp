#pragma once
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace retrochat::vault::crypto {

/** SHA-256 and PBKDF2-HMAC-SHA256 through OpenSSL EVP. */
class Digest {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure> Sha256(std::span<const uint8_t> data);

    /** SHA-256 over the UTF-8 bytes of `text`, lowercase hex. */
    [[nodiscard]] static Result<std::string, VaultFailure> Sha256Hex(std::string_view text);

    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure> Pbkdf2HmacSha256(
        std::string_view passphrase,
        std::span<const uint8_t> salt,
        uint32_t iterations,
        size_t output_size);
private:
    Digest() = delete;
};

}
