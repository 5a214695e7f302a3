#pragma once

#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"

#include <span>
#include <vector>
#include <cstdint>

namespace retrochat::vault::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) through the OpenSSL EVP_KDF interface.
 */
class Hkdf {
public:
    /**
     * @brief Extract-then-expand into a caller-provided buffer.
     *
     * @param ikm Input key material (must be non-empty)
     * @param output Output buffer, at most MAX_OUTPUT_LEN bytes
     * @param salt Optional salt
     * @param info Optional context info
     */
    static Result<Unit, VaultFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, VaultFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

}
