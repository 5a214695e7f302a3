#pragma once
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
namespace retrochat::vault::crypto {

class X25519 {
public:
    /**
     * Keys must be exactly 32 bytes and not all zero. The failure names
     * `field` so callers can report which input was rejected.
     */
    [[nodiscard]] static Result<Unit, VaultFailure> ValidateKey(
        std::span<const uint8_t> key,
        std::string_view field);

    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure> DerivePublicKey(
        std::span<const uint8_t> private_key);

    /** Raw scalar multiplication; a low-order peer key yields an error rather than a zero secret. */
    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure> ComputeSharedSecret(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> peer_public_key);

    [[nodiscard]] static bool IsAllZero(std::span<const uint8_t> bytes) noexcept;
private:
    X25519() = delete;
};

}
