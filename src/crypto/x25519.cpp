#include "retrochat/crypto/x25519.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/format.hpp"
#include <sodium.h>
#include <string>

namespace retrochat::vault::crypto {
    bool X25519::IsAllZero(const std::span<const uint8_t> bytes) noexcept {
        uint8_t accumulator = 0;
        for (const auto byte : bytes) {
            accumulator |= byte;
        }
        return accumulator == 0;
    }

    Result<Unit, VaultFailure> X25519::ValidateKey(
        const std::span<const uint8_t> key,
        const std::string_view field) {
        if (key.size() != kX25519PublicKeyBytes) {
            return Result<Unit, VaultFailure>::Err(
                VaultFailure::KeyDerivation(std::string(field),
                    compat::format("Invalid {}: expected {} bytes, got {}", field, kX25519PublicKeyBytes, key.size())));
        }
        if (IsAllZero(key)) {
            return Result<Unit, VaultFailure>::Err(
                VaultFailure::KeyDerivation(std::string(field),
                    compat::format("Invalid {}: key is all zeros", field)));
        }
        return Result<Unit, VaultFailure>::Ok(unit);
    }

    Result<std::vector<uint8_t>, VaultFailure> X25519::DerivePublicKey(
        const std::span<const uint8_t> private_key) {
        if (auto check = ValidateKey(private_key, "privateKey"); check.IsErr()) {
            return Result<std::vector<uint8_t>, VaultFailure>::Err(std::move(check).UnwrapErr());
        }
        std::vector<uint8_t> public_key(kX25519PublicKeyBytes);
        if (crypto_scalarmult_base(public_key.data(), private_key.data()) != 0) {
            return Result<std::vector<uint8_t>, VaultFailure>::Err(
                VaultFailure::KeyDerivation("privateKey", "X25519 public key derivation failed"));
        }
        return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(public_key));
    }

    Result<std::vector<uint8_t>, VaultFailure> X25519::ComputeSharedSecret(
        const std::span<const uint8_t> private_key,
        const std::span<const uint8_t> peer_public_key) {
        if (auto check = ValidateKey(private_key, "myPrivateKey"); check.IsErr()) {
            return Result<std::vector<uint8_t>, VaultFailure>::Err(std::move(check).UnwrapErr());
        }
        if (auto check = ValidateKey(peer_public_key, "peerPublicKey"); check.IsErr()) {
            return Result<std::vector<uint8_t>, VaultFailure>::Err(std::move(check).UnwrapErr());
        }
        std::vector<uint8_t> shared(kX25519SharedSecretBytes);
        if (crypto_scalarmult(shared.data(), private_key.data(), peer_public_key.data()) != 0) {
            return Result<std::vector<uint8_t>, VaultFailure>::Err(
                VaultFailure::KeyDerivation("peerPublicKey", "X25519 key agreement failed"));
        }
        return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(shared));
    }
}
