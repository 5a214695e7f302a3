#pragma once
#include "retrochat/crypto/sodium_secure_memory_handle.hpp"
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include <cstdint>
#include <string>
#include <vector>
namespace retrochat::vault::models {

/** Long-lived X25519 identity: private half in guarded memory, public half in the clear. */
class IdentityKeyPair {
public:
    IdentityKeyPair(
        crypto::SecureMemoryHandle private_key_handle,
        std::vector<uint8_t> public_key);
    IdentityKeyPair(IdentityKeyPair&&) noexcept = default;
    IdentityKeyPair& operator=(IdentityKeyPair&&) noexcept = default;
    IdentityKeyPair(const IdentityKeyPair&) = delete;
    IdentityKeyPair& operator=(const IdentityKeyPair&) = delete;
    [[nodiscard]] const crypto::SecureMemoryHandle& GetPrivateKeyHandle() const noexcept {
        return private_key_handle_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] std::string GetPublicKeyHex() const;
    [[nodiscard]] Result<std::vector<uint8_t>, VaultFailure> CopyPrivateKey() const;
private:
    crypto::SecureMemoryHandle private_key_handle_;
    std::vector<uint8_t> public_key_;
};
}
