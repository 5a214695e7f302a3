#include "retrochat/crypto/symmetric_key.hpp"
#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/format.hpp"

namespace retrochat::vault::crypto {
    Result<SymmetricKey, VaultFailure> SymmetricKey::FromBytes(const std::span<const uint8_t> bytes) {
        if (bytes.size() != kAesKeyBytes) {
            return Result<SymmetricKey, VaultFailure>::Err(
                VaultFailure::Validation(
                    compat::format("Symmetric key must be {} bytes, got {}", kAesKeyBytes, bytes.size())));
        }
        auto handle_result = SecureMemoryHandle::FromBytes(bytes);
        if (handle_result.IsErr()) {
            return Result<SymmetricKey, VaultFailure>::Err(
                VaultFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        return Result<SymmetricKey, VaultFailure>::Ok(SymmetricKey(std::move(handle_result).Unwrap()));
    }

    Result<SymmetricKey, VaultFailure> SymmetricKey::Generate() {
        auto bytes = SodiumInterop::GetRandomBytes(kAesKeyBytes);
        auto key = FromBytes(bytes);
        RETROCHAT_TRY(SodiumInterop::Wipe(bytes));
        return key;
    }

    Result<std::vector<uint8_t>, VaultFailure> SymmetricKey::CopyBytes() const {
        auto read_result = handle_.ReadBytes(handle_.Size());
        if (read_result.IsErr()) {
            return Result<std::vector<uint8_t>, VaultFailure>::Err(
                VaultFailure::FromSodiumFailure(read_result.UnwrapErr()));
        }
        return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(read_result).Unwrap());
    }
}
