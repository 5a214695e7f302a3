#include "retrochat/models/identity_key_pair.hpp"
#include "retrochat/core/hex.hpp"
namespace retrochat::vault::models {
IdentityKeyPair::IdentityKeyPair(
    crypto::SecureMemoryHandle private_key_handle,
    std::vector<uint8_t> public_key)
    : private_key_handle_(std::move(private_key_handle))
    , public_key_(std::move(public_key)) {
}
std::string IdentityKeyPair::GetPublicKeyHex() const {
    return hex::Encode(public_key_);
}
Result<std::vector<uint8_t>, VaultFailure> IdentityKeyPair::CopyPrivateKey() const {
    auto read_result = private_key_handle_.ReadBytes(private_key_handle_.Size());
    if (read_result.IsErr()) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::FromSodiumFailure(read_result.UnwrapErr()));
    }
    return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(read_result).Unwrap());
}
}
