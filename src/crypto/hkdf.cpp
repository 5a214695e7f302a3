#include "retrochat/crypto/hkdf.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/format.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <memory>

namespace retrochat::vault::crypto {

namespace {
    struct KdfCtxDeleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            EVP_KDF_CTX_free(ctx);
        }
    };
    using KdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, KdfCtxDeleter>;
}

Result<Unit, VaultFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::KeyDerivation("length",
                compat::format("HKDF output size must be in [1, {}], got {}", MAX_OUTPUT_LEN, output.size())));
    }
    if (ikm.empty()) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::KeyDerivation("ikm", "HKDF input key material cannot be empty"));
    }

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, OpenSSLConstants::ALGORITHM_HKDF.data(), nullptr);
    if (!kdf) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::KeyDerivation("hkdf", "Failed to fetch HKDF algorithm"));
    }
    KdfCtxPtr kctx(EVP_KDF_CTX_new(kdf));
    EVP_KDF_free(kdf);
    if (!kctx) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::KeyDerivation("hkdf", "Failed to create HKDF context"));
    }

    OSSL_PARAM params[5];
    int param_idx = 0;
    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        "digest", const_cast<char*>(OpenSSLConstants::ALGORITHM_SHA256.data()), 0);
    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        "key", const_cast<uint8_t*>(ikm.data()), ikm.size());
    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            "salt", const_cast<uint8_t*>(salt.data()), salt.size());
    }
    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            "info", const_cast<uint8_t*>(info.data()), info.size());
    }
    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSLConstants::SUCCESS) {
        return Result<Unit, VaultFailure>::Err(
            VaultFailure::KeyDerivation("hkdf", "HKDF key derivation failed"));
    }
    return Result<Unit, VaultFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, VaultFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(ikm, output, salt, info);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(output));
}

}
