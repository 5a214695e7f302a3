#include "retrochat/crypto/aes_gcm.hpp"
#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/format.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>
#include <string>
namespace retrochat::vault::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[OpenSSL::ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    Result<std::vector<uint8_t>, VaultFailure> CipherError(const char* step) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::Generic(compat::format("{}: {}", step, GetOpenSSLError())));
    }
    void Wipe(std::vector<uint8_t>& buffer) {
        [[maybe_unused]] auto wiped = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
    }
}
Result<std::vector<uint8_t>, VaultFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (key.size() != kAesKeyBytes) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::Validation(
                compat::format("AES-256-GCM key must be {} bytes, got {}", kAesKeyBytes, key.size())));
    }
    if (nonce.size() != kAesGcmNonceBytes) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::Validation(
                compat::format("AES-GCM nonce must be {} bytes, got {}", kAesGcmNonceBytes, nonce.size())));
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return CipherError("Failed to create cipher context");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return CipherError("Failed to initialize AES-256-GCM");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return CipherError("Failed to set nonce length");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return CipherError("Failed to set key and nonce");
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return CipherError("Failed to add associated data");
        }
    }
    std::vector<uint8_t> output(plaintext.size() + kAesGcmTagBytes);
    int ciphertext_len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                         plaintext.data(),
                         static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return CipherError("Encryption failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return CipherError("Encryption finalization failed");
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                           static_cast<int>(kAesGcmTagBytes),
                           output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return CipherError("Failed to get authentication tag");
    }
    output.resize(static_cast<size_t>(ciphertext_len) + kAesGcmTagBytes);
    return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, VaultFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (key.size() != kAesKeyBytes) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::Validation(
                compat::format("AES-256-GCM key must be {} bytes, got {}", kAesKeyBytes, key.size())));
    }
    if (nonce.size() != kAesGcmNonceBytes) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::Validation(
                compat::format("AES-GCM nonce must be {} bytes, got {}", kAesGcmNonceBytes, nonce.size())));
    }
    if (ciphertext_with_tag.size() < kAesGcmTagBytes) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(
            VaultFailure::Validation(
                compat::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                    ciphertext_with_tag.size(), kAesGcmTagBytes)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - kAesGcmTagBytes;
    std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::span<const uint8_t> tag = ciphertext_with_tag.subspan(ciphertext_len);
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return CipherError("Failed to create cipher context");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return CipherError("Failed to initialize AES-256-GCM");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return CipherError("Failed to set nonce length");
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return CipherError("Failed to set key and nonce");
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return CipherError("Failed to add associated data");
        }
    }
    std::vector<uint8_t> output(ciphertext_len + 1);
    int plaintext_len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                         ciphertext.data(),
                         static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return CipherError("Decryption failed");
    }
    std::vector<uint8_t> tag_copy(tag.begin(), tag.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                           static_cast<int>(kAesGcmTagBytes),
                           tag_copy.data()) != OpenSSL::SUCCESS) {
        Wipe(output);
        return CipherError("Failed to set authentication tag");
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, VaultFailure>::Err(VaultFailure::AeadAuthentication());
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(output));
}
Result<EncryptedBlob, VaultFailure>
AesGcm::Seal(
    std::span<const uint8_t> key,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    EncryptedBlob blob;
    blob.iv = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);
    auto encrypt_result = Encrypt(key, blob.iv, plaintext, associated_data);
    if (encrypt_result.IsErr()) {
        return Result<EncryptedBlob, VaultFailure>::Err(std::move(encrypt_result).UnwrapErr());
    }
    blob.ciphertext = std::move(encrypt_result).Unwrap();
    return Result<EncryptedBlob, VaultFailure>::Ok(std::move(blob));
}
Result<std::vector<uint8_t>, VaultFailure>
AesGcm::Open(
    std::span<const uint8_t> key,
    const EncryptedBlob& blob,
    std::span<const uint8_t> associated_data) {
    auto decrypt_result = Decrypt(key, blob.iv, blob.ciphertext, associated_data);
    if (decrypt_result.IsErr()) {
        return Result<std::vector<uint8_t>, VaultFailure>::Err(VaultFailure::AeadAuthentication());
    }
    return decrypt_result;
}
}
