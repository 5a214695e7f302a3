#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/crypto/sodium_secure_memory_handle.hpp"
#include "retrochat/core/format.hpp"

#include <string>

namespace retrochat::vault::crypto {
    namespace {
        SodiumFailure NotInitialized() {
            return SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED));
        }
    }

    Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
        std::call_once(init_flag_, [] {
            initialized_.store(sodium_init() >= 0, std::memory_order_release);
        });
        if (!IsInitialized()) {
            return Result<Unit, SodiumFailure>::Err(
                SodiumFailure::InitializationFailed(std::string(ErrorMessages::SODIUM_INIT_FAILED)));
        }
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    bool SodiumInterop::IsInitialized() noexcept {
        return initialized_.load(std::memory_order_acquire);
    }

    Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(const std::span<uint8_t> buffer) {
        if (!IsInitialized()) {
            return Result<Unit, SodiumFailure>::Err(NotInitialized());
        }
        if (!buffer.empty()) {
            sodium_memzero(buffer.data(), buffer.size());
        }
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(const std::span<const uint8_t> buffer) {
        return SecureWipe(std::span<uint8_t>(const_cast<uint8_t*>(buffer.data()), buffer.size()));
    }

    Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::string& text) {
        auto wiped = SecureWipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(text.data()), text.size()));
        text.clear();
        return wiped;
    }

    Result<Unit, VaultFailure> SodiumInterop::Wipe(const std::span<uint8_t> buffer) {
        return SecureWipe(buffer).MapErr(VaultFailure::FromSodiumFailure);
    }

    Result<Unit, VaultFailure> SodiumInterop::Wipe(std::string& text) {
        return SecureWipe(text).MapErr(VaultFailure::FromSodiumFailure);
    }

    Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
        const std::span<const uint8_t> a,
        const std::span<const uint8_t> b) {
        if (!IsInitialized()) {
            return Result<bool, SodiumFailure>::Err(SodiumFailure::ComparisonFailed(compat::format(
                "{}: {}", ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED, ErrorMessages::NOT_INITIALIZED)));
        }
        if (a.size() != b.size()) {
            return Result<bool, SodiumFailure>::Ok(false);
        }
        return Result<bool, SodiumFailure>::Ok(a.empty() || sodium_memcmp(a.data(), b.data(), a.size()) == 0);
    }

    Result<X25519KeyPair, VaultFailure> SodiumInterop::GenerateX25519KeyPair(const std::string_view key_purpose) {
        using KeyPairResult = Result<X25519KeyPair, VaultFailure>;
        auto allocated = SecureMemoryHandle::Allocate(kX25519PrivateKeyBytes);
        if (allocated.IsErr()) {
            return KeyPairResult::Err(VaultFailure::FromSodiumFailure(allocated.UnwrapErr()));
        }
        SecureMemoryHandle private_key = std::move(allocated).Unwrap();

        std::vector<uint8_t> scalar = GetRandomBytes(kX25519PrivateKeyBytes);
        std::vector<uint8_t> public_key(kX25519PublicKeyBytes);
        const bool derived = crypto_scalarmult_base(public_key.data(), scalar.data()) == 0;
        auto written = private_key.Write(scalar);
        RETROCHAT_TRY(Wipe(scalar));

        if (written.IsErr()) {
            return KeyPairResult::Err(VaultFailure::FromSodiumFailure(written.UnwrapErr()));
        }
        if (!derived) {
            return KeyPairResult::Err(VaultFailure::KeyDerivation(
                "publicKey", compat::format("Failed to derive {} public key", key_purpose)));
        }
        return KeyPairResult::Ok(X25519KeyPair(std::move(private_key), std::move(public_key)));
    }

    std::vector<uint8_t> SodiumInterop::GetRandomBytes(const size_t size) {
        std::vector<uint8_t> bytes(size);
        if (!bytes.empty()) {
            randombytes_buf(bytes.data(), bytes.size());
        }
        return bytes;
    }

    void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
        return IsInitialized() ? sodium_malloc(size) : nullptr;
    }

    void SodiumInterop::FreeSecure(void* ptr) noexcept {
        if (ptr != nullptr) {
            sodium_free(ptr);
        }
    }
}
