#pragma once
#include "retrochat/crypto/sodium_secure_memory_handle.hpp"
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include <cstdint>
#include <span>
#include <type_traits>
namespace retrochat::vault::crypto {

/** A 256-bit AES key held in guarded memory. Move-only. */
class SymmetricKey {
public:
    static Result<SymmetricKey, VaultFailure> FromBytes(std::span<const uint8_t> bytes);
    static Result<SymmetricKey, VaultFailure> Generate();

    SymmetricKey(SymmetricKey&&) noexcept = default;
    SymmetricKey& operator=(SymmetricKey&&) noexcept = default;
    SymmetricKey(const SymmetricKey&) = delete;
    SymmetricKey& operator=(const SymmetricKey&) = delete;

    /**
     * Runs `func` with a view of the key bytes. `func` must return
     * Result<R, VaultFailure> and must not retain the span.
     */
    template<typename F>
    auto WithKey(F&& func) const -> std::invoke_result_t<F, std::span<const uint8_t>> {
        using R = std::invoke_result_t<F, std::span<const uint8_t>>;
        auto access = handle_.WithReadAccess(std::forward<F>(func));
        if (access.IsErr()) {
            return R::Err(VaultFailure::FromSodiumFailure(access.UnwrapErr()));
        }
        return std::move(access).Unwrap();
    }

    [[nodiscard]] Result<std::vector<uint8_t>, VaultFailure> CopyBytes() const;

    [[nodiscard]] bool IsValid() const noexcept { return !handle_.IsInvalid(); }
private:
    explicit SymmetricKey(SecureMemoryHandle handle) noexcept
        : handle_(std::move(handle)) {}
    SecureMemoryHandle handle_;
};

}
