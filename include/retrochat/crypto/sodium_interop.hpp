#pragma once

#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include "retrochat/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace retrochat::vault::crypto {

class SecureMemoryHandle;

/** Guarded private key plus its public half. */
using X25519KeyPair = std::pair<SecureMemoryHandle, std::vector<uint8_t>>;

/**
 * @brief The vault's single entry point into libsodium.
 *
 * Randomness, zeroing of plaintext and key copies, constant-time
 * comparison, guarded allocation and X25519 key generation.
 */
class SodiumInterop {
public:
    /** Runs sodium_init once per process; every later call reports the first outcome. */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /** sodium_memzero over the buffer. Fails only before Initialize. */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    static Result<Unit, SodiumFailure> SecureWipe(std::span<const uint8_t> buffer);

    /** Zeroes the characters of a serialized secret and empties the string. */
    static Result<Unit, SodiumFailure> SecureWipe(std::string& text);

    /** SecureWipe with the failure reported as a VaultFailure, for RETROCHAT_TRY. */
    static Result<Unit, VaultFailure> Wipe(std::span<uint8_t> buffer);

    static Result<Unit, VaultFailure> Wipe(std::string& text);

    /** Buffers of different length compare unequal without a content read. */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    /** `key_purpose` only labels the error message. */
    static Result<X25519KeyPair, VaultFailure> GenerateX25519KeyPair(std::string_view key_purpose);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
};

}
