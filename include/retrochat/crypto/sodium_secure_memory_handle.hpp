#pragma once

#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>

namespace retrochat::vault::crypto {

/**
 * @brief Owner of one sodium_malloc allocation holding key material.
 *
 * The allocation is guard-paged, locked in RAM and zeroed by sodium_free.
 * A moved-from or default-constructed handle is empty and every accessor
 * on it fails with InvalidOperation.
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> data);

    SecureMemoryHandle() noexcept = default;
    ~SecureMemoryHandle();

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /** Copies `data` to the front of the buffer and zeroes the rest. */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /** `output` must hold at least Size() bytes. */
    Result<Unit, SodiumFailure> Read(std::span<uint8_t> output) const;

    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t count) const;

    /** Runs `func` over the guarded bytes without copying them out. */
    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using Output = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (IsInvalid()) {
            return Result<Output, SodiumFailure>::Err(Disposed());
        }
        return Result<Output, SodiumFailure>::Ok(std::forward<F>(func)(std::span<const uint8_t>(data_, size_)));
    }

    [[nodiscard]] bool IsInvalid() const noexcept { return data_ == nullptr; }

    [[nodiscard]] size_t Size() const noexcept { return size_; }

private:
    SecureMemoryHandle(uint8_t* data, size_t size) noexcept
        : data_(data), size_(size) {}

    static SodiumFailure Disposed();
    void Release() noexcept;

    uint8_t* data_ = nullptr;
    size_t size_ = 0;
};

}
