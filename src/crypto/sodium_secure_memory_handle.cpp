#include "retrochat/crypto/sodium_secure_memory_handle.hpp"
#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/format.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace retrochat::vault::crypto {
    using HandleResult = Result<SecureMemoryHandle, SodiumFailure>;

    SodiumFailure SecureMemoryHandle::Disposed() {
        return SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED));
    }

    HandleResult SecureMemoryHandle::Allocate(const size_t size) {
        if (!SodiumInterop::IsInitialized()) {
            return HandleResult::Err(SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
        }
        if (size == 0) {
            return HandleResult::Err(SodiumFailure::AllocationFailed("Cannot allocate zero-sized secure memory"));
        }
        auto* data = static_cast<uint8_t*>(SodiumInterop::AllocateSecure(size));
        if (data == nullptr) {
            return HandleResult::Err(SodiumFailure::AllocationFailed(
                compat::format("{}{} bytes", ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY, size)));
        }
        return HandleResult::Ok(SecureMemoryHandle(data, size));
    }

    HandleResult SecureMemoryHandle::FromBytes(const std::span<const uint8_t> data) {
        auto allocated = Allocate(data.size());
        RETROCHAT_TRY(allocated);
        SecureMemoryHandle handle = std::move(allocated).Unwrap();
        RETROCHAT_TRY(handle.Write(data));
        return HandleResult::Ok(std::move(handle));
    }

    void SecureMemoryHandle::Release() noexcept {
        if (data_ != nullptr) {
            SodiumInterop::FreeSecure(data_);
        }
        data_ = nullptr;
        size_ = 0;
    }

    SecureMemoryHandle::~SecureMemoryHandle() {
        Release();
    }

    SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
        : data_(std::exchange(other.data_, nullptr))
        , size_(std::exchange(other.size_, 0)) {
    }

    SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
        if (this != &other) {
            Release();
            data_ = std::exchange(other.data_, nullptr);
            size_ = std::exchange(other.size_, 0);
        }
        return *this;
    }

    Result<Unit, SodiumFailure> SecureMemoryHandle::Write(const std::span<const uint8_t> data) {
        if (IsInvalid()) {
            return Result<Unit, SodiumFailure>::Err(Disposed());
        }
        if (data.size() > size_) {
            return Result<Unit, SodiumFailure>::Err(SodiumFailure::BufferTooSmall(compat::format(
                "{} (data: {}, buffer: {})", ErrorMessages::DATA_EXCEEDS_BUFFER, data.size(), size_)));
        }
        const auto tail = std::copy(data.begin(), data.end(), data_);
        std::fill(tail, data_ + size_, uint8_t{0});
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    Result<Unit, SodiumFailure> SecureMemoryHandle::Read(const std::span<uint8_t> output) const {
        if (IsInvalid()) {
            return Result<Unit, SodiumFailure>::Err(Disposed());
        }
        if (output.size() < size_) {
            return Result<Unit, SodiumFailure>::Err(SodiumFailure::BufferTooSmall(compat::format(
                "Output buffer too small (requested: {}, provided: {})", size_, output.size())));
        }
        std::copy_n(data_, size_, output.begin());
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::ReadBytes(const size_t count) const {
        using BytesResult = Result<std::vector<uint8_t>, SodiumFailure>;
        if (IsInvalid()) {
            return BytesResult::Err(Disposed());
        }
        if (count > size_) {
            return BytesResult::Err(SodiumFailure::BufferTooSmall("Requested size exceeds allocated size"));
        }
        return BytesResult::Ok(std::vector<uint8_t>(data_, data_ + count));
    }
}
