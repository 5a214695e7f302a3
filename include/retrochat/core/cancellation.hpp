#pragma once
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include <atomic>
#include <memory>
#include <string_view>
namespace retrochat::vault {

/**
 * @brief Observer half of a cancellation pair.
 *
 * Operations call Check() before each crypto, storage and transport step.
 * A default-constructed token is never cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;
    [[nodiscard]] bool IsCancelled() const noexcept {
        return state_ && state_->load(std::memory_order_acquire);
    }
    [[nodiscard]] Result<Unit, VaultFailure> Check(std::string_view operation) const;
private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> state)
        : state_(std::move(state)) {}
    std::shared_ptr<std::atomic<bool>> state_;
};

class CancellationSource {
public:
    CancellationSource();
    [[nodiscard]] CancellationToken Token() const;
    void Cancel() noexcept;
    [[nodiscard]] bool IsCancelled() const noexcept;
    /** Cancels outstanding tokens and starts a fresh generation. */
    void Reset();
private:
    std::shared_ptr<std::atomic<bool>> state_;
};

}
