#include "retrochat/core/cancellation.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/format.hpp"

namespace retrochat::vault {
    Result<Unit, VaultFailure> CancellationToken::Check(const std::string_view operation) const {
        if (IsCancelled()) {
            return Result<Unit, VaultFailure>::Err(
                VaultFailure::Cancelled(compat::format("{} ({})", ErrorMessages::OPERATION_CANCELLED, operation)));
        }
        return Result<Unit, VaultFailure>::Ok(unit);
    }

    CancellationSource::CancellationSource()
        : state_(std::make_shared<std::atomic<bool>>(false)) {}

    CancellationToken CancellationSource::Token() const {
        return CancellationToken(state_);
    }

    void CancellationSource::Cancel() noexcept {
        state_->store(true, std::memory_order_release);
    }

    bool CancellationSource::IsCancelled() const noexcept {
        return state_->load(std::memory_order_acquire);
    }

    void CancellationSource::Reset() {
        Cancel();
        state_ = std::make_shared<std::atomic<bool>>(false);
    }
}
