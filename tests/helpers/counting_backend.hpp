#pragma once
#include "retrochat/interfaces/i_vault_backend.hpp"
#include "retrochat/storage/memory_vault_backend.hpp"
#include <atomic>
#include <memory>

namespace retrochat::vault::test_helpers {

using interfaces::IVaultBackend;
using interfaces::RowVisitor;
using interfaces::TransactionBody;
using storage::StoreName;
using storage::VaultRow;

/**
 * Wraps a backend, counts calls and optionally fails writes.
 * Reads go straight through.
 */
class CountingBackend final : public IVaultBackend {
public:
    explicit CountingBackend(std::shared_ptr<IVaultBackend> inner = std::make_shared<storage::MemoryVaultBackend>())
        : inner_(std::move(inner)) {}

    Result<std::optional<VaultRow>, VaultFailure> Get(const StoreName store, const std::string_view id) override {
        ++reads;
        return inner_->Get(store, id);
    }

    Result<Unit, VaultFailure> Put(const StoreName store, const VaultRow& row) override {
        ++writes;
        if (fail_writes) {
            return Result<Unit, VaultFailure>::Err(VaultFailure::Storage("injected write failure"));
        }
        return inner_->Put(store, row);
    }

    Result<Unit, VaultFailure> Delete(const StoreName store, const std::string_view id) override {
        ++writes;
        return inner_->Delete(store, id);
    }

    Result<std::vector<VaultRow>, VaultFailure> GetAll(const StoreName store) override {
        ++reads;
        return inner_->GetAll(store);
    }

    Result<Unit, VaultFailure> ScanByUpdatedDesc(const StoreName store, const RowVisitor& visitor) override {
        ++reads;
        return inner_->ScanByUpdatedDesc(store, visitor);
    }

    Result<Unit, VaultFailure> RunInTransaction(const StoreName store, const TransactionBody& body) override {
        ++transactions;
        if (fail_writes) {
            return Result<Unit, VaultFailure>::Err(VaultFailure::Storage("injected write failure"));
        }
        return inner_->RunInTransaction(store, body);
    }

    Result<Unit, VaultFailure> ReplaceAll(const std::map<StoreName, std::vector<VaultRow>>& rows) override {
        ++replace_calls;
        if (fail_replace) {
            return Result<Unit, VaultFailure>::Err(VaultFailure::Storage("injected replace failure"));
        }
        return inner_->ReplaceAll(rows);
    }

    Result<Unit, VaultFailure> Clear() override {
        ++writes;
        return inner_->Clear();
    }

    [[nodiscard]] size_t TotalCalls() const noexcept {
        return reads.load() + writes.load() + transactions.load() + replace_calls.load();
    }

    [[nodiscard]] IVaultBackend& Inner() const noexcept { return *inner_; }

    std::atomic<size_t> reads{0};
    std::atomic<size_t> writes{0};
    std::atomic<size_t> transactions{0};
    std::atomic<size_t> replace_calls{0};
    std::atomic<bool> fail_writes{false};
    std::atomic<bool> fail_replace{false};

private:
    std::shared_ptr<IVaultBackend> inner_;
};

}
