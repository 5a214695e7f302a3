#include "retrochat/storage/memory_vault_backend.hpp"
#include <algorithm>

namespace retrochat::vault::storage {
    namespace {
        class MemoryStoreTransaction final : public interfaces::IStoreTransaction {
        public:
            using Table = std::map<std::string, VaultRow, std::less<>>;

            explicit MemoryStoreTransaction(const Table& table)
                : table_(table) {}

            Result<std::optional<VaultRow>, VaultFailure> Get(const std::string_view id) override {
                if (const auto pending = pending_.find(id); pending != pending_.end()) {
                    return Result<std::optional<VaultRow>, VaultFailure>::Ok(pending->second);
                }
                if (const auto it = table_.find(id); it != table_.end()) {
                    return Result<std::optional<VaultRow>, VaultFailure>::Ok(it->second);
                }
                return Result<std::optional<VaultRow>, VaultFailure>::Ok(std::nullopt);
            }

            Result<Unit, VaultFailure> Put(const VaultRow& row) override {
                pending_[row.id] = row;
                return Result<Unit, VaultFailure>::Ok(Unit{});
            }

            Result<Unit, VaultFailure> Delete(const std::string_view id) override {
                pending_[std::string(id)] = std::nullopt;
                return Result<Unit, VaultFailure>::Ok(Unit{});
            }

            [[nodiscard]] const std::map<std::string, std::optional<VaultRow>, std::less<>>& Pending() const noexcept {
                return pending_;
            }
        private:
            const Table& table_;
            std::map<std::string, std::optional<VaultRow>, std::less<>> pending_;
        };
    }

    Result<std::optional<VaultRow>, VaultFailure> MemoryVaultBackend::Get(
        const StoreName store, const std::string_view id) {
        std::lock_guard lock(mutex_);
        const auto& table = tables_[store];
        if (const auto it = table.find(id); it != table.end()) {
            return Result<std::optional<VaultRow>, VaultFailure>::Ok(it->second);
        }
        return Result<std::optional<VaultRow>, VaultFailure>::Ok(std::nullopt);
    }

    Result<Unit, VaultFailure> MemoryVaultBackend::Put(const StoreName store, const VaultRow& row) {
        std::lock_guard lock(mutex_);
        tables_[store][row.id] = row;
        return Result<Unit, VaultFailure>::Ok(Unit{});
    }

    Result<Unit, VaultFailure> MemoryVaultBackend::Delete(const StoreName store, const std::string_view id) {
        std::lock_guard lock(mutex_);
        auto& table = tables_[store];
        if (const auto it = table.find(id); it != table.end()) {
            table.erase(it);
        }
        return Result<Unit, VaultFailure>::Ok(Unit{});
    }

    Result<std::vector<VaultRow>, VaultFailure> MemoryVaultBackend::GetAll(const StoreName store) {
        std::lock_guard lock(mutex_);
        std::vector<VaultRow> rows;
        for (const auto& [id, row] : tables_[store]) {
            rows.push_back(row);
        }
        return Result<std::vector<VaultRow>, VaultFailure>::Ok(std::move(rows));
    }

    Result<Unit, VaultFailure> MemoryVaultBackend::ScanByUpdatedDesc(
        const StoreName store, const interfaces::RowVisitor& visitor) {
        std::vector<VaultRow> snapshot;
        {
            std::lock_guard lock(mutex_);
            for (const auto& [id, row] : tables_[store]) {
                snapshot.push_back(row);
            }
        }
        std::sort(snapshot.begin(), snapshot.end(), [](const VaultRow& a, const VaultRow& b) {
            if (a.updated_at != b.updated_at) {
                return a.updated_at > b.updated_at;
            }
            return a.id > b.id;
        });
        for (const auto& row : snapshot) {
            if (!visitor(row)) {
                break;
            }
        }
        return Result<Unit, VaultFailure>::Ok(Unit{});
    }

    Result<Unit, VaultFailure> MemoryVaultBackend::RunInTransaction(
        const StoreName store, const interfaces::TransactionBody& body) {
        std::lock_guard lock(mutex_);
        auto& table = tables_[store];
        MemoryStoreTransaction transaction(table);
        RETROCHAT_TRY(body(transaction));
        for (const auto& [id, row] : transaction.Pending()) {
            if (row.has_value()) {
                table[id] = *row;
            } else if (const auto it = table.find(id); it != table.end()) {
                table.erase(it);
            }
        }
        return Result<Unit, VaultFailure>::Ok(Unit{});
    }

    Result<Unit, VaultFailure> MemoryVaultBackend::ReplaceAll(
        const std::map<StoreName, std::vector<VaultRow>>& rows) {
        std::lock_guard lock(mutex_);
        std::map<StoreName, Table> staged;
        for (const auto& [store, store_rows] : rows) {
            auto& table = staged[store];
            for (const auto& row : store_rows) {
                table[row.id] = row;
            }
        }
        tables_ = std::move(staged);
        return Result<Unit, VaultFailure>::Ok(Unit{});
    }

    Result<Unit, VaultFailure> MemoryVaultBackend::Clear() {
        std::lock_guard lock(mutex_);
        tables_.clear();
        return Result<Unit, VaultFailure>::Ok(Unit{});
    }
}
