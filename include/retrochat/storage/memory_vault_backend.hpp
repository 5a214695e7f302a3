#pragma once
#include "retrochat/interfaces/i_vault_backend.hpp"
#include <map>
#include <mutex>
#include <string>
namespace retrochat::vault::storage {

/** Process-local backend; contents die with the object. */
class MemoryVaultBackend final : public interfaces::IVaultBackend {
public:
    MemoryVaultBackend() = default;

    Result<std::optional<VaultRow>, VaultFailure> Get(StoreName store, std::string_view id) override;
    Result<Unit, VaultFailure> Put(StoreName store, const VaultRow& row) override;
    Result<Unit, VaultFailure> Delete(StoreName store, std::string_view id) override;
    Result<std::vector<VaultRow>, VaultFailure> GetAll(StoreName store) override;
    Result<Unit, VaultFailure> ScanByUpdatedDesc(StoreName store, const interfaces::RowVisitor& visitor) override;
    Result<Unit, VaultFailure> RunInTransaction(StoreName store, const interfaces::TransactionBody& body) override;
    Result<Unit, VaultFailure> ReplaceAll(const std::map<StoreName, std::vector<VaultRow>>& rows) override;
    Result<Unit, VaultFailure> Clear() override;

private:
    using Table = std::map<std::string, VaultRow, std::less<>>;

    mutable std::mutex mutex_;
    std::map<StoreName, Table> tables_;
};

}
