#pragma once
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include "retrochat/storage/store_name.hpp"
#include "retrochat/storage/vault_row.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string_view>
#include <vector>
namespace retrochat::vault::interfaces {

using storage::StoreName;
using storage::VaultRow;

/** Read-write view of one store inside RunInTransaction. */
class IStoreTransaction {
public:
    virtual ~IStoreTransaction() = default;
    [[nodiscard]] virtual Result<std::optional<VaultRow>, VaultFailure> Get(std::string_view id) = 0;
    [[nodiscard]] virtual Result<Unit, VaultFailure> Put(const VaultRow& row) = 0;
    [[nodiscard]] virtual Result<Unit, VaultFailure> Delete(std::string_view id) = 0;
};

using TransactionBody = std::function<Result<Unit, VaultFailure>(IStoreTransaction&)>;

/** Return false to stop the scan. */
using RowVisitor = std::function<bool(const VaultRow&)>;

/**
 * @brief Persistence for the five vault stores.
 *
 * Backends move opaque rows; they never see keys or plaintext. All methods
 * are safe to call from several threads. Visitors and transaction bodies
 * must not call back into the same backend.
 */
class IVaultBackend {
public:
    virtual ~IVaultBackend() = default;

    [[nodiscard]] virtual Result<std::optional<VaultRow>, VaultFailure> Get(
        StoreName store, std::string_view id) = 0;

    /** Insert or replace by id. */
    [[nodiscard]] virtual Result<Unit, VaultFailure> Put(StoreName store, const VaultRow& row) = 0;

    [[nodiscard]] virtual Result<Unit, VaultFailure> Delete(StoreName store, std::string_view id) = 0;

    /** Every row, ordered by id. */
    [[nodiscard]] virtual Result<std::vector<VaultRow>, VaultFailure> GetAll(StoreName store) = 0;

    /** Visits rows newest `updated_at` first; ties break on descending id. */
    [[nodiscard]] virtual Result<Unit, VaultFailure> ScanByUpdatedDesc(
        StoreName store, const RowVisitor& visitor) = 0;

    /**
     * Runs `body` with exclusive access to `store`. Writes made through the
     * transaction become visible only if `body` returns Ok.
     */
    [[nodiscard]] virtual Result<Unit, VaultFailure> RunInTransaction(
        StoreName store, const TransactionBody& body) = 0;

    /** Atomically empties every store and writes `rows`. */
    [[nodiscard]] virtual Result<Unit, VaultFailure> ReplaceAll(
        const std::map<StoreName, std::vector<VaultRow>>& rows) = 0;

    [[nodiscard]] virtual Result<Unit, VaultFailure> Clear() = 0;
};

}
