#pragma once
#include "retrochat/interfaces/i_vault_backend.hpp"
#include <memory>
#include <mutex>
#include <string>
struct sqlite3;
namespace retrochat::vault::storage {

/**
 * @brief File-backed vault on SQLite.
 *
 * One table per store (id TEXT PRIMARY KEY, iv BLOB, ciphertext BLOB,
 * created_at TEXT, updated_at TEXT) with an index on updated_at. The schema
 * version is kept in PRAGMA user_version.
 */
class SqliteVaultBackend final : public interfaces::IVaultBackend {
public:
    /** Opens or creates the database at `path`; ":memory:" gives a private in-memory database. */
    [[nodiscard]] static Result<std::unique_ptr<SqliteVaultBackend>, VaultFailure> Open(const std::string& path);

    ~SqliteVaultBackend() override;
    SqliteVaultBackend(const SqliteVaultBackend&) = delete;
    SqliteVaultBackend& operator=(const SqliteVaultBackend&) = delete;

    Result<std::optional<VaultRow>, VaultFailure> Get(StoreName store, std::string_view id) override;
    Result<Unit, VaultFailure> Put(StoreName store, const VaultRow& row) override;
    Result<Unit, VaultFailure> Delete(StoreName store, std::string_view id) override;
    Result<std::vector<VaultRow>, VaultFailure> GetAll(StoreName store) override;
    Result<Unit, VaultFailure> ScanByUpdatedDesc(StoreName store, const interfaces::RowVisitor& visitor) override;
    Result<Unit, VaultFailure> RunInTransaction(StoreName store, const interfaces::TransactionBody& body) override;
    Result<Unit, VaultFailure> ReplaceAll(const std::map<StoreName, std::vector<VaultRow>>& rows) override;
    Result<Unit, VaultFailure> Clear() override;

private:
    explicit SqliteVaultBackend(sqlite3* db) noexcept;

    Result<Unit, VaultFailure> InitializeSchema();
    Result<Unit, VaultFailure> Exec(std::string_view sql);
    void RollbackQuietly();

    std::mutex mutex_;
    sqlite3* db_;
};

}
