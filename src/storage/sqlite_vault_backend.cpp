#include "retrochat/storage/sqlite_vault_backend.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/format.hpp"
#include "retrochat/debug/vault_logger.hpp"
#include <sqlite3.h>

namespace retrochat::vault::storage {
    namespace {
        struct StatementDeleter {
            void operator()(sqlite3_stmt* statement) const noexcept {
                sqlite3_finalize(statement);
            }
        };
        using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

        constexpr std::string_view kRowColumns = "id, iv, ciphertext, created_at, updated_at";

        VaultFailure SqliteError(sqlite3* db, const std::string_view operation) {
            return VaultFailure::Storage(compat::format("SQLite {} failed: {}", operation, sqlite3_errmsg(db)));
        }

        Result<Statement, VaultFailure> Prepare(sqlite3* db, const std::string& sql) {
            sqlite3_stmt* raw = nullptr;
            if (sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.size()), &raw, nullptr) != SQLITE_OK) {
                sqlite3_finalize(raw);
                return Result<Statement, VaultFailure>::Err(SqliteError(db, "prepare"));
            }
            return Result<Statement, VaultFailure>::Ok(Statement(raw));
        }

        bool BindText(sqlite3_stmt* statement, const int index, const std::string_view text) {
            return sqlite3_bind_text(statement, index, text.data(), static_cast<int>(text.size()),
                                     SQLITE_TRANSIENT) == SQLITE_OK;
        }

        bool BindBlob(sqlite3_stmt* statement, const int index, const std::vector<uint8_t>& bytes) {
            if (bytes.empty()) {
                return sqlite3_bind_zeroblob(statement, index, 0) == SQLITE_OK;
            }
            return sqlite3_bind_blob(statement, index, bytes.data(), static_cast<int>(bytes.size()),
                                     SQLITE_TRANSIENT) == SQLITE_OK;
        }

        std::string ColumnText(sqlite3_stmt* statement, const int column) {
            const auto* text = sqlite3_column_text(statement, column);
            const int size = sqlite3_column_bytes(statement, column);
            if (text == nullptr || size <= 0) {
                return {};
            }
            return {reinterpret_cast<const char*>(text), static_cast<size_t>(size)};
        }

        std::vector<uint8_t> ColumnBlob(sqlite3_stmt* statement, const int column) {
            const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(statement, column));
            const int size = sqlite3_column_bytes(statement, column);
            if (data == nullptr || size <= 0) {
                return {};
            }
            return {data, data + size};
        }

        VaultRow ReadRow(sqlite3_stmt* statement) {
            VaultRow row;
            row.id = ColumnText(statement, 0);
            row.blob.iv = ColumnBlob(statement, 1);
            row.blob.ciphertext = ColumnBlob(statement, 2);
            row.created_at = ColumnText(statement, 3);
            row.updated_at = ColumnText(statement, 4);
            return row;
        }

        Result<std::optional<VaultRow>, VaultFailure> SelectRow(
            sqlite3* db, const StoreName store, const std::string_view id) {
            using RowResult = Result<std::optional<VaultRow>, VaultFailure>;
            auto prepared = Prepare(db, compat::format(
                "SELECT {} FROM \"{}\" WHERE id = ?1", kRowColumns, ToString(store)));
            if (prepared.IsErr()) {
                return RowResult::Err(std::move(prepared).UnwrapErr());
            }
            const Statement statement = std::move(prepared).Unwrap();
            if (!BindText(statement.get(), 1, id)) {
                return RowResult::Err(SqliteError(db, "bind"));
            }
            const int rc = sqlite3_step(statement.get());
            if (rc == SQLITE_DONE) {
                return RowResult::Ok(std::nullopt);
            }
            if (rc != SQLITE_ROW) {
                return RowResult::Err(SqliteError(db, "select"));
            }
            return RowResult::Ok(ReadRow(statement.get()));
        }

        Result<Unit, VaultFailure> UpsertRow(sqlite3* db, const StoreName store, const VaultRow& row) {
            auto prepared = Prepare(db, compat::format(
                "INSERT OR REPLACE INTO \"{}\" ({}) VALUES (?1, ?2, ?3, ?4, ?5)", ToString(store), kRowColumns));
            if (prepared.IsErr()) {
                return Result<Unit, VaultFailure>::Err(std::move(prepared).UnwrapErr());
            }
            const Statement statement = std::move(prepared).Unwrap();
            if (!BindText(statement.get(), 1, row.id)
                || !BindBlob(statement.get(), 2, row.blob.iv)
                || !BindBlob(statement.get(), 3, row.blob.ciphertext)
                || !BindText(statement.get(), 4, row.created_at)
                || !BindText(statement.get(), 5, row.updated_at)) {
                return Result<Unit, VaultFailure>::Err(SqliteError(db, "bind"));
            }
            if (sqlite3_step(statement.get()) != SQLITE_DONE) {
                return Result<Unit, VaultFailure>::Err(SqliteError(db, "insert"));
            }
            return Result<Unit, VaultFailure>::Ok(Unit{});
        }

        Result<Unit, VaultFailure> DeleteRow(sqlite3* db, const StoreName store, const std::string_view id) {
            auto prepared = Prepare(db, compat::format("DELETE FROM \"{}\" WHERE id = ?1", ToString(store)));
            if (prepared.IsErr()) {
                return Result<Unit, VaultFailure>::Err(std::move(prepared).UnwrapErr());
            }
            const Statement statement = std::move(prepared).Unwrap();
            if (!BindText(statement.get(), 1, id)) {
                return Result<Unit, VaultFailure>::Err(SqliteError(db, "bind"));
            }
            if (sqlite3_step(statement.get()) != SQLITE_DONE) {
                return Result<Unit, VaultFailure>::Err(SqliteError(db, "delete"));
            }
            return Result<Unit, VaultFailure>::Ok(Unit{});
        }

        Result<Unit, VaultFailure> ForEachRow(
            sqlite3* db, const std::string& sql, const interfaces::RowVisitor& visitor) {
            auto prepared = Prepare(db, sql);
            if (prepared.IsErr()) {
                return Result<Unit, VaultFailure>::Err(std::move(prepared).UnwrapErr());
            }
            const Statement statement = std::move(prepared).Unwrap();
            while (true) {
                const int rc = sqlite3_step(statement.get());
                if (rc == SQLITE_DONE) {
                    break;
                }
                if (rc != SQLITE_ROW) {
                    return Result<Unit, VaultFailure>::Err(SqliteError(db, "scan"));
                }
                if (!visitor(ReadRow(statement.get()))) {
                    break;
                }
            }
            return Result<Unit, VaultFailure>::Ok(Unit{});
        }

        class SqliteStoreTransaction final : public interfaces::IStoreTransaction {
        public:
            SqliteStoreTransaction(sqlite3* db, const StoreName store)
                : db_(db), store_(store) {}

            Result<std::optional<VaultRow>, VaultFailure> Get(const std::string_view id) override {
                return SelectRow(db_, store_, id);
            }

            Result<Unit, VaultFailure> Put(const VaultRow& row) override {
                return UpsertRow(db_, store_, row);
            }

            Result<Unit, VaultFailure> Delete(const std::string_view id) override {
                return DeleteRow(db_, store_, id);
            }
        private:
            sqlite3* db_;
            StoreName store_;
        };
    }

    SqliteVaultBackend::SqliteVaultBackend(sqlite3* db) noexcept
        : db_(db) {
    }

    SqliteVaultBackend::~SqliteVaultBackend() {
        if (db_ != nullptr) {
            sqlite3_close_v2(db_);
            db_ = nullptr;
        }
    }

    Result<std::unique_ptr<SqliteVaultBackend>, VaultFailure> SqliteVaultBackend::Open(const std::string& path) {
        using OpenResult = Result<std::unique_ptr<SqliteVaultBackend>, VaultFailure>;
        sqlite3* db = nullptr;
        const int rc = sqlite3_open_v2(path.c_str(), &db,
                                       SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                       nullptr);
        if (rc != SQLITE_OK) {
            std::string message = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
            sqlite3_close_v2(db);
            return OpenResult::Err(VaultFailure::Storage(compat::format("SQLite open failed: {}", message)));
        }
        std::unique_ptr<SqliteVaultBackend> backend(new SqliteVaultBackend(db));
        RETROCHAT_TRY(backend->InitializeSchema());
        RC_LOG_ID(debug::Area::Storage, "OPEN", "sqlite", path);
        return OpenResult::Ok(std::move(backend));
    }

    Result<Unit, VaultFailure> SqliteVaultBackend::Exec(const std::string_view sql) {
        char* error = nullptr;
        const std::string statement(sql);
        if (sqlite3_exec(db_, statement.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
            std::string message = error != nullptr ? error : "unknown error";
            sqlite3_free(error);
            return Result<Unit, VaultFailure>::Err(
                VaultFailure::Storage(compat::format("SQLite exec failed: {}", message)));
        }
        return Result<Unit, VaultFailure>::Ok(Unit{});
    }

    void SqliteVaultBackend::RollbackQuietly() {
        auto rollback = Exec("ROLLBACK");
        if (rollback.IsErr()) {
            RC_LOG_MSG(debug::Area::Storage, "ROLLBACK", rollback.UnwrapErr().message);
        }
    }

    Result<Unit, VaultFailure> SqliteVaultBackend::InitializeSchema() {
        std::lock_guard lock(mutex_);
        RETROCHAT_TRY(Exec("PRAGMA journal_mode=WAL"));
        for (const auto store : kAllStores) {
            RETROCHAT_TRY(Exec(compat::format(
                "CREATE TABLE IF NOT EXISTS \"{0}\" ("
                "id TEXT PRIMARY KEY NOT NULL, "
                "iv BLOB NOT NULL, "
                "ciphertext BLOB NOT NULL, "
                "created_at TEXT NOT NULL, "
                "updated_at TEXT NOT NULL)",
                ToString(store))));
            RETROCHAT_TRY(Exec(compat::format(
                "CREATE INDEX IF NOT EXISTS \"{0}_by_updated\" ON \"{0}\" (updated_at)", ToString(store))));
        }
        return Exec(compat::format("PRAGMA user_version = {}", kVaultDbVersion));
    }

    Result<std::optional<VaultRow>, VaultFailure> SqliteVaultBackend::Get(
        const StoreName store, const std::string_view id) {
        std::lock_guard lock(mutex_);
        return SelectRow(db_, store, id);
    }

    Result<Unit, VaultFailure> SqliteVaultBackend::Put(const StoreName store, const VaultRow& row) {
        std::lock_guard lock(mutex_);
        return UpsertRow(db_, store, row);
    }

    Result<Unit, VaultFailure> SqliteVaultBackend::Delete(const StoreName store, const std::string_view id) {
        std::lock_guard lock(mutex_);
        return DeleteRow(db_, store, id);
    }

    Result<std::vector<VaultRow>, VaultFailure> SqliteVaultBackend::GetAll(const StoreName store) {
        std::lock_guard lock(mutex_);
        std::vector<VaultRow> rows;
        auto scan = ForEachRow(db_,
            compat::format("SELECT {} FROM \"{}\" ORDER BY id", kRowColumns, ToString(store)),
            [&rows](const VaultRow& row) {
                rows.push_back(row);
                return true;
            });
        if (scan.IsErr()) {
            return Result<std::vector<VaultRow>, VaultFailure>::Err(std::move(scan).UnwrapErr());
        }
        return Result<std::vector<VaultRow>, VaultFailure>::Ok(std::move(rows));
    }

    Result<Unit, VaultFailure> SqliteVaultBackend::ScanByUpdatedDesc(
        const StoreName store, const interfaces::RowVisitor& visitor) {
        std::lock_guard lock(mutex_);
        return ForEachRow(db_,
            compat::format("SELECT {} FROM \"{}\" ORDER BY updated_at DESC, id DESC", kRowColumns, ToString(store)),
            visitor);
    }

    Result<Unit, VaultFailure> SqliteVaultBackend::RunInTransaction(
        const StoreName store, const interfaces::TransactionBody& body) {
        std::lock_guard lock(mutex_);
        RETROCHAT_TRY(Exec("BEGIN IMMEDIATE"));
        SqliteStoreTransaction transaction(db_, store);
        auto outcome = body(transaction);
        if (outcome.IsErr()) {
            RollbackQuietly();
            return outcome;
        }
        auto commit = Exec("COMMIT");
        if (commit.IsErr()) {
            RollbackQuietly();
        }
        return commit;
    }

    Result<Unit, VaultFailure> SqliteVaultBackend::ReplaceAll(
        const std::map<StoreName, std::vector<VaultRow>>& rows) {
        std::lock_guard lock(mutex_);
        RETROCHAT_TRY(Exec("BEGIN IMMEDIATE"));
        auto write_all = [this, &rows]() -> Result<Unit, VaultFailure> {
            for (const auto store : kAllStores) {
                RETROCHAT_TRY(Exec(compat::format("DELETE FROM \"{}\"", ToString(store))));
            }
            for (const auto& [store, store_rows] : rows) {
                for (const auto& row : store_rows) {
                    RETROCHAT_TRY(UpsertRow(db_, store, row));
                }
            }
            return Exec("COMMIT");
        };
        auto outcome = write_all();
        if (outcome.IsErr()) {
            RollbackQuietly();
        }
        return outcome;
    }

    Result<Unit, VaultFailure> SqliteVaultBackend::Clear() {
        std::lock_guard lock(mutex_);
        RETROCHAT_TRY(Exec("BEGIN IMMEDIATE"));
        for (const auto store : kAllStores) {
            auto cleared = Exec(compat::format("DELETE FROM \"{}\"", ToString(store)));
            if (cleared.IsErr()) {
                RollbackQuietly();
                return cleared;
            }
        }
        return Exec("COMMIT");
    }
}
