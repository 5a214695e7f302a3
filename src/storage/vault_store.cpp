#include "retrochat/storage/vault_store.hpp"
#include "retrochat/core/hex.hpp"
#include "retrochat/core/timestamp.hpp"
#include "retrochat/debug/vault_logger.hpp"

namespace retrochat::vault::storage {
    VaultStore::VaultStore(std::shared_ptr<interfaces::IVaultBackend> backend)
        : backend_(std::move(backend)) {
    }

    Result<VaultRow, VaultFailure> VaultStore::SealRow(
        std::string id,
        const crypto::SymmetricKey& key,
        const std::span<const uint8_t> plaintext,
        const std::string_view aad,
        std::string created_at,
        std::string updated_at) {
        auto sealed = key.WithKey([&](const std::span<const uint8_t> key_bytes) {
            return crypto::AesGcm::Seal(key_bytes, plaintext, hex::AsBytes(aad));
        });
        if (sealed.IsErr()) {
            return Result<VaultRow, VaultFailure>::Err(std::move(sealed).UnwrapErr());
        }
        return Result<VaultRow, VaultFailure>::Ok(VaultRow{
            std::move(id),
            std::move(sealed).Unwrap(),
            std::move(created_at),
            std::move(updated_at)
        });
    }

    Result<std::vector<uint8_t>, VaultFailure> VaultStore::OpenRow(
        const VaultRow& row,
        const crypto::SymmetricKey& key,
        const std::string_view aad) {
        return key.WithKey([&](const std::span<const uint8_t> key_bytes) {
            return crypto::AesGcm::Open(key_bytes, row.blob, hex::AsBytes(aad));
        });
    }

    Result<Unit, VaultFailure> VaultStore::Put(
        const StoreName store,
        const std::string_view id,
        const crypto::SymmetricKey& key,
        const std::span<const uint8_t> plaintext,
        const std::string_view aad,
        const CancellationToken& token) {
        RETROCHAT_TRY(token.Check("vault put"));
        const std::string now = timestamp::NowIso8601();
        auto sealed = SealRow(std::string(id), key, plaintext, aad, now, now);
        if (sealed.IsErr()) {
            return Result<Unit, VaultFailure>::Err(std::move(sealed).UnwrapErr());
        }
        VaultRow row = std::move(sealed).Unwrap();
        RETROCHAT_TRY(token.Check("vault put"));
        return backend_->RunInTransaction(store, [&row](interfaces::IStoreTransaction& transaction)
            -> Result<Unit, VaultFailure> {
            auto existing = transaction.Get(row.id);
            if (existing.IsErr()) {
                return Result<Unit, VaultFailure>::Err(std::move(existing).UnwrapErr());
            }
            if (const auto& previous = existing.Unwrap(); previous.has_value()) {
                row.created_at = previous->created_at;
            }
            return transaction.Put(row);
        });
    }

    Result<std::optional<std::vector<uint8_t>>, VaultFailure> VaultStore::Get(
        const StoreName store,
        const std::string_view id,
        const crypto::SymmetricKey& key,
        const std::string_view aad,
        const CancellationToken& token) {
        using GetResult = Result<std::optional<std::vector<uint8_t>>, VaultFailure>;
        RETROCHAT_TRY(token.Check("vault get"));
        auto fetched = backend_->Get(store, id);
        if (fetched.IsErr()) {
            return GetResult::Err(std::move(fetched).UnwrapErr());
        }
        const auto& row = fetched.Unwrap();
        if (!row.has_value()) {
            return GetResult::Ok(std::nullopt);
        }
        RETROCHAT_TRY(token.Check("vault get"));
        auto opened = OpenRow(*row, key, aad);
        if (opened.IsErr()) {
            RC_LOG_ID(debug::Area::Storage, "OPEN_FAILED", std::string(ToString(store)).c_str(), id);
            return GetResult::Err(std::move(opened).UnwrapErr());
        }
        return GetResult::Ok(std::move(opened).Unwrap());
    }

    Result<Unit, VaultFailure> VaultStore::Delete(const StoreName store, const std::string_view id) {
        return backend_->Delete(store, id);
    }

    Result<std::vector<OpenedRow>, VaultFailure> VaultStore::OpenAll(
        const StoreName store,
        const crypto::SymmetricKey& key,
        const std::string_view aad,
        const CancellationToken& token) {
        RETROCHAT_TRY(token.Check("vault list"));
        std::vector<OpenedRow> opened_rows;
        bool cancelled = false;
        RETROCHAT_TRY(backend_->ScanByUpdatedDesc(store, [&](const VaultRow& row) {
            if (token.IsCancelled()) {
                cancelled = true;
                return false;
            }
            auto opened = OpenRow(row, key, aad);
            if (opened.IsErr()) {
                debug::LogRowSkipped(ToString(store), row.id);
                return true;
            }
            opened_rows.push_back(OpenedRow{row, std::move(opened).Unwrap()});
            return true;
        }));
        if (cancelled) {
            RETROCHAT_TRY(token.Check("vault list"));
        }
        return Result<std::vector<OpenedRow>, VaultFailure>::Ok(std::move(opened_rows));
    }
}
