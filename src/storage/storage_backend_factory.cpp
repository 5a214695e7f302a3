#include "retrochat/storage/storage_backend_factory.hpp"
#include "retrochat/storage/memory_vault_backend.hpp"
#include "retrochat/storage/sqlite_vault_backend.hpp"

namespace retrochat::vault::storage {
    Result<std::shared_ptr<interfaces::IVaultBackend>, VaultFailure> StorageBackendFactory::Create(
        const configuration::VaultConfig& config) {
        using BackendResult = Result<std::shared_ptr<interfaces::IVaultBackend>, VaultFailure>;
        if (!config.IsValid()) {
            return BackendResult::Err(VaultFailure::Validation("Invalid vault configuration."));
        }
        switch (config.GetBackendKind()) {
            case configuration::StorageBackendKind::Memory:
                return BackendResult::Ok(std::make_shared<MemoryVaultBackend>());
            case configuration::StorageBackendKind::Sqlite: {
                auto opened = SqliteVaultBackend::Open(config.GetSqlitePath());
                if (opened.IsErr()) {
                    return BackendResult::Err(std::move(opened).UnwrapErr());
                }
                return BackendResult::Ok(std::shared_ptr<interfaces::IVaultBackend>(std::move(opened).Unwrap()));
            }
        }
        return BackendResult::Err(VaultFailure::InvalidState("Unknown storage backend."));
    }
}
