#pragma once
#include "retrochat/interfaces/i_vault_backend.hpp"
#include "retrochat/configuration/vault_config.hpp"
#include <memory>
namespace retrochat::vault::storage {

class StorageBackendFactory {
public:
    [[nodiscard]] static Result<std::shared_ptr<interfaces::IVaultBackend>, VaultFailure> Create(
        const configuration::VaultConfig& config);
private:
    StorageBackendFactory() = delete;
};

}
