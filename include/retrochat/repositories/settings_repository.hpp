#pragma once
#include "retrochat/storage/vault_store.hpp"
#include "retrochat/crypto/symmetric_key.hpp"
#include "retrochat/core/cancellation.hpp"
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
namespace retrochat::vault::repositories {

/** Encrypted key/value preferences. The setting key is the row id. */
class SettingsRepository {
public:
    explicit SettingsRepository(std::shared_ptr<storage::VaultStore> store);

    Result<Unit, VaultFailure> Set(
        const crypto::SymmetricKey& dsk,
        std::string_view key,
        std::string_view value,
        const CancellationToken& token = {});

    Result<std::optional<std::string>, VaultFailure> Get(
        const crypto::SymmetricKey& dsk,
        std::string_view key,
        const CancellationToken& token = {});

    Result<Unit, VaultFailure> Remove(std::string_view key);

private:
    std::shared_ptr<storage::VaultStore> store_;
};

}
