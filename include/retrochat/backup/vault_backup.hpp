#pragma once
#include "retrochat/interfaces/i_vault_backend.hpp"
#include "retrochat/configuration/vault_config.hpp"
#include "retrochat/core/cancellation.hpp"
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include "vault/backup.pb.h"
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
namespace retrochat::vault::backup {

using PreparedRows = std::map<storage::StoreName, std::vector<storage::VaultRow>>;

/**
 * @brief Passphrase-protected export and restore of the whole vault.
 *
 * The backup carries rows exactly as stored: still sealed under the DSK or
 * a conversation key. The passphrase layer (PBKDF2-HMAC-SHA256 into
 * AES-256-GCM) wraps that payload once more, and a SHA-256 of the payload
 * detects a file that decrypts but was not produced by Export.
 *
 * Import validates the file, the payload and every row before the vault is
 * touched, then swaps all five stores in one backend transaction.
 */
class VaultBackup {
public:
    VaultBackup(std::shared_ptr<interfaces::IVaultBackend> backend, configuration::VaultConfig config);

    Result<proto::vault::EncryptedBackupFile, VaultFailure> Export(
        std::string_view passphrase,
        const CancellationToken& token = {});

    /** Export rendered as the JSON backup file. */
    Result<std::string, VaultFailure> ExportJson(
        std::string_view passphrase,
        const CancellationToken& token = {});

    /**
     * @brief Replaces the vault with the backup contents.
     *
     * A wrong passphrase or a modified ciphertext is an Integrity failure
     * and nothing is written. A storage failure while replacing is Critical.
     * Callers should lock the session afterwards: the restored keys store
     * carries the DSK of the exporting account.
     */
    Result<Unit, VaultFailure> Import(
        std::string_view passphrase,
        const proto::vault::EncryptedBackupFile& file,
        const CancellationToken& token = {});

    Result<Unit, VaultFailure> ImportJson(
        std::string_view passphrase,
        std::string_view file_json,
        const CancellationToken& token = {});

    /** Empties every store. */
    Result<Unit, VaultFailure> ResetVault();

    [[nodiscard]] static Result<Unit, VaultFailure> ValidateFile(
        const proto::vault::EncryptedBackupFile& file,
        const configuration::VaultConfig& config);

    /** Decodes every row of every store; the first malformed row fails the whole payload. */
    [[nodiscard]] static Result<PreparedRows, VaultFailure> PreparePayload(
        const proto::vault::BackupPayload& payload);

private:
    std::shared_ptr<interfaces::IVaultBackend> backend_;
    configuration::VaultConfig config_;
};

}
