#pragma once

#include "retrochat/core/constants.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace retrochat::vault::configuration {

enum class StorageBackendKind {
    Memory,
    Sqlite
};

/**
 * @brief Tunables for one vault instance.
 *
 * The protocol version and the PBKDF2 import bounds are part of the backup
 * format; they are carried here so callers can read them but the factories
 * never change them.
 *
 * **Usage Example**:
 * ```cpp
 * auto config = VaultConfig::Default().WithSqlite("/var/lib/retrochat/vault.db");
 * ```
 */
class VaultConfig {
public:
    [[nodiscard]] static VaultConfig Default() {
        return VaultConfig(kBackupPbkdf2Iterations, kDefaultMessagePageSize, kDefaultDecryptBatchSize);
    }

    /**
     * @brief Slower exports and smaller decrypt batches.
     *
     * Backups written with this config take 5x the default PBKDF2 work.
     */
    [[nodiscard]] static VaultConfig Hardened() {
        return VaultConfig(1'000'000, kDefaultMessagePageSize, 10);
    }

    [[nodiscard]] VaultConfig WithSqlite(std::string path) const {
        VaultConfig copy = *this;
        copy.backend_kind_ = StorageBackendKind::Sqlite;
        copy.sqlite_path_ = std::move(path);
        return copy;
    }

    [[nodiscard]] VaultConfig WithBackupIterations(const uint32_t iterations) const {
        VaultConfig copy = *this;
        copy.backup_iterations_ = iterations;
        return copy;
    }

    [[nodiscard]] uint32_t GetProtocolVersion() const noexcept { return kProtocolVersion; }
    [[nodiscard]] uint32_t GetBackupIterations() const noexcept { return backup_iterations_; }
    [[nodiscard]] uint32_t GetMinImportIterations() const noexcept { return kBackupMinIterations; }
    [[nodiscard]] uint32_t GetMaxImportIterations() const noexcept { return kBackupMaxIterations; }
    [[nodiscard]] size_t GetDefaultPageSize() const noexcept { return default_page_size_; }
    [[nodiscard]] size_t GetDecryptBatchSize() const noexcept { return decrypt_batch_size_; }
    [[nodiscard]] StorageBackendKind GetBackendKind() const noexcept { return backend_kind_; }
    [[nodiscard]] const std::string& GetSqlitePath() const noexcept { return sqlite_path_; }

    /** Export iterations must lie inside the range an import accepts. */
    [[nodiscard]] bool IsValid() const noexcept {
        return backup_iterations_ >= kBackupMinIterations
            && backup_iterations_ <= kBackupMaxIterations
            && default_page_size_ > 0
            && decrypt_batch_size_ > 0
            && (backend_kind_ == StorageBackendKind::Memory || !sqlite_path_.empty());
    }

private:
    VaultConfig(const uint32_t backup_iterations, const size_t default_page_size, const size_t decrypt_batch_size)
        : backup_iterations_(backup_iterations)
        , default_page_size_(default_page_size)
        , decrypt_batch_size_(decrypt_batch_size) {}

    uint32_t backup_iterations_;
    size_t default_page_size_;
    size_t decrypt_batch_size_;
    StorageBackendKind backend_kind_ = StorageBackendKind::Memory;
    std::string sqlite_path_;
};

}
