#pragma once
#include "retrochat/interfaces/i_vault_backend.hpp"
#include "retrochat/crypto/symmetric_key.hpp"
#include "retrochat/core/cancellation.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>
namespace retrochat::vault::storage {

/** A row together with its opened plaintext. */
struct OpenedRow {
    VaultRow row;
    std::vector<uint8_t> plaintext;
};

/**
 * @brief AEAD layer between typed repositories and a raw backend.
 *
 * Every Put seals the plaintext under a fresh 12-byte IV; every Get opens
 * it and reports an authentication failure as an Integrity error, never as
 * plaintext. Updating an existing id keeps its created_at.
 */
class VaultStore {
public:
    explicit VaultStore(std::shared_ptr<interfaces::IVaultBackend> backend);

    Result<Unit, VaultFailure> Put(
        StoreName store,
        std::string_view id,
        const crypto::SymmetricKey& key,
        std::span<const uint8_t> plaintext,
        std::string_view aad,
        const CancellationToken& token = {});

    /** Ok(nullopt) when no row has `id`. */
    Result<std::optional<std::vector<uint8_t>>, VaultFailure> Get(
        StoreName store,
        std::string_view id,
        const crypto::SymmetricKey& key,
        std::string_view aad,
        const CancellationToken& token = {});

    Result<Unit, VaultFailure> Delete(StoreName store, std::string_view id);

    /**
     * Opens every row of `store`, newest `updated_at` first. Rows that fail
     * authentication are skipped, not reported.
     */
    Result<std::vector<OpenedRow>, VaultFailure> OpenAll(
        StoreName store,
        const crypto::SymmetricKey& key,
        std::string_view aad,
        const CancellationToken& token = {});

    [[nodiscard]] static Result<VaultRow, VaultFailure> SealRow(
        std::string id,
        const crypto::SymmetricKey& key,
        std::span<const uint8_t> plaintext,
        std::string_view aad,
        std::string created_at,
        std::string updated_at);

    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure> OpenRow(
        const VaultRow& row,
        const crypto::SymmetricKey& key,
        std::string_view aad);

    [[nodiscard]] interfaces::IVaultBackend& Backend() const noexcept { return *backend_; }
private:
    std::shared_ptr<interfaces::IVaultBackend> backend_;
};

}
