#pragma once
#include "retrochat/storage/vault_store.hpp"
#include "retrochat/models/contact.hpp"
#include "retrochat/crypto/symmetric_key.hpp"
#include "retrochat/core/cancellation.hpp"
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace retrochat::vault::repositories {

/**
 * @brief Address book sealed under the device storage key.
 *
 * One contact per address: the id is SHA-256 of the lowercase address, so
 * the same wallet written in any case maps to the same row.
 */
class ContactsRepository {
public:
    explicit ContactsRepository(std::shared_ptr<storage::VaultStore> store);

    [[nodiscard]] static Result<std::string, VaultFailure> ContactIdFor(std::string_view address);

    /** Conflict when a contact for the address already exists. */
    Result<models::Contact, VaultFailure> Create(
        const crypto::SymmetricKey& dsk,
        std::string_view address,
        std::string_view label,
        std::optional<std::string> note = std::nullopt,
        std::optional<std::string> public_key_hex = std::nullopt,
        const CancellationToken& token = {});

    /** Replaces label, note and key; the address and created_at are kept. */
    Result<models::Contact, VaultFailure> Update(
        const crypto::SymmetricKey& dsk,
        std::string_view id,
        std::string_view label,
        std::optional<std::string> note = std::nullopt,
        std::optional<std::string> public_key_hex = std::nullopt,
        const CancellationToken& token = {});

    Result<Unit, VaultFailure> Delete(std::string_view id);

    /** Newest first; undecryptable rows are skipped. */
    Result<std::vector<models::Contact>, VaultFailure> List(
        const crypto::SymmetricKey& dsk,
        const CancellationToken& token = {});

    /** Case-insensitive match on label or address. A blank query lists everything. */
    Result<std::vector<models::Contact>, VaultFailure> Search(
        const crypto::SymmetricKey& dsk,
        std::string_view query,
        const CancellationToken& token = {});

    /** nullopt for an invalid address, an unknown contact or a row that does not open. */
    Result<std::optional<models::Contact>, VaultFailure> GetByAddress(
        const crypto::SymmetricKey& dsk,
        std::string_view address,
        const CancellationToken& token = {});

private:
    std::shared_ptr<storage::VaultStore> store_;
};

}
