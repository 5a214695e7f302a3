#pragma once
#include "retrochat/storage/vault_store.hpp"
#include "retrochat/crypto/symmetric_key.hpp"
#include "retrochat/core/cancellation.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include "vault/envelope.pb.h"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace retrochat::vault::protocol {

/** Window over the messages index. Bounds compare against envelope timestamps. */
struct MessagePage {
    size_t limit = kDefaultMessagePageSize;
    /** Exclusive upper bound. */
    std::optional<std::string> before;
    /** Exclusive lower bound. */
    std::optional<std::string> after;
};

/**
 * @brief Encrypted message log keyed by content address.
 *
 * Rows are sealed under the conversation key, so a listing with one key
 * silently passes over every other conversation's rows.
 */
class MessageRepository {
public:
    explicit MessageRepository(std::shared_ptr<storage::VaultStore> store);

    /**
     * @brief Persists `envelope` once.
     *
     * Returns the message id. A second call with the same nonce and
     * ciphertext writes nothing and returns the same id.
     */
    Result<std::string, VaultFailure> Store(
        const crypto::SymmetricKey& conversation_key,
        const proto::vault::MessageEnvelope& envelope,
        const CancellationToken& token = {});

    /**
     * Ok(nullopt) for an unknown id. A row that does not open under the key
     * is DecryptionFailed; a row whose content no longer hashes to its id is
     * TamperDetected.
     */
    Result<std::optional<proto::vault::MessageEnvelope>, VaultFailure> Get(
        std::string_view id,
        const crypto::SymmetricKey& conversation_key,
        const CancellationToken& token = {});

    /** Newest first. Rows that fail to decrypt are skipped. */
    Result<std::vector<proto::vault::MessageEnvelope>, VaultFailure> List(
        const crypto::SymmetricKey& conversation_key,
        const MessagePage& page = {},
        const CancellationToken& token = {});

    Result<Unit, VaultFailure> Delete(std::string_view id);

private:
    Result<proto::vault::MessageEnvelope, VaultFailure> OpenEnvelope(
        const storage::VaultRow& row,
        const crypto::SymmetricKey& conversation_key) const;

    std::shared_ptr<storage::VaultStore> store_;
};

}
