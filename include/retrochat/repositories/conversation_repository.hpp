#pragma once
#include "retrochat/storage/vault_store.hpp"
#include "retrochat/models/conversation.hpp"
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

/** Conversation metadata sealed under the DSK. */
class ConversationRepository {
public:
    explicit ConversationRepository(std::shared_ptr<storage::VaultStore> store);

    /**
     * Inserts or replaces the row keyed by `conversation.id`, which is the
     * conversation id from ConversationKeys. created_at survives updates.
     */
    Result<models::Conversation, VaultFailure> Upsert(
        const crypto::SymmetricKey& dsk,
        const models::Conversation& conversation,
        const CancellationToken& token = {});

    Result<std::optional<models::Conversation>, VaultFailure> Get(
        const crypto::SymmetricKey& dsk,
        std::string_view id,
        const CancellationToken& token = {});

    Result<std::vector<models::Conversation>, VaultFailure> List(
        const crypto::SymmetricKey& dsk,
        const CancellationToken& token = {});

    Result<Unit, VaultFailure> Delete(std::string_view id);

private:
    std::shared_ptr<storage::VaultStore> store_;
};

}
