#include "retrochat/repositories/conversation_repository.hpp"
#include "retrochat/validation/address.hpp"
#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/hex.hpp"
#include "retrochat/core/proto_json.hpp"
#include "retrochat/debug/vault_logger.hpp"
#include "vault/records.pb.h"

namespace retrochat::vault::repositories {
    using storage::StoreName;
    using storage::VaultRow;
    using ConversationResult = Result<models::Conversation, VaultFailure>;
    using ConversationList = std::vector<models::Conversation>;

    namespace {
        ConversationResult DecodeConversation(const VaultRow& row, std::vector<uint8_t>& plaintext) {
            std::string json(plaintext.begin(), plaintext.end());
            RETROCHAT_TRY(crypto::SodiumInterop::Wipe(plaintext));
            proto::vault::ConversationRecord record;
            auto parsed = proto_json::Parse(json, record);
            RETROCHAT_TRY(crypto::SodiumInterop::Wipe(json));
            RETROCHAT_TRY(parsed);
            models::Conversation conversation;
            conversation.id = row.id;
            conversation.peer_address = record.peer_address();
            conversation.epoch = record.epoch();
            if (record.has_peer_public_key_hex()) {
                conversation.peer_public_key_hex = record.peer_public_key_hex();
            }
            if (record.has_title()) {
                conversation.title = record.title();
            }
            conversation.created_at = row.created_at;
            conversation.updated_at = row.updated_at;
            return ConversationResult::Ok(std::move(conversation));
        }
    }

    ConversationRepository::ConversationRepository(std::shared_ptr<storage::VaultStore> store)
        : store_(std::move(store)) {
    }

    ConversationResult ConversationRepository::Upsert(
        const crypto::SymmetricKey& dsk,
        const models::Conversation& conversation,
        const CancellationToken& token) {
        if (conversation.id.empty()) {
            return ConversationResult::Err(VaultFailure::InvalidField("id", "Invalid conversation ID"));
        }
        auto normalized = validation::NormalizeAddress(conversation.peer_address);
        RETROCHAT_TRY(normalized);

        proto::vault::ConversationRecord record;
        record.set_peer_address(normalized.Unwrap());
        record.set_epoch(conversation.epoch);
        if (conversation.peer_public_key_hex.has_value()) {
            record.set_peer_public_key_hex(*conversation.peer_public_key_hex);
        }
        if (conversation.title.has_value()) {
            record.set_title(*conversation.title);
        }
        auto json = proto_json::Serialize(record);
        RETROCHAT_TRY(json);
        std::string plaintext = std::move(json).Unwrap();
        auto stored = store_->Put(StoreName::Conversations, conversation.id, dsk, hex::AsBytes(plaintext),
            kConversationsAad, token);
        RETROCHAT_TRY(crypto::SodiumInterop::Wipe(plaintext));
        RETROCHAT_TRY(stored);

        auto fetched = store_->Backend().Get(StoreName::Conversations, conversation.id);
        RETROCHAT_TRY(fetched);
        models::Conversation saved = conversation;
        saved.peer_address = normalized.Unwrap();
        if (const auto& row = fetched.Unwrap(); row.has_value()) {
            saved.created_at = row->created_at;
            saved.updated_at = row->updated_at;
        }
        return ConversationResult::Ok(std::move(saved));
    }

    Result<std::optional<models::Conversation>, VaultFailure> ConversationRepository::Get(
        const crypto::SymmetricKey& dsk,
        const std::string_view id,
        const CancellationToken& token) {
        using GetResult = Result<std::optional<models::Conversation>, VaultFailure>;
        RETROCHAT_TRY(token.Check("get conversation"));
        auto fetched = store_->Backend().Get(StoreName::Conversations, id);
        RETROCHAT_TRY(fetched);
        const auto& row = fetched.Unwrap();
        if (!row.has_value()) {
            return GetResult::Ok(std::nullopt);
        }
        auto opened = storage::VaultStore::OpenRow(*row, dsk, kConversationsAad);
        RETROCHAT_TRY(opened);
        auto conversation = DecodeConversation(*row, opened.Unwrap());
        RETROCHAT_TRY(conversation);
        return GetResult::Ok(std::move(conversation).Unwrap());
    }

    Result<ConversationList, VaultFailure> ConversationRepository::List(
        const crypto::SymmetricKey& dsk,
        const CancellationToken& token) {
        auto opened = store_->OpenAll(StoreName::Conversations, dsk, kConversationsAad, token);
        RETROCHAT_TRY(opened);
        ConversationList conversations;
        for (auto& entry : opened.Unwrap()) {
            auto conversation = DecodeConversation(entry.row, entry.plaintext);
            if (conversation.IsErr()) {
                debug::LogRowSkipped(ToString(StoreName::Conversations), entry.row.id);
                continue;
            }
            conversations.push_back(std::move(conversation).Unwrap());
        }
        return Result<ConversationList, VaultFailure>::Ok(std::move(conversations));
    }

    Result<Unit, VaultFailure> ConversationRepository::Delete(const std::string_view id) {
        if (id.empty()) {
            return Result<Unit, VaultFailure>::Err(VaultFailure::Validation("Invalid conversation ID"));
        }
        return store_->Backend().Delete(StoreName::Conversations, id);
    }
}
