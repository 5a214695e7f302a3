#include "retrochat/protocol/message_repository.hpp"
#include "retrochat/protocol/message_id.hpp"
#include "retrochat/validation/envelope_validator.hpp"
#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/core/format.hpp"
#include "retrochat/core/hex.hpp"
#include "retrochat/core/proto_json.hpp"
#include "retrochat/core/timestamp.hpp"
#include "retrochat/debug/vault_logger.hpp"
#include <algorithm>

namespace retrochat::vault::protocol {
    using storage::StoreName;
    using storage::VaultRow;
    using EnvelopeList = std::vector<proto::vault::MessageEnvelope>;

    namespace {
        VaultFailure DecryptionFailed() {
            return VaultFailure::Integrity(
                IntegrityKind::DecryptionFailed, std::string(ErrorMessages::MESSAGE_DECRYPT_FAILED));
        }
    }

    MessageRepository::MessageRepository(std::shared_ptr<storage::VaultStore> store)
        : store_(std::move(store)) {
    }

    Result<std::string, VaultFailure> MessageRepository::Store(
        const crypto::SymmetricKey& conversation_key,
        const proto::vault::MessageEnvelope& envelope,
        const CancellationToken& token) {
        if (!validation::EnvelopeValidator::IsSupportedVersion(envelope.v())) {
            return Result<std::string, VaultFailure>::Err(VaultFailure::Validation(
                compat::format("Unsupported protocol version: {}", envelope.v())));
        }
        auto derived = DeriveMessageId(envelope);
        RETROCHAT_TRY(derived);
        std::string id = std::move(derived).Unwrap();

        proto::vault::StoredMessage record;
        *record.mutable_envelope() = envelope;
        auto json = proto_json::Serialize(record);
        RETROCHAT_TRY(json);
        std::string plaintext = std::move(json).Unwrap();

        const std::string stamp = envelope.ts().empty() ? timestamp::NowIso8601() : envelope.ts();
        RETROCHAT_TRY(token.Check("store message"));
        auto sealed = storage::VaultStore::SealRow(
            id, conversation_key, hex::AsBytes(plaintext), kMessagesAad, stamp, stamp);
        RETROCHAT_TRY(crypto::SodiumInterop::Wipe(plaintext));
        RETROCHAT_TRY(sealed);
        const VaultRow row = std::move(sealed).Unwrap();

        RETROCHAT_TRY(token.Check("store message"));
        RETROCHAT_TRY(store_->Backend().RunInTransaction(StoreName::Messages,
            [&row](interfaces::IStoreTransaction& transaction) -> Result<Unit, VaultFailure> {
                auto existing = transaction.Get(row.id);
                RETROCHAT_TRY(existing);
                if (existing.Unwrap().has_value()) {
                    RC_LOG_ID(debug::Area::Messaging, "STORE_DUPLICATE", "id", row.id);
                    return Result<Unit, VaultFailure>::Ok(unit);
                }
                return transaction.Put(row);
            }));
        return Result<std::string, VaultFailure>::Ok(std::move(id));
    }

    Result<proto::vault::MessageEnvelope, VaultFailure> MessageRepository::OpenEnvelope(
        const VaultRow& row,
        const crypto::SymmetricKey& conversation_key) const {
        using EnvelopeResult = Result<proto::vault::MessageEnvelope, VaultFailure>;
        auto opened = storage::VaultStore::OpenRow(row, conversation_key, kMessagesAad);
        if (opened.IsErr()) {
            return EnvelopeResult::Err(DecryptionFailed());
        }
        std::vector<uint8_t> bytes = std::move(opened).Unwrap();
        std::string json(bytes.begin(), bytes.end());
        RETROCHAT_TRY(crypto::SodiumInterop::Wipe(bytes));

        proto::vault::StoredMessage record;
        auto parsed = proto_json::Parse(json, record);
        RETROCHAT_TRY(crypto::SodiumInterop::Wipe(json));
        if (parsed.IsErr() || !record.has_envelope()) {
            return EnvelopeResult::Err(DecryptionFailed());
        }
        return EnvelopeResult::Ok(std::move(*record.mutable_envelope()));
    }

    Result<std::optional<proto::vault::MessageEnvelope>, VaultFailure> MessageRepository::Get(
        const std::string_view id,
        const crypto::SymmetricKey& conversation_key,
        const CancellationToken& token) {
        using GetResult = Result<std::optional<proto::vault::MessageEnvelope>, VaultFailure>;
        RETROCHAT_TRY(token.Check("get message"));
        auto fetched = store_->Backend().Get(StoreName::Messages, id);
        RETROCHAT_TRY(fetched);
        const auto& row = fetched.Unwrap();
        if (!row.has_value()) {
            return GetResult::Ok(std::nullopt);
        }
        RETROCHAT_TRY(token.Check("get message"));
        auto envelope = OpenEnvelope(*row, conversation_key);
        RETROCHAT_TRY(envelope);
        proto::vault::MessageEnvelope opened = std::move(envelope).Unwrap();

        auto recomputed = DeriveMessageId(opened);
        RETROCHAT_TRY(recomputed);
        if (recomputed.Unwrap() != id) {
            return GetResult::Err(VaultFailure::Integrity(
                IntegrityKind::TamperDetected, std::string(ErrorMessages::MESSAGE_TAMPERED)));
        }
        return GetResult::Ok(std::move(opened));
    }

    Result<EnvelopeList, VaultFailure> MessageRepository::List(
        const crypto::SymmetricKey& conversation_key,
        const MessagePage& page,
        const CancellationToken& token) {
        RETROCHAT_TRY(token.Check("list messages"));
        EnvelopeList messages;
        if (page.limit == 0) {
            return Result<EnvelopeList, VaultFailure>::Ok(std::move(messages));
        }

        bool cancelled = false;
        RETROCHAT_TRY(store_->Backend().ScanByUpdatedDesc(StoreName::Messages,
            [&](const VaultRow& row) {
                if (token.IsCancelled()) {
                    cancelled = true;
                    return false;
                }
                if (page.before.has_value() && row.updated_at >= *page.before) {
                    return true;
                }
                if (page.after.has_value() && row.updated_at <= *page.after) {
                    return false;
                }
                auto envelope = OpenEnvelope(row, conversation_key);
                if (envelope.IsErr()) {
                    debug::LogRowSkipped(ToString(StoreName::Messages), row.id);
                    return true;
                }
                messages.push_back(std::move(envelope).Unwrap());
                return messages.size() < page.limit;
            }));
        if (cancelled) {
            RETROCHAT_TRY(token.Check("list messages"));
        }
        std::stable_sort(messages.begin(), messages.end(),
            [](const proto::vault::MessageEnvelope& a, const proto::vault::MessageEnvelope& b) {
                return a.ts() > b.ts();
            });
        return Result<EnvelopeList, VaultFailure>::Ok(std::move(messages));
    }

    Result<Unit, VaultFailure> MessageRepository::Delete(const std::string_view id) {
        if (id.empty()) {
            return Result<Unit, VaultFailure>::Err(VaultFailure::Validation("Invalid message ID"));
        }
        return store_->Backend().Delete(StoreName::Messages, id);
    }
}
