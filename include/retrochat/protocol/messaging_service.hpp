#pragma once
#include "retrochat/protocol/conversation_keys.hpp"
#include "retrochat/protocol/message_repository.hpp"
#include "retrochat/repositories/contacts_repository.hpp"
#include "retrochat/session/key_hierarchy_manager.hpp"
#include "retrochat/diagnostics/local_telemetry.hpp"
#include "retrochat/interfaces/i_transport.hpp"
#include "retrochat/core/cancellation.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
namespace retrochat::vault::protocol {

/**
 * @brief Binds a transport to the vault for one unlocked session.
 *
 * Incoming envelopes are validated, de-duplicated by message id, keyed to
 * the conversation with the remote party and stored. Only the most recent
 * `processed_capacity` ids are remembered; an older redelivery reaches the
 * repository, which stores each id once. Any failure on the
 * incoming path is recorded in telemetry and the envelope is dropped.
 *
 * Without an explicit key, a conversation key already derived for the
 * address pair is reused. Otherwise the peer key comes from the contact
 * record, then from the transport's key directory.
 */
class MessagingService : public std::enable_shared_from_this<MessagingService> {
public:
    [[nodiscard]] static std::shared_ptr<MessagingService> Create(
        std::shared_ptr<session::KeyHierarchyManager> session,
        std::shared_ptr<MessageRepository> messages,
        std::shared_ptr<repositories::ContactsRepository> contacts,
        std::shared_ptr<diagnostics::LocalTelemetry> telemetry,
        size_t processed_capacity = kProcessedIdCapacity);

    ~MessagingService();

    MessagingService(const MessagingService&) = delete;
    MessagingService& operator=(const MessagingService&) = delete;

    /** Connects `transport` with the session address unless it is already connected, then subscribes. */
    Result<Unit, VaultFailure> Start(std::shared_ptr<interfaces::ITransport> transport);

    /**
     * @brief Seals `text` for `peer_address`, sends it and stores it.
     *
     * `peer_public_key_hex` overrides the key lookup. Returns the message id.
     */
    Result<std::string, VaultFailure> Send(
        std::string_view peer_address,
        std::optional<std::string> peer_public_key_hex,
        std::string_view text);

    /**
     * Runs the incoming pipeline for one envelope. Ok(nullopt) when the
     * envelope was skipped as a duplicate or for lack of a peer key.
     */
    Result<std::optional<std::string>, VaultFailure> HandleIncoming(const proto::vault::MessageEnvelope& envelope);

    /** Unsubscribes, disconnects and forgets processed ids. */
    void Stop();

    [[nodiscard]] bool IsRunning() const;

    [[nodiscard]] size_t ProcessedCount() const;

    /** Conversation key for `peer_address`, resolving the peer key as Send does. */
    Result<ConversationKeySpec, VaultFailure> ConversationKeyFor(
        std::string_view peer_address,
        const std::optional<std::string>& peer_public_key_hex = std::nullopt);

    [[nodiscard]] ConversationKeyCache& KeyCache() noexcept { return *key_cache_; }

private:
    MessagingService(
        std::shared_ptr<session::KeyHierarchyManager> session,
        std::shared_ptr<MessageRepository> messages,
        std::shared_ptr<repositories::ContactsRepository> contacts,
        std::shared_ptr<diagnostics::LocalTelemetry> telemetry,
        size_t processed_capacity);

    Result<std::optional<std::string>, VaultFailure> ResolvePeerKey(
        const std::shared_ptr<interfaces::ITransport>& transport,
        std::string_view peer_address);

    [[nodiscard]] CancellationToken RunToken() const;
    bool IsProcessed(const std::string& id) const;
    void MarkProcessed(const std::string& id);

    std::shared_ptr<session::KeyHierarchyManager> session_;
    std::shared_ptr<MessageRepository> messages_;
    std::shared_ptr<repositories::ContactsRepository> contacts_;
    std::shared_ptr<diagnostics::LocalTelemetry> telemetry_;
    std::shared_ptr<ConversationKeyCache> key_cache_;

    mutable std::mutex mutex_;
    std::shared_ptr<interfaces::ITransport> transport_;
    interfaces::Subscription subscription_;
    size_t processed_capacity_;
    std::set<std::string> processed_;
    std::deque<std::string> processed_order_;
    CancellationSource run_cancellation_;
};

}
