#include "retrochat/protocol/messaging_service.hpp"
#include "retrochat/protocol/message_id.hpp"
#include "retrochat/protocol/message_sealer.hpp"
#include "retrochat/validation/address.hpp"
#include "retrochat/validation/envelope_validator.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/hex.hpp"
#include "retrochat/debug/vault_logger.hpp"
#include <algorithm>

namespace retrochat::vault::protocol {
    using interfaces::TransportErrorCodes;
    using interfaces::TransportStatus;
    using KeyLookup = Result<std::optional<std::string>, VaultFailure>;

    namespace {
        constexpr std::string_view kIncomingScope = "messaging.incoming";
        constexpr std::string_view kSendScope = "messaging.send";
    }

    std::shared_ptr<MessagingService> MessagingService::Create(
        std::shared_ptr<session::KeyHierarchyManager> session,
        std::shared_ptr<MessageRepository> messages,
        std::shared_ptr<repositories::ContactsRepository> contacts,
        std::shared_ptr<diagnostics::LocalTelemetry> telemetry,
        const size_t processed_capacity) {
        std::shared_ptr<MessagingService> service(new MessagingService(
            std::move(session), std::move(messages), std::move(contacts), std::move(telemetry), processed_capacity));
        service->session_->AddEventHandler(service->key_cache_);
        return service;
    }

    MessagingService::MessagingService(
        std::shared_ptr<session::KeyHierarchyManager> session,
        std::shared_ptr<MessageRepository> messages,
        std::shared_ptr<repositories::ContactsRepository> contacts,
        std::shared_ptr<diagnostics::LocalTelemetry> telemetry,
        const size_t processed_capacity)
        : session_(std::move(session))
        , messages_(std::move(messages))
        , contacts_(std::move(contacts))
        , telemetry_(std::move(telemetry))
        , key_cache_(std::make_shared<ConversationKeyCache>())
        , processed_capacity_(std::max<size_t>(processed_capacity, 1)) {
        run_cancellation_.Cancel();
    }

    MessagingService::~MessagingService() {
        Stop();
    }

    CancellationToken MessagingService::RunToken() const {
        std::lock_guard lock(mutex_);
        return run_cancellation_.Token();
    }

    bool MessagingService::IsProcessed(const std::string& id) const {
        std::lock_guard lock(mutex_);
        return processed_.contains(id);
    }

    void MessagingService::MarkProcessed(const std::string& id) {
        std::lock_guard lock(mutex_);
        if (!processed_.insert(id).second) {
            return;
        }
        processed_order_.push_back(id);
        while (processed_order_.size() > processed_capacity_) {
            processed_.erase(processed_order_.front());
            processed_order_.pop_front();
        }
    }

    bool MessagingService::IsRunning() const {
        std::lock_guard lock(mutex_);
        return transport_ != nullptr;
    }

    size_t MessagingService::ProcessedCount() const {
        std::lock_guard lock(mutex_);
        return processed_.size();
    }

    Result<Unit, VaultFailure> MessagingService::Start(std::shared_ptr<interfaces::ITransport> transport) {
        if (!transport) {
            return Result<Unit, VaultFailure>::Err(VaultFailure::Validation("Transport is required."));
        }
        auto address = session_->Address();
        RETROCHAT_TRY(address);
        Stop();

        if (transport->Status() != TransportStatus::Connected) {
            RETROCHAT_TRY(transport->Connect(address.Unwrap()));
        }
        std::weak_ptr<MessagingService> weak = weak_from_this();
        auto subscription = transport->Subscribe([weak](const proto::vault::MessageEnvelope& envelope) {
            const auto self = weak.lock();
            if (!self) {
                return;
            }
            auto handled = self->HandleIncoming(envelope);
            if (handled.IsErr()) {
                self->telemetry_->LogError(kIncomingScope, handled.UnwrapErr());
            }
        });
        RETROCHAT_TRY(subscription);

        std::lock_guard lock(mutex_);
        transport_ = std::move(transport);
        subscription_ = std::move(subscription).Unwrap();
        run_cancellation_.Reset();
        RC_LOG_MSG(debug::Area::Messaging, "START", "subscribed");
        return Result<Unit, VaultFailure>::Ok(unit);
    }

    void MessagingService::Stop() {
        std::shared_ptr<interfaces::ITransport> transport;
        interfaces::Subscription subscription;
        {
            std::lock_guard lock(mutex_);
            run_cancellation_.Cancel();
            transport = std::move(transport_);
            transport_.reset();
            subscription = std::move(subscription_);
            processed_.clear();
            processed_order_.clear();
        }
        subscription.Reset();
        if (transport) {
            auto disconnected = transport->Disconnect();
            if (disconnected.IsErr()) {
                telemetry_->LogError("messaging.stop", disconnected.UnwrapErr());
            }
            RC_LOG_MSG(debug::Area::Messaging, "STOP", "disconnected");
        }
    }

    KeyLookup MessagingService::ResolvePeerKey(
        const std::shared_ptr<interfaces::ITransport>& transport,
        const std::string_view peer_address) {
        auto dsk = session_->GetDeviceStorageKey();
        RETROCHAT_TRY(dsk);
        auto contact = contacts_->GetByAddress(*dsk.Unwrap(), peer_address, session_->SessionToken());
        RETROCHAT_TRY(contact);
        const auto& found = contact.Unwrap();
        if (found.has_value() && found->public_key_hex.has_value()) {
            return KeyLookup::Ok(found->public_key_hex);
        }
        if (transport) {
            if (interfaces::IPeerKeyDirectory* directory = transport->PeerKeys()) {
                auto fetched = directory->GetPeerPublicKey(peer_address);
                if (fetched.IsOk()) {
                    return fetched;
                }
                RC_LOG_MSG(debug::Area::Messaging, "PEER_KEY", "transport lookup failed");
            }
        }
        return KeyLookup::Ok(std::nullopt);
    }

    Result<ConversationKeySpec, VaultFailure> MessagingService::ConversationKeyFor(
        const std::string_view peer_address,
        const std::optional<std::string>& peer_public_key_hex) {
        using SpecResult = Result<ConversationKeySpec, VaultFailure>;
        auto my_address = session_->Address();
        RETROCHAT_TRY(my_address);

        std::optional<std::string> peer_key = peer_public_key_hex;
        if (!peer_key.has_value()) {
            if (auto cached = key_cache_->Find(my_address.Unwrap(), peer_address); cached.has_value()) {
                return SpecResult::Ok(std::move(*cached));
            }
            std::shared_ptr<interfaces::ITransport> transport;
            {
                std::lock_guard lock(mutex_);
                transport = transport_;
            }
            auto resolved = ResolvePeerKey(transport, peer_address);
            RETROCHAT_TRY(resolved);
            peer_key = std::move(resolved).Unwrap();
        }
        if (!peer_key.has_value()) {
            return SpecResult::Err(VaultFailure::KeyDerivation("peerPublicKey", "Peer public key is not available."));
        }
        auto peer_key_bytes = hex::Decode(*peer_key);
        if (peer_key_bytes.IsErr()) {
            return SpecResult::Err(VaultFailure::KeyDerivation("peerPublicKey", "Invalid peer public key."));
        }
        auto identity = session_->GetOrCreateIdentityKeyPair();
        RETROCHAT_TRY(identity);
        return key_cache_->GetOrDerive(*identity.Unwrap(), peer_key_bytes.Unwrap(), my_address.Unwrap(), peer_address);
    }

    Result<std::optional<std::string>, VaultFailure> MessagingService::HandleIncoming(
        const proto::vault::MessageEnvelope& envelope) {
        using HandleResult = Result<std::optional<std::string>, VaultFailure>;
        const CancellationToken run_token = RunToken();
        RETROCHAT_TRY(run_token.Check("incoming message"));
        RETROCHAT_TRY(validation::EnvelopeValidator::Validate(envelope));

        auto derived_id = DeriveMessageId(envelope);
        RETROCHAT_TRY(derived_id);
        const std::string id = std::move(derived_id).Unwrap();
        if (IsProcessed(id)) {
            RC_LOG_ID(debug::Area::Messaging, "INCOMING_DUPLICATE", "id", id);
            return HandleResult::Ok(std::nullopt);
        }

        auto my_address = session_->Address();
        RETROCHAT_TRY(my_address);
        const bool is_incoming = hex::ToLower(envelope.to_address()) == hex::ToLower(my_address.Unwrap());
        const std::string& peer_address = is_incoming ? envelope.from_address() : envelope.to_address();

        auto key = ConversationKeyFor(peer_address);
        if (key.IsErr() && key.UnwrapErr().type == VaultFailureType::KeyDerivation
            && key.UnwrapErr().code == "peerPublicKey") {
            telemetry_->LogInfo(kIncomingScope, "Dropped message: no public key for peer.");
            return HandleResult::Ok(std::nullopt);
        }
        RETROCHAT_TRY(key);

        RETROCHAT_TRY(run_token.Check("incoming message"));
        auto stored = messages_->Store(*key.Unwrap().key, envelope, session_->SessionToken());
        RETROCHAT_TRY(stored);
        MarkProcessed(id);
        RC_LOG_ID(debug::Area::Messaging, "INCOMING_STORED", "id", id);
        return HandleResult::Ok(std::move(stored).Unwrap());
    }

    Result<std::string, VaultFailure> MessagingService::Send(
        const std::string_view peer_address,
        std::optional<std::string> peer_public_key_hex,
        const std::string_view text) {
        using SendResult = Result<std::string, VaultFailure>;
        std::shared_ptr<interfaces::ITransport> transport;
        {
            std::lock_guard lock(mutex_);
            transport = transport_;
        }
        if (!transport || transport->Status() != TransportStatus::Connected) {
            return SendResult::Err(VaultFailure::Transport(
                std::string(TransportErrorCodes::NOT_CONNECTED), "Transport is not connected."));
        }
        auto my_address = session_->Address();
        RETROCHAT_TRY(my_address);
        if (!validation::IsAddress(validation::Trim(peer_address))) {
            return SendResult::Err(VaultFailure::InvalidField(
                "peerAddress", std::string(ErrorMessages::INVALID_ADDRESS)));
        }

        const CancellationToken run_token = RunToken();
        auto key = ConversationKeyFor(validation::Trim(peer_address), peer_public_key_hex);
        RETROCHAT_TRY(key);
        auto sealed = MessageSealer::Seal(*key.Unwrap().key, my_address.Unwrap(), validation::Trim(peer_address), text);
        RETROCHAT_TRY(sealed);
        const proto::vault::MessageEnvelope envelope = std::move(sealed).Unwrap();

        RETROCHAT_TRY(run_token.Check("send message"));
        auto delivered = transport->Send(envelope);
        if (delivered.IsErr()) {
            telemetry_->LogError(kSendScope, delivered.UnwrapErr());
            return SendResult::Err(std::move(delivered).UnwrapErr());
        }
        auto stored = messages_->Store(*key.Unwrap().key, envelope, session_->SessionToken());
        RETROCHAT_TRY(stored);
        MarkProcessed(stored.Unwrap());
        return stored;
    }
}
