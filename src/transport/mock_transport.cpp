#include "retrochat/transport/mock_transport.hpp"
#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/validation/address.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/hex.hpp"
#include "retrochat/debug/vault_logger.hpp"

namespace retrochat::vault::transport {
    using interfaces::TransportErrorCodes;
    using interfaces::TransportStatus;

    MockTransport::MockTransport()
        : default_peer_key_hex_(hex::Encode(crypto::SodiumInterop::GetRandomBytes(kX25519PublicKeyBytes)))
        , handlers_(std::make_shared<HandlerRegistry>()) {
    }

    TransportStatus MockTransport::Status() const {
        std::lock_guard lock(mutex_);
        return status_;
    }

    std::optional<interfaces::TransportError> MockTransport::Error() const {
        std::lock_guard lock(mutex_);
        return error_;
    }

    Result<Unit, VaultFailure> MockTransport::Fail(const std::string_view code, std::string message) {
        error_ = interfaces::TransportError{std::string(code), message};
        return Result<Unit, VaultFailure>::Err(VaultFailure::Transport(std::string(code), std::move(message)));
    }

    Result<Unit, VaultFailure> MockTransport::Connect(const std::string_view address) {
        std::lock_guard lock(mutex_);
        if (status_ == TransportStatus::Connected) {
            return Result<Unit, VaultFailure>::Err(VaultFailure::Transport(
                std::string(TransportErrorCodes::ALREADY_CONNECTED), "Transport already connected."));
        }
        if (!validation::IsAddressFormat(validation::Trim(address))) {
            return Fail(TransportErrorCodes::INVALID_ADDRESS, std::string(ErrorMessages::INVALID_ADDRESS));
        }
        status_ = TransportStatus::Connecting;
        error_.reset();
        address_ = std::string(validation::Trim(address));
        status_ = TransportStatus::Connected;
        RC_LOG_ID(debug::Area::Transport, "MOCK_CONNECT", "address", address_);
        return Result<Unit, VaultFailure>::Ok(unit);
    }

    Result<Unit, VaultFailure> MockTransport::Send(const proto::vault::MessageEnvelope& envelope) {
        std::optional<proto::vault::MessageEnvelope> echo;
        {
            std::lock_guard lock(mutex_);
            if (status_ != TransportStatus::Connected) {
                return Fail(TransportErrorCodes::NOT_CONNECTED,
                    "Transport is not connected. Call connect() first.");
            }
            if (envelope.from_address().empty() || envelope.to_address().empty()) {
                return Result<Unit, VaultFailure>::Err(VaultFailure::Transport(
                    std::string(TransportErrorCodes::INVALID_ENVELOPE),
                    "Message envelope missing required fields (from/to)."));
            }
            sent_.push_back(envelope);
            if (hex::ToLower(envelope.to_address()) == hex::ToLower(address_)) {
                echo = envelope;
                echo->set_from_address(envelope.to_address());
                echo->set_to_address(envelope.from_address());
            }
        }
        if (echo.has_value()) {
            handlers_->Dispatch(*echo);
        }
        return Result<Unit, VaultFailure>::Ok(unit);
    }

    Result<interfaces::Subscription, VaultFailure> MockTransport::Subscribe(interfaces::MessageHandler handler) {
        if (!handler) {
            return Result<interfaces::Subscription, VaultFailure>::Err(VaultFailure::Transport(
                std::string(TransportErrorCodes::SUBSCRIPTION_FAILED), "Message handler is empty."));
        }
        return Result<interfaces::Subscription, VaultFailure>::Ok(handlers_->Add(std::move(handler)));
    }

    Result<Unit, VaultFailure> MockTransport::Disconnect() {
        handlers_->Clear();
        std::lock_guard lock(mutex_);
        address_.clear();
        status_ = TransportStatus::Disconnected;
        error_.reset();
        return Result<Unit, VaultFailure>::Ok(unit);
    }

    Result<std::optional<std::string>, VaultFailure> MockTransport::GetPeerPublicKey(const std::string_view peer_address) {
        using KeyResult = Result<std::optional<std::string>, VaultFailure>;
        std::lock_guard lock(mutex_);
        if (status_ != TransportStatus::Connected) {
            return KeyResult::Ok(std::nullopt);
        }
        if (const auto it = peer_keys_.find(hex::ToLower(peer_address)); it != peer_keys_.end()) {
            return KeyResult::Ok(it->second);
        }
        return KeyResult::Ok(default_peer_key_hex_);
    }

    void MockTransport::RegisterPeerKey(const std::string_view peer_address, std::string public_key_hex) {
        std::lock_guard lock(mutex_);
        peer_keys_.insert_or_assign(hex::ToLower(peer_address), std::move(public_key_hex));
    }

    std::vector<proto::vault::MessageEnvelope> MockTransport::SentMessages() const {
        std::lock_guard lock(mutex_);
        return sent_;
    }

    Result<Unit, VaultFailure> MockTransport::SimulateIncoming(const proto::vault::MessageEnvelope& envelope) {
        {
            std::lock_guard lock(mutex_);
            if (status_ != TransportStatus::Connected) {
                return Result<Unit, VaultFailure>::Err(VaultFailure::Transport(
                    std::string(TransportErrorCodes::NOT_CONNECTED),
                    "Cannot simulate incoming message: transport not connected."));
            }
        }
        handlers_->Dispatch(envelope);
        return Result<Unit, VaultFailure>::Ok(unit);
    }
}
