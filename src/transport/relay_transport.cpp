#include "retrochat/transport/relay_transport.hpp"
#include "retrochat/transport/relay_frame_codec.hpp"
#include "retrochat/validation/address.hpp"
#include "retrochat/validation/envelope_validator.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/hex.hpp"
#include "retrochat/debug/vault_logger.hpp"
#include <chrono>

namespace retrochat::vault::transport {
    using interfaces::TransportErrorCodes;
    using interfaces::TransportStatus;

    namespace {
        VaultFailure TransportFailure(const std::string_view code, std::string message) {
            return VaultFailure::Transport(std::string(code), std::move(message));
        }
    }

    RelayTransport::RelayTransport(RelayTransportOptions options)
        : options_(std::move(options))
        , handlers_(std::make_shared<HandlerRegistry>()) {
    }

    RelayTransport::~RelayTransport() {
        auto disconnected = Disconnect();
        (void)disconnected;
    }

    void RelayTransport::SetIdentityPublicKey(std::string public_key_hex) {
        std::lock_guard lock(mutex_);
        options_.identity_public_key_hex = std::move(public_key_hex);
    }

    TransportStatus RelayTransport::Status() const {
        std::lock_guard lock(mutex_);
        return status_;
    }

    std::optional<interfaces::TransportError> RelayTransport::Error() const {
        std::lock_guard lock(mutex_);
        return error_;
    }

    std::string RelayTransport::SessionId() const {
        std::lock_guard lock(mutex_);
        return session_id_;
    }

    void RelayTransport::RecordError(const std::string_view code, const std::string& message, const bool enter_error_state) {
        std::lock_guard lock(mutex_);
        error_ = interfaces::TransportError{std::string(code), message};
        if (enter_error_state) {
            status_ = TransportStatus::Error;
        }
    }

    Result<Unit, VaultFailure> RelayTransport::Handshake(
        const net::Socket sock,
        const std::string& address,
        std::string& session_id) {
        std::string identity_key;
        {
            std::lock_guard lock(mutex_);
            identity_key = options_.identity_public_key_hex;
        }
        proto::vault::RelayFrame hello;
        hello.set_request_id(next_request_id_++);
        hello.mutable_hello()->set_address(address);
        hello.mutable_hello()->set_identity_public_key_hex(identity_key);

        RETROCHAT_TRY(net::SetRecvTimeout(sock, options_.handshake_timeout_ms));
        auto sent = RelayFrameCodec::WriteFrame(sock, hello);
        if (sent.IsErr()) {
            return Result<Unit, VaultFailure>::Err(TransportFailure(
                TransportErrorCodes::CONNECTION_FAILED, sent.UnwrapErr().message));
        }
        auto reply = RelayFrameCodec::ReadFrame(sock);
        if (reply.IsErr()) {
            return Result<Unit, VaultFailure>::Err(TransportFailure(
                TransportErrorCodes::CONNECTION_FAILED, reply.UnwrapErr().message));
        }
        const auto& frame = reply.Unwrap();
        if (frame.has_error()) {
            return Result<Unit, VaultFailure>::Err(TransportFailure(
                TransportErrorCodes::CONNECTION_FAILED, frame.error().message()));
        }
        if (!frame.has_welcome()) {
            return Result<Unit, VaultFailure>::Err(TransportFailure(
                TransportErrorCodes::CONNECTION_FAILED, "Relay did not answer the hello frame."));
        }
        session_id = frame.welcome().session_id();
        return net::SetRecvTimeout(sock, 0);
    }

    Result<Unit, VaultFailure> RelayTransport::Connect(const std::string_view address) {
        const std::string trimmed(validation::Trim(address));
        {
            std::lock_guard lock(mutex_);
            if (status_ == TransportStatus::Connected || status_ == TransportStatus::Connecting) {
                return Result<Unit, VaultFailure>::Err(TransportFailure(
                    TransportErrorCodes::ALREADY_CONNECTED, "Transport already connected."));
            }
            if (!validation::IsAddressFormat(trimmed)) {
                error_ = interfaces::TransportError{
                    std::string(TransportErrorCodes::INVALID_ADDRESS), std::string(ErrorMessages::INVALID_ADDRESS)};
                return Result<Unit, VaultFailure>::Err(TransportFailure(
                    TransportErrorCodes::INVALID_ADDRESS, std::string(ErrorMessages::INVALID_ADDRESS)));
            }
            status_ = TransportStatus::Connecting;
            error_.reset();
        }
        StopWorkers();

        auto connected = net::ConnectTcp(options_.host, options_.port);
        if (connected.IsErr()) {
            RecordError(TransportErrorCodes::CONNECTION_FAILED, connected.UnwrapErr().message, true);
            return Result<Unit, VaultFailure>::Err(std::move(connected).UnwrapErr());
        }
        net::ScopedSocket sock = std::move(connected).Unwrap();
        std::string session_id;
        auto greeted = Handshake(sock.Get(), trimmed, session_id);
        if (greeted.IsErr()) {
            RecordError(TransportErrorCodes::CONNECTION_FAILED, greeted.UnwrapErr().message, true);
            return greeted;
        }

        const net::Socket fd = sock.Get();
        {
            std::lock_guard write_lock(write_mutex_);
            socket_ = std::move(sock);
        }
        stopping_.store(false);
        {
            std::lock_guard dispatch_lock(dispatch_mutex_);
            dispatch_stopping_ = false;
        }
        dispatcher_ = std::thread([this] { DispatchLoop(); });
        reader_ = std::thread([this, fd] { ReaderLoop(fd); });
        {
            std::lock_guard lock(mutex_);
            address_ = trimmed;
            session_id_ = std::move(session_id);
            status_ = TransportStatus::Connected;
        }
        RC_LOG_ID(debug::Area::Transport, "RELAY_CONNECT", "session", SessionId());
        return Result<Unit, VaultFailure>::Ok(unit);
    }

    Result<Unit, VaultFailure> RelayTransport::WriteFrame(const proto::vault::RelayFrame& frame) {
        std::lock_guard write_lock(write_mutex_);
        if (!socket_.IsValid()) {
            return Result<Unit, VaultFailure>::Err(TransportFailure(
                TransportErrorCodes::NOT_CONNECTED, "Transport is not connected."));
        }
        return RelayFrameCodec::WriteFrame(socket_.Get(), frame);
    }

    Result<Unit, VaultFailure> RelayTransport::Send(const proto::vault::MessageEnvelope& envelope) {
        if (Status() != TransportStatus::Connected) {
            RecordError(TransportErrorCodes::NOT_CONNECTED, "Transport is not connected. Call connect() first.", false);
            return Result<Unit, VaultFailure>::Err(TransportFailure(
                TransportErrorCodes::NOT_CONNECTED, "Transport is not connected. Call connect() first."));
        }
        if (validation::EnvelopeValidator::Validate(envelope).IsErr()) {
            return Result<Unit, VaultFailure>::Err(TransportFailure(
                TransportErrorCodes::INVALID_ENVELOPE, std::string(ErrorMessages::INVALID_MESSAGE_PAYLOAD)));
        }
        proto::vault::RelayFrame frame;
        frame.set_request_id(next_request_id_++);
        *frame.mutable_deliver()->mutable_envelope() = envelope;
        auto written = WriteFrame(frame);
        if (written.IsErr()) {
            RecordError(TransportErrorCodes::SEND_FAILED, written.UnwrapErr().message, false);
            return Result<Unit, VaultFailure>::Err(TransportFailure(
                TransportErrorCodes::SEND_FAILED, written.UnwrapErr().message));
        }
        return Result<Unit, VaultFailure>::Ok(unit);
    }

    Result<interfaces::Subscription, VaultFailure> RelayTransport::Subscribe(interfaces::MessageHandler handler) {
        if (!handler) {
            return Result<interfaces::Subscription, VaultFailure>::Err(TransportFailure(
                TransportErrorCodes::SUBSCRIPTION_FAILED, "Message handler is empty."));
        }
        return Result<interfaces::Subscription, VaultFailure>::Ok(handlers_->Add(std::move(handler)));
    }

    Result<std::optional<std::string>, VaultFailure> RelayTransport::GetPeerPublicKey(const std::string_view peer_address) {
        using KeyResult = Result<std::optional<std::string>, VaultFailure>;
        if (Status() != TransportStatus::Connected) {
            return KeyResult::Ok(std::nullopt);
        }
        if (!validation::IsAddressFormat(peer_address)) {
            return KeyResult::Err(TransportFailure(
                TransportErrorCodes::INVALID_ADDRESS, std::string(ErrorMessages::INVALID_ADDRESS)));
        }
        const uint64_t request_id = next_request_id_++;
        {
            std::lock_guard lock(pending_mutex_);
            pending_.emplace(request_id, PendingLookup{});
        }
        proto::vault::RelayFrame frame;
        frame.set_request_id(request_id);
        frame.mutable_peer_key_request()->set_address(hex::ToLower(peer_address));
        auto written = WriteFrame(frame);
        if (written.IsErr()) {
            std::lock_guard lock(pending_mutex_);
            pending_.erase(request_id);
            return KeyResult::Err(TransportFailure(TransportErrorCodes::SEND_FAILED, written.UnwrapErr().message));
        }

        std::unique_lock lock(pending_mutex_);
        const bool answered = pending_cv_.wait_for(lock, std::chrono::milliseconds(options_.request_timeout_ms),
            [this, request_id] {
                const auto it = pending_.find(request_id);
                return it == pending_.end() || it->second.done;
            });
        const auto it = pending_.find(request_id);
        if (!answered || it == pending_.end()) {
            pending_.erase(request_id);
            return KeyResult::Err(TransportFailure(
                TransportErrorCodes::CONNECTION_FAILED, "Peer key request timed out."));
        }
        PendingLookup lookup = std::move(it->second);
        pending_.erase(it);
        if (lookup.failure.has_value()) {
            return KeyResult::Err(std::move(*lookup.failure));
        }
        return KeyResult::Ok(std::move(lookup.public_key_hex));
    }

    void RelayTransport::HandleFrame(const proto::vault::RelayFrame& frame) {
        switch (frame.body_case()) {
            case proto::vault::RelayFrame::kDeliver: {
                const auto& envelope = frame.deliver().envelope();
                if (validation::EnvelopeValidator::Validate(envelope).IsErr()) {
                    RC_LOG_MSG(debug::Area::Transport, "RELAY_DROP", "invalid envelope");
                    return;
                }
                EnqueueDelivery(envelope);
                return;
            }
            case proto::vault::RelayFrame::kPeerKeyResponse: {
                std::lock_guard lock(pending_mutex_);
                if (const auto it = pending_.find(frame.request_id()); it != pending_.end()) {
                    it->second.done = true;
                    if (frame.peer_key_response().has_public_key_hex()
                        && !frame.peer_key_response().public_key_hex().empty()) {
                        it->second.public_key_hex = hex::ToLower(frame.peer_key_response().public_key_hex());
                    }
                }
                pending_cv_.notify_all();
                return;
            }
            case proto::vault::RelayFrame::kError: {
                VaultFailure failure = TransportFailure(frame.error().code(), frame.error().message());
                {
                    std::lock_guard lock(pending_mutex_);
                    if (const auto it = pending_.find(frame.request_id()); it != pending_.end()) {
                        it->second.done = true;
                        it->second.failure = failure;
                        pending_cv_.notify_all();
                        return;
                    }
                }
                RecordError(frame.error().code(), frame.error().message(), false);
                return;
            }
            default:
                RC_LOG_VALUE(debug::Area::Transport, "RELAY_IGNORE", "body", static_cast<int>(frame.body_case()));
                return;
        }
    }

    void RelayTransport::ReaderLoop(const net::Socket sock) {
        while (!stopping_.load()) {
            auto frame = RelayFrameCodec::ReadFrame(sock);
            if (frame.IsErr()) {
                if (!stopping_.load()) {
                    RecordError(TransportErrorCodes::CONNECTION_FAILED, frame.UnwrapErr().message, true);
                }
                FailPendingLookups(TransportFailure(TransportErrorCodes::CONNECTION_FAILED, "Relay connection lost."));
                return;
            }
            HandleFrame(frame.Unwrap());
        }
    }

    void RelayTransport::EnqueueDelivery(const proto::vault::MessageEnvelope& envelope) {
        {
            std::lock_guard lock(dispatch_mutex_);
            if (dispatch_stopping_) {
                return;
            }
            dispatch_queue_.push_back(envelope);
        }
        dispatch_cv_.notify_one();
    }

    void RelayTransport::DispatchLoop() {
        while (true) {
            proto::vault::MessageEnvelope envelope;
            {
                std::unique_lock lock(dispatch_mutex_);
                dispatch_cv_.wait(lock, [this] { return dispatch_stopping_ || !dispatch_queue_.empty(); });
                if (dispatch_stopping_) {
                    return;
                }
                envelope = std::move(dispatch_queue_.front());
                dispatch_queue_.pop_front();
            }
            handlers_->Dispatch(envelope);
        }
    }

    void RelayTransport::FailPendingLookups(const VaultFailure& failure) {
        std::lock_guard lock(pending_mutex_);
        for (auto& [id, lookup] : pending_) {
            if (!lookup.done) {
                lookup.done = true;
                lookup.failure = failure;
            }
        }
        pending_cv_.notify_all();
    }

    void RelayTransport::StopWorkers() {
        stopping_.store(true);
        {
            std::lock_guard write_lock(write_mutex_);
            socket_.Shutdown();
        }
        {
            std::lock_guard dispatch_lock(dispatch_mutex_);
            dispatch_stopping_ = true;
            dispatch_queue_.clear();
        }
        dispatch_cv_.notify_all();
        // Releases a lookup blocked on the dispatch thread before the join.
        FailPendingLookups(TransportFailure(TransportErrorCodes::NOT_CONNECTED, "Transport disconnected."));
        for (std::thread* worker : {&reader_, &dispatcher_}) {
            if (!worker->joinable()) {
                continue;
            }
            if (worker->get_id() == std::this_thread::get_id()) {
                worker->detach();
            } else {
                worker->join();
            }
        }
        std::lock_guard write_lock(write_mutex_);
        socket_.Close();
    }

    Result<Unit, VaultFailure> RelayTransport::Disconnect() {
        StopWorkers();
        handlers_->Clear();
        std::lock_guard lock(mutex_);
        address_.clear();
        session_id_.clear();
        status_ = TransportStatus::Disconnected;
        error_.reset();
        return Result<Unit, VaultFailure>::Ok(unit);
    }
}
