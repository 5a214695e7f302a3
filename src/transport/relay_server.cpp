#include "retrochat/transport/relay_server.hpp"
#include "retrochat/transport/relay_frame_codec.hpp"
#include "retrochat/interfaces/i_transport.hpp"
#include "retrochat/validation/address.hpp"
#include "retrochat/validation/envelope_validator.hpp"
#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/hex.hpp"
#include "retrochat/debug/vault_logger.hpp"

namespace retrochat::vault::transport {
    using interfaces::TransportErrorCodes;

    namespace {
        constexpr size_t kSessionIdBytes = 8;

        proto::vault::RelayFrame ErrorFrame(const uint64_t request_id, const std::string_view code, std::string message) {
            proto::vault::RelayFrame frame;
            frame.set_request_id(request_id);
            frame.mutable_error()->set_code(std::string(code));
            frame.mutable_error()->set_message(std::move(message));
            return frame;
        }
    }

    RelayServer::~RelayServer() {
        Stop();
    }

    Result<uint16_t, VaultFailure> RelayServer::Start(const uint16_t port, const bool loopback_only) {
        {
            std::lock_guard lock(mutex_);
            if (listener_.IsValid()) {
                return Result<uint16_t, VaultFailure>::Err(
                    VaultFailure::InvalidState("Relay server is already running."));
            }
        }
        auto listening = net::ListenTcp(port, loopback_only);
        if (listening.IsErr()) {
            return Result<uint16_t, VaultFailure>::Err(std::move(listening).UnwrapErr());
        }
        net::ScopedSocket listener = std::move(listening).Unwrap();
        auto bound = net::LocalPort(listener.Get());
        if (bound.IsErr()) {
            return bound;
        }
        stopping_.store(false);
        {
            std::lock_guard lock(mutex_);
            listener_ = std::move(listener);
        }
        accept_thread_ = std::thread([this] { AcceptLoop(); });
        RC_LOG_VALUE(debug::Area::Transport, "RELAY_LISTEN", "port", bound.Unwrap());
        return bound;
    }

    void RelayServer::Stop() {
        stopping_.store(true);
        {
            std::lock_guard lock(mutex_);
            listener_.Shutdown();
        }
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        std::vector<std::thread> threads;
        {
            std::lock_guard lock(mutex_);
            listener_.Close();
            for (const auto& client : clients_) {
                std::lock_guard write_lock(client->write_mutex);
                client->socket.Shutdown();
            }
            threads.swap(client_threads_);
        }
        for (auto& thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        std::lock_guard lock(mutex_);
        clients_.clear();
        routes_.clear();
    }

    size_t RelayServer::RegisteredCount() const {
        std::lock_guard lock(mutex_);
        return routes_.size();
    }

    void RelayServer::AcceptLoop() {
        net::Socket listen_fd;
        {
            std::lock_guard lock(mutex_);
            listen_fd = listener_.Get();
        }
        while (!stopping_.load()) {
            auto accepted = net::AcceptTcp(listen_fd);
            if (accepted.IsErr()) {
                if (!stopping_.load()) {
                    RC_LOG_ID(debug::Area::Transport, "RELAY_ACCEPT", "error", accepted.UnwrapErr().message);
                }
                return;
            }
            auto client = std::make_shared<Client>();
            client->socket = std::move(accepted).Unwrap();
            std::lock_guard lock(mutex_);
            if (stopping_.load()) {
                return;
            }
            clients_.push_back(client);
            client_threads_.emplace_back([this, client] { ClientLoop(client); });
        }
    }

    Result<Unit, VaultFailure> RelayServer::Write(Client& client, const proto::vault::RelayFrame& frame) {
        std::lock_guard write_lock(client.write_mutex);
        if (!client.socket.IsValid()) {
            return Result<Unit, VaultFailure>::Err(VaultFailure::Transport(
                std::string(TransportErrorCodes::NOT_CONNECTED), "Client connection closed."));
        }
        return RelayFrameCodec::WriteFrame(client.socket.Get(), frame);
    }

    Result<Unit, VaultFailure> RelayServer::Register(
        const std::shared_ptr<Client>& client,
        const proto::vault::RelayFrame& hello) {
        if (!hello.has_hello() || !validation::IsAddressFormat(hello.hello().address())) {
            auto rejected = Write(*client, ErrorFrame(hello.request_id(),
                TransportErrorCodes::INVALID_ADDRESS, std::string(ErrorMessages::INVALID_ADDRESS)));
            if (rejected.IsErr()) {
                RC_LOG_ID(debug::Area::Transport, "RELAY_REJECT", "write", rejected.UnwrapErr().message);
            }
            return Result<Unit, VaultFailure>::Err(VaultFailure::Transport(
                std::string(TransportErrorCodes::INVALID_ADDRESS), std::string(ErrorMessages::INVALID_ADDRESS)));
        }
        client->address = hex::ToLower(hello.hello().address());
        client->identity_public_key_hex = hex::ToLower(hello.hello().identity_public_key_hex());
        {
            std::lock_guard lock(mutex_);
            routes_[client->address] = client;
        }
        proto::vault::RelayFrame welcome;
        welcome.set_request_id(hello.request_id());
        welcome.mutable_welcome()->set_session_id(
            hex::Encode(crypto::SodiumInterop::GetRandomBytes(kSessionIdBytes)));
        RC_LOG_ID(debug::Area::Transport, "RELAY_HELLO", "address", client->address);
        return Write(*client, welcome);
    }

    void RelayServer::Route(const proto::vault::RelayFrame& frame) {
        const auto& envelope = frame.deliver().envelope();
        if (validation::EnvelopeValidator::Validate(envelope).IsErr()) {
            RC_LOG_MSG(debug::Area::Transport, "RELAY_DROP", "invalid envelope");
            return;
        }
        std::shared_ptr<Client> target;
        {
            std::lock_guard lock(mutex_);
            if (const auto it = routes_.find(hex::ToLower(envelope.to())); it != routes_.end()) {
                target = it->second;
            }
        }
        if (!target) {
            RC_LOG_ID(debug::Area::Transport, "RELAY_DROP", "offline", envelope.to());
            return;
        }
        proto::vault::RelayFrame out;
        *out.mutable_deliver()->mutable_envelope() = envelope;
        auto written = Write(*target, out);
        if (written.IsErr()) {
            RC_LOG_ID(debug::Area::Transport, "RELAY_DROP", "write", written.UnwrapErr().message);
        }
    }

    void RelayServer::AnswerPeerKey(const std::shared_ptr<Client>& client, const proto::vault::RelayFrame& frame) {
        const std::string wanted = hex::ToLower(frame.peer_key_request().address());
        proto::vault::RelayFrame response;
        response.set_request_id(frame.request_id());
        response.mutable_peer_key_response()->set_address(wanted);
        {
            std::lock_guard lock(mutex_);
            if (const auto it = routes_.find(wanted);
                it != routes_.end() && !it->second->identity_public_key_hex.empty()) {
                response.mutable_peer_key_response()->set_public_key_hex(it->second->identity_public_key_hex);
            }
        }
        auto written = Write(*client, response);
        if (written.IsErr()) {
            RC_LOG_ID(debug::Area::Transport, "RELAY_PEER_KEY", "write", written.UnwrapErr().message);
        }
    }

    void RelayServer::Unregister(const std::shared_ptr<Client>& client) {
        std::lock_guard lock(mutex_);
        if (const auto it = routes_.find(client->address); it != routes_.end() && it->second == client) {
            routes_.erase(it);
        }
        std::erase(clients_, client);
    }

    void RelayServer::ClientLoop(const std::shared_ptr<Client>& client) {
        const net::Socket fd = client->socket.Get();
        auto hello = RelayFrameCodec::ReadFrame(fd);
        if (hello.IsOk() && Register(client, hello.Unwrap()).IsOk()) {
            while (!stopping_.load()) {
                auto frame = RelayFrameCodec::ReadFrame(fd);
                if (frame.IsErr()) {
                    break;
                }
                const auto& received = frame.Unwrap();
                switch (received.body_case()) {
                    case proto::vault::RelayFrame::kDeliver:
                        Route(received);
                        break;
                    case proto::vault::RelayFrame::kPeerKeyRequest:
                        AnswerPeerKey(client, received);
                        break;
                    default: {
                        auto written = Write(*client, ErrorFrame(received.request_id(),
                            TransportErrorCodes::INVALID_ENVELOPE, "Unexpected relay frame."));
                        if (written.IsErr()) {
                            RC_LOG_ID(debug::Area::Transport, "RELAY_UNEXPECTED", "write", written.UnwrapErr().message);
                        }
                        break;
                    }
                }
            }
        }
        Unregister(client);
        std::lock_guard write_lock(client->write_mutex);
        client->socket.Close();
    }
}
