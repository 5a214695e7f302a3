#pragma once
#include "retrochat/interfaces/i_transport.hpp"
#include "retrochat/transport/handler_registry.hpp"
#include "retrochat/transport/posix_socket.hpp"
#include "vault/relay.pb.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
namespace retrochat::vault::transport {

struct RelayTransportOptions {
    std::string host;
    uint16_t port = 0;
    /** Announced in the hello frame so peers can fetch it. May be empty. */
    std::string identity_public_key_hex;
    uint32_t handshake_timeout_ms = 5000;
    uint32_t request_timeout_ms = 5000;
};

/**
 * @brief TCP client for a store-less envelope relay.
 *
 * Connect performs a hello/welcome exchange and starts two threads. The
 * reader decodes frames and completes peer key lookups; incoming envelopes
 * are queued for the dispatch thread, which runs the subscribers. Handlers
 * may therefore call GetPeerPublicKey. Envelopes that fail validation are
 * dropped by the reader. Losing the connection moves the transport to the
 * Error state with CONNECTION_FAILED.
 */
class RelayTransport final : public interfaces::ITransport, public interfaces::IPeerKeyDirectory {
public:
    explicit RelayTransport(RelayTransportOptions options);
    ~RelayTransport() override;

    RelayTransport(const RelayTransport&) = delete;
    RelayTransport& operator=(const RelayTransport&) = delete;

    /** Takes effect on the next Connect. */
    void SetIdentityPublicKey(std::string public_key_hex);

    [[nodiscard]] interfaces::TransportStatus Status() const override;
    [[nodiscard]] std::optional<interfaces::TransportError> Error() const override;
    Result<Unit, VaultFailure> Connect(std::string_view address) override;
    Result<Unit, VaultFailure> Send(const proto::vault::MessageEnvelope& envelope) override;
    Result<interfaces::Subscription, VaultFailure> Subscribe(interfaces::MessageHandler handler) override;
    Result<Unit, VaultFailure> Disconnect() override;
    [[nodiscard]] interfaces::IPeerKeyDirectory* PeerKeys() noexcept override { return this; }

    Result<std::optional<std::string>, VaultFailure> GetPeerPublicKey(std::string_view peer_address) override;

    /** Id the relay assigned in its welcome frame. */
    [[nodiscard]] std::string SessionId() const;

private:
    struct PendingLookup {
        bool done = false;
        std::optional<std::string> public_key_hex;
        std::optional<VaultFailure> failure;
    };

    Result<Unit, VaultFailure> Handshake(net::Socket sock, const std::string& address, std::string& session_id);
    void ReaderLoop(net::Socket sock);
    void DispatchLoop();
    void EnqueueDelivery(const proto::vault::MessageEnvelope& envelope);
    void HandleFrame(const proto::vault::RelayFrame& frame);
    Result<Unit, VaultFailure> WriteFrame(const proto::vault::RelayFrame& frame);
    void RecordError(std::string_view code, const std::string& message, bool enter_error_state);
    void FailPendingLookups(const VaultFailure& failure);
    void StopWorkers();

    RelayTransportOptions options_;

    mutable std::mutex mutex_;
    interfaces::TransportStatus status_ = interfaces::TransportStatus::Disconnected;
    std::optional<interfaces::TransportError> error_;
    std::string address_;
    std::string session_id_;

    std::mutex write_mutex_;
    net::ScopedSocket socket_;
    std::thread reader_;
    std::atomic<bool> stopping_{false};

    std::mutex dispatch_mutex_;
    std::condition_variable dispatch_cv_;
    std::deque<proto::vault::MessageEnvelope> dispatch_queue_;
    bool dispatch_stopping_ = false;
    std::thread dispatcher_;

    std::mutex pending_mutex_;
    std::condition_variable pending_cv_;
    std::map<uint64_t, PendingLookup> pending_;
    std::atomic<uint64_t> next_request_id_{1};

    std::shared_ptr<HandlerRegistry> handlers_;
};

}
