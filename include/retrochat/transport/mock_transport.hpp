#pragma once
#include "retrochat/interfaces/i_transport.hpp"
#include "retrochat/transport/handler_registry.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace retrochat::vault::transport {

/**
 * @brief In-process transport for development and tests.
 *
 * Connects instantly. An envelope sent to the connected address is echoed
 * back to the subscribers with from and to swapped. Every peer resolves to
 * the same random public key unless one was registered for it.
 */
class MockTransport final : public interfaces::ITransport, public interfaces::IPeerKeyDirectory {
public:
    MockTransport();

    [[nodiscard]] interfaces::TransportStatus Status() const override;
    [[nodiscard]] std::optional<interfaces::TransportError> Error() const override;
    Result<Unit, VaultFailure> Connect(std::string_view address) override;
    Result<Unit, VaultFailure> Send(const proto::vault::MessageEnvelope& envelope) override;
    Result<interfaces::Subscription, VaultFailure> Subscribe(interfaces::MessageHandler handler) override;
    Result<Unit, VaultFailure> Disconnect() override;
    [[nodiscard]] interfaces::IPeerKeyDirectory* PeerKeys() noexcept override { return this; }

    /** nullopt while disconnected. */
    Result<std::optional<std::string>, VaultFailure> GetPeerPublicKey(std::string_view peer_address) override;

    void RegisterPeerKey(std::string_view peer_address, std::string public_key_hex);

    [[nodiscard]] std::vector<proto::vault::MessageEnvelope> SentMessages() const;

    /** Delivers `envelope` to the subscribers as if it came from the network. */
    Result<Unit, VaultFailure> SimulateIncoming(const proto::vault::MessageEnvelope& envelope);

    [[nodiscard]] size_t SubscriberCount() const { return handlers_->Size(); }

private:
    Result<Unit, VaultFailure> Fail(std::string_view code, std::string message);

    mutable std::mutex mutex_;
    interfaces::TransportStatus status_ = interfaces::TransportStatus::Disconnected;
    std::optional<interfaces::TransportError> error_;
    std::string address_;
    std::string default_peer_key_hex_;
    std::map<std::string, std::string> peer_keys_;
    std::vector<proto::vault::MessageEnvelope> sent_;
    std::shared_ptr<HandlerRegistry> handlers_;
};

}
