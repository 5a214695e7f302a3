#pragma once
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include "vault/envelope.pb.h"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
namespace retrochat::vault::interfaces {

enum class TransportStatus {
    Disconnected,
    Connecting,
    Connected,
    Error
};

struct TransportErrorCodes {
    static constexpr std::string_view NOT_CONNECTED = "NOT_CONNECTED";
    static constexpr std::string_view INVALID_ENVELOPE = "INVALID_ENVELOPE";
    static constexpr std::string_view ALREADY_CONNECTED = "ALREADY_CONNECTED";
    static constexpr std::string_view INVALID_ADDRESS = "INVALID_ADDRESS";
    static constexpr std::string_view CONNECTION_FAILED = "CONNECTION_FAILED";
    static constexpr std::string_view SEND_FAILED = "SEND_FAILED";
    static constexpr std::string_view SUBSCRIPTION_FAILED = "SUBSCRIPTION_FAILED";
};

/** Last error a transport reported; cleared by a successful Connect. */
struct TransportError {
    std::string code;
    std::string message;
};

using MessageHandler = std::function<void(const proto::vault::MessageEnvelope&)>;

/**
 * @brief Registration returned by ITransport::Subscribe.
 *
 * The handler is removed when the subscription is reset or destroyed.
 * Outliving the transport is safe.
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> unsubscribe)
        : unsubscribe_(std::move(unsubscribe)) {}

    Subscription(Subscription&& other) noexcept
        : unsubscribe_(std::exchange(other.unsubscribe_, nullptr)) {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            Reset();
            unsubscribe_ = std::exchange(other.unsubscribe_, nullptr);
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    ~Subscription() { Reset(); }

    void Reset() noexcept {
        if (auto unsubscribe = std::exchange(unsubscribe_, nullptr)) {
            unsubscribe();
        }
    }

    [[nodiscard]] bool IsActive() const noexcept { return static_cast<bool>(unsubscribe_); }
private:
    std::function<void()> unsubscribe_;
};

/** Optional transport capability: X25519 public keys of peers. */
class IPeerKeyDirectory {
public:
    virtual ~IPeerKeyDirectory() = default;

    /** Lowercase hex key, or nullopt when the peer's key is not known. */
    [[nodiscard]] virtual Result<std::optional<std::string>, VaultFailure> GetPeerPublicKey(
        std::string_view peer_address) = 0;
};

/**
 * @brief Envelope delivery contract shared by every transport.
 *
 * Delivery is at-least-once: handlers may see the same envelope twice.
 * Failures carry one of TransportErrorCodes in VaultFailure::code.
 * Handlers may run on a transport-owned thread and must not call
 * Disconnect() on the transport that invoked them.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    [[nodiscard]] virtual TransportStatus Status() const = 0;

    [[nodiscard]] virtual std::optional<TransportError> Error() const = 0;

    virtual Result<Unit, VaultFailure> Connect(std::string_view address) = 0;

    virtual Result<Unit, VaultFailure> Send(const proto::vault::MessageEnvelope& envelope) = 0;

    virtual Result<Subscription, VaultFailure> Subscribe(MessageHandler handler) = 0;

    virtual Result<Unit, VaultFailure> Disconnect() = 0;

    /** nullptr when the transport cannot look up peer keys. */
    [[nodiscard]] virtual IPeerKeyDirectory* PeerKeys() noexcept { return nullptr; }
};

}
