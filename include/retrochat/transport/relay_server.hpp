#pragma once
#include "retrochat/transport/posix_socket.hpp"
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include "vault/relay.pb.h"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
namespace retrochat::vault::transport {

/**
 * @brief Minimal envelope relay that RelayTransport talks to.
 *
 * Routes each delivered envelope to the client registered for its `to`
 * address and answers peer key lookups from the keys announced in hello
 * frames. Nothing is stored: envelopes for offline peers are dropped.
 * A second hello for the same address replaces the earlier route.
 */
class RelayServer {
public:
    RelayServer() = default;
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    /** Returns the bound port, which differs from `port` when `port` is 0. */
    Result<uint16_t, VaultFailure> Start(uint16_t port = 0, bool loopback_only = true);

    void Stop();

    [[nodiscard]] size_t RegisteredCount() const;

private:
    struct Client {
        net::ScopedSocket socket;
        std::mutex write_mutex;
        std::string address;
        std::string identity_public_key_hex;
    };

    void AcceptLoop();
    void ClientLoop(const std::shared_ptr<Client>& client);
    Result<Unit, VaultFailure> Register(const std::shared_ptr<Client>& client, const proto::vault::RelayFrame& hello);
    void Route(const proto::vault::RelayFrame& frame);
    void AnswerPeerKey(const std::shared_ptr<Client>& client, const proto::vault::RelayFrame& frame);
    void Unregister(const std::shared_ptr<Client>& client);
    static Result<Unit, VaultFailure> Write(Client& client, const proto::vault::RelayFrame& frame);

    mutable std::mutex mutex_;
    net::ScopedSocket listener_;
    std::thread accept_thread_;
    std::vector<std::thread> client_threads_;
    std::vector<std::shared_ptr<Client>> clients_;
    std::map<std::string, std::shared_ptr<Client>> routes_;
    std::atomic<bool> stopping_{false};
};

}
