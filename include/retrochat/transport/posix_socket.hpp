#pragma once
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <utility>
namespace retrochat::vault::transport::net {

using Socket = int;
inline constexpr Socket kInvalidSocket = -1;

/** Owns one file descriptor; closes it on destruction. */
class ScopedSocket {
public:
    ScopedSocket() = default;
    explicit ScopedSocket(const Socket fd) noexcept : fd_(fd) {}
    ScopedSocket(ScopedSocket&& other) noexcept : fd_(std::exchange(other.fd_, kInvalidSocket)) {}
    ScopedSocket& operator=(ScopedSocket&& other) noexcept {
        if (this != &other) {
            Close();
            fd_ = std::exchange(other.fd_, kInvalidSocket);
        }
        return *this;
    }
    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;
    ~ScopedSocket() { Close(); }

    [[nodiscard]] Socket Get() const noexcept { return fd_; }
    [[nodiscard]] bool IsValid() const noexcept { return fd_ != kInvalidSocket; }

    /** Wakes any thread blocked in recv on this socket. */
    void Shutdown() const noexcept;
    void Close() noexcept;
private:
    Socket fd_ = kInvalidSocket;
};

[[nodiscard]] Result<ScopedSocket, VaultFailure> ConnectTcp(const std::string& host, uint16_t port);

/** Port 0 picks an ephemeral port. */
[[nodiscard]] Result<ScopedSocket, VaultFailure> ListenTcp(uint16_t port, bool loopback_only);

[[nodiscard]] Result<uint16_t, VaultFailure> LocalPort(Socket sock);

[[nodiscard]] Result<ScopedSocket, VaultFailure> AcceptTcp(Socket listen_sock);

[[nodiscard]] Result<Unit, VaultFailure> SetRecvTimeout(Socket sock, uint32_t timeout_ms);

[[nodiscard]] Result<Unit, VaultFailure> SendAll(Socket sock, std::span<const uint8_t> data);

/** Fails when the peer closes the stream before `out` is filled. */
[[nodiscard]] Result<Unit, VaultFailure> RecvExact(Socket sock, std::span<uint8_t> out);

}
