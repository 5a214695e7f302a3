#include "retrochat/transport/posix_socket.hpp"
#include "retrochat/interfaces/i_transport.hpp"
#include "retrochat/core/format.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace retrochat::vault::transport::net {
    using interfaces::TransportErrorCodes;

    namespace {
        VaultFailure ConnectionFailed(const std::string_view what) {
            return VaultFailure::Transport(std::string(TransportErrorCodes::CONNECTION_FAILED),
                compat::format("{}: {}", what, std::strerror(errno)));
        }

        constexpr size_t kMaxChunk = static_cast<size_t>((std::numeric_limits<int>::max)());
    }

    void ScopedSocket::Shutdown() const noexcept {
        if (fd_ != kInvalidSocket) {
            ::shutdown(fd_, SHUT_RDWR);
        }
    }

    void ScopedSocket::Close() noexcept {
        if (fd_ != kInvalidSocket) {
            ::close(fd_);
            fd_ = kInvalidSocket;
        }
    }

    Result<ScopedSocket, VaultFailure> ConnectTcp(const std::string& host, const uint16_t port) {
        using SocketResult = Result<ScopedSocket, VaultFailure>;
        if (host.empty() || port == 0) {
            return SocketResult::Err(VaultFailure::Transport(
                std::string(TransportErrorCodes::CONNECTION_FAILED), "invalid endpoint"));
        }
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_protocol = IPPROTO_TCP;

        addrinfo* result = nullptr;
        const std::string port_str = std::to_string(port);
        if (getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result) != 0) {
            return SocketResult::Err(VaultFailure::Transport(
                std::string(TransportErrorCodes::CONNECTION_FAILED), "dns resolve failed"));
        }
        ScopedSocket connected;
        for (addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
            ScopedSocket sock(::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol));
            if (!sock.IsValid()) {
                continue;
            }
            if (::connect(sock.Get(), rp->ai_addr, rp->ai_addrlen) == 0) {
                connected = std::move(sock);
                break;
            }
        }
        freeaddrinfo(result);
        if (!connected.IsValid()) {
            return SocketResult::Err(ConnectionFailed("connect failed"));
        }
        return SocketResult::Ok(std::move(connected));
    }

    Result<ScopedSocket, VaultFailure> ListenTcp(const uint16_t port, const bool loopback_only) {
        using SocketResult = Result<ScopedSocket, VaultFailure>;
        ScopedSocket sock(::socket(AF_INET, SOCK_STREAM, 0));
        if (!sock.IsValid()) {
            return SocketResult::Err(ConnectionFailed("tcp socket failed"));
        }
        int yes = 1;
        (void)::setsockopt(sock.Get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(loopback_only ? INADDR_LOOPBACK : INADDR_ANY);
        if (::bind(sock.Get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            return SocketResult::Err(ConnectionFailed("bind failed"));
        }
        if (::listen(sock.Get(), 8) < 0) {
            return SocketResult::Err(ConnectionFailed("listen failed"));
        }
        return SocketResult::Ok(std::move(sock));
    }

    Result<uint16_t, VaultFailure> LocalPort(const Socket sock) {
        sockaddr_in addr{};
        socklen_t len = sizeof(addr);
        if (::getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
            return Result<uint16_t, VaultFailure>::Err(ConnectionFailed("getsockname failed"));
        }
        return Result<uint16_t, VaultFailure>::Ok(ntohs(addr.sin_port));
    }

    Result<ScopedSocket, VaultFailure> AcceptTcp(const Socket listen_sock) {
        ScopedSocket accepted(::accept(listen_sock, nullptr, nullptr));
        if (!accepted.IsValid()) {
            return Result<ScopedSocket, VaultFailure>::Err(ConnectionFailed("accept failed"));
        }
        return Result<ScopedSocket, VaultFailure>::Ok(std::move(accepted));
    }

    Result<Unit, VaultFailure> SetRecvTimeout(const Socket sock, const uint32_t timeout_ms) {
        timeval tv{};
        tv.tv_sec = static_cast<long>(timeout_ms / 1000u);
        tv.tv_usec = static_cast<long>((timeout_ms % 1000u) * 1000u);
        if (::setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, static_cast<socklen_t>(sizeof(tv))) != 0) {
            return Result<Unit, VaultFailure>::Err(ConnectionFailed("setsockopt failed"));
        }
        return Result<Unit, VaultFailure>::Ok(unit);
    }

    Result<Unit, VaultFailure> SendAll(const Socket sock, const std::span<const uint8_t> data) {
        size_t sent = 0;
        while (sent < data.size()) {
            const size_t chunk = std::min(data.size() - sent, kMaxChunk);
            const ssize_t n = ::send(sock, data.data() + sent, chunk, MSG_NOSIGNAL);
            if (n <= 0) {
                return Result<Unit, VaultFailure>::Err(VaultFailure::Transport(
                    std::string(TransportErrorCodes::SEND_FAILED),
                    compat::format("send failed: {}", std::strerror(errno))));
            }
            sent += static_cast<size_t>(n);
        }
        return Result<Unit, VaultFailure>::Ok(unit);
    }

    Result<Unit, VaultFailure> RecvExact(const Socket sock, const std::span<uint8_t> out) {
        size_t got = 0;
        while (got < out.size()) {
            const size_t chunk = std::min(out.size() - got, kMaxChunk);
            const ssize_t n = ::recv(sock, out.data() + got, chunk, 0);
            if (n == 0) {
                return Result<Unit, VaultFailure>::Err(VaultFailure::Transport(
                    std::string(TransportErrorCodes::CONNECTION_FAILED), "connection closed"));
            }
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return Result<Unit, VaultFailure>::Err(ConnectionFailed("recv failed"));
            }
            got += static_cast<size_t>(n);
        }
        return Result<Unit, VaultFailure>::Ok(unit);
    }
}
