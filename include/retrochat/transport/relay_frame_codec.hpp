#pragma once
#include "retrochat/transport/posix_socket.hpp"
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include "vault/relay.pb.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
namespace retrochat::vault::transport {

inline constexpr size_t kRelayFrameHeaderBytes = 4;
inline constexpr uint32_t kMaxRelayFrameBytes = 1U << 20;

/** `u32 big-endian length ‖ RelayFrame` framing over a byte stream. */
class RelayFrameCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, VaultFailure> Encode(const proto::vault::RelayFrame& frame);

    /** Rejects empty frames and frames above kMaxRelayFrameBytes. */
    [[nodiscard]] static Result<uint32_t, VaultFailure> DecodeLength(
        std::span<const uint8_t, kRelayFrameHeaderBytes> header);

    [[nodiscard]] static Result<proto::vault::RelayFrame, VaultFailure> DecodeBody(std::span<const uint8_t> body);

    [[nodiscard]] static Result<Unit, VaultFailure> WriteFrame(net::Socket sock, const proto::vault::RelayFrame& frame);

    /** Blocks until one whole frame has arrived. */
    [[nodiscard]] static Result<proto::vault::RelayFrame, VaultFailure> ReadFrame(net::Socket sock);
private:
    RelayFrameCodec() = delete;
};

}
