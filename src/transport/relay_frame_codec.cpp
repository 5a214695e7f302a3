#include "retrochat/transport/relay_frame_codec.hpp"
#include "retrochat/core/format.hpp"

namespace retrochat::vault::transport {
    using FrameResult = Result<proto::vault::RelayFrame, VaultFailure>;

    Result<std::vector<uint8_t>, VaultFailure> RelayFrameCodec::Encode(const proto::vault::RelayFrame& frame) {
        using BytesResult = Result<std::vector<uint8_t>, VaultFailure>;
        const size_t body_size = frame.ByteSizeLong();
        if (body_size == 0 || body_size > kMaxRelayFrameBytes) {
            return BytesResult::Err(VaultFailure::Encode(
                compat::format("Relay frame size {} out of range", body_size)));
        }
        std::vector<uint8_t> out(kRelayFrameHeaderBytes + body_size);
        const auto length = static_cast<uint32_t>(body_size);
        out[0] = static_cast<uint8_t>(length >> 24);
        out[1] = static_cast<uint8_t>(length >> 16);
        out[2] = static_cast<uint8_t>(length >> 8);
        out[3] = static_cast<uint8_t>(length);
        if (!frame.SerializeToArray(out.data() + kRelayFrameHeaderBytes, static_cast<int>(body_size))) {
            return BytesResult::Err(VaultFailure::Encode("Failed to serialize relay frame"));
        }
        return BytesResult::Ok(std::move(out));
    }

    Result<uint32_t, VaultFailure> RelayFrameCodec::DecodeLength(
        const std::span<const uint8_t, kRelayFrameHeaderBytes> header) {
        const uint32_t length = (static_cast<uint32_t>(header[0]) << 24)
            | (static_cast<uint32_t>(header[1]) << 16)
            | (static_cast<uint32_t>(header[2]) << 8)
            | static_cast<uint32_t>(header[3]);
        if (length == 0 || length > kMaxRelayFrameBytes) {
            return Result<uint32_t, VaultFailure>::Err(VaultFailure::Decode(
                compat::format("Relay frame length {} out of range", length)));
        }
        return Result<uint32_t, VaultFailure>::Ok(length);
    }

    FrameResult RelayFrameCodec::DecodeBody(const std::span<const uint8_t> body) {
        proto::vault::RelayFrame frame;
        if (!frame.ParseFromArray(body.data(), static_cast<int>(body.size()))) {
            return FrameResult::Err(VaultFailure::Decode("Failed to parse relay frame"));
        }
        return FrameResult::Ok(std::move(frame));
    }

    Result<Unit, VaultFailure> RelayFrameCodec::WriteFrame(const net::Socket sock, const proto::vault::RelayFrame& frame) {
        auto encoded = Encode(frame);
        RETROCHAT_TRY(encoded);
        return net::SendAll(sock, encoded.Unwrap());
    }

    FrameResult RelayFrameCodec::ReadFrame(const net::Socket sock) {
        std::array<uint8_t, kRelayFrameHeaderBytes> header{};
        RETROCHAT_TRY(net::RecvExact(sock, header));
        auto length = DecodeLength(header);
        RETROCHAT_TRY(length);
        std::vector<uint8_t> body(length.Unwrap());
        RETROCHAT_TRY(net::RecvExact(sock, body));
        return DecodeBody(body);
    }
}
