#include <catch2/catch_test_macros.hpp>
#include "retrochat/transport/relay_frame_codec.hpp"
#include <sys/socket.h>
#include <array>
#include <string>
#include <vector>
using namespace retrochat::vault;
using namespace retrochat::vault::transport;
TEST_CASE("RelayFrameCodec - Length prefix", "[transport][relay][codec]") {
    proto::vault::RelayFrame frame;
    frame.set_request_id(7);
    frame.mutable_hello()->set_address("0x1111111111111111111111111111111111111111");

    auto encoded = RelayFrameCodec::Encode(frame);
    REQUIRE(encoded.IsOk());
    const auto& bytes = encoded.Unwrap();
    REQUIRE(bytes.size() == kRelayFrameHeaderBytes + frame.ByteSizeLong());
    const uint32_t length = (static_cast<uint32_t>(bytes[0]) << 24) | (static_cast<uint32_t>(bytes[1]) << 16)
        | (static_cast<uint32_t>(bytes[2]) << 8) | bytes[3];
    REQUIRE(length == frame.ByteSizeLong());

    const std::array<uint8_t, kRelayFrameHeaderBytes> header{bytes[0], bytes[1], bytes[2], bytes[3]};
    REQUIRE(RelayFrameCodec::DecodeLength(header).Unwrap() == length);

    auto decoded = RelayFrameCodec::DecodeBody(std::span<const uint8_t>(bytes).subspan(kRelayFrameHeaderBytes));
    REQUIRE(decoded.IsOk());
    REQUIRE(decoded.Unwrap().request_id() == 7);
    REQUIRE(decoded.Unwrap().body_case() == proto::vault::RelayFrame::kHello);
    REQUIRE(decoded.Unwrap().hello().address() == frame.hello().address());
}
TEST_CASE("RelayFrameCodec - Bounds", "[transport][relay][codec]") {
    SECTION("Empty frame cannot be encoded") {
        const proto::vault::RelayFrame empty;
        REQUIRE(RelayFrameCodec::Encode(empty).IsErr());
    }
    SECTION("Zero length header") {
        const std::array<uint8_t, kRelayFrameHeaderBytes> header{0, 0, 0, 0};
        REQUIRE(RelayFrameCodec::DecodeLength(header).UnwrapErr().type == VaultFailureType::Decode);
    }
    SECTION("Oversized header") {
        const std::array<uint8_t, kRelayFrameHeaderBytes> header{0x00, 0x10, 0x00, 0x01};
        REQUIRE(RelayFrameCodec::DecodeLength(header).IsErr());
        const std::array<uint8_t, kRelayFrameHeaderBytes> at_limit{0x00, 0x10, 0x00, 0x00};
        REQUIRE(RelayFrameCodec::DecodeLength(at_limit).Unwrap() == kMaxRelayFrameBytes);
    }
    SECTION("Truncated body") {
        const std::vector<uint8_t> truncated{0x08};
        REQUIRE(RelayFrameCodec::DecodeBody(truncated).IsErr());
    }
}
TEST_CASE("RelayFrameCodec - Over a socket pair", "[transport][relay][codec]") {
    int fds[2] = {-1, -1};
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    net::ScopedSocket left(fds[0]);
    net::ScopedSocket right(fds[1]);

    proto::vault::RelayFrame first;
    first.set_request_id(1);
    first.mutable_peer_key_request()->set_address("0x2222222222222222222222222222222222222222");
    proto::vault::RelayFrame second;
    second.mutable_error()->set_code("INVALID_ENVELOPE");
    second.mutable_error()->set_message("Unexpected relay frame.");

    REQUIRE(RelayFrameCodec::WriteFrame(left.Get(), first).IsOk());
    REQUIRE(RelayFrameCodec::WriteFrame(left.Get(), second).IsOk());

    auto read_first = RelayFrameCodec::ReadFrame(right.Get());
    REQUIRE(read_first.IsOk());
    REQUIRE(read_first.Unwrap().peer_key_request().address() == first.peer_key_request().address());
    auto read_second = RelayFrameCodec::ReadFrame(right.Get());
    REQUIRE(read_second.IsOk());
    REQUIRE(read_second.Unwrap().error().message() == "Unexpected relay frame.");

    SECTION("Peer closing mid-stream is an error") {
        const std::array<uint8_t, 2> partial{0x00, 0x00};
        REQUIRE(net::SendAll(left.Get(), partial).IsOk());
        left.Close();
        REQUIRE(RelayFrameCodec::ReadFrame(right.Get()).IsErr());
    }
}
