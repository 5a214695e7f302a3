#include <catch2/catch_test_macros.hpp>
#include "retrochat/core/hex.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/timestamp.hpp"
#include "retrochat/core/proto_json.hpp"
#include "vault/envelope.pb.h"
#include "vault/records.pb.h"
using namespace retrochat::vault;
TEST_CASE("Hex - Encoding", "[hex][core]") {
    SECTION("Lowercase output") {
        const std::vector<uint8_t> bytes = {0x00, 0xAB, 0x10, 0xFF};
        REQUIRE(hex::Encode(bytes) == "00ab10ff");
    }
    SECTION("Decode accepts either case") {
        auto decoded = hex::Decode("00AbfF");
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == std::vector<uint8_t>{0x00, 0xAB, 0xFF});
    }
    SECTION("Decode rejects odd length and stray characters") {
        REQUIRE(hex::Decode("abc").IsErr());
        auto bad = hex::Decode("zz");
        REQUIRE(bad.IsErr());
        REQUIRE(bad.UnwrapErr().type == VaultFailureType::Decode);
    }
    SECTION("Shape checks") {
        REQUIRE(hex::IsHex("deadbeef"));
        REQUIRE_FALSE(hex::IsHex(""));
        REQUIRE_FALSE(hex::IsHex("0xdead"));
        REQUIRE(hex::IsHexOfLength(std::string(24, 'a'), kAesGcmNonceBytes));
        REQUIRE_FALSE(hex::IsHexOfLength(std::string(22, 'a'), kAesGcmNonceBytes));
    }
    SECTION("StripPrefix") {
        REQUIRE(hex::StripPrefix("0xabc") == "abc");
        REQUIRE(hex::StripPrefix("0Xabc") == "abc");
        REQUIRE(hex::StripPrefix("abc") == "abc");
    }
}
TEST_CASE("Timestamp - ISO-8601 UTC", "[timestamp][core]") {
    SECTION("Now is well formed") {
        const auto now = timestamp::NowIso8601();
        REQUIRE(now.size() == 24);
        REQUIRE(now.back() == 'Z');
        REQUIRE(timestamp::IsIso8601Utc(now));
    }
    SECTION("Accepted forms") {
        REQUIRE(timestamp::IsIso8601Utc("2024-02-29T23:59:59Z"));
        REQUIRE(timestamp::IsIso8601Utc("2024-01-01T00:00:00.1Z"));
        REQUIRE(timestamp::IsIso8601Utc("2024-01-01T00:00:00.123456Z"));
    }
    SECTION("Rejected forms") {
        REQUIRE_FALSE(timestamp::IsIso8601Utc(""));
        REQUIRE_FALSE(timestamp::IsIso8601Utc("2023-02-29T00:00:00Z"));
        REQUIRE_FALSE(timestamp::IsIso8601Utc("2024-13-01T00:00:00Z"));
        REQUIRE_FALSE(timestamp::IsIso8601Utc("2024-01-01T24:00:00Z"));
        REQUIRE_FALSE(timestamp::IsIso8601Utc("2024-01-01T00:00:00+01:00"));
        REQUIRE_FALSE(timestamp::IsIso8601Utc("2024-01-01T00:00:00."));
        REQUIRE_FALSE(timestamp::IsIso8601Utc("2024-01-01 00:00:00Z"));
    }
    SECTION("Lexicographic order matches time order") {
        REQUIRE(std::string("2024-01-01T00:00:00.000Z") < std::string("2024-01-01T00:00:00.001Z"));
    }
}
TEST_CASE("ProtoJson - Envelope wire form", "[proto_json][core]") {
    proto::vault::MessageEnvelope envelope;
    envelope.set_v(1);
    envelope.set_from_address("0xaaaa");
    envelope.set_to_address("0xbbbb");
    envelope.set_ts("2024-01-01T00:00:00.000Z");
    envelope.set_nonce("00");
    envelope.set_iv("11");
    envelope.set_ciphertext("22");
    SECTION("Uses the short wire names") {
        auto json = proto_json::Serialize(envelope);
        REQUIRE(json.IsOk());
        REQUIRE(json.Unwrap().find("\"from\":\"0xaaaa\"") != std::string::npos);
        REQUIRE(json.Unwrap().find("\"to\":\"0xbbbb\"") != std::string::npos);
        REQUIRE(json.Unwrap().find("aad") == std::string::npos);
    }
    SECTION("Parse round trip") {
        proto::vault::MessageEnvelope parsed;
        REQUIRE(proto_json::Parse(proto_json::Serialize(envelope).Unwrap(), parsed).IsOk());
        REQUIRE(parsed.from_address() == "0xaaaa");
        REQUIRE(parsed.ciphertext() == "22");
    }
    SECTION("Strict mode rejects unknown keys") {
        proto::vault::SettingRecord record;
        const std::string json = R"({"key":"theme","value":"dark","extra":1})";
        REQUIRE(proto_json::Parse(json, record).IsOk());
        auto strict = proto_json::Parse(json, record, false);
        REQUIRE(strict.IsErr());
        REQUIRE(strict.UnwrapErr().type == VaultFailureType::Decode);
    }
    SECTION("Malformed JSON") {
        proto::vault::SettingRecord record;
        REQUIRE(proto_json::Parse("{not json", record).IsErr());
    }
}
