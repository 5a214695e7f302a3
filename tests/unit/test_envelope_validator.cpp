#include <catch2/catch_test_macros.hpp>
#include "retrochat/validation/envelope_validator.hpp"
#include "retrochat/core/proto_json.hpp"
#include "retrochat/core/constants.hpp"
#include <string>
using namespace retrochat::vault;
using namespace retrochat::vault::validation;
namespace {
proto::vault::MessageEnvelope ValidEnvelope() {
    proto::vault::MessageEnvelope envelope;
    envelope.set_v(1);
    envelope.set_from_address("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
    envelope.set_to_address("0x2222222222222222222222222222222222222222");
    envelope.set_ts("2024-05-01T12:00:00.000Z");
    envelope.set_nonce(std::string(kMessageNonceBytes * 2, 'a'));
    envelope.set_iv(std::string(kAesGcmNonceBytes * 2, 'b'));
    envelope.set_ciphertext(std::string(42, 'c'));
    return envelope;
}
void RequireRejected(const proto::vault::MessageEnvelope& envelope) {
    auto result = EnvelopeValidator::Validate(envelope);
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == VaultFailureType::Validation);
    REQUIRE(result.UnwrapErr().message == "Invalid message payload.");
}
}
TEST_CASE("EnvelopeValidator - Accepts well-formed envelopes", "[envelope][validation]") {
    REQUIRE(EnvelopeValidator::Validate(ValidEnvelope()).IsOk());
    auto with_aad = ValidEnvelope();
    with_aad.set_aad("abcd");
    REQUIRE(EnvelopeValidator::Validate(with_aad).IsOk());
}
TEST_CASE("EnvelopeValidator - Every field is checked", "[envelope][validation]") {
    SECTION("Version") {
        auto envelope = ValidEnvelope();
        envelope.set_v(2);
        RequireRejected(envelope);
        REQUIRE_FALSE(EnvelopeValidator::IsSupportedVersion(0));
    }
    SECTION("Addresses") {
        auto bad_checksum = ValidEnvelope();
        bad_checksum.set_from_address("0x5AAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
        RequireRejected(bad_checksum);
        auto short_to = ValidEnvelope();
        short_to.set_to_address("0x222222222222222222222222222222222222222");
        RequireRejected(short_to);
    }
    SECTION("Timestamp") {
        auto envelope = ValidEnvelope();
        envelope.set_ts("yesterday");
        RequireRejected(envelope);
    }
    SECTION("Nonce and IV lengths") {
        auto nonce = ValidEnvelope();
        nonce.set_nonce(std::string(30, 'a'));
        RequireRejected(nonce);
        auto iv = ValidEnvelope();
        iv.set_iv(std::string(26, 'b'));
        RequireRejected(iv);
    }
    SECTION("Ciphertext must be non-empty hex") {
        auto empty = ValidEnvelope();
        empty.set_ciphertext("");
        RequireRejected(empty);
        auto not_hex = ValidEnvelope();
        not_hex.set_ciphertext("xyz0");
        RequireRejected(not_hex);
    }
    SECTION("AAD, when present, must be hex") {
        auto envelope = ValidEnvelope();
        envelope.set_aad("not hex");
        RequireRejected(envelope);
    }
}
TEST_CASE("EnvelopeValidator - JSON entry point", "[envelope][validation]") {
    SECTION("Valid JSON") {
        auto json = proto_json::Serialize(ValidEnvelope()).Unwrap();
        auto parsed = EnvelopeValidator::ParseJson(json);
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap().to_address() == "0x2222222222222222222222222222222222222222");
    }
    SECTION("Garbage gives the same error as a bad field") {
        auto parsed = EnvelopeValidator::ParseJson("[1,2,3]");
        REQUIRE(parsed.IsErr());
        REQUIRE(parsed.UnwrapErr().message == "Invalid message payload.");
    }
}
