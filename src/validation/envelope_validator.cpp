#include "retrochat/validation/envelope_validator.hpp"
#include "retrochat/validation/address.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/hex.hpp"
#include "retrochat/core/proto_json.hpp"
#include "retrochat/core/timestamp.hpp"

namespace retrochat::vault::validation {
    namespace {
        Result<Unit, VaultFailure> Reject() {
            return Result<Unit, VaultFailure>::Err(
                VaultFailure::Validation(std::string(ErrorMessages::INVALID_MESSAGE_PAYLOAD)));
        }
    }

    bool EnvelopeValidator::IsSupportedVersion(const uint32_t version) noexcept {
        return version == kProtocolVersion;
    }

    Result<Unit, VaultFailure> EnvelopeValidator::Validate(const proto::vault::MessageEnvelope& envelope) {
        if (!IsSupportedVersion(envelope.v())) {
            return Reject();
        }
        if (!IsAddress(envelope.from_address()) || !IsAddress(envelope.to_address())) {
            return Reject();
        }
        if (!timestamp::IsIso8601Utc(envelope.ts())) {
            return Reject();
        }
        if (!hex::IsHexOfLength(envelope.nonce(), kMessageNonceBytes)
            || !hex::IsHexOfLength(envelope.iv(), kAesGcmNonceBytes)) {
            return Reject();
        }
        if (!hex::IsHex(envelope.ciphertext())) {
            return Reject();
        }
        if (envelope.has_aad() && !hex::IsHex(envelope.aad())) {
            return Reject();
        }
        return Result<Unit, VaultFailure>::Ok(Unit{});
    }

    Result<proto::vault::MessageEnvelope, VaultFailure> EnvelopeValidator::ParseJson(const std::string_view json) {
        proto::vault::MessageEnvelope envelope;
        if (proto_json::Parse(json, envelope).IsErr()) {
            return Result<proto::vault::MessageEnvelope, VaultFailure>::Err(
                VaultFailure::Validation(std::string(ErrorMessages::INVALID_MESSAGE_PAYLOAD)));
        }
        RETROCHAT_TRY(Validate(envelope));
        return Result<proto::vault::MessageEnvelope, VaultFailure>::Ok(std::move(envelope));
    }
}
