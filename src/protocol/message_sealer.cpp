#include "retrochat/protocol/message_sealer.hpp"
#include "retrochat/crypto/aes_gcm.hpp"
#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/validation/address.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/hex.hpp"
#include "retrochat/core/timestamp.hpp"

namespace retrochat::vault::protocol {
    using EnvelopeResult = Result<proto::vault::MessageEnvelope, VaultFailure>;

    EnvelopeResult MessageSealer::Seal(
        const crypto::SymmetricKey& conversation_key,
        const std::string_view from_address,
        const std::string_view to_address,
        const std::string_view text,
        std::optional<std::string> ts) {
        auto from = validation::NormalizeAddress(from_address);
        RETROCHAT_TRY(from);
        auto to = validation::NormalizeAddress(to_address);
        RETROCHAT_TRY(to);

        auto sealed = conversation_key.WithKey([&](const std::span<const uint8_t> key) {
            return crypto::AesGcm::Seal(key, hex::AsBytes(text), hex::AsBytes(kMessagesAad));
        });
        RETROCHAT_TRY(sealed);
        const crypto::EncryptedBlob blob = std::move(sealed).Unwrap();

        proto::vault::MessageEnvelope envelope;
        envelope.set_v(kProtocolVersion);
        envelope.set_from_address(std::move(from).Unwrap());
        envelope.set_to_address(std::move(to).Unwrap());
        envelope.set_ts(ts.has_value() ? std::move(*ts) : timestamp::NowIso8601());
        envelope.set_nonce(hex::Encode(crypto::SodiumInterop::GetRandomBytes(kMessageNonceBytes)));
        envelope.set_iv(hex::Encode(blob.iv));
        envelope.set_ciphertext(hex::Encode(blob.ciphertext));
        return EnvelopeResult::Ok(std::move(envelope));
    }

    Result<std::string, VaultFailure> MessageSealer::Open(
        const crypto::SymmetricKey& conversation_key,
        const proto::vault::MessageEnvelope& envelope) {
        auto iv = hex::Decode(envelope.iv());
        auto ciphertext = hex::Decode(envelope.ciphertext());
        if (iv.IsErr() || ciphertext.IsErr()) {
            return Result<std::string, VaultFailure>::Err(VaultFailure::AeadAuthentication());
        }
        const crypto::EncryptedBlob blob{std::move(iv).Unwrap(), std::move(ciphertext).Unwrap()};
        auto opened = conversation_key.WithKey([&](const std::span<const uint8_t> key) {
            return crypto::AesGcm::Open(key, blob, hex::AsBytes(kMessagesAad));
        });
        RETROCHAT_TRY(opened);
        std::vector<uint8_t> plaintext = std::move(opened).Unwrap();
        std::string text(plaintext.begin(), plaintext.end());
        RETROCHAT_TRY(crypto::SodiumInterop::Wipe(plaintext));
        return Result<std::string, VaultFailure>::Ok(std::move(text));
    }
}
