#pragma once
#include "retrochat/crypto/symmetric_key.hpp"
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include "vault/envelope.pb.h"
#include <optional>
#include <string>
#include <string_view>
namespace retrochat::vault::protocol {

/** Message body encryption under a conversation key. */
class MessageSealer {
public:
    /**
     * Builds a complete v1 envelope: checksummed addresses, fresh 16-byte
     * nonce, AES-256-GCM body under `retrochat:messages:v1`. `ts` defaults to now.
     */
    [[nodiscard]] static Result<proto::vault::MessageEnvelope, VaultFailure> Seal(
        const crypto::SymmetricKey& conversation_key,
        std::string_view from_address,
        std::string_view to_address,
        std::string_view text,
        std::optional<std::string> ts = std::nullopt);

    [[nodiscard]] static Result<std::string, VaultFailure> Open(
        const crypto::SymmetricKey& conversation_key,
        const proto::vault::MessageEnvelope& envelope);
private:
    MessageSealer() = delete;
};

}
