#include "retrochat/protocol/message_id.hpp"
#include "retrochat/crypto/digest.hpp"

namespace retrochat::vault::protocol {
    Result<std::string, VaultFailure> DeriveMessageId(const proto::vault::MessageEnvelope& envelope) {
        return crypto::Digest::Sha256Hex(envelope.nonce() + envelope.ciphertext());
    }
}
