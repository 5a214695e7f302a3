#pragma once
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include "vault/envelope.pb.h"
#include <string>
namespace retrochat::vault::protocol {

/**
 * Content address of an envelope: lowercase hex SHA-256 over the UTF-8
 * text `nonce ‖ ciphertext`, exactly as the two hex fields are spelled.
 */
[[nodiscard]] Result<std::string, VaultFailure> DeriveMessageId(const proto::vault::MessageEnvelope& envelope);

}
