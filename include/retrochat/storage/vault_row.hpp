#pragma once
#include "retrochat/crypto/aes_gcm.hpp"
#include <string>
namespace retrochat::vault::storage {

/**
 * One persisted record. `blob` is always AEAD output; timestamps are
 * ISO-8601 UTC strings and compare correctly as plain strings.
 */
struct VaultRow {
    std::string id;
    crypto::EncryptedBlob blob;
    std::string created_at;
    std::string updated_at;
};

}
