#pragma once
#include <optional>
#include <string>
namespace retrochat::vault::models {

/** Address book entry. `address` is always EIP-55 checksummed. */
struct Contact {
    std::string id;
    std::string address;
    std::string label;
    std::optional<std::string> note;
    /** X25519 public key used for conversation keys, when known. */
    std::optional<std::string> public_key_hex;
    std::string created_at;
    std::string updated_at;
};

}
