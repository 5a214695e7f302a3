#pragma once
#include <cstdint>
#include <optional>
#include <string>
namespace retrochat::vault::models {

struct Conversation {
    std::string id;
    std::string peer_address;
    uint32_t epoch = 0;
    std::optional<std::string> peer_public_key_hex;
    std::optional<std::string> title;
    std::string created_at;
    std::string updated_at;
};

}
