#pragma once
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace retrochat::vault::hex {

/** Lowercase hex encoding. */
std::string Encode(std::span<const uint8_t> bytes);

/** Accepts either case; rejects odd length and non-hex characters. */
Result<std::vector<uint8_t>, VaultFailure> Decode(std::string_view text);

/** True for a non-empty, even-length string of hex digits. */
bool IsHex(std::string_view text) noexcept;

bool IsHexOfLength(std::string_view text, size_t byte_length) noexcept;

std::string_view StripPrefix(std::string_view text) noexcept;

std::string ToLower(std::string_view text);

inline std::span<const uint8_t> AsBytes(std::string_view text) noexcept {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

}
