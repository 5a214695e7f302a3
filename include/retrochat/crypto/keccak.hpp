#pragma once
#include <array>
#include <cstdint>
#include <span>
namespace retrochat::vault::crypto {

/**
 * Original Keccak-256 (0x01 domain padding, not FIPS-202 SHA3-256), as used
 * for Ethereum address checksums. Served by OpenSSL's KECCAK-256 digest when
 * the default provider has it.
 */
std::array<uint8_t, 32> Keccak256(std::span<const uint8_t> data) noexcept;

/** In-tree sponge behind Keccak256 when the OpenSSL provider has no KECCAK-256 (before 3.2). */
std::array<uint8_t, 32> Keccak256Sponge(std::span<const uint8_t> data) noexcept;

}
