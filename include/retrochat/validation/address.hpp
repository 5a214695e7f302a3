#pragma once
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include <string>
#include <string_view>
namespace retrochat::vault::validation {

/** Shape check only: `0x` followed by exactly 40 hex digits. */
bool IsAddressFormat(std::string_view address) noexcept;

/**
 * Shape check plus EIP-55: an all-lowercase address is accepted as is,
 * anything containing uppercase must carry the correct checksum.
 */
bool IsAddress(std::string_view address);

/** EIP-55 mixed-case form. Requires IsAddressFormat. */
Result<std::string, VaultFailure> ToChecksumAddress(std::string_view address);

/** Trims, validates with IsAddress and returns the checksummed form. */
Result<std::string, VaultFailure> NormalizeAddress(std::string_view input);

std::string_view Trim(std::string_view text) noexcept;

}
