#pragma once
#include "retrochat/core/failures.hpp"
#include <string>
#include <string_view>
namespace retrochat::vault::validation {

/**
 * Strips secrets from free text before it is logged or shown.
 *
 * Input is trimmed and capped at 400 characters, then `0x` + 64 or more hex
 * digits becomes `0x[redacted]` and any run of 80+ hex or base64 characters
 * becomes `[redacted]`.
 */
std::string RedactSensitiveText(std::string_view input);

/** Redacted user-facing text for a failure; internal failure kinds collapse to a generic message. */
std::string SafeUserMessage(const VaultFailure& failure);

}
