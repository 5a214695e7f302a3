#pragma once
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include "vault/envelope.pb.h"
#include <string_view>
namespace retrochat::vault::validation {

/**
 * @brief Schema check for envelopes crossing the trust boundary.
 *
 * Every violation yields the same ValidationError text so nothing about
 * the rejected payload leaks to the caller.
 */
class EnvelopeValidator {
public:
    [[nodiscard]] static Result<Unit, VaultFailure> Validate(
        const proto::vault::MessageEnvelope& envelope);

    /** Parses the JSON wire form and validates it. */
    [[nodiscard]] static Result<proto::vault::MessageEnvelope, VaultFailure> ParseJson(
        std::string_view json);

    [[nodiscard]] static bool IsSupportedVersion(uint32_t version) noexcept;
private:
    EnvelopeValidator() = delete;
};

}
