#include "retrochat/validation/redact.hpp"
#include "retrochat/validation/address.hpp"
#include "retrochat/core/constants.hpp"
#include <regex>

namespace retrochat::vault::validation {
    namespace {
        const std::regex& HexSecretPattern() {
            static const std::regex pattern(R"(\b0x[a-fA-F0-9]{64,}\b)");
            return pattern;
        }

        const std::regex& LongHexPattern() {
            static const std::regex pattern(R"(\b[a-fA-F0-9]{80,}\b)");
            return pattern;
        }

        const std::regex& Base64LikePattern() {
            static const std::regex pattern(R"(\b[A-Za-z0-9+/]{80,}={0,2}\b)");
            return pattern;
        }
    }

    std::string RedactSensitiveText(const std::string_view input) {
        const auto trimmed = Trim(input);
        std::string capped(trimmed.substr(0, kRedactionCap));
        if (trimmed.size() > kRedactionCap) {
            capped += "\xE2\x80\xA6";
        }
        std::string out = std::regex_replace(capped, HexSecretPattern(), "0x[redacted]");
        out = std::regex_replace(out, LongHexPattern(), "[redacted]");
        return std::regex_replace(out, Base64LikePattern(), "[redacted]");
    }

    std::string SafeUserMessage(const VaultFailure& failure) {
        switch (failure.type) {
            case VaultFailureType::Generic:
            case VaultFailureType::Storage:
            case VaultFailureType::Encode:
            case VaultFailureType::Decode:
                return std::string(ErrorMessages::GENERIC_USER_MESSAGE);
            default:
                break;
        }
        const auto trimmed = Trim(failure.message);
        if (trimmed.empty()) {
            return std::string(ErrorMessages::GENERIC_USER_MESSAGE);
        }
        return RedactSensitiveText(trimmed);
    }
}
