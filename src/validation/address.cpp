#include "retrochat/validation/address.hpp"
#include "retrochat/crypto/keccak.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/hex.hpp"
#include <cctype>

namespace retrochat::vault::validation {
    namespace {
        constexpr size_t kAddressHexChars = kAddressBytes * 2;

        bool IsHexDigit(const char c) noexcept {
            return std::isxdigit(static_cast<unsigned char>(c)) != 0;
        }
    }

    std::string_view Trim(std::string_view text) noexcept {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
            text.remove_prefix(1);
        }
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
            text.remove_suffix(1);
        }
        return text;
    }

    bool IsAddressFormat(const std::string_view address) noexcept {
        if (address.size() != kAddressHexChars + 2 || address[0] != '0' || address[1] != 'x') {
            return false;
        }
        for (size_t i = 2; i < address.size(); ++i) {
            if (!IsHexDigit(address[i])) {
                return false;
            }
        }
        return true;
    }

    Result<std::string, VaultFailure> ToChecksumAddress(const std::string_view address) {
        if (!IsAddressFormat(address)) {
            return Result<std::string, VaultFailure>::Err(
                VaultFailure::InvalidField("address", std::string(ErrorMessages::INVALID_ADDRESS)));
        }
        const std::string lower = hex::ToLower(address.substr(2));
        const auto digest = crypto::Keccak256(hex::AsBytes(lower));
        std::string out = "0x";
        out.reserve(kAddressHexChars + 2);
        for (size_t i = 0; i < lower.size(); ++i) {
            const uint8_t byte = digest[i / 2];
            const uint8_t nibble = (i % 2 == 0) ? (byte >> 4) : (byte & 0x0F);
            const char c = lower[i];
            if (c >= 'a' && c <= 'f' && nibble >= 8) {
                out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
            } else {
                out.push_back(c);
            }
        }
        return Result<std::string, VaultFailure>::Ok(std::move(out));
    }

    bool IsAddress(const std::string_view address) {
        if (!IsAddressFormat(address)) {
            return false;
        }
        if (hex::ToLower(address) == address) {
            return true;
        }
        auto checksummed = ToChecksumAddress(address);
        return checksummed.IsOk() && checksummed.Unwrap() == address;
    }

    Result<std::string, VaultFailure> NormalizeAddress(const std::string_view input) {
        const auto trimmed = Trim(input);
        if (!IsAddress(trimmed)) {
            return Result<std::string, VaultFailure>::Err(
                VaultFailure::InvalidField("address", std::string(ErrorMessages::INVALID_ADDRESS)));
        }
        return ToChecksumAddress(trimmed);
    }
}
