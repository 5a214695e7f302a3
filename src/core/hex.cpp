#include "retrochat/core/hex.hpp"
#include "retrochat/core/format.hpp"
#include <cctype>

namespace retrochat::vault::hex {
    namespace {
        constexpr char kHexDigits[] = "0123456789abcdef";

        int NibbleValue(const char c) noexcept {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f') {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F') {
                return c - 'A' + 10;
            }
            return -1;
        }
    }

    std::string Encode(const std::span<const uint8_t> bytes) {
        std::string out;
        out.reserve(bytes.size() * 2);
        for (const auto byte : bytes) {
            out.push_back(kHexDigits[(byte >> 4) & 0x0F]);
            out.push_back(kHexDigits[byte & 0x0F]);
        }
        return out;
    }

    Result<std::vector<uint8_t>, VaultFailure> Decode(const std::string_view text) {
        if (text.size() % 2 != 0) {
            return Result<std::vector<uint8_t>, VaultFailure>::Err(
                VaultFailure::Decode("Invalid hex string length."));
        }
        std::vector<uint8_t> out(text.size() / 2);
        for (size_t i = 0; i < out.size(); ++i) {
            const int high = NibbleValue(text[i * 2]);
            const int low = NibbleValue(text[i * 2 + 1]);
            if (high < 0 || low < 0) {
                return Result<std::vector<uint8_t>, VaultFailure>::Err(
                    VaultFailure::Decode(compat::format("Invalid hex character at offset {}", i * 2)));
            }
            out[i] = static_cast<uint8_t>((high << 4) | low);
        }
        return Result<std::vector<uint8_t>, VaultFailure>::Ok(std::move(out));
    }

    bool IsHex(const std::string_view text) noexcept {
        if (text.empty() || text.size() % 2 != 0) {
            return false;
        }
        for (const char c : text) {
            if (NibbleValue(c) < 0) {
                return false;
            }
        }
        return true;
    }

    bool IsHexOfLength(const std::string_view text, const size_t byte_length) noexcept {
        return text.size() == byte_length * 2 && IsHex(text);
    }

    std::string_view StripPrefix(const std::string_view text) noexcept {
        if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
            return text.substr(2);
        }
        return text;
    }

    std::string ToLower(const std::string_view text) {
        std::string out(text);
        for (auto& c : out) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return out;
    }
}
