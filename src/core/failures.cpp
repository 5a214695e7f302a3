#include "retrochat/core/failures.hpp"

namespace retrochat::vault {
    std::string_view ToString(const VaultFailureType type) noexcept {
        switch (type) {
            case VaultFailureType::Validation: return "ValidationError";
            case VaultFailureType::Auth: return "AuthError";
            case VaultFailureType::Integrity: return "IntegrityError";
            case VaultFailureType::NotFound: return "NotFound";
            case VaultFailureType::Conflict: return "Conflict";
            case VaultFailureType::Transport: return "TransportError";
            case VaultFailureType::Critical: return "CriticalError";
            case VaultFailureType::KeyDerivation: return "KeyDerivationError";
            case VaultFailureType::Storage: return "StorageError";
            case VaultFailureType::Encode: return "EncodeError";
            case VaultFailureType::Decode: return "DecodeError";
            case VaultFailureType::InvalidState: return "InvalidState";
            case VaultFailureType::Cancelled: return "Cancelled";
            case VaultFailureType::Generic: return "Error";
        }
        return "Error";
    }
}
