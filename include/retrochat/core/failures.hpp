#pragma once
#include <string>
#include <string_view>
namespace retrochat::vault {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    AllocationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class VaultFailureType {
    Validation,
    Auth,
    Integrity,
    NotFound,
    Conflict,
    Transport,
    Critical,
    KeyDerivation,
    Storage,
    Encode,
    Decode,
    InvalidState,
    Cancelled,
    Generic
};
enum class IntegrityKind {
    None,
    AeadAuthentication,
    TamperDetected,
    DecryptionFailed,
    HashMismatch
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class VaultFailure {
public:
    VaultFailureType type;
    std::string message;
    IntegrityKind integrity_kind = IntegrityKind::None;
    /** Transport error code (NOT_CONNECTED, SEND_FAILED, ...) or the offending field name. */
    std::string code;
    VaultFailure(const VaultFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    VaultFailure(const VaultFailureType t, std::string msg, const IntegrityKind kind, std::string c)
        : type(t), message(std::move(msg)), integrity_kind(kind), code(std::move(c)) {}
    static VaultFailure Validation(std::string msg) {
        return {VaultFailureType::Validation, std::move(msg)};
    }
    static VaultFailure InvalidField(std::string field, std::string msg) {
        return {VaultFailureType::Validation, std::move(msg), IntegrityKind::None, std::move(field)};
    }
    static VaultFailure Auth(std::string msg) {
        return {VaultFailureType::Auth, std::move(msg)};
    }
    static VaultFailure Integrity(const IntegrityKind kind, std::string msg) {
        return {VaultFailureType::Integrity, std::move(msg), kind, {}};
    }
    static VaultFailure AeadAuthentication() {
        return Integrity(IntegrityKind::AeadAuthentication, "AEAD authentication failed");
    }
    static VaultFailure NotFound(std::string msg) {
        return {VaultFailureType::NotFound, std::move(msg)};
    }
    static VaultFailure Conflict(std::string msg) {
        return {VaultFailureType::Conflict, std::move(msg)};
    }
    static VaultFailure Transport(std::string transport_code, std::string msg) {
        return {VaultFailureType::Transport, std::move(msg), IntegrityKind::None, std::move(transport_code)};
    }
    static VaultFailure Critical(std::string msg) {
        return {VaultFailureType::Critical, std::move(msg)};
    }
    static VaultFailure KeyDerivation(std::string field, std::string msg) {
        return {VaultFailureType::KeyDerivation, std::move(msg), IntegrityKind::None, std::move(field)};
    }
    static VaultFailure Storage(std::string msg) {
        return {VaultFailureType::Storage, std::move(msg)};
    }
    static VaultFailure Encode(std::string msg) {
        return {VaultFailureType::Encode, std::move(msg)};
    }
    static VaultFailure Decode(std::string msg) {
        return {VaultFailureType::Decode, std::move(msg)};
    }
    static VaultFailure InvalidState(std::string msg) {
        return {VaultFailureType::InvalidState, std::move(msg)};
    }
    static VaultFailure Cancelled(std::string msg) {
        return {VaultFailureType::Cancelled, std::move(msg)};
    }
    static VaultFailure Generic(std::string msg) {
        return {VaultFailureType::Generic, std::move(msg)};
    }
    static VaultFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
    [[nodiscard]] bool IsIntegrity(const IntegrityKind kind) const noexcept {
        return type == VaultFailureType::Integrity && integrity_kind == kind;
    }
};
std::string_view ToString(VaultFailureType type) noexcept;
}
