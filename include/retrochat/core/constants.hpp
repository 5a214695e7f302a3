#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace retrochat::vault {

inline constexpr uint32_t kProtocolVersion = 1;

inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kX25519SharedSecretBytes = 32;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;

inline constexpr size_t kSha256Bytes = 32;
inline constexpr size_t kKeccak256Bytes = 32;

inline constexpr size_t kSessionKeyBytes = 32;
inline constexpr size_t kDeviceStorageKeyBytes = 32;
inline constexpr size_t kConversationKeyBytes = 32;
inline constexpr size_t kConversationIdBytes = 16;
inline constexpr size_t kSessionFingerprintBytes = 8;
inline constexpr size_t kWalletSignatureBytes = 65;
inline constexpr size_t kAddressBytes = 20;

inline constexpr size_t kMessageNonceBytes = 16;

inline constexpr size_t kBackupSaltBytes = 16;
inline constexpr uint32_t kBackupPbkdf2Iterations = 200'000;
inline constexpr uint32_t kBackupMinIterations = 50'000;
inline constexpr uint32_t kBackupMaxIterations = 2'000'000;
inline constexpr size_t kMinPassphraseLength = 8;

inline constexpr size_t kDefaultMessagePageSize = 50;
inline constexpr size_t kDefaultDecryptBatchSize = 25;
inline constexpr size_t kTelemetryCapacity = 200;
inline constexpr size_t kProcessedIdCapacity = 1024;
inline constexpr size_t kRedactionCap = 400;

inline constexpr std::string_view kChallengePrefix = "Retrochat Vault v1::wallet=";
inline constexpr std::string_view kSessionKeyLabel = "retrochat:vault:session-key:v1";
inline constexpr std::string_view kDskAad = "retrochat:dsk:v1";
inline constexpr std::string_view kIdentityAad = "retrochat:identity:x25519:v1";
inline constexpr std::string_view kConversationSalt = "retrochat:conversation:salt:v1";
inline constexpr std::string_view kConversationInfoPrefix = "retrochat:conversation:hkdf:v1";
inline constexpr std::string_view kMessagesAad = "retrochat:messages:v1";
inline constexpr std::string_view kContactsAad = "retrochat:contacts:v1";
inline constexpr std::string_view kConversationsAad = "retrochat:conversations:v1";
inline constexpr std::string_view kSettingsAad = "retrochat:settings:v1";
inline constexpr std::string_view kBackupAad = "retrochat:backup:v1";

inline constexpr std::string_view kDskRowId = "dsk";
inline constexpr std::string_view kIdentityRowId = "identity-x25519";

inline constexpr std::string_view kBackupFileFormat = "retrochat.encrypted-backup";
inline constexpr std::string_view kBackupPayloadFormat = "retrochat.vault.payload";
inline constexpr std::string_view kBackupKdfName = "PBKDF2";
inline constexpr std::string_view kBackupKdfHash = "SHA-256";
inline constexpr std::string_view kBackupAeadName = "AES-GCM";
inline constexpr std::string_view kVaultDbName = "retrochat-vault";
inline constexpr uint32_t kVaultDbVersion = 3;

struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr size_t ERROR_BUFFER_SIZE = 256;
    static constexpr std::string_view ALGORITHM_HKDF = "HKDF";
    static constexpr std::string_view ALGORITHM_SHA256 = "SHA256";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view WRONG_ACCOUNT = "Wrong account or corrupted vault. Please reset the vault.";
    static constexpr std::string_view DSK_CORRUPTED = "Failed to decrypt DSK. The vault may be corrupted.";
    static constexpr std::string_view VAULT_LOCKED = "Vault is locked.";
    static constexpr std::string_view INVALID_MESSAGE_PAYLOAD = "Invalid message payload.";
    static constexpr std::string_view MESSAGE_TAMPERED = "Message ID mismatch: tampering detected.";
    static constexpr std::string_view MESSAGE_DECRYPT_FAILED =
        "Message decryption failed: tampering detected or wrong key.";
    static constexpr std::string_view CONTACT_EXISTS = "A contact with this address already exists.";
    static constexpr std::string_view CONTACT_NOT_FOUND = "Contact not found.";
    static constexpr std::string_view INVALID_ADDRESS = "Invalid wallet address format.";
    static constexpr std::string_view INVALID_SIGNATURE = "Invalid signature format.";
    static constexpr std::string_view INVALID_IDENTITY_RECORD = "Invalid identity key record.";
    static constexpr std::string_view PASSPHRASE_TOO_SHORT = "Passphrase must be at least 8 characters.";
    static constexpr std::string_view BACKUP_WRONG_PASSPHRASE =
        "Backup integrity check failed (wrong passphrase or tampered file).";
    static constexpr std::string_view BACKUP_HASH_MISMATCH = "Backup integrity check failed (hash mismatch).";
    static constexpr std::string_view OPERATION_CANCELLED = "Operation cancelled.";
    static constexpr std::string_view GENERIC_USER_MESSAGE = "Something went wrong.";
};

}
