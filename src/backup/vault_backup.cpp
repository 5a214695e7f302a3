#include "retrochat/backup/vault_backup.hpp"
#include "retrochat/crypto/aes_gcm.hpp"
#include "retrochat/crypto/digest.hpp"
#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/crypto/symmetric_key.hpp"
#include "retrochat/validation/address.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/format.hpp"
#include "retrochat/core/hex.hpp"
#include "retrochat/core/proto_json.hpp"
#include "retrochat/core/timestamp.hpp"
#include "retrochat/debug/vault_logger.hpp"

namespace retrochat::vault::backup {
    using storage::StoreName;
    using storage::VaultRow;
    using BackupRows = google::protobuf::RepeatedPtrField<proto::vault::BackupRow>;
    using FileResult = Result<proto::vault::EncryptedBackupFile, VaultFailure>;

    namespace {
        Result<Unit, VaultFailure> Invalid(std::string message) {
            return Result<Unit, VaultFailure>::Err(VaultFailure::Validation(std::move(message)));
        }

        Result<Unit, VaultFailure> CheckPassphrase(const std::string_view passphrase) {
            if (validation::Trim(passphrase).size() < kMinPassphraseLength) {
                return Result<Unit, VaultFailure>::Err(VaultFailure::InvalidField(
                    "passphrase", std::string(ErrorMessages::PASSPHRASE_TOO_SHORT)));
            }
            return Result<Unit, VaultFailure>::Ok(unit);
        }

        const BackupRows& RowsOf(const proto::vault::BackupStores& stores, const StoreName store) {
            switch (store) {
                case StoreName::Keys: return stores.keys();
                case StoreName::Contacts: return stores.contacts();
                case StoreName::Conversations: return stores.conversations();
                case StoreName::Messages: return stores.messages();
                case StoreName::Settings: return stores.settings();
            }
            return stores.keys();
        }

        BackupRows* MutableRowsOf(proto::vault::BackupStores& stores, const StoreName store) {
            switch (store) {
                case StoreName::Keys: return stores.mutable_keys();
                case StoreName::Contacts: return stores.mutable_contacts();
                case StoreName::Conversations: return stores.mutable_conversations();
                case StoreName::Messages: return stores.mutable_messages();
                case StoreName::Settings: return stores.mutable_settings();
            }
            return stores.mutable_keys();
        }

        void SerializeRow(const VaultRow& row, proto::vault::BackupRow& out) {
            out.set_id(row.id);
            out.mutable_blob()->set_iv_hex(hex::Encode(row.blob.iv));
            out.mutable_blob()->set_ciphertext_hex(hex::Encode(row.blob.ciphertext));
            out.set_created_at(row.created_at);
            out.set_updated_at(row.updated_at);
        }

        Result<VaultRow, VaultFailure> DeserializeRow(const proto::vault::BackupRow& row, const StoreName store) {
            using RowResult = Result<VaultRow, VaultFailure>;
            const std::string_view name = ToString(store);
            if (row.id().empty()) {
                return RowResult::Err(VaultFailure::Validation(compat::format("Invalid row id in store {}", name)));
            }
            if (!row.has_blob()) {
                return RowResult::Err(VaultFailure::Validation(
                    compat::format("Invalid blob structure in store {}", name)));
            }
            auto iv = hex::Decode(row.blob().iv_hex());
            if (iv.IsErr() || iv.Unwrap().size() != kAesGcmNonceBytes) {
                return RowResult::Err(VaultFailure::Validation(
                    compat::format("Invalid IV length in {} row (expected 12 bytes).", name)));
            }
            auto ciphertext = hex::Decode(row.blob().ciphertext_hex());
            if (ciphertext.IsErr() || ciphertext.Unwrap().empty()) {
                return RowResult::Err(VaultFailure::Validation(
                    compat::format("Invalid ciphertext length in {} row.", name)));
            }
            return RowResult::Ok(VaultRow{
                row.id(),
                crypto::EncryptedBlob{std::move(iv).Unwrap(), std::move(ciphertext).Unwrap()},
                row.created_at(),
                row.updated_at()
            });
        }

        Result<crypto::SymmetricKey, VaultFailure> DeriveBackupKey(
            const std::string_view passphrase,
            const std::span<const uint8_t> salt,
            const uint32_t iterations) {
            auto derived = crypto::Digest::Pbkdf2HmacSha256(passphrase, salt, iterations, kAesKeyBytes);
            RETROCHAT_TRY(derived);
            std::vector<uint8_t> key_bytes = std::move(derived).Unwrap();
            auto key = crypto::SymmetricKey::FromBytes(key_bytes);
            RETROCHAT_TRY(crypto::SodiumInterop::Wipe(key_bytes));
            return key;
        }
    }

    VaultBackup::VaultBackup(std::shared_ptr<interfaces::IVaultBackend> backend, configuration::VaultConfig config)
        : backend_(std::move(backend))
        , config_(std::move(config)) {
    }

    FileResult VaultBackup::Export(const std::string_view passphrase, const CancellationToken& token) {
        RETROCHAT_TRY(CheckPassphrase(passphrase));
        RC_LOG_SECTION(debug::Area::Backup, "EXPORT");

        proto::vault::BackupPayload payload;
        payload.set_format(std::string(kBackupPayloadFormat));
        payload.set_v(kProtocolVersion);
        payload.set_exported_at(timestamp::NowIso8601());
        payload.mutable_db()->set_name(std::string(kVaultDbName));
        payload.mutable_db()->set_version(kVaultDbVersion);
        proto::vault::BackupStores* stores = payload.mutable_stores();
        size_t row_count = 0;
        for (const StoreName store : storage::kAllStores) {
            RETROCHAT_TRY(token.Check("backup export"));
            auto rows = backend_->GetAll(store);
            RETROCHAT_TRY(rows);
            BackupRows* out = MutableRowsOf(*stores, store);
            for (const VaultRow& row : rows.Unwrap()) {
                SerializeRow(row, *out->Add());
            }
            row_count += rows.Unwrap().size();
        }
        debug::LogBackupRows("EXPORT", row_count);

        auto serialized = proto_json::Serialize(payload);
        RETROCHAT_TRY(serialized);
        std::string plaintext = std::move(serialized).Unwrap();
        auto hash = crypto::Digest::Sha256Hex(plaintext);
        RETROCHAT_TRY(hash);

        RETROCHAT_TRY(token.Check("backup export"));
        const std::vector<uint8_t> salt = crypto::SodiumInterop::GetRandomBytes(kBackupSaltBytes);
        const uint32_t iterations = config_.GetBackupIterations();
        auto key = DeriveBackupKey(passphrase, salt, iterations);
        RETROCHAT_TRY(key);

        RETROCHAT_TRY(token.Check("backup export"));
        auto sealed = key.Unwrap().WithKey([&](const std::span<const uint8_t> key_bytes) {
            return crypto::AesGcm::Seal(key_bytes, hex::AsBytes(plaintext), hex::AsBytes(kBackupAad));
        });
        RETROCHAT_TRY(crypto::SodiumInterop::Wipe(plaintext));
        RETROCHAT_TRY(sealed);
        const crypto::EncryptedBlob& blob = sealed.Unwrap();

        proto::vault::EncryptedBackupFile file;
        file.set_format(std::string(kBackupFileFormat));
        file.set_v(kProtocolVersion);
        file.set_created_at(timestamp::NowIso8601());
        file.mutable_kdf()->set_name(std::string(kBackupKdfName));
        file.mutable_kdf()->set_hash(std::string(kBackupKdfHash));
        file.mutable_kdf()->set_salt_hex(hex::Encode(salt));
        file.mutable_kdf()->set_iterations(iterations);
        file.mutable_aead()->set_name(std::string(kBackupAeadName));
        file.mutable_aead()->set_iv_hex(hex::Encode(blob.iv));
        file.mutable_aead()->set_aad_label(std::string(kBackupAad));
        file.set_ciphertext_hex(hex::Encode(blob.ciphertext));
        file.set_plaintext_hash_hex(std::move(hash).Unwrap());
        return FileResult::Ok(std::move(file));
    }

    Result<std::string, VaultFailure> VaultBackup::ExportJson(
        const std::string_view passphrase,
        const CancellationToken& token) {
        auto file = Export(passphrase, token);
        RETROCHAT_TRY(file);
        return proto_json::Serialize(file.Unwrap());
    }

    Result<Unit, VaultFailure> VaultBackup::ValidateFile(
        const proto::vault::EncryptedBackupFile& file,
        const configuration::VaultConfig& config) {
        if (file.format() != kBackupFileFormat) {
            return Invalid("Invalid backup format.");
        }
        if (file.v() != config.GetProtocolVersion()) {
            return Invalid("Unsupported backup version.");
        }
        if (!timestamp::IsIso8601Utc(file.created_at())) {
            return Invalid("Invalid createdAt.");
        }
        if (!file.has_kdf()) {
            return Invalid("Invalid kdf.");
        }
        if (file.kdf().name() != kBackupKdfName) {
            return Invalid("Unsupported kdf.");
        }
        if (file.kdf().hash() != kBackupKdfHash) {
            return Invalid("Unsupported kdf hash.");
        }
        if (file.kdf().iterations() < config.GetMinImportIterations()
            || file.kdf().iterations() > config.GetMaxImportIterations()) {
            return Invalid("Backup KDF iterations out of allowed range.");
        }
        if (!file.has_aead()) {
            return Invalid("Invalid aead.");
        }
        if (file.aead().name() != kBackupAeadName) {
            return Invalid("Unsupported aead.");
        }
        if (file.aead().aad_label() != kBackupAad) {
            return Invalid("Unexpected backup AAD label.");
        }
        if (!hex::IsHexOfLength(file.kdf().salt_hex(), kBackupSaltBytes)) {
            return Invalid("Invalid backup salt length (expected 16 bytes).");
        }
        if (!hex::IsHexOfLength(file.aead().iv_hex(), kAesGcmNonceBytes)) {
            return Invalid("Invalid backup IV length (expected 12 bytes).");
        }
        if (!hex::IsHex(file.ciphertext_hex())) {
            return Invalid("Invalid backup ciphertext length.");
        }
        if (!hex::IsHexOfLength(file.plaintext_hash_hex(), kSha256Bytes)) {
            return Invalid("Invalid backup hash length (expected 32 bytes).");
        }
        return Result<Unit, VaultFailure>::Ok(unit);
    }

    Result<PreparedRows, VaultFailure> VaultBackup::PreparePayload(const proto::vault::BackupPayload& payload) {
        using PreparedResult = Result<PreparedRows, VaultFailure>;
        if (payload.format() != kBackupPayloadFormat) {
            return PreparedResult::Err(VaultFailure::Validation("Invalid backup payload format."));
        }
        if (payload.v() != kProtocolVersion) {
            return PreparedResult::Err(VaultFailure::Validation("Unsupported backup payload version."));
        }
        if (payload.exported_at().empty()) {
            return PreparedResult::Err(VaultFailure::Validation("Invalid payload.exportedAt."));
        }
        if (!payload.has_db() || payload.db().name().empty()) {
            return PreparedResult::Err(VaultFailure::Validation("Invalid payload.db."));
        }
        if (!payload.has_stores()) {
            return PreparedResult::Err(VaultFailure::Validation("Invalid payload.stores."));
        }
        PreparedRows prepared;
        for (const StoreName store : storage::kAllStores) {
            std::vector<VaultRow>& rows = prepared[store];
            for (const auto& backup_row : RowsOf(payload.stores(), store)) {
                auto row = DeserializeRow(backup_row, store);
                if (row.IsErr()) {
                    return PreparedResult::Err(VaultFailure::Validation(compat::format(
                        "Failed to prepare backup data for store \"{}\": {}",
                        ToString(store), row.UnwrapErr().message)));
                }
                rows.push_back(std::move(row).Unwrap());
            }
        }
        return PreparedResult::Ok(std::move(prepared));
    }

    Result<Unit, VaultFailure> VaultBackup::Import(
        const std::string_view passphrase,
        const proto::vault::EncryptedBackupFile& file,
        const CancellationToken& token) {
        RETROCHAT_TRY(CheckPassphrase(passphrase));
        RETROCHAT_TRY(ValidateFile(file, config_));
        RC_LOG_SECTION(debug::Area::Backup, "IMPORT");

        auto salt = hex::Decode(file.kdf().salt_hex());
        RETROCHAT_TRY(salt);
        auto iv = hex::Decode(file.aead().iv_hex());
        RETROCHAT_TRY(iv);
        auto ciphertext = hex::Decode(file.ciphertext_hex());
        RETROCHAT_TRY(ciphertext);

        RETROCHAT_TRY(token.Check("backup import"));
        auto key = DeriveBackupKey(passphrase, salt.Unwrap(), file.kdf().iterations());
        RETROCHAT_TRY(key);

        RETROCHAT_TRY(token.Check("backup import"));
        const crypto::EncryptedBlob blob{std::move(iv).Unwrap(), std::move(ciphertext).Unwrap()};
        auto opened = key.Unwrap().WithKey([&](const std::span<const uint8_t> key_bytes) {
            return crypto::AesGcm::Open(key_bytes, blob, hex::AsBytes(kBackupAad));
        });
        if (opened.IsErr()) {
            return Result<Unit, VaultFailure>::Err(VaultFailure::Integrity(
                IntegrityKind::DecryptionFailed, std::string(ErrorMessages::BACKUP_WRONG_PASSPHRASE)));
        }
        std::vector<uint8_t> plaintext_bytes = std::move(opened).Unwrap();
        std::string plaintext(plaintext_bytes.begin(), plaintext_bytes.end());
        RETROCHAT_TRY(crypto::SodiumInterop::Wipe(plaintext_bytes));

        auto actual_hash = crypto::Digest::Sha256Hex(plaintext);
        RETROCHAT_TRY(actual_hash);
        const std::string expected_hash = hex::ToLower(file.plaintext_hash_hex());
        auto hash_matches = crypto::SodiumInterop::ConstantTimeEquals(
            hex::AsBytes(actual_hash.Unwrap()), hex::AsBytes(expected_hash));
        if (hash_matches.IsErr() || !hash_matches.Unwrap()) {
            return Result<Unit, VaultFailure>::Err(VaultFailure::Integrity(
                IntegrityKind::HashMismatch, std::string(ErrorMessages::BACKUP_HASH_MISMATCH)));
        }

        proto::vault::BackupPayload payload;
        auto parsed = proto_json::Parse(plaintext, payload, false);
        RETROCHAT_TRY(crypto::SodiumInterop::Wipe(plaintext));
        if (parsed.IsErr()) {
            return Result<Unit, VaultFailure>::Err(VaultFailure::Decode("Backup payload is not valid JSON."));
        }
        auto prepared = PreparePayload(payload);
        RETROCHAT_TRY(prepared);

        size_t row_count = 0;
        for (const auto& [store, rows] : prepared.Unwrap()) {
            row_count += rows.size();
        }
        debug::LogBackupRows("IMPORT", row_count);

        RETROCHAT_TRY(token.Check("backup import"));
        auto replaced = backend_->ReplaceAll(prepared.Unwrap());
        if (replaced.IsErr()) {
            return Result<Unit, VaultFailure>::Err(VaultFailure::Critical(compat::format(
                "Critical error during backup restoration: {}", replaced.UnwrapErr().message)));
        }
        return Result<Unit, VaultFailure>::Ok(unit);
    }

    Result<Unit, VaultFailure> VaultBackup::ImportJson(
        const std::string_view passphrase,
        const std::string_view file_json,
        const CancellationToken& token) {
        RETROCHAT_TRY(CheckPassphrase(passphrase));
        proto::vault::EncryptedBackupFile file;
        auto parsed = proto_json::Parse(file_json, file);
        if (parsed.IsErr()) {
            return Result<Unit, VaultFailure>::Err(VaultFailure::Validation("Invalid backup file: expected object."));
        }
        return Import(passphrase, file, token);
    }

    Result<Unit, VaultFailure> VaultBackup::ResetVault() {
        RC_LOG_MSG(debug::Area::Backup, "RESET", "clearing all stores");
        return backend_->Clear();
    }
}
