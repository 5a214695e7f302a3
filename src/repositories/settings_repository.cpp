#include "retrochat/repositories/settings_repository.hpp"
#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/hex.hpp"
#include "retrochat/core/proto_json.hpp"
#include "vault/records.pb.h"

namespace retrochat::vault::repositories {
    using storage::StoreName;

    namespace {
        Result<Unit, VaultFailure> ValidateKey(const std::string_view key) {
            if (key.empty()) {
                return Result<Unit, VaultFailure>::Err(VaultFailure::InvalidField("key", "Invalid setting key"));
            }
            return Result<Unit, VaultFailure>::Ok(unit);
        }
    }

    SettingsRepository::SettingsRepository(std::shared_ptr<storage::VaultStore> store)
        : store_(std::move(store)) {
    }

    Result<Unit, VaultFailure> SettingsRepository::Set(
        const crypto::SymmetricKey& dsk,
        const std::string_view key,
        const std::string_view value,
        const CancellationToken& token) {
        RETROCHAT_TRY(ValidateKey(key));
        proto::vault::SettingRecord record;
        record.set_key(std::string(key));
        record.set_value(std::string(value));
        auto json = proto_json::Serialize(record);
        RETROCHAT_TRY(json);
        std::string plaintext = std::move(json).Unwrap();
        auto stored = store_->Put(StoreName::Settings, key, dsk, hex::AsBytes(plaintext), kSettingsAad, token);
        RETROCHAT_TRY(crypto::SodiumInterop::Wipe(plaintext));
        return stored;
    }

    Result<std::optional<std::string>, VaultFailure> SettingsRepository::Get(
        const crypto::SymmetricKey& dsk,
        const std::string_view key,
        const CancellationToken& token) {
        using GetResult = Result<std::optional<std::string>, VaultFailure>;
        RETROCHAT_TRY(ValidateKey(key));
        auto opened = store_->Get(StoreName::Settings, key, dsk, kSettingsAad, token);
        RETROCHAT_TRY(opened);
        auto& plaintext = opened.Unwrap();
        if (!plaintext.has_value()) {
            return GetResult::Ok(std::nullopt);
        }
        std::string json(plaintext->begin(), plaintext->end());
        RETROCHAT_TRY(crypto::SodiumInterop::Wipe(*plaintext));
        proto::vault::SettingRecord record;
        auto parsed = proto_json::Parse(json, record);
        RETROCHAT_TRY(crypto::SodiumInterop::Wipe(json));
        RETROCHAT_TRY(parsed);
        if (record.key() != key) {
            return GetResult::Err(VaultFailure::Integrity(
                IntegrityKind::TamperDetected, "Setting record does not match its key."));
        }
        return GetResult::Ok(record.value());
    }

    Result<Unit, VaultFailure> SettingsRepository::Remove(const std::string_view key) {
        RETROCHAT_TRY(ValidateKey(key));
        return store_->Backend().Delete(StoreName::Settings, key);
    }
}
