#include "retrochat/session/key_hierarchy_manager.hpp"
#include "retrochat/crypto/digest.hpp"
#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/crypto/x25519.hpp"
#include "retrochat/validation/address.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/hex.hpp"
#include "retrochat/core/proto_json.hpp"
#include "retrochat/core/timestamp.hpp"
#include "retrochat/debug/vault_logger.hpp"
#include "vault/records.pb.h"

namespace retrochat::vault::session {
    using crypto::SodiumInterop;
    using crypto::SymmetricKey;
    using storage::StoreName;
    using storage::VaultStore;

    namespace {
        using KeyResult = Result<std::shared_ptr<const SymmetricKey>, VaultFailure>;
        using IdentityResult = Result<std::shared_ptr<const models::IdentityKeyPair>, VaultFailure>;

        void Wipe(std::vector<uint8_t>& buffer) {
            [[maybe_unused]] auto wiped = SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        }

        void Wipe(std::string& text) {
            [[maybe_unused]] auto wiped = SodiumInterop::SecureWipe(text);
        }

        Result<SymmetricKey, VaultFailure> DeriveSessionKey(
            const std::string_view signature_hex,
            std::string& fingerprint) {
            auto signature = hex::Decode(signature_hex);
            RETROCHAT_TRY(signature);
            std::vector<uint8_t> signature_bytes = std::move(signature).Unwrap();

            std::vector<uint8_t> input(kSessionKeyLabel.begin(), kSessionKeyLabel.end());
            input.insert(input.end(), signature_bytes.begin(), signature_bytes.end());
            Wipe(signature_bytes);

            auto digest = crypto::Digest::Sha256(input);
            Wipe(input);
            RETROCHAT_TRY(digest);
            std::vector<uint8_t> material = std::move(digest).Unwrap();

            fingerprint = hex::Encode(std::span<const uint8_t>(material).first(kSessionFingerprintBytes));
            auto key = SymmetricKey::FromBytes(material);
            Wipe(material);
            return key;
        }

        bool IsSignatureShape(const std::string_view signature) {
            std::string_view clean = signature;
            if (clean.size() >= 2 && clean[0] == '0' && clean[1] == 'x') {
                clean.remove_prefix(2);
            }
            return hex::IsHexOfLength(clean, kWalletSignatureBytes);
        }
    }

    KeyHierarchyManager::KeyHierarchyManager(std::shared_ptr<VaultStore> store)
        : store_(std::move(store)) {
        cancellation_.Cancel();
    }

    std::string KeyHierarchyManager::BuildChallenge(const std::string_view address) {
        return std::string(kChallengePrefix) + hex::ToLower(address);
    }

    Result<SessionInfo, VaultFailure> KeyHierarchyManager::Unlock(
        const std::string_view signature,
        const std::string_view address) {
        uint64_t generation = 0;
        CancellationToken token;
        {
            std::lock_guard lock(mutex_);
            generation = ++generation_;
            cancellation_.Reset();
            token = cancellation_.Token();
            info_ = SessionInfo{SessionStatus::Unlocking, {}, {}, {}};
            keys_ = UnlockedKeys{};
        }

        if (!validation::IsAddressFormat(address)) {
            return FailUnlock(generation,
                VaultFailure::InvalidField("address", std::string(ErrorMessages::INVALID_ADDRESS)));
        }
        if (!IsSignatureShape(signature)) {
            return FailUnlock(generation,
                VaultFailure::InvalidField("signature", std::string(ErrorMessages::INVALID_SIGNATURE)));
        }

        std::string fingerprint;
        auto session_key = DeriveSessionKey(hex::StripPrefix(signature), fingerprint);
        if (session_key.IsErr()) {
            return FailUnlock(generation, std::move(session_key).UnwrapErr());
        }
        auto shared_session_key = std::make_shared<const SymmetricKey>(std::move(session_key).Unwrap());

        bool created = false;
        auto dsk = GetOrCreateDeviceStorageKey(*shared_session_key, token, created);
        if (dsk.IsErr()) {
            return FailUnlock(generation, std::move(dsk).UnwrapErr());
        }

        SessionInfo info{SessionStatus::Unlocked, hex::ToLower(address), fingerprint, {}};
        {
            std::lock_guard lock(mutex_);
            if (generation != generation_ || token.IsCancelled()) {
                return Result<SessionInfo, VaultFailure>::Err(
                    VaultFailure::Cancelled(std::string(ErrorMessages::OPERATION_CANCELLED)));
            }
            info_ = info;
            keys_ = UnlockedKeys{shared_session_key, std::move(dsk).Unwrap(), nullptr};
        }
        debug::LogUnlocked(fingerprint, created);
        for (const auto& handler : Handlers()) {
            handler->OnSessionUnlocked(info.address);
        }
        return Result<SessionInfo, VaultFailure>::Ok(std::move(info));
    }

    Result<SessionInfo, VaultFailure> KeyHierarchyManager::FailUnlock(
        const uint64_t generation,
        VaultFailure failure) {
        {
            std::lock_guard lock(mutex_);
            if (generation == generation_) {
                info_ = SessionInfo{SessionStatus::Error, {}, {}, failure.message};
                keys_ = UnlockedKeys{};
                cancellation_.Cancel();
            }
        }
        RC_LOG_MSG(debug::Area::Session, "UNLOCK_FAILED", std::string(ToString(failure.type)));
        return Result<SessionInfo, VaultFailure>::Err(std::move(failure));
    }

    KeyResult KeyHierarchyManager::GetOrCreateDeviceStorageKey(
        const SymmetricKey& session_key,
        const CancellationToken& token,
        bool& created) {
        RETROCHAT_TRY(token.Check("dsk"));
        std::shared_ptr<const SymmetricKey> dsk;
        auto outcome = store_->Backend().RunInTransaction(StoreName::Keys,
            [&](interfaces::IStoreTransaction& transaction) -> Result<Unit, VaultFailure> {
                auto existing = transaction.Get(kDskRowId);
                RETROCHAT_TRY(existing);
                if (const auto& row = existing.Unwrap(); row.has_value()) {
                    auto opened = VaultStore::OpenRow(*row, session_key, kDskAad);
                    if (opened.IsErr()) {
                        if (opened.UnwrapErr().IsIntegrity(IntegrityKind::AeadAuthentication)) {
                            return Result<Unit, VaultFailure>::Err(
                                VaultFailure::Auth(std::string(ErrorMessages::WRONG_ACCOUNT)));
                        }
                        return Result<Unit, VaultFailure>::Err(VaultFailure::Integrity(
                            IntegrityKind::DecryptionFailed, std::string(ErrorMessages::DSK_CORRUPTED)));
                    }
                    std::vector<uint8_t> raw = std::move(opened).Unwrap();
                    auto key = SymmetricKey::FromBytes(raw);
                    Wipe(raw);
                    if (key.IsErr()) {
                        return Result<Unit, VaultFailure>::Err(VaultFailure::Integrity(
                            IntegrityKind::DecryptionFailed, std::string(ErrorMessages::DSK_CORRUPTED)));
                    }
                    dsk = std::make_shared<const SymmetricKey>(std::move(key).Unwrap());
                    return Result<Unit, VaultFailure>::Ok(Unit{});
                }

                RETROCHAT_TRY(token.Check("dsk create"));
                auto generated = SymmetricKey::Generate();
                RETROCHAT_TRY(generated);
                auto key = std::move(generated).Unwrap();
                auto raw = key.CopyBytes();
                RETROCHAT_TRY(raw);
                std::vector<uint8_t> raw_bytes = std::move(raw).Unwrap();
                const std::string now = timestamp::NowIso8601();
                auto row = VaultStore::SealRow(std::string(kDskRowId), session_key, raw_bytes, kDskAad, now, now);
                Wipe(raw_bytes);
                RETROCHAT_TRY(row);
                RETROCHAT_TRY(transaction.Put(row.Unwrap()));
                created = true;
                dsk = std::make_shared<const SymmetricKey>(std::move(key));
                return Result<Unit, VaultFailure>::Ok(Unit{});
            });
        if (outcome.IsErr()) {
            return KeyResult::Err(std::move(outcome).UnwrapErr());
        }
        return KeyResult::Ok(std::move(dsk));
    }

    void KeyHierarchyManager::Lock() {
        {
            std::lock_guard lock(mutex_);
            ++generation_;
            cancellation_.Cancel();
            info_ = SessionInfo{};
            keys_ = UnlockedKeys{};
        }
        RC_LOG_MSG(debug::Area::Session, "LOCK", "keys dropped");
        for (const auto& handler : Handlers()) {
            handler->OnSessionLocked();
        }
    }

    SessionInfo KeyHierarchyManager::Info() const {
        std::lock_guard lock(mutex_);
        return info_;
    }

    SessionStatus KeyHierarchyManager::Status() const {
        std::lock_guard lock(mutex_);
        return info_.status;
    }

    bool KeyHierarchyManager::IsUnlocked() const {
        return Status() == SessionStatus::Unlocked;
    }

    Result<std::string, VaultFailure> KeyHierarchyManager::Address() const {
        std::lock_guard lock(mutex_);
        if (info_.status != SessionStatus::Unlocked) {
            return Result<std::string, VaultFailure>::Err(
                VaultFailure::InvalidState(std::string(ErrorMessages::VAULT_LOCKED)));
        }
        return Result<std::string, VaultFailure>::Ok(info_.address);
    }

    KeyResult KeyHierarchyManager::GetDeviceStorageKey() const {
        std::lock_guard lock(mutex_);
        if (info_.status != SessionStatus::Unlocked || !keys_.dsk) {
            return KeyResult::Err(VaultFailure::InvalidState(std::string(ErrorMessages::VAULT_LOCKED)));
        }
        return KeyResult::Ok(keys_.dsk);
    }

    CancellationToken KeyHierarchyManager::SessionToken() const {
        std::lock_guard lock(mutex_);
        return cancellation_.Token();
    }

    Result<std::optional<std::shared_ptr<const models::IdentityKeyPair>>, VaultFailure>
    KeyHierarchyManager::LoadIdentity(const SymmetricKey& dsk, const CancellationToken& token) {
        using LoadResult = Result<std::optional<std::shared_ptr<const models::IdentityKeyPair>>, VaultFailure>;
        auto fetched = store_->Get(StoreName::Keys, kIdentityRowId, dsk, kIdentityAad, token);
        RETROCHAT_TRY(fetched);
        auto plaintext = std::move(fetched).Unwrap();
        if (!plaintext.has_value()) {
            return LoadResult::Ok(std::nullopt);
        }
        std::string json(plaintext->begin(), plaintext->end());
        Wipe(*plaintext);

        proto::vault::IdentityRecord record;
        auto parsed = proto_json::Parse(json, record);
        Wipe(json);
        if (parsed.IsErr()
            || !hex::IsHexOfLength(record.public_key_hex(), kX25519PublicKeyBytes)
            || !hex::IsHexOfLength(record.private_key_hex(), kX25519PrivateKeyBytes)) {
            Wipe(*record.mutable_private_key_hex());
            return LoadResult::Err(VaultFailure::Decode(std::string(ErrorMessages::INVALID_IDENTITY_RECORD)));
        }

        auto private_key = hex::Decode(record.private_key_hex());
        Wipe(*record.mutable_private_key_hex());
        RETROCHAT_TRY(private_key);
        std::vector<uint8_t> private_bytes = std::move(private_key).Unwrap();
        auto public_key = hex::Decode(record.public_key_hex());
        auto derived = crypto::X25519::DerivePublicKey(private_bytes);
        if (public_key.IsErr() || derived.IsErr() || derived.Unwrap() != public_key.Unwrap()) {
            Wipe(private_bytes);
            return LoadResult::Err(VaultFailure::Integrity(
                IntegrityKind::DecryptionFailed, std::string(ErrorMessages::INVALID_IDENTITY_RECORD)));
        }
        auto handle = crypto::SecureMemoryHandle::FromBytes(private_bytes);
        Wipe(private_bytes);
        if (handle.IsErr()) {
            return LoadResult::Err(VaultFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        return LoadResult::Ok(std::make_shared<const models::IdentityKeyPair>(
            std::move(handle).Unwrap(), std::move(public_key).Unwrap()));
    }

    IdentityResult KeyHierarchyManager::GetOrCreateIdentityKeyPair() {
        std::lock_guard identity_lock(identity_mutex_);
        std::shared_ptr<const SymmetricKey> dsk;
        CancellationToken token;
        uint64_t generation = 0;
        {
            std::lock_guard lock(mutex_);
            if (info_.status != SessionStatus::Unlocked || !keys_.dsk) {
                return IdentityResult::Err(VaultFailure::InvalidState(std::string(ErrorMessages::VAULT_LOCKED)));
            }
            if (keys_.identity) {
                return IdentityResult::Ok(keys_.identity);
            }
            dsk = keys_.dsk;
            token = cancellation_.Token();
            generation = generation_;
        }

        auto loaded = LoadIdentity(*dsk, token);
        RETROCHAT_TRY(loaded);
        std::shared_ptr<const models::IdentityKeyPair> identity;
        if (auto existing = std::move(loaded).Unwrap(); existing.has_value()) {
            identity = std::move(*existing);
        } else {
            auto generated = SodiumInterop::GenerateX25519KeyPair("identity");
            RETROCHAT_TRY(generated);
            auto [handle, public_key] = std::move(generated).Unwrap();
            auto private_key = handle.ReadBytes(handle.Size());
            if (private_key.IsErr()) {
                return IdentityResult::Err(VaultFailure::FromSodiumFailure(private_key.UnwrapErr()));
            }
            std::vector<uint8_t> private_bytes = std::move(private_key).Unwrap();

            proto::vault::IdentityRecord record;
            record.set_public_key_hex(hex::Encode(public_key));
            record.set_private_key_hex(hex::Encode(private_bytes));
            Wipe(private_bytes);
            auto json = proto_json::Serialize(record);
            Wipe(*record.mutable_private_key_hex());
            RETROCHAT_TRY(json);
            std::string payload = std::move(json).Unwrap();
            auto stored = store_->Put(StoreName::Keys, kIdentityRowId, *dsk,
                                      hex::AsBytes(payload), kIdentityAad, token);
            Wipe(payload);
            RETROCHAT_TRY(stored);
            RC_LOG_ID(debug::Area::Session, "IDENTITY", "created", std::string(kIdentityRowId));
            identity = std::make_shared<const models::IdentityKeyPair>(std::move(handle), std::move(public_key));
        }

        std::lock_guard lock(mutex_);
        if (generation != generation_) {
            return IdentityResult::Err(VaultFailure::Cancelled(std::string(ErrorMessages::OPERATION_CANCELLED)));
        }
        keys_.identity = identity;
        return IdentityResult::Ok(std::move(identity));
    }

    Result<std::optional<std::string>, VaultFailure> KeyHierarchyManager::GetIdentityPublicKey() {
        using PublicKeyResult = Result<std::optional<std::string>, VaultFailure>;
        std::shared_ptr<const SymmetricKey> dsk;
        CancellationToken token;
        {
            std::lock_guard lock(mutex_);
            if (info_.status != SessionStatus::Unlocked || !keys_.dsk) {
                return PublicKeyResult::Err(VaultFailure::InvalidState(std::string(ErrorMessages::VAULT_LOCKED)));
            }
            if (keys_.identity) {
                return PublicKeyResult::Ok(keys_.identity->GetPublicKeyHex());
            }
            dsk = keys_.dsk;
            token = cancellation_.Token();
        }
        auto loaded = LoadIdentity(*dsk, token);
        RETROCHAT_TRY(loaded);
        const auto& identity = loaded.Unwrap();
        if (!identity.has_value()) {
            return PublicKeyResult::Ok(std::nullopt);
        }
        return PublicKeyResult::Ok((*identity)->GetPublicKeyHex());
    }

    void KeyHierarchyManager::AddEventHandler(std::shared_ptr<interfaces::ISessionEventHandler> handler) {
        if (!handler) {
            return;
        }
        std::lock_guard lock(mutex_);
        handlers_.push_back(std::move(handler));
    }

    std::vector<std::shared_ptr<interfaces::ISessionEventHandler>> KeyHierarchyManager::Handlers() const {
        std::lock_guard lock(mutex_);
        return handlers_;
    }
}
