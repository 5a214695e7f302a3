#include "retrochat/protocol/conversation_keys.hpp"
#include "retrochat/crypto/hkdf.hpp"
#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/crypto/x25519.hpp"
#include "retrochat/validation/address.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/format.hpp"
#include "retrochat/core/hex.hpp"

namespace retrochat::vault::protocol {
    namespace {
        std::string PairKey(const std::string_view my_address, const std::string_view peer_address, const int64_t epoch) {
            return compat::format("{}|{}|{}", hex::ToLower(my_address), hex::ToLower(peer_address), epoch);
        }

        void Wipe(std::vector<uint8_t>& buffer) {
            [[maybe_unused]] auto wiped = crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
        }

        Result<Unit, VaultFailure> ValidateAddress(const std::string_view address, const std::string_view field) {
            if (!validation::IsAddressFormat(address)) {
                return Result<Unit, VaultFailure>::Err(VaultFailure::KeyDerivation(
                    std::string(field),
                    compat::format("Invalid {}: not a valid address format", field)));
            }
            return Result<Unit, VaultFailure>::Ok(Unit{});
        }
    }

    std::string ConversationKeys::BuildInfo(
        const std::string_view my_address,
        const std::string_view peer_address,
        const int64_t epoch) {
        std::string a = hex::ToLower(my_address);
        std::string b = hex::ToLower(peer_address);
        if (b < a) {
            std::swap(a, b);
        }
        return compat::format("{}|{}|{}|epoch={}", kConversationInfoPrefix, a, b, epoch);
    }

    Result<ConversationKeySpec, VaultFailure> ConversationKeys::Derive(
        const std::span<const uint8_t> my_private_key,
        const std::span<const uint8_t> peer_public_key,
        const std::string_view my_address,
        const std::string_view peer_address,
        const int64_t epoch) {
        RETROCHAT_TRY(crypto::X25519::ValidateKey(my_private_key, "myPrivateKey"));
        RETROCHAT_TRY(crypto::X25519::ValidateKey(peer_public_key, "peerPublicKey"));
        RETROCHAT_TRY(ValidateAddress(my_address, "myAddress"));
        RETROCHAT_TRY(ValidateAddress(peer_address, "peerAddress"));
        if (epoch < 0) {
            return Result<ConversationKeySpec, VaultFailure>::Err(VaultFailure::KeyDerivation(
                "epoch", "Invalid epoch: must be a non-negative integer"));
        }

        auto shared = crypto::X25519::ComputeSharedSecret(my_private_key, peer_public_key);
        RETROCHAT_TRY(shared);
        std::vector<uint8_t> shared_secret = std::move(shared).Unwrap();

        const std::string info = BuildInfo(my_address, peer_address, epoch);
        auto derived = crypto::Hkdf::DeriveKeyBytes(
            shared_secret, kConversationKeyBytes, hex::AsBytes(kConversationSalt), hex::AsBytes(info));
        Wipe(shared_secret);
        RETROCHAT_TRY(derived);
        std::vector<uint8_t> material = std::move(derived).Unwrap();

        std::string id = hex::Encode(std::span<const uint8_t>(material).first(kConversationIdBytes));
        auto key = crypto::SymmetricKey::FromBytes(material);
        Wipe(material);
        RETROCHAT_TRY(key);
        return Result<ConversationKeySpec, VaultFailure>::Ok(ConversationKeySpec{
            std::make_shared<const crypto::SymmetricKey>(std::move(key).Unwrap()),
            std::move(id)
        });
    }

    Result<ConversationKeySpec, VaultFailure> ConversationKeyCache::GetOrDerive(
        const models::IdentityKeyPair& identity,
        const std::span<const uint8_t> peer_public_key,
        const std::string_view my_address,
        const std::string_view peer_address,
        const int64_t epoch) {
        const std::string pair_key = PairKey(my_address, peer_address, epoch);
        const std::string cache_key = compat::format("{}|{}", pair_key, hex::Encode(peer_public_key));
        {
            std::lock_guard lock(mutex_);
            if (const auto it = entries_.find(cache_key); it != entries_.end()) {
                by_pair_.insert_or_assign(pair_key, it->second);
                return Result<ConversationKeySpec, VaultFailure>::Ok(it->second);
            }
        }
        auto derived = identity.GetPrivateKeyHandle().WithReadAccess(
            [&](const std::span<const uint8_t> private_key) {
                return ConversationKeys::Derive(private_key, peer_public_key, my_address, peer_address, epoch);
            });
        if (derived.IsErr()) {
            return Result<ConversationKeySpec, VaultFailure>::Err(
                VaultFailure::FromSodiumFailure(derived.UnwrapErr()));
        }
        auto outcome = std::move(derived).Unwrap();
        RETROCHAT_TRY(outcome);
        std::lock_guard lock(mutex_);
        const auto [it, inserted] = entries_.emplace(cache_key, outcome.Unwrap());
        by_pair_.insert_or_assign(pair_key, it->second);
        return Result<ConversationKeySpec, VaultFailure>::Ok(it->second);
    }

    std::optional<ConversationKeySpec> ConversationKeyCache::Find(
        const std::string_view my_address,
        const std::string_view peer_address,
        const int64_t epoch) const {
        std::lock_guard lock(mutex_);
        if (const auto it = by_pair_.find(PairKey(my_address, peer_address, epoch)); it != by_pair_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    void ConversationKeyCache::Clear() {
        std::lock_guard lock(mutex_);
        entries_.clear();
        by_pair_.clear();
    }

    size_t ConversationKeyCache::Size() const {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    void ConversationKeyCache::OnSessionUnlocked(const std::string&) {
        Clear();
    }

    void ConversationKeyCache::OnSessionLocked() {
        Clear();
    }
}
