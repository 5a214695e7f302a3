#pragma once
#include "retrochat/crypto/symmetric_key.hpp"
#include "retrochat/models/identity_key_pair.hpp"
#include "retrochat/interfaces/i_session_event_handler.hpp"
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
namespace retrochat::vault::protocol {

/** Per-pair message key and its public identifier. Never persisted. */
struct ConversationKeySpec {
    std::shared_ptr<const crypto::SymmetricKey> key;
    std::string id;
};

/**
 * @brief Deterministic conversation key agreement.
 *
 * key = HKDF-SHA256(X25519(my, peer), salt, info) with
 * info = "retrochat:conversation:hkdf:v1|<a>|<b>|epoch=<n>", where a and b are
 * the two lowercase addresses in sorted order. Both parties therefore derive
 * the same key without a handshake. The id is the hex of the first 16 key
 * bytes. A new epoch gives a new key and id.
 */
class ConversationKeys {
public:
    [[nodiscard]] static Result<ConversationKeySpec, VaultFailure> Derive(
        std::span<const uint8_t> my_private_key,
        std::span<const uint8_t> peer_public_key,
        std::string_view my_address,
        std::string_view peer_address,
        int64_t epoch = 0);

    [[nodiscard]] static std::string BuildInfo(
        std::string_view my_address,
        std::string_view peer_address,
        int64_t epoch);
private:
    ConversationKeys() = delete;
};

/**
 * @brief Session-scoped cache of derived conversation keys.
 *
 * Keyed by (my address, peer address, epoch, peer public key). The most
 * recent key for each address pair is also reachable without the peer key.
 * Registered as a session event handler so it empties on every lock and
 * unlock.
 */
class ConversationKeyCache final : public interfaces::ISessionEventHandler {
public:
    Result<ConversationKeySpec, VaultFailure> GetOrDerive(
        const models::IdentityKeyPair& identity,
        std::span<const uint8_t> peer_public_key,
        std::string_view my_address,
        std::string_view peer_address,
        int64_t epoch = 0);

    /** Last key derived for the address pair, if any. */
    [[nodiscard]] std::optional<ConversationKeySpec> Find(
        std::string_view my_address,
        std::string_view peer_address,
        int64_t epoch = 0) const;

    void Clear();

    [[nodiscard]] size_t Size() const;

    void OnSessionUnlocked(const std::string& address) override;
    void OnSessionLocked() override;
private:
    mutable std::mutex mutex_;
    std::map<std::string, ConversationKeySpec> entries_;
    std::map<std::string, ConversationKeySpec> by_pair_;
};

}
