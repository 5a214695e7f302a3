#pragma once
#include "retrochat/storage/vault_store.hpp"
#include "retrochat/crypto/symmetric_key.hpp"
#include "retrochat/models/identity_key_pair.hpp"
#include "retrochat/interfaces/i_session_event_handler.hpp"
#include "retrochat/core/cancellation.hpp"
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace retrochat::vault::session {

enum class SessionStatus {
    Locked,
    Unlocking,
    Unlocked,
    Error
};

/** Non-secret view of the session. `error` is set only in the Error state. */
struct SessionInfo {
    SessionStatus status = SessionStatus::Locked;
    std::string address;
    std::string fingerprint;
    std::string error;
};

/**
 * @brief Owns the key hierarchy for one vault.
 *
 * wallet signature -> session key -> device storage key (DSK) -> identity
 * key pair. The session key and DSK live only in guarded memory and only
 * while Unlocked. Other components borrow the DSK and identity through
 * shared handles that stay valid for the call that obtained them.
 *
 * State machine: Locked -> Unlocking -> Unlocked | Error -> Locked, and
 * Unlocked -> Unlocking for a re-unlock. Lock() is valid in every state.
 */
class KeyHierarchyManager {
public:
    explicit KeyHierarchyManager(std::shared_ptr<storage::VaultStore> store);

    KeyHierarchyManager(const KeyHierarchyManager&) = delete;
    KeyHierarchyManager& operator=(const KeyHierarchyManager&) = delete;

    /** The text the wallet signs: `Retrochat Vault v1::wallet=<lowercase address>`. */
    [[nodiscard]] static std::string BuildChallenge(std::string_view address);

    /**
     * @brief Derives the session key from `signature` and opens the DSK.
     *
     * `address` must be `0x` + 40 hex digits and `signature` 65 bytes of hex
     * with an optional `0x`; malformed input fails before any storage access.
     * A DSK that does not authenticate under the derived key is an Auth
     * failure. Every failure leaves the session in the Error state.
     */
    Result<SessionInfo, VaultFailure> Unlock(std::string_view signature, std::string_view address);

    /** Drops every key, cancels work bound to the session and notifies handlers. Idempotent. */
    void Lock();

    [[nodiscard]] SessionInfo Info() const;

    [[nodiscard]] SessionStatus Status() const;

    [[nodiscard]] bool IsUnlocked() const;

    /** Lowercase address of the unlocked session. */
    [[nodiscard]] Result<std::string, VaultFailure> Address() const;

    [[nodiscard]] Result<std::shared_ptr<const crypto::SymmetricKey>, VaultFailure> GetDeviceStorageKey() const;

    /** Cancelled as soon as the session is locked or re-unlocked. */
    [[nodiscard]] CancellationToken SessionToken() const;

    /** Loads the identity key pair, generating and persisting it on first use. */
    Result<std::shared_ptr<const models::IdentityKeyPair>, VaultFailure> GetOrCreateIdentityKeyPair();

    /** Lowercase hex public key, or nullopt when no identity exists yet. */
    Result<std::optional<std::string>, VaultFailure> GetIdentityPublicKey();

    void AddEventHandler(std::shared_ptr<interfaces::ISessionEventHandler> handler);

    [[nodiscard]] storage::VaultStore& Store() const noexcept { return *store_; }

private:
    struct UnlockedKeys {
        std::shared_ptr<const crypto::SymmetricKey> session_key;
        std::shared_ptr<const crypto::SymmetricKey> dsk;
        std::shared_ptr<const models::IdentityKeyPair> identity;
    };

    Result<std::shared_ptr<const crypto::SymmetricKey>, VaultFailure> GetOrCreateDeviceStorageKey(
        const crypto::SymmetricKey& session_key,
        const CancellationToken& token,
        bool& created);

    Result<std::optional<std::shared_ptr<const models::IdentityKeyPair>>, VaultFailure> LoadIdentity(
        const crypto::SymmetricKey& dsk,
        const CancellationToken& token);

    Result<SessionInfo, VaultFailure> FailUnlock(uint64_t generation, VaultFailure failure);

    std::vector<std::shared_ptr<interfaces::ISessionEventHandler>> Handlers() const;

    std::shared_ptr<storage::VaultStore> store_;
    mutable std::mutex mutex_;
    std::mutex identity_mutex_;
    SessionInfo info_;
    UnlockedKeys keys_;
    CancellationSource cancellation_;
    uint64_t generation_ = 0;
    std::vector<std::shared_ptr<interfaces::ISessionEventHandler>> handlers_;
};

}
