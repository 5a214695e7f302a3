#include "retrochat/protocol/decrypt_chain.hpp"
#include "retrochat/protocol/message_sealer.hpp"
#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/debug/vault_logger.hpp"
#include <thread>

namespace retrochat::vault::protocol {
    DecryptChain::DecryptChain(const size_t batch_size, YieldHook yield)
        : batch_size_(std::max<size_t>(1, batch_size))
        , yield_(yield ? std::move(yield) : YieldHook([] { std::this_thread::yield(); })) {
    }

    DecryptChain::~DecryptChain() {
        Clear();
    }

    Result<size_t, VaultFailure> DecryptChain::Decrypt(
        const crypto::SymmetricKey& conversation_key,
        const std::vector<PendingMessage>& messages,
        const BatchCallback& on_batch,
        const CancellationToken& token) {
        std::lock_guard chain_lock(chain_mutex_);

        std::vector<const PendingMessage*> targets;
        {
            std::lock_guard cache_lock(cache_mutex_);
            std::set<std::string_view> queued;
            for (const auto& message : messages) {
                if (plaintexts_.find(message.id) == plaintexts_.end() && queued.insert(message.id).second) {
                    targets.push_back(&message);
                }
            }
        }
        if (targets.empty()) {
            return Result<size_t, VaultFailure>::Ok(0);
        }
        RC_LOG_VALUE(debug::Area::Messaging, "DECRYPT_CHAIN", "targets", targets.size());

        const std::function<Result<std::string, VaultFailure>(const PendingMessage* const&, size_t)> map =
            [this, &conversation_key](const PendingMessage* const& item, size_t) -> Result<std::string, VaultFailure> {
                auto text = MessageSealer::Open(conversation_key, item->envelope);
                RETROCHAT_TRY(text);
                std::lock_guard cache_lock(cache_mutex_);
                plaintexts_.insert_or_assign(item->id, std::move(text).Unwrap());
                return Result<std::string, VaultFailure>::Ok(item->id);
            };
        const std::function<void(const std::vector<std::string>&, size_t, size_t)> batch_done =
            [&on_batch](const std::vector<std::string>& ids, size_t, size_t) {
                if (on_batch) {
                    on_batch(ids);
                }
            };
        auto decrypted = MapBatched(targets, batch_size_, map, batch_done, yield_, token);
        RETROCHAT_TRY(decrypted);
        return Result<size_t, VaultFailure>::Ok(decrypted.Unwrap().size());
    }

    std::optional<std::string> DecryptChain::Plaintext(const std::string_view id) const {
        std::lock_guard lock(cache_mutex_);
        const auto it = plaintexts_.find(id);
        if (it == plaintexts_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    size_t DecryptChain::CachedCount() const {
        std::lock_guard lock(cache_mutex_);
        return plaintexts_.size();
    }

    void DecryptChain::Clear() {
        std::lock_guard lock(cache_mutex_);
        for (auto& [id, text] : plaintexts_) {
            [[maybe_unused]] auto wiped = crypto::SodiumInterop::SecureWipe(text);
        }
        plaintexts_.clear();
    }
}
