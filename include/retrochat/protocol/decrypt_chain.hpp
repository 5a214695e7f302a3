#pragma once
#include "retrochat/crypto/symmetric_key.hpp"
#include "retrochat/core/cancellation.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include "vault/envelope.pb.h"
#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
namespace retrochat::vault::protocol {

using YieldHook = std::function<void()>;

/**
 * @brief Maps `items` in sequential batches of `batch_size`.
 *
 * After each batch `on_batch(results, first, last)` runs with the inclusive
 * index range of that batch; `yield` runs between batches, never after the
 * last one. The first failing item aborts the walk.
 */
template<typename T, typename R>
Result<std::vector<R>, VaultFailure> MapBatched(
    const std::vector<T>& items,
    const size_t batch_size,
    const std::function<Result<R, VaultFailure>(const T&, size_t)>& map,
    const std::function<void(const std::vector<R>&, size_t, size_t)>& on_batch = {},
    const YieldHook& yield = {},
    const CancellationToken& token = {}) {
    const size_t size = std::max<size_t>(1, batch_size);
    std::vector<R> out;
    out.reserve(items.size());
    for (size_t start = 0; start < items.size(); start += size) {
        const size_t end = std::min(start + size, items.size());
        std::vector<R> batch;
        batch.reserve(end - start);
        for (size_t index = start; index < end; ++index) {
            RETROCHAT_TRY(token.Check("decrypt batch"));
            auto mapped = map(items[index], index);
            RETROCHAT_TRY(mapped);
            batch.push_back(std::move(mapped).Unwrap());
        }
        if (on_batch) {
            on_batch(batch, start, end - 1);
        }
        std::move(batch.begin(), batch.end(), std::back_inserter(out));
        if (end < items.size() && yield) {
            yield();
        }
    }
    return Result<std::vector<R>, VaultFailure>::Ok(std::move(out));
}

struct PendingMessage {
    std::string id;
    proto::vault::MessageEnvelope envelope;
};

/**
 * @brief Serialized bulk decryption of message bodies for one view.
 *
 * At most one Decrypt runs at a time; a second caller waits for the first.
 * Plaintexts are cached by message id and each id is decrypted once.
 */
class DecryptChain {
public:
    explicit DecryptChain(size_t batch_size = kDefaultDecryptBatchSize, YieldHook yield = {});

    ~DecryptChain();

    DecryptChain(const DecryptChain&) = delete;
    DecryptChain& operator=(const DecryptChain&) = delete;

    using BatchCallback = std::function<void(const std::vector<std::string>& decrypted_ids)>;

    /** Returns how many bodies were decrypted by this call. */
    Result<size_t, VaultFailure> Decrypt(
        const crypto::SymmetricKey& conversation_key,
        const std::vector<PendingMessage>& messages,
        const BatchCallback& on_batch = {},
        const CancellationToken& token = {});

    [[nodiscard]] std::optional<std::string> Plaintext(std::string_view id) const;

    [[nodiscard]] size_t CachedCount() const;

    /** Wipes every cached plaintext. */
    void Clear();

private:
    size_t batch_size_;
    YieldHook yield_;
    std::mutex chain_mutex_;
    mutable std::mutex cache_mutex_;
    std::map<std::string, std::string, std::less<>> plaintexts_;
};

}
