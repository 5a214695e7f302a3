#include <catch2/catch_test_macros.hpp>
#include "retrochat/protocol/decrypt_chain.hpp"
#include "retrochat/protocol/message_id.hpp"
#include "retrochat/protocol/message_sealer.hpp"
#include "retrochat/core/format.hpp"
#include "helpers/vault_fixture.hpp"
#include <string>
#include <utility>
#include <vector>
using namespace retrochat::vault;
using retrochat::vault::crypto::SodiumInterop;
using namespace retrochat::vault::protocol;
using test_helpers::kAliceAddress;
using test_helpers::kBobAddress;
using test_helpers::MakeKey;
namespace {
std::vector<PendingMessage> MakePending(const crypto::SymmetricKey& key, const int count) {
    std::vector<PendingMessage> pending;
    for (int i = 0; i < count; ++i) {
        auto sealed = MessageSealer::Seal(key, kAliceAddress, kBobAddress, compat::format("body {}", i));
        REQUIRE(sealed.IsOk());
        auto envelope = std::move(sealed).Unwrap();
        auto id = DeriveMessageId(envelope);
        REQUIRE(id.IsOk());
        pending.push_back(PendingMessage{std::move(id).Unwrap(), std::move(envelope)});
    }
    return pending;
}
}
TEST_CASE("MapBatched - Batches, callbacks and yields", "[protocol][batching]") {
    const std::vector<int> items = {1, 2, 3, 4, 5, 6, 7};
    std::vector<std::pair<size_t, size_t>> ranges;
    int yields = 0;
    auto result = MapBatched<int, int>(
        items, 3,
        [](const int& item, size_t) { return Result<int, VaultFailure>::Ok(item * 10); },
        [&](const std::vector<int>& batch, const size_t first, const size_t last) {
            REQUIRE(batch.size() == last - first + 1);
            ranges.emplace_back(first, last);
        },
        [&] { ++yields; });
    REQUIRE(result.IsOk());
    REQUIRE(result.Unwrap() == std::vector<int>{10, 20, 30, 40, 50, 60, 70});
    REQUIRE(ranges == std::vector<std::pair<size_t, size_t>>{{0, 2}, {3, 5}, {6, 6}});
    REQUIRE(yields == 2);
}
TEST_CASE("MapBatched - Edge cases", "[protocol][batching]") {
    SECTION("Empty input") {
        int calls = 0;
        auto result = MapBatched<int, int>(
            {}, 4, [&](const int& item, size_t) { ++calls; return Result<int, VaultFailure>::Ok(item); });
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().empty());
        REQUIRE(calls == 0);
    }
    SECTION("Zero batch size behaves as one") {
        int yields = 0;
        auto result = MapBatched<int, int>(
            {1, 2, 3}, 0,
            [](const int& item, size_t) { return Result<int, VaultFailure>::Ok(item); },
            {}, [&] { ++yields; });
        REQUIRE(result.Unwrap().size() == 3);
        REQUIRE(yields == 2);
    }
    SECTION("First failure aborts") {
        std::vector<size_t> seen;
        auto result = MapBatched<int, int>(
            {1, 2, 3, 4}, 2,
            [&](const int& item, const size_t index) {
                seen.push_back(index);
                if (item == 3) {
                    return Result<int, VaultFailure>::Err(VaultFailure::Generic("boom"));
                }
                return Result<int, VaultFailure>::Ok(item);
            });
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().message == "boom");
        REQUIRE(seen == std::vector<size_t>{0, 1, 2});
    }
    SECTION("Cancellation") {
        CancellationSource source;
        source.Cancel();
        auto result = MapBatched<int, int>(
            {1}, 1, [](const int& item, size_t) { return Result<int, VaultFailure>::Ok(item); },
            {}, {}, source.Token());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::Cancelled);
    }
}
TEST_CASE("DecryptChain - Decrypts each message once", "[protocol][decrypt-chain]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = MakeKey(0x31);
    const auto pending = MakePending(*key, 7);
    int yields = 0;
    DecryptChain chain(3, [&] { ++yields; });

    std::vector<size_t> batch_sizes;
    auto decrypted = chain.Decrypt(*key, pending, [&](const std::vector<std::string>& ids) {
        batch_sizes.push_back(ids.size());
    });
    REQUIRE(decrypted.IsOk());
    REQUIRE(decrypted.Unwrap() == 7);
    REQUIRE(batch_sizes == std::vector<size_t>{3, 3, 1});
    REQUIRE(yields == 2);
    REQUIRE(chain.CachedCount() == 7);
    REQUIRE(chain.Plaintext(pending[4].id) == std::optional<std::string>("body 4"));

    SECTION("Cached ids are skipped") {
        auto again = chain.Decrypt(*key, pending);
        REQUIRE(again.IsOk());
        REQUIRE(again.Unwrap() == 0);
        auto extra = MakePending(*key, 1);
        auto with_new = pending;
        with_new.push_back(extra.front());
        with_new.push_back(extra.front());
        REQUIRE(chain.Decrypt(*key, with_new).Unwrap() == 1);
        REQUIRE(chain.CachedCount() == 8);
    }
    SECTION("Clear wipes the cache") {
        chain.Clear();
        REQUIRE(chain.CachedCount() == 0);
        REQUIRE_FALSE(chain.Plaintext(pending[0].id).has_value());
    }
}
TEST_CASE("DecryptChain - Failure keeps earlier results", "[protocol][decrypt-chain]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = MakeKey(0x31);
    auto pending = MakePending(*key, 4);
    pending[2].envelope.set_ciphertext(std::string(pending[2].envelope.ciphertext().size(), '0'));
    DecryptChain chain(2);
    auto decrypted = chain.Decrypt(*key, pending);
    REQUIRE(decrypted.IsErr());
    REQUIRE(decrypted.UnwrapErr().IsIntegrity(IntegrityKind::AeadAuthentication));
    REQUIRE(chain.CachedCount() == 2);
    REQUIRE_FALSE(chain.Plaintext(pending[2].id).has_value());
}
