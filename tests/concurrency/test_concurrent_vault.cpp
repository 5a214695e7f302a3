#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "retrochat/storage/sqlite_vault_backend.hpp"
#include "retrochat/protocol/message_sealer.hpp"
#include "helpers/vault_fixture.hpp"
#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace retrochat::vault;
using retrochat::vault::crypto::SodiumInterop;
using test_helpers::kAliceAddress;
using test_helpers::kBobAddress;
using test_helpers::MakeKey;
using test_helpers::VaultDevice;

namespace {

std::shared_ptr<interfaces::IVaultBackend> MakeBackend(const std::string& kind) {
    if (kind == "sqlite") {
        auto sqlite = storage::SqliteVaultBackend::Open(":memory:");
        REQUIRE(sqlite.IsOk());
        return std::shared_ptr<interfaces::IVaultBackend>(std::move(sqlite).Unwrap());
    }
    return std::make_shared<storage::MemoryVaultBackend>();
}

void JoinAll(std::vector<std::thread>& threads) {
    for (auto& thread : threads) {
        thread.join();
    }
}

}

TEST_CASE("Concurrent Vault - Messages written and listed in parallel", "[concurrency][messages]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto kind = GENERATE(as<std::string>{}, "memory", "sqlite");
    INFO(kind);
    protocol::MessageRepository repository(std::make_shared<storage::VaultStore>(MakeBackend(kind)));
    const auto key = MakeKey(0x61);

    constexpr int kWriters = 4;
    constexpr int kPerWriter = 25;
    std::atomic<int> failures{0};
    std::atomic<bool> writing{true};
    std::vector<std::thread> threads;

    for (int w = 0; w < kWriters; ++w) {
        threads.emplace_back([&, w] {
            for (int i = 0; i < kPerWriter; ++i) {
                auto sealed = protocol::MessageSealer::Seal(
                    *key, kAliceAddress, kBobAddress, "writer " + std::to_string(w) + " #" + std::to_string(i));
                if (sealed.IsErr() || repository.Store(*key, sealed.Unwrap()).IsErr()) {
                    ++failures;
                }
            }
        });
    }
    std::thread reader([&] {
        while (writing.load()) {
            protocol::MessagePage page;
            page.limit = kWriters * kPerWriter;
            if (repository.List(*key, page).IsErr()) {
                ++failures;
            }
        }
    });
    JoinAll(threads);
    writing = false;
    reader.join();

    REQUIRE(failures.load() == 0);
    protocol::MessagePage page;
    page.limit = kWriters * kPerWriter * 2;
    auto listed = repository.List(*key, page);
    REQUIRE(listed.IsOk());
    REQUIRE(listed.Unwrap().size() == kWriters * kPerWriter);
}

TEST_CASE("Concurrent Vault - Only one contact create wins", "[concurrency][contacts]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto kind = GENERATE(as<std::string>{}, "memory", "sqlite");
    INFO(kind);
    VaultDevice device(MakeBackend(kind));
    REQUIRE(device.Unlock(0x0A, kAliceAddress));
    const auto dsk = device.Dsk();

    constexpr int kThreads = 8;
    std::atomic<int> created{0};
    std::atomic<int> conflicts{0};
    std::atomic<int> other{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            auto result = device.contacts->Create(*dsk, kBobAddress, "Bob " + std::to_string(t));
            if (result.IsOk()) {
                ++created;
            } else if (result.UnwrapErr().type == VaultFailureType::Conflict) {
                ++conflicts;
            } else {
                ++other;
            }
        });
    }
    JoinAll(threads);

    REQUIRE(created.load() == 1);
    REQUIRE(conflicts.load() == kThreads - 1);
    REQUIRE(other.load() == 0);
    REQUIRE(device.contacts->List(*dsk).Unwrap().size() == 1);
}

TEST_CASE("Concurrent Vault - Identity is created once", "[concurrency][session]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    VaultDevice device;
    REQUIRE(device.Unlock(0x0A, kAliceAddress));

    constexpr int kThreads = 8;
    std::vector<std::string> public_keys(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            public_keys[t] = device.PublicKeyHex();
        });
    }
    JoinAll(threads);

    const std::set<std::string> distinct(public_keys.begin(), public_keys.end());
    REQUIRE(distinct.size() == 1);
    REQUIRE(distinct.begin()->size() == kX25519PublicKeyBytes * 2);
}

TEST_CASE("Concurrent Vault - Lock racing unlock settles cleanly", "[concurrency][session]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    VaultDevice device;
    REQUIRE(device.Unlock(0x0A, kAliceAddress));
    const auto original_dsk = device.Dsk();
    REQUIRE(original_dsk != nullptr);
    const auto original_bytes = original_dsk->CopyBytes().Unwrap();
    device.session->Lock();

    std::atomic<int> unexpected{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                auto unlocked = device.session->Unlock(test_helpers::FakeSignature(0x0A), kAliceAddress);
                if (unlocked.IsErr() && unlocked.UnwrapErr().type != VaultFailureType::Cancelled
                    && unlocked.UnwrapErr().type != VaultFailureType::InvalidState) {
                    ++unexpected;
                }
            }
        });
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                device.session->Lock();
            }
        });
    }
    JoinAll(threads);
    REQUIRE(unexpected.load() == 0);

    REQUIRE(device.Unlock(0x0A, kAliceAddress));
    REQUIRE(device.session->IsUnlocked());
    REQUIRE(device.Dsk()->CopyBytes().Unwrap() == original_bytes);
    REQUIRE(device.backend->GetAll(storage::StoreName::Keys).Unwrap().size() == 1);
}

TEST_CASE("Concurrent Vault - Telemetry keeps its capacity", "[concurrency][telemetry]") {
    diagnostics::LocalTelemetry telemetry(32);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&telemetry] {
            for (int i = 0; i < 100; ++i) {
                (void)telemetry.LogInfo("concurrency", "tick");
            }
        });
    }
    JoinAll(threads);
    REQUIRE(telemetry.Size() == 32);

    std::set<std::string> ids;
    for (const auto& event : telemetry.Snapshot()) {
        ids.insert(event.id);
    }
    REQUIRE(ids.size() == 32);
}
