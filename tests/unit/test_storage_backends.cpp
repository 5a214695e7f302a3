#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "retrochat/storage/memory_vault_backend.hpp"
#include "retrochat/storage/sqlite_vault_backend.hpp"
#include "retrochat/storage/storage_backend_factory.hpp"
#include "retrochat/configuration/vault_config.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
using namespace retrochat::vault;
using namespace retrochat::vault::storage;
using interfaces::IStoreTransaction;
using interfaces::IVaultBackend;
namespace {
VaultRow MakeRow(const std::string& id, const std::string& updated_at, const uint8_t fill = 0x01) {
    return VaultRow{
        id,
        crypto::EncryptedBlob{std::vector<uint8_t>(12, fill), std::vector<uint8_t>(20, fill)},
        "2024-01-01T00:00:00.000Z",
        updated_at
    };
}
std::shared_ptr<IVaultBackend> MakeBackend(const std::string& kind) {
    if (kind == "sqlite") {
        auto sqlite = SqliteVaultBackend::Open(":memory:");
        REQUIRE(sqlite.IsOk());
        return std::shared_ptr<IVaultBackend>(std::move(sqlite).Unwrap());
    }
    return std::make_shared<MemoryVaultBackend>();
}
}
TEST_CASE("StoreName - Names", "[storage]") {
    for (const auto store : kAllStores) {
        REQUIRE(StoreNameFromString(ToString(store)) == store);
    }
    REQUIRE(ToString(StoreName::Messages) == "messages");
    REQUIRE_FALSE(StoreNameFromString("blobs").has_value());
}
TEST_CASE("VaultBackend - Row operations", "[storage][backend]") {
    const std::string kind = GENERATE(as<std::string>{}, "memory", "sqlite");
    const auto backend = MakeBackend(kind);
    INFO("backend: " << kind);
    {
        SECTION("Put, Get and replace by id") {
            REQUIRE(backend->Put(StoreName::Contacts, MakeRow("a", "2024-01-01T00:00:01.000Z")).IsOk());
            auto fetched = backend->Get(StoreName::Contacts, "a");
            REQUIRE(fetched.IsOk());
            REQUIRE(fetched.Unwrap().has_value());
            REQUIRE(fetched.Unwrap()->blob.iv.size() == 12);
            REQUIRE(backend->Put(StoreName::Contacts, MakeRow("a", "2024-01-01T00:00:02.000Z", 0x02)).IsOk());
            auto replaced = backend->Get(StoreName::Contacts, "a").Unwrap();
            REQUIRE(replaced->blob.ciphertext.front() == 0x02);
            REQUIRE(replaced->updated_at == "2024-01-01T00:00:02.000Z");
            REQUIRE(backend->GetAll(StoreName::Contacts).Unwrap().size() == 1);
        }
        SECTION("Stores are independent") {
            REQUIRE(backend->Put(StoreName::Settings, MakeRow("x", "2024-01-01T00:00:01.000Z")).IsOk());
            REQUIRE_FALSE(backend->Get(StoreName::Contacts, "x").Unwrap().has_value());
        }
        SECTION("Delete of a missing id succeeds") {
            REQUIRE(backend->Delete(StoreName::Messages, "missing").IsOk());
            REQUIRE(backend->Put(StoreName::Messages, MakeRow("m", "2024-01-01T00:00:01.000Z")).IsOk());
            REQUIRE(backend->Delete(StoreName::Messages, "m").IsOk());
            REQUIRE_FALSE(backend->Get(StoreName::Messages, "m").Unwrap().has_value());
        }
        SECTION("GetAll is ordered by id") {
            for (const auto* id : {"c", "a", "b"}) {
                REQUIRE(backend->Put(StoreName::Keys, MakeRow(id, "2024-01-01T00:00:01.000Z")).IsOk());
            }
            const auto rows = backend->GetAll(StoreName::Keys).Unwrap();
            REQUIRE(rows.size() == 3);
            REQUIRE(rows[0].id == "a");
            REQUIRE(rows[2].id == "c");
        }
    }
}
TEST_CASE("VaultBackend - Scan order", "[storage][backend]") {
    const std::string kind = GENERATE(as<std::string>{}, "memory", "sqlite");
    const auto backend = MakeBackend(kind);
    INFO("backend: " << kind);
    {
        REQUIRE(backend->Put(StoreName::Messages, MakeRow("old", "2024-01-01T00:00:01.000Z")).IsOk());
        REQUIRE(backend->Put(StoreName::Messages, MakeRow("new", "2024-01-01T00:00:03.000Z")).IsOk());
        REQUIRE(backend->Put(StoreName::Messages, MakeRow("tie-a", "2024-01-01T00:00:02.000Z")).IsOk());
        REQUIRE(backend->Put(StoreName::Messages, MakeRow("tie-b", "2024-01-01T00:00:02.000Z")).IsOk());
        SECTION("Newest first, ties by descending id") {
            std::vector<std::string> seen;
            REQUIRE(backend->ScanByUpdatedDesc(StoreName::Messages, [&](const VaultRow& row) {
                seen.push_back(row.id);
                return true;
            }).IsOk());
            REQUIRE(seen == std::vector<std::string>{"new", "tie-b", "tie-a", "old"});
        }
        SECTION("Visitor can stop early") {
            size_t visited = 0;
            REQUIRE(backend->ScanByUpdatedDesc(StoreName::Messages, [&](const VaultRow&) {
                return ++visited < 2;
            }).IsOk());
            REQUIRE(visited == 2);
        }
    }
}
TEST_CASE("VaultBackend - Transactions", "[storage][backend]") {
    const std::string kind = GENERATE(as<std::string>{}, "memory", "sqlite");
    const auto backend = MakeBackend(kind);
    INFO("backend: " << kind);
    {
        REQUIRE(backend->Put(StoreName::Contacts, MakeRow("keep", "2024-01-01T00:00:01.000Z")).IsOk());
        SECTION("Committed writes are visible") {
            auto outcome = backend->RunInTransaction(StoreName::Contacts,
                [](IStoreTransaction& tx) -> Result<Unit, VaultFailure> {
                    RETROCHAT_TRY(tx.Put(MakeRow("added", "2024-01-01T00:00:02.000Z")));
                    auto own_write = tx.Get("added");
                    RETROCHAT_TRY(own_write);
                    if (!own_write.Unwrap().has_value()) {
                        return Result<Unit, VaultFailure>::Err(VaultFailure::Generic("read-your-writes"));
                    }
                    return tx.Delete("keep");
                });
            REQUIRE(outcome.IsOk());
            REQUIRE(backend->Get(StoreName::Contacts, "added").Unwrap().has_value());
            REQUIRE_FALSE(backend->Get(StoreName::Contacts, "keep").Unwrap().has_value());
        }
        SECTION("A failing body leaves the store untouched") {
            auto outcome = backend->RunInTransaction(StoreName::Contacts,
                [](IStoreTransaction& tx) -> Result<Unit, VaultFailure> {
                    RETROCHAT_TRY(tx.Put(MakeRow("added", "2024-01-01T00:00:02.000Z")));
                    RETROCHAT_TRY(tx.Delete("keep"));
                    return Result<Unit, VaultFailure>::Err(VaultFailure::Conflict("abort"));
                });
            REQUIRE(outcome.IsErr());
            REQUIRE(outcome.UnwrapErr().type == VaultFailureType::Conflict);
            REQUIRE_FALSE(backend->Get(StoreName::Contacts, "added").Unwrap().has_value());
            REQUIRE(backend->Get(StoreName::Contacts, "keep").Unwrap().has_value());
        }
    }
}
TEST_CASE("VaultBackend - ReplaceAll and Clear", "[storage][backend]") {
    const std::string kind = GENERATE(as<std::string>{}, "memory", "sqlite");
    const auto backend = MakeBackend(kind);
    INFO("backend: " << kind);
    {
        REQUIRE(backend->Put(StoreName::Contacts, MakeRow("stale", "2024-01-01T00:00:01.000Z")).IsOk());
        REQUIRE(backend->Put(StoreName::Settings, MakeRow("stale", "2024-01-01T00:00:01.000Z")).IsOk());
        SECTION("Every store is replaced") {
            std::map<StoreName, std::vector<VaultRow>> rows;
            rows[StoreName::Contacts] = {MakeRow("fresh", "2024-01-02T00:00:00.000Z")};
            REQUIRE(backend->ReplaceAll(rows).IsOk());
            REQUIRE(backend->Get(StoreName::Contacts, "fresh").Unwrap().has_value());
            REQUIRE_FALSE(backend->Get(StoreName::Contacts, "stale").Unwrap().has_value());
            REQUIRE(backend->GetAll(StoreName::Settings).Unwrap().empty());
        }
        SECTION("Clear empties everything") {
            REQUIRE(backend->Clear().IsOk());
            for (const auto store : kAllStores) {
                REQUIRE(backend->GetAll(store).Unwrap().empty());
            }
        }
    }
}
TEST_CASE("SqliteVaultBackend - Rows survive reopening", "[storage][backend][sqlite]") {
    const auto path = std::filesystem::temp_directory_path() / "retrochat_vault_reopen_test.db";
    std::filesystem::remove(path);
    {
        auto opened = SqliteVaultBackend::Open(path.string());
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap()->Put(StoreName::Keys, MakeRow("dsk", "2024-01-01T00:00:01.000Z", 0x07)).IsOk());
    }
    {
        auto reopened = SqliteVaultBackend::Open(path.string());
        REQUIRE(reopened.IsOk());
        auto row = reopened.Unwrap()->Get(StoreName::Keys, "dsk");
        REQUIRE(row.IsOk());
        REQUIRE(row.Unwrap().has_value());
        REQUIRE(row.Unwrap()->blob.iv == std::vector<uint8_t>(12, 0x07));
    }
    std::filesystem::remove(path);
}
TEST_CASE("StorageBackendFactory - Configuration", "[storage][config]") {
    SECTION("Default config gives a memory backend") {
        auto backend = StorageBackendFactory::Create(configuration::VaultConfig::Default());
        REQUIRE(backend.IsOk());
        REQUIRE(dynamic_cast<MemoryVaultBackend*>(backend.Unwrap().get()) != nullptr);
    }
    SECTION("SQLite config") {
        auto backend = StorageBackendFactory::Create(configuration::VaultConfig::Default().WithSqlite(":memory:"));
        REQUIRE(backend.IsOk());
        REQUIRE(dynamic_cast<SqliteVaultBackend*>(backend.Unwrap().get()) != nullptr);
    }
    SECTION("Invalid configs are refused") {
        REQUIRE(StorageBackendFactory::Create(configuration::VaultConfig::Default().WithSqlite("")).IsErr());
        REQUIRE(StorageBackendFactory::Create(
            configuration::VaultConfig::Default().WithBackupIterations(1000)).IsErr());
    }
    SECTION("Hardened profile stays importable") {
        const auto hardened = configuration::VaultConfig::Hardened();
        REQUIRE(hardened.IsValid());
        REQUIRE(hardened.GetBackupIterations() > configuration::VaultConfig::Default().GetBackupIterations());
        REQUIRE(hardened.GetProtocolVersion() == 1);
    }
}
