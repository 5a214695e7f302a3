#include <catch2/catch_test_macros.hpp>
#include "retrochat/backup/vault_backup.hpp"
#include "retrochat/repositories/settings_repository.hpp"
#include "retrochat/core/constants.hpp"
#include "helpers/vault_fixture.hpp"
#include <string>
using namespace retrochat::vault;
using retrochat::vault::crypto::SodiumInterop;
using namespace retrochat::vault::backup;
using test_helpers::FakeSignature;
using test_helpers::kAliceAddress;
using test_helpers::kBobAddress;
using test_helpers::VaultDevice;
namespace {
constexpr const char* kPassphrase = "correct horse battery";
configuration::VaultConfig FastConfig() {
    return configuration::VaultConfig::Default().WithBackupIterations(kBackupMinIterations);
}
}
TEST_CASE("VaultBackup - Export and restore on a new device", "[backup]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    VaultDevice source;
    REQUIRE(source.Unlock(0x0A, kAliceAddress));
    REQUIRE(source.contacts->Create(*source.Dsk(), kBobAddress, "Bob").IsOk());
    repositories::SettingsRepository settings(source.store);
    REQUIRE(settings.Set(*source.Dsk(), "theme", "dark").IsOk());
    const std::string public_key = source.PublicKeyHex();

    VaultBackup exporter(source.backend, FastConfig());
    auto file = exporter.Export(kPassphrase);
    REQUIRE(file.IsOk());
    REQUIRE(file.Unwrap().format() == kBackupFileFormat);
    REQUIRE(file.Unwrap().kdf().iterations() == kBackupMinIterations);
    REQUIRE(file.Unwrap().kdf().salt_hex().size() == kBackupSaltBytes * 2);
    REQUIRE(file.Unwrap().aead().aad_label() == kBackupAad);
    REQUIRE(VaultBackup::ValidateFile(file.Unwrap(), FastConfig()).IsOk());

    VaultDevice target;
    REQUIRE(target.Unlock(0x0B, kBobAddress));
    REQUIRE(target.contacts->Create(*target.Dsk(), kAliceAddress, "Stale").IsOk());
    target.session->Lock();

    VaultBackup importer(target.backend, FastConfig());
    REQUIRE(importer.Import(kPassphrase, file.Unwrap()).IsOk());

    SECTION("Restored vault opens with the exporting wallet") {
        REQUIRE(target.Unlock(0x0A, kAliceAddress));
        const auto contacts = target.contacts->List(*target.Dsk()).Unwrap();
        REQUIRE(contacts.size() == 1);
        REQUIRE(contacts.front().label == "Bob");
        repositories::SettingsRepository restored_settings(target.store);
        REQUIRE(restored_settings.Get(*target.Dsk(), "theme").Unwrap() == std::optional<std::string>("dark"));
        REQUIRE(target.PublicKeyHex() == public_key);
    }
    SECTION("The replaced account no longer unlocks") {
        auto unlock = target.session->Unlock(FakeSignature(0x0B), kBobAddress);
        REQUIRE(unlock.IsErr());
        REQUIRE(unlock.UnwrapErr().type == VaultFailureType::Auth);
    }
}
TEST_CASE("VaultBackup - JSON file", "[backup]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    VaultDevice device;
    REQUIRE(device.Unlock(0x0A, kAliceAddress));
    VaultBackup backup(device.backend, FastConfig());

    auto json = backup.ExportJson(kPassphrase);
    REQUIRE(json.IsOk());
    const std::string& text = json.Unwrap();
    for (const auto* field : {"\"format\"", "\"createdAt\"", "\"saltHex\"", "\"iterations\"", "\"ivHex\"",
                              "\"aadLabel\"", "\"ciphertextHex\"", "\"plaintextHashHex\""}) {
        INFO(field);
        REQUIRE(text.find(field) != std::string::npos);
    }

    SECTION("Round trip through JSON") {
        REQUIRE(backup.ImportJson(kPassphrase, text).IsOk());
    }
    SECTION("Unknown file keys are tolerated") {
        std::string extended = text;
        extended.insert(1, "\"comment\":\"from laptop\",");
        REQUIRE(backup.ImportJson(kPassphrase, extended).IsOk());
    }
    SECTION("Not JSON") {
        auto result = backup.ImportJson(kPassphrase, "[1, 2");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().message == "Invalid backup file: expected object.");
    }
}
TEST_CASE("VaultBackup - Passphrase policy", "[backup]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    VaultBackup backup(std::make_shared<storage::MemoryVaultBackend>(), FastConfig());
    auto short_export = backup.Export("   short   ");
    REQUIRE(short_export.IsErr());
    REQUIRE(short_export.UnwrapErr().code == "passphrase");
    REQUIRE(short_export.UnwrapErr().message == ErrorMessages::PASSPHRASE_TOO_SHORT);
    REQUIRE(backup.ImportJson("1234567", "{}").UnwrapErr().code == "passphrase");
    REQUIRE(backup.Export("12345678").IsOk());
}
TEST_CASE("VaultBackup - File validation", "[backup][validation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    VaultBackup backup(std::make_shared<storage::MemoryVaultBackend>(), FastConfig());
    const auto valid = backup.Export(kPassphrase).Unwrap();
    const auto config = FastConfig();

    auto expect_invalid = [&](proto::vault::EncryptedBackupFile file, const std::string& message) {
        auto result = VaultBackup::ValidateFile(file, config);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::Validation);
        REQUIRE(result.UnwrapErr().message == message);
    };

    auto file = valid;
    file.set_format("zip");
    expect_invalid(file, "Invalid backup format.");
    file = valid;
    file.set_v(2);
    expect_invalid(file, "Unsupported backup version.");
    file = valid;
    file.set_created_at("yesterday");
    expect_invalid(file, "Invalid createdAt.");
    file = valid;
    file.mutable_kdf()->set_iterations(kBackupMinIterations - 1);
    expect_invalid(file, "Backup KDF iterations out of allowed range.");
    file = valid;
    file.mutable_kdf()->set_iterations(kBackupMaxIterations + 1);
    expect_invalid(file, "Backup KDF iterations out of allowed range.");
    file = valid;
    file.mutable_kdf()->set_hash("SHA-1");
    expect_invalid(file, "Unsupported kdf hash.");
    file = valid;
    file.mutable_aead()->set_aad_label("other");
    expect_invalid(file, "Unexpected backup AAD label.");
    file = valid;
    file.mutable_kdf()->set_salt_hex("00");
    expect_invalid(file, "Invalid backup salt length (expected 16 bytes).");
    file = valid;
    file.mutable_aead()->set_iv_hex("00");
    expect_invalid(file, "Invalid backup IV length (expected 12 bytes).");
    file = valid;
    file.set_plaintext_hash_hex("abcd");
    expect_invalid(file, "Invalid backup hash length (expected 32 bytes).");
    file = valid;
    file.clear_kdf();
    expect_invalid(file, "Invalid kdf.");
}
TEST_CASE("VaultBackup - Payload preparation", "[backup][validation]") {
    proto::vault::BackupPayload payload;
    payload.set_format(std::string(kBackupPayloadFormat));
    payload.set_v(kProtocolVersion);
    payload.set_exported_at("2024-01-01T00:00:00.000Z");
    payload.mutable_db()->set_name(std::string(kVaultDbName));
    auto* row = payload.mutable_stores()->add_messages();
    row->set_id("m1");
    row->mutable_blob()->set_iv_hex(std::string(kAesGcmNonceBytes * 2, 'a'));
    row->mutable_blob()->set_ciphertext_hex("beef");

    SECTION("Valid payload") {
        auto prepared = VaultBackup::PreparePayload(payload);
        REQUIRE(prepared.IsOk());
        REQUIRE(prepared.Unwrap().size() == storage::kAllStores.size());
        REQUIRE(prepared.Unwrap().at(storage::StoreName::Messages).size() == 1);
        REQUIRE(prepared.Unwrap().at(storage::StoreName::Messages).front().blob.ciphertext
                == std::vector<uint8_t>{0xbe, 0xef});
    }
    SECTION("Short IV names the store") {
        row->mutable_blob()->set_iv_hex("aabb");
        auto prepared = VaultBackup::PreparePayload(payload);
        REQUIRE(prepared.IsErr());
        REQUIRE(prepared.UnwrapErr().message
                == "Failed to prepare backup data for store \"messages\": "
                   "Invalid IV length in messages row (expected 12 bytes).");
    }
    SECTION("Empty ciphertext") {
        row->mutable_blob()->set_ciphertext_hex("");
        REQUIRE(VaultBackup::PreparePayload(payload).IsErr());
    }
    SECTION("Missing stores") {
        payload.clear_stores();
        REQUIRE(VaultBackup::PreparePayload(payload).UnwrapErr().message == "Invalid payload.stores.");
    }
    SECTION("Wrong format") {
        payload.set_format("other");
        REQUIRE(VaultBackup::PreparePayload(payload).IsErr());
    }
}
TEST_CASE("VaultBackup - Reset and cancellation", "[backup]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    VaultDevice device;
    REQUIRE(device.Unlock(0x0A, kAliceAddress));
    VaultBackup backup(device.backend, FastConfig());

    SECTION("Cancelled export") {
        CancellationSource source;
        source.Cancel();
        auto result = backup.Export(kPassphrase, source.Token());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == VaultFailureType::Cancelled);
    }
    SECTION("Reset empties every store") {
        REQUIRE(backup.ResetVault().IsOk());
        for (const auto store : storage::kAllStores) {
            REQUIRE(device.backend->GetAll(store).Unwrap().empty());
        }
    }
}
