#include <catch2/catch_test_macros.hpp>
#include "retrochat/repositories/contacts_repository.hpp"
#include "retrochat/repositories/conversation_repository.hpp"
#include "retrochat/repositories/settings_repository.hpp"
#include "retrochat/crypto/digest.hpp"
#include "retrochat/core/constants.hpp"
#include "helpers/vault_fixture.hpp"
#include <algorithm>
#include <string>
#include <vector>
using namespace retrochat::vault;
using retrochat::vault::crypto::SodiumInterop;
using namespace retrochat::vault::repositories;
using test_helpers::kBobAddress;
using test_helpers::MakeKey;
namespace {
constexpr const char* kChecksummed = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
constexpr const char* kLowercase = "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed";
constexpr const char* kOtherChecksummed = "0xdbF03B407c01E7cD3CBea99509d93f8DDDC8C6FB";
}
TEST_CASE("ContactsRepository - Create and lookup", "[repositories][contacts]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto backend = std::make_shared<storage::MemoryVaultBackend>();
    ContactsRepository contacts(std::make_shared<storage::VaultStore>(backend));
    const auto dsk = MakeKey(0x61);

    auto created = contacts.Create(*dsk, std::string("  ") + kLowercase, "Vitalik", std::string("met at devcon"));
    REQUIRE(created.IsOk());
    const auto& contact = created.Unwrap();
    REQUIRE(contact.address == kChecksummed);
    REQUIRE(contact.id == crypto::Digest::Sha256Hex(kLowercase).Unwrap());
    REQUIRE(contact.note == std::optional<std::string>("met at devcon"));
    REQUIRE_FALSE(contact.public_key_hex.has_value());
    REQUIRE(contact.created_at == contact.updated_at);

    SECTION("Same address in another case conflicts") {
        auto duplicate = contacts.Create(*dsk, kChecksummed, "Again");
        REQUIRE(duplicate.IsErr());
        REQUIRE(duplicate.UnwrapErr().type == VaultFailureType::Conflict);
        REQUIRE(duplicate.UnwrapErr().message == ErrorMessages::CONTACT_EXISTS);
        REQUIRE(contacts.List(*dsk).Unwrap().size() == 1);
    }
    SECTION("GetByAddress is case-insensitive") {
        auto found = contacts.GetByAddress(*dsk, kChecksummed);
        REQUIRE(found.IsOk());
        REQUIRE(found.Unwrap().has_value());
        REQUIRE(found.Unwrap()->label == "Vitalik");
        REQUIRE(found.Unwrap()->note == contact.note);
    }
    SECTION("GetByAddress tolerates junk") {
        REQUIRE_FALSE(contacts.GetByAddress(*dsk, "not an address").Unwrap().has_value());
        REQUIRE_FALSE(contacts.GetByAddress(*dsk, kBobAddress).Unwrap().has_value());
        REQUIRE_FALSE(contacts.GetByAddress(*MakeKey(0x62), kChecksummed).Unwrap().has_value());
    }
    SECTION("Invalid address is rejected") {
        auto bad = contacts.Create(*dsk, "0x12", "Nobody");
        REQUIRE(bad.IsErr());
        REQUIRE(bad.UnwrapErr().type == VaultFailureType::Validation);
    }
    SECTION("Rows are opaque") {
        const auto row = backend->Get(storage::StoreName::Contacts, contact.id).Unwrap();
        REQUIRE(row.has_value());
        const std::string stored(row->blob.ciphertext.begin(), row->blob.ciphertext.end());
        REQUIRE(stored.find("Vitalik") == std::string::npos);
    }
}
TEST_CASE("ContactsRepository - Update, search and delete", "[repositories][contacts]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    ContactsRepository contacts(std::make_shared<storage::VaultStore>(std::make_shared<storage::MemoryVaultBackend>()));
    const auto dsk = MakeKey(0x61);
    const auto first = contacts.Create(*dsk, kChecksummed, "Vitalik").Unwrap();
    const auto second = contacts.Create(*dsk, kOtherChecksummed, "Satoshi").Unwrap();

    SECTION("Update keeps address and created_at") {
        const std::string key_hex(64, 'a');
        auto updated = contacts.Update(*dsk, first.id, "V", std::nullopt, key_hex);
        REQUIRE(updated.IsOk());
        REQUIRE(updated.Unwrap().label == "V");
        REQUIRE(updated.Unwrap().address == kChecksummed);
        REQUIRE(updated.Unwrap().created_at == first.created_at);
        REQUIRE(updated.Unwrap().public_key_hex == std::optional<std::string>(key_hex));
        REQUIRE(contacts.GetByAddress(*dsk, kChecksummed).Unwrap()->public_key_hex == key_hex);
    }
    SECTION("Update of an unknown id") {
        auto missing = contacts.Update(*dsk, "nope", "X");
        REQUIRE(missing.IsErr());
        REQUIRE(missing.UnwrapErr().type == VaultFailureType::NotFound);
        REQUIRE(missing.UnwrapErr().message == ErrorMessages::CONTACT_NOT_FOUND);
    }
    SECTION("Search by label or address") {
        auto by_label = contacts.Search(*dsk, "  sAtO ");
        REQUIRE(by_label.Unwrap().size() == 1);
        REQUIRE(by_label.Unwrap().front().id == second.id);
        auto by_address = contacts.Search(*dsk, "5AAEB6");
        REQUIRE(by_address.Unwrap().size() == 1);
        REQUIRE(by_address.Unwrap().front().id == first.id);
        REQUIRE(contacts.Search(*dsk, "   ").Unwrap().size() == 2);
        REQUIRE(contacts.Search(*dsk, "zzz").Unwrap().empty());
    }
    SECTION("Delete") {
        REQUIRE(contacts.Delete(first.id).IsOk());
        const auto remaining = contacts.List(*dsk).Unwrap();
        REQUIRE(remaining.size() == 1);
        REQUIRE(remaining.front().id == second.id);
        REQUIRE(contacts.Delete("").IsErr());
    }
}
TEST_CASE("ConversationRepository - Upsert and list", "[repositories][conversations]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    ConversationRepository conversations(
        std::make_shared<storage::VaultStore>(std::make_shared<storage::MemoryVaultBackend>()));
    const auto dsk = MakeKey(0x71);
    models::Conversation conversation;
    conversation.id = "0123456789abcdef0123456789abcdef";
    conversation.peer_address = kLowercase;
    conversation.title = std::string("Vitalik");

    auto saved = conversations.Upsert(*dsk, conversation);
    REQUIRE(saved.IsOk());
    REQUIRE(saved.Unwrap().peer_address == kChecksummed);
    REQUIRE_FALSE(saved.Unwrap().created_at.empty());

    SECTION("Update keeps created_at") {
        conversation.epoch = 2;
        auto again = conversations.Upsert(*dsk, conversation);
        REQUIRE(again.IsOk());
        REQUIRE(again.Unwrap().created_at == saved.Unwrap().created_at);
        auto fetched = conversations.Get(*dsk, conversation.id);
        REQUIRE(fetched.Unwrap()->epoch == 2);
        REQUIRE(fetched.Unwrap()->title == std::optional<std::string>("Vitalik"));
        REQUIRE(conversations.List(*dsk).Unwrap().size() == 1);
    }
    SECTION("Missing id and bad peer are rejected") {
        models::Conversation nameless = conversation;
        nameless.id.clear();
        REQUIRE(conversations.Upsert(*dsk, nameless).UnwrapErr().code == "id");
        models::Conversation bad_peer = conversation;
        bad_peer.peer_address = "bob";
        REQUIRE(conversations.Upsert(*dsk, bad_peer).IsErr());
    }
    SECTION("Get with the wrong key is an integrity error") {
        auto fetched = conversations.Get(*MakeKey(0x72), conversation.id);
        REQUIRE(fetched.IsErr());
        REQUIRE(fetched.UnwrapErr().type == VaultFailureType::Integrity);
    }
    SECTION("Delete") {
        REQUIRE(conversations.Delete(conversation.id).IsOk());
        REQUIRE_FALSE(conversations.Get(*dsk, conversation.id).Unwrap().has_value());
    }
}
TEST_CASE("SettingsRepository - Values", "[repositories][settings]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto backend = std::make_shared<storage::MemoryVaultBackend>();
    SettingsRepository settings(std::make_shared<storage::VaultStore>(backend));
    const auto dsk = MakeKey(0x81);

    REQUIRE(settings.Set(*dsk, "theme", "dark").IsOk());
    REQUIRE(settings.Get(*dsk, "theme").Unwrap() == std::optional<std::string>("dark"));
    REQUIRE(settings.Set(*dsk, "theme", "light").IsOk());
    REQUIRE(settings.Get(*dsk, "theme").Unwrap() == std::optional<std::string>("light"));
    REQUIRE_FALSE(settings.Get(*dsk, "locale").Unwrap().has_value());

    SECTION("Empty keys are invalid") {
        REQUIRE(settings.Set(*dsk, "", "x").UnwrapErr().code == "key");
        REQUIRE(settings.Get(*dsk, "").IsErr());
        REQUIRE(settings.Remove("").IsErr());
    }
    SECTION("Remove") {
        REQUIRE(settings.Remove("theme").IsOk());
        REQUIRE_FALSE(settings.Get(*dsk, "theme").Unwrap().has_value());
    }
    SECTION("A row moved to another key is detected") {
        auto row = backend->Get(storage::StoreName::Settings, "theme").Unwrap();
        REQUIRE(row.has_value());
        row->id = "locale";
        REQUIRE(backend->Put(storage::StoreName::Settings, *row).IsOk());
        auto moved = settings.Get(*dsk, "locale");
        REQUIRE(moved.IsErr());
        REQUIRE(moved.UnwrapErr().IsIntegrity(IntegrityKind::TamperDetected));
    }
}
