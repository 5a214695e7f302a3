#include "retrochat/repositories/contacts_repository.hpp"
#include "retrochat/validation/address.hpp"
#include "retrochat/crypto/digest.hpp"
#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/core/constants.hpp"
#include "retrochat/core/hex.hpp"
#include "retrochat/core/proto_json.hpp"
#include "retrochat/core/timestamp.hpp"
#include "retrochat/debug/vault_logger.hpp"
#include "vault/records.pb.h"

namespace retrochat::vault::repositories {
    using storage::StoreName;
    using storage::VaultRow;
    using ContactResult = Result<models::Contact, VaultFailure>;
    using ContactList = std::vector<models::Contact>;

    namespace {
        Result<std::string, VaultFailure> EncodeRecord(
            const std::string& address,
            const std::string_view label,
            const std::optional<std::string>& note,
            const std::optional<std::string>& public_key_hex) {
            proto::vault::ContactRecord record;
            record.set_address(address);
            record.set_label(std::string(label));
            if (note.has_value()) {
                record.set_note(*note);
            }
            if (public_key_hex.has_value()) {
                record.set_public_key_hex(*public_key_hex);
            }
            return proto_json::Serialize(record);
        }

        ContactResult DecodeContact(const VaultRow& row, std::vector<uint8_t>& plaintext) {
            std::string json(plaintext.begin(), plaintext.end());
            RETROCHAT_TRY(crypto::SodiumInterop::Wipe(plaintext));
            proto::vault::ContactRecord record;
            auto parsed = proto_json::Parse(json, record);
            RETROCHAT_TRY(crypto::SodiumInterop::Wipe(json));
            RETROCHAT_TRY(parsed);
            models::Contact contact;
            contact.id = row.id;
            contact.address = record.address();
            contact.label = record.label();
            if (record.has_note()) {
                contact.note = record.note();
            }
            if (record.has_public_key_hex()) {
                contact.public_key_hex = record.public_key_hex();
            }
            contact.created_at = row.created_at;
            contact.updated_at = row.updated_at;
            return ContactResult::Ok(std::move(contact));
        }

        ContactResult OpenContact(const VaultRow& row, const crypto::SymmetricKey& dsk) {
            auto opened = storage::VaultStore::OpenRow(row, dsk, kContactsAad);
            RETROCHAT_TRY(opened);
            std::vector<uint8_t> plaintext = std::move(opened).Unwrap();
            return DecodeContact(row, plaintext);
        }

        bool ContainsIgnoreCase(const std::string_view haystack, const std::string& lowered_needle) {
            return hex::ToLower(haystack).find(lowered_needle) != std::string::npos;
        }
    }

    ContactsRepository::ContactsRepository(std::shared_ptr<storage::VaultStore> store)
        : store_(std::move(store)) {
    }

    Result<std::string, VaultFailure> ContactsRepository::ContactIdFor(const std::string_view address) {
        return crypto::Digest::Sha256Hex(hex::ToLower(address));
    }

    ContactResult ContactsRepository::Create(
        const crypto::SymmetricKey& dsk,
        const std::string_view address,
        const std::string_view label,
        std::optional<std::string> note,
        std::optional<std::string> public_key_hex,
        const CancellationToken& token) {
        auto normalized = validation::NormalizeAddress(address);
        RETROCHAT_TRY(normalized);
        std::string checksummed = std::move(normalized).Unwrap();
        auto derived_id = ContactIdFor(checksummed);
        RETROCHAT_TRY(derived_id);
        std::string id = std::move(derived_id).Unwrap();

        auto json = EncodeRecord(checksummed, label, note, public_key_hex);
        RETROCHAT_TRY(json);
        std::string plaintext = std::move(json).Unwrap();
        RETROCHAT_TRY(token.Check("create contact"));
        const std::string now = timestamp::NowIso8601();
        auto sealed = storage::VaultStore::SealRow(id, dsk, hex::AsBytes(plaintext), kContactsAad, now, now);
        RETROCHAT_TRY(crypto::SodiumInterop::Wipe(plaintext));
        RETROCHAT_TRY(sealed);
        const VaultRow row = std::move(sealed).Unwrap();

        RETROCHAT_TRY(token.Check("create contact"));
        RETROCHAT_TRY(store_->Backend().RunInTransaction(StoreName::Contacts,
            [&row](interfaces::IStoreTransaction& transaction) -> Result<Unit, VaultFailure> {
                auto existing = transaction.Get(row.id);
                RETROCHAT_TRY(existing);
                if (existing.Unwrap().has_value()) {
                    return Result<Unit, VaultFailure>::Err(
                        VaultFailure::Conflict(std::string(ErrorMessages::CONTACT_EXISTS)));
                }
                return transaction.Put(row);
            }));
        RC_LOG_ID(debug::Area::Storage, "CONTACT_CREATE", "id", id);

        return ContactResult::Ok(models::Contact{
            std::move(id),
            std::move(checksummed),
            std::string(label),
            std::move(note),
            std::move(public_key_hex),
            now,
            now
        });
    }

    ContactResult ContactsRepository::Update(
        const crypto::SymmetricKey& dsk,
        const std::string_view id,
        const std::string_view label,
        std::optional<std::string> note,
        std::optional<std::string> public_key_hex,
        const CancellationToken& token) {
        RETROCHAT_TRY(token.Check("update contact"));
        std::optional<models::Contact> updated;
        RETROCHAT_TRY(store_->Backend().RunInTransaction(StoreName::Contacts,
            [&](interfaces::IStoreTransaction& transaction) -> Result<Unit, VaultFailure> {
                auto existing = transaction.Get(id);
                RETROCHAT_TRY(existing);
                const auto& current_row = existing.Unwrap();
                if (!current_row.has_value()) {
                    return Result<Unit, VaultFailure>::Err(
                        VaultFailure::NotFound(std::string(ErrorMessages::CONTACT_NOT_FOUND)));
                }
                auto current = OpenContact(*current_row, dsk);
                RETROCHAT_TRY(current);
                models::Contact contact = std::move(current).Unwrap();

                auto json = EncodeRecord(contact.address, label, note, public_key_hex);
                RETROCHAT_TRY(json);
                std::string plaintext = std::move(json).Unwrap();
                const std::string now = timestamp::NowIso8601();
                auto sealed = storage::VaultStore::SealRow(
                    contact.id, dsk, hex::AsBytes(plaintext), kContactsAad, contact.created_at, now);
                RETROCHAT_TRY(crypto::SodiumInterop::Wipe(plaintext));
                RETROCHAT_TRY(sealed);
                RETROCHAT_TRY(transaction.Put(sealed.Unwrap()));

                contact.label = std::string(label);
                contact.note = note;
                contact.public_key_hex = public_key_hex;
                contact.updated_at = now;
                updated = std::move(contact);
                return Result<Unit, VaultFailure>::Ok(unit);
            }));
        return ContactResult::Ok(std::move(*updated));
    }

    Result<Unit, VaultFailure> ContactsRepository::Delete(const std::string_view id) {
        if (id.empty()) {
            return Result<Unit, VaultFailure>::Err(VaultFailure::Validation("Invalid contact ID"));
        }
        return store_->Backend().Delete(StoreName::Contacts, id);
    }

    Result<ContactList, VaultFailure> ContactsRepository::List(
        const crypto::SymmetricKey& dsk,
        const CancellationToken& token) {
        auto opened = store_->OpenAll(StoreName::Contacts, dsk, kContactsAad, token);
        RETROCHAT_TRY(opened);
        ContactList contacts;
        for (auto& entry : opened.Unwrap()) {
            auto contact = DecodeContact(entry.row, entry.plaintext);
            if (contact.IsErr()) {
                debug::LogRowSkipped(ToString(StoreName::Contacts), entry.row.id);
                continue;
            }
            contacts.push_back(std::move(contact).Unwrap());
        }
        return Result<ContactList, VaultFailure>::Ok(std::move(contacts));
    }

    Result<ContactList, VaultFailure> ContactsRepository::Search(
        const crypto::SymmetricKey& dsk,
        const std::string_view query,
        const CancellationToken& token) {
        const std::string needle = hex::ToLower(validation::Trim(query));
        auto all = List(dsk, token);
        if (needle.empty() || all.IsErr()) {
            return all;
        }
        ContactList matches;
        for (auto& contact : all.Unwrap()) {
            if (ContainsIgnoreCase(contact.label, needle) || ContainsIgnoreCase(contact.address, needle)) {
                matches.push_back(std::move(contact));
            }
        }
        return Result<ContactList, VaultFailure>::Ok(std::move(matches));
    }

    Result<std::optional<models::Contact>, VaultFailure> ContactsRepository::GetByAddress(
        const crypto::SymmetricKey& dsk,
        const std::string_view address,
        const CancellationToken& token) {
        using GetResult = Result<std::optional<models::Contact>, VaultFailure>;
        if (!validation::IsAddress(validation::Trim(address))) {
            return GetResult::Ok(std::nullopt);
        }
        auto id = ContactIdFor(validation::Trim(address));
        RETROCHAT_TRY(id);
        RETROCHAT_TRY(token.Check("get contact"));
        auto fetched = store_->Backend().Get(StoreName::Contacts, id.Unwrap());
        RETROCHAT_TRY(fetched);
        const auto& row = fetched.Unwrap();
        if (!row.has_value()) {
            return GetResult::Ok(std::nullopt);
        }
        auto contact = OpenContact(*row, dsk);
        if (contact.IsErr()) {
            debug::LogRowSkipped(ToString(StoreName::Contacts), row->id);
            return GetResult::Ok(std::nullopt);
        }
        return GetResult::Ok(std::move(contact).Unwrap());
    }
}
