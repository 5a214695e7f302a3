/**
 * @file vault_walkthrough.cpp
 * @brief Two vaults exchanging a message over the in-process transport
 */

#include "retrochat/crypto/sodium_interop.hpp"
#include "retrochat/storage/memory_vault_backend.hpp"
#include "retrochat/storage/vault_store.hpp"
#include "retrochat/session/key_hierarchy_manager.hpp"
#include "retrochat/repositories/contacts_repository.hpp"
#include "retrochat/protocol/message_repository.hpp"
#include "retrochat/protocol/messaging_service.hpp"
#include "retrochat/protocol/message_sealer.hpp"
#include "retrochat/transport/mock_transport.hpp"
#include "retrochat/backup/vault_backup.hpp"
#include "retrochat/core/hex.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace retrochat::vault;

namespace {

struct Device {
    std::shared_ptr<storage::MemoryVaultBackend> backend;
    std::shared_ptr<storage::VaultStore> store;
    std::shared_ptr<session::KeyHierarchyManager> session;
    std::shared_ptr<protocol::MessageRepository> messages;
    std::shared_ptr<repositories::ContactsRepository> contacts;
    std::shared_ptr<diagnostics::LocalTelemetry> telemetry;
    std::shared_ptr<protocol::MessagingService> service;
};

Device MakeDevice() {
    Device device;
    device.backend = std::make_shared<storage::MemoryVaultBackend>();
    device.store = std::make_shared<storage::VaultStore>(device.backend);
    device.session = std::make_shared<session::KeyHierarchyManager>(device.store);
    device.messages = std::make_shared<protocol::MessageRepository>(device.store);
    device.contacts = std::make_shared<repositories::ContactsRepository>(device.store);
    device.telemetry = std::make_shared<diagnostics::LocalTelemetry>();
    device.service = protocol::MessagingService::Create(
        device.session, device.messages, device.contacts, device.telemetry);
    return device;
}

// Stand-in for the wallet: any 65 bytes unlock the vault for that address.
std::string FakeWalletSignature() {
    return "0x" + hex::Encode(crypto::SodiumInterop::GetRandomBytes(kWalletSignatureBytes));
}

bool Report(const char* step, const Result<Unit, VaultFailure>& result) {
    if (result.IsErr()) {
        std::cerr << "   " << step << " failed: " << result.UnwrapErr().message << std::endl;
        return false;
    }
    std::cout << "   ✓ " << step << std::endl;
    return true;
}

}

int main() {
    std::cout << "=== Retrochat Vault - Walkthrough ===" << std::endl;
    std::cout << std::endl;

    auto init_result = crypto::SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: " << init_result.UnwrapErr().message << std::endl;
        return 1;
    }

    const std::string alice_address = "0x1111111111111111111111111111111111111111";
    const std::string bob_address = "0x2222222222222222222222222222222222222222";

    std::cout << "1. Unlocking both vaults..." << std::endl;
    Device alice = MakeDevice();
    Device bob = MakeDevice();
    auto alice_unlock = alice.session->Unlock(FakeWalletSignature(), alice_address);
    auto bob_unlock = bob.session->Unlock(FakeWalletSignature(), bob_address);
    if (alice_unlock.IsErr() || bob_unlock.IsErr()) {
        std::cerr << "   Unlock failed" << std::endl;
        return 1;
    }
    std::cout << "   Alice fingerprint: " << alice_unlock.Unwrap().fingerprint << std::endl;
    std::cout << "   Bob fingerprint:   " << bob_unlock.Unwrap().fingerprint << std::endl;
    std::cout << std::endl;

    std::cout << "2. Exchanging identity keys through contacts..." << std::endl;
    auto alice_identity = alice.session->GetOrCreateIdentityKeyPair();
    auto bob_identity = bob.session->GetOrCreateIdentityKeyPair();
    auto alice_dsk = alice.session->GetDeviceStorageKey();
    auto bob_dsk = bob.session->GetDeviceStorageKey();
    if (alice_identity.IsErr() || bob_identity.IsErr() || alice_dsk.IsErr() || bob_dsk.IsErr()) {
        std::cerr << "   Key hierarchy unavailable" << std::endl;
        return 1;
    }
    auto bob_contact = alice.contacts->Create(*alice_dsk.Unwrap(), bob_address, "Bob", std::nullopt,
        bob_identity.Unwrap()->GetPublicKeyHex());
    auto alice_contact = bob.contacts->Create(*bob_dsk.Unwrap(), alice_address, "Alice", std::nullopt,
        alice_identity.Unwrap()->GetPublicKeyHex());
    if (bob_contact.IsErr() || alice_contact.IsErr()) {
        std::cerr << "   Contact creation failed" << std::endl;
        return 1;
    }
    std::cout << "   ✓ Alice knows " << bob_contact.Unwrap().address << std::endl;
    std::cout << "   ✓ Bob knows " << alice_contact.Unwrap().address << std::endl;
    std::cout << std::endl;

    std::cout << "3. Sending a message..." << std::endl;
    auto alice_transport = std::make_shared<transport::MockTransport>();
    auto bob_transport = std::make_shared<transport::MockTransport>();
    // The transport directory wins over contacts, so it must agree with them.
    alice_transport->RegisterPeerKey(bob_address, bob_identity.Unwrap()->GetPublicKeyHex());
    bob_transport->RegisterPeerKey(alice_address, alice_identity.Unwrap()->GetPublicKeyHex());
    if (!Report("Alice transport started", alice.service->Start(alice_transport))
        || !Report("Bob transport started", bob.service->Start(bob_transport))) {
        return 1;
    }
    auto sent = alice.service->Send(bob_address, std::nullopt, "hello");
    if (sent.IsErr()) {
        std::cerr << "   Send failed: " << sent.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   Message id: " << sent.Unwrap() << std::endl;

    // The mock transport has no network; hand Alice's envelope to Bob directly.
    for (const auto& envelope : alice_transport->SentMessages()) {
        if (!Report("Bob received envelope", bob_transport->SimulateIncoming(envelope))) {
            return 1;
        }
    }
    auto bob_key = bob.service->ConversationKeyFor(alice_address);
    if (bob_key.IsErr()) {
        std::cerr << "   Conversation key failed: " << bob_key.UnwrapErr().message << std::endl;
        return 1;
    }
    auto history = bob.messages->List(*bob_key.Unwrap().key);
    if (history.IsErr() || history.Unwrap().empty()) {
        std::cerr << "   Bob has no messages" << std::endl;
        return 1;
    }
    auto plaintext = protocol::MessageSealer::Open(*bob_key.Unwrap().key, history.Unwrap().front());
    if (plaintext.IsErr()) {
        std::cerr << "   Decryption failed" << std::endl;
        return 1;
    }
    std::cout << "   Bob reads: \"" << plaintext.Unwrap() << "\" in conversation "
              << bob_key.Unwrap().id << std::endl;
    std::cout << std::endl;

    std::cout << "4. Exporting Bob's vault..." << std::endl;
    backup::VaultBackup bob_backup(bob.backend, configuration::VaultConfig::Default());
    auto exported = bob_backup.ExportJson("correct horse battery staple");
    if (exported.IsErr()) {
        std::cerr << "   Export failed: " << exported.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Backup file is " << exported.Unwrap().size() << " bytes of JSON" << std::endl;
    std::cout << std::endl;

    alice.service->Stop();
    bob.service->Stop();
    alice.session->Lock();
    bob.session->Lock();

    std::cout << "=== Walkthrough completed successfully ===" << std::endl;
    return 0;
}
