#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "courier/core/constants.hpp"
#include "courier/crypto/sodium_interop.hpp"
#include "courier/identity/material_store.hpp"
#include "courier/models/protocol_address.hpp"
#include "helpers/temp_store.hpp"
using namespace courier;
using namespace courier::protocol;
using courier::protocol::crypto::SodiumInterop;
using courier::protocol::identity::MaterialStore;
using courier::protocol::interfaces::IdentityChange;
using courier::protocol::models::ProtocolAddress;
using courier::protocol::test_helpers::FastStoreConfig;
using courier::protocol::test_helpers::TempDirectory;
using Catch::Matchers::ContainsSubstring;
TEST_CASE("MaterialStore - Identity lifecycle", "[identity][material_store]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    auto store = MaterialStore::Open(dir.File("alice.db"), "pass", FastStoreConfig()).Unwrap();
    SECTION("Fresh store has no identity") {
        REQUIRE_FALSE(store->HasIdentity().Unwrap());
        auto local_id = store->GetLocalId();
        REQUIRE(local_id.IsErr());
        REQUIRE(local_id.UnwrapErr().type == ProtocolFailureType::InvalidState);
        REQUIRE(store->GetIdentityKeyPair().IsErr());
        REQUIRE(store->GetRegistrationId().IsErr());
        REQUIRE(store->GeneratePreKeys(1).IsErr());
    }
    SECTION("Initialized identity persists across reopen") {
        REQUIRE(store->InitializeIdentity("alice").IsOk());
        REQUIRE(store->HasIdentity().Unwrap());
        const uint32_t registration_id = store->GetRegistrationId().Unwrap();
        REQUIRE(registration_id >= 1);
        REQUIRE(registration_id < 16380);
        const auto public_key = store->GetIdentityKeyPair().Unwrap().GetPublicKey();
        store.reset();
        auto reopened = MaterialStore::Open(dir.File("alice.db"), "pass", FastStoreConfig()).Unwrap();
        REQUIRE(reopened->GetLocalId().Unwrap() == "alice");
        REQUIRE(reopened->GetDeviceId().Unwrap() == 1);
        REQUIRE(reopened->GetRegistrationId().Unwrap() == registration_id);
        REQUIRE(reopened->GetIdentityKeyPair().Unwrap().GetPublicKey() == public_key);
    }
    SECTION("Explicit device id is stored") {
        REQUIRE(store->InitializeIdentity("alice", 3).IsOk());
        REQUIRE(store->GetDeviceId().Unwrap() == 3);
    }
    SECTION("Empty id and device zero are rejected") {
        REQUIRE(store->InitializeIdentity("").UnwrapErr().type == ProtocolFailureType::InvalidInput);
        REQUIRE(store->InitializeIdentity("alice", 0).UnwrapErr().type == ProtocolFailureType::InvalidInput);
        REQUIRE_FALSE(store->HasIdentity().Unwrap());
    }
}
TEST_CASE("MaterialStore - Prekey counters", "[identity][material_store]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    auto store = MaterialStore::Open(dir.File("bob.db"), "pass", FastStoreConfig()).Unwrap();
    REQUIRE(store->InitializeIdentity("bob").IsOk());
    SECTION("Untouched counters report one") {
        REQUIRE(store->LatestPreKeyId(StoreKeys::COUNTER_PRE_KEY).Unwrap() == 1);
        auto missing = store->Stores().pre_keys.LoadPreKey(1);
        REQUIRE(missing.IsErr());
        REQUIRE(missing.UnwrapErr().type == ProtocolFailureType::MaterialNotFound);
        REQUIRE_THAT(missing.UnwrapErr().message, ContainsSubstring("1"));
    }
    SECTION("First batch starts at id one") {
        REQUIRE(store->GeneratePreKeys(3).IsOk());
        REQUIRE(store->LatestPreKeyId(StoreKeys::COUNTER_PRE_KEY).Unwrap() == 3);
        REQUIRE(store->LatestPreKeyId(StoreKeys::COUNTER_SIGNED_PRE_KEY).Unwrap() == 1);
        REQUIRE(store->LatestPreKeyId(StoreKeys::COUNTER_KYBER_PRE_KEY).Unwrap() == 1);
        for (uint32_t id = 1; id <= 3; ++id) {
            auto pre_key = store->Stores().pre_keys.LoadPreKey(id);
            REQUIRE(pre_key.IsOk());
            REQUIRE(pre_key.Unwrap().id() == id);
        }
        REQUIRE(store->Stores().signed_pre_keys.LoadSignedPreKey(1).IsOk());
        REQUIRE(store->Stores().kyber_pre_keys.LoadKyberPreKey(1).IsOk());
    }
    SECTION("Later batches continue the sequence") {
        REQUIRE(store->GeneratePreKeys(1).IsOk());
        REQUIRE(store->GeneratePreKeys(6).IsOk());
        REQUIRE(store->LatestPreKeyId(StoreKeys::COUNTER_PRE_KEY).Unwrap() == 7);
        REQUIRE(store->LatestPreKeyId(StoreKeys::COUNTER_SIGNED_PRE_KEY).Unwrap() == 2);
        REQUIRE(store->Stores().pre_keys.LoadPreKey(7).IsOk());
        auto beyond = store->Stores().pre_keys.LoadPreKey(8);
        REQUIRE(beyond.IsErr());
        REQUIRE_THAT(beyond.UnwrapErr().message, ContainsSubstring("8"));
    }
    SECTION("Signed prekeys verify under the identity key") {
        REQUIRE(store->GeneratePreKeys(0).IsOk());
        const auto identity = store->GetIdentityKeyPair().Unwrap();
        const auto record = store->Stores().signed_pre_keys.LoadSignedPreKey(1).Unwrap();
        const std::vector<uint8_t> public_key(record.public_key().begin(), record.public_key().end());
        const std::vector<uint8_t> signature(record.signature().begin(), record.signature().end());
        REQUIRE(SodiumInterop::VerifyDetached(signature, public_key, identity.GetPublicKey()));
    }
}
TEST_CASE("MaterialStore - One-time prekey removal policy", "[identity][material_store]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    SECTION("Default policy keeps the prekey and writes a marker") {
        auto store = MaterialStore::Open(dir.File("keep.db"), "pass", FastStoreConfig()).Unwrap();
        REQUIRE(store->InitializeIdentity("bob").IsOk());
        REQUIRE(store->GeneratePreKeys(1).IsOk());
        REQUIRE(store->Stores().pre_keys.RemovePreKey(1).IsOk());
        REQUIRE(store->Stores().pre_keys.LoadPreKey(1).IsOk());
        auto markers = store->Records().ListKeysByPrefix(StoreKeys::PRE_KEY_USED_PREFIX);
        REQUIRE(markers.Unwrap() == std::vector<std::string>{"prekey:used:1"});
    }
    SECTION("Strict policy erases the prekey") {
        const auto config = configuration::StoreConfig::StrictSingleUse().WithScryptCost(1024, 8, 1);
        auto store = MaterialStore::Open(dir.File("strict.db"), "pass", config).Unwrap();
        REQUIRE(store->InitializeIdentity("bob").IsOk());
        REQUIRE(store->GeneratePreKeys(1).IsOk());
        REQUIRE(store->Stores().pre_keys.RemovePreKey(1).IsOk());
        REQUIRE(store->Stores().pre_keys.LoadPreKey(1).UnwrapErr().type == ProtocolFailureType::MaterialNotFound);
    }
}
TEST_CASE("MaterialStore - Peer identities", "[identity][material_store]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    auto store = MaterialStore::Open(dir.File("alice.db"), "pass", FastStoreConfig()).Unwrap();
    auto& identities = store->Stores().identity;
    const ProtocolAddress bob("bob", 1);
    const std::vector<uint8_t> first(32, 0x01);
    const std::vector<uint8_t> second(32, 0x02);
    REQUIRE(identities.IsTrustedIdentity(bob, first).Unwrap());
    REQUIRE(identities.SaveIdentity(bob, first).Unwrap() == IdentityChange::NewOrUnchanged);
    REQUIRE(identities.SaveIdentity(bob, first).Unwrap() == IdentityChange::NewOrUnchanged);
    REQUIRE(identities.IsTrustedIdentity(bob, first).Unwrap());
    REQUIRE_FALSE(identities.IsTrustedIdentity(bob, second).Unwrap());
    REQUIRE(identities.SaveIdentity(bob, second).Unwrap() == IdentityChange::ReplacedExisting);
    REQUIRE(identities.GetIdentity(bob).Unwrap().value() == second);
    REQUIRE_FALSE(identities.GetIdentity(ProtocolAddress("bob", 2)).Unwrap().has_value());
}
TEST_CASE("MaterialStore - Inbox", "[identity][material_store]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    auto store = MaterialStore::Open(dir.File("bob.db"), "pass", FastStoreConfig()).Unwrap();
    auto make = [](const std::string& id, const int64_t timestamp, const std::string& text) {
        proto::storage::InboxMessage message;
        message.set_id(id);
        message.set_sender_id("alice");
        message.set_timestamp(timestamp);
        message.set_plaintext(text);
        return message;
    };
    SECTION("Messages are listed by timestamp") {
        REQUIRE(store->SaveInboxMessage(make("z-first", 100, "first")).IsOk());
        REQUIRE(store->SaveInboxMessage(make("a-third", 300, "third")).IsOk());
        REQUIRE(store->SaveInboxMessage(make("m-second", 200, "second")).IsOk());
        auto listed = store->ListInboxMessages();
        REQUIRE(listed.IsOk());
        const auto& messages = listed.Unwrap();
        REQUIRE(messages.size() == 3);
        REQUIRE(messages[0].plaintext() == "first");
        REQUIRE(messages[1].plaintext() == "second");
        REQUIRE(messages[2].plaintext() == "third");
    }
    SECTION("Saving under an existing id replaces it") {
        REQUIRE(store->SaveInboxMessage(make("same", 1, "old")).IsOk());
        REQUIRE(store->SaveInboxMessage(make("same", 1, "new")).IsOk());
        const auto messages = store->ListInboxMessages().Unwrap();
        REQUIRE(messages.size() == 1);
        REQUIRE(messages[0].plaintext() == "new");
    }
    SECTION("Empty id is rejected") {
        REQUIRE(store->SaveInboxMessage(make("", 1, "x")).UnwrapErr().type == ProtocolFailureType::InvalidInput);
        REQUIRE(store->ListInboxMessages().Unwrap().empty());
    }
}
