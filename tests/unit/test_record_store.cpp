#include <catch2/catch_test_macros.hpp>
#include "courier/crypto/sodium_interop.hpp"
#include "courier/storage/record_store.hpp"
#include "courier/storage/sqlite_database.hpp"
#include "courier/utilities/encoding.hpp"
#include "helpers/temp_store.hpp"
using namespace courier;
using namespace courier::protocol;
using namespace courier::protocol::storage;
using courier::protocol::crypto::SodiumInterop;
using courier::protocol::test_helpers::FastStoreConfig;
using courier::protocol::test_helpers::TempDirectory;
using courier::protocol::utilities::Encoding;
TEST_CASE("RecordStore - Typed values", "[storage][record_store]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    auto opened = RecordStore::Open(dir.File("store.db"), "pass", FastStoreConfig());
    REQUIRE(opened.IsOk());
    auto store = std::move(opened).Unwrap();
    SECTION("Absent keys read as empty") {
        auto value = store->GetText("missing");
        REQUIRE(value.IsOk());
        REQUIRE_FALSE(value.Unwrap().has_value());
        REQUIRE(store->Delete("missing").IsOk());
    }
    SECTION("Bytes, text and integers round trip") {
        const std::vector<uint8_t> bytes = {0x00, 0x01, 0xfe, 0xff};
        REQUIRE(store->SetBytes("b", bytes).IsOk());
        REQUIRE(store->SetText("t", "hello").IsOk());
        REQUIRE(store->SetInteger("i", -42).IsOk());
        REQUIRE(store->GetBytes("b").Unwrap().value() == bytes);
        REQUIRE(store->GetText("t").Unwrap().value() == "hello");
        REQUIRE(store->GetInteger("i").Unwrap().value() == -42);
    }
    SECTION("Set overwrites and Delete removes") {
        REQUIRE(store->SetText("k", "one").IsOk());
        REQUIRE(store->SetText("k", "two").IsOk());
        REQUIRE(store->GetText("k").Unwrap().value() == "two");
        REQUIRE(store->Delete("k").IsOk());
        REQUIRE_FALSE(store->GetText("k").Unwrap().has_value());
    }
    SECTION("Reading the wrong arm is a decode failure") {
        REQUIRE(store->SetText("k", "text").IsOk());
        auto value = store->GetInteger("k");
        REQUIRE(value.IsErr());
        REQUIRE(value.UnwrapErr().type == StorageFailureType::Decode);
    }
    SECTION("Metadata is kept apart from sealed values") {
        REQUIRE(store->SetMeta("localId", "alice").IsOk());
        REQUIRE(store->GetMeta("localId").Unwrap().value() == "alice");
        REQUIRE_FALSE(store->GetText("localId").Unwrap().has_value());
    }
}
TEST_CASE("RecordStore - Prefix listing", "[storage][record_store]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    auto store = RecordStore::Open(dir.File("store.db"), "pass", FastStoreConfig()).Unwrap();
    REQUIRE(store->SetInteger("prekey:2", 2).IsOk());
    REQUIRE(store->SetInteger("prekey:10", 10).IsOk());
    REQUIRE(store->SetInteger("prekey:1", 1).IsOk());
    REQUIRE(store->SetInteger("prekeyX", 0).IsOk());
    REQUIRE(store->SetInteger("signedprekey:1", 1).IsOk());
    SECTION("Keys come back in bytewise order") {
        auto keys = store->ListKeysByPrefix("prekey:");
        REQUIRE(keys.IsOk());
        REQUIRE(keys.Unwrap() == std::vector<std::string>{"prekey:1", "prekey:10", "prekey:2"});
    }
    SECTION("Wildcard characters in the prefix match literally") {
        REQUIRE(store->SetInteger("a%b", 1).IsOk());
        REQUIRE(store->SetInteger("axb", 1).IsOk());
        auto keys = store->ListKeysByPrefix("a%");
        REQUIRE(keys.IsOk());
        REQUIRE(keys.Unwrap() == std::vector<std::string>{"a%b"});
    }
    SECTION("Unmatched prefix yields nothing") {
        REQUIRE(store->ListKeysByPrefix("session:").Unwrap().empty());
    }
}
TEST_CASE("RecordStore - Passphrase and tamper detection", "[storage][record_store]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    const auto path = dir.File("store.db");
    {
        auto store = RecordStore::Open(path, "correct", FastStoreConfig()).Unwrap();
        REQUIRE(store->SetText("secret", "value").IsOk());
        REQUIRE(store->SetText("other", "value2").IsOk());
    }
    SECTION("Reopening with the same passphrase reads values") {
        auto store = RecordStore::Open(path, "correct", FastStoreConfig()).Unwrap();
        REQUIRE(store->GetText("secret").Unwrap().value() == "value");
    }
    SECTION("Wrong passphrase opens but fails on first read") {
        auto opened = RecordStore::Open(path, "wrong", FastStoreConfig());
        REQUIRE(opened.IsOk());
        auto value = opened.Unwrap()->GetText("secret");
        REQUIRE(value.IsErr());
        REQUIRE(value.UnwrapErr().type == StorageFailureType::TamperOrWrongPassphrase);
    }
    SECTION("A blob moved under another key fails to open") {
        {
            auto db = SqliteDatabase::Open(path).Unwrap();
            REQUIRE(db->Execute(
                "UPDATE kv SET value = (SELECT value FROM kv WHERE key = 'secret') WHERE key = 'other'").IsOk());
        }
        auto store = RecordStore::Open(path, "correct", FastStoreConfig()).Unwrap();
        auto value = store->GetText("other");
        REQUIRE(value.IsErr());
        REQUIRE(value.UnwrapErr().type == StorageFailureType::TamperOrWrongPassphrase);
    }
    SECTION("A truncated blob fails to open") {
        {
            auto db = SqliteDatabase::Open(path).Unwrap();
            REQUIRE(db->Execute("UPDATE kv SET value = X'0102' WHERE key = 'secret'").IsOk());
        }
        auto store = RecordStore::Open(path, "correct", FastStoreConfig()).Unwrap();
        auto value = store->GetText("secret");
        REQUIRE(value.IsErr());
        REQUIRE(value.UnwrapErr().type == StorageFailureType::TamperOrWrongPassphrase);
    }
}
