#include <catch2/catch_test_macros.hpp>
#include "courier/relay/relay_database.hpp"
#include "helpers/temp_store.hpp"
using namespace courier::relay;
using courier::protocol::StorageFailureType;
using courier::protocol::test_helpers::TempDirectory;
namespace {
    QueueEntry Entry(const std::string& id, const std::string& to, const int64_t created_at) {
        QueueEntry entry;
        entry.id = id;
        entry.to_id = to;
        entry.from_id = "alice";
        entry.envelope_json = R"({"version":1})";
        entry.created_at = created_at;
        return entry;
    }
}
TEST_CASE("RelayDatabase - Users and bundles", "[relay][database]") {
    auto db = RelayDatabase::Open(":memory:").Unwrap();
    SECTION("Registration is idempotent") {
        REQUIRE_FALSE(db->UserExists("bob").Unwrap());
        REQUIRE(db->InsertUser("bob", 1).IsOk());
        REQUIRE(db->InsertUser("bob", 2).IsOk());
        REQUIRE(db->UserExists("bob").Unwrap());
        REQUIRE(db->CountUsers().Unwrap() == 1);
    }
    SECTION("Bundles are last write wins") {
        REQUIRE_FALSE(db->GetBundle("bob").Unwrap().has_value());
        REQUIRE(db->UpsertBundle("bob", R"({"id":"bob","deviceId":1})", 1).IsOk());
        REQUIRE(db->UpsertBundle("bob", R"({"id":"bob","deviceId":2})", 2).IsOk());
        REQUIRE(db->GetBundle("bob").Unwrap().value() == R"({"id":"bob","deviceId":2})");
        REQUIRE(db->CountBundles().Unwrap() == 1);
    }
}
TEST_CASE("RelayDatabase - Queue", "[relay][database]") {
    auto db = RelayDatabase::Open(":memory:").Unwrap();
    REQUIRE(db->InsertMessage(Entry("m2", "bob", 200)).IsOk());
    REQUIRE(db->InsertMessage(Entry("m1", "bob", 100)).IsOk());
    REQUIRE(db->InsertMessage(Entry("m3", "bob", 200)).IsOk());
    REQUIRE(db->InsertMessage(Entry("c1", "carol", 50)).IsOk());
    SECTION("Pending entries come in creation then insertion order") {
        const auto pending = db->PendingFor("bob").Unwrap();
        REQUIRE(pending.size() == 3);
        REQUIRE(pending[0].id == "m1");
        REQUIRE(pending[1].id == "m2");
        REQUIRE(pending[2].id == "m3");
        REQUIRE(pending[0].from_id == "alice");
        REQUIRE_FALSE(pending[0].delivered);
    }
    SECTION("Delivered entries leave the pending list but stay stored") {
        REQUIRE(db->MarkDelivered("m1").IsOk());
        REQUIRE(db->PendingFor("bob").Unwrap().size() == 2);
        const auto stored = db->GetMessage("m1").Unwrap();
        REQUIRE(stored.has_value());
        REQUIRE(stored->delivered);
        REQUIRE(db->CountQueued().Unwrap() == 3);
        REQUIRE(db->CountMessages().Unwrap() == 4);
    }
    SECTION("Depth per recipient counts undelivered entries") {
        REQUIRE(db->MarkDelivered("c1").IsOk());
        const auto depths = db->QueueDepthByRecipient().Unwrap();
        REQUIRE(depths.size() == 1);
        REQUIRE(depths[0].first == "bob");
        REQUIRE(depths[0].second == 3);
    }
    SECTION("A closed database refuses work") {
        db->Close();
        auto result = db->PendingFor("bob");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == StorageFailureType::InvalidState);
    }
}
TEST_CASE("RelayDatabase - Persistence", "[relay][database]") {
    TempDirectory dir;
    const auto path = (dir.Path() / "nested" / "relay.db").string();
    {
        auto db = RelayDatabase::Open(path).Unwrap();
        REQUIRE(db->InsertUser("bob", 1).IsOk());
        REQUIRE(db->InsertMessage(Entry("m1", "bob", 1)).IsOk());
    }
    auto reopened = RelayDatabase::Open(path).Unwrap();
    REQUIRE(reopened->UserExists("bob").Unwrap());
    REQUIRE(reopened->PendingFor("bob").Unwrap().size() == 1);
    REQUIRE(reopened->Path() == path);
}
