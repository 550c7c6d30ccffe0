#include <catch2/catch_test_macros.hpp>
#include "courier/configuration/relay_config.hpp"
#include "courier/relay/relay_service.hpp"
#include "courier/utilities/encoding.hpp"
#include "helpers/mock_push_channel.hpp"
#include "helpers/relay_fixtures.hpp"
#include "helpers/temp_store.hpp"
#include "courier/storage/sqlite_database.hpp"
#include <algorithm>
#include <map>
#include <thread>
using namespace courier;
using namespace courier::relay;
using courier::protocol::RelayFailureType;
using courier::protocol::configuration::RelayConfig;
using courier::protocol::test_helpers::TempDirectory;
using courier::relay::test_helpers::MockPushChannel;
using courier::relay::test_helpers::SampleMessage;
using courier::relay::test_helpers::SampleUpload;
namespace {
    proto::wire::RegisterRequest RegisterAs(const std::string& id) {
        proto::wire::RegisterRequest request;
        request.set_id(id);
        return request;
    }

    std::vector<std::string> BodiesOf(const MockPushChannel& channel) {
        std::vector<std::string> bodies;
        for (const auto& message : channel.Messages()) {
            bodies.push_back(message.envelope().body());
        }
        return bodies;
    }
}
TEST_CASE("RelayService - Registration and bundles", "[relay][service][integration]") {
    auto service = RelayService::Open(RelayConfig::ForDatabase(":memory:")).Unwrap();
    SECTION("Registration is idempotent") {
        REQUIRE(service->Register(RegisterAs("bob")).Unwrap().id() == "bob");
        REQUIRE(service->Register(RegisterAs("bob")).IsOk());
        REQUIRE(service->Diagnostics().Unwrap().counts().users() == 1);
    }
    SECTION("Empty id fails validation") {
        REQUIRE(service->Register(RegisterAs("")).UnwrapErr().type == RelayFailureType::Validation);
    }
    SECTION("Latest published bundle wins") {
        REQUIRE(service->Register(RegisterAs("bob")).IsOk());
        REQUIRE(service->PublishBundle(SampleUpload("bob", 1)).IsOk());
        REQUIRE(service->PublishBundle(SampleUpload("bob", 9)).IsOk());
        const auto fetched = service->FetchBundle("bob").Unwrap();
        REQUIRE(fetched.id() == "bob");
        REQUIRE(fetched.bundle().pre_key().key_id() == 9);
        REQUIRE(fetched.bundle().kyber_pre_key().public_key() == std::string(1184, 'k'));
    }
    SECTION("Unknown ids") {
        REQUIRE(service->PublishBundle(SampleUpload("ghost")).UnwrapErr().type == RelayFailureType::NotRegistered);
        REQUIRE(service->FetchBundle("ghost").UnwrapErr().type == RelayFailureType::NotFound);
    }
    SECTION("Incomplete bundles fail validation") {
        REQUIRE(service->Register(RegisterAs("bob")).IsOk());
        auto upload = SampleUpload("bob");
        upload.mutable_bundle()->clear_kyber_pre_key();
        auto published = service->PublishBundle(upload);
        REQUIRE(published.UnwrapErr().type == RelayFailureType::Validation);
        REQUIRE(published.UnwrapErr().message == "bundle.kyberPreKey: is required");
    }
}
TEST_CASE("RelayService - Store and forward", "[relay][service][integration]") {
    auto service = RelayService::Open(RelayConfig::ForDatabase(":memory:")).Unwrap();
    REQUIRE(service->Register(RegisterAs("alice")).IsOk());
    REQUIRE(service->Register(RegisterAs("bob")).IsOk());
    SECTION("Queued messages replay in order on connect") {
        REQUIRE_FALSE(service->Submit(SampleMessage("alice", "bob", "first")).Unwrap().delivered());
        REQUIRE_FALSE(service->Submit(SampleMessage("alice", "bob", "second")).Unwrap().delivered());
        REQUIRE(service->Diagnostics().Unwrap().counts().queued_messages() == 2);
        auto channel = std::make_shared<MockPushChannel>();
        REQUIRE(service->Connect("bob", channel).IsOk());
        REQUIRE(BodiesOf(*channel) == std::vector<std::string>{"first", "second"});
        const auto frame = channel->Messages().front();
        REQUIRE(frame.from() == "alice");
        REQUIRE(frame.to() == "bob");
        REQUIRE(frame.envelope().session_id() == "alice::bob");
        REQUIRE(service->Diagnostics().Unwrap().counts().queued_messages() == 0);
    }
    SECTION("Connected recipients get messages immediately") {
        auto channel = std::make_shared<MockPushChannel>();
        REQUIRE(service->Connect("bob", channel).IsOk());
        const auto response = service->Submit(SampleMessage("alice", "bob", "live")).Unwrap();
        REQUIRE(response.ok());
        REQUIRE(response.queued());
        REQUIRE(response.delivered());
        REQUIRE(BodiesOf(*channel) == std::vector<std::string>{"live"});
    }
    SECTION("Unknown recipients leave no queue entry") {
        auto result = service->Submit(SampleMessage("alice", "ghost", "lost"));
        REQUIRE(result.UnwrapErr().type == RelayFailureType::NotRegistered);
        REQUIRE(service->Diagnostics().Unwrap().counts().queued_messages() == 0);
    }
    SECTION("Unregistered clients cannot connect") {
        auto channel = std::make_shared<MockPushChannel>();
        REQUIRE(service->Connect("ghost", channel).UnwrapErr().type == RelayFailureType::Unauthorized);
        REQUIRE(service->ActiveConnections() == 0);
    }
    SECTION("A failed push keeps the entry and later ones queued") {
        REQUIRE(service->Submit(SampleMessage("alice", "bob", "one")).IsOk());
        REQUIRE(service->Submit(SampleMessage("alice", "bob", "two")).IsOk());
        REQUIRE(service->Submit(SampleMessage("alice", "bob", "three")).IsOk());
        auto flaky = std::make_shared<MockPushChannel>();
        flaky->FailAfter(1);
        REQUIRE(service->Connect("bob", flaky).IsOk());
        REQUIRE(BodiesOf(*flaky) == std::vector<std::string>{"one"});
        REQUIRE(service->Diagnostics().Unwrap().counts().queued_messages() == 2);
        auto healthy = std::make_shared<MockPushChannel>();
        REQUIRE(service->Connect("bob", healthy).IsOk());
        REQUIRE(BodiesOf(*healthy) == std::vector<std::string>{"two", "three"});
    }
    SECTION("A failing live channel reports undelivered but queues") {
        auto channel = std::make_shared<MockPushChannel>();
        REQUIRE(service->Connect("bob", channel).IsOk());
        channel->FailSends(true);
        const auto response = service->Submit(SampleMessage("alice", "bob", "later")).Unwrap();
        REQUIRE(response.queued());
        REQUIRE_FALSE(response.delivered());
        REQUIRE(service->Diagnostics().Unwrap().counts().queued_messages() == 1);
    }
    SECTION("A second connection supersedes the first") {
        auto first = std::make_shared<MockPushChannel>();
        auto second = std::make_shared<MockPushChannel>();
        REQUIRE(service->Connect("bob", first).IsOk());
        REQUIRE(service->Connect("bob", second).IsOk());
        REQUIRE(first->ClosedCode() == std::optional<uint16_t>(4000));
        REQUIRE(first->CloseReason() == "superseded");
        service->Disconnect("bob", first.get());
        REQUIRE(service->ActiveConnections() == 1);
        REQUIRE(service->Submit(SampleMessage("alice", "bob", "to second")).Unwrap().delivered());
        REQUIRE(first->Frames().empty());
        REQUIRE(BodiesOf(*second) == std::vector<std::string>{"to second"});
        service->Disconnect("bob", second.get());
        REQUIRE(service->ActiveConnections() == 0);
    }
    SECTION("A channel that closed before connecting is not kept") {
        auto channel = std::make_shared<MockPushChannel>();
        channel->Close(1000, "gone");
        service->Disconnect("bob", channel.get());
        REQUIRE(service->Connect("bob", channel).IsOk());
        REQUIRE(service->ActiveConnections() == 0);
        REQUIRE(service->Diagnostics().Unwrap().counts().active_connections() == 0);
        REQUIRE_FALSE(service->Submit(SampleMessage("alice", "bob", "later")).Unwrap().delivered());
        REQUIRE(channel->Frames().empty());
        auto healthy = std::make_shared<MockPushChannel>();
        REQUIRE(service->Connect("bob", healthy).IsOk());
        REQUIRE(BodiesOf(*healthy) == std::vector<std::string>{"later"});
    }
    SECTION("Concurrent submissions arrive once each") {
        auto channel = std::make_shared<MockPushChannel>();
        REQUIRE(service->Connect("bob", channel).IsOk());
        constexpr int kSenders = 4;
        constexpr int kPerSender = 10;
        std::vector<std::thread> senders;
        for (int s = 0; s < kSenders; ++s) {
            senders.emplace_back([&service, s] {
                for (int i = 0; i < kPerSender; ++i) {
                    (void)service->Submit(SampleMessage("alice", "bob", std::to_string(s * 100 + i)));
                }
            });
        }
        for (auto& sender : senders) {
            sender.join();
        }
        auto bodies = BodiesOf(*channel);
        REQUIRE(bodies.size() == kSenders * kPerSender);
        std::sort(bodies.begin(), bodies.end());
        REQUIRE(std::adjacent_find(bodies.begin(), bodies.end()) == bodies.end());
        REQUIRE(service->Diagnostics().Unwrap().counts().queued_messages() == 0);
    }
}
TEST_CASE("RelayService - Diagnostics and shutdown", "[relay][service][integration]") {
    TempDirectory dir;
    const auto path = dir.File("relay.db");
    auto service = RelayService::Open(RelayConfig::ForDatabase(path)).Unwrap();
    REQUIRE(service->Register(RegisterAs("alice")).IsOk());
    REQUIRE(service->Register(RegisterAs("bob")).IsOk());
    REQUIRE(service->Register(RegisterAs("carol")).IsOk());
    REQUIRE(service->PublishBundle(SampleUpload("bob")).IsOk());
    for (int i = 0; i < 7; ++i) {
        REQUIRE(service->Submit(SampleMessage("alice", "bob", "b")).IsOk());
    }
    REQUIRE(service->Submit(SampleMessage("bob", "carol", "c")).IsOk());
    auto alice_channel = std::make_shared<MockPushChannel>();
    REQUIRE(service->Connect("alice", alice_channel).IsOk());
    SECTION("Snapshot reports counts and depth buckets") {
        const auto snapshot = service->Diagnostics().Unwrap();
        REQUIRE(snapshot.db_path() == path);
        REQUIRE(snapshot.counts().users() == 3);
        REQUIRE(snapshot.counts().prekeys() == 1);
        REQUIRE(snapshot.counts().queued_messages() == 8);
        REQUIRE(snapshot.counts().active_connections() == 1);
        const auto& histogram = snapshot.queue_depth_histogram();
        REQUIRE(histogram.at("0") == 0);
        REQUIRE(histogram.at("1-5") == 1);
        REQUIRE(histogram.at("6-20") == 1);
        REQUIRE(histogram.at("21+") == 0);
        REQUIRE_FALSE(snapshot.has_metrics());
    }
    SECTION("Shutdown closes connections and keeps the queue on disk") {
        service->Shutdown();
        REQUIRE(alice_channel->ClosedCode() == std::optional<uint16_t>(1001));
        REQUIRE(service->Register(RegisterAs("dave")).UnwrapErr().type == RelayFailureType::Storage);
        service.reset();
        auto reopened = RelayService::Open(RelayConfig::ForDatabase(path)).Unwrap();
        auto bob_channel = std::make_shared<MockPushChannel>();
        REQUIRE(reopened->Connect("bob", bob_channel).IsOk());
        REQUIRE(bob_channel->Frames().size() == 7);
    }
}
TEST_CASE("RelayService - Queue order under concurrent submits", "[relay][service][integration]") {
    TempDirectory dir;
    const auto path = dir.File("relay.db");
    auto service = RelayService::Open(RelayConfig::ForDatabase(path)).Unwrap();
    REQUIRE(service->Register(RegisterAs("bob")).IsOk());
    constexpr int kSenders = 4;
    constexpr int kPerSender = 25;
    std::vector<std::thread> senders;
    for (int s = 0; s < kSenders; ++s) {
        senders.emplace_back([&service, s] {
            for (int i = 0; i < kPerSender; ++i) {
                (void)service->Submit(SampleMessage("sender" + std::to_string(s), "bob", std::to_string(i)));
            }
        });
    }
    for (auto& sender : senders) {
        sender.join();
    }

    auto db = courier::protocol::storage::SqliteDatabase::Open(path).Unwrap();
    auto statement = db->Prepare("SELECT created_at FROM messages ORDER BY rowid").Unwrap();
    std::vector<int64_t> stamps;
    while (statement.Step().Unwrap()) {
        stamps.push_back(statement.ColumnInt64(0));
    }
    REQUIRE(stamps.size() == kSenders * kPerSender);
    REQUIRE(std::is_sorted(stamps.begin(), stamps.end()));

    auto channel = std::make_shared<MockPushChannel>();
    REQUIRE(service->Connect("bob", channel).IsOk());
    std::map<std::string, int> last_seen;
    for (const auto& message : channel->Messages()) {
        const int index = std::stoi(message.envelope().body());
        const auto previous = last_seen.find(message.from());
        if (previous != last_seen.end()) {
            REQUIRE(index == previous->second + 1);
        }
        last_seen[message.from()] = index;
    }
    REQUIRE(channel->Frames().size() == kSenders * kPerSender);
}
