#include <catch2/catch_test_macros.hpp>
#include "courier/relay/connection_registry.hpp"
#include "helpers/mock_push_channel.hpp"
using namespace courier::relay;
using courier::relay::test_helpers::MockPushChannel;
TEST_CASE("ConnectionRegistry - Install and supersede", "[relay][registry]") {
    ConnectionRegistry registry;
    auto first = std::make_shared<MockPushChannel>();
    auto second = std::make_shared<MockPushChannel>();
    REQUIRE(registry.Install("bob", first) == nullptr);
    REQUIRE(registry.Find("bob") == first);
    REQUIRE(registry.Size() == 1);
    SECTION("A new connection closes the old one") {
        auto superseded = registry.Install("bob", second);
        REQUIRE(superseded == first);
        REQUIRE(first->ClosedCode() == std::optional<uint16_t>(4000));
        REQUIRE(first->CloseReason() == "superseded");
        REQUIRE(second->IsOpen());
        REQUIRE(registry.Find("bob") == second);
        REQUIRE(registry.Size() == 1);
    }
    SECTION("Reinstalling the same channel does not close it") {
        REQUIRE(registry.Install("bob", first) == nullptr);
        REQUIRE(first->IsOpen());
    }
    SECTION("Remove by a superseded channel keeps the newer one") {
        registry.Install("bob", second);
        REQUIRE_FALSE(registry.Remove("bob", first.get()));
        REQUIRE(registry.Find("bob") == second);
        REQUIRE(registry.Remove("bob", second.get()));
        REQUIRE(registry.Find("bob") == nullptr);
        REQUIRE(registry.Size() == 0);
    }
    SECTION("Unknown ids are ignored") {
        REQUIRE_FALSE(registry.Remove("carol", first.get()));
        REQUIRE(registry.Find("carol") == nullptr);
    }
}
TEST_CASE("ConnectionRegistry - Slot reuse and shutdown", "[relay][registry]") {
    ConnectionRegistry registry;
    auto alice = std::make_shared<MockPushChannel>();
    auto bob = std::make_shared<MockPushChannel>();
    auto carol = std::make_shared<MockPushChannel>();
    registry.Install("alice", alice);
    registry.Install("bob", bob);
    REQUIRE(registry.Remove("alice", alice.get()));
    registry.Install("carol", carol);
    REQUIRE(registry.Size() == 2);
    REQUIRE(registry.Find("carol") == carol);
    REQUIRE(registry.Find("bob") == bob);
    REQUIRE(registry.Find("alice") == nullptr);
    registry.CloseAll(1001, "relay shutting down");
    REQUIRE(registry.Size() == 0);
    REQUIRE(bob->ClosedCode() == std::optional<uint16_t>(1001));
    REQUIRE(carol->CloseReason() == "relay shutting down");
    REQUIRE(alice->IsOpen());
}
