#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "courier/configuration/relay_config.hpp"
#include "courier/relay/relay_service.hpp"
#include "courier/relay/request_router.hpp"
#include "courier/utilities/json_codec.hpp"
#include "helpers/relay_fixtures.hpp"
using namespace courier;
using namespace courier::relay;
using courier::protocol::configuration::RelayConfig;
using courier::protocol::utilities::JsonCodec;
using courier::relay::test_helpers::SampleMessage;
using courier::relay::test_helpers::SampleUpload;
using Catch::Matchers::ContainsSubstring;
namespace {
    std::string ToJson(const google::protobuf::Message& message) {
        return JsonCodec::Print(message).Unwrap();
    }

    proto::wire::ErrorResponse ErrorOf(const HttpResponse& response) {
        return JsonCodec::ParseAs<proto::wire::ErrorResponse>(response.body).Unwrap();
    }
}
TEST_CASE("RequestRouter - URL helpers", "[relay][router]") {
    SECTION("Percent decoding") {
        REQUIRE(RequestRouter::PercentDecode("bob%20smith") == "bob smith");
        REQUIRE(RequestRouter::PercentDecode("a%2Fb%2fc") == "a/b/c");
        REQUIRE(RequestRouter::PercentDecode("100%") == "100%");
        REQUIRE(RequestRouter::PercentDecode("%zz") == "%zz");
        REQUIRE(RequestRouter::PercentDecode("a+b") == "a+b");
    }
    SECTION("Path and query") {
        REQUIRE(RequestRouter::PathOf("/ws?client_id=bob") == "/ws");
        REQUIRE(RequestRouter::PathOf("/health") == "/health");
        REQUIRE(RequestRouter::QueryParameter("/ws?client_id=bob", "client_id") == std::optional<std::string>("bob"));
        REQUIRE(RequestRouter::QueryParameter("/ws?x=1&client_id=bob+smith", "client_id") ==
                std::optional<std::string>("bob smith"));
        REQUIRE(RequestRouter::QueryParameter("/ws?client_id=a%26b", "client_id") == std::optional<std::string>("a&b"));
        REQUIRE(RequestRouter::QueryParameter("/ws?client_id", "client_id") == std::optional<std::string>(""));
        REQUIRE_FALSE(RequestRouter::QueryParameter("/ws", "client_id").has_value());
        REQUIRE_FALSE(RequestRouter::QueryParameter("/ws?other=1", "client_id").has_value());
    }
}
TEST_CASE("RequestRouter - Routes", "[relay][router]") {
    auto service = RelayService::Open(RelayConfig::ForDatabase(":memory:")).Unwrap();
    RequestRouter router(*service);
    SECTION("Health is plain text") {
        const auto response = router.Handle({"GET", "/health", ""});
        REQUIRE(response.status == 200);
        REQUIRE(response.body == "ok");
        REQUIRE_THAT(response.content_type, ContainsSubstring("text/plain"));
    }
    SECTION("Unknown routes and methods are 404") {
        const auto missing = router.Handle({"GET", "/nope", ""});
        REQUIRE(missing.status == 404);
        REQUIRE(ErrorOf(missing).error() == "Not found.");
        REQUIRE(router.Handle({"GET", "/v1/register", ""}).status == 404);
        REQUIRE(router.Handle({"GET", "/v1/prekeys/", ""}).status == 404);
    }
    SECTION("Malformed JSON is rejected before validation") {
        const auto response = router.Handle({"POST", "/v1/register", "{not json"});
        REQUIRE(response.status == 400);
        REQUIRE(ErrorOf(response).error() == "Invalid JSON body.");
        REQUIRE(router.Handle({"POST", "/v1/register", "[1]"}).status == 400);
    }
    SECTION("Schema failures carry details") {
        const auto response = router.Handle({"POST", "/v1/register", R"({"id":""})"});
        REQUIRE(response.status == 400);
        const auto error = ErrorOf(response);
        REQUIRE(error.error() == "Invalid request.");
        REQUIRE_THAT(error.details(), ContainsSubstring("id"));
        REQUIRE(router.Handle({"POST", "/v1/register", ""}).status == 400);
    }
    SECTION("Register, publish and fetch") {
        const auto registered = router.Handle({"POST", "/v1/register", R"({"id":"bob smith"})"});
        REQUIRE(registered.status == 200);
        REQUIRE(JsonCodec::ParseAs<proto::wire::RegisterResponse>(registered.body).Unwrap().id() == "bob smith");
        const auto published = router.Handle({"POST", "/v1/prekeys", ToJson(SampleUpload("bob smith", 7))});
        REQUIRE(published.status == 200);
        REQUIRE(JsonCodec::ParseAs<proto::wire::OkResponse>(published.body).Unwrap().ok());
        const auto fetched = router.Handle({"GET", "/v1/prekeys/bob%20smith", ""});
        REQUIRE(fetched.status == 200);
        const auto bundle = JsonCodec::ParseAs<proto::wire::PreKeyFetchResponse>(fetched.body).Unwrap();
        REQUIRE(bundle.id() == "bob smith");
        REQUIRE(bundle.bundle().pre_key().key_id() == 7);
    }
    SECTION("Publishing for an unknown user is 404") {
        const auto response = router.Handle({"POST", "/v1/prekeys", ToJson(SampleUpload("ghost"))});
        REQUIRE(response.status == 404);
        REQUIRE(ErrorOf(response).error() == "User not registered.");
    }
    SECTION("Fetching a missing bundle is 404") {
        const auto response = router.Handle({"GET", "/v1/prekeys/ghost", ""});
        REQUIRE(response.status == 404);
        REQUIRE(ErrorOf(response).error() == "Prekeys not found.");
    }
    SECTION("Submitting to an unknown recipient is 404") {
        const auto response = router.Handle({"POST", "/v1/messages", ToJson(SampleMessage("alice", "ghost", "x"))});
        REQUIRE(response.status == 404);
        REQUIRE(ErrorOf(response).error() == "Recipient not registered.");
    }
    SECTION("Submitting to an offline recipient queues") {
        REQUIRE(router.Handle({"POST", "/v1/register", R"({"id":"bob"})"}).status == 200);
        const auto response = router.Handle({"POST", "/v1/messages", ToJson(SampleMessage("alice", "bob", "x"))});
        REQUIRE(response.status == 200);
        const auto submitted = JsonCodec::ParseAs<proto::wire::SubmitResponse>(response.body).Unwrap();
        REQUIRE(submitted.ok());
        REQUIRE(submitted.queued());
        REQUIRE_FALSE(submitted.delivered());
        REQUIRE_THAT(response.body, ContainsSubstring("\"delivered\":false"));
    }
    SECTION("Diagnostics and metrics") {
        const auto rejected = router.Handle({"POST", "/diagnostics/metrics", R"({"cpuPct":-1,"load":[1,2,3],"updatedAt":5})"});
        REQUIRE(rejected.status == 400);
        const auto accepted = router.Handle({"POST", "/diagnostics/metrics",
            R"({"cpuPct":3.5,"memPct":40,"swapPct":0,"netInBytes":1,"netOutBytes":2,"load":[0.5,0.4,0.3],"updatedAt":5})"});
        REQUIRE(accepted.status == 200);
        const auto diagnostics = router.Handle({"GET", "/diagnostics", ""});
        REQUIRE(diagnostics.status == 200);
        const auto snapshot = JsonCodec::ParseAs<proto::wire::DiagnosticsSnapshot>(diagnostics.body).Unwrap();
        REQUIRE(snapshot.metrics().cpu_pct() == 3.5);
        REQUIRE(snapshot.queue_depth_histogram().size() == 4);
        REQUIRE(snapshot.db_path() == ":memory:");
    }
}
