#include <catch2/catch_test_macros.hpp>
#include "courier/configuration/relay_config.hpp"
#include "courier/crypto/sodium_interop.hpp"
#include "courier/identity/material_store.hpp"
#include "courier/protocol/bundle_protocol.hpp"
#include "courier/protocol/hybrid_session_cipher.hpp"
#include "courier/protocol/secure_messenger.hpp"
#include "courier/relay/http_server.hpp"
#include "courier/relay/relay_client.hpp"
#include "courier/relay/relay_service.hpp"
#include "courier/utilities/encoding.hpp"
#include "helpers/mock_push_channel.hpp"
#include "helpers/relay_fixtures.hpp"
#include "helpers/temp_store.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <functional>
#include <thread>
using namespace courier;
using namespace courier::protocol;
using courier::protocol::configuration::RelayConfig;
using courier::protocol::crypto::SodiumInterop;
using courier::protocol::identity::MaterialStore;
using courier::protocol::test_helpers::FastStoreConfig;
using courier::protocol::test_helpers::TempDirectory;
using courier::protocol::utilities::Encoding;
using courier::relay::HttpServer;
using courier::relay::RelayClient;
using courier::relay::RelayService;
using courier::relay::test_helpers::MockPushChannel;
using courier::relay::test_helpers::SampleMessage;
namespace {
    bool WaitFor(const std::function<bool()>& condition) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!condition()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return true;
    }

    std::unique_ptr<MaterialStore> CreateIdentity(const TempDirectory& dir, const std::string& name) {
        auto store = MaterialStore::Open(dir.File(name + ".db"), "alpha", FastStoreConfig()).Unwrap();
        REQUIRE(store->InitializeIdentity(name).IsOk());
        return store;
    }

    proto::wire::RelayMessage Wrap(const proto::wire::Envelope& envelope) {
        proto::wire::RelayMessage message;
        message.set_from(envelope.sender_id());
        message.set_to(envelope.recipient_id());
        *message.mutable_envelope() = envelope;
        return message;
    }
}
TEST_CASE("End to end - Two stores through the relay service", "[e2e][integration]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    HybridSessionCipher cipher;
    auto service = RelayService::Open(RelayConfig::ForDatabase(dir.File("relay.db"))).Unwrap();
    auto alice = CreateIdentity(dir, "alice");
    auto bob = CreateIdentity(dir, "bob");
    REQUIRE(bob->GeneratePreKeys(1).IsOk());
    REQUIRE(bob->GeneratePreKeys(6).IsOk());

    proto::wire::RegisterRequest registration;
    registration.set_id("alice");
    REQUIRE(service->Register(registration).IsOk());
    registration.set_id("bob");
    REQUIRE(service->Register(registration).IsOk());
    proto::wire::PreKeyUpload upload;
    upload.set_id("bob");
    *upload.mutable_bundle() = BundleProtocol::ExportBundle(*bob).Unwrap();
    REQUIRE(service->PublishBundle(upload).IsOk());

    const auto fetched = service->FetchBundle("bob").Unwrap();
    REQUIRE(fetched.bundle().pre_key().key_id() == 7);
    REQUIRE(BundleProtocol::InitSession(*alice, cipher, fetched.bundle()).IsOk());

    const std::string text = "hello from docker phase zero e2e";
    auto envelope = SecureMessenger::EncryptMessage(*alice, cipher, "bob", Encoding::ToBytes(text)).Unwrap();
    REQUIRE_FALSE(service->Submit(Wrap(envelope)).Unwrap().delivered());

    auto bob_channel = std::make_shared<MockPushChannel>();
    REQUIRE(service->Connect("bob", bob_channel).IsOk());
    const auto frames = bob_channel->Messages();
    REQUIRE(frames.size() == 1);
    auto plaintext = SecureMessenger::DecryptMessage(*bob, cipher, frames[0].envelope());
    REQUIRE(plaintext.IsOk());
    REQUIRE(Encoding::ToText(plaintext.Unwrap()) == text);

    auto alice_channel = std::make_shared<MockPushChannel>();
    REQUIRE(service->Connect("alice", alice_channel).IsOk());
    auto reply = SecureMessenger::EncryptMessage(*bob, cipher, "alice", Encoding::ToBytes("ack")).Unwrap();
    REQUIRE(service->Submit(Wrap(reply)).Unwrap().delivered());
    const auto replies = alice_channel->Messages();
    REQUIRE(replies.size() == 1);
    REQUIRE(Encoding::ToText(SecureMessenger::DecryptMessage(*alice, cipher, replies[0].envelope()).Unwrap()) == "ack");
}
TEST_CASE("End to end - HTTP and WebSocket surface", "[e2e][integration][network]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    TempDirectory dir;
    auto config = RelayConfig::ForDatabase(dir.File("relay.db"));
    config.host = "127.0.0.1";
    config.port = 0;
    config.workers = 2;
    auto service = RelayService::Open(config).Unwrap();
    HttpServer server(*service, config);
    REQUIRE(server.Start().IsOk());
    REQUIRE(server.Port() != 0);
    auto client = RelayClient::ForUrl("http://127.0.0.1:" + std::to_string(server.Port()) + "/").Unwrap();

    HybridSessionCipher cipher;
    auto alice = CreateIdentity(dir, "alice");
    auto bob = CreateIdentity(dir, "bob");
    REQUIRE(alice->GeneratePreKeys(1).IsOk());
    REQUIRE(client.Register("alice").IsOk());
    REQUIRE(client.UploadBundle("alice", BundleProtocol::ExportBundle(*alice).Unwrap()).IsOk());
    REQUIRE(client.Register("bob").IsOk());

    SECTION("Relay error statuses map back onto failures") {
        REQUIRE(client.FetchBundle("ghost").UnwrapErr().type == RelayFailureType::NotFound);
        auto upload = client.UploadBundle("ghost", BundleProtocol::ExportBundle(*alice).Unwrap());
        REQUIRE(upload.UnwrapErr().type == RelayFailureType::NotRegistered);
        auto listen = client.Listen("ghost", [](const proto::wire::RelayMessage&) { return false; });
        REQUIRE(listen.IsErr());
    }
    SECTION("A message sent before listening is replayed over the push channel") {
        const auto bundle = client.FetchBundle("alice").Unwrap();
        REQUIRE(BundleProtocol::InitSession(*bob, cipher, bundle).IsOk());
        const std::string text = "hello from relay phase one";
        auto envelope = SecureMessenger::EncryptMessage(*bob, cipher, "alice", Encoding::ToBytes(text)).Unwrap();
        const auto submitted = client.Send(Wrap(envelope)).Unwrap();
        REQUIRE(submitted.queued());
        REQUIRE_FALSE(submitted.delivered());

        std::string received;
        auto listened = client.Listen("alice", [&](const proto::wire::RelayMessage& frame) {
            auto plaintext = SecureMessenger::DecryptMessage(*alice, cipher, frame.envelope());
            if (plaintext.IsOk()) {
                received = Encoding::ToText(plaintext.Unwrap());
            }
            return false;
        });
        REQUIRE(listened.IsOk());
        REQUIRE(received == text);

        const auto snapshot = client.Diagnostics().Unwrap();
        REQUIRE(snapshot.counts().users() == 2);
        REQUIRE(snapshot.db_path() == dir.File("relay.db"));
    }
    SECTION("A second listener supersedes the first") {
        std::vector<std::string> first_frames;
        Result<Unit, RelayFailure> first_result = Result<Unit, RelayFailure>::Ok(unit);
        std::thread first([&]() {
            first_result = client.Listen("alice", [&](const proto::wire::RelayMessage& frame) {
                first_frames.push_back(frame.envelope().body());
                return false;
            });
        });
        REQUIRE(WaitFor([&]() { return service->ActiveConnections() == 1; }));

        std::vector<std::string> second_frames;
        Result<Unit, RelayFailure> second_result = Result<Unit, RelayFailure>::Ok(unit);
        std::thread second([&]() {
            second_result = client.Listen("alice", [&](const proto::wire::RelayMessage& frame) {
                second_frames.push_back(frame.envelope().body());
                return false;
            });
        });
        first.join();
        REQUIRE(first_result.IsErr());
        REQUIRE(first_result.UnwrapErr().type == RelayFailureType::Transport);
        REQUIRE(first_result.UnwrapErr().message.find("4000") != std::string::npos);
        REQUIRE(first_result.UnwrapErr().message.find("superseded") != std::string::npos);
        REQUIRE(service->ActiveConnections() == 1);

        const auto submitted = client.Send(SampleMessage("bob", "alice", "for the newer session")).Unwrap();
        second.join();
        REQUIRE(submitted.delivered());
        REQUIRE(second_result.IsOk());
        REQUIRE(second_frames == std::vector<std::string>{"for the newer session"});
        REQUIRE(first_frames.empty());
    }
    server.Stop();
    service->Shutdown();
}
TEST_CASE("End to end - Stalled push consumer", "[e2e][integration][network]") {
    namespace net = boost::asio;
    namespace beast = boost::beast;
    namespace websocket = beast::websocket;

    TempDirectory dir;
    auto config = RelayConfig::ForDatabase(dir.File("relay.db"));
    config.host = "127.0.0.1";
    config.port = 0;
    config.workers = 2;
    config.push_timeout = std::chrono::milliseconds(200);
    auto service = RelayService::Open(config).Unwrap();
    HttpServer server(*service, config);
    REQUIRE(server.Start().IsOk());
    auto client = RelayClient::ForUrl("http://127.0.0.1:" + std::to_string(server.Port())).Unwrap();
    REQUIRE(client.Register("alice").IsOk());
    REQUIRE(client.Register("bob").IsOk());

    // Handshakes as bob, then never reads.
    net::io_context io;
    websocket::stream<beast::tcp_stream> stalled(io);
    beast::get_lowest_layer(stalled).connect(
        net::ip::tcp::endpoint(net::ip::make_address("127.0.0.1"), server.Port()));
    stalled.handshake("127.0.0.1:" + std::to_string(server.Port()), "/ws?client_id=bob");
    REQUIRE(WaitFor([&]() { return service->ActiveConnections() == 1; }));

    const std::string payload(1 << 20, 'x');
    bool push_failed = false;
    for (int i = 0; i < 64 && !push_failed; ++i) {
        push_failed = !service->Submit(SampleMessage("alice", "bob", payload)).Unwrap().delivered();
    }
    REQUIRE(push_failed);
    REQUIRE(WaitFor([&]() { return service->ActiveConnections() == 0; }));

    const auto snapshot = client.Diagnostics().Unwrap();
    REQUIRE(snapshot.counts().active_connections() == 0);
    REQUIRE(snapshot.counts().queued_messages() >= 1);

    server.Stop();
    service->Shutdown();
}
