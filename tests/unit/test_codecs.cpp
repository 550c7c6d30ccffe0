#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "courier/models/application_message.hpp"
#include "courier/utilities/encoding.hpp"
#include "courier/utilities/envelope_codec.hpp"
#include "courier/utilities/json_codec.hpp"
#include "wire/relay.pb.h"
using namespace courier;
using namespace courier::protocol;
using namespace courier::protocol::models;
using namespace courier::protocol::utilities;
using Catch::Matchers::ContainsSubstring;
TEST_CASE("EnvelopeCodec - Build and validate", "[codec][envelope]") {
    const auto body = Encoding::ToBytes("ciphertext");
    auto envelope = EnvelopeCodec::Build("alice", "bob", 0, body, 1700000000000);
    REQUIRE(envelope.version() == 1);
    REQUIRE(envelope.session_id() == "alice::bob");
    REQUIRE(EnvelopeCodec::Validate(envelope).IsOk());
    SECTION("JSON keeps camelCase names and base64 body") {
        auto json = EnvelopeCodec::ToJson(envelope);
        REQUIRE(json.IsOk());
        REQUIRE_THAT(json.Unwrap(), ContainsSubstring("\"senderId\":\"alice\""));
        REQUIRE_THAT(json.Unwrap(), ContainsSubstring("\"sessionId\":\"alice::bob\""));
        REQUIRE_THAT(json.Unwrap(), ContainsSubstring(Encoding::ToBase64(body)));
        auto parsed = EnvelopeCodec::FromJson(json.Unwrap());
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap().body() == "ciphertext");
        REQUIRE(parsed.Unwrap().timestamp() == 1700000000000);
    }
    SECTION("Unknown fields and unrestricted types are accepted") {
        auto parsed = EnvelopeCodec::FromJson(
            R"({"version":1,"senderId":"a","recipientId":"b","sessionId":"a::b",)"
            R"("type":9,"body":"AQI=","timestamp":5,"extra":true})");
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap().type() == 9);
    }
    SECTION("Each shape rule is enforced") {
        auto broken = envelope;
        broken.set_version(0);
        REQUIRE_THAT(EnvelopeCodec::Validate(broken).UnwrapErr().message, ContainsSubstring("version"));
        broken = envelope;
        broken.clear_sender_id();
        REQUIRE_THAT(EnvelopeCodec::Validate(broken).UnwrapErr().message, ContainsSubstring("senderId"));
        broken = envelope;
        broken.clear_recipient_id();
        REQUIRE_THAT(EnvelopeCodec::Validate(broken).UnwrapErr().message, ContainsSubstring("recipientId"));
        broken = envelope;
        broken.set_type(-1);
        REQUIRE_THAT(EnvelopeCodec::Validate(broken).UnwrapErr().message, ContainsSubstring("type"));
        broken = envelope;
        broken.clear_body();
        REQUIRE_THAT(EnvelopeCodec::Validate(broken).UnwrapErr().message, ContainsSubstring("body"));
        broken = envelope;
        broken.set_timestamp(0);
        REQUIRE_THAT(EnvelopeCodec::Validate(broken).UnwrapErr().message, ContainsSubstring("timestamp"));
    }
    SECTION("Malformed JSON is a decode failure") {
        auto parsed = EnvelopeCodec::FromJson("{not json");
        REQUIRE(parsed.IsErr());
        REQUIRE(parsed.UnwrapErr().type == ProtocolFailureType::Decode);
    }
}
TEST_CASE("JsonCodec - Object detection", "[codec][json]") {
    REQUIRE(JsonCodec::IsJsonObject(R"({"a":1})"));
    REQUIRE(JsonCodec::IsJsonObject("  {}"));
    REQUIRE_FALSE(JsonCodec::IsJsonObject("[1,2]"));
    REQUIRE_FALSE(JsonCodec::IsJsonObject("\"text\""));
    REQUIRE_FALSE(JsonCodec::IsJsonObject(""));
}
TEST_CASE("Encoding - Random UUIDs", "[codec][encoding]") {
    const auto first = Encoding::GenerateUuid();
    const auto second = Encoding::GenerateUuid();
    REQUIRE(first != second);
    REQUIRE(first.size() == 36);
    REQUIRE(first[8] == '-');
    REQUIRE(first[13] == '-');
    REQUIRE(first[14] == '4');
    REQUIRE(first.find_first_not_of("0123456789abcdef-") == std::string::npos);
}
TEST_CASE("JsonCodec - 64-bit integers print as numbers", "[codec][json]") {
    const auto envelope = EnvelopeCodec::Build("bob", "alice", 0, Encoding::ToBytes("hi"), 1700000000000);
    SECTION("Envelope timestamp") {
        const auto json = EnvelopeCodec::ToJson(envelope).Unwrap();
        REQUIRE_THAT(json, ContainsSubstring("\"timestamp\":1700000000000"));
        REQUIRE_THAT(json, !ContainsSubstring("\"1700000000000\""));
        REQUIRE_THAT(json, ContainsSubstring("\"type\":0"));
        REQUIRE_THAT(json, ContainsSubstring("\"body\":\"aGk=\""));
        REQUIRE(EnvelopeCodec::FromJson(json).Unwrap().timestamp() == 1700000000000);
    }
    SECTION("Nested in a push frame") {
        proto::wire::RelayMessage frame;
        frame.set_from("bob");
        frame.set_to("alice");
        *frame.mutable_envelope() = envelope;
        const auto json = JsonCodec::Print(frame).Unwrap();
        REQUIRE_THAT(json, ContainsSubstring("\"timestamp\":1700000000000"));
        REQUIRE_THAT(json, ContainsSubstring("\"from\":\"bob\""));
        const auto parsed = JsonCodec::ParseAs<proto::wire::RelayMessage>(json).Unwrap();
        REQUIRE(parsed.envelope().timestamp() == 1700000000000);
        REQUIRE(parsed.envelope().body() == "hi");
    }
    SECTION("Diagnostics metrics sample") {
        proto::wire::DiagnosticsSnapshot snapshot;
        snapshot.set_db_path(":memory:");
        (*snapshot.mutable_queue_depth_histogram())["1-5"] = 2;
        auto* metrics = snapshot.mutable_metrics();
        metrics->set_cpu_pct(3.5);
        metrics->add_load(0.5);
        metrics->set_updated_at(1700000000123);
        const auto json = JsonCodec::Print(snapshot).Unwrap();
        REQUIRE_THAT(json, ContainsSubstring("\"updatedAt\":1700000000123"));
        REQUIRE_THAT(json, ContainsSubstring("\"cpuPct\":3.5"));
        REQUIRE_THAT(json, ContainsSubstring("\"1-5\":2"));
    }
    SECTION("Application message timestamps") {
        const auto json = ApplicationMessageCodec::Encode(ApplicationMessageCodec::MakeControlPing(1700000000000)).Unwrap();
        REQUIRE_THAT(json, ContainsSubstring("\"createdAt\":1700000000000"));
    }
}
TEST_CASE("ApplicationMessageCodec - Chat messages", "[codec][application]") {
    SECTION("Prompt survives encode and decode") {
        const auto prompt = ApplicationMessageCodec::MakeChatPrompt("req-1", "status?", "alice", 1000);
        auto json = ApplicationMessageCodec::Encode(prompt);
        REQUIRE(json.IsOk());
        REQUIRE_THAT(json.Unwrap(), ContainsSubstring("\"kind\":\"chat.prompt\""));
        auto decoded = ApplicationMessageCodec::Decode(json.Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE(ApplicationMessageCodec::KindOf(decoded.Unwrap()) == MessageKinds::CHAT_PROMPT);
        const auto& message = std::get<proto::app::ChatPrompt>(decoded.Unwrap());
        REQUIRE(message.request_id() == "req-1");
        REQUIRE(message.prompt() == "status?");
    }
    SECTION("Reply decodes from literal JSON") {
        auto decoded = ApplicationMessageCodec::Decode(
            R"({"version":1,"kind":"chat.reply","requestId":"r","reply":"ok","from":"bob","createdAt":7})");
        REQUIRE(decoded.IsOk());
        REQUIRE(std::holds_alternative<proto::app::ChatReply>(decoded.Unwrap()));
    }
    SECTION("Empty prompt is rejected") {
        auto decoded = ApplicationMessageCodec::Decode(
            R"({"version":1,"kind":"chat.prompt","requestId":"r","prompt":"","from":"a","createdAt":7})");
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == ProtocolFailureType::InvalidInput);
        REQUIRE_THAT(decoded.UnwrapErr().message, ContainsSubstring("prompt"));
    }
    SECTION("Wrong version is rejected") {
        auto decoded = ApplicationMessageCodec::Decode(R"({"version":2,"kind":"control.ping","createdAt":7})");
        REQUIRE(decoded.IsErr());
        REQUIRE_THAT(decoded.UnwrapErr().message, ContainsSubstring("version"));
    }
    SECTION("Unknown kind is rejected") {
        auto decoded = ApplicationMessageCodec::Decode(R"({"version":1,"kind":"chat.shout","createdAt":7})");
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
    SECTION("Encode refuses an invalid message") {
        const auto ping = ApplicationMessageCodec::MakeControlPing(0);
        REQUIRE(ApplicationMessageCodec::Encode(ping).IsErr());
    }
}
TEST_CASE("ApplicationMessageCodec - Telemetry report", "[codec][application]") {
    const std::string valid = R"({"version":1,"kind":"telemetry.report","reportId":"t1","source":"relay",)"
        R"("relay":{"uptimeSec":5,"queueDepthHistogram":{"0":1},"counts":{"users":2}},)"
        R"("host":{"cpuPct":1.5,"memPct":20,"swapPct":0,"netInBytes":10,"netOutBytes":20,"load":[0.1,0.2,0.3]},)"
        R"("createdAt":99})";
    SECTION("Complete report decodes") {
        auto decoded = ApplicationMessageCodec::Decode(valid);
        REQUIRE(decoded.IsOk());
        const auto& report = std::get<proto::app::TelemetryReport>(decoded.Unwrap());
        REQUIRE(report.relay().counts().users() == 2);
        REQUIRE(report.host().load_size() == 3);
    }
    SECTION("Load must hold three numbers") {
        auto decoded = ApplicationMessageCodec::Decode(
            R"({"version":1,"kind":"telemetry.report","reportId":"t1","source":"relay",)"
            R"("relay":{"counts":{}},"host":{"load":[0.1]},"createdAt":99})");
        REQUIRE(decoded.IsErr());
        REQUIRE_THAT(decoded.UnwrapErr().message, ContainsSubstring("host.load"));
    }
    SECTION("Negative metrics are rejected") {
        auto decoded = ApplicationMessageCodec::Decode(
            R"({"version":1,"kind":"telemetry.report","reportId":"t1","source":"relay",)"
            R"("relay":{"counts":{}},"host":{"cpuPct":-1,"load":[1,2,3]},"createdAt":99})");
        REQUIRE(decoded.IsErr());
        REQUIRE_THAT(decoded.UnwrapErr().message, ContainsSubstring("non-negative"));
    }
    SECTION("Missing relay snapshot is rejected") {
        auto decoded = ApplicationMessageCodec::Decode(
            R"({"version":1,"kind":"telemetry.report","reportId":"t1","source":"relay",)"
            R"("host":{"load":[1,2,3]},"createdAt":99})");
        REQUIRE(decoded.IsErr());
        REQUIRE_THAT(decoded.UnwrapErr().message, ContainsSubstring("relay"));
    }
}
