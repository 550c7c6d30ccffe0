#include "courier/utilities/envelope_codec.hpp"
#include "courier/utilities/json_codec.hpp"
#include "courier/core/constants.hpp"
#include "courier/core/format.hpp"

namespace courier::protocol::utilities {

std::string EnvelopeCodec::SessionIdFor(std::string_view sender_id, std::string_view recipient_id) {
    return compat::format("{}::{}", sender_id, recipient_id);
}

proto::wire::Envelope EnvelopeCodec::Build(
    std::string_view sender_id,
    std::string_view recipient_id,
    const uint32_t ciphertext_type,
    std::span<const uint8_t> body,
    const int64_t timestamp_ms) {
    proto::wire::Envelope envelope;
    envelope.set_version(static_cast<int32_t>(Constants::ENVELOPE_VERSION));
    envelope.set_sender_id(std::string(sender_id));
    envelope.set_recipient_id(std::string(recipient_id));
    envelope.set_session_id(SessionIdFor(sender_id, recipient_id));
    envelope.set_type(static_cast<int32_t>(ciphertext_type));
    envelope.set_body(body.data(), body.size());
    envelope.set_timestamp(timestamp_ms);
    return envelope;
}

Result<Unit, ProtocolFailure> EnvelopeCodec::Validate(const proto::wire::Envelope& envelope) {
    auto fail = [](std::string_view field, std::string_view rule) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(compat::format("envelope.{}: {}", field, rule)));
    };
    if (envelope.version() <= 0) {
        return fail("version", "must be a positive integer");
    }
    if (envelope.sender_id().empty()) {
        return fail("senderId", "must not be empty");
    }
    if (envelope.recipient_id().empty()) {
        return fail("recipientId", "must not be empty");
    }
    if (envelope.session_id().empty()) {
        return fail("sessionId", "must not be empty");
    }
    if (envelope.type() < 0) {
        return fail("type", "must be a non-negative integer");
    }
    if (envelope.body().empty()) {
        return fail("body", "must not be empty");
    }
    if (envelope.timestamp() <= 0) {
        return fail("timestamp", "must be a positive integer");
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::string, ProtocolFailure> EnvelopeCodec::ToJson(const proto::wire::Envelope& envelope) {
    return JsonCodec::Print(envelope);
}

Result<proto::wire::Envelope, ProtocolFailure> EnvelopeCodec::FromJson(std::string_view json) {
    auto parsed = JsonCodec::ParseAs<proto::wire::Envelope>(json);
    if (parsed.IsErr()) {
        return parsed;
    }
    auto valid = Validate(parsed.Unwrap());
    if (valid.IsErr()) {
        return Result<proto::wire::Envelope, ProtocolFailure>::Err(valid.UnwrapErr());
    }
    return parsed;
}

}
