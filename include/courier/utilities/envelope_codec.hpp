#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include "wire/envelope.pb.h"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
namespace courier::protocol::utilities {
class EnvelopeCodec {
public:
    [[nodiscard]] static std::string SessionIdFor(std::string_view sender_id, std::string_view recipient_id);

    [[nodiscard]] static proto::wire::Envelope Build(
        std::string_view sender_id,
        std::string_view recipient_id,
        uint32_t ciphertext_type,
        std::span<const uint8_t> body,
        int64_t timestamp_ms);

    /**
     * Wire-shape checks: positive version and timestamp, non-empty ids and
     * body, non-negative type. The type value itself is not restricted here;
     * receivers reject unknown types when decrypting.
     */
    [[nodiscard]] static Result<Unit, ProtocolFailure> Validate(const proto::wire::Envelope& envelope);

    [[nodiscard]] static Result<std::string, ProtocolFailure> ToJson(const proto::wire::Envelope& envelope);

    [[nodiscard]] static Result<proto::wire::Envelope, ProtocolFailure> FromJson(std::string_view json);
private:
    EnvelopeCodec() = delete;
};
}
