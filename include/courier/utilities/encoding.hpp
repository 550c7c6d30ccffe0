#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace courier::protocol::utilities {

/**
 * Text encodings and identifiers. Base64 is the standard alphabet with
 * padding, matching the wire mapping of protobuf `bytes` fields.
 */
class Encoding {
public:
    [[nodiscard]] static std::string ToBase64(std::span<const uint8_t> data);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> FromBase64(std::string_view text);

    [[nodiscard]] static std::string ToHex(std::span<const uint8_t> data);

    /// Random RFC 4122 version 4 UUID in canonical lowercase form.
    [[nodiscard]] static std::string GenerateUuid();

    [[nodiscard]] static int64_t NowMillis();

    [[nodiscard]] static std::vector<uint8_t> ToBytes(std::string_view text);

    [[nodiscard]] static std::string ToText(std::span<const uint8_t> data);
private:
    Encoding() = delete;
};
}
