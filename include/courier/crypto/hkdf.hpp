#pragma once

#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"

#include <span>
#include <vector>
#include <cstdint>

namespace courier::protocol::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) over OpenSSL EVP_KDF
 *
 * DeriveKey runs extract and expand in one call. Extract and Expand are
 * exposed separately for combining hybrid secrets.
 */
class Hkdf {
public:
    static Result<Unit, ProtocolFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    /**
     * @brief HKDF-Extract. Output is always HASH_LEN bytes.
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> Extract(
        std::span<const uint8_t> ikm,
        std::span<const uint8_t> salt = {});

    /**
     * @brief HKDF-Expand. `prk` must be HASH_LEN bytes.
     */
    static Result<Unit, ProtocolFailure> Expand(
        std::span<const uint8_t> prk,
        std::span<uint8_t> output,
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

}
