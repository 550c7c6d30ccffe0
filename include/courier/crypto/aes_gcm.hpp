#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace courier::protocol::crypto {

/**
 * AES-256-GCM authenticated encryption.
 *
 * Stateless primitive: the caller supplies a nonce that is unique per key.
 * Both the record store and the session cipher draw a fresh random
 * 12-byte nonce per message and carry it next to the ciphertext.
 *
 * Output layout of Encrypt is ciphertext || tag(16). A tag mismatch in
 * Decrypt is reported as ProtocolFailureType::Decode and never yields
 * partial plaintext.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
