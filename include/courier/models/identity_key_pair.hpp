#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include "courier/crypto/sodium_secure_memory_handle.hpp"
#include "protocol/key_material.pb.h"
#include <cstdint>
#include <span>
#include <vector>
namespace courier::protocol::models {

/**
 * Long-term Ed25519 identity of a local store.
 *
 * The same pair serves key agreement through its Curve25519 form; the
 * conversions are computed on use and never persisted.
 */
class IdentityKeyPair {
public:
    IdentityKeyPair(
        crypto::SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key);
    IdentityKeyPair(IdentityKeyPair&&) noexcept = default;
    IdentityKeyPair& operator=(IdentityKeyPair&&) noexcept = default;
    IdentityKeyPair(const IdentityKeyPair&) = delete;
    IdentityKeyPair& operator=(const IdentityKeyPair&) = delete;

    [[nodiscard]] static Result<IdentityKeyPair, ProtocolFailure> Generate();

    [[nodiscard]] static Result<IdentityKeyPair, ProtocolFailure> FromRecord(
        const proto::protocol::IdentityKeyPairRecord& record);

    [[nodiscard]] Result<proto::protocol::IdentityKeyPairRecord, ProtocolFailure> ToRecord() const;

    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] std::vector<uint8_t> GetPublicKeyCopy() const {
        return public_key_;
    }

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Sign(std::span<const uint8_t> message) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> GetX25519PublicKey() const;

    /// Caller wipes the returned scalar.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> GetX25519SecretKey() const;
private:
    crypto::SecureMemoryHandle secret_key_handle_;
    std::vector<uint8_t> public_key_;
};
}
