#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include "wire/relay.pb.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
namespace courier::protocol::models {

/**
 * Peer key material used to start a session.
 *
 * Decoded from the wire Bundle with key sizes checked. Signatures are
 * checked separately by VerifySignatures so a bundle can be inspected
 * before it is trusted.
 */
class PreKeyBundle {
public:
    struct PreKey {
        uint32_t id;
        std::vector<uint8_t> public_key;
    };
    struct SignedKey {
        uint32_t id;
        std::vector<uint8_t> public_key;
        std::vector<uint8_t> signature;
    };

    PreKeyBundle(
        std::string name,
        uint32_t device_id,
        uint32_t registration_id,
        std::vector<uint8_t> identity_key,
        SignedKey signed_pre_key,
        std::optional<PreKey> pre_key,
        SignedKey kyber_pre_key);

    [[nodiscard]] static Result<PreKeyBundle, ProtocolFailure> FromWire(const proto::wire::Bundle& bundle);

    [[nodiscard]] proto::wire::Bundle ToWire() const;

    /// Ed25519 checks of the signed prekey and Kyber prekey against the identity key.
    [[nodiscard]] Result<Unit, ProtocolFailure> VerifySignatures() const;

    [[nodiscard]] const std::string& GetName() const noexcept { return name_; }
    [[nodiscard]] uint32_t GetDeviceId() const noexcept { return device_id_; }
    [[nodiscard]] uint32_t GetRegistrationId() const noexcept { return registration_id_; }
    [[nodiscard]] const std::vector<uint8_t>& GetIdentityKey() const noexcept { return identity_key_; }
    [[nodiscard]] const SignedKey& GetSignedPreKey() const noexcept { return signed_pre_key_; }
    [[nodiscard]] const std::optional<PreKey>& GetPreKey() const noexcept { return pre_key_; }
    [[nodiscard]] const SignedKey& GetKyberPreKey() const noexcept { return kyber_pre_key_; }
private:
    std::string name_;
    uint32_t device_id_;
    uint32_t registration_id_;
    std::vector<uint8_t> identity_key_;
    SignedKey signed_pre_key_;
    std::optional<PreKey> pre_key_;
    SignedKey kyber_pre_key_;
};
}
