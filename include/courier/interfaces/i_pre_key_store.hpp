#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include "protocol/key_material.pb.h"
#include <cstdint>
#include <span>
namespace courier::protocol::interfaces {

/// Loads that miss fail with ProtocolFailureType::MaterialNotFound.
class IPreKeyStore {
public:
    virtual ~IPreKeyStore() = default;

    [[nodiscard]] virtual Result<proto::protocol::PreKeyRecord, ProtocolFailure> LoadPreKey(uint32_t pre_key_id) = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> StorePreKey(const proto::protocol::PreKeyRecord& record) = 0;

    /// Called once a session consumed the prekey.
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> RemovePreKey(uint32_t pre_key_id) = 0;
};

class ISignedPreKeyStore {
public:
    virtual ~ISignedPreKeyStore() = default;

    [[nodiscard]] virtual Result<proto::protocol::SignedPreKeyRecord, ProtocolFailure> LoadSignedPreKey(
        uint32_t signed_pre_key_id) = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> StoreSignedPreKey(
        const proto::protocol::SignedPreKeyRecord& record) = 0;
};

class IKyberPreKeyStore {
public:
    virtual ~IKyberPreKeyStore() = default;

    [[nodiscard]] virtual Result<proto::protocol::KyberPreKeyRecord, ProtocolFailure> LoadKyberPreKey(
        uint32_t kyber_pre_key_id) = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> StoreKyberPreKey(
        const proto::protocol::KyberPreKeyRecord& record) = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> MarkKyberPreKeyUsed(
        uint32_t kyber_pre_key_id,
        uint32_t signed_pre_key_id,
        std::span<const uint8_t> base_key) = 0;
};
}
