#pragma once
#include "courier/configuration/store_config.hpp"
#include "courier/interfaces/i_identity_key_store.hpp"
#include "courier/interfaces/i_pre_key_store.hpp"
#include "courier/interfaces/i_session_store.hpp"
#include "courier/storage/record_store.hpp"

namespace courier::protocol::storage {

// ============================================================================
// Store contracts over a RecordStore
//
// Record keys:
//   local:identityKeyPair           own identity pair
//   identity:<name>.<device>        peer identity key (TOFU)
//   session:<name>.<device>         SessionRecord
//   prekey:<id>, prekey:used:<id>   one-time prekeys and use markers
//   signedprekey:<id>
//   kyberprekey:<id>, kyberprekey:used:<id>
// ============================================================================

class RecordIdentityKeyStore final : public interfaces::IIdentityKeyStore {
public:
    explicit RecordIdentityKeyStore(RecordStore& store) : store_(store) {}

    Result<models::IdentityKeyPair, ProtocolFailure> GetIdentityKeyPair() override;

    Result<uint32_t, ProtocolFailure> GetLocalRegistrationId() override;

    Result<interfaces::IdentityChange, ProtocolFailure> SaveIdentity(
        const models::ProtocolAddress& address,
        std::span<const uint8_t> identity_key) override;

    Result<bool, ProtocolFailure> IsTrustedIdentity(
        const models::ProtocolAddress& address,
        std::span<const uint8_t> identity_key) override;

    Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> GetIdentity(
        const models::ProtocolAddress& address) override;
private:
    RecordStore& store_;
};

class RecordSessionStore final : public interfaces::ISessionStore {
public:
    explicit RecordSessionStore(RecordStore& store) : store_(store) {}

    Result<std::optional<proto::protocol::SessionRecord>, ProtocolFailure> LoadSession(
        const models::ProtocolAddress& address) override;

    Result<Unit, ProtocolFailure> StoreSession(
        const models::ProtocolAddress& address,
        const proto::protocol::SessionRecord& record) override;
private:
    RecordStore& store_;
};

/// RemovePreKey follows StoreConfig::one_time_pre_key_policy.
class RecordPreKeyStore final : public interfaces::IPreKeyStore {
public:
    RecordPreKeyStore(RecordStore& store, configuration::OneTimePreKeyPolicy policy)
        : store_(store), policy_(policy) {}

    Result<proto::protocol::PreKeyRecord, ProtocolFailure> LoadPreKey(uint32_t pre_key_id) override;

    Result<Unit, ProtocolFailure> StorePreKey(const proto::protocol::PreKeyRecord& record) override;

    Result<Unit, ProtocolFailure> RemovePreKey(uint32_t pre_key_id) override;
private:
    RecordStore& store_;
    configuration::OneTimePreKeyPolicy policy_;
};

class RecordSignedPreKeyStore final : public interfaces::ISignedPreKeyStore {
public:
    explicit RecordSignedPreKeyStore(RecordStore& store) : store_(store) {}

    Result<proto::protocol::SignedPreKeyRecord, ProtocolFailure> LoadSignedPreKey(
        uint32_t signed_pre_key_id) override;

    Result<Unit, ProtocolFailure> StoreSignedPreKey(
        const proto::protocol::SignedPreKeyRecord& record) override;
private:
    RecordStore& store_;
};

class RecordKyberPreKeyStore final : public interfaces::IKyberPreKeyStore {
public:
    explicit RecordKyberPreKeyStore(RecordStore& store) : store_(store) {}

    Result<proto::protocol::KyberPreKeyRecord, ProtocolFailure> LoadKyberPreKey(
        uint32_t kyber_pre_key_id) override;

    Result<Unit, ProtocolFailure> StoreKyberPreKey(
        const proto::protocol::KyberPreKeyRecord& record) override;

    Result<Unit, ProtocolFailure> MarkKyberPreKeyUsed(
        uint32_t kyber_pre_key_id,
        uint32_t signed_pre_key_id,
        std::span<const uint8_t> base_key) override;
private:
    RecordStore& store_;
};

}
