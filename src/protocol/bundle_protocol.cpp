#include "courier/protocol/bundle_protocol.hpp"
#include "courier/core/constants.hpp"
#include "courier/models/pre_key_bundle.hpp"
#include <spdlog/spdlog.h>

namespace courier::protocol {

namespace {
    std::vector<uint8_t> ToVector(const std::string& bytes) {
        return {bytes.begin(), bytes.end()};
    }
}

Result<proto::wire::Bundle, ProtocolFailure> BundleProtocol::ExportBundle(identity::MaterialStore& store) {
    using BundleResult = Result<proto::wire::Bundle, ProtocolFailure>;

    auto has_identity = store.HasIdentity();
    if (has_identity.IsErr()) {
        return BundleResult::Err(has_identity.UnwrapErr());
    }
    if (!has_identity.Unwrap()) {
        return BundleResult::Err(ProtocolFailure::InvalidState(
            std::string(ErrorMessages::IDENTITY_NOT_INITIALIZED)));
    }
    auto local_id = store.GetLocalId();
    if (local_id.IsErr()) {
        return BundleResult::Err(local_id.UnwrapErr());
    }
    auto device_id = store.GetDeviceId();
    if (device_id.IsErr()) {
        return BundleResult::Err(device_id.UnwrapErr());
    }
    auto registration_id = store.GetRegistrationId();
    if (registration_id.IsErr()) {
        return BundleResult::Err(registration_id.UnwrapErr());
    }
    auto identity = store.GetIdentityKeyPair();
    if (identity.IsErr()) {
        return BundleResult::Err(identity.UnwrapErr());
    }

    auto signed_id = store.LatestPreKeyId(StoreKeys::COUNTER_SIGNED_PRE_KEY);
    auto pre_key_id = store.LatestPreKeyId(StoreKeys::COUNTER_PRE_KEY);
    auto kyber_id = store.LatestPreKeyId(StoreKeys::COUNTER_KYBER_PRE_KEY);
    if (signed_id.IsErr()) {
        return BundleResult::Err(signed_id.UnwrapErr());
    }
    if (pre_key_id.IsErr()) {
        return BundleResult::Err(pre_key_id.UnwrapErr());
    }
    if (kyber_id.IsErr()) {
        return BundleResult::Err(kyber_id.UnwrapErr());
    }

    auto& stores = store.Stores();
    auto signed_record = stores.signed_pre_keys.LoadSignedPreKey(signed_id.Unwrap());
    if (signed_record.IsErr()) {
        return BundleResult::Err(signed_record.UnwrapErr());
    }
    auto pre_key_record = stores.pre_keys.LoadPreKey(pre_key_id.Unwrap());
    if (pre_key_record.IsErr()) {
        return BundleResult::Err(pre_key_record.UnwrapErr());
    }
    auto kyber_record = stores.kyber_pre_keys.LoadKyberPreKey(kyber_id.Unwrap());
    if (kyber_record.IsErr()) {
        return BundleResult::Err(kyber_record.UnwrapErr());
    }

    const auto& signed_pre_key = signed_record.Unwrap();
    const auto& pre_key = pre_key_record.Unwrap();
    const auto& kyber_pre_key = kyber_record.Unwrap();
    const models::PreKeyBundle bundle(
        local_id.Unwrap(),
        device_id.Unwrap(),
        registration_id.Unwrap(),
        identity.Unwrap().GetPublicKeyCopy(),
        models::PreKeyBundle::SignedKey{
            signed_pre_key.id(), ToVector(signed_pre_key.public_key()), ToVector(signed_pre_key.signature())},
        models::PreKeyBundle::PreKey{pre_key.id(), ToVector(pre_key.public_key())},
        models::PreKeyBundle::SignedKey{
            kyber_pre_key.id(), ToVector(kyber_pre_key.public_key()), ToVector(kyber_pre_key.signature())});
    return BundleResult::Ok(bundle.ToWire());
}

Result<bool, ProtocolFailure> BundleProtocol::HasSession(
    identity::MaterialStore& store,
    std::string_view peer_id,
    const uint32_t device_id) {
    const models::ProtocolAddress address(std::string(peer_id), device_id);
    auto session = store.Stores().sessions.LoadSession(address);
    if (session.IsErr()) {
        return Result<bool, ProtocolFailure>::Err(session.UnwrapErr());
    }
    return Result<bool, ProtocolFailure>::Ok(session.Unwrap().has_value());
}

Result<Unit, ProtocolFailure> BundleProtocol::InitSession(
    identity::MaterialStore& store,
    interfaces::IProtocolCipher& cipher,
    const proto::wire::Bundle& wire_bundle) {
    auto bundle = models::PreKeyBundle::FromWire(wire_bundle);
    if (bundle.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(bundle.UnwrapErr());
    }
    const auto& peer = bundle.Unwrap();
    auto existing = HasSession(store, peer.GetName(), peer.GetDeviceId());
    if (existing.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(existing.UnwrapErr());
    }
    if (existing.Unwrap()) {
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    COURIER_TRY_UNIT(peer.VerifySignatures());
    const models::ProtocolAddress address(peer.GetName(), peer.GetDeviceId());
    COURIER_TRY_UNIT(cipher.ProcessPreKeyBundle(peer, address, store.Stores()));
    spdlog::debug("Session established with {}", address.ToString());
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

}
