#include "courier/models/pre_key_bundle.hpp"
#include "courier/crypto/sodium_interop.hpp"
#include "courier/core/constants.hpp"
#include "courier/protocol/constants.hpp"
#include "courier/core/format.hpp"
namespace courier::protocol::models {
using crypto::SodiumInterop;

namespace {
    std::vector<uint8_t> ToVector(const std::string& bytes) {
        return {bytes.begin(), bytes.end()};
    }

    Result<Unit, ProtocolFailure> CheckSize(
        std::string_view field,
        const std::string& bytes,
        const size_t expected) {
        if (bytes.size() != expected) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::PeerPubKey(
                compat::format("bundle.{} must be {} bytes, got {}", field, expected, bytes.size())));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> CheckShape(const proto::wire::Bundle& bundle) {
        if (bundle.id().empty()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("bundle.id must not be empty"));
        }
        if (bundle.device_id() <= 0 || bundle.registration_id() <= 0) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("bundle.deviceId and bundle.registrationId must be positive"));
        }
        if (!bundle.has_signed_pre_key() || !bundle.has_kyber_pre_key()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("bundle is missing its signed or Kyber prekey"));
        }
        if (bundle.signed_pre_key().key_id() < 0 || bundle.kyber_pre_key().key_id() < 0 ||
            (bundle.has_pre_key() && bundle.pre_key().key_id() < 0)) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("bundle key ids must be non-negative"));
        }
        COURIER_TRY_UNIT(CheckSize("identityKey", bundle.identity_key(), kEd25519PublicKeyBytes));
        COURIER_TRY_UNIT(CheckSize("signedPreKey.publicKey", bundle.signed_pre_key().public_key(),
                                   kX25519PublicKeyBytes));
        COURIER_TRY_UNIT(CheckSize("signedPreKey.signature", bundle.signed_pre_key().signature(),
                                   kEd25519SignatureBytes));
        COURIER_TRY_UNIT(CheckSize("kyberPreKey.publicKey", bundle.kyber_pre_key().public_key(),
                                   kKyberPublicKeyBytes));
        COURIER_TRY_UNIT(CheckSize("kyberPreKey.signature", bundle.kyber_pre_key().signature(),
                                   kEd25519SignatureBytes));
        if (bundle.has_pre_key()) {
            COURIER_TRY_UNIT(CheckSize("preKey.publicKey", bundle.pre_key().public_key(),
                                       kX25519PublicKeyBytes));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}

PreKeyBundle::PreKeyBundle(
    std::string name,
    const uint32_t device_id,
    const uint32_t registration_id,
    std::vector<uint8_t> identity_key,
    SignedKey signed_pre_key,
    std::optional<PreKey> pre_key,
    SignedKey kyber_pre_key)
    : name_(std::move(name))
    , device_id_(device_id)
    , registration_id_(registration_id)
    , identity_key_(std::move(identity_key))
    , signed_pre_key_(std::move(signed_pre_key))
    , pre_key_(std::move(pre_key))
    , kyber_pre_key_(std::move(kyber_pre_key)) {
}

Result<PreKeyBundle, ProtocolFailure> PreKeyBundle::FromWire(const proto::wire::Bundle& bundle) {
    if (auto shape = CheckShape(bundle); shape.IsErr()) {
        return Result<PreKeyBundle, ProtocolFailure>::Err(shape.UnwrapErr());
    }
    std::optional<PreKey> pre_key;
    if (bundle.has_pre_key()) {
        pre_key = PreKey{
            static_cast<uint32_t>(bundle.pre_key().key_id()),
            ToVector(bundle.pre_key().public_key())};
    }
    const auto& spk = bundle.signed_pre_key();
    const auto& kpk = bundle.kyber_pre_key();
    return Result<PreKeyBundle, ProtocolFailure>::Ok(PreKeyBundle(
        bundle.id(),
        static_cast<uint32_t>(bundle.device_id()),
        static_cast<uint32_t>(bundle.registration_id()),
        ToVector(bundle.identity_key()),
        SignedKey{static_cast<uint32_t>(spk.key_id()), ToVector(spk.public_key()), ToVector(spk.signature())},
        std::move(pre_key),
        SignedKey{static_cast<uint32_t>(kpk.key_id()), ToVector(kpk.public_key()), ToVector(kpk.signature())}));
}

proto::wire::Bundle PreKeyBundle::ToWire() const {
    proto::wire::Bundle bundle;
    bundle.set_id(name_);
    bundle.set_device_id(static_cast<int32_t>(device_id_));
    bundle.set_registration_id(static_cast<int32_t>(registration_id_));
    bundle.set_identity_key(identity_key_.data(), identity_key_.size());

    auto* spk = bundle.mutable_signed_pre_key();
    spk->set_key_id(static_cast<int32_t>(signed_pre_key_.id));
    spk->set_public_key(signed_pre_key_.public_key.data(), signed_pre_key_.public_key.size());
    spk->set_signature(signed_pre_key_.signature.data(), signed_pre_key_.signature.size());

    if (pre_key_.has_value()) {
        auto* pk = bundle.mutable_pre_key();
        pk->set_key_id(static_cast<int32_t>(pre_key_->id));
        pk->set_public_key(pre_key_->public_key.data(), pre_key_->public_key.size());
    }

    auto* kpk = bundle.mutable_kyber_pre_key();
    kpk->set_key_id(static_cast<int32_t>(kyber_pre_key_.id));
    kpk->set_public_key(kyber_pre_key_.public_key.data(), kyber_pre_key_.public_key.size());
    kpk->set_signature(kyber_pre_key_.signature.data(), kyber_pre_key_.signature.size());
    return bundle;
}

Result<Unit, ProtocolFailure> PreKeyBundle::VerifySignatures() const {
    if (!SodiumInterop::VerifyDetached(signed_pre_key_.signature, signed_pre_key_.public_key, identity_key_)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Handshake(std::string(ErrorMessages::SIGNED_PRE_KEY_FAILED)));
    }
    if (!SodiumInterop::VerifyDetached(kyber_pre_key_.signature, kyber_pre_key_.public_key, identity_key_)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Handshake(std::string(ErrorMessages::KYBER_PRE_KEY_FAILED)));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}
}
