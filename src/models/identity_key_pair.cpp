#include "courier/models/identity_key_pair.hpp"
#include "courier/crypto/sodium_interop.hpp"
#include "courier/protocol/constants.hpp"
#include "courier/core/format.hpp"
namespace courier::protocol::models {
using crypto::SodiumInterop;
using crypto::SecureMemoryHandle;

IdentityKeyPair::IdentityKeyPair(
    SecureMemoryHandle secret_key_handle,
    std::vector<uint8_t> public_key)
    : secret_key_handle_(std::move(secret_key_handle))
    , public_key_(std::move(public_key)) {
}

Result<IdentityKeyPair, ProtocolFailure> IdentityKeyPair::Generate() {
    auto generated = SodiumInterop::GenerateEd25519KeyPair();
    if (generated.IsErr()) {
        return Result<IdentityKeyPair, ProtocolFailure>::Err(generated.UnwrapErr());
    }
    auto [secret_key, public_key] = std::move(generated).Unwrap();
    auto handle = SecureMemoryHandle::FromBytes(secret_key);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(secret_key));
    if (handle.IsErr()) {
        return Result<IdentityKeyPair, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    return Result<IdentityKeyPair, ProtocolFailure>::Ok(
        IdentityKeyPair(std::move(handle).Unwrap(), std::move(public_key)));
}

Result<IdentityKeyPair, ProtocolFailure> IdentityKeyPair::FromRecord(
    const proto::protocol::IdentityKeyPairRecord& record) {
    if (record.public_key().size() != kEd25519PublicKeyBytes ||
        record.private_key().size() != kEd25519SecretKeyBytes) {
        return Result<IdentityKeyPair, ProtocolFailure>::Err(
            ProtocolFailure::Decode(compat::format(
                "Identity key pair has invalid sizes (public {}, private {})",
                record.public_key().size(), record.private_key().size())));
    }
    const auto& secret = record.private_key();
    auto handle = SecureMemoryHandle::FromBytes(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(secret.data()), secret.size()));
    if (handle.IsErr()) {
        return Result<IdentityKeyPair, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    const auto& pub = record.public_key();
    return Result<IdentityKeyPair, ProtocolFailure>::Ok(
        IdentityKeyPair(std::move(handle).Unwrap(), std::vector<uint8_t>(pub.begin(), pub.end())));
}

Result<proto::protocol::IdentityKeyPairRecord, ProtocolFailure> IdentityKeyPair::ToRecord() const {
    proto::protocol::IdentityKeyPairRecord record;
    record.set_public_key(public_key_.data(), public_key_.size());
    auto copied = secret_key_handle_.WithReadAccess([&record](std::span<const uint8_t> secret) {
        record.set_private_key(secret.data(), secret.size());
        return unit;
    });
    if (copied.IsErr()) {
        return Result<proto::protocol::IdentityKeyPairRecord, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(copied.UnwrapErr()));
    }
    return Result<proto::protocol::IdentityKeyPairRecord, ProtocolFailure>::Ok(std::move(record));
}

Result<std::vector<uint8_t>, ProtocolFailure> IdentityKeyPair::Sign(std::span<const uint8_t> message) const {
    auto signed_result = secret_key_handle_.WithReadAccess([message](std::span<const uint8_t> secret) {
        return SodiumInterop::SignDetached(message, secret);
    });
    if (signed_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(signed_result.UnwrapErr()));
    }
    return std::move(signed_result).Unwrap();
}

Result<std::vector<uint8_t>, ProtocolFailure> IdentityKeyPair::GetX25519PublicKey() const {
    return SodiumInterop::Ed25519PublicKeyToX25519(public_key_);
}

Result<std::vector<uint8_t>, ProtocolFailure> IdentityKeyPair::GetX25519SecretKey() const {
    auto converted = secret_key_handle_.WithReadAccess([](std::span<const uint8_t> secret) {
        return SodiumInterop::Ed25519SecretKeyToX25519(secret);
    });
    if (converted.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(converted.UnwrapErr()));
    }
    return std::move(converted).Unwrap();
}
}
