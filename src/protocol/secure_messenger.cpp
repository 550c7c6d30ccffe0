#include "courier/protocol/secure_messenger.hpp"
#include "courier/protocol/constants.hpp"
#include "courier/core/format.hpp"
#include "courier/utilities/encoding.hpp"
#include "courier/utilities/envelope_codec.hpp"

namespace courier::protocol {

using utilities::EnvelopeCodec;

Result<proto::wire::Envelope, ProtocolFailure> SecureMessenger::EncryptMessage(
    identity::MaterialStore& store,
    interfaces::IProtocolCipher& cipher,
    std::string_view recipient_id,
    std::span<const uint8_t> plaintext) {
    using EnvelopeResult = Result<proto::wire::Envelope, ProtocolFailure>;

    auto local_id = store.GetLocalId();
    if (local_id.IsErr()) {
        return EnvelopeResult::Err(local_id.UnwrapErr());
    }
    const models::ProtocolAddress address(std::string(recipient_id), PEER_DEVICE_ID);
    auto ciphertext = cipher.Encrypt(plaintext, address, store.Stores());
    if (ciphertext.IsErr()) {
        return EnvelopeResult::Err(ciphertext.UnwrapErr());
    }
    const auto& message = ciphertext.Unwrap();
    return EnvelopeResult::Ok(EnvelopeCodec::Build(
        local_id.Unwrap(), recipient_id, message.type, message.bytes, utilities::Encoding::NowMillis()));
}

Result<std::vector<uint8_t>, ProtocolFailure> SecureMessenger::DecryptMessage(
    identity::MaterialStore& store,
    interfaces::IProtocolCipher& cipher,
    const proto::wire::Envelope& envelope) {
    const models::ProtocolAddress address(envelope.sender_id(), PEER_DEVICE_ID);
    const std::span<const uint8_t> body(
        reinterpret_cast<const uint8_t*>(envelope.body().data()), envelope.body().size());

    switch (envelope.type()) {
        case static_cast<int32_t>(kCiphertextTypePreKey):
            return cipher.DecryptPreKey(body, address, store.Stores());
        case static_cast<int32_t>(kCiphertextTypeEstablished):
            return cipher.Decrypt(body, address, store.Stores());
        default:
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                compat::format("Unsupported ciphertext type: {}", envelope.type())));
    }
}

}
