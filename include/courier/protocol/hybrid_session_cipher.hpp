#pragma once
#include "courier/interfaces/i_protocol_cipher.hpp"
#include "protocol/key_material.pb.h"
#include "protocol/messages.pb.h"

namespace courier::protocol {

/**
 * @brief X3DH-style handshake with a Kyber-768 encapsulation, followed by
 * symmetric message chains
 *
 * Handshake (initiator A, responder B):
 *   DH1 = IK_A * SPK_B, DH2 = EK_A * IK_B, DH3 = EK_A * SPK_B,
 *   DH4 = EK_A * OPK_B (only with a one-time prekey)
 *   classical = HKDF(0xFF*32 || DH1..DH4, info "Courier-X3DH")
 *   root      = CombineHybridSecrets(classical, Kyber shared secret)
 *
 * Each direction has its own chain derived from the root. A chain step
 * yields a message key and the next chain key. Messages are sealed with
 * AES-256-GCM under a random nonce; the associated data is the sender
 * identity key followed by the receiver identity key.
 *
 * The initiator sends prekey messages until the first message from the
 * responder decrypts. A responder that receives further prekey messages
 * with the same base key keeps its session.
 */
class HybridSessionCipher final : public interfaces::IProtocolCipher {
public:
    Result<models::CiphertextMessage, ProtocolFailure> Encrypt(
        std::span<const uint8_t> plaintext,
        const models::ProtocolAddress& address,
        interfaces::ProtocolStores& stores) override;

    Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        std::span<const uint8_t> message,
        const models::ProtocolAddress& address,
        interfaces::ProtocolStores& stores) override;

    Result<std::vector<uint8_t>, ProtocolFailure> DecryptPreKey(
        std::span<const uint8_t> message,
        const models::ProtocolAddress& address,
        interfaces::ProtocolStores& stores) override;

    Result<Unit, ProtocolFailure> ProcessPreKeyBundle(
        const models::PreKeyBundle& bundle,
        const models::ProtocolAddress& address,
        interfaces::ProtocolStores& stores) override;

private:
    static Result<proto::protocol::SessionRecord, ProtocolFailure> AcceptHandshake(
        const proto::protocol::PreKeyCipherMessage& message,
        interfaces::ProtocolStores& stores);

    static Result<std::vector<uint8_t>, ProtocolFailure> DecryptWithSession(
        proto::protocol::SessionRecord& session,
        const proto::protocol::CipherMessage& message);
};

}
