#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include "courier/interfaces/i_identity_key_store.hpp"
#include "courier/interfaces/i_pre_key_store.hpp"
#include "courier/interfaces/i_session_store.hpp"
#include "courier/models/ciphertext_message.hpp"
#include "courier/models/pre_key_bundle.hpp"
#include "courier/models/protocol_address.hpp"
#include <span>
#include <vector>
namespace courier::protocol::interfaces {

/// Storage contracts a cipher reads and writes during one operation.
struct ProtocolStores {
    IIdentityKeyStore& identity;
    ISessionStore& sessions;
    IPreKeyStore& pre_keys;
    ISignedPreKeyStore& signed_pre_keys;
    IKyberPreKeyStore& kyber_pre_keys;
};

/**
 * Session establishment and message encryption capability.
 *
 * Implementations keep all state in `stores`; the same cipher instance
 * may serve several local identities.
 */
class IProtocolCipher {
public:
    virtual ~IProtocolCipher() = default;

    [[nodiscard]] virtual Result<models::CiphertextMessage, ProtocolFailure> Encrypt(
        std::span<const uint8_t> plaintext,
        const models::ProtocolAddress& address,
        ProtocolStores& stores) = 0;

    /// Decrypts an established-session message.
    [[nodiscard]] virtual Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        std::span<const uint8_t> message,
        const models::ProtocolAddress& address,
        ProtocolStores& stores) = 0;

    /// Decrypts a prekey message, creating the responder session on first use.
    [[nodiscard]] virtual Result<std::vector<uint8_t>, ProtocolFailure> DecryptPreKey(
        std::span<const uint8_t> message,
        const models::ProtocolAddress& address,
        ProtocolStores& stores) = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> ProcessPreKeyBundle(
        const models::PreKeyBundle& bundle,
        const models::ProtocolAddress& address,
        ProtocolStores& stores) = 0;
};
}
