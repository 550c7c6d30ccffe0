#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include "courier/identity/material_store.hpp"
#include "courier/interfaces/i_protocol_cipher.hpp"
#include "wire/envelope.pb.h"
#include <span>
#include <string_view>
#include <vector>

namespace courier::protocol {

/**
 * @brief Wraps cipher output into envelopes and back
 *
 * Peers are addressed at device 1 regardless of the device id in their
 * bundle; multi-device fan-out is not supported.
 */
class SecureMessenger {
public:
    static constexpr uint32_t PEER_DEVICE_ID = 1;

    [[nodiscard]] static Result<proto::wire::Envelope, ProtocolFailure> EncryptMessage(
        identity::MaterialStore& store,
        interfaces::IProtocolCipher& cipher,
        std::string_view recipient_id,
        std::span<const uint8_t> plaintext);

    /// @return Err(InvalidInput) for a ciphertext type other than prekey or established
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> DecryptMessage(
        identity::MaterialStore& store,
        interfaces::IProtocolCipher& cipher,
        const proto::wire::Envelope& envelope);

private:
    SecureMessenger() = delete;
};

}
