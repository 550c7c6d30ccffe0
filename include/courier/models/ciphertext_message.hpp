#pragma once
#include "courier/protocol/constants.hpp"
#include <cstdint>
#include <vector>
namespace courier::protocol::models {
/// Cipher output: the envelope type discriminator and the serialized message.
struct CiphertextMessage {
    uint32_t type = kCiphertextTypeEstablished;
    std::vector<uint8_t> bytes;

    [[nodiscard]] bool IsPreKeyMessage() const noexcept {
        return type == kCiphertextTypePreKey;
    }
};
}
