#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace courier::protocol {

inline constexpr uint32_t kProtocolVersion = 1;

inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kX25519SharedSecretBytes = 32;
inline constexpr size_t kEd25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519SecretKeyBytes = 64;
inline constexpr size_t kEd25519SignatureBytes = 64;

inline constexpr size_t kKyberPublicKeyBytes = 1184;
inline constexpr size_t kKyberSecretKeyBytes = 2400;
inline constexpr size_t kKyberCiphertextBytes = 1088;
inline constexpr size_t kKyberSharedSecretBytes = 32;

inline constexpr size_t kRootKeyBytes = 32;
inline constexpr size_t kChainKeyBytes = 32;
inline constexpr size_t kMessageKeyBytes = 32;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;

inline constexpr size_t kMaxSkippedMessageKeys = 1000;

// X3DH input is prefixed with 32 bytes of 0xFF before the DH outputs.
inline constexpr size_t kX3dhPrefixBytes = 32;
inline constexpr uint8_t kX3dhPrefixByte = 0xFF;

inline constexpr std::string_view kX3dhInfo = "Courier-X3DH";
inline constexpr std::string_view kHybridX3dhInfo = "Courier-Hybrid-X3DH";
inline constexpr std::string_view kInitiatorChainInfo = "Courier-Initiator-Chain";
inline constexpr std::string_view kResponderChainInfo = "Courier-Responder-Chain";
inline constexpr std::string_view kChainInfo = "Courier-Chain";
inline constexpr std::string_view kMessageInfo = "Courier-Msg";

// Ciphertext type discriminators carried in envelopes.
inline constexpr uint32_t kCiphertextTypePreKey = 0;
inline constexpr uint32_t kCiphertextTypeEstablished = 1;

}
