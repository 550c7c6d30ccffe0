#ifndef COURIER_CRYPTO_KYBER_INTEROP_HPP
#define COURIER_CRYPTO_KYBER_INTEROP_HPP

#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include <span>
#include <vector>
#include <string_view>
#include <utility>

namespace courier::protocol::crypto {

/// KyberInterop - wrapper around liboqs Kyber-768 (ML-KEM, FIPS 203)
///
/// **Key Sizes (Kyber-768)**:
/// - Public Key:    1184 bytes
/// - Secret Key:    2400 bytes
/// - Ciphertext:    1088 bytes
/// - Shared Secret:   32 bytes
///
/// Secret keys are returned as plain byte vectors because they are sealed
/// into the encrypted record store right after generation.
class KyberInterop {
public:
    static constexpr size_t KYBER_768_PUBLIC_KEY_SIZE = 1184;
    static constexpr size_t KYBER_768_SECRET_KEY_SIZE = 2400;
    static constexpr size_t KYBER_768_CIPHERTEXT_SIZE = 1088;
    static constexpr size_t KYBER_768_SHARED_SECRET_SIZE = 32;

    /// Binds the liboqs RNG to libsodium. Safe to call multiple times.
    static Result<Unit, SodiumFailure> Initialize();

    /// @return (secret_key, public_key)
    static Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, ProtocolFailure>
    GenerateKyber768KeyPair(std::string_view purpose);

    /// @return (ciphertext, shared_secret)
    static Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, ProtocolFailure>
    Encapsulate(std::span<const uint8_t> public_key);

    static Result<std::vector<uint8_t>, ProtocolFailure>
    Decapsulate(
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> secret_key);

    /// Combines X25519 and Kyber-768 shared secrets:
    ///   PRK    = HKDF-Extract("Courier-PQ-Hybrid-v1::" || context, x25519_ss || kyber_ss)
    ///   result = HKDF-Expand(PRK, context, 32)
    static Result<std::vector<uint8_t>, ProtocolFailure>
    CombineHybridSecrets(
        std::span<const uint8_t> x25519_shared_secret,
        std::span<const uint8_t> kyber_shared_secret,
        std::string_view context);

    static Result<Unit, ProtocolFailure>
    ValidatePublicKey(std::span<const uint8_t> public_key);

    static Result<Unit, ProtocolFailure>
    ValidateCiphertext(std::span<const uint8_t> ciphertext);

private:
    KyberInterop() = delete;
};

}

#endif
