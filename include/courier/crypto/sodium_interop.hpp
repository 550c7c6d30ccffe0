#pragma once

#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include "courier/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace courier::protocol::crypto {

/**
 * @brief Interop layer for libsodium operations
 *
 * Curve25519 key agreement, Ed25519 signatures, the CSPRNG and secure
 * memory allocation. Every method requires Initialize() to have succeeded.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium. Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Key Generation and Agreement
    // ========================================================================

    /**
     * @brief Generate an X25519 key pair
     *
     * @return Ok((secret_key, public_key)) or Err
     */
    static Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, ProtocolFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief Generate an Ed25519 signing key pair
     *
     * @return Ok((secret_key[64], public_key[32])) or Err
     */
    static Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, ProtocolFailure>
    GenerateEd25519KeyPair();

    /**
     * @brief X25519 scalar multiplication
     *
     * Rejects low-order peer points (all-zero output).
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> ComputeSharedSecret(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> peer_public_key);

    static Result<std::vector<uint8_t>, ProtocolFailure> Ed25519PublicKeyToX25519(
        std::span<const uint8_t> ed25519_public_key);

    static Result<std::vector<uint8_t>, ProtocolFailure> Ed25519SecretKeyToX25519(
        std::span<const uint8_t> ed25519_secret_key);

    // ========================================================================
    // Signatures
    // ========================================================================

    static Result<std::vector<uint8_t>, ProtocolFailure> SignDetached(
        std::span<const uint8_t> message,
        std::span<const uint8_t> ed25519_secret_key);

    [[nodiscard]] static bool VerifyDetached(
        std::span<const uint8_t> signature,
        std::span<const uint8_t> message,
        std::span<const uint8_t> ed25519_public_key) noexcept;

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static uint32_t GenerateRandomUInt32(bool ensure_non_zero = false);

    /**
     * @brief Uniform random value in [lower, upper)
     */
    static uint32_t GenerateRandomInRange(uint32_t lower, uint32_t upper);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

}
