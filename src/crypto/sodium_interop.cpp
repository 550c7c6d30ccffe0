#include "courier/crypto/sodium_interop.hpp"

#include <string>

namespace courier::protocol::crypto {

namespace {

using KeyPairResult = Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, ProtocolFailure>;
using BytesResult = Result<std::vector<uint8_t>, ProtocolFailure>;

bool IsAllZero(std::span<const uint8_t> data) {
    uint8_t acc = 0;
    for (const auto byte : data) {
        acc |= byte;
    }
    return acc == 0;
}

}

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                "Buffer size " + std::to_string(buffer.size()) +
                " exceeds maximum " + std::to_string(MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = SodiumConstants::SECURE_WIPE_PATTERN;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }
    return Result<bool, SodiumFailure>::Ok(
        sodium_memcmp(a.data(), b.data(), a.size()) == SodiumConstants::SUCCESS);
}

// ============================================================================
// Key Generation and Agreement
// ============================================================================

KeyPairResult SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    std::vector<uint8_t> sk = GetRandomBytes(Constants::X_25519_PRIVATE_KEY_SIZE);
    std::vector<uint8_t> pk(Constants::X_25519_PUBLIC_KEY_SIZE);

    if (crypto_scalarmult_base(pk.data(), sk.data()) != SodiumConstants::SUCCESS) {
        SecureWipe(std::span<uint8_t>(sk));
        return KeyPairResult::Err(
            ProtocolFailure::DeriveKey(
                "Failed to derive " + std::string(key_purpose) + " public key"));
    }

    return KeyPairResult::Ok(std::make_pair(std::move(sk), std::move(pk)));
}

KeyPairResult SodiumInterop::GenerateEd25519KeyPair() {
    std::vector<uint8_t> pk(Constants::ED_25519_PUBLIC_KEY_SIZE);
    std::vector<uint8_t> sk(Constants::ED_25519_SECRET_KEY_SIZE);

    if (crypto_sign_keypair(pk.data(), sk.data()) != SodiumConstants::SUCCESS) {
        SecureWipe(std::span<uint8_t>(sk));
        return KeyPairResult::Err(
            ProtocolFailure::KeyGeneration("Failed to generate Ed25519 key pair"));
    }

    return KeyPairResult::Ok(std::make_pair(std::move(sk), std::move(pk)));
}

BytesResult SodiumInterop::ComputeSharedSecret(
    std::span<const uint8_t> private_key,
    std::span<const uint8_t> peer_public_key) {

    if (private_key.size() != Constants::X_25519_PRIVATE_KEY_SIZE) {
        return BytesResult::Err(ProtocolFailure::InvalidInput(
            "X25519 private key must be " +
            std::to_string(Constants::X_25519_PRIVATE_KEY_SIZE) + " bytes"));
    }
    if (peer_public_key.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return BytesResult::Err(ProtocolFailure::PeerPubKey(
            "X25519 public key must be " +
            std::to_string(Constants::X_25519_PUBLIC_KEY_SIZE) + " bytes"));
    }

    std::vector<uint8_t> shared(crypto_scalarmult_BYTES);
    if (crypto_scalarmult(shared.data(), private_key.data(), peer_public_key.data())
        != SodiumConstants::SUCCESS || IsAllZero(shared)) {
        SecureWipe(std::span<uint8_t>(shared));
        return BytesResult::Err(ProtocolFailure::PeerPubKey(
            "X25519 key agreement produced an invalid shared secret"));
    }
    return BytesResult::Ok(std::move(shared));
}

BytesResult SodiumInterop::Ed25519PublicKeyToX25519(std::span<const uint8_t> ed25519_public_key) {
    if (ed25519_public_key.size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return BytesResult::Err(ProtocolFailure::PeerPubKey(
            "Ed25519 public key must be " +
            std::to_string(Constants::ED_25519_PUBLIC_KEY_SIZE) + " bytes"));
    }
    std::vector<uint8_t> out(Constants::X_25519_PUBLIC_KEY_SIZE);
    if (crypto_sign_ed25519_pk_to_curve25519(out.data(), ed25519_public_key.data())
        != SodiumConstants::SUCCESS) {
        return BytesResult::Err(ProtocolFailure::PeerPubKey(
            "Ed25519 public key cannot be converted to X25519"));
    }
    return BytesResult::Ok(std::move(out));
}

BytesResult SodiumInterop::Ed25519SecretKeyToX25519(std::span<const uint8_t> ed25519_secret_key) {
    if (ed25519_secret_key.size() != Constants::ED_25519_SECRET_KEY_SIZE) {
        return BytesResult::Err(ProtocolFailure::InvalidInput(
            "Ed25519 secret key must be " +
            std::to_string(Constants::ED_25519_SECRET_KEY_SIZE) + " bytes"));
    }
    std::vector<uint8_t> out(Constants::X_25519_PRIVATE_KEY_SIZE);
    if (crypto_sign_ed25519_sk_to_curve25519(out.data(), ed25519_secret_key.data())
        != SodiumConstants::SUCCESS) {
        return BytesResult::Err(ProtocolFailure::DeriveKey(
            "Ed25519 secret key cannot be converted to X25519"));
    }
    return BytesResult::Ok(std::move(out));
}

// ============================================================================
// Signatures
// ============================================================================

BytesResult SodiumInterop::SignDetached(
    std::span<const uint8_t> message,
    std::span<const uint8_t> ed25519_secret_key) {

    if (ed25519_secret_key.size() != Constants::ED_25519_SECRET_KEY_SIZE) {
        return BytesResult::Err(ProtocolFailure::InvalidInput(
            "Ed25519 secret key must be " +
            std::to_string(Constants::ED_25519_SECRET_KEY_SIZE) + " bytes"));
    }

    std::vector<uint8_t> signature(Constants::ED_25519_SIGNATURE_SIZE);
    if (crypto_sign_detached(signature.data(), nullptr,
                             message.data(), message.size(),
                             ed25519_secret_key.data()) != SodiumConstants::SUCCESS) {
        return BytesResult::Err(ProtocolFailure::Generic("Failed to sign message"));
    }
    return BytesResult::Ok(std::move(signature));
}

bool SodiumInterop::VerifyDetached(
    std::span<const uint8_t> signature,
    std::span<const uint8_t> message,
    std::span<const uint8_t> ed25519_public_key) noexcept {

    if (signature.size() != Constants::ED_25519_SIGNATURE_SIZE ||
        ed25519_public_key.size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(),
                                       message.data(), message.size(),
                                       ed25519_public_key.data()) == SodiumConstants::SUCCESS;
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    if (size > 0) {
        randombytes_buf(buffer.data(), size);
    }
    return buffer;
}

uint32_t SodiumInterop::GenerateRandomUInt32(bool ensure_non_zero) {
    uint32_t value;
    do {
        value = randombytes_random();
    } while (ensure_non_zero && value == 0);
    return value;
}

uint32_t SodiumInterop::GenerateRandomInRange(uint32_t lower, uint32_t upper) {
    if (upper <= lower) {
        return lower;
    }
    return lower + randombytes_uniform(upper - lower);
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

}
