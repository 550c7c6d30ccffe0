#include "courier/crypto/kyber_interop.hpp"
#include "courier/crypto/sodium_interop.hpp"
#include "courier/crypto/hkdf.hpp"
#include <sodium.h>
#include <oqs/oqs.h>
#include <oqs/rand.h>
#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace courier::protocol::crypto {

namespace {

using PairResult = Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, ProtocolFailure>;
using BytesResult = Result<std::vector<uint8_t>, ProtocolFailure>;

struct OqsKemDeleter {
    void operator()(OQS_KEM* kem) const noexcept {
        if (kem != nullptr) {
            OQS_KEM_free(kem);
        }
    }
};
using OqsKemPtr = std::unique_ptr<OQS_KEM, OqsKemDeleter>;

Result<OqsKemPtr, ProtocolFailure> CreateKyber768Instance() {
    auto init_result = KyberInterop::Initialize();
    if (init_result.IsErr()) {
        return Result<OqsKemPtr, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }

    OqsKemPtr kem(OQS_KEM_new(OQS_KEM_alg_kyber_768));
    if (!kem) {
        return Result<OqsKemPtr, ProtocolFailure>::Err(
            ProtocolFailure::KeyGeneration("Failed to create Kyber-768 KEM instance (liboqs)"));
    }

    if (kem->length_public_key != KyberInterop::KYBER_768_PUBLIC_KEY_SIZE ||
        kem->length_secret_key != KyberInterop::KYBER_768_SECRET_KEY_SIZE ||
        kem->length_ciphertext != KyberInterop::KYBER_768_CIPHERTEXT_SIZE ||
        kem->length_shared_secret != KyberInterop::KYBER_768_SHARED_SECRET_SIZE) {
        return Result<OqsKemPtr, ProtocolFailure>::Err(
            ProtocolFailure::KeyGeneration("Kyber-768 size mismatch with FIPS 203 parameters"));
    }

    return Result<OqsKemPtr, ProtocolFailure>::Ok(std::move(kem));
}

bool AllZero(std::span<const uint8_t> data) {
    return std::all_of(data.begin(), data.end(), [](uint8_t b) { return b == 0; });
}

}

Result<Unit, SodiumFailure> KyberInterop::Initialize() {
    static std::once_flag rng_init_flag;
    static std::atomic<bool> initialized{false};

    auto sodium_init = SodiumInterop::Initialize();
    if (sodium_init.IsErr()) {
        return sodium_init;
    }

    std::call_once(rng_init_flag, []() {
        OQS_randombytes_custom_algorithm(
            [](uint8_t* buf, size_t len) { randombytes_buf(buf, len); });
        initialized.store(true, std::memory_order_release);
    });

    if (!initialized.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("KyberInterop initialization failed"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

PairResult KyberInterop::GenerateKyber768KeyPair(std::string_view purpose) {
    auto kem_result = CreateKyber768Instance();
    if (kem_result.IsErr()) {
        return PairResult::Err(kem_result.UnwrapErr());
    }
    auto kem = std::move(kem_result).Unwrap();

    std::vector<uint8_t> pk(KYBER_768_PUBLIC_KEY_SIZE);
    std::vector<uint8_t> sk(KYBER_768_SECRET_KEY_SIZE);
    if (OQS_KEM_keypair(kem.get(), pk.data(), sk.data()) != OQS_SUCCESS) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(sk));
        return PairResult::Err(
            ProtocolFailure::KeyGeneration(
                "Kyber-768 key generation failed for " + std::string(purpose)));
    }

    return PairResult::Ok(std::make_pair(std::move(sk), std::move(pk)));
}

PairResult KyberInterop::Encapsulate(std::span<const uint8_t> public_key) {
    auto validation_result = ValidatePublicKey(public_key);
    if (validation_result.IsErr()) {
        return PairResult::Err(validation_result.UnwrapErr());
    }

    auto kem_result = CreateKyber768Instance();
    if (kem_result.IsErr()) {
        return PairResult::Err(kem_result.UnwrapErr());
    }
    auto kem = std::move(kem_result).Unwrap();

    std::vector<uint8_t> ciphertext(KYBER_768_CIPHERTEXT_SIZE);
    std::vector<uint8_t> shared_secret(KYBER_768_SHARED_SECRET_SIZE);
    if (OQS_KEM_encaps(kem.get(), ciphertext.data(), shared_secret.data(), public_key.data())
        != OQS_SUCCESS) {
        return PairResult::Err(ProtocolFailure::Handshake("Kyber-768 encapsulation failed"));
    }

    return PairResult::Ok(std::make_pair(std::move(ciphertext), std::move(shared_secret)));
}

BytesResult KyberInterop::Decapsulate(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> secret_key) {

    auto ct_validation = ValidateCiphertext(ciphertext);
    if (ct_validation.IsErr()) {
        return BytesResult::Err(ct_validation.UnwrapErr());
    }
    if (secret_key.size() != KYBER_768_SECRET_KEY_SIZE) {
        return BytesResult::Err(
            ProtocolFailure::InvalidInput("Invalid Kyber-768 secret key size (expected 2400 bytes)"));
    }

    auto kem_result = CreateKyber768Instance();
    if (kem_result.IsErr()) {
        return BytesResult::Err(kem_result.UnwrapErr());
    }
    auto kem = std::move(kem_result).Unwrap();

    std::vector<uint8_t> shared_secret(KYBER_768_SHARED_SECRET_SIZE);
    if (OQS_KEM_decaps(kem.get(), shared_secret.data(), ciphertext.data(), secret_key.data())
        != OQS_SUCCESS) {
        return BytesResult::Err(ProtocolFailure::Handshake("Kyber-768 decapsulation failed"));
    }
    return BytesResult::Ok(std::move(shared_secret));
}

BytesResult KyberInterop::CombineHybridSecrets(
    std::span<const uint8_t> x25519_shared_secret,
    std::span<const uint8_t> kyber_shared_secret,
    std::string_view context) {

    if (x25519_shared_secret.size() != Hkdf::HASH_LEN) {
        return BytesResult::Err(
            ProtocolFailure::InvalidInput("X25519 shared secret must be 32 bytes"));
    }
    if (kyber_shared_secret.size() != KYBER_768_SHARED_SECRET_SIZE) {
        return BytesResult::Err(
            ProtocolFailure::InvalidInput("Kyber shared secret must be 32 bytes"));
    }

    std::vector<uint8_t> ikm;
    ikm.reserve(x25519_shared_secret.size() + kyber_shared_secret.size());
    ikm.insert(ikm.end(), x25519_shared_secret.begin(), x25519_shared_secret.end());
    ikm.insert(ikm.end(), kyber_shared_secret.begin(), kyber_shared_secret.end());

    std::string salt_str = "Courier-PQ-Hybrid-v1::";
    salt_str += context;
    std::vector<uint8_t> salt(salt_str.begin(), salt_str.end());

    auto prk_result = Hkdf::Extract(ikm, salt);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(ikm));
    if (prk_result.IsErr()) {
        return BytesResult::Err(
            ProtocolFailure::DeriveKey("HKDF-Extract failed in hybrid key combination"));
    }
    auto prk = std::move(prk_result).Unwrap();

    std::vector<uint8_t> hybrid(KYBER_768_SHARED_SECRET_SIZE);
    std::vector<uint8_t> context_info(context.begin(), context.end());
    auto expand_result = Hkdf::Expand(prk, hybrid, context_info);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(prk));
    if (expand_result.IsErr()) {
        return BytesResult::Err(
            ProtocolFailure::DeriveKey("HKDF-Expand failed in hybrid key combination"));
    }
    return BytesResult::Ok(std::move(hybrid));
}

Result<Unit, ProtocolFailure> KyberInterop::ValidatePublicKey(std::span<const uint8_t> public_key) {
    if (public_key.size() != KYBER_768_PUBLIC_KEY_SIZE) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::PeerPubKey("Invalid Kyber-768 public key size (expected 1184 bytes)"));
    }
    if (AllZero(public_key)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::PeerPubKey("Invalid Kyber-768 public key (all zeros)"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> KyberInterop::ValidateCiphertext(std::span<const uint8_t> ciphertext) {
    if (ciphertext.size() != KYBER_768_CIPHERTEXT_SIZE) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Decode("Invalid Kyber-768 ciphertext size (expected 1088 bytes)"));
    }
    if (AllZero(ciphertext)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Decode("Invalid Kyber-768 ciphertext (all zeros)"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

}
