#include <catch2/catch_test_macros.hpp>
#include "courier/crypto/aes_gcm.hpp"
#include "courier/crypto/hkdf.hpp"
#include "courier/crypto/kyber_interop.hpp"
#include "courier/crypto/passphrase_kdf.hpp"
#include "courier/crypto/sodium_interop.hpp"
#include "courier/protocol/constants.hpp"
#include "courier/utilities/encoding.hpp"
using namespace courier::protocol;
using namespace courier::protocol::crypto;
using courier::protocol::utilities::Encoding;
TEST_CASE("AES-GCM - Round trip and authentication", "[crypto][aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(kAesKeyBytes, 0xAA);
    const std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0xBB);
    const std::vector<uint8_t> ad = {'k', 'v', ':', 'a'};
    SECTION("Decrypts what it encrypted") {
        const auto plaintext = Encoding::ToBytes("courier record");
        auto sealed = AesGcm::Encrypt(key, nonce, plaintext, ad);
        REQUIRE(sealed.IsOk());
        REQUIRE(sealed.Unwrap().size() == plaintext.size() + kAesGcmTagBytes);
        auto opened = AesGcm::Decrypt(key, nonce, sealed.Unwrap(), ad);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == plaintext);
    }
    SECTION("Empty plaintext yields a bare tag") {
        auto sealed = AesGcm::Encrypt(key, nonce, {}, ad);
        REQUIRE(sealed.IsOk());
        REQUIRE(sealed.Unwrap().size() == kAesGcmTagBytes);
        auto opened = AesGcm::Decrypt(key, nonce, sealed.Unwrap(), ad);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap().empty());
    }
    SECTION("Different associated data fails") {
        auto sealed = AesGcm::Encrypt(key, nonce, Encoding::ToBytes("value"), ad);
        REQUIRE(sealed.IsOk());
        const std::vector<uint8_t> other_ad = {'k', 'v', ':', 'b'};
        REQUIRE(AesGcm::Decrypt(key, nonce, sealed.Unwrap(), other_ad).IsErr());
    }
    SECTION("Flipped ciphertext bit fails") {
        auto sealed = AesGcm::Encrypt(key, nonce, Encoding::ToBytes("value"), ad);
        REQUIRE(sealed.IsOk());
        auto tampered = sealed.Unwrap();
        tampered[0] ^= 0x01;
        REQUIRE(AesGcm::Decrypt(key, nonce, tampered, ad).IsErr());
    }
    SECTION("Wrong key size is rejected") {
        const std::vector<uint8_t> short_key(16, 0xAA);
        REQUIRE(AesGcm::Encrypt(short_key, nonce, Encoding::ToBytes("value"), ad).IsErr());
    }
}
TEST_CASE("HKDF - RFC 5869 test case 1", "[crypto][hkdf]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> ikm(22, 0x0b);
    std::vector<uint8_t> salt;
    for (uint8_t i = 0x00; i <= 0x0c; ++i) {
        salt.push_back(i);
    }
    std::vector<uint8_t> info;
    for (uint8_t i = 0xf0; i <= 0xf9; ++i) {
        info.push_back(i);
    }
    auto okm = Hkdf::DeriveKeyBytes(ikm, 42, salt, info);
    REQUIRE(okm.IsOk());
    REQUIRE(Encoding::ToHex(okm.Unwrap()) ==
            "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf34007208d5b887185865");
}
TEST_CASE("HKDF - Info separates outputs", "[crypto][hkdf]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> ikm(32, 0x42);
    const auto chain_info = Encoding::ToBytes(kChainInfo);
    const auto message_info = Encoding::ToBytes(kMessageInfo);
    auto chain = Hkdf::DeriveKeyBytes(ikm, kChainKeyBytes, {}, chain_info);
    auto message = Hkdf::DeriveKeyBytes(ikm, kMessageKeyBytes, {}, message_info);
    REQUIRE(chain.IsOk());
    REQUIRE(message.IsOk());
    REQUIRE(chain.Unwrap() != message.Unwrap());
    SECTION("Output longer than 255 blocks is rejected") {
        REQUIRE(Hkdf::DeriveKeyBytes(ikm, Hkdf::MAX_OUTPUT_LEN + 1).IsErr());
    }
}
TEST_CASE("SodiumInterop - Key agreement and signatures", "[crypto][sodium]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("X25519 shared secrets agree") {
        auto alice = SodiumInterop::GenerateX25519KeyPair("alice");
        auto bob = SodiumInterop::GenerateX25519KeyPair("bob");
        REQUIRE(alice.IsOk());
        REQUIRE(bob.IsOk());
        REQUIRE(alice.Unwrap().second.size() == kX25519PublicKeyBytes);
        auto ab = SodiumInterop::ComputeSharedSecret(alice.Unwrap().first, bob.Unwrap().second);
        auto ba = SodiumInterop::ComputeSharedSecret(bob.Unwrap().first, alice.Unwrap().second);
        REQUIRE(ab.IsOk());
        REQUIRE(ba.IsOk());
        REQUIRE(ab.Unwrap() == ba.Unwrap());
    }
    SECTION("Ed25519 detached signatures verify and reject tampering") {
        auto identity = SodiumInterop::GenerateEd25519KeyPair();
        REQUIRE(identity.IsOk());
        const auto& [secret_key, public_key] = identity.Unwrap();
        REQUIRE(secret_key.size() == kEd25519SecretKeyBytes);
        const auto message = Encoding::ToBytes("signed prekey");
        auto signature = SodiumInterop::SignDetached(message, secret_key);
        REQUIRE(signature.IsOk());
        REQUIRE(SodiumInterop::VerifyDetached(signature.Unwrap(), message, public_key));
        auto forged = signature.Unwrap();
        forged[5] ^= 0x80;
        REQUIRE_FALSE(SodiumInterop::VerifyDetached(forged, message, public_key));
    }
    SECTION("Random range stays within bounds") {
        for (int i = 0; i < 200; ++i) {
            const uint32_t value = SodiumInterop::GenerateRandomInRange(1, 16380);
            REQUIRE(value >= 1);
            REQUIRE(value < 16380);
        }
    }
}
TEST_CASE("KyberInterop - Encapsulation round trip", "[crypto][kyber]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    REQUIRE(KyberInterop::Initialize().IsOk());
    auto pair = KyberInterop::GenerateKyber768KeyPair("test");
    REQUIRE(pair.IsOk());
    const auto& [secret_key, public_key] = pair.Unwrap();
    REQUIRE(public_key.size() == kKyberPublicKeyBytes);
    REQUIRE(secret_key.size() == kKyberSecretKeyBytes);
    auto encapsulated = KyberInterop::Encapsulate(public_key);
    REQUIRE(encapsulated.IsOk());
    const auto& [ciphertext, shared_secret] = encapsulated.Unwrap();
    REQUIRE(ciphertext.size() == kKyberCiphertextBytes);
    auto decapsulated = KyberInterop::Decapsulate(ciphertext, secret_key);
    REQUIRE(decapsulated.IsOk());
    REQUIRE(decapsulated.Unwrap() == shared_secret);
    SECTION("Hybrid combination depends on both secrets") {
        const std::vector<uint8_t> classical(kX25519SharedSecretBytes, 0x11);
        const std::vector<uint8_t> other_classical(kX25519SharedSecretBytes, 0x12);
        auto combined = KyberInterop::CombineHybridSecrets(classical, shared_secret, kHybridX3dhInfo);
        auto other = KyberInterop::CombineHybridSecrets(other_classical, shared_secret, kHybridX3dhInfo);
        REQUIRE(combined.IsOk());
        REQUIRE(other.IsOk());
        REQUIRE(combined.Unwrap().size() == kRootKeyBytes);
        REQUIRE(combined.Unwrap() != other.Unwrap());
    }
    SECTION("Truncated public key is rejected") {
        const std::vector<uint8_t> truncated(public_key.begin(), public_key.begin() + 100);
        REQUIRE(KyberInterop::Encapsulate(truncated).IsErr());
    }
}
TEST_CASE("PassphraseKdf - Scrypt derivation", "[crypto][scrypt]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> salt(16, 0x5A);
    const ScryptParameters params{1024, 8, 1, 32};
    auto first = PassphraseKdf::DeriveKey("correct horse", salt, params);
    auto second = PassphraseKdf::DeriveKey("correct horse", salt, params);
    auto other = PassphraseKdf::DeriveKey("wrong horse", salt, params);
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    REQUIRE(other.IsOk());
    auto first_bytes = first.Unwrap().ReadBytes(32);
    auto second_bytes = second.Unwrap().ReadBytes(32);
    auto other_bytes = other.Unwrap().ReadBytes(32);
    REQUIRE(first_bytes.IsOk());
    REQUIRE(first_bytes.Unwrap() == second_bytes.Unwrap());
    REQUIRE(first_bytes.Unwrap() != other_bytes.Unwrap());
    SECTION("Empty salt is rejected") {
        REQUIRE(PassphraseKdf::DeriveKey("correct horse", {}, params).IsErr());
    }
}
