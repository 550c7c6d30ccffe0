#include "courier/crypto/aes_gcm.hpp"
#include "courier/crypto/sodium_interop.hpp"
#include "courier/core/constants.hpp"
#include "courier/core/format.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>
#include <optional>
#include <string>
namespace courier::protocol::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    using BytesResult = Result<std::vector<uint8_t>, ProtocolFailure>;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    BytesResult OpenSslFailure(const char* what) {
        return BytesResult::Err(
            ProtocolFailure::Generic(compat::format("{}: {}", what, GetOpenSSLError())));
    }

    std::optional<ProtocolFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return ProtocolFailure::InvalidInput(
                compat::format("AES-256-GCM key must be {} bytes, got {}",
                    Constants::AES_KEY_SIZE, key.size()));
        }
        if (nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
            return ProtocolFailure::InvalidInput(
                compat::format("AES-GCM nonce must be {} bytes, got {}",
                    Constants::AES_GCM_NONCE_SIZE, nonce.size()));
        }
        return std::nullopt;
    }
}
BytesResult AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto invalid = ValidateKeyAndNonce(key, nonce)) {
        return BytesResult::Err(std::move(*invalid));
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return OpenSslFailure("Failed to create cipher context");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return OpenSslFailure("Failed to initialize AES-256-GCM");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return OpenSslFailure("Failed to set nonce length");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return OpenSslFailure("Failed to set key and nonce");
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return OpenSslFailure("Failed to add associated data");
        }
    }
    std::vector<uint8_t> output(plaintext.size() + Constants::AES_GCM_TAG_SIZE);
    int ciphertext_len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                          plaintext.data(),
                          static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return OpenSslFailure("Encryption failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return OpenSslFailure("Encryption finalization failed");
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                           Constants::AES_GCM_TAG_SIZE,
                           output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return OpenSslFailure("Failed to get authentication tag");
    }
    output.resize(ciphertext_len + Constants::AES_GCM_TAG_SIZE);
    return BytesResult::Ok(std::move(output));
}
BytesResult AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto invalid = ValidateKeyAndNonce(key, nonce)) {
        return BytesResult::Err(std::move(*invalid));
    }
    if (ciphertext_with_tag.size() < Constants::AES_GCM_TAG_SIZE) {
        return BytesResult::Err(
            ProtocolFailure::Decode(
                compat::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                    ciphertext_with_tag.size(), Constants::AES_GCM_TAG_SIZE)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - Constants::AES_GCM_TAG_SIZE;
    std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::vector<uint8_t> tag(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(ciphertext_len),
                             ciphertext_with_tag.end());
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return OpenSslFailure("Failed to create cipher context");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return OpenSslFailure("Failed to initialize AES-256-GCM");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return OpenSslFailure("Failed to set nonce length");
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return OpenSslFailure("Failed to set key and nonce");
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return OpenSslFailure("Failed to add associated data");
        }
    }
    // One spare byte keeps data() valid for an empty ciphertext.
    std::vector<uint8_t> output(ciphertext_len + 1);
    int plaintext_len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                          ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return OpenSslFailure("Decryption failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                           Constants::AES_GCM_TAG_SIZE,
                           tag.data()) != OpenSSL::SUCCESS) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return OpenSslFailure("Failed to set authentication tag");
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return BytesResult::Err(
            ProtocolFailure::Decode(
                "Authentication tag verification failed - data may have been tampered with"));
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return BytesResult::Ok(std::move(output));
}
}
