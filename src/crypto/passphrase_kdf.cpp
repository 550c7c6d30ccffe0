#include "courier/crypto/passphrase_kdf.hpp"
#include "courier/crypto/sodium_interop.hpp"

#include <sodium.h>
#include <string>
#include <vector>

namespace courier::protocol::crypto {

Result<SecureMemoryHandle, StorageFailure> PassphraseKdf::DeriveKey(
    std::string_view passphrase,
    std::span<const uint8_t> salt,
    const ScryptParameters& params) {

    if (salt.empty()) {
        return Result<SecureMemoryHandle, StorageFailure>::Err(
            StorageFailure::InvalidState("scrypt salt cannot be empty"));
    }
    if (params.key_length == 0) {
        return Result<SecureMemoryHandle, StorageFailure>::Err(
            StorageFailure::InvalidState("scrypt key length cannot be zero"));
    }

    auto handle_result = SecureMemoryHandle::Allocate(params.key_length);
    if (handle_result.IsErr()) {
        return Result<SecureMemoryHandle, StorageFailure>::Err(
            StorageFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    auto handle = std::move(handle_result).Unwrap();

    std::vector<uint8_t> derived(params.key_length);
    const int rc = crypto_pwhash_scryptsalsa208sha256_ll(
        reinterpret_cast<const uint8_t*>(passphrase.data()), passphrase.size(),
        salt.data(), salt.size(),
        params.n, params.r, params.p,
        derived.data(), derived.size());
    if (rc != SodiumConstants::SUCCESS) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(derived));
        return Result<SecureMemoryHandle, StorageFailure>::Err(
            StorageFailure::InvalidState(
                "scrypt key derivation failed (N=" + std::to_string(params.n) +
                ", r=" + std::to_string(params.r) + ", p=" + std::to_string(params.p) + ")"));
    }

    auto write_result = handle.Write(derived);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(derived));
    if (write_result.IsErr()) {
        return Result<SecureMemoryHandle, StorageFailure>::Err(
            StorageFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }
    return Result<SecureMemoryHandle, StorageFailure>::Ok(std::move(handle));
}

}
