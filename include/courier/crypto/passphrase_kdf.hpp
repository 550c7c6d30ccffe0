#pragma once

#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include "courier/crypto/sodium_secure_memory_handle.hpp"

#include <cstdint>
#include <span>
#include <string_view>

namespace courier::protocol::crypto {

struct ScryptParameters {
    uint64_t n;
    uint32_t r;
    uint32_t p;
    size_t key_length;
};

/**
 * @brief scrypt passphrase stretching (libsodium scryptsalsa208sha256)
 *
 * The derived key never leaves secure memory.
 */
class PassphraseKdf {
public:
    static Result<SecureMemoryHandle, StorageFailure> DeriveKey(
        std::string_view passphrase,
        std::span<const uint8_t> salt,
        const ScryptParameters& params);

private:
    PassphraseKdf() = delete;
};

}
