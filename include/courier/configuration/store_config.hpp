#pragma once

#include "courier/core/constants.hpp"
#include <cstddef>
#include <cstdint>

namespace courier::protocol::configuration {

/// What happens to a one-time prekey once a session consumed it
enum class OneTimePreKeyPolicy : uint8_t {
    /// Keep `prekey:<id>` and write a `prekey:used:<id>` marker
    MarkUsed = 0,

    /// Erase `prekey:<id>`
    Delete = 1
};

/// Settings for one local material store
///
/// Scrypt cost and salt length only apply when a store is created; an
/// existing store keeps the parameters persisted in its meta table.
///
/// @example
/// ```cpp
/// auto config = StoreConfig::StrictSingleUse();
/// auto store = RecordStore::Open(path, passphrase, config);
/// ```
class StoreConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    [[nodiscard]] static constexpr StoreConfig Default() noexcept {
        return StoreConfig(OneTimePreKeyPolicy::MarkUsed);
    }

    /// Consumed one-time prekeys are erased
    [[nodiscard]] static constexpr StoreConfig StrictSingleUse() noexcept {
        return StoreConfig(OneTimePreKeyPolicy::Delete);
    }

    // =========================================================================
    // Builders
    // =========================================================================

    /// Lower scrypt cost, for tests that open many stores
    [[nodiscard]] constexpr StoreConfig WithScryptCost(const uint64_t n, const uint32_t r, const uint32_t p) const noexcept {
        StoreConfig copy = *this;
        copy.scrypt_n = n;
        copy.scrypt_r = r;
        copy.scrypt_p = p;
        return copy;
    }

    [[nodiscard]] constexpr StoreConfig WithDeviceId(const uint32_t device_id) const noexcept {
        StoreConfig copy = *this;
        copy.default_device_id = device_id;
        return copy;
    }

    uint64_t scrypt_n = ScryptConstants::DEFAULT_N;
    uint32_t scrypt_r = ScryptConstants::DEFAULT_R;
    uint32_t scrypt_p = ScryptConstants::DEFAULT_P;
    size_t key_length = ScryptConstants::KEY_LENGTH;
    size_t salt_length = ScryptConstants::SALT_LENGTH;
    uint32_t default_device_id = Constants::DEFAULT_DEVICE_ID;
    OneTimePreKeyPolicy one_time_pre_key_policy = OneTimePreKeyPolicy::MarkUsed;

private:
    explicit constexpr StoreConfig(const OneTimePreKeyPolicy policy) noexcept
        : one_time_pre_key_policy(policy) {}
};

}
