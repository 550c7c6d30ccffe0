#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include "courier/models/identity_key_pair.hpp"
#include "courier/models/protocol_address.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
namespace courier::protocol::interfaces {

enum class IdentityChange {
    NewOrUnchanged,
    ReplacedExisting
};

/**
 * Local identity and trust-on-first-use record of peer identities.
 *
 * Trust is reported, not enforced: SaveIdentity always stores the key.
 */
class IIdentityKeyStore {
public:
    virtual ~IIdentityKeyStore() = default;

    [[nodiscard]] virtual Result<models::IdentityKeyPair, ProtocolFailure> GetIdentityKeyPair() = 0;

    [[nodiscard]] virtual Result<uint32_t, ProtocolFailure> GetLocalRegistrationId() = 0;

    [[nodiscard]] virtual Result<IdentityChange, ProtocolFailure> SaveIdentity(
        const models::ProtocolAddress& address,
        std::span<const uint8_t> identity_key) = 0;

    /// True when no key is stored for `address` or the stored key matches.
    [[nodiscard]] virtual Result<bool, ProtocolFailure> IsTrustedIdentity(
        const models::ProtocolAddress& address,
        std::span<const uint8_t> identity_key) = 0;

    [[nodiscard]] virtual Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> GetIdentity(
        const models::ProtocolAddress& address) = 0;
};
}
