#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include "courier/identity/material_store.hpp"
#include "courier/interfaces/i_protocol_cipher.hpp"
#include "wire/relay.pb.h"

namespace courier::protocol {

/**
 * @brief Publishable bundles and session establishment against them
 */
class BundleProtocol {
public:
    /**
     * @brief Snapshot of the latest signed, one-time and Kyber prekeys
     *
     * Each category reports the id most recently allocated by its counter.
     *
     * @return Err(InvalidState) without a local identity,
     *         Err(MaterialNotFound) when a referenced prekey is missing
     */
    [[nodiscard]] static Result<proto::wire::Bundle, ProtocolFailure> ExportBundle(
        identity::MaterialStore& store);

    /**
     * @brief Establish a session with the bundle owner's (id, deviceId)
     *
     * An existing session is kept as is; presence is not a freshness check.
     */
    [[nodiscard]] static Result<Unit, ProtocolFailure> InitSession(
        identity::MaterialStore& store,
        interfaces::IProtocolCipher& cipher,
        const proto::wire::Bundle& bundle);

    /// True when `store` holds a session with (peer_id, device_id).
    [[nodiscard]] static Result<bool, ProtocolFailure> HasSession(
        identity::MaterialStore& store,
        std::string_view peer_id,
        uint32_t device_id);

private:
    BundleProtocol() = delete;
};

}
