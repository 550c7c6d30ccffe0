#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include "courier/configuration/store_config.hpp"
#include "courier/interfaces/i_protocol_cipher.hpp"
#include "courier/storage/record_store.hpp"
#include "courier/storage/store_adapters.hpp"
#include "storage/stored_value.pb.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace courier::protocol::identity {

/**
 * @brief Local identity and private key material of one identity owner
 *
 * Wraps an encrypted RecordStore and exposes the store adapters a
 * protocol cipher works against. Prekey counters assume a single writer
 * per store instance.
 */
class MaterialStore {
public:
    static Result<std::unique_ptr<MaterialStore>, StorageFailure> Open(
        const std::string& path,
        std::string_view passphrase,
        const configuration::StoreConfig& config = configuration::StoreConfig::Default());

    MaterialStore(const MaterialStore&) = delete;
    MaterialStore& operator=(const MaterialStore&) = delete;

    // ========================================================================
    // Identity
    // ========================================================================

    /// True once InitializeIdentity has persisted a local id and key pair.
    Result<bool, ProtocolFailure> HasIdentity();

    /**
     * @brief Create the local identity
     *
     * Draws a registration id uniformly from [1, 16380) and a fresh Ed25519
     * pair. Overwrites an existing identity; callers check HasIdentity().
     *
     * @param device_id Defaults to StoreConfig::default_device_id
     */
    Result<Unit, ProtocolFailure> InitializeIdentity(
        std::string_view local_id,
        std::optional<uint32_t> device_id = std::nullopt);

    Result<std::string, ProtocolFailure> GetLocalId();

    /// Stored device id, or the configured default when none is stored.
    Result<uint32_t, ProtocolFailure> GetDeviceId();

    Result<uint32_t, ProtocolFailure> GetRegistrationId();

    Result<models::IdentityKeyPair, ProtocolFailure> GetIdentityKeyPair();

    // ========================================================================
    // Prekeys
    // ========================================================================

    /**
     * @brief Allocate `count` one-time prekeys, one signed prekey and one
     * Kyber prekey, each under the next id of its counter
     */
    Result<Unit, ProtocolFailure> GeneratePreKeys(uint32_t count);

    /**
     * @brief Id most recently allocated from a prekey counter
     *
     * An untouched counter reports 1, so lookups of never-generated
     * material fail with MaterialNotFound for id 1.
     */
    Result<uint32_t, ProtocolFailure> LatestPreKeyId(std::string_view counter_key);

    // ========================================================================
    // Inbox
    // ========================================================================

    Result<Unit, ProtocolFailure> SaveInboxMessage(const proto::storage::InboxMessage& message);

    /// Sorted by timestamp ascending.
    Result<std::vector<proto::storage::InboxMessage>, ProtocolFailure> ListInboxMessages();

    // ========================================================================
    // Adapters
    // ========================================================================

    [[nodiscard]] interfaces::ProtocolStores& Stores() noexcept { return stores_; }

    [[nodiscard]] storage::RecordStore& Records() noexcept { return *records_; }

private:
    explicit MaterialStore(std::unique_ptr<storage::RecordStore> records);

    Result<uint32_t, ProtocolFailure> NextCounter(std::string_view counter_key);

    std::unique_ptr<storage::RecordStore> records_;
    storage::RecordIdentityKeyStore identity_store_;
    storage::RecordSessionStore session_store_;
    storage::RecordPreKeyStore pre_key_store_;
    storage::RecordSignedPreKeyStore signed_pre_key_store_;
    storage::RecordKyberPreKeyStore kyber_pre_key_store_;
    interfaces::ProtocolStores stores_;
};

}
