#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include "courier/configuration/store_config.hpp"
#include "courier/crypto/sodium_secure_memory_handle.hpp"
#include "courier/storage/sqlite_database.hpp"
#include "storage/stored_value.pb.h"
#include <google/protobuf/message_lite.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace courier::protocol::storage {

/**
 * @brief Encrypted key/value table backing all local state
 *
 * Two SQLite tables: `meta` holds plaintext store metadata (KDF parameters,
 * local id, device id, registration id) and `kv` holds sealed values.
 *
 * Each value is a serialized proto::storage::StoredValue sealed with
 * AES-256-GCM under the passphrase-derived key. The stored blob is
 * nonce(12) || ciphertext || tag(16) and the record key is the associated
 * data, so a blob copied under another key fails to open.
 *
 * A wrong passphrase is not detected by Open. The first Get of an existing
 * record fails with StorageFailureType::TamperOrWrongPassphrase.
 */
class RecordStore {
public:
    static Result<std::unique_ptr<RecordStore>, StorageFailure> Open(
        const std::string& path,
        std::string_view passphrase,
        const configuration::StoreConfig& config = configuration::StoreConfig::Default());

    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    // ========================================================================
    // Sealed values
    // ========================================================================

    /**
     * @return Ok(nullopt) when `key` is absent
     */
    Result<std::optional<proto::storage::StoredValue>, StorageFailure> Get(std::string_view key);

    Result<Unit, StorageFailure> Set(std::string_view key, const proto::storage::StoredValue& value);

    /// Deleting an absent key succeeds.
    Result<Unit, StorageFailure> Delete(std::string_view key);

    /**
     * @brief Keys starting with `prefix`, in bytewise lexicographic order
     */
    Result<std::vector<std::string>, StorageFailure> ListKeysByPrefix(std::string_view prefix);

    Result<std::optional<std::vector<uint8_t>>, StorageFailure> GetBytes(std::string_view key);
    Result<Unit, StorageFailure> SetBytes(std::string_view key, std::span<const uint8_t> value);

    Result<std::optional<std::string>, StorageFailure> GetText(std::string_view key);
    Result<Unit, StorageFailure> SetText(std::string_view key, std::string_view value);

    Result<std::optional<int64_t>, StorageFailure> GetInteger(std::string_view key);
    Result<Unit, StorageFailure> SetInteger(std::string_view key, int64_t value);

    /**
     * @brief Parse a protobuf record kept in the bytes arm
     *
     * @return Ok(false) when `key` is absent
     */
    Result<bool, StorageFailure> GetMessage(std::string_view key, google::protobuf::MessageLite& message);
    Result<Unit, StorageFailure> SetMessage(std::string_view key, const google::protobuf::MessageLite& message);

    // ========================================================================
    // Plaintext metadata
    // ========================================================================

    Result<std::optional<std::string>, StorageFailure> GetMeta(std::string_view key);
    Result<Unit, StorageFailure> SetMeta(std::string_view key, std::string_view value);

    [[nodiscard]] const std::string& Path() const noexcept { return path_; }

    [[nodiscard]] const configuration::StoreConfig& Config() const noexcept { return config_; }

private:
    RecordStore(std::unique_ptr<SqliteDatabase> db,
                crypto::SecureMemoryHandle key,
                configuration::StoreConfig config);

    static Result<Unit, StorageFailure> CreateSchema(SqliteDatabase& db);

    static Result<proto::storage::KdfParameters, StorageFailure> LoadOrCreateKdfParameters(
        SqliteDatabase& db,
        const configuration::StoreConfig& config);

    Result<std::vector<uint8_t>, StorageFailure> Seal(
        std::string_view key,
        std::span<const uint8_t> plaintext) const;

    Result<std::vector<uint8_t>, StorageFailure> Unseal(
        std::string_view key,
        std::span<const uint8_t> blob) const;

    std::unique_ptr<SqliteDatabase> db_;
    crypto::SecureMemoryHandle key_;
    configuration::StoreConfig config_;
    std::string path_;
    mutable std::mutex mutex_;
};

}
