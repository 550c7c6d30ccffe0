#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include "courier/storage/sqlite_database.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace courier::relay {

using protocol::StorageFailure;
using protocol::Result;
using protocol::Unit;

/// One queued envelope. Only `delivered` ever changes after insertion.
struct QueueEntry {
    std::string id;
    std::string to_id;
    std::string from_id;
    std::string envelope_json;
    int64_t created_at = 0;
    bool delivered = false;
};

/**
 * @brief Registration, bundle and queue tables of the relay
 *
 * Every call holds the database mutex for its whole duration.
 */
class RelayDatabase {
public:
    /// Creates the parent directory, the tables and the queue index when absent.
    static Result<std::unique_ptr<RelayDatabase>, StorageFailure> Open(const std::string& path);

    RelayDatabase(const RelayDatabase&) = delete;
    RelayDatabase& operator=(const RelayDatabase&) = delete;

    // ========================================================================
    // Users and bundles
    // ========================================================================

    /// A second insert of the same id keeps the first row.
    Result<Unit, StorageFailure> InsertUser(std::string_view id, int64_t created_at);

    Result<bool, StorageFailure> UserExists(std::string_view id);

    /// Replaces any previous bundle of `id`.
    Result<Unit, StorageFailure> UpsertBundle(std::string_view id, std::string_view bundle_json, int64_t updated_at);

    Result<std::optional<std::string>, StorageFailure> GetBundle(std::string_view id);

    // ========================================================================
    // Queue
    // ========================================================================

    Result<Unit, StorageFailure> InsertMessage(const QueueEntry& entry);

    /// Undelivered entries of `to_id` ordered by created_at, then insertion order.
    Result<std::vector<QueueEntry>, StorageFailure> PendingFor(std::string_view to_id);

    Result<Unit, StorageFailure> MarkDelivered(std::string_view id);

    Result<std::optional<QueueEntry>, StorageFailure> GetMessage(std::string_view id);

    // ========================================================================
    // Counts
    // ========================================================================

    Result<uint32_t, StorageFailure> CountUsers();
    Result<uint32_t, StorageFailure> CountBundles();
    Result<uint32_t, StorageFailure> CountQueued();
    Result<uint32_t, StorageFailure> CountMessages();

    /// (recipient, undelivered count) for every recipient with a pending entry
    Result<std::vector<std::pair<std::string, uint32_t>>, StorageFailure> QueueDepthByRecipient();

    [[nodiscard]] const std::string& Path() const noexcept { return path_; }

    void Close() noexcept;

private:
    RelayDatabase(std::unique_ptr<protocol::storage::SqliteDatabase> db, std::string path);

    Result<uint32_t, StorageFailure> Count(std::string_view sql);

    std::unique_ptr<protocol::storage::SqliteDatabase> db_;
    std::string path_;
    std::mutex mutex_;
};

}
