#include "courier/relay/relay_database.hpp"
#include <spdlog/spdlog.h>

namespace courier::relay {

using protocol::storage::SqliteDatabase;
using protocol::storage::SqliteStatement;

namespace {
    constexpr std::string_view kSchema =
        "CREATE TABLE IF NOT EXISTS users ("
        "id TEXT PRIMARY KEY, created_at INTEGER NOT NULL);"
        "CREATE TABLE IF NOT EXISTS prekeys ("
        "id TEXT PRIMARY KEY, bundle_json TEXT NOT NULL, updated_at INTEGER NOT NULL);"
        "CREATE TABLE IF NOT EXISTS messages ("
        "id TEXT PRIMARY KEY, to_id TEXT NOT NULL, from_id TEXT NOT NULL, "
        "envelope_json TEXT NOT NULL, created_at INTEGER NOT NULL, "
        "delivered INTEGER NOT NULL DEFAULT 0);"
        "CREATE INDEX IF NOT EXISTS idx_messages_to_delivered ON messages (to_id, delivered);";

    constexpr std::string_view kMessageColumns =
        "SELECT id, to_id, from_id, envelope_json, created_at, delivered FROM messages ";

    QueueEntry ReadEntry(const SqliteStatement& stmt) {
        QueueEntry entry;
        entry.id = stmt.ColumnText(0);
        entry.to_id = stmt.ColumnText(1);
        entry.from_id = stmt.ColumnText(2);
        entry.envelope_json = stmt.ColumnText(3);
        entry.created_at = stmt.ColumnInt64(4);
        entry.delivered = stmt.ColumnInt64(5) != 0;
        return entry;
    }

    StorageFailure Closed() {
        return StorageFailure::InvalidState("Relay database is closed");
    }
}

RelayDatabase::RelayDatabase(std::unique_ptr<SqliteDatabase> db, std::string path)
    : db_(std::move(db))
    , path_(std::move(path)) {
}

Result<std::unique_ptr<RelayDatabase>, StorageFailure> RelayDatabase::Open(const std::string& path) {
    using OpenResult = Result<std::unique_ptr<RelayDatabase>, StorageFailure>;
    auto db = SqliteDatabase::Open(path);
    if (db.IsErr()) {
        return OpenResult::Err(db.UnwrapErr());
    }
    auto& handle = *db.Unwrap();
    if (path != ":memory:") {
        if (auto wal = handle.Execute("PRAGMA journal_mode=WAL"); wal.IsErr()) {
            return OpenResult::Err(wal.UnwrapErr());
        }
    }
    if (auto schema = handle.Execute(kSchema); schema.IsErr()) {
        return OpenResult::Err(schema.UnwrapErr());
    }
    spdlog::debug("Relay database ready at {}", path);
    return OpenResult::Ok(std::unique_ptr<RelayDatabase>(new RelayDatabase(std::move(db).Unwrap(), path)));
}

void RelayDatabase::Close() noexcept {
    std::lock_guard lock(mutex_);
    db_.reset();
}

// ============================================================================
// Users and bundles
// ============================================================================

Result<Unit, StorageFailure> RelayDatabase::InsertUser(std::string_view id, const int64_t created_at) {
    std::lock_guard lock(mutex_);
    if (!db_) {
        return Result<Unit, StorageFailure>::Err(Closed());
    }
    auto stmt = db_->Prepare("INSERT OR IGNORE INTO users (id, created_at) VALUES (?1, ?2)");
    if (stmt.IsErr()) {
        return Result<Unit, StorageFailure>::Err(stmt.UnwrapErr());
    }
    COURIER_TRY_UNIT(stmt.Unwrap().BindText(1, id));
    COURIER_TRY_UNIT(stmt.Unwrap().BindInt64(2, created_at));
    return stmt.Unwrap().Run();
}

Result<bool, StorageFailure> RelayDatabase::UserExists(std::string_view id) {
    std::lock_guard lock(mutex_);
    if (!db_) {
        return Result<bool, StorageFailure>::Err(Closed());
    }
    auto stmt = db_->Prepare("SELECT 1 FROM users WHERE id = ?1");
    if (stmt.IsErr()) {
        return Result<bool, StorageFailure>::Err(stmt.UnwrapErr());
    }
    if (auto bound = stmt.Unwrap().BindText(1, id); bound.IsErr()) {
        return Result<bool, StorageFailure>::Err(bound.UnwrapErr());
    }
    return stmt.Unwrap().Step();
}

Result<Unit, StorageFailure> RelayDatabase::UpsertBundle(
    std::string_view id,
    std::string_view bundle_json,
    const int64_t updated_at) {
    std::lock_guard lock(mutex_);
    if (!db_) {
        return Result<Unit, StorageFailure>::Err(Closed());
    }
    auto stmt = db_->Prepare("INSERT OR REPLACE INTO prekeys (id, bundle_json, updated_at) VALUES (?1, ?2, ?3)");
    if (stmt.IsErr()) {
        return Result<Unit, StorageFailure>::Err(stmt.UnwrapErr());
    }
    COURIER_TRY_UNIT(stmt.Unwrap().BindText(1, id));
    COURIER_TRY_UNIT(stmt.Unwrap().BindText(2, bundle_json));
    COURIER_TRY_UNIT(stmt.Unwrap().BindInt64(3, updated_at));
    return stmt.Unwrap().Run();
}

Result<std::optional<std::string>, StorageFailure> RelayDatabase::GetBundle(std::string_view id) {
    using BundleResult = Result<std::optional<std::string>, StorageFailure>;
    std::lock_guard lock(mutex_);
    if (!db_) {
        return BundleResult::Err(Closed());
    }
    auto stmt = db_->Prepare("SELECT bundle_json FROM prekeys WHERE id = ?1");
    if (stmt.IsErr()) {
        return BundleResult::Err(stmt.UnwrapErr());
    }
    if (auto bound = stmt.Unwrap().BindText(1, id); bound.IsErr()) {
        return BundleResult::Err(bound.UnwrapErr());
    }
    auto row = stmt.Unwrap().Step();
    if (row.IsErr()) {
        return BundleResult::Err(row.UnwrapErr());
    }
    if (!row.Unwrap()) {
        return BundleResult::Ok(std::nullopt);
    }
    return BundleResult::Ok(stmt.Unwrap().ColumnText(0));
}

// ============================================================================
// Queue
// ============================================================================

Result<Unit, StorageFailure> RelayDatabase::InsertMessage(const QueueEntry& entry) {
    std::lock_guard lock(mutex_);
    if (!db_) {
        return Result<Unit, StorageFailure>::Err(Closed());
    }
    auto stmt = db_->Prepare(
        "INSERT INTO messages (id, to_id, from_id, envelope_json, created_at, delivered) "
        "VALUES (?1, ?2, ?3, ?4, ?5, 0)");
    if (stmt.IsErr()) {
        return Result<Unit, StorageFailure>::Err(stmt.UnwrapErr());
    }
    auto& insert = stmt.Unwrap();
    COURIER_TRY_UNIT(insert.BindText(1, entry.id));
    COURIER_TRY_UNIT(insert.BindText(2, entry.to_id));
    COURIER_TRY_UNIT(insert.BindText(3, entry.from_id));
    COURIER_TRY_UNIT(insert.BindText(4, entry.envelope_json));
    COURIER_TRY_UNIT(insert.BindInt64(5, entry.created_at));
    return insert.Run();
}

Result<std::vector<QueueEntry>, StorageFailure> RelayDatabase::PendingFor(std::string_view to_id) {
    using PendingResult = Result<std::vector<QueueEntry>, StorageFailure>;
    std::lock_guard lock(mutex_);
    if (!db_) {
        return PendingResult::Err(Closed());
    }
    auto stmt = db_->Prepare(std::string(kMessageColumns) +
        "WHERE to_id = ?1 AND delivered = 0 ORDER BY created_at ASC, rowid ASC");
    if (stmt.IsErr()) {
        return PendingResult::Err(stmt.UnwrapErr());
    }
    auto& select = stmt.Unwrap();
    if (auto bound = select.BindText(1, to_id); bound.IsErr()) {
        return PendingResult::Err(bound.UnwrapErr());
    }
    std::vector<QueueEntry> entries;
    while (true) {
        auto row = select.Step();
        if (row.IsErr()) {
            return PendingResult::Err(row.UnwrapErr());
        }
        if (!row.Unwrap()) {
            break;
        }
        entries.push_back(ReadEntry(select));
    }
    return PendingResult::Ok(std::move(entries));
}

Result<Unit, StorageFailure> RelayDatabase::MarkDelivered(std::string_view id) {
    std::lock_guard lock(mutex_);
    if (!db_) {
        return Result<Unit, StorageFailure>::Err(Closed());
    }
    auto stmt = db_->Prepare("UPDATE messages SET delivered = 1 WHERE id = ?1");
    if (stmt.IsErr()) {
        return Result<Unit, StorageFailure>::Err(stmt.UnwrapErr());
    }
    COURIER_TRY_UNIT(stmt.Unwrap().BindText(1, id));
    return stmt.Unwrap().Run();
}

Result<std::optional<QueueEntry>, StorageFailure> RelayDatabase::GetMessage(std::string_view id) {
    using EntryResult = Result<std::optional<QueueEntry>, StorageFailure>;
    std::lock_guard lock(mutex_);
    if (!db_) {
        return EntryResult::Err(Closed());
    }
    auto stmt = db_->Prepare(std::string(kMessageColumns) + "WHERE id = ?1");
    if (stmt.IsErr()) {
        return EntryResult::Err(stmt.UnwrapErr());
    }
    auto& select = stmt.Unwrap();
    if (auto bound = select.BindText(1, id); bound.IsErr()) {
        return EntryResult::Err(bound.UnwrapErr());
    }
    auto row = select.Step();
    if (row.IsErr()) {
        return EntryResult::Err(row.UnwrapErr());
    }
    if (!row.Unwrap()) {
        return EntryResult::Ok(std::nullopt);
    }
    return EntryResult::Ok(ReadEntry(select));
}

// ============================================================================
// Counts
// ============================================================================

Result<uint32_t, StorageFailure> RelayDatabase::Count(std::string_view sql) {
    std::lock_guard lock(mutex_);
    if (!db_) {
        return Result<uint32_t, StorageFailure>::Err(Closed());
    }
    auto stmt = db_->Prepare(sql);
    if (stmt.IsErr()) {
        return Result<uint32_t, StorageFailure>::Err(stmt.UnwrapErr());
    }
    auto row = stmt.Unwrap().Step();
    if (row.IsErr()) {
        return Result<uint32_t, StorageFailure>::Err(row.UnwrapErr());
    }
    return Result<uint32_t, StorageFailure>::Ok(
        row.Unwrap() ? static_cast<uint32_t>(stmt.Unwrap().ColumnInt64(0)) : 0);
}

Result<uint32_t, StorageFailure> RelayDatabase::CountUsers() {
    return Count("SELECT COUNT(1) FROM users");
}

Result<uint32_t, StorageFailure> RelayDatabase::CountBundles() {
    return Count("SELECT COUNT(1) FROM prekeys");
}

Result<uint32_t, StorageFailure> RelayDatabase::CountQueued() {
    return Count("SELECT COUNT(1) FROM messages WHERE delivered = 0");
}

Result<uint32_t, StorageFailure> RelayDatabase::CountMessages() {
    return Count("SELECT COUNT(1) FROM messages");
}

Result<std::vector<std::pair<std::string, uint32_t>>, StorageFailure> RelayDatabase::QueueDepthByRecipient() {
    using DepthResult = Result<std::vector<std::pair<std::string, uint32_t>>, StorageFailure>;
    std::lock_guard lock(mutex_);
    if (!db_) {
        return DepthResult::Err(Closed());
    }
    auto stmt = db_->Prepare("SELECT to_id, COUNT(1) FROM messages WHERE delivered = 0 GROUP BY to_id");
    if (stmt.IsErr()) {
        return DepthResult::Err(stmt.UnwrapErr());
    }
    auto& select = stmt.Unwrap();
    std::vector<std::pair<std::string, uint32_t>> depths;
    while (true) {
        auto row = select.Step();
        if (row.IsErr()) {
            return DepthResult::Err(row.UnwrapErr());
        }
        if (!row.Unwrap()) {
            break;
        }
        depths.emplace_back(select.ColumnText(0), static_cast<uint32_t>(select.ColumnInt64(1)));
    }
    return DepthResult::Ok(std::move(depths));
}

}
