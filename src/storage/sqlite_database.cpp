#include "courier/storage/sqlite_database.hpp"
#include "courier/core/format.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <system_error>

namespace courier::protocol::storage {

namespace {
    constexpr std::string_view kMemoryPath = ":memory:";
}

// ============================================================================
// SqliteStatement
// ============================================================================

SqliteStatement::~SqliteStatement() {
    if (stmt_ != nullptr) {
        sqlite3_finalize(stmt_);
    }
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
}

SqliteStatement& SqliteStatement::operator=(SqliteStatement&& other) noexcept {
    if (this != &other) {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = other.stmt_;
        other.db_ = nullptr;
        other.stmt_ = nullptr;
    }
    return *this;
}

Result<Unit, StorageFailure> SqliteStatement::CheckBind(const int rc, const int index) const {
    if (rc != SQLITE_OK) {
        return Result<Unit, StorageFailure>::Err(
            StorageFailure::Sql(compat::format("bind parameter {} failed: {}",
                index, sqlite3_errmsg(db_))));
    }
    return Result<Unit, StorageFailure>::Ok(unit);
}

Result<Unit, StorageFailure> SqliteStatement::BindText(const int index, std::string_view value) {
    return CheckBind(sqlite3_bind_text(stmt_, index, value.data(),
                                       static_cast<int>(value.size()), SQLITE_TRANSIENT), index);
}

Result<Unit, StorageFailure> SqliteStatement::BindBlob(const int index, std::span<const uint8_t> value) {
    // A zero-length blob still needs a non-null pointer or SQLite stores NULL.
    static constexpr uint8_t kEmpty = 0;
    const void* data = value.empty() ? static_cast<const void*>(&kEmpty) : value.data();
    return CheckBind(sqlite3_bind_blob(stmt_, index, data,
                                       static_cast<int>(value.size()), SQLITE_TRANSIENT), index);
}

Result<Unit, StorageFailure> SqliteStatement::BindInt64(const int index, const int64_t value) {
    return CheckBind(sqlite3_bind_int64(stmt_, index, value), index);
}

Result<bool, StorageFailure> SqliteStatement::Step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return Result<bool, StorageFailure>::Ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, StorageFailure>::Ok(false);
    }
    return Result<bool, StorageFailure>::Err(
        StorageFailure::Sql(compat::format("step failed: {}", sqlite3_errmsg(db_))));
}

Result<Unit, StorageFailure> SqliteStatement::Run() {
    auto step = Step();
    if (step.IsErr()) {
        return Result<Unit, StorageFailure>::Err(step.UnwrapErr());
    }
    return Result<Unit, StorageFailure>::Ok(unit);
}

std::string SqliteStatement::ColumnText(const int column) const {
    const auto* text = sqlite3_column_text(stmt_, column);
    const int len = sqlite3_column_bytes(stmt_, column);
    if (text == nullptr) {
        return {};
    }
    return {reinterpret_cast<const char*>(text), static_cast<size_t>(len)};
}

std::vector<uint8_t> SqliteStatement::ColumnBlob(const int column) const {
    const auto* blob = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, column));
    const int len = sqlite3_column_bytes(stmt_, column);
    if (blob == nullptr || len <= 0) {
        return {};
    }
    return {blob, blob + len};
}

int64_t SqliteStatement::ColumnInt64(const int column) const {
    return sqlite3_column_int64(stmt_, column);
}

// ============================================================================
// SqliteDatabase
// ============================================================================

Result<std::unique_ptr<SqliteDatabase>, StorageFailure> SqliteDatabase::Open(const std::string& path) {
    using OpenResult = Result<std::unique_ptr<SqliteDatabase>, StorageFailure>;

    if (path.empty()) {
        return OpenResult::Err(StorageFailure::Io("Database path cannot be empty"));
    }

    if (path != kMemoryPath) {
        const auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return OpenResult::Err(StorageFailure::Io(
                    compat::format("Failed to create directory {}: {}", parent.string(), ec.message())));
            }
        }
    }

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db != nullptr) {
            sqlite3_close(db);
        }
        return OpenResult::Err(StorageFailure::Io(
            compat::format("Failed to open database {}: {}", path, message)));
    }

    return OpenResult::Ok(std::unique_ptr<SqliteDatabase>(new SqliteDatabase(db, path)));
}

SqliteDatabase::~SqliteDatabase() {
    Close();
}

void SqliteDatabase::Close() noexcept {
    if (db_ != nullptr) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

Result<Unit, StorageFailure> SqliteDatabase::Execute(std::string_view sql) {
    if (db_ == nullptr) {
        return Result<Unit, StorageFailure>::Err(StorageFailure::InvalidState("Database is closed"));
    }
    const std::string statement(sql);
    char* error = nullptr;
    if (sqlite3_exec(db_, statement.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error != nullptr ? error : sqlite3_errmsg(db_);
        sqlite3_free(error);
        return Result<Unit, StorageFailure>::Err(StorageFailure::Sql(message));
    }
    return Result<Unit, StorageFailure>::Ok(unit);
}

Result<SqliteStatement, StorageFailure> SqliteDatabase::Prepare(std::string_view sql) {
    if (db_ == nullptr) {
        return Result<SqliteStatement, StorageFailure>::Err(
            StorageFailure::InvalidState("Database is closed"));
    }
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr) != SQLITE_OK) {
        return Result<SqliteStatement, StorageFailure>::Err(
            StorageFailure::Sql(compat::format("prepare failed: {}", sqlite3_errmsg(db_))));
    }
    return Result<SqliteStatement, StorageFailure>::Ok(SqliteStatement(db_, stmt));
}

}
