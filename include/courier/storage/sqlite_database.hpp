#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace courier::protocol::storage {

/**
 * @brief Prepared statement, finalized on destruction
 *
 * Bind indices are 1-based and column indices 0-based, as in the C API.
 */
class SqliteStatement {
public:
    SqliteStatement() noexcept = default;
    ~SqliteStatement();

    SqliteStatement(SqliteStatement&& other) noexcept;
    SqliteStatement& operator=(SqliteStatement&& other) noexcept;
    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    Result<Unit, StorageFailure> BindText(int index, std::string_view value);
    Result<Unit, StorageFailure> BindBlob(int index, std::span<const uint8_t> value);
    Result<Unit, StorageFailure> BindInt64(int index, int64_t value);

    /**
     * @brief Advance the statement
     *
     * @return Ok(true) when a row is available, Ok(false) when done
     */
    Result<bool, StorageFailure> Step();

    /**
     * @brief Step a statement that must not yield rows
     */
    Result<Unit, StorageFailure> Run();

    [[nodiscard]] std::string ColumnText(int column) const;
    [[nodiscard]] std::vector<uint8_t> ColumnBlob(int column) const;
    [[nodiscard]] int64_t ColumnInt64(int column) const;

private:
    friend class SqliteDatabase;
    SqliteStatement(sqlite3* db, sqlite3_stmt* stmt) noexcept : db_(db), stmt_(stmt) {}

    Result<Unit, StorageFailure> CheckBind(int rc, int index) const;

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Owning handle to one SQLite connection
 *
 * Not thread-safe; owners serialize access with their own mutex.
 */
class SqliteDatabase {
public:
    /**
     * @brief Open or create the database at `path`
     *
     * Missing parent directories are created. ":memory:" opens a private
     * in-memory database.
     */
    static Result<std::unique_ptr<SqliteDatabase>, StorageFailure> Open(const std::string& path);

    ~SqliteDatabase();

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    Result<Unit, StorageFailure> Execute(std::string_view sql);

    Result<SqliteStatement, StorageFailure> Prepare(std::string_view sql);

    [[nodiscard]] const std::string& Path() const noexcept { return path_; }

    [[nodiscard]] bool IsOpen() const noexcept { return db_ != nullptr; }

    void Close() noexcept;

private:
    SqliteDatabase(sqlite3* db, std::string path) noexcept : db_(db), path_(std::move(path)) {}

    sqlite3* db_;
    std::string path_;
};

}
