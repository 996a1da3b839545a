/// @file sqlite_connection.hpp
/// @brief RAII wrappers for SQLite connections and statements

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "store_error.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace lumen::store {

/// @brief Map a SQLite result code to a store error code
[[nodiscard]] StoreErrorCode sqliteToStoreErrorCode(int rc) noexcept;

class SqliteStatement {
public:
    SqliteStatement() = default;
    SqliteStatement(sqlite3* db, sqlite3_stmt* stmt) noexcept : db_(db), stmt_(stmt) {}
    ~SqliteStatement() { finalize(); }

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    SqliteStatement(SqliteStatement&& other) noexcept
        : db_(other.db_), stmt_(other.stmt_), bind_rc_(other.bind_rc_) {
        other.stmt_ = nullptr;
    }

    SqliteStatement& operator=(SqliteStatement&& other) noexcept {
        if (this != &other) {
            finalize();
            db_ = other.db_;
            stmt_ = other.stmt_;
            bind_rc_ = other.bind_rc_;
            other.stmt_ = nullptr;
        }
        return *this;
    }

    // Parameter indexes are 1-based. A failed bind is reported by the next step().
    SqliteStatement& bindText(int index, std::string_view value);
    SqliteStatement& bindInt64(int index, int64_t value);
    SqliteStatement& bindDouble(int index, double value);
    SqliteStatement& bindBlob(int index, std::span<const uint8_t> value);
    SqliteStatement& bindNull(int index);
    SqliteStatement& bindOptional(int index, std::optional<int64_t> value);

    /// @brief Advance the statement
    /// @return true if a row is available, false when done
    [[nodiscard]] StoreResult<bool> step(std::source_location location =
                                             std::source_location::current());

    /// @brief Step a statement that returns no rows
    [[nodiscard]] StoreResult<void> run(std::source_location location =
                                            std::source_location::current());

    /// @brief Reset for re-execution and clear bindings
    void reset();

    // Column indexes are 0-based
    [[nodiscard]] bool columnIsNull(int index) const;
    [[nodiscard]] int64_t columnInt64(int index) const;
    [[nodiscard]] std::optional<int64_t> columnOptionalInt64(int index) const;
    [[nodiscard]] double columnDouble(int index) const;
    [[nodiscard]] std::string columnText(int index) const;
    [[nodiscard]] std::vector<uint8_t> columnBlob(int index) const;

    [[nodiscard]] sqlite3_stmt* get() const noexcept { return stmt_; }

private:
    void finalize() noexcept;
    void noteBind(int rc) noexcept;

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
    int bind_rc_ = 0;
};

/// @brief How a connection opens its file
enum class OpenMode {
    ReadWrite,        // File must exist
    ReadWriteCreate,  // Created if absent
    ReadOnly,
};

struct ConnectionOptions {
    OpenMode mode = OpenMode::ReadWrite;
    int busy_timeout_ms = 5000;
    bool wal = true;  // Switch the file to WAL (ignored for read-only)
};

/// @brief One SQLite connection, closed on destruction
class SqliteConnection {
public:
    [[nodiscard]] static StoreResult<SqliteConnection> open(const std::filesystem::path& path,
                                                            const ConnectionOptions& options);

    ~SqliteConnection();

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;
    SqliteConnection(SqliteConnection&& other) noexcept;
    SqliteConnection& operator=(SqliteConnection&& other) noexcept;

    /// @brief Execute one or more statements without parameters
    [[nodiscard]] StoreResult<void> exec(std::string_view sql, std::source_location location =
                                                                   std::source_location::current());

    [[nodiscard]] StoreResult<SqliteStatement> prepare(std::string_view sql,
                                                       std::source_location location =
                                                           std::source_location::current());

    [[nodiscard]] StoreResult<void> beginImmediate();
    [[nodiscard]] StoreResult<void> commit();

    /// @brief Roll back the open transaction, if any; failures are logged
    void rollback() noexcept;

    [[nodiscard]] bool inTransaction() const noexcept;

    [[nodiscard]] StoreResult<int> userVersion();
    [[nodiscard]] StoreResult<void> setUserVersion(int version);

    [[nodiscard]] StoreResult<bool> tableExists(std::string_view table);

    /// @brief Column names of a table, in declaration order (empty if absent)
    [[nodiscard]] StoreResult<std::vector<std::string>> columns(std::string_view table);

    /// @brief Rows modified by the most recent statement
    [[nodiscard]] int64_t changes() const noexcept;

    /// @brief Build an error for a failed call, with SQLite's message appended
    [[nodiscard]] StoreError error(int rc, std::string_view context,
                                   std::source_location location =
                                       std::source_location::current()) const;

    [[nodiscard]] sqlite3* handle() const noexcept { return db_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    SqliteConnection(sqlite3* db, std::filesystem::path path) noexcept
        : db_(db), path_(std::move(path)) {}

    void close() noexcept;

    sqlite3* db_ = nullptr;
    std::filesystem::path path_;
};

}  // namespace lumen::store
