/// @file sqlite_connection.cpp
/// @brief SQLite RAII wrappers implementation

#include "sqlite_connection.hpp"

#include <cstring>

#include <fmt/format.h>
#include <sqlite3.h>

#include "../util/logger.hpp"
#include "../util/string_utils.hpp"

namespace lumen::store {

namespace {

[[nodiscard]] StoreError make_error(sqlite3* db, int rc, std::string_view context,
                                    std::source_location location) {
    const char* detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    return StoreError(sqliteToStoreErrorCode(rc),
                      fmt::format("{}: {} (rc={})", context, detail ? detail : "", rc), location);
}

}  // namespace

StoreErrorCode sqliteToStoreErrorCode(int rc) noexcept {
    switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
        return StoreErrorCode::Busy;
    case SQLITE_NOTFOUND:
        return StoreErrorCode::NotFound;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
    case SQLITE_MISMATCH:
        return StoreErrorCode::Corrupt;
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL:
    case SQLITE_READONLY:
    case SQLITE_PERM:
        return StoreErrorCode::Io;
    default:
        return StoreErrorCode::Database;
    }
}

// ===== SqliteStatement =====

void SqliteStatement::finalize() noexcept {
    if (stmt_) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
    }
}

void SqliteStatement::noteBind(int rc) noexcept {
    if (rc != SQLITE_OK && bind_rc_ == SQLITE_OK) {
        bind_rc_ = rc;
    }
}

SqliteStatement& SqliteStatement::bindText(int index, std::string_view value) {
    noteBind(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT));
    return *this;
}

SqliteStatement& SqliteStatement::bindInt64(int index, int64_t value) {
    noteBind(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)));
    return *this;
}

SqliteStatement& SqliteStatement::bindDouble(int index, double value) {
    noteBind(sqlite3_bind_double(stmt_, index, value));
    return *this;
}

SqliteStatement& SqliteStatement::bindBlob(int index, std::span<const uint8_t> value) {
    if (value.empty()) {
        noteBind(sqlite3_bind_zeroblob(stmt_, index, 0));
    } else {
        noteBind(sqlite3_bind_blob64(stmt_, index, value.data(),
                                     static_cast<sqlite3_uint64>(value.size()), SQLITE_TRANSIENT));
    }
    return *this;
}

SqliteStatement& SqliteStatement::bindNull(int index) {
    noteBind(sqlite3_bind_null(stmt_, index));
    return *this;
}

SqliteStatement& SqliteStatement::bindOptional(int index, std::optional<int64_t> value) {
    return value ? bindInt64(index, *value) : bindNull(index);
}

StoreResult<bool> SqliteStatement::step(std::source_location location) {
    if (!stmt_) {
        return std::unexpected(StoreError(StoreErrorCode::Database, "step on empty statement",
                                          location));
    }
    if (bind_rc_ != SQLITE_OK) {
        return std::unexpected(make_error(db_, bind_rc_, "bind failed", location));
    }

    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    return std::unexpected(make_error(db_, rc, "step failed", location));
}

StoreResult<void> SqliteStatement::run(std::source_location location) {
    auto stepped = step(location);
    if (!stepped) {
        return std::unexpected(stepped.error());
    }
    return {};
}

void SqliteStatement::reset() {
    if (stmt_) {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }
    bind_rc_ = SQLITE_OK;
}

bool SqliteStatement::columnIsNull(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

int64_t SqliteStatement::columnInt64(int index) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, index));
}

std::optional<int64_t> SqliteStatement::columnOptionalInt64(int index) const {
    if (columnIsNull(index)) {
        return std::nullopt;
    }
    return columnInt64(index);
}

double SqliteStatement::columnDouble(int index) const {
    return sqlite3_column_double(stmt_, index);
}

std::string SqliteStatement::columnText(int index) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    if (!text) {
        return {};
    }
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, index)));
}

std::vector<uint8_t> SqliteStatement::columnBlob(int index) const {
    const void* blob = sqlite3_column_blob(stmt_, index);
    int size = sqlite3_column_bytes(stmt_, index);
    if (!blob || size <= 0) {
        return {};
    }
    std::vector<uint8_t> data(static_cast<size_t>(size));
    std::memcpy(data.data(), blob, data.size());
    return data;
}

// ===== SqliteConnection =====

StoreResult<SqliteConnection> SqliteConnection::open(const std::filesystem::path& path,
                                                     const ConnectionOptions& options) {
    int flags = SQLITE_OPEN_NOMUTEX;
    switch (options.mode) {
    case OpenMode::ReadWrite:
        flags |= SQLITE_OPEN_READWRITE;
        break;
    case OpenMode::ReadWriteCreate:
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
        break;
    case OpenMode::ReadOnly:
        flags |= SQLITE_OPEN_READONLY;
        break;
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(pathToUtf8(path).c_str(), &db, flags, nullptr);
    // The handle owns resources even when opening failed
    SqliteConnection connection(db, path);
    if (rc != SQLITE_OK) {
        return std::unexpected(make_error(db, rc, fmt::format("open '{}'", pathToUtf8(path)),
                                          std::source_location::current()));
    }

    sqlite3_extended_result_codes(db, 0);
    rc = sqlite3_busy_timeout(db, options.busy_timeout_ms);
    if (rc != SQLITE_OK) {
        return std::unexpected(connection.error(rc, "busy_timeout"));
    }

    if (options.wal && options.mode != OpenMode::ReadOnly) {
        LUMEN_TRY_VOID(connection.exec("PRAGMA journal_mode=WAL;"));
        LUMEN_TRY_VOID(connection.exec("PRAGMA synchronous=NORMAL;"));
    }
    return connection;
}

SqliteConnection::~SqliteConnection() {
    close();
}

SqliteConnection::SqliteConnection(SqliteConnection&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)) {
    other.db_ = nullptr;
}

SqliteConnection& SqliteConnection::operator=(SqliteConnection&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        other.db_ = nullptr;
    }
    return *this;
}

void SqliteConnection::close() noexcept {
    if (db_) {
        if (inTransaction()) {
            rollback();
        }
        // All statements are RAII-finalized before the connection goes away
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK) {
            LOG_WARN("sqlite3_close failed ({}), deferring", rc);
            sqlite3_close_v2(db_);
        }
        db_ = nullptr;
    }
}

StoreResult<void> SqliteConnection::exec(std::string_view sql, std::source_location location) {
    std::string statement(sql);
    char* message = nullptr;
    int rc = sqlite3_exec(db_, statement.c_str(), nullptr, nullptr, &message);
    if (rc != SQLITE_OK) {
        std::string detail = message ? message : sqlite3_errstr(rc);
        sqlite3_free(message);
        return std::unexpected(StoreError(sqliteToStoreErrorCode(rc),
                                          fmt::format("exec '{}': {} (rc={})", statement, detail,
                                                      rc),
                                          location));
    }
    return {};
}

StoreResult<SqliteStatement> SqliteConnection::prepare(std::string_view sql,
                                                       std::source_location location) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
        return std::unexpected(make_error(db_, rc, "prepare failed", location));
    }
    return SqliteStatement(db_, stmt);
}

StoreResult<void> SqliteConnection::beginImmediate() {
    return exec("BEGIN IMMEDIATE;");
}

StoreResult<void> SqliteConnection::commit() {
    return exec("COMMIT;");
}

void SqliteConnection::rollback() noexcept {
    if (!db_ || !inTransaction()) {
        return;
    }
    int rc = sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        LOG_WARN("ROLLBACK failed: {}", sqlite3_errmsg(db_));
    }
}

bool SqliteConnection::inTransaction() const noexcept {
    return db_ && sqlite3_get_autocommit(db_) == 0;
}

StoreResult<int> SqliteConnection::userVersion() {
    auto stmt = LUMEN_TRY(prepare("PRAGMA user_version;"));
    bool has_row = LUMEN_TRY(stmt.step());
    if (!has_row) {
        return 0;
    }
    return static_cast<int>(stmt.columnInt64(0));
}

StoreResult<void> SqliteConnection::setUserVersion(int version) {
    // PRAGMA arguments cannot be bound
    return exec(fmt::format("PRAGMA user_version = {};", version));
}

StoreResult<bool> SqliteConnection::tableExists(std::string_view table) {
    auto stmt =
        LUMEN_TRY(prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?1;"));
    stmt.bindText(1, table);
    return stmt.step();
}

StoreResult<std::vector<std::string>> SqliteConnection::columns(std::string_view table) {
    auto stmt = LUMEN_TRY(prepare("SELECT name FROM pragma_table_info(?1);"));
    stmt.bindText(1, table);

    std::vector<std::string> names;
    while (LUMEN_TRY(stmt.step())) {
        names.push_back(stmt.columnText(0));
    }
    return names;
}

int64_t SqliteConnection::changes() const noexcept {
    return db_ ? static_cast<int64_t>(sqlite3_changes64(db_)) : 0;
}

StoreError SqliteConnection::error(int rc, std::string_view context,
                                   std::source_location location) const {
    return make_error(db_, rc, context, location);
}

}  // namespace lumen::store
