/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file engine.cpp
 * @brief Implementation of the SQLite persistence layer.
 *
 * @details
 * Text is always bound with `SQLITE_TRANSIENT` so SQLite takes its own copy;
 * callers may pass temporaries.
 */

#include "proddb/storage/engine.hpp"

#include "proddb/infra/error.hpp"
#include "proddb/infra/logger.hpp"
#include "proddb/storage/schema.hpp"

#include <sqlite3.h>

namespace proddb::storage {

namespace {

/// Busy timeout for a second process waiting on the writer lock.
constexpr int kBusyTimeoutMs = 5000;

[[noreturn]] void raise(sqlite3* db, int rc, const std::string& what)
{
    int code = db ? sqlite3_extended_errcode(db) : rc;
    std::string detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    throw infra::StorageError(code, what + ": " + detail);
}

} // namespace

// ============================================================================
//  Statement
// ============================================================================

Statement::Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}

/// @brief Finalizes the prepared statement unless it was moved out.
Statement::~Statement()
{
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : db_(other.db_), stmt_(other.stmt_)
{
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept
{
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

/**
 * @brief Binds a text parameter (1-based), copied by SQLite.
 * @throws infra::StorageError if the index is out of range.
 */
Statement& Statement::bind(int index, const std::string& value)
{
    int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        raise(db_, rc, "bind text #" + std::to_string(index));
    }
    return *this;
}

/// @brief Binds text, or SQL NULL when `value` is empty.
Statement& Statement::bind(int index, const std::optional<std::string>& value)
{
    if (value) {
        return bind(index, *value);
    }
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK) {
        raise(db_, rc, "bind null #" + std::to_string(index));
    }
    return *this;
}

/**
 * @brief Advances the cursor by one row.
 *
 * @return `true` while a row is available, `false` once the statement is done.
 * @throws infra::StorageError carrying the extended result code for any other
 * outcome (constraint violation, busy timeout, trigger abort).
 */
bool Statement::step()
{
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    raise(db_, rc, "step '" + std::string(sqlite3_sql(stmt_)) + "'");
}

/// @brief Steps to completion, discarding rows.
void Statement::run()
{
    while (step()) {
    }
}

/// @brief Column as text; NULL reads as the empty string.
std::string Statement::text(int column) const
{
    const unsigned char* raw = sqlite3_column_text(stmt_, column);
    if (!raw) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(raw),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::optional<std::string> Statement::optional_text(int column) const
{
    if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return text(column);
}

int64_t Statement::int64(int column) const
{
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
}

// ============================================================================
//  Engine
// ============================================================================

Engine::Engine(std::string path) : path_(std::move(path)) {}

/**
 * @brief Closes the connection.
 *
 * All `Statement` objects must be gone by now; `sqlite3_close` refuses to
 * close a connection with unfinalized statements.
 */
Engine::~Engine()
{
    if (db_) {
        sqlite3_close(db_);
    }
}

/**
 * @brief Opens (or creates) the database file and installs the schema.
 *
 * Operational Logic:
 * 1. **Open**: `sqlite3_open_v2` in read-write/create mode. A failed open still
 *    allocates a handle, which is closed before throwing.
 * 2. **Connection Settings**: Enables extended result codes and sets the busy
 *    timeout so a second process waits for the writer instead of failing.
 * 3. **Integrity**: Turns on foreign key enforcement (off by default in SQLite).
 * 4. **Schema**: Runs the idempotent `CREATE ... IF NOT EXISTS` script.
 *
 * @throws infra::StorageError if the file cannot be opened or the schema fails.
 */
void Engine::init()
{
    int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string detail = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw infra::StorageError(rc, "Cannot open '" + path_ + "': " + detail);
    }

    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, kBusyTimeoutMs);

    exec("PRAGMA foreign_keys = ON;");
    exec(kSchema);

    infra::Logger::log(infra::LogLevel::DEBUG, "Store: Schema ready in '" + path_ + "'");
}

/**
 * @brief Executes one or more statements with no parameters or results.
 *
 * Used for pragmas, the schema script and transaction control.
 */
void Engine::exec(const std::string& sql)
{
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw infra::StorageError(sqlite3_extended_errcode(db_), "exec failed: " + msg);
    }
}

/// @brief Compiles `sql` into a `Statement` bound to this connection.
Statement Engine::prepare(const std::string& sql)
{
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        raise(db_, rc, "prepare");
    }
    infra::Logger::log(infra::LogLevel::TRACE, "Store: " + sql);
    return Statement(db_, stmt);
}

/// @brief Rows touched by the most recent INSERT, UPDATE or DELETE.
int Engine::changes() const
{
    return sqlite3_changes(db_);
}

} // namespace proddb::storage
