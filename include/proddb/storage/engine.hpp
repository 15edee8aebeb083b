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
 * @file engine.hpp
 * @brief Low-level persistence layer over a single SQLite database file.
 *
 * @details
 * The `Engine` owns the `sqlite3` connection and hands out RAII `Statement`
 * objects. Every non-success SQLite result code is converted into an
 * `infra::StorageError`; nothing in this layer reports failure through return
 * values.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace proddb::storage {

/**
 * @class Statement
 * @brief Move-only owner of a prepared statement.
 *
 * Bind indices are 1-based, column indices 0-based, following SQLite.
 */
class Statement {
  public:
    Statement(sqlite3* db, sqlite3_stmt* stmt);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const std::string& value);

    /// @brief Binds SQL NULL for `std::nullopt`.
    Statement& bind(int index, const std::optional<std::string>& value);

    /**
     * @brief Advances the cursor.
     * @return true if a row is available, false when the statement is done.
     * @throws infra::StorageError on any other result (constraint, I/O, busy).
     */
    bool step();

    /// @brief Executes a statement that returns no rows.
    void run();

    std::string text(int column) const;
    std::optional<std::string> optional_text(int column) const;
    int64_t int64(int column) const;

  private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

/**
 * @class Engine
 * @brief Owns the SQLite connection and the on-disk schema.
 */
class Engine {
  public:
    /**
     * @param path Database file. `":memory:"` opens a private in-memory store.
     */
    explicit Engine(std::string path);

    /// @brief Closes the connection.
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * @brief Opens the file and bootstraps the schema.
     *
     * Enables `foreign_keys`, installs a busy timeout so a second process waits
     * for the writer lock instead of failing at once, and runs the idempotent
     * `CREATE ... IF NOT EXISTS` script.
     *
     * @throws infra::StorageError if the file cannot be opened or the DDL fails.
     */
    void init();

    /// @brief Runs one or more SQL statements without results.
    void exec(const std::string& sql);

    /// @brief Compiles a single statement.
    Statement prepare(const std::string& sql);

    /// @brief Number of rows changed by the most recent statement.
    int changes() const;

    const std::string& path() const { return path_; }

  private:
    std::string path_;
    sqlite3* db_ = nullptr;
};

} // namespace proddb::storage
