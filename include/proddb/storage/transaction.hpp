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
 * @file transaction.hpp
 * @brief RAII write transaction over a `Db`.
 *
 * @details
 * Construction takes the in-process writer lock and issues `BEGIN IMMEDIATE`,
 * which also takes SQLite's file-level reserved lock so other processes cannot
 * interleave a write. If the object is destroyed without `commit()` the
 * transaction is rolled back, so any exception escaping an operation leaves the
 * store unchanged.
 *
 * @code
 * storage::Transaction tx(db);
 * db.insert_device(row);
 * tx.commit();
 * @endcode
 */

#pragma once

#include <mutex>
#include <shared_mutex>

namespace proddb::storage {

class Db;

class Transaction {
  public:
    /**
     * @throws infra::StorageError if the calling thread already holds a
     * transaction on `db` (nesting is not supported) or if `BEGIN` fails.
     */
    explicit Transaction(Db& db);

    /// @brief Rolls back if neither `commit()` nor `rollback()` ran.
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    /// @throws infra::StorageError if COMMIT fails; the transaction is then rolled back.
    void commit();

    void rollback();

    /**
     * @brief Rolls back without throwing a storage failure.
     *
     * A ROLLBACK that fails (for example because SQLite already ended the
     * transaction after a `RAISE(ROLLBACK)` trigger) is logged at ERROR. The
     * object is released either way, so callers can rethrow the error that
     * caused the abort.
     *
     * @return `false` if ROLLBACK reported an error.
     */
    bool abort();

    bool active() const { return active_; }

  private:
    void release();

    Db& db_;
    std::unique_lock<std::shared_mutex> lock_;
    bool active_ = false;
};

} // namespace proddb::storage
