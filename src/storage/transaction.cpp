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
 * @file transaction.cpp
 * @brief RAII write transaction: exclusive lock + BEGIN IMMEDIATE.
 */

#include "proddb/storage/transaction.hpp"

#include "proddb/infra/error.hpp"
#include "proddb/infra/logger.hpp"
#include "proddb/storage/db.hpp"

#include <cstdio>
#include <string>

namespace proddb::storage {

Transaction::Transaction(Db& db) : db_(db)
{
    if (db_.in_transaction()) {
        throw infra::StorageError(0, "Nested transactions are not supported");
    }

    lock_ = std::unique_lock<std::shared_mutex>(db_.rw_lock_);
    db_.writer_.store(std::this_thread::get_id());

    try {
        db_.storage_.exec("BEGIN IMMEDIATE");
    } catch (...) {
        db_.writer_.store(std::thread::id());
        throw;
    }
    active_ = true;
    infra::Logger::log(infra::LogLevel::TRACE, "Store: BEGIN IMMEDIATE");
}

Transaction::~Transaction()
{
    if (!active_) {
        return;
    }
    try {
        infra::Logger::log(infra::LogLevel::WARN, "Store: Transaction auto-rollback");
        abort();
    } catch (const std::exception& e) {
        // Only logging can get here; the lock is already released.
        std::fprintf(stderr, "Store: auto-rollback logging failed: %s\n", e.what());
    }
}

void Transaction::commit()
{
    if (!active_) {
        throw infra::StorageError(0, "Transaction is not active");
    }
    try {
        db_.storage_.exec("COMMIT");
    } catch (const infra::StorageError&) {
        abort();
        throw;
    }
    release();
    infra::Logger::log(infra::LogLevel::TRACE, "Store: COMMIT");
}

void Transaction::rollback()
{
    if (!active_) {
        return;
    }
    // Release the lock even if ROLLBACK itself fails.
    struct Releaser {
        Transaction& tx;
        ~Releaser() { tx.release(); }
    } releaser{*this};

    db_.storage_.exec("ROLLBACK");
    infra::Logger::log(infra::LogLevel::DEBUG, "Store: ROLLBACK");
}

bool Transaction::abort()
{
    try {
        rollback();
        return true;
    } catch (const infra::StorageError& e) {
        // rollback() has released the lock; the caller's error takes precedence.
        infra::Logger::log(infra::LogLevel::ERROR,
                           std::string("Store: ROLLBACK failed: ") + e.what());
        return false;
    }
}

void Transaction::release()
{
    active_ = false;
    db_.writer_.store(std::thread::id());
    if (lock_.owns_lock()) {
        lock_.unlock();
    }
}

} // namespace proddb::storage
