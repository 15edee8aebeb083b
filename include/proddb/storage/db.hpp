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
 * @file db.hpp
 * @brief Row-level store controller for the proddb schema.
 *
 * @details
 * `Db` is the only component that speaks SQL. It exposes typed row primitives
 * and enforces the single-writer discipline:
 * - Write primitives may only run on the thread that holds the open
 *   `Transaction`; anything else is a `StorageError`.
 * - Read primitives take a shared lock, except on the writer thread, which
 *   already holds the exclusive lock and reads its own uncommitted rows.
 */

#pragma once

#include "proddb/storage/engine.hpp"
#include "proddb/storage/records.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace proddb::storage {

class Transaction;

/**
 * @class Db
 * @brief The store controller: schema bootstrap, locking and row access.
 */
class Db {
  public:
    /**
     * @brief Opens (or creates) the database file and bootstraps the schema.
     *
     * @param path Database file, or `":memory:"`.
     * @throws infra::StorageError if the file cannot be opened.
     */
    explicit Db(std::string path);

    ~Db();

    Db(const Db&) = delete;
    Db& operator=(const Db&) = delete;

    // ========================================================================
    //  WRITE PRIMITIVES (require an open Transaction on the calling thread)
    // ========================================================================

    void insert_device_type(const DeviceType& row);
    void insert_device_type_attribute(const DeviceTypeAttribute& row);
    void insert_device(const Device& row);
    void insert_device_attribute(const DeviceAttribute& row);
    void insert_history(const HistoryEntry& row);

    /**
     * @brief Deletes a device type; its attribute definitions cascade.
     *
     * @return true if a row was deleted.
     * @throws infra::StorageError (foreign key) while devices still reference it.
     */
    bool remove_device_type(const std::string& id);

    /// @brief Deletes a device; its attribute values cascade.
    bool remove_device(const std::string& id);

    // ========================================================================
    //  READ PRIMITIVES
    // ========================================================================

    std::optional<DeviceType> device_type_by_part(const std::string& part_number) const;
    std::optional<DeviceType> device_type_by_id(const std::string& id) const;
    std::vector<DeviceType> device_types() const;
    std::vector<DeviceTypeAttribute> device_type_attributes(const std::string& device_type) const;
    bool device_type_attribute_exists(const std::string& device_type,
                                      const std::string& attribute_name) const;

    std::optional<Device> device_by_id(const std::string& id) const;

    /// @brief True if any device, of any type, already uses `serial`.
    bool serial_exists(const std::string& serial) const;

    /// @brief All serial numbers of devices of the given type.
    std::vector<std::string> serials_for_type(const std::string& device_type) const;

    std::vector<DeviceAttribute> device_attributes(const std::string& device) const;

    /**
     * @brief Joins devices with their types and applies substring filters.
     *
     * Uses `instr()` rather than `LIKE` so matching is case-sensitive and
     * `%`/`_` in the needle are literal. Results are ordered by device id,
     * i.e. by creation time.
     */
    std::vector<DeviceView> find_devices(const DeviceFilter& filter) const;

    /// @brief History rows for one entity, oldest first.
    std::vector<HistoryEntry> history_for(const std::string& entity_id) const;

    int64_t count_device_types() const;
    int64_t count_devices() const;
    int64_t count_history() const;

    /// @brief True while the calling thread holds the open transaction.
    bool in_transaction() const;

    const std::string& path() const { return storage_.path(); }

  private:
    friend class Transaction;

    std::shared_lock<std::shared_mutex> read_guard() const;
    void require_writer(const char* operation) const;
    int64_t scalar(const std::string& sql) const;

    /// @brief The SQLite connection.
    mutable Engine storage_;

    /// @brief Writers hold it exclusively for a whole transaction; readers share it.
    mutable std::shared_mutex rw_lock_;

    /// @brief Thread currently holding the open transaction (default id if none).
    std::atomic<std::thread::id> writer_{};
};

} // namespace proddb::storage
