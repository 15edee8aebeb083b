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
 * @file db.cpp
 * @brief Implementation of the row-level store controller.
 */

#include "proddb/storage/db.hpp"

#include "proddb/infra/error.hpp"
#include "proddb/infra/logger.hpp"

namespace proddb::storage {

namespace {

constexpr const char* kDeviceTypeColumns =
    "SELECT ulid, part_number, manufacturer_name, model, descriptor, serial_number_spec "
    "FROM device_type";

DeviceType read_device_type(const Statement& st)
{
    DeviceType row;
    row.id = st.text(0);
    row.part_number = st.text(1);
    row.manufacturer_name = st.text(2);
    row.model = st.optional_text(3);
    row.descriptor = st.optional_text(4);
    row.serial_number_spec = st.optional_text(5);
    return row;
}

} // namespace

/**
 * @brief Opens the store and creates the schema if absent.
 */
Db::Db(std::string path) : storage_(std::move(path))
{
    infra::Logger::log(infra::LogLevel::DEBUG, "Store: Opening '" + storage_.path() + "'");
    storage_.init();
    infra::Logger::log(infra::LogLevel::INFO, "Store: Online (" + storage_.path() + ")");
}

Db::~Db()
{
    infra::Logger::log(infra::LogLevel::DEBUG, "Store: Closing '" + storage_.path() + "'");
}

// ============================================================================
//  Locking
// ============================================================================

/// @brief True when the calling thread owns the open write transaction.
bool Db::in_transaction() const
{
    return writer_.load() == std::this_thread::get_id();
}

/**
 * @brief Acquires the shared lock for a read.
 *
 * **Locking Strategy:**
 * - Readers on other threads share `rw_lock_` and wait while a writer holds it.
 * - The writer thread reads its own uncommitted rows through the same
 *   connection, so it gets an empty guard instead of deadlocking on the lock
 *   it already owns.
 */
std::shared_lock<std::shared_mutex> Db::read_guard() const
{
    // The writer thread already owns rw_lock_ exclusively.
    if (in_transaction()) {
        return std::shared_lock<std::shared_mutex>();
    }
    return std::shared_lock<std::shared_mutex>(rw_lock_);
}

/**
 * @brief Guards the write primitives.
 * @throws infra::StorageError if the caller has not opened a `Transaction`.
 */
void Db::require_writer(const char* operation) const
{
    if (!in_transaction()) {
        throw infra::StorageError(0, std::string(operation) + " requires an open transaction");
    }
}

/// @brief First column of the first row, or 0 for an empty result.
int64_t Db::scalar(const std::string& sql) const
{
    auto lock = read_guard();
    Statement st = storage_.prepare(sql);
    return st.step() ? st.int64(0) : 0;
}

// ============================================================================
//  Write primitives
// ============================================================================

/**
 * @brief Inserts a device type row.
 *
 * Must run inside a `Transaction`. The UNIQUE constraint on `part_number` is
 * the last line of defense; the service checks for duplicates first and
 * reports them as conflicts.
 */
void Db::insert_device_type(const DeviceType& row)
{
    require_writer("insert_device_type");
    storage_
        .prepare("INSERT INTO device_type "
                 "(ulid, part_number, manufacturer_name, model, descriptor, serial_number_spec) "
                 "VALUES (?, ?, ?, ?, ?, ?)")
        .bind(1, row.id)
        .bind(2, row.part_number)
        .bind(3, row.manufacturer_name)
        .bind(4, row.model)
        .bind(5, row.descriptor)
        .bind(6, row.serial_number_spec)
        .run();
}

void Db::insert_device_type_attribute(const DeviceTypeAttribute& row)
{
    require_writer("insert_device_type_attribute");
    storage_
        .prepare("INSERT INTO device_type_attribute "
                 "(ulid, device_type, attribute_name, multiplicity) VALUES (?, ?, ?, ?)")
        .bind(1, row.id)
        .bind(2, row.device_type)
        .bind(3, row.attribute_name)
        .bind(4, row.multiplicity)
        .run();
}

void Db::insert_device(const Device& row)
{
    require_writer("insert_device");
    storage_
        .prepare("INSERT INTO device (ulid, device_type, part_number, serial_number) "
                 "VALUES (?, ?, ?, ?)")
        .bind(1, row.id)
        .bind(2, row.device_type)
        .bind(3, row.part_number)
        .bind(4, row.serial_number)
        .run();
}

void Db::insert_device_attribute(const DeviceAttribute& row)
{
    require_writer("insert_device_attribute");
    storage_
        .prepare("INSERT INTO device_attribute "
                 "(ulid, device, attribute_type, attribute_name, value) VALUES (?, ?, ?, ?, ?)")
        .bind(1, row.id)
        .bind(2, row.device)
        .bind(3, row.attribute_type)
        .bind(4, row.attribute_name)
        .bind(5, row.value)
        .run();
}

void Db::insert_history(const HistoryEntry& row)
{
    require_writer("insert_history");
    storage_
        .prepare("INSERT INTO history_entry (ulid, entity_ulid, timestamp, operation, comment) "
                 "VALUES (?, ?, ?, ?, ?)")
        .bind(1, row.id)
        .bind(2, row.entity_id)
        .bind(3, row.timestamp)
        .bind(4, row.operation)
        .bind(5, row.comment)
        .run();
}

/**
 * @brief Deletes a device type and, by cascade, its attribute definitions.
 *
 * @return `false` if no row had that id.
 * @throws infra::StorageError (foreign key) while devices still reference it.
 */
bool Db::remove_device_type(const std::string& id)
{
    require_writer("remove_device_type");
    storage_.prepare("DELETE FROM device_type WHERE ulid = ?").bind(1, id).run();
    return storage_.changes() > 0;
}

/// @return `false` if no row had that id. Device attributes go with it.
bool Db::remove_device(const std::string& id)
{
    require_writer("remove_device");
    storage_.prepare("DELETE FROM device WHERE ulid = ?").bind(1, id).run();
    return storage_.changes() > 0;
}

// ============================================================================
//  Read primitives
// ============================================================================

/// @brief Exact lookup on the unique part number.
std::optional<DeviceType> Db::device_type_by_part(const std::string& part_number) const
{
    auto lock = read_guard();
    Statement st = storage_.prepare(std::string(kDeviceTypeColumns) + " WHERE part_number = ?");
    st.bind(1, part_number);
    if (!st.step()) {
        return std::nullopt;
    }
    return read_device_type(st);
}

std::optional<DeviceType> Db::device_type_by_id(const std::string& id) const
{
    auto lock = read_guard();
    Statement st = storage_.prepare(std::string(kDeviceTypeColumns) + " WHERE ulid = ?");
    st.bind(1, id);
    if (!st.step()) {
        return std::nullopt;
    }
    return read_device_type(st);
}

std::vector<DeviceType> Db::device_types() const
{
    auto lock = read_guard();
    Statement st = storage_.prepare(std::string(kDeviceTypeColumns) + " ORDER BY ulid");
    std::vector<DeviceType> rows;
    while (st.step()) {
        rows.push_back(read_device_type(st));
    }
    return rows;
}

std::vector<DeviceTypeAttribute> Db::device_type_attributes(const std::string& device_type) const
{
    auto lock = read_guard();
    Statement st = storage_.prepare("SELECT ulid, device_type, attribute_name, multiplicity "
                                    "FROM device_type_attribute WHERE device_type = ? "
                                    "ORDER BY attribute_name");
    st.bind(1, device_type);

    std::vector<DeviceTypeAttribute> rows;
    while (st.step()) {
        rows.push_back({st.text(0), st.text(1), st.text(2), st.text(3)});
    }
    return rows;
}

bool Db::device_type_attribute_exists(const std::string& device_type,
                                      const std::string& attribute_name) const
{
    auto lock = read_guard();
    Statement st = storage_.prepare("SELECT 1 FROM device_type_attribute "
                                    "WHERE device_type = ? AND attribute_name = ?");
    st.bind(1, device_type).bind(2, attribute_name);
    return st.step();
}

std::optional<Device> Db::device_by_id(const std::string& id) const
{
    auto lock = read_guard();
    Statement st = storage_.prepare(
        "SELECT ulid, device_type, part_number, serial_number FROM device WHERE ulid = ?");
    st.bind(1, id);
    if (!st.step()) {
        return std::nullopt;
    }
    return Device{st.text(0), st.text(1), st.text(2), st.text(3)};
}

bool Db::serial_exists(const std::string& serial) const
{
    auto lock = read_guard();
    Statement st = storage_.prepare("SELECT 1 FROM device WHERE serial_number = ?");
    st.bind(1, serial);
    return st.step();
}

/**
 * @brief Every serial stored for one device type, in no particular order.
 *
 * Feeds the serial allocator, which scans them for the highest conforming
 * number.
 */
std::vector<std::string> Db::serials_for_type(const std::string& device_type) const
{
    auto lock = read_guard();
    Statement st = storage_.prepare("SELECT serial_number FROM device WHERE device_type = ?");
    st.bind(1, device_type);

    std::vector<std::string> serials;
    while (st.step()) {
        serials.push_back(st.text(0));
    }
    return serials;
}

std::vector<DeviceAttribute> Db::device_attributes(const std::string& device) const
{
    auto lock = read_guard();
    Statement st = storage_.prepare("SELECT ulid, device, attribute_type, attribute_name, value "
                                    "FROM device_attribute WHERE device = ? ORDER BY ulid");
    st.bind(1, device);

    std::vector<DeviceAttribute> rows;
    while (st.step()) {
        rows.push_back({st.text(0), st.text(1), st.text(2), st.text(3), st.optional_text(4)});
    }
    return rows;
}

/**
 * @brief Searches devices joined with their type.
 *
 * **Query Strategy:**
 * 1. **Predicate Assembly**: Each non-empty filter field adds a case-sensitive
 *    substring test (`instr(column, ?) > 0`); all present fields must match.
 *    Using `instr` instead of `LIKE` keeps `%` and `_` literal.
 * 2. **Binding**: Values are bound as parameters in the order they were added,
 *    never spliced into the SQL text.
 * 3. **Ordering**: Results come back by device id, which is creation order
 *    since ids are ULIDs.
 *
 * An empty filter lists every device.
 */
std::vector<DeviceView> Db::find_devices(const DeviceFilter& filter) const
{
    std::string sql = "SELECT d.ulid, d.device_type, d.part_number, d.serial_number, "
                      "dt.model, dt.manufacturer_name "
                      "FROM device d JOIN device_type dt ON d.device_type = dt.ulid "
                      "WHERE 1=1";
    std::vector<std::string> params;

    auto add = [&](const std::optional<std::string>& needle, const char* column) {
        if (needle && !needle->empty()) {
            sql += std::string(" AND instr(") + column + ", ?) > 0";
            params.push_back(*needle);
        }
    };
    add(filter.manufacturer, "dt.manufacturer_name");
    add(filter.part_number, "d.part_number");
    add(filter.serial_number, "d.serial_number");
    add(filter.model, "dt.model");
    sql += " ORDER BY d.ulid";

    auto lock = read_guard();
    Statement st = storage_.prepare(sql);
    for (size_t i = 0; i < params.size(); ++i) {
        st.bind(static_cast<int>(i + 1), params[i]);
    }

    std::vector<DeviceView> rows;
    while (st.step()) {
        DeviceView view;
        view.id = st.text(0);
        view.device_type = st.text(1);
        view.part_number = st.text(2);
        view.serial_number = st.text(3);
        view.model = st.optional_text(4);
        view.manufacturer_name = st.text(5);
        rows.push_back(std::move(view));
    }

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Store: find_devices matched " + std::to_string(rows.size()) + " rows");
    return rows;
}

/// @brief History for one entity, oldest first.
std::vector<HistoryEntry> Db::history_for(const std::string& entity_id) const
{
    auto lock = read_guard();
    Statement st = storage_.prepare("SELECT ulid, entity_ulid, timestamp, operation, comment "
                                    "FROM history_entry WHERE entity_ulid = ? ORDER BY ulid");
    st.bind(1, entity_id);

    std::vector<HistoryEntry> rows;
    while (st.step()) {
        rows.push_back({st.text(0), st.text(1), st.text(2), st.text(3), st.text(4)});
    }
    return rows;
}

int64_t Db::count_device_types() const
{
    return scalar("SELECT COUNT(*) FROM device_type");
}

int64_t Db::count_devices() const
{
    return scalar("SELECT COUNT(*) FROM device");
}

int64_t Db::count_history() const
{
    return scalar("SELECT COUNT(*) FROM history_entry");
}

} // namespace proddb::storage
