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
 * @file inventory_test.cpp
 * @brief Integration tests for the transactional inventory service.
 *
 * @details
 * Each test runs against a fresh database file and checks:
 * 1. Batch creation with consecutive serials.
 * 2. Conflict detection (part numbers, serials, attributes).
 * 3. All-or-nothing behaviour when a batch fails part-way.
 * 4. Completeness of the history trail.
 */

#include "proddb/core/history.hpp"
#include "proddb/core/inventory.hpp"
#include "proddb/infra/error.hpp"
#include "proddb/infra/id_generator.hpp"
#include "proddb/infra/time.hpp"
#include "proddb/storage/db.hpp"
#include "framework.hpp"
#include "temp_db.hpp"

#include <sqlite3.h>

#include <set>
#include <string>
#include <thread>
#include <vector>

using proddb::core::DeviceTypeSpec;
using proddb::core::InventoryService;
using proddb::core::SerialSource;
using proddb::infra::ConflictError;
using proddb::infra::NotFoundError;
using proddb::infra::StorageError;
using proddb::infra::ValidationError;

namespace {

/// Fresh store + generator + service for one test.
struct Fixture {
    proddb::test::TempDatabase tmp;
    proddb::infra::IdGenerator ids;
    proddb::storage::Db db{tmp.path};
    InventoryService service{db, ids};

    std::string add_type(const std::string& part, const std::string& spec,
                         const std::string& manufacturer = "Acme")
    {
        DeviceTypeSpec t;
        t.part_number = part;
        t.manufacturer_name = manufacturer;
        t.model = "Model-" + part;
        t.serial_number_spec = spec;
        return service.register_device_type(t);
    }
};

} // namespace

void test_register_device_type()
{
    Fixture f;
    std::string id = f.add_type("PN-1", "SN-{3}");
    ASSERT_TRUE(proddb::infra::IdGenerator::is_valid(id));

    auto stored = f.db.device_type_by_part("PN-1");
    ASSERT_TRUE(stored.has_value());
    ASSERT_EQ(stored->id, id);
    ASSERT_TRUE(stored->serial_number_spec == std::optional<std::string>("SN-{3}"));
    ASSERT_FALSE(stored->descriptor.has_value());
}

void test_register_validation()
{
    Fixture f;
    DeviceTypeSpec blank;
    blank.part_number = "  ";
    blank.manufacturer_name = "Acme";
    ASSERT_THROWS_CODE(f.service.register_device_type(blank), ValidationError, "MISSING_FIELD");

    DeviceTypeSpec bad_spec;
    bad_spec.part_number = "PN-1";
    bad_spec.manufacturer_name = "Acme";
    bad_spec.serial_number_spec = "SN-NOPLACEHOLDER";
    ASSERT_THROWS_CODE(f.service.register_device_type(bad_spec), ValidationError,
                       "MALFORMED_SPEC");
    ASSERT_EQ(f.db.count_device_types(), int64_t{0});
}

void test_duplicate_part_number()
{
    Fixture f;
    f.add_type("PN-1", "SN-{3}");
    ASSERT_THROWS_CODE(f.add_type("PN-1", "X-{2}", "Other"), ConflictError,
                       "DUPLICATE_PART_NUMBER");
    ASSERT_EQ(f.db.count_device_types(), int64_t{1});
    ASSERT_EQ(f.db.count_history(), int64_t{1});
}

/**
 * @brief A batch of three gets consecutive serials in creation order.
 */
void test_batch_create_consecutive_serials()
{
    Fixture f;
    f.add_type("PN-1", "P{2}");

    auto created = f.service.create_devices("PN-1", 3, SerialSource::next());
    ASSERT_EQ(created.size(), size_t{3});
    ASSERT_EQ(created[0].serial, std::string("P01"));
    ASSERT_EQ(created[1].serial, std::string("P02"));
    ASSERT_EQ(created[2].serial, std::string("P03"));
    ASSERT_TRUE(created[0].device_id < created[1].device_id);

    auto more = f.service.create_devices("PN-1", 1, SerialSource::next());
    ASSERT_EQ(more[0].serial, std::string("P04"));
}

void test_explicit_serial()
{
    Fixture f;
    f.add_type("PN-1", "SN-{3}");

    auto created = f.service.create_devices("PN-1", 1, SerialSource::explicit_serial("CUSTOM-9"));
    ASSERT_EQ(created.size(), size_t{1});
    ASSERT_EQ(created[0].serial, std::string("CUSTOM-9"));

    auto device = f.db.device_by_id(created[0].device_id);
    ASSERT_TRUE(device.has_value());
    ASSERT_EQ(device->part_number, std::string("PN-1"));

    // A non-conforming explicit serial does not disturb allocation.
    auto next = f.service.create_devices("PN-1", 1, SerialSource::next());
    ASSERT_EQ(next[0].serial, std::string("SN-001"));
}

void test_duplicate_serial()
{
    Fixture f;
    f.add_type("PN-1", "SN-{3}");
    f.add_type("PN-2", "SN-{3}");
    f.service.create_devices("PN-1", 1, SerialSource::explicit_serial("SN-001"));

    ASSERT_THROWS_CODE(f.service.create_devices("PN-2", 1, SerialSource::explicit_serial("SN-001")),
                       ConflictError, "DUPLICATE_SERIAL");
    ASSERT_EQ(f.db.count_devices(), int64_t{1});
}

void test_create_device_errors()
{
    Fixture f;
    f.add_type("PN-1", "SN-{3}");

    ASSERT_THROWS_CODE(f.service.create_devices("PN-1", 2, SerialSource::explicit_serial("X")),
                       ConflictError, "AMBIGUOUS_SERIAL");
    ASSERT_THROWS_CODE(f.service.create_devices("PN-1", 0, SerialSource::next()),
                       ValidationError, "INVALID_COUNT");
    ASSERT_THROWS_CODE(f.service.create_devices("PN-404", 1, SerialSource::next()), NotFoundError,
                       "UNKNOWN_DEVICE_TYPE");
    ASSERT_EQ(f.db.count_devices(), int64_t{0});
}

/**
 * @brief A batch that collides part-way leaves no device, no history behind.
 *
 * PN-A allocates P01, then P02 which already belongs to PN-B.
 */
void test_batch_failure_is_atomic()
{
    Fixture f;
    f.add_type("PN-A", "P{2}");
    f.add_type("PN-B", "Q{2}");
    f.service.create_devices("PN-B", 1, SerialSource::explicit_serial("P02"));

    int64_t history_before = f.db.count_history();
    ASSERT_THROWS_CODE(f.service.create_devices("PN-A", 3, SerialSource::next()), ConflictError,
                       "DUPLICATE_SERIAL");

    ASSERT_EQ(f.db.count_devices(), int64_t{1});
    ASSERT_EQ(f.db.count_history(), history_before);
    ASSERT_FALSE(f.db.serial_exists("P01"));
    ASSERT_FALSE(f.db.in_transaction());
}

/**
 * @brief A trigger that ends the transaction inside SQLite makes the follow-up
 * ROLLBACK fail; the caller still sees the trigger's error, not the ROLLBACK's.
 */
void test_rollback_failure_keeps_original_error()
{
    Fixture f;
    f.add_type("PN-1", "P{2}");

    sqlite3* raw = nullptr;
    ASSERT_EQ(sqlite3_open(f.tmp.path.c_str(), &raw), SQLITE_OK);
    int rc = sqlite3_exec(raw,
                          "CREATE TRIGGER boom BEFORE INSERT ON device "
                          "WHEN NEW.serial_number = 'BOOM' "
                          "BEGIN SELECT RAISE(ROLLBACK, 'boom'); END;",
                          nullptr, nullptr, nullptr);
    sqlite3_close(raw);
    ASSERT_EQ(rc, SQLITE_OK);

    int64_t history_before = f.db.count_history();
    bool caught = false;
    try {
        f.service.create_devices("PN-1", 1, SerialSource::explicit_serial("BOOM"));
    } catch (const StorageError& e) {
        caught = true;
        ASSERT_EQ(e.sqlite_code() & 0xff, SQLITE_CONSTRAINT);
        ASSERT_TRUE(std::string(e.what()).find("boom") != std::string::npos);
        ASSERT_TRUE(std::string(e.what()).find("ROLLBACK") == std::string::npos);
    }
    ASSERT_TRUE(caught);

    ASSERT_FALSE(f.db.in_transaction());
    ASSERT_EQ(f.db.count_devices(), int64_t{0});
    ASSERT_EQ(f.db.count_history(), history_before);

    auto created = f.service.create_devices("PN-1", 1, SerialSource::next());
    ASSERT_EQ(created.size(), size_t{1});
    ASSERT_EQ(f.db.count_devices(), int64_t{1});
}

/**
 * @brief Every created entity has exactly one creation record.
 */
void test_history_completeness()
{
    Fixture f;
    std::string started = proddb::infra::now_iso8601_utc();

    std::string type_id = f.add_type("PN-1", "SN-{3}");
    auto created = f.service.create_devices("PN-1", 2, SerialSource::next());

    auto type_history = f.service.history(type_id);
    ASSERT_EQ(type_history.size(), size_t{1});
    ASSERT_EQ(type_history[0].operation, std::string(proddb::core::ops::kCreateDeviceType));
    ASSERT_EQ(type_history[0].comment, std::string("Acme/PN-1"));
    ASSERT_TRUE(type_history[0].timestamp >= started);

    for (const auto& c : created) {
        auto entries = f.service.history(c.device_id);
        ASSERT_EQ(entries.size(), size_t{1});
        ASSERT_EQ(entries[0].operation, std::string(proddb::core::ops::kCreateDevice));
        ASSERT_EQ(entries[0].comment, "PN-1/" + c.serial);
    }
    ASSERT_EQ(f.db.count_history(), int64_t{3});
}

void test_type_attributes()
{
    Fixture f;
    std::string type_id = f.add_type("PN-1", "SN-{3}");

    std::string attr = f.service.add_device_type_attribute("PN-1", "mac_address", "2");
    ASSERT_TRUE(proddb::infra::IdGenerator::is_valid(attr));
    ASSERT_THROWS_CODE(f.service.add_device_type_attribute("PN-1", "mac_address", "1"),
                       ConflictError, "DUPLICATE_ATTRIBUTE");
    ASSERT_THROWS_CODE(f.service.add_device_type_attribute("PN-404", "x", "1"), NotFoundError,
                       "UNKNOWN_DEVICE_TYPE");

    auto types = f.service.list_device_types();
    ASSERT_EQ(types.size(), size_t{1});
    ASSERT_EQ(types[0].type.id, type_id);
    ASSERT_EQ(types[0].attributes.size(), size_t{1});
    ASSERT_EQ(types[0].attributes[0].multiplicity, std::string("2"));
    ASSERT_EQ(f.service.history(type_id).size(), size_t{2});
}

void test_device_attributes()
{
    Fixture f;
    f.add_type("PN-1", "SN-{3}");
    auto created = f.service.create_devices("PN-1", 1, SerialSource::next());
    const std::string& device_id = created[0].device_id;

    f.service.add_device_attribute(device_id, "string", "mac", std::string("00:11:22:33:44:55"));
    f.service.add_device_attribute(device_id, "string", "note", std::nullopt);
    ASSERT_THROWS_CODE(f.service.add_device_attribute(device_id, "string", "mac", std::nullopt),
                       ConflictError, "DUPLICATE_ATTRIBUTE");
    ASSERT_THROWS_CODE(f.service.add_device_attribute("01NOSUCHDEVICE0000000000000", "string",
                                                      "mac", std::nullopt),
                       NotFoundError, "UNKNOWN_DEVICE");

    auto view = f.service.get_device(device_id);
    ASSERT_EQ(view.serial_number, std::string("SN-001"));
    ASSERT_EQ(view.manufacturer_name, std::string("Acme"));
    ASSERT_EQ(view.attributes.size(), size_t{2});
    ASSERT_TRUE(view.attributes.at("mac").value ==
                std::optional<std::string>("00:11:22:33:44:55"));
    ASSERT_FALSE(view.attributes.at("note").value.has_value());

    ASSERT_THROWS_CODE(f.service.get_device("missing"), NotFoundError, "UNKNOWN_DEVICE");
}

/**
 * @brief Filters match case-sensitive substrings and combine with AND.
 */
void test_find_devices_through_service()
{
    Fixture f;
    f.add_type("RTR-100", "R{3}", "Acme Networks");
    f.add_type("SW-200", "S{3}", "Globex");
    f.service.create_devices("RTR-100", 2, SerialSource::next());
    f.service.create_devices("SW-200", 1, SerialSource::next());

    proddb::storage::DeviceFilter by_maker;
    by_maker.manufacturer = "Networks";
    ASSERT_EQ(f.service.find_devices(by_maker).size(), size_t{2});

    proddb::storage::DeviceFilter lower;
    lower.manufacturer = "globex";
    ASSERT_EQ(f.service.find_devices(lower).size(), size_t{0});

    proddb::storage::DeviceFilter combined;
    combined.part_number = "RTR";
    combined.serial_number = "R002";
    auto hits = f.service.find_devices(combined);
    ASSERT_EQ(hits.size(), size_t{1});
    ASSERT_TRUE(hits[0].model == std::optional<std::string>("Model-RTR-100"));
}

/**
 * @brief Concurrent writers on one store never hand out the same serial.
 */
void test_concurrent_allocation()
{
    Fixture f;
    f.add_type("PN-1", "P{2}");

    std::vector<std::thread> workers;
    std::vector<std::vector<proddb::core::CreatedDevice>> results(4);
    for (auto& out : results) {
        workers.emplace_back([&f, &out] {
            for (int i = 0; i < 5; ++i) {
                auto batch = f.service.create_devices("PN-1", 1, SerialSource::next());
                out.insert(out.end(), batch.begin(), batch.end());
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    std::set<std::string> serials;
    for (const auto& out : results) {
        for (const auto& c : out) {
            serials.insert(c.serial);
        }
    }
    ASSERT_EQ(serials.size(), size_t{20});
    ASSERT_EQ(*serials.begin(), std::string("P01"));
    ASSERT_EQ(*serials.rbegin(), std::string("P20"));
    ASSERT_EQ(f.db.count_devices(), int64_t{20});
}
