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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure primitives.
 *
 * @details
 * Covers the ULID generator (encoding, monotonicity, overflow carry),
 * string helpers, timestamp formatting, log level parsing and layered
 * configuration.
 */

#include "proddb/infra/config.hpp"
#include "proddb/infra/error.hpp"
#include "proddb/infra/id_generator.hpp"
#include "proddb/infra/logger.hpp"
#include "proddb/infra/string.hpp"
#include "proddb/infra/time.hpp"
#include "framework.hpp"

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using proddb::infra::IdGenerator;

namespace {

IdGenerator::Entropy fill_with(uint8_t byte)
{
    return [byte](uint8_t* out, size_t len) { std::memset(out, byte, len); };
}

} // namespace

// ============================================================================
//  IdGenerator
// ============================================================================

void test_ulid_length()
{
    IdGenerator ids;
    std::string id = ids.next_id();
    ASSERT_EQ(id.length(), IdGenerator::kLength);
    ASSERT_TRUE(IdGenerator::is_valid(id));
}

/**
 * @brief Every symbol belongs to the Crockford alphabet (no I, L, O, U).
 */
void test_ulid_alphabet()
{
    const std::string alphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
    IdGenerator ids;
    for (int i = 0; i < 200; ++i) {
        for (char c : ids.next_id()) {
            ASSERT_TRUE(alphabet.find(c) != std::string::npos);
        }
    }
}

void test_ulid_encode_known_values()
{
    ASSERT_EQ(IdGenerator::encode(0, 0, 0), std::string(26, '0'));
    ASSERT_EQ(IdGenerator::encode(1, 0, 0), std::string("00000000010000000000000000"));
    ASSERT_EQ(IdGenerator::encode(1469918176385, 0, 0).substr(0, 10), std::string("01ARYZ6S41"));
    ASSERT_EQ(IdGenerator::encode((uint64_t{1} << 48) - 1, 0xFFFF, ~uint64_t{0}),
              std::string("7ZZZZZZZZZZZZZZZZZZZZZZZZZ"));
}

void test_ulid_timestamp_of()
{
    ASSERT_EQ(IdGenerator::timestamp_of(IdGenerator::encode(1469918176385, 0x1234, 99)),
              uint64_t{1469918176385});
    ASSERT_THROWS_CODE(IdGenerator::timestamp_of("not-a-ulid"), proddb::infra::ValidationError,
                       "INVALID_ULID");
    ASSERT_FALSE(IdGenerator::is_valid("8ZZZZZZZZZZZZZZZZZZZZZZZZZ"));
    ASSERT_FALSE(IdGenerator::is_valid("0000000000000000000000000I"));
}

/**
 * @brief Consecutive ids from one generator sort strictly increasing.
 */
void test_ulid_monotonic_order()
{
    IdGenerator ids;
    std::string previous = ids.next_id();
    for (int i = 0; i < 5000; ++i) {
        std::string current = ids.next_id();
        ASSERT_TRUE(previous < current);
        previous = current;
    }
}

/**
 * @brief With the clock stalled, the tail is incremented by exactly one.
 */
void test_ulid_same_millisecond_increments_tail()
{
    IdGenerator ids([] { return uint64_t{1000}; }, fill_with(0x00));
    ASSERT_EQ(ids.next_id(), IdGenerator::encode(1000, 0, 0));
    ASSERT_EQ(ids.next_id(), IdGenerator::encode(1000, 0, 1));
    ASSERT_EQ(ids.next_id(), IdGenerator::encode(1000, 0, 2));
}

/**
 * @brief A clock that steps backwards keeps the last timestamp.
 */
void test_ulid_clock_regression()
{
    uint64_t now = 5000;
    IdGenerator ids([&now] { return now; }, fill_with(0x00));
    std::string first = ids.next_id();
    now = 4000;
    std::string second = ids.next_id();

    ASSERT_TRUE(first < second);
    ASSERT_EQ(IdGenerator::timestamp_of(second), uint64_t{5000});
}

/**
 * @brief An exhausted 80-bit tail carries into the timestamp.
 */
void test_ulid_tail_overflow_carries()
{
    IdGenerator ids([] { return uint64_t{1000}; }, fill_with(0xFF));
    std::string saturated = ids.next_id();
    ASSERT_EQ(saturated, IdGenerator::encode(1000, 0xFFFF, ~uint64_t{0}));

    std::string carried = ids.next_id();
    ASSERT_EQ(carried, IdGenerator::encode(1001, 0, 0));
    ASSERT_TRUE(saturated < carried);
}

void test_ulid_entropy_failure()
{
    IdGenerator ids([] { return uint64_t{1}; },
                    [](uint8_t*, size_t) { throw std::runtime_error("no entropy"); });
    ASSERT_THROWS_CODE(ids.next_id(), proddb::infra::Error, "ENTROPY");
}

void test_ulid_concurrent_uniqueness()
{
    IdGenerator ids;
    std::vector<std::vector<std::string>> per_thread(4);
    std::vector<std::thread> workers;
    for (auto& bucket : per_thread) {
        workers.emplace_back([&ids, &bucket] {
            for (int i = 0; i < 1000; ++i) {
                bucket.push_back(ids.next_id());
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    std::set<std::string> all;
    for (const auto& bucket : per_thread) {
        all.insert(bucket.begin(), bucket.end());
    }
    ASSERT_EQ(all.size(), size_t{4000});
}

// ============================================================================
//  String / time
// ============================================================================

void test_string_trim()
{
    ASSERT_EQ(proddb::infra::String::trim("   hello proddb   "), std::string("hello proddb"));
    ASSERT_EQ(proddb::infra::String::trim("  \t\n  \r "), std::string(""));
}

void test_string_zero_pad()
{
    using proddb::infra::String;
    ASSERT_EQ(String::zero_pad(7, 3), std::string("007"));
    ASSERT_EQ(String::zero_pad(100, 2), std::string("100"));
    ASSERT_EQ(String::zero_pad(0, 1), std::string("0"));
    ASSERT_FALSE(String::is_digits(""));
    ASSERT_FALSE(String::is_digits("12a"));
    ASSERT_TRUE(String::is_blank(" \t"));
}

void test_iso8601_format()
{
    using namespace std::chrono;
    system_clock::time_point tp{microseconds(1500000)};
    ASSERT_EQ(proddb::infra::to_iso8601_utc(tp), std::string("1970-01-01T00:00:01.500000+00:00"));
}

// ============================================================================
//  Logger / Config
// ============================================================================

void test_log_level_parse()
{
    using proddb::infra::LogLevel;
    using proddb::infra::parse_log_level;
    ASSERT_TRUE(parse_log_level("warning") == LogLevel::WARN);
    ASSERT_TRUE(parse_log_level(" Debug ") == LogLevel::DEBUG);
    ASSERT_FALSE(parse_log_level("verbose").has_value());
}

void test_config_env_overrides()
{
    proddb::infra::Config config;
    setenv("PRODDB_DATABASE", "/tmp/from-env.db", 1);
    setenv("PRODDB_LOG_LEVEL", "error", 1);
    config.apply_env();
    unsetenv("PRODDB_DATABASE");
    unsetenv("PRODDB_LOG_LEVEL");

    ASSERT_EQ(config.database_path, std::string("/tmp/from-env.db"));
    ASSERT_TRUE(config.log_level == proddb::infra::LogLevel::ERROR);

    setenv("PRODDB_LOG_LEVEL", "loud", 1);
    ASSERT_THROWS_CODE(config.apply_env(), proddb::infra::ValidationError, "INVALID_LOG_LEVEL");
    unsetenv("PRODDB_LOG_LEVEL");
}

void test_config_file()
{
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() / "proddb_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"database": "inventory.db", "log_level": "info"})";
    }

    proddb::infra::Config config;
    config.apply_file(path.string());
    fs::remove(path);

    ASSERT_EQ(config.database_path, std::string("inventory.db"));
    ASSERT_TRUE(config.log_level == proddb::infra::LogLevel::INFO);

    ASSERT_THROWS_CODE(config.apply_file(path.string()), proddb::infra::ValidationError,
                       "INVALID_CONFIG");
}
