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
 * @file id_generator.hpp
 * @brief Monotonic ULID generator used for every primary key in proddb.
 *
 * @details
 * A ULID is a 128-bit value: a 48-bit UTC millisecond timestamp in the high bits
 * followed by an 80-bit random tail. It is rendered as 26 Crockford base-32
 * characters, most significant symbol first, so the textual form sorts in
 * generation order.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace proddb::infra {

/**
 * @class IdGenerator
 * @brief Thread-safe, explicitly owned ULID source.
 *
 * @details
 * One instance is created by the bootstrap and handed by reference to every
 * component that mints primary keys. All state lives in the instance; there is
 * no hidden process-global generator.
 *
 * **Monotonicity:**
 * - A new millisecond draws a fresh random tail.
 * - A repeated (or regressed) millisecond increments the previous tail by one.
 * - A tail overflow carries into the timestamp component.
 */
class IdGenerator {
  public:
    /// @brief Returns the current UTC time in milliseconds since the Unix epoch.
    using Clock = std::function<uint64_t()>;

    /// @brief Fills the buffer with random bytes. Must throw on failure.
    using Entropy = std::function<void(uint8_t*, size_t)>;

    /// @brief Length of the textual form.
    static constexpr size_t kLength = 26;

    /**
     * @brief Builds a generator backed by the system clock and `std::random_device`.
     */
    IdGenerator();

    /**
     * @brief Builds a generator with injected time and randomness sources.
     *
     * @param clock Millisecond UTC clock.
     * @param entropy Random byte source.
     */
    IdGenerator(Clock clock, Entropy entropy);

    IdGenerator(const IdGenerator&) = delete;
    IdGenerator& operator=(const IdGenerator&) = delete;

    /**
     * @brief Produces the next identifier.
     *
     * @return std::string A 26-character ULID, strictly greater than every
     * identifier previously returned by this instance.
     *
     * @throws infra::Error (kind INTERNAL) if the entropy source fails.
     *
     * @code
     * proddb::infra::IdGenerator ids;
     * std::string pk = ids.next_id(); // e.g. "01JAB3Q9Y8ZK6M2T4V7W0XN5CD"
     * @endcode
     */
    std::string next_id();

    /**
     * @brief Encodes a raw ULID value.
     *
     * @param timestamp_ms Timestamp component (only the low 48 bits are used).
     * @param tail_hi High 16 bits of the 80-bit tail.
     * @param tail_lo Low 64 bits of the 80-bit tail.
     */
    static std::string encode(uint64_t timestamp_ms, uint16_t tail_hi, uint64_t tail_lo);

    /**
     * @brief Decodes the millisecond timestamp of a ULID.
     *
     * @throws infra::ValidationError if `id` is not a well-formed ULID.
     */
    static uint64_t timestamp_of(const std::string& id);

    /// @brief True if `id` has the ULID length and only Crockford symbols.
    static bool is_valid(const std::string& id);

  private:
    void draw_tail();

    Clock clock_;
    Entropy entropy_;

    std::mutex mutex_;
    bool started_ = false;
    uint64_t last_timestamp_ms_ = 0;
    uint16_t tail_hi_ = 0;
    uint64_t tail_lo_ = 0;
};

} // namespace proddb::infra
