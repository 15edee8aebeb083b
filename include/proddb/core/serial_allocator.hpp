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
 * @file serial_allocator.hpp
 * @brief Serial-number templates and next-serial allocation.
 *
 * @details
 * A template contains exactly one `{n}` placeholder, `n` being a positive
 * decimal field width. Everything before and after it is literal text:
 *
 * | Template    | Prefix | Width | Suffix | 1st serial |
 * |-------------|--------|-------|--------|------------|
 * | `SN-{4}-X`  | `SN-`  | 4     | `-X`   | `SN-0001-X`|
 * | `P{2}`      | `P`    | 2     |        | `P01`      |
 */

#pragma once

#include "proddb/storage/db.hpp"
#include "proddb/storage/records.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace proddb::core {

/**
 * @class SerialSpec
 * @brief A parsed serial-number template.
 */
class SerialSpec {
  public:
    /**
     * @brief Splits a template around its placeholder.
     *
     * @throws infra::ValidationError (code `MALFORMED_SPEC`) if the template is
     * empty, has no `{n}` placeholder with a positive width, or has more than one.
     */
    static SerialSpec parse(const std::string& spec);

    /**
     * @brief Matches a serial against `prefix` + (>= width digits) + `suffix`.
     *
     * @return The numeric field, or `std::nullopt` if the serial does not conform
     * (including digit runs too large for 64 bits).
     */
    std::optional<uint64_t> match(const std::string& serial) const;

    /// @brief Renders `prefix` + zero-padded `number` + `suffix`; never truncates.
    std::string render(uint64_t number) const;

    const std::string& prefix() const { return prefix_; }
    size_t width() const { return width_; }
    const std::string& suffix() const { return suffix_; }

  private:
    SerialSpec(std::string prefix, size_t width, std::string suffix);

    std::string prefix_;
    size_t width_;
    std::string suffix_;
};

/**
 * @class SerialAllocator
 * @brief Computes the next free serial for a device type.
 *
 * @warning The result is only stable inside the transaction that inserts it:
 * the allocator scans existing rows and returns `max + 1`.
 */
class SerialAllocator {
  public:
    explicit SerialAllocator(const storage::Db& db) : db_(db) {}

    /**
     * @brief Returns the serial following the highest conforming one.
     *
     * Serials of this type that do not match the current template are ignored.
     *
     * @throws infra::ValidationError (`MALFORMED_SPEC`) if the type has no usable
     * template.
     */
    std::string allocate_next(const storage::DeviceType& type) const;

  private:
    const storage::Db& db_;
};

} // namespace proddb::core
