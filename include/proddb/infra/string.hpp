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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Stateless helpers used by input validation, the serial allocator and the
 * command-line parser. All comparisons are byte-exact; nothing here is
 * locale-aware beyond ASCII classification.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace proddb::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing ASCII whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string A new string without the surrounding whitespace.
     * Returns an empty string if the input is empty or consists solely of whitespace.
     *
     * @code
     * std::string clean = proddb::infra::String::trim("  ACME-100 \n"); // "ACME-100"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// @brief True if `s` is empty or whitespace only.
    static bool is_blank(const std::string& s);

    /// @brief ASCII upper-casing.
    static std::string to_upper(const std::string& s);

    /// @brief True if `s` is non-empty and made only of ASCII digits.
    static bool is_digits(const std::string& s);

    /**
     * @brief Renders `value` in decimal, left-padded with zeros to at least `width`.
     *
     * Wider numbers are never truncated: `zero_pad(10000, 4) == "10000"`.
     */
    static std::string zero_pad(uint64_t value, size_t width);

    /// @brief True if `s` begins with `prefix`.
    static bool starts_with(const std::string& s, const std::string& prefix);
};

} // namespace proddb::infra
