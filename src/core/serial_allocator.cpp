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
 * @file serial_allocator.cpp
 * @brief Template parsing, matching and next-serial computation.
 *
 * @details
 * Prefix and suffix are compared as plain bytes, so characters such as `.`,
 * `+` or `(` in a template have no special meaning.
 */

#include "proddb/core/serial_allocator.hpp"

#include "proddb/infra/error.hpp"
#include "proddb/infra/logger.hpp"
#include "proddb/infra/string.hpp"

#include <limits>

namespace proddb::core {

namespace {

struct Placeholder {
    size_t begin;
    size_t end; // one past '}'
    std::string digits;
};

/// Finds the next `{digits}` at or after `from`.
std::optional<Placeholder> find_placeholder(const std::string& spec, size_t from)
{
    while (true) {
        size_t open = spec.find('{', from);
        if (open == std::string::npos) {
            return std::nullopt;
        }
        size_t close = spec.find('}', open + 1);
        if (close == std::string::npos) {
            return std::nullopt;
        }
        std::string inner = spec.substr(open + 1, close - open - 1);
        if (infra::String::is_digits(inner)) {
            return Placeholder{open, close + 1, inner};
        }
        from = open + 1;
    }
}

/// Decimal digits to `uint64_t`; empty optional on overflow.
std::optional<uint64_t> to_u64(const std::string& digits)
{
    uint64_t value = 0;
    for (char c : digits) {
        auto d = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - d) / 10) {
            return std::nullopt;
        }
        value = value * 10 + d;
    }
    return value;
}

infra::ValidationError malformed(const std::string& spec, const std::string& why)
{
    return infra::ValidationError("MALFORMED_SPEC",
                                  "Malformed serial number spec '" + spec + "': " + why);
}

} // namespace

SerialSpec::SerialSpec(std::string prefix, size_t width, std::string suffix)
    : prefix_(std::move(prefix)), width_(width), suffix_(std::move(suffix))
{
}

/**
 * @brief Parses a spec such as `SN-{4}-X` into prefix, width and suffix.
 *
 * Operational Logic:
 * 1. **Locate**: Finds the first `{digits}` group; none at all is malformed.
 * 2. **Uniqueness**: A second group anywhere after it is malformed.
 * 3. **Width**: The digits must be a positive integer small enough to render.
 *    Widths beyond 20 digits are legal and simply pad with more zeros.
 *
 * Braces that do not enclose digits (`{x}`, `{}`) are not placeholders and
 * stay part of the literal text, which then fails step 1 if nothing else
 * qualifies.
 *
 * @throws infra::ValidationError `MALFORMED_SPEC`.
 */
SerialSpec SerialSpec::parse(const std::string& spec)
{
    if (spec.empty()) {
        throw malformed(spec, "no serial number spec defined");
    }

    auto first = find_placeholder(spec, 0);
    if (!first) {
        throw malformed(spec, "must contain a {n} placeholder");
    }
    if (find_placeholder(spec, first->end)) {
        throw malformed(spec, "must contain exactly one {n} placeholder");
    }

    auto width = to_u64(first->digits);
    if (!width || *width == 0) {
        throw malformed(spec, "placeholder width must be a positive integer");
    }
    if (*width > std::string().max_size() / 2) {
        throw malformed(spec, "placeholder width is too large");
    }

    return SerialSpec(spec.substr(0, first->begin), static_cast<size_t>(*width),
                      spec.substr(first->end));
}

/**
 * @brief Extracts the number from a serial produced by this spec.
 *
 * The serial must carry the literal prefix and suffix with at least `width`
 * ASCII digits between them. More digits are allowed, since rendering grows
 * past the width once the counter needs them.
 *
 * @return The number, or empty if the serial does not conform or overflows.
 */
std::optional<uint64_t> SerialSpec::match(const std::string& serial) const
{
    if (serial.size() < prefix_.size() + width_ + suffix_.size()) {
        return std::nullopt;
    }
    if (serial.compare(0, prefix_.size(), prefix_) != 0) {
        return std::nullopt;
    }
    if (serial.compare(serial.size() - suffix_.size(), suffix_.size(), suffix_) != 0) {
        return std::nullopt;
    }

    std::string digits =
        serial.substr(prefix_.size(), serial.size() - prefix_.size() - suffix_.size());
    if (digits.size() < width_ || !infra::String::is_digits(digits)) {
        return std::nullopt;
    }
    return to_u64(digits);
}

/// @brief Zero-pads `number` to the placeholder width; never truncates.
std::string SerialSpec::render(uint64_t number) const
{
    return prefix_ + infra::String::zero_pad(number, width_) + suffix_;
}

/**
 * @brief Derives the next serial for `type` from what is already stored.
 *
 * **Allocation Strategy:**
 * 1. **Scan**: Reads every serial of this device type (serials of other types
 *    never influence the result).
 * 2. **Filter**: Keeps only serials matching the type's spec; explicit
 *    serials in another shape are counted and ignored.
 * 3. **Successor**: Renders `max + 1`, or `1` when nothing conforms.
 *
 * Called inside the creating transaction, so concurrent allocations are
 * serialized by the writer lock and cannot hand out the same number.
 *
 * @throws infra::ValidationError `MALFORMED_SPEC` for a missing or bad spec.
 * @throws infra::ConflictError `SERIAL_EXHAUSTED` when the counter is at its maximum.
 */
std::string SerialAllocator::allocate_next(const storage::DeviceType& type) const
{
    SerialSpec spec = SerialSpec::parse(type.serial_number_spec.value_or(""));

    uint64_t max_seen = 0;
    size_t conforming = 0;
    size_t ignored = 0;
    for (const auto& serial : db_.serials_for_type(type.id)) {
        if (auto n = spec.match(serial)) {
            ++conforming;
            if (*n > max_seen) {
                max_seen = *n;
            }
        } else {
            ++ignored;
        }
    }

    if (max_seen == std::numeric_limits<uint64_t>::max()) {
        throw infra::ConflictError("SERIAL_EXHAUSTED",
                                   "Serial space exhausted for " + type.part_number);
    }

    if (ignored > 0) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Serial: Ignored " + std::to_string(ignored) +
                               " non-conforming serial(s) for " + type.part_number);
    }

    std::string next = spec.render(max_seen + 1);
    infra::Logger::log(infra::LogLevel::DEBUG, "Serial: " + type.part_number + " -> " + next +
                                                   " (" + std::to_string(conforming) +
                                                   " conforming)");
    return next;
}

} // namespace proddb::core
