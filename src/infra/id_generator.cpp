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
 * @file id_generator.cpp
 * @brief Implementation of the monotonic ULID generator.
 *
 * @details
 * The 128-bit value is held as two 64-bit words:
 * `hi = (timestamp_ms << 16) | tail_hi` and `lo = tail_lo`.
 * Encoding walks the value in 5-bit groups from bit 125 down to bit 0; the
 * first symbol therefore carries only three significant bits.
 */

#include "proddb/infra/id_generator.hpp"

#include "proddb/infra/error.hpp"

#include <chrono>
#include <random>

namespace proddb::infra {

namespace {

constexpr char kAlphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
constexpr uint64_t kTimestampMask = (uint64_t{1} << 48) - 1;

uint64_t system_clock_ms()
{
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

void random_device_entropy(uint8_t* out, size_t len)
{
    // std::random_device reads the kernel CSPRNG on Linux; one device per thread
    // avoids sharing the handle across generators.
    static thread_local std::random_device rd;
    size_t i = 0;
    while (i < len) {
        unsigned int word = rd();
        for (size_t b = 0; b < sizeof(word) && i < len; ++b, ++i) {
            out[i] = static_cast<uint8_t>(word >> (8 * b));
        }
    }
}

/// Extracts the 5-bit group starting at `shift` from the 128-bit value {hi, lo}.
unsigned int group_at(uint64_t hi, uint64_t lo, unsigned int shift)
{
    if (shift >= 64) {
        return static_cast<unsigned int>((hi >> (shift - 64)) & 0x1F);
    }
    uint64_t bits = lo >> shift;
    if (shift > 59) {
        bits |= hi << (64 - shift);
    }
    return static_cast<unsigned int>(bits & 0x1F);
}

int decode_symbol(char c)
{
    for (int i = 0; i < 32; ++i) {
        if (kAlphabet[i] == c) {
            return i;
        }
    }
    return -1;
}

} // namespace

IdGenerator::IdGenerator() : IdGenerator(system_clock_ms, random_device_entropy) {}

IdGenerator::IdGenerator(Clock clock, Entropy entropy)
    : clock_(std::move(clock)), entropy_(std::move(entropy))
{
}

void IdGenerator::draw_tail()
{
    uint8_t buf[10];
    try {
        entropy_(buf, sizeof(buf));
    } catch (const std::exception& e) {
        throw Error(ErrorKind::INTERNAL, "ENTROPY", std::string("Entropy source failed: ") + e.what());
    }

    tail_hi_ = static_cast<uint16_t>((buf[0] << 8) | buf[1]);
    tail_lo_ = 0;
    for (size_t i = 2; i < sizeof(buf); ++i) {
        tail_lo_ = (tail_lo_ << 8) | buf[i];
    }
}

std::string IdGenerator::next_id()
{
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t now = clock_() & kTimestampMask;

    if (!started_ || now > last_timestamp_ms_) {
        started_ = true;
        last_timestamp_ms_ = now;
        draw_tail();
    } else {
        // Same (or regressed) millisecond: keep the previous timestamp and step the tail.
        if (++tail_lo_ == 0 && ++tail_hi_ == 0) {
            // 80-bit tail exhausted; carry into the timestamp.
            last_timestamp_ms_ = (last_timestamp_ms_ + 1) & kTimestampMask;
        }
    }

    return encode(last_timestamp_ms_, tail_hi_, tail_lo_);
}

std::string IdGenerator::encode(uint64_t timestamp_ms, uint16_t tail_hi, uint64_t tail_lo)
{
    uint64_t hi = ((timestamp_ms & kTimestampMask) << 16) | tail_hi;
    uint64_t lo = tail_lo;

    std::string out(kLength, '0');
    for (size_t i = 0; i < kLength; ++i) {
        unsigned int shift = static_cast<unsigned int>(5 * (kLength - 1 - i));
        out[i] = kAlphabet[group_at(hi, lo, shift)];
    }
    return out;
}

bool IdGenerator::is_valid(const std::string& id)
{
    if (id.size() != kLength || id[0] > '7') {
        return false;
    }
    for (char c : id) {
        if (decode_symbol(c) < 0) {
            return false;
        }
    }
    return true;
}

uint64_t IdGenerator::timestamp_of(const std::string& id)
{
    if (!is_valid(id)) {
        throw ValidationError("INVALID_ULID", "Not a ULID: '" + id + "'");
    }

    // The first ten symbols cover bits 129..80: two zero pad bits and the timestamp.
    uint64_t ts = 0;
    for (size_t i = 0; i < 10; ++i) {
        ts = (ts << 5) | static_cast<uint64_t>(decode_symbol(id[i]));
    }
    return ts;
}

} // namespace proddb::infra
