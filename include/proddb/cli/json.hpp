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
 * @file json.hpp
 * @brief cJSON ownership guard and typed field accessors.
 */

#pragma once

#include <cJSON.h>
#include <cstdint>
#include <optional>
#include <string>

namespace proddb::cli {

/**
 * @class ScopedJson
 * @brief RAII owner of a cJSON tree; deletes it on destruction.
 */
class ScopedJson {
  public:
    ScopedJson() = default;

    /// Takes ownership of `raw` (may be nullptr).
    explicit ScopedJson(cJSON* raw) : ptr_(raw) {}

    ScopedJson(const ScopedJson&) = delete;
    ScopedJson& operator=(const ScopedJson&) = delete;

    ScopedJson(ScopedJson&& other) noexcept : ptr_(other.ptr_) { other.ptr_ = nullptr; }

    ScopedJson& operator=(ScopedJson&& other) noexcept
    {
        if (this != &other) {
            cJSON_Delete(ptr_);
            ptr_ = other.ptr_;
            other.ptr_ = nullptr;
        }
        return *this;
    }

    ~ScopedJson() { cJSON_Delete(ptr_); }

    cJSON* get() const { return ptr_; }

  private:
    cJSON* ptr_ = nullptr;
};

/// @brief Serializes with indentation; never returns a null document.
std::string print(const cJSON* node);

/// @brief Adds `value` as a string, or JSON null for `std::nullopt`.
void add_optional_string(cJSON* object, const char* key, const std::optional<std::string>& value);

/// @brief String member of `object`, or `std::nullopt` if absent, null, or not a string.
std::optional<std::string> get_string(const cJSON* object, const char* key);

/**
 * @brief Integral member of `object`.
 *
 * @return `std::nullopt` if absent, not a number, fractional, non-finite, or
 * outside the `int64_t` range.
 */
std::optional<int64_t> get_int(const cJSON* object, const char* key);

/// @brief True only if the member exists and is JSON `true`.
bool get_flag(const cJSON* object, const char* key);

} // namespace proddb::cli
