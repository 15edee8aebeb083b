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

#include "proddb/cli/json.hpp"

#include <cmath>
#include <cstdlib>

namespace proddb::cli {

std::string print(const cJSON* node)
{
    char* raw = cJSON_Print(node);
    if (!raw) {
        return "null";
    }
    std::string out(raw);
    free(raw);
    return out;
}

void add_optional_string(cJSON* object, const char* key, const std::optional<std::string>& value)
{
    if (value) {
        cJSON_AddStringToObject(object, key, value->c_str());
    } else {
        cJSON_AddNullToObject(object, key);
    }
}

std::optional<std::string> get_string(const cJSON* object, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(object, key);
    if (!cJSON_IsString(item) || item->valuestring == nullptr) {
        return std::nullopt;
    }
    return std::string(item->valuestring);
}

std::optional<int64_t> get_int(const cJSON* object, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(object, key);
    if (!cJSON_IsNumber(item)) {
        return std::nullopt;
    }
    double value = item->valuedouble;
    // 2^63 is exactly representable; anything at or above it does not fit.
    constexpr double kLimit = 9223372036854775808.0;
    if (!std::isfinite(value) || value != std::trunc(value) || value < -kLimit ||
        value >= kLimit) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

bool get_flag(const cJSON* object, const char* key)
{
    return cJSON_IsTrue(cJSON_GetObjectItemCaseSensitive(object, key));
}

} // namespace proddb::cli
