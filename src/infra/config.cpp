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
 * @file config.cpp
 * @brief Layered configuration loading (file, environment).
 */

#include "proddb/infra/config.hpp"

#include "proddb/infra/error.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace proddb::infra {

void Config::set_log_level(const std::string& name)
{
    auto parsed = parse_log_level(name);
    if (!parsed) {
        throw ValidationError("INVALID_LOG_LEVEL", "Unknown log level '" + name + "'");
    }
    log_level = *parsed;
}

void Config::apply_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ValidationError("INVALID_CONFIG", "Cannot read config file '" + path + "'");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    cJSON* root = cJSON_Parse(buffer.str().c_str());
    if (!cJSON_IsObject(root)) {
        cJSON_Delete(root);
        throw ValidationError("INVALID_CONFIG", "Config file '" + path + "' is not a JSON object");
    }

    cJSON* db = cJSON_GetObjectItem(root, "database");
    cJSON* level = cJSON_GetObjectItem(root, "log_level");
    std::string level_name = cJSON_IsString(level) ? level->valuestring : "";

    if (cJSON_IsString(db) && db->valuestring[0] != '\0') {
        database_path = db->valuestring;
    }
    cJSON_Delete(root);

    if (!level_name.empty()) {
        set_log_level(level_name);
    }
    Logger::log(LogLevel::DEBUG, "Config: Loaded " + path);
}

void Config::apply_env()
{
    const char* db = std::getenv("PRODDB_DATABASE");
    if (db && *db) {
        database_path = db;
    }
    const char* level = std::getenv("PRODDB_LOG_LEVEL");
    if (level && *level) {
        set_log_level(level);
    }
}

} // namespace proddb::infra
