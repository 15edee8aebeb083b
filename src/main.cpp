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
 * @file main.cpp
 * @brief Application Entry Point (Bootstrap).
 *
 * @details
 * This file contains the `main` function which orchestrates one command run:
 * 1. Argument Parsing.
 * 2. Configuration Resolution (defaults, file, environment, flags).
 * 3. Subsystem Initialization (Logger, Store, Inventory Service).
 * 4. Request Dispatch and Response Emission.
 *
 * Exit status: 0 on success, 1 on an error document, 2 on a usage error.
 */

#include "proddb/cli/args.hpp"
#include "proddb/cli/handler.hpp"
#include "proddb/core/inventory.hpp"
#include "proddb/infra/config.hpp"
#include "proddb/infra/error.hpp"
#include "proddb/infra/id_generator.hpp"
#include "proddb/infra/logger.hpp"
#include "proddb/storage/db.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    using namespace proddb;

    const std::string program = argc > 0 ? argv[0] : "proddb";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    try {
        // 1. Parse Command Line Arguments
        cli::Invocation inv = cli::parse_args(args);
        if (inv.help) {
            std::cout << cli::usage(program);
            return cli::kExitOk;
        }

        // 2. Resolve Configuration
        infra::Config config;
        if (inv.config_file) {
            config.apply_file(*inv.config_file);
        }
        config.apply_env();
        if (inv.database_path) {
            config.database_path = *inv.database_path;
        }
        if (inv.log_level) {
            config.set_log_level(*inv.log_level);
        }
        infra::Logger::set_level(config.log_level);
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Config: Database path set to '" + config.database_path + "'");

        // 3. Initialize Subsystems (opens the store, applies the schema)
        infra::IdGenerator ids;
        storage::Db db(config.database_path);
        core::InventoryService service(db, ids);

        // 4. Dispatch
        cli::Reply reply = cli::Handler::process(service, inv.request.get());
        std::cout << reply.document << std::endl;
        return cli::exit_status(reply);

    } catch (const infra::Error& e) {
        cli::Reply reply = cli::Handler::failure(e);
        std::cout << reply.document << std::endl;
        if (reply.code == "USAGE") {
            std::cerr << cli::usage(program);
        }
        return cli::exit_status(reply);
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::FATAL,
                           "System: Critical Failure: " + std::string(e.what()));
        cli::Reply reply = cli::Handler::failure(
            infra::Error(infra::ErrorKind::INTERNAL, "INTERNAL", e.what()));
        std::cout << reply.document << std::endl;
        return cli::exit_status(reply);
    }
}
