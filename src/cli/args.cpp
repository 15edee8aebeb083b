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
 * @file args.cpp
 * @brief Table-driven command-line parser.
 */

#include "proddb/cli/args.hpp"

#include "proddb/infra/error.hpp"
#include "proddb/infra/string.hpp"

#include <sstream>

namespace proddb::cli {

namespace {

enum class FlagKind { TEXT, COUNT, SWITCH };

struct Flag {
    const char* name; // without the leading "--"
    const char* key;  // request member
    FlagKind kind;
    bool required;
};

struct Command {
    const char* name;
    const char* action;
    std::vector<Flag> flags;
    const char* summary;
};

const std::vector<Command>& commands()
{
    static const std::vector<Command> table = {
        {"add-device-type",
         "add_device_type",
         {{"part-number", "part_number", FlagKind::TEXT, true},
          {"manufacturer", "manufacturer", FlagKind::TEXT, true},
          {"model", "model", FlagKind::TEXT, false},
          {"descriptor", "descriptor", FlagKind::TEXT, false},
          {"serial-spec", "serial_spec", FlagKind::TEXT, false}},
         "Register a device type"},
        {"create-device",
         "create_device",
         {{"part-number", "part_number", FlagKind::TEXT, true},
          {"serial", "serial", FlagKind::TEXT, false},
          {"next-serial", "next_serial", FlagKind::SWITCH, false},
          {"count", "count", FlagKind::COUNT, false}},
         "Create devices (--serial S | --next-serial) [--count N]"},
        {"find-device",
         "find_device",
         {{"manufacturer", "manufacturer", FlagKind::TEXT, false},
          {"part-number", "part_number", FlagKind::TEXT, false},
          {"serial", "serial", FlagKind::TEXT, false},
          {"model", "model", FlagKind::TEXT, false}},
         "Find devices by case-sensitive substring"},
        {"add-type-attribute",
         "add_type_attribute",
         {{"part-number", "part_number", FlagKind::TEXT, true},
          {"name", "name", FlagKind::TEXT, true},
          {"multiplicity", "multiplicity", FlagKind::TEXT, false}},
         "Declare an attribute on a device type"},
        {"add-device-attribute",
         "add_device_attribute",
         {{"device", "device", FlagKind::TEXT, true},
          {"name", "name", FlagKind::TEXT, true},
          {"type", "type", FlagKind::TEXT, false},
          {"value", "value", FlagKind::TEXT, false}},
         "Attach an attribute value to a device"},
        {"show-device",
         "show_device",
         {{"device", "device", FlagKind::TEXT, true}},
         "Show one device with its attributes"},
        {"list-device-types", "list_device_types", {}, "List all device types"},
        {"history",
         "history",
         {{"entity", "entity", FlagKind::TEXT, true}},
         "Show the audit trail of an entity"},
    };
    return table;
}

infra::ValidationError usage_error(const std::string& message)
{
    return infra::ValidationError("USAGE", message);
}

const Command* find_command(const std::string& name)
{
    for (const auto& cmd : commands()) {
        if (name == cmd.name) {
            return &cmd;
        }
    }
    return nullptr;
}

const Flag* find_flag(const Command& cmd, const std::string& name)
{
    for (const auto& flag : cmd.flags) {
        if (name == flag.name) {
            return &flag;
        }
    }
    return nullptr;
}

/// Splits "--name=value" into its parts; plain "--name" yields no value.
std::pair<std::string, std::optional<std::string>> split_flag(const std::string& arg)
{
    std::string body = arg.substr(2);
    size_t eq = body.find('=');
    if (eq == std::string::npos) {
        return {body, std::nullopt};
    }
    return {body.substr(0, eq), body.substr(eq + 1)};
}

} // namespace

Invocation parse_args(const std::vector<std::string>& args)
{
    Invocation inv;
    const Command* cmd = nullptr;
    std::vector<std::string> rest;

    // Pass 1: global options and the command word.
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            inv.help = true;
            continue;
        }
        if (infra::String::starts_with(arg, "--")) {
            auto [name, inline_value] = split_flag(arg);
            std::optional<std::string>* target = nullptr;
            if (name == "db") {
                target = &inv.database_path;
            } else if (name == "config") {
                target = &inv.config_file;
            } else if (name == "log-level") {
                target = &inv.log_level;
            }
            if (target) {
                if (inline_value) {
                    *target = *inline_value;
                } else if (i + 1 < args.size()) {
                    *target = args[++i];
                } else {
                    throw usage_error("--" + name + " requires a value");
                }
                continue;
            }
            rest.push_back(arg);
            continue;
        }
        if (!cmd && rest.empty()) {
            cmd = find_command(arg);
            if (!cmd) {
                throw usage_error("Unknown command '" + arg + "'");
            }
            continue;
        }
        rest.push_back(arg);
    }

    if (inv.help) {
        return inv;
    }
    if (!cmd) {
        throw usage_error("No command given");
    }

    ScopedJson request(cJSON_CreateObject());
    cJSON_AddStringToObject(request.get(), "action", cmd->action);

    // Pass 2: command flags.
    for (size_t i = 0; i < rest.size(); ++i) {
        const std::string& arg = rest[i];
        if (!infra::String::starts_with(arg, "--")) {
            throw usage_error("Unexpected argument '" + arg + "'");
        }
        auto [name, inline_value] = split_flag(arg);
        const Flag* flag = find_flag(*cmd, name);
        if (!flag) {
            throw usage_error("Unknown option '--" + name + "' for " + cmd->name);
        }
        if (cJSON_HasObjectItem(request.get(), flag->key)) {
            throw usage_error("Option '--" + name + "' given more than once");
        }

        if (flag->kind == FlagKind::SWITCH) {
            if (inline_value) {
                throw usage_error("Option '--" + name + "' takes no value");
            }
            cJSON_AddTrueToObject(request.get(), flag->key);
            continue;
        }

        std::string value;
        if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < rest.size()) {
            value = rest[++i];
        } else {
            throw usage_error("Option '--" + name + "' requires a value");
        }

        if (flag->kind == FlagKind::COUNT) {
            if (!infra::String::is_digits(value) || value.size() > 9) {
                throw usage_error("--" + name + " must be a positive integer, got '" + value + "'");
            }
            cJSON_AddNumberToObject(request.get(), flag->key, std::stod(value));
        } else {
            cJSON_AddStringToObject(request.get(), flag->key, value.c_str());
        }
    }

    for (const auto& flag : cmd->flags) {
        if (flag.required && !cJSON_HasObjectItem(request.get(), flag.key)) {
            throw usage_error(std::string(cmd->name) + " requires --" + flag.name);
        }
    }

    if (std::string(cmd->name) == "create-device") {
        bool has_serial = cJSON_HasObjectItem(request.get(), "serial");
        bool has_next = cJSON_HasObjectItem(request.get(), "next_serial");
        if (has_serial == has_next) {
            throw usage_error("create-device requires exactly one of --serial or --next-serial");
        }
    }

    inv.request = std::move(request);
    return inv;
}

std::string usage(const std::string& program)
{
    std::ostringstream out;
    out << "Usage: " << program << " [--db FILE] [--config FILE] [--log-level LEVEL] COMMAND [OPTIONS]\n"
        << "\nCommands:\n";
    for (const auto& cmd : commands()) {
        out << "  " << cmd.name;
        for (const auto& flag : cmd.flags) {
            out << (flag.required ? " --" : " [--") << flag.name;
            if (flag.kind != FlagKind::SWITCH) {
                out << " " << infra::String::to_upper(flag.key);
            }
            out << (flag.required ? "" : "]");
        }
        out << "\n      " << cmd.summary << "\n";
    }
    out << "\nEnvironment:\n"
        << "  PRODDB_DATABASE   Database file (default: product.db)\n"
        << "  PRODDB_LOG_LEVEL  trace|debug|info|warn|error|fatal (default: warn)\n";
    return out.str();
}

} // namespace proddb::cli
