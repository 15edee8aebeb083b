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
 * @file handler.cpp
 * @brief Implementation of the request dispatch pipeline.
 *
 * @details
 * 1. **Decode**: Extract the action and its arguments from the request.
 * 2. **Execute**: Route the action to `core::InventoryService`.
 * 3. **Respond**: Serialize the result, or the error, into a response document.
 */

#include "proddb/cli/handler.hpp"

#include "proddb/cli/json.hpp"
#include "proddb/infra/error.hpp"
#include "proddb/infra/logger.hpp"

namespace proddb::cli {

namespace {

std::string require_string(const cJSON* req, const char* key)
{
    auto value = get_string(req, key);
    if (!value) {
        throw infra::ValidationError("MISSING_FIELD",
                                     std::string("Missing required argument: '") + key + "'");
    }
    return *value;
}

cJSON* device_to_json(const storage::DeviceView& d)
{
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddStringToObject(obj, "ulid", d.id.c_str());
    cJSON_AddStringToObject(obj, "device_type", d.device_type.c_str());
    cJSON_AddStringToObject(obj, "part_number", d.part_number.c_str());
    cJSON_AddStringToObject(obj, "serial_number", d.serial_number.c_str());
    add_optional_string(obj, "model", d.model);
    cJSON_AddStringToObject(obj, "manufacturer_name", d.manufacturer_name.c_str());
    return obj;
}

cJSON* device_type_to_json(const storage::DeviceTypeView& v)
{
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddStringToObject(obj, "ulid", v.type.id.c_str());
    cJSON_AddStringToObject(obj, "part_number", v.type.part_number.c_str());
    cJSON_AddStringToObject(obj, "manufacturer_name", v.type.manufacturer_name.c_str());
    add_optional_string(obj, "model", v.type.model);
    add_optional_string(obj, "descriptor", v.type.descriptor);
    add_optional_string(obj, "serial_number_spec", v.type.serial_number_spec);

    cJSON* attrs = cJSON_AddArrayToObject(obj, "attributes");
    for (const auto& a : v.attributes) {
        cJSON* item = cJSON_CreateObject();
        cJSON_AddStringToObject(item, "ulid", a.id.c_str());
        cJSON_AddStringToObject(item, "attribute_name", a.attribute_name.c_str());
        cJSON_AddStringToObject(item, "multiplicity", a.multiplicity.c_str());
        cJSON_AddItemToArray(attrs, item);
    }
    return obj;
}

cJSON* history_to_json(const storage::HistoryEntry& h)
{
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddStringToObject(obj, "ulid", h.id.c_str());
    cJSON_AddStringToObject(obj, "entity_ulid", h.entity_id.c_str());
    cJSON_AddStringToObject(obj, "timestamp", h.timestamp.c_str());
    cJSON_AddStringToObject(obj, "operation", h.operation.c_str());
    cJSON_AddStringToObject(obj, "comment", h.comment.c_str());
    return obj;
}

/// Fills `resp` for one action; throws `infra::Error` on any failure.
void dispatch(core::InventoryService& svc, const cJSON* req, cJSON* resp)
{
    std::string action = get_string(req, "action").value_or("");

    if (action == "add_device_type") {
        core::DeviceTypeSpec spec;
        spec.part_number = require_string(req, "part_number");
        spec.manufacturer_name = require_string(req, "manufacturer");
        spec.model = get_string(req, "model");
        spec.descriptor = get_string(req, "descriptor");
        spec.serial_number_spec = get_string(req, "serial_spec");
        std::string id = svc.register_device_type(spec);
        cJSON_AddStringToObject(resp, "device_type_ulid", id.c_str());
    } else if (action == "create_device") {
        std::string part = require_string(req, "part_number");
        int64_t count = 1;
        if (cJSON_HasObjectItem(req, "count")) {
            auto parsed = get_int(req, "count");
            if (!parsed) {
                throw infra::ValidationError("INVALID_COUNT", "'count' must be an integer");
            }
            count = *parsed;
        }
        auto serial = get_string(req, "serial");
        bool next = get_flag(req, "next_serial");
        if (serial.has_value() == next) {
            throw infra::ValidationError("USAGE",
                                         "Exactly one of 'serial' or 'next_serial' is required");
        }
        auto source = next ? core::SerialSource::next()
                           : core::SerialSource::explicit_serial(*serial);

        auto created = svc.create_devices(part, count, source);
        cJSON* arr = cJSON_AddArrayToObject(resp, "created");
        for (const auto& c : created) {
            cJSON* item = cJSON_CreateObject();
            cJSON_AddStringToObject(item, "device_ulid", c.device_id.c_str());
            cJSON_AddStringToObject(item, "serial", c.serial.c_str());
            cJSON_AddItemToArray(arr, item);
        }
    } else if (action == "find_device") {
        storage::DeviceFilter filter;
        filter.manufacturer = get_string(req, "manufacturer");
        filter.part_number = get_string(req, "part_number");
        filter.serial_number = get_string(req, "serial");
        filter.model = get_string(req, "model");
        cJSON* arr = cJSON_AddArrayToObject(resp, "devices");
        for (const auto& d : svc.find_devices(filter)) {
            cJSON_AddItemToArray(arr, device_to_json(d));
        }
    } else if (action == "add_type_attribute") {
        std::string id = svc.add_device_type_attribute(
            require_string(req, "part_number"), require_string(req, "name"),
            get_string(req, "multiplicity").value_or("1"));
        cJSON_AddStringToObject(resp, "attribute_ulid", id.c_str());
    } else if (action == "add_device_attribute") {
        std::string id = svc.add_device_attribute(
            require_string(req, "device"), get_string(req, "type").value_or("string"),
            require_string(req, "name"), get_string(req, "value"));
        cJSON_AddStringToObject(resp, "attribute_ulid", id.c_str());
    } else if (action == "show_device") {
        storage::DeviceView view = svc.get_device(require_string(req, "device"));
        cJSON* obj = device_to_json(view);
        cJSON* attrs = cJSON_AddObjectToObject(obj, "attributes");
        for (const auto& [name, attr] : view.attributes) {
            cJSON* item = cJSON_CreateObject();
            cJSON_AddStringToObject(item, "ulid", attr.id.c_str());
            cJSON_AddStringToObject(item, "type", attr.type.c_str());
            add_optional_string(item, "value", attr.value);
            cJSON_AddItemToObject(attrs, name.c_str(), item);
        }
        cJSON_AddItemToObject(resp, "device", obj);
    } else if (action == "list_device_types") {
        cJSON* arr = cJSON_AddArrayToObject(resp, "device_types");
        for (const auto& v : svc.list_device_types()) {
            cJSON_AddItemToArray(arr, device_type_to_json(v));
        }
    } else if (action == "history") {
        cJSON* arr = cJSON_AddArrayToObject(resp, "history");
        for (const auto& h : svc.history(require_string(req, "entity"))) {
            cJSON_AddItemToArray(arr, history_to_json(h));
        }
    } else if (action.empty()) {
        throw infra::ValidationError("USAGE", "Missing 'action'");
    } else {
        throw infra::ValidationError("USAGE", "Unknown action '" + action + "'");
    }
}

} // namespace

Reply Handler::process(core::InventoryService& service, const cJSON* request)
{
    if (!cJSON_IsObject(request)) {
        return failure(infra::ValidationError("USAGE", "Request must be a JSON object"));
    }

    ScopedJson resp(cJSON_CreateObject());
    cJSON_AddStringToObject(resp.get(), "status", "ok");
    try {
        dispatch(service, request, resp.get());
    } catch (const infra::Error& e) {
        return failure(e);
    }
    return Reply{true, infra::ErrorKind::INTERNAL, "", print(resp.get())};
}

Reply Handler::process(core::InventoryService& service, const std::string& raw_json)
{
    if (raw_json.empty()) {
        return failure(infra::ValidationError("USAGE", "Empty request payload"));
    }
    ScopedJson req(cJSON_Parse(raw_json.c_str()));
    if (!req.get()) {
        return failure(infra::ValidationError("USAGE", "Invalid JSON syntax"));
    }
    return process(service, req.get());
}

Reply Handler::failure(const infra::Error& err)
{
    infra::Logger::log(infra::LogLevel::DEBUG, std::string("CLI: ") + infra::to_string(err.kind()) +
                                                   " " + err.code() + ": " + err.what());

    ScopedJson resp(cJSON_CreateObject());
    cJSON_AddStringToObject(resp.get(), "status", "error");
    cJSON* detail = cJSON_AddObjectToObject(resp.get(), "error");
    cJSON_AddStringToObject(detail, "kind", infra::to_string(err.kind()));
    cJSON_AddStringToObject(detail, "code", err.code().c_str());
    cJSON_AddStringToObject(detail, "message", err.what());
    return Reply{false, err.kind(), err.code(), print(resp.get())};
}

int exit_status(const Reply& reply)
{
    if (reply.ok) {
        return kExitOk;
    }
    return reply.code == "USAGE" ? kExitUsage : kExitError;
}

} // namespace proddb::cli
