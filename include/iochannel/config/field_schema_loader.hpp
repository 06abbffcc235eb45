/**
 * @file field_schema_loader.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <string>

#include "iochannel/core/error.hpp"
#include "iochannel/schema/field_schema_registry.hpp"

namespace ioc {

/**
 * @brief Loads field definitions from a JSON list of flat objects:
 *
 * `{ "form": "equipment", "id": "quantity", "name": "数量", "type": "number",
 *    "key": "_widget_1635777485580", "required": false, "values": "DI|DO" }`
 *
 * `required` and `values` are optional; `values` is a '|'-separated list for enum fields.
 */
class FieldSchemaLoader {
public:
    /**
     * @param outError `ConfigIo` for unreadable files, `SchemaMismatch` for malformed
     * entries or inconsistent definitions.
     */
    static bool loadFromJsonFile(const std::string& path, FieldSchemaRegistry& outRegistry, Error& outError);
    static bool loadFromJsonString(const std::string& json, FieldSchemaRegistry& outRegistry, Error& outError);
};

} // namespace ioc
