/**
 * @file equipment_builder.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <vector>

#include "iochannel/catalog/channel_model_catalog.hpp"
#include "iochannel/core/error.hpp"
#include "iochannel/schema/equipment_item.hpp"
#include "iochannel/schema/field_schema_registry.hpp"

namespace ioc {

/**
 * @brief Turns interpreted checklist records into the calculator's input.
 *
 * Point requirements of a row come from, in order of precedence:
 * 1. explicit DI/DO/AI/AO count fields;
 * 2. the signal type field times the quantity;
 * 3. a catalog module type named in the spec model (quantity x module capacity).
 *
 * A row whose spec model names the catalog's rack model adds to the rack count instead.
 */
class EquipmentItemBuilder {
public:
    static bool fromRecords(const TypedRecord& mainRecord,
                            const std::vector<TypedRecord>& equipmentRecords,
                            const ChannelModelCatalog& catalog,
                            ProjectInput& outInput,
                            Error& outError);

    /**
     * @brief Interpret raw payloads through `registry` and build the project input.
     *
     * Fails with the first `SchemaMismatch`; the error message names the row.
     */
    static bool fromPayloads(const FieldSchemaRegistry& registry,
                             const RawPayload& mainPayload,
                             const std::vector<RawPayload>& equipmentPayloads,
                             const ChannelModelCatalog& catalog,
                             ProjectInput& outInput,
                             Error& outError);
};

} // namespace ioc
