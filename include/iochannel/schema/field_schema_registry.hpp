/**
 * @file field_schema_registry.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <string>
#include <vector>

#include "iochannel/core/error.hpp"
#include "iochannel/schema/field_definition.hpp"

namespace ioc {

/**
 * @brief Field identifiers understood by `EquipmentItemBuilder`.
 */
namespace field_ids {
inline constexpr const char* kProjectName = "project_name";
inline constexpr const char* kProjectNumber = "project_number";
inline constexpr const char* kDesignNumber = "design_number";
inline constexpr const char* kClientName = "client_name";
inline constexpr const char* kStation = "station";

inline constexpr const char* kEquipmentId = "equipment_id";
inline constexpr const char* kEquipmentName = "equipment_name";
inline constexpr const char* kBrand = "brand";
inline constexpr const char* kSpecModel = "spec_model";
inline constexpr const char* kTechParams = "tech_params";
inline constexpr const char* kQuantity = "quantity";
inline constexpr const char* kUnit = "unit";
inline constexpr const char* kSubsystem = "subsystem";
inline constexpr const char* kRemark = "remark";
inline constexpr const char* kTechRemark = "tech_remark";
inline constexpr const char* kContractStatus = "contract_status";
inline constexpr const char* kSignalType = "signal_type";
inline constexpr const char* kDiCount = "di_count";
inline constexpr const char* kDoCount = "do_count";
inline constexpr const char* kAiCount = "ai_count";
inline constexpr const char* kAoCount = "ao_count";
inline constexpr const char* kRangeLow = "range_low";
inline constexpr const char* kRangeHigh = "range_high";
inline constexpr const char* kAlarmLevels = "alarm_levels";
inline constexpr const char* kMaintenance = "maintenance";
} // namespace field_ids

/**
 * @brief Immutable lookup table of field definitions for the main form and the
 * equipment sub-form.
 *
 * A registry is built once at startup (either `builtin()` or `create()` from loaded
 * definitions) and then only read, so it may be shared between threads without locking.
 */
class FieldSchemaRegistry {
public:
    FieldSchemaRegistry() = default;

    /**
     * @brief Build a registry after checking identifier/raw-key uniqueness per form and
     * that every enum field declares its allowed values.
     *
     * @return false with `ErrorKind::SchemaMismatch` on inconsistent definitions.
     */
    static bool create(std::vector<FieldDefinition> mainDefinitions,
                       std::vector<FieldDefinition> equipmentDefinitions,
                       FieldSchemaRegistry& outRegistry,
                       Error& outError);

    /**
     * @brief Process-wide registry holding the deepened-design checklist field mapping.
     */
    static const FieldSchemaRegistry& builtin();

    const std::vector<FieldDefinition>& definitions(FormKind form) const noexcept;
    const FieldDefinition* find(FormKind form, const std::string& fieldId) const;

    /**
     * @brief Interpret a raw payload through the definitions of `form`.
     *
     * Every declared field is looked up by its raw key and coerced to its semantic type.
     * Optional fields that are absent, null or empty are left out of the record.
     *
     * @return false with `ErrorKind::SchemaMismatch` (subject = field id) when a required
     * field is missing or a value cannot be coerced.
     */
    bool interpret(const RawPayload& payload,
                   FormKind form,
                   TypedRecord& outRecord,
                   Error& outError) const;

private:
    std::vector<FieldDefinition> main_;
    std::vector<FieldDefinition> equipment_;
};

} // namespace ioc
