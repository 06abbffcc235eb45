/**
 * @file channel_calculator.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "iochannel/catalog/channel_model_catalog.hpp"
#include "iochannel/core/error.hpp"
#include "iochannel/schema/equipment_item.hpp"

namespace ioc {

/**
 * @brief Kind of auxiliary point allocated next to an analog input.
 */
enum class ExtensionKind { SetPoint, Alarm, MaintenanceValue, MaintenanceEnable };

/**
 * @brief Auxiliary point (alarm set-point, alarm bit, maintenance value/enable).
 */
struct ExtensionPoint {
    ExtensionKind kind = ExtensionKind::SetPoint;
    /// Set for `SetPoint` and `Alarm`.
    std::optional<AlarmLevel> level;
    /// Appended to the parent tag, e.g. "_HiLimit".
    std::string suffix;
    /// Point description used in tables, e.g. "SH设定点位".
    std::string label;
    std::string tag;
    DataType dataType = DataType::Real;
    std::int64_t address = 0;
};

/**
 * @brief One allocated channel.
 */
struct ChannelAssignment {
    std::string moduleType;
    /// 0-based, per module type.
    std::int64_t moduleInstance = 0;
    /// 0-based, below the module capacity.
    std::int64_t channelIndex = 0;
    std::int64_t address = 0;
    std::string tag;
    SignalClass signalClass = SignalClass::DiscreteInput;
    DataType dataType = DataType::Bool;

    /// Originating checklist row and its position in the run input.
    std::shared_ptr<const EquipmentItem> source;
    std::size_t itemIndex = 0;

    /// 1-based rack and slot of the module instance.
    std::int64_t rack = 1;
    std::int64_t slot = 0;
    /// "<rack>_<slot>_<CLASS>_<channel>"
    std::string channelCode;

    std::vector<ExtensionPoint> extensions;
};

struct CalculationOptions {
    /// Racks available; exceeding it is reported as a warning.
    std::size_t rackCount = 1;
};

struct CalculationResult {
    /// Ordered by signal class (AI, AO, DI, DO), item order, then point ordinal.
    std::vector<ChannelAssignment> assignments;
    /// Non-fatal findings such as rack overflow.
    std::vector<std::string> warnings;
    /// Distinct module instances used.
    std::size_t moduleCount = 0;
    std::size_t rackCount = 0;

    std::size_t count(SignalClass signalClass) const;
};

/**
 * @brief Generic allocation algorithm turning point requirements into channel assignments.
 *
 * For each signal class a cursor (module instance, channel) walks the models of that
 * class in priority order. A full module always starts a new instance; a bounded model
 * that runs out of instances hands over to the next model of the class.
 *
 * Runs are all-or-nothing: on failure `outResult` is left untouched.
 */
class ChannelCalculator {
public:
    /**
     * @brief Allocate every required point of `items`.
     *
     * Errors: `InvalidRequirement` (negative/non-integer count), `UnknownModuleType`
     * (no model serves a requested class), `CapacityExhausted` (bounded models full or
     * no extension area), `AddressConflict` (two points on one address).
     */
    static bool calculate(const std::vector<EquipmentItem>& items,
                          const ChannelModelCatalog& catalog,
                          const CalculationOptions& options,
                          CalculationResult& outResult,
                          Error& outError);

    static bool calculate(const ProjectInput& input,
                          const ChannelModelCatalog& catalog,
                          CalculationResult& outResult,
                          Error& outError);
};

const char* toString(ExtensionKind kind);

} // namespace ioc
