/**
 * @file equipment_item.hpp
 * @brief iochannel source file.
 */

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "iochannel/core/signal_class.hpp"

namespace ioc {

/**
 * @brief Alarm threshold level; allocated as a set-point plus an alarm bit.
 */
enum class AlarmLevel { LowLow, Low, High, HighHigh };

/// Scaling range of an analog point in engineering units.
struct EngineeringRange {
    double low = 0.0;
    double high = 0.0;
};

/**
 * @brief One row of the deepened-design checklist after schema interpretation.
 */
struct EquipmentItem {
    std::string id;
    std::string name;
    /// Station the equipment is installed at.
    std::string location;
    std::string specModel;
    double quantity = 0.0;
    /// Requested point count per signal class. Kept as the raw number so that negative
    /// or fractional requests reach the calculator and are rejected there.
    std::map<SignalClass, double> requirements;
    std::optional<EngineeringRange> range;
    /// Requested alarm levels in LL, L, H, HH order without duplicates.
    std::vector<AlarmLevel> alarmLevels;
    bool maintenance = false;
    /// Row lists an I/O module itself; its channels are exported as reserved points.
    bool reserved = false;

    double required(SignalClass signalClass) const;
};

/**
 * @brief Main-form project fields.
 */
struct ProjectInfo {
    std::string name;
    std::string number;
    std::string designNumber;
    std::string client;
    std::string station;
};

/**
 * @brief Everything one calculation run needs from the checklist.
 */
struct ProjectInput {
    ProjectInfo project;
    std::vector<EquipmentItem> items;
    /// Racks declared in the checklist; at least one.
    std::size_t rackCount = 1;
};

const char* toString(AlarmLevel level);
std::optional<AlarmLevel> parseAlarmLevel(const std::string& text);

} // namespace ioc
